#ifndef __KVT_CONNECTION_POOL__
#define __KVT_CONNECTION_POOL__

#include "ConnectionFactory.hpp"
#include "Headers.hpp"

namespace kvt {
enum class SlotState { FREE, LEASED, RELEASING };

/**
 * @brief A bounded set of store connections leased to one caller at a time.
 *
 * Slots go Free -> Leased -> Free, or are discarded when their connection
 * failed.  Discarded slots free capacity for a replacement, created on
 * demand.  One mutex and one condition variable guard all pool state; I/O
 * happens outside the lock.
 */
class ConnectionPool {
 public:
  /**
   * @param _acquireTimeoutMs How long getConnection() waits for capacity.
   * 0 fails at once when the pool is full, negative waits forever.
   */
  ConnectionPool(shared_ptr<ConnectionFactory> _factory, int _maxConnections,
                 int64_t _acquireTimeoutMs);
  virtual ~ConnectionPool();

  /**
   * @brief Leases a connection ready for I/O.
   * @throws PoolError EXHAUSTED when the pool is full and may not wait or is
   * shut down, TIMEOUT when no capacity freed up in time, and whatever the
   * factory throws when binding a transport failed.
   */
  shared_ptr<PooledConnection> getConnection();

  /**
   * @brief Returns a leased connection.  Broken connections are discarded.
   * @throws std::runtime_error when @p conn is not leased from this pool.
   */
  void release(const shared_ptr<PooledConnection>& conn);

  /**
   * @brief Refuses further leases and releases idle connections and
   * factory resources.  Connections still leased are discarded on release.
   */
  void shutdown();

  PoolStats getStats();
  bool isShutdown();

 protected:
  struct Slot {
    shared_ptr<PooledConnection> connection;
    SlotState state;
  };

  int findFreeSlot();

  shared_ptr<ConnectionFactory> factory;
  int maxConnections;
  int64_t acquireTimeoutMs;
  map<int, Slot> slots;
  int nextSlotId;
  int64_t discarded;
  bool shuttingDown;
  mutex poolMutex;
  condition_variable poolCv;
};
}  // namespace kvt

#endif  // __KVT_CONNECTION_POOL__
