#ifndef __KVT_CONNECTION_FACTORY__
#define __KVT_CONNECTION_FACTORY__

#include "Headers.hpp"
#include "StoreConnection.hpp"

namespace kvt {
struct PoolStats {
  int maxConnections = 0;
  int created = 0;
  int leased = 0;
  int free = 0;
  int64_t discarded = 0;
  int64_t sessionOpenAttempts = 0;
  int64_t sessionReopens = 0;
};

/**
 * @brief What a factory gets while a slot is being leased: the pool lock
 * (held on entry and on return), the pool's condition variable and the
 * caller's acquire deadline.
 */
struct AcquireContext {
  unique_lock<mutex>* lock;
  condition_variable* cv;
  std::chrono::steady_clock::time_point deadline;
  bool hasDeadline;
};

/** @brief Releases a held lock for the lifetime of the guard. */
class UnlockGuard {
 public:
  explicit UnlockGuard(unique_lock<mutex>* _lock) : lock(_lock) {
    lock->unlock();
  }
  ~UnlockGuard() { lock->lock(); }

 private:
  unique_lock<mutex>* lock;
};

/**
 * @brief Builds the connections held in pool slots and binds a transport to
 * them each time they are leased.
 */
class ConnectionFactory {
 public:
  virtual ~ConnectionFactory() {}

  /** @brief A new, unbound connection for a new slot.  Pool lock held. */
  virtual shared_ptr<PooledConnection> makeConnection(int slotId) = 0;

  /**
   * @brief Makes a leased connection ready for I/O.  Called with the pool
   * lock held; slow work must release it through an UnlockGuard.
   * @throws TunnelError, PoolError or IoError, and the slot goes back to the
   * pool.
   */
  virtual void activate(const shared_ptr<PooledConnection>& conn,
                        AcquireContext& ctx) = 0;

  /**
   * @brief Called on release without the pool lock.  @p healthy tells
   * whether the slot will be reused.
   */
  virtual void deactivate(const shared_ptr<PooledConnection>& conn,
                          bool healthy) = 0;

  /** @brief Releases factory-wide resources.  Pool lock held. */
  virtual void shutdown(unique_lock<mutex>* lock) {}

  /** @brief Adds factory counters to @p stats.  Pool lock held. */
  virtual void fillStats(PoolStats* stats) {}
};
}  // namespace kvt

#endif  // __KVT_CONNECTION_FACTORY__
