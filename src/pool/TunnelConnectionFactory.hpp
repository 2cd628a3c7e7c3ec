#ifndef __KVT_TUNNEL_CONNECTION_FACTORY__
#define __KVT_TUNNEL_CONNECTION_FACTORY__

#include "ConnectionFactory.hpp"
#include "Headers.hpp"
#include "TunnelSessionFactory.hpp"

namespace kvt {
/**
 * @brief Binds every leased connection to a forwarded channel.
 *
 * In non-shared mode each lease opens its own session, and releasing the
 * connection closes it.  In shared mode all leases multiplex over one
 * session, opened lazily by a single caller while the others wait for its
 * outcome.  All shared-session state is guarded by the pool lock.
 */
class TunnelConnectionFactory : public ConnectionFactory {
 public:
  TunnelConnectionFactory(const PoolConfig& _config,
                          shared_ptr<TunnelSessionFactory> _sessionFactory);

  /**
   * @brief Uses @p session as the shared session.  It is opened on first use
   * when it is not open yet.  Must be called before the first lease.
   */
  void adoptSession(shared_ptr<TunnelSession> session);

  virtual shared_ptr<PooledConnection> makeConnection(int slotId);
  virtual void activate(const shared_ptr<PooledConnection>& conn,
                        AcquireContext& ctx);
  virtual void deactivate(const shared_ptr<PooledConnection>& conn,
                          bool healthy);
  virtual void shutdown(unique_lock<mutex>* lock);
  virtual void fillStats(PoolStats* stats);

  /** @brief The current shared session, if any.  Pool lock held. */
  shared_ptr<TunnelSession> getSharedSession() { return sharedSession; }

 protected:
  void activateNonShared(const shared_ptr<PooledConnection>& conn,
                         AcquireContext& ctx);
  void activateShared(const shared_ptr<PooledConnection>& conn,
                      AcquireContext& ctx);
  shared_ptr<TunnelSession> acquireSharedSession(AcquireContext& ctx);
  shared_ptr<TunnelSession> openSharedSession(AcquireContext& ctx);
  void bindChannel(const shared_ptr<PooledConnection>& conn,
                   shared_ptr<ForwardedChannel> channel,
                   shared_ptr<TunnelSession> ownedSession);

  PoolConfig config;
  shared_ptr<TunnelSessionFactory> sessionFactory;

  shared_ptr<TunnelSession> sharedSession;
  bool sharedOpenInFlight;
  /** @brief Bumped each time a shared open finishes, successful or not. */
  uint64_t sharedGeneration;
  /** @brief Outcome of the last shared open, null on success. */
  std::exception_ptr lastOpenFailure;
  bool shuttingDown;
  int64_t sessionOpenAttempts;
  int64_t sessionReopens;
};
}  // namespace kvt

#endif  // __KVT_TUNNEL_CONNECTION_FACTORY__
