#ifndef __KVT_TUNNELED_CONNECTION_POOL__
#define __KVT_TUNNELED_CONNECTION_POOL__

#include "ConnectionPool.hpp"
#include "Headers.hpp"
#include "TunnelConnectionFactory.hpp"
#include "TunnelSessionFactory.hpp"

namespace kvt {
/**
 * @brief Drop-in replacement for a plain store connection pool whose
 * connections all go through a tunnel to the intermediary host.
 */
class TunneledConnectionPool : public ConnectionPool {
 public:
  /**
   * @param _sessionFactory Defaults to OpenSSH control master sessions.
   * @param existingSession Adopted as the shared session in shared mode.
   */
  explicit TunneledConnectionPool(
      const PoolConfig& _config,
      shared_ptr<TunnelSessionFactory> _sessionFactory = nullptr,
      shared_ptr<TunnelSession> existingSession = nullptr);

  /** @brief The shared session currently in use, null when none is. */
  shared_ptr<TunnelSession> getSharedSession();

  const PoolConfig& getConfig() const { return config; }

 protected:
  static shared_ptr<TunnelConnectionFactory> createFactory(
      const PoolConfig& config,
      shared_ptr<TunnelSessionFactory> sessionFactory);

  PoolConfig config;
  shared_ptr<TunnelConnectionFactory> tunnelFactory;
};
}  // namespace kvt

#endif  // __KVT_TUNNELED_CONNECTION_POOL__
