#include "TunneledConnectionPool.hpp"

#include "SshTunnelSession.hpp"

namespace kvt {
shared_ptr<TunnelConnectionFactory> TunneledConnectionPool::createFactory(
    const PoolConfig& config,
    shared_ptr<TunnelSessionFactory> sessionFactory) {
  if (sessionFactory.get() == NULL) {
    sessionFactory = make_shared<SshTunnelSessionFactory>(
        make_shared<SubprocessUtils>(), config.max_channels_per_session(),
        config.channel_open_grace_ms());
  }
  return make_shared<TunnelConnectionFactory>(config, sessionFactory);
}

TunneledConnectionPool::TunneledConnectionPool(
    const PoolConfig& _config, shared_ptr<TunnelSessionFactory> _sessionFactory,
    shared_ptr<TunnelSession> existingSession)
    : ConnectionPool(createFactory(_config, _sessionFactory),
                     _config.max_connections(), _config.acquire_timeout_ms()),
      config(_config) {
  tunnelFactory = static_pointer_cast<TunnelConnectionFactory>(factory);
  if (existingSession.get()) {
    if (!config.shared()) {
      throw std::runtime_error(
          "An existing session can only back a shared pool");
    }
    lock_guard<mutex> guard(poolMutex);
    tunnelFactory->adoptSession(existingSession);
  }
  LOG(INFO) << "Tunneled pool to " << config.target() << " through "
            << config.tunnel() << " ("
            << (config.shared() ? "shared" : "non-shared") << " session, "
            << config.max_connections() << " connections)";
}

shared_ptr<TunnelSession> TunneledConnectionPool::getSharedSession() {
  lock_guard<mutex> guard(poolMutex);
  return tunnelFactory->getSharedSession();
}
}  // namespace kvt
