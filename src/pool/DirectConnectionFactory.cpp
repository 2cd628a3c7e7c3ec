#include "DirectConnectionFactory.hpp"

#include "TcpTransport.hpp"

namespace kvt {
DirectConnectionFactory::DirectConnectionFactory(const TargetEndpoint& _target,
                                                 int64_t _socketTimeoutMs,
                                                 int64_t _connectTimeoutMs)
    : target(_target),
      socketTimeoutMs(_socketTimeoutMs),
      connectTimeoutMs(_connectTimeoutMs) {}

shared_ptr<PooledConnection> DirectConnectionFactory::makeConnection(
    int slotId) {
  return make_shared<PooledConnection>(
      slotId, make_shared<TcpTransport>(target, connectTimeoutMs));
}

void DirectConnectionFactory::activate(const shared_ptr<PooledConnection>& conn,
                                       AcquireContext& ctx) {
  UnlockGuard unlock(ctx.lock);
  conn->setSocketTimeout(socketTimeoutMs);
  conn->connect();
}

void DirectConnectionFactory::deactivate(
    const shared_ptr<PooledConnection>& conn, bool healthy) {
  if (!healthy) {
    conn->disconnect();
  }
}
}  // namespace kvt
