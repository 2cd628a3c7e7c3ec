#ifndef __KVT_DIRECT_CONNECTION_FACTORY__
#define __KVT_DIRECT_CONNECTION_FACTORY__

#include "ConnectionFactory.hpp"
#include "Headers.hpp"

namespace kvt {
/**
 * @brief Connects straight to the store over TCP.  Healthy connections stay
 * connected between leases.
 */
class DirectConnectionFactory : public ConnectionFactory {
 public:
  DirectConnectionFactory(const TargetEndpoint& _target,
                          int64_t _socketTimeoutMs, int64_t _connectTimeoutMs);

  virtual shared_ptr<PooledConnection> makeConnection(int slotId);
  virtual void activate(const shared_ptr<PooledConnection>& conn,
                        AcquireContext& ctx);
  virtual void deactivate(const shared_ptr<PooledConnection>& conn,
                          bool healthy);

 protected:
  TargetEndpoint target;
  int64_t socketTimeoutMs;
  int64_t connectTimeoutMs;
};
}  // namespace kvt

#endif  // __KVT_DIRECT_CONNECTION_FACTORY__
