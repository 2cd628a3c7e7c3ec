#ifndef __KVT_TUNNEL_SESSION_FACTORY__
#define __KVT_TUNNEL_SESSION_FACTORY__

#include "TunnelSession.hpp"

namespace kvt {
/**
 * @brief Creates (unopened) tunnel sessions.  The pool goes through this so
 * tests can hand it sessions without an ssh server.
 */
class TunnelSessionFactory {
 public:
  virtual ~TunnelSessionFactory() {}
  virtual shared_ptr<TunnelSession> create(const TunnelEndpoint& endpoint) = 0;
};
}  // namespace kvt

#endif  // __KVT_TUNNEL_SESSION_FACTORY__
