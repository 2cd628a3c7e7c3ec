#ifndef __KVT_TEST_HEADERS__
#define __KVT_TEST_HEADERS__

#include "Headers.hpp"

#include <catch2/catch_all.hpp>

namespace kvt {
inline TunnelEndpoint makeTestTunnelEndpoint() {
  TunnelEndpoint endpoint;
  endpoint.set_host("bastion.test");
  endpoint.set_port(2222);
  endpoint.set_user("deploy");
  endpoint.set_connect_timeout_ms(2000);
  return endpoint;
}

inline TargetEndpoint makeTestTargetEndpoint() {
  TargetEndpoint target;
  target.set_host("10.0.0.5");
  target.set_port(6379);
  return target;
}

inline PoolConfig makeTestPoolConfig(bool shared, int maxConnections,
                                     int64_t acquireTimeoutMs) {
  PoolConfig config;
  *(config.mutable_tunnel()) = makeTestTunnelEndpoint();
  *(config.mutable_target()) = makeTestTargetEndpoint();
  config.set_shared(shared);
  config.set_max_connections(maxConnections);
  config.set_acquire_timeout_ms(acquireTimeoutMs);
  return config;
}

// A listening socket on an ephemeral loopback port
class LoopbackListener {
 public:
  LoopbackListener() {
    fd = ::socket(AF_INET, SOCK_STREAM, 0);
    FATAL_FAIL(fd);
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    FATAL_FAIL(::bind(fd, (sockaddr*)&addr, sizeof(addr)));
    FATAL_FAIL(::listen(fd, 4));
    socklen_t len = sizeof(addr);
    FATAL_FAIL(::getsockname(fd, (sockaddr*)&addr, &len));
    port = ntohs(addr.sin_port);
  }
  ~LoopbackListener() { ::close(fd); }

  TargetEndpoint endpoint() {
    TargetEndpoint target;
    target.set_host("127.0.0.1");
    target.set_port(port);
    return target;
  }

  int fd;
  int port;
};

// Waits until a condition holds, polling every millisecond
template <typename Predicate>
bool waitFor(Predicate predicate, int64_t timeoutMs = 2000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}
}  // namespace kvt

#endif  // __KVT_TEST_HEADERS__
