#ifndef __KVT_TCP_TRANSPORT__
#define __KVT_TCP_TRANSPORT__

#include "Transport.hpp"

namespace kvt {
/**
 * @brief Plain TCP connection to the store, for pools that do not tunnel.
 */
class TcpTransport : public Transport {
 public:
  explicit TcpTransport(const TargetEndpoint& _endpoint,
                        int64_t _connectTimeoutMs = 3000);
  virtual ~TcpTransport();

  /**
   * @brief Resolves the endpoint and connects to the first address that
   * answers within the connect timeout.
   */
  virtual void connect();
  virtual size_t send(const void* buf, size_t count);
  virtual string recv(size_t maxBytes);
  virtual void close();
  virtual void setTimeout(int64_t timeoutMs);
  virtual int64_t getTimeout();
  virtual bool isUsable();

  const TargetEndpoint& getEndpoint() const { return endpoint; }

 protected:
  int connectToAddress(addrinfo* p);

  TargetEndpoint endpoint;
  int64_t connectTimeoutMs;
  atomic<int64_t> timeoutMs;
  /** @brief Connected socket, -1 when disconnected. */
  int sockFd;
  recursive_mutex transportMutex;
};
}  // namespace kvt

#endif  // __KVT_TCP_TRANSPORT__
