#ifndef __KVT_TUNNELED_TRANSPORT__
#define __KVT_TUNNELED_TRANSPORT__

#include "ForwardedChannel.hpp"
#include "Headers.hpp"
#include "Transport.hpp"
#include "TunnelSession.hpp"

namespace kvt {
/**
 * @brief Presents a forwarded channel as the transport of a store connection,
 * so the store client code never knows it is tunneled.
 *
 * When the transport owns a private session (non-shared pools), closing the
 * transport also closes that session.
 */
class TunneledTransport : public Transport {
 public:
  TunneledTransport();
  virtual ~TunneledTransport();

  /**
   * @brief Binds a freshly opened channel.  @p _ownedSession, when set, is
   * closed together with the channel.
   */
  void attach(shared_ptr<ForwardedChannel> _channel,
              shared_ptr<TunnelSession> _ownedSession = nullptr);

  /** @brief Checks that a usable channel is attached. */
  virtual void connect();
  virtual size_t send(const void* buf, size_t count);
  virtual string recv(size_t maxBytes);
  virtual void close();
  virtual void setTimeout(int64_t timeoutMs);
  virtual int64_t getTimeout();
  virtual bool isUsable();

  shared_ptr<ForwardedChannel> getChannel();

 protected:
  shared_ptr<ForwardedChannel> currentChannel();

  shared_ptr<ForwardedChannel> channel;
  shared_ptr<TunnelSession> ownedSession;
  atomic<int64_t> timeoutMs;
  recursive_mutex transportMutex;
};
}  // namespace kvt

#endif  // __KVT_TUNNELED_TRANSPORT__
