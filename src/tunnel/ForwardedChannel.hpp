#ifndef __KVT_FORWARDED_CHANNEL__
#define __KVT_FORWARDED_CHANNEL__

#include "Headers.hpp"
#include "TunnelErrors.hpp"
#include "TunnelSession.hpp"

namespace kvt {
enum class ChannelState { OPEN, CLOSED };

/**
 * @brief A bidirectional byte stream from the local process, through a
 * tunnel session, to the target endpoint.
 *
 * Reads distinguish three endings: the target closed the stream (empty
 * read), the forward was aborted (PEER_CLOSED) and the carrying session broke
 * (SESSION_BROKEN).  A broken session never looks like an empty read.
 */
class ForwardedChannel {
 public:
  ForwardedChannel(shared_ptr<TunnelSession> _session, int _id, int _fd,
                   const TargetEndpoint& _target);
  virtual ~ForwardedChannel();

  /**
   * @brief Writes up to @p count bytes.
   * @throws IoError TIMEOUT, SESSION_BROKEN or PEER_CLOSED.
   */
  size_t send(const void* buf, size_t count);

  /**
   * @brief Reads up to @p maxBytes.  Returns an empty string when the target
   * closed the stream.
   * @throws IoError TIMEOUT, SESSION_BROKEN or PEER_CLOSED.
   */
  string recv(size_t maxBytes);

  /** @brief Closes the stream and frees its slot on the session. */
  void close();

  void setTimeout(int64_t _timeoutMs) { timeoutMs = _timeoutMs; }
  int64_t getTimeout() { return timeoutMs; }

  /** @brief True when the channel is open and its session usable. */
  bool isUsable();
  ChannelState getState();

  int getId() const { return id; }
  const TargetEndpoint& getTarget() const { return target; }
  /** @brief The carrying session, or null once it has been destroyed. */
  shared_ptr<TunnelSession> getSession() { return session.lock(); }

 protected:
  friend class TunnelSession;

  /**
   * @brief Called by the session when it closes or errors.  Wakes blocked
   * readers; later I/O reports SESSION_BROKEN.
   */
  void invalidate();

  int checkUsable();
  [[noreturn]] void throwStreamEnded(const string& operation);
  ChannelEndReason getEndReason();

  weak_ptr<TunnelSession> session;
  int id;
  int fd;
  TargetEndpoint target;
  atomic<int64_t> timeoutMs;
  ChannelState state;
  bool sessionBroken;
  bool ended;
  ChannelEndReason endReason;
  mutex channelMutex;
};
}  // namespace kvt

#endif  // __KVT_FORWARDED_CHANNEL__
