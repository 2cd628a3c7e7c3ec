#ifndef __KVT_TUNNEL_SESSION__
#define __KVT_TUNNEL_SESSION__

#include "Headers.hpp"
#include "TunnelErrors.hpp"

namespace kvt {
class ForwardedChannel;

enum class TunnelSessionState { CONNECTING, OPEN, CLOSED, ERRORED };

/** @brief Why the stream of a forwarded channel ended. */
enum class ChannelEndReason { GRACEFUL, SESSION_BROKEN, ABORTED };

string toString(TunnelSessionState state);

/**
 * @brief One authenticated transport connection to the intermediary host,
 * able to carry several forwarded channels.
 *
 * The base class owns the state machine and the channel registry.  Derived
 * classes supply the transport through the protected hooks, which are called
 * without the session lock held.  Sessions must be owned by a shared_ptr, and
 * derived destructors must call close().
 */
class TunnelSession : public std::enable_shared_from_this<TunnelSession> {
 public:
  explicit TunnelSession(const TunnelEndpoint& _endpoint);
  virtual ~TunnelSession();

  /**
   * @brief Connects and authenticates.  A no-op on an open session.
   * @throws TunnelError AUTH_FAILED, TIMEOUT or NETWORK_UNREACHABLE when the
   * transport cannot be established (the session is then ERRORED), and
   * SESSION_CLOSED when the session was already closed or errored.
   */
  void open();

  /**
   * @brief Requests a new forwarded stream to @p target.
   * @throws TunnelError SESSION_CLOSED when the session is not open,
   * CHANNEL_LIMIT_EXCEEDED at the channel limit, REMOTE_REFUSED when the
   * intermediary host rejects the forward.
   */
  shared_ptr<ForwardedChannel> openChannel(const TargetEndpoint& target);

  /**
   * @brief Releases the transport and invalidates every open channel.
   * Closing a closed session is a no-op.
   */
  void close();

  /**
   * @brief Moves an open session to ERRORED and invalidates its channels.
   */
  void markErrored(const string& reason);

  /**
   * @brief Probes the transport.  A dead transport marks the session
   * ERRORED.
   * @return true when the session is open and its transport alive.
   */
  bool checkAlive();

  TunnelSessionState getState();
  inline bool isOpen() { return getState() == TunnelSessionState::OPEN; }

  /** @brief Number of channels currently open on this session. */
  int getOpenChannelCount();

  void setMaxChannels(int _maxChannels);
  int getMaxChannels();

  const TunnelEndpoint& getEndpoint() const { return endpoint; }
  const string& getId() const { return id; }

 protected:
  friend class ForwardedChannel;

  /** @brief Called by a channel that closed itself. */
  void channelClosed(int channelId);
  /** @brief Called by a channel whose stream reached EOF or failed. */
  ChannelEndReason channelEnded(int channelId);

  /** @brief Establishes the transport.  Throws TunnelError on failure. */
  virtual void establish() = 0;
  /**
   * @brief Opens the stream for a new channel.
   * @return The local descriptor carrying the channel's bytes.
   */
  virtual int openStream(int channelId, const TargetEndpoint& target) = 0;
  /** @brief Releases whatever openStream allocated besides the fd. */
  virtual void closeStream(int channelId) = 0;
  /** @brief Explains an EOF or error seen on a channel's descriptor. */
  virtual ChannelEndReason describeStreamEnd(int channelId) = 0;
  virtual bool transportAlive() = 0;
  /** @brief Releases the transport established by establish(). */
  virtual void teardown() = 0;

  void invalidateChannels(
      const map<int, shared_ptr<ForwardedChannel>>& toInvalidate);

  TunnelEndpoint endpoint;
  /** @brief Short random id used in logs. */
  string id;
  TunnelSessionState state;
  bool established;
  int maxChannels;
  int nextChannelId;
  /** @brief Channel opens that have reserved a slot but not finished. */
  int pendingChannels;
  map<int, shared_ptr<ForwardedChannel>> channels;
  recursive_mutex sessionMutex;
};
}  // namespace kvt

#endif  // __KVT_TUNNEL_SESSION__
