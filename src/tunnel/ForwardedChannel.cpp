#include "ForwardedChannel.hpp"

#include "Transport.hpp"

namespace kvt {
ForwardedChannel::ForwardedChannel(shared_ptr<TunnelSession> _session,
                                   int _id, int _fd,
                                   const TargetEndpoint& _target)
    : session(_session),
      id(_id),
      fd(_fd),
      target(_target),
      timeoutMs(-1),
      state(ChannelState::OPEN),
      sessionBroken(false),
      ended(false),
      endReason(ChannelEndReason::GRACEFUL) {}

ForwardedChannel::~ForwardedChannel() { close(); }

int ForwardedChannel::checkUsable() {
  int currentFd;
  {
    lock_guard<mutex> guard(channelMutex);
    if (sessionBroken) {
      throw IoError(IoErrorCode::SESSION_BROKEN,
                    "Tunnel session under channel " + to_string(id) +
                        " is gone");
    }
    if (state == ChannelState::CLOSED) {
      throw IoError(IoErrorCode::PEER_CLOSED,
                    "Channel " + to_string(id) + " is closed");
    }
    currentFd = fd;
  }
  auto s = session.lock();
  if (!s || !s->isOpen()) {
    lock_guard<mutex> guard(channelMutex);
    sessionBroken = true;
    throw IoError(IoErrorCode::SESSION_BROKEN,
                  "Tunnel session under channel " + to_string(id) +
                      " is not open");
  }
  return currentFd;
}

size_t ForwardedChannel::send(const void* buf, size_t count) {
  int currentFd = checkUsable();
  while (true) {
    if (!waitOnFd(currentFd, POLLOUT, timeoutMs)) {
      throw IoError(IoErrorCode::TIMEOUT,
                    "Timed out writing to channel " + to_string(id));
    }
    ssize_t bytesWritten = ::send(currentFd, buf, count, MSG_NOSIGNAL);
    if (bytesWritten >= 0) {
      return size_t(bytesWritten);
    }
    auto localErrno = errno;
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      continue;
    }
    VLOG(1) << "Failed a call to send on channel " << id << ": "
            << strerror(localErrno);
    throwStreamEnded("write");
  }
}

string ForwardedChannel::recv(size_t maxBytes) {
  int currentFd = checkUsable();
  if (maxBytes == 0) {
    // A zero-byte read says nothing about the stream
    return "";
  }
  string s(maxBytes, '\0');
  while (true) {
    if (!waitOnFd(currentFd, POLLIN, timeoutMs)) {
      throw IoError(IoErrorCode::TIMEOUT,
                    "Timed out reading from channel " + to_string(id));
    }
    ssize_t bytesRead = ::recv(currentFd, &s[0], maxBytes, 0);
    if (bytesRead > 0) {
      s.resize(bytesRead);
      return s;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR || localErrno == EAGAIN ||
          localErrno == EWOULDBLOCK) {
        continue;
      }
      VLOG(1) << "Failed a call to recv on channel " << id << ": "
              << strerror(localErrno);
      throwStreamEnded("read");
    }
    if (getEndReason() == ChannelEndReason::GRACEFUL) {
      return "";
    }
    throwStreamEnded("read");
  }
}

ChannelEndReason ForwardedChannel::getEndReason() {
  {
    lock_guard<mutex> guard(channelMutex);
    if (sessionBroken) {
      // Invalidated while we were blocked
      return ChannelEndReason::SESSION_BROKEN;
    }
    if (ended) {
      return endReason;
    }
  }
  auto s = session.lock();
  ChannelEndReason reason =
      s ? s->channelEnded(id) : ChannelEndReason::SESSION_BROKEN;
  lock_guard<mutex> guard(channelMutex);
  ended = true;
  endReason = reason;
  if (reason == ChannelEndReason::SESSION_BROKEN) {
    sessionBroken = true;
  }
  return reason;
}

void ForwardedChannel::throwStreamEnded(const string& operation) {
  auto reason = getEndReason();
  if (reason == ChannelEndReason::SESSION_BROKEN) {
    throw IoError(IoErrorCode::SESSION_BROKEN,
                  "Tunnel session broke during " + operation + " on channel " +
                      to_string(id));
  }
  throw IoError(IoErrorCode::PEER_CLOSED,
                "Forward to " + target.host() + ":" +
                    to_string(target.port()) + " ended during " + operation);
}

void ForwardedChannel::close() {
  int fdToClose;
  {
    lock_guard<mutex> guard(channelMutex);
    if (fd == -1) {
      return;
    }
    fdToClose = fd;
    fd = -1;
    state = ChannelState::CLOSED;
  }
  ::shutdown(fdToClose, SHUT_RDWR);
  FATAL_FAIL(::close(fdToClose));
  auto s = session.lock();
  if (s) {
    s->channelClosed(id);
  }
}

void ForwardedChannel::invalidate() {
  lock_guard<mutex> guard(channelMutex);
  if (state == ChannelState::CLOSED) {
    return;
  }
  sessionBroken = true;
  state = ChannelState::CLOSED;
  // Keep the fd until close() so blocked readers never see a reused number
  ::shutdown(fd, SHUT_RDWR);
}

bool ForwardedChannel::isUsable() {
  {
    lock_guard<mutex> guard(channelMutex);
    if (sessionBroken || state != ChannelState::OPEN || ended) {
      return false;
    }
  }
  auto s = session.lock();
  return s && s->isOpen();
}

ChannelState ForwardedChannel::getState() {
  lock_guard<mutex> guard(channelMutex);
  return state;
}
}  // namespace kvt
