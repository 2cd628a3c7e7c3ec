#include "TunnelSession.hpp"

#include "ForwardedChannel.hpp"

namespace kvt {
string toString(TunnelSessionState state) {
  switch (state) {
    case TunnelSessionState::CONNECTING:
      return "Connecting";
    case TunnelSessionState::OPEN:
      return "Open";
    case TunnelSessionState::CLOSED:
      return "Closed";
    case TunnelSessionState::ERRORED:
      return "Errored";
  }
  return "Unknown";
}

TunnelSession::TunnelSession(const TunnelEndpoint& _endpoint)
    : endpoint(_endpoint),
      id(genRandomAlphaNum(8)),
      state(TunnelSessionState::CONNECTING),
      established(false),
      maxChannels(10),
      nextChannelId(0),
      pendingChannels(0) {}

TunnelSession::~TunnelSession() {
  if (established) {
    STERROR << "Call close before destructing a TunnelSession.";
  }
}

void TunnelSession::open() {
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state == TunnelSessionState::OPEN) {
      return;
    }
    if (state != TunnelSessionState::CONNECTING) {
      throw TunnelError(TunnelErrorCode::SESSION_CLOSED,
                        "Session " + id + " is " + toString(state));
    }
  }

  LOG(INFO) << "Opening tunnel session " << id << " to " << endpoint;
  try {
    establish();
  } catch (const TunnelError& te) {
    LOG(WARNING) << "Tunnel session " << id << " failed to open: "
                 << te.what();
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state == TunnelSessionState::CONNECTING) {
      state = TunnelSessionState::ERRORED;
    }
    throw;
  }

  bool closedWhileConnecting = false;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    established = true;
    if (state == TunnelSessionState::CONNECTING) {
      state = TunnelSessionState::OPEN;
    } else {
      closedWhileConnecting = true;
    }
  }
  if (closedWhileConnecting) {
    teardown();
    {
      lock_guard<recursive_mutex> guard(sessionMutex);
      established = false;
    }
    throw TunnelError(TunnelErrorCode::SESSION_CLOSED,
                      "Session " + id + " was closed while connecting");
  }
  LOG(INFO) << "Tunnel session " << id << " open to " << endpoint;
}

shared_ptr<ForwardedChannel> TunnelSession::openChannel(
    const TargetEndpoint& target) {
  int channelId;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state != TunnelSessionState::OPEN) {
      throw TunnelError(TunnelErrorCode::SESSION_CLOSED,
                        "Session " + id + " is " + toString(state));
    }
    if (int(channels.size()) + pendingChannels >= maxChannels) {
      throw TunnelError(TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED,
                        "Session " + id + " already carries " +
                            to_string(maxChannels) + " channels");
    }
    channelId = nextChannelId++;
    pendingChannels++;
  }

  int fd;
  try {
    fd = openStream(channelId, target);
  } catch (...) {
    lock_guard<recursive_mutex> guard(sessionMutex);
    pendingChannels--;
    throw;
  }

  auto channel =
      make_shared<ForwardedChannel>(shared_from_this(), channelId, fd, target);
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    pendingChannels--;
    if (state == TunnelSessionState::OPEN) {
      channels[channelId] = channel;
      VLOG(1) << "Opened channel " << channelId << " to " << target
              << " on session " << id << " (" << channels.size()
              << " open)";
      return channel;
    }
  }
  // The session went away while the stream was being opened
  channel->invalidate();
  closeStream(channelId);
  throw TunnelError(TunnelErrorCode::SESSION_CLOSED,
                    "Session " + id + " closed while opening a channel");
}

void TunnelSession::close() {
  map<int, shared_ptr<ForwardedChannel>> toInvalidate;
  bool needsTeardown;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state == TunnelSessionState::CLOSED) {
      return;
    }
    needsTeardown = established;
    established = false;
    state = TunnelSessionState::CLOSED;
    toInvalidate.swap(channels);
  }
  invalidateChannels(toInvalidate);
  if (needsTeardown) {
    teardown();
  }
  LOG(INFO) << "Closed tunnel session " << id;
}

void TunnelSession::markErrored(const string& reason) {
  map<int, shared_ptr<ForwardedChannel>> toInvalidate;
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state != TunnelSessionState::OPEN) {
      return;
    }
    state = TunnelSessionState::ERRORED;
    toInvalidate.swap(channels);
  }
  LOG(WARNING) << "Tunnel session " << id << " errored: " << reason << " ("
               << toInvalidate.size() << " channels invalidated)";
  invalidateChannels(toInvalidate);
}

bool TunnelSession::checkAlive() {
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (state != TunnelSessionState::OPEN) {
      return false;
    }
  }
  if (!transportAlive()) {
    markErrored("transport is gone");
    return false;
  }
  return true;
}

TunnelSessionState TunnelSession::getState() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return state;
}

int TunnelSession::getOpenChannelCount() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return int(channels.size());
}

void TunnelSession::setMaxChannels(int _maxChannels) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  maxChannels = _maxChannels;
}

int TunnelSession::getMaxChannels() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return maxChannels;
}

void TunnelSession::channelClosed(int channelId) {
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (channels.erase(channelId) == 0) {
      // Already invalidated by close/markErrored
      return;
    }
  }
  closeStream(channelId);
  VLOG(1) << "Channel " << channelId << " closed on session " << id;
}

ChannelEndReason TunnelSession::channelEnded(int channelId) {
  if (!isOpen()) {
    return ChannelEndReason::SESSION_BROKEN;
  }
  if (!transportAlive()) {
    markErrored("transport died under channel " + to_string(channelId));
    return ChannelEndReason::SESSION_BROKEN;
  }
  auto reason = describeStreamEnd(channelId);
  if (reason == ChannelEndReason::SESSION_BROKEN) {
    markErrored("channel " + to_string(channelId) + " lost its transport");
  }
  return reason;
}

void TunnelSession::invalidateChannels(
    const map<int, shared_ptr<ForwardedChannel>>& toInvalidate) {
  for (auto& it : toInvalidate) {
    it.second->invalidate();
    closeStream(it.first);
  }
}
}  // namespace kvt
