#include "TunneledTransport.hpp"

namespace kvt {
TunneledTransport::TunneledTransport() : timeoutMs(-1) {}

TunneledTransport::~TunneledTransport() { close(); }

void TunneledTransport::attach(shared_ptr<ForwardedChannel> _channel,
                               shared_ptr<TunnelSession> _ownedSession) {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (channel.get()) {
    STFATAL << "Tried to attach a channel to a transport that already has "
               "one";
  }
  channel = _channel;
  ownedSession = _ownedSession;
  channel->setTimeout(timeoutMs);
}

shared_ptr<ForwardedChannel> TunneledTransport::currentChannel() {
  lock_guard<recursive_mutex> guard(transportMutex);
  if (channel.get() == NULL) {
    throw IoError(IoErrorCode::PEER_CLOSED, "No channel attached");
  }
  return channel;
}

void TunneledTransport::connect() {
  auto c = currentChannel();
  if (c->isUsable()) {
    return;
  }
  auto session = c->getSession();
  if (session.get() == NULL || !session->isOpen()) {
    throw IoError(IoErrorCode::SESSION_BROKEN,
                  "Tunnel session under the attached channel is gone");
  }
  throw IoError(IoErrorCode::PEER_CLOSED, "Attached channel is closed");
}

size_t TunneledTransport::send(const void* buf, size_t count) {
  return currentChannel()->send(buf, count);
}

string TunneledTransport::recv(size_t maxBytes) {
  return currentChannel()->recv(maxBytes);
}

void TunneledTransport::close() {
  shared_ptr<ForwardedChannel> oldChannel;
  shared_ptr<TunnelSession> oldSession;
  {
    lock_guard<recursive_mutex> guard(transportMutex);
    oldChannel.swap(channel);
    oldSession.swap(ownedSession);
  }
  if (oldChannel.get()) {
    oldChannel->close();
  }
  if (oldSession.get()) {
    oldSession->close();
  }
}

void TunneledTransport::setTimeout(int64_t _timeoutMs) {
  lock_guard<recursive_mutex> guard(transportMutex);
  timeoutMs = _timeoutMs;
  if (channel.get()) {
    channel->setTimeout(_timeoutMs);
  }
}

int64_t TunneledTransport::getTimeout() { return timeoutMs; }

bool TunneledTransport::isUsable() {
  lock_guard<recursive_mutex> guard(transportMutex);
  return channel.get() && channel->isUsable();
}

shared_ptr<ForwardedChannel> TunneledTransport::getChannel() {
  lock_guard<recursive_mutex> guard(transportMutex);
  return channel;
}
}  // namespace kvt
