#include "TunnelErrors.hpp"

namespace kvt {
string toString(TunnelErrorCode code) {
  switch (code) {
    case TunnelErrorCode::AUTH_FAILED:
      return "AuthFailed";
    case TunnelErrorCode::TIMEOUT:
      return "Timeout";
    case TunnelErrorCode::NETWORK_UNREACHABLE:
      return "NetworkUnreachable";
    case TunnelErrorCode::SESSION_CLOSED:
      return "SessionClosed";
    case TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED:
      return "ChannelLimitExceeded";
    case TunnelErrorCode::REMOTE_REFUSED:
      return "RemoteRefused";
    case TunnelErrorCode::SESSION_UNAVAILABLE:
      return "SessionUnavailable";
  }
  return "Unknown";
}

string toString(IoErrorCode code) {
  switch (code) {
    case IoErrorCode::TIMEOUT:
      return "Timeout";
    case IoErrorCode::SESSION_BROKEN:
      return "SessionBroken";
    case IoErrorCode::PEER_CLOSED:
      return "PeerClosed";
  }
  return "Unknown";
}

string toString(PoolErrorCode code) {
  switch (code) {
    case PoolErrorCode::TIMEOUT:
      return "Timeout";
    case PoolErrorCode::CHANNEL_UNAVAILABLE:
      return "ChannelUnavailable";
    case PoolErrorCode::EXHAUSTED:
      return "Exhausted";
  }
  return "Unknown";
}
}  // namespace kvt
