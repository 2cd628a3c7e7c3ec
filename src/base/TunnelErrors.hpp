#ifndef __KVT_TUNNEL_ERRORS__
#define __KVT_TUNNEL_ERRORS__

#include "Headers.hpp"

namespace kvt {
enum class TunnelErrorCode {
  AUTH_FAILED,
  TIMEOUT,
  NETWORK_UNREACHABLE,
  SESSION_CLOSED,
  CHANNEL_LIMIT_EXCEEDED,
  REMOTE_REFUSED,
  SESSION_UNAVAILABLE,
};

enum class IoErrorCode {
  TIMEOUT,
  SESSION_BROKEN,
  PEER_CLOSED,
};

enum class PoolErrorCode {
  TIMEOUT,
  CHANNEL_UNAVAILABLE,
  EXHAUSTED,
};

string toString(TunnelErrorCode code);
string toString(IoErrorCode code);
string toString(PoolErrorCode code);

/**
 * @brief Failure to open, use or keep a tunnel session.
 */
class TunnelError : public std::runtime_error {
 public:
  TunnelError(TunnelErrorCode _code, const string& msg)
      : std::runtime_error(toString(_code) + ": " + msg), code(_code) {}

  TunnelErrorCode getCode() const { return code; }

  /**
   * @brief True when the error means the whole session is unusable, as
   * opposed to a single channel being refused.
   */
  bool isSessionFatal() const {
    return code != TunnelErrorCode::CHANNEL_LIMIT_EXCEEDED &&
           code != TunnelErrorCode::REMOTE_REFUSED;
  }

 private:
  TunnelErrorCode code;
};

/**
 * @brief Byte stream failure on a transport.  SESSION_BROKEN must never be
 * reported as an empty read.
 */
class IoError : public std::runtime_error {
 public:
  IoError(IoErrorCode _code, const string& msg)
      : std::runtime_error(toString(_code) + ": " + msg), code(_code) {}

  IoErrorCode getCode() const { return code; }

 private:
  IoErrorCode code;
};

/** @brief Failure to lease a connection from a pool. */
class PoolError : public std::runtime_error {
 public:
  PoolError(PoolErrorCode _code, const string& msg)
      : std::runtime_error(toString(_code) + ": " + msg), code(_code) {}

  PoolErrorCode getCode() const { return code; }

 private:
  PoolErrorCode code;
};
}  // namespace kvt

#endif  // __KVT_TUNNEL_ERRORS__
