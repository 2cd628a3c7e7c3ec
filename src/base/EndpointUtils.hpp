#ifndef __KVT_ENDPOINT_UTILS__
#define __KVT_ENDPOINT_UTILS__

#include "Headers.hpp"

namespace kvt {
/**
 * @brief Parses `[user@]host[:port]` into a tunnel endpoint.  IPv6 hosts must
 * be bracketed: `user@[::1]:2222`.
 * @throws EndpointParseException when the syntax is invalid.
 */
TunnelEndpoint parseTunnelEndpoint(const string& input);

/**
 * @brief Parses `host:port`, `[ipv6]:port`, `host` or `port` into a target
 * endpoint.  Missing parts keep the proto defaults (127.0.0.1:6379).
 * @throws EndpointParseException when the syntax is invalid.
 */
TargetEndpoint parseTargetEndpoint(const string& input);

/** @brief Formats a target the way `ssh -W` expects it. */
string formatForwardTarget(const TargetEndpoint& target);

/**
 * @brief Fills in the login name and the default private key when the
 * endpoint does not name them.
 */
void applyTunnelDefaults(TunnelEndpoint* endpoint);

/**
 * @brief Thrown when an invalid endpoint string is encountered.
 */
class EndpointParseException : public std::exception {
 public:
  explicit EndpointParseException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace kvt
#endif  // __KVT_ENDPOINT_UTILS__
