#include "EndpointUtils.hpp"

namespace kvt {
namespace {
struct HostAndPort {
  string host;
  string port;
};

// Splits host[:port], where an IPv6 host has to be inside square brackets
HostAndPort splitHostAndPort(const string& input) {
  HostAndPort result;
  if (!input.empty() && input[0] == '[') {
    auto closeBracket = input.find(']');
    if (closeBracket == string::npos) {
      throw EndpointParseException("Missing ']' in '" + input + "'");
    }
    result.host = input.substr(1, closeBracket - 1);
    string rest = input.substr(closeBracket + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') {
        throw EndpointParseException("Unexpected characters after ']' in '" +
                                     input + "'");
      }
      result.port = rest.substr(1);
    }
    return result;
  }
  auto colonCount = std::count(input.begin(), input.end(), ':');
  if (colonCount > 1) {
    throw EndpointParseException(
        "Ipv6 addresses must be inside of square brackets, ie [::1]:6379");
  }
  auto colonIndex = input.find(':');
  if (colonIndex == string::npos) {
    result.host = input;
  } else {
    result.host = input.substr(0, colonIndex);
    result.port = input.substr(colonIndex + 1);
  }
  return result;
}

int parsePort(const string& port, const string& input) {
  if (port.empty() || port.find_first_not_of("0123456789") != string::npos) {
    throw EndpointParseException("Invalid port in '" + input + "'");
  }
  int value;
  try {
    value = stoi(port);
  } catch (const std::logic_error& lr) {
    throw EndpointParseException("Invalid port in '" + input +
                                 "': " + lr.what());
  }
  if (value < 1 || value > 65535) {
    throw EndpointParseException("Port out of range in '" + input + "'");
  }
  return value;
}
}  // namespace

TunnelEndpoint parseTunnelEndpoint(const string& input) {
  TunnelEndpoint endpoint;
  string remaining = input;
  auto atIndex = remaining.rfind('@');
  if (atIndex != string::npos) {
    endpoint.set_user(remaining.substr(0, atIndex));
    remaining = remaining.substr(atIndex + 1);
    if (endpoint.user().empty()) {
      throw EndpointParseException("Empty user name in '" + input + "'");
    }
  }
  auto hostAndPort = splitHostAndPort(remaining);
  if (hostAndPort.host.empty()) {
    throw EndpointParseException("Missing tunnel host in '" + input + "'");
  }
  endpoint.set_host(hostAndPort.host);
  if (!hostAndPort.port.empty()) {
    endpoint.set_port(parsePort(hostAndPort.port, input));
  }
  return endpoint;
}

TargetEndpoint parseTargetEndpoint(const string& input) {
  TargetEndpoint target;
  if (input.empty()) {
    throw EndpointParseException("Empty target endpoint");
  }
  if (input.find_first_not_of("0123456789") == string::npos) {
    // Just a port on the default host
    target.set_port(parsePort(input, input));
    return target;
  }
  auto hostAndPort = splitHostAndPort(input);
  if (hostAndPort.host.empty()) {
    throw EndpointParseException("Missing target host in '" + input + "'");
  }
  target.set_host(hostAndPort.host);
  if (!hostAndPort.port.empty()) {
    target.set_port(parsePort(hostAndPort.port, input));
  }
  return target;
}

string formatForwardTarget(const TargetEndpoint& target) {
  if (target.host().find(':') != string::npos) {
    return "[" + target.host() + "]:" + to_string(target.port());
  }
  return target.host() + ":" + to_string(target.port());
}

void applyTunnelDefaults(TunnelEndpoint* endpoint) {
  if (!endpoint->has_user() || endpoint->user().empty()) {
    endpoint->set_user(GetOsUserName());
  }
  if (!endpoint->has_identity_file()) {
    string defaultKey = GetHomeDirectory() + "/.ssh/id_rsa";
    std::error_code ec;
    if (fs::exists(defaultKey, ec)) {
      endpoint->set_identity_file(defaultKey);
    }
  } else if (!endpoint->identity_file().empty() &&
             endpoint->identity_file()[0] == '~') {
    endpoint->set_identity_file(GetHomeDirectory() +
                                endpoint->identity_file().substr(1));
  }
}
}  // namespace kvt
