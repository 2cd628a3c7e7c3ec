#include "EndpointUtils.hpp"
#include "TestHeaders.hpp"

using namespace kvt;

TEST_CASE("Parses tunnel endpoints", "[EndpointUtils]") {
  SECTION("host only keeps the default port") {
    auto endpoint = parseTunnelEndpoint("bastion.example.com");
    REQUIRE(endpoint.host() == "bastion.example.com");
    REQUIRE(endpoint.port() == DEFAULT_TUNNEL_PORT);
    REQUIRE_FALSE(endpoint.has_port());
    REQUIRE_FALSE(endpoint.has_user());
  }

  SECTION("user, host and port") {
    auto endpoint = parseTunnelEndpoint("deploy@10.1.2.3:2200");
    REQUIRE(endpoint.user() == "deploy");
    REQUIRE(endpoint.host() == "10.1.2.3");
    REQUIRE(endpoint.port() == 2200);
  }

  SECTION("user names may contain @") {
    auto endpoint = parseTunnelEndpoint("me@corp.com@jump");
    REQUIRE(endpoint.user() == "me@corp.com");
    REQUIRE(endpoint.host() == "jump");
  }

  SECTION("bracketed ipv6") {
    auto endpoint = parseTunnelEndpoint("root@[fe80::1]:22022");
    REQUIRE(endpoint.host() == "fe80::1");
    REQUIRE(endpoint.port() == 22022);
  }
}

TEST_CASE("Rejects invalid tunnel endpoints", "[EndpointUtils]") {
  REQUIRE_THROWS_AS(parseTunnelEndpoint(""), EndpointParseException);
  REQUIRE_THROWS_AS(parseTunnelEndpoint("@host"), EndpointParseException);
  REQUIRE_THROWS_AS(parseTunnelEndpoint("user@"), EndpointParseException);
  REQUIRE_THROWS_AS(parseTunnelEndpoint("host:abc"), EndpointParseException);
  REQUIRE_THROWS_AS(parseTunnelEndpoint("host:70000"),
                    EndpointParseException);
  REQUIRE_THROWS_AS(parseTunnelEndpoint("[::1"), EndpointParseException);
  REQUIRE_THROWS_WITH(
      parseTunnelEndpoint("::1:22"),
      "Ipv6 addresses must be inside of square brackets, ie [::1]:6379");
}

TEST_CASE("Parses target endpoints", "[EndpointUtils]") {
  auto target = parseTargetEndpoint("cache.internal:6380");
  REQUIRE(target.host() == "cache.internal");
  REQUIRE(target.port() == 6380);

  target = parseTargetEndpoint("cache.internal");
  REQUIRE(target.host() == "cache.internal");
  REQUIRE(target.port() == 6379);

  target = parseTargetEndpoint("7000");
  REQUIRE(target.host() == "127.0.0.1");
  REQUIRE(target.port() == 7000);

  target = parseTargetEndpoint("[::1]:6379");
  REQUIRE(target.host() == "::1");

  REQUIRE_THROWS_AS(parseTargetEndpoint(""), EndpointParseException);
  REQUIRE_THROWS_AS(parseTargetEndpoint(":6379"), EndpointParseException);
  REQUIRE_THROWS_AS(parseTargetEndpoint("0"), EndpointParseException);
}

TEST_CASE("Formats forward targets for ssh -W", "[EndpointUtils]") {
  TargetEndpoint target;
  target.set_host("10.0.0.5");
  target.set_port(6379);
  REQUIRE(formatForwardTarget(target) == "10.0.0.5:6379");

  target.set_host("fd00::5");
  REQUIRE(formatForwardTarget(target) == "[fd00::5]:6379");
}

TEST_CASE("Fills in tunnel defaults", "[EndpointUtils]") {
  TunnelEndpoint endpoint;
  endpoint.set_host("bastion");
  applyTunnelDefaults(&endpoint);
  REQUIRE(endpoint.user() == GetOsUserName());

  TunnelEndpoint withKey;
  withKey.set_host("bastion");
  withKey.set_user("ops");
  withKey.set_identity_file("~/keys/pool_key");
  applyTunnelDefaults(&withKey);
  REQUIRE(withKey.user() == "ops");
  REQUIRE(withKey.identity_file() == GetHomeDirectory() + "/keys/pool_key");
}
