#include "PoolConfigLoader.hpp"

#include <SimpleIni.h>

namespace kvt {
namespace {
int64_t parseNumber(const char* section, const char* key, const char* value) {
  try {
    size_t consumed;
    int64_t number = stoll(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return number;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid number for ") + section + "." +
                             key + ": " + value);
  }
}

int parseInt(const char* section, const char* key, const char* value) {
  int64_t number = parseNumber(section, key, value);
  if (number < std::numeric_limits<int>::min() ||
      number > std::numeric_limits<int>::max()) {
    throw std::runtime_error(string("Out of range for ") + section + "." +
                             key + ": " + value);
  }
  return int(number);
}

bool parseFlag(const char* section, const char* key, const char* value) {
  string s(value);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return char(::tolower(c)); });
  if (s == "1" || s == "true" || s == "yes" || s == "on") {
    return true;
  }
  if (s == "0" || s == "false" || s == "no" || s == "off") {
    return false;
  }
  throw std::runtime_error(string("Invalid flag for ") + section + "." + key +
                           ": " + value);
}
}  // namespace

void PoolConfigLoader::loadFile(const string& path, PoolConfig* config,
                                int* verbosity) {
  CSimpleIniA ini(true, true, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  auto tunnel = config->mutable_tunnel();
  const char* value;
  if ((value = ini.GetValue("Tunnel", "host", NULL))) {
    tunnel->set_host(value);
  }
  if ((value = ini.GetValue("Tunnel", "port", NULL))) {
    tunnel->set_port(parseInt("Tunnel", "port", value));
  }
  if ((value = ini.GetValue("Tunnel", "user", NULL))) {
    tunnel->set_user(value);
  }
  if ((value = ini.GetValue("Tunnel", "identity_file", NULL))) {
    tunnel->set_identity_file(value);
  }
  if ((value = ini.GetValue("Tunnel", "connect_timeout_ms", NULL))) {
    tunnel->set_connect_timeout_ms(
        parseNumber("Tunnel", "connect_timeout_ms", value));
  }
  if ((value = ini.GetValue("Tunnel", "accept_new_host_keys", NULL))) {
    tunnel->set_accept_new_host_keys(
        parseFlag("Tunnel", "accept_new_host_keys", value));
  }
  CSimpleIniA::TNamesDepend sshOptions;
  if (ini.GetAllValues("Tunnel", "ssh_option", sshOptions)) {
    // Keep the order of the file
    sshOptions.sort(CSimpleIniA::Entry::LoadOrder());
    for (auto& entry : sshOptions) {
      tunnel->add_ssh_options(entry.pItem);
    }
  }

  auto target = config->mutable_target();
  if ((value = ini.GetValue("Target", "host", NULL))) {
    target->set_host(value);
  }
  if ((value = ini.GetValue("Target", "port", NULL))) {
    target->set_port(parseInt("Target", "port", value));
  }

  if ((value = ini.GetValue("Pool", "max_connections", NULL))) {
    config->set_max_connections(
        parseInt("Pool", "max_connections", value));
  }
  if ((value = ini.GetValue("Pool", "acquire_timeout_ms", NULL))) {
    config->set_acquire_timeout_ms(
        parseNumber("Pool", "acquire_timeout_ms", value));
  }
  if ((value = ini.GetValue("Pool", "shared", NULL))) {
    config->set_shared(parseFlag("Pool", "shared", value));
  }
  if ((value = ini.GetValue("Pool", "max_channels_per_session", NULL))) {
    config->set_max_channels_per_session(
        parseInt("Pool", "max_channels_per_session", value));
  }
  if ((value = ini.GetValue("Pool", "reopen_wait_ms", NULL))) {
    config->set_reopen_wait_ms(parseNumber("Pool", "reopen_wait_ms", value));
  }
  if ((value = ini.GetValue("Pool", "socket_timeout_ms", NULL))) {
    config->set_socket_timeout_ms(
        parseNumber("Pool", "socket_timeout_ms", value));
  }
  if ((value = ini.GetValue("Pool", "channel_open_grace_ms", NULL))) {
    config->set_channel_open_grace_ms(
        parseNumber("Pool", "channel_open_grace_ms", value));
  }

  if (verbosity && (value = ini.GetValue("Debug", "verbose", NULL))) {
    *verbosity = parseInt("Debug", "verbose", value);
  }
}

void PoolConfigLoader::validate(const PoolConfig& config, bool tunneled) {
  if (tunneled) {
    if (config.tunnel().host().empty()) {
      throw std::runtime_error("Missing tunnel host");
    }
    if (config.tunnel().port() <= 0 || config.tunnel().port() > 65535) {
      throw std::runtime_error("Invalid tunnel port: " +
                               to_string(config.tunnel().port()));
    }
  }
  if (config.tunnel().connect_timeout_ms() <= 0) {
    throw std::runtime_error("connect_timeout_ms must be positive");
  }
  if (config.target().host().empty()) {
    throw std::runtime_error("Missing target host");
  }
  if (config.target().port() <= 0 || config.target().port() > 65535) {
    throw std::runtime_error("Invalid target port: " +
                             to_string(config.target().port()));
  }
  if (config.max_connections() <= 0) {
    throw std::runtime_error("max_connections must be positive");
  }
  if (config.acquire_timeout_ms() < 0) {
    throw std::runtime_error("acquire_timeout_ms must not be negative");
  }
  if (config.max_channels_per_session() <= 0) {
    throw std::runtime_error("max_channels_per_session must be positive");
  }
  if (config.channel_open_grace_ms() < 0) {
    throw std::runtime_error("channel_open_grace_ms must not be negative");
  }
  if (tunneled && config.shared() &&
      config.max_connections() > config.max_channels_per_session()) {
    LOG(WARNING) << "Shared session allows "
                 << config.max_channels_per_session()
                 << " channels but the pool holds up to "
                 << config.max_connections()
                 << " connections: leases past the limit fail";
  }
}
}  // namespace kvt
