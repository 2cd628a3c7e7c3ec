#ifndef __KVT_POOL_CONFIG_LOADER__
#define __KVT_POOL_CONFIG_LOADER__

#include "Headers.hpp"

namespace kvt {
/**
 * @brief Reads pool configuration from an INI file.
 *
 * [Tunnel] host, port, user, identity_file, connect_timeout_ms,
 *          accept_new_host_keys, ssh_option (repeatable)
 * [Target] host, port
 * [Pool]   max_connections, acquire_timeout_ms, shared,
 *          max_channels_per_session, reopen_wait_ms, socket_timeout_ms,
 *          channel_open_grace_ms
 * [Debug]  verbose
 */
class PoolConfigLoader {
 public:
  /**
   * @brief Overlays the values found in @p path on @p config.
   * @param verbosity Receives [Debug] verbose when present.
   * @throws std::runtime_error when the file cannot be read or a value does
   * not parse.
   */
  static void loadFile(const string& path, PoolConfig* config,
                       int* verbosity);

  /**
   * @brief Checks ranges.  The [Tunnel] section is ignored when
   * @p tunneled is false.
   * @throws std::runtime_error naming the first invalid field.
   */
  static void validate(const PoolConfig& config, bool tunneled = true);
};
}  // namespace kvt

#endif  // __KVT_POOL_CONFIG_LOADER__
