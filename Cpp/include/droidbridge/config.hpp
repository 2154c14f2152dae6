#ifndef DROIDBRIDGE_CONFIG_HPP
#define DROIDBRIDGE_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>
#include "droidbridge/models.hpp"

namespace droidbridge {

// Settings of droidbridge_server
struct ServerConfig {
    std::string adb_path = "adb";
    std::string host = "127.0.0.1";
    int port = 8000;
    std::optional<std::string> default_device;
    int command_timeout_ms = 30000;     ///< 0 disables the per-command timeout
    std::string log_level = "info";
    bool debug = false;
    bool restart_server = true;         ///< kill-server/start-server once at startup
    int package_cache_ttl_s = 30;
    int connect_settle_ms = 1000;
    int wakeup_settle_ms = 500;
    // When set, POST routes require "Authorization: Bearer <token>"
    std::optional<std::string> api_token;
};

// Environment lookup; returns nullptr for unset variables
using EnvLookup = std::function<const char*(const char*)>;

/**
 * Overlay the keys present in `j` onto `config`.
 * Throws InvalidArgumentError on a value of the wrong type or out of range.
 */
void apply_json(ServerConfig& config, const json& j);

/**
 * Overlay DROIDBRIDGE_* environment variables onto `config`.
 * Throws InvalidArgumentError on a malformed value.
 */
void apply_environment(ServerConfig& config, const EnvLookup& getenv);

/**
 * Defaults, then the JSON file at `path` (if given), then the environment.
 * Throws InvalidArgumentError if the file cannot be read or parsed.
 */
ServerConfig load_config(const std::optional<std::string>& path, const EnvLookup& getenv);

json to_json(const ServerConfig& config);

} // namespace droidbridge

#endif // DROIDBRIDGE_CONFIG_HPP
