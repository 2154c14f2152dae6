#include "droidbridge/config.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/text.hpp"

#include <fstream>
#include <stdexcept>

namespace droidbridge {

namespace {

void validate(const ServerConfig& config) {
    if (config.adb_path.empty()) {
        throw InvalidArgumentError("adb_path must not be empty");
    }
    if (config.port <= 0 || config.port > 65535) {
        throw InvalidArgumentError("port out of range: " + std::to_string(config.port));
    }
    if (config.command_timeout_ms < 0 || config.package_cache_ttl_s < 0 ||
        config.connect_settle_ms < 0 || config.wakeup_settle_ms < 0) {
        throw InvalidArgumentError("durations must not be negative");
    }
}

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw InvalidArgumentError(name + " must be an integer, got \"" + value + "\"");
    }
}

bool parse_bool(const std::string& name, const std::string& value) {
    std::string lower = to_lower(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw InvalidArgumentError(name + " must be a boolean, got \"" + value + "\"");
}

} // namespace

void apply_json(ServerConfig& config, const json& j) {
    if (!j.is_object()) {
        throw InvalidArgumentError("configuration must be a JSON object");
    }

    try {
        config.adb_path = j.value("adb_path", config.adb_path);
        config.host = j.value("host", config.host);
        config.port = j.value("port", config.port);
        config.command_timeout_ms = j.value("command_timeout_ms", config.command_timeout_ms);
        config.log_level = j.value("log_level", config.log_level);
        config.debug = j.value("debug", config.debug);
        config.restart_server = j.value("restart_server", config.restart_server);
        config.package_cache_ttl_s = j.value("package_cache_ttl_s", config.package_cache_ttl_s);
        config.connect_settle_ms = j.value("connect_settle_ms", config.connect_settle_ms);
        config.wakeup_settle_ms = j.value("wakeup_settle_ms", config.wakeup_settle_ms);

        if (j.contains("api_token")) {
            const auto& token = j.at("api_token");
            if (token.is_null() || token.get<std::string>().empty()) {
                config.api_token.reset();
            } else {
                config.api_token = token.get<std::string>();
            }
        }

        if (j.contains("default_device")) {
            const auto& device = j.at("default_device");
            if (device.is_null()) {
                config.default_device.reset();
            } else {
                config.default_device = device.get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        throw InvalidArgumentError(std::string("Invalid configuration: ") + e.what());
    }

    validate(config);
}

void apply_environment(ServerConfig& config, const EnvLookup& getenv) {
    if (const char* v = getenv("DROIDBRIDGE_ADB")) config.adb_path = v;
    if (const char* v = getenv("DROIDBRIDGE_HOST")) config.host = v;
    if (const char* v = getenv("DROIDBRIDGE_PORT")) config.port = parse_int("DROIDBRIDGE_PORT", v);
    if (const char* v = getenv("DROIDBRIDGE_DEVICE")) {
        if (*v == '\0') {
            config.default_device.reset();
        } else {
            config.default_device = std::string(v);
        }
    }
    if (const char* v = getenv("DROIDBRIDGE_TIMEOUT_MS")) {
        config.command_timeout_ms = parse_int("DROIDBRIDGE_TIMEOUT_MS", v);
    }
    if (const char* v = getenv("DROIDBRIDGE_LOG_LEVEL")) config.log_level = v;
    if (const char* v = getenv("DROIDBRIDGE_TOKEN")) {
        if (*v == '\0') {
            config.api_token.reset();
        } else {
            config.api_token = std::string(v);
        }
    }
    if (const char* v = getenv("DROIDBRIDGE_DEBUG")) config.debug = parse_bool("DROIDBRIDGE_DEBUG", v);

    validate(config);
}

ServerConfig load_config(const std::optional<std::string>& path, const EnvLookup& getenv) {
    ServerConfig config;

    if (path) {
        std::ifstream in(*path);
        if (!in) {
            throw InvalidArgumentError("Cannot open configuration file: " + *path);
        }
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw InvalidArgumentError("Cannot parse configuration file " + *path + ": " + e.what());
        }
        apply_json(config, j);
    }

    apply_environment(config, getenv);
    return config;
}

json to_json(const ServerConfig& config) {
    json j;
    j["adb_path"] = config.adb_path;
    j["host"] = config.host;
    j["port"] = config.port;
    j["default_device"] = config.default_device.has_value() ? json(config.default_device.value()) : json(nullptr);
    j["command_timeout_ms"] = config.command_timeout_ms;
    j["log_level"] = config.log_level;
    j["debug"] = config.debug;
    j["restart_server"] = config.restart_server;
    j["package_cache_ttl_s"] = config.package_cache_ttl_s;
    j["connect_settle_ms"] = config.connect_settle_ms;
    j["wakeup_settle_ms"] = config.wakeup_settle_ms;
    // The token itself is never echoed
    j["api_token_set"] = config.api_token.has_value();
    return j;
}

} // namespace droidbridge
