#include <httplib.h>
#include "droidbridge/config.hpp"
#include "droidbridge/device_session.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/logging.hpp"
#include "droidbridge/server.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace droidbridge;

namespace {

httplib::Server* g_server = nullptr;

void on_signal(int) {
    // stop() unblocks listen(); main then returns and the exit hook reaps children
    if (g_server) {
        g_server->stop();
    }
}

SessionOptions session_options(const ServerConfig& config) {
    SessionOptions options;
    options.adb_path = config.adb_path;
    options.default_device = config.default_device;
    options.debug = config.debug;
    if (config.command_timeout_ms > 0) {
        options.command_timeout = std::chrono::milliseconds(config.command_timeout_ms);
    }
    options.connect_settle = std::chrono::milliseconds(config.connect_settle_ms);
    options.wakeup_settle = std::chrono::milliseconds(config.wakeup_settle_ms);
    if (config.restart_server) {
        options.server_guard = std::make_shared<BridgeServerGuard>();
    }
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    ServerConfig config;
    std::unique_ptr<DeviceSession> session;

    try {
        std::optional<std::string> config_path;
        if (argc > 1) {
            config_path = argv[1];
        }
        config = load_config(config_path, [](const char* name) -> const char* { return std::getenv(name); });
        set_log_level(config.log_level);

        session = std::make_unique<DeviceSession>(session_options(config));
    } catch (const std::exception& e) {
        std::cerr << "droidbridge_server: " << e.what() << "\n";
        return 1;
    }

    httplib::Server svr;
    ResponseCache cache;
    register_routes(svr, *session, cache, config);

    g_server = &svr;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    logger()->info("DroidBridge listening on http://{}:{}", config.host, config.port);
    if (config.host != "127.0.0.1" && config.host != "localhost" && !config.api_token) {
        logger()->warn("Listening on {} without an API token; any host on the network can drive the device",
                       config.host);
    }
    if (session->default_device()) {
        logger()->info("Default device: {}", *session->default_device());
    }

    if (!svr.listen(config.host.c_str(), config.port)) {
        logger()->error("Failed to listen on {}:{}", config.host, config.port);
        return 1;
    }

    logger()->info("Server stopped");
    return 0;
}
