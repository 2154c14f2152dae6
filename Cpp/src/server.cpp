#include "droidbridge/server.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/logging.hpp"
#include "droidbridge/text.hpp"

#include <httplib.h>
#include <opencv2/imgcodecs.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace droidbridge {

namespace {

std::optional<std::string> param(const httplib::Request& req, const std::string& name) {
    if (!req.has_param(name.c_str())) {
        return std::nullopt;
    }
    std::string value = req.get_param_value(name.c_str());
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string required_param(const httplib::Request& req, const std::string& name) {
    auto value = param(req, name);
    if (!value) {
        throw InvalidArgumentError("Missing query parameter: " + name);
    }
    return *value;
}

std::vector<std::string> split_names(const std::string& names) {
    std::vector<std::string> result;
    std::istringstream iss(names);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

// Run `build` and send its JSON; exceptions become JSON error responses
template <typename Fn>
void respond(httplib::Response& res, Fn&& build) {
    try {
        json j = build();
        res.set_content(j.dump(2), "application/json");
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        res.status = status_for(e);
        res.set_content(error_body(e).dump(2), "application/json");
    }
}

void reject(httplib::Response& res, int status, const std::string& type, const std::string& message) {
    logger()->warn("Rejected request: {}", message);
    json error;
    error["error"] = message;
    error["type"] = type;
    res.status = status;
    res.set_content(error.dump(2), "application/json");
}

} // namespace

// ============ ResponseCache ============

std::optional<std::string> ResponseCache::get(const std::string& key, std::chrono::seconds ttl) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (std::chrono::steady_clock::now() - it->second.timestamp >= ttl) {
        return std::nullopt;
    }
    return it->second.value;
}

void ResponseCache::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = {value, std::chrono::steady_clock::now()};
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============ Errors ============

int status_for(const std::exception& e) {
    if (dynamic_cast<const InvalidArgumentError*>(&e) || dynamic_cast<const UnknownKeyError*>(&e)) {
        return 400;
    }
    if (dynamic_cast<const WindowNotFoundError*>(&e)) {
        return 404;
    }
    if (dynamic_cast<const ConnectionError*>(&e)) {
        return 502;
    }
    return 500;
}

json error_body(const std::exception& e) {
    std::string type = "Error";
    if (dynamic_cast<const BinaryNotFoundError*>(&e)) type = "BinaryNotFoundError";
    else if (dynamic_cast<const InvalidArgumentError*>(&e)) type = "InvalidArgumentError";
    else if (dynamic_cast<const ProcessSpawnError*>(&e)) type = "ProcessSpawnError";
    else if (dynamic_cast<const ConnectionError*>(&e)) type = "ConnectionError";
    else if (dynamic_cast<const WindowNotFoundError*>(&e)) type = "WindowNotFoundError";
    else if (dynamic_cast<const ApplicationErrorError*>(&e)) type = "ApplicationErrorError";
    else if (dynamic_cast<const ApplicationNotRespondingError*>(&e)) type = "ApplicationNotRespondingError";
    else if (dynamic_cast<const WakeupFailedError*>(&e)) type = "WakeupFailedError";
    else if (dynamic_cast<const UnknownKeyError*>(&e)) type = "UnknownKeyError";
    else if (dynamic_cast<const MalformedHierarchyError*>(&e)) type = "MalformedHierarchyError";
    else if (dynamic_cast<const ScreenshotError*>(&e)) type = "ScreenshotError";
    else if (!dynamic_cast<const Error*>(&e)) type = "InternalError";

    json error;
    error["error"] = e.what();
    error["type"] = type;
    return error;
}

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(6) << us.count();
    return ss.str();
}

// ============ Routes ============

void register_routes(httplib::Server& svr, DeviceSession& session, ResponseCache& cache,
                     const ServerConfig& config) {
    const std::chrono::seconds package_ttl(config.package_cache_ttl_s);

    // POST routes drive the device: no browser origins, and the token when one is configured
    svr.set_pre_routing_handler([token = config.api_token](const httplib::Request& req, httplib::Response& res) {
        if (req.method != "POST") {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        if (req.has_header("Origin")) {
            reject(res, 403, "Forbidden", "Cross-origin requests may not drive the device");
            return httplib::Server::HandlerResponse::Handled;
        }
        if (token && req.get_header_value("Authorization") != "Bearer " + *token) {
            reject(res, 401, "Unauthorized", "Missing or invalid API token");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    // CORS, read-only routes only
    svr.set_post_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        if (req.method == "GET") {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET");
        }
    });

    // ============ ROOT ============
    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        respond(res, [] {
            json response;
            response["app"] = "DroidBridge";
            response["endpoints"] = {
                {"health", "GET /health"},
                {"devices", "GET /devices"},
                {"version", "GET /version"},
                {"connect", "POST /connect?address="},
                {"packages", "GET /packages"},
                {"activities", "GET /packages/activities?package="},
                {"focus", "GET /window/focus"},
                {"hierarchy", "GET /hierarchy"},
                {"launch", "POST /launch?package=&activity="},
                {"wakeup", "POST /wakeup"},
                {"keys", "POST /keys?names="},
                {"text", "POST /text"},
                {"install", "POST /install?path=&flags="},
                {"uninstall", "POST /uninstall?package=&flags="},
                {"shell", "POST /shell"},
                {"screenshot", "GET /screenshot"}
            };
            response["timestamp"] = get_iso_timestamp();
            return response;
        });
    });

    // ============ HEALTH ============
    svr.Get("/health", [&session](const httplib::Request&, httplib::Response& res) {
        respond(res, [&] {
            bool is_connected = false;
            for (const auto& entry : session.list_devices()) {
                if (entry.state == "device") {
                    is_connected = true;
                    break;
                }
            }

            json response;
            response["status"] = is_connected ? "healthy" : "degraded";
            response["adb_connected"] = is_connected;
            response["default_device"] = session.default_device().has_value()
                                             ? json(*session.default_device())
                                             : json(nullptr);
            response["active_processes"] = session.runner().active_processes();
            response["timestamp"] = get_iso_timestamp();
            return response;
        });
    });

    // ============ TRANSPORT ============
    svr.Get("/devices", [&session](const httplib::Request&, httplib::Response& res) {
        respond(res, [&] { return json(session.list_devices()); });
    });

    svr.Get("/version", [&session](const httplib::Request&, httplib::Response& res) {
        respond(res, [&] { return json{{"version", session.version()}}; });
    });

    svr.Post("/connect", [&session, &cache](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            std::string device = session.connect(param(req, "address"));
            // Cached answers may have been produced for another target
            cache.clear();
            return json{{"device", device}};
        });
    });

    // ============ PACKAGES ============
    svr.Get("/packages", [&session, &cache, package_ttl](const httplib::Request& req, httplib::Response& res) {
        auto device = param(req, "device");
        std::string key = "packages:" + device.value_or("");

        if (auto cached = cache.get(key, package_ttl)) {
            res.set_content(*cached, "application/json");
            return;
        }
        respond(res, [&] {
            json j = session.list_installed_packages(device);
            cache.set(key, j.dump(2));
            return j;
        });
    });

    svr.Get("/packages/activities", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            return json(session.list_package_activities(required_param(req, "package"), param(req, "device")));
        });
    });

    // ============ WINDOW ============
    svr.Get("/window/focus", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] { return json(session.get_focused_window(param(req, "device"))); });
    });

    svr.Get("/hierarchy", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            ViewNode root = session.get_view_hierarchy(param(req, "device"));
            json response;
            response["tree"] = root.to_json();
            response["xml"] = format_hierarchy(root);
            return response;
        });
    });

    // ============ INTERACTION ============
    svr.Post("/launch", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            std::string package = required_param(req, "package");
            session.launch(package, param(req, "activity"), param(req, "device"));
            return json{{"launched", package}};
        });
    });

    svr.Post("/wakeup", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            session.wakeup(param(req, "device"));
            return json{{"screen", session.screen_state(param(req, "device"))}};
        });
    });

    svr.Post("/keys", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            auto names = split_names(required_param(req, "names"));
            session.press_key(CommandLine(names), std::chrono::milliseconds(500), param(req, "device"));
            return json{{"pressed", names}};
        });
    });

    svr.Post("/text", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            session.input_text(req.body, std::chrono::milliseconds(500), param(req, "device"));
            return json{{"typed", req.body}};
        });
    });

    svr.Post("/install", [&session, &cache](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            std::string output = session.install_app(required_param(req, "path"),
                                                     param(req, "flags").value_or("r"), param(req, "device"));
            cache.clear();
            return json{{"output", output}};
        });
    });

    svr.Post("/uninstall", [&session, &cache](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            std::string output = session.uninstall_app(required_param(req, "package"),
                                                       param(req, "flags").value_or(""), param(req, "device"));
            cache.clear();
            return json{{"output", output}};
        });
    });

    svr.Post("/shell", [&session](const httplib::Request& req, httplib::Response& res) {
        respond(res, [&] {
            if (trim(req.body).empty()) {
                throw InvalidArgumentError("Request body must contain a shell command");
            }
            CommandLine cmd(req.body);
            cmd.prepend({"shell"});
            return json(session.run_result(cmd, "", param(req, "device")));
        });
    });

    svr.Get("/screenshot", [&session](const httplib::Request& req, httplib::Response& res) {
        try {
            cv::Mat image = session.screenshot(param(req, "device"));
            std::vector<unsigned char> png;
            if (!cv::imencode(".png", image, png)) {
                throw ScreenshotError("Failed to encode screenshot as PNG");
            }
            res.set_content(std::string(png.begin(), png.end()), "image/png");
        } catch (const std::exception& e) {
            logger()->error("{}", e.what());
            res.status = status_for(e);
            res.set_content(error_body(e).dump(2), "application/json");
        }
    });
}

} // namespace droidbridge
