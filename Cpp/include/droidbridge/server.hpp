#ifndef DROIDBRIDGE_SERVER_HPP
#define DROIDBRIDGE_SERVER_HPP

#include <chrono>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "droidbridge/config.hpp"
#include "droidbridge/device_session.hpp"
#include "droidbridge/models.hpp"

namespace httplib {
class Server;
}

namespace droidbridge {

// Serialized responses kept for a fixed time-to-live
class ResponseCache {
public:
    std::optional<std::string> get(const std::string& key, std::chrono::seconds ttl) const;
    void set(const std::string& key, const std::string& value);
    void clear();

private:
    struct CacheEntry {
        std::string value;
        std::chrono::steady_clock::time_point timestamp;
    };

    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> entries_;
};

// HTTP status for an exception escaping a route handler
int status_for(const std::exception& e);

// {"error": what(), "type": <error class name>}
json error_body(const std::exception& e);

std::string get_iso_timestamp();

void register_routes(httplib::Server& svr, DeviceSession& session, ResponseCache& cache,
                     const ServerConfig& config);

} // namespace droidbridge

#endif // DROIDBRIDGE_SERVER_HPP
