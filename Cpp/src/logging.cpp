#include "droidbridge/logging.hpp"
#include "droidbridge/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace droidbridge {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("droidbridge");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("droidbridge");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        throw InvalidArgumentError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace droidbridge
