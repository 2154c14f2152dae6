#ifndef DROIDBRIDGE_LOGGING_HPP
#define DROIDBRIDGE_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace droidbridge {

/**
 * Library-wide logger ("droidbridge"), writing to a colored stderr sink.
 * Created on first use and shared by every runner and session.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Set the logger level from its name (trace, debug, info, warn, error,
 * critical, off). Throws InvalidArgumentError on an unknown name.
 */
void set_log_level(const std::string& level);

} // namespace droidbridge

#endif // DROIDBRIDGE_LOGGING_HPP
