#ifndef DROIDBRIDGE_PARSERS_HPP
#define DROIDBRIDGE_PARSERS_HPP

#include <optional>
#include <string>
#include <vector>
#include "droidbridge/models.hpp"

namespace droidbridge {
namespace parsers {

// Result of "adb connect"
struct ConnectReply {
    std::string device;
    bool already_connected = false;
};

// Parse "adb connect" output; std::nullopt unless it contains "connected to "
std::optional<ConnectReply> parse_connect_output(const std::string& text);

// Parse "adb devices" output
std::vector<DeviceEntry> parse_devices(const std::string& text);

// Parse "pm list packages -f" output
std::vector<std::string> parse_package_list(const std::string& text);

// Parse "dumpsys package <pkg>" output into exported activity names
std::vector<std::string> parse_package_activities(const std::string& text, const std::string& package);

/**
 * Parse the mCurrentFocus / mFocusedApp lines of "dumpsys window windows".
 * Throws ApplicationErrorError or ApplicationNotRespondingError when the
 * focus line reports a crash or ANR dialog, WindowNotFoundError when no
 * package/activity token is present.
 */
FocusedWindow parse_focused_window(const std::string& text);

// Parse mScreenOn / "Display Power: state=" lines of "dumpsys power"
ScreenState parse_screen_state(const std::string& text);

// Cut a uiautomator dump down to the markup between the first '<' and the last '>'
std::string strip_hierarchy_trailer(const std::string& text);

// Join shell commands into one invocation, each preceded by a numbered marker line
std::string build_multi_command(const std::vector<std::string>& cmds, const std::string& marker);

// Split the output of a build_multi_command() invocation back per command
std::vector<std::string> split_multi_output(const std::string& output, size_t count, const std::string& marker);

} // namespace parsers
} // namespace droidbridge

#endif // DROIDBRIDGE_PARSERS_HPP
