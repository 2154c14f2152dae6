#include "droidbridge/parsers.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/text.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace droidbridge {
namespace parsers {

std::optional<ConnectReply> parse_connect_output(const std::string& text) {
    static const std::string marker = "connected to ";

    std::string lower = to_lower(text);
    size_t pos = lower.find(marker);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string rest = lower.substr(pos + marker.size());
    size_t eol = rest.find('\n');
    if (eol != std::string::npos) {
        rest = rest.substr(0, eol);
    }

    ConnectReply reply;
    reply.device = trim(rest);
    reply.already_connected = lower.find("already connected to ") != std::string::npos;
    if (reply.device.empty()) {
        return std::nullopt;
    }
    return reply;
}

std::vector<DeviceEntry> parse_devices(const std::string& text) {
    std::vector<DeviceEntry> devices;

    for (const auto& line : split_lines(text)) {
        if (line.empty() || line[0] == '*' || line.rfind("List of devices", 0) == 0) {
            continue;
        }

        std::istringstream line_stream(line);
        DeviceEntry entry;
        if (line_stream >> entry.serial >> entry.state) {
            devices.push_back(entry);
        }
    }

    return devices;
}

std::vector<std::string> parse_package_list(const std::string& text) {
    std::vector<std::string> packages;

    for (const auto& line : split_lines(text)) {
        if (std::count(line.begin(), line.end(), '=') != 1) {
            continue;
        }
        std::string package = trim(line.substr(line.find('=') + 1));
        if (!package.empty()) {
            packages.push_back(package);
        }
    }

    return packages;
}

std::vector<std::string> parse_package_activities(const std::string& text, const std::string& package) {
    std::regex activity_regex("[0-9a-fA-F]{8} " + regex_escape(package) + R"(/([\.\w]+) filter [0-9a-fA-F]{8})");
    std::vector<std::string> activities;

    auto iter = std::sregex_iterator(text.begin(), text.end(), activity_regex);
    for (auto end = std::sregex_iterator(); iter != end; ++iter) {
        std::string activity = (*iter)[1].str();

        // Only "<prefix>.<Name>" entries, e.g. ".MainActivity"
        if (std::count(activity.begin(), activity.end(), '.') != 1) {
            continue;
        }
        if (std::find(activities.begin(), activities.end(), activity) == activities.end()) {
            activities.push_back(activity);
        }
    }

    return activities;
}

FocusedWindow parse_focused_window(const std::string& text) {
    std::string focus_line;
    std::string app_line;

    for (const auto& line : split_lines(text)) {
        if (focus_line.empty() && line.find("mCurrentFocus") != std::string::npos) {
            focus_line = line;
        } else if (app_line.empty() && line.find("mFocusedApp") != std::string::npos) {
            app_line = line;
        }
    }

    if (focus_line.find("Application Error") != std::string::npos) {
        throw ApplicationErrorError("Application error: " + trim(focus_line));
    }
    if (focus_line.find("Application Not Responding") != std::string::npos) {
        throw ApplicationNotRespondingError("Application not responding: " + trim(focus_line));
    }

    static const std::regex token_regex(R"([\w\.]+/[\w\.]+)");
    std::smatch match;
    for (const std::string* line : {&app_line, &focus_line}) {
        if (std::regex_search(*line, match, token_regex)) {
            std::string token = match[0].str();
            size_t slash = token.find('/');
            return FocusedWindow{token.substr(0, slash), token.substr(slash + 1)};
        }
    }

    throw WindowNotFoundError("Current window focus could not be found in dumpsys");
}

ScreenState parse_screen_state(const std::string& text) {
    if (text.find("mScreenOn=true") != std::string::npos ||
        text.find("Display Power: state=ON") != std::string::npos) {
        return ScreenState::On;
    }
    if (text.find("mScreenOn=false") != std::string::npos ||
        text.find("Display Power: state=OFF") != std::string::npos ||
        text.find("Display Power: state=DOZE") != std::string::npos) {
        return ScreenState::Off;
    }
    return ScreenState::Unknown;
}

std::string strip_hierarchy_trailer(const std::string& text) {
    size_t begin = text.find('<');
    size_t end = text.rfind('>');
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        return trim(text);
    }
    return text.substr(begin, end - begin + 1);
}

std::string build_multi_command(const std::vector<std::string>& cmds, const std::string& marker) {
    std::string combined;
    for (size_t i = 0; i < cmds.size(); ++i) {
        combined += "echo " + marker + std::to_string(i) + "; " + cmds[i] + "; ";
    }
    return combined;
}

std::vector<std::string> split_multi_output(const std::string& output, size_t count, const std::string& marker) {
    std::vector<std::string> results(count, "");
    long current = -1;
    std::string buffer;

    auto flush = [&]() {
        if (current >= 0 && static_cast<size_t>(current) < count) {
            results[current] = trim_right(buffer);
        }
        buffer.clear();
    };

    for (const auto& line : split_lines(output)) {
        if (line.rfind(marker, 0) == 0) {
            flush();
            try {
                current = std::stol(line.substr(marker.length()));
            } catch (const std::logic_error&) {
                current++;
            }
        } else if (current >= 0) {
            buffer += line + "\n";
        }
    }
    flush();

    return results;
}

} // namespace parsers
} // namespace droidbridge
