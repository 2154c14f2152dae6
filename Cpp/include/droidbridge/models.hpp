#ifndef DROIDBRIDGE_MODELS_HPP
#define DROIDBRIDGE_MODELS_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace droidbridge {

using json = nlohmann::json;

// Outcome of one bridge invocation
struct CommandResult {
    int exit_status = 0;
    std::string output;
    bool timed_out = false;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(CommandResult, exit_status, output, timed_out)
};

// Entry of "adb devices"
struct DeviceEntry {
    std::string serial;
    std::string state;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(DeviceEntry, serial, state)
};

// Window that currently holds input focus
struct FocusedWindow {
    std::string package;
    std::string activity;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FocusedWindow, package, activity)
};

enum class ScreenState {
    On,
    Off,
    Unknown
};

NLOHMANN_JSON_SERIALIZE_ENUM(ScreenState, {
    {ScreenState::Unknown, "unknown"},
    {ScreenState::On, "on"},
    {ScreenState::Off, "off"},
})

} // namespace droidbridge

#endif // DROIDBRIDGE_MODELS_HPP
