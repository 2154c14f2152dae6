#include "droidbridge/device_session.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/keycodes.hpp"
#include "droidbridge/logging.hpp"
#include "droidbridge/parsers.hpp"
#include "droidbridge/text.hpp"

#include <filesystem>

#include <opencv2/imgcodecs.hpp>

namespace fs = std::filesystem;

namespace droidbridge {

namespace {

const char* const MULTI_MARKER = "__DROIDBRIDGE_MULTI__";
const char* const FOCUS_FILTER = "mCurrentFocus|mFocusedApp";
const char* const SCREEN_FILTER = "mScreenOn=|Display Power: state=";

RunnerOptions runner_options(const SessionOptions& options) {
    RunnerOptions runner;
    runner.singleton = false;
    runner.debug = options.debug;
    runner.spawner = options.spawner;
    runner.resolver = options.resolver;
    return runner;
}

void settle(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

// Holds the session's wakeup lock and records the calling thread as its owner
class WakeupScope {
public:
    WakeupScope(std::mutex& mutex, std::atomic<std::thread::id>& owner)
        : lock_(mutex), owner_(owner) {
        owner_ = std::this_thread::get_id();
    }

    ~WakeupScope() {
        owner_ = std::thread::id();
    }

    WakeupScope(const WakeupScope&) = delete;
    WakeupScope& operator=(const WakeupScope&) = delete;

private:
    std::lock_guard<std::mutex> lock_;
    std::atomic<std::thread::id>& owner_;
};

} // namespace

// ============ BridgeServerGuard ============

bool BridgeServerGuard::ensure_restarted(DeviceSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (restarted_) {
        return false;
    }
    session.kill_server();
    session.start_server();
    restarted_ = true;
    return true;
}

// ============ DeviceSession ============

DeviceSession::DeviceSession(SessionOptions options)
    : runner_(CommandLine(std::vector<std::string>{options.adb_path}), runner_options(options)),
      debug_(options.debug),
      command_timeout_(options.command_timeout),
      connect_settle_(options.connect_settle),
      wakeup_settle_(options.wakeup_settle) {
    if (options.server_guard) {
        options.server_guard->ensure_restarted(*this);
    }
    if (options.default_device) {
        connect(*options.default_device);
    }
}

std::optional<std::string> DeviceSession::default_device() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return default_device_;
}

std::optional<std::string> DeviceSession::resolve_target(const std::optional<std::string>& device) const {
    if (device) {
        return device;
    }
    return default_device();
}

void DeviceSession::print(const std::string& output) const {
    if (debug_ && !output.empty()) {
        logger()->info("{}", output);
    }
}

ExecOptions DeviceSession::exec_options(const std::string& filter) const {
    ExecOptions options;
    options.timeout = command_timeout_;
    options.filter = filter;
    return options;
}

CommandResult DeviceSession::run_untargeted(const CommandLine& args) {
    auto result = runner_.execute(args, exec_options(""));
    print(result.output);
    return result;
}

CommandResult DeviceSession::run_result(const CommandLine& args, const std::string& filter,
                                        const std::optional<std::string>& device) {
    CommandLine cmd = args;
    if (auto target = resolve_target(device)) {
        cmd.prepend({"-s", *target});
    }

    auto result = runner_.execute(cmd, exec_options(filter));
    print(result.output);
    return result;
}

std::string DeviceSession::run(const CommandLine& args, const std::string& filter,
                               const std::optional<std::string>& device) {
    return run_result(args, filter, device).output;
}

std::string DeviceSession::shell(const CommandLine& args, const std::string& filter,
                                 const std::optional<std::string>& device) {
    CommandLine cmd = args;
    cmd.prepend({"shell"});
    return run(cmd, filter, device);
}

std::string DeviceSession::exec_out(const CommandLine& args, const std::string& filter,
                                    const std::optional<std::string>& device) {
    CommandLine cmd = args;
    cmd.prepend({"exec-out"});
    return run(cmd, filter, device);
}

std::vector<std::string> DeviceSession::shell_multi(const std::vector<std::string>& commands,
                                                    const std::optional<std::string>& device) {
    if (commands.empty()) {
        return {};
    }

    std::string combined = parsers::build_multi_command(commands, MULTI_MARKER);
    std::string output = shell(CommandLine(std::vector<std::string>{combined}), "", device);
    return parsers::split_multi_output(output, commands.size(), MULTI_MARKER);
}

// ============ Transport commands ============

std::string DeviceSession::connect(const std::optional<std::string>& address) {
    std::vector<std::string> args{"connect"};
    if (address) {
        args.push_back(*address);
    }

    std::string output = run_untargeted(CommandLine(args)).output;
    auto reply = parsers::parse_connect_output(output);
    if (!reply) {
        throw ConnectionError(output.empty() ? "adb connect produced no output" : output);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!default_device_) {
            default_device_ = reply->device;
        }
    }

    if (!reply->already_connected) {
        settle(connect_settle_);
    }
    return reply->device;
}

std::string DeviceSession::disconnect(const std::optional<std::string>& address) {
    std::vector<std::string> args{"disconnect"};
    if (address) {
        args.push_back(*address);
    }
    return run_untargeted(CommandLine(args)).output;
}

std::string DeviceSession::version() {
    return run_untargeted("version").output;
}

std::string DeviceSession::start_server() {
    return run_untargeted("start-server").output;
}

std::string DeviceSession::kill_server() {
    return run_untargeted("kill-server").output;
}

std::vector<DeviceEntry> DeviceSession::list_devices() {
    return parsers::parse_devices(run_untargeted("devices").output);
}

std::string DeviceSession::wait_for_device(const std::optional<std::string>& device) {
    return run("wait-for-device", "", device);
}

std::string DeviceSession::reboot(const std::optional<std::string>& device) {
    return run("reboot", "", device);
}

// ============ Device queries ============

std::string DeviceSession::get_property(const std::string& name, const std::optional<std::string>& device) {
    return shell(CommandLine{"getprop", name}, "", device);
}

std::vector<std::string> DeviceSession::list_installed_packages(const std::optional<std::string>& device) {
    return parsers::parse_package_list(shell("pm list packages -f", "", device));
}

std::vector<std::string> DeviceSession::list_package_activities(const std::string& package,
                                                                const std::optional<std::string>& device) {
    std::string output = shell(CommandLine{"dumpsys", "package", package}, "", device);
    return parsers::parse_package_activities(output, package);
}

FocusedWindow DeviceSession::get_focused_window(const std::optional<std::string>& device) {
    return parsers::parse_focused_window(shell("dumpsys window windows", FOCUS_FILTER, device));
}

ViewNode DeviceSession::get_view_hierarchy(const std::optional<std::string>& device) {
    std::string output = exec_out("uiautomator dump /dev/tty", "", device);
    return parse_hierarchy(parsers::strip_hierarchy_trailer(output));
}

ScreenState DeviceSession::screen_state(const std::optional<std::string>& device) {
    return parsers::parse_screen_state(shell("dumpsys power", SCREEN_FILTER, device));
}

// ============ Interaction ============

void DeviceSession::launch(const std::string& package, const std::optional<std::string>& activity,
                           const std::optional<std::string>& device) {
    if (activity && !activity->empty()) {
        // "Main" -> pkg/.Main, ".Main" and "com.pkg.Main" are used as given
        std::string separator = activity->find('.') != std::string::npos ? "/" : "/.";
        shell(CommandLine{"am", "start", "-n", package + separator + *activity}, "", device);
    } else {
        shell(CommandLine{"monkey", "-p", package, "-c", "android.intent.category.LAUNCHER", "1"}, "", device);
    }
}

void DeviceSession::wakeup(const std::optional<std::string>& device) {
    // press_key() re-enters from the thread already running the wakeup sequence
    if (wakeup_owner_ == std::this_thread::get_id()) {
        return;
    }
    WakeupScope scope(wakeup_mutex_, wakeup_owner_);

    ScreenState state = screen_state(device);
    if (state == ScreenState::On) {
        return;
    }
    if (state == ScreenState::Unknown) {
        throw WakeupFailedError("Current screen state could not be found in dumpsys");
    }

    press_key("POWER", wakeup_settle_, device);
    press_key("MENU", wakeup_settle_, device);

    if (screen_state(device) != ScreenState::On) {
        throw WakeupFailedError("Screen is still off after sending POWER and MENU");
    }
}

void DeviceSession::press_key(const CommandLine& names, std::chrono::milliseconds wait_after,
                              const std::optional<std::string>& device) {
    if (names.empty()) {
        throw InvalidArgumentError("No key names given");
    }

    std::vector<std::string> args{"input", "keyevent"};
    for (const auto& name : names.tokens()) {
        auto code = key_code(name);
        if (!code) {
            throw UnknownKeyError(to_upper(name));
        }
        args.push_back(std::to_string(*code));
    }

    wakeup(device);
    shell(CommandLine(args), "", device);
    settle(wait_after);
}

void DeviceSession::input_text(const std::string& text, std::chrono::milliseconds wait_after,
                               const std::optional<std::string>& device) {
    std::string encoded;
    for (char c : text) {
        if (c == ' ') {
            encoded += "%s";
        } else {
            encoded += c;
        }
    }

    wakeup(device);
    shell(CommandLine(std::vector<std::string>{"input", "text", shell_escape(encoded)}), "", device);
    settle(wait_after);
}

std::string DeviceSession::install_app(const std::string& apk_path, const std::string& flags,
                                       const std::optional<std::string>& device) {
    std::vector<std::string> args{"install"};
    if (!flags.empty()) {
        args.push_back("-" + flags);
    }
    args.push_back(apk_path);
    return run(CommandLine(args), "", device);
}

std::string DeviceSession::uninstall_app(const std::string& package, const std::string& flags,
                                         const std::optional<std::string>& device) {
    std::vector<std::string> args{"uninstall"};
    if (!flags.empty()) {
        args.push_back("-" + flags);
    }
    args.push_back(package);
    return run(CommandLine(args), "", device);
}

cv::Mat DeviceSession::screenshot(const std::optional<std::string>& device) {
    wakeup(device);

    std::string name = random_uuid() + ".png";
    std::string remote = "/sdcard/" + name;
    fs::path local = fs::temp_directory_path() / name;

    shell(CommandLine{"screencap", "-p", remote}, "", device);
    run(CommandLine{"pull", remote, local.string()}, "", device);
    shell(CommandLine{"rm", remote}, "", device);

    cv::Mat image = cv::imread(local.string(), cv::IMREAD_UNCHANGED);
    std::error_code ec;
    fs::remove(local, ec);

    if (image.empty()) {
        throw ScreenshotError("Failed to decode screenshot pulled from " + remote);
    }
    return image;
}

} // namespace droidbridge
