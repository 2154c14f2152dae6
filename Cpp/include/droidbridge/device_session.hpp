#ifndef DROIDBRIDGE_DEVICE_SESSION_HPP
#define DROIDBRIDGE_DEVICE_SESSION_HPP

#include "droidbridge/command_line.hpp"
#include "droidbridge/hierarchy.hpp"
#include "droidbridge/models.hpp"
#include "droidbridge/process_runner.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

namespace droidbridge {

class DeviceSession;

/**
 * Restarts the bridge server (kill-server, start-server) at most once for
 * all sessions sharing this guard. A failed restart is retried by the next
 * session that asks.
 */
class BridgeServerGuard {
public:
    // Returns true if this call performed the restart
    bool ensure_restarted(DeviceSession& session);
    bool restarted() const { return restarted_; }

private:
    std::mutex mutex_;
    std::atomic<bool> restarted_{false};
};

struct SessionOptions {
    std::string adb_path = "adb";
    // Connected during construction and adopted as the default device
    std::optional<std::string> default_device;
    bool debug = false;
    std::optional<std::chrono::milliseconds> command_timeout;
    // Pause after a fresh connect before the device is treated as ready
    std::chrono::milliseconds connect_settle{1000};
    // Pause after each key event sent by wakeup()
    std::chrono::milliseconds wakeup_settle{500};
    // Restart the bridge server once per guard before first use
    std::shared_ptr<BridgeServerGuard> server_guard;
    // Forwarded to the ProcessRunner; defaults are the POSIX spawner and PATH lookup
    std::shared_ptr<Spawner> spawner;
    PathResolver resolver;
};

/**
 * Device-targeting layer over a ProcessRunner for the adb tool.
 *
 * Every call targets the explicit `device` argument when given, else the
 * session's default device (set by the first successful connect), else
 * lets adb pick. Methods returning text surface the tool output only; the
 * exit status is available through run_result().
 */
class DeviceSession {
public:
    explicit DeviceSession(SessionOptions options = SessionOptions());

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Transport commands

    std::string connect(const std::optional<std::string>& address = std::nullopt);
    std::string disconnect(const std::optional<std::string>& address = std::nullopt);
    std::string version();
    std::string start_server();
    std::string kill_server();
    std::vector<DeviceEntry> list_devices();
    std::string wait_for_device(const std::optional<std::string>& device = std::nullopt);
    std::string reboot(const std::optional<std::string>& device = std::nullopt);

    CommandResult run_result(const CommandLine& args, const std::string& filter = "",
                             const std::optional<std::string>& device = std::nullopt);
    std::string run(const CommandLine& args, const std::string& filter = "",
                    const std::optional<std::string>& device = std::nullopt);
    std::string shell(const CommandLine& args, const std::string& filter = "",
                      const std::optional<std::string>& device = std::nullopt);
    std::string exec_out(const CommandLine& args, const std::string& filter = "",
                         const std::optional<std::string>& device = std::nullopt);

    /**
     * Run several shell commands in a single adb invocation.
     * Returns one output per command, in order.
     */
    std::vector<std::string> shell_multi(const std::vector<std::string>& commands,
                                         const std::optional<std::string>& device = std::nullopt);

    // Device queries

    std::string get_property(const std::string& name, const std::optional<std::string>& device = std::nullopt);
    std::vector<std::string> list_installed_packages(const std::optional<std::string>& device = std::nullopt);
    std::vector<std::string> list_package_activities(const std::string& package,
                                                     const std::optional<std::string>& device = std::nullopt);
    FocusedWindow get_focused_window(const std::optional<std::string>& device = std::nullopt);
    ViewNode get_view_hierarchy(const std::optional<std::string>& device = std::nullopt);
    ScreenState screen_state(const std::optional<std::string>& device = std::nullopt);

    // Interaction

    void launch(const std::string& package, const std::optional<std::string>& activity = std::nullopt,
                const std::optional<std::string>& device = std::nullopt);

    /**
     * Turn the screen on if it is not. One thread at a time runs the
     * check, POWER/MENU and re-check sequence; concurrent callers wait and
     * then find the screen on. Re-entrant calls from the owning thread
     * (press_key() calls wakeup() itself) return immediately. Throws
     * WakeupFailedError if the screen is still not on after POWER and MENU
     * were sent.
     */
    void wakeup(const std::optional<std::string>& device = std::nullopt);

    // Throws UnknownKeyError before anything is sent if a name has no key code
    void press_key(const CommandLine& names, std::chrono::milliseconds wait_after = std::chrono::milliseconds(500),
                   const std::optional<std::string>& device = std::nullopt);
    void input_text(const std::string& text, std::chrono::milliseconds wait_after = std::chrono::milliseconds(500),
                    const std::optional<std::string>& device = std::nullopt);

    std::string install_app(const std::string& apk_path, const std::string& flags = "r",
                            const std::optional<std::string>& device = std::nullopt);
    std::string uninstall_app(const std::string& package, const std::string& flags = "",
                              const std::optional<std::string>& device = std::nullopt);

    // Throws ScreenshotError if the pulled capture cannot be decoded
    cv::Mat screenshot(const std::optional<std::string>& device = std::nullopt);

    std::optional<std::string> default_device() const;
    ProcessRunner& runner() { return runner_; }

private:
    // Bridge-level command, never prefixed with a device selector
    CommandResult run_untargeted(const CommandLine& args);
    ExecOptions exec_options(const std::string& filter) const;
    std::optional<std::string> resolve_target(const std::optional<std::string>& device) const;
    void print(const std::string& output) const;

    ProcessRunner runner_;
    const bool debug_;
    const std::optional<std::chrono::milliseconds> command_timeout_;
    const std::chrono::milliseconds connect_settle_;
    const std::chrono::milliseconds wakeup_settle_;

    mutable std::mutex state_mutex_;
    std::optional<std::string> default_device_;

    // Serializes wakeup() across threads; the owner skips re-entrant calls
    std::mutex wakeup_mutex_;
    std::atomic<std::thread::id> wakeup_owner_{std::thread::id()};
};

} // namespace droidbridge

#endif // DROIDBRIDGE_DEVICE_SESSION_HPP
