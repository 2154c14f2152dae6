#ifndef DROIDBRIDGE_POSIX_SPAWNER_HPP
#define DROIDBRIDGE_POSIX_SPAWNER_HPP

#include "droidbridge/child_process.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace droidbridge {

/**
 * Exit status as reported by waitpid(): the exit code for a normal exit,
 * the negated signal number for a child killed by a signal.
 */
int decode_wait_status(int status);

// Milliseconds left before a deadline, as a poll() timeout: 0 once expired, at most INT_MAX.
int clamp_poll_timeout(long long remaining_ms);

/**
 * Resolve `name` against PATH the way execvp() would.
 * Names containing a '/' are checked directly.
 * Returns the absolute path of the first executable match.
 */
std::optional<std::string> find_in_path(const std::string& name);

class PosixChildProcess final : public ChildProcess {
public:
    PosixChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
    ~PosixChildProcess() override;

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    int pid() const override { return static_cast<int>(pid_); }

    std::optional<CapturedOutput> communicate(std::optional<std::chrono::milliseconds> timeout) override;
    bool kill() noexcept override;
    int wait() override;

private:
    // Returns true once the child is reaped; false if it is still running.
    bool try_reap(bool blocking);
    void close_fds() noexcept;

    const pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::string out_buf_;
    std::string err_buf_;

    std::mutex state_mutex_;
    std::atomic<bool> reaped_{false};
    int exit_status_ = 0;
};

/**
 * fork()/execvp() spawner. The child gets stdin from /dev/null and its
 * stdout/stderr on two close-on-exec pipes, so children spawned
 * concurrently from other threads never inherit each other's pipes.
 */
class PosixSpawner final : public Spawner {
public:
    std::shared_ptr<ChildProcess> spawn(const std::vector<std::string>& argv) override;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_POSIX_SPAWNER_HPP
