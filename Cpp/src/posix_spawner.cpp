#include "droidbridge/posix_spawner.hpp"
#include "droidbridge/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace droidbridge {

namespace {

constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(5);
// Longer timeouts are treated as none; the deadline would overflow steady_clock
constexpr auto MAX_TIMEOUT = std::chrono::hours(24 * 365 * 100);

bool is_executable(const fs::path& candidate) {
    std::error_code ec;
    return fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
}

std::string absolute_path(const fs::path& candidate) {
    std::error_code ec;
    fs::path resolved = fs::absolute(candidate, ec);
    return (ec ? candidate : resolved).lexically_normal().string();
}

std::string errno_message(const std::string& call) {
    return call + " failed: " + std::strerror(errno);
}

} // namespace

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

int clamp_poll_timeout(long long remaining_ms) {
    if (remaining_ms <= 0) {
        return 0;
    }
    if (remaining_ms > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(remaining_ms);
}

std::optional<std::string> find_in_path(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) {
            return absolute_path(name);
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string search_path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (true) {
        size_t end = search_path.find(':', start);
        std::string dir = search_path.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty()) {
            dir = ".";
        }

        fs::path candidate = fs::path(dir) / name;
        if (is_executable(candidate)) {
            return absolute_path(candidate);
        }

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return std::nullopt;
}

// ============ PosixChildProcess ============

PosixChildProcess::PosixChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

PosixChildProcess::~PosixChildProcess() {
    close_fds();
    // Never leave a zombie behind, even on exceptional paths
    if (!reaped_) {
        kill();
        try_reap(true);
    }
}

void PosixChildProcess::close_fds() noexcept {
    if (stdout_fd_ != -1) { ::close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ != -1) { ::close(stderr_fd_); stderr_fd_ = -1; }
}

bool PosixChildProcess::try_reap(bool blocking) {
    if (reaped_) {
        return true;
    }

    // Observe the exit without reaping, so kill() can never hit a recycled pid
    siginfo_t info;
    int rc;
    do {
        std::memset(&info, 0, sizeof(info));
        rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT | (blocking ? 0 : WNOHANG));
    } while (rc < 0 && errno == EINTR);

    if (rc == 0 && info.si_pid == 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    exit_status_ = (result == pid_) ? decode_wait_status(status) : -1;
    reaped_ = true;
    return true;
}

std::optional<CapturedOutput> PosixChildProcess::communicate(std::optional<std::chrono::milliseconds> timeout) {
    using clock = std::chrono::steady_clock;

    std::optional<clock::time_point> deadline;
    if (timeout && *timeout < MAX_TIMEOUT) {
        deadline = clock::now() + *timeout;
    }

    auto remaining_ms = [&deadline]() -> int {
        if (!deadline) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - clock::now()).count();
        return clamp_poll_timeout(left);
    };

    char buffer[4096];
    while (stdout_fd_ != -1 || stderr_fd_ != -1) {
        pollfd fds[2];
        int* owners[2];
        std::string* sinks[2];
        nfds_t count = 0;

        if (stdout_fd_ != -1) {
            fds[count] = {stdout_fd_, POLLIN, 0};
            owners[count] = &stdout_fd_;
            sinks[count] = &out_buf_;
            ++count;
        }
        if (stderr_fd_ != -1) {
            fds[count] = {stderr_fd_, POLLIN, 0};
            owners[count] = &stderr_fd_;
            sinks[count] = &err_buf_;
            ++count;
        }

        int wait_ms = remaining_ms();
        if (wait_ms == 0) {
            return std::nullopt;
        }

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            close_fds();
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;

            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                ::close(*owners[i]);
                *owners[i] = -1;
            }
        }
    }

    if (!deadline) {
        try_reap(true);
    } else {
        while (!try_reap(false)) {
            if (remaining_ms() == 0) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(REAP_POLL_INTERVAL);
        }
    }

    CapturedOutput captured;
    captured.exit_status = wait();
    captured.out = std::move(out_buf_);
    captured.err = std::move(err_buf_);
    return captured;
}

bool PosixChildProcess::kill() noexcept {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return false;
    }
    return ::kill(pid_, SIGKILL) == 0;
}

int PosixChildProcess::wait() {
    try_reap(true);
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

// ============ PosixSpawner ============

std::shared_ptr<ChildProcess> PosixSpawner::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw InvalidArgumentError("Cannot spawn an empty command");
    }

    // Build the exec vector before fork(): the child must not allocate
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw ProcessSpawnError(errno_message("pipe2"));
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        std::string message = errno_message("pipe2");
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw ProcessSpawnError(message);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string message = errno_message("fork");
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        ::close(err_pipe[0]); ::close(err_pipe[1]);
        throw ProcessSpawnError(message);
    }

    if (pid == 0) {
        // Child: dup2() clears close-on-exec on the target descriptors
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        _exit(127);
    }

    // Parent: close write ends so EOF reaches us when the child exits
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    return std::make_shared<PosixChildProcess>(pid, out_pipe[0], err_pipe[0]);
}

} // namespace droidbridge
