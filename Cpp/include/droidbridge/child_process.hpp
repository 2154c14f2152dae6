#ifndef DROIDBRIDGE_CHILD_PROCESS_HPP
#define DROIDBRIDGE_CHILD_PROCESS_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace droidbridge {

// Raw streams of a finished child, not yet decoded.
struct CapturedOutput {
    int exit_status = 0;
    std::string out;
    std::string err;
};

/**
 * Handle to a spawned child process.
 *
 * kill() may be called from any thread (including the exit hook) while
 * another thread is blocked in communicate() or wait().
 */
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;

    /**
     * Collect stdout and stderr until both reach EOF and the child has
     * exited. Returns std::nullopt if `timeout` elapses first; the child is
     * left running and output read so far is discarded with the handle.
     */
    virtual std::optional<CapturedOutput> communicate(std::optional<std::chrono::milliseconds> timeout) = 0;

    // Send SIGKILL. Returns false if the child was already reaped or the signal failed.
    virtual bool kill() noexcept = 0;

    // Block until the child is reaped and return its exit status.
    virtual int wait() = 0;
};

/**
 * Creates child processes from a fully resolved argument vector.
 * The default implementation forks and execs; tests substitute a fake.
 */
class Spawner {
public:
    virtual ~Spawner() = default;

    virtual std::shared_ptr<ChildProcess> spawn(const std::vector<std::string>& argv) = 0;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_CHILD_PROCESS_HPP
