#ifndef DROIDBRIDGE_PROCESS_RUNNER_HPP
#define DROIDBRIDGE_PROCESS_RUNNER_HPP

#include "droidbridge/child_process.hpp"
#include "droidbridge/command_line.hpp"
#include "droidbridge/models.hpp"
#include "droidbridge/process_pool.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace droidbridge {

using PathResolver = std::function<std::optional<std::string>(const std::string&)>;

struct RunnerOptions {
    // Serialize every execute() call through one lock
    bool singleton = false;
    // Echo each command line through the logger
    bool debug = false;
    // Defaults to PosixSpawner
    std::shared_ptr<Spawner> spawner;
    // Defaults to find_in_path
    PathResolver resolver;
};

struct ExecOptions {
    // Non-positive values mean no timeout
    std::optional<std::chrono::milliseconds> timeout;
    // Regular expression; when set only matching output lines are kept
    std::string filter;
    // Observer called with (exit status, output) before execute() returns
    std::function<void(int, const std::string&)> callback;
};

/**
 * Runs a fixed executable with per-call arguments as child processes.
 *
 * The executable is resolved against PATH once, at construction. Every
 * child is tracked in a pool for the duration of its call, and the pool is
 * registered with the process exit hook so that children still running
 * when the host exits are killed.
 *
 * Output is the merge of both streams at library level: decoded stderr,
 * a newline, then decoded stdout (stdout alone when stderr is empty).
 * Timeouts never throw: the child is killed and the result carries a
 * descriptive message with timed_out set.
 */
class ProcessRunner {
public:
    explicit ProcessRunner(const CommandLine& binary, RunnerOptions options = RunnerOptions());

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    CommandResult execute(const CommandLine& args, const ExecOptions& options = ExecOptions());

    const std::vector<std::string>& binary() const { return binary_; }
    bool singleton() const { return singleton_; }
    bool debug() const { return debug_; }

    // Children currently running on this runner
    size_t active_processes() const { return pool_->size(); }
    std::shared_ptr<ProcessPool> pool() const { return pool_; }

private:
    void print(const std::string& line) const;

    std::vector<std::string> binary_;
    const bool singleton_;
    const bool debug_;
    std::shared_ptr<Spawner> spawner_;
    std::shared_ptr<ProcessPool> pool_;
    std::mutex exec_mutex_;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_PROCESS_RUNNER_HPP
