#include "droidbridge/process_runner.hpp"
#include "droidbridge/errors.hpp"
#include "droidbridge/logging.hpp"
#include "droidbridge/posix_spawner.hpp"
#include "droidbridge/text.hpp"

#include <regex>
#include <sstream>

namespace droidbridge {

namespace {

std::string format_seconds(std::chrono::milliseconds timeout) {
    std::ostringstream ss;
    ss << timeout.count() / 1000.0;
    return ss.str();
}

std::string merge_streams(const std::string& out, const std::string& err) {
    std::string output = trim_right(sanitize_utf8(out));
    std::string error = trim_right(sanitize_utf8(err));
    if (error.empty()) {
        return output;
    }
    return error + "\n" + output;
}

} // namespace

ProcessRunner::ProcessRunner(const CommandLine& binary, RunnerOptions options)
    : binary_(binary.tokens()),
      singleton_(options.singleton),
      debug_(options.debug),
      spawner_(options.spawner ? options.spawner : std::make_shared<PosixSpawner>()),
      pool_(std::make_shared<ProcessPool>()) {
    if (!binary_.empty()) {
        PathResolver resolver = options.resolver ? options.resolver : PathResolver(find_in_path);
        auto resolved = resolver(binary_[0]);
        if (!resolved) {
            throw BinaryNotFoundError(binary.str());
        }
        binary_[0] = *resolved;
    }

    ExitReaper::instance().track(pool_);
}

void ProcessRunner::print(const std::string& line) const {
    if (debug_ && !line.empty()) {
        logger()->info("{}", line);
    }
}

CommandResult ProcessRunner::execute(const CommandLine& args, const ExecOptions& options) {
    std::vector<std::string> argv = binary_;
    argv.insert(argv.end(), args.tokens().begin(), args.tokens().end());
    if (argv.empty()) {
        throw InvalidArgumentError("Nothing to execute: empty command");
    }

    std::optional<std::regex> filter;
    if (!options.filter.empty()) {
        try {
            filter.emplace(options.filter);
        } catch (const std::regex_error& e) {
            throw InvalidArgumentError("Invalid output filter \"" + options.filter + "\": " + e.what());
        }
    }

    std::optional<std::chrono::milliseconds> timeout = options.timeout;
    if (timeout && timeout->count() <= 0) {
        timeout.reset();
    }

    CommandResult result;
    {
        std::unique_lock<std::mutex> gate(exec_mutex_, std::defer_lock);
        if (singleton_) {
            gate.lock();
        }

        print("> " + join_command(argv));

        auto child = spawner_->spawn(argv);
        PoolRegistration registration(pool_, child);

        auto captured = child->communicate(timeout);
        if (captured) {
            result.exit_status = captured->exit_status;
            result.output = merge_streams(captured->out, captured->err);
        } else {
            child->kill();
            result.exit_status = child->wait();
            result.timed_out = true;
            result.output = "Process \"" + std::to_string(child->pid()) + "\" timed out after " +
                            format_seconds(*timeout) + " seconds";
            logger()->warn("{}", result.output);
        }
    }

    // The timeout message is kept intact so callers can still recognize it
    if (filter && !result.timed_out) {
        result.output = trim_right(filter_lines(result.output, *filter));
    }

    if (options.callback) {
        options.callback(result.exit_status, result.output);
    }

    return result;
}

} // namespace droidbridge
