#ifndef DROIDBRIDGE_TESTS_FAKE_SPAWNER_HPP
#define DROIDBRIDGE_TESTS_FAKE_SPAWNER_HPP

#include "droidbridge/child_process.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace droidbridge {
namespace fakes {

// What a fake child prints and how long it runs
struct FakeResponse {
    std::string out;
    std::string err;
    int exit_status = 0;
    std::chrono::milliseconds duration{0};
    bool hang = false;                  ///< never exits on its own
    std::function<void()> during;       ///< called while the child "runs"
};

// Lifetime of one fake child, for overlap checks
struct FakeSpan {
    std::vector<std::string> argv;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point finished;
};

class FakeSpawner;

class FakeChild : public ChildProcess {
public:
    FakeChild(int pid, FakeResponse response, FakeSpawner& owner, size_t span_index)
        : pid_(pid), response_(std::move(response)), owner_(owner), span_index_(span_index) {}

    int pid() const override { return pid_; }

    std::optional<CapturedOutput> communicate(std::optional<std::chrono::milliseconds> timeout) override;

    bool kill() noexcept override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) return false;
        killed_ = true;
        cv_.notify_all();
        return true;
    }

    int wait() override {
        std::lock_guard<std::mutex> lock(mutex_);
        reaped_ = true;
        return killed_ ? -9 : response_.exit_status;
    }

    bool killed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return killed_;
    }

private:
    const int pid_;
    FakeResponse response_;
    FakeSpawner& owner_;
    const size_t span_index_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool killed_ = false;
    bool reaped_ = false;
};

/**
 * Spawner whose children are scripted per argument vector.
 * Records every spawned argv and the lifetime of each child.
 */
class FakeSpawner : public Spawner {
public:
    using Script = std::function<FakeResponse(const std::vector<std::string>&)>;

    explicit FakeSpawner(Script script = Script()) : script_(std::move(script)) {}

    std::shared_ptr<ChildProcess> spawn(const std::vector<std::string>& argv) override {
        FakeResponse response = script_ ? script_(argv) : FakeResponse();
        std::lock_guard<std::mutex> lock(mutex_);
        spans_.push_back(FakeSpan{argv, std::chrono::steady_clock::now(), {}});
        auto child = std::make_shared<FakeChild>(next_pid_++, std::move(response), *this, spans_.size() - 1);
        children_.push_back(child);
        return child;
    }

    void set_script(Script script) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_ = std::move(script);
    }

    size_t spawn_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_.size();
    }

    std::vector<std::vector<std::string>> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::vector<std::string>> result;
        for (const auto& span : spans_) result.push_back(span.argv);
        return result;
    }

    std::vector<FakeSpan> spans() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spans_;
    }

    std::vector<std::shared_ptr<FakeChild>> children() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return children_;
    }

    void finish(size_t span_index) {
        std::lock_guard<std::mutex> lock(mutex_);
        spans_[span_index].finished = std::chrono::steady_clock::now();
    }

private:
    Script script_;
    mutable std::mutex mutex_;
    std::vector<FakeSpan> spans_;
    std::vector<std::shared_ptr<FakeChild>> children_;
    int next_pid_ = 1000;
};

inline std::optional<CapturedOutput> FakeChild::communicate(std::optional<std::chrono::milliseconds> timeout) {
    if (response_.during) {
        response_.during();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    bool limited = timeout && (response_.hang || *timeout < response_.duration);

    if (response_.hang && !timeout) {
        cv_.wait(lock, [this] { return killed_; });
    } else {
        auto budget = limited ? *timeout : response_.duration;
        cv_.wait_for(lock, budget, [this] { return killed_; });
    }
    owner_.finish(span_index_);

    if (killed_) {
        reaped_ = true;
        return CapturedOutput{-9, "", ""};
    }
    if (limited) {
        return std::nullopt;
    }
    reaped_ = true;
    return CapturedOutput{response_.exit_status, response_.out, response_.err};
}

// Always resolves to /fake/bin/<name>
inline std::optional<std::string> fake_resolver(const std::string& name) {
    return "/fake/bin/" + name;
}

} // namespace fakes
} // namespace droidbridge

#endif // DROIDBRIDGE_TESTS_FAKE_SPAWNER_HPP
