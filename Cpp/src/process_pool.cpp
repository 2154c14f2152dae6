#include "droidbridge/process_pool.hpp"
#include "droidbridge/logging.hpp"

#include <algorithm>
#include <cstdlib>

namespace droidbridge {

// ============ ProcessPool ============

bool ProcessPool::add(const std::shared_ptr<ChildProcess>& child) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(children_.begin(), children_.end(), child) != children_.end()) {
        return false;
    }
    children_.push_back(child);
    return true;
}

bool ProcessPool::remove(const std::shared_ptr<ChildProcess>& child) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(children_.begin(), children_.end(), child);
    if (it == children_.end()) {
        return false;
    }
    children_.erase(it);
    return true;
}

size_t ProcessPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return children_.size();
}

std::vector<int> ProcessPool::pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> result;
    for (const auto& child : children_) {
        result.push_back(child->pid());
    }
    return result;
}

std::vector<int> ProcessPool::kill_all() {
    std::vector<std::shared_ptr<ChildProcess>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(children_);
    }

    std::vector<int> killed;
    for (const auto& child : drained) {
        if (child->kill()) {
            killed.push_back(child->pid());
        }
    }
    return killed;
}

// ============ PoolRegistration ============

PoolRegistration::PoolRegistration(std::shared_ptr<ProcessPool> pool, std::shared_ptr<ChildProcess> child)
    : pool_(std::move(pool)), child_(std::move(child)) {
    pool_->add(child_);
}

PoolRegistration::~PoolRegistration() {
    pool_->remove(child_);
}

// ============ ExitReaper ============

ExitReaper& ExitReaper::instance() {
    static ExitReaper reaper;
    static std::once_flag hook_installed;
    std::call_once(hook_installed, [] {
        // The logger must outlive the hook, so create it before registering
        logger();
        std::atexit([] { ExitReaper::instance().reap(); });
    });
    return reaper;
}

void ExitReaper::release_abandoned() {
    pools_.erase(std::remove_if(pools_.begin(), pools_.end(),
                                [](const std::shared_ptr<ProcessPool>& p) {
                                    return p.use_count() == 1 && p->size() == 0;
                                }),
                 pools_.end());
}

void ExitReaper::track(const std::shared_ptr<ProcessPool>& pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    release_abandoned();
    pools_.push_back(pool);
}

size_t ExitReaper::tracked() {
    std::lock_guard<std::mutex> lock(mutex_);
    release_abandoned();
    return pools_.size();
}

size_t ExitReaper::reap() {
    std::vector<std::shared_ptr<ProcessPool>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live = pools_;
    }

    size_t count = 0;
    for (const auto& pool : live) {
        for (int pid : pool->kill_all()) {
            logger()->warn("Process \"{}\" killed because parent process is shutting down", pid);
            ++count;
        }
    }
    return count;
}

} // namespace droidbridge
