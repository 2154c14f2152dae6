#ifndef DROIDBRIDGE_PROCESS_POOL_HPP
#define DROIDBRIDGE_PROCESS_POOL_HPP

#include "droidbridge/child_process.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace droidbridge {

/**
 * Children currently running on behalf of one ProcessRunner.
 * add/remove/kill_all are mutually atomic and safe to call from the
 * process exit hook while other threads are executing commands.
 */
class ProcessPool {
public:
    // Returns false if `child` is already registered.
    bool add(const std::shared_ptr<ChildProcess>& child);

    // Returns false if `child` is not registered (e.g. already reaped by kill_all).
    bool remove(const std::shared_ptr<ChildProcess>& child);

    size_t size() const;
    std::vector<int> pids() const;

    /**
     * Deregister every child and send it SIGKILL.
     * Returns the pids that were signalled; failures are ignored.
     */
    std::vector<int> kill_all();

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ChildProcess>> children_;
};

/**
 * Adds a child to a pool on construction and removes it on destruction,
 * so every exit path of a command deregisters its process. Shares
 * ownership of the pool, which may outlive the runner that created it.
 */
class PoolRegistration {
public:
    PoolRegistration(std::shared_ptr<ProcessPool> pool, std::shared_ptr<ChildProcess> child);
    ~PoolRegistration();

    PoolRegistration(const PoolRegistration&) = delete;
    PoolRegistration& operator=(const PoolRegistration&) = delete;

private:
    std::shared_ptr<ProcessPool> pool_;
    std::shared_ptr<ChildProcess> child_;
};

/**
 * Process-wide teardown of every live pool.
 *
 * The first call to instance() installs a single std::atexit hook. Pools
 * are held by strong reference: a runner with static storage duration is
 * destroyed before the hook runs, and its children must still be killed.
 * A pool is released once it is empty and nothing but the reaper holds it.
 */
class ExitReaper {
public:
    static ExitReaper& instance();

    void track(const std::shared_ptr<ProcessPool>& pool);

    // Pools currently held, released ones excluded
    size_t tracked();

    // Kill every child of every tracked pool. Returns the number of children killed.
    size_t reap();

private:
    ExitReaper() = default;

    // Requires mutex_
    void release_abandoned();

    std::mutex mutex_;
    std::vector<std::shared_ptr<ProcessPool>> pools_;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_PROCESS_POOL_HPP
