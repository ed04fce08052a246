/**
 * @file concurrency_gate.hpp
 * @brief Per-job admission control bounding overlapping runs.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <sys/types.h>

namespace jobguard {

class ConcurrencyGate;

/**
 * @brief Proof of admission for one run.
 *
 * Move-only. The slot is released exactly once: by release(), or by the
 * destructor of whichever permit object still owns it.
 */
class GatePermit {
public:
    GatePermit() = default;
    ~GatePermit();

    GatePermit(GatePermit&& other) noexcept;
    GatePermit& operator=(GatePermit&& other) noexcept;

    GatePermit(const GatePermit&) = delete;
    GatePermit& operator=(const GatePermit&) = delete;

    /// Record the worker pid holding this slot.
    void bind_worker(pid_t pid);

    /// Give the slot back. Later calls are no-ops.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }
    [[nodiscard]] const JobName& job() const noexcept { return job_; }

private:
    friend class ConcurrencyGate;
    GatePermit(ConcurrencyGate* gate, JobName job) : gate_(gate), job_(std::move(job)) {}

    ConcurrencyGate* gate_{nullptr};
    JobName job_;
    pid_t worker_{0};
};

/**
 * @brief Tracks in-flight runs per job name.
 *
 * Each job name has its own slot and lock, so contention on one job never
 * delays admission of another. Unknown names are registered on first use
 * with a limit of 1.
 */
class ConcurrencyGate {
public:
    ConcurrencyGate() = default;

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Register @p job with @p limit (values below 1 become 1).
    void configure(const JobName& job, uint32_t limit);

    /**
     * @brief Admit a run of @p job if it is below its limit.
     * @return a permit on admission, nullopt on rejection (state unchanged).
     */
    [[nodiscard]] std::optional<GatePermit> try_acquire(const JobName& job);

    [[nodiscard]] uint32_t in_flight(const JobName& job) const;
    [[nodiscard]] uint32_t limit(const JobName& job) const;
    [[nodiscard]] std::vector<pid_t> active_workers(const JobName& job) const;

    /// Sum of in-flight runs over all jobs.
    [[nodiscard]] uint32_t total_in_flight() const;

private:
    friend class GatePermit;

    struct Slot {
        mutable std::mutex mutex;
        uint32_t limit{1};
        uint32_t in_flight{0};
        std::vector<pid_t> workers;
    };

    Slot& slot(const JobName& job);
    [[nodiscard]] Slot* find(const JobName& job) const;

    void bind(const JobName& job, pid_t pid);
    void release(const JobName& job, pid_t pid) noexcept;

    mutable std::shared_mutex slots_mutex_;
    std::map<JobName, std::unique_ptr<Slot>> slots_;
};

}  // namespace jobguard
