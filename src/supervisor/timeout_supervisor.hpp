/**
 * @file timeout_supervisor.hpp
 * @brief Wall-clock enforcement for a single worker process.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/worker_process.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace jobguard {

/**
 * @brief Terminates a worker that outlives its timeout.
 *
 * One instance per admitted run, running on its own jthread so a hung
 * worker cannot delay it. When the deadline passes the worker's process
 * group receives SIGTERM; if it is still alive after the grace window it
 * receives SIGKILL. A timeout of zero disables the supervisor entirely.
 *
 * The supervisor never reaps. The Job Runner waits for the worker,
 * then calls disarm().
 */
class TimeoutSupervisor {
public:
    TimeoutSupervisor(ProcessHandle& process, SteadyTime admitted_at, Duration timeout,
                      Duration grace, JobName job, Logger& logger);
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    /// Cancel the timer and join it. Idempotent.
    void disarm();

    [[nodiscard]] bool armed() const noexcept { return timer_.joinable(); }

    /// True once SIGTERM was delivered because the deadline passed.
    [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

    /// True if the grace window expired and SIGKILL was sent.
    [[nodiscard]] bool escalated() const noexcept { return escalated_.load(); }

private:
    void watch(std::stop_token stop);

    ProcessHandle& process_;
    SteadyTime deadline_;
    Duration timeout_;
    Duration grace_;
    JobName job_;
    Logger& logger_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::atomic<bool> fired_{false};
    std::atomic<bool> escalated_{false};

    std::jthread timer_;
};

}  // namespace jobguard
