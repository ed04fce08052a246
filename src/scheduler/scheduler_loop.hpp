/**
 * @file scheduler_loop.hpp
 * @brief Recurring tick that dispatches due jobs.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/job.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace jobguard {

/**
 * @brief Receives due jobs from the loop.
 *
 * dispatch() must return promptly: it admits or skips the run and hands
 * execution to another thread.
 */
class IJobDispatcher {
public:
    virtual ~IJobDispatcher() = default;
    virtual void dispatch(const JobDefinitionPtr& job) = 0;
};

/**
 * @brief Single coordinating thread comparing schedules with the clock.
 *
 * A job that is overdue by several periods is dispatched once and its
 * next due time moves past the current tick. An error while evaluating
 * one job's schedule is logged and only that job is skipped for the tick.
 */
class SchedulerLoop {
public:
    SchedulerLoop(std::vector<JobDefinitionPtr> jobs, IJobDispatcher& dispatcher,
                  Logger& logger, Duration tick_interval = Duration{1000});
    ~SchedulerLoop();

    SchedulerLoop(const SchedulerLoop&) = delete;
    SchedulerLoop& operator=(const SchedulerLoop&) = delete;

    /// Compute initial due times relative to @p now (run_on_start jobs are due at once).
    void prime(Timestamp now);

    /// prime() and start ticking on a dedicated thread.
    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

    /**
     * @brief Evaluate every job against @p now.
     * @return number of jobs dispatched.
     */
    size_t tick(Timestamp now);

    [[nodiscard]] std::optional<Timestamp> next_due(const JobName& job) const;
    [[nodiscard]] Duration tick_interval() const noexcept { return tick_interval_; }

private:
    struct Entry {
        JobDefinitionPtr job;
        std::optional<Timestamp> next_due;
    };

    void run(std::stop_token stop);

    std::vector<Entry> entries_;
    IJobDispatcher& dispatcher_;
    Logger& logger_;
    Duration tick_interval_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
};

}  // namespace jobguard
