/**
 * @file retry_queue.hpp
 * @brief Delayed re-dispatch of failed runs.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "scheduler/job.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace jobguard {

/**
 * @brief Holds retries until their backoff delay has passed.
 *
 * A single timer thread hands each due retry to the fire callback, which
 * re-enters admission so the retry is subject to the concurrency gate.
 * After close() pending retries are dropped and new ones are refused.
 */
class RetryQueue {
public:
    /// Invoked on the timer thread with the job and its 1-based retry number.
    using FireFn = std::function<void(const JobDefinitionPtr&, uint32_t)>;

    RetryQueue(FireFn fire, Logger& logger);
    ~RetryQueue();

    RetryQueue(const RetryQueue&) = delete;
    RetryQueue& operator=(const RetryQueue&) = delete;

    /// Queue retry @p attempt of @p job to fire after @p delay. False once closed.
    bool schedule(JobDefinitionPtr job, uint32_t attempt, Duration delay);

    /// Retries waiting for their delay or currently firing.
    [[nodiscard]] size_t pending() const;

    /// Block until nothing is pending.
    void wait_idle();

    /// Drop pending retries, refuse new ones and join the timer thread.
    void close();

private:
    struct Entry {
        JobDefinitionPtr job;
        uint32_t attempt;
    };

    void run(std::stop_token stop);

    FireFn fire_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    std::multimap<SteadyTime, Entry> queue_;
    size_t firing_{0};
    bool closed_{false};

    std::jthread thread_;
};

}  // namespace jobguard
