/**
 * @file scheduler_loop.cpp
 * @brief SchedulerLoop implementation.
 */

#include "scheduler/scheduler_loop.hpp"

#include <chrono>
#include <exception>

namespace jobguard {

SchedulerLoop::SchedulerLoop(std::vector<JobDefinitionPtr> jobs, IJobDispatcher& dispatcher,
                             Logger& logger, Duration tick_interval)
    : dispatcher_(dispatcher),
      logger_(logger),
      tick_interval_(tick_interval.count() > 0 ? tick_interval : Duration{1000}) {
    entries_.reserve(jobs.size());
    for (auto& job : jobs) {
        entries_.push_back(Entry{std::move(job), std::nullopt});
    }
}

SchedulerLoop::~SchedulerLoop() {
    stop();
}

void SchedulerLoop::prime(Timestamp now) {
    std::lock_guard lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.job->run_on_start) {
            entry.next_due = now;
            continue;
        }
        try {
            entry.next_due = entry.job->schedule.next_after(now);
        } catch (const std::exception& e) {
            entry.next_due.reset();
            logger_.error("Job " + entry.job->name + ": cannot compute next run: " + e.what());
        }
    }
}

void SchedulerLoop::start() {
    if (thread_.joinable()) return;
    prime(std::chrono::system_clock::now());
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
    logger_.info("Scheduler loop started: " + std::to_string(entries_.size()) + " jobs, tick "
                 + std::to_string(tick_interval_.count()) + "ms");
}

void SchedulerLoop::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
        logger_.info("Scheduler loop stopped");
    }
}

size_t SchedulerLoop::tick(Timestamp now) {
    std::vector<JobDefinitionPtr> due;
    {
        std::lock_guard lock(mutex_);
        for (auto& entry : entries_) {
            try {
                if (!entry.next_due) {
                    // Earlier evaluation failed; start over from now.
                    entry.next_due = entry.job->schedule.next_after(now);
                    continue;
                }
                if (*entry.next_due > now) continue;

                auto next = entry.job->schedule.next_after(*entry.next_due);
                if (next <= now) next = entry.job->schedule.next_after(now);
                entry.next_due = next;
                due.push_back(entry.job);
            } catch (const std::exception& e) {
                logger_.error("Job " + entry.job->name + ": schedule evaluation failed, skipped this tick: "
                              + e.what());
            }
        }
    }

    size_t dispatched = 0;
    for (const auto& job : due) {
        try {
            dispatcher_.dispatch(job);
            ++dispatched;
        } catch (const std::exception& e) {
            logger_.error("Job " + job->name + ": dispatch failed: " + e.what());
        }
    }
    return dispatched;
}

std::optional<Timestamp> SchedulerLoop::next_due(const JobName& job) const {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.job->name == job) return entry.next_due;
    }
    return std::nullopt;
}

void SchedulerLoop::run(std::stop_token stop) {
    auto next_tick = std::chrono::steady_clock::now();
    std::mutex wait_mutex;
    while (!stop.stop_requested()) {
        tick(std::chrono::system_clock::now());

        next_tick += tick_interval_;
        auto now = std::chrono::steady_clock::now();
        if (next_tick < now) next_tick = now;

        std::unique_lock lock(wait_mutex);
        cv_.wait_until(lock, stop, next_tick, [] { return false; });
    }
}

}  // namespace jobguard
