/**
 * @file retry_queue.cpp
 * @brief RetryQueue implementation.
 */

#include "scheduler/retry_queue.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace jobguard {

RetryQueue::RetryQueue(FireFn fire, Logger& logger)
    : fire_(std::move(fire)), logger_(logger) {
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

RetryQueue::~RetryQueue() {
    close();
}

bool RetryQueue::schedule(JobDefinitionPtr job, uint32_t attempt, Duration delay) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        auto due = std::chrono::steady_clock::now() + delay;
        queue_.emplace(due, Entry{std::move(job), attempt});
    }
    cv_.notify_all();
    return true;
}

size_t RetryQueue::pending() const {
    std::lock_guard lock(mutex_);
    return queue_.size() + firing_;
}

void RetryQueue::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && firing_ == 0; });
}

void RetryQueue::close() {
    size_t dropped = 0;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;
        dropped = queue_.size();
        queue_.clear();
    }
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    idle_cv_.notify_all();
    if (dropped > 0) {
        logger_.info("Dropped " + std::to_string(dropped) + " pending retries");
    }
}

void RetryQueue::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (queue_.empty()) {
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            continue;
        }

        auto due = queue_.begin()->first;
        if (due > std::chrono::steady_clock::now()) {
            // Woken early by schedule() when an earlier entry arrives.
            cv_.wait_until(lock, stop, due, [this, due] {
                return !queue_.empty() && queue_.begin()->first < due;
            });
            continue;
        }

        std::vector<Entry> batch;
        auto now = std::chrono::steady_clock::now();
        while (!queue_.empty() && queue_.begin()->first <= now) {
            batch.push_back(std::move(queue_.begin()->second));
            queue_.erase(queue_.begin());
        }
        firing_ = batch.size();
        lock.unlock();

        for (const auto& entry : batch) {
            try {
                fire_(entry.job, entry.attempt);
            } catch (const std::exception& e) {
                logger_.error("Job " + entry.job->name + ": retry " + std::to_string(entry.attempt)
                              + " could not be dispatched: " + e.what());
            }
        }

        lock.lock();
        firing_ = 0;
        if (queue_.empty()) idle_cv_.notify_all();
    }
}

}  // namespace jobguard
