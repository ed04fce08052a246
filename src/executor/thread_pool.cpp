/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <stdexcept>

namespace jobguard {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::enqueue(std::function<void(std::stop_token)> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!workers_.empty() && workers_.front().get_stop_token().stop_requested()) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void ThreadPool::drain() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return task_queue_.empty() && active_tasks_.load() == 0; });
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Queued work still runs after a stop request.
            if (task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
            ++active_tasks_;
        }

        task(stop);

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

size_t ThreadPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace jobguard
