/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 *
 * Admitted runs wait for their worker process on these threads, so the
 * scheduler loop never blocks on a job. Shutdown drains the queue: every
 * submitted task runs before the threads exit.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace jobguard {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Block until the queue is empty and no task is running.
    void drain();

    /// Run everything queued, then join all threads. Idempotent.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void enqueue(std::function<void(std::stop_token)> task);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::condition_variable_any idle_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace jobguard
