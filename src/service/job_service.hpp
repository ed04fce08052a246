/**
 * @file job_service.hpp
 * @brief Top-level JobService facade tying all modules together.
 *
 * Provides a single entry point for:
 *   1. Running configured jobs on their schedules (start/stop)
 *   2. Triggering a job on demand (trigger)
 *   3. Running every job once and waiting for completion (run_all_once)
 *   4. Re-dispatching failed runs under each job's retry policy
 *   5. Health and metrics snapshots for an external reporting endpoint
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/job_runner.hpp"
#include "executor/thread_pool.hpp"
#include "gate/concurrency_gate.hpp"
#include "history/run_history.hpp"
#include "scheduler/job.hpp"
#include "scheduler/retry_queue.hpp"
#include "scheduler/scheduler_loop.hpp"
#include "telemetry/health_reporter.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jobguard {

enum class TriggerResult : uint8_t {
    Admitted,
    Skipped,            ///< concurrency limit reached, recorded as skipped_concurrent
    UnknownJob
};

[[nodiscard]] constexpr std::string_view to_string(TriggerResult result) noexcept {
    switch (result) {
        case TriggerResult::Admitted:   return "admitted";
        case TriggerResult::Skipped:    return "skipped";
        case TriggerResult::UnknownJob: return "unknown_job";
    }
    return "unknown";
}

/**
 * @brief Wires gate, runner, worker pool, history, health and scheduler loop.
 */
class JobService final : public IJobDispatcher {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::vector<JobDefinition> extra_jobs;      ///< programmatic jobs, e.g. callables
    };

    explicit JobService(Options opts);
    ~JobService() override;

    // Non-copyable, non-movable
    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    /// Stop the loop, drop pending retries and wait for every in-flight run to finish.
    void stop();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    // ── Triggering ───────────────────────────
    /// Admit-or-skip a run of @p job now; never blocks on the run.
    TriggerResult trigger(const JobName& job);

    /// Trigger every job once, wait for all runs and their retries, return their records.
    std::vector<RunRecord> run_all_once();

    /// Block until no run is queued, executing or waiting to be retried.
    void drain();

    void dispatch(const JobDefinitionPtr& job) override;

    // ── Reporting ────────────────────────────
    [[nodiscard]] HealthSnapshot health() const { return health_.check(); }
    [[nodiscard]] MetricsSnapshot metrics() const { return health_.metrics(); }
    [[nodiscard]] std::string status_line() const;

    // ── Accessors (for testing) ─────────────
    Logger& logger() { return logger_; }
    const Config& config() const { return config_; }
    ConcurrencyGate& gate() { return gate_; }
    RunHistory& history() { return history_; }
    HealthReporter& reporter() { return health_; }
    JobRunner& runner() { return runner_; }
    SchedulerLoop& loop() { return loop_; }
    RetryQueue& retries() { return retries_; }
    [[nodiscard]] std::vector<JobDefinitionPtr> jobs() const;
    [[nodiscard]] size_t worker_threads() const noexcept { return pool_.thread_count(); }

private:
    TriggerResult submit(const JobDefinitionPtr& job, uint32_t attempt = 0);
    void maybe_retry(const JobDefinitionPtr& job, const RunRecord& record);
    void register_probes();

    Config config_;
    Logger logger_;
    std::map<JobName, JobDefinitionPtr> jobs_;

    ConcurrencyGate gate_;
    RunHistory history_;
    HealthReporter health_;
    JobRunner runner_;
    RetryQueue retries_;                ///< outlives pool_: queued runs may schedule retries
    ThreadPool pool_;
    SchedulerLoop loop_;

    std::atomic<bool> running_{false};
};

}  // namespace jobguard
