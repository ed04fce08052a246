/**
 * @file job_runner.hpp
 * @brief Life cycle of a single job execution.
 *
 * Run state machine:
 *
 *   Pending ──admit()──► Admitted ──spawn──► Running ──► Succeeded | Failed | TimedOut
 *      │
 *      └── gate full ──► SkippedConcurrent
 *
 * Every admitted run reaches exactly one terminal phase. On that
 * transition the gate slot is released once, the RunRecord is appended
 * to history, and the health counters are updated. Nothing thrown by job
 * logic leaves the worker process.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/worker_process.hpp"
#include "gate/concurrency_gate.hpp"
#include "history/run_history.hpp"
#include "scheduler/job.hpp"
#include "telemetry/health_reporter.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>

namespace jobguard {

struct RunnerOptions {
    Duration kill_grace{2000};          ///< SIGTERM → SIGKILL window
    size_t stderr_tail_lines{20};
};

/**
 * @brief An admitted run that has not been executed yet.
 */
struct RunTicket {
    RunId run_id{0};
    uint32_t attempt{0};                ///< 0 = first run, n = n-th retry
    Timestamp admitted_at;
    SteadyTime admitted_steady;         ///< timeout deadline is measured from here
    GatePermit permit;
};

class JobRunner {
public:
    /// Called on every phase transition; for tests and tracing.
    using PhaseObserver = std::function<void(const JobName&, RunId, RunPhase)>;

    JobRunner(RunnerOptions options, ConcurrencyGate& gate, RunHistory& history,
              HealthReporter& health, Logger& logger);

    /**
     * @brief Try to admit a run of @p job (Pending → Admitted).
     *
     * On rejection the run is finalized as SkippedConcurrent and nullopt
     * is returned; no worker is spawned.
     */
    [[nodiscard]] std::optional<RunTicket> admit(const JobDefinition& job, uint32_t attempt = 0);

    /**
     * @brief Execute an admitted run to completion (blocking).
     *
     * Spawns the worker under the job's resource limits, arms the
     * timeout supervisor, waits, classifies the outcome and finalizes.
     * If supervision itself throws, the worker is killed and the run is
     * finalized as Failed with ReasonCode::Internal.
     */
    RunRecord execute(const JobDefinition& job, RunTicket ticket);

    void set_phase_observer(PhaseObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] ConcurrencyGate& gate() noexcept { return gate_; }

    /// Next process-wide run identifier.
    [[nodiscard]] static RunId next_run_id() noexcept;

    /// Most recently issued run identifier (0 before the first run).
    [[nodiscard]] static RunId last_run_id() noexcept;

private:
    void supervise(const JobDefinition& job, RunTicket& ticket, RunRecord& record, bool& finalized);
    void finalize(RunRecord& record, RunPhase phase, GatePermit& permit);
    void notify(const JobName& job, RunId run_id, RunPhase phase);

    RunnerOptions options_;
    ConcurrencyGate& gate_;
    RunHistory& history_;
    HealthReporter& health_;
    Logger& logger_;
    PhaseObserver observer_;
};

/**
 * @brief Outcome classification of a reaped worker.
 *
 * Exposed separately so the mapping can be tested without processes.
 */
struct Classification {
    RunPhase phase{RunPhase::Failed};
    ReasonCode reason{ReasonCode::None};
    std::optional<std::string> summary;
};

struct ClassifyInput {
    const WorkerExit* exit{nullptr};
    bool timed_out{false};
    bool escalated{false};
    Duration timeout{0};
    const LimitPlan* limits{nullptr};
    bool callable{false};
    std::optional<std::string> last_stderr_line;
};

[[nodiscard]] Classification classify_exit(const ClassifyInput& input);

}  // namespace jobguard
