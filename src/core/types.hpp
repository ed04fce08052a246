/**
 * @file types.hpp
 * @brief Fundamental types used throughout jobguard.
 *
 * Defines JobName, ResourcePolicy, RunRecord, and the run state machine
 * vocabulary shared by the gate, runner, history and health reporter.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace jobguard {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using JobName = std::string;
using RunId = uint64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resource Policy
// ─────────────────────────────────────────────

/**
 * @brief Normalized per-job ceilings.
 *
 * Zero means "unbounded" for every ceiling. Built once from configuration
 * and never mutated afterwards.
 */
struct ResourcePolicy {
    Duration timeout{0};                ///< Wall-clock ceiling, 0 = supervisor disabled
    uint64_t address_space_mb{0};       ///< RLIMIT_AS ceiling, 0 = unbounded
    uint64_t cpu_seconds{0};            ///< RLIMIT_CPU ceiling, 0 = unbounded
    uint32_t concurrency{1};            ///< Max simultaneous runs, always >= 1

    [[nodiscard]] constexpr bool has_timeout() const noexcept { return timeout.count() > 0; }
    [[nodiscard]] constexpr bool has_address_space_limit() const noexcept { return address_space_mb > 0; }
    [[nodiscard]] constexpr bool has_cpu_limit() const noexcept { return cpu_seconds > 0; }

    bool operator==(const ResourcePolicy&) const = default;
};

/**
 * @brief Re-dispatch of failed or timed-out runs with exponential backoff.
 *
 * Retry n (1-based) waits delay * backoff^(n-1). A retry goes through the
 * concurrency gate like any other trigger.
 */
struct RetryPolicy {
    uint32_t max_retries{0};            ///< 0 = never retry
    Duration delay{1000};               ///< Wait before the first retry
    double backoff{2.0};                ///< Multiplier per further retry, > 0

    /// Longest wait between two attempts.
    static constexpr Duration kMaxDelay{std::chrono::hours{24}};

    [[nodiscard]] constexpr bool enabled() const noexcept { return max_retries > 0; }

    [[nodiscard]] Duration delay_for(uint32_t retry) const noexcept {
        double ms = static_cast<double>(delay.count());
        for (uint32_t i = 1; i < retry && ms < static_cast<double>(kMaxDelay.count()); ++i) {
            ms *= backoff;
        }
        if (ms > static_cast<double>(kMaxDelay.count())) return kMaxDelay;
        return Duration{static_cast<Duration::rep>(ms)};
    }

    bool operator==(const RetryPolicy&) const = default;
};

// ─────────────────────────────────────────────
// Run State Machine
// ─────────────────────────────────────────────

enum class RunPhase : uint8_t {
    Pending,            ///< Selected by the scheduler loop
    Admitted,           ///< Holds a concurrency gate slot
    Running,            ///< Worker process spawned
    Succeeded,
    Failed,
    TimedOut,
    SkippedConcurrent
};

[[nodiscard]] constexpr std::string_view to_string(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Pending:           return "pending";
        case RunPhase::Admitted:          return "admitted";
        case RunPhase::Running:           return "running";
        case RunPhase::Succeeded:         return "succeeded";
        case RunPhase::Failed:            return "failed";
        case RunPhase::TimedOut:          return "timed_out";
        case RunPhase::SkippedConcurrent: return "skipped_concurrent";
    }
    return "unknown";
}

/// Terminal outcome of a run, as persisted in history.
enum class RunOutcome : uint8_t {
    Success,
    Failed,
    TimedOut,
    SkippedConcurrent
};

[[nodiscard]] constexpr std::string_view to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::Success:           return "success";
        case RunOutcome::Failed:            return "failed";
        case RunOutcome::TimedOut:          return "timed_out";
        case RunOutcome::SkippedConcurrent: return "skipped_concurrent";
    }
    return "unknown";
}

/**
 * @brief Summarized cause of a terminal outcome.
 *
 * This is what the reporting interface exposes instead of raw errors.
 */
enum class ReasonCode : uint8_t {
    None,
    ExitStatus,         ///< Worker exited with a non-zero status
    Signaled,           ///< Worker killed by a signal we did not send
    Exception,          ///< Job logic raised an error at the worker boundary
    CpuLimit,           ///< RLIMIT_CPU exceeded
    MemoryLimit,        ///< Allocation failed under RLIMIT_AS
    SpawnFailed,        ///< fork/exec or pipe set-up failed
    Timeout,            ///< Timeout supervisor terminated the worker
    ConcurrencyLimit,   ///< Rejected by the concurrency gate
    Internal            ///< Supervising the run failed inside the daemon
};

[[nodiscard]] constexpr std::string_view to_string(ReasonCode reason) noexcept {
    switch (reason) {
        case ReasonCode::None:             return "none";
        case ReasonCode::ExitStatus:       return "exit_status";
        case ReasonCode::Signaled:         return "signaled";
        case ReasonCode::Exception:        return "exception";
        case ReasonCode::CpuLimit:         return "cpu_limit";
        case ReasonCode::MemoryLimit:      return "memory_limit";
        case ReasonCode::SpawnFailed:      return "spawn_failed";
        case ReasonCode::Timeout:          return "timeout";
        case ReasonCode::ConcurrencyLimit: return "concurrency_limit";
        case ReasonCode::Internal:         return "internal_error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// Run Record
// ─────────────────────────────────────────────

/**
 * @brief The finalized record of one job invocation.
 *
 * run_id is assigned at admission from a process-wide counter, so records
 * of a single job are totally ordered by it.
 */
struct RunRecord {
    RunId run_id{0};
    JobName job_name;
    uint32_t attempt{0};                ///< 0 = scheduled run, n = n-th retry
    Timestamp started_at;
    Timestamp finished_at;
    RunOutcome outcome{RunOutcome::Failed};
    ReasonCode reason{ReasonCode::None};
    std::optional<std::string> error_summary;

    pid_t worker_pid{0};
    std::optional<int> exit_code;
    std::optional<int> term_signal;

    [[nodiscard]] Duration duration() const noexcept {
        return std::chrono::duration_cast<Duration>(finished_at - started_at);
    }
};

/// Map a terminal RunPhase to the persisted outcome.
[[nodiscard]] constexpr RunOutcome outcome_of(RunPhase phase) noexcept {
    switch (phase) {
        case RunPhase::Succeeded:         return RunOutcome::Success;
        case RunPhase::TimedOut:          return RunOutcome::TimedOut;
        case RunPhase::SkippedConcurrent: return RunOutcome::SkippedConcurrent;
        default:                          return RunOutcome::Failed;
    }
}

}  // namespace jobguard
