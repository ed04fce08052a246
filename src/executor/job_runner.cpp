/**
 * @file job_runner.cpp
 * @brief JobRunner implementation: spawn, supervise, classify, finalize.
 */

#include "executor/job_runner.hpp"

#include "executor/output_capture.hpp"
#include "limits/resource_limiter.hpp"
#include "supervisor/timeout_supervisor.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <string>
#include <variant>

namespace jobguard {

namespace {

std::atomic<RunId> g_run_counter{0};

std::string format_seconds(Duration d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3fs", static_cast<double>(d.count()) / 1000.0);
    return buf;
}

Classification failed(ReasonCode reason, std::string summary) {
    return Classification{RunPhase::Failed, reason, std::move(summary)};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Classification
// ─────────────────────────────────────────────

Classification classify_exit(const ClassifyInput& input) {
    const WorkerExit& exit = *input.exit;

    if (input.timed_out) {
        std::string summary = "exceeded timeout of " + format_seconds(input.timeout);
        if (input.escalated) summary += ", killed after grace period";
        return Classification{RunPhase::TimedOut, ReasonCode::Timeout, std::move(summary)};
    }

    if (const auto* r = exit.find(ChildReportKind::ExecFailed)) {
        return failed(ReasonCode::SpawnFailed, r->describe());
    }

    if (const auto* r = exit.find(ChildReportKind::OutOfMemory)) {
        return failed(ReasonCode::MemoryLimit, r->describe());
    }
    if (input.callable && exit.exit_code == kExitOutOfMemory) {
        return failed(ReasonCode::MemoryLimit, "out of memory");
    }

    if (exit.term_signal) {
        int sig = *exit.term_signal;
        bool cpu_limited = input.limits != nullptr && input.limits->limit_cpu;
        auto cpu_allowance = std::chrono::seconds{
            cpu_limited ? static_cast<int64_t>(input.limits->cpu_soft_seconds) : int64_t{0}};
        if (sig == SIGXCPU || (cpu_limited && sig == SIGKILL && exit.cpu_time >= cpu_allowance)) {
            return failed(ReasonCode::CpuLimit,
                          "CPU time limit of " + std::to_string(cpu_allowance.count()) + "s exceeded");
        }
    }

    if (exit.exit_code) {
        int code = *exit.exit_code;
        if (code == 0) {
            return Classification{RunPhase::Succeeded, ReasonCode::None, std::nullopt};
        }
        if (const auto* r = exit.find(ChildReportKind::Exception)) {
            return failed(ReasonCode::Exception, r->describe());
        }
        std::string summary = "exit status " + std::to_string(code);
        if (input.last_stderr_line) summary += ": " + *input.last_stderr_line;
        return failed(ReasonCode::ExitStatus, std::move(summary));
    }

    if (exit.term_signal) {
        return failed(ReasonCode::Signaled, "terminated by signal " + std::to_string(*exit.term_signal));
    }

    return failed(ReasonCode::ExitStatus, "unknown termination status");
}

// ─────────────────────────────────────────────
// JobRunner
// ─────────────────────────────────────────────

JobRunner::JobRunner(RunnerOptions options, ConcurrencyGate& gate, RunHistory& history,
                     HealthReporter& health, Logger& logger)
    : options_(options), gate_(gate), history_(history), health_(health), logger_(logger) {}

RunId JobRunner::next_run_id() noexcept {
    return g_run_counter.fetch_add(1) + 1;
}

RunId JobRunner::last_run_id() noexcept {
    return g_run_counter.load();
}

std::optional<RunTicket> JobRunner::admit(const JobDefinition& job, uint32_t attempt) {
    RunId run_id = next_run_id();
    notify(job.name, run_id, RunPhase::Pending);

    auto permit = gate_.try_acquire(job.name);
    if (!permit) {
        RunRecord record;
        record.run_id = run_id;
        record.job_name = job.name;
        record.attempt = attempt;
        record.started_at = std::chrono::system_clock::now();
        record.reason = ReasonCode::ConcurrencyLimit;
        record.error_summary = "concurrency limit of " + std::to_string(gate_.limit(job.name))
                             + " reached";
        GatePermit none;
        finalize(record, RunPhase::SkippedConcurrent, none);
        return std::nullopt;
    }

    notify(job.name, run_id, RunPhase::Admitted);
    return RunTicket{
        .run_id = run_id,
        .attempt = attempt,
        .admitted_at = std::chrono::system_clock::now(),
        .admitted_steady = std::chrono::steady_clock::now(),
        .permit = std::move(*permit),
    };
}

RunRecord JobRunner::execute(const JobDefinition& job, RunTicket ticket) {
    RunRecord record;
    record.run_id = ticket.run_id;
    record.job_name = job.name;
    record.attempt = ticket.attempt;
    record.started_at = ticket.admitted_at;

    bool finalized = false;
    try {
        supervise(job, ticket, record, finalized);
    } catch (const std::exception& e) {
        if (finalized) {
            logger_.error("Job " + job.name + " run " + std::to_string(record.run_id)
                          + ": error after finalize: " + e.what());
            return record;
        }
        // The worker, supervisor and output pump are gone by now.
        record.reason = ReasonCode::Internal;
        record.error_summary = std::string{"supervision failed: "} + e.what();
        record.exit_code.reset();
        record.term_signal.reset();
        finalized = true;
        finalize(record, RunPhase::Failed, ticket.permit);
    }
    return record;
}

void JobRunner::supervise(const JobDefinition& job, RunTicket& ticket, RunRecord& record,
                          bool& finalized) {
    auto finish = [&](RunPhase phase) {
        finalized = true;
        finalize(record, phase, ticket.permit);
    };

    health_.record_started(job.name);

    auto plan = ResourceLimiter::plan(job.policy, job.name, logger_);
    auto spawned = spawn_worker(job.logic, plan);
    if (!spawned) {
        record.reason = ReasonCode::SpawnFailed;
        record.error_summary = spawned.error().message;
        return finish(RunPhase::Failed);
    }

    auto& process = **spawned;
    record.worker_pid = process.pid();
    ticket.permit.bind_worker(process.pid());
    notify(job.name, record.run_id, RunPhase::Running);
    logger_.info("Job " + job.name + " run " + std::to_string(record.run_id)
                 + " started (pid " + std::to_string(process.pid()) + ")");

    OutputCapture capture(process.stdout_fd(), process.stderr_fd(), job.name, logger_,
                          options_.stderr_tail_lines);
    TimeoutSupervisor supervisor(process, ticket.admitted_steady, job.policy.timeout,
                                 options_.kill_grace, job.name, logger_);

    auto exit = process.wait();
    supervisor.disarm();
    capture.finish();

    if (!exit) {
        record.reason = ReasonCode::SpawnFailed;
        record.error_summary = exit.error().message;
        return finish(RunPhase::Failed);
    }

    for (const auto& report : exit->reports) {
        if (report.kind == ChildReportKind::LimitFailed) {
            logger_.warn("Job " + job.name + ": " + report.describe());
        }
    }

    record.exit_code = exit->exit_code;
    record.term_signal = exit->term_signal;

    auto verdict = classify_exit(ClassifyInput{
        .exit = &exit.value(),
        .timed_out = supervisor.fired(),
        .escalated = supervisor.escalated(),
        .timeout = job.policy.timeout,
        .limits = &plan,
        .callable = std::holds_alternative<JobCallable>(job.logic),
        .last_stderr_line = capture.last_stderr_line(),
    });
    record.reason = verdict.reason;
    record.error_summary = std::move(verdict.summary);
    finish(verdict.phase);
}

void JobRunner::finalize(RunRecord& record, RunPhase phase, GatePermit& permit) {
    record.finished_at = std::chrono::system_clock::now();
    record.outcome = outcome_of(phase);

    permit.release();
    history_.append(record);
    health_.record_outcome(record);
    notify(record.job_name, record.run_id, phase);

    std::string head = "Job " + record.job_name + " run " + std::to_string(record.run_id);
    if (record.attempt > 0) head += " (retry " + std::to_string(record.attempt) + ")";
    switch (record.outcome) {
        case RunOutcome::Success:
            logger_.info(head + " succeeded in " + format_seconds(record.duration()));
            break;
        case RunOutcome::SkippedConcurrent:
            logger_.info(head + " skipped: " + record.error_summary.value_or("already running"));
            break;
        case RunOutcome::Failed:
        case RunOutcome::TimedOut:
            logger_.warn(head + " " + std::string{to_string(record.outcome)} + " ("
                         + std::string{to_string(record.reason)} + ") after "
                         + format_seconds(record.duration()) + ": "
                         + record.error_summary.value_or("no details"));
            break;
    }
}

void JobRunner::notify(const JobName& job, RunId run_id, RunPhase phase) {
    logger_.debug("Job " + job + " run " + std::to_string(run_id) + " -> "
                  + std::string{to_string(phase)});
    if (observer_) observer_(job, run_id, phase);
}

}  // namespace jobguard
