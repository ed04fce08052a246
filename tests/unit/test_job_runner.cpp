/**
 * @file test_job_runner.cpp
 * @brief Unit tests for JobRunner execution and exit classification.
 */

#include "executor/job_runner.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>
#include <vector>

using namespace jobguard;

class JobRunnerTest : public ::testing::Test {
protected:
    ConcurrencyGate gate_;
    RunHistory history_;
    HealthReporter health_;
    Logger logger_{std::make_unique<NullSink>()};
    JobRunner runner_{RunnerOptions{.kill_grace = Duration{300}, .stderr_tail_lines = 5},
                      gate_, history_, health_, logger_};

    static JobDefinition make_job(const JobName& name, JobLogic logic, ResourcePolicy policy = {}) {
        return JobDefinition{
            .name = name,
            .schedule = Schedule::every(Duration{60000}),
            .logic = std::move(logic),
            .policy = policy,
            .run_on_start = false,
        };
    }

    static JobLogic shell(std::string script) {
        return CommandSpec{.argv = {"/bin/sh", "-c", std::move(script)}, .extra_env = {}, .working_dir = {}};
    }

    RunRecord run(const JobDefinition& job) {
        auto ticket = runner_.admit(job);
        if (!ticket) throw std::runtime_error("run was not admitted");
        return runner_.execute(job, std::move(*ticket));
    }
};

TEST_F(JobRunnerTest, SuccessfulCommand) {
    auto job = make_job("ok", shell("exit 0"));
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Success);
    EXPECT_EQ(record.reason, ReasonCode::None);
    EXPECT_FALSE(record.error_summary.has_value());
    EXPECT_GT(record.worker_pid, 0);
    EXPECT_EQ(record.exit_code, 0);
    EXPECT_GE(record.finished_at, record.started_at);

    EXPECT_EQ(gate_.in_flight("ok"), 0u);
    EXPECT_TRUE(gate_.active_workers("ok").empty());
    ASSERT_EQ(history_.size(), 1u);
    EXPECT_EQ(history_.last("ok")->run_id, record.run_id);

    auto counters = health_.job("ok");
    EXPECT_EQ(counters.succeeded, 1u);
    EXPECT_EQ(counters.running, 0u);
    EXPECT_EQ(counters.last_outcome, RunOutcome::Success);
}

TEST_F(JobRunnerTest, NonZeroExitCarriesStderrLine) {
    auto job = make_job("broken", shell("echo 'disk full' >&2; exit 4"));
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::ExitStatus);
    EXPECT_EQ(record.exit_code, 4);
    EXPECT_EQ(record.error_summary, std::optional<std::string>{"exit status 4: disk full"});
    EXPECT_EQ(health_.job("broken").failed, 1u);
}

TEST_F(JobRunnerTest, TimeoutTerminatesWorker) {
    auto job = make_job("slow", shell("sleep 10"), ResourcePolicy{.timeout = Duration{300}});
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::TimedOut);
    EXPECT_EQ(record.reason, ReasonCode::Timeout);
    EXPECT_EQ(record.term_signal, SIGTERM);
    EXPECT_GE(record.duration(), Duration{300});
    EXPECT_LT(record.duration(), Duration{5000});
    ASSERT_TRUE(record.error_summary.has_value());
    EXPECT_NE(record.error_summary->find("0.300s"), std::string::npos);

    EXPECT_EQ(gate_.in_flight("slow"), 0u);
    EXPECT_EQ(health_.job("slow").timed_out, 1u);
}

TEST_F(JobRunnerTest, TimeoutEscalatesWhenTermIsIgnored) {
    auto job = make_job("stubborn", shell("trap '' TERM; sleep 10"),
                        ResourcePolicy{.timeout = Duration{200}});
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::TimedOut);
    EXPECT_EQ(record.term_signal, SIGKILL);
    ASSERT_TRUE(record.error_summary.has_value());
    EXPECT_NE(record.error_summary->find("killed after grace period"), std::string::npos);
}

TEST_F(JobRunnerTest, RejectedRunIsRecordedAsSkipped) {
    auto job = make_job("busy", shell("exit 0"));
    auto held = gate_.try_acquire("busy");
    ASSERT_TRUE(held.has_value());

    auto ticket = runner_.admit(job);
    EXPECT_FALSE(ticket.has_value());

    auto last = history_.last("busy");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->outcome, RunOutcome::SkippedConcurrent);
    EXPECT_EQ(last->reason, ReasonCode::ConcurrencyLimit);
    EXPECT_EQ(last->worker_pid, 0);
    EXPECT_EQ(gate_.in_flight("busy"), 1u);

    auto counters = health_.job("busy");
    EXPECT_EQ(counters.skipped, 1u);
    EXPECT_EQ(counters.running, 0u);
}

TEST_F(JobRunnerTest, CallableExceptionIsClassified) {
    auto job = make_job("thrower", make_callable_logic([]() -> bool {
        throw std::runtime_error("search backend unreachable");
    }));
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::Exception);
    EXPECT_EQ(record.error_summary, std::optional<std::string>{"search backend unreachable"});
}

TEST_F(JobRunnerTest, CallableReturningFalseFails) {
    auto job = make_job("false", make_callable_logic([] { return false; }));
    auto record = run(job);
    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::ExitStatus);
}

TEST_F(JobRunnerTest, MissingProgramIsSpawnFailure) {
    auto job = make_job("missing", CommandSpec{
        .argv = {"/nonexistent/jobguard-program"}, .extra_env = {}, .working_dir = {}});
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::SpawnFailed);
    ASSERT_TRUE(record.error_summary.has_value());
    EXPECT_NE(record.error_summary->find("/nonexistent/jobguard-program"), std::string::npos);
}

TEST_F(JobRunnerTest, AddressSpaceLimitStopsLargeAllocation) {
    if (!ResourceLimiter::platform_supported()) GTEST_SKIP();

    auto job = make_job("hungry", make_callable_logic([] {
        std::vector<char> block(size_t{1} << 30);
        block[0] = 1;
        return block[0] == 1;
    }), ResourcePolicy{.address_space_mb = 256});
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::MemoryLimit);
}

TEST_F(JobRunnerTest, CpuLimitStopsBusyLoop) {
    if (!ResourceLimiter::platform_supported()) GTEST_SKIP();

    auto job = make_job("spinner", make_callable_logic([] {
        volatile uint64_t x = 0;
        for (;;) x = x + 1;
        return false;
    }), ResourcePolicy{.timeout = Duration{15000}, .cpu_seconds = 1});
    auto record = run(job);

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::CpuLimit);
}

TEST_F(JobRunnerTest, PhasesAreObservedInOrder) {
    std::mutex mutex;
    std::vector<RunPhase> phases;
    runner_.set_phase_observer([&](const JobName&, RunId, RunPhase phase) {
        std::lock_guard lock(mutex);
        phases.push_back(phase);
    });

    static_cast<void>(run(make_job("traced", shell("exit 0"))));

    std::vector<RunPhase> expected{RunPhase::Pending, RunPhase::Admitted, RunPhase::Running,
                                   RunPhase::Succeeded};
    EXPECT_EQ(phases, expected);
}

TEST_F(JobRunnerTest, SupervisionErrorStillFinalizesRun) {
    std::vector<RunPhase> phases;
    runner_.set_phase_observer([&](const JobName&, RunId, RunPhase phase) {
        phases.push_back(phase);
        if (phase == RunPhase::Running) throw std::runtime_error("observer failed");
    });

    auto job = make_job("fragile", shell("sleep 30"));
    auto started = std::chrono::steady_clock::now();
    auto record = run(job);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(record.outcome, RunOutcome::Failed);
    EXPECT_EQ(record.reason, ReasonCode::Internal);
    ASSERT_TRUE(record.error_summary.has_value());
    EXPECT_NE(record.error_summary->find("observer failed"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds{10});

    // Slot, history and counters all settled exactly once.
    EXPECT_EQ(gate_.in_flight("fragile"), 0u);
    EXPECT_TRUE(gate_.active_workers("fragile").empty());
    ASSERT_EQ(history_.records_for("fragile").size(), 1u);
    auto counters = health_.job("fragile");
    EXPECT_EQ(counters.failed, 1u);
    EXPECT_EQ(counters.running, 0u);
    EXPECT_EQ(counters.last_reason, ReasonCode::Internal);
    ASSERT_FALSE(phases.empty());
    EXPECT_EQ(phases.back(), RunPhase::Failed);

    // The worker was killed and reaped when supervision unwound.
    ASSERT_GT(record.worker_pid, 0);
    EXPECT_EQ(::kill(record.worker_pid, 0), -1);
}

TEST_F(JobRunnerTest, RetryAttemptIsRecorded) {
    auto job = make_job("again", shell("exit 1"));
    auto ticket = runner_.admit(job, 2);
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->attempt, 2u);
    auto record = runner_.execute(job, std::move(*ticket));
    EXPECT_EQ(record.attempt, 2u);
    EXPECT_EQ(history_.last("again")->attempt, 2u);
}

TEST_F(JobRunnerTest, RunIdsIncrease) {
    auto job = make_job("ids", shell("exit 0"));
    auto first = run(job);
    auto second = run(job);
    EXPECT_LT(first.run_id, second.run_id);
    EXPECT_EQ(JobRunner::last_run_id(), second.run_id);

    auto records = history_.records_for("ids");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].run_id, first.run_id);
}

// ─────────────────────────────────────────────
// classify_exit
// ─────────────────────────────────────────────

namespace {

ChildReport make_report(ChildReportKind kind, const char* message, int error = 0) {
    ChildReport r;
    r.kind = kind;
    r.error = error;
    std::strncpy(r.message, message, sizeof(r.message) - 1);
    return r;
}

}  // namespace

TEST(ClassifyExitTest, CleanExitSucceeds) {
    WorkerExit exit{.exit_code = 0};
    auto c = classify_exit(ClassifyInput{.exit = &exit});
    EXPECT_EQ(c.phase, RunPhase::Succeeded);
    EXPECT_EQ(c.reason, ReasonCode::None);
    EXPECT_FALSE(c.summary.has_value());
}

TEST(ClassifyExitTest, TimeoutWinsOverExitStatus) {
    WorkerExit exit{.term_signal = SIGTERM};
    auto c = classify_exit(ClassifyInput{.exit = &exit, .timed_out = true, .timeout = Duration{1500}});
    EXPECT_EQ(c.phase, RunPhase::TimedOut);
    EXPECT_EQ(c.reason, ReasonCode::Timeout);
    EXPECT_EQ(c.summary, std::optional<std::string>{"exceeded timeout of 1.500s"});
}

TEST(ClassifyExitTest, ExecFailureIsSpawnFailed) {
    WorkerExit exit{.exit_code = kExitSpawnFailed};
    exit.reports.push_back(make_report(ChildReportKind::ExecFailed, "exec /bin/nope", ENOENT));
    auto c = classify_exit(ClassifyInput{.exit = &exit});
    EXPECT_EQ(c.reason, ReasonCode::SpawnFailed);
    EXPECT_NE(c.summary->find("exec /bin/nope"), std::string::npos);
}

TEST(ClassifyExitTest, SigxcpuIsCpuLimit) {
    LimitPlan plan{.limit_cpu = true, .cpu_soft_seconds = 2, .cpu_hard_seconds = 3};
    WorkerExit exit{.term_signal = SIGXCPU};
    auto c = classify_exit(ClassifyInput{.exit = &exit, .limits = &plan});
    EXPECT_EQ(c.reason, ReasonCode::CpuLimit);
    EXPECT_EQ(c.summary, std::optional<std::string>{"CPU time limit of 2s exceeded"});
}

TEST(ClassifyExitTest, SigkillAfterCpuAllowanceIsCpuLimit) {
    LimitPlan plan{.limit_cpu = true, .cpu_soft_seconds = 2, .cpu_hard_seconds = 3};
    WorkerExit exit{.term_signal = SIGKILL, .cpu_time = std::chrono::seconds{3}};
    EXPECT_EQ(classify_exit(ClassifyInput{.exit = &exit, .limits = &plan}).reason, ReasonCode::CpuLimit);

    WorkerExit early{.term_signal = SIGKILL, .cpu_time = std::chrono::milliseconds{10}};
    EXPECT_EQ(classify_exit(ClassifyInput{.exit = &early, .limits = &plan}).reason, ReasonCode::Signaled);
}

TEST(ClassifyExitTest, CallableOutOfMemoryExit) {
    WorkerExit exit{.exit_code = kExitOutOfMemory};
    EXPECT_EQ(classify_exit(ClassifyInput{.exit = &exit, .callable = true}).reason,
              ReasonCode::MemoryLimit);
    // A command exiting 71 is just an exit status.
    EXPECT_EQ(classify_exit(ClassifyInput{.exit = &exit, .callable = false}).reason,
              ReasonCode::ExitStatus);
}

TEST(ClassifyExitTest, ExceptionReportUsesMessage) {
    WorkerExit exit{.exit_code = kExitJobException};
    exit.reports.push_back(make_report(ChildReportKind::Exception, "bad payload"));
    auto c = classify_exit(ClassifyInput{.exit = &exit, .callable = true});
    EXPECT_EQ(c.reason, ReasonCode::Exception);
    EXPECT_EQ(c.summary, std::optional<std::string>{"bad payload"});
}

TEST(ClassifyExitTest, ForeignSignal) {
    WorkerExit exit{.term_signal = SIGSEGV};
    auto c = classify_exit(ClassifyInput{.exit = &exit});
    EXPECT_EQ(c.phase, RunPhase::Failed);
    EXPECT_EQ(c.reason, ReasonCode::Signaled);
}

TEST(ClassifyExitTest, LimitFailureReportDoesNotChangeOutcome) {
    WorkerExit exit{.exit_code = 0};
    auto r = make_report(ChildReportKind::LimitFailed, "", EPERM);
    r.resource = LimitResource::AddressSpace;
    exit.reports.push_back(r);
    EXPECT_EQ(classify_exit(ClassifyInput{.exit = &exit}).phase, RunPhase::Succeeded);
}
