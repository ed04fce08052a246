/**
 * @file test_health_reporter.cpp
 * @brief Unit tests for health probes, counters, and their JSON form.
 */

#include "telemetry/health_reporter.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace jobguard;

namespace {

RunRecord finished(const JobName& job, RunOutcome outcome, ReasonCode reason = ReasonCode::None) {
    RunRecord r;
    r.run_id = 1;
    r.job_name = job;
    r.outcome = outcome;
    r.reason = reason;
    r.started_at = std::chrono::system_clock::now();
    r.finished_at = r.started_at;
    return r;
}

}  // namespace

TEST(HealthReporterTest, HealthyWithoutProbes) {
    HealthReporter reporter;
    auto snap = reporter.check();
    EXPECT_EQ(snap.status, HealthStatus::Healthy);
    EXPECT_FALSE(snap.reason.has_value());
    EXPECT_TRUE(snap.dependencies.empty());
}

TEST(HealthReporterTest, OptionalProbeFailureDegrades) {
    HealthReporter reporter;
    reporter.add_probe("cache", false, [] { return Result<void>{Error{"cache dir missing"}}; });
    reporter.add_probe("history", true, [] { return Result<void>{}; });

    auto snap = reporter.check();
    EXPECT_EQ(snap.status, HealthStatus::Degraded);
    ASSERT_TRUE(snap.reason.has_value());
    EXPECT_EQ(*snap.reason, "cache: cache dir missing");
    ASSERT_EQ(snap.dependencies.size(), 2u);
    EXPECT_FALSE(snap.dependencies[0].ok);
    EXPECT_TRUE(snap.dependencies[1].ok);
}

TEST(HealthReporterTest, CriticalProbeFailureIsUnhealthy) {
    HealthReporter reporter;
    reporter.add_probe("cache", false, [] { return Result<void>{Error{"cache dir missing"}}; });
    reporter.add_probe(DependencyProbe{
        .name = "history",
        .critical = true,
        .check = [] { return Result<void>{Error{"read-only file system"}}; },
    });

    auto snap = reporter.check();
    EXPECT_EQ(snap.status, HealthStatus::Unhealthy);
    EXPECT_EQ(*snap.reason, "history: read-only file system");
}

TEST(HealthReporterTest, RunCounters) {
    HealthReporter reporter;
    reporter.register_job("idle");
    reporter.record_queued("sync");
    EXPECT_EQ(reporter.job("sync").backlog, 1u);

    reporter.record_started("sync");
    EXPECT_EQ(reporter.job("sync").backlog, 0u);
    EXPECT_EQ(reporter.job("sync").running, 1u);

    // A skip while one run is in flight leaves it running.
    reporter.record_outcome(finished("sync", RunOutcome::SkippedConcurrent, ReasonCode::ConcurrencyLimit));
    EXPECT_EQ(reporter.job("sync").running, 1u);
    EXPECT_EQ(reporter.job("sync").skipped, 1u);

    reporter.record_outcome(finished("sync", RunOutcome::TimedOut, ReasonCode::Timeout));
    auto c = reporter.job("sync");
    EXPECT_EQ(c.running, 0u);
    EXPECT_EQ(c.timed_out, 1u);
    EXPECT_EQ(c.last_outcome, RunOutcome::TimedOut);
    EXPECT_EQ(c.last_reason, ReasonCode::Timeout);
    EXPECT_TRUE(c.last_finished.has_value());

    reporter.record_retry("sync");
    EXPECT_EQ(reporter.job("sync").retries, 1u);
    EXPECT_EQ(reporter.job("sync").running, 0u);

    auto metrics = reporter.metrics();
    EXPECT_EQ(metrics.jobs.size(), 2u);
    EXPECT_EQ(metrics.jobs.at("idle").succeeded, 0u);
}

TEST(HealthReporterTest, RequestCounters) {
    HealthReporter reporter;
    reporter.record_request();
    reporter.record_request(true);
    reporter.record_request();
    EXPECT_EQ(reporter.requests_total(), 3u);
    EXPECT_EQ(reporter.errors_total(), 1u);
}

TEST(HealthReporterTest, WritablePathProbe) {
    EXPECT_TRUE(probe_writable_path(std::filesystem::temp_directory_path()).has_value());

    auto missing = probe_writable_path("/nonexistent/jobguard");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(HealthJsonTest, HealthSnapshot) {
    HealthReporter reporter;
    reporter.add_probe("history", true, [] { return Result<void>{Error{"gone"}}; });
    auto json = to_json(reporter.check());

    EXPECT_NE(json.find(R"("status":"error")"), std::string::npos);
    EXPECT_NE(json.find(R"("reason":"history: gone")"), std::string::npos);
    EXPECT_NE(json.find(R"("history":{"status":"error","critical":true,"detail":"gone"})"),
              std::string::npos);
}

TEST(HealthJsonTest, MetricsSnapshot) {
    HealthReporter reporter;
    reporter.record_request();
    reporter.record_started("sync");
    reporter.record_outcome(finished("sync", RunOutcome::Success));
    auto json = to_json(reporter.metrics());

    EXPECT_NE(json.find(R"("requests_total":1)"), std::string::npos);
    EXPECT_NE(json.find(R"("errors_total":0)"), std::string::npos);
    EXPECT_NE(json.find(R"("sync":{)"), std::string::npos);
    EXPECT_NE(json.find(R"("retries":0)"), std::string::npos);
    EXPECT_NE(json.find(R"("succeeded":1)"), std::string::npos);
}
