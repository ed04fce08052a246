/**
 * @file health_reporter.cpp
 * @brief HealthReporter implementation and JSON rendering.
 */

#include "telemetry/health_reporter.hpp"

#include "core/logger.hpp"

#include <cerrno>
#include <chrono>
#include <sstream>

#include <unistd.h>

namespace jobguard {

void HealthReporter::register_job(const JobName& job) {
    std::lock_guard lock(mutex_);
    jobs_.try_emplace(job);
}

void HealthReporter::add_probe(DependencyProbe probe) {
    std::lock_guard lock(mutex_);
    probes_.push_back(std::move(probe));
}

void HealthReporter::record_request(bool error) noexcept {
    requests_total_.fetch_add(1, std::memory_order_relaxed);
    if (error) errors_total_.fetch_add(1, std::memory_order_relaxed);
}

void HealthReporter::record_queued(const JobName& job) {
    std::lock_guard lock(mutex_);
    ++jobs_[job].backlog;
}

void HealthReporter::record_started(const JobName& job) {
    std::lock_guard lock(mutex_);
    auto& c = jobs_[job];
    if (c.backlog > 0) --c.backlog;
    ++c.running;
}

void HealthReporter::record_retry(const JobName& job) {
    std::lock_guard lock(mutex_);
    ++jobs_[job].retries;
}

void HealthReporter::record_outcome(const RunRecord& record) {
    std::lock_guard lock(mutex_);
    auto& c = jobs_[record.job_name];
    switch (record.outcome) {
        case RunOutcome::Success:           ++c.succeeded; break;
        case RunOutcome::Failed:            ++c.failed; break;
        case RunOutcome::TimedOut:          ++c.timed_out; break;
        case RunOutcome::SkippedConcurrent: ++c.skipped; break;
    }
    if (record.outcome != RunOutcome::SkippedConcurrent && c.running > 0) {
        --c.running;
    }
    c.last_outcome = record.outcome;
    c.last_reason = record.reason;
    c.last_finished = record.finished_at;
}

HealthSnapshot HealthReporter::check() const {
    std::vector<DependencyProbe> probes;
    {
        std::lock_guard lock(mutex_);
        probes = probes_;
    }

    HealthSnapshot snap;
    snap.checked_at = std::chrono::system_clock::now();

    for (auto& probe : probes) {
        DependencyStatus dep{probe.name, probe.critical, true, {}};
        auto result = probe.check ? probe.check() : Result<void>{};
        if (!result) {
            dep.ok = false;
            dep.detail = result.error().message;

            auto severity = probe.critical ? HealthStatus::Unhealthy : HealthStatus::Degraded;
            if (severity > snap.status) {
                snap.status = severity;
                snap.reason = probe.name + ": " + dep.detail;
            }
        }
        snap.dependencies.push_back(std::move(dep));
    }
    return snap;
}

MetricsSnapshot HealthReporter::metrics() const {
    MetricsSnapshot snap;
    snap.captured_at = std::chrono::system_clock::now();
    snap.requests_total = requests_total_.load();
    snap.errors_total = errors_total_.load();
    std::lock_guard lock(mutex_);
    snap.jobs = jobs_;
    return snap;
}

JobCounters HealthReporter::job(const JobName& job) const {
    std::lock_guard lock(mutex_);
    auto it = jobs_.find(job);
    return it == jobs_.end() ? JobCounters{} : it->second;
}

Result<void> probe_writable_path(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return Error{"not a directory: " + dir.string(), ErrorCode::NotFound};
    }
    if (::access(dir.c_str(), W_OK) != 0) {
        return system_error("access " + dir.string(), errno);
    }
    return {};
}

// ─────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────

std::string to_json(const HealthSnapshot& snapshot) {
    std::ostringstream oss;
    oss << R"({"status":")" << to_string(snapshot.status) << "\""
        << R"(,"time":")" << format_timestamp(snapshot.checked_at) << "\"";
    if (snapshot.reason) {
        oss << R"(,"reason":")" << json_escape(*snapshot.reason) << "\"";
    }
    oss << R"(,"dependencies":{)";
    bool first = true;
    for (const auto& dep : snapshot.dependencies) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(dep.name) << R"(":{"status":")"
            << (dep.ok ? "ok" : "error") << "\""
            << R"(,"critical":)" << (dep.critical ? "true" : "false");
        if (!dep.ok) {
            oss << R"(,"detail":")" << json_escape(dep.detail) << "\"";
        }
        oss << '}';
    }
    oss << "}}";
    return oss.str();
}

std::string to_json(const MetricsSnapshot& snapshot) {
    std::ostringstream oss;
    oss << R"({"time":")" << format_timestamp(snapshot.captured_at) << "\""
        << R"(,"requests_total":)" << snapshot.requests_total
        << R"(,"errors_total":)" << snapshot.errors_total
        << R"(,"jobs":{)";
    bool first = true;
    for (const auto& [name, c] : snapshot.jobs) {
        if (!first) oss << ',';
        first = false;
        oss << '"' << json_escape(name) << R"(":{)"
            << R"("succeeded":)" << c.succeeded
            << R"(,"failed":)" << c.failed
            << R"(,"timed_out":)" << c.timed_out
            << R"(,"skipped":)" << c.skipped
            << R"(,"retries":)" << c.retries
            << R"(,"running":)" << c.running
            << R"(,"backlog":)" << c.backlog;
        if (c.last_outcome) {
            oss << R"(,"last_outcome":")" << to_string(*c.last_outcome) << "\""
                << R"(,"last_reason":")" << to_string(c.last_reason) << "\"";
        }
        if (c.last_finished) {
            oss << R"(,"last_finished":")" << format_timestamp(*c.last_finished) << "\"";
        }
        oss << '}';
    }
    oss << "}}";
    return oss.str();
}

}  // namespace jobguard
