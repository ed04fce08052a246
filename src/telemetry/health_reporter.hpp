/**
 * @file health_reporter.hpp
 * @brief Process-wide counters and liveness snapshots for monitoring.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace jobguard {

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,       ///< a non-critical dependency is failing
    Unhealthy       ///< a critical dependency is failing
};

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:   return "ok";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "error";
    }
    return "unknown";
}

/**
 * @brief A named dependency check, e.g. "the history directory is writable".
 */
struct DependencyProbe {
    std::string name;
    bool critical{true};
    std::function<Result<void>()> check;
};

struct DependencyStatus {
    std::string name;
    bool critical{true};
    bool ok{true};
    std::string detail;     ///< error message when !ok
};

struct HealthSnapshot {
    HealthStatus status{HealthStatus::Healthy};
    Timestamp checked_at;
    std::vector<DependencyStatus> dependencies;
    std::optional<std::string> reason;      ///< first failing dependency
};

struct JobCounters {
    uint64_t succeeded{0};
    uint64_t failed{0};
    uint64_t timed_out{0};
    uint64_t skipped{0};
    uint64_t retries{0};        ///< retries scheduled after a failed run
    uint32_t running{0};
    uint32_t backlog{0};        ///< admitted, waiting for a pool thread
    std::optional<RunOutcome> last_outcome;
    ReasonCode last_reason{ReasonCode::None};
    std::optional<Timestamp> last_finished;
};

struct MetricsSnapshot {
    Timestamp captured_at;
    uint64_t requests_total{0};
    uint64_t errors_total{0};
    std::map<JobName, JobCounters> jobs;
};

/**
 * @brief Aggregates counters; never originates business state.
 *
 * Created once at start-up and shared by reference for the life of the
 * daemon. Request counters are atomics; per-job counters share one lock.
 */
class HealthReporter {
public:
    HealthReporter() = default;

    HealthReporter(const HealthReporter&) = delete;
    HealthReporter& operator=(const HealthReporter&) = delete;

    /// Make @p job visible in metrics before its first run.
    void register_job(const JobName& job);

    void add_probe(DependencyProbe probe);

    template <DependencyProbeLike P>
    void add_probe(std::string name, bool critical, P probe) {
        add_probe(DependencyProbe{std::move(name), critical,
                                  [p = std::move(probe)]() mutable { return p(); }});
    }

    // ── Request layer ────────────────────────
    void record_request(bool error = false) noexcept;

    // ── Job Runner ───────────────────────────
    void record_queued(const JobName& job);
    void record_started(const JobName& job);
    void record_outcome(const RunRecord& record);
    void record_retry(const JobName& job);

    // ── Snapshots ────────────────────────────
    /// Run every probe and derive the overall status.
    [[nodiscard]] HealthSnapshot check() const;
    [[nodiscard]] MetricsSnapshot metrics() const;
    [[nodiscard]] JobCounters job(const JobName& job) const;

    [[nodiscard]] uint64_t requests_total() const noexcept { return requests_total_.load(); }
    [[nodiscard]] uint64_t errors_total() const noexcept { return errors_total_.load(); }

private:
    std::atomic<uint64_t> requests_total_{0};
    std::atomic<uint64_t> errors_total_{0};

    mutable std::mutex mutex_;
    std::map<JobName, JobCounters> jobs_;
    std::vector<DependencyProbe> probes_;
};

/// Probe that succeeds when @p dir exists and is writable.
[[nodiscard]] Result<void> probe_writable_path(const std::filesystem::path& dir);

[[nodiscard]] std::string to_json(const HealthSnapshot& snapshot);
[[nodiscard]] std::string to_json(const MetricsSnapshot& snapshot);

}  // namespace jobguard
