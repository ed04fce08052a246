/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include "core/resource_policy.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jobguard {

/// Upper bound on worker pool threads, whatever the configured concurrency.
inline constexpr uint32_t kMaxWorkerThreads = 256;

struct SchedulerConfig {
    uint32_t tick_interval_ms = 1000;
    uint32_t kill_grace_ms = 2000;      ///< SIGTERM → SIGKILL escalation window
    uint32_t worker_threads = 0;        ///< 0 = sum of job concurrency limits, capped at kMaxWorkerThreads
    uint32_t status_interval_s = 30;
};

struct HistoryConfig {
    uint32_t retention_count = 500;
    uint32_t retention_hours = 720;
    std::filesystem::path path;         ///< empty = in-memory only
};

struct HealthConfig {
    std::vector<std::filesystem::path> critical_paths;     ///< unwritable → unhealthy
    std::vector<std::filesystem::path> optional_paths;     ///< unwritable → degraded
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< empty = stdout
    std::string log_level = "info";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief One [[jobs]] entry as written in the file.
 *
 * Limits stay raw so that environment overrides of the process-wide
 * defaults still reach jobs that do not override a field themselves.
 */
struct JobConfig {
    std::string name;
    std::string schedule;
    std::vector<std::string> command;
    std::vector<std::string> env;
    std::string working_dir;
    bool run_on_start = false;
    RawResourcePolicy limits;
    RawRetryPolicy retry;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    ResourcePolicy limits;              ///< process-wide defaults, already normalized
    HistoryConfig history;
    HealthConfig health;
    TelemetryConfig telemetry;
    std::vector<JobConfig> jobs;

    /// Normalization messages, logged by the daemon once logging is up.
    std::vector<std::string> warnings;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Out-of-range numeric settings fall back to their defaults and add an
 * entry to Config::warnings.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration (no jobs).
 */
Config default_config();

/// Returns the value of an environment variable, or nullopt if unset.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// EnvLookup backed by the process environment.
std::optional<std::string> process_env(const char* name);

/**
 * @brief Apply the deployment's environment overrides to the [limits] defaults.
 *
 * Recognized: JOB_TIMEOUT, JOB_RLIMIT_AS_MB, JOB_RLIMIT_CPU_SECONDS,
 * RUN_JOB_CONCURRENCY. Malformed values are normalized and reported
 * through Config::warnings.
 */
void apply_environment(Config& config, const EnvLookup& env = process_env);

}  // namespace jobguard
