/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <cstdlib>

#include <toml++/toml.hpp>

namespace jobguard {

namespace {

/**
 * @brief Render a scalar TOML value as text for the normalizer.
 *
 * Non-scalar values come back as a placeholder so that the normalizer
 * reports them as malformed instead of silently ignoring them.
 */
template <typename View>
std::optional<std::string> raw_text(View node) {
    if (!node) return std::nullopt;
    if (auto s = node.template value_exact<std::string>()) return *s;
    if (auto i = node.template value_exact<int64_t>()) return std::to_string(*i);
    if (auto d = node.template value_exact<double>()) return std::to_string(*d);
    if (auto b = node.template value_exact<bool>()) return std::string{*b ? "true" : "false"};
    return std::string{"<non-scalar>"};
}

template <typename View>
RawResourcePolicy read_raw_limits(View limits) {
    RawResourcePolicy raw;
    if (!limits.is_table()) return raw;
    raw.timeout_seconds = raw_text(limits["timeout_seconds"]);
    raw.address_space_mb = raw_text(limits["address_space_mb"]);
    raw.cpu_seconds = raw_text(limits["cpu_seconds"]);
    raw.concurrency = raw_text(limits["concurrency"]);
    return raw;
}

template <typename View>
RawRetryPolicy read_raw_retry(View retry) {
    RawRetryPolicy raw;
    if (!retry.is_table()) return raw;
    raw.max_retries = raw_text(retry["max_retries"]);
    raw.delay_seconds = raw_text(retry["delay_seconds"]);
    raw.backoff = raw_text(retry["backoff"]);
    return raw;
}

/**
 * @brief Read an integer setting that must lie in [min, max].
 *
 * Missing keys keep @p fallback silently; anything else outside the range
 * keeps it with a warning.
 */
template <typename View>
uint32_t read_bounded(View table, std::string_view section, const char* key, uint32_t fallback,
                      uint32_t min, uint32_t max, std::vector<std::string>& warnings) {
    auto node = table[key];
    if (!node) return fallback;

    auto value = node.template value_exact<int64_t>();
    if (value && *value >= int64_t{min} && *value <= int64_t{max}) {
        return static_cast<uint32_t>(*value);
    }
    auto shown = value ? std::to_string(*value) : raw_text(node).value_or("");
    warnings.push_back(std::string{section} + "." + key + ": value '" + shown + "' outside ["
                       + std::to_string(min) + ", " + std::to_string(max) + "], using "
                       + std::to_string(fallback));
    return fallback;
}

template <typename View>
std::vector<std::string> read_string_array(View node) {
    std::vector<std::string> out;
    if (auto* arr = node.as_array()) {
        for (const auto& el : *arr) {
            if (auto s = el.template value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

template <typename View>
std::vector<std::filesystem::path> read_path_array(View node) {
    std::vector<std::filesystem::path> out;
    for (auto& s : read_string_array(node)) out.emplace_back(std::move(s));
    return out;
}

void append_warnings(Config& config, std::vector<std::string> warnings) {
    for (auto& w : warnings) config.warnings.push_back(std::move(w));
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::NotFound};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& sc = config.scheduler;
            sc.tick_interval_ms = read_bounded(scheduler, "scheduler", "tick_interval_ms",
                                               sc.tick_interval_ms, 1, 60'000, config.warnings);
            sc.kill_grace_ms = read_bounded(scheduler, "scheduler", "kill_grace_ms",
                                            sc.kill_grace_ms, 0, 600'000, config.warnings);
            sc.worker_threads = read_bounded(scheduler, "scheduler", "worker_threads",
                                             sc.worker_threads, 0, kMaxWorkerThreads, config.warnings);
            sc.status_interval_s = read_bounded(scheduler, "scheduler", "status_interval_s",
                                                sc.status_interval_s, 0, 86'400, config.warnings);
        }

        // [limits]
        if (auto limits = tbl["limits"]; limits.is_table()) {
            auto normalized = normalize_policy(read_raw_limits(limits), ResourcePolicy{}, "limits");
            config.limits = normalized.policy;
            append_warnings(config, std::move(normalized.warnings));
        }

        // [history]
        if (auto history = tbl["history"]; history.is_table()) {
            auto& hc = config.history;
            hc.retention_count = read_bounded(history, "history", "retention_count",
                                              hc.retention_count, 0, 10'000'000, config.warnings);
            hc.retention_hours = read_bounded(history, "history", "retention_hours",
                                              hc.retention_hours, 0, 24 * 366 * 100, config.warnings);
            hc.path = history["path"].value_or(std::string{});
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            config.health.critical_paths = read_path_array(health["critical_paths"]);
            config.health.optional_paths = read_path_array(health["optional_paths"]);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.max_file_size_mb = read_bounded(
                telemetry, "telemetry", "max_file_size_mb", config.telemetry.max_file_size_mb,
                1, 64 * 1024, config.warnings);
            config.telemetry.rotate_count = read_bounded(
                telemetry, "telemetry", "rotate_count", config.telemetry.rotate_count,
                1, 1000, config.warnings);
        }

        // [[jobs]]
        if (auto* jobs = tbl["jobs"].as_array()) {
            size_t index = 0;
            for (auto& node : *jobs) {
                ++index;
                auto* job_tbl = node.as_table();
                if (job_tbl == nullptr) {
                    config.warnings.push_back("jobs[" + std::to_string(index) + "]: not a table, skipped");
                    continue;
                }
                toml::node_view<toml::node> job{job_tbl};

                JobConfig jc;
                jc.name = job["name"].value_or(std::string{});
                jc.schedule = job["schedule"].value_or(std::string{});
                if (auto cmd = job["command"].value<std::string>()) {
                    jc.command = {"/bin/sh", "-c", *cmd};
                } else {
                    jc.command = read_string_array(job["command"]);
                }
                jc.env = read_string_array(job["env"]);
                jc.working_dir = job["working_dir"].value_or(std::string{});
                jc.run_on_start = job["run_on_start"].value_or(false);
                jc.limits = read_raw_limits(job["limits"]);
                jc.retry = read_raw_retry(job["retry"]);

                config.jobs.push_back(std::move(jc));
            }
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Config};
    }
}

Config default_config() {
    return Config{};
}

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string{value};
}

void apply_environment(Config& config, const EnvLookup& env) {
    // An empty variable counts as unset.
    auto lookup = [&env](const char* name) -> std::optional<std::string> {
        auto value = env(name);
        if (value && value->empty()) return std::nullopt;
        return value;
    };

    RawResourcePolicy raw;
    raw.timeout_seconds = lookup("JOB_TIMEOUT");
    raw.address_space_mb = lookup("JOB_RLIMIT_AS_MB");
    raw.cpu_seconds = lookup("JOB_RLIMIT_CPU_SECONDS");
    raw.concurrency = lookup("RUN_JOB_CONCURRENCY");

    auto normalized = normalize_policy(raw, config.limits, "environment");
    config.limits = normalized.policy;
    append_warnings(config, std::move(normalized.warnings));
}

}  // namespace jobguard
