/**
 * @file resource_policy.hpp
 * @brief Normalization of raw limit values into a ResourcePolicy.
 *
 * Raw values arrive as text (environment variables, TOML scalars rendered
 * to text). Anything malformed falls back to "unbounded" (or concurrency 1)
 * and produces a warning; nothing here can stop a job from running.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jobguard {

/**
 * @brief Unvalidated limit settings. An empty optional means "inherit".
 */
struct RawResourcePolicy {
    std::optional<std::string> timeout_seconds;
    std::optional<std::string> address_space_mb;
    std::optional<std::string> cpu_seconds;
    std::optional<std::string> concurrency;
};

/// Highest accepted concurrency limit; larger values are clamped.
inline constexpr uint32_t kMaxConcurrency = 1024;

struct NormalizedPolicy {
    ResourcePolicy policy;
    std::vector<std::string> warnings;
};

/**
 * @brief Overlay @p raw on top of @p base.
 *
 * Unset fields keep the value from @p base. A set but empty field resets
 * the ceiling to unbounded (concurrency to 1).
 *
 * @param context prefix used in warning messages, e.g. "JOB_TIMEOUT".
 */
[[nodiscard]] NormalizedPolicy normalize_policy(const RawResourcePolicy& raw,
                                                const ResourcePolicy& base = {},
                                                std::string_view context = "limits");

/**
 * @brief Unvalidated [jobs.retry] settings. An empty optional means default.
 */
struct RawRetryPolicy {
    std::optional<std::string> max_retries;
    std::optional<std::string> delay_seconds;
    std::optional<std::string> backoff;
};

struct NormalizedRetry {
    RetryPolicy policy;
    std::vector<std::string> warnings;
};

/**
 * @brief Validate retry settings; malformed fields keep their defaults.
 *
 * max_retries is capped at kMaxRetries, backoff must be a finite number
 * in (0, 100].
 */
[[nodiscard]] NormalizedRetry normalize_retry(const RawRetryPolicy& raw,
                                              std::string_view context = "retry");

inline constexpr uint32_t kMaxRetries = 100;

/// Parse a non-negative duration in (possibly fractional) seconds.
[[nodiscard]] std::optional<Duration> parse_seconds(std::string_view text) noexcept;

/// Parse a non-negative integer.
[[nodiscard]] std::optional<uint64_t> parse_unsigned(std::string_view text) noexcept;

}  // namespace jobguard
