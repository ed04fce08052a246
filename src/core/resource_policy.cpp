/**
 * @file resource_policy.cpp
 * @brief ResourcePolicy normalization.
 */

#include "core/resource_policy.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace jobguard {

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

/// Largest timeout we accept: anything beyond a year is a typo.
constexpr double kMaxTimeoutSeconds = 366.0 * 24 * 3600;

}  // anonymous namespace

std::optional<Duration> parse_seconds(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) return std::nullopt;

    double seconds = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (!std::isfinite(seconds) || seconds < 0.0 || seconds > kMaxTimeoutSeconds) {
        return std::nullopt;
    }

    auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    // A positive sub-millisecond value still means "enabled".
    if (ms == 0 && seconds > 0.0) ms = 1;
    return Duration{ms};
}

std::optional<uint64_t> parse_unsigned(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty() || text.front() == '-') return std::nullopt;
    if (text.front() == '+') text.remove_prefix(1);

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

NormalizedPolicy normalize_policy(const RawResourcePolicy& raw,
                                  const ResourcePolicy& base,
                                  std::string_view context) {
    NormalizedPolicy out{base, {}};
    auto& policy = out.policy;

    auto warn = [&](std::string_view field, const std::string& value, std::string_view fallback) {
        out.warnings.push_back(std::string{context} + "." + std::string{field}
                               + ": malformed value '" + value + "', using " + std::string{fallback});
    };

    if (raw.timeout_seconds) {
        if (trim(*raw.timeout_seconds).empty()) {
            policy.timeout = Duration{0};
        } else if (auto t = parse_seconds(*raw.timeout_seconds)) {
            policy.timeout = *t;
        } else {
            policy.timeout = Duration{0};
            warn("timeout_seconds", *raw.timeout_seconds, "no timeout");
        }
    }

    auto apply_ceiling = [&](const std::optional<std::string>& value, uint64_t& target,
                             std::string_view field) {
        if (!value) return;
        if (trim(*value).empty()) {
            target = 0;
        } else if (auto v = parse_unsigned(*value)) {
            target = *v;
        } else {
            target = 0;
            warn(field, *value, "unbounded");
        }
    };
    apply_ceiling(raw.address_space_mb, policy.address_space_mb, "address_space_mb");
    apply_ceiling(raw.cpu_seconds, policy.cpu_seconds, "cpu_seconds");

    if (raw.concurrency) {
        if (trim(*raw.concurrency).empty()) {
            policy.concurrency = 1;
        } else {
            auto v = parse_unsigned(*raw.concurrency);
            if (v && *v > kMaxConcurrency) {
                policy.concurrency = kMaxConcurrency;
                out.warnings.push_back(std::string{context} + ".concurrency: " + *raw.concurrency
                                       + " exceeds the maximum, using "
                                       + std::to_string(kMaxConcurrency));
            } else if (v && *v >= 1) {
                policy.concurrency = static_cast<uint32_t>(*v);
            } else {
                policy.concurrency = 1;
                warn("concurrency", *raw.concurrency, "1");
            }
        }
    }

    return out;
}

NormalizedRetry normalize_retry(const RawRetryPolicy& raw, std::string_view context) {
    NormalizedRetry out;
    auto& policy = out.policy;

    auto warn = [&](std::string_view field, const std::string& value, const std::string& fallback) {
        out.warnings.push_back(std::string{context} + "." + std::string{field}
                               + ": malformed value '" + value + "', using " + fallback);
    };

    if (raw.max_retries && !trim(*raw.max_retries).empty()) {
        auto v = parse_unsigned(*raw.max_retries);
        if (v && *v <= kMaxRetries) {
            policy.max_retries = static_cast<uint32_t>(*v);
        } else {
            warn("max_retries", *raw.max_retries, "0");
        }
    }

    if (raw.delay_seconds && !trim(*raw.delay_seconds).empty()) {
        auto d = parse_seconds(*raw.delay_seconds);
        if (d && *d <= RetryPolicy::kMaxDelay) {
            policy.delay = *d;
        } else {
            warn("delay_seconds", *raw.delay_seconds,
                 std::to_string(policy.delay.count() / 1000) + "s");
        }
    }

    if (raw.backoff && !trim(*raw.backoff).empty()) {
        auto text = trim(*raw.backoff);
        double factor = 0.0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), factor);
        if (ec == std::errc{} && ptr == text.data() + text.size() && std::isfinite(factor)
            && factor > 0.0 && factor <= 100.0) {
            policy.backoff = factor;
        } else {
            warn("backoff", *raw.backoff, "2");
        }
    }

    return out;
}

}  // namespace jobguard
