/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (virtual interface for runtime-configurable log
 * destinations) and a thread-safe Logger front-end emitting one NDJSON
 * line per event. The same sink interface backs the run history file.
 *
 * Forked worker children must never log: the logger mutex may be held by
 * another parent thread at fork time.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace jobguard {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug", "info", "warn"/"warning" or "error".
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// ISO 8601 UTC with milliseconds, e.g. "2024-05-01T12:00:00.250Z".
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (virtual, runtime-configurable)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for line-oriented output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Thread-safe logger front-end.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= this->level(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    mutable std::mutex mutex_;
};

}  // namespace jobguard
