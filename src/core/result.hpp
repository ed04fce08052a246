/**
 * @file result.hpp
 * @brief Value-or-error type used for fallible set-up operations.
 *
 * Config loading, schedule parsing, process spawning and dependency probes
 * all report failure through Result<T, E>. Exceptions stay confined to the
 * job-logic boundary inside the worker process.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace jobguard {

/**
 * @brief Coarse error category, usable in reason codes and tests.
 */
enum class ErrorCode : uint8_t {
    Generic,
    Config,         ///< Invalid or missing configuration
    Parse,          ///< Malformed input text (schedule, number)
    System,         ///< A system call failed; message carries strerror
    NotFound,       ///< Unknown job or missing file
    State           ///< Operation invalid in the current state
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Generic:  return "generic";
        case ErrorCode::Config:   return "config";
        case ErrorCode::Parse:    return "parse";
        case ErrorCode::System:   return "system";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::State:    return "state";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a category and a descriptive message.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::Generic};

    explicit Error(std::string msg, ErrorCode c = ErrorCode::Generic)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E> holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error_text());
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::string error_text() const {
        if constexpr (std::is_same_v<E, Error>) {
            return std::get<E>(storage_).message;
        } else {
            return "<error>";
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no return value on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message, ErrorCode code = ErrorCode::Generic) {
    return Result<T, E>(E{std::move(message), code});
}

/// Build a System error from errno.
Error system_error(std::string_view what, int err);

}  // namespace jobguard
