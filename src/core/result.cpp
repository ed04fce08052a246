/**
 * @file result.cpp
 * @brief Helpers for building Error values from system call failures.
 */

#include "core/result.hpp"

#include <system_error>

namespace jobguard {

Error system_error(std::string_view what, int err) {
    std::string message{what};
    message += ": ";
    message += std::error_code(err, std::generic_category()).message();
    return Error{std::move(message), ErrorCode::System};
}

}  // namespace jobguard
