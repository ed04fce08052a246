/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for jobguard collaborator contracts.
 *
 * Job logic and dependency probes are narrow capabilities rather than
 * class hierarchies: anything callable with the right signature qualifies,
 * and is type-erased into a std::function at registration.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <type_traits>

namespace jobguard {

// ─────────────────────────────────────────────
// RunnableLike
// ─────────────────────────────────────────────

/**
 * @concept RunnableLike
 * @brief A unit of in-process job logic.
 *
 * Invoked once inside the forked worker; returns true on success.
 * Throwing is allowed and is reported as a failed run.
 */
template <typename T>
concept RunnableLike = std::invocable<T&>
    && std::convertible_to<std::invoke_result_t<T&>, bool>;

// ─────────────────────────────────────────────
// DependencyProbeLike
// ─────────────────────────────────────────────

/**
 * @concept DependencyProbeLike
 * @brief A liveness check for an external dependency (e.g. the
 *        persistence directory). Success means reachable.
 */
template <typename T>
concept DependencyProbeLike = requires(T probe) {
    { probe() } -> std::same_as<Result<void>>;
};

}  // namespace jobguard
