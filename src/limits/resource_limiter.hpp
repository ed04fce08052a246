/**
 * @file resource_limiter.hpp
 * @brief Address-space and CPU-time ceilings for worker processes.
 *
 * Split in two halves: plan() runs in the parent, where logging is safe,
 * and decides which ceilings apply; apply() runs in the forked child
 * between fork() and exec and only calls setrlimit().
 *
 * Resource limiting is best-effort. On platforms without RLIMIT_AS or
 * RLIMIT_CPU the plan is empty and runs are protected by the timeout
 * supervisor alone.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <cstdint>

#include <sys/resource.h>

namespace jobguard {

/**
 * @brief Which ceilings to set in the child, already clamped to the
 *        inherited hard limits.
 */
struct LimitPlan {
    bool limit_address_space{false};
    rlim_t address_space_bytes{0};

    bool limit_cpu{false};
    rlim_t cpu_soft_seconds{0};     ///< SIGXCPU at this point
    rlim_t cpu_hard_seconds{0};     ///< SIGKILL at this point

    [[nodiscard]] bool empty() const noexcept { return !limit_address_space && !limit_cpu; }
};

enum class LimitResource : uint8_t {
    None,
    AddressSpace,
    Cpu
};

/// First setrlimit() failure in the child, if any.
struct LimitFailure {
    LimitResource resource{LimitResource::None};
    int error{0};

    [[nodiscard]] bool failed() const noexcept { return resource != LimitResource::None; }
};

class ResourceLimiter {
public:
    /// Whether this build exposes both RLIMIT_AS and RLIMIT_CPU.
    [[nodiscard]] static constexpr bool platform_supported() noexcept {
#if defined(RLIMIT_AS) && defined(RLIMIT_CPU)
        return true;
#else
        return false;
#endif
    }

    /**
     * @brief Decide which ceilings to apply for @p policy (parent side).
     *
     * Logs at info level when the platform lacks the primitives or when a
     * ceiling has to be clamped to the inherited hard limit.
     */
    [[nodiscard]] static LimitPlan plan(const ResourcePolicy& policy,
                                        const JobName& job,
                                        Logger& logger);

    /**
     * @brief Apply @p plan to the calling process (child side).
     *
     * Async-signal-safe: safe to call between fork() and exec.
     */
    static LimitFailure apply(const LimitPlan& plan) noexcept;
};

[[nodiscard]] constexpr const char* to_string(LimitResource resource) noexcept {
    switch (resource) {
        case LimitResource::None:         return "none";
        case LimitResource::AddressSpace: return "RLIMIT_AS";
        case LimitResource::Cpu:          return "RLIMIT_CPU";
    }
    return "unknown";
}

}  // namespace jobguard
