/**
 * @file resource_limiter.cpp
 * @brief ResourceLimiter implementation on top of getrlimit/setrlimit.
 */

#include "limits/resource_limiter.hpp"

#include <cerrno>
#include <limits>
#include <string>

namespace jobguard {

namespace {

constexpr rlim_t kBytesPerMb = 1024 * 1024;

/// Clamp @p wanted to the inherited hard limit; children cannot raise it.
rlim_t clamp_to_hard(int resource, rlim_t wanted, bool& clamped) {
    clamped = false;
    rlimit current{};
    if (::getrlimit(resource, &current) != 0) return wanted;
    if (current.rlim_max != RLIM_INFINITY && wanted > current.rlim_max) {
        clamped = true;
        return current.rlim_max;
    }
    return wanted;
}

}  // anonymous namespace

LimitPlan ResourceLimiter::plan(const ResourcePolicy& policy,
                                const JobName& job,
                                Logger& logger) {
    LimitPlan plan;
    if (!policy.has_address_space_limit() && !policy.has_cpu_limit()) {
        return plan;
    }

    if constexpr (!platform_supported()) {
        logger.info("Job " + job + ": resource limits not supported on this platform, "
                    "relying on timeout only");
        return plan;
    }

#if defined(RLIMIT_AS) && defined(RLIMIT_CPU)
    if (policy.has_address_space_limit()) {
        if (policy.address_space_mb > std::numeric_limits<rlim_t>::max() / kBytesPerMb) {
            logger.warn("Job " + job + ": address space ceiling "
                        + std::to_string(policy.address_space_mb) + " MB out of range, leaving unbounded");
        } else {
            bool clamped = false;
            plan.address_space_bytes = clamp_to_hard(
                RLIMIT_AS, static_cast<rlim_t>(policy.address_space_mb) * kBytesPerMb, clamped);
            plan.limit_address_space = true;
            if (clamped) {
                logger.info("Job " + job + ": address space ceiling clamped to inherited hard limit ("
                            + std::to_string(plan.address_space_bytes / kBytesPerMb) + " MB)");
            }
        }
    }

    if (policy.has_cpu_limit()) {
        bool clamped = false;
        auto soft = static_cast<rlim_t>(policy.cpu_seconds);
        // One extra second between SIGXCPU and SIGKILL.
        auto hard = clamp_to_hard(RLIMIT_CPU, soft + 1, clamped);
        if (soft > hard) soft = hard;
        plan.limit_cpu = true;
        plan.cpu_soft_seconds = soft;
        plan.cpu_hard_seconds = hard;
        if (clamped) {
            logger.info("Job " + job + ": CPU ceiling clamped to inherited hard limit ("
                        + std::to_string(hard) + " s)");
        }
    }

    logger.debug("Job " + job + ": limits AS="
                 + (plan.limit_address_space ? std::to_string(plan.address_space_bytes / kBytesPerMb) + "MB"
                                             : std::string{"unbounded"})
                 + " CPU="
                 + (plan.limit_cpu ? std::to_string(plan.cpu_soft_seconds) + "s"
                                   : std::string{"unbounded"}));
#endif

    return plan;
}

LimitFailure ResourceLimiter::apply(const LimitPlan& plan) noexcept {
#if defined(RLIMIT_AS) && defined(RLIMIT_CPU)
    if (plan.limit_address_space) {
        rlimit lim{plan.address_space_bytes, plan.address_space_bytes};
        if (::setrlimit(RLIMIT_AS, &lim) != 0) {
            return LimitFailure{LimitResource::AddressSpace, errno};
        }
    }

    if (plan.limit_cpu) {
        rlimit lim{plan.cpu_soft_seconds, plan.cpu_hard_seconds};
        if (::setrlimit(RLIMIT_CPU, &lim) != 0) {
            return LimitFailure{LimitResource::Cpu, errno};
        }
    }
#else
    (void)plan;
#endif
    return LimitFailure{};
}

}  // namespace jobguard
