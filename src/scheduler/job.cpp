/**
 * @file job.cpp
 * @brief JobDefinition construction from configuration.
 */

#include "scheduler/job.hpp"

namespace jobguard {

Result<JobDefinition> make_job_definition(const JobConfig& config,
                                          const ResourcePolicy& defaults,
                                          std::vector<std::string>& warnings) {
    if (config.name.empty()) {
        return Error{"job entry without a name", ErrorCode::Config};
    }
    if (config.command.empty()) {
        return Error{"job '" + config.name + "': command is empty", ErrorCode::Config};
    }

    auto schedule = Schedule::parse(config.schedule);
    if (!schedule) {
        return Error{"job '" + config.name + "': " + schedule.error().message, ErrorCode::Config};
    }

    auto normalized = normalize_policy(config.limits, defaults, "jobs." + config.name + ".limits");
    for (auto& w : normalized.warnings) warnings.push_back(std::move(w));

    auto retry = normalize_retry(config.retry, "jobs." + config.name + ".retry");
    for (auto& w : retry.warnings) warnings.push_back(std::move(w));

    return JobDefinition{
        .name = config.name,
        .schedule = std::move(schedule).value(),
        .logic = CommandSpec{
            .argv = config.command,
            .extra_env = config.env,
            .working_dir = config.working_dir,
        },
        .policy = normalized.policy,
        .run_on_start = config.run_on_start,
        .retry = retry.policy,
    };
}

}  // namespace jobguard
