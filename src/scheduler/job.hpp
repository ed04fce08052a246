/**
 * @file job.hpp
 * @brief JobDefinition: what to run, when, and under which ceilings.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/schedule.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jobguard {

/**
 * @brief An external program executed in the worker with execvp().
 */
struct CommandSpec {
    std::vector<std::string> argv;          ///< argv[0] is looked up in PATH
    std::vector<std::string> extra_env;     ///< "KEY=VALUE" entries added to the environment
    std::string working_dir;                ///< empty = inherit
};

/// In-process job logic, invoked inside the forked worker.
using JobCallable = std::function<bool()>;

using JobLogic = std::variant<CommandSpec, JobCallable>;

/**
 * @brief Immutable description of a scheduled job.
 *
 * Shared between the scheduler loop and in-flight runs as
 * std::shared_ptr<const JobDefinition>.
 */
struct JobDefinition {
    JobName name;
    Schedule schedule;
    JobLogic logic;
    ResourcePolicy policy;
    bool run_on_start{false};
    RetryPolicy retry;                      ///< re-dispatch of failed/timed-out runs
};

using JobDefinitionPtr = std::shared_ptr<const JobDefinition>;

/// Wrap any RunnableLike into job logic.
template <RunnableLike F>
JobLogic make_callable_logic(F&& func) {
    return JobCallable{[f = std::forward<F>(func)]() mutable -> bool { return static_cast<bool>(f()); }};
}

/**
 * @brief Build a JobDefinition from a [[jobs]] entry.
 *
 * Limits are normalized on top of @p defaults; normalization messages are
 * appended to @p warnings. Fails only for entries that cannot run at all:
 * no name, no command, or an unparseable schedule.
 */
[[nodiscard]] Result<JobDefinition> make_job_definition(const JobConfig& config,
                                                        const ResourcePolicy& defaults,
                                                        std::vector<std::string>& warnings);

}  // namespace jobguard
