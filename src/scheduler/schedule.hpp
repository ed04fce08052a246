/**
 * @file schedule.hpp
 * @brief Trigger schedules: fixed intervals and crontab-style expressions.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <bitset>
#include <string>
#include <string_view>

namespace jobguard {

/**
 * @brief When a job becomes due.
 *
 * Accepted forms:
 *   "@every 90s", "@every 5m", "@every 250ms", "@every 2h" (bare number = seconds)
 *   "@hourly", "@daily", "@midnight", "@weekly", "@monthly", "@yearly", "@annually"
 *   "m h dom mon dow"  crontab(5) fields with '*', lists, ranges, steps,
 *                         and three-letter month/day names
 *
 * Crontab schedules are evaluated in UTC. If both day-of-month and
 * day-of-week are restricted, a day matching either one qualifies.
 * Intervals longer than 100 years and expressions that can never match
 * are rejected by parse().
 */
class Schedule {
public:
    [[nodiscard]] static Result<Schedule> parse(std::string_view expression);

    /// Convenience for tests and programmatic jobs.
    [[nodiscard]] static Schedule every(Duration interval);

    /**
     * @brief First due time strictly after @p after.
     *
     * Throws std::runtime_error if no crontab match exists within eight
     * years of @p after.
     */
    [[nodiscard]] Timestamp next_after(Timestamp after) const;

    [[nodiscard]] bool is_interval() const noexcept { return interval_.count() > 0; }
    [[nodiscard]] Duration interval() const noexcept { return interval_; }
    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

private:
    Schedule() = default;

    [[nodiscard]] bool day_matches(int mday, int wday) const noexcept;

    std::string expression_;
    Duration interval_{0};

    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_of_month_;     ///< index 1..31
    std::bitset<13> months_;            ///< index 1..12
    std::bitset<7> days_of_week_;       ///< 0 = Sunday
    bool dom_restricted_{false};
    bool dow_restricted_{false};
};

}  // namespace jobguard
