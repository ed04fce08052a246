/**
 * @file schedule.cpp
 * @brief Schedule parsing and next-run computation.
 */

#include "scheduler/schedule.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace jobguard {

namespace {

struct CronSymbol {
    std::string_view name;
    unsigned value;
};

constexpr std::array<CronSymbol, 12> kMonthNames{{
    {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
    {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12},
}};

constexpr std::array<CronSymbol, 7> kDayNames{{
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3}, {"thu", 4}, {"fri", 5}, {"sat", 6},
}};

struct SpecialSchedule {
    std::string_view special;
    std::string_view regular;
};

constexpr std::array<SpecialSchedule, 7> kSpecialSchedules{{
    {"@yearly",   "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly",  "0 0 1 * *"},
    {"@weekly",   "0 0 * * 0"},
    {"@daily",    "0 0 * * *"},
    {"@midnight", "0 0 * * *"},
    {"@hourly",   "0 * * * *"},
}};

/// Five years of search is enough for any satisfiable expression.
// Longest gap between two matches of a satisfiable expression is the
// 8-year leap-day gap across a skipped century leap year (2096 to 2104).
constexpr int kSearchHorizonYears = 8;

// Longest accepted "@every" interval; keeps next_after() clear of overflow.
constexpr uint64_t kMaxIntervalMs = uint64_t{100} * 366 * 24 * 3600 * 1000;

std::string lower(std::string_view s) {
    std::string out{s};
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

template <size_t N>
std::optional<unsigned> lookup_symbol(std::string_view token,
                                      const std::array<CronSymbol, N>* symbols) {
    if (symbols == nullptr) return std::nullopt;
    auto name = lower(token);
    for (const auto& sym : *symbols) {
        if (sym.name == name) return sym.value;
    }
    return std::nullopt;
}

template <size_t N>
std::optional<unsigned> parse_value(std::string_view token, unsigned min, unsigned max,
                                    const std::array<CronSymbol, N>* symbols) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        auto sym = lookup_symbol(token, symbols);
        if (!sym) return std::nullopt;
        value = *sym;
    }
    if (value < min || value > max) return std::nullopt;
    return value;
}

/**
 * @brief Parse one crontab field into a bitset.
 * @return the error text, empty on success.
 */
template <size_t Bits, size_t N = 1>
std::string parse_field(std::string_view field, unsigned min, unsigned max,
                        std::bitset<Bits>& out,
                        const std::array<CronSymbol, N>* symbols = nullptr) {
    while (!field.empty()) {
        auto comma = field.find(',');
        auto item = field.substr(0, comma);
        field = comma == std::string_view::npos ? std::string_view{} : field.substr(comma + 1);
        if (item.empty()) return "empty list item";

        unsigned step = 1;
        if (auto slash = item.find('/'); slash != std::string_view::npos) {
            auto s = parse_value<N>(item.substr(slash + 1), 1, max, nullptr);
            if (!s) return "invalid step '" + std::string{item.substr(slash + 1)} + "'";
            step = *s;
            item = item.substr(0, slash);
        }

        unsigned first = min;
        unsigned last = max;
        if (item != "*") {
            auto dash = item.find('-');
            auto f = parse_value(item.substr(0, dash), min, max, symbols);
            if (!f) return "invalid value '" + std::string{item.substr(0, dash)} + "'";
            first = last = *f;
            if (dash != std::string_view::npos) {
                auto l = parse_value(item.substr(dash + 1), min, max, symbols);
                if (!l) return "invalid value '" + std::string{item.substr(dash + 1)} + "'";
                if (*l < first) return "malformed range '" + std::string{item} + "'";
                last = *l;
            } else if (step > 1) {
                // "5/15" means "starting at 5, every 15"
                last = max;
            }
        }

        for (unsigned i = first; i <= last; i += step) {
            out.set(i);
        }
    }
    return {};
}

std::optional<Duration> parse_interval(std::string_view text) {
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

    uint64_t amount = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), amount);
    if (ec != std::errc{} || amount == 0) return std::nullopt;

    std::string_view unit{ptr, static_cast<size_t>(text.data() + text.size() - ptr)};
    uint64_t unit_ms = 0;
    if (unit.empty() || unit == "s") unit_ms = 1000;
    else if (unit == "ms") unit_ms = 1;
    else if (unit == "m") unit_ms = 60 * 1000;
    else if (unit == "h") unit_ms = 3600 * 1000;
    else return std::nullopt;

    if (amount > kMaxIntervalMs / unit_ms) return std::nullopt;
    return Duration(static_cast<Duration::rep>(amount * unit_ms));
}

Timestamp from_utc_tm(std::tm& tm) {
    return std::chrono::system_clock::from_time_t(::timegm(&tm));
}

/// Re-normalize a tm after a field was bumped past its range.
void normalize(std::tm& tm) {
    std::time_t t = ::timegm(&tm);
    ::gmtime_r(&t, &tm);
}

}  // anonymous namespace

Result<Schedule> Schedule::parse(std::string_view expression) {
    Schedule schedule;
    schedule.expression_ = std::string{expression};

    std::string expr{expression};
    if (expression.starts_with("@every")) {
        auto interval = parse_interval(expression.substr(6));
        if (!interval) {
            return Error{"Invalid interval in schedule '" + std::string{expression} + "'", ErrorCode::Parse};
        }
        schedule.interval_ = *interval;
        return schedule;
    }
    if (expression.starts_with("@")) {
        bool found = false;
        for (const auto& special : kSpecialSchedules) {
            if (special.special == expression) {
                expr = std::string{special.regular};
                found = true;
                break;
            }
        }
        if (!found) {
            return Error{"Unknown schedule '" + std::string{expression} + "'", ErrorCode::Parse};
        }
    }

    std::istringstream iss(expr);
    std::vector<std::string> fields;
    for (std::string f; iss >> f;) fields.push_back(f);
    if (fields.size() != 5) {
        return Error{"Schedule '" + std::string{expression} + "' must have 5 fields", ErrorCode::Parse};
    }

    std::bitset<8> dow;
    std::array<std::string, 5> errors{
        parse_field(fields[0], 0, 59, schedule.minutes_),
        parse_field(fields[1], 0, 23, schedule.hours_),
        parse_field(fields[2], 1, 31, schedule.days_of_month_),
        parse_field(fields[3], 1, 12, schedule.months_, &kMonthNames),
        parse_field(fields[4], 0, 7, dow, &kDayNames),
    };
    for (const auto& err : errors) {
        if (!err.empty()) {
            return Error{"Schedule '" + std::string{expression} + "': " + err, ErrorCode::Parse};
        }
    }

    // 7 is an alias for Sunday
    for (size_t i = 0; i < 7; ++i) schedule.days_of_week_[i] = dow[i];
    if (dow[7]) schedule.days_of_week_.set(0);

    schedule.dom_restricted_ = fields[2] != "*";
    schedule.dow_restricted_ = fields[4] != "*";

    // Reject day/month combinations that never occur ("0 0 30 2 *").
    try {
        static_cast<void>(schedule.next_after(std::chrono::system_clock::now()));
    } catch (const std::runtime_error& e) {
        return Error{e.what(), ErrorCode::Parse};
    }
    return schedule;
}

Schedule Schedule::every(Duration interval) {
    Schedule schedule;
    schedule.interval_ = std::clamp(interval, Duration{1},
                                    Duration{static_cast<Duration::rep>(kMaxIntervalMs)});
    schedule.expression_ = "@every " + std::to_string(schedule.interval_.count()) + "ms";
    return schedule;
}

bool Schedule::day_matches(int mday, int wday) const noexcept {
    bool dom = days_of_month_[static_cast<size_t>(mday)];
    bool dow = days_of_week_[static_cast<size_t>(wday)];
    if (dom_restricted_ && dow_restricted_) return dom || dow;
    if (dom_restricted_) return dom;
    if (dow_restricted_) return dow;
    return true;
}

Timestamp Schedule::next_after(Timestamp after) const {
    if (is_interval()) {
        return after + interval_;
    }

    // Start at the next whole minute.
    auto t = std::chrono::system_clock::to_time_t(after);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    tm.tm_sec = 0;
    tm.tm_min += 1;
    normalize(tm);

    const int last_year = tm.tm_year + kSearchHorizonYears;
    while (tm.tm_year <= last_year) {
        if (!months_[static_cast<size_t>(tm.tm_mon + 1)]) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!day_matches(tm.tm_mday, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!hours_[static_cast<size_t>(tm.tm_hour)]) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            normalize(tm);
            continue;
        }
        if (!minutes_[static_cast<size_t>(tm.tm_min)]) {
            tm.tm_min += 1;
            normalize(tm);
            continue;
        }
        return from_utc_tm(tm);
    }

    throw std::runtime_error("Schedule '" + expression_ + "' never matches");
}

}  // namespace jobguard
