#pragma once

#include "common/utils.hpp"
#include <bitset>
#include <optional>
#include <string>

// Five-field cron schedule (minute hour day-of-month month day-of-week), UTC.
// Supports "*", lists, ranges, steps, JAN-DEC / SUN-SAT names, 7 as Sunday and
// the @hourly/@daily/@weekly/@monthly/@yearly shorthands. When both day fields
// are restricted a day matches if either of them does.
class CronExpression {
public:
    // Throws ConfigurationError describing the offending field.
    static CronExpression parse(const std::string& expression);

    // First firing time strictly after `after`, at minute precision. nullopt for
    // expressions that never fire (e.g. "0 0 31 2 *").
    std::optional<utils::TimePoint> next(utils::TimePoint after) const;

    bool matches(utils::TimePoint time) const;

    const std::string& text() const { return text_; }

private:
    CronExpression() = default;

    bool dayMatches(int dayOfMonth, int month, int dayOfWeek) const;

    std::string text_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;  // 1-31
    std::bitset<13> months_;       // 1-12
    std::bitset<7> daysOfWeek_;    // 0 = Sunday
    bool dayOfMonthRestricted_ = false;
    bool dayOfWeekRestricted_ = false;
};
