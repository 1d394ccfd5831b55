#pragma once

#include "Result.h"

#include <bitset>
#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace DriveSync {

/**
 * @brief Five-field cron expression: minute hour day-of-month month day-of-week.
 *
 * Each field accepts '*', single values, lists "a,b", ranges "a-b" and
 * steps "*\/n", "a-b/n" or "a/n". Day of week is 0-7 with both 0 and 7
 * meaning Sunday. When both day fields are restricted a day matches if
 * either one does, as in classic cron. Times are evaluated in local time.
 */
class CronExpression {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @return ScheduleFault describing the first bad field, or for an
     *         expression no calendar date satisfies (e.g. "0 0 30 2 *")
     */
    static Result<CronExpression> parse(const std::string& expression);

    /**
     * @brief First matching minute strictly after @p after, or nullopt if
     *        nothing matches within five years
     */
    std::optional<TimePoint> nextAfter(TimePoint after) const;

    bool matches(const std::tm& local) const;

    const std::string& expression() const { return expression_; }

private:
    CronExpression() = default;

    bool hasCalendarDay() const;

    std::string expression_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool domRestricted_ = false;
    bool dowRestricted_ = false;
};

/**
 * @brief Result of ParseFriendlySchedule
 */
struct FriendlySchedule {
    enum class Type { Interval, Cron };

    Type type = Type::Interval;
    std::chrono::minutes interval{0};
    std::string cronExpression;
};

/**
 * @brief Translate phrases such as "hourly", "every 30 minutes", "every 2 hours",
 *        "daily at 2 am", "daily at midnight" or "weekly on monday at 3 pm".
 *
 * Matching is case-insensitive.
 * @return InvalidArgument for unsupported phrases
 */
Result<FriendlySchedule> parseFriendlySchedule(const std::string& text);

} // namespace DriveSync
