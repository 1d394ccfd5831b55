#include "CronExpression.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace DriveSync {

namespace {

std::optional<int> parseNumber(const std::string& text) {
    if (text.empty() || text.size() > 4 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoi(text);
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(text);
    while (std::getline(stream, current, separator)) {
        parts.push_back(current);
    }
    if (!text.empty() && text.back() == separator) {
        parts.emplace_back();
    }
    return parts;
}

/**
 * @brief Expand one field into the values it selects
 * @return error text, empty on success
 */
std::string expandField(const std::string& field, int lo, int hi, std::vector<int>& values) {
    if (field.empty()) {
        return "empty field";
    }
    for (const auto& part : split(field, ',')) {
        std::string base = part;
        int step = 1;
        bool stepped = false;

        auto slash = part.find('/');
        if (slash != std::string::npos) {
            base = part.substr(0, slash);
            auto parsed = parseNumber(part.substr(slash + 1));
            if (!parsed || *parsed == 0) {
                return "bad step in '" + part + "'";
            }
            step = *parsed;
            stepped = true;
        }

        int first = lo;
        int last = hi;
        if (base == "*") {
            // full range
        } else if (auto dash = base.find('-'); dash != std::string::npos) {
            auto from = parseNumber(base.substr(0, dash));
            auto to = parseNumber(base.substr(dash + 1));
            if (!from || !to || *from > *to) {
                return "bad range '" + base + "'";
            }
            first = *from;
            last = *to;
        } else {
            auto value = parseNumber(base);
            if (!value) {
                return "bad value '" + base + "'";
            }
            first = *value;
            last = stepped ? hi : *value;
        }

        if (first < lo || last > hi) {
            return "'" + part + "' outside " + std::to_string(lo) + "-" + std::to_string(hi);
        }
        for (int v = first; v <= last; v += step) {
            values.push_back(v);
        }
    }
    return {};
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::vector<std::string> words(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream stream(lowercase(text));
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

/// "2am", "3:30pm", "14:00", "midnight", "noon" -> (hour, minute)
std::optional<std::pair<int, int>> parseClock(std::string text) {
    if (text == "midnight") return std::make_pair(0, 0);
    if (text == "noon") return std::make_pair(12, 0);

    std::string suffix;
    if (text.size() > 2 && (text.compare(text.size() - 2, 2, "am") == 0 || text.compare(text.size() - 2, 2, "pm") == 0)) {
        suffix = text.substr(text.size() - 2);
        text.erase(text.size() - 2);
    }

    int minute = 0;
    auto colon = text.find(':');
    auto hourPart = parseNumber(text.substr(0, colon));
    if (!hourPart) {
        return std::nullopt;
    }
    if (colon != std::string::npos) {
        auto minutePart = parseNumber(text.substr(colon + 1));
        if (!minutePart || *minutePart > 59 || text.size() - colon - 1 != 2) {
            return std::nullopt;
        }
        minute = *minutePart;
    }

    int hour = *hourPart;
    if (suffix.empty()) {
        if (hour > 23) return std::nullopt;
    } else {
        if (hour < 1 || hour > 12) return std::nullopt;
        hour %= 12;
        if (suffix == "pm") hour += 12;
    }
    return std::make_pair(hour, minute);
}

std::optional<int> parseWeekday(const std::string& text) {
    static const char* names[] = {"sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};
    for (int day = 0; day < 7; ++day) {
        std::string name = names[day];
        if (text == name || text == name.substr(0, 3)) {
            return day;
        }
    }
    return std::nullopt;
}

std::string joinFrom(const std::vector<std::string>& tokens, size_t start) {
    std::string joined;
    for (size_t i = start; i < tokens.size(); ++i) {
        joined += tokens[i];
    }
    return joined;
}

} // namespace

Result<CronExpression> CronExpression::parse(const std::string& expression) {
    std::istringstream stream(expression);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return Err<CronExpression>(ErrorCode::ScheduleFault,
                                   "Cron expression needs 5 fields, got " + std::to_string(fields.size()) +
                                   ": '" + expression + "'");
    }

    static const struct {
        const char* name;
        int lo;
        int hi;
    } ranges[] = {{"minute", 0, 59}, {"hour", 0, 23}, {"day of month", 1, 31}, {"month", 1, 12}, {"day of week", 0, 7}};

    CronExpression cron;
    cron.expression_ = expression;
    for (size_t i = 0; i < fields.size(); ++i) {
        std::vector<int> values;
        std::string error = expandField(fields[i], ranges[i].lo, ranges[i].hi, values);
        if (!error.empty()) {
            return Err<CronExpression>(ErrorCode::ScheduleFault,
                                       std::string("Invalid ") + ranges[i].name + " field: " + error);
        }
        for (int v : values) {
            switch (i) {
                case 0: cron.minutes_.set(v); break;
                case 1: cron.hours_.set(v); break;
                case 2: cron.daysOfMonth_.set(v); break;
                case 3: cron.months_.set(v); break;
                default: cron.daysOfWeek_.set(v % 7); break;
            }
        }
    }
    cron.domRestricted_ = fields[2] != "*";
    cron.dowRestricted_ = fields[4] != "*";
    if (!cron.hasCalendarDay()) {
        return Err<CronExpression>(ErrorCode::ScheduleFault,
                                   "Cron expression never fires, no selected month has the selected day: '" +
                                   expression + "'");
    }
    return cron;
}

bool CronExpression::hasCalendarDay() const {
    // With both day fields restricted a weekday alone is enough
    if (!domRestricted_ || dowRestricted_) {
        return true;
    }
    static const int kLongestMonth[] = {0, 31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    for (int month = 1; month <= 12; ++month) {
        if (!months_.test(month)) {
            continue;
        }
        for (int day = 1; day <= kLongestMonth[month]; ++day) {
            if (daysOfMonth_.test(day)) {
                return true;
            }
        }
    }
    return false;
}

bool CronExpression::matches(const std::tm& local) const {
    if (!minutes_.test(local.tm_min) || !hours_.test(local.tm_hour) || !months_.test(local.tm_mon + 1)) {
        return false;
    }
    const bool dom = daysOfMonth_.test(local.tm_mday);
    const bool dow = daysOfWeek_.test(local.tm_wday);
    if (domRestricted_ && dowRestricted_) {
        return dom || dow;
    }
    return dom && dow;
}

std::optional<CronExpression::TimePoint> CronExpression::nextAfter(TimePoint after) const {
    std::time_t start = std::chrono::system_clock::to_time_t(after);
    std::tm t{};
    localtime_r(&start, &t);
    t.tm_sec = 0;
    t.tm_min += 1;
    t.tm_isdst = -1;
    std::mktime(&t);

    const int lastYear = t.tm_year + 5;
    auto dayMatches = [this](const std::tm& tm) {
        const bool dom = daysOfMonth_.test(tm.tm_mday);
        const bool dow = daysOfWeek_.test(tm.tm_wday);
        return (domRestricted_ && dowRestricted_) ? (dom || dow) : (dom && dow);
    };

    // Coarse-to-fine: skip whole months, days and hours before minutes
    while (t.tm_year <= lastYear) {
        if (!months_.test(t.tm_mon + 1)) {
            t.tm_mon += 1;
            t.tm_mday = 1;
            t.tm_hour = 0;
            t.tm_min = 0;
        } else if (!dayMatches(t)) {
            t.tm_mday += 1;
            t.tm_hour = 0;
            t.tm_min = 0;
        } else if (!hours_.test(t.tm_hour)) {
            t.tm_hour += 1;
            t.tm_min = 0;
        } else if (!minutes_.test(t.tm_min)) {
            t.tm_min += 1;
        } else {
            std::time_t found = std::mktime(&t);
            if (found == static_cast<std::time_t>(-1)) {
                return std::nullopt;
            }
            return std::chrono::system_clock::from_time_t(found);
        }
        t.tm_isdst = -1;
        std::mktime(&t);
    }
    return std::nullopt;
}

Result<FriendlySchedule> parseFriendlySchedule(const std::string& text) {
    const auto tokens = words(text);
    auto unsupported = [&]() {
        return Err<FriendlySchedule>(ErrorCode::InvalidArgument, "Unsupported schedule: '" + text + "'");
    };
    if (tokens.empty()) {
        return unsupported();
    }

    FriendlySchedule schedule;

    if (tokens.size() == 1 && tokens[0] == "hourly") {
        schedule.interval = std::chrono::minutes(60);
        return schedule;
    }

    if (tokens[0] == "every" && (tokens.size() == 2 || tokens.size() == 3)) {
        int count = 1;
        if (tokens.size() == 3) {
            auto parsed = parseNumber(tokens[1]);
            if (!parsed || *parsed == 0) {
                return unsupported();
            }
            count = *parsed;
        }
        const std::string& unit = tokens.back();
        if (unit == "minute" || unit == "minutes") {
            schedule.interval = std::chrono::minutes(count);
        } else if (unit == "hour" || unit == "hours") {
            schedule.interval = std::chrono::hours(count);
        } else {
            return unsupported();
        }
        return schedule;
    }

    std::optional<std::pair<int, int>> clock;
    std::string dayOfWeek = "*";
    if (tokens[0] == "daily" && tokens.size() >= 3 && tokens[1] == "at") {
        clock = parseClock(joinFrom(tokens, 2));
    } else if (tokens[0] == "weekly" && tokens.size() >= 5 && tokens[1] == "on" && tokens[3] == "at") {
        auto day = parseWeekday(tokens[2]);
        if (!day) {
            return unsupported();
        }
        dayOfWeek = std::to_string(*day);
        clock = parseClock(joinFrom(tokens, 4));
    }
    if (!clock) {
        return unsupported();
    }

    schedule.type = FriendlySchedule::Type::Cron;
    schedule.cronExpression = std::to_string(clock->second) + " " + std::to_string(clock->first) + " * * " + dayOfWeek;
    return schedule;
}

} // namespace DriveSync
