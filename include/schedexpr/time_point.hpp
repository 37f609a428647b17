#pragma once

#include <ctime>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace schedexpr {

struct ScheduleError : std::runtime_error { using std::runtime_error::runtime_error; };

enum class DayOfWeek {
    Sunday = 0,
    Monday,
    Tuesday,
    Wednesday,
    Thursday,
    Friday,
    Saturday,
};

/// The point in time a schedule is evaluated against.
/// No calendar validation is performed on it.
struct TimePoint {
    int minute_of_hour{0};
    int hour_of_day{0};
    DayOfWeek day_of_week{DayOfWeek::Sunday};
    int week_of_month{1}; // ordinal of the weekday within the month, 1..5
    int month_of_year{1}; // 1..12
};

bool operator==(const TimePoint& a, const TimePoint& b);
bool operator!=(const TimePoint& a, const TimePoint& b);

/// Convert broken-down calendar time. Days 1-7 of a month are week 1,
/// days 29-31 are week 5.
TimePoint to_time_point(const std::tm& tm);

/// Current local time.
TimePoint now_time_point();

/// Parse "YYYY-MM-DD HH:MM" ('T' is accepted in place of the space,
/// a trailing ":SS" is ignored). Throws ScheduleError on malformed input
/// or a date that does not exist.
TimePoint parse_time_point(std::string_view text);

// "wed", "Wednesday", ... (case-insensitive)
std::optional<DayOfWeek> day_from_name(std::string_view name);

const char* to_string(DayOfWeek d);
std::string to_string(const TimePoint& t);

std::ostream& operator<<(std::ostream& os, DayOfWeek d);
std::ostream& operator<<(std::ostream& os, const TimePoint& t);

} // namespace schedexpr
