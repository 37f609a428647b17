#include "schedexpr/time_point.hpp"

#include <cctype>
#include <cstdio>
#include <ostream>

namespace schedexpr {

static const char* const kShortNames[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
static const char* const kLongNames[] = {
    "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"};

bool operator==(const TimePoint& a, const TimePoint& b) {
    return a.minute_of_hour == b.minute_of_hour && a.hour_of_day == b.hour_of_day &&
           a.day_of_week == b.day_of_week && a.week_of_month == b.week_of_month &&
           a.month_of_year == b.month_of_year;
}

bool operator!=(const TimePoint& a, const TimePoint& b) { return !(a == b); }

TimePoint to_time_point(const std::tm& tm) {
    TimePoint t;
    t.minute_of_hour = tm.tm_min;
    t.hour_of_day = tm.tm_hour;
    t.day_of_week = static_cast<DayOfWeek>(tm.tm_wday);
    t.week_of_month = (tm.tm_mday - 1) / 7 + 1;
    t.month_of_year = tm.tm_mon + 1;
    return t;
}

TimePoint now_time_point() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    if (localtime_r(&now, &tm) == nullptr) throw ScheduleError("Cannot read local time");
    return to_time_point(tm);
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

// Sakamoto's method, 0 = Sunday.
static int weekday(int y, int m, int d) {
    static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    if (m < 3) y -= 1;
    return (y + y / 4 - y / 100 + y / 400 + offsets[m - 1] + d) % 7;
}

static bool read_digits(std::string_view s, std::size_t& i, std::size_t width, int& out) {
    if (i + width > s.size()) return false;
    int v = 0;
    for (std::size_t k = 0; k < width; ++k) {
        char c = s[i + k];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    i += width;
    out = v;
    return true;
}

static bool read_char(std::string_view s, std::size_t& i, char c) {
    if (i >= s.size() || s[i] != c) return false;
    ++i;
    return true;
}

TimePoint parse_time_point(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    auto fail = [&](const char* why) {
        return ScheduleError(std::string("Invalid time '") + std::string(text) + "': " + why);
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    std::size_t i = 0;
    if (!read_digits(text, i, 4, year) || !read_char(text, i, '-') || !read_digits(text, i, 2, month) ||
        !read_char(text, i, '-') || !read_digits(text, i, 2, day)) {
        throw fail("expected YYYY-MM-DD");
    }
    if (i >= text.size() || (text[i] != ' ' && text[i] != 'T')) throw fail("expected ' ' or 'T' after the date");
    ++i;
    if (!read_digits(text, i, 2, hour) || !read_char(text, i, ':') || !read_digits(text, i, 2, minute)) {
        throw fail("expected HH:MM");
    }
    if (read_char(text, i, ':') && !read_digits(text, i, 2, second)) throw fail("expected seconds after ':'");
    if (i != text.size()) throw fail("unexpected trailing characters");

    if (month < 1 || month > 12) throw fail("month out of range");
    if (day < 1 || day > days_in_month(year, month)) throw fail("day out of range");
    if (hour > 23) throw fail("hour out of range");
    if (minute > 59) throw fail("minute out of range");
    if (second > 59) throw fail("second out of range");

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_wday = weekday(year, month, day);
    return to_time_point(tm);
}

std::optional<DayOfWeek> day_from_name(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    for (int d = 0; d < 7; ++d) {
        if (lower == kShortNames[d] || lower == kLongNames[d]) return static_cast<DayOfWeek>(d);
    }
    return std::nullopt;
}

const char* to_string(DayOfWeek d) {
    int i = static_cast<int>(d);
    if (i < 0 || i > 6) return "???";
    return kShortNames[i];
}

std::string to_string(const TimePoint& t) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s %02d:%02d (week %d, month %d)", to_string(t.day_of_week), t.hour_of_day,
                  t.minute_of_hour, t.week_of_month, t.month_of_year);
    return buf;
}

std::ostream& operator<<(std::ostream& os, DayOfWeek d) { return os << to_string(d); }

std::ostream& operator<<(std::ostream& os, const TimePoint& t) { return os << to_string(t); }

} // namespace schedexpr
