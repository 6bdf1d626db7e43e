#ifndef CALENDAR_HPP
#define CALENDAR_HPP

#include <cstdint>
#include <string>

#include "cryptostats/util/timestamp.hpp"

namespace cryptostats::util {

struct CalendarDate {
    int      year  = 1970;
    unsigned month = 1;
    unsigned day   = 1;
};

// Inclusive [00:00:00, 23:59:59] bounds of one UTC day.
struct DayWindow {
    Timestamp start;
    Timestamp end;
};

bool is_leap_year(int year) noexcept;
unsigned days_in_month(int year, unsigned month) noexcept;
bool is_valid_date(const CalendarDate& date) noexcept;

// Strict yyyy-MM-dd. Anything else (dd-MM-yyyy, missing zero padding,
// trailing characters, impossible days) is rejected.
bool parse_iso_date(const std::string& text, CalendarDate& out);

std::string to_iso_string(const CalendarDate& date);

// days relative to 1970-01-01, proleptic Gregorian
std::int64_t days_from_civil(const CalendarDate& date) noexcept;
CalendarDate civil_from_days(std::int64_t days) noexcept;

DayWindow day_window(const CalendarDate& date);

}

#endif
