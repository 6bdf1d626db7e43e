#include "cryptostats/util/calendar.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace cryptostats::util {

namespace {

constexpr std::size_t ISO_DATE_LENGTH = 10;
constexpr EpochMillis MILLIS_PER_DAY  = 86'400'000;
constexpr EpochMillis LAST_SECOND_OF_DAY = MILLIS_PER_DAY - 1000;

bool read_digits(const std::string& text, std::size_t pos, std::size_t count, int& out)
{
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

}

bool is_leap_year(int year) noexcept
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) noexcept
{
    static constexpr unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

bool is_valid_date(const CalendarDate& date) noexcept
{
    if (date.month < 1 || date.month > 12) return false;
    return date.day >= 1 && date.day <= days_in_month(date.year, date.month);
}

bool parse_iso_date(const std::string& text, CalendarDate& out)
{
    if (text.size() != ISO_DATE_LENGTH) return false;
    if (text[4] != '-' || text[7] != '-') return false;

    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_digits(text, 0, 4, year)) return false;
    if (!read_digits(text, 5, 2, month)) return false;
    if (!read_digits(text, 8, 2, day)) return false;

    CalendarDate date;
    date.year  = year;
    date.month = static_cast<unsigned>(month);
    date.day   = static_cast<unsigned>(day);
    if (!is_valid_date(date)) return false;

    out = date;
    return true;
}

std::string to_iso_string(const CalendarDate& date)
{
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

std::int64_t days_from_civil(const CalendarDate& date) noexcept
{
    const std::int64_t y = static_cast<std::int64_t>(date.year) - (date.month <= 2 ? 1 : 0);
    const std::int64_t m = date.month;
    const std::int64_t d = date.day;

    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate civil_from_days(std::int64_t days) noexcept
{
    const std::int64_t z   = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp  = (5 * doy + 2) / 153;
    const std::int64_t d   = doy - (153 * mp + 2) / 5 + 1;
    const std::int64_t m   = mp < 10 ? mp + 3 : mp - 9;

    CalendarDate date;
    date.year  = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    date.month = static_cast<unsigned>(m);
    date.day   = static_cast<unsigned>(d);
    return date;
}

DayWindow day_window(const CalendarDate& date)
{
    const EpochMillis start = days_from_civil(date) * MILLIS_PER_DAY;

    DayWindow window;
    window.start = Timestamp::from_millis(start);
    window.end   = Timestamp::from_millis(start + LAST_SECOND_OF_DAY);
    return window;
}

}
