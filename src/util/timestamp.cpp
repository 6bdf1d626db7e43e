#include "cryptostats/util/timestamp.hpp"

#include <iomanip>
#include <sstream>

#include "cryptostats/util/calendar.hpp"

namespace cryptostats::util {

    namespace {
        constexpr EpochMillis MILLIS_PER_DAY = 86'400'000;
    }

    Timestamp::Timestamp() : tp_{} {}

    Timestamp::Timestamp(const time_point& tp) : tp_(tp) {}

    Timestamp Timestamp::now() {
        return Timestamp{
            std::chrono::time_point_cast<duration>(clock::now())
        };
    }

    Timestamp Timestamp::from_millis(EpochMillis millis) {
        return Timestamp{time_point{duration{millis}}};
    }

    Timestamp::time_point Timestamp::value() const {
        return tp_;
    }

    EpochMillis Timestamp::millis() const {
        return tp_.time_since_epoch().count();
    }

    void Timestamp::set_value(const time_point& tp) {
        tp_ = tp;
    }

    std::string Timestamp::to_iso_string() const {
        const EpochMillis ms = millis();
        EpochMillis days = ms / MILLIS_PER_DAY;
        EpochMillis rem  = ms % MILLIS_PER_DAY;
        if (rem < 0) {
            rem += MILLIS_PER_DAY;
            --days;
        }

        const CalendarDate date = civil_from_days(days);
        const EpochMillis secs = rem / 1000;

        std::ostringstream oss;
        oss << util::to_iso_string(date) << 'T'
            << std::setfill('0')
            << std::setw(2) << secs / 3600 << ':'
            << std::setw(2) << (secs / 60) % 60 << ':'
            << std::setw(2) << secs % 60;
        return oss.str();
    }

    Timestamp& Timestamp::operator+=(const duration& d) {
        tp_ += d;
        return *this;
    }

    Timestamp& Timestamp::operator-=(const duration& d) {
        tp_ -= d;
        return *this;
    }

    bool operator==(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() == rhs.value();
    }

    bool operator!=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(lhs == rhs);
    }

    bool operator<(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() < rhs.value();
    }

    bool operator<=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(rhs < lhs);
    }

    bool operator>(const Timestamp& lhs, const Timestamp& rhs) {
        return rhs < lhs;
    }

    bool operator>=(const Timestamp& lhs, const Timestamp& rhs) {
        return !(lhs < rhs);
    }

    Timestamp::duration operator-(const Timestamp& lhs, const Timestamp& rhs) {
        return lhs.value() - rhs.value();
    }

}
