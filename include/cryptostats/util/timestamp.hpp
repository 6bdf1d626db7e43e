#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <chrono>
#include <string>

#include "cryptostats/types.hpp"

namespace cryptostats::util { 

class Timestamp {
public:
    using clock         = std::chrono::system_clock;
    using duration      = std::chrono::milliseconds;
    using time_point    = std::chrono::time_point<clock, duration>;

    Timestamp();
    explicit Timestamp(const time_point& tp);

    static Timestamp now();
    static Timestamp from_millis(EpochMillis millis);

    time_point value() const;
    EpochMillis millis() const;

    void set_value(const time_point& tp);

    // yyyy-MM-ddTHH:mm:ss, UTC
    std::string to_iso_string() const;

    Timestamp& operator+=(const duration& d);
    Timestamp& operator-=(const duration& d);

private:
    time_point tp_;
};

bool operator==(const Timestamp& lhs, const Timestamp& rhs);
bool operator!=(const Timestamp& lhs, const Timestamp& rhs);
bool operator<(const Timestamp& lhs, const Timestamp& rhs);
bool operator<=(const Timestamp& lhs, const Timestamp& rhs);
bool operator>(const Timestamp& lhs, const Timestamp& rhs);
bool operator>=(const Timestamp& lhs, const Timestamp& rhs);

Timestamp::duration operator-(const Timestamp& lhs, const Timestamp& rhs);

}

#endif
