#ifndef SYSTEMCLOCK_HPP
#define SYSTEMCLOCK_HPP

#include "cryptostats/util/i_clock.hpp"

namespace cryptostats::util {

class SystemClock : public IClock {
public:
    SystemClock() = default;
    ~SystemClock() override = default;

    Timestamp now() const override;
};

} 

#endif
