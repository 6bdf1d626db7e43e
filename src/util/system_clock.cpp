#include "cryptostats/util/system_clock.hpp"

namespace cryptostats::util {

    Timestamp SystemClock::now() const
    {
        return Timestamp::now();
    }

}
