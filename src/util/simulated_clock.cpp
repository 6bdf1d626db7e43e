#include "cryptostats/util/simulated_clock.hpp"

namespace cryptostats::util {

    SimulatedClock::SimulatedClock()
        : current_{Timestamp::from_millis(0)}
    {
    }

    SimulatedClock::SimulatedClock(const Timestamp& start)
        : current_{start}
    {
    }

    Timestamp SimulatedClock::now() const
    {
        return current_;
    }

    void SimulatedClock::set_time(const Timestamp& t)
    {
        current_ = t;
    }

    void SimulatedClock::advance_time(const Timestamp::duration& delta)
    {
        current_ += delta;
    }

} 
