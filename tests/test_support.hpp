#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <string>
#include <vector>

#include "cryptostats/core/price_observation.hpp"

namespace cryptostats::test {

// 2022-01-01T00:00:00Z
constexpr EpochMillis JAN_1_2022 = 1640995200000;
constexpr EpochMillis ONE_HOUR   = 3'600'000;
constexpr EpochMillis ONE_DAY    = 86'400'000;

inline core::PriceObservation obs(const std::string& symbol, EpochMillis millis, const std::string& price)
{
    return core::PriceObservation(symbol, util::Timestamp::from_millis(millis), Price(price.c_str()));
}

// two observations spanning [low, high]
inline void add_range(std::vector<core::PriceObservation>& out, const std::string& symbol,
                      EpochMillis millis, const std::string& low, const std::string& high)
{
    out.push_back(obs(symbol, millis, low));
    out.push_back(obs(symbol, millis + ONE_HOUR, high));
}

}

#endif
