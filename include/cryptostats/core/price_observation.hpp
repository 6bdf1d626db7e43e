#ifndef PRICE_OBSERVATION_HPP
#define PRICE_OBSERVATION_HPP

#include "cryptostats/types.hpp"
#include "cryptostats/util/timestamp.hpp"

namespace cryptostats::core {

using cryptostats::util::Timestamp;

// One quoted price. Identity is (symbol, timestamp).
struct PriceObservation {
    Symbol    symbol{};
    Timestamp timestamp{};
    Price     price{0};

    PriceObservation() = default;

    PriceObservation(Symbol    symbol,
                     Timestamp ts,
                     Price     price);
};

}

#endif
