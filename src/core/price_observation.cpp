#include "cryptostats/core/price_observation.hpp"

#include <utility>

namespace cryptostats::core {

PriceObservation::PriceObservation(Symbol    symbol_,
                                   Timestamp ts,
                                   Price     price_)
    : symbol{std::move(symbol_)}
    , timestamp{ts}
    , price{std::move(price_)}
{
}

}
