#ifndef PRICE_AGGREGATOR_HPP
#define PRICE_AGGREGATOR_HPP

#include <vector>

#include "cryptostats/core/price_observation.hpp"

namespace cryptostats::report {

using cryptostats::core::PriceObservation;

// Single-pass reductions over one symbol's observations. The caller is
// responsible for handing in a homogeneous sequence; ties resolve to the
// first element encountered.
class PriceAggregator {
public:
    // zero for an empty sequence
    static Price min_price(const std::vector<PriceObservation>& observations);
    static Price max_price(const std::vector<PriceObservation>& observations);

    // nullptr for an empty sequence; points into `observations`
    static const PriceObservation* oldest(const std::vector<PriceObservation>& observations);
    static const PriceObservation* newest(const std::vector<PriceObservation>& observations);
};

}

#endif
