#ifndef I_PRICE_REPOSITORY_HPP
#define I_PRICE_REPOSITORY_HPP

#include <cstddef>
#include <vector>
#include "cryptostats/core/price_observation.hpp"

namespace cryptostats::report {

using cryptostats::core::PriceObservation;
using cryptostats::util::Timestamp;

class IPriceRepository {
public:
    virtual ~IPriceRepository() = default;

    // insert, or replace the price of an existing (symbol, timestamp)
    virtual void upsert(const std::vector<PriceObservation>& observations) = 0;

    virtual std::vector<PriceObservation> find_by_symbol(const Symbol& symbol) const = 0;

    // inclusive on both ends
    virtual std::vector<PriceObservation> find_by_timestamp_range(Timestamp start, Timestamp end) const = 0;

    virtual std::vector<PriceObservation> find_all() const = 0;

    virtual std::size_t size() const = 0;
};

} 

#endif
