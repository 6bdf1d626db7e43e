#include "cryptostats/report/price_aggregator.hpp"

#include <spdlog/spdlog.h>

namespace cryptostats::report {

Price PriceAggregator::min_price(const std::vector<PriceObservation>& observations)
{
    if (observations.empty()) return Price{0};

    const PriceObservation* best = &observations.front();
    for (const auto& obs : observations) {
        if (obs.price < best->price) best = &obs;
    }

    spdlog::debug("min price over {} observations: {}", observations.size(), best->price.str());
    return best->price;
}

Price PriceAggregator::max_price(const std::vector<PriceObservation>& observations)
{
    if (observations.empty()) return Price{0};

    const PriceObservation* best = &observations.front();
    for (const auto& obs : observations) {
        if (obs.price > best->price) best = &obs;
    }

    spdlog::debug("max price over {} observations: {}", observations.size(), best->price.str());
    return best->price;
}

const PriceObservation* PriceAggregator::oldest(const std::vector<PriceObservation>& observations)
{
    const PriceObservation* result = nullptr;
    for (const auto& obs : observations) {
        if (!result || obs.timestamp < result->timestamp) result = &obs;
    }
    return result;
}

const PriceObservation* PriceAggregator::newest(const std::vector<PriceObservation>& observations)
{
    const PriceObservation* result = nullptr;
    for (const auto& obs : observations) {
        if (!result || obs.timestamp > result->timestamp) result = &obs;
    }
    return result;
}

}
