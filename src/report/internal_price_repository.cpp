#include "cryptostats/report/internal_price_repository.hpp"

#include <mutex>

namespace cryptostats::report {

void InternalPriceRepository::upsert(const std::vector<PriceObservation>& observations) 
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& obs : observations) {
        pricesBySymbol_[obs.symbol].insert_or_assign(obs.timestamp, obs);
    }
}

std::vector<PriceObservation> InternalPriceRepository::find_by_symbol(const Symbol& symbol) const 
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PriceObservation> result;

    auto it = pricesBySymbol_.find(symbol);
    if (it == pricesBySymbol_.end()) return result;

    result.reserve(it->second.size());
    for (const auto& entry : it->second) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<PriceObservation> InternalPriceRepository::find_by_timestamp_range(Timestamp start, Timestamp end) const 
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PriceObservation> result;
    if (end < start) return result;

    for (const auto& [symbol, series] : pricesBySymbol_) {
        auto first = series.lower_bound(start);
        auto last  = series.upper_bound(end);
        for (auto it = first; it != last; ++it) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<PriceObservation> InternalPriceRepository::find_all() const 
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PriceObservation> result;

    for (const auto& [symbol, series] : pricesBySymbol_) {
        for (const auto& entry : series) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::size_t InternalPriceRepository::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [symbol, series] : pricesBySymbol_) {
        count += series.size();
    }
    return count;
}

} 
