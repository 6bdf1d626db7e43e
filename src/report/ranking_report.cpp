#include "cryptostats/report/ranking_report.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "cryptostats/report/normalized_range.hpp"
#include "cryptostats/report/price_aggregator.hpp"

namespace cryptostats::report {

SymbolGroups group_by_symbol(const std::vector<PriceObservation>& observations)
{
    SymbolGroups groups;
    for (const auto& obs : observations) {
        groups[obs.symbol].push_back(obs);
    }
    return groups;
}

NormalizedStats normalized_stats(const Symbol& symbol,
                                 const std::vector<PriceObservation>& group,
                                 unsigned scale)
{
    NormalizedStats stats;
    stats.symbol          = symbol;
    stats.minPrice        = PriceAggregator::min_price(group);
    stats.maxPrice        = PriceAggregator::max_price(group);
    stats.normalizedValue = normalized_range(stats.minPrice, stats.maxPrice, scale);
    return stats;
}

RankingReport RankingReport::from_observations(const std::vector<PriceObservation>& observations) 
{
    RankingReport report;

    if (observations.empty()) return report;

    const SymbolGroups groups = group_by_symbol(observations);
    report.entries_.reserve(groups.size());

    for (const auto& [symbol, group] : groups) {
        report.entries_.push_back(normalized_stats(symbol, group, RANKING_SCALE));
    }

    std::stable_sort(report.entries_.begin(), report.entries_.end(),
        [](const NormalizedStats& lhs, const NormalizedStats& rhs) {
            return lhs.normalizedValue > rhs.normalizedValue;
        });

    spdlog::debug("ranked {} symbols from {} observations", report.entries_.size(), observations.size());
    return report;
}

const NormalizedStats* RankingReport::top() const noexcept
{
    return entries_.empty() ? nullptr : &entries_.front();
}

}
