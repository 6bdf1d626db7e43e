#include "cryptostats/report/symbol_stats_report.hpp"

#include "cryptostats/report/price_aggregator.hpp"

namespace cryptostats::report {

SymbolStatsReport SymbolStatsReport::from_observations(const std::vector<PriceObservation>& observations) 
{
    SymbolStatsReport report;

    if (observations.empty()) return report;

    report.stats_.symbol   = observations[0].symbol;
    report.stats_.oldest   = *PriceAggregator::oldest(observations);
    report.stats_.newest   = *PriceAggregator::newest(observations);
    report.stats_.minPrice = PriceAggregator::min_price(observations);
    report.stats_.maxPrice = PriceAggregator::max_price(observations);
    report.stats_.count    = observations.size();

    return report;
}

} 
