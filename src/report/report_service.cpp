#include "cryptostats/report/report_service.hpp"

#include <spdlog/spdlog.h>

namespace cryptostats::report {

SymbolStatsReport ReportService::stats_for(const Symbol& symbol) const
{
    spdlog::info("fetching stats for symbol {}", symbol);
    auto observations = repo_.find_by_symbol(symbol);
    return SymbolStatsReport::from_observations(observations);
}

RankingReport ReportService::ranked_by_symbol() const
{
    spdlog::info("ranking symbols by normalized range");
    auto observations = repo_.find_all();
    return RankingReport::from_observations(observations);
}

NormalizedStats ReportService::highest_range() const
{
    auto ranking = ranked_by_symbol();
    if (ranking.empty()) return NormalizedStats{};
    return *ranking.top();
}

DayRangeResult ReportService::highest_range_for_day(const std::string& date) const
{
    spdlog::info("fetching highest normalized range for day {}", date);
    return dayQuery_.highest_range_for_day(date);
}

} 
