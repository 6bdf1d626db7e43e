#ifndef REPORT_SERVICE_HPP
#define REPORT_SERVICE_HPP

#include <string>

#include "cryptostats/report/i_price_repository.hpp"
#include "cryptostats/report/symbol_stats_report.hpp"
#include "cryptostats/report/ranking_report.hpp"
#include "cryptostats/report/day_range_query.hpp"

namespace cryptostats::report {

class ReportService {
public:

    explicit ReportService(const IPriceRepository& repo)
        : repo_(repo)
        , dayQuery_(repo)
    {
    }

    // invalid stats when the symbol has no records
    SymbolStatsReport stats_for(const Symbol& symbol) const;

    RankingReport ranked_by_symbol() const;

    // top ranking entry; symbol is NO_SYMBOL when there is no data
    NormalizedStats highest_range() const;

    DayRangeResult highest_range_for_day(const std::string& date) const;

private:
    const IPriceRepository& repo_;
    DayRangeQuery           dayQuery_;
};

} 

#endif 
