#ifndef RANKING_REPORT_HPP
#define RANKING_REPORT_HPP

#include <map>
#include <string>
#include <vector>

#include "cryptostats/core/price_observation.hpp"

namespace cryptostats::report {

using cryptostats::core::PriceObservation;

using SymbolGroups = std::map<Symbol, std::vector<PriceObservation>>;

struct NormalizedStats {
    std::string symbol;

    Price   minPrice{0};
    Price   maxPrice{0};
    Decimal normalizedValue{0};
};

// Exact, case-sensitive grouping; each group keeps input order.
SymbolGroups group_by_symbol(const std::vector<PriceObservation>& observations);

NormalizedStats normalized_stats(const Symbol& symbol,
                                 const std::vector<PriceObservation>& group,
                                 unsigned scale = RANKING_SCALE);

class RankingReport {
public:
    RankingReport() = default;

    // One entry per symbol, normalizedValue descending. Exact ties keep
    // ascending symbol order.
    static RankingReport from_observations(const std::vector<PriceObservation>& observations);

    const std::vector<NormalizedStats>& entries() const noexcept { return entries_; }

    bool empty() const noexcept { return entries_.empty(); }

    // nullptr when nothing was ranked
    const NormalizedStats* top() const noexcept;

private:
    std::vector<NormalizedStats> entries_;
};

}

#endif
