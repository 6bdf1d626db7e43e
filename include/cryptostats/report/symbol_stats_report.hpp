#ifndef SYMBOL_STATS_REPORT_HPP
#define SYMBOL_STATS_REPORT_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "cryptostats/core/price_observation.hpp"

namespace cryptostats::report {

using cryptostats::core::PriceObservation;

struct SymbolStats {
    std::string symbol;

    PriceObservation oldest{};
    PriceObservation newest{};
    Price            minPrice{0};
    Price            maxPrice{0};
    std::size_t      count = 0;

    bool isValid() const {
        return count > 0;
    }
};

class SymbolStatsReport {
public:
    SymbolStatsReport() = default;

    static SymbolStatsReport from_observations(const std::vector<PriceObservation>& observations);

    const SymbolStats& stats() const noexcept { return stats_; }

private:
    SymbolStats stats_;
};

} 

#endif
