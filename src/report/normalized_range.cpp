#include "cryptostats/report/normalized_range.hpp"

#include <spdlog/spdlog.h>

#include "cryptostats/core/decimal.hpp"

namespace cryptostats::report {

Decimal normalized_range(const Price& minPrice, const Price& maxPrice, unsigned scale)
{
    if (minPrice <= 0) {
        spdlog::warn("min price is {}, normalized range defaults to 0", minPrice.str());
        return Decimal{0};
    }

    return core::divide_half_up(maxPrice - minPrice, minPrice, scale);
}

}
