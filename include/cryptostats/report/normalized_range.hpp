#ifndef NORMALIZED_RANGE_HPP
#define NORMALIZED_RANGE_HPP

#include "cryptostats/types.hpp"

namespace cryptostats::report {

// (maxPrice - minPrice) / minPrice rounded half-up to `scale` digits.
// Zero when minPrice is not positive. Never throws.
Decimal normalized_range(const Price& minPrice, const Price& maxPrice, unsigned scale = REPORT_SCALE);

}

#endif
