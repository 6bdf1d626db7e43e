#ifndef DAY_RANGE_QUERY_HPP
#define DAY_RANGE_QUERY_HPP

#include <string>

#include "cryptostats/report/i_price_repository.hpp"

namespace cryptostats::report {

struct DayRangeResult {
    QueryStatus status = QueryStatus::NotFound;
    std::string date;
    Symbol      symbol = NO_SYMBOL;
    Decimal     normalizedValue{0};

    bool found() const {
        return status == QueryStatus::Found;
    }
};

// Winner of one UTC calendar day, dates given as yyyy-MM-dd.
class DayRangeQuery {
public:
    explicit DayRangeQuery(const IPriceRepository& repo)
        : repo_(repo)
    {
    }

    DayRangeResult highest_range_for_day(const std::string& date) const;

private:
    const IPriceRepository& repo_;
};

}

#endif
