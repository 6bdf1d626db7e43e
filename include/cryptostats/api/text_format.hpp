#ifndef TEXT_FORMAT_HPP
#define TEXT_FORMAT_HPP

#include <string>

#include "cryptostats/report/day_range_query.hpp"
#include "cryptostats/report/ranking_report.hpp"
#include "cryptostats/report/symbol_stats_report.hpp"

namespace cryptostats::api {

// Plain-text renderings for the *-string endpoints.
class TextFormat {
public:
    static constexpr unsigned PRICE_DIGITS   = 4;
    static constexpr unsigned RANKING_DIGITS = 6;
    static constexpr unsigned DAY_DIGITS     = 4;
    static constexpr char     DECIMAL_MARK   = ',';

    static const char* const SYMBOL_NOT_FOUND;
    static const char* const DAY_NOT_FOUND;
    static const char* const DAY_INVALID;

    // "46813,21": half-up, trailing zeros dropped
    static std::string price(const Price& value);

    static std::string stats(const report::SymbolStats& stats);
    static std::string ranking(const report::RankingReport& ranking);
    static std::string day(const report::DayRangeResult& result);
};

}

#endif
