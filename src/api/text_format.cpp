#include "cryptostats/api/text_format.hpp"

#include <sstream>

#include "cryptostats/core/decimal.hpp"

namespace cryptostats::api {

const char* const TextFormat::SYMBOL_NOT_FOUND = "The cryptocurrency was not found.";
const char* const TextFormat::DAY_NOT_FOUND    = "No records found for the specified date.";
const char* const TextFormat::DAY_INVALID      = "Invalid date format. Please use YYYY-MM-DD.";

std::string TextFormat::price(const Price& value)
{
    return core::to_plain_string(value, PRICE_DIGITS, DECIMAL_MARK);
}

std::string TextFormat::stats(const report::SymbolStats& stats)
{
    if (!stats.isValid()) return SYMBOL_NOT_FOUND;

    std::ostringstream oss;
    oss << "Crypto " << stats.symbol << ":\n"
        << "Oldest Price: " << price(stats.oldest.price) << "\n"
        << "Newest Price: " << price(stats.newest.price) << "\n"
        << "Min Price: "    << price(stats.minPrice) << "\n"
        << "Max Price: "    << price(stats.maxPrice);
    return oss.str();
}

std::string TextFormat::ranking(const report::RankingReport& ranking)
{
    std::ostringstream oss;
    for (const auto& entry : ranking.entries()) {
        oss << "Crypto: " << entry.symbol
            << "  Normalized Value: " << core::to_fixed_string(entry.normalizedValue, RANKING_DIGITS)
            << "\n";
    }
    return oss.str();
}

std::string TextFormat::day(const report::DayRangeResult& result)
{
    switch (result.status) {
    case QueryStatus::InvalidInput:
        return DAY_INVALID;
    case QueryStatus::NotFound:
        return DAY_NOT_FOUND;
    case QueryStatus::Found:
        break;
    }

    std::ostringstream oss;
    oss << "Crypto " << result.symbol << ":\n"
        << "Normalized Range: " << core::to_fixed_string(result.normalizedValue, DAY_DIGITS);
    return oss.str();
}

}
