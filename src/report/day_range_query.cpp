#include "cryptostats/report/day_range_query.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "cryptostats/report/ranking_report.hpp"
#include "cryptostats/util/calendar.hpp"

namespace cryptostats::report {

DayRangeResult DayRangeQuery::highest_range_for_day(const std::string& date) const
{
    DayRangeResult result;
    result.date = date;

    util::CalendarDate day;
    if (!util::parse_iso_date(date, day)) {
        spdlog::info("rejected day query, '{}' is not yyyy-MM-dd", date);
        result.status = QueryStatus::InvalidInput;
        return result;
    }

    const util::DayWindow window = util::day_window(day);
    const auto observations = repo_.find_by_timestamp_range(window.start, window.end);
    if (observations.empty()) {
        spdlog::warn("no records found for day {}", date);
        result.status = QueryStatus::NotFound;
        return result;
    }

    const SymbolGroups groups = group_by_symbol(observations);

    bool haveWinner = false;
    NormalizedStats winner;
    for (const auto& [symbol, group] : groups) {
        NormalizedStats stats = normalized_stats(symbol, group, RANKING_SCALE);
        if (!haveWinner || stats.normalizedValue > winner.normalizedValue) {
            winner = std::move(stats);
            haveWinner = true;
        }
    }

    result.status          = QueryStatus::Found;
    result.symbol          = winner.symbol;
    result.normalizedValue = winner.normalizedValue;

    spdlog::debug("day {} winner {} over {} symbols", date, result.symbol, groups.size());
    return result;
}

}
