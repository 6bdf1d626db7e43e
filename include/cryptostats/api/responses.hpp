#ifndef RESPONSES_HPP
#define RESPONSES_HPP

#include <string>

#include <crow.h>

#include "cryptostats/report/day_range_query.hpp"
#include "cryptostats/report/ranking_report.hpp"
#include "cryptostats/report/symbol_stats_report.hpp"

namespace cryptostats::api {

// Maps report results onto HTTP: 200 with a body, 404 for "no data",
// 400 for invalid input.
crow::json::wvalue stats_to_json(const report::SymbolStats& stats);
crow::json::wvalue normalized_to_json(const report::NormalizedStats& stats);

crow::response stats_response(const report::SymbolStatsReport& report);
crow::response ranking_response(const report::RankingReport& ranking);
crow::response highest_range_response(const report::NormalizedStats& top);
crow::response day_response(const report::DayRangeResult& result);

crow::response stats_text_response(const report::SymbolStatsReport& report);
crow::response ranking_text_response(const report::RankingReport& ranking);
crow::response day_text_response(const report::DayRangeResult& result);

crow::response error_response(int code, const std::string& message);

}

#endif
