#include "cryptostats/api/responses.hpp"

#include <utility>
#include <vector>

#include "cryptostats/api/text_format.hpp"
#include "cryptostats/core/decimal.hpp"

namespace cryptostats::api {

namespace {

constexpr int HTTP_OK          = 200;
constexpr int HTTP_BAD_REQUEST = 400;
constexpr int HTTP_NOT_FOUND   = 404;

crow::response text_response(int code, const std::string& body)
{
    crow::response res(code, body);
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    return res;
}

crow::response json_response(int code, crow::json::wvalue&& body)
{
    crow::response res(std::move(body));
    res.code = code;
    return res;
}

}

crow::json::wvalue stats_to_json(const report::SymbolStats& stats)
{
    crow::json::wvalue json;
    json["symbol"]          = stats.symbol;
    json["oldestPrice"]     = core::to_double(stats.oldest.price);
    json["newestPrice"]     = core::to_double(stats.newest.price);
    json["minPrice"]        = core::to_double(stats.minPrice);
    json["maxPrice"]        = core::to_double(stats.maxPrice);
    json["oldestTimestamp"] = stats.oldest.timestamp.to_iso_string();
    json["newestTimestamp"] = stats.newest.timestamp.to_iso_string();
    json["count"]           = stats.count;
    return json;
}

crow::json::wvalue normalized_to_json(const report::NormalizedStats& stats)
{
    crow::json::wvalue json;
    json["symbol"]          = stats.symbol;
    json["normalizedValue"] = core::to_double(stats.normalizedValue);
    json["minPrice"]        = core::to_double(stats.minPrice);
    json["maxPrice"]        = core::to_double(stats.maxPrice);
    return json;
}

crow::response stats_response(const report::SymbolStatsReport& report)
{
    if (!report.stats().isValid()) {
        return error_response(HTTP_NOT_FOUND, TextFormat::SYMBOL_NOT_FOUND);
    }
    return json_response(HTTP_OK, stats_to_json(report.stats()));
}

crow::response ranking_response(const report::RankingReport& ranking)
{
    std::vector<crow::json::wvalue> entries;
    for (const auto& entry : ranking.entries()) {
        entries.push_back(normalized_to_json(entry));
    }

    crow::json::wvalue body;
    body = std::move(entries);
    return json_response(HTTP_OK, std::move(body));
}

crow::response highest_range_response(const report::NormalizedStats& top)
{
    if (top.symbol.empty()) {
        return error_response(HTTP_NOT_FOUND, "No cryptocurrency data available.");
    }
    return json_response(HTTP_OK, normalized_to_json(top));
}

crow::response day_response(const report::DayRangeResult& result)
{
    switch (result.status) {
    case QueryStatus::InvalidInput:
        return error_response(HTTP_BAD_REQUEST, TextFormat::DAY_INVALID);
    case QueryStatus::NotFound:
        return error_response(HTTP_NOT_FOUND, TextFormat::DAY_NOT_FOUND);
    case QueryStatus::Found:
        break;
    }

    crow::json::wvalue json;
    json["symbol"]          = result.symbol;
    json["date"]            = result.date;
    json["normalizedValue"] = core::to_double(result.normalizedValue);
    return json_response(HTTP_OK, std::move(json));
}

crow::response stats_text_response(const report::SymbolStatsReport& report)
{
    const int code = report.stats().isValid() ? HTTP_OK : HTTP_NOT_FOUND;
    return text_response(code, TextFormat::stats(report.stats()));
}

crow::response ranking_text_response(const report::RankingReport& ranking)
{
    return text_response(HTTP_OK, TextFormat::ranking(ranking));
}

crow::response day_text_response(const report::DayRangeResult& result)
{
    int code = HTTP_OK;
    if (result.status == QueryStatus::InvalidInput) code = HTTP_BAD_REQUEST;
    if (result.status == QueryStatus::NotFound) code = HTTP_NOT_FOUND;
    return text_response(code, TextFormat::day(result));
}

crow::response error_response(int code, const std::string& message)
{
    crow::json::wvalue json;
    json["error"] = message;
    return json_response(code, std::move(json));
}

}
