#include "cryptostats/api/http_routes.hpp"

#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "cryptostats/api/responses.hpp"

namespace cryptostats::api {

namespace {

constexpr int HTTP_INTERNAL_ERROR = 500;

template <typename Handler>
crow::response guarded(const char* route, Handler&& handler)
{
    try {
        return handler();
    }
    catch (const std::exception& e) {
        spdlog::error("{} failed: {}", route, e.what());
        return error_response(HTTP_INTERNAL_ERROR, "Internal server error");
    }
}

}

void register_routes(App& app, const report::ReportService& service)
{
    CROW_ROUTE(app, "/api/cryptos/<string>/stats")
    ([&service](std::string symbol) {
        return guarded("stats", [&] {
            return stats_response(service.stats_for(symbol));
        });
    });

    CROW_ROUTE(app, "/api/cryptos/<string>/stats-string")
    ([&service](std::string symbol) {
        return guarded("stats-string", [&] {
            return stats_text_response(service.stats_for(symbol));
        });
    });

    CROW_ROUTE(app, "/api/cryptos/ranking")
    ([&service]() {
        return guarded("ranking", [&] {
            return ranking_response(service.ranked_by_symbol());
        });
    });

    CROW_ROUTE(app, "/api/cryptos/highest-range")
    ([&service]() {
        return guarded("highest-range", [&] {
            return highest_range_response(service.highest_range());
        });
    });

    CROW_ROUTE(app, "/api/cryptos/highest-range-string")
    ([&service]() {
        return guarded("highest-range-string", [&] {
            return ranking_text_response(service.ranked_by_symbol());
        });
    });

    CROW_ROUTE(app, "/api/cryptos/<string>/highest-normalized-range")
    ([&service](std::string date) {
        return guarded("highest-normalized-range", [&] {
            return day_response(service.highest_range_for_day(date));
        });
    });

    CROW_ROUTE(app, "/api/cryptos/<string>/highest-normalized-range-string")
    ([&service](std::string date) {
        return guarded("highest-normalized-range-string", [&] {
            return day_text_response(service.highest_range_for_day(date));
        });
    });
}

}
