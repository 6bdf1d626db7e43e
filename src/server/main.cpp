#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

#include <crow.h>
#include <spdlog/spdlog.h>

#include "cryptostats/api/http_routes.hpp"
#include "cryptostats/api/rate_limiter.hpp"
#include "cryptostats/ingest/csv_price_loader.hpp"
#include "cryptostats/report/internal_price_repository.hpp"
#include "cryptostats/report/report_service.hpp"
#include "cryptostats/util/service_config.hpp"
#include "cryptostats/util/system_clock.hpp"

using namespace cryptostats;

int main(int argc, char* argv[]) {
    util::ServiceConfig config;
    try {
        config = util::ServiceConfig::from_args(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "cryptostats_server: " << e.what() << "\n";
        std::cerr << "usage: cryptostats_server [--port N] [--data-dir DIR] [--files A.csv,B.csv]"
                     " [--rate-limit N] [--rate-window SECONDS] [--log-level LEVEL]\n";
        return 2;
    }

    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    report::InternalPriceRepository repo;
    ingest::CsvPriceLoader loader;
    const auto summary = loader.load_into(repo, config.dataDir, config.files);
    if (summary.filesRead == 0) {
        spdlog::warn("no price files could be read from '{}', serving an empty dataset", config.dataDir);
    }

    report::ReportService reportService(repo);

    util::SystemClock clock;
    api::RateLimiter limiter(clock, config.rateLimit,
                             std::chrono::duration_cast<std::chrono::milliseconds>(config.rateWindow));

    api::App app;
    app.get_middleware<api::RateLimitMiddleware>().limiter = &limiter;
    app.loglevel(crow::LogLevel::Warning);

    api::register_routes(app, reportService);

    spdlog::info("serving {} observations on http://0.0.0.0:{}", repo.size(), config.port);
    spdlog::info("rate limit: {} requests per {}s per client", config.rateLimit, config.rateWindow.count());

    app.port(config.port).multithreaded().run();

    return 0;
}
