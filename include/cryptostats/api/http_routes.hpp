#ifndef HTTP_ROUTES_HPP
#define HTTP_ROUTES_HPP

#include <crow.h>

#include "cryptostats/api/rate_limit_middleware.hpp"
#include "cryptostats/report/report_service.hpp"

namespace cryptostats::api {

using App = crow::App<RateLimitMiddleware>;

// Registers every /api/cryptos route. `service` must outlive `app`.
void register_routes(App& app, const report::ReportService& service);

}

#endif
