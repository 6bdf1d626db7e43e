#include "cryptostats/api/rate_limit_middleware.hpp"

namespace cryptostats::api {

namespace {
constexpr int HTTP_TOO_MANY_REQUESTS = 429;
}

void RateLimitMiddleware::before_handle(crow::request& req, crow::response& res, context& /*ctx*/)
{
    if (!limiter) return;

    if (!limiter->try_consume(req.remote_ip_address)) {
        res.code = HTTP_TOO_MANY_REQUESTS;
        res.set_header("Content-Type", "text/plain; charset=utf-8");
        res.write("Rate limit exceeded! Please try again later.");
        res.end();
    }
}

void RateLimitMiddleware::after_handle(crow::request& /*req*/, crow::response& /*res*/, context& /*ctx*/)
{
}

}
