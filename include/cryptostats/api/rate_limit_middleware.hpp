#ifndef RATE_LIMIT_MIDDLEWARE_HPP
#define RATE_LIMIT_MIDDLEWARE_HPP

#include <crow.h>

#include "cryptostats/api/rate_limiter.hpp"

namespace cryptostats::api {

// Answers 429 before routing once a client address runs out of tokens.
// Requests pass through untouched while no limiter is attached.
struct RateLimitMiddleware {
    struct context {};

    RateLimiter* limiter = nullptr;

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);
};

}

#endif
