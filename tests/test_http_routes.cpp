#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cryptostats/api/http_routes.hpp"
#include "cryptostats/report/internal_price_repository.hpp"
#include "cryptostats/util/simulated_clock.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace cryptostats;
using namespace cryptostats::report;
using namespace cryptostats::api;
using cryptostats::test::add_range;
using cryptostats::test::JAN_1_2022;
using cryptostats::test::ONE_HOUR;
using cryptostats::util::SimulatedClock;

namespace {

crow::response get(App& app, const std::string& url, const std::string& clientAddress = "10.0.0.1")
{
    crow::request req;
    req.method            = crow::HTTPMethod::Get;
    req.url               = url;
    req.raw_url           = url;
    req.remote_ip_address = clientAddress;

    crow::response res;
    app.handle_full(req, res);
    return res;
}

// every read fails, to reach the handler error path
class FailingRepository : public IPriceRepository {
public:
    void upsert(const std::vector<PriceObservation>&) override {}

    std::vector<PriceObservation> find_by_symbol(const Symbol&) const override
    {
        throw std::runtime_error("store unavailable");
    }

    std::vector<PriceObservation> find_by_timestamp_range(Timestamp, Timestamp) const override
    {
        throw std::runtime_error("store unavailable");
    }

    std::vector<PriceObservation> find_all() const override
    {
        throw std::runtime_error("store unavailable");
    }

    std::size_t size() const override { return 0; }
};

}

class HttpRoutesTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        std::vector<PriceObservation> data;
        add_range(data, "BTC", JAN_1_2022, "46813.21", "47000.00");
        add_range(data, "ETH", JAN_1_2022 + 2 * ONE_HOUR, "3715.32", "3800.00");
        repo.upsert(data);

        register_routes(app, service);
        app.validate();
    }

    InternalPriceRepository repo;
    ReportService           service{repo};
    App                     app;
};

TEST_F(HttpRoutesTest, StatsRoute)
{
    const auto found = get(app, "/api/cryptos/BTC/stats");
    EXPECT_EQ(found.code, 200);
    const auto body = crow::json::load(found.body);
    ASSERT_TRUE(body);
    EXPECT_EQ(std::string(body["symbol"].s()), "BTC");

    EXPECT_EQ(get(app, "/api/cryptos/ADA/stats").code, 404);
    EXPECT_EQ(get(app, "/api/cryptos/BTC/stats-string").code, 200);
    EXPECT_EQ(get(app, "/api/cryptos/ADA/stats-string").code, 404);
}

TEST_F(HttpRoutesTest, RankingRoutes)
{
    const auto ranking = get(app, "/api/cryptos/ranking");
    EXPECT_EQ(ranking.code, 200);
    const auto body = crow::json::load(ranking.body);
    ASSERT_TRUE(body);
    EXPECT_EQ(body.size(), 2u);

    const auto top = get(app, "/api/cryptos/highest-range");
    EXPECT_EQ(top.code, 200);
    const auto topBody = crow::json::load(top.body);
    ASSERT_TRUE(topBody);
    EXPECT_EQ(std::string(topBody["symbol"].s()), "ETH");

    EXPECT_EQ(get(app, "/api/cryptos/highest-range-string").code, 200);
}

TEST_F(HttpRoutesTest, DayRoutesMapStatusCodes)
{
    const auto found = get(app, "/api/cryptos/2022-01-01/highest-normalized-range");
    EXPECT_EQ(found.code, 200);
    const auto body = crow::json::load(found.body);
    ASSERT_TRUE(body);
    EXPECT_EQ(std::string(body["symbol"].s()), "ETH");
    EXPECT_EQ(std::string(body["date"].s()), "2022-01-01");

    EXPECT_EQ(get(app, "/api/cryptos/2022-03-01/highest-normalized-range").code, 404);
    EXPECT_EQ(get(app, "/api/cryptos/01-01-2022/highest-normalized-range").code, 400);

    EXPECT_EQ(get(app, "/api/cryptos/2022-01-01/highest-normalized-range-string").code, 200);
    EXPECT_EQ(get(app, "/api/cryptos/2022-03-01/highest-normalized-range-string").code, 404);
    EXPECT_EQ(get(app, "/api/cryptos/2022-02-30/highest-normalized-range-string").code, 400);
}

TEST_F(HttpRoutesTest, UnknownPathIs404)
{
    EXPECT_EQ(get(app, "/api/cryptos").code, 404);
}

TEST(HttpRoutesErrorTest, HandlerFailureIs500)
{
    FailingRepository repo;
    ReportService service(repo);
    App app;
    register_routes(app, service);
    app.validate();

    EXPECT_EQ(get(app, "/api/cryptos/BTC/stats").code, 500);
    EXPECT_EQ(get(app, "/api/cryptos/ranking").code, 500);
    EXPECT_EQ(get(app, "/api/cryptos/2022-01-01/highest-normalized-range").code, 500);
}

class RateLimitMiddlewareTest : public ::testing::Test {
protected:
    void before(const std::string& clientAddress, crow::response& res)
    {
        crow::request req;
        req.url               = "/api/cryptos/ranking";
        req.remote_ip_address = clientAddress;

        RateLimitMiddleware::context ctx;
        middleware.before_handle(req, res, ctx);
    }

    bool passes(const std::string& clientAddress)
    {
        crow::response res;
        before(clientAddress, res);
        return !res.is_completed() && res.code == 200;
    }

    SimulatedClock      clock{util::Timestamp::from_millis(JAN_1_2022)};
    RateLimiter         limiter{clock, 3, std::chrono::milliseconds(60s)};
    RateLimitMiddleware middleware;
};

TEST_F(RateLimitMiddlewareTest, PassesThroughWithoutLimiter)
{
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(passes("10.0.0.1")) << "request " << i;
    }
}

TEST_F(RateLimitMiddlewareTest, RequestOverCapacityGets429)
{
    middleware.limiter = &limiter;

    for (std::uint32_t i = 0; i < limiter.capacity(); ++i) {
        EXPECT_TRUE(passes("10.0.0.1")) << "request " << i;
    }

    crow::response refused;
    before("10.0.0.1", refused);
    EXPECT_TRUE(refused.is_completed());
    EXPECT_EQ(refused.code, 429);
    EXPECT_EQ(refused.body, "Rate limit exceeded! Please try again later.");

    EXPECT_TRUE(passes("10.0.0.2"));

    clock.advance_time(20s);
    EXPECT_TRUE(passes("10.0.0.1"));
}
