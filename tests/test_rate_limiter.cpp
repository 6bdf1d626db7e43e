#include <chrono>
#include <stdexcept>

#include <gtest/gtest.h>

#include "cryptostats/api/rate_limiter.hpp"
#include "cryptostats/util/simulated_clock.hpp"

using namespace std::chrono_literals;
using cryptostats::api::RateLimiter;
using cryptostats::util::SimulatedClock;
using cryptostats::util::Timestamp;

class RateLimiterTest : public ::testing::Test {
protected:
    SimulatedClock clock{Timestamp::from_millis(1640995200000)};
    RateLimiter limiter{clock, 10, std::chrono::milliseconds(60s)};
};

TEST_F(RateLimiterTest, AllowsCapacityThenRefuses)
{
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.try_consume("10.0.0.1")) << "request " << i;
    }
    EXPECT_FALSE(limiter.try_consume("10.0.0.1"));
    EXPECT_EQ(limiter.available("10.0.0.1"), 0u);
}

TEST_F(RateLimiterTest, RefillsGreedilyOverTheWindow)
{
    for (int i = 0; i < 10; ++i) limiter.try_consume("10.0.0.1");

    clock.advance_time(3s);
    EXPECT_FALSE(limiter.try_consume("10.0.0.1"));

    clock.advance_time(3s);
    EXPECT_TRUE(limiter.try_consume("10.0.0.1"));
    EXPECT_FALSE(limiter.try_consume("10.0.0.1"));

    clock.advance_time(10min);
    EXPECT_EQ(limiter.available("10.0.0.1"), 10u);
}

TEST_F(RateLimiterTest, AddressesHaveIndependentBuckets)
{
    for (int i = 0; i < 10; ++i) limiter.try_consume("10.0.0.1");

    EXPECT_FALSE(limiter.try_consume("10.0.0.1"));
    EXPECT_TRUE(limiter.try_consume("10.0.0.2"));
    EXPECT_EQ(limiter.available("10.0.0.2"), 9u);
    EXPECT_EQ(limiter.tracked_clients(), 2u);
}

TEST_F(RateLimiterTest, UnseenAddressReportsFullCapacity)
{
    EXPECT_EQ(limiter.available("192.168.1.7"), limiter.capacity());
    EXPECT_EQ(limiter.tracked_clients(), 0u);
}

TEST_F(RateLimiterTest, IdleBucketsAreDroppedAfterAWindow)
{
    limiter.try_consume("10.0.0.1");
    limiter.try_consume("10.0.0.2");
    EXPECT_EQ(limiter.tracked_clients(), 2u);

    clock.advance_time(30s);
    limiter.try_consume("10.0.0.2");
    EXPECT_EQ(limiter.tracked_clients(), 2u);

    clock.advance_time(31s);
    EXPECT_TRUE(limiter.try_consume("10.0.0.3"));
    EXPECT_EQ(limiter.tracked_clients(), 2u);
    EXPECT_EQ(limiter.available("10.0.0.1"), 10u);

    clock.advance_time(60s);
    EXPECT_EQ(limiter.evict_idle(), 2u);
    EXPECT_EQ(limiter.tracked_clients(), 0u);
}

TEST_F(RateLimiterTest, ActiveBucketsSurviveTheSweep)
{
    for (int i = 0; i < 10; ++i) limiter.try_consume("10.0.0.1");

    clock.advance_time(59s);
    EXPECT_EQ(limiter.evict_idle(), 0u);
    EXPECT_EQ(limiter.tracked_clients(), 1u);
    EXPECT_EQ(limiter.available("10.0.0.1"), 9u);
}

TEST(RateLimiterConfigTest, RejectsEmptyLimits)
{
    SimulatedClock clock;
    EXPECT_THROW(RateLimiter(clock, 0, std::chrono::milliseconds(60000)), std::invalid_argument);
    EXPECT_THROW(RateLimiter(clock, 10, std::chrono::milliseconds(0)), std::invalid_argument);
}
