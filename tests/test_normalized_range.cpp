#include <gtest/gtest.h>

#include "cryptostats/core/decimal.hpp"
#include "cryptostats/report/normalized_range.hpp"

using namespace cryptostats;
using namespace cryptostats::report;
using cryptostats::core::to_fixed_string;

TEST(NormalizedRangeTest, BtcRangeAtReportScale)
{
    const Decimal r = normalized_range(Price("34875.00"), Price("47222.66"), REPORT_SCALE);
    EXPECT_EQ(to_fixed_string(r, REPORT_SCALE), "0.354");
}

TEST(NormalizedRangeTest, DefaultScaleIsReportScale)
{
    EXPECT_EQ(normalized_range(Price("34875.00"), Price("47222.66")), Decimal("0.354"));
}

TEST(NormalizedRangeTest, RankingScaleKeepsTenDigits)
{
    const Decimal btc = normalized_range(Price("34875.00"), Price("47222.66"), RANKING_SCALE);
    const Decimal eth = normalized_range(Price("2336.52"), Price("3823.82"), RANKING_SCALE);

    EXPECT_EQ(to_fixed_string(btc, RANKING_SCALE), "0.3540547670");
    EXPECT_EQ(to_fixed_string(eth, RANKING_SCALE), "0.6365449472");
    EXPECT_GT(eth, btc);
}

TEST(NormalizedRangeTest, RoundsHalfUp)
{
    EXPECT_EQ(normalized_range(Price("1"), Price("1.0015"), 3), Decimal("0.002"));
    EXPECT_EQ(normalized_range(Price("1"), Price("1.0014"), 3), Decimal("0.001"));
    EXPECT_EQ(normalized_range(Price("3"), Price("5"), 10), Decimal("0.6666666667"));
}

TEST(NormalizedRangeTest, RoundsHalfUpWhenQuotientDoesNotTerminate)
{
    EXPECT_EQ(normalized_range(Price("7"), Price("7.0035"), 3), Decimal("0.001"));
    EXPECT_EQ(to_fixed_string(normalized_range(Price("7"), Price("7.0035"), 3), 3), "0.001");
    EXPECT_EQ(normalized_range(Price("3"), Price("3.0015"), 3), Decimal("0.001"));
    EXPECT_EQ(normalized_range(Price("7"), Price("7.00000000035"), RANKING_SCALE), Decimal("0.0000000001"));
}

TEST(NormalizedRangeTest, FlatSeriesIsZero)
{
    EXPECT_EQ(normalized_range(Price("46813.21"), Price("46813.21"), RANKING_SCALE), Decimal(0));
}

TEST(NormalizedRangeTest, ZeroMinimumIsGuarded)
{
    EXPECT_EQ(normalized_range(Price(0), Price("12.5"), REPORT_SCALE), Decimal(0));
    EXPECT_EQ(normalized_range(Price(0), Price(0), RANKING_SCALE), Decimal(0));
}

TEST(NormalizedRangeTest, NeverNegativeForValidRanges)
{
    const char* pairs[][2] = {
        {"0.0001", "0.0001"}, {"0.0001", "1"}, {"1", "2"}, {"46797.61", "46813.21"}, {"2336.52", "3823.82"}
    };
    for (const auto& p : pairs) {
        EXPECT_GE(normalized_range(Price(p[0]), Price(p[1]), RANKING_SCALE), Decimal(0));
    }
}
