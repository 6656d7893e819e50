#include <gtest/gtest.h>
#include "tracker/market_data/price_quantizer.hpp"
#include <cmath>
#include <limits>

using namespace FtseTracker::Core;

TEST(PriceQuantizerTest, RoundsToNearestQuarter) {
    EXPECT_DOUBLE_EQ(round_to_quarter(1637.12), 1637.0);
    EXPECT_DOUBLE_EQ(round_to_quarter(1637.13), 1637.25);
    EXPECT_DOUBLE_EQ(round_to_quarter(1637.40), 1637.5);
    EXPECT_DOUBLE_EQ(round_to_quarter(1637.70), 1637.75);
    EXPECT_DOUBLE_EQ(round_to_quarter(1637.99), 1638.0);
}

TEST(PriceQuantizerTest, BandLowerBoundsAreInclusive) {
    EXPECT_DOUBLE_EQ(round_to_quarter(100.0), 100.0);
    EXPECT_DOUBLE_EQ(round_to_quarter(100.125), 100.25);
    EXPECT_DOUBLE_EQ(round_to_quarter(100.375), 100.5);
    EXPECT_DOUBLE_EQ(round_to_quarter(100.625), 100.75);
    EXPECT_DOUBLE_EQ(round_to_quarter(100.875), 101.0);
}

TEST(PriceQuantizerTest, QuarterValuesAreFixedPoints) {
    for (double value : {1637.0, 1637.25, 1637.5, 1637.75}) {
        EXPECT_DOUBLE_EQ(round_to_quarter(value), value);
        EXPECT_DOUBLE_EQ(round_to_quarter(round_to_quarter(value)), value);
    }
}

TEST(PriceQuantizerTest, NegativeValuesUseFloorForTheFraction) {
    // floor(-0.9) = -1, fraction 0.1 -> -1.0
    EXPECT_DOUBLE_EQ(round_to_quarter(-0.9), -1.0);
    // floor(-0.3) = -1, fraction 0.7 -> -0.25
    EXPECT_DOUBLE_EQ(round_to_quarter(-0.3), -0.25);
}

TEST(PriceQuantizerTest, NonFiniteInputIsReturnedUnchanged) {
    EXPECT_TRUE(std::isnan(round_to_quarter(std::numeric_limits<double>::quiet_NaN())));
    double infinity = std::numeric_limits<double>::infinity();
    EXPECT_EQ(round_to_quarter(infinity), infinity);
}
