#include <gtest/gtest.h>
#include "vantage/primitives.hpp"
#include "series_fixtures.hpp"
#include <cmath>
#include <vector>

using namespace vantage;
using namespace vantage::indicators;

// ============================================================================
// MOVING AVERAGES
// ============================================================================

TEST(PrimitivesTest, SimpleMovingAverageWarmup) {
    std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 5.0};
    auto sma = simple_moving_average(values, 3);

    ASSERT_EQ(sma.size(), 5u);
    EXPECT_FALSE(sma[0].has_value());
    EXPECT_FALSE(sma[1].has_value());
    EXPECT_DOUBLE_EQ(*sma[2], 2.0);
    EXPECT_DOUBLE_EQ(*sma[3], 3.0);
    EXPECT_DOUBLE_EQ(*sma[4], 4.0);
}

TEST(PrimitivesTest, SimpleMovingAverageShortInput) {
    std::vector<double> values = {1.0, 2.0};
    auto sma = simple_moving_average(values, 3);

    ASSERT_EQ(sma.size(), 2u);
    EXPECT_FALSE(sma[0].has_value());
    EXPECT_FALSE(sma[1].has_value());

    EXPECT_TRUE(simple_moving_average(std::vector<double>{}, 3).empty());
}

TEST(PrimitivesTest, SimpleMovingAverageOverPartialInput) {
    Values values = {std::nullopt, 2.0, 4.0, std::nullopt, 6.0, 8.0, 10.0};
    auto sma = simple_moving_average(values, 2);

    EXPECT_FALSE(sma[1].has_value());
    EXPECT_DOUBLE_EQ(*sma[2], 3.0);
    // A gap inside the window leaves it undefined
    EXPECT_FALSE(sma[3].has_value());
    EXPECT_FALSE(sma[4].has_value());
    EXPECT_DOUBLE_EQ(*sma[5], 7.0);
    EXPECT_DOUBLE_EQ(*sma[6], 9.0);
}

TEST(PrimitivesTest, ExponentialMovingAverageSeedsWithFirstValue) {
    std::vector<double> values = {10.0, 11.0, 12.0, 13.0};
    auto ema = exponential_moving_average(values, 3);

    // k = 2 / (3 + 1) = 0.5
    ASSERT_EQ(ema.size(), 4u);
    EXPECT_DOUBLE_EQ(*ema[0], 10.0);
    EXPECT_DOUBLE_EQ(*ema[1], 10.5);
    EXPECT_DOUBLE_EQ(*ema[2], 11.25);
    EXPECT_DOUBLE_EQ(*ema[3], 12.125);
}

TEST(PrimitivesTest, ExponentialMovingAverageDefinedEverywhere) {
    std::vector<double> values = {5.0, 6.0};
    auto ema = exponential_moving_average(values, 26);

    EXPECT_TRUE(ema[0].has_value());
    EXPECT_TRUE(ema[1].has_value());
}

// ============================================================================
// DISPERSION AND WINDOW EXTREMES
// ============================================================================

TEST(PrimitivesTest, RollingStdDevIsPopulation) {
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    auto std_dev = rolling_std_dev(values, 8);

    // Classic example: population sigma = 2
    EXPECT_FALSE(std_dev[6].has_value());
    EXPECT_DOUBLE_EQ(*std_dev[7], 2.0);
}

TEST(PrimitivesTest, RollingStdDevOfConstantIsZero) {
    std::vector<double> values(30, 100.0);
    auto std_dev = rolling_std_dev(values, 20);

    for (size_t i = 19; i < values.size(); ++i) {
        ASSERT_TRUE(std_dev[i].has_value());
        EXPECT_EQ(*std_dev[i], 0.0);
    }
}

TEST(PrimitivesTest, RollingStdDevOfInexactConstantIsZero) {
    std::vector<double> values(30, 44.1);
    auto std_dev = rolling_std_dev(values, 20);

    for (size_t i = 19; i < values.size(); ++i) {
        EXPECT_EQ(*std_dev[i], 0.0) << "index " << i;
    }
}

TEST(PrimitivesTest, RollingExtremes) {
    std::vector<double> values = {3.0, 1.0, 4.0, 1.0, 5.0, 9.0, 2.0};
    auto highest = rolling_max(values, 3);
    auto lowest = rolling_min(values, 3);

    EXPECT_FALSE(highest[1].has_value());
    EXPECT_DOUBLE_EQ(*highest[2], 4.0);
    EXPECT_DOUBLE_EQ(*highest[6], 9.0);
    EXPECT_DOUBLE_EQ(*lowest[2], 1.0);
    EXPECT_DOUBLE_EQ(*lowest[6], 2.0);
}

// ============================================================================
// TRUE RANGE
// ============================================================================

TEST(PrimitivesTest, TrueRangeWithoutPreviousClose) {
    EXPECT_DOUBLE_EQ(true_range(12.0, 10.0, std::nullopt), 2.0);
}

TEST(PrimitivesTest, TrueRangeUsesGaps) {
    // Gap up: previous close far below the bar
    EXPECT_DOUBLE_EQ(true_range(12.0, 11.0, 8.0), 4.0);
    // Gap down
    EXPECT_DOUBLE_EQ(true_range(9.0, 8.0, 12.0), 4.0);
    // Inside bar
    EXPECT_DOUBLE_EQ(true_range(12.0, 9.0, 10.0), 3.0);
}

TEST(PrimitivesTest, TrueRangeSeries) {
    auto series = vantage::testing::series_from_closes({10.0, 14.0, 13.0}, 0.5);
    auto tr = true_range_series(series);

    ASSERT_EQ(tr.size(), 3u);
    EXPECT_DOUBLE_EQ(tr[0], 1.0);          // high - low
    EXPECT_DOUBLE_EQ(tr[1], 4.5);          // 14.5 - 10
    EXPECT_DOUBLE_EQ(tr[2], 1.5);          // |12.5 - 14|
}

TEST(PrimitivesTest, WilderSmoothing) {
    EXPECT_DOUBLE_EQ(wilder_smooth(10.0, 24.0, 14), (10.0 * 13 + 24.0) / 14);
}
