#include <gtest/gtest.h>
#include "vantage/trend_indicators.hpp"
#include "series_fixtures.hpp"
#include <vector>

using namespace vantage;
using namespace vantage::indicators;
using vantage::testing::series_from_closes;

namespace {

// 30 rising closes 100..129 followed by 30 falling closes 128..99
Series rise_then_fall() {
    std::vector<double> closes;
    for (int i = 0; i < 30; ++i) {
        closes.push_back(100.0 + i);
    }
    for (int i = 0; i < 30; ++i) {
        closes.push_back(128.0 - i);
    }
    return series_from_closes(closes, 0.5);
}

} // namespace

TEST(ParabolicSarTest, InitialState) {
    const auto series = rise_then_fall();
    auto state = initial_parabolic_sar(series[0], ParabolicSarParams{});

    EXPECT_EQ(state.trend, Trend::Bullish);
    EXPECT_DOUBLE_EQ(state.sar, 99.5);
    EXPECT_DOUBLE_EQ(state.extreme_point, 100.5);
    EXPECT_DOUBLE_EQ(state.acceleration_factor, 0.02);
}

TEST(ParabolicSarTest, AccelerationStepsOnNewExtreme) {
    const auto series = rise_then_fall();
    const ParabolicSarParams params;

    auto state = initial_parabolic_sar(series[0], params);
    state = advance_parabolic_sar(state, series[1], params);

    EXPECT_EQ(state.trend, Trend::Bullish);
    EXPECT_DOUBLE_EQ(state.sar, 99.52);
    EXPECT_DOUBLE_EQ(state.extreme_point, 101.5);
    EXPECT_DOUBLE_EQ(state.acceleration_factor, 0.04);

    state = advance_parabolic_sar(state, series[2], params);
    EXPECT_NEAR(state.sar, 99.5992, 1e-9);
    EXPECT_DOUBLE_EQ(state.acceleration_factor, 0.06);
}

TEST(ParabolicSarTest, AccelerationIsCapped) {
    const auto series = rise_then_fall();
    const ParabolicSarParams params;

    auto state = initial_parabolic_sar(series[0], params);
    for (size_t i = 1; i < 30; ++i) {
        state = advance_parabolic_sar(state, series[i], params);
        EXPECT_LE(state.acceleration_factor, params.max_acceleration + 1e-12);
    }
    EXPECT_DOUBLE_EQ(state.acceleration_factor, 0.2);
}

TEST(ParabolicSarTest, SingleReversalOnPeak) {
    const auto series = rise_then_fall();
    auto result = calculate_parabolic_sar(series);

    ASSERT_EQ(result.sar.size(), 60u);

    std::vector<size_t> flips;
    for (size_t i = 1; i < result.trend.size(); ++i) {
        if (*result.trend[i] != *result.trend[i - 1]) {
            flips.push_back(i);
        }
    }
    ASSERT_EQ(flips, (std::vector<size_t>{32}));

    EXPECT_EQ(*result.trend[31], Trend::Bullish);
    EXPECT_EQ(*result.trend[32], Trend::Bearish);
    EXPECT_EQ(*result.trend[59], Trend::Bearish);

    // Reversal places the SAR at the prior extreme, the highest high
    EXPECT_DOUBLE_EQ(*result.sar[32], 129.5);
    EXPECT_NEAR(*result.sar[31], 126.29483373662211, 1e-9);
    EXPECT_NEAR(*result.sar[33], 129.42, 1e-9);
    EXPECT_NEAR(*result.sar[34], 129.2232, 1e-9);
    EXPECT_NEAR(*result.sar[35], 128.879808, 1e-9);
}

TEST(ParabolicSarTest, ReversalWhenProjectionCrossesBar) {
    const auto series = rise_then_fall();
    const ParabolicSarParams params;

    auto state = initial_parabolic_sar(series[0], params);
    for (size_t i = 1; i < series.size(); ++i) {
        const double projection = projected_sar(state);
        const auto next = advance_parabolic_sar(state, series[i], params);

        if (state.trend == Trend::Bullish) {
            EXPECT_EQ(next.trend == Trend::Bearish, projection > series[i].low) << "bar " << i;
        } else {
            EXPECT_EQ(next.trend == Trend::Bullish, projection < series[i].high) << "bar " << i;
        }

        // The stop stays on the correct side of the bar
        if (next.trend == Trend::Bullish) {
            EXPECT_LE(next.sar, series[i].low);
        } else {
            EXPECT_GE(next.sar, series[i].high);
        }
        state = next;
    }
}

TEST(ParabolicSarTest, BarByBarMatchesBatch) {
    const auto series = vantage::testing::random_walk(250);
    const ParabolicSarParams params{0.03, 0.25};
    auto batch = calculate_parabolic_sar(series, params);

    auto state = initial_parabolic_sar(series[0], params);
    EXPECT_EQ(*batch.sar[0], state.sar);
    for (size_t i = 1; i < series.size(); ++i) {
        state = advance_parabolic_sar(state, series[i], params);
        EXPECT_EQ(*batch.sar[i], state.sar);
        EXPECT_EQ(*batch.trend[i], state.trend);
    }
}

TEST(ParabolicSarTest, NeedsTwoBars) {
    auto single = calculate_parabolic_sar(series_from_closes({100.0}));
    ASSERT_EQ(single.sar.size(), 1u);
    EXPECT_FALSE(single.sar[0].has_value());
    EXPECT_FALSE(single.trend[0].has_value());

    auto empty = calculate_parabolic_sar(Series{});
    EXPECT_TRUE(empty.sar.empty());
}
