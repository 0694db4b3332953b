#include <gtest/gtest.h>
#include "vantage/analysis_session.hpp"
#include "series_fixtures.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <vector>

using namespace vantage;
using namespace vantage::analysis;
using vantage::testing::random_walk;
using vantage::testing::series_from_closes;

TEST(AnalysisSessionTest, EmptySeriesThrows) {
    AnalysisConfig config;
    EXPECT_THROW(AnalysisEngine::run(Series{}, config), EmptyInputError);
    EXPECT_THROW(AnalysisEngine::analyze(Series{}, config), EmptyInputError);
}

TEST(AnalysisSessionTest, InvalidConfigThrows) {
    AnalysisConfig config;
    config.macd.fast_period = 40;
    EXPECT_THROW(AnalysisEngine::run(random_walk(50), config), ConfigError);
}

TEST(AnalysisSessionTest, PeriodLongerThanHistory) {
    auto config = parse_config({{"RSI.period", std::to_string(std::numeric_limits<size_t>::max())}});
    auto table = AnalysisEngine::run(random_walk(30), config);

    EXPECT_EQ(table.size(), 30u);
    EXPECT_TRUE(table.column(Column::Rsi).all_undefined());
}

TEST(AnalysisSessionTest, SummaryValidatesConfig) {
    const auto series = random_walk(30);
    const AnalysisConfig defaults;
    const auto table = AnalysisEngine::run(series, defaults);

    AnalysisConfig config;
    config.statistics.range_lookback = 0;
    EXPECT_THROW(build_summary(series, table, {}, config), ConfigError);

    config = AnalysisConfig{};
    config.statistics.average_volume_window = 0;
    EXPECT_THROW(build_summary(series, table, {}, config), ConfigError);

    EXPECT_NO_THROW(build_summary(series, table, {}, defaults));
}

TEST(AnalysisSessionTest, EveryColumnAligned) {
    const auto series = random_walk(300);
    auto table = AnalysisEngine::run(series, AnalysisConfig{});

    ASSERT_EQ(table.size(), series.size());
    EXPECT_EQ(table.dates().front(), series.front().date);
    EXPECT_EQ(table.dates().back(), series.back().date);

    for (Column column : all_columns()) {
        EXPECT_EQ(table.column(column).size(), series.size()) << column_name(column);
        EXPECT_EQ(table.column(column).name(), column_name(column));
    }

    // Configured periods plus the trend pair
    std::set<size_t> periods;
    for (const auto& [period, ma] : table.moving_averages()) {
        periods.insert(period);
        EXPECT_EQ(ma.size(), series.size());
        EXPECT_EQ(ma.name(), moving_average_name(period));
    }
    EXPECT_EQ(periods, (std::set<size_t>{20, 50, 200}));
}

TEST(AnalysisSessionTest, ColumnsMatchInputs) {
    const auto series = random_walk(60);
    auto table = AnalysisEngine::run(series, AnalysisConfig{});

    for (size_t i = 0; i < series.size(); ++i) {
        EXPECT_EQ(*table.column(Column::Close)[i], series[i].close);
        EXPECT_EQ(*table.column(Column::Volume)[i], static_cast<double>(series[i].volume));

        const auto trend = table.column(Column::SarTrend)[i];
        ASSERT_TRUE(trend.has_value());
        EXPECT_TRUE(*trend == 1.0 || *trend == -1.0);
    }

    EXPECT_FALSE(table.column(Column::VolumeMa)[18].has_value());
    EXPECT_TRUE(table.column(Column::VolumeMa)[19].has_value());
}

TEST(AnalysisSessionTest, RunIsDeterministic) {
    const auto series = random_walk(250, 99);
    AnalysisConfig config;

    auto first = AnalysisEngine::run(series, config);
    auto second = AnalysisEngine::run(series, config);
    EXPECT_TRUE(first == second);
}

TEST(AnalysisSessionTest, TrendPeriodsAlwaysComputed) {
    AnalysisConfig config;
    config.moving_averages.periods = {10};
    config.moving_averages.trend_fast_period = 5;
    config.moving_averages.trend_slow_period = 15;

    auto table = AnalysisEngine::run(random_walk(40), config);
    EXPECT_NE(table.moving_average(5), nullptr);
    EXPECT_NE(table.moving_average(10), nullptr);
    EXPECT_NE(table.moving_average(15), nullptr);
    EXPECT_EQ(table.moving_average(20), nullptr);
}

TEST(AnalysisSessionTest, MinimalSeries) {
    const auto series = random_walk(5);
    auto report = AnalysisEngine::analyze(series, AnalysisConfig{});

    EXPECT_EQ(report.table.size(), 5u);
    EXPECT_TRUE(report.table.column(Column::Rsi).all_undefined());
    EXPECT_TRUE(report.table.column(Column::Adx).all_undefined());
    EXPECT_TRUE(report.table.column(Column::Obv).last().has_value());

    // Only the volume rule could fire, and its average is undefined too
    EXPECT_TRUE(report.signals.empty());
    EXPECT_EQ(report.summary.trend, TrendState::Unknown);
    EXPECT_FALSE(report.summary.rsi.has_value());
    EXPECT_TRUE(report.levels.supports.empty());
    EXPECT_TRUE(report.levels.resistances.empty());
    EXPECT_FALSE(report.fibonacci.has_value());
    EXPECT_GE(report.calc_time_ns, 0);
}

TEST(AnalysisSessionTest, SingleBar) {
    auto report = AnalysisEngine::analyze(series_from_closes({42.0}), AnalysisConfig{});

    EXPECT_EQ(report.summary.data_points, 1u);
    EXPECT_DOUBLE_EQ(report.summary.last_price, 42.0);
    EXPECT_FALSE(report.summary.change_pct.has_value());
    EXPECT_FALSE(report.summary.volatility.has_value());
    EXPECT_FALSE(report.summary.sar.has_value());
    EXPECT_DOUBLE_EQ(report.pivots.pivot, 42.0);
}

TEST(AnalysisSessionTest, SummaryFields) {
    std::vector<double> closes;
    for (int i = 0; i < 60; ++i) {
        closes.push_back(100.0 + i);
    }
    const auto series = series_from_closes(closes, 0.5, 2000);
    auto report = AnalysisEngine::analyze(series, AnalysisConfig{});
    const auto& summary = report.summary;

    EXPECT_EQ(summary.last_date, series.back().date);
    EXPECT_DOUBLE_EQ(summary.last_price, 159.0);
    EXPECT_NEAR(*summary.change_pct, 100.0 / 158.0, 1e-12);
    EXPECT_EQ(summary.last_volume, 2000u);
    EXPECT_DOUBLE_EQ(summary.average_volume, 2000.0);
    EXPECT_DOUBLE_EQ(summary.period_high, 159.5);
    EXPECT_DOUBLE_EQ(summary.period_low, 99.5);
    EXPECT_EQ(summary.data_points, 60u);
    ASSERT_TRUE(summary.volatility.has_value());
    EXPECT_GT(*summary.volatility, 0.0);

    EXPECT_DOUBLE_EQ(*summary.rsi, 100.0);
    EXPECT_DOUBLE_EQ(*summary.volume_ratio, 1.0);
    EXPECT_EQ(summary.trend, TrendState::Bullish);
    EXPECT_TRUE(summary.moving_averages.at(50).has_value());
    EXPECT_FALSE(summary.moving_averages.at(200).has_value());

    // Overbought RSI and the MA20/MA50 trend fire together
    ASSERT_GE(summary.signals.size(), 2u);
    EXPECT_EQ(summary.signals[0].kind, signals::SignalKind::RsiOverbought);
    EXPECT_EQ(summary.signals[1].kind, signals::SignalKind::BullishTrend);
    EXPECT_EQ(summary.signals.size(), report.signals.size());
}

TEST(AnalysisSessionTest, FibonacciNeedsBothSwings) {
    AnalysisConfig config;
    config.fibonacci.swing_high = 130.0;
    auto partial = AnalysisEngine::analyze(random_walk(30), config);
    EXPECT_FALSE(partial.fibonacci.has_value());

    config.fibonacci.swing_low = 90.0;
    auto full = AnalysisEngine::analyze(random_walk(30), config);
    ASSERT_TRUE(full.fibonacci.has_value());
    EXPECT_EQ(full.fibonacci->size(), config.fibonacci.ratios.size());
    EXPECT_DOUBLE_EQ(full.fibonacci->front().price, 130.0);
}

TEST(AnalysisSessionTest, PivotsFromLastBar) {
    const auto series = random_walk(40);
    auto report = AnalysisEngine::analyze(series, AnalysisConfig{});

    const Bar& last = series.back();
    EXPECT_DOUBLE_EQ(report.pivots.pivot, (last.high + last.low + last.close) / 3.0);
}

// ============================================================================
// BATCH
// ============================================================================

TEST(AnalysisSessionTest, EngineThreadCount) {
    EXPECT_EQ(AnalysisEngine(3).num_threads(), 3u);
    EXPECT_GE(AnalysisEngine().num_threads(), 1u);
}

TEST(AnalysisSessionTest, BatchPreservesOrder) {
    std::vector<Series> batch;
    for (uint64_t s = 0; s < 9; ++s) {
        batch.push_back(random_walk(80 + s * 10, s));
    }

    AnalysisConfig config;
    AnalysisEngine engine(4);
    auto reports = engine.analyze_batch(batch, config);

    ASSERT_EQ(reports.size(), batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(reports[i].table.size(), batch[i].size());
        EXPECT_TRUE(reports[i].table == AnalysisEngine::run(batch[i], config));
    }
}

TEST(AnalysisSessionTest, BatchMatchesSingleThreaded) {
    std::vector<Series> batch;
    for (uint64_t s = 0; s < 6; ++s) {
        batch.push_back(random_walk(120, 1000 + s));
    }

    AnalysisConfig config;
    auto serial = AnalysisEngine(1).analyze_batch(batch, config);
    auto parallel = AnalysisEngine(8).analyze_batch(batch, config);

    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); ++i) {
        EXPECT_TRUE(serial[i].table == parallel[i].table);
    }
}

TEST(AnalysisSessionTest, EmptyBatch) {
    AnalysisEngine engine(2);
    EXPECT_TRUE(engine.analyze_batch({}, AnalysisConfig{}).empty());
}

TEST(AnalysisSessionTest, BatchPropagatesErrors) {
    std::vector<Series> batch = {random_walk(30), Series{}, random_walk(30)};
    AnalysisEngine engine(2);
    EXPECT_THROW(engine.analyze_batch(batch, AnalysisConfig{}), EmptyInputError);
}

TEST(AnalysisSessionTest, ColumnCatalogue) {
    const auto& columns = all_columns();
    ASSERT_EQ(columns.size(), COLUMN_COUNT);
    EXPECT_EQ(column_name(columns.front()), "CLOSE");
    EXPECT_EQ(column_name(columns.back()), "ICHIMOKU_LAGGING");

    std::set<std::string_view> names;
    for (Column column : columns) {
        names.insert(column_name(column));
    }
    EXPECT_EQ(names.size(), COLUMN_COUNT);
}

TEST(AnalysisSessionTest, TrendStateNames) {
    EXPECT_EQ(to_string(TrendState::Bullish), "bullish");
    EXPECT_EQ(to_string(TrendState::Unknown), "unknown");
}
