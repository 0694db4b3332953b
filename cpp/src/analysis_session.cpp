#include "vantage/analysis_session.hpp"
#include "vantage/primitives.hpp"
#include "vantage/technical_indicators.hpp"
#include "vantage/trend_indicators.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <numeric>
#include <set>
#include <thread>

namespace vantage::analysis {

namespace {

Values to_values(const std::vector<double>& raw) {
    return Values(raw.begin(), raw.end());
}

Values trend_to_values(const std::vector<std::optional<indicators::Trend>>& trend) {
    Values out(trend.size());
    for (size_t i = 0; i < trend.size(); ++i) {
        if (trend[i]) {
            out[i] = *trend[i] == indicators::Trend::Bullish ? 1.0 : -1.0;
        }
    }
    return out;
}

// Annualized population std dev of simple daily returns, in percent
Value annualized_volatility(const std::vector<double>& closes, size_t trading_days) {
    std::vector<double> returns;
    returns.reserve(closes.size());
    for (size_t i = 1; i < closes.size(); ++i) {
        if (closes[i - 1] != 0.0) {
            returns.push_back((closes[i] - closes[i - 1]) / closes[i - 1]);
        }
    }

    if (returns.size() < 2) {
        return std::nullopt;
    }

    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / returns.size();
    double sq_sum = 0.0;
    for (double r : returns) {
        sq_sum += (r - mean) * (r - mean);
    }

    return std::sqrt(sq_sum / returns.size()) * std::sqrt(static_cast<double>(trading_days)) * 100.0;
}

} // namespace

std::string_view to_string(TrendState trend) noexcept {
    switch (trend) {
        case TrendState::Bullish: return "bullish";
        case TrendState::Bearish: return "bearish";
        case TrendState::Unknown: return "unknown";
    }
    return "unknown";
}

AnalysisEngine::AnalysisEngine(unsigned int num_threads)
    : num_threads_(num_threads == 0 ? std::max(1u, std::thread::hardware_concurrency()) : num_threads) {
}

ResultTable AnalysisEngine::run(const Series& series, const AnalysisConfig& config) {
    if (series.empty()) {
        throw EmptyInputError("cannot analyze an empty series");
    }
    config.validate();

    std::vector<std::chrono::year_month_day> dates;
    dates.reserve(series.size());
    for (const auto& bar : series) {
        dates.push_back(bar.date);
    }

    ResultTable table(std::move(dates));

    const auto closes = series.closes();
    const auto volumes = series.volumes();

    table.set_column(Column::Close, to_values(closes));
    table.set_column(Column::Volume, to_values(volumes));

    // Moving averages, including the pair the trend rule compares
    std::set<size_t> ma_periods(config.moving_averages.periods.begin(), config.moving_averages.periods.end());
    ma_periods.insert(config.moving_averages.trend_fast_period);
    ma_periods.insert(config.moving_averages.trend_slow_period);
    for (size_t period : ma_periods) {
        table.set_moving_average(period, indicators::simple_moving_average(closes, period));
    }

    table.set_column(Column::Rsi, indicators::calculate_rsi(closes, config.rsi.period));

    auto macd = indicators::calculate_macd(
        closes, config.macd.fast_period, config.macd.slow_period, config.macd.signal_period);
    table.set_column(Column::Macd, std::move(macd.macd_line));
    table.set_column(Column::MacdSignal, std::move(macd.signal_line));
    table.set_column(Column::MacdHistogram, std::move(macd.histogram));

    auto bands = indicators::calculate_bollinger_bands(
        closes, config.bollinger.period, config.bollinger.std_dev_multiplier);
    table.set_column(Column::BollingerUpper, std::move(bands.upper));
    table.set_column(Column::BollingerMiddle, std::move(bands.middle));
    table.set_column(Column::BollingerLower, std::move(bands.lower));
    table.set_column(Column::BollingerBandwidth, std::move(bands.bandwidth));
    table.set_column(Column::BollingerPercentB, std::move(bands.percent_b));

    table.set_column(Column::Atr, indicators::calculate_atr(series, config.atr.period));

    auto stochastic = indicators::calculate_stochastic(
        series, config.stochastic.k_period, config.stochastic.d_period);
    table.set_column(Column::StochasticK, std::move(stochastic.k));
    table.set_column(Column::StochasticD, std::move(stochastic.d));

    auto adx = indicators::calculate_adx(series, config.adx.period);
    table.set_column(Column::Adx, std::move(adx.adx));
    table.set_column(Column::PlusDi, std::move(adx.plus_di));
    table.set_column(Column::MinusDi, std::move(adx.minus_di));

    auto sar = indicators::calculate_parabolic_sar(series, config.sar);
    table.set_column(Column::ParabolicSar, std::move(sar.sar));
    table.set_column(Column::SarTrend, trend_to_values(sar.trend));

    table.set_column(Column::Obv, indicators::calculate_obv(series));
    table.set_column(Column::Vwap, indicators::calculate_vwap(series));
    table.set_column(Column::VolumeMa, indicators::simple_moving_average(volumes, config.volume.ma_period));

    auto ichimoku = indicators::calculate_ichimoku(series, config.ichimoku);
    table.set_column(Column::IchimokuConversion, std::move(ichimoku.conversion));
    table.set_column(Column::IchimokuBase, std::move(ichimoku.base));
    table.set_column(Column::IchimokuLeadingA, std::move(ichimoku.leading_a));
    table.set_column(Column::IchimokuLeadingB, std::move(ichimoku.leading_b));
    table.set_column(Column::IchimokuLagging, std::move(ichimoku.lagging));

    return table;
}

Summary build_summary(const Series& series,
                      const ResultTable& table,
                      const std::vector<signals::Signal>& signals,
                      const AnalysisConfig& config) {
    Summary summary{};

    if (series.empty()) {
        throw EmptyInputError("cannot summarize an empty series");
    }
    config.validate();

    const Bar& last = series.back();
    const size_t n = series.size();

    summary.last_date = last.date;
    summary.last_price = last.close;
    summary.last_volume = last.volume;
    summary.data_points = n;

    if (n >= 2 && series[n - 2].close != 0.0) {
        const double prev_close = series[n - 2].close;
        summary.change_pct = (last.close - prev_close) / prev_close * 100.0;
    }

    const size_t volume_window = std::min(config.statistics.average_volume_window, n);
    double volume_sum = 0.0;
    for (size_t i = n - volume_window; i < n; ++i) {
        volume_sum += static_cast<double>(series[i].volume);
    }
    summary.average_volume = volume_sum / volume_window;

    summary.volatility = annualized_volatility(series.closes(), config.statistics.trading_days_per_year);

    const size_t lookback = std::min(config.statistics.range_lookback, n);
    summary.period_high = series[n - lookback].high;
    summary.period_low = series[n - lookback].low;
    for (size_t i = n - lookback; i < n; ++i) {
        summary.period_high = std::max(summary.period_high, series[i].high);
        summary.period_low = std::min(summary.period_low, series[i].low);
    }

    summary.rsi = table.column(Column::Rsi).last();
    summary.macd = table.column(Column::Macd).last();
    summary.macd_signal = table.column(Column::MacdSignal).last();
    summary.percent_b = table.column(Column::BollingerPercentB).last();
    summary.atr = table.column(Column::Atr).last();
    summary.stochastic_k = table.column(Column::StochasticK).last();
    summary.adx = table.column(Column::Adx).last();
    summary.sar = table.column(Column::ParabolicSar).last();

    for (const auto& [period, ma] : table.moving_averages()) {
        summary.moving_averages[period] = ma.last();
    }

    const auto volume_ma = table.column(Column::VolumeMa).last();
    if (volume_ma && *volume_ma > 0.0) {
        summary.volume_ratio = static_cast<double>(last.volume) / *volume_ma;
    }

    summary.trend = TrendState::Unknown;
    const auto* fast = table.moving_average(config.moving_averages.trend_fast_period);
    const auto* slow = table.moving_average(config.moving_averages.trend_slow_period);
    if (fast != nullptr && slow != nullptr) {
        const auto fast_value = fast->last();
        const auto slow_value = slow->last();
        if (fast_value && slow_value) {
            summary.trend = *fast_value > *slow_value ? TrendState::Bullish : TrendState::Bearish;
        }
    }

    summary.signals = signals;
    return summary;
}

AnalysisReport AnalysisEngine::analyze(const Series& series, const AnalysisConfig& config) {
    const auto start = std::chrono::steady_clock::now();

    AnalysisReport report{};
    report.table = run(series, config);
    report.signals = signals::evaluate(report.table, config);
    report.summary = build_summary(series, report.table, report.signals, config);

    const Bar& last = series.back();
    report.pivots = indicators::calculate_pivot_points(last.high, last.low, last.close);
    report.levels = indicators::calculate_support_resistance(series, config.support_resistance);

    if (config.fibonacci.swing_high && config.fibonacci.swing_low) {
        report.fibonacci = indicators::calculate_fibonacci_retracement(
            *config.fibonacci.swing_high, *config.fibonacci.swing_low, config.fibonacci.ratios);
    }

    const auto end = std::chrono::steady_clock::now();
    report.calc_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return report;
}

std::vector<AnalysisReport> AnalysisEngine::analyze_batch(const std::vector<Series>& batch,
                                                          const AnalysisConfig& config) const {
    std::vector<AnalysisReport> reports(batch.size());

    if (batch.empty()) {
        return reports;
    }

    // Each worker owns a contiguous slice of the batch
    const size_t workers = std::min<size_t>(num_threads_, batch.size());
    const size_t per_worker = batch.size() / workers;
    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    for (size_t t = 0; t < workers; ++t) {
        const size_t start_idx = t * per_worker;
        const size_t end_idx = (t == workers - 1) ? batch.size() : (t + 1) * per_worker;

        futures.push_back(std::async(std::launch::async, [&reports, &batch, &config, start_idx, end_idx]() {
            for (size_t i = start_idx; i < end_idx; ++i) {
                reports[i] = analyze(batch[i], config);
            }
        }));
    }

    // Wait for all workers before surfacing the first error
    for (auto& future : futures) {
        future.wait();
    }
    for (auto& future : futures) {
        future.get();
    }

    return reports;
}

} // namespace vantage::analysis
