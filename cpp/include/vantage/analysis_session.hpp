#pragma once

#include "vantage/config.hpp"
#include "vantage/price_levels.hpp"
#include "vantage/result_table.hpp"
#include "vantage/series.hpp"
#include "vantage/signal_generator.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace vantage::analysis {

enum class TrendState {
    Bullish,
    Bearish,
    Unknown
};

std::string_view to_string(TrendState trend) noexcept;

/**
 * Point-in-time view of the last bar
 */
struct Summary {
    std::chrono::year_month_day last_date;
    double last_price;
    Value change_pct;           // versus the previous close
    uint64_t last_volume;
    double average_volume;      // trailing window, shorter if the series is
    Value volatility;           // annualized std dev of daily returns, percent
    double period_high;
    double period_low;
    size_t data_points;

    Value rsi;
    Value macd;
    Value macd_signal;
    Value percent_b;
    Value atr;
    Value stochastic_k;
    Value adx;
    Value sar;
    std::map<size_t, Value> moving_averages;
    Value volume_ratio;
    TrendState trend;

    std::vector<signals::Signal> signals;
};

/**
 * Everything one session produces
 */
struct AnalysisReport {
    ResultTable table;
    std::vector<signals::Signal> signals;
    Summary summary;
    indicators::PivotPoints pivots;
    indicators::SupportResistance levels;
    std::optional<std::vector<indicators::FibonacciLevel>> fibonacci;
    int64_t calc_time_ns;
};

Summary build_summary(const Series& series,
                      const ResultTable& table,
                      const std::vector<signals::Signal>& signals,
                      const AnalysisConfig& config);

/**
 * Stateless analysis driver.
 *
 * Sessions share nothing, so batches are split across worker threads.
 */
class AnalysisEngine {
public:
    explicit AnalysisEngine(unsigned int num_threads = 0);

    /**
     * Compute every indicator column for the series.
     * Throws EmptyInputError for zero bars and ConfigError for an invalid config.
     */
    static ResultTable run(const Series& series, const AnalysisConfig& config);

    // Table plus signals, summary and price levels
    static AnalysisReport analyze(const Series& series, const AnalysisConfig& config);

    // Reports in input order; the first failure is rethrown
    std::vector<AnalysisReport> analyze_batch(const std::vector<Series>& batch,
                                              const AnalysisConfig& config) const;

    [[nodiscard]] unsigned int num_threads() const noexcept { return num_threads_; }

private:
    unsigned int num_threads_;
};

} // namespace vantage::analysis
