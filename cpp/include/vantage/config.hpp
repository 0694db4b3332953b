#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vantage {

// Raised for parameter sets that no calculator can honour
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct RsiParams {
    size_t period = 14;
    double overbought = 70.0;
    double oversold = 30.0;
};

struct MacdParams {
    size_t fast_period = 12;
    size_t slow_period = 26;
    size_t signal_period = 9;
};

struct BollingerParams {
    size_t period = 20;
    double std_dev_multiplier = 2.0;
};

struct AtrParams {
    size_t period = 14;
};

struct StochasticParams {
    size_t k_period = 14;
    size_t d_period = 3;
};

struct AdxParams {
    size_t period = 14;
};

struct ParabolicSarParams {
    double acceleration = 0.02;
    double max_acceleration = 0.2;
};

struct MovingAverageParams {
    std::vector<size_t> periods = {20, 50, 200};
    // Trend state compares these two simple moving averages
    size_t trend_fast_period = 20;
    size_t trend_slow_period = 50;
};

struct VolumeParams {
    size_t ma_period = 20;
    double spike_multiplier = 1.5;
};

struct SupportResistanceParams {
    size_t window = 20;
    size_t num_levels = 5;
    // Fraction of the window's price range within which prices are clustered
    double tolerance = 0.01;
};

struct FibonacciParams {
    std::vector<double> ratios = {0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0, 1.272, 1.618};
    // Swing points are never auto-detected; levels are produced only when both are set
    std::optional<double> swing_high;
    std::optional<double> swing_low;
};

struct IchimokuParams {
    size_t conversion_period = 9;
    size_t base_period = 26;
    size_t leading_period = 52;
    size_t displacement = 26;
};

struct StatisticsParams {
    size_t trading_days_per_year = 252;
    size_t range_lookback = 252;
    size_t average_volume_window = 20;
};

/**
 * Full parameter set for one analysis run.
 * Defaults are the conventional daily-chart settings.
 */
struct AnalysisConfig {
    RsiParams rsi;
    MacdParams macd;
    BollingerParams bollinger;
    AtrParams atr;
    StochasticParams stochastic;
    AdxParams adx;
    ParabolicSarParams sar;
    MovingAverageParams moving_averages;
    VolumeParams volume;
    SupportResistanceParams support_resistance;
    FibonacciParams fibonacci;
    IchimokuParams ichimoku;
    StatisticsParams statistics;

    // Throws ConfigError describing the first invalid parameter
    void validate() const;
};

/**
 * Build a configuration from dotted key/value pairs applied over the defaults.
 *
 * Keys: RSI.period RSI.overbought RSI.oversold MACD.fast MACD.slow MACD.signal
 *       BB.period BB.stdDev ATR.period STOCH.k STOCH.d ADX.period
 *       SAR.accel SAR.maxAccel MA.periods MA.trendFast MA.trendSlow
 *       VOLUME.period VOLUME.spike SR.window SR.levels SR.tolerance
 *       FIB.levels FIB.high FIB.low ICHIMOKU.conversion ICHIMOKU.base
 *       ICHIMOKU.leading ICHIMOKU.displacement STATS.tradingDays STATS.lookback
 * List values are comma separated: MA.periods=20,50,200
 *
 * Throws ConfigError on unknown keys, unparsable values or a result that fails validate().
 */
AnalysisConfig parse_config(const std::map<std::string, std::string>& entries);

} // namespace vantage
