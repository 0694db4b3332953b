#include "vantage/config.hpp"

#include <charconv>
#include <cmath>
#include <functional>
#include <sstream>
#include <type_traits>
#include <unordered_map>

namespace vantage {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

template <typename T>
T parse_number(const std::string& key, const std::string& raw) {
    const std::string text = trim(raw);
    T value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end) {
        throw ConfigError("invalid value for " + key + ": '" + raw + "'");
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) {
            throw ConfigError("non-finite value for " + key + ": '" + raw + "'");
        }
    }
    return value;
}

template <typename T>
std::vector<T> parse_list(const std::string& key, const std::string& raw) {
    std::vector<T> values;
    std::istringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        values.push_back(parse_number<T>(key, item));
    }
    if (values.empty()) {
        throw ConfigError("empty list for " + key);
    }
    return values;
}

using Setter = std::function<void(AnalysisConfig&, const std::string& key, const std::string& value)>;

template <typename T>
Setter set(T AnalysisConfig::*group, size_t T::*field) {
    return [group, field](AnalysisConfig& c, const std::string& key, const std::string& value) {
        (c.*group).*field = parse_number<size_t>(key, value);
    };
}

template <typename T>
Setter set(T AnalysisConfig::*group, double T::*field) {
    return [group, field](AnalysisConfig& c, const std::string& key, const std::string& value) {
        (c.*group).*field = parse_number<double>(key, value);
    };
}

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"RSI.period", set(&AnalysisConfig::rsi, &RsiParams::period)},
        {"RSI.overbought", set(&AnalysisConfig::rsi, &RsiParams::overbought)},
        {"RSI.oversold", set(&AnalysisConfig::rsi, &RsiParams::oversold)},
        {"MACD.fast", set(&AnalysisConfig::macd, &MacdParams::fast_period)},
        {"MACD.slow", set(&AnalysisConfig::macd, &MacdParams::slow_period)},
        {"MACD.signal", set(&AnalysisConfig::macd, &MacdParams::signal_period)},
        {"BB.period", set(&AnalysisConfig::bollinger, &BollingerParams::period)},
        {"BB.stdDev", set(&AnalysisConfig::bollinger, &BollingerParams::std_dev_multiplier)},
        {"ATR.period", set(&AnalysisConfig::atr, &AtrParams::period)},
        {"STOCH.k", set(&AnalysisConfig::stochastic, &StochasticParams::k_period)},
        {"STOCH.d", set(&AnalysisConfig::stochastic, &StochasticParams::d_period)},
        {"ADX.period", set(&AnalysisConfig::adx, &AdxParams::period)},
        {"SAR.accel", set(&AnalysisConfig::sar, &ParabolicSarParams::acceleration)},
        {"SAR.maxAccel", set(&AnalysisConfig::sar, &ParabolicSarParams::max_acceleration)},
        {"MA.trendFast", set(&AnalysisConfig::moving_averages, &MovingAverageParams::trend_fast_period)},
        {"MA.trendSlow", set(&AnalysisConfig::moving_averages, &MovingAverageParams::trend_slow_period)},
        {"VOLUME.period", set(&AnalysisConfig::volume, &VolumeParams::ma_period)},
        {"VOLUME.spike", set(&AnalysisConfig::volume, &VolumeParams::spike_multiplier)},
        {"SR.window", set(&AnalysisConfig::support_resistance, &SupportResistanceParams::window)},
        {"SR.levels", set(&AnalysisConfig::support_resistance, &SupportResistanceParams::num_levels)},
        {"SR.tolerance", set(&AnalysisConfig::support_resistance, &SupportResistanceParams::tolerance)},
        {"ICHIMOKU.conversion", set(&AnalysisConfig::ichimoku, &IchimokuParams::conversion_period)},
        {"ICHIMOKU.base", set(&AnalysisConfig::ichimoku, &IchimokuParams::base_period)},
        {"ICHIMOKU.leading", set(&AnalysisConfig::ichimoku, &IchimokuParams::leading_period)},
        {"ICHIMOKU.displacement", set(&AnalysisConfig::ichimoku, &IchimokuParams::displacement)},
        {"STATS.tradingDays", set(&AnalysisConfig::statistics, &StatisticsParams::trading_days_per_year)},
        {"STATS.lookback", set(&AnalysisConfig::statistics, &StatisticsParams::range_lookback)},
        {"MA.periods", [](AnalysisConfig& c, const std::string& key, const std::string& value) {
            c.moving_averages.periods = parse_list<size_t>(key, value);
        }},
        {"FIB.levels", [](AnalysisConfig& c, const std::string& key, const std::string& value) {
            c.fibonacci.ratios = parse_list<double>(key, value);
        }},
        {"FIB.high", [](AnalysisConfig& c, const std::string& key, const std::string& value) {
            c.fibonacci.swing_high = parse_number<double>(key, value);
        }},
        {"FIB.low", [](AnalysisConfig& c, const std::string& key, const std::string& value) {
            c.fibonacci.swing_low = parse_number<double>(key, value);
        }},
    };
    return table;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigError(message);
    }
}

} // namespace

void AnalysisConfig::validate() const {
    require(std::isfinite(rsi.overbought) && std::isfinite(rsi.oversold), "RSI thresholds must be finite");
    require(std::isfinite(bollinger.std_dev_multiplier), "BB.stdDev must be finite");
    require(std::isfinite(sar.acceleration) && std::isfinite(sar.max_acceleration), "SAR accelerations must be finite");
    require(std::isfinite(volume.spike_multiplier), "VOLUME.spike must be finite");
    require(std::isfinite(support_resistance.tolerance), "SR.tolerance must be finite");
    for (double ratio : fibonacci.ratios) {
        require(std::isfinite(ratio), "FIB.levels entries must be finite");
    }
    require((!fibonacci.swing_high || std::isfinite(*fibonacci.swing_high)) &&
            (!fibonacci.swing_low || std::isfinite(*fibonacci.swing_low)),
            "FIB.high and FIB.low must be finite");

    require(rsi.period > 0, "RSI.period must be positive");
    require(rsi.oversold < rsi.overbought, "RSI.oversold must be below RSI.overbought");
    require(rsi.oversold >= 0.0 && rsi.overbought <= 100.0, "RSI thresholds must lie in [0, 100]");

    require(macd.fast_period > 0 && macd.slow_period > 0 && macd.signal_period > 0,
            "MACD periods must be positive");
    require(macd.fast_period < macd.slow_period, "MACD.fast must be below MACD.slow");

    require(bollinger.period > 0, "BB.period must be positive");
    require(bollinger.std_dev_multiplier >= 0.0, "BB.stdDev must not be negative");

    require(atr.period > 0, "ATR.period must be positive");
    require(stochastic.k_period > 0 && stochastic.d_period > 0, "STOCH periods must be positive");
    require(adx.period > 0, "ADX.period must be positive");

    require(sar.acceleration > 0.0, "SAR.accel must be positive");
    require(sar.acceleration <= sar.max_acceleration, "SAR.accel must not exceed SAR.maxAccel");

    for (size_t period : moving_averages.periods) {
        require(period > 0, "MA.periods entries must be positive");
    }
    require(moving_averages.trend_fast_period > 0 && moving_averages.trend_slow_period > 0,
            "MA trend periods must be positive");

    require(volume.ma_period > 0, "VOLUME.period must be positive");
    require(volume.spike_multiplier > 0.0, "VOLUME.spike must be positive");

    require(support_resistance.window > 0, "SR.window must be positive");
    require(support_resistance.tolerance >= 0.0, "SR.tolerance must not be negative");

    require(!fibonacci.ratios.empty(), "FIB.levels must not be empty");
    if (fibonacci.swing_high && fibonacci.swing_low) {
        require(*fibonacci.swing_high >= *fibonacci.swing_low, "FIB.high must not be below FIB.low");
    }

    require(ichimoku.conversion_period > 0 && ichimoku.base_period > 0 && ichimoku.leading_period > 0,
            "ICHIMOKU periods must be positive");

    require(statistics.trading_days_per_year > 0, "STATS.tradingDays must be positive");
    require(statistics.range_lookback > 0, "STATS.lookback must be positive");
    require(statistics.average_volume_window > 0, "average volume window must be positive");
}

AnalysisConfig parse_config(const std::map<std::string, std::string>& entries) {
    AnalysisConfig config;
    const auto& table = setters();

    for (const auto& [key, value] : entries) {
        const auto it = table.find(key);
        if (it == table.end()) {
            throw ConfigError("unknown configuration key: " + key);
        }
        it->second(config, key, value);
    }

    config.validate();
    return config;
}

} // namespace vantage
