#pragma once

#include "vantage/series.hpp"

#include <vector>
#include <cstdint>

namespace vantage::indicators {

// Price and volume indicators computed from a full series.
// History shorter than an indicator's window leaves every position undefined.

// Relative Strength Index (Wilder smoothing after a simple-average seed)
Values calculate_rsi(const std::vector<double>& prices, size_t period = 14);

// MACD (Moving Average Convergence Divergence)
struct MACDResult {
    Values macd_line;
    Values signal_line;
    Values histogram;
};

MACDResult calculate_macd(
    const std::vector<double>& prices,
    size_t fast_period = 12,
    size_t slow_period = 26,
    size_t signal_period = 9
);

// Bollinger Bands
struct BollingerBands {
    Values upper;
    Values middle;
    Values lower;
    Values bandwidth;   // (upper - lower) / middle * 100
    Values percent_b;   // (close - lower) / (upper - lower)
};

BollingerBands calculate_bollinger_bands(
    const std::vector<double>& prices,
    size_t period = 20,
    double std_dev_multiplier = 2.0
);

// Average True Range (volatility)
Values calculate_atr(const Series& series, size_t period = 14);

// Stochastic oscillator
struct StochasticResult {
    Values k;
    Values d;
};

StochasticResult calculate_stochastic(const Series& series, size_t k_period = 14, size_t d_period = 3);

// On Balance Volume, seeded with the first bar's volume
Values calculate_obv(const Series& series);

// Daily VWAP approximation: typical price is the mean of the close and up to two prior closes
Values calculate_vwap(const Series& series);

} // namespace vantage::indicators
