#pragma once

#include "vantage/series.hpp"

#include <optional>
#include <vector>

namespace vantage::indicators {

// Building blocks shared by the indicator calculators.
// Every function returns one value per input position; positions
// without enough history are nullopt.

// Simple Moving Average, defined from index period-1
Values simple_moving_average(const std::vector<double>& values, size_t period);

// SMA over a partially defined input: a window is defined only if all of its values are
Values simple_moving_average(const Values& values, size_t period);

// Exponential Moving Average seeded with the first observation, defined from index 0
Values exponential_moving_average(const std::vector<double>& values, size_t period);

// Population standard deviation over the trailing window, defined from index period-1
Values rolling_std_dev(const std::vector<double>& values, size_t period);

// Trailing window extremes, defined from index period-1
Values rolling_max(const std::vector<double>& values, size_t period);
Values rolling_min(const std::vector<double>& values, size_t period);

// max(high - low, |high - prev_close|, |low - prev_close|); high - low without a previous close
double true_range(double high, double low, std::optional<double> prev_close);

// True range for every bar of the series (first bar uses high - low)
std::vector<double> true_range_series(const Series& series);

// Wilder running average: (avg * (period - 1) + value) / period
inline double wilder_smooth(double previous, double value, size_t period) {
    return (previous * static_cast<double>(period - 1) + value) / static_cast<double>(period);
}

} // namespace vantage::indicators
