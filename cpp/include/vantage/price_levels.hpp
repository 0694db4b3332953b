#pragma once

#include "vantage/config.hpp"
#include "vantage/series.hpp"

#include <vector>

namespace vantage::indicators {

// Point-in-time price levels (not aligned series)

// Classic floor-trader pivots
struct PivotPoints {
    double pivot;
    double r1;
    double s1;
    double r2;
    double s2;
    double r3;
    double s3;
};

PivotPoints calculate_pivot_points(double high, double low, double close);

struct FibonacciLevel {
    double ratio;
    double price;
};

// Level for ratio r is high - r * (high - low); ratios above 1 extend below the low
std::vector<FibonacciLevel> calculate_fibonacci_retracement(
    double high,
    double low,
    const std::vector<double>& ratios = FibonacciParams{}.ratios
);

struct SupportResistance {
    std::vector<double> supports;     // nearest first, descending
    std::vector<double> resistances;  // nearest first, ascending
};

/**
 * Cluster the trailing window's highs, lows and closes.
 *
 * Prices are visited in ascending order and join the current cluster while
 * within tolerance * (window max - window min) of its last member. Clusters
 * with at least two members contribute their mean as a level. Levels below
 * the last close are supports, above it resistances.
 *
 * Returns empty lists when the series is shorter than the window.
 */
SupportResistance calculate_support_resistance(const Series& series,
                                               const SupportResistanceParams& params = {});

} // namespace vantage::indicators
