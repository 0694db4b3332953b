#include "vantage/price_levels.hpp"

#include <algorithm>
#include <functional>
#include <numeric>

namespace vantage::indicators {

PivotPoints calculate_pivot_points(double high, double low, double close) {
    const double pivot = (high + low + close) / 3.0;

    return PivotPoints{
        pivot,
        2.0 * pivot - low,
        2.0 * pivot - high,
        pivot + (high - low),
        pivot - (high - low),
        high + 2.0 * (pivot - low),
        low - 2.0 * (high - pivot)
    };
}

std::vector<FibonacciLevel> calculate_fibonacci_retracement(
    double high,
    double low,
    const std::vector<double>& ratios
) {
    const double diff = high - low;

    std::vector<FibonacciLevel> levels;
    levels.reserve(ratios.size());

    for (double ratio : ratios) {
        levels.push_back(FibonacciLevel{ratio, high - ratio * diff});
    }

    return levels;
}

SupportResistance calculate_support_resistance(const Series& series,
                                               const SupportResistanceParams& params) {
    SupportResistance result;

    if (params.window == 0 || series.size() < params.window) {
        return result;
    }

    std::vector<double> prices;
    prices.reserve(params.window * 3);
    for (size_t i = series.size() - params.window; i < series.size(); ++i) {
        prices.push_back(series[i].high);
        prices.push_back(series[i].low);
        prices.push_back(series[i].close);
    }

    // Sorted order keeps the clustering deterministic
    std::sort(prices.begin(), prices.end());
    const double tolerance = (prices.back() - prices.front()) * params.tolerance;

    std::vector<double> levels;
    std::vector<double> cluster;

    auto close_cluster = [&]() {
        if (cluster.size() >= 2) {
            levels.push_back(std::accumulate(cluster.begin(), cluster.end(), 0.0) / cluster.size());
        }
        cluster.clear();
    };

    for (double price : prices) {
        if (!cluster.empty() && price - cluster.back() > tolerance) {
            close_cluster();
        }
        cluster.push_back(price);
    }
    close_cluster();

    const double current_price = series.back().close;

    for (double level : levels) {
        if (level < current_price) {
            result.supports.push_back(level);
        } else if (level > current_price) {
            result.resistances.push_back(level);
        }
    }

    std::sort(result.supports.begin(), result.supports.end(), std::greater<>());
    std::sort(result.resistances.begin(), result.resistances.end());

    if (result.supports.size() > params.num_levels) {
        result.supports.resize(params.num_levels);
    }
    if (result.resistances.size() > params.num_levels) {
        result.resistances.resize(params.num_levels);
    }

    return result;
}

} // namespace vantage::indicators
