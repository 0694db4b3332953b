#include "vantage/primitives.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace vantage::indicators {

namespace {

// Relative to the window mean
constexpr double FLAT_TOLERANCE = 1e-12;

} // namespace

Values simple_moving_average(const std::vector<double>& values, size_t period) {
    Values sma(values.size());

    if (period == 0 || values.size() < period) {
        return sma;
    }

    // Calculate first SMA
    double sum = std::accumulate(values.begin(), values.begin() + period, 0.0);
    sma[period - 1] = sum / period;

    // Rolling window
    for (size_t i = period; i < values.size(); ++i) {
        sum = sum - values[i - period] + values[i];
        sma[i] = sum / period;
    }

    return sma;
}

Values simple_moving_average(const Values& values, size_t period) {
    Values sma(values.size());

    if (period == 0 || values.size() < period) {
        return sma;
    }

    // Length of the run of defined values ending at i
    size_t run = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        run = values[i] ? run + 1 : 0;
        if (run < period) {
            continue;
        }

        double sum = 0.0;
        for (size_t j = i + 1 - period; j <= i; ++j) {
            sum += *values[j];
        }
        sma[i] = sum / period;
    }

    return sma;
}

Values exponential_moving_average(const std::vector<double>& values, size_t period) {
    Values ema(values.size());

    if (period == 0 || values.empty()) {
        return ema;
    }

    const double multiplier = 2.0 / (period + 1.0);

    double current = values[0];
    ema[0] = current;

    for (size_t i = 1; i < values.size(); ++i) {
        current = (values[i] - current) * multiplier + current;
        ema[i] = current;
    }

    return ema;
}

Values rolling_std_dev(const std::vector<double>& values, size_t period) {
    Values std_dev(values.size());

    if (period == 0 || values.size() < period) {
        return std_dev;
    }

    for (size_t i = period - 1; i < values.size(); ++i) {
        const auto first = values.begin() + (i + 1 - period);
        const auto last = values.begin() + (i + 1);
        const double mean = std::accumulate(first, last, 0.0) / period;

        double sum_sq = 0.0;
        for (auto it = first; it != last; ++it) {
            const double diff = *it - mean;
            sum_sq += diff * diff;
        }

        // Rounding noise around a flat window is no dispersion
        const double sigma = std::sqrt(sum_sq / period);
        std_dev[i] = sigma <= FLAT_TOLERANCE * std::abs(mean) ? 0.0 : sigma;
    }

    return std_dev;
}

Values rolling_max(const std::vector<double>& values, size_t period) {
    Values out(values.size());

    if (period == 0 || values.size() < period) {
        return out;
    }

    for (size_t i = period - 1; i < values.size(); ++i) {
        out[i] = *std::max_element(values.begin() + (i + 1 - period), values.begin() + (i + 1));
    }

    return out;
}

Values rolling_min(const std::vector<double>& values, size_t period) {
    Values out(values.size());

    if (period == 0 || values.size() < period) {
        return out;
    }

    for (size_t i = period - 1; i < values.size(); ++i) {
        out[i] = *std::min_element(values.begin() + (i + 1 - period), values.begin() + (i + 1));
    }

    return out;
}

double true_range(double high, double low, std::optional<double> prev_close) {
    const double hl = high - low;
    if (!prev_close) {
        return hl;
    }

    const double hc = std::abs(high - *prev_close);
    const double lc = std::abs(low - *prev_close);

    return std::max({hl, hc, lc});
}

std::vector<double> true_range_series(const Series& series) {
    std::vector<double> tr(series.size());

    for (size_t i = 0; i < series.size(); ++i) {
        const std::optional<double> prev_close =
            i == 0 ? std::nullopt : std::optional<double>(series[i - 1].close);
        tr[i] = true_range(series[i].high, series[i].low, prev_close);
    }

    return tr;
}

} // namespace vantage::indicators
