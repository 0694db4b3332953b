#include "vantage/technical_indicators.hpp"
#include "vantage/primitives.hpp"
#include <cmath>
#include <algorithm>

namespace vantage::indicators {

namespace {

Value rsi_from_averages(double avg_gain, double avg_loss) {
    if (avg_loss == 0.0) {
        // Flat window has no variation to measure
        if (avg_gain == 0.0) {
            return std::nullopt;
        }
        return 100.0;
    }

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

} // namespace

Values calculate_rsi(const std::vector<double>& prices, size_t period) {
    Values rsi(prices.size());

    if (period == 0 || prices.size() <= period) {
        return rsi;
    }

    // Seed with simple averages of the first period changes
    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (size_t i = 1; i <= period; ++i) {
        const double change = prices[i] - prices[i - 1];
        avg_gain += change > 0 ? change : 0.0;
        avg_loss += change < 0 ? -change : 0.0;
    }

    avg_gain /= period;
    avg_loss /= period;
    rsi[period] = rsi_from_averages(avg_gain, avg_loss);

    for (size_t i = period + 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        avg_gain = wilder_smooth(avg_gain, change > 0 ? change : 0.0, period);
        avg_loss = wilder_smooth(avg_loss, change < 0 ? -change : 0.0, period);
        rsi[i] = rsi_from_averages(avg_gain, avg_loss);
    }

    return rsi;
}

MACDResult calculate_macd(
    const std::vector<double>& prices,
    size_t fast_period,
    size_t slow_period,
    size_t signal_period
) {
    MACDResult result;
    result.macd_line.resize(prices.size());
    result.signal_line.resize(prices.size());
    result.histogram.resize(prices.size());

    if (fast_period == 0 || slow_period == 0 || signal_period == 0 || prices.size() < slow_period) {
        return result;
    }

    const auto ema_fast = exponential_moving_average(prices, fast_period);
    const auto ema_slow = exponential_moving_average(prices, slow_period);

    std::vector<double> macd(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        macd[i] = *ema_fast[i] - *ema_slow[i];
        result.macd_line[i] = macd[i];
    }

    result.signal_line = exponential_moving_average(macd, signal_period);

    for (size_t i = 0; i < prices.size(); ++i) {
        result.histogram[i] = macd[i] - *result.signal_line[i];
    }

    return result;
}

BollingerBands calculate_bollinger_bands(
    const std::vector<double>& prices,
    size_t period,
    double std_dev_multiplier
) {
    BollingerBands bands;
    bands.middle = simple_moving_average(prices, period);
    bands.upper.resize(prices.size());
    bands.lower.resize(prices.size());
    bands.bandwidth.resize(prices.size());
    bands.percent_b.resize(prices.size());

    const auto std_dev = rolling_std_dev(prices, period);

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!bands.middle[i] || !std_dev[i]) {
            continue;
        }

        const double middle = *bands.middle[i];
        const double upper = middle + std_dev_multiplier * *std_dev[i];
        const double lower = middle - std_dev_multiplier * *std_dev[i];
        bands.upper[i] = upper;
        bands.lower[i] = lower;

        if (middle != 0.0) {
            bands.bandwidth[i] = (upper - lower) / middle * 100.0;
        }
        // Zero bandwidth leaves %B undefined
        if (*std_dev[i] > 0.0 && upper != lower) {
            bands.percent_b[i] = (prices[i] - lower) / (upper - lower);
        }
    }

    return bands;
}

Values calculate_atr(const Series& series, size_t period) {
    return simple_moving_average(true_range_series(series), period);
}

StochasticResult calculate_stochastic(const Series& series, size_t k_period, size_t d_period) {
    StochasticResult result;
    result.k.resize(series.size());

    const auto highest = rolling_max(series.highs(), k_period);
    const auto lowest = rolling_min(series.lows(), k_period);

    for (size_t i = 0; i < series.size(); ++i) {
        if (!highest[i] || !lowest[i] || *highest[i] == *lowest[i]) {
            continue;
        }
        result.k[i] = 100.0 * (series[i].close - *lowest[i]) / (*highest[i] - *lowest[i]);
    }

    result.d = simple_moving_average(result.k, d_period);
    return result;
}

Values calculate_obv(const Series& series) {
    Values obv(series.size());

    if (series.empty()) {
        return obv;
    }

    double running = static_cast<double>(series[0].volume);
    obv[0] = running;

    for (size_t i = 1; i < series.size(); ++i) {
        const double volume = static_cast<double>(series[i].volume);
        if (series[i].close > series[i - 1].close) {
            running += volume;
        } else if (series[i].close < series[i - 1].close) {
            running -= volume;
        }
        obv[i] = running;
    }

    return obv;
}

Values calculate_vwap(const Series& series) {
    Values vwap(series.size());

    double cumulative_pv = 0.0;
    double cumulative_volume = 0.0;

    for (size_t i = 0; i < series.size(); ++i) {
        // Fewer terms for the first two bars
        const size_t first = i >= 2 ? i - 2 : 0;
        double sum = 0.0;
        for (size_t j = first; j <= i; ++j) {
            sum += series[j].close;
        }
        const double typical_price = sum / static_cast<double>(i - first + 1);

        const double volume = static_cast<double>(series[i].volume);
        cumulative_pv += typical_price * volume;
        cumulative_volume += volume;

        if (cumulative_volume > 0.0) {
            vwap[i] = cumulative_pv / cumulative_volume;
        }
    }

    return vwap;
}

} // namespace vantage::indicators
