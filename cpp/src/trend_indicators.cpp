#include "vantage/trend_indicators.hpp"
#include "vantage/primitives.hpp"

#include <algorithm>
#include <cmath>

namespace vantage::indicators {

DirectionalMovement directional_movement(const Bar& previous, const Bar& current) {
    const double up = current.high - previous.high;
    const double down = previous.low - current.low;

    return DirectionalMovement{
        (up > down && up > 0.0) ? up : 0.0,
        (down > up && down > 0.0) ? down : 0.0,
        true_range(current.high, current.low, previous.close)
    };
}

DirectionalState accumulate_directional(const DirectionalState& state,
                                        const DirectionalMovement& move,
                                        size_t period) {
    DirectionalState next = state;

    if (state.count < period) {
        // Still summing the seed window
        next.smoothed_true_range += move.true_range;
        next.smoothed_plus_dm += move.plus_dm;
        next.smoothed_minus_dm += move.minus_dm;
        next.count = state.count + 1;

        if (next.count == period) {
            next.smoothed_true_range /= period;
            next.smoothed_plus_dm /= period;
            next.smoothed_minus_dm /= period;
        }
        return next;
    }

    next.smoothed_true_range = wilder_smooth(state.smoothed_true_range, move.true_range, period);
    next.smoothed_plus_dm = wilder_smooth(state.smoothed_plus_dm, move.plus_dm, period);
    next.smoothed_minus_dm = wilder_smooth(state.smoothed_minus_dm, move.minus_dm, period);
    next.count = state.count + 1;
    return next;
}

AdxResult calculate_adx(const Series& series, size_t period) {
    const size_t n = series.size();

    AdxResult result;
    result.adx.resize(n);
    result.plus_di.resize(n);
    result.minus_di.resize(n);
    result.dx.resize(n);

    // Fewer than 2 * period bars
    if (period == 0 || period > n / 2) {
        return result;
    }

    DirectionalState state;

    for (size_t i = 1; i < n; ++i) {
        state = accumulate_directional(state, directional_movement(series[i - 1], series[i]), period);

        if (!state.seeded(period) || state.smoothed_true_range <= 0.0) {
            continue;
        }

        const double plus_di = 100.0 * state.smoothed_plus_dm / state.smoothed_true_range;
        const double minus_di = 100.0 * state.smoothed_minus_dm / state.smoothed_true_range;
        result.plus_di[i] = plus_di;
        result.minus_di[i] = minus_di;

        const double di_sum = plus_di + minus_di;
        if (di_sum > 0.0) {
            result.dx[i] = 100.0 * std::abs(plus_di - minus_di) / di_sum;
        }
    }

    result.adx = simple_moving_average(result.dx, period);
    return result;
}

ParabolicSarState initial_parabolic_sar(const Bar& first, const ParabolicSarParams& params) {
    return ParabolicSarState{
        Trend::Bullish,
        first.low,
        first.high,
        params.acceleration
    };
}

double projected_sar(const ParabolicSarState& state) noexcept {
    return state.sar + state.acceleration_factor * (state.extreme_point - state.sar);
}

ParabolicSarState advance_parabolic_sar(const ParabolicSarState& state,
                                        const Bar& bar,
                                        const ParabolicSarParams& params) {
    ParabolicSarState next = state;
    const double sar = projected_sar(state);

    if (state.trend == Trend::Bullish) {
        if (bar.high > next.extreme_point) {
            next.extreme_point = bar.high;
            next.acceleration_factor = std::min(next.acceleration_factor + params.acceleration,
                                                params.max_acceleration);
        }

        // SAR may not rise above the bar's low; crossing it is the reversal
        if (sar > bar.low) {
            next.trend = Trend::Bearish;
            next.sar = next.extreme_point;
            next.extreme_point = bar.low;
            next.acceleration_factor = params.acceleration;
        } else {
            next.sar = sar;
        }
    } else {
        if (bar.low < next.extreme_point) {
            next.extreme_point = bar.low;
            next.acceleration_factor = std::min(next.acceleration_factor + params.acceleration,
                                                params.max_acceleration);
        }

        if (sar < bar.high) {
            next.trend = Trend::Bullish;
            next.sar = next.extreme_point;
            next.extreme_point = bar.high;
            next.acceleration_factor = params.acceleration;
        } else {
            next.sar = sar;
        }
    }

    return next;
}

ParabolicSarResult calculate_parabolic_sar(const Series& series, const ParabolicSarParams& params) {
    ParabolicSarResult result;
    result.sar.resize(series.size());
    result.trend.resize(series.size());

    if (series.size() < 2) {
        return result;
    }

    auto state = initial_parabolic_sar(series[0], params);
    result.sar[0] = state.sar;
    result.trend[0] = state.trend;

    for (size_t i = 1; i < series.size(); ++i) {
        state = advance_parabolic_sar(state, series[i], params);
        result.sar[i] = state.sar;
        result.trend[i] = state.trend;
    }

    return result;
}

namespace {

// (highest high + lowest low) / 2 over the trailing window
Values midpoint(const std::vector<double>& highs, const std::vector<double>& lows, size_t period) {
    const auto highest = rolling_max(highs, period);
    const auto lowest = rolling_min(lows, period);

    Values mid(highs.size());
    for (size_t i = 0; i < highs.size(); ++i) {
        if (highest[i] && lowest[i]) {
            mid[i] = (*highest[i] + *lowest[i]) / 2.0;
        }
    }
    return mid;
}

} // namespace

IchimokuResult calculate_ichimoku(const Series& series, const IchimokuParams& params) {
    const size_t n = series.size();

    IchimokuResult result;
    result.conversion.resize(n);
    result.base.resize(n);
    result.leading_a.resize(n);
    result.leading_b.resize(n);
    result.lagging.resize(n);

    if (params.leading_period == 0 || n < params.leading_period) {
        return result;
    }

    const auto highs = series.highs();
    const auto lows = series.lows();

    result.conversion = midpoint(highs, lows, params.conversion_period);
    result.base = midpoint(highs, lows, params.base_period);
    const auto span_b = midpoint(highs, lows, params.leading_period);

    const size_t shift = params.displacement;
    for (size_t i = shift; i < n; ++i) {
        const size_t src = i - shift;
        if (result.conversion[src] && result.base[src]) {
            result.leading_a[i] = (*result.conversion[src] + *result.base[src]) / 2.0;
        }
        result.leading_b[i] = span_b[src];
    }

    for (size_t i = 0; shift < n && i < n - shift; ++i) {
        result.lagging[i] = series[i + shift].close;
    }

    return result;
}

} // namespace vantage::indicators
