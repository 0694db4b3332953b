#pragma once

#include "vantage/config.hpp"
#include "vantage/series.hpp"

#include <optional>
#include <vector>

namespace vantage::indicators {

// =============================================================================
// DIRECTIONAL MOVEMENT / ADX
// =============================================================================

/**
 * Raw directional movement between two consecutive bars
 */
struct DirectionalMovement {
    double plus_dm;
    double minus_dm;
    double true_range;
};

DirectionalMovement directional_movement(const Bar& previous, const Bar& current);

/**
 * Wilder-smoothed running totals threaded through the bars in order.
 * The first `period` movements are averaged to seed the recurrence.
 */
struct DirectionalState {
    double smoothed_true_range = 0.0;
    double smoothed_plus_dm = 0.0;
    double smoothed_minus_dm = 0.0;
    size_t count = 0;

    [[nodiscard]] bool seeded(size_t period) const noexcept { return count >= period; }
};

DirectionalState accumulate_directional(const DirectionalState& state,
                                        const DirectionalMovement& move,
                                        size_t period);

struct AdxResult {
    Values adx;
    Values plus_di;
    Values minus_di;
    Values dx;
};

// Needs 2 * period bars; shorter input leaves every column undefined
AdxResult calculate_adx(const Series& series, size_t period = 14);

// =============================================================================
// PARABOLIC SAR
// =============================================================================

enum class Trend {
    Bullish,
    Bearish
};

/**
 * Stop-and-reverse state after processing one bar
 */
struct ParabolicSarState {
    Trend trend;
    double sar;
    double extreme_point;
    double acceleration_factor;
};

// Seed from the first bar: bullish, SAR at the low, EP at the high
ParabolicSarState initial_parabolic_sar(const Bar& first, const ParabolicSarParams& params);

// SAR value the current state projects for the next bar before any reversal
double projected_sar(const ParabolicSarState& state) noexcept;

// Process the next bar in order
ParabolicSarState advance_parabolic_sar(const ParabolicSarState& state,
                                        const Bar& bar,
                                        const ParabolicSarParams& params);

struct ParabolicSarResult {
    Values sar;
    std::vector<std::optional<Trend>> trend;
};

// Needs at least 2 bars
ParabolicSarResult calculate_parabolic_sar(const Series& series, const ParabolicSarParams& params = {});

// =============================================================================
// ICHIMOKU
// =============================================================================

struct IchimokuResult {
    Values conversion;  // Tenkan-sen
    Values base;        // Kijun-sen
    Values leading_a;   // Senkou span A, shifted forward
    Values leading_b;   // Senkou span B, shifted forward
    Values lagging;     // Chikou span, close shifted back
};

IchimokuResult calculate_ichimoku(const Series& series, const IchimokuParams& params = {});

} // namespace vantage::indicators
