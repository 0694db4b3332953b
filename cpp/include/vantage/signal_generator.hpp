#pragma once

#include "vantage/config.hpp"
#include "vantage/result_table.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vantage::signals {

enum class SignalKind {
    RsiOverbought,
    RsiOversold,
    BullishTrend,
    BearishTrend,
    BullishMacdCross,
    BearishMacdCross,
    VolumeSpike
};

enum class Severity {
    Info,
    Success,
    Warning,
    Danger
};

struct Signal {
    SignalKind kind;
    Severity severity;
    std::string title;
    std::string message;
    std::optional<double> value;
};

std::string_view to_string(SignalKind kind) noexcept;
std::string_view to_string(Severity severity) noexcept;

// Each rule looks at the last one or two rows and returns nothing when an input is undefined

// RSI above overbought (danger) or below oversold (success)
std::optional<Signal> rsi_signal(const analysis::ResultTable& table, const RsiParams& params);

// Fast MA above slow MA (success) or not (warning)
std::optional<Signal> trend_signal(const analysis::ResultTable& table, const MovingAverageParams& params);

// MACD crossing its signal line between the last two rows
std::optional<Signal> macd_cross_signal(const analysis::ResultTable& table);

// Last volume above its moving average times the spike multiplier
std::optional<Signal> volume_spike_signal(const analysis::ResultTable& table, const VolumeParams& params);

/**
 * Run every rule in priority order: RSI, trend, MACD cross, volume spike.
 * Rules are independent; several signals may be emitted together.
 */
std::vector<Signal> evaluate(const analysis::ResultTable& table, const AnalysisConfig& config);

} // namespace vantage::signals
