#include "vantage/signal_generator.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace vantage::signals {

using analysis::Column;
using analysis::ResultTable;

namespace {

std::string format_value(double value, int precision = 1) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

std::string_view to_string(SignalKind kind) noexcept {
    switch (kind) {
        case SignalKind::RsiOverbought: return "rsi_overbought";
        case SignalKind::RsiOversold: return "rsi_oversold";
        case SignalKind::BullishTrend: return "bullish_trend";
        case SignalKind::BearishTrend: return "bearish_trend";
        case SignalKind::BullishMacdCross: return "bullish_macd_cross";
        case SignalKind::BearishMacdCross: return "bearish_macd_cross";
        case SignalKind::VolumeSpike: return "volume_spike";
    }
    return "unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Success: return "success";
        case Severity::Warning: return "warning";
        case Severity::Danger: return "danger";
    }
    return "unknown";
}

std::optional<Signal> rsi_signal(const ResultTable& table, const RsiParams& params) {
    const auto rsi = table.column(Column::Rsi).last();
    if (!rsi) {
        return std::nullopt;
    }

    if (*rsi > params.overbought) {
        return Signal{
            SignalKind::RsiOverbought,
            Severity::Danger,
            "RSI Overbought",
            "RSI at " + format_value(*rsi) + " > " + format_value(params.overbought, 0) + " - sell signal",
            *rsi
        };
    }
    if (*rsi < params.oversold) {
        return Signal{
            SignalKind::RsiOversold,
            Severity::Success,
            "RSI Oversold",
            "RSI at " + format_value(*rsi) + " < " + format_value(params.oversold, 0) + " - buy signal",
            *rsi
        };
    }
    return std::nullopt;
}

std::optional<Signal> trend_signal(const ResultTable& table, const MovingAverageParams& params) {
    const auto* fast_ma = table.moving_average(params.trend_fast_period);
    const auto* slow_ma = table.moving_average(params.trend_slow_period);
    if (fast_ma == nullptr || slow_ma == nullptr) {
        return std::nullopt;
    }

    const auto fast = fast_ma->last();
    const auto slow = slow_ma->last();
    if (!fast || !slow) {
        return std::nullopt;
    }

    const std::string fast_name = analysis::moving_average_name(params.trend_fast_period);
    const std::string slow_name = analysis::moving_average_name(params.trend_slow_period);

    if (*fast > *slow) {
        return Signal{
            SignalKind::BullishTrend,
            Severity::Success,
            "Bullish trend",
            fast_name + " > " + slow_name + " - upward trend",
            std::nullopt
        };
    }
    return Signal{
        SignalKind::BearishTrend,
        Severity::Warning,
        "Bearish trend",
        fast_name + " <= " + slow_name + " - downward trend",
        std::nullopt
    };
}

std::optional<Signal> macd_cross_signal(const ResultTable& table) {
    const auto& macd = table.column(Column::Macd);
    const auto& signal = table.column(Column::MacdSignal);

    const auto macd_now = macd.from_back(0);
    const auto macd_prev = macd.from_back(1);
    const auto signal_now = signal.from_back(0);
    const auto signal_prev = signal.from_back(1);

    if (!macd_now || !macd_prev || !signal_now || !signal_prev) {
        return std::nullopt;
    }

    if (*macd_prev <= *signal_prev && *macd_now > *signal_now) {
        return Signal{
            SignalKind::BullishMacdCross,
            Severity::Success,
            "Bullish MACD cross",
            "MACD crossed above its signal line",
            *macd_now
        };
    }
    if (*macd_prev >= *signal_prev && *macd_now < *signal_now) {
        return Signal{
            SignalKind::BearishMacdCross,
            Severity::Danger,
            "Bearish MACD cross",
            "MACD crossed below its signal line",
            *macd_now
        };
    }
    return std::nullopt;
}

std::optional<Signal> volume_spike_signal(const ResultTable& table, const VolumeParams& params) {
    const auto volume = table.column(Column::Volume).last();
    const auto average = table.column(Column::VolumeMa).last();

    if (!volume || !average || *average <= 0.0) {
        return std::nullopt;
    }

    if (*volume > *average * params.spike_multiplier) {
        const double ratio = *volume / *average;
        return Signal{
            SignalKind::VolumeSpike,
            Severity::Warning,
            "High volume",
            "Volume " + format_value(ratio) + "x the average",
            ratio
        };
    }
    return std::nullopt;
}

std::vector<Signal> evaluate(const ResultTable& table, const AnalysisConfig& config) {
    std::vector<Signal> signals;

    if (table.size() == 0) {
        return signals;
    }

    if (auto s = rsi_signal(table, config.rsi)) {
        signals.push_back(std::move(*s));
    }
    if (auto s = trend_signal(table, config.moving_averages)) {
        signals.push_back(std::move(*s));
    }
    if (auto s = macd_cross_signal(table)) {
        signals.push_back(std::move(*s));
    }
    if (auto s = volume_spike_signal(table, config.volume)) {
        signals.push_back(std::move(*s));
    }

    return signals;
}

} // namespace vantage::signals
