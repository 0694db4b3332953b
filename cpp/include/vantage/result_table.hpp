#pragma once

#include "vantage/series.hpp"

#include <array>
#include <chrono>
#include <map>
#include <string_view>
#include <vector>

namespace vantage::analysis {

/**
 * Fixed set of per-bar columns produced by a session.
 * Moving averages are keyed by period and stored separately.
 */
enum class Column : size_t {
    Close,
    Volume,
    Rsi,
    Macd,
    MacdSignal,
    MacdHistogram,
    BollingerUpper,
    BollingerMiddle,
    BollingerLower,
    BollingerBandwidth,
    BollingerPercentB,
    Atr,
    StochasticK,
    StochasticD,
    Adx,
    PlusDi,
    MinusDi,
    ParabolicSar,
    SarTrend,       // +1 bullish, -1 bearish
    Obv,
    Vwap,
    VolumeMa,
    IchimokuConversion,
    IchimokuBase,
    IchimokuLeadingA,
    IchimokuLeadingB,
    IchimokuLagging
};

constexpr size_t COLUMN_COUNT = static_cast<size_t>(Column::IchimokuLagging) + 1;

std::string_view column_name(Column column) noexcept;

// Every column in declaration order
const std::array<Column, COLUMN_COUNT>& all_columns() noexcept;

// "MA_20" style name for a moving average column
std::string moving_average_name(size_t period);

/**
 * Aligned indicator output for one series. Every column has the
 * length of the input; undefined positions are nullopt.
 */
class ResultTable {
public:
    ResultTable() = default;
    explicit ResultTable(std::vector<std::chrono::year_month_day> dates);

    [[nodiscard]] size_t size() const noexcept { return dates_.size(); }
    [[nodiscard]] const std::vector<std::chrono::year_month_day>& dates() const noexcept { return dates_; }

    [[nodiscard]] const IndicatorSeries& column(Column column) const {
        return columns_[static_cast<size_t>(column)];
    }

    // nullptr if the period was not computed
    [[nodiscard]] const IndicatorSeries* moving_average(size_t period) const;
    [[nodiscard]] const std::map<size_t, IndicatorSeries>& moving_averages() const noexcept {
        return moving_averages_;
    }

    // Values must have one entry per date
    void set_column(Column column, Values values);
    void set_moving_average(size_t period, Values values);

    bool operator==(const ResultTable&) const = default;

private:
    std::vector<std::chrono::year_month_day> dates_;
    std::array<IndicatorSeries, COLUMN_COUNT> columns_;
    std::map<size_t, IndicatorSeries> moving_averages_;
};

} // namespace vantage::analysis
