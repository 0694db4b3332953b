#include "vantage/result_table.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace vantage::analysis {

namespace {

constexpr std::array<std::string_view, COLUMN_COUNT> COLUMN_NAMES = {
    "CLOSE",
    "VOLUME",
    "RSI",
    "MACD",
    "MACD_SIGNAL",
    "MACD_HIST",
    "BB_UPPER",
    "BB_MIDDLE",
    "BB_LOWER",
    "BB_BANDWIDTH",
    "BB_PERCENT_B",
    "ATR",
    "STOCH_K",
    "STOCH_D",
    "ADX",
    "PLUS_DI",
    "MINUS_DI",
    "SAR",
    "SAR_TREND",
    "OBV",
    "VWAP",
    "VOLUME_MA",
    "ICHIMOKU_CONVERSION",
    "ICHIMOKU_BASE",
    "ICHIMOKU_LEADING_A",
    "ICHIMOKU_LEADING_B",
    "ICHIMOKU_LAGGING",
};

std::array<Column, COLUMN_COUNT> make_all_columns() {
    std::array<Column, COLUMN_COUNT> columns{};
    for (size_t i = 0; i < COLUMN_COUNT; ++i) {
        columns[i] = static_cast<Column>(i);
    }
    return columns;
}

} // namespace

std::string_view column_name(Column column) noexcept {
    const auto index = static_cast<size_t>(column);
    return index < COLUMN_COUNT ? COLUMN_NAMES[index] : std::string_view{"UNKNOWN"};
}

const std::array<Column, COLUMN_COUNT>& all_columns() noexcept {
    static const auto columns = make_all_columns();
    return columns;
}

std::string moving_average_name(size_t period) {
    return "MA_" + std::to_string(period);
}

ResultTable::ResultTable(std::vector<std::chrono::year_month_day> dates)
    : dates_(std::move(dates)) {
    for (Column column : all_columns()) {
        columns_[static_cast<size_t>(column)] =
            IndicatorSeries::undefined(std::string(column_name(column)), dates_.size());
    }
}

const IndicatorSeries* ResultTable::moving_average(size_t period) const {
    const auto it = moving_averages_.find(period);
    return it == moving_averages_.end() ? nullptr : &it->second;
}

void ResultTable::set_column(Column column, Values values) {
    if (values.size() != dates_.size()) {
        throw std::length_error("column " + std::string(column_name(column)) + " is not aligned with the series");
    }
    columns_[static_cast<size_t>(column)] =
        IndicatorSeries(std::string(column_name(column)), std::move(values));
}

void ResultTable::set_moving_average(size_t period, Values values) {
    if (values.size() != dates_.size()) {
        throw std::length_error(moving_average_name(period) + " is not aligned with the series");
    }
    moving_averages_.insert_or_assign(period, IndicatorSeries(moving_average_name(period), std::move(values)));
}

} // namespace vantage::analysis
