#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vantage {

// Daily OHLCV input and aligned indicator output

/**
 * One trading session.
 * Invariant (enforced by the data provider): low <= min(open, close) <= max(open, close) <= high
 */
struct Bar {
    std::chrono::year_month_day date;
    double open;
    double high;
    double low;
    double close;
    uint64_t volume;
};

// Raised when an analysis is requested on zero bars
class EmptyInputError : public std::invalid_argument {
public:
    explicit EmptyInputError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * Ordered sequence of bars, ascending by date.
 * The engine only reads it; callers own it.
 */
class Series {
public:
    Series() = default;
    explicit Series(std::vector<Bar> bars) : bars_(std::move(bars)) {}

    [[nodiscard]] size_t size() const noexcept { return bars_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bars_.empty(); }

    const Bar& operator[](size_t i) const { return bars_[i]; }
    const Bar& front() const { return bars_.front(); }
    const Bar& back() const { return bars_.back(); }

    const std::vector<Bar>& bars() const noexcept { return bars_; }

    auto begin() const noexcept { return bars_.begin(); }
    auto end() const noexcept { return bars_.end(); }

    // Column extraction for the price/volume based calculators
    std::vector<double> opens() const;
    std::vector<double> highs() const;
    std::vector<double> lows() const;
    std::vector<double> closes() const;
    std::vector<double> volumes() const;

private:
    std::vector<Bar> bars_;
};

// Returns a description of the first contract violation, or nullopt if the bars are usable
std::optional<std::string> check_bars(const std::vector<Bar>& bars);

// Per-position value; nullopt marks insufficient history or a degenerate range
using Value = std::optional<double>;
using Values = std::vector<Value>;

/**
 * Named numeric sequence aligned with the input Series
 */
class IndicatorSeries {
public:
    IndicatorSeries() = default;
    IndicatorSeries(std::string name, Values values)
        : name_(std::move(name)), values_(std::move(values)) {}

    // All positions undefined
    static IndicatorSeries undefined(std::string name, size_t length) {
        return IndicatorSeries(std::move(name), Values(length));
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const Values& values() const noexcept { return values_; }
    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    const Value& operator[](size_t i) const { return values_[i]; }

    [[nodiscard]] bool defined(size_t i) const { return i < values_.size() && values_[i].has_value(); }

    // Last position (nullopt for an empty series)
    [[nodiscard]] Value last() const { return values_.empty() ? Value{} : values_.back(); }

    // Position counted from the end: from_back(0) == last()
    [[nodiscard]] Value from_back(size_t offset) const {
        return offset < values_.size() ? values_[values_.size() - 1 - offset] : Value{};
    }

    [[nodiscard]] size_t count_defined() const noexcept;
    [[nodiscard]] bool all_undefined() const noexcept { return count_defined() == 0; }

    bool operator==(const IndicatorSeries&) const = default;

private:
    std::string name_;
    Values values_;
};

// ISO "YYYY-MM-DD"
std::string format_date(const std::chrono::year_month_day& date);
std::optional<std::chrono::year_month_day> parse_date(const std::string& text);

} // namespace vantage
