#include "vantage/series.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace vantage {

namespace {

template <typename Field>
std::vector<double> extract(const std::vector<Bar>& bars, Field field) {
    std::vector<double> out;
    out.reserve(bars.size());
    for (const auto& bar : bars) {
        out.push_back(field(bar));
    }
    return out;
}

} // namespace

std::vector<double> Series::opens() const {
    return extract(bars_, [](const Bar& b) { return b.open; });
}

std::vector<double> Series::highs() const {
    return extract(bars_, [](const Bar& b) { return b.high; });
}

std::vector<double> Series::lows() const {
    return extract(bars_, [](const Bar& b) { return b.low; });
}

std::vector<double> Series::closes() const {
    return extract(bars_, [](const Bar& b) { return b.close; });
}

std::vector<double> Series::volumes() const {
    return extract(bars_, [](const Bar& b) { return static_cast<double>(b.volume); });
}

size_t IndicatorSeries::count_defined() const noexcept {
    return static_cast<size_t>(std::count_if(values_.begin(), values_.end(),
        [](const Value& v) { return v.has_value(); }));
}

std::optional<std::string> check_bars(const std::vector<Bar>& bars) {
    for (size_t i = 0; i < bars.size(); ++i) {
        const Bar& bar = bars[i];
        std::ostringstream ss;
        ss << "bar " << i << " (" << format_date(bar.date) << "): ";

        if (!bar.date.ok()) {
            ss << "invalid date";
            return ss.str();
        }
        if (!std::isfinite(bar.open) || !std::isfinite(bar.high) ||
            !std::isfinite(bar.low) || !std::isfinite(bar.close)) {
            ss << "prices must be finite";
            return ss.str();
        }
        if (bar.open <= 0.0 || bar.high <= 0.0 || bar.low <= 0.0 || bar.close <= 0.0) {
            ss << "prices must be positive";
            return ss.str();
        }
        if (bar.high < bar.low) {
            ss << "high " << bar.high << " below low " << bar.low;
            return ss.str();
        }
        if (std::min(bar.open, bar.close) < bar.low || std::max(bar.open, bar.close) > bar.high) {
            ss << "open/close outside [low, high]";
            return ss.str();
        }
        if (i > 0 && !(bars[i - 1].date < bar.date)) {
            ss << "date not after previous bar " << format_date(bars[i - 1].date);
            return ss.str();
        }
    }
    return std::nullopt;
}

std::string format_date(const std::chrono::year_month_day& date) {
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << static_cast<int>(date.year()) << '-'
       << std::setw(2) << static_cast<unsigned>(date.month()) << '-'
       << std::setw(2) << static_cast<unsigned>(date.day());
    return ss.str();
}

std::optional<std::chrono::year_month_day> parse_date(const std::string& text) {
    // Format: "2024-02-04"
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    const char* s = text.data();
    if (std::from_chars(s, s + 4, y).ec != std::errc{} ||
        std::from_chars(s + 5, s + 7, m).ec != std::errc{} ||
        std::from_chars(s + 8, s + 10, d).ec != std::errc{}) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

} // namespace vantage
