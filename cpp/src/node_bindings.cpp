#define NAPI_VERSION 8
#include <node_api.h>

#include "vantage/analysis_session.hpp"
#include "vantage/config.hpp"
#include "vantage/series.hpp"

#include <cmath>
#include <exception>
#include <map>
#include <string>
#include <vector>

/**
 * Node.js N-API bindings for the vantage analysis engine
 *
 * Converts plain JS bars/config to engine types and the report back
 * to plain objects. Undefined indicator positions become null.
 */

namespace vantage::bindings {

// Helper macros for N-API error handling
#define NAPI_CALL(env, call)                                      \
  do {                                                            \
    napi_status status = (call);                                  \
    if (status != napi_ok) {                                      \
      napi_throw_error(env, nullptr, "N-API call failed");        \
      return nullptr;                                             \
    }                                                             \
  } while(0)

#define NAPI_ASSERT(env, condition, message)                      \
  do {                                                            \
    if (!(condition)) {                                           \
      napi_throw_error(env, nullptr, message);                    \
      return nullptr;                                             \
    }                                                             \
  } while(0)

namespace {

// 2^64, first value outside uint64_t
constexpr double MAX_VOLUME = 18446744073709551616.0;

std::string get_string(napi_env env, napi_value value) {
    size_t len;
    napi_get_value_string_utf8(env, value, nullptr, 0, &len);
    std::string result(len, '\0');
    napi_get_value_string_utf8(env, value, &result[0], len + 1, &len);
    return result;
}

// String form of any JS value (numbers from config objects included)
std::string coerce_string(napi_env env, napi_value value) {
    napi_value str;
    napi_coerce_to_string(env, value, &str);
    return get_string(env, str);
}

bool get_named_double(napi_env env, napi_value obj, const char* name, double& out) {
    napi_value value;
    if (napi_get_named_property(env, obj, name, &value) != napi_ok) {
        return false;
    }
    return napi_get_value_double(env, value, &out) == napi_ok;
}

napi_value create_result_object(napi_env env) {
    napi_value obj;
    napi_create_object(env, &obj);
    return obj;
}

napi_value make_double(napi_env env, double value) {
    napi_value nval;
    napi_create_double(env, value, &nval);
    return nval;
}

napi_value make_optional(napi_env env, const Value& value) {
    if (!value) {
        napi_value null_value;
        napi_get_null(env, &null_value);
        return null_value;
    }
    return make_double(env, *value);
}

void set_property_double(napi_env env, napi_value obj, const char* name, double value) {
    napi_set_named_property(env, obj, name, make_double(env, value));
}

void set_property_optional(napi_env env, napi_value obj, const char* name, const Value& value) {
    napi_set_named_property(env, obj, name, make_optional(env, value));
}

void set_property_int64(napi_env env, napi_value obj, const char* name, int64_t value) {
    napi_value nval;
    napi_create_int64(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_string(napi_env env, napi_value obj, const char* name, std::string_view value) {
    napi_value nval;
    napi_create_string_utf8(env, value.data(), value.length(), &nval);
    napi_set_named_property(env, obj, name, nval);
}

napi_value make_series_array(napi_env env, const IndicatorSeries& series) {
    napi_value array;
    napi_create_array_with_length(env, series.size(), &array);
    for (size_t i = 0; i < series.size(); ++i) {
        napi_set_element(env, array, static_cast<uint32_t>(i), make_optional(env, series[i]));
    }
    return array;
}

napi_value make_double_array(napi_env env, const std::vector<double>& values) {
    napi_value array;
    napi_create_array_with_length(env, values.size(), &array);
    for (size_t i = 0; i < values.size(); ++i) {
        napi_set_element(env, array, static_cast<uint32_t>(i), make_double(env, values[i]));
    }
    return array;
}

napi_value make_columns(napi_env env, const analysis::ResultTable& table) {
    napi_value columns = create_result_object(env);

    napi_value dates;
    napi_create_array_with_length(env, table.size(), &dates);
    for (size_t i = 0; i < table.size(); ++i) {
        const std::string date = format_date(table.dates()[i]);
        napi_value nval;
        napi_create_string_utf8(env, date.c_str(), date.length(), &nval);
        napi_set_element(env, dates, static_cast<uint32_t>(i), nval);
    }
    napi_set_named_property(env, columns, "DATE", dates);

    for (auto column : analysis::all_columns()) {
        const std::string name(analysis::column_name(column));
        napi_set_named_property(env, columns, name.c_str(), make_series_array(env, table.column(column)));
    }
    for (const auto& [period, series] : table.moving_averages()) {
        napi_set_named_property(env, columns, series.name().c_str(), make_series_array(env, series));
    }

    return columns;
}

napi_value make_signals(napi_env env, const std::vector<signals::Signal>& list) {
    napi_value array;
    napi_create_array_with_length(env, list.size(), &array);

    for (size_t i = 0; i < list.size(); ++i) {
        napi_value signal = create_result_object(env);
        set_property_string(env, signal, "kind", signals::to_string(list[i].kind));
        set_property_string(env, signal, "severity", signals::to_string(list[i].severity));
        set_property_string(env, signal, "title", list[i].title);
        set_property_string(env, signal, "message", list[i].message);
        set_property_optional(env, signal, "value", list[i].value);
        napi_set_element(env, array, static_cast<uint32_t>(i), signal);
    }

    return array;
}

napi_value make_summary(napi_env env, const analysis::Summary& summary) {
    napi_value result = create_result_object(env);

    set_property_string(env, result, "lastDate", format_date(summary.last_date));
    set_property_double(env, result, "lastPrice", summary.last_price);
    set_property_optional(env, result, "changePct", summary.change_pct);
    set_property_int64(env, result, "volume", static_cast<int64_t>(summary.last_volume));
    set_property_double(env, result, "avgVolume", summary.average_volume);
    set_property_optional(env, result, "volatility", summary.volatility);
    set_property_double(env, result, "periodHigh", summary.period_high);
    set_property_double(env, result, "periodLow", summary.period_low);
    set_property_int64(env, result, "dataPoints", static_cast<int64_t>(summary.data_points));
    set_property_optional(env, result, "rsi", summary.rsi);
    set_property_optional(env, result, "macd", summary.macd);
    set_property_optional(env, result, "macdSignal", summary.macd_signal);
    set_property_optional(env, result, "bbPosition", summary.percent_b);
    set_property_optional(env, result, "atr", summary.atr);
    set_property_optional(env, result, "stochasticK", summary.stochastic_k);
    set_property_optional(env, result, "adx", summary.adx);
    set_property_optional(env, result, "sar", summary.sar);
    set_property_optional(env, result, "volumeRatio", summary.volume_ratio);
    set_property_string(env, result, "trend", analysis::to_string(summary.trend));

    for (const auto& [period, value] : summary.moving_averages) {
        const std::string name = "ma" + std::to_string(period);
        set_property_optional(env, result, name.c_str(), value);
    }

    napi_set_named_property(env, result, "signals", make_signals(env, summary.signals));
    return result;
}

napi_value make_levels(napi_env env, const analysis::AnalysisReport& report) {
    napi_value levels = create_result_object(env);

    napi_value pivots = create_result_object(env);
    set_property_double(env, pivots, "pivot", report.pivots.pivot);
    set_property_double(env, pivots, "r1", report.pivots.r1);
    set_property_double(env, pivots, "s1", report.pivots.s1);
    set_property_double(env, pivots, "r2", report.pivots.r2);
    set_property_double(env, pivots, "s2", report.pivots.s2);
    set_property_double(env, pivots, "r3", report.pivots.r3);
    set_property_double(env, pivots, "s3", report.pivots.s3);
    napi_set_named_property(env, levels, "pivots", pivots);

    napi_set_named_property(env, levels, "supports", make_double_array(env, report.levels.supports));
    napi_set_named_property(env, levels, "resistances", make_double_array(env, report.levels.resistances));

    if (report.fibonacci) {
        napi_value fib = create_result_object(env);
        for (const auto& level : *report.fibonacci) {
            const std::string name = "fib_" + std::to_string(level.ratio);
            set_property_double(env, fib, name.c_str(), level.price);
        }
        napi_set_named_property(env, levels, "fibonacci", fib);
    }

    return levels;
}

} // namespace

/**
 * analyze(bars: {date, open, high, low, close, volume}[], config?: {[key]: string | number})
 * Returns: { columns, signals, summary, levels, calcTimeNs }
 */
napi_value Analyze(napi_env env, napi_callback_info info) {
    size_t argc = 2;
    napi_value args[2];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 1, "Expected arguments: bars[, config]");

    bool is_array = false;
    NAPI_CALL(env, napi_is_array(env, args[0], &is_array));
    NAPI_ASSERT(env, is_array, "bars must be an array");

    uint32_t length = 0;
    NAPI_CALL(env, napi_get_array_length(env, args[0], &length));

    std::vector<Bar> bars;
    bars.reserve(length);

    for (uint32_t i = 0; i < length; ++i) {
        napi_value element;
        NAPI_CALL(env, napi_get_element(env, args[0], i, &element));

        napi_value date_value;
        NAPI_CALL(env, napi_get_named_property(env, element, "date", &date_value));
        const auto date = parse_date(coerce_string(env, date_value));
        NAPI_ASSERT(env, date.has_value(), "bar date must be YYYY-MM-DD");

        Bar bar{};
        bar.date = *date;
        double volume = 0.0;
        const bool ok = get_named_double(env, element, "open", bar.open)
            && get_named_double(env, element, "high", bar.high)
            && get_named_double(env, element, "low", bar.low)
            && get_named_double(env, element, "close", bar.close)
            && get_named_double(env, element, "volume", volume);
        NAPI_ASSERT(env, ok, "bar fields open/high/low/close/volume must be numbers");
        NAPI_ASSERT(env, std::isfinite(volume) && volume >= 0.0 && volume < MAX_VOLUME,
                    "bar volume must be a non-negative finite number");
        NAPI_ASSERT(env, std::floor(volume) == volume, "bar volume must be a whole number");
        bar.volume = static_cast<uint64_t>(volume);

        bars.push_back(bar);
    }

    if (const auto violation = check_bars(bars)) {
        napi_throw_error(env, nullptr, violation->c_str());
        return nullptr;
    }

    std::map<std::string, std::string> entries;
    if (argc >= 2) {
        napi_valuetype type;
        NAPI_CALL(env, napi_typeof(env, args[1], &type));
        if (type == napi_object) {
            napi_value keys;
            NAPI_CALL(env, napi_get_property_names(env, args[1], &keys));
            uint32_t key_count = 0;
            NAPI_CALL(env, napi_get_array_length(env, keys, &key_count));
            for (uint32_t i = 0; i < key_count; ++i) {
                napi_value key;
                napi_value value;
                NAPI_CALL(env, napi_get_element(env, keys, i, &key));
                NAPI_CALL(env, napi_get_property(env, args[1], key, &value));
                entries[get_string(env, key)] = coerce_string(env, value);
            }
        }
    }

    analysis::AnalysisReport report;
    try {
        const auto config = parse_config(entries);
        report = analysis::AnalysisEngine::analyze(Series(std::move(bars)), config);
    } catch (const std::exception& e) {
        napi_throw_error(env, nullptr, e.what());
        return nullptr;
    }

    napi_value result = create_result_object(env);
    napi_set_named_property(env, result, "columns", make_columns(env, report.table));
    napi_set_named_property(env, result, "signals", make_signals(env, report.signals));
    napi_set_named_property(env, result, "summary", make_summary(env, report.summary));
    napi_set_named_property(env, result, "levels", make_levels(env, report));
    set_property_int64(env, result, "calcTimeNs", report.calc_time_ns);

    return result;
}

/**
 * columnNames(): string[]
 */
napi_value ColumnNames(napi_env env, napi_callback_info info) {
    napi_value array;
    NAPI_CALL(env, napi_create_array_with_length(env, analysis::COLUMN_COUNT, &array));

    uint32_t index = 0;
    for (auto column : analysis::all_columns()) {
        const auto name = analysis::column_name(column);
        napi_value nval;
        NAPI_CALL(env, napi_create_string_utf8(env, name.data(), name.length(), &nval));
        NAPI_CALL(env, napi_set_element(env, array, index++, nval));
    }

    return array;
}

//=============================================================================
// MODULE INITIALIZATION
//=============================================================================

napi_value Init(napi_env env, napi_value exports) {
    napi_value fn;

    napi_create_function(env, nullptr, 0, Analyze, nullptr, &fn);
    napi_set_named_property(env, exports, "analyze", fn);

    napi_create_function(env, nullptr, 0, ColumnNames, nullptr, &fn);
    napi_set_named_property(env, exports, "columnNames", fn);

    return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)

} // namespace vantage::bindings
