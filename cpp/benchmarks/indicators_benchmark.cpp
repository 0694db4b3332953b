#include "vantage/analysis_session.hpp"
#include "vantage/primitives.hpp"
#include "vantage/technical_indicators.hpp"
#include "vantage/trend_indicators.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <numeric>
#include <algorithm>
#include <cmath>
#include <random>
#include <functional>

using namespace vantage;

// Benchmark utilities
struct BenchmarkStats {
    double mean_ns;
    double std_dev_ns;
    double min_ns;
    double max_ns;
    double p50_ns;
    double p95_ns;
    double p99_ns;
    int num_samples;
};

BenchmarkStats compute_stats(std::vector<int64_t>& times) {
    std::sort(times.begin(), times.end());

    const int n = times.size();
    double sum = std::accumulate(times.begin(), times.end(), 0.0);
    double mean = sum / n;

    double sq_sum = 0.0;
    for (auto t : times) {
        sq_sum += (t - mean) * (t - mean);
    }
    double std_dev = std::sqrt(sq_sum / n);

    return BenchmarkStats{
        mean,
        std_dev,
        static_cast<double>(times.front()),
        static_cast<double>(times.back()),
        static_cast<double>(times[n / 2]),
        static_cast<double>(times[static_cast<int>(n * 0.95)]),
        static_cast<double>(times[static_cast<int>(n * 0.99)]),
        n
    };
}

void print_stats(const std::string& name, const BenchmarkStats& stats) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  " << std::left << std::setw(30) << name << " | "
              << std::setw(10) << stats.mean_ns / 1000.0 << " us (mean) | "
              << std::setw(10) << stats.p50_ns / 1000.0 << " us (p50) | "
              << std::setw(10) << stats.p99_ns / 1000.0 << " us (p99) | "
              << std::setw(10) << (1e9 / stats.mean_ns) << " ops/sec\n";
}

// Random-walk daily bars starting 2000-01-03
Series make_series(size_t num_bars, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> step(0.0, 1.0);
    std::uniform_real_distribution<double> wick(0.0, 1.0);
    std::uniform_int_distribution<uint64_t> volume(100000, 5000000);

    std::vector<Bar> bars;
    bars.reserve(num_bars);

    std::chrono::sys_days day = std::chrono::sys_days{std::chrono::year{2000} / 1 / 3};
    double close = 100.0;

    for (size_t i = 0; i < num_bars; ++i) {
        const double open = close;
        close = std::max(1.0, close + step(rng));
        const double high = std::max(open, close) + wick(rng);
        const double low = std::max(0.5, std::min(open, close) - wick(rng));

        bars.push_back(Bar{std::chrono::year_month_day{day}, open, high, low, close, volume(rng)});
        day += std::chrono::days{1};
    }

    return Series(std::move(bars));
}

BenchmarkStats time_it(int warmup, int iterations, const std::function<void()>& fn) {
    for (int i = 0; i < warmup; ++i) {
        fn();
    }

    std::vector<int64_t> times(iterations);
    for (int i = 0; i < iterations; ++i) {
        const auto start = std::chrono::high_resolution_clock::now();
        fn();
        const auto end = std::chrono::high_resolution_clock::now();
        times[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }

    return compute_stats(times);
}

// ============================================================================
// INDICATOR BENCHMARK
// ============================================================================

void benchmark_indicators() {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "             INDICATOR BENCHMARK (5000 bars)                 \n";
    std::cout << "============================================================\n\n";

    const int NUM_WARMUP = 20;
    const int NUM_ITERATIONS = 200;

    const auto series = make_series(5000, 42);
    const auto closes = series.closes();

    print_stats("SMA(20)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::simple_moving_average(closes, 20).size();
    }));
    print_stats("EMA(20)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::exponential_moving_average(closes, 20).size();
    }));
    print_stats("RSI(14)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_rsi(closes, 14).size();
    }));
    print_stats("MACD(12,26,9)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_macd(closes).histogram.size();
    }));
    print_stats("Bollinger(20,2)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_bollinger_bands(closes).upper.size();
    }));
    print_stats("ATR(14)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_atr(series, 14).size();
    }));
    print_stats("Stochastic(14,3)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_stochastic(series).d.size();
    }));
    print_stats("ADX(14)", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_adx(series).adx.size();
    }));
    print_stats("Parabolic SAR", time_it(NUM_WARMUP, NUM_ITERATIONS, [&] {
        volatile auto n = indicators::calculate_parabolic_sar(series).sar.size();
    }));
}

// ============================================================================
// SESSION BENCHMARK
// ============================================================================

void benchmark_sessions() {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "                  SESSION BENCHMARK                          \n";
    std::cout << "============================================================\n\n";

    const AnalysisConfig config;
    const auto series = make_series(5000, 7);

    print_stats("Full analysis (5000 bars)", time_it(5, 50, [&] {
        volatile auto n = analysis::AnalysisEngine::analyze(series, config).table.size();
    }));

    std::vector<Series> batch;
    for (uint64_t s = 0; s < 64; ++s) {
        batch.push_back(make_series(1000, 100 + s));
    }

    for (unsigned int threads : {1u, 2u, 4u, 8u}) {
        analysis::AnalysisEngine engine(threads);
        const auto stats = time_it(1, 10, [&] {
            volatile auto n = engine.analyze_batch(batch, config).size();
        });
        print_stats("Batch 64x1000, " + std::to_string(threads) + " threads", stats);
    }
}

int main() {
    std::cout << "\n";
    std::cout << "############################################################\n";
    std::cout << "#            VANTAGE ANALYSIS ENGINE BENCHMARKS            #\n";
    std::cout << "############################################################\n";

    benchmark_indicators();
    benchmark_sessions();

    std::cout << "\n";
    return 0;
}
