#include "../include/options_pricing.hpp"
#include "../include/payoff_evaluator.hpp"
#include "../include/strategy_resolver.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <vector>
#include <numeric>
#include <algorithm>
#include <cmath>
#include <string>

using namespace fxhedge;
using namespace fxhedge::options;

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
              << std::setw(8) << stats.mean_ns << " ns (mean) | "
              << std::setw(8) << stats.p50_ns << " ns (p50) | "
              << std::setw(8) << stats.p99_ns << " ns (p99) | "
              << std::setw(10) << (1e9 / stats.mean_ns) << " ops/sec\n";
}

template <typename Fn>
BenchmarkStats time_calls(int warmup, int iterations, Fn&& fn) {
    for (int i = 0; i < warmup; ++i) {
        volatile double sink = fn();
        (void)sink;
    }

    std::vector<int64_t> times(iterations);
    for (int i = 0; i < iterations; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        volatile double sink = fn();
        (void)sink;
        auto end = std::chrono::high_resolution_clock::now();
        times[i] = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }
    return compute_stats(times);
}

// Market used throughout: EUR/USD-like spot, 1y, 10% vol
constexpr double S = 1.10, T = 1.0, r_d = 0.02, r_f = 0.01, sigma = 0.10;

// ============================================================================
// GARMAN-KOHLHAGEN BENCHMARK
// ============================================================================

void benchmark_garman_kohlhagen() {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "              GARMAN-KOHLHAGEN BENCHMARK                     \n";
    std::cout << "============================================================\n\n";

    const int NUM_WARMUP = 10000;
    const int NUM_ITERATIONS = 100000;

    auto call = time_calls(NUM_WARMUP, NUM_ITERATIONS, [] {
        return GarmanKohlhagenPricer::price(OptionType::CALL, S, 1.10, T, r_d, r_f, sigma);
    });
    print_stats("GK Call (ATM)", call);

    auto put = time_calls(NUM_WARMUP, NUM_ITERATIONS, [] {
        return GarmanKohlhagenPricer::price(OptionType::PUT, S, 1.05, T, r_d, r_f, sigma);
    });
    print_stats("GK Put (OTM)", put);

    // Strike ladder, as used by the dashboard smile view
    std::vector<double> strikes;
    for (double K = 0.90; K <= 1.30; K += 0.005) {
        strikes.push_back(K);
    }

    auto start = std::chrono::high_resolution_clock::now();
    double total = 0.0;
    for (double K : strikes) {
        total += GarmanKohlhagenPricer::price(OptionType::CALL, S, K, T, r_d, r_f, sigma);
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    std::cout << "\n  Strike ladder: " << strikes.size() << " calls in "
              << elapsed << " ns (" << std::setprecision(2)
              << static_cast<double>(elapsed) / strikes.size() << " ns/option, sum="
              << std::setprecision(4) << total << ")\n";
}

// ============================================================================
// BARRIER BENCHMARK
// ============================================================================

void benchmark_barriers() {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "                 BARRIER OPTIONS BENCHMARK                   \n";
    std::cout << "============================================================\n\n";

    const int NUM_WARMUP = 5000;
    const int NUM_ITERATIONS = 50000;

    auto uo = time_calls(NUM_WARMUP, NUM_ITERATIONS, [] {
        return BarrierOptionPricer::price_single(
            OptionType::CALL, BarrierType::UP_AND_OUT, S, 1.10, 1.25, T, r_d, r_f, sigma);
    });
    print_stats("Up-and-Out Call", uo);

    auto di = time_calls(NUM_WARMUP, NUM_ITERATIONS, [] {
        return BarrierOptionPricer::price_single(
            OptionType::PUT, BarrierType::DOWN_AND_IN, S, 1.05, 1.00, T, r_d, r_f, sigma);
    });
    print_stats("Down-and-In Put", di);

    auto dko = time_calls(NUM_WARMUP, NUM_ITERATIONS, [] {
        return BarrierOptionPricer::price_double(
            OptionType::CALL, DoubleBarrierType::KNOCK_OUT, S, 1.10, 1.00, 1.20, T, r_d, r_f, sigma);
    });
    print_stats("Double Knock-Out Call (n=11)", dko);

    const double out = BarrierOptionPricer::price_double(
        OptionType::CALL, DoubleBarrierType::KNOCK_OUT, S, 1.10, 1.00, 1.20, T, r_d, r_f, sigma);
    const double in = BarrierOptionPricer::price_double(
        OptionType::CALL, DoubleBarrierType::KNOCK_IN, S, 1.10, 1.00, 1.20, T, r_d, r_f, sigma);
    const double vanilla = GarmanKohlhagenPricer::price(OptionType::CALL, S, 1.10, T, r_d, r_f, sigma);

    std::cout << std::setprecision(8)
              << "\n  DKO + DKI = " << (out + in) << "  vanilla = " << vanilla << "\n";
}

// ============================================================================
// STRATEGY BENCHMARK
// ============================================================================

void benchmark_strategies() {
    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "             STRATEGY RESOLUTION / PAYOFF BENCHMARK          \n";
    std::cout << "============================================================\n\n";

    strategy::StrategyResolver resolver;
    strategy::StrategyParams params;
    params.market = MarketParams{S, r_d, r_f, sigma, T};
    params.strike_upper = Level::absolute(1.15);

    std::vector<int64_t> times(1000);
    strategy::ResolveResult resolved;
    for (auto& t : times) {
        auto start = std::chrono::high_resolution_clock::now();
        resolved = resolver.resolve(strategy::StrategyKey::COLLAR_CALL, params);
        auto end = std::chrono::high_resolution_clock::now();
        t = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    }
    print_stats("Zero-cost collar solve", compute_stats(times));

    const int NUM_CURVES = 2000;
    auto start = std::chrono::high_resolution_clock::now();
    size_t points = 0;
    for (int i = 0; i < NUM_CURVES; ++i) {
        auto curve = payoff::PayoffEvaluator::payoff_curve(
            resolved.strategy, params.market, payoff::SweepConfig{}, 0.0);
        points += curve.points.size();
    }
    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    std::cout << "\n  Payoff curves: " << NUM_CURVES << " x 100 points, "
              << std::setprecision(1) << static_cast<double>(elapsed) / points << " ns/point\n";
}

int main() {
    std::cout << "============================================================\n";
    std::cout << "        FXHEDGE CLOSED-FORM PRICING ENGINE - BENCHMARK       \n";
    std::cout << "============================================================\n";
    std::cout << "\n";
    std::cout << "Models implemented:\n";
    std::cout << "  - Garman-Kohlhagen FX vanilla\n";
    std::cout << "  - Single barrier (Reiner-Rubinstein / Haug)\n";
    std::cout << "  - Double barrier (Ikeda-Kunitomo series)\n";
    std::cout << "  - Zero-cost collar strike solver\n";
    std::cout << "\n";

    benchmark_garman_kohlhagen();
    benchmark_barriers();
    benchmark_strategies();

    std::cout << "\n";
    std::cout << "============================================================\n";
    std::cout << "                   BENCHMARK COMPLETE                         \n";
    std::cout << "============================================================\n";

    return 0;
}
