#include "../include/monte_carlo.hpp"
#include "../include/options_pricing.hpp"
#include <iostream>
#include <iomanip>
#include <vector>

using namespace fxhedge;
using namespace fxhedge::montecarlo;

namespace {

const MarketParams kMarket{
    .spot = 1.10,
    .r_domestic = 0.02,
    .r_foreign = 0.01,
    .volatility = 0.10,
    .maturity = 1.0
};

ResolvedLeg up_and_out_call() {
    ResolvedLeg leg{};
    leg.type = OptionType::CALL;
    leg.barrier = BarrierKind::KNOCK_OUT;
    leg.strike = 1.10;
    leg.barrier_level = 1.25;
    leg.volatility = kMarket.volatility;
    leg.quantity = 100.0;
    return leg;
}

} // namespace

void benchmark_barrier_convergence() {
    std::cout << "\n=== UP-AND-OUT CALL CONVERGENCE (K=1.10, H=1.25) ===\n\n";

    const double reference = options::BarrierOptionPricer::price_single(
        OptionType::CALL, options::BarrierType::UP_AND_OUT,
        kMarket.spot, 1.10, 1.25, kMarket.maturity,
        kMarket.r_domestic, kMarket.r_foreign, kMarket.volatility);

    std::cout << "Closed form:             " << std::fixed << std::setprecision(6) << reference << "\n\n";
    std::cout << "Convergence warnings above 2e-4 unit std error go to stderr\n\n";
    std::cout << "   Paths |    Price   |  Std Err  | Error/SE | Time (ms)\n";
    std::cout << "-----------------------------------------------------------\n";

    const auto leg = up_and_out_call();
    const auto warn = stderr_sink();
    for (size_t paths : {1000u, 10000u, 100000u}) {
        MonteCarloConfig config;
        config.num_paths = paths;
        config.max_std_error = 2e-4;
        MonteCarloEngine engine(config);
        auto result = engine.price(leg, kMarket, warn);

        std::cout << std::setw(8) << paths << " | "
                  << std::setprecision(6) << std::setw(10) << result.price << " | "
                  << std::setw(9) << result.std_error << " | "
                  << std::setprecision(2) << std::setw(8)
                  << (result.price - reference) / result.std_error << " | "
                  << std::setprecision(1) << result.calc_time_ns / 1e6 << "\n";
    }
}

void benchmark_brownian_bridge() {
    std::cout << "\n=== DISCRETE MONITORING BIAS (52 steps, 100K paths) ===\n\n";

    const auto leg = up_and_out_call();

    MonteCarloConfig config;
    config.num_paths = 100000;
    config.time_steps = 52;

    config.brownian_bridge = false;
    auto discrete = MonteCarloEngine(config).price(leg, kMarket);
    config.brownian_bridge = true;
    auto bridged = MonteCarloEngine(config).price(leg, kMarket);

    std::cout << std::fixed << std::setprecision(6);
    std::cout << "Without bridge:          " << discrete.price << " (hit ratio "
              << std::setprecision(3) << discrete.hit_ratio << ")\n";
    std::cout << "With bridge:             " << std::setprecision(6) << bridged.price << " (hit ratio "
              << std::setprecision(3) << bridged.hit_ratio << ")\n";
}

void benchmark_multi_thread_scaling() {
    std::cout << "\n=== MULTI-THREADING SCALABILITY TEST ===\n\n";

    const unsigned int max_threads = std::max(1u, std::thread::hardware_concurrency());
    std::cout << "System has " << max_threads << " hardware threads\n";
    std::cout << "Testing with 50,000 paths x 252 steps...\n\n";

    std::vector<unsigned int> thread_counts = {1, 2, 4, max_threads};

    std::cout << "Threads | Time (ms) | Paths/sec | Speedup |   Price\n";
    std::cout << "------------------------------------------------------\n";

    const auto leg = up_and_out_call();
    int64_t baseline_time = 0;

    for (unsigned int num_threads : thread_counts) {
        if (num_threads > max_threads) continue;

        MonteCarloConfig config;
        config.num_paths = 50000;
        config.num_threads = num_threads;
        MonteCarloEngine engine(config);
        auto result = engine.price(leg, kMarket);

        if (baseline_time == 0) {
            baseline_time = result.calc_time_ns;
        }

        const double time_ms = result.calc_time_ns / 1e6;
        const double paths_per_sec = (config.num_paths * 1e9) / result.calc_time_ns;
        const double speedup = static_cast<double>(baseline_time) / result.calc_time_ns;

        std::cout << std::setw(7) << num_threads << " | "
                  << std::fixed << std::setprecision(1) << std::setw(9) << time_ms << " | "
                  << std::setprecision(0) << std::setw(9) << paths_per_sec << " | "
                  << std::setprecision(2) << std::setw(6) << speedup << "x | "
                  << std::setprecision(6) << result.price << "\n";
    }

    std::cout << "\nPrice column is identical across thread counts.\n";
}

int main() {
    std::cout << "============================================================\n";
    std::cout << "         FXHEDGE MONTE CARLO BARRIER ENGINE - BENCHMARK      \n";
    std::cout << "============================================================\n";

    benchmark_barrier_convergence();
    benchmark_brownian_bridge();
    benchmark_multi_thread_scaling();

    std::cout << "\nMonte Carlo benchmarks complete.\n\n";

    return 0;
}
