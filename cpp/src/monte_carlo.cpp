#include "monte_carlo.hpp"
#include <cmath>
#include <algorithm>
#include <string>

namespace fxhedge::montecarlo {

namespace {

[[nodiscard]] bool valid_leg_levels(const ResolvedLeg& leg) noexcept {
    if (!(leg.strike > 0.0) || !(leg.volatility > 0.0)) {
        return false;
    }
    switch (leg.barrier) {
        case BarrierKind::NONE:
            return true;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN:
            return leg.barrier_level > 0.0;
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN:
            return leg.lower_barrier > 0.0 && leg.lower_barrier < leg.upper_barrier;
    }
    return false;
}

} // namespace

MonteCarloEngine::MonteCarloEngine(MonteCarloConfig config)
    : config_(config),
      num_threads_(config.num_threads == 0
                       ? std::max(1u, std::thread::hardware_concurrency())
                       : config.num_threads) {
}

MonteCarloResult MonteCarloEngine::price(
    const ResolvedLeg& leg,
    const MarketParams& market,
    const DiagnosticSink& sink
) const {
    const auto start = std::chrono::steady_clock::now();

    MonteCarloResult result{};

    if (!(market.spot > 0.0) || !(market.maturity > 0.0) || !valid_leg_levels(leg)) {
        emit(sink, DIAG_INVALID_INPUT,
             "monte carlo: spot, maturity, strike, volatility and barriers must be positive "
             "with lower < upper (S=" + std::to_string(market.spot) +
             ", T=" + std::to_string(market.maturity) +
             ", K=" + std::to_string(leg.strike) + ")");
        return result;
    }
    if (config_.num_paths == 0) {
        emit(sink, DIAG_INVALID_INPUT, "monte carlo: num_paths must be positive");
        return result;
    }

    const size_t num_paths = config_.num_paths;
    const size_t batch_size = std::max<size_t>(config_.batch_size, 1);
    const size_t num_batches = (num_paths + batch_size - 1) / batch_size;
    const size_t workers = std::min<size_t>(num_threads_, num_batches);

    std::vector<BatchSums> partials(num_batches);
    std::vector<std::future<void>> futures;
    futures.reserve(workers);

    // Contiguous batch ranges per worker; batch b always uses stream b
    for (size_t t = 0; t < workers; ++t) {
        const size_t first = t * num_batches / workers;
        const size_t last = (t + 1) * num_batches / workers;

        futures.push_back(std::async(std::launch::async,
            [this, &partials, &leg, &market, first, last, num_paths, batch_size]() {
                for (size_t b = first; b < last; ++b) {
                    const size_t begin = b * batch_size;
                    const size_t count = std::min(batch_size, num_paths - begin);
                    Xoshiro256PP rng(stream_seed(config_.seed, b));
                    partials[b] = simulate_batch(leg, market, config_.time_steps, count,
                                                 config_.brownian_bridge, rng);
                }
            }));
    }

    for (auto& future : futures) {
        future.get();
    }

    double sum = 0.0;
    double sum_sq = 0.0;
    size_t hits = 0;
    for (const auto& partial : partials) {
        sum += partial.sum;
        sum_sq += partial.sum_sq;
        hits += partial.hits;
    }

    const double n = static_cast<double>(num_paths);
    const double disc = std::exp(-market.r_domestic * market.maturity);
    const double mean = sum / n;
    const double variance = std::max(sum_sq / n - mean * mean, 0.0);
    const double scale = leg.quantity / 100.0;

    result.unit_price = disc * mean;
    result.unit_std_error = disc * std::sqrt(variance / n);
    result.price = result.unit_price * scale;
    result.std_error = result.unit_std_error * std::abs(scale);
    result.num_paths = num_paths;
    result.hit_ratio = static_cast<double>(hits) / n;

    if (config_.max_std_error > 0.0 && result.unit_std_error > config_.max_std_error) {
        emit(sink, DIAG_CONVERGENCE_RISK,
             "monte carlo: standard error " + std::to_string(result.unit_std_error) +
             " exceeds " + std::to_string(config_.max_std_error) +
             " with " + std::to_string(num_paths) + " paths");
    }

    const auto end = std::chrono::steady_clock::now();
    result.calc_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return result;
}

} // namespace fxhedge::montecarlo
