#pragma once

#include <vector>
#include <cmath>
#include <chrono>
#include <algorithm>
#include <thread>
#include <future>
#include <array>
#include <cstdint>

#include "fx_types.hpp"

namespace fxhedge::montecarlo {

// =============================================================================
// XOSHIRO256++ RANDOM NUMBER GENERATOR
// =============================================================================

[[nodiscard]] inline uint64_t splitmix64(uint64_t& x) noexcept {
    uint64_t z = (x += 0x9e3779b97f4a7c15);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
    z = (z ^ (z >> 27)) * 0x94d049bb133111eb;
    return z ^ (z >> 31);
}

/**
 * Xoshiro256++ - Fast, High-Quality PRNG
 *
 * Properties:
 * - Period: 2^256 - 1
 * - Passes BigCrush and PractRand
 * - Splitmix64 seeding for proper initialization
 *
 * Reference: https://prng.di.unimi.it/xoshiro256plusplus.c
 */
class Xoshiro256PP {
public:
    explicit Xoshiro256PP(uint64_t seed) noexcept {
        state_[0] = splitmix64(seed);
        state_[1] = splitmix64(seed);
        state_[2] = splitmix64(seed);
        state_[3] = splitmix64(seed);
    }

    __attribute__((always_inline))
    uint64_t operator()() noexcept {
        const uint64_t result = rotl(state_[0] + state_[3], 23) + state_[0];
        const uint64_t t = state_[1] << 17;

        state_[2] ^= state_[0];
        state_[3] ^= state_[1];
        state_[1] ^= state_[2];
        state_[0] ^= state_[3];

        state_[2] ^= t;
        state_[3] = rotl(state_[3], 45);

        return result;
    }

    /**
     * Generate uniform double in [0, 1) - IEEE 754 precision
     */
    __attribute__((always_inline))
    double uniform() noexcept {
        return (operator()() >> 11) * 0x1.0p-53;
    }

private:
    std::array<uint64_t, 4> state_;

    static inline uint64_t rotl(uint64_t x, int k) noexcept {
        return (x << k) | (x >> (64 - k));
    }
};

/**
 * Box-Muller transform over any generator exposing uniform() in [0, 1).
 * Produces normals in pairs and hands out the cached sine variate on the
 * next call.
 */
template <typename UniformRng>
class BoxMullerNormal {
public:
    explicit BoxMullerNormal(UniformRng& rng) noexcept : rng_(rng) {}

    double operator()() noexcept {
        if (has_spare_) {
            has_spare_ = false;
            return spare_;
        }

        constexpr double TWO_PI = 6.283185307179586;
        const double u1 = 1.0 - rng_.uniform();   // (0, 1], keeps log finite
        const double u2 = rng_.uniform();
        const double radius = std::sqrt(-2.0 * std::log(u1));
        const double angle = TWO_PI * u2;

        spare_ = radius * std::sin(angle);
        has_spare_ = true;
        return radius * std::cos(angle);
    }

private:
    UniformRng& rng_;
    double spare_{0.0};
    bool has_spare_{false};
};

// Probability that a log-Brownian bridge between s0 and s1, both on the same
// side of `level`, touches it within a step of variance var_dt
[[nodiscard]] inline double bridge_crossing_probability(
    double s0, double s1, double level, double var_dt
) noexcept {
    const double a = std::log(s0 / level);
    const double c = std::log(s1 / level);
    if (a * c <= 0.0) {
        return 1.0;
    }
    return std::exp(-2.0 * a * c / var_dt);
}

// =============================================================================
// BARRIER MONTE CARLO ENGINE
// =============================================================================

struct MonteCarloConfig {
    size_t num_paths{10000};
    size_t time_steps{252};          // dt = T / time_steps
    uint64_t seed{42};
    unsigned int num_threads{0};     // 0 = hardware concurrency
    size_t batch_size{4096};         // paths per independent RNG stream
    bool brownian_bridge{true};      // continuous-monitoring correction
    double max_std_error{0.0};       // 0 disables the convergence warning
};

// Partial sums of one batch of paths
struct BatchSums {
    double sum{0.0};
    double sum_sq{0.0};
    size_t paths{0};
    size_t hits{0};
};

struct MonteCarloResult {
    double unit_price;          // premium for 100% notional
    double unit_std_error;
    double price;               // unit_price * quantity / 100
    double std_error;
    size_t num_paths;
    double hit_ratio;           // fraction of paths that touched the barrier
    int64_t calc_time_ns;
};

class MonteCarloEngine {
public:
    explicit MonteCarloEngine(MonteCarloConfig config = {});

    /**
     * Discounted expected payoff of a resolved leg under GBM with drift
     * r_d - r_f and the leg's volatility. Batches run in parallel, each on
     * its own Xoshiro256++ stream, and are reduced in batch order so the
     * result does not depend on the thread count.
     */
    [[nodiscard]] MonteCarloResult price(
        const ResolvedLeg& leg,
        const MarketParams& market,
        const DiagnosticSink& sink = {}
    ) const;

    /**
     * Simulate num_paths paths for one leg with an injected generator.
     * Knock-out paths stop at the first hit. Knock-in paths run to maturity.
     */
    template <typename Rng>
    [[nodiscard]] static BatchSums simulate_batch(
        const ResolvedLeg& leg,
        const MarketParams& market,
        size_t time_steps,
        size_t num_paths,
        bool brownian_bridge,
        Rng& rng
    );

    // Seed of the RNG stream used for batch `stream`
    [[nodiscard]] static uint64_t stream_seed(uint64_t seed, uint64_t stream) noexcept {
        uint64_t x = seed ^ (0xd1b54a32d192ed03ULL * (stream + 1));
        return splitmix64(x);
    }

    [[nodiscard]] const MonteCarloConfig& config() const noexcept { return config_; }
    [[nodiscard]] unsigned int num_threads() const noexcept { return num_threads_; }

private:
    MonteCarloConfig config_;
    unsigned int num_threads_;

    template <typename Rng>
    [[nodiscard]] static bool crossed_within_step(
        const ResolvedLeg& leg, double s0, double s1, double var_dt, Rng& rng
    );
};

// =============================================================================
// TEMPLATE IMPLEMENTATION
// =============================================================================

template <typename Rng>
bool MonteCarloEngine::crossed_within_step(
    const ResolvedLeg& leg, double s0, double s1, double var_dt, Rng& rng
) {
    // Neither endpoint triggered the barrier
    double p = 0.0;

    switch (leg.barrier) {
        case BarrierKind::NONE:
            return false;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN:
            p = bridge_crossing_probability(s0, s1, leg.barrier_level, var_dt);
            break;
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN:
            if (!leg.reverse) {
                const double p_lower = bridge_crossing_probability(s0, s1, leg.lower_barrier, var_dt);
                const double p_upper = bridge_crossing_probability(s0, s1, leg.upper_barrier, var_dt);
                p = 1.0 - (1.0 - p_lower) * (1.0 - p_upper);
            } else {
                // Both endpoints outside the corridor
                const bool s0_above = s0 >= leg.upper_barrier;
                const bool s1_above = s1 >= leg.upper_barrier;
                if (s0_above != s1_above) {
                    return true;   // jumped across the corridor
                }
                const double level = s0_above ? leg.upper_barrier : leg.lower_barrier;
                p = bridge_crossing_probability(s0, s1, level, var_dt);
            }
            break;
    }

    return p > 0.0 && rng.uniform() < p;
}

template <typename Rng>
BatchSums MonteCarloEngine::simulate_batch(
    const ResolvedLeg& leg,
    const MarketParams& market,
    size_t time_steps,
    size_t num_paths,
    bool brownian_bridge,
    Rng& rng
) {
    BatchSums sums{};
    sums.paths = num_paths;

    const size_t steps = std::max<size_t>(time_steps, 1);
    const double sigma = leg.volatility;
    const double dt = market.maturity / static_cast<double>(steps);
    const double var_dt = sigma * sigma * dt;
    const double drift = (market.r_domestic - market.r_foreign - 0.5 * sigma * sigma) * dt;
    const double diffusion = sigma * std::sqrt(dt);

    const bool has_barrier = leg.barrier != BarrierKind::NONE;
    const bool knock_out = is_knock_out(leg.barrier);

    BoxMullerNormal<Rng> normal(rng);

    for (size_t path = 0; path < num_paths; ++path) {
        double S = market.spot;
        bool hit = has_barrier && barrier_triggered(leg, S);

        for (size_t step = 0; step < steps; ++step) {
            if (hit && knock_out) {
                break;
            }

            // GBM: S(t+dt) = S(t) * exp((r_d - r_f - sigma^2/2)dt + sigma*sqrt(dt)*Z)
            const double S_next = S * std::exp(drift + diffusion * normal());

            if (has_barrier && !hit) {
                hit = barrier_triggered(leg, S_next) ||
                      (brownian_bridge && crossed_within_step(leg, S, S_next, var_dt, rng));
            }
            S = S_next;
        }

        double payoff = 0.0;
        if (!has_barrier) {
            payoff = intrinsic_value(leg.type, S, leg.strike);
        } else if (knock_out) {
            payoff = hit ? 0.0 : intrinsic_value(leg.type, S, leg.strike);
        } else {
            payoff = hit ? intrinsic_value(leg.type, S, leg.strike) : 0.0;
        }

        sums.sum += payoff;
        sums.sum_sq += payoff * payoff;
        if (hit) {
            ++sums.hits;
        }
    }

    return sums;
}

} // namespace fxhedge::montecarlo
