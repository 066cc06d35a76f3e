#pragma once

#include <string_view>
#include <vector>

#include "fx_types.hpp"
#include "options_pricing.hpp"
#include "monte_carlo.hpp"
#include "payoff_evaluator.hpp"
#include "strategy_resolver.hpp"

namespace fxhedge::engine {

struct PricingConfig {
    PricingMode mode{PricingMode::CLOSED_FORM};
    montecarlo::MonteCarloConfig mc{};
    DiagnosticSink on_diagnostic;
};

struct LegPricing {
    ResolvedLeg leg;
    double unit_price;     // premium for 100% notional
    double premium;        // unit_price * quantity / 100, signed
    double std_error;      // scaled like premium, 0 for closed forms
    PricingMethod method;
};

struct StrategyPricing {
    std::vector<LegPricing> legs;
    double total_premium;
    int64_t calc_time_ns;
};

/**
 * Entry point used by the add-on and by callers that hold a strategy and
 * market parameters. Holds configuration only; every call is independent.
 */
class HedgeEngine {
public:
    explicit HedgeEngine(PricingConfig config = {});

    [[nodiscard]] double price_vanilla(
        OptionType type, double S, double K, double T,
        double r_d, double r_f, double sigma
    ) const;

    /**
     * Prices one leg in the requested mode. A leg with no closed form
     * (reverse double barrier) is priced by Monte Carlo with
     * PricingMethod::MONTE_CARLO_FALLBACK and an UNSUPPORTED_COMBINATION
     * diagnostic. Invalid legs price at 0 with PricingMethod::REJECTED.
     */
    [[nodiscard]] LegPricing price_barrier(
        const OptionLeg& leg, const MarketParams& market, PricingMode mode
    ) const;

    [[nodiscard]] LegPricing price_leg(const OptionLeg& leg, const MarketParams& market) const {
        return price_barrier(leg, market, config_.mode);
    }

    [[nodiscard]] StrategyPricing price_strategy(
        const Strategy& strategy, const MarketParams& market
    ) const;

    [[nodiscard]] payoff::PayoffCurve evaluate_payoff_curve(
        const Strategy& strategy,
        const MarketParams& market,
        const payoff::SweepConfig& sweep = {}
    ) const;

    [[nodiscard]] strategy::ResolveResult resolve_strategy(
        std::string_view key, const strategy::StrategyParams& params
    ) const {
        return resolver_.resolve(key, params);
    }

    [[nodiscard]] const PricingConfig& config() const noexcept { return config_; }

private:
    PricingConfig config_;
    montecarlo::MonteCarloEngine mc_engine_;
    strategy::StrategyResolver resolver_;

    [[nodiscard]] bool valid_leg(const ResolvedLeg& leg, const MarketParams& market) const;
    [[nodiscard]] LegPricing price_monte_carlo(
        const ResolvedLeg& leg, const MarketParams& market, PricingMethod method
    ) const;
};

} // namespace fxhedge::engine
