#pragma once

#include <string>
#include <vector>

#include "fx_types.hpp"

namespace fxhedge::payoff {

struct SweepConfig {
    double width_pct{30.0};   // sweep S0 * (1 -/+ width_pct / 100)
    size_t steps{100};        // number of spot levels, endpoints included
};

struct PayoffPoint {
    double spot;
    double unhedged_rate;
    double hedged_rate;                    // spot - payoff
    double hedged_rate_with_premium;       // hedged_rate - total premium
    std::vector<double> reference_levels;  // leg strikes and barriers, see labels
};

struct PayoffCurve {
    std::vector<PayoffPoint> points;
    std::vector<std::string> reference_labels;
    double total_premium{0.0};
};

/**
 * Expiry payoff of a strategy at a hypothetical spot.
 *
 * Barrier legs are tested against the single spot value given, not a path:
 * the question answered is what the strategy pays if spot lands exactly
 * there. Knock-out and knock-in gating use the same activation rule as the
 * Monte Carlo engine.
 */
class PayoffEvaluator {
public:
    [[nodiscard]] static double leg_payoff(const ResolvedLeg& leg, double spot) noexcept;

    [[nodiscard]] static double payoff_at_spot(
        const std::vector<ResolvedLeg>& legs, double spot
    ) noexcept;

    // Resolves percentage levels against initial_spot first
    [[nodiscard]] static double payoff_at_spot(
        const Strategy& strategy, double spot, double initial_spot,
        double default_volatility = 0.0
    ) noexcept;

    [[nodiscard]] static PayoffCurve payoff_curve(
        const Strategy& strategy,
        const MarketParams& market,
        const SweepConfig& sweep,
        double total_premium,
        const DiagnosticSink& sink = {}
    );

    // Labels and absolute levels of every leg strike and barrier
    static void reference_levels(
        const std::vector<ResolvedLeg>& legs,
        std::vector<std::string>& labels,
        std::vector<double>& levels
    );
};

} // namespace fxhedge::payoff
