#include "payoff_evaluator.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace fxhedge::payoff {

double PayoffEvaluator::leg_payoff(const ResolvedLeg& leg, double spot) noexcept {
    double value = intrinsic_value(leg.type, spot, leg.strike);

    if (leg.barrier != BarrierKind::NONE) {
        const bool hit = barrier_triggered(leg, spot);
        if (is_knock_out(leg.barrier) && hit) {
            value = 0.0;
        } else if (is_knock_in(leg.barrier) && !hit) {
            value = 0.0;
        }
    }

    return value * leg.quantity / 100.0;
}

double PayoffEvaluator::payoff_at_spot(
    const std::vector<ResolvedLeg>& legs, double spot
) noexcept {
    double total = 0.0;
    for (const auto& leg : legs) {
        total += leg_payoff(leg, spot);
    }
    return total;
}

double PayoffEvaluator::payoff_at_spot(
    const Strategy& strategy, double spot, double initial_spot,
    double default_volatility
) noexcept {
    const MarketParams market{.spot = initial_spot, .volatility = default_volatility};

    double total = 0.0;
    for (const auto& leg : strategy) {
        total += leg_payoff(resolve_leg(leg, market), spot);
    }
    return total;
}

void PayoffEvaluator::reference_levels(
    const std::vector<ResolvedLeg>& legs,
    std::vector<std::string>& labels,
    std::vector<double>& levels
) {
    labels.clear();
    levels.clear();

    for (size_t i = 0; i < legs.size(); ++i) {
        const auto& leg = legs[i];
        const std::string prefix = "leg" + std::to_string(i + 1) + " ";

        labels.push_back(prefix + "strike");
        levels.push_back(leg.strike);

        if (leg.barrier == BarrierKind::KNOCK_OUT || leg.barrier == BarrierKind::KNOCK_IN) {
            labels.push_back(prefix + "barrier");
            levels.push_back(leg.barrier_level);
        } else if (is_double(leg.barrier)) {
            labels.push_back(prefix + "upper barrier");
            levels.push_back(leg.upper_barrier);
            labels.push_back(prefix + "lower barrier");
            levels.push_back(leg.lower_barrier);
        }
    }
}

PayoffCurve PayoffEvaluator::payoff_curve(
    const Strategy& strategy,
    const MarketParams& market,
    const SweepConfig& sweep,
    double total_premium,
    const DiagnosticSink& sink
) {
    PayoffCurve curve;
    curve.total_premium = total_premium;

    if (!(market.spot > 0.0)) {
        emit(sink, DIAG_INVALID_INPUT, "payoff curve: spot must be positive");
        return curve;
    }
    if (!(sweep.width_pct > 0.0) || sweep.width_pct >= 100.0 || sweep.steps < 2) {
        emit(sink, DIAG_INVALID_INPUT,
             "payoff curve: width_pct must be in (0, 100) and steps >= 2 (width_pct=" +
             std::to_string(sweep.width_pct) + ", steps=" + std::to_string(sweep.steps) + ")");
        return curve;
    }

    std::vector<ResolvedLeg> legs;
    legs.reserve(strategy.size());
    for (const auto& leg : strategy) {
        legs.push_back(resolve_leg(leg, market));
    }

    std::vector<double> levels;
    reference_levels(legs, curve.reference_labels, levels);

    const double lo = market.spot * (1.0 - sweep.width_pct / 100.0);
    const double hi = market.spot * (1.0 + sweep.width_pct / 100.0);
    const double step = (hi - lo) / static_cast<double>(sweep.steps - 1);

    curve.points.reserve(sweep.steps);
    for (size_t i = 0; i < sweep.steps; ++i) {
        const double spot = (i + 1 == sweep.steps) ? hi : lo + step * static_cast<double>(i);
        const double payoff = payoff_at_spot(legs, spot);

        PayoffPoint point{};
        point.spot = spot;
        point.unhedged_rate = spot;
        point.hedged_rate = spot - payoff;
        point.hedged_rate_with_premium = point.hedged_rate - total_premium;
        point.reference_levels = levels;
        curve.points.push_back(std::move(point));
    }

    return curve;
}

} // namespace fxhedge::payoff
