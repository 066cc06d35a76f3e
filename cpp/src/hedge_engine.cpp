#include "hedge_engine.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace fxhedge::engine {

HedgeEngine::HedgeEngine(PricingConfig config)
    : config_(std::move(config)),
      mc_engine_(config_.mc) {
}

double HedgeEngine::price_vanilla(
    OptionType type, double S, double K, double T,
    double r_d, double r_f, double sigma
) const {
    return options::GarmanKohlhagenPricer::price(type, S, K, T, r_d, r_f, sigma, config_.on_diagnostic);
}

bool HedgeEngine::valid_leg(const ResolvedLeg& leg, const MarketParams& market) const {
    const auto& sink = config_.on_diagnostic;

    if (!(market.spot > 0.0) || !(market.maturity > 0.0)) {
        emit(sink, DIAG_INVALID_INPUT,
             "leg: spot and maturity must be positive (S=" + std::to_string(market.spot) +
             ", T=" + std::to_string(market.maturity) + ")");
        return false;
    }
    if (!(leg.strike > 0.0)) {
        emit(sink, DIAG_INVALID_INPUT, "leg: strike must be positive (K=" + std::to_string(leg.strike) + ")");
        return false;
    }
    if (!(leg.volatility > 0.0)) {
        emit(sink, DIAG_INVALID_INPUT, "leg: volatility must be positive");
        return false;
    }

    switch (leg.barrier) {
        case BarrierKind::NONE:
            return true;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN:
            if (!(leg.barrier_level > 0.0)) {
                emit(sink, DIAG_INVALID_INPUT, "leg: barrier must be positive");
                return false;
            }
            return true;
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN:
            if (!(leg.lower_barrier > 0.0) || !(leg.upper_barrier > leg.lower_barrier)) {
                emit(sink, DIAG_INVALID_INPUT,
                     "leg: double barrier requires 0 < lower < upper (L=" +
                     std::to_string(leg.lower_barrier) + ", U=" +
                     std::to_string(leg.upper_barrier) + ")");
                return false;
            }
            return true;
    }
    return false;
}

LegPricing HedgeEngine::price_monte_carlo(
    const ResolvedLeg& leg, const MarketParams& market, PricingMethod method
) const {
    const auto mc = mc_engine_.price(leg, market, config_.on_diagnostic);
    return LegPricing{
        .leg = leg,
        .unit_price = mc.unit_price,
        .premium = mc.price,
        .std_error = mc.std_error,
        .method = method
    };
}

LegPricing HedgeEngine::price_barrier(
    const OptionLeg& leg, const MarketParams& market, PricingMode mode
) const {
    const ResolvedLeg resolved = resolve_leg(leg, market);

    LegPricing result{
        .leg = resolved,
        .unit_price = 0.0,
        .premium = 0.0,
        .std_error = 0.0,
        .method = PricingMethod::REJECTED
    };

    if (!valid_leg(resolved, market)) {
        return result;
    }

    if (mode == PricingMode::MONTE_CARLO) {
        return price_monte_carlo(resolved, market, PricingMethod::MONTE_CARLO);
    }

    const auto& sink = config_.on_diagnostic;
    const double S = market.spot;
    const double T = market.maturity;
    const double r_d = market.r_domestic;
    const double r_f = market.r_foreign;
    const double sigma = resolved.volatility;
    const double K = resolved.strike;

    double unit_price = 0.0;

    switch (resolved.barrier) {
        case BarrierKind::NONE:
            unit_price = options::GarmanKohlhagenPricer::price(resolved.type, S, K, T, r_d, r_f, sigma, sink);
            break;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN: {
            const auto barrier_type = options::BarrierOptionPricer::single_barrier_type(
                resolved.type, is_knock_in(resolved.barrier), resolved.reverse);
            unit_price = options::BarrierOptionPricer::price_single(
                resolved.type, barrier_type, S, K, resolved.barrier_level, T,
                r_d, r_f, sigma, 0.0, sink);
            break;
        }
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN: {
            if (resolved.reverse) {
                emit(sink, DIAG_UNSUPPORTED_COMBINATION,
                     "reverse double barrier has no closed form, priced by monte carlo");
                return price_monte_carlo(resolved, market, PricingMethod::MONTE_CARLO_FALLBACK);
            }
            const auto barrier_type = is_knock_in(resolved.barrier)
                ? options::DoubleBarrierType::KNOCK_IN
                : options::DoubleBarrierType::KNOCK_OUT;
            unit_price = options::BarrierOptionPricer::price_double(
                resolved.type, barrier_type, S, K,
                resolved.lower_barrier, resolved.upper_barrier, T,
                r_d, r_f, sigma, sink);
            break;
        }
    }

    result.unit_price = unit_price;
    result.premium = unit_price * resolved.quantity / 100.0;
    result.method = PricingMethod::CLOSED_FORM;
    return result;
}

StrategyPricing HedgeEngine::price_strategy(
    const Strategy& strategy, const MarketParams& market
) const {
    const auto start = std::chrono::steady_clock::now();

    StrategyPricing pricing{};
    pricing.legs.reserve(strategy.size());

    for (const auto& leg : strategy) {
        pricing.legs.push_back(price_leg(leg, market));
        pricing.total_premium += pricing.legs.back().premium;
    }

    const auto end = std::chrono::steady_clock::now();
    pricing.calc_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return pricing;
}

payoff::PayoffCurve HedgeEngine::evaluate_payoff_curve(
    const Strategy& strategy,
    const MarketParams& market,
    const payoff::SweepConfig& sweep
) const {
    const auto pricing = price_strategy(strategy, market);
    return payoff::PayoffEvaluator::payoff_curve(
        strategy, market, sweep, pricing.total_premium, config_.on_diagnostic);
}

} // namespace fxhedge::engine
