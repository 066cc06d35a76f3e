#include "strategy_resolver.hpp"
#include "options_pricing.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace fxhedge::strategy {

namespace {

struct KeyName {
    StrategyKey key;
    const char* name;
};

constexpr std::array<KeyName, 13> KEY_NAMES = {{
    {StrategyKey::FORWARD, "forward"},
    {StrategyKey::COLLAR, "collar"},
    {StrategyKey::COLLAR_PUT, "collarPut"},
    {StrategyKey::COLLAR_CALL, "collarCall"},
    {StrategyKey::STRANGLE, "strangle"},
    {StrategyKey::STRADDLE, "straddle"},
    {StrategyKey::SEAGULL, "seagull"},
    {StrategyKey::CALL, "call"},
    {StrategyKey::PUT, "put"},
    {StrategyKey::CALL_KO, "callKO"},
    {StrategyKey::PUT_KI, "putKI"},
    {StrategyKey::CALL_PUT_KI_KO, "callPutKI_KO"},
    {StrategyKey::CUSTOM, "custom"},
}};

[[nodiscard]] OptionLeg make_leg(OptionType type, Level strike, double quantity) {
    OptionLeg leg{};
    leg.type = type;
    leg.strike = strike;
    leg.quantity = quantity;
    return leg;
}

[[nodiscard]] OptionLeg make_barrier_leg(OptionType type, Level strike, double quantity,
                                         BarrierKind barrier, Level barrier_level) {
    OptionLeg leg = make_leg(type, strike, quantity);
    leg.barrier = barrier;
    leg.barrier_level = barrier_level;
    return leg;
}

[[nodiscard]] bool positive_level(const std::optional<Level>& level, double spot) noexcept {
    return level && level->resolve(spot) > 0.0;
}

} // namespace

std::optional<StrategyKey> parse_strategy_key(std::string_view key) noexcept {
    for (const auto& entry : KEY_NAMES) {
        if (key == entry.name) {
            return entry.key;
        }
    }
    return std::nullopt;
}

const char* to_string(StrategyKey key) noexcept {
    for (const auto& entry : KEY_NAMES) {
        if (entry.key == key) {
            return entry.name;
        }
    }
    return "unknown";
}

// ============================================================================
// VALIDATION
// ============================================================================

ValidationResult StrategyResolver::validate_market(const MarketParams& market) {
    if (!(market.spot > 0.0) || !std::isfinite(market.spot)) {
        return ValidationResult::reject(REJECT_INVALID_MARKET, "spot must be positive");
    }
    if (!(market.volatility > 0.0) || !std::isfinite(market.volatility)) {
        return ValidationResult::reject(REJECT_INVALID_MARKET, "volatility must be positive");
    }
    if (!(market.maturity > 0.0) || !std::isfinite(market.maturity)) {
        return ValidationResult::reject(REJECT_INVALID_MARKET, "maturity must be positive");
    }
    if (!std::isfinite(market.r_domestic) || !std::isfinite(market.r_foreign)) {
        return ValidationResult::reject(REJECT_INVALID_MARKET, "interest rates must be finite");
    }
    return ValidationResult::pass();
}

ValidationResult StrategyResolver::validate_leg(const OptionLeg& leg, const MarketParams& market) {
    const double S0 = market.spot;
    const double strike = leg.strike.resolve(S0);

    if (!(strike > 0.0) || !std::isfinite(strike)) {
        return ValidationResult::reject(REJECT_INVALID_STRIKE, "strike must resolve to a positive level");
    }
    if (leg.volatility && (!(*leg.volatility > 0.0) || !std::isfinite(*leg.volatility))) {
        return ValidationResult::reject(REJECT_INVALID_VOLATILITY, "volatility override must be positive");
    }
    if (!std::isfinite(leg.quantity)) {
        return ValidationResult::reject(REJECT_INVALID_QUANTITY, "quantity must be finite");
    }

    switch (leg.barrier) {
        case BarrierKind::NONE:
            break;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN:
            if (!leg.barrier_level) {
                return ValidationResult::reject(REJECT_MISSING_PARAMETER,
                                                "single barrier leg requires a barrier level");
            }
            if (!positive_level(leg.barrier_level, S0)) {
                return ValidationResult::reject(REJECT_INVALID_BARRIER, "barrier must be positive");
            }
            break;
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN: {
            if (!leg.upper_barrier || !leg.lower_barrier) {
                return ValidationResult::reject(REJECT_MISSING_PARAMETER,
                                                "double barrier leg requires upper and lower barriers");
            }
            const double upper = leg.upper_barrier->resolve(S0);
            const double lower = leg.lower_barrier->resolve(S0);
            if (!(lower > 0.0) || !(upper > lower)) {
                return ValidationResult::reject(REJECT_INVALID_BARRIER,
                                                "double barrier requires 0 < lower < upper");
            }
            break;
        }
    }

    return ValidationResult::pass();
}

// ============================================================================
// ZERO-COST COLLAR SOLVER
// Bracketed bisection on the Garman-Kohlhagen premium, which is monotone in
// strike: decreasing for calls, increasing for puts.
// ============================================================================

ZeroCostSolution StrategyResolver::solve_call_strike(const MarketParams& market, double put_strike) const {
    const auto& m = market;
    ZeroCostSolution solution{};
    solution.put_strike = put_strike;
    solution.put_price = options::GarmanKohlhagenPricer::price(
        OptionType::PUT, m.spot, put_strike, m.maturity, m.r_domestic, m.r_foreign, m.volatility);

    auto excess = [&](double K) {
        return options::GarmanKohlhagenPricer::price(
            OptionType::CALL, m.spot, K, m.maturity, m.r_domestic, m.r_foreign, m.volatility)
            - solution.put_price;
    };

    double lo = put_strike;
    double hi = std::max(put_strike, m.spot) * 1.2;
    for (int i = 0; i < solver_.max_expansions && excess(lo) < 0.0; ++i) lo *= 0.5;
    for (int i = 0; i < solver_.max_expansions && excess(hi) > 0.0; ++i) hi *= 2.0;
    if (excess(lo) < 0.0 || excess(hi) > 0.0) {
        return solution;
    }

    int iter = 0;
    while (hi - lo > solver_.tolerance && iter < solver_.max_iterations) {
        const double mid = 0.5 * (lo + hi);
        if (excess(mid) > 0.0) {
            lo = mid;
        } else {
            hi = mid;
        }
        ++iter;
    }

    solution.iterations = iter;
    solution.converged = hi - lo <= solver_.tolerance;
    solution.call_strike = 0.5 * (lo + hi);
    solution.call_price = solution.put_price + excess(solution.call_strike);
    return solution;
}

ZeroCostSolution StrategyResolver::solve_put_strike(const MarketParams& market, double call_strike) const {
    const auto& m = market;
    ZeroCostSolution solution{};
    solution.call_strike = call_strike;
    solution.call_price = options::GarmanKohlhagenPricer::price(
        OptionType::CALL, m.spot, call_strike, m.maturity, m.r_domestic, m.r_foreign, m.volatility);

    auto excess = [&](double K) {
        return options::GarmanKohlhagenPricer::price(
            OptionType::PUT, m.spot, K, m.maturity, m.r_domestic, m.r_foreign, m.volatility)
            - solution.call_price;
    };

    double lo = call_strike;
    double hi = std::max(call_strike, m.spot) * 1.2;
    for (int i = 0; i < solver_.max_expansions && excess(lo) > 0.0; ++i) lo *= 0.5;
    for (int i = 0; i < solver_.max_expansions && excess(hi) < 0.0; ++i) hi *= 2.0;
    if (excess(lo) > 0.0 || excess(hi) < 0.0) {
        return solution;
    }

    int iter = 0;
    while (hi - lo > solver_.tolerance && iter < solver_.max_iterations) {
        const double mid = 0.5 * (lo + hi);
        if (excess(mid) < 0.0) {
            lo = mid;
        } else {
            hi = mid;
        }
        ++iter;
    }

    solution.iterations = iter;
    solution.converged = hi - lo <= solver_.tolerance;
    solution.put_strike = 0.5 * (lo + hi);
    solution.put_price = solution.call_price + excess(solution.put_strike);
    return solution;
}

// ============================================================================
// TEMPLATE EXPANSION
// Legs are written from the point of view of a buyer of the foreign
// currency: calls cap the purchase rate, sold puts finance them.
// ============================================================================

ResolveResult StrategyResolver::resolve(std::string_view key, const StrategyParams& params) const {
    const auto parsed = parse_strategy_key(key);
    if (!parsed) {
        return ResolveResult::reject(REJECT_UNKNOWN_STRATEGY,
                                     "unknown strategy '" + std::string(key) + "'");
    }
    return resolve(*parsed, params);
}

ResolveResult StrategyResolver::resolve(StrategyKey key, const StrategyParams& params) const {
    const auto market_check = validate_market(params.market);
    if (!market_check.passed) {
        return ResolveResult::reject(market_check.reject_code, market_check.reject_reason);
    }

    const double q = params.option_quantity;
    if (!std::isfinite(q)) {
        return ResolveResult::reject(REJECT_INVALID_QUANTITY, "option quantity must be finite");
    }

    const MarketParams& m = params.market;
    const char* name = to_string(key);

    auto missing = [name](const char* field) {
        return ResolveResult::reject(REJECT_MISSING_PARAMETER,
                                     std::string(name) + " requires " + field);
    };

    ResolveResult result{};
    result.key = key;
    Strategy& legs = result.strategy;

    switch (key) {
        case StrategyKey::FORWARD: {
            const Level F = Level::absolute(
                options::forward_rate(m.spot, m.maturity, m.r_domestic, m.r_foreign));
            legs.push_back(make_leg(OptionType::CALL, F, q));
            legs.push_back(make_leg(OptionType::PUT, F, -q));
            break;
        }
        case StrategyKey::COLLAR:
            if (!params.strike_upper) return missing("strike_upper");
            if (!params.strike_lower) return missing("strike_lower");
            legs.push_back(make_leg(OptionType::CALL, *params.strike_upper, q));
            legs.push_back(make_leg(OptionType::PUT, *params.strike_lower, -q));
            break;
        case StrategyKey::COLLAR_PUT: {
            if (!params.strike_lower) return missing("strike_lower");
            const double put_strike = params.strike_lower->resolve(m.spot);
            if (!(put_strike > 0.0)) {
                return ResolveResult::reject(REJECT_INVALID_STRIKE, "put strike must be positive");
            }
            const auto solution = solve_call_strike(m, put_strike);
            if (!solution.converged) {
                return ResolveResult::reject(REJECT_SOLVER_FAILED,
                                             "no zero-cost call strike for put strike " +
                                             std::to_string(put_strike));
            }
            legs.push_back(make_leg(OptionType::CALL, Level::absolute(solution.call_strike), q));
            legs.push_back(make_leg(OptionType::PUT, Level::absolute(put_strike), -q));
            break;
        }
        case StrategyKey::COLLAR_CALL: {
            if (!params.strike_upper) return missing("strike_upper");
            const double call_strike = params.strike_upper->resolve(m.spot);
            if (!(call_strike > 0.0)) {
                return ResolveResult::reject(REJECT_INVALID_STRIKE, "call strike must be positive");
            }
            const auto solution = solve_put_strike(m, call_strike);
            if (!solution.converged) {
                return ResolveResult::reject(REJECT_SOLVER_FAILED,
                                             "no zero-cost put strike for call strike " +
                                             std::to_string(call_strike));
            }
            legs.push_back(make_leg(OptionType::CALL, Level::absolute(call_strike), q));
            legs.push_back(make_leg(OptionType::PUT, Level::absolute(solution.put_strike), -q));
            break;
        }
        case StrategyKey::STRANGLE:
            if (!params.strike_upper) return missing("strike_upper");
            if (!params.strike_lower) return missing("strike_lower");
            legs.push_back(make_leg(OptionType::CALL, *params.strike_upper, q));
            legs.push_back(make_leg(OptionType::PUT, *params.strike_lower, q));
            break;
        case StrategyKey::STRADDLE: {
            const Level K = params.strike_mid.value_or(Level::percent(100.0));
            legs.push_back(make_leg(OptionType::CALL, K, q));
            legs.push_back(make_leg(OptionType::PUT, K, q));
            break;
        }
        case StrategyKey::SEAGULL:
            if (!params.strike_mid) return missing("strike_mid");
            if (!params.strike_upper) return missing("strike_upper");
            if (!params.strike_lower) return missing("strike_lower");
            legs.push_back(make_leg(OptionType::CALL, *params.strike_mid, q));
            legs.push_back(make_leg(OptionType::CALL, *params.strike_upper, -q));
            legs.push_back(make_leg(OptionType::PUT, *params.strike_lower, -q));
            break;
        case StrategyKey::CALL:
            if (!params.strike_upper) return missing("strike_upper");
            legs.push_back(make_leg(OptionType::CALL, *params.strike_upper, q));
            break;
        case StrategyKey::PUT:
            if (!params.strike_lower) return missing("strike_lower");
            legs.push_back(make_leg(OptionType::PUT, *params.strike_lower, q));
            break;
        case StrategyKey::CALL_KO:
            if (!params.strike_upper) return missing("strike_upper");
            if (!params.barrier_upper) return missing("barrier_upper");
            legs.push_back(make_barrier_leg(OptionType::CALL, *params.strike_upper, q,
                                            BarrierKind::KNOCK_OUT, *params.barrier_upper));
            break;
        case StrategyKey::PUT_KI:
            if (!params.strike_lower) return missing("strike_lower");
            if (!params.barrier_lower) return missing("barrier_lower");
            legs.push_back(make_barrier_leg(OptionType::PUT, *params.strike_lower, q,
                                            BarrierKind::KNOCK_IN, *params.barrier_lower));
            break;
        case StrategyKey::CALL_PUT_KI_KO:
            if (!params.strike_upper) return missing("strike_upper");
            if (!params.strike_lower) return missing("strike_lower");
            if (!params.barrier_upper) return missing("barrier_upper");
            if (!params.barrier_lower) return missing("barrier_lower");
            legs.push_back(make_barrier_leg(OptionType::CALL, *params.strike_upper, q,
                                            BarrierKind::KNOCK_OUT, *params.barrier_upper));
            legs.push_back(make_barrier_leg(OptionType::PUT, *params.strike_lower, q,
                                            BarrierKind::KNOCK_IN, *params.barrier_lower));
            break;
        case StrategyKey::CUSTOM:
            if (params.custom_legs.empty()) return missing("at least one leg");
            legs = params.custom_legs;
            break;
    }

    for (size_t i = 0; i < legs.size(); ++i) {
        const auto check = validate_leg(legs[i], m);
        if (!check.passed) {
            return ResolveResult::reject(check.reject_code,
                                         "leg " + std::to_string(i + 1) + ": " + check.reject_reason);
        }
    }

    return result;
}

} // namespace fxhedge::strategy
