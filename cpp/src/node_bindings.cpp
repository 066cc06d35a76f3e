#define NAPI_VERSION 8
#include <node_api.h>

#include "binding_args.hpp"
#include "hedge_engine.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <vector>

/**
 * Node.js N-API bindings for the fxhedge pricing engine
 *
 * Exposes the four engine operations to the dashboard. Argument errors are
 * thrown as JS errors; pricing diagnostics are returned alongside results.
 */

namespace fxhedge::bindings {

// Helper macros for N-API error handling
#define NAPI_CALL(env, call)                                      \
  do {                                                            \
    napi_status status = (call);                                  \
    if (status != napi_ok) {                                      \
      napi_throw_error(env, nullptr, "N-API call failed");        \
      return nullptr;                                             \
    }                                                             \
  } while(0)

#define NAPI_ASSERT(env, condition, message)                      \
  do {                                                            \
    if (!(condition)) {                                           \
      napi_throw_error(env, nullptr, message);                    \
      return nullptr;                                             \
    }                                                             \
  } while(0)

//=============================================================================
// VALUE HELPERS
//=============================================================================

// Empty string when the value is not a JS string
std::string get_string(napi_env env, napi_value value) {
    size_t len = 0;
    if (napi_get_value_string_utf8(env, value, nullptr, 0, &len) != napi_ok) {
        return {};
    }
    std::string result(len, '\0');
    if (napi_get_value_string_utf8(env, value, &result[0], len + 1, &len) != napi_ok) {
        return {};
    }
    result.resize(len);
    return result;
}

napi_value create_result_object(napi_env env) {
    napi_value obj;
    napi_create_object(env, &obj);
    return obj;
}

void set_property_double(napi_env env, napi_value obj, const char* name, double value) {
    napi_value nval;
    napi_create_double(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_int64(napi_env env, napi_value obj, const char* name, int64_t value) {
    napi_value nval;
    napi_create_int64(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_bool(napi_env env, napi_value obj, const char* name, bool value) {
    napi_value nval;
    napi_get_boolean(env, value, &nval);
    napi_set_named_property(env, obj, name, nval);
}

void set_property_string(napi_env env, napi_value obj, const char* name, const std::string& value) {
    napi_value nval;
    napi_create_string_utf8(env, value.c_str(), value.length(), &nval);
    napi_set_named_property(env, obj, name, nval);
}

napi_valuetype type_of(napi_env env, napi_value value) {
    napi_valuetype type = napi_undefined;
    napi_typeof(env, value, &type);
    return type;
}

// Returns the named property, or nullptr when absent/undefined/null
napi_value get_property(napi_env env, napi_value obj, const char* name) {
    bool has = false;
    if (napi_has_named_property(env, obj, name, &has) != napi_ok || !has) {
        return nullptr;
    }
    napi_value value;
    if (napi_get_named_property(env, obj, name, &value) != napi_ok) {
        return nullptr;
    }
    const auto type = type_of(env, value);
    if (type == napi_undefined || type == napi_null) {
        return nullptr;
    }
    return value;
}

bool read_double(napi_env env, napi_value obj, const char* name, double& out) {
    napi_value value = get_property(env, obj, name);
    return value != nullptr && type_of(env, value) == napi_number &&
           napi_get_value_double(env, value, &out) == napi_ok;
}

bool read_bool(napi_env env, napi_value obj, const char* name, bool& out) {
    napi_value value = get_property(env, obj, name);
    return value != nullptr && type_of(env, value) == napi_boolean &&
           napi_get_value_bool(env, value, &out) == napi_ok;
}

// A level is either a number (absolute) or { value, isPercent }
bool read_level(napi_env env, napi_value obj, const char* name, std::optional<Level>& out,
                std::string& error) {
    out.reset();
    napi_value value = get_property(env, obj, name);
    if (value == nullptr) {
        return true;
    }
    if (type_of(env, value) == napi_number) {
        double level;
        napi_get_value_double(env, value, &level);
        out = Level::absolute(level);
        return true;
    }
    double level;
    if (type_of(env, value) != napi_object || !read_double(env, value, "value", level)) {
        error = std::string(name) + " must be a number or { value, isPercent }";
        return false;
    }
    bool is_percent = false;
    read_bool(env, value, "isPercent", is_percent);
    out = Level{level, is_percent};
    return true;
}

//=============================================================================
// ARGUMENT PARSING
//=============================================================================

bool parse_market(napi_env env, napi_value obj, MarketParams& market, std::string& error) {
    if (obj == nullptr || type_of(env, obj) != napi_object) {
        error = "market must be an object";
        return false;
    }
    struct Field { const char* name; double* target; };
    const Field fields[] = {
        {"spot", &market.spot},
        {"rDomestic", &market.r_domestic},
        {"rForeign", &market.r_foreign},
        {"volatility", &market.volatility},
        {"maturity", &market.maturity},
    };
    for (const auto& field : fields) {
        if (!read_double(env, obj, field.name, *field.target)) {
            error = std::string("market.") + field.name + " is required";
            return false;
        }
    }
    return true;
}

/**
 * { type: "call"|"put", barrierType?: "none"|"KO"|"KI"|"DKO"|"DKI",
 *   reverse?, strike, barrierLevel?, upperBarrier?, lowerBarrier?,
 *   volatility?, quantity? }
 */
bool parse_leg(napi_env env, napi_value obj, OptionLeg& leg, std::string& error) {
    if (obj == nullptr || type_of(env, obj) != napi_object) {
        error = "leg must be an object";
        return false;
    }

    napi_value type_value = get_property(env, obj, "type");
    if (type_value == nullptr || type_of(env, type_value) != napi_string ||
        !parse_option_type(get_string(env, type_value), leg.type)) {
        error = "leg.type must be 'call' or 'put'";
        return false;
    }

    napi_value barrier_value = get_property(env, obj, "barrierType");
    if (barrier_value != nullptr && (type_of(env, barrier_value) != napi_string ||
                                     !parse_barrier_kind(get_string(env, barrier_value), leg.barrier))) {
        error = "leg.barrierType must be one of none, KO, KI, DKO, DKI";
        return false;
    }

    read_bool(env, obj, "reverse", leg.reverse);

    std::optional<Level> strike;
    if (!read_level(env, obj, "strike", strike, error)) return false;
    if (!strike) {
        error = "leg.strike is required";
        return false;
    }
    leg.strike = *strike;

    if (!read_level(env, obj, "barrierLevel", leg.barrier_level, error)) return false;
    if (!read_level(env, obj, "upperBarrier", leg.upper_barrier, error)) return false;
    if (!read_level(env, obj, "lowerBarrier", leg.lower_barrier, error)) return false;

    double vol;
    if (read_double(env, obj, "volatility", vol)) {
        leg.volatility = vol;
    }
    read_double(env, obj, "quantity", leg.quantity);
    return true;
}

bool parse_strategy(napi_env env, napi_value array, Strategy& strategy, std::string& error) {
    bool is_array = false;
    if (array == nullptr || napi_is_array(env, array, &is_array) != napi_ok || !is_array) {
        error = "strategy must be an array of legs";
        return false;
    }
    uint32_t length = 0;
    napi_get_array_length(env, array, &length);
    strategy.clear();
    strategy.reserve(length);
    for (uint32_t i = 0; i < length; ++i) {
        napi_value element;
        napi_get_element(env, array, i, &element);
        OptionLeg leg{};
        if (!parse_leg(env, element, leg, error)) {
            error = "leg " + std::to_string(i + 1) + ": " + error;
            return false;
        }
        strategy.push_back(leg);
    }
    return true;
}

// "closedForm" (default) or "monteCarlo"; optional MC settings in `mc`
bool parse_pricing_config(napi_env env, napi_value mode_value, napi_value mc_value,
                          engine::PricingConfig& config, std::string& error) {
    if (mode_value != nullptr && type_of(env, mode_value) == napi_string) {
        const std::string mode = get_string(env, mode_value);
        if (mode == "monteCarlo") {
            config.mode = PricingMode::MONTE_CARLO;
        } else if (mode == "closedForm") {
            config.mode = PricingMode::CLOSED_FORM;
        } else {
            error = "pricing mode must be 'closedForm' or 'monteCarlo'";
            return false;
        }
    }
    if (mc_value != nullptr && type_of(env, mc_value) == napi_object) {
        double value;
        if (read_double(env, mc_value, "numPaths", value) &&
            !to_count(value, 1.0, MAX_PATHS, config.mc.num_paths)) {
            error = "mc.numPaths must be a finite number in [1, 1e8]";
            return false;
        }
        if (read_double(env, mc_value, "timeSteps", value) &&
            !to_count(value, 1.0, MAX_TIME_STEPS, config.mc.time_steps)) {
            error = "mc.timeSteps must be a finite number in [1, 1e5]";
            return false;
        }
        if (read_double(env, mc_value, "seed", value) && !to_seed(value, config.mc.seed)) {
            error = "mc.seed must be a non-negative integer no greater than 2^53";
            return false;
        }
        read_bool(env, mc_value, "brownianBridge", config.mc.brownian_bridge);
        if (read_double(env, mc_value, "maxStdError", value)) {
            if (!std::isfinite(value)) {
                error = "mc.maxStdError must be finite";
                return false;
            }
            config.mc.max_std_error = value;
        }
    }
    return true;
}

//=============================================================================
// RESULT BUILDERS
//=============================================================================

napi_value diagnostics_array(napi_env env, const DiagnosticLog& log) {
    napi_value array;
    napi_create_array_with_length(env, log.entries().size(), &array);
    for (size_t i = 0; i < log.entries().size(); ++i) {
        napi_value entry = create_result_object(env);
        set_property_int64(env, entry, "code", log.entries()[i].code);
        set_property_string(env, entry, "message", log.entries()[i].message);
        napi_set_element(env, array, i, entry);
    }
    return array;
}

napi_value resolved_leg_object(napi_env env, const ResolvedLeg& leg) {
    napi_value obj = create_result_object(env);
    set_property_string(env, obj, "type", leg.type == OptionType::CALL ? "call" : "put");
    set_property_string(env, obj, "barrierType", barrier_kind_name(leg.barrier));
    set_property_bool(env, obj, "reverse", leg.reverse);
    set_property_double(env, obj, "strike", leg.strike);
    if (leg.barrier == BarrierKind::KNOCK_OUT || leg.barrier == BarrierKind::KNOCK_IN) {
        set_property_double(env, obj, "barrierLevel", leg.barrier_level);
    } else if (is_double(leg.barrier)) {
        set_property_double(env, obj, "upperBarrier", leg.upper_barrier);
        set_property_double(env, obj, "lowerBarrier", leg.lower_barrier);
    }
    set_property_double(env, obj, "volatility", leg.volatility);
    set_property_double(env, obj, "quantity", leg.quantity);
    return obj;
}

napi_value leg_pricing_object(napi_env env, const engine::LegPricing& pricing) {
    napi_value obj = create_result_object(env);
    set_property_double(env, obj, "price", pricing.premium);
    set_property_double(env, obj, "unitPrice", pricing.unit_price);
    set_property_double(env, obj, "stdError", pricing.std_error);
    set_property_string(env, obj, "method", to_string(pricing.method));
    napi_set_named_property(env, obj, "leg", resolved_leg_object(env, pricing.leg));
    return obj;
}

napi_value level_object(napi_env env, const Level& level) {
    napi_value obj = create_result_object(env);
    set_property_double(env, obj, "value", level.value);
    set_property_bool(env, obj, "isPercent", level.is_percent);
    return obj;
}

napi_value option_leg_object(napi_env env, const OptionLeg& leg) {
    napi_value obj = create_result_object(env);
    set_property_string(env, obj, "type", leg.type == OptionType::CALL ? "call" : "put");
    set_property_string(env, obj, "barrierType", barrier_kind_name(leg.barrier));
    set_property_bool(env, obj, "reverse", leg.reverse);
    napi_set_named_property(env, obj, "strike", level_object(env, leg.strike));
    if (leg.barrier_level) {
        napi_set_named_property(env, obj, "barrierLevel", level_object(env, *leg.barrier_level));
    }
    if (leg.upper_barrier) {
        napi_set_named_property(env, obj, "upperBarrier", level_object(env, *leg.upper_barrier));
    }
    if (leg.lower_barrier) {
        napi_set_named_property(env, obj, "lowerBarrier", level_object(env, *leg.lower_barrier));
    }
    if (leg.volatility) {
        set_property_double(env, obj, "volatility", *leg.volatility);
    }
    set_property_double(env, obj, "quantity", leg.quantity);
    return obj;
}

//=============================================================================
// PRICING BINDINGS
//=============================================================================

/**
 * priceVanilla(type, S, K, T, r1, r2, sigma): number
 */
napi_value PriceVanilla(napi_env env, napi_callback_info info) {
    size_t argc = 7;
    napi_value args[7];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 7, "Expected 7 arguments: type, S, K, T, r1, r2, sigma");

    OptionType type;
    NAPI_ASSERT(env, type_of(env, args[0]) == napi_string &&
                     parse_option_type(get_string(env, args[0]), type),
                "type must be 'call' or 'put'");

    double values[6];
    for (size_t i = 0; i < 6; ++i) {
        NAPI_ASSERT(env, type_of(env, args[i + 1]) == napi_number, "S, K, T, r1, r2, sigma must be numbers");
        napi_get_value_double(env, args[i + 1], &values[i]);
    }

    engine::HedgeEngine engine;
    const double price = engine.price_vanilla(type, values[0], values[1], values[2],
                                              values[3], values[4], values[5]);

    napi_value result;
    napi_create_double(env, price, &result);
    return result;
}

/**
 * priceBarrier(leg, market, mode?, mc?)
 * Returns: { price, unitPrice, stdError, method, leg, diagnostics }
 */
napi_value PriceBarrier(napi_env env, napi_callback_info info) {
    size_t argc = 4;
    napi_value args[4] = {nullptr, nullptr, nullptr, nullptr};
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 2, "Expected at least 2 arguments: leg, market");

    std::string error;
    OptionLeg leg{};
    NAPI_ASSERT(env, parse_leg(env, args[0], leg, error), error.c_str());
    MarketParams market{};
    NAPI_ASSERT(env, parse_market(env, args[1], market, error), error.c_str());

    engine::PricingConfig config;
    NAPI_ASSERT(env, parse_pricing_config(env, argc > 2 ? args[2] : nullptr,
                                          argc > 3 ? args[3] : nullptr, config, error),
                error.c_str());

    DiagnosticLog log;
    config.on_diagnostic = log.sink();
    engine::HedgeEngine engine(config);

    const auto pricing = engine.price_barrier(leg, market, config.mode);

    napi_value result = leg_pricing_object(env, pricing);
    napi_set_named_property(env, result, "diagnostics", diagnostics_array(env, log));
    return result;
}

/**
 * evaluatePayoffCurve(strategy, market, sweep?, mode?, mc?)
 * Returns: { points, referenceLabels, totalPremium, legs, diagnostics }
 */
napi_value EvaluatePayoffCurve(napi_env env, napi_callback_info info) {
    size_t argc = 5;
    napi_value args[5] = {nullptr, nullptr, nullptr, nullptr, nullptr};
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 2, "Expected at least 2 arguments: strategy, market");

    std::string error;
    Strategy strategy;
    NAPI_ASSERT(env, parse_strategy(env, args[0], strategy, error), error.c_str());
    MarketParams market{};
    NAPI_ASSERT(env, parse_market(env, args[1], market, error), error.c_str());

    payoff::SweepConfig sweep;
    if (argc > 2 && args[2] != nullptr && type_of(env, args[2]) == napi_object) {
        double width;
        if (read_double(env, args[2], "widthPct", width)) {
            NAPI_ASSERT(env, std::isfinite(width), "sweep.widthPct must be finite");
            sweep.width_pct = width;
        }
        double steps;
        if (read_double(env, args[2], "steps", steps)) {
            NAPI_ASSERT(env, to_count(steps, 2.0, MAX_SWEEP_STEPS, sweep.steps),
                        "sweep.steps must be a finite number in [2, 1e6]");
        }
    }

    engine::PricingConfig config;
    NAPI_ASSERT(env, parse_pricing_config(env, argc > 3 ? args[3] : nullptr,
                                          argc > 4 ? args[4] : nullptr, config, error),
                error.c_str());

    DiagnosticLog log;
    config.on_diagnostic = log.sink();
    engine::HedgeEngine engine(config);

    const auto pricing = engine.price_strategy(strategy, market);
    const auto curve = payoff::PayoffEvaluator::payoff_curve(
        strategy, market, sweep, pricing.total_premium, config.on_diagnostic);

    napi_value result = create_result_object(env);
    set_property_double(env, result, "totalPremium", curve.total_premium);

    napi_value labels;
    napi_create_array_with_length(env, curve.reference_labels.size(), &labels);
    for (size_t i = 0; i < curve.reference_labels.size(); ++i) {
        napi_value label;
        napi_create_string_utf8(env, curve.reference_labels[i].c_str(),
                                curve.reference_labels[i].length(), &label);
        napi_set_element(env, labels, i, label);
    }
    napi_set_named_property(env, result, "referenceLabels", labels);

    napi_value points;
    napi_create_array_with_length(env, curve.points.size(), &points);
    for (size_t i = 0; i < curve.points.size(); ++i) {
        const auto& p = curve.points[i];
        napi_value point = create_result_object(env);
        set_property_double(env, point, "spot", p.spot);
        set_property_double(env, point, "unhedgedRate", p.unhedged_rate);
        set_property_double(env, point, "hedgedRate", p.hedged_rate);
        set_property_double(env, point, "hedgedRateWithPremium", p.hedged_rate_with_premium);

        napi_value levels;
        napi_create_array_with_length(env, p.reference_levels.size(), &levels);
        for (size_t j = 0; j < p.reference_levels.size(); ++j) {
            napi_value level;
            napi_create_double(env, p.reference_levels[j], &level);
            napi_set_element(env, levels, j, level);
        }
        napi_set_named_property(env, point, "referenceLevels", levels);
        napi_set_element(env, points, i, point);
    }
    napi_set_named_property(env, result, "points", points);

    napi_value legs;
    napi_create_array_with_length(env, pricing.legs.size(), &legs);
    for (size_t i = 0; i < pricing.legs.size(); ++i) {
        napi_set_element(env, legs, i, leg_pricing_object(env, pricing.legs[i]));
    }
    napi_set_named_property(env, result, "legs", legs);
    set_property_int64(env, result, "calcTimeNs", pricing.calc_time_ns);
    napi_set_named_property(env, result, "diagnostics", diagnostics_array(env, log));

    return result;
}

//=============================================================================
// STRATEGY BINDINGS
//=============================================================================

/**
 * resolveStrategy(key, params)
 * params: { market, strikeUpper?, strikeLower?, strikeMid?, barrierUpper?,
 *           barrierLower?, optionQuantity?, legs? }
 * Returns: { passed, rejectCode, rejectReason, legs }
 */
napi_value ResolveStrategy(napi_env env, napi_callback_info info) {
    size_t argc = 2;
    napi_value args[2];
    NAPI_CALL(env, napi_get_cb_info(env, info, &argc, args, nullptr, nullptr));
    NAPI_ASSERT(env, argc >= 2, "Expected 2 arguments: key, params");
    NAPI_ASSERT(env, type_of(env, args[0]) == napi_string, "key must be a string");
    NAPI_ASSERT(env, type_of(env, args[1]) == napi_object, "params must be an object");

    const std::string key = get_string(env, args[0]);
    std::string error;

    strategy::StrategyParams params;
    NAPI_ASSERT(env, parse_market(env, get_property(env, args[1], "market"), params.market, error),
                error.c_str());
    NAPI_ASSERT(env, read_level(env, args[1], "strikeUpper", params.strike_upper, error), error.c_str());
    NAPI_ASSERT(env, read_level(env, args[1], "strikeLower", params.strike_lower, error), error.c_str());
    NAPI_ASSERT(env, read_level(env, args[1], "strikeMid", params.strike_mid, error), error.c_str());
    NAPI_ASSERT(env, read_level(env, args[1], "barrierUpper", params.barrier_upper, error), error.c_str());
    NAPI_ASSERT(env, read_level(env, args[1], "barrierLower", params.barrier_lower, error), error.c_str());
    read_double(env, args[1], "optionQuantity", params.option_quantity);

    napi_value custom = get_property(env, args[1], "legs");
    if (custom != nullptr) {
        NAPI_ASSERT(env, parse_strategy(env, custom, params.custom_legs, error), error.c_str());
    }

    engine::HedgeEngine engine;
    const auto resolved = engine.resolve_strategy(key, params);

    napi_value result = create_result_object(env);
    set_property_bool(env, result, "passed", resolved.passed);
    set_property_int64(env, result, "rejectCode", resolved.reject_code);
    set_property_string(env, result, "rejectReason", resolved.reject_reason);

    napi_value legs;
    napi_create_array_with_length(env, resolved.strategy.size(), &legs);
    for (size_t i = 0; i < resolved.strategy.size(); ++i) {
        napi_set_element(env, legs, i, option_leg_object(env, resolved.strategy[i]));
    }
    napi_set_named_property(env, result, "legs", legs);

    return result;
}

//=============================================================================
// MODULE INITIALIZATION
//=============================================================================

napi_value Init(napi_env env, napi_value exports) {
    napi_value fn;

    napi_create_function(env, nullptr, 0, PriceVanilla, nullptr, &fn);
    napi_set_named_property(env, exports, "priceVanilla", fn);

    napi_create_function(env, nullptr, 0, PriceBarrier, nullptr, &fn);
    napi_set_named_property(env, exports, "priceBarrier", fn);

    napi_create_function(env, nullptr, 0, EvaluatePayoffCurve, nullptr, &fn);
    napi_set_named_property(env, exports, "evaluatePayoffCurve", fn);

    napi_create_function(env, nullptr, 0, ResolveStrategy, nullptr, &fn);
    napi_set_named_property(env, exports, "resolveStrategy", fn);

    return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)

} // namespace fxhedge::bindings
