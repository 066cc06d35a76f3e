#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fx_types.hpp"

namespace fxhedge::strategy {

enum class StrategyKey : uint8_t {
    FORWARD = 0,
    COLLAR,
    COLLAR_PUT,       // put strike fixed, call strike solved for zero cost
    COLLAR_CALL,      // call strike fixed, put strike solved for zero cost
    STRANGLE,
    STRADDLE,
    SEAGULL,
    CALL,
    PUT,
    CALL_KO,
    PUT_KI,
    CALL_PUT_KI_KO,
    CUSTOM
};

[[nodiscard]] std::optional<StrategyKey> parse_strategy_key(std::string_view key) noexcept;
[[nodiscard]] const char* to_string(StrategyKey key) noexcept;

/**
 * User-facing inputs for a named strategy. Which fields are required depends
 * on the template; a missing required field is rejected, never defaulted.
 */
struct StrategyParams {
    MarketParams market{};
    std::optional<Level> strike_upper;
    std::optional<Level> strike_lower;
    std::optional<Level> strike_mid;      // straddle falls back to at-the-money
    std::optional<Level> barrier_upper;
    std::optional<Level> barrier_lower;
    double option_quantity{100.0};
    std::vector<OptionLeg> custom_legs;
};

struct SolverConfig {
    double tolerance{1e-10};     // bracket width, in strike units
    int max_iterations{200};
    int max_expansions{60};
};

struct ZeroCostSolution {
    bool converged{false};
    double call_strike{0.0};
    double put_strike{0.0};
    double call_price{0.0};
    double put_price{0.0};
    int iterations{0};
};

struct ResolveResult {
    bool passed{true};
    uint32_t reject_code{0};
    std::string reject_reason;
    StrategyKey key{StrategyKey::CUSTOM};
    Strategy strategy;

    static ResolveResult reject(uint32_t code, std::string reason) {
        ResolveResult r{};
        r.passed = false;
        r.reject_code = code;
        r.reject_reason = std::move(reason);
        return r;
    }
};

class StrategyResolver {
public:
    explicit StrategyResolver(SolverConfig solver = {}) : solver_(solver) {}

    [[nodiscard]] ResolveResult resolve(StrategyKey key, const StrategyParams& params) const;
    [[nodiscard]] ResolveResult resolve(std::string_view key, const StrategyParams& params) const;

    [[nodiscard]] static ValidationResult validate_market(const MarketParams& market);
    [[nodiscard]] static ValidationResult validate_leg(const OptionLeg& leg, const MarketParams& market);

    // Put strike whose premium equals the call at call_strike
    [[nodiscard]] ZeroCostSolution solve_put_strike(const MarketParams& market, double call_strike) const;

    // Call strike whose premium equals the put at put_strike
    [[nodiscard]] ZeroCostSolution solve_call_strike(const MarketParams& market, double put_strike) const;

private:
    SolverConfig solver_;
};

} // namespace fxhedge::strategy
