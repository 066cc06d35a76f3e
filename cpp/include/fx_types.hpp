#pragma once

#include <algorithm>
#include <cstdint>
#include <cmath>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fxhedge {

// ============================================================================
// CORE TYPES AND ENUMS
// ============================================================================

enum class OptionType : uint8_t { CALL = 0, PUT = 1 };

enum class BarrierKind : uint8_t {
    NONE = 0,
    KNOCK_OUT = 1,
    KNOCK_IN = 2,
    DOUBLE_KNOCK_OUT = 3,
    DOUBLE_KNOCK_IN = 4
};

enum class PricingMode : uint8_t { CLOSED_FORM = 0, MONTE_CARLO = 1 };

// Method that actually produced a price
enum class PricingMethod : uint8_t {
    CLOSED_FORM = 0,
    MONTE_CARLO = 1,
    MONTE_CARLO_FALLBACK = 2,   // closed form requested, none available
    REJECTED = 3
};

[[nodiscard]] inline const char* to_string(PricingMethod method) noexcept {
    switch (method) {
        case PricingMethod::CLOSED_FORM: return "closed_form";
        case PricingMethod::MONTE_CARLO: return "monte_carlo";
        case PricingMethod::MONTE_CARLO_FALLBACK: return "monte_carlo_fallback";
        case PricingMethod::REJECTED: return "rejected";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_knock_out(BarrierKind kind) noexcept {
    return kind == BarrierKind::KNOCK_OUT || kind == BarrierKind::DOUBLE_KNOCK_OUT;
}

[[nodiscard]] inline bool is_knock_in(BarrierKind kind) noexcept {
    return kind == BarrierKind::KNOCK_IN || kind == BarrierKind::DOUBLE_KNOCK_IN;
}

[[nodiscard]] inline bool is_double(BarrierKind kind) noexcept {
    return kind == BarrierKind::DOUBLE_KNOCK_OUT || kind == BarrierKind::DOUBLE_KNOCK_IN;
}

// Strike or barrier, either absolute or a percentage of initial spot
struct Level {
    double value{0.0};
    bool is_percent{false};

    static Level percent(double pct) noexcept { return Level{pct, true}; }
    static Level absolute(double level) noexcept { return Level{level, false}; }

    [[nodiscard]] double resolve(double initial_spot) const noexcept {
        return is_percent ? initial_spot * value / 100.0 : value;
    }
};

struct MarketParams {
    double spot{0.0};
    double r_domestic{0.0};   // r1, decimal
    double r_foreign{0.0};    // r2, decimal
    double volatility{0.0};   // per annum
    double maturity{0.0};     // years
};

struct OptionLeg {
    OptionType type{OptionType::CALL};
    BarrierKind barrier{BarrierKind::NONE};
    bool reverse{false};
    Level strike{};
    std::optional<Level> barrier_level;   // single barrier
    std::optional<Level> upper_barrier;   // double barrier
    std::optional<Level> lower_barrier;   // double barrier
    std::optional<double> volatility;     // overrides MarketParams::volatility
    double quantity{100.0};               // % of notional, negative = sold
};

using Strategy = std::vector<OptionLeg>;

// Leg with every level in absolute terms
struct ResolvedLeg {
    OptionType type{OptionType::CALL};
    BarrierKind barrier{BarrierKind::NONE};
    bool reverse{false};
    double strike{0.0};
    double barrier_level{0.0};
    double upper_barrier{0.0};
    double lower_barrier{0.0};
    double volatility{0.0};
    double quantity{100.0};
};

[[nodiscard]] inline ResolvedLeg resolve_leg(const OptionLeg& leg, const MarketParams& market) noexcept {
    const double S0 = market.spot;
    ResolvedLeg resolved{};
    resolved.type = leg.type;
    resolved.barrier = leg.barrier;
    resolved.reverse = leg.reverse;
    resolved.strike = leg.strike.resolve(S0);
    resolved.barrier_level = leg.barrier_level ? leg.barrier_level->resolve(S0) : 0.0;
    resolved.upper_barrier = leg.upper_barrier ? leg.upper_barrier->resolve(S0) : 0.0;
    resolved.lower_barrier = leg.lower_barrier ? leg.lower_barrier->resolve(S0) : 0.0;
    resolved.volatility = leg.volatility.value_or(market.volatility);
    resolved.quantity = leg.quantity;
    return resolved;
}

// ============================================================================
// BARRIER ACTIVATION RULE
// Shared by the payoff evaluator (single point) and Monte Carlo (per step).
//   call, single barrier:  standard hit on spot >= H, reverse on spot <= H
//   put, single barrier:   standard hit on spot <= H, reverse on spot >= H
//   double barrier:        standard hit outside (L, U), reverse hit inside
// ============================================================================

[[nodiscard]] inline bool barrier_is_up(OptionType type, bool reverse) noexcept {
    return (type == OptionType::CALL) != reverse;
}

[[nodiscard]] inline bool barrier_triggered(const ResolvedLeg& leg, double spot) noexcept {
    switch (leg.barrier) {
        case BarrierKind::NONE:
            return false;
        case BarrierKind::KNOCK_OUT:
        case BarrierKind::KNOCK_IN:
            return barrier_is_up(leg.type, leg.reverse)
                ? spot >= leg.barrier_level
                : spot <= leg.barrier_level;
        case BarrierKind::DOUBLE_KNOCK_OUT:
        case BarrierKind::DOUBLE_KNOCK_IN: {
            const bool outside = spot <= leg.lower_barrier || spot >= leg.upper_barrier;
            return leg.reverse ? !outside : outside;
        }
    }
    return false;
}

[[nodiscard]] inline double intrinsic_value(OptionType type, double spot, double strike) noexcept {
    return type == OptionType::CALL
        ? std::max(spot - strike, 0.0)
        : std::max(strike - spot, 0.0);
}

// ============================================================================
// PRICING RESULT
// ============================================================================

struct PricingResult {
    double price;
    double intrinsic_value;
    double time_value;
    double std_error;           // Monte Carlo standard error, 0 for closed forms
    PricingMethod method;
    int64_t calc_time_ns;
};

// ============================================================================
// DIAGNOSTICS
// ============================================================================

constexpr uint32_t DIAG_INVALID_INPUT = 2001;
constexpr uint32_t DIAG_UNSUPPORTED_COMBINATION = 2002;
constexpr uint32_t DIAG_CONVERGENCE_RISK = 2003;

struct Diagnostic {
    uint32_t code{0};
    std::string message;
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

inline void emit(const DiagnosticSink& sink, uint32_t code, std::string message) {
    if (sink) {
        sink(Diagnostic{code, std::move(message)});
    }
}

// Collects diagnostics for inspection after a pricing call
class DiagnosticLog {
public:
    [[nodiscard]] DiagnosticSink sink() {
        return [this](const Diagnostic& d) { entries_.push_back(d); };
    }

    [[nodiscard]] const std::vector<Diagnostic>& entries() const noexcept { return entries_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_t count(uint32_t code) const noexcept {
        size_t n = 0;
        for (const auto& d : entries_) {
            if (d.code == code) ++n;
        }
        return n;
    }
    void clear() noexcept { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
};

[[nodiscard]] inline DiagnosticSink stderr_sink() {
    return [](const Diagnostic& d) {
        std::cerr << "[fxhedge] " << d.code << " " << d.message << "\n";
    };
}

// ============================================================================
// VALIDATION RESULT
// ============================================================================

struct ValidationResult {
    bool passed{true};
    uint32_t reject_code{0};
    std::string reject_reason;

    static ValidationResult pass() {
        return ValidationResult{true, 0, {}};
    }

    static ValidationResult reject(uint32_t code, std::string reason) {
        return ValidationResult{false, code, std::move(reason)};
    }
};

// Reject codes
constexpr uint32_t REJECT_INVALID_MARKET = 3001;
constexpr uint32_t REJECT_INVALID_STRIKE = 3002;
constexpr uint32_t REJECT_INVALID_BARRIER = 3003;
constexpr uint32_t REJECT_INVALID_VOLATILITY = 3004;
constexpr uint32_t REJECT_INVALID_QUANTITY = 3005;
constexpr uint32_t REJECT_MISSING_PARAMETER = 3006;
constexpr uint32_t REJECT_UNKNOWN_STRATEGY = 3007;
constexpr uint32_t REJECT_SOLVER_FAILED = 3008;

} // namespace fxhedge
