#pragma once

#include <cmath>
#include <algorithm>
#include <chrono>

#include "fx_types.hpp"

namespace fxhedge::options {

// Floors applied to maturity and volatility before dividing by sigma * sqrt(T)
inline constexpr double MIN_TIME = 1e-10;
inline constexpr double MIN_VOL = 1e-10;

enum class BarrierType : uint8_t {
    DOWN_AND_OUT = 0, DOWN_AND_IN = 1,
    UP_AND_OUT = 2, UP_AND_IN = 3
};

enum class DoubleBarrierType : uint8_t { KNOCK_OUT = 0, KNOCK_IN = 1 };

// ============================================================================
// MATHEMATICAL UTILITIES
// ============================================================================

class alignas(64) MathUtils {
public:
    // Abramowitz & Stegun 7.1.26 - max error 7.5e-8
    [[nodiscard]] static inline double norm_cdf(double x) noexcept {
        static constexpr double a1 =  0.254829592;
        static constexpr double a2 = -0.284496736;
        static constexpr double a3 =  1.421413741;
        static constexpr double a4 = -1.453152027;
        static constexpr double a5 =  1.061405429;
        static constexpr double p  =  0.3275911;

        const int sign = (x < 0) ? -1 : 1;
        x = std::abs(x) * INV_SQRT2;

        const double t = 1.0 / (1.0 + p * x);
        const double t2 = t * t;
        const double t3 = t2 * t;
        const double t4 = t3 * t;
        const double t5 = t4 * t;

        const double y = 1.0 - (((((a5 * t5 + a4 * t4) + a3 * t3) + a2 * t2) + a1 * t)
                         * std::exp(-x * x));

        return 0.5 * (1.0 + sign * y);
    }

private:
    static constexpr double INV_SQRT2 = 0.7071067811865475;
};

// ============================================================================
// FORWARD RATE - COVERED INTEREST PARITY
// ============================================================================

[[nodiscard]] inline double forward_rate(double S, double T, double r_d, double r_f) noexcept {
    return S * std::exp((r_d - r_f) * T);
}

// ============================================================================
// GARMAN-KOHLHAGEN PRICER - FX VANILLA
// ============================================================================

class alignas(64) GarmanKohlhagenPricer {
public:
    /**
     * Premium per unit of foreign notional, in domestic currency.
     * Returns 0 and reports DIAG_INVALID_INPUT when S or K is not positive.
     */
    [[nodiscard]] static double price(
        OptionType type, double S, double K, double T,
        double r_d, double r_f, double sigma,
        const DiagnosticSink& sink = {}
    );

    // Same price with intrinsic/time value split and timing
    [[nodiscard]] static PricingResult price_detailed(
        OptionType type, double S, double K, double T,
        double r_d, double r_f, double sigma,
        const DiagnosticSink& sink = {}
    );

private:
    static inline void calc_d1_d2(double S, double K, double T, double r_d, double r_f,
                                   double sigma, double& d1, double& d2) noexcept {
        const double sigma_sqrt_T = sigma * std::sqrt(T);
        d1 = (std::log(S / K) + (r_d - r_f + 0.5 * sigma * sigma) * T) / sigma_sqrt_T;
        d2 = d1 - sigma_sqrt_T;
    }
};

// ============================================================================
// BARRIER OPTIONS - CLOSED FORM
// Single barrier: Reiner-Rubinstein as tabulated by Haug, with cost of carry
// b = r_d - r_f. Double barrier: Ikeda-Kunitomo series with flat boundaries.
// ============================================================================

class alignas(64) BarrierOptionPricer {
public:
    static constexpr int DOUBLE_BARRIER_TERMS = 5;   // n in [-5, 5]

    [[nodiscard]] static double price_single(
        OptionType option_type, BarrierType barrier_type,
        double S, double K, double H, double T,
        double r_d, double r_f, double sigma,
        double rebate = 0.0,
        const DiagnosticSink& sink = {}
    );

    // "in" is priced as vanilla minus "out"
    [[nodiscard]] static double price_double(
        OptionType option_type, DoubleBarrierType barrier_type,
        double S, double K, double L, double U, double T,
        double r_d, double r_f, double sigma,
        const DiagnosticSink& sink = {}
    );

    // Maps a standard/reverse single barrier leg onto the down/up table
    [[nodiscard]] static BarrierType single_barrier_type(
        OptionType option_type, bool knock_in, bool reverse
    ) noexcept;

private:
    // Continuous-monitoring knock-out value under the double barrier series
    [[nodiscard]] static double double_knock_out(
        OptionType option_type, double S, double K, double L, double U,
        double T, double r_d, double r_f, double sigma
    ) noexcept;
};

// ============================================================================
// PUT-CALL PARITY AND VALIDATION
// ============================================================================

struct PutCallParityCheck {
    bool is_valid;
    double difference;
    double expected;
};

[[nodiscard]] PutCallParityCheck check_put_call_parity(
    double call_price, double put_price,
    double S, double K, double T, double r_d, double r_f,
    double tolerance = 1e-6
) noexcept;

} // namespace fxhedge::options
