#include "options_pricing.hpp"
#include <algorithm>
#include <chrono>
#include <string>

namespace fxhedge::options {

namespace {

// Rejects NaN as well as non-positive values
[[nodiscard]] inline bool positive(double x) noexcept {
    return x > 0.0;
}

} // namespace

// ============================================================================
// GARMAN-KOHLHAGEN PRICER IMPLEMENTATION
// ============================================================================

double GarmanKohlhagenPricer::price(
    OptionType type, double S, double K, double T,
    double r_d, double r_f, double sigma,
    const DiagnosticSink& sink
) {
    if (!positive(S) || !positive(K)) {
        emit(sink, DIAG_INVALID_INPUT,
             "vanilla: spot and strike must be positive (S=" + std::to_string(S) +
             ", K=" + std::to_string(K) + ")");
        return 0.0;
    }

    T = std::max(T, MIN_TIME);
    sigma = std::max(sigma, MIN_VOL);

    double d1, d2;
    calc_d1_d2(S, K, T, r_d, r_f, sigma, d1, d2);

    const double foreign_df = std::exp(-r_f * T);
    const double domestic_df = std::exp(-r_d * T);

    double value;
    if (type == OptionType::CALL) {
        value = S * foreign_df * MathUtils::norm_cdf(d1)
              - K * domestic_df * MathUtils::norm_cdf(d2);
    } else {
        value = K * domestic_df * MathUtils::norm_cdf(-d2)
              - S * foreign_df * MathUtils::norm_cdf(-d1);
    }

    return std::max(value, 0.0);
}

PricingResult GarmanKohlhagenPricer::price_detailed(
    OptionType type, double S, double K, double T,
    double r_d, double r_f, double sigma,
    const DiagnosticSink& sink
) {
    const auto start = std::chrono::steady_clock::now();

    PricingResult result{};
    result.method = PricingMethod::CLOSED_FORM;
    result.std_error = 0.0;

    if (!positive(S) || !positive(K)) {
        emit(sink, DIAG_INVALID_INPUT, "vanilla: spot and strike must be positive");
        result.method = PricingMethod::REJECTED;
        return result;
    }

    result.price = price(type, S, K, T, r_d, r_f, sigma, sink);
    result.intrinsic_value = intrinsic_value(type, S, K);
    result.time_value = result.price - result.intrinsic_value;

    const auto end = std::chrono::steady_clock::now();
    result.calc_time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();

    return result;
}

// ============================================================================
// SINGLE BARRIER IMPLEMENTATION
// ============================================================================

BarrierType BarrierOptionPricer::single_barrier_type(
    OptionType option_type, bool knock_in, bool reverse
) noexcept {
    if (barrier_is_up(option_type, reverse)) {
        return knock_in ? BarrierType::UP_AND_IN : BarrierType::UP_AND_OUT;
    }
    return knock_in ? BarrierType::DOWN_AND_IN : BarrierType::DOWN_AND_OUT;
}

double BarrierOptionPricer::price_single(
    OptionType option_type, BarrierType barrier_type,
    double S, double K, double H, double T,
    double r_d, double r_f, double sigma,
    double rebate,
    const DiagnosticSink& sink
) {
    if (!positive(S) || !positive(K) || !positive(H) || !positive(T) || !positive(sigma)) {
        emit(sink, DIAG_INVALID_INPUT,
             "single barrier: S, K, H, T and sigma must be positive (S=" + std::to_string(S) +
             ", K=" + std::to_string(K) + ", H=" + std::to_string(H) +
             ", T=" + std::to_string(T) + ", sigma=" + std::to_string(sigma) + ")");
        return 0.0;
    }

    const bool is_call = option_type == OptionType::CALL;
    const bool is_down = barrier_type == BarrierType::DOWN_AND_OUT ||
                         barrier_type == BarrierType::DOWN_AND_IN;
    const bool is_in = barrier_type == BarrierType::DOWN_AND_IN ||
                       barrier_type == BarrierType::UP_AND_IN;

    // Barrier already breached at inception
    if ((is_down && S <= H) || (!is_down && S >= H)) {
        return is_in
            ? GarmanKohlhagenPricer::price(option_type, S, K, T, r_d, r_f, sigma, sink)
            : std::max(rebate, 0.0);
    }

    const double b = r_d - r_f;
    const double r = r_d;
    const double sigma_sq = sigma * sigma;
    const double sigma_sqrt_T = sigma * std::sqrt(T);

    const double mu = (b - 0.5 * sigma_sq) / sigma_sq;
    const double lambda = std::sqrt(std::max(mu * mu + 2.0 * r / sigma_sq, 0.0));

    const double eta = is_down ? 1.0 : -1.0;
    const double phi = is_call ? 1.0 : -1.0;

    const double carry_df = std::exp((b - r) * T);
    const double df = std::exp(-r * T);
    const double h_s = H / S;

    const double x1 = std::log(S / K) / sigma_sqrt_T + (1.0 + mu) * sigma_sqrt_T;
    const double x2 = std::log(S / H) / sigma_sqrt_T + (1.0 + mu) * sigma_sqrt_T;
    const double y1 = std::log(H * H / (S * K)) / sigma_sqrt_T + (1.0 + mu) * sigma_sqrt_T;
    const double y2 = std::log(H / S) / sigma_sqrt_T + (1.0 + mu) * sigma_sqrt_T;

    const double pow_2mu1 = std::pow(h_s, 2.0 * (mu + 1.0));
    const double pow_2mu = std::pow(h_s, 2.0 * mu);

    // Reflection principle components
    const double f1 = phi * S * carry_df * MathUtils::norm_cdf(phi * x1)
                    - phi * K * df * MathUtils::norm_cdf(phi * x1 - phi * sigma_sqrt_T);
    const double f2 = phi * S * carry_df * MathUtils::norm_cdf(phi * x2)
                    - phi * K * df * MathUtils::norm_cdf(phi * x2 - phi * sigma_sqrt_T);
    const double f3 = phi * S * carry_df * pow_2mu1 * MathUtils::norm_cdf(eta * y1)
                    - phi * K * df * pow_2mu * MathUtils::norm_cdf(eta * y1 - eta * sigma_sqrt_T);
    const double f4 = phi * S * carry_df * pow_2mu1 * MathUtils::norm_cdf(eta * y2)
                    - phi * K * df * pow_2mu * MathUtils::norm_cdf(eta * y2 - eta * sigma_sqrt_T);

    // Rebate terms: f5 paid at expiry if never hit, f6 paid at hit
    double f5 = 0.0;
    double f6 = 0.0;
    if (rebate > 0.0) {
        const double z = std::log(H / S) / sigma_sqrt_T + lambda * sigma_sqrt_T;
        f5 = rebate * df * (MathUtils::norm_cdf(eta * x2 - eta * sigma_sqrt_T)
                            - pow_2mu * MathUtils::norm_cdf(eta * y2 - eta * sigma_sqrt_T));
        f6 = rebate * (std::pow(h_s, mu + lambda) * MathUtils::norm_cdf(eta * z)
                       + std::pow(h_s, mu - lambda)
                         * MathUtils::norm_cdf(eta * z - 2.0 * eta * lambda * sigma_sqrt_T));
    }

    const bool strike_above = K >= H;
    double price = 0.0;

    switch (barrier_type) {
        case BarrierType::DOWN_AND_IN:
            if (is_call) {
                price = strike_above ? f3 + f5 : f1 - f2 + f4 + f5;
            } else {
                price = strike_above ? f2 - f3 + f4 + f5 : f1 + f5;
            }
            break;
        case BarrierType::UP_AND_IN:
            if (is_call) {
                price = strike_above ? f1 + f5 : f2 - f3 + f4 + f5;
            } else {
                price = strike_above ? f1 - f2 + f4 + f5 : f3 + f5;
            }
            break;
        case BarrierType::DOWN_AND_OUT:
            if (is_call) {
                price = strike_above ? f1 - f3 + f6 : f2 - f4 + f6;
            } else {
                price = strike_above ? f1 - f2 + f3 - f4 + f6 : f6;
            }
            break;
        case BarrierType::UP_AND_OUT:
            if (is_call) {
                price = strike_above ? f6 : f1 - f2 + f3 - f4 + f6;
            } else {
                price = strike_above ? f2 - f4 + f6 : f1 - f3 + f6;
            }
            break;
    }

    if (!std::isfinite(price)) {
        emit(sink, DIAG_INVALID_INPUT,
             "single barrier: non-finite price, sigma=" + std::to_string(sigma) +
             " too small for barrier reflection terms");
        return 0.0;
    }

    return std::max(price, 0.0);
}

// ============================================================================
// DOUBLE BARRIER IMPLEMENTATION
// ============================================================================

double BarrierOptionPricer::double_knock_out(
    OptionType option_type, double S, double K, double L, double U,
    double T, double r_d, double r_f, double sigma
) noexcept {
    const bool is_call = option_type == OptionType::CALL;

    // Payoff is integrated over (lo, hi) inside the corridor
    const double lo = is_call ? std::max(K, L) : L;
    const double hi = is_call ? U : std::min(K, U);
    if (lo >= hi) {
        return 0.0;
    }

    const double b = r_d - r_f;
    const double r = r_d;
    const double sigma_sq = sigma * sigma;
    const double sigma_sqrt_T = sigma * std::sqrt(T);
    const double drift = (b + 0.5 * sigma_sq) * T;

    // Flat boundaries: mu2 = 0, mu1 = mu3
    const double mu1 = 2.0 * b / sigma_sq + 1.0;
    const double mu3 = mu1;

    const double log_ul = std::log(U / L);
    const double log_ls = std::log(L / S);

    double sum1 = 0.0;
    double sum2 = 0.0;

    for (int n = -DOUBLE_BARRIER_TERMS; n <= DOUBLE_BARRIER_TERMS; ++n) {
        const double shift = 2.0 * n * log_ul;

        const double d1 = (std::log(S / lo) + shift + drift) / sigma_sqrt_T;
        const double d2 = (std::log(S / hi) + shift + drift) / sigma_sqrt_T;
        const double d3 = (std::log(L * L / (S * lo)) - shift + drift) / sigma_sqrt_T;
        const double d4 = (std::log(L * L / (S * hi)) - shift + drift) / sigma_sqrt_T;

        const double log_w1 = n * log_ul;
        const double log_w3 = log_ls - n * log_ul;

        sum1 += std::exp(mu1 * log_w1)
                    * (MathUtils::norm_cdf(d1) - MathUtils::norm_cdf(d2))
              - std::exp(mu3 * log_w3)
                    * (MathUtils::norm_cdf(d3) - MathUtils::norm_cdf(d4));

        sum2 += std::exp((mu1 - 2.0) * log_w1)
                    * (MathUtils::norm_cdf(d1 - sigma_sqrt_T) - MathUtils::norm_cdf(d2 - sigma_sqrt_T))
              - std::exp((mu3 - 2.0) * log_w3)
                    * (MathUtils::norm_cdf(d3 - sigma_sqrt_T) - MathUtils::norm_cdf(d4 - sigma_sqrt_T));
    }

    const double spot_leg = S * std::exp((b - r) * T) * sum1;
    const double strike_leg = K * std::exp(-r * T) * sum2;

    return is_call ? spot_leg - strike_leg : strike_leg - spot_leg;
}

double BarrierOptionPricer::price_double(
    OptionType option_type, DoubleBarrierType barrier_type,
    double S, double K, double L, double U, double T,
    double r_d, double r_f, double sigma,
    const DiagnosticSink& sink
) {
    if (!positive(S) || !positive(K) || !positive(L) || !positive(U) ||
        !positive(T) || !positive(sigma)) {
        emit(sink, DIAG_INVALID_INPUT,
             "double barrier: S, K, L, U, T and sigma must be positive");
        return 0.0;
    }
    if (L >= U) {
        emit(sink, DIAG_INVALID_INPUT,
             "double barrier: lower barrier " + std::to_string(L) +
             " must be below upper barrier " + std::to_string(U));
        return 0.0;
    }

    const double vanilla = GarmanKohlhagenPricer::price(option_type, S, K, T, r_d, r_f, sigma, sink);

    double out = 0.0;
    if (S > L && S < U) {
        out = double_knock_out(option_type, S, K, L, U, T, r_d, r_f, sigma);
        if (!std::isfinite(out)) {
            emit(sink, DIAG_INVALID_INPUT,
                 "double barrier: series did not produce a finite value");
            return 0.0;
        }
    }

    // Keep out within [0, vanilla] so that in + out == vanilla
    out = std::clamp(out, 0.0, vanilla);

    return barrier_type == DoubleBarrierType::KNOCK_OUT ? out : vanilla - out;
}

// ============================================================================
// PUT-CALL PARITY
// ============================================================================

PutCallParityCheck check_put_call_parity(
    double call_price, double put_price,
    double S, double K, double T, double r_d, double r_f,
    double tolerance
) noexcept {
    const double expected = S * std::exp(-r_f * T) - K * std::exp(-r_d * T);
    const double actual = call_price - put_price;
    const double difference = std::abs(actual - expected);

    return PutCallParityCheck{
        .is_valid = difference < tolerance,
        .difference = difference,
        .expected = expected
    };
}

} // namespace fxhedge::options
