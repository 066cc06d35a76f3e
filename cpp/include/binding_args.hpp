#pragma once

#include "fx_types.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

/**
 * Conversions from JS argument values to engine types
 *
 * The add-on reads every JS number as a double and every enum as a string.
 * These helpers reject anything the engine cannot represent before it is
 * narrowed to an integer or mapped to an enum.
 */

namespace fxhedge::bindings {

// ============================================================================
// LIMITS
// ============================================================================

inline constexpr double MAX_PATHS = 1e8;
inline constexpr double MAX_TIME_STEPS = 1e5;
inline constexpr double MAX_SWEEP_STEPS = 1e6;
inline constexpr double MAX_SEED = 9007199254740992.0;   // 2^53, exact in a double

// ============================================================================
// ENUM NAMES
// ============================================================================

[[nodiscard]] inline bool parse_option_type(std::string_view text, OptionType& type) noexcept {
    if (text == "call") { type = OptionType::CALL; return true; }
    if (text == "put") { type = OptionType::PUT; return true; }
    return false;
}

[[nodiscard]] inline bool parse_barrier_kind(std::string_view text, BarrierKind& kind) noexcept {
    if (text == "none") { kind = BarrierKind::NONE; return true; }
    if (text == "KO") { kind = BarrierKind::KNOCK_OUT; return true; }
    if (text == "KI") { kind = BarrierKind::KNOCK_IN; return true; }
    if (text == "DKO") { kind = BarrierKind::DOUBLE_KNOCK_OUT; return true; }
    if (text == "DKI") { kind = BarrierKind::DOUBLE_KNOCK_IN; return true; }
    return false;
}

[[nodiscard]] inline const char* barrier_kind_name(BarrierKind kind) noexcept {
    switch (kind) {
        case BarrierKind::NONE: return "none";
        case BarrierKind::KNOCK_OUT: return "KO";
        case BarrierKind::KNOCK_IN: return "KI";
        case BarrierKind::DOUBLE_KNOCK_OUT: return "DKO";
        case BarrierKind::DOUBLE_KNOCK_IN: return "DKI";
    }
    return "none";
}

// ============================================================================
// NUMERIC NARROWING
// ============================================================================

// Finite and within [min, max]; fractional counts are truncated
[[nodiscard]] inline bool to_count(double value, double min, double max, size_t& out) noexcept {
    if (!std::isfinite(value) || value < min || value > max) {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

[[nodiscard]] inline bool to_seed(double value, uint64_t& out) noexcept {
    if (!std::isfinite(value) || value < 0.0 || value > MAX_SEED || std::floor(value) != value) {
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

} // namespace fxhedge::bindings
