// ==============================================================================
// Layer 0: Core Utility - Parameter Tables
// ==============================================================================
// Static description of a node's tunable quantities: a stable ordinal/name pair,
// unit, range, default, scale and smoothing policy. Each processor declares a
// `static constexpr std::array<ParameterInfo, N> kParameters` table; hosts map
// their own identifiers onto the ordinals.
//
// Design Rules:
// - Tables are built at compile time, never through runtime reflection
// - Normalized <-> real conversions are pure and noexcept
// - Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <volta/dsp/core/setup_error.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Volta {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Mapping between normalized [0, 1] and the real range.
enum class ParameterScale : uint8_t {
    Linear,      ///< real = min + n * (max - min)
    Logarithmic  ///< real = min * (max / min)^n, requires min > 0
};

/// @brief How control-rate changes are spread over samples on the audio thread.
enum class SmoothingPolicy : uint8_t {
    None,         ///< Jump to the new value
    Exponential,  ///< One-pole approach, smoothingMs is the 99% settling time
    Linear        ///< Constant-rate ramp lasting smoothingMs
};

// =============================================================================
// ParameterInfo
// =============================================================================

/// @brief One row of a parameter table.
struct ParameterInfo {
    uint32_t ordinal = 0;
    std::string_view name;
    std::string_view unit;
    double minValue = 0.0;
    double maxValue = 1.0;
    double defaultValue = 0.0;
    ParameterScale scale = ParameterScale::Linear;
    SmoothingPolicy smoothing = SmoothingPolicy::Exponential;
    float smoothingMs = 10.0f;

    /// Convert a real value to [0, 1]
    [[nodiscard]] constexpr double toNormalized(double value) const noexcept {
        const double v = std::clamp(value, minValue, maxValue);
        if (scale == ParameterScale::Logarithmic) {
            return std::log(v / minValue) / std::log(maxValue / minValue);
        }
        return (v - minValue) / (maxValue - minValue);
    }

    /// Convert [0, 1] to a real value inside [minValue, maxValue]
    [[nodiscard]] constexpr double fromNormalized(double normalized) const noexcept {
        const double n = std::clamp(normalized, 0.0, 1.0);
        if (scale == ParameterScale::Logarithmic) {
            return std::clamp(minValue * std::exp(n * std::log(maxValue / minValue)),
                              minValue, maxValue);
        }
        return minValue + n * (maxValue - minValue);
    }

    /// Clamp a real value to the declared range
    [[nodiscard]] constexpr double clampValue(double value) const noexcept {
        return std::clamp(value, minValue, maxValue);
    }
};

template<size_t N>
using ParameterTable = std::array<ParameterInfo, N>;

// =============================================================================
// Table Validation
// =============================================================================

/// @brief Compile-time usable check of a parameter table.
///
/// Ordinals must equal their index, names must be non-empty and unique,
/// min < max, the default must lie inside the range and logarithmic
/// parameters need a positive minimum.
template<size_t N>
[[nodiscard]] constexpr bool isValidParameterTable(const ParameterTable<N>& table) noexcept {
    for (size_t i = 0; i < N; ++i) {
        const ParameterInfo& p = table[i];
        if (p.ordinal != i || p.name.empty()) return false;
        if (!(p.minValue < p.maxValue)) return false;
        if (p.defaultValue < p.minValue || p.defaultValue > p.maxValue) return false;
        if (p.scale == ParameterScale::Logarithmic && !(p.minValue > 0.0)) return false;
        if (p.smoothingMs < 0.0f) return false;
        for (size_t j = 0; j < i; ++j) {
            if (table[j].name == p.name) return false;
        }
    }
    return true;
}

/// @brief Runtime validation with a descriptive error naming the bad row.
template<size_t N>
inline void validateParameterTable(const ParameterTable<N>& table, const char* component) {
    for (size_t i = 0; i < N; ++i) {
        const ParameterInfo& p = table[i];
        std::string problem;
        if (p.ordinal != i) {
            problem = "ordinal " + std::to_string(p.ordinal) + " at index " + std::to_string(i);
        } else if (p.name.empty()) {
            problem = "empty name at ordinal " + std::to_string(i);
        } else if (!(p.minValue < p.maxValue)) {
            problem = std::string(p.name) + ": min must be below max";
        } else if (p.defaultValue < p.minValue || p.defaultValue > p.maxValue) {
            problem = std::string(p.name) + ": default outside range";
        } else if (p.scale == ParameterScale::Logarithmic && !(p.minValue > 0.0)) {
            problem = std::string(p.name) + ": logarithmic scale needs min > 0";
        } else if (p.smoothingMs < 0.0f) {
            problem = std::string(p.name) + ": negative smoothing time";
        } else {
            for (size_t j = 0; j < i; ++j) {
                if (table[j].name == p.name) {
                    problem = "duplicate name " + std::string(p.name);
                    break;
                }
            }
        }
        if (!problem.empty()) {
            detail::throwSetupError(SetupErrorCode::InvalidParameterTable, component, problem);
        }
    }
}

/// @brief Look up an ordinal by name.
template<size_t N>
[[nodiscard]] constexpr std::optional<uint32_t> findParameter(const ParameterTable<N>& table,
                                                              std::string_view name) noexcept {
    for (const auto& p : table) {
        if (p.name == name) {
            return p.ordinal;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Node Parameter Access
// =============================================================================

/// @brief A node with a static parameter table and real-valued accessors.
template<typename P>
concept Parameterized = requires(P node, const P constNode, uint32_t ordinal, double value) {
    { P::kParameters.size() } -> std::convertible_to<size_t>;
    { P::kParameters[0] } -> std::convertible_to<ParameterInfo>;
    { node.setParameter(ordinal, value) } noexcept;
    { constNode.getParameter(ordinal) } noexcept -> std::convertible_to<double>;
};

/// Set a parameter from a normalized [0, 1] value
template<Parameterized P>
inline void setParameterNormalized(P& node, uint32_t ordinal, double normalized) noexcept {
    if (ordinal >= P::kParameters.size()) return;
    node.setParameter(ordinal, P::kParameters[ordinal].fromNormalized(normalized));
}

/// Current value of a parameter mapped to [0, 1]
template<Parameterized P>
[[nodiscard]] inline double getParameterNormalized(const P& node, uint32_t ordinal) noexcept {
    if (ordinal >= P::kParameters.size()) return 0.0;
    return P::kParameters[ordinal].toNormalized(node.getParameter(ordinal));
}

/// Set a parameter by name; returns false when the name is unknown
template<Parameterized P>
inline bool setParameterByName(P& node, std::string_view name, double value) noexcept {
    const auto ordinal = findParameter(P::kParameters, name);
    if (!ordinal) return false;
    node.setParameter(*ordinal, value);
    return true;
}

} // namespace DSP
} // namespace Volta
