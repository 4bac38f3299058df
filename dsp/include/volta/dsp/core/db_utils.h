// ==============================================================================
// Layer 0: Core Utility - dB/Linear Conversion
// ==============================================================================
// Gain conversions used by filters (shelf/peak gain), tests and analysis.
//
// Design Rules:
// - Real-Time Safety (no allocation, no locks, no exceptions)
// - Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>

#include <cmath>

namespace Volta {
namespace DSP {

/// Floor value for silence in decibels (about 24-bit dynamic range).
inline constexpr double kSilenceFloorDb = -144.0;

/// @brief Convert decibels to linear gain.
/// @note NaN input returns 0 gain.
template<SampleType T>
[[nodiscard]] inline T dbToGain(T dB) noexcept {
    if (std::isnan(dB)) {
        return T(0);
    }
    return std::pow(T(10), dB / T(20));
}

/// @brief Convert linear gain to decibels.
/// @return kSilenceFloorDb for zero, negative or NaN gain
template<SampleType T>
[[nodiscard]] inline T gainToDb(T gain) noexcept {
    if (!(gain > T(0))) {
        return static_cast<T>(kSilenceFloorDb);
    }
    return std::max(T(20) * std::log10(gain), static_cast<T>(kSilenceFloorDb));
}

} // namespace DSP
} // namespace Volta
