// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Mathematical constants for DSP calculations, available for every sample type.
// Components import these rather than defining their own.
//
// Design Rules:
// - Real-Time Safety (constexpr, no allocations)
// - Layer 0 (no dependencies on other DSP layers)
//
// Note: Constants are inline constexpr variable templates so there is exactly
// one definition per type across all translation units.
// ==============================================================================

#pragma once

namespace Volta {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi at the precision of T
template<typename T>
inline constexpr T kPi = static_cast<T>(3.14159265358979323846264338327950288);

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
template<typename T>
inline constexpr T kTwoPi = static_cast<T>(2) * kPi<T>;

/// Half Pi (quarter circle in radians)
template<typename T>
inline constexpr T kHalfPi = kPi<T> / static_cast<T>(2);

/// Natural logarithm of 2
template<typename T>
inline constexpr T kLn2 = static_cast<T>(0.693147180559945309417232121458176568);

/// 1 / sqrt(2), the Butterworth Q
template<typename T>
inline constexpr T kInvSqrt2 = static_cast<T>(0.707106781186547524400844362104849039);

} // namespace DSP
} // namespace Volta
