// ==============================================================================
// Layer 0: Core Utility - Sample Traits
// ==============================================================================
// The numeric capability set every sample value must satisfy. Algorithms are
// written once against SampleType and instantiated for float and double.
//
// Design Rules:
// - Real-Time Safety (constexpr, noexcept)
// - Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <limits>

namespace Volta {
namespace DSP {

// =============================================================================
// SampleType Concept
// =============================================================================

/// @brief A scalar usable as an audio sample.
///
/// Requires arithmetic, ordering (for clamping) and conversion to and from the
/// double reference type. All IEEE floating-point types qualify.
template<typename T>
concept SampleType = std::floating_point<T> && requires(T a, T b, double d) {
    { a + b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a < b } -> std::convertible_to<bool>;
    { static_cast<T>(d) };
    { static_cast<double>(a) };
};

// =============================================================================
// SampleTraits
// =============================================================================

/// @brief Per-precision constants and conversions used by the generic algorithms.
///
/// The epsilons scale with the type's precision:
/// - kAdaaEpsilon: minimum |x[n] - x[n-1]| for the ADAA difference quotient.
///   Below it the quotient suffers catastrophic cancellation.
/// - kAdaa2Epsilon: the same threshold for second-order ADAA, whose nested
///   quotient divides by the input step twice.
/// - kDefaultTolerance: default residual tolerance of the implicit solver.
/// - kMinDerivative: |r'(y)| below which Newton-Raphson is ill-conditioned.
template<typename T>
struct SampleTraits;

template<>
struct SampleTraits<float> {
    static constexpr float kAdaaEpsilon = 1e-3f;
    static constexpr float kAdaa2Epsilon = 1e-2f;
    static constexpr float kDefaultTolerance = 1e-5f;
    static constexpr float kMinDerivative = 1e-6f;
    static constexpr float kDenormalThreshold = 1e-15f;
};

template<>
struct SampleTraits<double> {
    static constexpr double kAdaaEpsilon = 1e-6;
    static constexpr double kAdaa2Epsilon = 1e-5;
    static constexpr double kDefaultTolerance = 1e-9;
    static constexpr double kMinDerivative = 1e-12;
    static constexpr double kDenormalThreshold = 1e-30;
};

template<>
struct SampleTraits<long double> {
    static constexpr long double kAdaaEpsilon = 1e-7L;
    static constexpr long double kAdaa2Epsilon = 1e-6L;
    static constexpr long double kDefaultTolerance = 1e-11L;
    static constexpr long double kMinDerivative = 1e-14L;
    static constexpr long double kDenormalThreshold = 1e-30L;
};

// =============================================================================
// Conversions and Helpers
// =============================================================================

/// Convert from the double reference type
template<SampleType T>
[[nodiscard]] constexpr T fromDouble(double value) noexcept {
    return static_cast<T>(value);
}

/// Convert to the double reference type
template<SampleType T>
[[nodiscard]] constexpr double toDouble(T value) noexcept {
    return static_cast<double>(value);
}

/// Clamp a sample to [lo, hi]
template<SampleType T>
[[nodiscard]] constexpr T clampSample(T value, T lo, T hi) noexcept {
    return std::clamp(value, lo, hi);
}

/// True when value is neither NaN nor infinite
template<SampleType T>
[[nodiscard]] inline bool isFiniteSample(T value) noexcept {
    return std::isfinite(value);
}

/// Replace denormal-range values with zero
template<SampleType T>
[[nodiscard]] inline T flushDenormal(T value) noexcept {
    return (std::abs(value) < SampleTraits<T>::kDenormalThreshold) ? T(0) : value;
}

} // namespace DSP
} // namespace Volta
