// ==============================================================================
// Layer 1: DSP Primitive - Saturators
// ==============================================================================
// Memoryless nonlinear transfer functions with their derivative and
// antiderivative. The derivative feeds Newton-Raphson in the implicit solver;
// the antiderivative feeds first-order ADAA.
//
// Every saturator is a small copyable struct over a SampleType:
//   T evaluate(T x) const noexcept         - f(x)
//   T derivative(T x) const noexcept       - f'(x)      (optional)
//   T antiderivative(T x) const noexcept   - F(x)       (optional, for ADAA)
//   T antiderivative2(T x) const noexcept  - F2(x)      (optional, for 2nd-order ADAA)
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations)
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/math_constants.h>
#include <volta/dsp/core/sample_traits.h>

#include <algorithm>
#include <cmath>
#include <concepts>

namespace Volta {
namespace DSP {

// =============================================================================
// Concepts
// =============================================================================

/// @brief Anything with `T evaluate(T) const`.
template<typename S, typename T>
concept Saturator = SampleType<T> && requires(const S s, T x) {
    { s.evaluate(x) } -> std::convertible_to<T>;
};

/// @brief A saturator that exposes its slope (enables Newton-Raphson).
template<typename S, typename T>
concept DifferentiableSaturator = Saturator<S, T> && requires(const S s, T x) {
    { s.derivative(x) } -> std::convertible_to<T>;
};

/// @brief A saturator that exposes its antiderivative (enables ADAA).
template<typename S, typename T>
concept IntegrableSaturator = Saturator<S, T> && requires(const S s, T x) {
    { s.antiderivative(x) } -> std::convertible_to<T>;
};

/// @brief A saturator that also exposes its second antiderivative.
template<typename S, typename T>
concept TwiceIntegrableSaturator = IntegrableSaturator<S, T> && requires(const S s, T x) {
    { s.antiderivative2(x) } -> std::convertible_to<T>;
};

/// @brief Slope of a saturator at the origin, used to linearize it.
///
/// Saturators without a derivative are linearized with a central difference.
template<typename T, typename S>
[[nodiscard]] inline T slopeAtOrigin(const S& sat) noexcept {
    if constexpr (DifferentiableSaturator<S, T>) {
        return static_cast<T>(sat.derivative(T(0)));
    } else {
        constexpr T h = static_cast<T>(1e-4);
        return (static_cast<T>(sat.evaluate(h)) - static_cast<T>(sat.evaluate(-h))) / (T(2) * h);
    }
}

// =============================================================================
// Linear
// =============================================================================

/// @brief Identity. Turns any nonlinear topology into its linear model.
template<SampleType T>
struct Linear {
    [[nodiscard]] T evaluate(T x) const noexcept { return x; }
    [[nodiscard]] T derivative(T) const noexcept { return T(1); }
    [[nodiscard]] T antiderivative(T x) const noexcept { return T(0.5) * x * x; }
    [[nodiscard]] T antiderivative2(T x) const noexcept { return x * x * x / T(6); }
};

// =============================================================================
// Tanh
// =============================================================================

/// @brief Hyperbolic tangent, the classic transistor-ish soft clipper.
///
/// The antiderivative ln(cosh(x)) is evaluated as
/// |x| + log1p(exp(-2|x|)) - ln 2, which stays finite for any input. There is
/// no second antiderivative: integrating ln(cosh(x)) needs the dilogarithm.
template<SampleType T>
struct Tanh {
    [[nodiscard]] T evaluate(T x) const noexcept { return std::tanh(x); }

    [[nodiscard]] T derivative(T x) const noexcept {
        const T t = std::tanh(x);
        return T(1) - t * t;
    }

    [[nodiscard]] T antiderivative(T x) const noexcept {
        const T ax = std::abs(x);
        return ax + std::log1p(std::exp(T(-2) * ax)) - kLn2<T>;
    }
};

// =============================================================================
// Asinh
// =============================================================================

/// @brief Inverse hyperbolic sine: unbounded, logarithmic growth.
template<SampleType T>
struct Asinh {
    [[nodiscard]] T evaluate(T x) const noexcept { return std::asinh(x); }

    [[nodiscard]] T derivative(T x) const noexcept {
        return T(1) / std::sqrt(x * x + T(1));
    }

    [[nodiscard]] T antiderivative(T x) const noexcept {
        return x * std::asinh(x) - std::sqrt(x * x + T(1));
    }

    [[nodiscard]] T antiderivative2(T x) const noexcept {
        const T root = std::sqrt(x * x + T(1));
        return (T(2) * x * x - T(1)) * T(0.25) * std::asinh(x) - T(0.75) * x * root;
    }
};

// =============================================================================
// HardClip
// =============================================================================

/// @brief Hard clipper to [minValue, maxValue].
///
/// The derivative is 0 outside the range, so Newton-Raphson falls back to
/// fixed-point iteration there.
template<SampleType T>
struct HardClip {
    T minValue = T(-1);
    T maxValue = T(1);

    [[nodiscard]] T evaluate(T x) const noexcept {
        return std::clamp(x, minValue, maxValue);
    }

    [[nodiscard]] T derivative(T x) const noexcept {
        return (x > minValue && x < maxValue) ? T(1) : T(0);
    }

    [[nodiscard]] T antiderivative(T x) const noexcept {
        if (x < minValue) {
            return minValue * x - T(0.5) * minValue * minValue;
        }
        if (x > maxValue) {
            return maxValue * x - T(0.5) * maxValue * maxValue;
        }
        return T(0.5) * x * x;
    }

    [[nodiscard]] T antiderivative2(T x) const noexcept {
        if (x < minValue) {
            return outerAntiderivative2(minValue, x);
        }
        if (x > maxValue) {
            return outerAntiderivative2(maxValue, x);
        }
        return x * x * x / T(6);
    }

private:
    /// Second antiderivative of the constant `level`, continuous at x = level
    [[nodiscard]] static T outerAntiderivative2(T level, T x) noexcept {
        return T(0.5) * level * x * x - T(0.5) * level * level * x + level * level * level / T(6);
    }
};

// =============================================================================
// SoftClipCubic
// =============================================================================

/// @brief Cubic polynomial soft clipper: 1.5x - 0.5x^3 inside [-1, 1].
///
/// f'(+/-1) = 0, so the knee is smooth and output never exceeds +/-1.
template<SampleType T>
struct SoftClipCubic {
    [[nodiscard]] T evaluate(T x) const noexcept {
        if (x >= T(1)) return T(1);
        if (x <= T(-1)) return T(-1);
        return T(1.5) * x - T(0.5) * x * x * x;
    }

    [[nodiscard]] T derivative(T x) const noexcept {
        if (x >= T(1) || x <= T(-1)) return T(0);
        return T(1.5) * (T(1) - x * x);
    }

    [[nodiscard]] T antiderivative(T x) const noexcept {
        const T ax = std::abs(x);
        if (ax >= T(1)) {
            return ax - T(0.375);
        }
        const T x2 = x * x;
        return T(0.75) * x2 - T(0.125) * x2 * x2;
    }

    [[nodiscard]] T antiderivative2(T x) const noexcept {
        if (std::abs(x) >= T(1)) {
            return std::copysign(T(0.5) * x * x + T(0.1), x) - T(0.375) * x;
        }
        const T x3 = x * x * x;
        return T(0.25) * x3 - T(0.025) * x3 * x * x;
    }
};

// =============================================================================
// CommonCollector
// =============================================================================

namespace detail {

/// 1 / (1 + 2^e) without overflow for large |e|
template<SampleType T>
[[nodiscard]] inline T logisticExp2(T e) noexcept {
    if (e > T(0)) {
        const T p = std::exp2(-e);
        return p / (T(1) + p);
    }
    return T(1) / (T(1) + std::exp2(e));
}

/// Exponential smooth minimum; t = 0 is the hard min
template<SampleType T>
[[nodiscard]] inline T smoothMin(T t, T a, T b) noexcept {
    return std::min(a, b) - t * std::log2(T(1) + std::exp2(-std::abs(a - b) / t));
}

/// Exponential smooth maximum; t = 0 is the hard max
template<SampleType T>
[[nodiscard]] inline T smoothMax(T t, T a, T b) noexcept {
    return std::max(a, b) + t * std::log2(T(1) + std::exp2(-std::abs(a - b) / t));
}

} // namespace detail

/// @brief NPN transistor in common-collector (emitter follower) configuration.
///
/// The emitter follows the base until it reaches a supply rail:
///   f(x) = smoothClamp(x + xBias, vee, vcc) + yBias
/// xBias and yBias recenter the curve; the defaults put f(0) at 0 with the
/// +/-4.5 V rails of a 9 V pedal, so positive swings clip first.
template<SampleType T>
struct CommonCollector {
    T vcc = static_cast<T>(4.5);      ///< Positive rail (V)
    T vee = static_cast<T>(-4.5);     ///< Negative rail (V)
    T xBias = static_cast<T>(0.77);   ///< Added to the input
    T yBias = static_cast<T>(-0.77);  ///< Added to the output
    T smoothing = static_cast<T>(0.1);  ///< Width of the rail knees (V)

    [[nodiscard]] T evaluate(T x) const noexcept {
        const T t = knee();
        const T upper = detail::smoothMin(t, x + xBias, vcc);
        return detail::smoothMax(t, vee, upper) + yBias;
    }

    [[nodiscard]] T derivative(T x) const noexcept {
        const T t = knee();
        const T upper = detail::smoothMin(t, x + xBias, vcc);
        return detail::logisticExp2((x + xBias - vcc) / t)
             * detail::logisticExp2((vee - upper) / t);
    }

private:
    [[nodiscard]] T knee() const noexcept {
        return std::max(smoothing, static_cast<T>(1e-6));
    }
};

// =============================================================================
// Driven
// =============================================================================

/// @brief Scales the knee of a saturator: f(x) = S(drive * x) / drive.
///
/// Small-signal gain stays at S'(0) regardless of drive; higher drive moves
/// the onset of saturation toward zero. The drive magnitude is floored at
/// kMinDrive, and non-finite values are ignored.
template<SampleType T, typename S>
struct Driven {
    static constexpr T kMinDrive = static_cast<T>(1e-6);

    S inner{};

    Driven() = default;

    Driven(S saturator, T drive) noexcept
        : inner(saturator) {
        setDrive(drive);
    }

    void setDrive(T drive) noexcept {
        if (!std::isfinite(drive)) return;
        drive_ = std::max(std::abs(drive), kMinDrive);
    }
    [[nodiscard]] T getDrive() const noexcept { return drive_; }

    [[nodiscard]] T evaluate(T x) const noexcept {
        return static_cast<T>(inner.evaluate(drive_ * x)) / drive_;
    }

    [[nodiscard]] T derivative(T x) const noexcept
        requires DifferentiableSaturator<S, T> {
        return static_cast<T>(inner.derivative(drive_ * x));
    }

    [[nodiscard]] T antiderivative(T x) const noexcept
        requires IntegrableSaturator<S, T> {
        return static_cast<T>(inner.antiderivative(drive_ * x)) / (drive_ * drive_);
    }

    [[nodiscard]] T antiderivative2(T x) const noexcept
        requires TwiceIntegrableSaturator<S, T> {
        return static_cast<T>(inner.antiderivative2(drive_ * x)) / (drive_ * drive_ * drive_);
    }

private:
    T drive_ = T(1);
};

// =============================================================================
// Blend
// =============================================================================

/// @brief Crossfade between the identity and a saturator.
///
/// amount = 0 is linear, amount = 1 is fully saturated.
template<SampleType T, typename S>
struct Blend {
    S inner{};
    T amount = T(1);

    [[nodiscard]] T evaluate(T x) const noexcept {
        return (T(1) - amount) * x + amount * static_cast<T>(inner.evaluate(x));
    }

    [[nodiscard]] T derivative(T x) const noexcept
        requires DifferentiableSaturator<S, T> {
        return (T(1) - amount) + amount * static_cast<T>(inner.derivative(x));
    }

    [[nodiscard]] T antiderivative(T x) const noexcept
        requires IntegrableSaturator<S, T> {
        return (T(1) - amount) * T(0.5) * x * x
             + amount * static_cast<T>(inner.antiderivative(x));
    }

    [[nodiscard]] T antiderivative2(T x) const noexcept
        requires TwiceIntegrableSaturator<S, T> {
        return (T(1) - amount) * x * x * x / T(6)
             + amount * static_cast<T>(inner.antiderivative2(x));
    }
};

} // namespace DSP
} // namespace Volta
