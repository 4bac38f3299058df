// ==============================================================================
// Layer 1: DSP Primitive - Antiderivative Anti-Aliasing
// ==============================================================================
// Antiderivative anti-aliasing for any saturator that exposes its
// antiderivative. First order replaces f(x[n]) by the mean of f over the
// segment between consecutive inputs:
//
//   y[n] = (F(x[n]) - F(x[n-1])) / (x[n] - x[n-1])   if |x[n] - x[n-1]| > eps
//   y[n] = f(x[n])                                    otherwise
//
// eps is SampleTraits<T>::kAdaaEpsilon. The scheme costs one sample of history
// (x[n-1] and F(x[n-1])) and adds half a sample of group delay.
//
// Second order applies the same smoothing twice with the second
// antiderivative F2, over the last three inputs:
//
//   D(a, b) = (F2(a) - F2(b)) / (a - b)
//   y[n]    = 2 (D(x[n], x[n-1]) - D(x[n-1], x[n-2])) / (x[n] - x[n-2])
//
// It suppresses aliasing further at the cost of one full sample of group
// delay and a larger epsilon (kAdaa2Epsilon).
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 1 (depends only on Layer 0 and saturators.h)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/primitives/saturators.h>

#include <cmath>
#include <cstddef>

namespace Volta {
namespace DSP {

// =============================================================================
// FirstOrderADAA Class
// =============================================================================

/// @brief First-order ADAA wrapper around an integrable saturator.
///
/// @tparam T Sample type
/// @tparam S Saturator with evaluate() and antiderivative()
///
/// @par State
/// The previous input and its antiderivative persist across calls. After
/// reset() there is no previous input, and the first sample is evaluated
/// directly.
///
/// @par Usage Example
/// @code
/// FirstOrderADAA<float, Tanh<float>> shaper;
/// for (size_t i = 0; i < n; ++i) {
///     out[i] = shaper.process(in[i] * 4.0f);
/// }
/// @endcode
template<SampleType T, typename S>
class FirstOrderADAA {
public:
    static_assert(IntegrableSaturator<S, T>,
                  "FirstOrderADAA requires a saturator with antiderivative()");

    FirstOrderADAA() noexcept = default;

    explicit FirstOrderADAA(const S& saturator) noexcept
        : saturator_(saturator) {}

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Replace the saturator. History is kept; call reset() for a clean start.
    void setSaturator(const S& saturator) noexcept {
        saturator_ = saturator;
        if (hasPrevious_) {
            prevAntiderivative_ = saturator_.antiderivative(prevInput_);
        }
    }

    [[nodiscard]] const S& getSaturator() const noexcept { return saturator_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Output for x without advancing the history.
    [[nodiscard]] T peek(T x) const noexcept {
        if (!hasPrevious_) {
            return saturator_.evaluate(x);
        }
        const T dx = x - prevInput_;
        if (std::abs(dx) > SampleTraits<T>::kAdaaEpsilon) {
            return (saturator_.antiderivative(x) - prevAntiderivative_) / dx;
        }
        return saturator_.evaluate(x);
    }

    /// @brief Make x the previous input for the next call.
    void commit(T x) noexcept {
        prevInput_ = x;
        prevAntiderivative_ = saturator_.antiderivative(x);
        hasPrevious_ = true;
    }

    /// @brief Process one sample and advance the history.
    [[nodiscard]] T process(T x) noexcept {
        if (!hasPrevious_) {
            commit(x);
            return saturator_.evaluate(x);
        }
        const T dx = x - prevInput_;
        const T fx = saturator_.antiderivative(x);
        T y;
        if (std::abs(dx) > SampleTraits<T>::kAdaaEpsilon) {
            y = (fx - prevAntiderivative_) / dx;
        } else {
            y = saturator_.evaluate(x);
        }
        prevInput_ = x;
        prevAntiderivative_ = fx;
        return y;
    }

    /// @brief Process a block in place, in temporal order.
    void processBlock(T* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// @brief Forget the previous sample; keeps the saturator.
    void reset() noexcept {
        prevInput_ = T(0);
        prevAntiderivative_ = T(0);
        hasPrevious_ = false;
    }

    [[nodiscard]] bool hasHistory() const noexcept { return hasPrevious_; }

private:
    S saturator_{};
    T prevInput_ = T(0);
    T prevAntiderivative_ = T(0);
    bool hasPrevious_ = false;
};

// =============================================================================
// SecondOrderADAA Class
// =============================================================================

/// @brief Second-order ADAA wrapper around a twice-integrable saturator.
///
/// Ill-conditioned steps fall back to expansions around the midpoint:
/// - |a - b| < eps in D(a, b): D = F((a + b) / 2)
/// - |x[n] - x[n-2]| < eps: with m their midpoint and d = m - x[n-1],
///   y = 2 / d (F(m) + (F2(x[n-1]) - F2(m)) / d)
/// - additionally |d| < eps: y = f((m + x[n-1]) / 2)
///
/// @par State
/// The last two inputs and their second antiderivatives persist across
/// calls. The first sample after reset() is evaluated directly and fills
/// both history slots.
template<SampleType T, typename S>
class SecondOrderADAA {
public:
    static_assert(TwiceIntegrableSaturator<S, T>,
                  "SecondOrderADAA requires a saturator with antiderivative2()");

    SecondOrderADAA() noexcept = default;

    explicit SecondOrderADAA(const S& saturator) noexcept
        : saturator_(saturator) {}

    /// Replace the saturator. History is kept; call reset() for a clean start.
    void setSaturator(const S& saturator) noexcept {
        saturator_ = saturator;
        if (hasPrevious_) {
            prevF2_ = saturator_.antiderivative2(prevInput_);
            olderF2_ = saturator_.antiderivative2(olderInput_);
        }
    }

    [[nodiscard]] const S& getSaturator() const noexcept { return saturator_; }

    /// @brief Process one sample and advance the history.
    [[nodiscard]] T process(T x) noexcept {
        const T f2 = saturator_.antiderivative2(x);
        if (!hasPrevious_) {
            prevInput_ = olderInput_ = x;
            prevF2_ = olderF2_ = f2;
            hasPrevious_ = true;
            return saturator_.evaluate(x);
        }

        const T y = smoothed(x, f2);
        olderInput_ = prevInput_;
        olderF2_ = prevF2_;
        prevInput_ = x;
        prevF2_ = f2;
        return y;
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    void reset() noexcept {
        prevInput_ = olderInput_ = T(0);
        prevF2_ = olderF2_ = T(0);
        hasPrevious_ = false;
    }

    [[nodiscard]] bool hasHistory() const noexcept { return hasPrevious_; }

private:
    [[nodiscard]] T smoothed(T x, T f2) const noexcept {
        constexpr T eps = SampleTraits<T>::kAdaa2Epsilon;
        const T span = x - olderInput_;

        if (std::abs(span) < eps) {
            const T mid = T(0.5) * (x + olderInput_);
            const T delta = mid - prevInput_;
            if (std::abs(delta) < eps) {
                return saturator_.evaluate(T(0.5) * (mid + prevInput_));
            }
            return T(2) / delta
                 * (saturator_.antiderivative(mid)
                    + (prevF2_ - saturator_.antiderivative2(mid)) / delta);
        }

        return T(2) * (quotient(x, f2, prevInput_, prevF2_)
                     - quotient(prevInput_, prevF2_, olderInput_, olderF2_)) / span;
    }

    /// (F2(a) - F2(b)) / (a - b), or F at the midpoint when a ~ b
    [[nodiscard]] T quotient(T a, T f2a, T b, T f2b) const noexcept {
        const T d = a - b;
        if (std::abs(d) < SampleTraits<T>::kAdaa2Epsilon) {
            return saturator_.antiderivative(T(0.5) * (a + b));
        }
        return (f2a - f2b) / d;
    }

    S saturator_{};
    T prevInput_ = T(0);
    T olderInput_ = T(0);
    T prevF2_ = T(0);
    T olderF2_ = T(0);
    bool hasPrevious_ = false;
};

} // namespace DSP
} // namespace Volta
