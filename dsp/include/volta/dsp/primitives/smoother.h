// ==============================================================================
// Layer 1: DSP Primitive - Parameter Smoother
// ==============================================================================
// Real-time safe interpolation of control-rate values so parameter changes do
// not produce audible steps.
// - OnePoleSmoother: exponential approach
// - LinearRamp: constant-rate ramp over a fixed time
// - SmoothedValue: runtime choice between the two (or none), driven by a
//   parameter's SmoothingPolicy
//
// Design Rules:
// - Real-Time Safety (noexcept, zero allocations in process)
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/sample_traits.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Volta {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Default smoothing time in milliseconds
inline constexpr float kDefaultSmoothingTimeMs = 5.0f;

/// Minimum allowed smoothing time in milliseconds
inline constexpr float kMinSmoothingTimeMs = 0.1f;

/// Maximum allowed smoothing time in milliseconds
inline constexpr float kMaxSmoothingTimeMs = 1000.0f;

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief One-pole coefficient for a given time to reach 99% of the target.
///
/// Time to 99% is about 5 time constants, so coeff = exp(-5 / (t * fs)).
template<SampleType T>
[[nodiscard]] inline T onePoleCoefficient(float smoothTimeMs, double sampleRate) noexcept {
    const double t = std::clamp(static_cast<double>(smoothTimeMs),
                                static_cast<double>(kMinSmoothingTimeMs),
                                static_cast<double>(kMaxSmoothingTimeMs));
    const double fs = (sampleRate > 0.0) ? sampleRate : 44100.0;
    return static_cast<T>(std::exp(-5000.0 / (t * fs)));
}

// =============================================================================
// OnePoleSmoother
// =============================================================================

/// @brief Exponential smoothing: y = target + coeff * (y - target).
template<SampleType T>
class OnePoleSmoother {
public:
    OnePoleSmoother() noexcept {
        coefficient_ = onePoleCoefficient<T>(timeMs_, sampleRate_);
    }

    explicit OnePoleSmoother(T initialValue) noexcept
        : current_(initialValue)
        , target_(initialValue) {
        coefficient_ = onePoleCoefficient<T>(timeMs_, sampleRate_);
    }

    /// @param smoothTimeMs Time to reach 99% of a step (ms)
    /// @param sampleRate Rate at which process() is called
    void configure(float smoothTimeMs, double sampleRate) noexcept {
        timeMs_ = smoothTimeMs;
        sampleRate_ = sampleRate;
        coefficient_ = onePoleCoefficient<T>(timeMs_, sampleRate_);
    }

    /// NaN targets are ignored
    void setTarget(T target) noexcept {
        if (!std::isnan(target)) {
            target_ = target;
        }
    }

    [[nodiscard]] T getTarget() const noexcept { return target_; }
    [[nodiscard]] T getCurrentValue() const noexcept { return current_; }

    [[nodiscard]] T process() noexcept {
        if (isComplete()) {
            current_ = target_;
            return current_;
        }
        current_ = flushDenormal(target_ + coefficient_ * (current_ - target_));
        return current_;
    }

    [[nodiscard]] bool isComplete() const noexcept {
        return std::abs(current_ - target_) <= completionThreshold();
    }

    /// Jump both current and target to value
    void snapTo(T value) noexcept {
        if (std::isnan(value)) return;
        current_ = value;
        target_ = value;
    }

    void snapToTarget() noexcept { current_ = target_; }

    void reset() noexcept {
        current_ = T(0);
        target_ = T(0);
    }

private:
    /// Relative threshold so Hz-scale and unit-scale values settle alike
    [[nodiscard]] T completionThreshold() const noexcept {
        return std::max(static_cast<T>(1e-4), std::abs(target_) * static_cast<T>(1e-6));
    }

    T coefficient_ = T(0);
    T current_ = T(0);
    T target_ = T(0);
    float timeMs_ = kDefaultSmoothingTimeMs;
    double sampleRate_ = 44100.0;
};

// =============================================================================
// LinearRamp
// =============================================================================

/// @brief Constant-rate ramp: every target change completes in rampTimeMs.
template<SampleType T>
class LinearRamp {
public:
    LinearRamp() noexcept = default;

    explicit LinearRamp(T initialValue) noexcept
        : current_(initialValue)
        , target_(initialValue) {}

    void configure(float rampTimeMs, double sampleRate) noexcept {
        rampTimeMs_ = rampTimeMs;
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 44100.0;
        if (current_ != target_) {
            increment_ = calculateIncrement(target_ - current_);
        }
    }

    void setTarget(T target) noexcept {
        if (std::isnan(target)) return;
        target_ = target;
        increment_ = calculateIncrement(target_ - current_);
    }

    [[nodiscard]] T getTarget() const noexcept { return target_; }
    [[nodiscard]] T getCurrentValue() const noexcept { return current_; }

    [[nodiscard]] T process() noexcept {
        if (current_ == target_) {
            return current_;
        }
        current_ += increment_;
        if ((increment_ > T(0) && current_ > target_) ||
            (increment_ < T(0) && current_ < target_)) {
            current_ = target_;
        }
        return current_;
    }

    [[nodiscard]] bool isComplete() const noexcept { return current_ == target_; }

    void snapTo(T value) noexcept {
        if (std::isnan(value)) return;
        current_ = value;
        target_ = value;
        increment_ = T(0);
    }

    void snapToTarget() noexcept {
        current_ = target_;
        increment_ = T(0);
    }

    void reset() noexcept {
        current_ = T(0);
        target_ = T(0);
        increment_ = T(0);
    }

private:
    [[nodiscard]] T calculateIncrement(T delta) const noexcept {
        const double numSamples = static_cast<double>(rampTimeMs_) * 0.001 * sampleRate_;
        if (numSamples < 1.0) {
            return delta;
        }
        return static_cast<T>(static_cast<double>(delta) / numSamples);
    }

    T increment_ = T(0);
    T current_ = T(0);
    T target_ = T(0);
    float rampTimeMs_ = kDefaultSmoothingTimeMs;
    double sampleRate_ = 44100.0;
};

// =============================================================================
// SmoothedValue
// =============================================================================

/// @brief Smoother whose behavior follows a parameter's SmoothingPolicy.
template<SampleType T>
class SmoothedValue {
public:
    void configure(SmoothingPolicy policy, float timeMs, double sampleRate) noexcept {
        policy_ = policy;
        onePole_.configure(timeMs, sampleRate);
        ramp_.configure(timeMs, sampleRate);
    }

    void setTarget(T target) noexcept {
        switch (policy_) {
            case SmoothingPolicy::None:
                onePole_.snapTo(target);
                ramp_.snapTo(target);
                break;
            case SmoothingPolicy::Exponential:
                onePole_.setTarget(target);
                break;
            case SmoothingPolicy::Linear:
                ramp_.setTarget(target);
                break;
        }
    }

    [[nodiscard]] T process() noexcept {
        switch (policy_) {
            case SmoothingPolicy::Exponential: return onePole_.process();
            case SmoothingPolicy::Linear:      return ramp_.process();
            case SmoothingPolicy::None:        break;
        }
        return onePole_.getCurrentValue();
    }

    [[nodiscard]] T getCurrentValue() const noexcept {
        return (policy_ == SmoothingPolicy::Linear) ? ramp_.getCurrentValue()
                                                    : onePole_.getCurrentValue();
    }

    [[nodiscard]] T getTarget() const noexcept {
        return (policy_ == SmoothingPolicy::Linear) ? ramp_.getTarget()
                                                    : onePole_.getTarget();
    }

    [[nodiscard]] bool isComplete() const noexcept {
        return (policy_ == SmoothingPolicy::Linear) ? ramp_.isComplete()
                                                    : onePole_.isComplete();
    }

    void snapTo(T value) noexcept {
        onePole_.snapTo(value);
        ramp_.snapTo(value);
    }

    [[nodiscard]] SmoothingPolicy getPolicy() const noexcept { return policy_; }

private:
    SmoothingPolicy policy_ = SmoothingPolicy::Exponential;
    OnePoleSmoother<T> onePole_{};
    LinearRamp<T> ramp_{};
};

} // namespace DSP
} // namespace Volta
