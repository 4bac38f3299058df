// ==============================================================================
// Layer 1: DSP Primitive - Slew Limiter
// ==============================================================================
// Audio-rate slew-rate distortion: the output follows the input but may move
// at most riseRate / fs up and fallRate / fs down per sample.
//
//   y[n] = y[n-1] + clamp(x[n] - y[n-1], -fall / fs, rise / fs)
//
// This is the saturation of an op-amp output stage that cannot swing faster
// than its slew rate. Small or slow signals pass unchanged; loud high
// frequencies turn into triangles. Unlike the memoryless saturators it keeps
// the previous output as state.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Volta {
namespace DSP {

/// @brief Rate-limited follower with separate rise and fall rates.
///
/// Rates are in signal units per second and are converted to per-sample
/// steps in prepare().
///
/// @code
/// SlewLimiter<float> slew;
/// slew.prepare(48000.0, 256);
/// slew.setRate(2000.0f);  // at most 2000 units/s in either direction
/// slew.processBlock(buffer, 256);
/// @endcode
template<SampleType T>
class SlewLimiter {
public:
    using Sample = T;

    static constexpr double kMinRate = 1.0;
    static constexpr double kMaxRate = 1e7;
    static constexpr double kDefaultRate = 10000.0;

    /// Below this distance to the target the output counts as settled
    static constexpr T kSettledThreshold = static_cast<T>(1e-6);

    enum ParameterId : uint32_t { kRiseId = 0, kFallId };

    static constexpr ParameterTable<2> kParameters{{
        {kRiseId, "rise", "1/s", kMinRate, kMaxRate, kDefaultRate,
         ParameterScale::Logarithmic, SmoothingPolicy::None, 0.0f},
        {kFallId, "fall", "1/s", kMinRate, kMaxRate, kDefaultRate,
         ParameterScale::Logarithmic, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "SlewLimiter");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        updateSteps();
        reset();
    }

    void reset() noexcept { current_ = T(0); }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Maximum upward rate (units/s)
    void setRiseRate(T unitsPerSecond) noexcept {
        if (!std::isfinite(unitsPerSecond)) return;
        riseRate_ = std::clamp(static_cast<double>(unitsPerSecond), kMinRate, kMaxRate);
        updateSteps();
    }

    /// Maximum downward rate (units/s)
    void setFallRate(T unitsPerSecond) noexcept {
        if (!std::isfinite(unitsPerSecond)) return;
        fallRate_ = std::clamp(static_cast<double>(unitsPerSecond), kMinRate, kMaxRate);
        updateSteps();
    }

    /// Same rate in both directions
    void setRate(T unitsPerSecond) noexcept {
        setRiseRate(unitsPerSecond);
        setFallRate(unitsPerSecond);
    }

    /// Start from a given output instead of zero
    void setCurrentValue(T value) noexcept {
        if (std::isfinite(value)) current_ = value;
    }

    [[nodiscard]] T getRiseRate() const noexcept { return static_cast<T>(riseRate_); }
    [[nodiscard]] T getFallRate() const noexcept { return static_cast<T>(fallRate_); }
    [[nodiscard]] T getCurrentValue() const noexcept { return current_; }

    /// True when the output is being rate-limited on its way to target
    [[nodiscard]] bool isChanging(T target) const noexcept {
        return std::abs(target - current_) > kSettledThreshold;
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kRiseId: setRiseRate(static_cast<T>(v)); break;
            case kFallId: setFallRate(static_cast<T>(v)); break;
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kRiseId: return riseRate_;
            case kFallId: return fallRate_;
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Non-finite input holds the previous output
    [[nodiscard]] T process(T input) noexcept {
        if (!std::isfinite(input)) {
            return current_;
        }
        const T delta = std::clamp(input - current_, -fallStep_, riseStep_);
        current_ = flushDenormal(current_ + delta);
        return current_;
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Signals below the slew limit pass unchanged
    [[nodiscard]] FrequencyResponse frequencyResponse(double) const noexcept {
        return FrequencyResponse::fromComplex({1.0, 0.0});
    }

private:
    void updateSteps() noexcept {
        if (sampleRate_ <= 0.0) return;
        riseStep_ = static_cast<T>(riseRate_ / sampleRate_);
        fallStep_ = static_cast<T>(fallRate_ / sampleRate_);
    }

    double riseRate_ = kDefaultRate;
    double fallRate_ = kDefaultRate;
    T riseStep_ = static_cast<T>(kDefaultRate / 44100.0);
    T fallStep_ = static_cast<T>(kDefaultRate / 44100.0);
    T current_ = T(0);
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
