// ==============================================================================
// Layer 2: DSP Processor - Waveshaper
// ==============================================================================
// Memoryless saturation stage: input drive, a saturator, output gain.
//
//   y = outputGain * sat(drive * x)
//
// For saturators that expose an antiderivative, first-order ADAA can be
// switched on to suppress aliasing without oversampling. ADAA adds half a
// sample of group delay, which is not reported as latency.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include <volta/dsp/core/db_utils.h>
#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/adaa.h>
#include <volta/dsp/primitives/saturators.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace Volta {
namespace DSP {

/// @brief Drive -> saturator -> output gain, with optional first-order ADAA.
///
/// @tparam Sat Any saturator; ADAA is only available when it is integrable
///
/// @par Usage Example
/// @code
/// Waveshaper<float, Tanh<float>> shaper;
/// shaper.prepare(48000.0, 256);
/// shaper.setDrive(18.0f);        // dB
/// shaper.setOutputGain(-12.0f);  // dB
/// shaper.setAdaaEnabled(true);
/// shaper.processBlock(buffer, 256);
/// @endcode
template<SampleType T, typename Sat = Tanh<T>>
class Waveshaper {
public:
    static_assert(Saturator<Sat, T>, "Waveshaper requires a saturator");

    using Sample = T;

    static constexpr bool kSupportsAdaa = IntegrableSaturator<Sat, T>;

    static constexpr double kMinDriveDb = -24.0;
    static constexpr double kMaxDriveDb = 48.0;
    static constexpr double kMinOutputDb = -48.0;
    static constexpr double kMaxOutputDb = 12.0;

    enum ParameterId : uint32_t { kDriveId = 0, kOutputId, kAdaaId };

    static constexpr ParameterTable<3> kParameters{{
        {kDriveId, "drive", "dB", kMinDriveDb, kMaxDriveDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Exponential, 20.0f},
        {kOutputId, "output", "dB", kMinOutputDb, kMaxOutputDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Exponential, 20.0f},
        {kAdaaId, "adaa", "", 0.0, 1.0, 1.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    Waveshaper() noexcept = default;

    explicit Waveshaper(Sat saturator) noexcept
        : saturator_(saturator) {
        syncAdaa();
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "Waveshaper");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        reset();
    }

    void reset() noexcept {
        if constexpr (kSupportsAdaa) {
            adaa_.reset();
        }
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Input gain in dB
    void setDrive(T db) noexcept {
        if (!std::isfinite(db)) return;
        driveDb_ = std::clamp(static_cast<double>(db), kMinDriveDb, kMaxDriveDb);
        drive_ = static_cast<T>(dbToGain(driveDb_));
    }

    /// Output gain in dB
    void setOutputGain(T db) noexcept {
        if (!std::isfinite(db)) return;
        outputDb_ = std::clamp(static_cast<double>(db), kMinOutputDb, kMaxOutputDb);
        output_ = static_cast<T>(dbToGain(outputDb_));
    }

    /// Ignored for saturators without an antiderivative
    void setAdaaEnabled(bool enabled) noexcept {
        const bool next = enabled && kSupportsAdaa;
        if (next != adaaEnabled_) {
            adaaEnabled_ = next;
            reset();
        }
    }

    void setSaturator(const Sat& saturator) noexcept {
        saturator_ = saturator;
        syncAdaa();
    }

    [[nodiscard]] T getDrive() const noexcept { return static_cast<T>(driveDb_); }
    [[nodiscard]] T getOutputGain() const noexcept { return static_cast<T>(outputDb_); }
    [[nodiscard]] bool isAdaaEnabled() const noexcept { return adaaEnabled_; }
    [[nodiscard]] const Sat& getSaturator() const noexcept { return saturator_; }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kDriveId:  setDrive(static_cast<T>(v)); break;
            case kOutputId: setOutputGain(static_cast<T>(v)); break;
            case kAdaaId:   setAdaaEnabled(v >= 0.5); break;
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kDriveId:  return driveDb_;
            case kOutputId: return outputDb_;
            case kAdaaId:   return adaaEnabled_ ? 1.0 : 0.0;
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] T process(T input) noexcept {
        const T x = drive_ * input;
        T y;
        if constexpr (kSupportsAdaa) {
            y = adaaEnabled_ ? adaa_.process(x) : static_cast<T>(saturator_.evaluate(x));
        } else {
            y = static_cast<T>(saturator_.evaluate(x));
        }
        if (!std::isfinite(y)) {
            y = T(0);
        }
        return output_ * y;
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Small-signal gain: output * drive * sat'(0), zero phase
    [[nodiscard]] FrequencyResponse frequencyResponse(double) const noexcept {
        const double slope = static_cast<double>(slopeAtOrigin<T>(saturator_));
        const double gain = static_cast<double>(output_) * static_cast<double>(drive_) * slope;
        return FrequencyResponse::fromComplex({gain, 0.0});
    }

private:
    void syncAdaa() noexcept {
        if constexpr (kSupportsAdaa) {
            adaa_.setSaturator(saturator_);
        }
    }

    struct NoAdaa {};
    using AdaaState = std::conditional_t<kSupportsAdaa, FirstOrderADAA<T, Sat>, NoAdaa>;

    Sat saturator_{};
    [[no_unique_address]] AdaaState adaa_{};
    double driveDb_ = 0.0;
    double outputDb_ = 0.0;
    T drive_ = T(1);
    T output_ = T(1);
    bool adaaEnabled_ = kSupportsAdaa;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
