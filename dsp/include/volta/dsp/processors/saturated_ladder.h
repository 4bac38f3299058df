// ==============================================================================
// Layer 2: DSP Processor - Saturated Ladder
// ==============================================================================
// 4-pole ladder whose nonlinearity sits inside the stages instead of on the
// resonance feedback. Each stage is a one-pole lowpass
//
//   s_i += a (in_i - s_i),   a = 2g / (1 + g),   g = tan(pi fc / fs)
//
// with the input u = x - k s_4 taken from the previous sample, so no stage
// sees a delay-free loop and nothing is solved iteratively. Two topologies
// place the saturators differently:
//
//   Ota        - s_i += a sat_i(in_i - s_i)
//                Transconductance amplifiers saturate the difference current
//                of each stage (4 saturators).
//   Transistor - s_i += a (sat(in_i) - sat_i(s_i))
//                Each differential transistor pair saturates its two inputs
//                separately; the input pair has its own saturator (5 in
//                all). The Huovilainen Moog model is this topology with tanh.
//
// With unit-slope saturators both reduce to the same linear cascade, which
// frequencyResponse() reports.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include <volta/dsp/core/db_utils.h>
#include <volta/dsp/core/math_constants.h>
#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/saturators.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>

namespace Volta {
namespace DSP {

/// @brief Where the stage saturators sit in a SaturatedLadder.
enum class LadderTopology : uint8_t {
    Ota,        ///< Saturated difference per stage
    Transistor  ///< Saturated input and state per stage
};

/// @brief Ladder lowpass with a saturator in every stage.
///
/// @tparam Sat Stage saturator; Tanh<T> gives the OTA and transistor
///             classics, Linear<T> the ideal cascade
///
/// @par Thread Safety
/// NOT thread-safe. Parameter changes go through ParameterBinding.
///
/// @code
/// SaturatedLadder<float> ladder;
/// ladder.prepare(48000.0, 256);
/// ladder.setTopology(LadderTopology::Transistor);
/// ladder.setCutoff(800.0f);
/// ladder.setResonance(3.5f);
/// ladder.processBlock(buffer, 256);
/// @endcode
template<SampleType T, typename Sat = Tanh<T>>
class SaturatedLadder {
public:
    static_assert(Saturator<Sat, T>, "SaturatedLadder requires a saturator");

    using Sample = T;

    static constexpr size_t kNumStages = 4;

    /// Four stage saturators plus the transistor topology's input pair
    static constexpr size_t kNumSaturators = kNumStages + 1;

    static constexpr double kMinCutoff = 20.0;
    static constexpr double kMaxCutoffRatio = 0.45;
    static constexpr double kMinResonance = 0.0;

    /// Self-oscillation threshold; the stage saturators bound the amplitude
    static constexpr double kMaxResonance = 4.0;

    static constexpr double kMinDriveDb = 0.0;
    static constexpr double kMaxDriveDb = 24.0;

    static constexpr int kMinSlope = 1;
    static constexpr int kMaxSlope = 4;

    enum ParameterId : uint32_t { kCutoffId = 0, kResonanceId, kDriveId, kSlopeId, kTopologyId };

    static constexpr ParameterTable<5> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kResonanceId, "resonance", "", kMinResonance, kMaxResonance, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Exponential, 10.0f},
        {kDriveId, "drive", "dB", kMinDriveDb, kMaxDriveDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Linear, 20.0f},
        {kSlopeId, "slope", "poles", 1.0, 4.0, 4.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
        {kTopologyId, "topology", "", 0.0, 1.0, 0.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    // =========================================================================
    // Lifecycle
    // =========================================================================

    SaturatedLadder() noexcept = default;

    explicit SaturatedLadder(Sat saturator) noexcept { setSaturator(saturator); }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "SaturatedLadder");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        updateCoefficient();
        reset();
    }

    void reset() noexcept {
        state_.fill(T(0));
        for (size_t i = 0; i < kNumStages; ++i) {
            saturatedState_[i] = static_cast<T>(saturators_[i].evaluate(T(0)));
        }
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Switching topology keeps the stage states
    void setTopology(LadderTopology topology) noexcept {
        topology_ = topology;
        for (size_t i = 0; i < kNumStages; ++i) {
            saturatedState_[i] = static_cast<T>(saturators_[i].evaluate(state_[i]));
        }
    }

    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateCoefficient();
    }

    /// Feedback amount k, clamped to [0, 4]
    void setResonance(T k) noexcept {
        if (!std::isfinite(k)) return;
        resonance_ = std::clamp(static_cast<double>(k), kMinResonance, kMaxResonance);
    }

    /// Input gain in dB, clamped to [0, 24]
    void setDrive(T db) noexcept {
        if (!std::isfinite(db)) return;
        driveDb_ = std::clamp(static_cast<double>(db), kMinDriveDb, kMaxDriveDb);
        driveGain_ = static_cast<T>(dbToGain(driveDb_));
    }

    /// Number of poles in the output (1-4)
    void setSlope(int poles) noexcept { slope_ = std::clamp(poles, kMinSlope, kMaxSlope); }

    /// Scale the output by (1 + k) to restore passband level at high resonance
    void setResonanceCompensation(bool enabled) noexcept { compensate_ = enabled; }

    /// Same saturator in every position
    void setSaturator(const Sat& saturator) noexcept {
        saturators_.fill(saturator);
        setTopology(topology_);
    }

    /// @param index 0-3 for the stages, 4 for the transistor input pair
    void setStageSaturator(size_t index, const Sat& saturator) noexcept {
        if (index >= kNumSaturators) return;
        saturators_[index] = saturator;
        setTopology(topology_);
    }

    [[nodiscard]] LadderTopology getTopology() const noexcept { return topology_; }
    [[nodiscard]] T getCutoff() const noexcept { return static_cast<T>(clampedCutoff()); }
    [[nodiscard]] T getResonance() const noexcept { return static_cast<T>(resonance_); }
    [[nodiscard]] T getDrive() const noexcept { return static_cast<T>(driveDb_); }
    [[nodiscard]] int getSlope() const noexcept { return slope_; }
    [[nodiscard]] bool isResonanceCompensationEnabled() const noexcept { return compensate_; }
    [[nodiscard]] const Sat& getStageSaturator(size_t index) const noexcept {
        return saturators_[std::min(index, kNumSaturators - 1)];
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kCutoffId:    setCutoff(static_cast<T>(v)); break;
            case kResonanceId: setResonance(static_cast<T>(v)); break;
            case kDriveId:     setDrive(static_cast<T>(v)); break;
            case kSlopeId:     setSlope(static_cast<int>(std::lround(v))); break;
            case kTopologyId:
                setTopology(std::lround(v) == 0 ? LadderTopology::Ota : LadderTopology::Transistor);
                break;
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kCutoffId:    return cutoff_;
            case kResonanceId: return resonance_;
            case kDriveId:     return driveDb_;
            case kSlopeId:     return static_cast<double>(slope_);
            case kTopologyId:  return topology_ == LadderTopology::Ota ? 0.0 : 1.0;
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] T process(T input) noexcept {
        const T u = driveGain_ * input - static_cast<T>(resonance_) * state_[kNumStages - 1];

        if (topology_ == LadderTopology::Ota) {
            for (size_t i = 0; i < kNumStages; ++i) {
                const T stageInput = (i == 0) ? u : state_[i - 1];
                const T current = static_cast<T>(saturators_[i].evaluate(stageInput - state_[i]));
                state_[i] = flushDenormal(state_[i] + a_ * current);
            }
        } else {
            T drive = static_cast<T>(saturators_[kNumStages].evaluate(u));
            for (size_t i = 0; i < kNumStages; ++i) {
                state_[i] = flushDenormal(state_[i] + a_ * (drive - saturatedState_[i]));
                saturatedState_[i] = static_cast<T>(saturators_[i].evaluate(state_[i]));
                drive = saturatedState_[i];
            }
        }

        if (!std::isfinite(state_[kNumStages - 1])) {
            reset();
            return T(0);
        }

        const T out = state_[static_cast<size_t>(slope_ - 1)];
        return compensate_ ? out * static_cast<T>(1.0 + resonance_) : out;
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    [[nodiscard]] const std::array<T, kNumStages>& getState() const noexcept { return state_; }

    /// @brief Response of the cascade linearized around zero.
    ///
    /// Each saturator is replaced by its slope at the origin, so stage i is
    ///   P_i(z) = a sigma_in z / (z - 1 + a sigma_i)
    /// and the loop closes through the one-sample-delayed last stage.
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        const std::complex<double> z = std::conj(unitDelayAt(hz, sampleRate_));
        const double a = static_cast<double>(a_);

        std::array<double, kNumSaturators> sigma{};
        for (size_t i = 0; i < kNumSaturators; ++i) {
            sigma[i] = static_cast<double>(slopeAtOrigin<T>(saturators_[i]));
        }

        std::array<std::complex<double>, kNumStages> chain{};
        std::complex<double> product{1.0, 0.0};
        for (size_t i = 0; i < kNumStages; ++i) {
            double inputSlope = sigma[i];
            if (topology_ == LadderTopology::Transistor) {
                inputSlope = (i == 0) ? sigma[kNumStages] : sigma[i - 1];
            }
            product *= a * inputSlope * z / (z - 1.0 + a * sigma[i]);
            chain[i] = product;
        }

        const std::complex<double> loop = 1.0 + resonance_ * chain[kNumStages - 1] / z;
        double gain = static_cast<double>(driveGain_);
        if (compensate_) gain *= 1.0 + resonance_;
        return FrequencyResponse::fromComplex(gain * chain[static_cast<size_t>(slope_ - 1)] / loop);
    }

private:
    [[nodiscard]] double clampedCutoff() const noexcept {
        if (sampleRate_ <= 0.0) return std::max(cutoff_, kMinCutoff);
        return std::clamp(cutoff_, kMinCutoff, kMaxCutoffRatio * sampleRate_);
    }

    void updateCoefficient() noexcept {
        if (sampleRate_ <= 0.0) return;
        const double g = std::tan(kPi<double> * clampedCutoff() / sampleRate_);
        a_ = static_cast<T>(2.0 * g / (1.0 + g));
    }

    std::array<Sat, kNumSaturators> saturators_{};
    std::array<T, kNumStages> state_{};
    std::array<T, kNumStages> saturatedState_{};
    LadderTopology topology_ = LadderTopology::Ota;
    T a_ = T(0);
    double cutoff_ = 1000.0;
    double resonance_ = 0.0;
    double driveDb_ = 0.0;
    T driveGain_ = T(1);
    int slope_ = 4;
    bool compensate_ = false;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
