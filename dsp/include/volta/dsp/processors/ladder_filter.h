// ==============================================================================
// Layer 2: DSP Processor - Ladder Filter
// ==============================================================================
// 4-pole Moog-style lowpass built from trapezoidal one-pole stages, with a
// saturator on the global resonance feedback.
//
// Each stage, with G = g / (1 + g) and g = tan(pi fc / fs):
//   y_i = G x_i + (1 - G) s_i,   s_i' = 2 y_i - s_i
// The feedback u = x - k sat(y4) closes a delay-free loop. Expanding the
// cascade gives the node equation
//   y4 = G^4 u + sum_i G^(4-i) (1 - G) s_i - k G^4 sat(y4)
// solved per sample by NonlinearStateSpace.
//
// Self-oscillation threshold of the linear model is k = 4; resonance is
// limited to [0, 4).
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 2 (depends on Layer 0-1 and state_space.h)
// ==============================================================================

#pragma once

#include <volta/dsp/core/db_utils.h>
#include <volta/dsp/core/math_constants.h>
#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/saturators.h>
#include <volta/dsp/processors/state_space.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>

namespace Volta {
namespace DSP {

/// @brief Moog-style 4-pole resonant lowpass ladder filter.
///
/// - Variable slope: 1-4 poles (6-24 dB/octave), selects the stage output
/// - Resonance k in [0, 4)
/// - Drive: 0-24 dB input gain
/// - Optional passband compensation: output scaled by (1 + k)
///
/// @tparam Sat Feedback saturator; Tanh<T> gives the classic transistor
///             ladder behavior, Linear<T> the Stilson/Smith linear model
///
/// @par Thread Safety
/// NOT thread-safe. Parameter changes go through ParameterBinding.
///
/// @code
/// LadderFilter<float, Tanh<float>> filter;
/// filter.prepare(44100.0, 512);
/// filter.setCutoff(1000.0f);
/// filter.setResonance(2.0f);
/// float output = filter.process(input);
/// @endcode
template<SampleType T, typename Sat = Tanh<T>>
class LadderFilter {
public:
    using Sample = T;
    using Engine = NonlinearStateSpace<T, 4, 4, Sat>;

    // =========================================================================
    // Constants
    // =========================================================================

    /// Minimum cutoff frequency (Hz)
    static constexpr double kMinCutoff = 20.0;

    /// Maximum cutoff as ratio of sample rate
    static constexpr double kMaxCutoffRatio = 0.45;

    static constexpr double kMinResonance = 0.0;

    /// Just below the self-oscillation threshold k = 4
    static constexpr double kMaxResonance = 3.99;

    static constexpr double kMinDriveDb = 0.0;
    static constexpr double kMaxDriveDb = 24.0;

    static constexpr int kMinSlope = 1;
    static constexpr int kMaxSlope = 4;

    enum ParameterId : uint32_t { kCutoffId = 0, kResonanceId, kDriveId, kSlopeId };

    static constexpr ParameterTable<4> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kResonanceId, "resonance", "", kMinResonance, kMaxResonance, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Exponential, 10.0f},
        {kDriveId, "drive", "dB", kMinDriveDb, kMaxDriveDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Linear, 20.0f},
        {kSlopeId, "slope", "poles", 1.0, 4.0, 4.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    // =========================================================================
    // Lifecycle
    // =========================================================================

    LadderFilter() noexcept = default;

    explicit LadderFilter(Sat saturator) noexcept {
        engine_.setSaturator(saturator);
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "LadderFilter");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        updateModel();
        reset();
    }

    void reset() noexcept { engine_.reset(); }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateModel();
    }

    /// Resonance amount k, clamped to [0, 4)
    void setResonance(T k) noexcept {
        if (!std::isfinite(k)) return;
        resonance_ = std::clamp(static_cast<double>(k), kMinResonance, kMaxResonance);
        updateModel();
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

    void setSaturator(const Sat& saturator) noexcept { engine_.setSaturator(saturator); }
    void setSolveMode(FeedbackSolveMode mode) noexcept { engine_.setSolveMode(mode); }
    void setSolverSettings(const SolverSettings<T>& settings) noexcept { engine_.setSolverSettings(settings); }

    [[nodiscard]] T getCutoff() const noexcept { return static_cast<T>(clampedCutoff()); }
    [[nodiscard]] T getResonance() const noexcept { return static_cast<T>(resonance_); }
    [[nodiscard]] T getDrive() const noexcept { return static_cast<T>(driveDb_); }
    [[nodiscard]] int getSlope() const noexcept { return slope_; }
    [[nodiscard]] bool isResonanceCompensationEnabled() const noexcept { return compensate_; }
    [[nodiscard]] FeedbackSolveMode getSolveMode() const noexcept { return engine_.getSolveMode(); }
    [[nodiscard]] const SolverResult<T>& getLastSolve() const noexcept { return engine_.getLastSolve(); }

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
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kCutoffId:    return cutoff_;
            case kResonanceId: return resonance_;
            case kDriveId:     return driveDb_;
            case kSlopeId:     return static_cast<double>(slope_);
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] T process(T input) noexcept {
        const auto stages = engine_.processMulti(driveGain_ * input);
        const T out = stages[static_cast<size_t>(slope_ - 1)];
        return compensate_ ? out * static_cast<T>(1.0 + resonance_) : out;
    }

    /// All four stage outputs of one step (no compensation applied)
    [[nodiscard]] std::array<T, 4> processStages(T input) noexcept {
        return engine_.processMulti(driveGain_ * input);
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Linearized response of the selected slope, drive and compensation included
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        const std::complex<double> z = std::conj(unitDelayAt(hz, sampleRate_));
        const auto h = engine_.transferFunction(z);
        double gain = static_cast<double>(driveGain_);
        if (compensate_) gain *= 1.0 + resonance_;
        return FrequencyResponse::fromComplex(gain * h[static_cast<size_t>(slope_ - 1)]);
    }

    [[nodiscard]] const Engine& engine() const noexcept { return engine_; }

private:
    [[nodiscard]] double clampedCutoff() const noexcept {
        if (sampleRate_ <= 0.0) return std::max(cutoff_, kMinCutoff);
        return std::clamp(cutoff_, kMinCutoff, kMaxCutoffRatio * sampleRate_);
    }

    void updateModel() noexcept {
        if (sampleRate_ <= 0.0) return;

        const double g = std::tan(kPi<double> * clampedCutoff() / sampleRate_);
        const double G = g / (1.0 + g);
        const double k = resonance_;

        // Stage outputs y_i = C_i.s + D_i.u + E_i.n, built front to back
        double c[4][4] = {};
        double d[4] = {};
        double e[4] = {};
        c[0][0] = 1.0 - G;
        d[0] = G;
        e[0] = -G * k;
        for (size_t i = 1; i < 4; ++i) {
            for (size_t j = 0; j < 4; ++j) {
                c[i][j] = G * c[i - 1][j];
            }
            c[i][i] += 1.0 - G;
            d[i] = G * d[i - 1];
            e[i] = G * e[i - 1];
        }

        typename Engine::Model m{};
        for (size_t i = 0; i < 4; ++i) {
            for (size_t j = 0; j < 4; ++j) {
                m.C[i][j] = static_cast<T>(c[i][j]);
                m.A[i][j] = static_cast<T>(2.0 * c[i][j] - (i == j ? 1.0 : 0.0));
            }
            m.D[i] = static_cast<T>(d[i]);
            m.E[i] = static_cast<T>(e[i]);
            m.B[i] = static_cast<T>(2.0 * d[i]);
            m.F[i] = static_cast<T>(2.0 * e[i]);
            m.P[i] = static_cast<T>(c[3][i]);
        }
        m.Q = static_cast<T>(d[3]);
        m.H = static_cast<T>(-e[3]);

        engine_.setModel(m);
    }

    Engine engine_{};
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
