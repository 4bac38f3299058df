// ==============================================================================
// Layer 2: DSP Processor - State Variable Filter
// ==============================================================================
// Topology-preserving (trapezoidal) SVF with a saturator on the band-pass
// damping feedback. All six responses come from one recurrence.
//
// With g = tan(pi fc / fs), R = 1 / (2Q) and n = sat(bp):
//   hp = x - 2R n - lp
//   bp = g hp + s1
//   lp = g bp + s2
//   s1' = 2 bp - s1,  s2' = 2 lp - s2
// Eliminating hp and lp leaves the node equation
//   bp = (s1 - g s2 + g x) / (1 + g^2) - (2Rg / (1 + g^2)) sat(bp)
// which NonlinearStateSpace solves per sample. With the default Linear
// saturator this is the textbook linear TPT SVF.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations in process)
// - Layer 2 (depends on Layer 0-1 and state_space.h)
// ==============================================================================

#pragma once

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

// =============================================================================
// SvfMode / SvfOutputs
// =============================================================================

/// @brief Response selected by SVF::process().
enum class SvfMode : uint8_t {
    Lowpass,   ///< 12 dB/oct lowpass, gain Q at cutoff
    Highpass,  ///< 12 dB/oct highpass
    Bandpass,  ///< Unnormalized bandpass, peak gain Q
    Notch,     ///< lp + hp
    Allpass,   ///< lp + hp - 2R bp
    Peak       ///< lp - hp
};

/// @brief Every response of one SVF step.
template<SampleType T>
struct SvfOutputs {
    T lowpass = T(0);
    T bandpass = T(0);
    T highpass = T(0);
    T notch = T(0);
    T allpass = T(0);
    T peak = T(0);
};

// =============================================================================
// SVF Class
// =============================================================================

/// @brief Nonlinear trapezoidal state variable filter.
///
/// @tparam T   Sample type
/// @tparam Sat Saturator on the damping path (Linear = no saturation)
///
/// @par Stable Region
/// Linear model: any cutoff inside (1 Hz, 0.495 fs) and Q in [0.1, 30].
/// A bounded saturator caps the damping force at 2R, so an input near the
/// cutoff that exceeds that cap makes the resonance grow without limit.
/// Keep the input level below about 2R, or put a clipper after the filter.
/// The Explicit solve mode may also ring at high input levels.
///
/// @par Usage Example
/// @code
/// SVF<float> filter;
/// filter.prepare(48000.0, 512);
/// filter.setMode(SvfMode::Lowpass);
/// filter.setCutoff(1000.0f);
/// filter.setQ(0.707f);
/// filter.processBlock(buffer, 512);
/// @endcode
template<SampleType T, typename Sat = Linear<T>>
class SVF {
public:
    using Sample = T;
    using Engine = NonlinearStateSpace<T, 2, 3, Sat>;

    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr double kMinCutoff = 1.0;
    static constexpr double kMaxCutoffRatio = 0.495;
    static constexpr double kMinQ = 0.1;
    static constexpr double kMaxQ = 30.0;
    static constexpr double kButterworthQ = 0.70710678118654752440;

    enum ParameterId : uint32_t { kCutoffId = 0, kQId = 1, kModeId = 2 };

    static constexpr ParameterTable<3> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kQId, "q", "", kMinQ, kMaxQ, kButterworthQ,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kModeId, "mode", "", 0.0, 5.0, 0.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    // =========================================================================
    // Lifecycle
    // =========================================================================

    SVF() noexcept = default;

    explicit SVF(Sat saturator) noexcept {
        engine_.setSaturator(saturator);
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "SVF");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        updateModel();
        reset();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setMode(SvfMode mode) noexcept { mode_ = mode; }
    [[nodiscard]] SvfMode getMode() const noexcept { return mode_; }

    /// Cutoff in Hz, clamped to (1 Hz, 0.495 fs)
    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateModel();
    }
    [[nodiscard]] T getCutoff() const noexcept { return static_cast<T>(clampedCutoff()); }

    /// Quality factor, clamped to [0.1, 30]
    void setQ(T q) noexcept {
        if (!std::isfinite(q)) return;
        q_ = std::clamp(static_cast<double>(q), kMinQ, kMaxQ);
        updateModel();
    }
    [[nodiscard]] T getQ() const noexcept { return static_cast<T>(q_); }

    void setSaturator(const Sat& saturator) noexcept { engine_.setSaturator(saturator); }
    [[nodiscard]] const Sat& getSaturator() const noexcept { return engine_.getSaturator(); }

    void setSolveMode(FeedbackSolveMode mode) noexcept { engine_.setSolveMode(mode); }
    [[nodiscard]] FeedbackSolveMode getSolveMode() const noexcept { return engine_.getSolveMode(); }

    void setSolverSettings(const SolverSettings<T>& settings) noexcept { engine_.setSolverSettings(settings); }
    [[nodiscard]] const SolverResult<T>& getLastSolve() const noexcept { return engine_.getLastSolve(); }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kCutoffId: setCutoff(static_cast<T>(v)); break;
            case kQId:      setQ(static_cast<T>(v)); break;
            case kModeId:   setMode(static_cast<SvfMode>(static_cast<uint8_t>(std::lround(v)))); break;
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kCutoffId: return cutoff_;
            case kQId:      return q_;
            case kModeId:   return static_cast<double>(mode_);
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Advance one sample and return all six responses.
    [[nodiscard]] SvfOutputs<T> processMulti(T input) noexcept {
        const auto y = engine_.processMulti(input);
        const T lp = y[0];
        const T bp = y[1];
        const T hp = y[2];
        const T twoR = static_cast<T>(1.0 / q_);
        return {lp, bp, hp, lp + hp, lp + hp - twoR * bp, lp - hp};
    }

    /// @brief Advance one sample and return the selected response.
    [[nodiscard]] T process(T input) noexcept {
        const auto y = engine_.processMulti(input);
        const auto mix = outputMix();
        return mix[0] * y[0] + mix[1] * y[1] + mix[2] * y[2];
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    void reset() noexcept { engine_.reset(); }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Linearized response of the selected mode
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        const std::complex<double> z = std::conj(unitDelayAt(hz, sampleRate_));
        const auto h = engine_.transferFunction(z);
        const auto mix = outputMix();
        return FrequencyResponse::fromComplex(static_cast<double>(mix[0]) * h[0]
                                            + static_cast<double>(mix[1]) * h[1]
                                            + static_cast<double>(mix[2]) * h[2]);
    }

    [[nodiscard]] const Engine& engine() const noexcept { return engine_; }

private:
    [[nodiscard]] double clampedCutoff() const noexcept {
        if (sampleRate_ <= 0.0) return std::max(cutoff_, kMinCutoff);
        return std::clamp(cutoff_, kMinCutoff, kMaxCutoffRatio * sampleRate_);
    }

    /// (lp, bp, hp) weights of the selected mode
    [[nodiscard]] std::array<T, 3> outputMix() const noexcept {
        const T twoR = static_cast<T>(1.0 / q_);
        switch (mode_) {
            case SvfMode::Lowpass:  return {T(1), T(0), T(0)};
            case SvfMode::Highpass: return {T(0), T(0), T(1)};
            case SvfMode::Bandpass: return {T(0), T(1), T(0)};
            case SvfMode::Notch:    return {T(1), T(0), T(1)};
            case SvfMode::Allpass:  return {T(1), -twoR, T(1)};
            case SvfMode::Peak:     return {T(1), T(0), T(-1)};
        }
        return {T(1), T(0), T(0)};
    }

    void updateModel() noexcept {
        if (sampleRate_ <= 0.0) return;

        const double g = std::tan(kPi<double> * clampedCutoff() / sampleRate_);
        const double r = 0.5 / q_;
        const double d = 1.0 + g * g;

        // Node input: bp = P.s + Q.x - H.sat(bp)
        const double p0 = 1.0 / d;
        const double p1 = -g / d;
        const double q = g / d;
        const double h = 2.0 * r * g / d;

        typename Engine::Model m{};
        m.P = {static_cast<T>(p0), static_cast<T>(p1)};
        m.Q = static_cast<T>(q);
        m.H = static_cast<T>(h);

        // Outputs 0 = lp, 1 = bp, 2 = hp, each as C.s + D.x + E.n
        const double bpC[2] = {p0, p1};
        const double bpD = q;
        const double bpE = -h;
        const double lpC[2] = {g * p0, g * p1 + 1.0};
        const double lpD = g * q;
        const double lpE = -g * h;
        const double hpC[2] = {-lpC[0], -lpC[1]};
        const double hpD = 1.0 - lpD;
        const double hpE = -2.0 * r - lpE;

        for (size_t j = 0; j < 2; ++j) {
            m.C[0][j] = static_cast<T>(lpC[j]);
            m.C[1][j] = static_cast<T>(bpC[j]);
            m.C[2][j] = static_cast<T>(hpC[j]);
        }
        m.D = {static_cast<T>(lpD), static_cast<T>(bpD), static_cast<T>(hpD)};
        m.E = {static_cast<T>(lpE), static_cast<T>(bpE), static_cast<T>(hpE)};

        // s1' = 2 bp - s1, s2' = 2 lp - s2
        m.A[0] = {static_cast<T>(2.0 * bpC[0] - 1.0), static_cast<T>(2.0 * bpC[1])};
        m.A[1] = {static_cast<T>(2.0 * lpC[0]), static_cast<T>(2.0 * lpC[1] - 1.0)};
        m.B = {static_cast<T>(2.0 * bpD), static_cast<T>(2.0 * lpD)};
        m.F = {static_cast<T>(2.0 * bpE), static_cast<T>(2.0 * lpE)};

        engine_.setModel(m);
    }

    Engine engine_{};
    SvfMode mode_ = SvfMode::Lowpass;
    double cutoff_ = 1000.0;
    double q_ = kButterworthQ;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
