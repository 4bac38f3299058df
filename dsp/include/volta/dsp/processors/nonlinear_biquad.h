// ==============================================================================
// Layer 2: DSP Processor - Nonlinear Biquad
// ==============================================================================
// Transposed Direct Form II biquad whose output is saturated before it
// re-enters the recursive part:
//
//   y   = b0 x + s1
//   n   = sat(y)
//   s1' = b1 x - a1 n + s2
//   s2' = b2 x - a2 n
//
// The saturated node is the output itself, so there is no delay-free loop and
// the step never iterates. With the Linear saturator this is the plain RBJ
// biquad. The saturator sees y / headroom and its output is scaled back up by
// headroom, so the default headroom of 10 keeps normal levels near-linear and
// only drives the feedback into saturation at high resonance.
//
// setStateSaturators() gives the two state registers separate saturators:
//
//   s1' = b1 x - a1 sat1(y) + s2
//   s2' = b2 x - a2 sat2(y)
//
// DcBlocker is the linear 5 Hz Butterworth highpass used after asymmetric
// nonlinearities.
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
// BiquadType
// =============================================================================

/// @brief RBJ cookbook response shapes.
enum class BiquadType : uint8_t {
    Lowpass,    ///< 12 dB/oct lowpass
    Highpass,   ///< 12 dB/oct highpass
    Bandpass,   ///< Constant 0 dB peak gain
    Notch,      ///< Band reject
    Allpass,    ///< Flat magnitude, phase shift
    LowShelf,   ///< Boost/cut below cutoff
    HighShelf,  ///< Boost/cut above cutoff
    Peak        ///< Parametric bell
};

// =============================================================================
// BiquadCoefficients
// =============================================================================

/// @brief Normalized biquad coefficients (a0 = 1 implied).
template<SampleType T>
struct BiquadCoefficients {
    T b0 = T(1);
    T b1 = T(0);
    T b2 = T(0);
    T a1 = T(0);
    T a2 = T(0);

    static constexpr double kMinFrequency = 1.0;
    static constexpr double kMaxFrequencyRatio = 0.495;
    static constexpr double kMinQ = 0.1;
    static constexpr double kMaxQ = 30.0;

    /// @brief RBJ cookbook design.
    /// @param gainDb Used by LowShelf, HighShelf and Peak only
    /// @return Bypass coefficients when sampleRate <= 0
    [[nodiscard]] static BiquadCoefficients calculate(BiquadType type, double frequency, double q,
                                                      double gainDb, double sampleRate) noexcept {
        if (!(sampleRate > 0.0)) {
            return {};
        }

        frequency = std::clamp(frequency, kMinFrequency, kMaxFrequencyRatio * sampleRate);
        q = std::clamp(q, kMinQ, kMaxQ);

        const double omega = kTwoPi<double> * frequency / sampleRate;
        const double sinOmega = std::sin(omega);
        const double cosOmega = std::cos(omega);
        const double alpha = sinOmega / (2.0 * q);

        double b0 = 1.0, b1 = 0.0, b2 = 0.0;
        double a0 = 1.0, a1 = 0.0, a2 = 0.0;

        switch (type) {
            case BiquadType::Lowpass:
                b0 = (1.0 - cosOmega) / 2.0;
                b1 = 1.0 - cosOmega;
                b2 = b0;
                a0 = 1.0 + alpha;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha;
                break;
            case BiquadType::Highpass:
                b0 = (1.0 + cosOmega) / 2.0;
                b1 = -(1.0 + cosOmega);
                b2 = b0;
                a0 = 1.0 + alpha;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha;
                break;
            case BiquadType::Bandpass:
                b0 = alpha;
                b1 = 0.0;
                b2 = -alpha;
                a0 = 1.0 + alpha;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha;
                break;
            case BiquadType::Notch:
                b0 = 1.0;
                b1 = -2.0 * cosOmega;
                b2 = 1.0;
                a0 = 1.0 + alpha;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha;
                break;
            case BiquadType::Allpass:
                b0 = 1.0 - alpha;
                b1 = -2.0 * cosOmega;
                b2 = 1.0 + alpha;
                a0 = 1.0 + alpha;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha;
                break;
            case BiquadType::LowShelf: {
                const double A = std::sqrt(std::pow(10.0, gainDb / 20.0));
                const double beta = std::sqrt(A) / q;
                b0 = A * ((A + 1.0) - (A - 1.0) * cosOmega + beta * sinOmega);
                b1 = 2.0 * A * ((A - 1.0) - (A + 1.0) * cosOmega);
                b2 = A * ((A + 1.0) - (A - 1.0) * cosOmega - beta * sinOmega);
                a0 = (A + 1.0) + (A - 1.0) * cosOmega + beta * sinOmega;
                a1 = -2.0 * ((A - 1.0) + (A + 1.0) * cosOmega);
                a2 = (A + 1.0) + (A - 1.0) * cosOmega - beta * sinOmega;
                break;
            }
            case BiquadType::HighShelf: {
                const double A = std::sqrt(std::pow(10.0, gainDb / 20.0));
                const double beta = std::sqrt(A) / q;
                b0 = A * ((A + 1.0) + (A - 1.0) * cosOmega + beta * sinOmega);
                b1 = -2.0 * A * ((A - 1.0) + (A + 1.0) * cosOmega);
                b2 = A * ((A + 1.0) + (A - 1.0) * cosOmega - beta * sinOmega);
                a0 = (A + 1.0) - (A - 1.0) * cosOmega + beta * sinOmega;
                a1 = 2.0 * ((A - 1.0) - (A + 1.0) * cosOmega);
                a2 = (A + 1.0) - (A - 1.0) * cosOmega - beta * sinOmega;
                break;
            }
            case BiquadType::Peak: {
                const double A = std::sqrt(std::pow(10.0, gainDb / 20.0));
                b0 = 1.0 + alpha * A;
                b1 = -2.0 * cosOmega;
                b2 = 1.0 - alpha * A;
                a0 = 1.0 + alpha / A;
                a1 = -2.0 * cosOmega;
                a2 = 1.0 - alpha / A;
                break;
            }
        }

        const double invA0 = 1.0 / a0;
        BiquadCoefficients c;
        c.b0 = static_cast<T>(b0 * invA0);
        c.b1 = static_cast<T>(b1 * invA0);
        c.b2 = static_cast<T>(b2 * invA0);
        c.a1 = static_cast<T>(a1 * invA0);
        c.a2 = static_cast<T>(a2 * invA0);
        return c;
    }

    /// Jury criterion: |a2| < 1 and |a1| < 1 + a2
    [[nodiscard]] bool isStable() const noexcept {
        constexpr T epsilon = static_cast<T>(1e-6);
        return std::abs(a2) < T(1) + epsilon && std::abs(a1) < T(1) + a2 + epsilon;
    }
};

// =============================================================================
// NonlinearBiquad Class
// =============================================================================

/// @brief TDF-II biquad with a saturator in the recursive path.
///
/// @tparam Sat Feedback saturator (Linear = the textbook biquad)
///
/// @par Usage Example
/// @code
/// NonlinearBiquad<float, Tanh<float>> dirty;
/// dirty.prepare(48000.0, 256);
/// dirty.setType(BiquadType::Lowpass);
/// dirty.setCutoff(800.0f);
/// dirty.setQ(8.0f);
/// dirty.processBlock(buffer, 256);
/// @endcode
template<SampleType T, typename Sat = Linear<T>>
class NonlinearBiquad {
public:
    using Sample = T;
    using Engine = NonlinearStateSpace<T, 2, 1, Driven<T, Sat>>;
    using Coefficients = BiquadCoefficients<T>;

    static constexpr double kMinGainDb = -24.0;
    static constexpr double kMaxGainDb = 24.0;

    /// Level the saturator treats as its unit input
    static constexpr double kDefaultHeadroom = 10.0;

    enum ParameterId : uint32_t { kCutoffId = 0, kQId, kGainId, kTypeId };

    static constexpr ParameterTable<4> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kQId, "q", "", 0.1, 30.0, 0.70710678118654752440,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kGainId, "gain", "dB", kMinGainDb, kMaxGainDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Linear, 10.0f},
        {kTypeId, "type", "", 0.0, 7.0, 0.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    NonlinearBiquad() noexcept { setHeadroom(static_cast<T>(kDefaultHeadroom)); }

    explicit NonlinearBiquad(Sat saturator) noexcept {
        saturator_ = saturator;
        setHeadroom(static_cast<T>(kDefaultHeadroom));
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "NonlinearBiquad");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        if (custom_) {
            loadModel();
        } else {
            updateModel();
        }
        reset();
    }

    void reset() noexcept { engine_.reset(); }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setType(BiquadType type) noexcept {
        type_ = type;
        updateModel();
    }

    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateModel();
    }

    void setQ(T q) noexcept {
        if (!std::isfinite(q)) return;
        q_ = std::clamp(static_cast<double>(q), Coefficients::kMinQ, Coefficients::kMaxQ);
        updateModel();
    }

    /// Shelf/peak gain in dB, clamped to [-24, 24]
    void setGain(T db) noexcept {
        if (!std::isfinite(db)) return;
        gainDb_ = std::clamp(static_cast<double>(db), kMinGainDb, kMaxGainDb);
        updateModel();
    }

    /// Load coefficients directly, bypassing the RBJ design
    void setCoefficients(const Coefficients& coeffs) noexcept {
        coeffs_ = coeffs;
        custom_ = true;
        loadModel();
    }

    /// Saturator input scaling; values <= 0 are ignored
    void setHeadroom(T headroom) noexcept {
        if (!(headroom > T(0)) || !std::isfinite(headroom)) return;
        headroom_ = headroom;
        engine_.setSaturator(Driven<T, Sat>{saturator_, T(1) / headroom_});
        if (engine_.hasStateSaturators()) {
            applyStateSaturators();
        }
    }

    /// Same saturator for both state registers; clears setStateSaturators()
    void setSaturator(const Sat& saturator) noexcept {
        saturator_ = saturator;
        engine_.setSaturator(Driven<T, Sat>{saturator_, T(1) / headroom_});
        engine_.clearStateSaturators();
    }

    /// @brief Separate saturators on the s1 and s2 feedback terms.
    ///
    /// Both see the same headroom scaling as the main saturator.
    void setStateSaturators(const Sat& first, const Sat& second) noexcept {
        stateSaturators_ = {first, second};
        applyStateSaturators();
    }

    [[nodiscard]] bool hasStateSaturators() const noexcept { return engine_.hasStateSaturators(); }

    [[nodiscard]] BiquadType getType() const noexcept { return type_; }
    [[nodiscard]] T getQ() const noexcept { return static_cast<T>(q_); }
    [[nodiscard]] T getGain() const noexcept { return static_cast<T>(gainDb_); }
    [[nodiscard]] T getHeadroom() const noexcept { return headroom_; }
    [[nodiscard]] const Coefficients& getCoefficients() const noexcept { return coeffs_; }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kCutoffId: setCutoff(static_cast<T>(v)); break;
            case kQId:      setQ(static_cast<T>(v)); break;
            case kGainId:   setGain(static_cast<T>(v)); break;
            case kTypeId:   setType(static_cast<BiquadType>(static_cast<uint8_t>(std::lround(v)))); break;
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kCutoffId: return cutoff_;
            case kQId:      return q_;
            case kGainId:   return gainDb_;
            case kTypeId:   return static_cast<double>(type_);
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] T process(T input) noexcept { return engine_.process(input); }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        return engine_.frequencyResponse(hz, sampleRate_);
    }

    [[nodiscard]] const Engine& engine() const noexcept { return engine_; }

private:
    /// Redesign from type, cutoff, Q and gain; drops custom coefficients
    void updateModel() noexcept {
        custom_ = false;
        if (sampleRate_ <= 0.0) return;
        coeffs_ = Coefficients::calculate(type_, cutoff_, q_, gainDb_, sampleRate_);
        loadModel();
    }

    void loadModel() noexcept {
        typename Engine::Model m{};
        m.P = {T(1), T(0)};
        m.Q = coeffs_.b0;
        m.H = T(0);
        m.C[0] = {T(1), T(0)};
        m.D = {coeffs_.b0};
        m.E = {T(0)};
        m.A[0] = {T(0), T(1)};
        m.A[1] = {T(0), T(0)};
        m.B = {coeffs_.b1, coeffs_.b2};
        m.F = {-coeffs_.a1, -coeffs_.a2};
        engine_.setModel(m);
    }

    void applyStateSaturators() noexcept {
        const T drive = T(1) / headroom_;
        engine_.setStateSaturators({Driven<T, Sat>{stateSaturators_[0], drive},
                                    Driven<T, Sat>{stateSaturators_[1], drive}});
    }

    Engine engine_{};
    Sat saturator_{};
    std::array<Sat, 2> stateSaturators_{};
    Coefficients coeffs_{};
    BiquadType type_ = BiquadType::Lowpass;
    double cutoff_ = 1000.0;
    double q_ = 0.70710678118654752440;
    double gainDb_ = 0.0;
    T headroom_ = static_cast<T>(kDefaultHeadroom);
    bool custom_ = false;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

// =============================================================================
// DcBlocker Class
// =============================================================================

/// @brief 5 Hz second-order highpass for removing DC after asymmetric shaping.
template<SampleType T>
class DcBlocker {
public:
    using Sample = T;

    static constexpr double kCutoffHz = 5.0;
    static constexpr double kQ = 0.707;

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        filter_.prepare(sampleRate, blockSize);
        filter_.setType(BiquadType::Highpass);
        filter_.setQ(static_cast<T>(kQ));
        filter_.setCutoff(static_cast<T>(kCutoffHz));
    }

    [[nodiscard]] T process(T input) noexcept { return filter_.process(input); }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    void reset() noexcept { filter_.reset(); }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return filter_.getSampleRate(); }
    [[nodiscard]] size_t getBlockSize() const noexcept { return filter_.getBlockSize(); }

    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        return filter_.frequencyResponse(hz);
    }

private:
    NonlinearBiquad<T, Linear<T>> filter_;
};

} // namespace DSP
} // namespace Volta
