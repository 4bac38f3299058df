// ==============================================================================
// Layer 2: DSP Processor - Wave Digital Circuits
// ==============================================================================
// Ready-made circuits built from the WDF primitives, wrapped as processing
// nodes. Both share one tree: a resistive voltage source (input, series R)
// in parallel with a capacitor.
//
//   WdfRcLowpass     tree rooted at an open circuit: passive RC lowpass
//   WdfDiodeClipper  tree rooted at an antiparallel diode pair: the classic
//                    RC diode clipper, solved per sample by Newton-Raphson
//
// R follows the cutoff: R = 1 / (2 pi C fc). Because the capacitor uses the
// bilinear transform without prewarping, the digital cutoff sits slightly
// below fc for fc approaching Nyquist.
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
#include <volta/dsp/primitives/diode_clipper.h>
#include <volta/dsp/primitives/wdf.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>

namespace Volta {
namespace DSP {

namespace detail {

/// Bilinear-transform Laplace variable s for a physical frequency hz
[[nodiscard]] inline std::complex<double> bilinearS(double hz, double sampleRate) noexcept {
    const std::complex<double> zInv = unitDelayAt(hz, sampleRate);
    return 2.0 * sampleRate * (1.0 - zInv) / (1.0 + zInv);
}

template<SampleType T>
using RcTree = WdfParallel<T, WdfResistiveVoltageSource<T>, WdfCapacitor<T>>;

} // namespace detail

// =============================================================================
// WdfRcLowpass
// =============================================================================

/// @brief First-order passive RC lowpass as a wave digital filter.
template<SampleType T>
class WdfRcLowpass {
public:
    using Sample = T;
    using Circuit = WdfCircuit<T, WdfOpenCircuit<T>, detail::RcTree<T>>;

    static constexpr double kCapacitance = 10e-9;
    static constexpr double kMinCutoff = 10.0;
    static constexpr double kMaxCutoffRatio = 0.45;

    enum ParameterId : uint32_t { kCutoffId = 0 };

    static constexpr ParameterTable<1> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    WdfRcLowpass() noexcept {
        circuit_.tree().right().setCapacitance(static_cast<T>(kCapacitance));
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "WdfRcLowpass");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        circuit_.prepare(sampleRate);
        updateResistance();
        reset();
    }

    void reset() noexcept { circuit_.reset(); }

    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateResistance();
    }
    [[nodiscard]] T getCutoff() const noexcept { return static_cast<T>(clampedCutoff()); }

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal == kCutoffId) {
            setCutoff(static_cast<T>(kParameters[kCutoffId].clampValue(value)));
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        return ordinal == kCutoffId ? cutoff_ : 0.0;
    }

    [[nodiscard]] T process(T input) noexcept {
        circuit_.tree().left().setVoltage(input);
        circuit_.step();
        return circuit_.rootVoltage();
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// 1 / (1 + sRC) at the bilinear-mapped s
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        const double rc = resistanceFor(clampedCutoff()) * kCapacitance;
        return FrequencyResponse::fromComplex(1.0 / (1.0 + detail::bilinearS(hz, sampleRate_) * rc));
    }

    [[nodiscard]] const Circuit& circuit() const noexcept { return circuit_; }

private:
    [[nodiscard]] static double resistanceFor(double hz) noexcept {
        return 1.0 / (kTwoPi<double> * kCapacitance * hz);
    }

    [[nodiscard]] double clampedCutoff() const noexcept {
        if (sampleRate_ <= 0.0) return std::max(cutoff_, kMinCutoff);
        return std::clamp(cutoff_, kMinCutoff, kMaxCutoffRatio * sampleRate_);
    }

    void updateResistance() noexcept {
        circuit_.tree().left().setResistance(static_cast<T>(resistanceFor(clampedCutoff())));
    }

    Circuit circuit_{};
    double cutoff_ = 1000.0;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

// =============================================================================
// WdfDiodeClipper
// =============================================================================

/// @brief Diode type loaded into WdfDiodeClipper.
enum class DiodeType : uint8_t {
    Silicon,
    Germanium,
    Led
};

/// @brief RC lowpass terminated by an antiparallel diode pair.
///
/// The input is scaled by the drive gain before it reaches the voltage
/// source; the output is divided by tanh(drive) so that heavy drive changes
/// the tone more than the level.
///
/// @par Usage Example
/// @code
/// WdfDiodeClipper<double> clipper;
/// clipper.prepare(4.0 * 48000.0, 4 * 256);   // typically run oversampled
/// clipper.setDiodes(DiodeType::Germanium, 1, 2);
/// clipper.setDrive(18.0);
/// double y = clipper.process(x);
/// @endcode
template<SampleType T>
class WdfDiodeClipper {
public:
    using Sample = T;
    using Circuit = WdfCircuit<T, WdfDiodePair<T>, detail::RcTree<T>>;

    static constexpr double kCapacitance = 33e-9;
    static constexpr double kMinCutoff = 20.0;
    static constexpr double kMaxCutoffRatio = 0.45;
    static constexpr double kMinDriveDb = -12.0;
    static constexpr double kMaxDriveDb = 48.0;

    enum ParameterId : uint32_t { kCutoffId = 0, kDriveId, kDiodeId };

    static constexpr ParameterTable<3> kParameters{{
        {kCutoffId, "cutoff", "Hz", 20.0, 20000.0, 3000.0,
         ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f},
        {kDriveId, "drive", "dB", kMinDriveDb, kMaxDriveDb, 0.0,
         ParameterScale::Linear, SmoothingPolicy::Exponential, 10.0f},
        {kDiodeId, "diode", "", 0.0, 2.0, 0.0,
         ParameterScale::Linear, SmoothingPolicy::None, 0.0f},
    }};

    static_assert(isValidParameterTable(kParameters));

    WdfDiodeClipper() noexcept {
        circuit_.tree().right().setCapacitance(static_cast<T>(kCapacitance));
        setDiodes(DiodeType::Silicon, 1, 1);
        setDrive(T(0));
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "WdfDiodeClipper");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        circuit_.prepare(sampleRate);
        updateResistance();
        reset();
    }

    void reset() noexcept { circuit_.reset(); }

    // =========================================================================
    // Configuration
    // =========================================================================

    void setCutoff(T hz) noexcept {
        if (!std::isfinite(hz)) return;
        cutoff_ = static_cast<double>(hz);
        updateResistance();
    }

    /// Input gain in dB
    void setDrive(T db) noexcept {
        if (!std::isfinite(db)) return;
        driveDb_ = std::clamp(static_cast<double>(db), kMinDriveDb, kMaxDriveDb);
        const double gain = dbToGain(driveDb_);
        drive_ = static_cast<T>(gain);
        makeup_ = static_cast<T>(1.0 / std::tanh(gain));
    }

    /// @param forward  Diodes in series conducting positive voltages (>= 1)
    /// @param backward Diodes in series conducting negative voltages (>= 1)
    void setDiodes(DiodeType type, size_t forward = 1, size_t backward = 1) noexcept {
        forward = std::max<size_t>(forward, 1);
        backward = std::max<size_t>(backward, 1);
        type_ = type;
        switch (type) {
            case DiodeType::Silicon:
                circuit_.root().setModel(DiodeModel<T>::silicon(forward, backward));
                break;
            case DiodeType::Germanium:
                circuit_.root().setModel(DiodeModel<T>::germanium(forward, backward));
                break;
            case DiodeType::Led:
                circuit_.root().setModel(DiodeModel<T>::led(forward, backward));
                break;
        }
    }

    void setSolverSettings(const SolverSettings<T>& settings) noexcept {
        circuit_.root().setSolverSettings(settings);
    }

    [[nodiscard]] T getCutoff() const noexcept { return static_cast<T>(clampedCutoff()); }
    [[nodiscard]] T getDrive() const noexcept { return static_cast<T>(driveDb_); }
    [[nodiscard]] DiodeType getDiodeType() const noexcept { return type_; }
    [[nodiscard]] const SolverResult<T>& getLastSolve() const noexcept {
        return circuit_.root().getLastSolve();
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setParameter(uint32_t ordinal, double value) noexcept {
        if (ordinal >= kParameters.size()) return;
        const double v = kParameters[ordinal].clampValue(value);
        switch (ordinal) {
            case kCutoffId: setCutoff(static_cast<T>(v)); break;
            case kDriveId:  setDrive(static_cast<T>(v)); break;
            case kDiodeId: {
                const DiodeModel<T>& m = circuit_.root().getModel();
                setDiodes(static_cast<DiodeType>(static_cast<uint8_t>(std::lround(v))),
                          static_cast<size_t>(m.numForward), static_cast<size_t>(m.numBackward));
                break;
            }
            default: break;
        }
    }

    [[nodiscard]] double getParameter(uint32_t ordinal) const noexcept {
        switch (ordinal) {
            case kCutoffId: return cutoff_;
            case kDriveId:  return driveDb_;
            case kDiodeId:  return static_cast<double>(type_);
            default: break;
        }
        return 0.0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] T process(T input) noexcept {
        circuit_.tree().left().setVoltage(drive_ * input);
        circuit_.step();
        const T out = makeup_ * circuit_.rootVoltage();
        return std::isfinite(out) ? out : T(0);
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Diodes replaced by their small-signal conductance at 0 V
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        const double r = resistanceFor(clampedCutoff());
        const double g0 = static_cast<double>(detail::diodePairConductance(circuit_.root().getModel(), T(0)));
        const double gain = static_cast<double>(drive_) * static_cast<double>(makeup_);
        const std::complex<double> s = detail::bilinearS(hz, sampleRate_);
        return FrequencyResponse::fromComplex(gain / (1.0 + r * g0 + s * r * kCapacitance));
    }

    [[nodiscard]] const Circuit& circuit() const noexcept { return circuit_; }

private:
    [[nodiscard]] static double resistanceFor(double hz) noexcept {
        return 1.0 / (kTwoPi<double> * kCapacitance * hz);
    }

    [[nodiscard]] double clampedCutoff() const noexcept {
        if (sampleRate_ <= 0.0) return std::max(cutoff_, kMinCutoff);
        return std::clamp(cutoff_, kMinCutoff, kMaxCutoffRatio * sampleRate_);
    }

    void updateResistance() noexcept {
        circuit_.tree().left().setResistance(static_cast<T>(resistanceFor(clampedCutoff())));
    }

    Circuit circuit_{};
    DiodeType type_ = DiodeType::Silicon;
    double cutoff_ = 3000.0;
    double driveDb_ = 0.0;
    T drive_ = T(1);
    T makeup_ = T(1);
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
