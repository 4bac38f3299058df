// ==============================================================================
// Layer 1: DSP Primitive - Dynamic Saturator
// ==============================================================================
// A saturator whose curve is chosen at runtime. Every other saturator is a
// compile-time type; this one switches between them behind a single type so a
// host can expose the curve as a parameter without re-instantiating the
// processor that embeds it.
//
// Only evaluate() and derivative() are provided: the diode and BJT curves have
// no closed-form antiderivative, so DynamicSaturator does not satisfy
// IntegrableSaturator and cannot be wrapped in ADAA.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations)
// - Layer 1 (depends on Layer 0, saturators.h and diode_clipper.h)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/primitives/diode_clipper.h>
#include <volta/dsp/primitives/saturators.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Volta {
namespace DSP {

/// @brief Curves selectable on a DynamicSaturator.
enum class SaturatorKind : uint8_t {
    Linear,          ///< No saturation
    Tanh,            ///< Hyperbolic tangent
    Asinh,           ///< Inverse hyperbolic sine
    HardClip,        ///< Clamp to [-1, 1]
    SoftClipCubic,   ///< Cubic knee, bounded at +/-1
    Diode,           ///< Antiparallel diode pair (see diode_clipper.h)
    SoftDiode,       ///< Diode pair blended with the dry input
    CommonCollector  ///< BJT emitter follower into the supply rails
};

/// Number of SaturatorKind values, for parameter ranges
inline constexpr uint8_t kNumSaturatorKinds = 8;

/// @brief Runtime-selectable saturator.
///
/// The diode model, the soft-diode blend amount and the BJT rails are kept
/// while switching kinds, so a host can configure them once.
///
/// @code
/// Waveshaper<float, DynamicSaturator<float>> shaper;
/// DynamicSaturator<float> curve;
/// curve.setKind(SaturatorKind::Diode);
/// shaper.setSaturator(curve);
/// @endcode
template<SampleType T>
class DynamicSaturator {
public:
    static constexpr T kDefaultSoftDiodeAmount = static_cast<T>(0.5);

    DynamicSaturator() noexcept = default;

    explicit DynamicSaturator(SaturatorKind kind) noexcept { setKind(kind); }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Out-of-range values select Linear
    void setKind(SaturatorKind kind) noexcept {
        kind_ = (static_cast<uint8_t>(kind) < kNumSaturatorKinds) ? kind : SaturatorKind::Linear;
    }
    [[nodiscard]] SaturatorKind getKind() const noexcept { return kind_; }

    void setDiodeModel(const DiodeModel<T>& model) noexcept {
        diode_.model = model;
        diode_.model.numForward = std::max(diode_.model.numForward, T(1));
        diode_.model.numBackward = std::max(diode_.model.numBackward, T(1));
    }
    [[nodiscard]] const DiodeModel<T>& getDiodeModel() const noexcept { return diode_.model; }

    /// Wet amount of the SoftDiode curve, clamped to [0, 1]
    void setSoftDiodeAmount(T amount) noexcept {
        if (!std::isfinite(amount)) return;
        softDiodeAmount_ = std::clamp(amount, T(0), T(1));
    }
    [[nodiscard]] T getSoftDiodeAmount() const noexcept { return softDiodeAmount_; }

    void setCommonCollector(const CommonCollector<T>& bjt) noexcept { bjt_ = bjt; }
    [[nodiscard]] const CommonCollector<T>& getCommonCollector() const noexcept { return bjt_; }

    // =========================================================================
    // Saturator Interface
    // =========================================================================

    [[nodiscard]] T evaluate(T x) const noexcept {
        switch (kind_) {
            case SaturatorKind::Linear:          return x;
            case SaturatorKind::Tanh:            return Tanh<T>{}.evaluate(x);
            case SaturatorKind::Asinh:           return Asinh<T>{}.evaluate(x);
            case SaturatorKind::HardClip:        return HardClip<T>{}.evaluate(x);
            case SaturatorKind::SoftClipCubic:   return SoftClipCubic<T>{}.evaluate(x);
            case SaturatorKind::Diode:           return diode_.evaluate(x);
            case SaturatorKind::SoftDiode:       return softDiode().evaluate(x);
            case SaturatorKind::CommonCollector: return bjt_.evaluate(x);
        }
        return x;
    }

    [[nodiscard]] T derivative(T x) const noexcept {
        switch (kind_) {
            case SaturatorKind::Linear:          return T(1);
            case SaturatorKind::Tanh:            return Tanh<T>{}.derivative(x);
            case SaturatorKind::Asinh:           return Asinh<T>{}.derivative(x);
            case SaturatorKind::HardClip:        return HardClip<T>{}.derivative(x);
            case SaturatorKind::SoftClipCubic:   return SoftClipCubic<T>{}.derivative(x);
            case SaturatorKind::Diode:           return diode_.derivative(x);
            case SaturatorKind::SoftDiode:       return softDiode().derivative(x);
            case SaturatorKind::CommonCollector: return bjt_.derivative(x);
        }
        return T(1);
    }

private:
    [[nodiscard]] Blend<T, DiodeClipper<T>> softDiode() const noexcept {
        return {diode_, softDiodeAmount_};
    }

    SaturatorKind kind_ = SaturatorKind::Linear;
    DiodeClipper<T> diode_{};
    CommonCollector<T> bjt_{};
    T softDiodeAmount_ = kDefaultSoftDiodeAmount;
};

} // namespace DSP
} // namespace Volta
