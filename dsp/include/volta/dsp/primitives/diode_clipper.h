// ==============================================================================
// Layer 1: DSP Primitive - Diode Clipper
// ==============================================================================
// Shockley model of an antiparallel diode pair, shared by the static clipper
// below and the WDF diode root (wdf.h).
//
//   i_d(v) = Is * (exp(v / (nf n Vt)) - exp(-v / (nb n Vt)))
//
// nf/nb are the number of diodes in series in each direction; unequal counts
// give asymmetric clipping.
//
// DiodeClipper is the memoryless circuit "input resistor R into the diode pair
// with an equal load R", whose output voltage solves
//
//   r(v) = i_d(v) / 2 + v - vin / 2 = 0
//
// per sample by Newton-Raphson. Small-signal gain is 1/2 (the resistive
// divider); the output saturates near the diode forward voltage.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations)
// - Layer 1 (depends on Layer 0 and implicit_solver.h)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/primitives/implicit_solver.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace Volta {
namespace DSP {

// =============================================================================
// DiodeModel
// =============================================================================

/// @brief Shockley diode parameters for an antiparallel diode pair.
template<SampleType T>
struct DiodeModel {
    T saturationCurrent = static_cast<T>(4.352e-9);  ///< Is (A)
    T idealityFactor = static_cast<T>(1.906);        ///< n
    T thermalVoltage = static_cast<T>(23e-3);        ///< Vt (V)
    T numForward = T(1);                             ///< Diodes in series, forward direction
    T numBackward = T(1);                            ///< Diodes in series, backward direction

    [[nodiscard]] static constexpr DiodeModel silicon(size_t nf = 1, size_t nb = 1) noexcept {
        return {static_cast<T>(4.352e-9), static_cast<T>(1.906), static_cast<T>(23e-3),
                static_cast<T>(nf), static_cast<T>(nb)};
    }

    [[nodiscard]] static constexpr DiodeModel germanium(size_t nf = 1, size_t nb = 1) noexcept {
        return {static_cast<T>(200e-9), static_cast<T>(2.109), static_cast<T>(23e-3),
                static_cast<T>(nf), static_cast<T>(nb)};
    }

    [[nodiscard]] static constexpr DiodeModel led(size_t nf = 1, size_t nb = 1) noexcept {
        return {static_cast<T>(2.96406e-12), static_cast<T>(2.475312), static_cast<T>(23e-3),
                static_cast<T>(nf), static_cast<T>(nb)};
    }
};

namespace detail {

/// exp() with its argument capped so float never overflows
template<SampleType T>
[[nodiscard]] inline T boundedExp(T x) noexcept {
    return std::exp(std::min(x, static_cast<T>(80)));
}

/// Net current of an antiparallel diode pair at voltage v
template<SampleType T>
[[nodiscard]] inline T diodePairCurrent(const DiodeModel<T>& d, T v) noexcept {
    const T nVt = d.idealityFactor * d.thermalVoltage;
    return d.saturationCurrent * (boundedExp(v / (d.numForward * nVt))
                                - boundedExp(-v / (d.numBackward * nVt)));
}

/// d/dv of diodePairCurrent
template<SampleType T>
[[nodiscard]] inline T diodePairConductance(const DiodeModel<T>& d, T v) noexcept {
    const T nVt = d.idealityFactor * d.thermalVoltage;
    const T fwd = d.numForward * nVt;
    const T bwd = d.numBackward * nVt;
    return d.saturationCurrent * (boundedExp(v / fwd) / fwd + boundedExp(-v / bwd) / bwd);
}

/// @brief Starting point that brackets the root from the outside.
///
/// For a port equation v = drive - scale * i_d(v), |v| <= |drive| and the
/// diode current cannot exceed |drive| / scale, which bounds v by the inverse
/// exponential. Newton-Raphson on the convex residual converges monotonically
/// from that side.
template<SampleType T>
[[nodiscard]] inline T diodeInitialGuess(const DiodeModel<T>& d, T drive, T scale) noexcept {
    const T nVt = d.idealityFactor * d.thermalVoltage;
    const T isScaled = std::max(scale * d.saturationCurrent, std::numeric_limits<T>::min());
    if (drive >= T(0)) {
        const T bound = d.numForward * nVt * std::log1p(drive / isScaled);
        return std::min(drive, bound);
    }
    const T bound = d.numBackward * nVt * std::log1p(-drive / isScaled);
    return std::max(drive, -bound);
}

} // namespace detail

// =============================================================================
// DiodeClipper
// =============================================================================

/// @brief Static diode clipper usable anywhere a saturator is.
///
/// evaluate() and derivative() each run one bounded solve, seeded from a
/// bracket of the root, so the struct carries no state between samples.
///
/// @code
/// Waveshaper<double, DiodeClipper<double>> shaper(
///     DiodeClipper<double>{DiodeModel<double>::germanium(1, 2)});
/// @endcode
template<SampleType T>
struct DiodeClipper {
    DiodeModel<T> model{};
    SolverSettings<T> settings{SampleTraits<T>::kDefaultTolerance, 50};

    /// Output voltage for input voltage x
    [[nodiscard]] T evaluate(T x) const noexcept {
        return solve(x).value;
    }

    /// Implicit derivative dv/dx = 1 / (g_d(v) + 2)
    [[nodiscard]] T derivative(T x) const noexcept {
        const T v = solve(x).value;
        return T(1) / (detail::diodePairConductance(model, v) + T(2));
    }

    /// Full solver outcome for x, for convergence checks
    [[nodiscard]] SolverResult<T> solve(T x) const noexcept {
        if (!std::isfinite(x)) {
            return {};
        }
        const ImplicitSolver<T> solver(settings);
        const OutputEquation eq{&model, x};
        return solver.solve(eq, detail::diodeInitialGuess(model, x * T(0.5), T(0.5)));
    }

private:
    struct OutputEquation {
        const DiodeModel<T>* model;
        T input;

        [[nodiscard]] T residual(T v) const noexcept {
            return T(0.5) * detail::diodePairCurrent(*model, v) + v - T(0.5) * input;
        }
        [[nodiscard]] T derivative(T v) const noexcept {
            return T(0.5) * detail::diodePairConductance(*model, v) + T(1);
        }
    };
};

} // namespace DSP
} // namespace Volta
