// ==============================================================================
// Layer 1: DSP Primitive - Implicit Equation Solver
// ==============================================================================
// Scalar Newton-Raphson with fixed-point fallback for per-sample implicit
// equations (zero-delay feedback through a nonlinearity, diode roots).
//
// An equation is any struct with
//   T residual(T y) const noexcept     - r(y), required
//   T derivative(T y) const noexcept   - r'(y), optional
//   T fixedPoint(T y) const noexcept   - g(y) with y = g(y) at the root,
//                                        optional, defaults to y - r(y)
//
// Iteration:
//   Newton-Raphson  y <- y - r(y) / r'(y)
//   Fixed point     y <- g(y)   when r' is missing, |r'| < kMinDerivative,
//                               or the Newton step is not finite
// Stops when |r(y)| < tolerance or after maxIterations steps. Without
// convergence the iterate with the smallest |r| is returned. The solver never
// fails: the caller always receives a finite best estimate when one was seen.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations, bounded iteration count)
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <limits>

namespace Volta {
namespace DSP {

// =============================================================================
// Equation Concepts
// =============================================================================

template<typename E, typename T>
concept ImplicitEquation = SampleType<T> && requires(const E eq, T y) {
    { eq.residual(y) } -> std::convertible_to<T>;
};

template<typename E, typename T>
concept DifferentiableEquation = ImplicitEquation<E, T> && requires(const E eq, T y) {
    { eq.derivative(y) } -> std::convertible_to<T>;
};

template<typename E, typename T>
concept FixedPointEquation = ImplicitEquation<E, T> && requires(const E eq, T y) {
    { eq.fixedPoint(y) } -> std::convertible_to<T>;
};

// =============================================================================
// SolverSettings / SolverResult
// =============================================================================

/// @brief Convergence configuration. Trades CPU cost against accuracy.
template<SampleType T>
struct SolverSettings {
    T tolerance = SampleTraits<T>::kDefaultTolerance;  ///< Stop when |r(y)| < tolerance
    int maxIterations = 16;                            ///< Hard bound on steps per call
};

/// @brief Outcome of one solve. Lives only for the sample being computed.
template<SampleType T>
struct SolverResult {
    T value = T(0);             ///< Best estimate of the root
    T residual = T(0);          ///< r(value)
    int iterations = 0;         ///< Steps taken
    bool converged = false;     ///< |residual| < tolerance
    bool usedFixedPoint = false;///< At least one fixed-point step was taken
};

// =============================================================================
// ImplicitSolver Class
// =============================================================================

/// @brief Bounded Newton-Raphson / fixed-point root finder.
///
/// @par Usage Example
/// @code
/// struct CubicEq {
///     float target;
///     float residual(float y) const noexcept { return y + y * y * y - target; }
///     float derivative(float y) const noexcept { return 1.0f + 3.0f * y * y; }
/// };
/// ImplicitSolver<float> solver;
/// auto result = solver.solve(CubicEq{2.0f}, 0.0f);  // result.value == 1
/// @endcode
template<SampleType T>
class ImplicitSolver {
public:
    static constexpr int kMinIterations = 1;
    static constexpr int kMaxIterations = 256;

    ImplicitSolver() noexcept = default;

    explicit ImplicitSolver(const SolverSettings<T>& settings) noexcept {
        setSettings(settings);
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Set tolerance and iteration bound (clamped to sane ranges)
    void setSettings(const SolverSettings<T>& settings) noexcept {
        setTolerance(settings.tolerance);
        setMaxIterations(settings.maxIterations);
    }

    void setTolerance(T tolerance) noexcept {
        settings_.tolerance = (tolerance > T(0) && std::isfinite(tolerance))
            ? tolerance
            : SampleTraits<T>::kDefaultTolerance;
    }

    void setMaxIterations(int maxIterations) noexcept {
        settings_.maxIterations = std::clamp(maxIterations, kMinIterations, kMaxIterations);
    }

    [[nodiscard]] const SolverSettings<T>& getSettings() const noexcept { return settings_; }

    // =========================================================================
    // Solving
    // =========================================================================

    /// @brief Solve eq.residual(y) = 0 starting from initialGuess.
    template<typename Equation>
    [[nodiscard]] SolverResult<T> solve(const Equation& eq, T initialGuess) const noexcept {
        static_assert(ImplicitEquation<Equation, T>, "Equation must provide residual(T)");
        return solveImpl(eq, initialGuess, nullptr);
    }

    /// @brief Same as solve(), recording |r| after every step into trace.
    ///
    /// trace must hold at least maxIterations + 1 entries. Used for
    /// convergence analysis; not intended for the audio path.
    template<typename Equation>
    [[nodiscard]] SolverResult<T> solveWithTrace(const Equation& eq, T initialGuess,
                                                 T* trace) const noexcept {
        static_assert(ImplicitEquation<Equation, T>, "Equation must provide residual(T)");
        return solveImpl(eq, initialGuess, trace);
    }

private:
    template<typename Equation>
    [[nodiscard]] static T fixedPointStep(const Equation& eq, T y, T r) noexcept {
        if constexpr (FixedPointEquation<Equation, T>) {
            (void)r;
            return static_cast<T>(eq.fixedPoint(y));
        } else {
            return y - r;
        }
    }

    template<typename Equation>
    [[nodiscard]] SolverResult<T> solveImpl(const Equation& eq, T initialGuess,
                                            T* trace) const noexcept {
        SolverResult<T> result;

        T y = std::isfinite(initialGuess) ? initialGuess : T(0);
        T r = static_cast<T>(eq.residual(y));
        T bestY = y;
        T bestR = r;
        T bestAbsR = std::isfinite(r) ? std::abs(r) : std::numeric_limits<T>::infinity();

        if (trace != nullptr) trace[0] = std::abs(r);

        int iter = 0;
        while (iter < settings_.maxIterations && !(bestAbsR < settings_.tolerance)) {
            T next = y;
            bool stepTaken = false;

            if constexpr (DifferentiableEquation<Equation, T>) {
                const T d = static_cast<T>(eq.derivative(y));
                if (std::isfinite(d) && std::abs(d) >= SampleTraits<T>::kMinDerivative) {
                    next = y - r / d;
                    stepTaken = std::isfinite(next);
                }
            }

            if (!stepTaken) {
                next = fixedPointStep(eq, y, r);
                result.usedFixedPoint = true;
                if (!std::isfinite(next)) {
                    ++iter;
                    break;
                }
            }

            y = next;
            r = static_cast<T>(eq.residual(y));
            ++iter;

            const T absR = std::abs(r);
            if (trace != nullptr) trace[iter] = absR;
            if (std::isfinite(r) && absR < bestAbsR) {
                bestAbsR = absR;
                bestR = r;
                bestY = y;
            }
            if (!std::isfinite(r)) {
                break;
            }
        }

        result.value = bestY;
        result.residual = bestR;
        result.iterations = iter;
        result.converged = bestAbsR < settings_.tolerance;
        return result;
    }

    SolverSettings<T> settings_{};
};

} // namespace DSP
} // namespace Volta
