// ==============================================================================
// Layer 2: DSP Processor - Nonlinear State-Space Engine
// ==============================================================================
// Discrete state-space system with one saturator inside a delay-free feedback
// loop. Shared by the SVF, ladder and nonlinear biquad, which differ only in
// the coefficients they load.
//
// Per sample, with state s (N), input u and saturator sat:
//   v  = P.s + Q.u                 linear part of the nonlinear node input
//   w  = v - H.sat(w)              implicit node equation (H = 0: w = v)
//   n  = sat(w)
//   y  = C.s + D.u + E.n           M outputs
//   s' = A.s + B.u + F.n
//
// Optionally each state row i has its own saturator for the feedback term,
// s'_i = ... + F_i.sat_i(w), while the node equation and the outputs keep the
// main saturator. This models a circuit where every state register clips at
// its own level.
//
// Solve modes:
//   Iterative - Newton-Raphson on r(w) = w - v + H.sat(w), seeded with the
//               previous sample's node value. The first sample after reset()
//               starts from the linearized value v / (1 + H.sat'(0)).
//   Explicit  - the excess sat(w) - w is taken from the previous sample and
//               the remaining linear equation is solved in closed form. Exact
//               for a linear saturator; under heavy drive it can overshoot or
//               go unstable and is NOT corrected.
//
// Design Rules:
// - Real-Time Safety (noexcept, no allocations)
// - Layer 2 (depends on Layer 0-1)
// ==============================================================================

#pragma once

#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/primitives/implicit_solver.h>
#include <volta/dsp/primitives/saturators.h>

#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>

namespace Volta {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief How the delay-free loop through the saturator is resolved.
enum class FeedbackSolveMode : uint8_t {
    Iterative,  ///< Per-sample implicit solve (accurate)
    Explicit    ///< One-sample-delayed nonlinear excess (cheap, not stabilized)
};

// =============================================================================
// StateSpaceModel
// =============================================================================

/// @brief Coefficients of a single-input system with one nonlinear node.
/// @tparam N State count
/// @tparam M Output count
template<SampleType T, size_t N, size_t M>
struct StateSpaceModel {
    std::array<T, N> P{};                  ///< State -> node input
    T Q = T(0);                            ///< Input -> node input
    T H = T(0);                            ///< Saturated node -> node input (negative feedback)
    std::array<std::array<T, N>, N> A{};   ///< State transition, A[row][col]
    std::array<T, N> B{};                  ///< Input -> next state
    std::array<T, N> F{};                  ///< Saturated node -> next state
    std::array<std::array<T, N>, M> C{};   ///< State -> outputs
    std::array<T, M> D{};                  ///< Input -> outputs
    std::array<T, M> E{};                  ///< Saturated node -> outputs
};

namespace detail {

/// Solve the n x n complex system m.x = rhs in place (Gaussian elimination,
/// partial pivoting). Returns false when the matrix is singular.
template<size_t N>
[[nodiscard]] inline bool solveComplexSystem(
    std::array<std::array<std::complex<double>, N>, N>& m,
    std::array<std::complex<double>, N>& rhs) noexcept {
    for (size_t col = 0; col < N; ++col) {
        size_t pivot = col;
        double best = std::abs(m[col][col]);
        for (size_t row = col + 1; row < N; ++row) {
            const double mag = std::abs(m[row][col]);
            if (mag > best) {
                best = mag;
                pivot = row;
            }
        }
        if (best < 1e-300) return false;
        if (pivot != col) {
            std::swap(m[pivot], m[col]);
            std::swap(rhs[pivot], rhs[col]);
        }
        for (size_t row = col + 1; row < N; ++row) {
            const std::complex<double> factor = m[row][col] / m[col][col];
            for (size_t k = col; k < N; ++k) {
                m[row][k] -= factor * m[col][k];
            }
            rhs[row] -= factor * rhs[col];
        }
    }
    for (size_t i = N; i > 0; --i) {
        const size_t row = i - 1;
        std::complex<double> acc = rhs[row];
        for (size_t k = row + 1; k < N; ++k) {
            acc -= m[row][k] * rhs[k];
        }
        rhs[row] = acc / m[row][row];
    }
    return true;
}

} // namespace detail

// =============================================================================
// NonlinearStateSpace Class
// =============================================================================

/// @brief Solve-and-update engine for a StateSpaceModel.
///
/// Not a processing node on its own: it has no sample rate. Filters embed it
/// and recompute the model when their parameters change.
template<SampleType T, size_t N, size_t M, typename Sat = Linear<T>>
class NonlinearStateSpace {
public:
    static_assert(N >= 1, "State-space system needs at least one state");
    static_assert(M >= 1, "State-space system needs at least one output");
    static_assert(Saturator<Sat, T>, "Sat must provide evaluate(T)");

    using Sample = T;
    using Model = StateSpaceModel<T, N, M>;
    using Outputs = std::array<T, M>;
    using State = std::array<T, N>;

    NonlinearStateSpace() noexcept = default;

    explicit NonlinearStateSpace(const Model& model, Sat saturator = Sat{}) noexcept
        : model_(model)
        , saturator_(std::move(saturator))
        , slope_(slopeAtOrigin<T>(saturator_)) {}

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Replace the coefficients; state is kept so modulation is click-free
    void setModel(const Model& model) noexcept { model_ = model; }
    [[nodiscard]] const Model& getModel() const noexcept { return model_; }

    void setSaturator(const Sat& saturator) noexcept {
        saturator_ = saturator;
        slope_ = slopeAtOrigin<T>(saturator_);
    }
    [[nodiscard]] const Sat& getSaturator() const noexcept { return saturator_; }

    /// Give each state row its own feedback saturator
    void setStateSaturators(const std::array<Sat, N>& saturators) noexcept {
        stateSaturators_ = saturators;
        hasStateSaturators_ = true;
    }

    /// Return to the main saturator for every row
    void clearStateSaturators() noexcept { hasStateSaturators_ = false; }

    [[nodiscard]] bool hasStateSaturators() const noexcept { return hasStateSaturators_; }
    [[nodiscard]] const std::array<Sat, N>& getStateSaturators() const noexcept { return stateSaturators_; }

    void setSolveMode(FeedbackSolveMode mode) noexcept { mode_ = mode; }
    [[nodiscard]] FeedbackSolveMode getSolveMode() const noexcept { return mode_; }

    void setSolverSettings(const SolverSettings<T>& settings) noexcept { solver_.setSettings(settings); }
    [[nodiscard]] const SolverSettings<T>& getSolverSettings() const noexcept { return solver_.getSettings(); }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Advance one sample and return every output.
    [[nodiscard]] Outputs processMulti(T u) noexcept {
        const State& s = state_;

        T v = model_.Q * u;
        for (size_t j = 0; j < N; ++j) {
            v += model_.P[j] * s[j];
        }

        const T w = solveNode(v);
        T n = static_cast<T>(saturator_.evaluate(w));
        if (!std::isfinite(n)) {
            n = T(0);
        }
        lastNode_ = w;
        hasHistory_ = true;

        Outputs y{};
        for (size_t i = 0; i < M; ++i) {
            T acc = model_.D[i] * u + model_.E[i] * n;
            for (size_t j = 0; j < N; ++j) {
                acc += model_.C[i][j] * s[j];
            }
            y[i] = acc;
        }

        State next{};
        for (size_t i = 0; i < N; ++i) {
            T fed = n;
            if (hasStateSaturators_) {
                fed = static_cast<T>(stateSaturators_[i].evaluate(w));
                if (!std::isfinite(fed)) {
                    fed = T(0);
                }
            }
            T acc = model_.B[i] * u + model_.F[i] * fed;
            for (size_t j = 0; j < N; ++j) {
                acc += model_.A[i][j] * s[j];
            }
            next[i] = flushDenormal(acc);
        }
        state_ = next;
        return y;
    }

    /// First output only
    [[nodiscard]] T process(T u) noexcept { return processMulti(u)[0]; }

    void reset() noexcept {
        state_.fill(T(0));
        lastNode_ = T(0);
        hasHistory_ = false;
        excess_ = T(0);
        lastSolve_ = {};
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] const State& getState() const noexcept { return state_; }

    /// Node value w of the most recent sample
    [[nodiscard]] T getLastNodeValue() const noexcept { return lastNode_; }

    /// Solver outcome of the most recent sample (Iterative mode with H != 0)
    [[nodiscard]] const SolverResult<T>& getLastSolve() const noexcept { return lastSolve_; }

    // =========================================================================
    // Linearized Response
    // =========================================================================

    /// @brief Transfer function of the model linearized around zero.
    ///
    /// The saturator is replaced by its slope at the origin, sigma:
    ///   w = v / (1 + H sigma),  n = sigma w
    /// which folds into A', B', C', D' and gives H(z) = C'(zI - A')^-1 B' + D'.
    /// State rows with their own saturator use that saturator's slope for
    /// their feedback term.
    [[nodiscard]] std::array<std::complex<double>, M> transferFunction(std::complex<double> z) const noexcept {
        const double sigma = static_cast<double>(slopeAtOrigin<T>(saturator_));
        const double denom = 1.0 + static_cast<double>(model_.H) * sigma;
        const double g = (std::abs(denom) > 1e-12) ? sigma / denom : 0.0;
        const double q = static_cast<double>(model_.Q);

        std::array<std::array<std::complex<double>, N>, N> m{};
        std::array<std::complex<double>, N> x{};
        for (size_t i = 0; i < N; ++i) {
            double rowGain = g;
            if (hasStateSaturators_) {
                rowGain = (std::abs(denom) > 1e-12)
                    ? static_cast<double>(slopeAtOrigin<T>(stateSaturators_[i])) / denom
                    : 0.0;
            }
            const double f = static_cast<double>(model_.F[i]) * rowGain;
            for (size_t j = 0; j < N; ++j) {
                const double aLin = static_cast<double>(model_.A[i][j])
                                  + f * static_cast<double>(model_.P[j]);
                m[i][j] = ((i == j) ? z : std::complex<double>{0.0, 0.0}) - aLin;
            }
            x[i] = static_cast<double>(model_.B[i]) + f * q;
        }

        std::array<std::complex<double>, M> h{};
        if (!detail::solveComplexSystem<N>(m, x)) {
            const double nan = std::numeric_limits<double>::quiet_NaN();
            h.fill({nan, nan});
            return h;
        }

        for (size_t i = 0; i < M; ++i) {
            const double e = static_cast<double>(model_.E[i]) * g;
            std::complex<double> acc = static_cast<double>(model_.D[i]) + e * q;
            for (size_t j = 0; j < N; ++j) {
                const double cLin = static_cast<double>(model_.C[i][j])
                                  + e * static_cast<double>(model_.P[j]);
                acc += cLin * x[j];
            }
            h[i] = acc;
        }
        return h;
    }

    /// @brief Linearized response of one output at hz.
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz, double sampleRate,
                                                      size_t output = 0) const noexcept {
        if (sampleRate <= 0.0 || output >= M) return {};
        const std::complex<double> z = std::conj(unitDelayAt(hz, sampleRate));
        return FrequencyResponse::fromComplex(transferFunction(z)[output]);
    }

private:
    /// r(w) = w - v + H sat(w)
    struct NodeEquation {
        const Sat* sat;
        T v;
        T h;

        [[nodiscard]] T residual(T w) const noexcept {
            return w - v + h * static_cast<T>(sat->evaluate(w));
        }

        [[nodiscard]] T derivative(T w) const noexcept
            requires DifferentiableSaturator<Sat, T> {
            return T(1) + h * static_cast<T>(sat->derivative(w));
        }

        [[nodiscard]] T fixedPoint(T w) const noexcept {
            return v - h * static_cast<T>(sat->evaluate(w));
        }
    };

    [[nodiscard]] T solveNode(T v) noexcept {
        const T h = model_.H;
        if (h == T(0)) {
            return v;
        }

        if (mode_ == FeedbackSolveMode::Explicit) {
            const T denom = T(1) + h;
            T w = (std::abs(denom) > SampleTraits<T>::kMinDerivative)
                ? (v - h * excess_) / denom
                : v;
            if (!std::isfinite(w)) {
                w = v;
            }
            excess_ = static_cast<T>(saturator_.evaluate(w)) - w;
            if (!std::isfinite(excess_)) {
                excess_ = T(0);
            }
            return w;
        }

        const NodeEquation eq{&saturator_, v, h};
        T guess = lastNode_;
        if (!hasHistory_ || !std::isfinite(guess)) {
            // No previous sample to start from: use the linearized solution
            const T denom = T(1) + h * slope_;
            guess = (std::abs(denom) > SampleTraits<T>::kMinDerivative) ? v / denom : v;
        }
        lastSolve_ = solver_.solve(eq, guess);
        return std::isfinite(lastSolve_.value) ? lastSolve_.value : v;
    }

    Model model_{};
    Sat saturator_{};
    std::array<Sat, N> stateSaturators_{};
    bool hasStateSaturators_ = false;
    T slope_ = slopeAtOrigin<T>(Sat{});
    State state_{};
    ImplicitSolver<T> solver_{};
    SolverResult<T> lastSolve_{};
    FeedbackSolveMode mode_ = FeedbackSolveMode::Iterative;
    T lastNode_ = T(0);
    bool hasHistory_ = false;
    T excess_ = T(0);
};

} // namespace DSP
} // namespace Volta
