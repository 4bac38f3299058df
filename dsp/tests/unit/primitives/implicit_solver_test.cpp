// ==============================================================================
// Layer 1: DSP Primitive Tests - Implicit Solver
// ==============================================================================
// Tests for: dsp/include/volta/dsp/primitives/implicit_solver.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_template_test_macros.hpp>

#include <volta/dsp/primitives/implicit_solver.h>

#include <array>
#include <cmath>
#include <limits>

using namespace Volta::DSP;
using Catch::Approx;

namespace {

/// y + y^3 = target, root at 1 for target 2
template <typename T>
struct CubicEquation {
    T target;
    T residual(T y) const noexcept { return y + y * y * y - target; }
    T derivative(T y) const noexcept { return T(1) + T(3) * y * y; }
};

/// y = 0.5 * cos(y), solved by contraction only
struct CosineFixedPoint {
    double residual(double y) const noexcept { return y - 0.5 * std::cos(y); }
    double fixedPoint(double y) const noexcept { return 0.5 * std::cos(y); }
};

/// Flat region where Newton cannot step
struct FlatThenSlope {
    double residual(double y) const noexcept { return y < 1.0 ? -0.5 : y - 1.5; }
    double derivative(double y) const noexcept { return y < 1.0 ? 0.0 : 1.0; }
};

/// No real root
struct NoRoot {
    double residual(double y) const noexcept { return y * y + 1.0; }
    double derivative(double y) const noexcept { return 2.0 * y; }
};

/// tanh feedback loop y = tanh(x - k * y)
struct TanhFeedback {
    double x;
    double k;
    double residual(double y) const noexcept { return y - std::tanh(x - k * y); }
    double derivative(double y) const noexcept {
        const double t = std::tanh(x - k * y);
        return 1.0 + k * (1.0 - t * t);
    }
};

} // namespace

static_assert(DifferentiableEquation<CubicEquation<float>, float>);
static_assert(FixedPointEquation<CosineFixedPoint, double>);
static_assert(!DifferentiableEquation<CosineFixedPoint, double>);

TEMPLATE_TEST_CASE("Newton-Raphson finds the cubic root", "[implicit_solver][primitives]",
                   float, double) {
    const ImplicitSolver<TestType> solver;
    const auto result = solver.solve(CubicEquation<TestType>{TestType(2)}, TestType(0));

    CHECK(result.converged);
    CHECK(result.value == Approx(1.0).epsilon(1e-5));
    CHECK(std::abs(result.residual) < SampleTraits<TestType>::kDefaultTolerance);
    CHECK(result.iterations <= 8);
    CHECK_FALSE(result.usedFixedPoint);
}

TEST_CASE("Residual decreases monotonically from a bracketing guess", "[implicit_solver][primitives]") {
    SolverSettings<double> settings;
    settings.tolerance = 1e-12;
    settings.maxIterations = 20;
    const ImplicitSolver<double> solver(settings);

    std::array<double, 21> trace{};
    const auto result = solver.solveWithTrace(CubicEquation<double>{2.0}, 3.0, trace.data());

    REQUIRE(result.converged);
    REQUIRE(result.iterations >= 2);
    for (int i = 1; i <= result.iterations; ++i) {
        INFO("step " << i);
        CHECK(trace[static_cast<size_t>(i)] < trace[static_cast<size_t>(i - 1)]);
    }
    // Quadratic convergence near the root
    const auto last = static_cast<size_t>(result.iterations);
    CHECK(trace[last] < trace[last - 1] * trace[last - 1] * 10.0 + 1e-15);
}

TEST_CASE("Converged result is immediate when the guess is a root", "[implicit_solver][primitives]") {
    const ImplicitSolver<double> solver;
    const auto result = solver.solve(CubicEquation<double>{2.0}, 1.0);
    CHECK(result.converged);
    CHECK(result.iterations == 0);
    CHECK(result.value == 1.0);
}

TEST_CASE("Fixed-point iteration solves contraction mappings", "[implicit_solver][primitives]") {
    SolverSettings<double> settings;
    settings.maxIterations = 64;
    const ImplicitSolver<double> solver(settings);

    const auto result = solver.solve(CosineFixedPoint{}, 0.0);
    CHECK(result.converged);
    CHECK(result.usedFixedPoint);
    CHECK(result.value == Approx(0.5 * std::cos(result.value)).margin(1e-9));
}

TEST_CASE("Vanishing derivative falls back to fixed-point steps", "[implicit_solver][primitives]") {
    const ImplicitSolver<double> solver;
    const auto result = solver.solve(FlatThenSlope{}, 0.0);
    CHECK(result.usedFixedPoint);
    CHECK(result.converged);
    CHECK(result.value == Approx(1.5));
}

TEST_CASE("Non-convergence returns the best estimate", "[implicit_solver][primitives]") {
    SolverSettings<double> settings;
    settings.maxIterations = 10;
    const ImplicitSolver<double> solver(settings);

    const auto result = solver.solve(NoRoot{}, 3.0);
    CHECK_FALSE(result.converged);
    CHECK(result.iterations <= 10);
    CHECK(std::isfinite(result.value));
    // Best |r| seen is never worse than the starting point
    CHECK(std::abs(result.residual) <= 10.0);
    CHECK(result.residual == Approx(result.value * result.value + 1.0));
}

TEST_CASE("Strong feedback loop stays bounded", "[implicit_solver][primitives]") {
    const ImplicitSolver<double> solver;
    for (double x : {-10.0, -1.0, 0.0, 0.3, 5.0, 50.0}) {
        const auto result = solver.solve(TanhFeedback{x, 4.0}, 0.0);
        INFO("x = " << x);
        CHECK(result.converged);
        CHECK(std::abs(result.value) <= 1.0);
    }
}

TEST_CASE("Settings are clamped", "[implicit_solver][primitives]") {
    ImplicitSolver<float> solver;

    solver.setMaxIterations(0);
    CHECK(solver.getSettings().maxIterations == ImplicitSolver<float>::kMinIterations);
    solver.setMaxIterations(100000);
    CHECK(solver.getSettings().maxIterations == ImplicitSolver<float>::kMaxIterations);

    solver.setTolerance(-1.0f);
    CHECK(solver.getSettings().tolerance == SampleTraits<float>::kDefaultTolerance);
    solver.setTolerance(std::numeric_limits<float>::quiet_NaN());
    CHECK(solver.getSettings().tolerance == SampleTraits<float>::kDefaultTolerance);
    solver.setTolerance(1e-3f);
    CHECK(solver.getSettings().tolerance == 1e-3f);
}

TEST_CASE("Single iteration bound is respected", "[implicit_solver][primitives]") {
    SolverSettings<double> settings;
    settings.maxIterations = 1;
    const ImplicitSolver<double> solver(settings);

    const auto result = solver.solve(CubicEquation<double>{2.0}, 3.0);
    CHECK(result.iterations == 1);
    CHECK_FALSE(result.converged);
}

TEST_CASE("Non-finite guess starts from zero", "[implicit_solver][primitives]") {
    const ImplicitSolver<double> solver;
    const auto result = solver.solve(CubicEquation<double>{2.0},
                                     std::numeric_limits<double>::infinity());
    CHECK(result.converged);
    CHECK(result.value == Approx(1.0));
}
