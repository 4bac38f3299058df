// ==============================================================================
// Layer 1: DSP Primitive Tests - Saturator Family
// ==============================================================================
// Tests for: dsp/include/volta/dsp/primitives/saturators.h
//            dsp/include/volta/dsp/primitives/diode_clipper.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_template_test_macros.hpp>

#include <volta/dsp/primitives/diode_clipper.h>
#include <volta/dsp/primitives/saturators.h>

#include <array>
#include <cmath>
#include <limits>

using namespace Volta::DSP;
using Catch::Approx;

// ==============================================================================
// Test Tags
// ==============================================================================
// [saturators]  - All saturator tests
// [primitives]  - Layer 1 primitive tests
// [diode]       - Diode clipper tests

static_assert(IntegrableSaturator<Tanh<float>, float>);
static_assert(IntegrableSaturator<HardClip<double>, double>);
static_assert(IntegrableSaturator<Driven<float, Asinh<float>>, float>);
static_assert(DifferentiableSaturator<DiodeClipper<double>, double>);
static_assert(!IntegrableSaturator<DiodeClipper<double>, double>);
static_assert(!IntegrableSaturator<Blend<double, DiodeClipper<double>>, double>);
static_assert(TwiceIntegrableSaturator<Driven<double, HardClip<double>>, double>);
static_assert(!TwiceIntegrableSaturator<Tanh<double>, double>);
static_assert(DifferentiableSaturator<CommonCollector<float>, float>);
static_assert(!IntegrableSaturator<CommonCollector<double>, double>);

namespace {

constexpr std::array<double, 11> kSamplePoints{
    -4.0, -2.0, -1.0, -0.7, -0.3, 0.0, 0.2, 0.5, 0.99, 1.5, 3.0};

/// Central difference of the antiderivative should reproduce evaluate()
template <typename S>
void checkAntiderivativeMatches(const S& sat) {
    constexpr double h = 1e-5;
    for (double x : kSamplePoints) {
        const double slope = (sat.antiderivative(x + h) - sat.antiderivative(x - h)) / (2.0 * h);
        INFO("x = " << x);
        CHECK(slope == Approx(sat.evaluate(x)).margin(1e-6));
    }
}

/// Central difference of the second antiderivative should reproduce antiderivative()
template <typename S>
void checkSecondAntiderivativeMatches(const S& sat) {
    constexpr double h = 1e-5;
    for (double x : kSamplePoints) {
        const double slope = (sat.antiderivative2(x + h) - sat.antiderivative2(x - h)) / (2.0 * h);
        INFO("x = " << x);
        CHECK(slope == Approx(sat.antiderivative(x)).margin(1e-6));
    }
}

/// Central difference of evaluate() should reproduce derivative()
template <typename S>
void checkDerivativeMatches(const S& sat) {
    constexpr double h = 1e-6;
    for (double x : kSamplePoints) {
        const double slope = (sat.evaluate(x + h) - sat.evaluate(x - h)) / (2.0 * h);
        INFO("x = " << x);
        CHECK(slope == Approx(sat.derivative(x)).margin(1e-5));
    }
}

} // namespace

// ==============================================================================
// Shapes
// ==============================================================================

TEMPLATE_TEST_CASE("Every saturator passes through the origin", "[saturators][primitives]",
                   float, double) {
    CHECK(Linear<TestType>{}.evaluate(TestType(0)) == TestType(0));
    CHECK(Tanh<TestType>{}.evaluate(TestType(0)) == TestType(0));
    CHECK(Asinh<TestType>{}.evaluate(TestType(0)) == TestType(0));
    CHECK(HardClip<TestType>{}.evaluate(TestType(0)) == TestType(0));
    CHECK(SoftClipCubic<TestType>{}.evaluate(TestType(0)) == TestType(0));
    CHECK(DiodeClipper<TestType>{}.evaluate(TestType(0)) == Approx(0.0).margin(1e-6));
}

TEST_CASE("Tanh and the clippers are bounded", "[saturators][primitives]") {
    const Tanh<double> tanhSat;
    const SoftClipCubic<double> cubic;
    const HardClip<double> clip{-0.5, 0.25};

    for (double x : {-1e6, -50.0, -3.0, 3.0, 50.0, 1e6}) {
        CHECK(std::abs(tanhSat.evaluate(x)) <= 1.0);
        CHECK(std::abs(cubic.evaluate(x)) <= 1.0);
        CHECK(clip.evaluate(x) >= -0.5);
        CHECK(clip.evaluate(x) <= 0.25);
    }
    CHECK(clip.evaluate(0.1) == 0.1);
}

TEST_CASE("Asinh grows without bound", "[saturators][primitives]") {
    const Asinh<double> sat;
    CHECK(sat.evaluate(1000.0) > 7.0);
    CHECK(sat.evaluate(-1000.0) < -7.0);
}

TEST_CASE("SoftClipCubic knee is smooth", "[saturators][primitives]") {
    const SoftClipCubic<double> sat;
    CHECK(sat.evaluate(1.0) == Approx(1.0));
    CHECK(sat.derivative(0.999999) == Approx(0.0).margin(1e-5));
    CHECK(sat.derivative(0.0) == Approx(1.5));
}

// ==============================================================================
// Derivatives and antiderivatives
// ==============================================================================

TEST_CASE("Antiderivatives integrate to the transfer curve", "[saturators][primitives]") {
    SECTION("Linear") { checkAntiderivativeMatches(Linear<double>{}); }
    SECTION("Tanh") { checkAntiderivativeMatches(Tanh<double>{}); }
    SECTION("Asinh") { checkAntiderivativeMatches(Asinh<double>{}); }
    SECTION("HardClip") { checkAntiderivativeMatches(HardClip<double>{}); }
    SECTION("SoftClipCubic") { checkAntiderivativeMatches(SoftClipCubic<double>{}); }
    SECTION("Driven") { checkAntiderivativeMatches(Driven<double, Tanh<double>>{{}, 4.0}); }
    SECTION("Blend") { checkAntiderivativeMatches(Blend<double, Asinh<double>>{{}, 0.3}); }
}

TEST_CASE("Second antiderivatives integrate to the antiderivative", "[saturators][primitives]") {
    SECTION("Linear") { checkSecondAntiderivativeMatches(Linear<double>{}); }
    SECTION("Asinh") { checkSecondAntiderivativeMatches(Asinh<double>{}); }
    SECTION("HardClip") { checkSecondAntiderivativeMatches(HardClip<double>{}); }
    SECTION("Asymmetric HardClip") { checkSecondAntiderivativeMatches(HardClip<double>{-0.5, 0.25}); }
    SECTION("SoftClipCubic") { checkSecondAntiderivativeMatches(SoftClipCubic<double>{}); }
    SECTION("Driven") { checkSecondAntiderivativeMatches(Driven<double, HardClip<double>>{{}, 4.0}); }
    SECTION("Blend") { checkSecondAntiderivativeMatches(Blend<double, Asinh<double>>{{}, 0.3}); }
}

TEST_CASE("Derivatives match finite differences", "[saturators][primitives]") {
    SECTION("Tanh") { checkDerivativeMatches(Tanh<double>{}); }
    SECTION("Asinh") { checkDerivativeMatches(Asinh<double>{}); }
    SECTION("Driven") { checkDerivativeMatches(Driven<double, Tanh<double>>{{}, 3.0}); }
    SECTION("Blend") { checkDerivativeMatches(Blend<double, Tanh<double>>{{}, 0.5}); }
    SECTION("CommonCollector") { checkDerivativeMatches(CommonCollector<double>{}); }
}

TEST_CASE("Tanh antiderivative stays finite for large inputs", "[saturators][primitives]") {
    const Tanh<float> sat;
    CHECK(std::isfinite(sat.antiderivative(1e4f)));
    CHECK(std::isfinite(sat.antiderivative(-1e4f)));
    CHECK(sat.antiderivative(0.0f) == Approx(0.0f).margin(1e-7f));
    // ln(cosh(x)) ~ |x| - ln 2 for large |x|
    CHECK(sat.antiderivative(100.0f) == Approx(100.0f - std::log(2.0f)));
}

// ==============================================================================
// Combinators and slope
// ==============================================================================

TEST_CASE("Driven keeps the small-signal gain", "[saturators][primitives]") {
    const Driven<double, Tanh<double>> soft{{}, 1.0};
    const Driven<double, Tanh<double>> hard{{}, 10.0};

    CHECK(slopeAtOrigin<double>(soft) == Approx(1.0));
    CHECK(slopeAtOrigin<double>(hard) == Approx(1.0));
    // Higher drive saturates earlier
    CHECK(hard.evaluate(0.5) < soft.evaluate(0.5));
    CHECK(hard.evaluate(10.0) == Approx(0.1));
}

TEST_CASE("Driven stays finite at zero drive", "[saturators][primitives]") {
    Driven<double, Tanh<double>> shaper{{}, 0.0};
    CHECK(shaper.getDrive() == Driven<double, Tanh<double>>::kMinDrive);

    for (double x : {-10.0, -0.5, 0.0, 0.5, 10.0}) {
        INFO("x = " << x);
        CHECK(std::isfinite(shaper.evaluate(x)));
        CHECK(std::isfinite(shaper.derivative(x)));
        CHECK(std::isfinite(shaper.antiderivative(x)));
        // Vanishing drive leaves the saturator linear
        CHECK(shaper.evaluate(x) == Approx(x).epsilon(1e-6));
    }

    SECTION("setDrive floors and ignores non-finite values") {
        shaper.setDrive(4.0);
        shaper.setDrive(std::numeric_limits<double>::quiet_NaN());
        CHECK(shaper.getDrive() == 4.0);
        shaper.setDrive(-2.0);
        CHECK(shaper.getDrive() == 2.0);
        shaper.setDrive(1e-12);
        CHECK(shaper.getDrive() == Driven<double, Tanh<double>>::kMinDrive);
    }
}

TEST_CASE("Blend crossfades between identity and saturator", "[saturators][primitives]") {
    const Blend<double, HardClip<double>> dry{{}, 0.0};
    const Blend<double, HardClip<double>> wet{{}, 1.0};
    const Blend<double, HardClip<double>> half{{}, 0.5};

    CHECK(dry.evaluate(3.0) == 3.0);
    CHECK(wet.evaluate(3.0) == 1.0);
    CHECK(half.evaluate(3.0) == Approx(2.0));
}

TEST_CASE("slopeAtOrigin falls back to a finite difference", "[saturators][primitives]") {
    struct CubicOnly {
        double evaluate(double x) const noexcept { return 2.0 * x + x * x * x; }
    };
    CHECK(slopeAtOrigin<double>(CubicOnly{}) == Approx(2.0).epsilon(1e-6));
    CHECK(slopeAtOrigin<double>(Asinh<double>{}) == 1.0);
}

// ==============================================================================
// DiodeClipper
// ==============================================================================

TEST_CASE("DiodeClipper small-signal gain is one half", "[saturators][primitives][diode]") {
    const DiodeClipper<double> clipper;
    CHECK(clipper.evaluate(1e-3) / 1e-3 == Approx(0.5).epsilon(1e-3));
    CHECK(clipper.derivative(0.0) == Approx(0.5).epsilon(1e-3));
}

TEST_CASE("DiodeClipper output is bounded by the diode drop", "[saturators][primitives][diode]") {
    const DiodeClipper<double> silicon{DiodeModel<double>::silicon()};
    const DiodeClipper<double> led{DiodeModel<double>::led()};

    for (double x : {2.0, 10.0, 100.0, 1000.0}) {
        const auto result = silicon.solve(x);
        INFO("x = " << x);
        CHECK(result.converged);
        CHECK(result.value > 0.0);
        CHECK(result.value < 1.5);
        // Odd symmetry for a symmetric pair
        CHECK(silicon.evaluate(-x) == Approx(-result.value).epsilon(1e-6));
        // LEDs drop more voltage than silicon
        CHECK(led.evaluate(x) > result.value);
    }
}

TEST_CASE("DiodeClipper is monotonic", "[saturators][primitives][diode]") {
    const DiodeClipper<float> clipper{DiodeModel<float>::germanium(1, 2)};
    float previous = clipper.evaluate(-5.0f);
    for (int i = 1; i <= 200; ++i) {
        const float x = -5.0f + 0.05f * static_cast<float>(i);
        const float y = clipper.evaluate(x);
        CHECK(y >= previous);
        previous = y;
    }
}

TEST_CASE("DiodeClipper asymmetric pair clips the two polarities differently",
          "[saturators][primitives][diode]") {
    const DiodeClipper<double> clipper{DiodeModel<double>::silicon(1, 3)};
    const double positive = clipper.evaluate(20.0);
    const double negative = clipper.evaluate(-20.0);
    CHECK(std::abs(negative) > positive * 2.0);
}

TEST_CASE("DiodeClipper rejects non-finite input", "[saturators][primitives][diode]") {
    const DiodeClipper<double> clipper;
    const auto result = clipper.solve(std::numeric_limits<double>::quiet_NaN());
    CHECK_FALSE(result.converged);
    CHECK(result.value == 0.0);
}

// ==============================================================================
// Common-collector BJT
// ==============================================================================

TEST_CASE("CommonCollector follows the input between the rails", "[saturators][primitives]") {
    const CommonCollector<double> bjt;

    CHECK(bjt.evaluate(0.0) == Approx(0.0).margin(1e-9));
    CHECK(bjt.evaluate(1.0) == Approx(1.0).margin(1e-6));
    CHECK(bjt.evaluate(-3.0) == Approx(-3.0).margin(1e-6));
    CHECK(bjt.derivative(0.0) == Approx(1.0).margin(1e-9));
    CHECK(slopeAtOrigin<double>(bjt) == Approx(1.0).margin(1e-9));
}

TEST_CASE("CommonCollector clips asymmetrically at the rails", "[saturators][primitives]") {
    const CommonCollector<double> bjt;

    // Output saturates at rail + yBias
    CHECK(bjt.evaluate(20.0) == Approx(4.5 - 0.77));
    CHECK(bjt.evaluate(-20.0) == Approx(-4.5 - 0.77));
    CHECK(bjt.derivative(20.0) == Approx(0.0).margin(1e-12));
    CHECK(bjt.derivative(-20.0) == Approx(0.0).margin(1e-12));

    // The knee sits where x + xBias meets the rail
    CHECK(bjt.derivative(4.5 - 0.77) == Approx(0.5));

    for (double x : {-1e6, -10.0, 10.0, 1e6}) {
        INFO("x = " << x);
        CHECK(std::isfinite(bjt.evaluate(x)));
        CHECK(bjt.evaluate(x) <= 4.5 - 0.77 + 1e-9);
        CHECK(bjt.evaluate(x) >= -4.5 - 0.77 - 1e-9);
    }
}

TEST_CASE("CommonCollector knee width follows the smoothing", "[saturators][primitives]") {
    CommonCollector<double> soft;
    soft.smoothing = 0.5;
    CommonCollector<double> hard;
    hard.smoothing = 0.01;

    const double knee = 4.5 - 0.77;
    CHECK(soft.evaluate(knee) < hard.evaluate(knee));
    CHECK(hard.evaluate(knee) == Approx(knee - 0.01).margin(1e-6));
    CHECK(hard.evaluate(knee - 0.5) == Approx(knee - 0.5).margin(1e-9));
}
