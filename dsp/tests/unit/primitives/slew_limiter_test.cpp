// ==============================================================================
// Layer 1: DSP Primitive Tests - Slew Limiter
// ==============================================================================
// Tests for: dsp/include/volta/dsp/primitives/slew_limiter.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_template_test_macros.hpp>

#include <volta/dsp/primitives/slew_limiter.h>

#include "signal_metrics.h"
#include "test_signals.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace Volta::DSP;
using namespace Volta::DSP::TestUtils::SignalMetrics;
using Catch::Approx;

// ==============================================================================
// Test Tags
// ==============================================================================
// [slew]        - Slew limiter tests
// [primitives]  - Layer 1 primitive tests

static_assert(Processor<SlewLimiter<float>>);
static_assert(Parameterized<SlewLimiter<double>>);

namespace {

constexpr double kSampleRate = 48000.0;

} // namespace

TEMPLATE_TEST_CASE("Slow signals pass unchanged", "[slew][primitives]", float, double) {
    SlewLimiter<TestType> slew;
    slew.prepare(kSampleRate, 256);

    // Peak slope of a 100 Hz unit sine is 628 units/s, far below the default
    auto sine = TestHelpers::makeSine<TestType>(2048, 100.0, kSampleRate, 1.0);
    const auto dry = sine;
    slew.processBlock(sine.data(), sine.size());

    for (size_t i = 0; i < sine.size(); ++i) {
        REQUIRE(sine[i] == Approx(dry[i]).margin(1e-6));
    }
}

TEST_CASE("A step rises at the configured rate", "[slew][primitives]") {
    SlewLimiter<double> slew;
    slew.prepare(kSampleRate, 64);
    slew.setRate(4800.0);  // 0.1 per sample

    for (int i = 1; i <= 10; ++i) {
        INFO("sample " << i);
        CHECK(slew.process(1.0) == Approx(0.1 * i));
    }
    CHECK(slew.process(1.0) == Approx(1.0));
    CHECK_FALSE(slew.isChanging(1.0));
}

TEST_CASE("Rise and fall rates are independent", "[slew][primitives]") {
    SlewLimiter<double> slew;
    slew.prepare(kSampleRate, 64);
    slew.setRiseRate(4800.0);  // 0.1 per sample
    slew.setFallRate(960.0);   // 0.02 per sample

    int riseSamples = 0;
    while (slew.isChanging(1.0) && riseSamples < 1000) {
        (void)slew.process(1.0);
        ++riseSamples;
    }
    int fallSamples = 0;
    while (slew.isChanging(0.0) && fallSamples < 1000) {
        (void)slew.process(0.0);
        ++fallSamples;
    }
    CHECK(riseSamples == 10);
    CHECK(fallSamples == 50);
    CHECK(slew.getCurrentValue() == Approx(0.0).margin(1e-12));
}

TEST_CASE("Loud high frequencies turn into a smaller triangle", "[slew][primitives]") {
    SlewLimiter<double> slew;
    slew.prepare(kSampleRate, 256);
    slew.setRate(10000.0);

    auto sine = TestHelpers::makeSine<double>(4800, 5000.0, kSampleRate, 1.0);
    slew.processBlock(sine.data(), sine.size());

    REQUIRE(allFinite(sine.data(), sine.size()));
    // A 5 kHz half period allows 10000 / 10000 = 1 unit of travel
    const double peak = findPeak(sine.data() + 2400, 2400);
    CHECK(peak > 0.5);
    CHECK(peak < 0.6);

    // Consecutive samples never differ by more than one step
    const double step = 10000.0 / kSampleRate;
    for (size_t i = 1; i < sine.size(); ++i) {
        REQUIRE(std::abs(sine[i] - sine[i - 1]) <= step + 1e-12);
    }
}

TEST_CASE("State can be preset and reset", "[slew][primitives]") {
    SlewLimiter<double> slew;
    slew.prepare(kSampleRate, 64);
    slew.setRate(4800.0);

    slew.setCurrentValue(2.0);
    CHECK(slew.getCurrentValue() == 2.0);
    CHECK(slew.isChanging(1.0));
    CHECK(slew.process(1.0) == Approx(1.9));

    slew.setCurrentValue(std::numeric_limits<double>::infinity());
    CHECK(slew.getCurrentValue() == Approx(1.9));

    slew.reset();
    CHECK(slew.getCurrentValue() == 0.0);
}

TEST_CASE("Non-finite input holds the output", "[slew][primitives]") {
    SlewLimiter<float> slew;
    slew.prepare(kSampleRate, 64);
    (void)slew.process(0.05f);
    CHECK(slew.process(std::numeric_limits<float>::quiet_NaN()) == Approx(0.05f));
    CHECK(slew.process(std::numeric_limits<float>::infinity()) == Approx(0.05f));
}

TEST_CASE("Slew limiter parameters", "[slew][primitives]") {
    SlewLimiter<double> slew;
    slew.prepare(kSampleRate, 64);

    slew.setParameter(SlewLimiter<double>::kRiseId, 2000.0);
    slew.setParameter(SlewLimiter<double>::kFallId, 1e12);
    CHECK(slew.getParameter(SlewLimiter<double>::kRiseId) == 2000.0);
    CHECK(slew.getParameter(SlewLimiter<double>::kFallId) == SlewLimiter<double>::kMaxRate);
    CHECK(slew.getRiseRate() == 2000.0);

    slew.setRate(-5.0);
    CHECK(slew.getRiseRate() == SlewLimiter<double>::kMinRate);

    CHECK(slew.getLatency() == 0);
    CHECK(slew.frequencyResponse(1000.0).magnitude == Approx(1.0));
    CHECK_THROWS_AS(slew.prepare(0.0, 64), SetupError);
}
