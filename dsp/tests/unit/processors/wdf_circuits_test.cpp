// ==============================================================================
// Layer 2: DSP Processor Tests - Wave Digital Circuits
// ==============================================================================
// Tests for: dsp/include/volta/dsp/processors/wdf_circuits.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/catch_template_test_macros.hpp>

#include <volta/dsp/processors/wdf_circuits.h>

#include "signal_metrics.h"
#include "test_signals.h"

#include <cmath>
#include <vector>

using namespace Volta::DSP;
using namespace Volta::DSP::TestUtils::SignalMetrics;
using Catch::Approx;

// ==============================================================================
// Test Tags
// ==============================================================================
// [wdf]        - All wave digital filter tests
// [processors] - Layer 2 processor tests

namespace {

constexpr double kSampleRate = 48000.0;

} // namespace

// ==============================================================================
// WdfRcLowpass
// ==============================================================================

TEMPLATE_TEST_CASE("RC lowpass matches its analog prototype", "[wdf][processors]", float, double) {
    WdfRcLowpass<TestType> rc;
    rc.prepare(kSampleRate, 128);
    rc.setCutoff(static_cast<TestType>(1000.0));

    CHECK(rc.frequencyResponse(0.0).magnitude == Approx(1.0).margin(1e-9));
    // Bilinear without prewarp: just under -3 dB at 1 kHz
    CHECK(rc.frequencyResponse(1000.0).magnitudeDb() == Approx(-3.0103).margin(0.05));

    for (double hz : {100.0, 1000.0, 8000.0}) {
        const double measured = measureGainAt(rc, hz, kSampleRate);
        INFO("hz = " << hz);
        CHECK(measured == Approx(rc.frequencyResponse(hz).magnitude).epsilon(3e-3));
    }
}

TEST_CASE("RC lowpass passes DC", "[wdf][processors]") {
    WdfRcLowpass<double> rc;
    rc.prepare(kSampleRate, 128);
    rc.setCutoff(200.0);

    std::vector<double> step(4800, 0.8);
    rc.processBlock(step.data(), step.size());
    CHECK(step.front() < 0.1);
    CHECK(step.back() == Approx(0.8).margin(1e-6));
    CHECK(rc.getLatency() == 0);
}

TEST_CASE("RC lowpass cutoff is clamped", "[wdf][processors]") {
    WdfRcLowpass<float> rc;
    rc.prepare(kSampleRate, 64);
    rc.setCutoff(40000.0f);
    CHECK(rc.getCutoff() == Approx(0.45f * 48000.0f));
    rc.setParameter(WdfRcLowpass<float>::kCutoffId, 5.0);
    CHECK(rc.getCutoff() == Approx(20.0f));
}

// ==============================================================================
// WdfDiodeClipper
// ==============================================================================

TEST_CASE("Diode clipper is linear for small signals", "[wdf][processors]") {
    WdfDiodeClipper<double> clipper;
    clipper.prepare(kSampleRate, 128);
    clipper.setCutoff(3000.0);

    // Makeup gain 1 / tanh(1) at 0 dB drive
    CHECK(clipper.frequencyResponse(0.0).magnitude == Approx(1.0 / std::tanh(1.0)).epsilon(1e-3));

    for (double hz : {200.0, 3000.0}) {
        const double measured = measureGainAt(clipper, hz, kSampleRate, 1e-3);
        INFO("hz = " << hz);
        CHECK(measured == Approx(clipper.frequencyResponse(hz).magnitude).epsilon(5e-3));
        CHECK(clipper.getLastSolve().converged);
    }
}

TEST_CASE("Diode clipper output is bounded under heavy drive", "[wdf][processors]") {
    WdfDiodeClipper<double> clipper;
    clipper.prepare(kSampleRate, 128);
    clipper.setDrive(48.0);

    auto sine = TestHelpers::makeSine<double>(4800, 200.0, kSampleRate, 1.0);
    clipper.processBlock(sine.data(), sine.size());

    REQUIRE(allFinite(sine.data(), sine.size()));
    CHECK(findPeak(sine.data(), sine.size()) < 1.0);
    CHECK(findPeak(sine.data(), sine.size()) > 0.5);
    CHECK(clipper.getLastSolve().converged);
}

TEST_CASE("Diode type and count set the clipping level", "[wdf][processors]") {
    auto peakFor = [](DiodeType type, size_t count) {
        WdfDiodeClipper<double> clipper;
        clipper.prepare(kSampleRate, 128);
        clipper.setDrive(36.0);
        clipper.setDiodes(type, count, count);
        auto sine = TestHelpers::makeSine<double>(4800, 100.0, kSampleRate, 1.0);
        clipper.processBlock(sine.data(), sine.size());
        return findPeak(sine.data(), sine.size());
    };

    const double silicon = peakFor(DiodeType::Silicon, 1);
    CHECK(peakFor(DiodeType::Germanium, 1) < silicon);
    CHECK(peakFor(DiodeType::Led, 1) > silicon);
    CHECK(peakFor(DiodeType::Silicon, 2) > silicon * 1.5);
}

TEST_CASE("Asymmetric diode stacks clip unevenly", "[wdf][processors]") {
    WdfDiodeClipper<double> clipper;
    clipper.prepare(kSampleRate, 128);
    clipper.setDrive(36.0);
    clipper.setDiodes(DiodeType::Silicon, 1, 3);

    auto sine = TestHelpers::makeSine<double>(4800, 100.0, kSampleRate, 1.0);
    clipper.processBlock(sine.data(), sine.size());

    double maxPositive = 0.0;
    double maxNegative = 0.0;
    for (double s : sine) {
        maxPositive = std::max(maxPositive, s);
        maxNegative = std::min(maxNegative, s);
    }
    CHECK(-maxNegative > 2.0 * maxPositive);
}

TEST_CASE("Diode clipper parameters", "[wdf][processors]") {
    WdfDiodeClipper<float> clipper;
    clipper.prepare(kSampleRate, 64);

    clipper.setParameter(WdfDiodeClipper<float>::kDiodeId, 2.0);
    CHECK(clipper.getDiodeType() == DiodeType::Led);
    CHECK(clipper.getParameter(WdfDiodeClipper<float>::kDiodeId) == 2.0);

    clipper.setDrive(100.0f);
    CHECK(clipper.getDrive() == Approx(48.0f));

    // Stack counts survive a type change
    clipper.setDiodes(DiodeType::Germanium, 2, 1);
    clipper.setParameter(WdfDiodeClipper<float>::kDiodeId, 0.0);
    CHECK(clipper.getDiodeType() == DiodeType::Silicon);
    CHECK(clipper.circuit().root().getModel().numForward == 2.0f);

    SolverSettings<float> settings;
    settings.maxIterations = 3;
    clipper.setSolverSettings(settings);
    CHECK(clipper.circuit().root().getSolverSettings().maxIterations == 3);
}
