// ==============================================================================
// Layer 2: DSP Processor Tests - Saturated Ladder
// ==============================================================================
// Tests for: dsp/include/volta/dsp/processors/saturated_ladder.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <volta/dsp/processors/saturated_ladder.h>

#include "signal_metrics.h"
#include "test_signals.h"

#include <cmath>
#include <limits>
#include <vector>

using namespace Volta::DSP;
using namespace Volta::DSP::TestUtils::SignalMetrics;
using Catch::Approx;

// ==============================================================================
// Test Tags
// ==============================================================================
// [satladder]  - Saturated ladder tests
// [processors] - Layer 2 processor tests
// [response]   - Frequency response checks

static_assert(Processor<SaturatedLadder<float>>);
static_assert(Parameterized<SaturatedLadder<double>>);
static_assert(HasFrequencyResponse<SaturatedLadder<double, Linear<double>>>);

namespace {

constexpr double kSampleRate = 48000.0;

template <typename L>
L makeLadder(LadderTopology topology, double cutoff, double resonance) {
    L ladder;
    ladder.prepare(kSampleRate, 512);
    ladder.setTopology(topology);
    ladder.setCutoff(static_cast<typename L::Sample>(cutoff));
    ladder.setResonance(static_cast<typename L::Sample>(resonance));
    return ladder;
}

template <typename L>
double settleDc(L& ladder, double level, int samples = 8000) {
    double y = 0.0;
    for (int i = 0; i < samples; ++i) {
        y = static_cast<double>(ladder.process(static_cast<typename L::Sample>(level)));
    }
    return y;
}

} // namespace

// ==============================================================================
// Linear behavior
// ==============================================================================

TEST_CASE("Linear stages match the predicted response", "[satladder][processors][response]") {
    using Ladder = SaturatedLadder<double, Linear<double>>;

    for (auto topology : {LadderTopology::Ota, LadderTopology::Transistor}) {
        auto ladder = makeLadder<Ladder>(topology, 1000.0, 1.0);
        INFO("topology = " << static_cast<int>(topology));

        CHECK(ladder.frequencyResponse(100.0).magnitude == Approx(0.5044).margin(1e-3));
        CHECK(ladder.frequencyResponse(1000.0).magnitude == Approx(0.3359).margin(1e-3));

        for (double hz : {200.0, 1000.0, 3000.0}) {
            const double predicted = ladder.frequencyResponse(hz).magnitude;
            const double measured = measureGainAt(ladder, hz, kSampleRate);
            INFO("hz = " << hz);
            CHECK(measured == Approx(predicted).epsilon(5e-3));
        }
    }
}

TEST_CASE("Topologies coincide with linear stages", "[satladder][processors]") {
    using Ladder = SaturatedLadder<double, Linear<double>>;
    auto ota = makeLadder<Ladder>(LadderTopology::Ota, 2000.0, 2.0);
    auto transistor = makeLadder<Ladder>(LadderTopology::Transistor, 2000.0, 2.0);

    const auto noise = TestHelpers::makeWhiteNoise<double>(4096, 1.0, 11);
    for (size_t i = 0; i < noise.size(); ++i) {
        REQUIRE(ota.process(noise[i]) == Approx(transistor.process(noise[i])).margin(1e-12));
    }
}

TEST_CASE("Quiet input sees the linearized response", "[satladder][processors][response]") {
    for (auto topology : {LadderTopology::Ota, LadderTopology::Transistor}) {
        auto ladder = makeLadder<SaturatedLadder<double>>(topology, 1500.0, 2.0);
        INFO("topology = " << static_cast<int>(topology));
        for (double hz : {300.0, 1500.0}) {
            const double predicted = ladder.frequencyResponse(hz).magnitude;
            const double measured = measureGainAt(ladder, hz, kSampleRate, 1e-4);
            INFO("hz = " << hz);
            CHECK(measured == Approx(predicted).epsilon(1e-2));
        }
    }
}

TEST_CASE("Slope selects the output pole", "[satladder][processors][response]") {
    auto ladder = makeLadder<SaturatedLadder<double, Linear<double>>>(LadderTopology::Ota, 1000.0, 0.0);

    ladder.setSlope(1);
    const double onePole = ladder.frequencyResponse(8000.0).magnitudeDb();
    ladder.setSlope(4);
    const double fourPole = ladder.frequencyResponse(8000.0).magnitudeDb();
    CHECK(fourPole < onePole - 30.0);

    ladder.setSlope(9);
    CHECK(ladder.getSlope() == 4);
    ladder.setSlope(0);
    CHECK(ladder.getSlope() == 1);
}

TEST_CASE("Compensation scales the output by 1 + k", "[satladder][processors]") {
    auto ladder = makeLadder<SaturatedLadder<double, Linear<double>>>(LadderTopology::Ota, 1000.0, 3.0);
    ladder.setResonanceCompensation(true);
    CHECK(ladder.isResonanceCompensationEnabled());
    CHECK(settleDc(ladder, 0.25) == Approx(0.25).margin(1e-9));
    CHECK(ladder.frequencyResponse(0.0).magnitude == Approx(1.0).margin(1e-9));
}

// ==============================================================================
// Nonlinear behavior
// ==============================================================================

TEST_CASE("Saturator placement differs between topologies", "[satladder][processors]") {
    // The OTA saturates the difference, which vanishes at DC; the transistor
    // pairs saturate the levels themselves
    auto ota = makeLadder<SaturatedLadder<double>>(LadderTopology::Ota, 1000.0, 0.0);
    auto transistor = makeLadder<SaturatedLadder<double>>(LadderTopology::Transistor, 1000.0, 0.0);

    CHECK(settleDc(ota, 5.0) == Approx(5.0).margin(1e-6));
    CHECK(settleDc(transistor, 5.0) < 4.0);
}

TEST_CASE("Input pair saturator only acts in the transistor topology", "[satladder][processors]") {
    using Ladder = SaturatedLadder<double, HardClip<double>>;
    for (auto topology : {LadderTopology::Ota, LadderTopology::Transistor}) {
        auto ladder = makeLadder<Ladder>(topology, 1000.0, 0.0);
        ladder.setStageSaturator(4, HardClip<double>{-0.1, 0.1});
        CHECK(ladder.getStageSaturator(4).maxValue == 0.1);

        const double expected = (topology == LadderTopology::Ota) ? 1.0 : 0.1;
        INFO("topology = " << static_cast<int>(topology));
        CHECK(settleDc(ladder, 1.0) == Approx(expected).margin(1e-9));
    }

    // Out-of-range index is ignored
    Ladder ladder;
    ladder.setStageSaturator(7, HardClip<double>{-0.5, 0.5});
    CHECK(ladder.getStageSaturator(4).maxValue == 1.0);
}

TEST_CASE("Impulse energy is finite for both topologies", "[satladder][processors]") {
    for (auto topology : {LadderTopology::Ota, LadderTopology::Transistor}) {
        auto ladder = makeLadder<SaturatedLadder<double>>(topology, 1000.0, 1.0);
        auto impulse = TestHelpers::makeImpulse<double>(10000);
        ladder.processBlock(impulse.data(), impulse.size());

        INFO("topology = " << static_cast<int>(topology));
        REQUIRE(allFinite(impulse.data(), impulse.size()));
        const double total = calculateEnergy(impulse.data(), impulse.size());
        CHECK(total > 1e-4);
        CHECK(total < 1.0);
        CHECK(calculateEnergy(impulse.data() + 9000, 1000) < total * 1e-12);
    }
}

TEST_CASE("Full resonance stays bounded under loud noise", "[satladder][processors]") {
    for (auto topology : {LadderTopology::Ota, LadderTopology::Transistor}) {
        for (double cutoff : {1000.0, 15000.0}) {
            auto ladder = makeLadder<SaturatedLadder<float>>(topology, cutoff, 4.0);
            auto noise = TestHelpers::makeWhiteNoise<float>(48000, 10.0, 3);
            ladder.processBlock(noise.data(), noise.size());

            INFO("topology = " << static_cast<int>(topology) << ", cutoff = " << cutoff);
            REQUIRE(allFinite(noise.data(), noise.size()));
            CHECK(findPeak(noise.data(), noise.size()) < 5.0);
        }
    }
}

TEST_CASE("Non-finite input resets the ladder", "[satladder][processors]") {
    auto ladder = makeLadder<SaturatedLadder<double>>(LadderTopology::Transistor, 1000.0, 2.0);
    (void)settleDc(ladder, 0.5, 100);

    CHECK(ladder.process(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    for (double s : ladder.getState()) {
        CHECK(s == 0.0);
    }
    CHECK(ladder.process(0.0) == 0.0);
}

TEST_CASE("Reset clears the stages", "[satladder][processors]") {
    auto ladder = makeLadder<SaturatedLadder<double>>(LadderTopology::Ota, 1000.0, 1.0);
    (void)settleDc(ladder, 1.0, 500);
    CHECK(ladder.getState()[3] != 0.0);

    ladder.reset();
    for (double s : ladder.getState()) {
        CHECK(s == 0.0);
    }
}

// ==============================================================================
// Parameters
// ==============================================================================

TEST_CASE("Saturated ladder parameters", "[satladder][processors]") {
    using Ladder = SaturatedLadder<double>;
    Ladder ladder;
    ladder.prepare(kSampleRate, 64);

    ladder.setParameter(Ladder::kTopologyId, 1.0);
    CHECK(ladder.getTopology() == LadderTopology::Transistor);
    CHECK(ladder.getParameter(Ladder::kTopologyId) == 1.0);

    ladder.setParameter(Ladder::kResonanceId, 10.0);
    CHECK(ladder.getResonance() == Ladder::kMaxResonance);

    ladder.setParameter(Ladder::kDriveId, 6.0);
    CHECK(ladder.getParameter(Ladder::kDriveId) == 6.0);

    ladder.setParameter(Ladder::kSlopeId, 2.0);
    CHECK(ladder.getSlope() == 2);

    ladder.setCutoff(30000.0);
    CHECK(ladder.getCutoff() == Approx(Ladder::kMaxCutoffRatio * kSampleRate));
    ladder.setCutoff(std::numeric_limits<double>::infinity());
    CHECK(ladder.getCutoff() == Approx(Ladder::kMaxCutoffRatio * kSampleRate));

    CHECK(ladder.getLatency() == 0);
    CHECK_THROWS_AS(ladder.prepare(48000.0, 0), SetupError);
}
