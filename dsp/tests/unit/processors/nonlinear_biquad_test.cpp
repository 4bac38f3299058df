// ==============================================================================
// Layer 2: DSP Processor Tests - Nonlinear Biquad
// ==============================================================================
// Tests for: dsp/include/volta/dsp/processors/nonlinear_biquad.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <volta/dsp/processors/nonlinear_biquad.h>

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
// [biquad]     - All biquad tests
// [processors] - Layer 2 processor tests
// [response]   - Frequency response checks

namespace {

constexpr double kSampleRate = 48000.0;

template <typename B>
B makeBiquad(BiquadType type, double cutoff, double q, double gainDb = 0.0) {
    B biquad;
    biquad.prepare(kSampleRate, 256);
    biquad.setType(type);
    biquad.setCutoff(static_cast<typename B::Sample>(cutoff));
    biquad.setQ(static_cast<typename B::Sample>(q));
    biquad.setGain(static_cast<typename B::Sample>(gainDb));
    return biquad;
}

} // namespace

// ==============================================================================
// Coefficients
// ==============================================================================

TEST_CASE("Coefficients default to bypass", "[biquad][processors]") {
    const BiquadCoefficients<float> bypass;
    CHECK(bypass.b0 == 1.0f);
    CHECK(bypass.a1 == 0.0f);
    CHECK(bypass.isStable());

    const auto invalid = BiquadCoefficients<float>::calculate(BiquadType::Lowpass, 1000.0, 0.7, 0.0, 0.0);
    CHECK(invalid.b0 == 1.0f);
    CHECK(invalid.b1 == 0.0f);
}

TEST_CASE("Designed filters are stable across the range", "[biquad][processors]") {
    for (auto type : {BiquadType::Lowpass, BiquadType::Highpass, BiquadType::Bandpass,
                      BiquadType::Notch, BiquadType::Allpass, BiquadType::LowShelf,
                      BiquadType::HighShelf, BiquadType::Peak}) {
        for (double hz : {5.0, 100.0, 5000.0, 23000.0, 40000.0}) {
            for (double q : {0.05, 0.707, 30.0, 100.0}) {
                const auto c = BiquadCoefficients<double>::calculate(type, hz, q, 12.0, kSampleRate);
                INFO("type " << static_cast<int>(type) << " hz " << hz << " q " << q);
                CHECK(c.isStable());
            }
        }
    }
}

// ==============================================================================
// Linear responses
// ==============================================================================

TEST_CASE("RBJ responses at the design frequency", "[biquad][processors][response]") {
    using Biquad = NonlinearBiquad<double>;

    SECTION("lowpass") {
        auto lp = makeBiquad<Biquad>(BiquadType::Lowpass, 1000.0, 0.70710678118654752440);
        CHECK(lp.frequencyResponse(1000.0).magnitudeDb() == Approx(-3.0103).margin(1e-3));
        CHECK(lp.frequencyResponse(10.0).magnitudeDb() == Approx(0.0).margin(1e-3));
        CHECK(measureGainAt(lp, 1000.0, kSampleRate) == Approx(lp.frequencyResponse(1000.0).magnitude).epsilon(2e-3));
    }

    SECTION("highpass") {
        auto hp = makeBiquad<Biquad>(BiquadType::Highpass, 1000.0, 0.70710678118654752440);
        CHECK(hp.frequencyResponse(1000.0).magnitudeDb() == Approx(-3.0103).margin(1e-3));
        CHECK(hp.frequencyResponse(100.0).magnitudeDb() < -35.0);
    }

    SECTION("bandpass has a 0 dB peak") {
        auto bp = makeBiquad<Biquad>(BiquadType::Bandpass, 2000.0, 5.0);
        CHECK(bp.frequencyResponse(2000.0).magnitude == Approx(1.0).epsilon(1e-9));
        CHECK(measureGainAt(bp, 2000.0, kSampleRate) == Approx(1.0).epsilon(2e-3));
    }

    SECTION("notch") {
        auto notch = makeBiquad<Biquad>(BiquadType::Notch, 2000.0, 2.0);
        CHECK(notch.frequencyResponse(2000.0).magnitude < 1e-9);
    }

    SECTION("allpass") {
        auto ap = makeBiquad<Biquad>(BiquadType::Allpass, 2000.0, 2.0);
        for (double hz : {20.0, 2000.0, 15000.0}) {
            CHECK(ap.frequencyResponse(hz).magnitude == Approx(1.0).epsilon(1e-9));
        }
    }

    SECTION("peak and shelves reach their gain") {
        auto peak = makeBiquad<Biquad>(BiquadType::Peak, 1000.0, 1.0, 6.0);
        CHECK(peak.frequencyResponse(1000.0).magnitudeDb() == Approx(6.0).margin(1e-6));

        auto low = makeBiquad<Biquad>(BiquadType::LowShelf, 500.0, 0.707, -9.0);
        CHECK(low.frequencyResponse(0.0).magnitudeDb() == Approx(-9.0).margin(1e-6));
        CHECK(low.frequencyResponse(20000.0).magnitudeDb() == Approx(0.0).margin(0.05));

        auto high = makeBiquad<Biquad>(BiquadType::HighShelf, 2000.0, 0.707, 9.0);
        CHECK(high.frequencyResponse(0.0).magnitudeDb() == Approx(0.0).margin(1e-6));
        CHECK(high.frequencyResponse(kSampleRate / 2.0).magnitudeDb() == Approx(9.0).margin(1e-6));
    }
}

TEST_CASE("Custom coefficients are used until the next redesign", "[biquad][processors]") {
    auto biquad = makeBiquad<NonlinearBiquad<double>>(BiquadType::Lowpass, 1000.0, 0.707);

    BiquadCoefficients<double> gain;
    gain.b0 = 0.5;
    biquad.setCoefficients(gain);
    CHECK(biquad.process(1.0) == Approx(0.5));
    CHECK(biquad.frequencyResponse(3000.0).magnitude == Approx(0.5));

    // Survives prepare
    biquad.prepare(kSampleRate, 256);
    CHECK(biquad.getCoefficients().b0 == 0.5);

    biquad.setCutoff(2000.0);
    CHECK(biquad.getCoefficients().b0 != 0.5);
}

// ==============================================================================
// Saturation
// ==============================================================================

TEST_CASE("Saturated feedback matches the linear filter at low level", "[biquad][processors]") {
    auto linear = makeBiquad<NonlinearBiquad<double>>(BiquadType::Lowpass, 1000.0, 10.0);
    auto driven = makeBiquad<NonlinearBiquad<double, Tanh<double>>>(BiquadType::Lowpass, 1000.0, 10.0);

    CHECK(driven.frequencyResponse(1000.0).magnitude
          == Approx(linear.frequencyResponse(1000.0).magnitude).epsilon(1e-12));
    CHECK(measureGainAt(driven, 1000.0, kSampleRate, 1e-3) == Approx(10.0).epsilon(5e-3));
}

TEST_CASE("Saturated feedback tames the resonance", "[biquad][processors]") {
    auto driven = makeBiquad<NonlinearBiquad<double, Tanh<double>>>(BiquadType::Lowpass, 1000.0, 10.0);
    CHECK(driven.getHeadroom() == Approx(NonlinearBiquad<double>::kDefaultHeadroom));

    const double gain = measureGainAt(driven, 1000.0, kSampleRate, 0.5);
    CHECK(gain < 5.0);

    // Less headroom saturates harder
    driven.setHeadroom(1.0);
    driven.reset();
    CHECK(measureGainAt(driven, 1000.0, kSampleRate, 0.5) < gain * 0.5);

    // Non-positive headroom is ignored
    driven.setHeadroom(0.0);
    CHECK(driven.getHeadroom() == 1.0);
}

TEST_CASE("Loud noise stays finite through a resonant saturated biquad", "[biquad][processors]") {
    auto driven = makeBiquad<NonlinearBiquad<float, HardClip<float>>>(BiquadType::Bandpass, 300.0, 30.0);
    auto noise = TestHelpers::makeWhiteNoise<float>(20000, 10.0);
    driven.processBlock(noise.data(), noise.size());
    CHECK(allFinite(noise.data(), noise.size()));
}

TEST_CASE("Equal state saturators match the shared saturator", "[biquad][processors]") {
    auto shared = makeBiquad<NonlinearBiquad<double, Tanh<double>>>(BiquadType::Lowpass, 1000.0, 10.0);
    auto split = makeBiquad<NonlinearBiquad<double, Tanh<double>>>(BiquadType::Lowpass, 1000.0, 10.0);
    split.setStateSaturators(Tanh<double>{}, Tanh<double>{});
    CHECK(split.hasStateSaturators());
    CHECK_FALSE(shared.hasStateSaturators());

    const auto noise = TestHelpers::makeWhiteNoise<double>(4096, 20.0, 5);
    for (double x : noise) {
        REQUIRE(split.process(x) == Approx(shared.process(x)).margin(1e-12));
    }
}

TEST_CASE("Clipping one state register tames the resonance", "[biquad][processors]") {
    using Biquad = NonlinearBiquad<double, HardClip<double>>;
    auto plain = makeBiquad<Biquad>(BiquadType::Lowpass, 1000.0, 10.0);
    auto clipped = makeBiquad<Biquad>(BiquadType::Lowpass, 1000.0, 10.0);
    // s1 clips at 0.2 x headroom = 2, s2 keeps the full range
    clipped.setStateSaturators(HardClip<double>{-0.2, 0.2}, HardClip<double>{});

    // Both register slopes are 1 at the origin
    CHECK(clipped.frequencyResponse(1000.0).magnitude
          == Approx(plain.frequencyResponse(1000.0).magnitude).epsilon(1e-12));
    CHECK(measureGainAt(clipped, 1000.0, kSampleRate, 1e-3) == Approx(10.0).epsilon(5e-3));

    CHECK(measureGainAt(plain, 1000.0, kSampleRate, 0.5) == Approx(10.0).epsilon(5e-3));
    CHECK(measureGainAt(clipped, 1000.0, kSampleRate, 0.5) < 5.0);
}

TEST_CASE("State saturators follow headroom and reset with setSaturator", "[biquad][processors]") {
    auto biquad = makeBiquad<NonlinearBiquad<double, Tanh<double>>>(BiquadType::Lowpass, 1000.0, 2.0);
    biquad.setStateSaturators(Tanh<double>{}, Tanh<double>{});
    CHECK(biquad.engine().getStateSaturators()[1].getDrive() == Approx(0.1));

    biquad.setHeadroom(4.0);
    CHECK(biquad.engine().getStateSaturators()[0].getDrive() == Approx(0.25));
    CHECK(biquad.engine().getStateSaturators()[1].getDrive() == Approx(0.25));

    biquad.setSaturator(Tanh<double>{});
    CHECK_FALSE(biquad.hasStateSaturators());
}

// ==============================================================================
// Parameters
// ==============================================================================

TEST_CASE("Biquad parameters", "[biquad][processors]") {
    NonlinearBiquad<float> biquad;
    biquad.prepare(kSampleRate, 64);

    biquad.setParameter(NonlinearBiquad<float>::kTypeId, 7.0);
    CHECK(biquad.getType() == BiquadType::Peak);

    biquad.setParameter(NonlinearBiquad<float>::kGainId, 48.0);
    CHECK(biquad.getGain() == Approx(24.0f));

    biquad.setQ(std::numeric_limits<float>::quiet_NaN());
    CHECK(biquad.getQ() == Approx(0.70710678f));
    biquad.setQ(0.0f);
    CHECK(biquad.getQ() == Approx(0.1f));
}

// ==============================================================================
// DcBlocker
// ==============================================================================

TEST_CASE("DcBlocker removes offset and passes audio", "[biquad][processors]") {
    DcBlocker<double> blocker;
    blocker.prepare(kSampleRate, 256);

    std::vector<double> offset(static_cast<size_t>(kSampleRate), 0.5);
    blocker.processBlock(offset.data(), offset.size());
    CHECK(std::abs(offset.back()) < 1e-3);

    blocker.reset();
    CHECK(blocker.frequencyResponse(1000.0).magnitude == Approx(1.0).margin(1e-4));
    CHECK(measureGainAt(blocker, 1000.0, kSampleRate) == Approx(1.0).epsilon(2e-3));
    CHECK(blocker.getLatency() == 0);
}
