// ==============================================================================
// Layer 0: Core Tests - Parameter Tables
// ==============================================================================
// Tests for: dsp/include/volta/dsp/core/parameter_info.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/processors/ladder_filter.h>
#include <volta/dsp/processors/svf.h>

#include <cmath>

using namespace Volta::DSP;
using Catch::Approx;

namespace {

constexpr ParameterInfo kLinearGain{0, "gain", "dB", -24.0, 24.0, 0.0,
                                    ParameterScale::Linear, SmoothingPolicy::Exponential, 20.0f};

constexpr ParameterInfo kLogCutoff{1, "cutoff", "Hz", 20.0, 20000.0, 1000.0,
                                   ParameterScale::Logarithmic, SmoothingPolicy::Exponential, 10.0f};

} // namespace

TEST_CASE("Linear parameters map the range onto [0, 1]", "[parameter_info][core]") {
    CHECK(kLinearGain.toNormalized(-24.0) == Approx(0.0));
    CHECK(kLinearGain.toNormalized(0.0) == Approx(0.5));
    CHECK(kLinearGain.toNormalized(24.0) == Approx(1.0));

    CHECK(kLinearGain.fromNormalized(0.25) == Approx(-12.0));
    CHECK(kLinearGain.fromNormalized(-1.0) == Approx(-24.0));
    CHECK(kLinearGain.fromNormalized(2.0) == Approx(24.0));
}

TEST_CASE("Logarithmic parameters are geometric in normalized space", "[parameter_info][core]") {
    CHECK(kLogCutoff.fromNormalized(0.0) == Approx(20.0));
    CHECK(kLogCutoff.fromNormalized(1.0) == Approx(20000.0));
    // Geometric midpoint of 20 Hz - 20 kHz
    CHECK(kLogCutoff.fromNormalized(0.5) == Approx(std::sqrt(20.0 * 20000.0)));

    for (double hz : {20.0, 100.0, 440.0, 1000.0, 8000.0, 20000.0}) {
        CHECK(kLogCutoff.fromNormalized(kLogCutoff.toNormalized(hz)) == Approx(hz).epsilon(1e-9));
    }
}

TEST_CASE("clampValue limits to the declared range", "[parameter_info][core]") {
    CHECK(kLinearGain.clampValue(100.0) == 24.0);
    CHECK(kLinearGain.clampValue(-100.0) == -24.0);
    CHECK(kLinearGain.clampValue(3.0) == 3.0);
}

TEST_CASE("Table validation", "[parameter_info][core]") {
    SECTION("processor tables are valid") {
        STATIC_CHECK(isValidParameterTable(SVF<float>::kParameters));
        STATIC_CHECK(isValidParameterTable(LadderFilter<double>::kParameters));
        CHECK_NOTHROW(validateParameterTable(LadderFilter<float>::kParameters, "LadderFilter"));
    }

    SECTION("ordinal must match index") {
        constexpr ParameterTable<2> table{{
            {0, "a", "", 0.0, 1.0, 0.5},
            {5, "b", "", 0.0, 1.0, 0.5},
        }};
        STATIC_CHECK_FALSE(isValidParameterTable(table));
        CHECK_THROWS_AS(validateParameterTable(table, "Test"), SetupError);
    }

    SECTION("names must be unique") {
        constexpr ParameterTable<2> table{{
            {0, "drive", "", 0.0, 1.0, 0.5},
            {1, "drive", "", 0.0, 1.0, 0.5},
        }};
        STATIC_CHECK_FALSE(isValidParameterTable(table));
        try {
            validateParameterTable(table, "Test");
            FAIL("duplicate accepted");
        } catch (const SetupError& e) {
            CHECK(e.code() == SetupErrorCode::InvalidParameterTable);
        }
    }

    SECTION("min must be below max and default inside") {
        constexpr ParameterTable<1> inverted{{{0, "x", "", 1.0, 0.0, 0.5}}};
        constexpr ParameterTable<1> outside{{{0, "x", "", 0.0, 1.0, 2.0}}};
        STATIC_CHECK_FALSE(isValidParameterTable(inverted));
        STATIC_CHECK_FALSE(isValidParameterTable(outside));
    }

    SECTION("logarithmic scale needs a positive minimum") {
        constexpr ParameterTable<1> table{{
            {0, "freq", "Hz", 0.0, 1000.0, 100.0, ParameterScale::Logarithmic},
        }};
        STATIC_CHECK_FALSE(isValidParameterTable(table));
        CHECK_THROWS_AS(validateParameterTable(table, "Test"), SetupError);
    }
}

TEST_CASE("findParameter looks up ordinals by name", "[parameter_info][core]") {
    const auto& table = LadderFilter<float>::kParameters;
    REQUIRE(findParameter(table, "resonance").has_value());
    CHECK(*findParameter(table, "resonance") == LadderFilter<float>::kResonanceId);
    CHECK_FALSE(findParameter(table, "feedback").has_value());
}

TEST_CASE("Node accessors go through the table", "[parameter_info][core]") {
    LadderFilter<float> ladder;
    ladder.prepare(48000.0, 64);

    SECTION("real values are clamped") {
        ladder.setParameter(LadderFilter<float>::kResonanceId, 10.0);
        CHECK(ladder.getParameter(LadderFilter<float>::kResonanceId) == Approx(3.99));
    }

    SECTION("normalized round trip") {
        setParameterNormalized(ladder, LadderFilter<float>::kCutoffId, 0.5);
        CHECK(ladder.getParameter(LadderFilter<float>::kCutoffId)
              == Approx(std::sqrt(20.0 * 20000.0)).epsilon(1e-6));
        CHECK(getParameterNormalized(ladder, LadderFilter<float>::kCutoffId) == Approx(0.5));
    }

    SECTION("by name") {
        CHECK(setParameterByName(ladder, "drive", 12.0));
        CHECK(ladder.getDrive() == Approx(12.0f));
        CHECK_FALSE(setParameterByName(ladder, "unknown", 1.0));
    }

    SECTION("out-of-range ordinals are ignored") {
        ladder.setParameter(99, 1.0);
        CHECK(ladder.getParameter(99) == 0.0);
    }
}
