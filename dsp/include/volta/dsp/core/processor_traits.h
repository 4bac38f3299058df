// ==============================================================================
// Layer 0: Core Utility - Processing Contract
// ==============================================================================
// The interface every processing node implements, expressed as C++20 concepts
// so combinators can compose nodes at compile time without virtual dispatch.
//
// Contract:
//   prepare(sampleRate, blockSize)  - setup, may allocate, throws SetupError
//   process(x) -> y                 - one sample, noexcept, no allocation
//   processBlock(buffer, n)         - in place, identical to n process() calls
//                                     in temporal order
//   reset()                         - clear memory, keep configuration
//   getLatency()                    - samples of delay at the node's own rate
//   getSampleRate()/getBlockSize()  - configuration agreed at prepare()
//   frequencyResponse(hz)           - optional, linearized model only
// ==============================================================================

#pragma once

#include <volta/dsp/core/sample_traits.h>

#include <cmath>
#include <complex>
#include <concepts>
#include <cstddef>

namespace Volta {
namespace DSP {

// =============================================================================
// FrequencyResponse
// =============================================================================

/// @brief Magnitude and phase of a linearized node at one frequency.
struct FrequencyResponse {
    double magnitude = 1.0;  ///< Linear magnitude
    double phase = 0.0;      ///< Phase in radians

    [[nodiscard]] static FrequencyResponse fromComplex(std::complex<double> h) noexcept {
        return {std::abs(h), std::arg(h)};
    }

    [[nodiscard]] std::complex<double> toComplex() const noexcept {
        return std::polar(magnitude, phase);
    }

    /// Magnitude in decibels
    [[nodiscard]] double magnitudeDb() const noexcept {
        return (magnitude > 0.0) ? 20.0 * std::log10(magnitude) : -144.0;
    }
};

/// @brief z^-1 evaluated on the unit circle at hz for the given sample rate.
[[nodiscard]] inline std::complex<double> unitDelayAt(double hz, double sampleRate) noexcept {
    const double omega = 2.0 * 3.14159265358979323846 * hz / sampleRate;
    return std::polar(1.0, -omega);
}

// =============================================================================
// Concepts
// =============================================================================

/// @brief A stateful node satisfying the processing contract.
template<typename P>
concept Processor = requires(P node, const P constNode,
                             typename P::Sample x,
                             typename P::Sample* buffer,
                             size_t n, double sampleRate) {
    requires SampleType<typename P::Sample>;
    { node.prepare(sampleRate, n) };
    { node.process(x) } noexcept -> std::same_as<typename P::Sample>;
    { node.processBlock(buffer, n) } noexcept;
    { node.reset() } noexcept;
    { constNode.getLatency() } noexcept -> std::convertible_to<size_t>;
    { constNode.getSampleRate() } noexcept -> std::convertible_to<double>;
    { constNode.getBlockSize() } noexcept -> std::convertible_to<size_t>;
};

/// @brief A node that can report the response of its linearized model.
template<typename P>
concept HasFrequencyResponse = Processor<P> && requires(const P node, double hz) {
    { node.frequencyResponse(hz) } noexcept -> std::same_as<FrequencyResponse>;
};

// =============================================================================
// Shared Block Processing
// =============================================================================

/// @brief Default block processing: process() per sample, strictly in order.
///
/// Nodes with feedback or phase state depend on this ordering; a node may only
/// override processBlock() with something observably identical.
template<typename P>
inline void processBlockPerSample(P& node, typename P::Sample* buffer,
                                  size_t numSamples) noexcept {
    if (buffer == nullptr) {
        return;
    }
    for (size_t i = 0; i < numSamples; ++i) {
        buffer[i] = node.process(buffer[i]);
    }
}

} // namespace DSP
} // namespace Volta
