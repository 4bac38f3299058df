// ==============================================================================
// Layer 3: System Component - Response Analyzer
// ==============================================================================
// Measures the small-signal magnitude response of a prepared node by driving
// it with a low-level impulse and transforming the captured impulse response:
//
//   h[n] = node(a * delta[n]) / a,   H[k] = FFT(h)
//
// A level of -60 dBFS keeps saturating nodes close to their linearized
// model, so the result is directly comparable with frequencyResponse().
//
// Design Rules:
// - Offline tool: allocates and throws, never used on the audio thread
// - The node is reset before and after the measurement
// - Layer 3 (composes Layer 0-2)
// ==============================================================================

#pragma once

#include <volta/dsp/core/db_utils.h>
#include <volta/dsp/core/debug_log.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/fft.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <vector>

namespace Volta {
namespace DSP {

/// @brief Impulse-response magnitude analysis of any processing node.
///
/// @code
/// SVF<double> svf;
/// svf.prepare(48000.0, 256);
/// ResponseAnalyzer analyzer(8192);
/// analyzer.analyze(svf);
/// double measured = analyzer.magnitudeDbAt(1000.0);
/// double expected = svf.frequencyResponse(1000.0).magnitudeDb();
/// @endcode
class ResponseAnalyzer {
public:
    /// Impulse level used by analyze() unless overridden (-60 dBFS)
    static constexpr double kDefaultImpulseLevel = 1e-3;

    /// @throws SetupError(InvalidConfiguration) for unsupported FFT sizes
    explicit ResponseAnalyzer(size_t fftSize = 8192) {
        fft_.prepare(fftSize);
        impulseResponse_.assign(fftSize, 0.0f);
        spectrum_.assign(fft_.numBins(), {});
    }

    /// @brief Capture fftSize samples of the node's impulse response.
    /// @throws SetupError(InvalidConfiguration) if the node is not prepared
    ///         or the level is not a positive finite value
    template<Processor Node>
    void analyze(Node& node, double impulseLevel = kDefaultImpulseLevel) {
        if (node.getSampleRate() <= 0.0 || node.getBlockSize() == 0) {
            detail::throwSetupError(SetupErrorCode::InvalidConfiguration, "ResponseAnalyzer",
                                    "node must be prepared before analysis");
        }
        if (!std::isfinite(impulseLevel) || impulseLevel <= 0.0) {
            detail::throwSetupError(SetupErrorCode::InvalidConfiguration, "ResponseAnalyzer",
                                    "impulse level must be positive");
        }

        using Sample = typename Node::Sample;
        const size_t n = fft_.size();
        const size_t blockSize = node.getBlockSize();
        std::vector<Sample> block(blockSize);

        node.reset();
        for (size_t offset = 0; offset < n; offset += blockSize) {
            const size_t count = std::min(blockSize, n - offset);
            std::fill(block.begin(), block.end(), Sample(0));
            if (offset == 0) {
                block[0] = static_cast<Sample>(impulseLevel);
            }
            node.processBlock(block.data(), count);
            for (size_t i = 0; i < count; ++i) {
                impulseResponse_[offset + i] =
                    static_cast<float>(static_cast<double>(block[i]) / impulseLevel);
            }
        }
        node.reset();

        fft_.forward(impulseResponse_.data(), spectrum_.data());
        sampleRate_ = node.getSampleRate();

        VOLTA_DSP_LOG("[volta] ResponseAnalyzer: %zu-point response at %.1f Hz\n", n, sampleRate_);
    }

    // =========================================================================
    // Results
    // =========================================================================

    /// Linear magnitude at hz, interpolated between bins
    [[nodiscard]] double magnitudeAt(double hz) const noexcept {
        if (sampleRate_ <= 0.0 || !std::isfinite(hz)) return 0.0;
        const double binWidth = sampleRate_ / static_cast<double>(fft_.size());
        const double position = std::clamp(hz / binWidth, 0.0,
                                           static_cast<double>(spectrum_.size() - 1));
        const size_t lower = static_cast<size_t>(position);
        const size_t upper = std::min(lower + 1, spectrum_.size() - 1);
        const double frac = position - static_cast<double>(lower);
        const double a = std::abs(std::complex<double>(spectrum_[lower]));
        const double b = std::abs(std::complex<double>(spectrum_[upper]));
        return a + frac * (b - a);
    }

    [[nodiscard]] double magnitudeDbAt(double hz) const noexcept {
        return gainToDb(magnitudeAt(hz));
    }

    /// Captured impulse response, normalized by the impulse level
    [[nodiscard]] const std::vector<float>& impulseResponse() const noexcept {
        return impulseResponse_;
    }

    [[nodiscard]] const std::vector<std::complex<float>>& spectrum() const noexcept {
        return spectrum_;
    }

    [[nodiscard]] size_t fftSize() const noexcept { return fft_.size(); }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }

private:
    FFT fft_;
    std::vector<float> impulseResponse_;
    std::vector<std::complex<float>> spectrum_;
    double sampleRate_ = 0.0;
};

} // namespace DSP
} // namespace Volta
