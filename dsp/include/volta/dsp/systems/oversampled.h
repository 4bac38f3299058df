// ==============================================================================
// Layer 3: System Component - Oversampled Node
// ==============================================================================
// Runs any processing node at N times the host rate:
//
//   host block -> Oversampler::upsample -> inner.processBlock at fs * N
//              -> Oversampler::downsample -> host block
//
// The inner node is prepared with (fs * N, blockSize * N), so its own
// parameters (cutoffs, smoothing times) are expressed at the oversampled rate
// automatically. The ratio is fixed at construction.
//
// Latency (base-rate samples, rounded to nearest):
//   halfband group delays of all up and down stages + inner latency / N
//
// Design Rules:
// - Real-Time Safety (noexcept, allocation only in prepare())
// - Layer 3 (composes Layer 0-2)
// ==============================================================================

#pragma once

#include <volta/dsp/core/debug_log.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/halfband_filter.h>
#include <volta/dsp/primitives/oversampler.h>

#include <cmath>
#include <complex>
#include <cstddef>
#include <memory>
#include <utility>

namespace Volta {
namespace DSP {

/// @brief Processing node wrapping Inner in an up/down-sampling pair.
///
/// @par Usage Example
/// @code
/// Oversampled<WdfDiodeClipper<double>> clipper(4);
/// clipper.prepare(48000.0, 256);            // inner runs at 192 kHz, 1024 samples
/// clipper.inner().setDrive(24.0);
/// clipper.processBlock(buffer, 256);
/// @endcode
template<Processor Inner>
class Oversampled {
public:
    using Sample = typename Inner::Sample;

    /// @param ratio 1, 2, 4, 8 or 16 (throws SetupError otherwise)
    explicit Oversampled(size_t ratio = 2, Inner inner = Inner{},
                         OversamplingQuality quality = OversamplingQuality::Standard)
        : oversampler_(ratio, quality)
        , inner_(std::move(inner)) {}

    /// @brief Share one immutable kernel between many wrappers.
    Oversampled(size_t ratio, std::shared_ptr<const HalfbandKernel<Sample>> kernel,
                Inner inner = Inner{})
        : oversampler_(ratio, std::move(kernel))
        , inner_(std::move(inner)) {}

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Prepare the inner node at the oversampled rate and allocate buffers.
    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "Oversampled");
        const double ratio = static_cast<double>(oversampler_.getRatio());
        inner_.prepare(sampleRate * ratio, blockSize * oversampler_.getRatio());
        oversampler_.prepare(blockSize);
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        VOLTA_DSP_LOG("[volta] Oversampled prepared: fs=%.1f block=%zu ratio=%zu latency=%zu\n",
                      sampleRate, blockSize, oversampler_.getRatio(), getLatency());
    }

    void reset() noexcept {
        oversampler_.reset();
        inner_.reset();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief One base-rate sample: N inner samples.
    [[nodiscard]] Sample process(Sample input) noexcept {
        Sample x = input;
        oversampler_.process(&x, 1, [this](Sample* hi, size_t n) {
            inner_.processBlock(hi, n);
        });
        return x;
    }

    /// @brief In place; blocks longer than the prepared size are chunked.
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        oversampler_.process(buffer, numSamples, [this](Sample* hi, size_t n) {
            inner_.processBlock(hi, n);
        });
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] size_t getLatency() const noexcept {
        const double innerLatency = static_cast<double>(inner_.getLatency())
                                  / static_cast<double>(oversampler_.getRatio());
        return static_cast<size_t>(std::lround(oversampler_.getLatencySamples() + innerLatency));
    }

    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }
    [[nodiscard]] size_t getRatio() const noexcept { return oversampler_.getRatio(); }

    /// Inner response times the up and down kernel responses
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept
        requires HasFrequencyResponse<Inner> {
        if (sampleRate_ <= 0.0) return {};
        const std::complex<double> h = inner_.frequencyResponse(hz).toComplex()
                                     * oversampler_.filterResponse(hz, sampleRate_);
        return FrequencyResponse::fromComplex(h);
    }

    [[nodiscard]] Inner& inner() noexcept { return inner_; }
    [[nodiscard]] const Inner& inner() const noexcept { return inner_; }
    [[nodiscard]] const Oversampler<Sample>& oversampler() const noexcept { return oversampler_; }

private:
    Oversampler<Sample> oversampler_;
    Inner inner_;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
