// ==============================================================================
// Layer 1: DSP Primitive - Halfband FIR Filter
// ==============================================================================
// Linear-phase halfband lowpass used by the 2x oversampling stages.
//
// HalfbandKernel holds the designed taps. It is built once (Kaiser-windowed
// sinc, cutoff at a quarter of the filter's own rate) and shared read-only by
// every filter and oversampler that uses it; there is no global table.
// HalfbandFilter is the per-instance delay line running one kernel.
//
// Halfband property: every even offset from the centre tap is zero and the
// centre tap is 0.5. The odd taps are normalized to sum to 0.5 so DC passes
// with unity gain.
//
// Design Rules:
// - Real-Time Safety (allocation only in design()/prepare())
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/math_constants.h>
#include <volta/dsp/core/sample_traits.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace Volta {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief Filter quality preset: stopband rejection vs latency.
enum class OversamplingQuality : uint8_t {
    Standard,  ///< 31 taps, Kaiser beta 7.857 (~80 dB), 15 samples latency per stage
    High       ///< 63 taps, Kaiser beta 10.06 (~100 dB), 31 samples latency per stage
};

namespace detail {

/// Zeroth-order modified Bessel function of the first kind (power series)
[[nodiscard]] inline double besselI0(double x) noexcept {
    const double halfX = 0.5 * x;
    double term = 1.0;
    double sum = 1.0;
    for (int k = 1; k < 64; ++k) {
        term *= halfX / static_cast<double>(k);
        const double t2 = term * term;
        sum += t2;
        if (t2 < sum * 1e-17) break;
    }
    return sum;
}

} // namespace detail

// =============================================================================
// HalfbandKernel
// =============================================================================

/// @brief Immutable halfband FIR taps.
template<SampleType T>
class HalfbandKernel {
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    /// Only reachable through design(); the tag type is private
    explicit HalfbandKernel(ConstructionTag) noexcept {}

    /// @brief Design a Kaiser-windowed halfband kernel.
    /// @param numTaps Odd tap count with (numTaps - 1) / 2 odd, e.g. 31 or 63
    /// @param beta Kaiser window shape
    [[nodiscard]] static std::shared_ptr<const HalfbandKernel> design(size_t numTaps, double beta) {
        auto kernel = std::make_shared<HalfbandKernel>(ConstructionTag{});
        kernel->build(numTaps, beta);
        return kernel;
    }

    /// @brief Kernel for a quality preset.
    [[nodiscard]] static std::shared_ptr<const HalfbandKernel> forQuality(OversamplingQuality quality) {
        switch (quality) {
            case OversamplingQuality::High:     return design(63, 10.06);
            case OversamplingQuality::Standard: break;
        }
        return design(31, 7.857);
    }

    [[nodiscard]] size_t size() const noexcept { return taps_.size(); }
    [[nodiscard]] const T* data() const noexcept { return taps_.data(); }
    [[nodiscard]] T operator[](size_t i) const noexcept { return taps_[i]; }

    /// Group delay in samples at the filter's own rate
    [[nodiscard]] size_t getLatency() const noexcept { return (taps_.size() - 1) / 2; }

    /// @brief Complex response at normalized frequency f / fs (fs = filter rate).
    [[nodiscard]] std::complex<double> response(double normalizedFrequency) const noexcept {
        std::complex<double> sum{0.0, 0.0};
        const double omega = kTwoPi<double> * normalizedFrequency;
        for (size_t i = 0; i < taps_.size(); ++i) {
            sum += static_cast<double>(taps_[i])
                 * std::polar(1.0, -omega * static_cast<double>(i));
        }
        return sum;
    }

private:
    void build(size_t numTaps, double beta) {
        if (numTaps < 3) numTaps = 3;
        if (numTaps % 2 == 0) ++numTaps;
        const size_t center = (numTaps - 1) / 2;
        const double m = static_cast<double>(center) + 1.0;
        const double i0Beta = detail::besselI0(beta);

        std::vector<double> taps(numTaps, 0.0);
        double oddSum = 0.0;
        for (size_t k = 1; k <= center; k += 2) {
            const double kd = static_cast<double>(k);
            const double sinc = std::sin(kPi<double> * kd * 0.5) / (kPi<double> * kd);
            const double ratio = kd / m;
            const double window = detail::besselI0(beta * std::sqrt(1.0 - ratio * ratio)) / i0Beta;
            const double h = sinc * window;
            taps[center - k] = h;
            taps[center + k] = h;
            oddSum += 2.0 * h;
        }
        const double scale = (oddSum != 0.0) ? 0.5 / oddSum : 1.0;
        taps_.resize(numTaps);
        for (size_t i = 0; i < numTaps; ++i) {
            taps_[i] = static_cast<T>(taps[i] * scale);
        }
        taps_[center] = T(0.5);
    }

    std::vector<T> taps_;
};

// =============================================================================
// HalfbandFilter
// =============================================================================

/// @brief Stateful FIR running a shared HalfbandKernel.
///
/// The delay line is stored twice back to back so each output is one
/// contiguous dot product, with no shifting and no wraparound test.
template<SampleType T>
class HalfbandFilter {
public:
    HalfbandFilter() noexcept = default;

    explicit HalfbandFilter(std::shared_ptr<const HalfbandKernel<T>> kernel) {
        setKernel(std::move(kernel));
    }

    /// Bind a kernel and size the delay line (not RT safe)
    void setKernel(std::shared_ptr<const HalfbandKernel<T>> kernel) {
        kernel_ = std::move(kernel);
        const size_t n = kernel_ ? kernel_->size() : 0;
        history_.assign(2 * n, T(0));
        writePos_ = 0;
    }

    [[nodiscard]] T process(T input) noexcept {
        const size_t n = kernel_ ? kernel_->size() : 0;
        if (n == 0) return input;

        writePos_ = (writePos_ == 0) ? n - 1 : writePos_ - 1;
        history_[writePos_] = input;
        history_[writePos_ + n] = input;

        const T* x = history_.data() + writePos_;
        const T* h = kernel_->data();
        T acc = T(0);
        for (size_t i = 0; i < n; ++i) {
            acc += h[i] * x[i];
        }
        return flushDenormal(acc);
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    void reset() noexcept {
        std::fill(history_.begin(), history_.end(), T(0));
        writePos_ = 0;
    }

    [[nodiscard]] size_t getLatency() const noexcept {
        return kernel_ ? kernel_->getLatency() : 0;
    }

    [[nodiscard]] const std::shared_ptr<const HalfbandKernel<T>>& kernel() const noexcept {
        return kernel_;
    }

private:
    std::shared_ptr<const HalfbandKernel<T>> kernel_;
    std::vector<T> history_;
    size_t writePos_ = 0;
};

} // namespace DSP
} // namespace Volta
