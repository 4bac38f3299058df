// ==============================================================================
// Layer 1: DSP Primitive - Real FFT
// ==============================================================================
// Forward real-to-complex transform via pffft, used by the response analyzer
// to measure what a node actually does against its linearized model.
//
// pffft ordered real output layout:
//   [DC_real, Nyquist_real, Re(1), Im(1), Re(2), Im(2), ...]
//
// Design Rules:
// - Allocation and SetupError only in prepare()
// - forward() is noexcept and allocation free
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/setup_error.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <complex>
#include <cstddef>
#include <memory>
#include <new>
#include <string>
#include <utility>

#include <pffft.h>

namespace Volta {
namespace DSP {

/// Smallest transform pffft accepts for real data
inline constexpr size_t kMinFFTSize = 32;

/// Largest transform the analyzer uses
inline constexpr size_t kMaxFFTSize = 65536;

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(float* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using PffftBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// SIMD-aligned float buffer owned by pffft's allocator
inline PffftBuffer makeAlignedBuffer(size_t numFloats) {
    auto* p = static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float)));
    if (p == nullptr) {
        throw std::bad_alloc();
    }
    std::fill_n(p, numFloats, 0.0f);
    return PffftBuffer{p};
}

} // namespace detail

/// @brief Real forward FFT of a fixed power-of-two size.
class FFT {
public:
    FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    /// @brief Allocate the pffft setup and aligned buffers.
    /// @param fftSize Power of two in [kMinFFTSize, kMaxFFTSize]
    /// @throws SetupError(InvalidConfiguration) for unsupported sizes
    void prepare(size_t fftSize) {
        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            detail::throwSetupError(SetupErrorCode::InvalidConfiguration, "FFT",
                                    "size " + std::to_string(fftSize)
                                    + " is not a power of two in [32, 65536]");
        }

        std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup(
            pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup) {
            detail::throwSetupError(SetupErrorCode::InvalidConfiguration, "FFT",
                                    "pffft rejected size " + std::to_string(fftSize));
        }

        auto input = detail::makeAlignedBuffer(fftSize);
        auto output = detail::makeAlignedBuffer(fftSize);
        auto work = detail::makeAlignedBuffer(fftSize);

        setup_ = std::move(setup);
        input_ = std::move(input);
        output_ = std::move(output);
        work_ = std::move(work);
        size_ = fftSize;
    }

    /// @brief Forward transform.
    /// @param input size() real samples
    /// @param output numBins() bins, DC to Nyquist, unnormalized
    void forward(const float* input, std::complex<float>* output) noexcept {
        if (!isPrepared() || input == nullptr || output == nullptr) return;

        const size_t n = size_;
        std::copy_n(input, n, input_.get());
        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(), work_.get(),
                                PFFFT_FORWARD);

        const float* bins = output_.get();
        output[0] = {bins[0], 0.0f};
        output[n / 2] = {bins[1], 0.0f};
        for (size_t k = 1; k < n / 2; ++k) {
            output[k] = {bins[2 * k], bins[2 * k + 1]};
        }
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] size_t numBins() const noexcept { return size_ / 2 + 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

private:
    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::PffftBuffer input_;
    detail::PffftBuffer output_;
    detail::PffftBuffer work_;
};

} // namespace DSP
} // namespace Volta
