// ==============================================================================
// Layer 1: DSP Primitive - Delay Line / Sample Delay
// ==============================================================================
// Integer-sample circular delay line, plus two trivial processing nodes built
// on the processing contract:
// - SampleDelay: fixed delay of N samples, reports N samples of latency
// - IdentityProcessor: passes input through unchanged
//
// SampleDelay is what combinators use to delay-compensate parallel branches
// and what the feedback combinator uses for its mandatory unit delay.
//
// Design Rules:
// - Real-Time Safety (allocation only in prepare(), noexcept read/write)
// - Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/sample_traits.h>
#include <volta/dsp/core/setup_error.h>

#include <algorithm>
#include <complex>
#include <cstddef>
#include <vector>

namespace Volta {
namespace DSP {

/// @brief Next power of 2 greater than or equal to n.
inline constexpr size_t nextPowerOf2(size_t n) noexcept {
    if (n == 0) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

// =============================================================================
// DelayLine
// =============================================================================

/// @brief Circular buffer with power-of-2 size and integer reads.
template<SampleType T>
class DelayLine {
public:
    /// @brief Allocate storage for delays up to maxDelaySamples (not RT safe).
    void prepare(size_t maxDelaySamples) {
        maxDelaySamples_ = maxDelaySamples;
        buffer_.assign(nextPowerOf2(maxDelaySamples + 1), T(0));
        mask_ = buffer_.size() - 1;
        writeIndex_ = 0;
    }

    void reset() noexcept {
        std::fill(buffer_.begin(), buffer_.end(), T(0));
        writeIndex_ = 0;
    }

    void write(T sample) noexcept {
        if (buffer_.empty()) return;
        buffer_[writeIndex_] = sample;
        writeIndex_ = (writeIndex_ + 1) & mask_;
    }

    /// @brief Sample written delaySamples writes ago (0 = most recent).
    [[nodiscard]] T read(size_t delaySamples) const noexcept {
        if (buffer_.empty()) return T(0);
        const size_t clamped = std::min(delaySamples, maxDelaySamples_);
        return buffer_[(writeIndex_ - 1 - clamped) & mask_];
    }

    [[nodiscard]] size_t maxDelaySamples() const noexcept { return maxDelaySamples_; }

private:
    std::vector<T> buffer_;
    size_t mask_ = 0;
    size_t writeIndex_ = 0;
    size_t maxDelaySamples_ = 0;
};

// =============================================================================
// SampleDelay
// =============================================================================

/// @brief Processing node delaying its input by a fixed number of samples.
template<SampleType T>
class SampleDelay {
public:
    using Sample = T;

    SampleDelay() noexcept = default;

    explicit SampleDelay(size_t delaySamples) noexcept
        : delaySamples_(delaySamples) {}

    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "SampleDelay");
        line_.prepare(delaySamples_);
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
    }

    [[nodiscard]] T process(T input) noexcept {
        if (delaySamples_ == 0) return input;
        line_.write(input);
        return line_.read(delaySamples_);
    }

    void processBlock(T* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    void reset() noexcept { line_.reset(); }

    [[nodiscard]] size_t getDelay() const noexcept { return delaySamples_; }
    [[nodiscard]] size_t getLatency() const noexcept { return delaySamples_; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept {
        if (sampleRate_ <= 0.0) return {};
        return FrequencyResponse::fromComplex(
            std::pow(unitDelayAt(hz, sampleRate_), static_cast<double>(delaySamples_)));
    }

private:
    DelayLine<T> line_;
    size_t delaySamples_ = 0;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

// =============================================================================
// IdentityProcessor
// =============================================================================

/// @brief Processing node that returns its input unchanged.
template<SampleType T>
class IdentityProcessor {
public:
    using Sample = T;

    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "IdentityProcessor");
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
    }

    [[nodiscard]] T process(T input) noexcept { return input; }
    void processBlock(T*, size_t) noexcept {}
    void reset() noexcept {}

    [[nodiscard]] size_t getLatency() const noexcept { return 0; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    [[nodiscard]] FrequencyResponse frequencyResponse(double) const noexcept { return {}; }

private:
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
