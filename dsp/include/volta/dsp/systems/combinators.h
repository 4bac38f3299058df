// ==============================================================================
// Layer 3: System Component - Composition Combinators
// ==============================================================================
// Compile-time composition of processing nodes. Each combinator is itself a
// processing node, so graphs nest freely:
//
//   Series<A, B, C>        x -> A -> B -> C -> y          latency = sum
//   Parallel<A, B>         y = wA * A(x) + wB * B(x)      latency = max
//   Feedback<F, R>         y[n] = F(x[n] + g * R(y[n-1])) latency = F
//
// Parallel branches with less latency than the slowest branch are delayed
// by compensation lines allocated in prepare(). Feedback always inserts
// exactly one sample of delay in the loop; zero-delay loops across nodes are
// not expressible.
//
// Design Rules:
// - No virtual dispatch, children held by value in a std::tuple
// - Real-Time Safety (noexcept, allocation only in constructors and prepare())
// - Layer 3 (composes Layer 0-2)
// ==============================================================================

#pragma once

#include <volta/dsp/core/debug_log.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/sample_delay.h>
#include <volta/dsp/primitives/smoother.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace Volta {
namespace DSP {

namespace detail {

/// Sample rate and block size shared by all children of a combinator
struct CompositeConfig {
    double sampleRate = 0.0;
    size_t blockSize = 0;
};

/// @brief Collect the configuration of already-prepared children.
///
/// Unprepared children (sample rate 0) are skipped. Two prepared children
/// that disagree throw SetupError(BlockSizeMismatch).
template<typename... Nodes>
[[nodiscard]] CompositeConfig adoptChildConfiguration(const char* component,
                                                      const Nodes&... nodes) {
    CompositeConfig config;
    const auto check = [&](const auto& node) {
        const double sr = node.getSampleRate();
        const size_t bs = node.getBlockSize();
        if (sr <= 0.0) return;
        if (config.sampleRate <= 0.0) {
            config = {sr, bs};
            return;
        }
        if (sr != config.sampleRate || bs != config.blockSize) {
            throwSetupError(SetupErrorCode::BlockSizeMismatch, component,
                            "children prepared at " + std::to_string(config.sampleRate) + " Hz/"
                            + std::to_string(config.blockSize) + " and "
                            + std::to_string(sr) + " Hz/" + std::to_string(bs));
        }
    };
    (check(nodes), ...);
    return config;
}

/// Prepare every child that has not been prepared yet
template<typename... Nodes>
inline void prepareUnpreparedChildren(const CompositeConfig& config, Nodes&... nodes) {
    const auto prepareOne = [&](auto& node) {
        if (node.getSampleRate() <= 0.0) {
            node.prepare(config.sampleRate, config.blockSize);
        }
    };
    (prepareOne(nodes), ...);
}

template<typename First, typename... Rest>
inline constexpr bool kSameSampleType =
    (std::is_same_v<typename First::Sample, typename Rest::Sample> && ...);

} // namespace detail

// =============================================================================
// Series
// =============================================================================

/// @brief Chain of nodes, each feeding the next.
///
/// @code
/// Series chain(Waveshaper<float>{}, LadderFilter<float>{});
/// chain.prepare(48000.0, 128);
/// chain.get<1>().setCutoff(800.0f);
/// chain.processBlock(buffer, 128);
/// @endcode
template<Processor... Nodes>
class Series {
public:
    static_assert(sizeof...(Nodes) >= 1, "Series needs at least one node");
    static_assert(detail::kSameSampleType<Nodes...>, "Series nodes must share a sample type");

    using Sample = typename std::tuple_element_t<0, std::tuple<Nodes...>>::Sample;

    static constexpr size_t kNumNodes = sizeof...(Nodes);

    Series() = default;

    /// @throws SetupError(BlockSizeMismatch) if prepared nodes disagree
    explicit Series(Nodes... nodes)
        : nodes_(std::move(nodes)...) {
        adopt();
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "Series");
        std::apply([&](auto&... node) { (node.prepare(sampleRate, blockSize), ...); }, nodes_);
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        VOLTA_DSP_LOG("[volta] Series prepared: %zu nodes, latency=%zu\n", kNumNodes, getLatency());
    }

    void reset() noexcept {
        std::apply([](auto&... node) { (node.reset(), ...); }, nodes_);
    }

    [[nodiscard]] Sample process(Sample input) noexcept {
        Sample y = input;
        std::apply([&](auto&... node) { ((y = node.process(y)), ...); }, nodes_);
        return y;
    }

    /// Each node runs over the whole buffer in turn
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        std::apply([&](auto&... node) { (node.processBlock(buffer, numSamples), ...); }, nodes_);
    }

    [[nodiscard]] size_t getLatency() const noexcept {
        return std::apply([](const auto&... node) {
            return (size_t{0} + ... + static_cast<size_t>(node.getLatency()));
        }, nodes_);
    }

    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Product of the child responses
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept
        requires (HasFrequencyResponse<Nodes> && ...) {
        const std::complex<double> h = std::apply([hz](const auto&... node) {
            return (std::complex<double>{1.0, 0.0} * ... * node.frequencyResponse(hz).toComplex());
        }, nodes_);
        return FrequencyResponse::fromComplex(h);
    }

    template<size_t I>
    [[nodiscard]] auto& get() noexcept { return std::get<I>(nodes_); }

    template<size_t I>
    [[nodiscard]] const auto& get() const noexcept { return std::get<I>(nodes_); }

private:
    void adopt() {
        const auto config = std::apply([](const auto&... node) {
            return detail::adoptChildConfiguration("Series", node...);
        }, nodes_);
        if (config.sampleRate <= 0.0) return;
        std::apply([&](auto&... node) { detail::prepareUnpreparedChildren(config, node...); }, nodes_);
        sampleRate_ = config.sampleRate;
        blockSize_ = config.blockSize;
    }

    std::tuple<Nodes...> nodes_;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

// =============================================================================
// Parallel
// =============================================================================

/// @brief Branches fed the same input, outputs summed with per-branch weights.
///
/// With latency compensation enabled (the default) every branch is delayed to
/// the latency of the slowest branch, so the sum stays time aligned.
template<Processor... Branches>
class Parallel {
public:
    static_assert(sizeof...(Branches) >= 1, "Parallel needs at least one branch");
    static_assert(detail::kSameSampleType<Branches...>, "Parallel branches must share a sample type");

    using Sample = typename std::tuple_element_t<0, std::tuple<Branches...>>::Sample;

    static constexpr size_t kNumBranches = sizeof...(Branches);

    Parallel() {
        weights_.fill(Sample(1));
    }

    /// @throws SetupError(BlockSizeMismatch) if prepared branches disagree
    explicit Parallel(Branches... branches)
        : branches_(std::move(branches)...) {
        weights_.fill(Sample(1));
        const auto config = std::apply([](const auto&... b) {
            return detail::adoptChildConfiguration("Parallel", b...);
        }, branches_);
        if (config.sampleRate > 0.0) {
            std::apply([&](auto&... b) { detail::prepareUnpreparedChildren(config, b...); }, branches_);
            configure(config.sampleRate, config.blockSize);
        }
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "Parallel");
        std::apply([&](auto&... b) { (b.prepare(sampleRate, blockSize), ...); }, branches_);
        configure(sampleRate, blockSize);
        VOLTA_DSP_LOG("[volta] Parallel prepared: %zu branches, latency=%zu\n",
                      kNumBranches, getLatency());
    }

    void reset() noexcept {
        std::apply([](auto&... b) { (b.reset(), ...); }, branches_);
        for (auto& d : delays_) d.reset();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Output weight of branch index; ignored when out of range or non-finite
    void setWeight(size_t index, Sample weight) noexcept {
        if (index >= kNumBranches || !std::isfinite(weight)) return;
        weights_[index] = weight;
    }

    [[nodiscard]] Sample getWeight(size_t index) const noexcept {
        return (index < kNumBranches) ? weights_[index] : Sample(0);
    }

    /// Compensation lines are always allocated; toggling clears them.
    void setLatencyCompensation(bool enabled) noexcept {
        if (enabled == compensate_) return;
        compensate_ = enabled;
        for (auto& d : delays_) d.reset();
    }

    [[nodiscard]] bool isLatencyCompensationEnabled() const noexcept { return compensate_; }

    /// Compensation delay applied to branch index
    [[nodiscard]] size_t getCompensationDelay(size_t index) const noexcept {
        return (index < kNumBranches) ? delays_[index].getDelay() : 0;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] Sample process(Sample input) noexcept {
        Sample sum = Sample(0);
        forEachBranch([&]<size_t I>(auto& branch) {
            Sample y = branch.process(input);
            if (compensate_) {
                y = delays_[I].process(y);
            }
            sum += weights_[I] * y;
        });
        return sum;
    }

    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) return;
        if (blockSize_ == 0) {
            processBlockPerSample(*this, buffer, numSamples);
            return;
        }
        for (size_t offset = 0; offset < numSamples; offset += blockSize_) {
            const size_t n = std::min(blockSize_, numSamples - offset);
            Sample* block = buffer + offset;
            std::copy(block, block + n, input_.begin());
            std::fill(accumulator_.begin(), accumulator_.begin() + static_cast<std::ptrdiff_t>(n),
                      Sample(0));

            forEachBranch([&]<size_t I>(auto& branch) {
                std::copy(input_.begin(), input_.begin() + static_cast<std::ptrdiff_t>(n),
                          work_.begin());
                branch.processBlock(work_.data(), n);
                if (compensate_) {
                    delays_[I].processBlock(work_.data(), n);
                }
                const Sample w = weights_[I];
                for (size_t i = 0; i < n; ++i) {
                    accumulator_[i] += w * work_[i];
                }
            });

            std::copy(accumulator_.begin(), accumulator_.begin() + static_cast<std::ptrdiff_t>(n),
                      block);
        }
    }

    [[nodiscard]] size_t getLatency() const noexcept {
        return std::apply([](const auto&... b) {
            return std::max({size_t{0}, static_cast<size_t>(b.getLatency())...});
        }, branches_);
    }

    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// Weighted sum of branch responses, compensation delays included
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept
        requires (HasFrequencyResponse<Branches> && ...) {
        std::complex<double> sum{0.0, 0.0};
        [&]<size_t... I>(std::index_sequence<I...>) {
            ((sum += static_cast<double>(weights_[I])
                   * std::get<I>(branches_).frequencyResponse(hz).toComplex()
                   * (compensate_ ? delays_[I].frequencyResponse(hz).toComplex()
                                  : std::complex<double>{1.0, 0.0})), ...);
        }(std::make_index_sequence<kNumBranches>{});
        return FrequencyResponse::fromComplex(sum);
    }

    template<size_t I>
    [[nodiscard]] auto& get() noexcept { return std::get<I>(branches_); }

    template<size_t I>
    [[nodiscard]] const auto& get() const noexcept { return std::get<I>(branches_); }

private:
    template<typename F>
    void forEachBranch(F&& f) noexcept {
        [&]<size_t... I>(std::index_sequence<I...>) {
            (f.template operator()<I>(std::get<I>(branches_)), ...);
        }(std::make_index_sequence<kNumBranches>{});
    }

    /// Rebuild compensation lines and scratch buffers; children already prepared
    void configure(double sampleRate, size_t blockSize) {
        const size_t maxLatency = getLatency();
        size_t index = 0;
        std::apply([&](const auto&... b) {
            ((delays_[index++] = SampleDelay<Sample>(maxLatency - static_cast<size_t>(b.getLatency()))), ...);
        }, branches_);
        for (auto& d : delays_) {
            d.prepare(sampleRate, blockSize);
        }

        input_.assign(blockSize, Sample(0));
        work_.assign(blockSize, Sample(0));
        accumulator_.assign(blockSize, Sample(0));

        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
    }

    std::tuple<Branches...> branches_;
    std::array<Sample, kNumBranches> weights_{};
    std::array<SampleDelay<Sample>, kNumBranches> delays_{};
    std::vector<Sample> input_;
    std::vector<Sample> work_;
    std::vector<Sample> accumulator_;
    bool compensate_ = true;
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

// =============================================================================
// Feedback
// =============================================================================

/// @brief Forward node with its output fed back to its input one sample later.
///
///   r    = Return(y[n-1])
///   y[n] = Forward(x[n] + g * r)
///
/// The loop gain g ramps linearly over kGainRampMs to avoid zipper noise and
/// defaults to 0. The loop is stable while |g * H(f) * R(f)| < 1 for the
/// linearized forward/return responses; larger gains are accepted and left
/// to the forward node's saturation.
template<Processor Forward, Processor Return = IdentityProcessor<typename Forward::Sample>>
class Feedback {
public:
    static_assert(std::is_same_v<typename Forward::Sample, typename Return::Sample>,
                  "Feedback forward and return nodes must share a sample type");

    using Sample = typename Forward::Sample;

    static constexpr double kMaxGain = 4.0;
    static constexpr float kGainRampMs = 10.0f;

    Feedback() = default;

    /// @throws SetupError(BlockSizeMismatch) if prepared nodes disagree
    explicit Feedback(Forward forward, Return feedback = Return{})
        : forward_(std::move(forward))
        , return_(std::move(feedback)) {
        const auto config = detail::adoptChildConfiguration("Feedback", forward_, return_);
        if (config.sampleRate > 0.0) {
            detail::prepareUnpreparedChildren(config, forward_, return_);
            gain_.configure(kGainRampMs, config.sampleRate);
            sampleRate_ = config.sampleRate;
            blockSize_ = config.blockSize;
        }
    }

    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "Feedback");
        forward_.prepare(sampleRate, blockSize);
        return_.prepare(sampleRate, blockSize);
        gain_.configure(kGainRampMs, sampleRate);
        gain_.snapToTarget();
        lastOutput_ = Sample(0);
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
    }

    void reset() noexcept {
        forward_.reset();
        return_.reset();
        gain_.snapToTarget();
        lastOutput_ = Sample(0);
    }

    /// Loop gain g, clamped to [-kMaxGain, kMaxGain]
    void setFeedbackGain(Sample gain) noexcept {
        if (!std::isfinite(gain)) return;
        gain_.setTarget(static_cast<Sample>(std::clamp(static_cast<double>(gain), -kMaxGain, kMaxGain)));
    }

    [[nodiscard]] Sample getFeedbackGain() const noexcept { return gain_.getTarget(); }

    [[nodiscard]] Sample process(Sample input) noexcept {
        const Sample g = gain_.process();
        const Sample r = return_.process(lastOutput_);
        const Sample y = forward_.process(input + g * r);
        lastOutput_ = y;
        return y;
    }

    /// Strictly per sample; the loop delay is one sample
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return forward_.getLatency(); }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    /// H / (1 - g H R z^-1) at the target gain
    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept
        requires HasFrequencyResponse<Forward> && HasFrequencyResponse<Return> {
        if (sampleRate_ <= 0.0) return forward_.frequencyResponse(hz);
        const std::complex<double> h = forward_.frequencyResponse(hz).toComplex();
        const std::complex<double> r = return_.frequencyResponse(hz).toComplex();
        const double g = static_cast<double>(gain_.getTarget());
        return FrequencyResponse::fromComplex(h / (1.0 - g * h * r * unitDelayAt(hz, sampleRate_)));
    }

    [[nodiscard]] Forward& forward() noexcept { return forward_; }
    [[nodiscard]] const Forward& forward() const noexcept { return forward_; }
    [[nodiscard]] Return& feedback() noexcept { return return_; }
    [[nodiscard]] const Return& feedback() const noexcept { return return_; }

private:
    Forward forward_{};
    Return return_{};
    LinearRamp<Sample> gain_{};
    Sample lastOutput_ = Sample(0);
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
