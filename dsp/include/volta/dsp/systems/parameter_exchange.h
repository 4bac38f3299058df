// ==============================================================================
// Layer 3: System Component - Parameter Exchange
// ==============================================================================
// Moves parameter values from a control thread to the audio thread without
// locks or waiting.
//
// ParameterExchange<N> is a triple buffer of parameter snapshots. The writer
// fills a private staging array and publishes it whole; the reader picks up
// the most recent complete snapshot once per block. One atomic word holds the
// index of the shared middle buffer plus a dirty bit:
//
//   writer: copy staging -> buffers[write]; write = exchange(write | dirty)
//   reader: if dirty: read = exchange(read) & index mask
//
// Intermediate publishes between two pulls are dropped, never torn.
//
// ParameterBinding<Node> pulls the snapshot, runs one smoother per parameter
// following the table's policy and forwards smoothed values to the node.
//
// Design Rules:
// - Exactly one writer thread and one reader thread per exchange
// - Real-Time Safety on the reader side (noexcept, no allocation, no locks)
// - Layer 3 (composes Layer 0-2)
// ==============================================================================

#pragma once

#include <volta/dsp/core/debug_log.h>
#include <volta/dsp/core/parameter_info.h>
#include <volta/dsp/core/processor_traits.h>
#include <volta/dsp/core/setup_error.h>
#include <volta/dsp/primitives/smoother.h>

#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Volta {
namespace DSP {

/// One complete set of real parameter values, indexed by ordinal
template<size_t N>
using ParameterSnapshot = std::array<double, N>;

// =============================================================================
// ParameterExchange
// =============================================================================

/// @brief Lock-free single-writer/single-reader snapshot of N parameters.
///
/// @par Thread Safety
/// set*(), getStaged() and publish() belong to the control thread;
/// pull() and snapshot() belong to the audio thread.
///
/// @par Usage Example
/// @code
/// // Control thread
/// exchange.set(LadderFilter<float>::kCutoffId, 440.0);
/// exchange.publish();
///
/// // Audio thread, once per block
/// if (exchange.pull()) {
///     const auto& values = exchange.snapshot();
/// }
/// @endcode
template<size_t N>
class ParameterExchange {
public:
    /// @throws SetupError(InvalidParameterTable) if the table is malformed
    explicit ParameterExchange(const ParameterTable<N>& table)
        : table_(table) {
        validateParameterTable(table_, "ParameterExchange");
        for (size_t i = 0; i < N; ++i) {
            staging_[i] = table_[i].defaultValue;
        }
        buffers_.fill(staging_);
    }

    ParameterExchange(const ParameterExchange&) = delete;
    ParameterExchange& operator=(const ParameterExchange&) = delete;

    // =========================================================================
    // Writer (control thread)
    // =========================================================================

    /// Stage a real value, clamped to the parameter's range
    void set(uint32_t ordinal, double value) noexcept {
        if (ordinal >= N || !std::isfinite(value)) return;
        staging_[ordinal] = table_[ordinal].clampValue(value);
    }

    /// Stage a normalized [0, 1] value
    void setNormalized(uint32_t ordinal, double normalized) noexcept {
        if (ordinal >= N || !std::isfinite(normalized)) return;
        staging_[ordinal] = table_[ordinal].fromNormalized(normalized);
    }

    /// Returns false when the name is not in the table
    bool setByName(std::string_view name, double value) noexcept {
        const auto ordinal = findParameter(table_, name);
        if (!ordinal) return false;
        set(*ordinal, value);
        return true;
    }

    [[nodiscard]] double getStaged(uint32_t ordinal) const noexcept {
        return (ordinal < N) ? staging_[ordinal] : 0.0;
    }

    /// Make everything staged so far visible to the reader
    void publish() noexcept {
        buffers_[writeIndex_] = staging_;
        const uint32_t previous = state_.exchange(writeIndex_ | kDirtyBit,
                                                  std::memory_order_acq_rel);
        writeIndex_ = previous & kIndexMask;
    }

    // =========================================================================
    // Reader (audio thread)
    // =========================================================================

    /// @brief Adopt the latest published snapshot.
    /// @return true if a new snapshot was published since the last pull
    bool pull() noexcept {
        if ((state_.load(std::memory_order_relaxed) & kDirtyBit) == 0) {
            return false;
        }
        const uint32_t previous = state_.exchange(readIndex_, std::memory_order_acq_rel);
        readIndex_ = previous & kIndexMask;
        return true;
    }

    [[nodiscard]] const ParameterSnapshot<N>& snapshot() const noexcept {
        return buffers_[readIndex_];
    }

    [[nodiscard]] const ParameterTable<N>& table() const noexcept { return table_; }

    static constexpr size_t size() noexcept { return N; }

private:
    static constexpr uint32_t kIndexMask = 0x3u;
    static constexpr uint32_t kDirtyBit = 0x4u;

    ParameterTable<N> table_;
    ParameterSnapshot<N> staging_{};
    std::array<ParameterSnapshot<N>, 3> buffers_{};

    // Middle buffer index | dirty bit; buffer 0 starts with the writer,
    // 1 in the middle, 2 with the reader
    alignas(64) std::atomic<uint32_t> state_{1u};
    alignas(64) uint32_t writeIndex_ = 0;
    alignas(64) uint32_t readIndex_ = 2;
};

// =============================================================================
// ParameterBinding
// =============================================================================

/// @brief Processing node that drives another node's parameters from an exchange.
///
/// Pulls once per processBlock(), then advances one SmoothedValue per
/// parameter every sample and calls node.setParameter() while a value is
/// still moving. Parameters with SmoothingPolicy::None jump on the first
/// sample of the block after a publish.
///
/// The bound node and exchange must outlive the binding.
template<typename Node>
    requires Processor<Node> && Parameterized<Node>
class ParameterBinding {
public:
    using Sample = typename Node::Sample;

    static constexpr size_t kNumParameters = Node::kParameters.size();

    using Exchange = ParameterExchange<kNumParameters>;

    ParameterBinding(Node& node, Exchange& exchange) noexcept
        : node_(node)
        , exchange_(exchange) {}

    /// @brief Prepare the node and jump every parameter to the current snapshot.
    /// @throws SetupError on invalid sample rate or block size
    void prepare(double sampleRate, size_t blockSize) {
        validateProcessSetup(sampleRate, blockSize, "ParameterBinding");
        node_.prepare(sampleRate, blockSize);
        exchange_.pull();
        const auto& values = exchange_.snapshot();
        for (size_t i = 0; i < kNumParameters; ++i) {
            const ParameterInfo& info = Node::kParameters[i];
            smoothers_[i].configure(info.smoothing, info.smoothingMs, sampleRate);
            smoothers_[i].snapTo(values[i]);
            pending_[i] = false;
            node_.setParameter(static_cast<uint32_t>(i), values[i]);
        }
        sampleRate_ = sampleRate;
        blockSize_ = blockSize;
        VOLTA_DSP_LOG("[volta] ParameterBinding prepared: %zu parameters at %.1f Hz\n",
                      kNumParameters, sampleRate);
    }

    /// Reset the node and finish all ramps
    void reset() noexcept {
        node_.reset();
        for (size_t i = 0; i < kNumParameters; ++i) {
            const double target = smoothers_[i].getTarget();
            smoothers_[i].snapTo(target);
            if (pending_[i]) {
                node_.setParameter(static_cast<uint32_t>(i), target);
                pending_[i] = false;
            }
        }
    }

    /// One smoothing step and one node sample; does not pull
    [[nodiscard]] Sample process(Sample input) noexcept {
        advanceSmoothers();
        return node_.process(input);
    }

    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (exchange_.pull()) {
            retarget();
        }
        processBlockPerSample(*this, buffer, numSamples);
    }

    [[nodiscard]] size_t getLatency() const noexcept { return node_.getLatency(); }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] size_t getBlockSize() const noexcept { return blockSize_; }

    [[nodiscard]] FrequencyResponse frequencyResponse(double hz) const noexcept
        requires HasFrequencyResponse<Node> {
        return node_.frequencyResponse(hz);
    }

    /// True while any parameter is still ramping towards its target
    [[nodiscard]] bool isSmoothing() const noexcept {
        for (bool p : pending_) {
            if (p) return true;
        }
        return false;
    }

    [[nodiscard]] Node& node() noexcept { return node_; }
    [[nodiscard]] const Node& node() const noexcept { return node_; }

private:
    void retarget() noexcept {
        const auto& values = exchange_.snapshot();
        for (size_t i = 0; i < kNumParameters; ++i) {
            if (values[i] != smoothers_[i].getTarget()) {
                smoothers_[i].setTarget(values[i]);
                pending_[i] = true;
            }
        }
    }

    void advanceSmoothers() noexcept {
        for (size_t i = 0; i < kNumParameters; ++i) {
            if (!pending_[i]) continue;
            double value = smoothers_[i].process();
            pending_[i] = !smoothers_[i].isComplete();
            if (!pending_[i]) {
                // Land exactly on the target once inside the completion threshold
                value = smoothers_[i].getTarget();
            }
            node_.setParameter(static_cast<uint32_t>(i), value);
        }
    }

    Node& node_;
    Exchange& exchange_;
    std::array<SmoothedValue<double>, kNumParameters> smoothers_{};
    std::array<bool, kNumParameters> pending_{};
    double sampleRate_ = 0.0;
    size_t blockSize_ = 0;
};

} // namespace DSP
} // namespace Volta
