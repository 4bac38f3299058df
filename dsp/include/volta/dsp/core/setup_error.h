// ==============================================================================
// Layer 0: Core Utility - Setup Errors
// ==============================================================================
// Configuration errors detected at construction/prepare time. Processing
// paths never throw; everything that can be rejected is rejected here, before
// the first sample.
//
// Design Rules:
// - Fail fast: a rejected prepare() leaves the previous configuration intact
// - Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <volta/dsp/core/debug_log.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Volta {
namespace DSP {

// =============================================================================
// SetupErrorCode
// =============================================================================

/// @brief Category of a setup-time failure.
enum class SetupErrorCode : uint8_t {
    InvalidSampleRate,         ///< Sample rate <= 0 or not finite
    InvalidBlockSize,          ///< Block size of zero
    InvalidOversamplingRatio,  ///< Ratio outside {1, 2, 4, 8, 16}
    BlockSizeMismatch,         ///< Composed nodes disagree on block size or rate
    InvalidParameterTable,     ///< Malformed parameter table
    InvalidConfiguration       ///< Any other rejected setting
};

/// @brief Human-readable name of an error code.
[[nodiscard]] inline const char* toString(SetupErrorCode code) noexcept {
    switch (code) {
        case SetupErrorCode::InvalidSampleRate:        return "invalid sample rate";
        case SetupErrorCode::InvalidBlockSize:         return "invalid block size";
        case SetupErrorCode::InvalidOversamplingRatio: return "invalid oversampling ratio";
        case SetupErrorCode::BlockSizeMismatch:        return "block size mismatch";
        case SetupErrorCode::InvalidParameterTable:    return "invalid parameter table";
        case SetupErrorCode::InvalidConfiguration:     return "invalid configuration";
    }
    return "unknown setup error";
}

// =============================================================================
// SetupError
// =============================================================================

/// @brief Exception thrown when a node cannot be configured as requested.
///
/// The message names the component and the offending value, e.g.
/// "Oversampler: invalid oversampling ratio (3); expected 1, 2, 4, 8 or 16".
class SetupError : public std::invalid_argument {
public:
    SetupError(SetupErrorCode code, const std::string& message)
        : std::invalid_argument(message)
        , code_(code) {}

    [[nodiscard]] SetupErrorCode code() const noexcept { return code_; }

private:
    SetupErrorCode code_;
};

namespace detail {

[[noreturn]] inline void throwSetupError(SetupErrorCode code,
                                         const char* component,
                                         const std::string& detail) {
    std::string message = std::string(component) + ": " + toString(code);
    if (!detail.empty()) {
        message += " (" + detail + ")";
    }
    VOLTA_DSP_LOG("[volta] setup rejected: %s\n", message.c_str());
    throw SetupError(code, message);
}

} // namespace detail

// =============================================================================
// Validation Helpers
// =============================================================================

/// Throws SetupError unless sampleRate is finite and > 0
inline void validateSampleRate(double sampleRate, const char* component) {
    if (!std::isfinite(sampleRate) || sampleRate <= 0.0) {
        detail::throwSetupError(SetupErrorCode::InvalidSampleRate, component,
                                std::to_string(sampleRate));
    }
}

/// Throws SetupError when blockSize is zero
inline void validateBlockSize(size_t blockSize, const char* component) {
    if (blockSize == 0) {
        detail::throwSetupError(SetupErrorCode::InvalidBlockSize, component,
                                "block size must be at least 1");
    }
}

/// Largest supported oversampling ratio
inline constexpr size_t kMaxOversamplingRatio = 16;

/// True when ratio is a power of two in [1, kMaxOversamplingRatio]
[[nodiscard]] constexpr bool isValidOversamplingRatio(size_t ratio) noexcept {
    return ratio >= 1 && ratio <= kMaxOversamplingRatio && (ratio & (ratio - 1)) == 0;
}

/// Throws SetupError unless ratio is 1, 2, 4, 8 or 16
inline void validateOversamplingRatio(size_t ratio, const char* component) {
    if (!isValidOversamplingRatio(ratio)) {
        detail::throwSetupError(SetupErrorCode::InvalidOversamplingRatio, component,
                                std::to_string(ratio) + "; expected 1, 2, 4, 8 or 16");
    }
}

/// Validate the (sampleRate, blockSize) pair every prepare() receives
inline void validateProcessSetup(double sampleRate, size_t blockSize, const char* component) {
    validateSampleRate(sampleRate, component);
    validateBlockSize(blockSize, component);
}

} // namespace DSP
} // namespace Volta
