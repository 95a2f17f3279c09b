// ==============================================================================
// Layer 0: Core Utility - Audio Format Descriptor & Validation
// ==============================================================================
// Describes caller audio buffers (encoding, channel count, sample rate,
// layout) and gates them against what the denoiser accepts: 32-bit float at
// 48 kHz with at least one channel.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (validation is noexcept, no allocation)
// - Principle III: Modern C++ (constexpr, value semantics)
// - Principle IX: Layer 0 (no dependencies on higher layers)
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Hush {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// @brief The only sample rate the denoiser accepts, in Hz.
inline constexpr double kRequiredSampleRate = 48000.0;

/// @brief Rates closer than this to kRequiredSampleRate are accepted
/// (absorbs floating point rounding in host-reported rates).
inline constexpr double kSampleRateTolerance = 0.5;

// =============================================================================
// Format Descriptor
// =============================================================================

/// @brief Sample encoding of a caller buffer.
enum class SampleEncoding : uint8_t {
    Float32 = 0,
    Float64,
    Int16,
    Int32
};

/// @brief Immutable per-call description of a caller buffer's samples.
struct AudioFormat {
    SampleEncoding encoding = SampleEncoding::Float32;
    int channelCount = 1;
    double sampleRate = kRequiredSampleRate;   ///< Hz
    bool interleaved = false;                  ///< false = one array per channel
};

/// @brief Non-owning view of a caller audio buffer.
///
/// Planar buffers supply one pointer per channel in @c channelData;
/// interleaved buffers supply @c interleavedData holding
/// frameCount * channelCount samples. Only the pointer matching
/// @c format.interleaved is read, and only after the encoding has been
/// checked to be Float32.
struct AudioBufferView {
    AudioFormat format;
    std::size_t frameCount = 0;            ///< Samples per channel
    float* const* channelData = nullptr;   ///< Planar: format.channelCount pointers
    float* interleavedData = nullptr;      ///< Interleaved: single block

    /// @brief View over planar float channels at the given rate.
    [[nodiscard]] static AudioBufferView planar(float* const* channels, int channelCount,
                                                std::size_t frames,
                                                double sampleRate = kRequiredSampleRate) noexcept {
        AudioBufferView view;
        view.format.channelCount = channelCount;
        view.format.sampleRate = sampleRate;
        view.format.interleaved = false;
        view.frameCount = frames;
        view.channelData = channels;
        return view;
    }

    /// @brief View over an interleaved float block at the given rate.
    [[nodiscard]] static AudioBufferView interleavedFloat(float* samples, int channelCount,
                                                          std::size_t frames,
                                                          double sampleRate = kRequiredSampleRate) noexcept {
        AudioBufferView view;
        view.format.channelCount = channelCount;
        view.format.sampleRate = sampleRate;
        view.format.interleaved = true;
        view.frameCount = frames;
        view.interleavedData = samples;
        return view;
    }
};

// =============================================================================
// Format Errors
// =============================================================================

/// @brief Kind of validation failure. None means the input was accepted.
enum class FormatErrorKind : uint8_t {
    None = 0,
    UnsupportedSampleFormat,   ///< Encoding is not 32-bit float
    UnsupportedChannelCount,   ///< Channel count <= 0
    UnsupportedSampleRate      ///< Rate differs from kRequiredSampleRate
};

/// @brief Typed validation result.
///
/// Value type returned by every validating call. Only the fields relevant to
/// @c kind are meaningful.
struct FormatError {
    FormatErrorKind kind = FormatErrorKind::None;
    int channelCount = 0;            ///< UnsupportedChannelCount
    double expectedSampleRate = 0.0; ///< UnsupportedSampleRate
    double actualSampleRate = 0.0;   ///< UnsupportedSampleRate

    [[nodiscard]] constexpr bool isError() const noexcept {
        return kind != FormatErrorKind::None;
    }

    [[nodiscard]] static constexpr FormatError none() noexcept { return {}; }

    [[nodiscard]] static constexpr FormatError unsupportedSampleFormat() noexcept {
        FormatError e;
        e.kind = FormatErrorKind::UnsupportedSampleFormat;
        return e;
    }

    [[nodiscard]] static constexpr FormatError unsupportedChannelCount(int channels) noexcept {
        FormatError e;
        e.kind = FormatErrorKind::UnsupportedChannelCount;
        e.channelCount = channels;
        return e;
    }

    [[nodiscard]] static constexpr FormatError unsupportedSampleRate(double expected,
                                                                     double actual) noexcept {
        FormatError e;
        e.kind = FormatErrorKind::UnsupportedSampleRate;
        e.expectedSampleRate = expected;
        e.actualSampleRate = actual;
        return e;
    }

    constexpr bool operator==(const FormatError&) const noexcept = default;
};

// =============================================================================
// Validation
// =============================================================================

/// @brief Check a sample rate against kRequiredSampleRate.
/// @return UnsupportedSampleRate if |rate - 48000| >= kSampleRateTolerance
[[nodiscard]] inline FormatError validateSampleRate(double sampleRate) noexcept {
    // Written so that NaN rates are rejected too
    if (!(std::abs(sampleRate - kRequiredSampleRate) < kSampleRateTolerance)) {
        return FormatError::unsupportedSampleRate(kRequiredSampleRate, sampleRate);
    }
    return FormatError::none();
}

/// @brief Check encoding, channel count and sample rate, in that order.
/// @return The first failing check, or FormatErrorKind::None
[[nodiscard]] inline FormatError validateFormat(const AudioFormat& format) noexcept {
    if (format.encoding != SampleEncoding::Float32) {
        return FormatError::unsupportedSampleFormat();
    }
    if (format.channelCount <= 0) {
        return FormatError::unsupportedChannelCount(format.channelCount);
    }
    return validateSampleRate(format.sampleRate);
}

/// @brief Human readable description of a validation result.
[[nodiscard]] std::string describeFormatError(const FormatError& error);

} // namespace DSP
} // namespace Hush
