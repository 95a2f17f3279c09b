// ==============================================================================
// Layer 0: Core Utility - Mono Downmix
// ==============================================================================
// Equal-weight average of a planar or interleaved float buffer into a single
// mono sequence. Channels are summed in index order in float precision and
// the 1/C scale is applied once per output sample.
//
// Planar accumulation and scaling run through Google Highway kernels
// (downmix_simd.cpp). Lane-wise add/mul is the same IEEE operation as the
// scalar loop, so SIMD and scalar paths produce identical samples.
//
// Constitution Compliance:
// - Principle III: Modern C++ (C++20)
// - Principle IX: Layer 0 (depends only on audio_format.h)
// ==============================================================================

#pragma once

#include "audio_format.h"

#include <cstddef>
#include <vector>

namespace Hush {
namespace DSP {

// =============================================================================
// SIMD Kernels (downmix_simd.cpp)
// =============================================================================

/// @brief dst[i] += src[i] for i in [0, count)
/// @note SIMD-accelerated with runtime ISA dispatch
void accumulateBulk(const float* src, float* dst, std::size_t count) noexcept;

/// @brief data[i] *= scale for i in [0, count)
/// @note SIMD-accelerated with runtime ISA dispatch
void scaleBulk(float* data, std::size_t count, float scale) noexcept;

// =============================================================================
// Downmix
// =============================================================================

/// @brief Average all channels of a float buffer into @p mono.
///
/// Re-validates the encoding and channel count (not the sample rate).
/// A zero-length buffer yields an empty @p mono without error.
///
/// @param buffer Caller buffer, planar or interleaved
/// @param mono Receives buffer.frameCount samples (cleared first)
/// @return UnsupportedSampleFormat for non-float encodings or missing data
///         pointers, UnsupportedChannelCount for channelCount <= 0
[[nodiscard]] inline FormatError downmixToMono(const AudioBufferView& buffer,
                                               std::vector<float>& mono) {
    mono.clear();

    if (buffer.format.encoding != SampleEncoding::Float32) {
        return FormatError::unsupportedSampleFormat();
    }

    const std::size_t frames = buffer.frameCount;
    if (frames == 0) {
        return FormatError::none();
    }

    const int channelCount = buffer.format.channelCount;
    if (channelCount <= 0) {
        return FormatError::unsupportedChannelCount(channelCount);
    }

    const auto channels = static_cast<std::size_t>(channelCount);
    const float scale = 1.0f / static_cast<float>(channelCount);

    if (!buffer.format.interleaved) {
        if (buffer.channelData == nullptr) {
            return FormatError::unsupportedSampleFormat();
        }
        for (std::size_t c = 0; c < channels; ++c) {
            if (buffer.channelData[c] == nullptr) {
                return FormatError::unsupportedSampleFormat();
            }
        }

        const float* first = buffer.channelData[0];
        mono.assign(first, first + frames);
        if (channels == 1) {
            return FormatError::none();
        }

        for (std::size_t c = 1; c < channels; ++c) {
            accumulateBulk(buffer.channelData[c], mono.data(), frames);
        }
        scaleBulk(mono.data(), frames, scale);
        return FormatError::none();
    }

    const float* interleaved = buffer.interleavedData;
    if (interleaved == nullptr) {
        return FormatError::unsupportedSampleFormat();
    }

    if (channels == 1) {
        mono.assign(interleaved, interleaved + frames);
        return FormatError::none();
    }

    mono.resize(frames);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        const float* slot = interleaved + frame * channels;
        float sum = 0.0f;
        for (std::size_t c = 0; c < channels; ++c) {
            sum += slot[c];
        }
        mono[frame] = sum * scale;
    }
    return FormatError::none();
}

} // namespace DSP
} // namespace Hush
