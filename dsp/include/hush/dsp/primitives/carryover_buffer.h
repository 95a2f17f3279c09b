// ==============================================================================
// Layer 1: DSP Primitive - CarryoverBuffer
// ==============================================================================
// Adapts arbitrarily chunked sample streams to an engine that only accepts
// whole frames. Each ingest() emits the largest frame-aligned prefix of
// (pending ++ input) and keeps the remainder for the next call.
//
// Frame alignment depends only on the cumulative sample count, never on how
// the caller chunked the stream, so any split of the same input produces
// identical output.
//
// Invariant: pendingCount() < frameSize() after every operation.
//
// Not thread-safe; StreamingDenoiser serializes access.
// ==============================================================================

#pragma once

#include "i_frame_engine.h"

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace Hush::DSP {

/// @brief Processed samples plus the mean speech probability of the frames
/// that produced them (0 when no frame ran).
struct FrameBatch {
    std::vector<float> samples;
    float speechProbability = 0.0f;
};

/// @brief Run @p frameCount consecutive frames in place through @p engine.
/// @param samples At least frameCount * engine.frameSize() samples
/// @return Mean of the per-frame probabilities, 0 for zero frames
inline float processFramesInPlace(IFrameEngine& engine, float* samples,
                                  std::size_t frameCount) noexcept {
    if (frameCount == 0) {
        return 0.0f;
    }

    const std::size_t frameSize = engine.frameSize();
    float totalProbability = 0.0f;
    for (std::size_t frame = 0; frame < frameCount; ++frame) {
        totalProbability += engine.processFrame(samples + frame * frameSize);
    }
    return totalProbability / static_cast<float>(frameCount);
}

class CarryoverBuffer {
public:
    /// @param frameSize Engine frame size N; every engine passed in must match
    explicit CarryoverBuffer(std::size_t frameSize)
        : frameSize_(frameSize)
    {
        pending_.reserve(frameSize_);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Append @p input and denoise every complete frame.
    /// @return The frame-aligned prefix of pending ++ input after processing,
    ///         and the mean probability of those frames
    [[nodiscard]] FrameBatch ingest(std::span<const float> input, IFrameEngine& engine) {
        std::vector<float> combined;
        combined.reserve(pending_.size() + input.size());
        combined.insert(combined.end(), pending_.begin(), pending_.end());
        combined.insert(combined.end(), input.begin(), input.end());

        const std::size_t frameCount = combined.size() / frameSize_;
        if (frameCount == 0) {
            pending_.swap(combined);
            return {};
        }

        const std::size_t processed = frameCount * frameSize_;
        FrameBatch batch;
        batch.speechProbability = processFramesInPlace(engine, combined.data(), frameCount);

        pending_.assign(combined.begin() + static_cast<std::ptrdiff_t>(processed), combined.end());
        combined.resize(processed);
        batch.samples = std::move(combined);
        return batch;
    }

    /// @brief Drain the pending samples.
    /// @param processPartialFrame false: return pending unchanged with probability 0.
    ///        true: zero-pad to one frame, denoise it, and return only the
    ///        original pending length with that frame's probability
    [[nodiscard]] FrameBatch flush(IFrameEngine& engine, bool processPartialFrame) {
        if (pending_.empty()) {
            return {};
        }

        FrameBatch batch;
        if (!processPartialFrame) {
            batch.samples.assign(pending_.begin(), pending_.end());
            pending_.clear();
            return batch;
        }

        const std::size_t pendingCount = pending_.size();
        std::vector<float> padded(frameSize_, 0.0f);
        std::copy(pending_.begin(), pending_.end(), padded.begin());
        pending_.clear();

        batch.speechProbability = processFramesInPlace(engine, padded.data(), 1);
        padded.resize(pendingCount);
        batch.samples = std::move(padded);
        return batch;
    }

    /// @brief Drop pending samples (capacity is kept).
    void clear() noexcept { pending_.clear(); }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] std::size_t pendingCount() const noexcept { return pending_.size(); }

    [[nodiscard]] std::span<const float> pending() const noexcept { return pending_; }

    [[nodiscard]] std::size_t frameSize() const noexcept { return frameSize_; }

private:
    std::size_t frameSize_;
    std::vector<float> pending_;
};

} // namespace Hush::DSP
