// ==============================================================================
// Layer 4: User Feature - StreamingDenoiser
// ==============================================================================
// Stateful streaming RNNoise denoiser for 48 kHz float audio.
//
// Composes:
// - validateFormat / downmixToMono (Layer 0): input gating and mono mix
// - CarryoverBuffer (Layer 1): frame alignment across arbitrary chunks
// - IFrameEngine / RnnoiseEngine (Layer 1): per-frame denoising
//
// Thread Safety: every public method is serialized by one mutex that guards
// the engine and the carryover buffer as a single unit. The mutex provides
// per-call atomicity, not ordering between concurrent callers; feed one
// logical stream per instance.
//
// Error Handling: validation failures are returned in StreamResult::error
// before any state is touched. Nothing on the processing path throws.
// ==============================================================================

#pragma once

#include "hush/dsp/core/audio_format.h"
#include "hush/dsp/primitives/carryover_buffer.h"
#include "hush/dsp/primitives/i_frame_engine.h"
#include "hush/dsp/primitives/rnnoise_engine.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace Hush::DSP {

/// @brief Result of a streaming call: denoised samples, mean speech
/// probability of the frames processed by the call, and the validation error
/// (FormatErrorKind::None on success, in which case samples may still be
/// empty while a partial frame is buffered).
struct StreamResult {
    std::vector<float> samples;
    float speechProbability = 0.0f;
    FormatError error;

    [[nodiscard]] bool ok() const noexcept { return !error.isError(); }
};

/// @brief Streaming denoiser over a fixed-frame engine.
///
/// @par Usage
/// @code
/// StreamingDenoiser denoiser;
/// while (auto chunk = nextChunk()) {
///     auto result = denoiser.processStream(*chunk, 48000.0);
///     if (!result.ok()) { report(describeFormatError(result.error)); break; }
///     write(result.samples);
/// }
/// write(denoiser.flush().samples);
/// @endcode
class StreamingDenoiser {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief RNNoise engine with the built-in model.
    /// @throws std::bad_alloc if the engine state cannot be allocated
    StreamingDenoiser();

    /// @brief RNNoise engine with custom weights (nullptr = built-in model).
    /// @throws std::bad_alloc if the engine state cannot be allocated
    explicit StreamingDenoiser(std::shared_ptr<const DenoiseModel> model);

    /// @brief Any frame engine.
    /// @throws std::invalid_argument if @p engine is null or reports frame size 0
    explicit StreamingDenoiser(std::unique_ptr<IFrameEngine> engine);

    ~StreamingDenoiser();

    StreamingDenoiser(const StreamingDenoiser&) = delete;
    StreamingDenoiser& operator=(const StreamingDenoiser&) = delete;
    StreamingDenoiser(StreamingDenoiser&&) = delete;
    StreamingDenoiser& operator=(StreamingDenoiser&&) = delete;

    // =========================================================================
    // Streaming API
    // =========================================================================

    /// @brief Denoise mono 48 kHz samples, buffering any partial frame.
    ///
    /// Never drops samples: output covers only complete frames, the remainder
    /// waits for the next call or flush(). Empty input returns an empty result
    /// without checking @p sampleRate.
    ///
    /// @return UnsupportedSampleRate if |sampleRate - 48000| >= 0.5
    [[nodiscard]] StreamResult processStream(std::span<const float> samples, double sampleRate);

    /// @brief Validate, downmix to mono and denoise a caller buffer.
    ///
    /// Multi-channel input is averaged to mono before denoising; the buffer's
    /// own sample rate is used.
    ///
    /// @return UnsupportedSampleFormat, UnsupportedChannelCount or
    ///         UnsupportedSampleRate on invalid input
    [[nodiscard]] StreamResult processStream(const AudioBufferView& buffer);

    /// @brief Drain buffered carryover samples.
    /// @param processPartialFrame false: return pending samples unchanged.
    ///        true: zero-pad to one frame, denoise, return the original count
    [[nodiscard]] FrameBatch flush(bool processPartialFrame = false);

    /// @brief Drop carryover samples and optionally reset the engine state.
    void reset(bool resetDenoiseState = true);

    // =========================================================================
    // Legacy In-Place API
    // =========================================================================

    /// @brief Denoise whole frames of a mono planar 48 kHz float buffer in place.
    ///
    /// Silently ignores buffers in any other format. Trailing samples that do
    /// not fill a frame are left unprocessed, and the carryover buffer is
    /// neither read nor written.
    /// @throws std::system_error if the lock cannot be taken
    [[deprecated("Use processStream() to avoid dropping trailing samples.")]]
    void processInPlace(const AudioBufferView& buffer);

    /// @brief Denoise floor(count / frameSize()) whole frames in place.
    ///
    /// Trailing samples are left unprocessed; the carryover buffer is neither
    /// read nor written. A null pointer is ignored.
    /// @throws std::system_error if the lock cannot be taken
    [[deprecated("Use processStream() to avoid dropping trailing samples.")]]
    void processInPlace(float* samples, std::size_t count);

    // =========================================================================
    // State Queries
    // =========================================================================

    /// @brief Engine frame size N (480 for RNNoise).
    [[nodiscard]] std::size_t frameSize() const noexcept { return frameSize_; }

    /// @brief Samples currently held back waiting for a complete frame.
    [[nodiscard]] std::size_t pendingSampleCount() const;

private:
    // Engine and carryover change together, so one mutex guards both
    struct StreamState {
        std::unique_ptr<IFrameEngine> engine;
        CarryoverBuffer carryover;
    };

    static std::unique_ptr<IFrameEngine> requireEngine(std::unique_ptr<IFrameEngine> engine);

    void processWholeFramesLocked(float* samples, std::size_t count) noexcept;

    mutable std::mutex mutex_;
    std::size_t frameSize_;
    StreamState state_;
};

} // namespace Hush::DSP
