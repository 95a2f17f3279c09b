// ==============================================================================
// StreamingDenoiser Implementation
// ==============================================================================

#include "streaming_denoiser.h"

#include "hush/dsp/core/downmix.h"
#include "hush/dsp/core/logging.h"

#include <stdexcept>
#include <utility>

namespace Hush::DSP {

namespace {

// describeFormatError allocates; only build the message when it will be emitted
void logRejectedBuffer(const FormatError& error) {
    if (getLogLevel() <= LogLevel::Debug) {
        HUSH_LOG_DEBUG("processStream rejected buffer: %s", describeFormatError(error).c_str());
    }
}

} // namespace

// =============================================================================
// Lifecycle
// =============================================================================

StreamingDenoiser::StreamingDenoiser()
    : StreamingDenoiser(std::make_unique<RnnoiseEngine>())
{
}

StreamingDenoiser::StreamingDenoiser(std::shared_ptr<const DenoiseModel> model)
    : StreamingDenoiser(std::make_unique<RnnoiseEngine>(std::move(model)))
{
}

StreamingDenoiser::StreamingDenoiser(std::unique_ptr<IFrameEngine> engine)
    : frameSize_(engine ? engine->frameSize() : 0)
    , state_{requireEngine(std::move(engine)), CarryoverBuffer(frameSize_)}
{
    HUSH_LOG_DEBUG("StreamingDenoiser created (frame size %zu)", frameSize_);
}

StreamingDenoiser::~StreamingDenoiser() = default;

std::unique_ptr<IFrameEngine> StreamingDenoiser::requireEngine(std::unique_ptr<IFrameEngine> engine) {
    if (!engine) {
        throw std::invalid_argument("StreamingDenoiser requires a frame engine");
    }
    if (engine->frameSize() == 0) {
        throw std::invalid_argument("StreamingDenoiser requires a non-zero frame size");
    }
    return engine;
}

// =============================================================================
// Streaming API
// =============================================================================

StreamResult StreamingDenoiser::processStream(std::span<const float> samples, double sampleRate) {
    StreamResult result;
    if (samples.empty()) {
        return result;
    }

    result.error = validateSampleRate(sampleRate);
    if (result.error.isError()) {
        HUSH_LOG_DEBUG("processStream rejected: %.3f Hz", sampleRate);
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FrameBatch batch = state_.carryover.ingest(samples, *state_.engine);
    result.samples = std::move(batch.samples);
    result.speechProbability = batch.speechProbability;
    return result;
}

StreamResult StreamingDenoiser::processStream(const AudioBufferView& buffer) {
    StreamResult result;
    result.error = validateFormat(buffer.format);
    if (result.error.isError()) {
        logRejectedBuffer(result.error);
        return result;
    }

    std::vector<float> mono;
    result.error = downmixToMono(buffer, mono);
    if (result.error.isError()) {
        logRejectedBuffer(result.error);
        return result;
    }

    if (mono.empty()) {
        return result;
    }

    return processStream(mono, buffer.format.sampleRate);
}

FrameBatch StreamingDenoiser::flush(bool processPartialFrame) {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.carryover.flush(*state_.engine, processPartialFrame);
}

void StreamingDenoiser::reset(bool resetDenoiseState) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.carryover.clear();
    if (resetDenoiseState) {
        state_.engine->reset();
    }
}

// =============================================================================
// Legacy In-Place API
// =============================================================================

void StreamingDenoiser::processInPlace(const AudioBufferView& buffer) {
    const AudioFormat& format = buffer.format;
    if (format.encoding != SampleEncoding::Float32
        || validateSampleRate(format.sampleRate).isError()
        || format.channelCount != 1
        || format.interleaved
        || buffer.channelData == nullptr
        || buffer.channelData[0] == nullptr) {
        HUSH_LOG_DEBUG("processInPlace ignored unsupported buffer");
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processWholeFramesLocked(buffer.channelData[0], buffer.frameCount);
}

void StreamingDenoiser::processInPlace(float* samples, std::size_t count) {
    if (samples == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    processWholeFramesLocked(samples, count);
}

void StreamingDenoiser::processWholeFramesLocked(float* samples, std::size_t count) noexcept {
    (void)processFramesInPlace(*state_.engine, samples, count / frameSize_);
}

// =============================================================================
// State Queries
// =============================================================================

std::size_t StreamingDenoiser::pendingSampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.carryover.pendingCount();
}

} // namespace Hush::DSP
