#pragma once
// ==============================================================================
// Fake Frame Engine
// ==============================================================================
// Deterministic IFrameEngine double. Records every frame it receives and
// applies a transform that depends on how many frames it has processed since
// the last reset, so misaligned or repeated frames change the output.
//
// The record is shared through a shared_ptr so tests can inspect it after
// ownership of the engine has moved into a StreamingDenoiser.
// ==============================================================================

#include <hush/dsp/primitives/i_frame_engine.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace TestHelpers {

struct FrameEngineRecord {
    std::mutex mutex;
    std::vector<std::vector<float>> frames;   ///< Input of every processed frame
    std::size_t resetCount = 0;

    std::size_t frameCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return frames.size();
    }
};

class FakeFrameEngine final : public Hush::DSP::IFrameEngine {
public:
    /// Output sample: input * kGain + (frames since reset)
    static constexpr float kGain = 0.5f;

    explicit FakeFrameEngine(std::size_t frameSize = 480,
                             std::shared_ptr<FrameEngineRecord> record = nullptr)
        : frameSize_(frameSize)
        , record_(record ? std::move(record) : std::make_shared<FrameEngineRecord>())
    {
    }

    [[nodiscard]] std::size_t frameSize() const noexcept override { return frameSize_; }

    float processFrame(float* frame) noexcept override {
        {
            std::lock_guard<std::mutex> lock(record_->mutex);
            record_->frames.emplace_back(frame, frame + frameSize_);
        }

        const auto offset = static_cast<float>(framesSinceReset_);
        for (std::size_t i = 0; i < frameSize_; ++i) {
            frame[i] = frame[i] * kGain + offset;
        }

        // Probability cycles 0, 0.25, 0.5, 0.75
        const float probability = static_cast<float>(framesSinceReset_ % 4) * 0.25f;
        ++framesSinceReset_;
        return probability;
    }

    void reset() noexcept override {
        framesSinceReset_ = 0;
        std::lock_guard<std::mutex> lock(record_->mutex);
        ++record_->resetCount;
    }

    [[nodiscard]] std::shared_ptr<FrameEngineRecord> record() const { return record_; }

    /// Expected output of the n-th frame after a reset for the given input
    [[nodiscard]] static float expectedSample(float input, std::size_t frameIndex) noexcept {
        return input * kGain + static_cast<float>(frameIndex);
    }

    /// Expected probability of the n-th frame after a reset
    [[nodiscard]] static float expectedProbability(std::size_t frameIndex) noexcept {
        return static_cast<float>(frameIndex % 4) * 0.25f;
    }

private:
    std::size_t frameSize_;
    std::shared_ptr<FrameEngineRecord> record_;
    std::size_t framesSinceReset_ = 0;
};

} // namespace TestHelpers
