// ==============================================================================
// Layer 1: DSP Primitive - RnnoiseEngine
// ==============================================================================
// IFrameEngine over the RNNoise C library. Owns one DenoiseState for its
// whole lifetime and optionally shares a custom weight set (DenoiseModel).
//
// RNNoise works on 480-sample frames at 48 kHz and returns a per-frame voice
// activity probability.
// ==============================================================================

#pragma once

#include "i_frame_engine.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

struct DenoiseState;
struct RNNModel;

namespace Hush::DSP {

/// @brief Custom RNNoise weights.
///
/// Immutable once loaded. Engines hold a shared_ptr so the weights outlive
/// every DenoiseState built from them.
class DenoiseModel {
public:
    ~DenoiseModel();

    DenoiseModel(const DenoiseModel&) = delete;
    DenoiseModel& operator=(const DenoiseModel&) = delete;

    /// @brief Load weights from a model file.
    /// @return nullptr (and an error log) if the file cannot be read or does
    ///         not hold valid weights
    [[nodiscard]] static std::shared_ptr<const DenoiseModel> fromFile(
        const std::filesystem::path& path);

    /// @brief Load weights from an in-memory blob. The bytes are copied.
    /// @return nullptr (and an error log) if the blob is not a valid model
    [[nodiscard]] static std::shared_ptr<const DenoiseModel> fromBuffer(
        std::span<const std::byte> bytes);

    /// @brief Underlying RNNoise handle, valid for the lifetime of this object
    [[nodiscard]] RNNModel* handle() const noexcept { return model_; }

private:
    DenoiseModel(RNNModel* model, std::vector<std::byte> storage) noexcept;

    RNNModel* model_ = nullptr;
    std::vector<std::byte> storage_;   // backs model_ when loaded from a buffer
};

/// @brief RNNoise frame engine.
///
/// @par Usage
/// @code
/// RnnoiseEngine engine;                      // default weights
/// std::vector<float> frame(engine.frameSize());
/// float vad = engine.processFrame(frame.data());
/// @endcode
class RnnoiseEngine final : public IFrameEngine {
public:
    /// @brief Create a denoise state.
    /// @param model Custom weights, or nullptr for the built-in model
    /// @throws std::bad_alloc if RNNoise cannot allocate its state
    explicit RnnoiseEngine(std::shared_ptr<const DenoiseModel> model = nullptr);
    ~RnnoiseEngine() override;

    RnnoiseEngine(const RnnoiseEngine&) = delete;
    RnnoiseEngine& operator=(const RnnoiseEngine&) = delete;

    [[nodiscard]] std::size_t frameSize() const noexcept override { return frameSize_; }

    float processFrame(float* frame) noexcept override;

    void reset() noexcept override;

    /// @brief Frame size reported by the linked RNNoise library
    [[nodiscard]] static std::size_t nativeFrameSize() noexcept;

private:
    std::shared_ptr<const DenoiseModel> model_;
    DenoiseState* state_ = nullptr;
    std::size_t frameSize_ = 0;
};

} // namespace Hush::DSP
