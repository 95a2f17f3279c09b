// ==============================================================================
// RnnoiseEngine Implementation
// ==============================================================================

#include "rnnoise_engine.h"

#include "hush/dsp/core/logging.h"

#include <climits>
#include <new>
#include <string>
#include <system_error>
#include <utility>

extern "C" {
#include <rnnoise.h>
}

namespace Hush::DSP {

namespace {

// Loading only records the blob; the weights are parsed by rnnoise_init, so
// build and discard one state to find out whether they are usable.
bool weightsAreUsable(RNNModel* model) noexcept {
    DenoiseState* state = rnnoise_create(model);
    if (state == nullptr) {
        return false;
    }
    rnnoise_destroy(state);
    return true;
}

} // namespace

// =============================================================================
// DenoiseModel
// =============================================================================

DenoiseModel::DenoiseModel(RNNModel* model, std::vector<std::byte> storage) noexcept
    : model_(model)
    , storage_(std::move(storage))
{
}

DenoiseModel::~DenoiseModel() {
    if (model_ != nullptr) {
        rnnoise_model_free(model_);
        model_ = nullptr;
    }
}

std::shared_ptr<const DenoiseModel> DenoiseModel::fromFile(const std::filesystem::path& path) {
    const std::string pathString = path.string();

    // rnnoise_model_from_filename does not check fopen's result
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        HUSH_LOG_ERROR("RNNoise model file not found: %s", pathString.c_str());
        return nullptr;
    }

    RNNModel* model = rnnoise_model_from_filename(pathString.c_str());
    if (model == nullptr) {
        HUSH_LOG_ERROR("Failed to load RNNoise model from file: %s", pathString.c_str());
        return nullptr;
    }
    if (!weightsAreUsable(model)) {
        rnnoise_model_free(model);
        HUSH_LOG_ERROR("Invalid RNNoise weights in file: %s", pathString.c_str());
        return nullptr;
    }

    HUSH_LOG_INFO("Loaded RNNoise model: %s", pathString.c_str());
    return std::shared_ptr<const DenoiseModel>(new DenoiseModel(model, {}));
}

std::shared_ptr<const DenoiseModel> DenoiseModel::fromBuffer(std::span<const std::byte> bytes) {
    if (bytes.empty() || bytes.size() > static_cast<std::size_t>(INT_MAX)) {
        HUSH_LOG_ERROR("Invalid RNNoise model blob size: %zu bytes", bytes.size());
        return nullptr;
    }

    // RNNoise references the blob for the model's lifetime, so keep our own copy
    std::vector<std::byte> storage(bytes.begin(), bytes.end());
    RNNModel* model = rnnoise_model_from_buffer(storage.data(), static_cast<int>(storage.size()));
    if (model == nullptr) {
        HUSH_LOG_ERROR("Failed to load RNNoise model from %zu byte blob", bytes.size());
        return nullptr;
    }
    if (!weightsAreUsable(model)) {
        rnnoise_model_free(model);
        HUSH_LOG_ERROR("Invalid RNNoise weights in %zu byte blob", bytes.size());
        return nullptr;
    }

    return std::shared_ptr<const DenoiseModel>(new DenoiseModel(model, std::move(storage)));
}

// =============================================================================
// RnnoiseEngine
// =============================================================================

RnnoiseEngine::RnnoiseEngine(std::shared_ptr<const DenoiseModel> model)
    : model_(std::move(model))
    , frameSize_(nativeFrameSize())
{
    state_ = rnnoise_create(model_ ? model_->handle() : nullptr);
    if (state_ == nullptr) {
        HUSH_LOG_ERROR("rnnoise_create failed");
        throw std::bad_alloc();
    }

    HUSH_LOG_DEBUG("RNNoise state created (frame size %zu, %s model)",
                   frameSize_, model_ ? "custom" : "default");
}

RnnoiseEngine::~RnnoiseEngine() {
    if (state_ != nullptr) {
        rnnoise_destroy(state_);
        state_ = nullptr;
    }
}

float RnnoiseEngine::processFrame(float* frame) noexcept {
    // RNNoise allows out == in
    return rnnoise_process_frame(state_, frame, frame);
}

void RnnoiseEngine::reset() noexcept {
    if (rnnoise_init(state_, model_ ? model_->handle() : nullptr) != 0) {
        HUSH_LOG_WARNING("rnnoise_init failed while resetting denoise state");
    }
}

std::size_t RnnoiseEngine::nativeFrameSize() noexcept {
    return static_cast<std::size_t>(rnnoise_get_frame_size());
}

} // namespace Hush::DSP
