// ==============================================================================
// IFrameEngine - Interface for Fixed-Frame Denoising Engines
// ==============================================================================
// Layer 1: DSP Primitives (Interface)
//
// Abstract seam between the streaming layer and an engine that only accepts
// frames of exactly frameSize() samples. RnnoiseEngine is the production
// implementation; tests inject deterministic doubles.
//
// All implementations must be real-time safe:
// - No allocations in processFrame()
// - All operations noexcept
// ==============================================================================
#pragma once

#include <cstddef>

namespace Hush::DSP {

/// @brief Interface for engines that denoise fixed-size frames in place
///
/// @note frameSize() must stay constant for the lifetime of the engine.
class IFrameEngine {
public:
    virtual ~IFrameEngine() = default;

    /// @brief Number of samples in every frame passed to processFrame()
    [[nodiscard]] virtual std::size_t frameSize() const noexcept = 0;

    /// @brief Denoise one frame in place
    /// @param frame Exactly frameSize() samples, overwritten with the output
    /// @return Speech probability for the frame in [0, 1]
    virtual float processFrame(float* frame) noexcept = 0;

    /// @brief Return to the initial condition (equivalent to fresh construction)
    virtual void reset() noexcept = 0;
};

} // namespace Hush::DSP
