// ==============================================================================
// HushDSP Lint Stub - Analysis of all public headers
// ==============================================================================
// Gives clang-tidy a .cpp translation unit that includes every public DSP
// header, so header-only code (CarryoverBuffer, downmixToMono) is checked
// even when nothing in the library instantiates it.
//
// Not part of the HushDSP library; compiled as a separate OBJECT target
// (dsp_lint_stub) so it appears in compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <hush/dsp/core/audio_format.h>
#include <hush/dsp/core/downmix.h>
#include <hush/dsp/core/logging.h>

// Layer 1: Primitives
#include <hush/dsp/primitives/carryover_buffer.h>
#include <hush/dsp/primitives/i_frame_engine.h>
#include <hush/dsp/primitives/rnnoise_engine.h>

// Layer 4: Effects
#include <hush/dsp/effects/streaming_denoiser.h>
