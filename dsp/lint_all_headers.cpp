// ==============================================================================
// SfxrDSP Lint Stub - Strict analysis of all public headers
// ==============================================================================
// Gives clang-tidy a .cpp translation unit that includes every public DSP
// header, so header-only code shows up in compile_commands.json.
//
// Compiled as a separate OBJECT library target (dsp_lint_stub). Not part of
// the SfxrDSP library itself.
// ==============================================================================

// Layer 0: Core
#include <sfxr/dsp/core/math_constants.h>
#include <sfxr/dsp/core/random.h>
#include <sfxr/dsp/core/sfx_params.h>
#include <sfxr/dsp/core/sfx_presets.h>

// Layer 1: Primitives
#include <sfxr/dsp/primitives/high_low_pass_filter.h>
#include <sfxr/dsp/primitives/sfx_envelope.h>
#include <sfxr/dsp/primitives/sfx_oscillator.h>
#include <sfxr/dsp/primitives/sfx_phaser.h>

// Layer 3: Systems
#include <sfxr/dsp/systems/sfx_generator.h>
