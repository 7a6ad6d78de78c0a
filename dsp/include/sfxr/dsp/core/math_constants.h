// ==============================================================================
// Layer 0: Core Utility - Math and Stream Constants
// ==============================================================================
// Mathematical constants plus the fixed stream format every sound effect is
// rendered in.
//
// Real-Time Safety: constexpr only, no allocations.
// Layer 0: no dependencies on other DSP layers.
//
// Note: Constants are inline constexpr to ensure a single definition across
// all translation units.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
inline constexpr float kTwoPi = 2.0f * kPi;

// =============================================================================
// Stream Format
// =============================================================================

/// Output sample rate the synthesis formulas are tuned for. Output is mono.
/// The generator does not resample; play its output at this rate.
inline constexpr double kSfxSampleRate = 44100.0;

/// Raw oscillator samples averaged into every output frame
inline constexpr size_t kSfxSupersampleCount = 8;

} // namespace DSP
} // namespace Sfxr
