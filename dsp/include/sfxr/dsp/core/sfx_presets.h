// ==============================================================================
// Layer 0: Core Utility - Sound Effect Presets
// ==============================================================================
// Randomized starting points for common game sounds, and small random
// mutation of an existing definition. Every function draws from its own
// Xorshift32 seeded by the caller, so the same seed always gives the same
// parameters. Nothing here synthesizes audio.
// ==============================================================================

#pragma once

#include <sfxr/dsp/core/sfx_params.h>

#include <array>
#include <cstdint>
#include <string_view>

namespace Sfxr {
namespace DSP {
namespace Presets {

/// Coin or item pickup: bright square with punch, optional arpeggio up
[[nodiscard]] SfxParams pickup(uint32_t seed = 0);

/// Shot or laser: fast downward slide, optional phaser and high-pass
[[nodiscard]] SfxParams laser(uint32_t seed = 0);

/// Explosion: low noise, optional repeat, phaser, vibrato and arpeggio
[[nodiscard]] SfxParams explosion(uint32_t seed = 0);

/// Power-up: rising slide, either repeating or with vibrato
[[nodiscard]] SfxParams powerup(uint32_t seed = 0);

/// Hit or damage: short falling burst
[[nodiscard]] SfxParams hit(uint32_t seed = 0);

/// Jump: square with upward slide
[[nodiscard]] SfxParams jump(uint32_t seed = 0);

/// Blip or menu navigation: short high-passed tone
[[nodiscard]] SfxParams blip(uint32_t seed = 0);

/// Nudge each mutable field by up to +/-0.05 with a 1:1 chance, clamped to
/// its range. freqLimit and waveType are never changed.
void mutate(SfxParams& params, uint32_t seed = 0);

/// Names accepted by fromName(), in declaration order
inline constexpr std::array<std::string_view, 7> kPresetNames = {
    "pickup", "laser", "explosion", "powerup", "hit", "jump", "blip"
};

/// Build a preset by name.
/// @return false (and leaves `out` untouched) if the name is unknown
[[nodiscard]] bool fromName(std::string_view name, uint32_t seed, SfxParams& out);

} // namespace Presets
} // namespace DSP
} // namespace Sfxr
