// ==============================================================================
// Sound Effect Presets Implementation
// ==============================================================================
// The random ranges are the classic sfxr generator buttons. Some ranges are
// written high-to-low on purpose; nextInRange() accepts either order.
// ==============================================================================

#include "sfx_presets.h"

#include <sfxr/dsp/core/random.h>

#include <algorithm>

namespace Sfxr {
namespace DSP {
namespace Presets {

namespace {

template <size_t N>
WaveType pickWave(Xorshift32& rng, const std::array<WaveType, N>& choices) noexcept {
    return choices[rng.nextIndex(static_cast<uint32_t>(N))];
}

} // anonymous namespace

SfxParams pickup(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.baseFreq = rng.nextInRange(0.4f, 0.9f);
    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.0f, 0.1f);
    p.envDecay = rng.nextInRange(0.1f, 0.5f);
    p.envPunch = rng.nextInRange(0.3f, 0.6f);

    if (rng.chance(1, 1)) {
        p.arpSpeed = rng.nextInRange(0.5f, 0.7f);
        p.arpMod = rng.nextInRange(0.2f, 0.6f);
    }

    return p;
}

SfxParams laser(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.waveType = pickWave(rng, std::array{WaveType::Square, WaveType::Square,
                                          WaveType::Sine, WaveType::Sine,
                                          WaveType::Triangle});

    if (rng.chance(1, 2)) {
        p.baseFreq = rng.nextInRange(0.3f, 0.9f);
        p.freqLimit = rng.nextInRange(0.0f, 0.1f);
        p.freqRamp = rng.nextInRange(-0.35f, -0.65f);
    } else {
        p.baseFreq = rng.nextInRange(0.5f, 1.0f);
        p.freqLimit = std::max(p.baseFreq - rng.nextInRange(0.2f, 0.8f), 0.2f);
        p.freqRamp = rng.nextInRange(-0.15f, -0.35f);
    }

    if (rng.chance(1, 1)) {
        p.duty = rng.nextInRange(0.0f, 0.5f);
        p.dutyRamp = rng.nextInRange(0.0f, 0.2f);
    } else {
        p.duty = rng.nextInRange(0.4f, 0.9f);
        p.dutyRamp = rng.nextInRange(0.0f, -0.7f);
    }

    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.1f, 0.3f);
    p.envDecay = rng.nextInRange(0.0f, 0.4f);

    if (rng.chance(1, 1)) {
        p.envPunch = rng.nextInRange(0.0f, 0.3f);
    }

    if (rng.chance(1, 2)) {
        p.phaOffset = rng.nextInRange(0.0f, 0.2f);
        p.phaRamp = -rng.nextInRange(0.0f, 0.2f);
    }

    if (rng.chance(1, 1)) {
        p.hpfFreq = rng.nextInRange(0.0f, 0.3f);
    }

    return p;
}

SfxParams explosion(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.waveType = WaveType::Noise;

    if (rng.chance(1, 1)) {
        p.baseFreq = rng.nextInRange(0.1f, 0.5f);
        p.freqRamp = rng.nextInRange(-0.1f, 0.3f);
    } else {
        p.baseFreq = rng.nextInRange(0.2f, 0.9f);
        p.freqRamp = rng.nextInRange(-0.2f, -0.4f);
    }

    p.baseFreq = p.baseFreq * p.baseFreq;

    if (rng.chance(1, 4)) {
        p.freqRamp = 0.0f;
    }

    if (rng.chance(1, 2)) {
        p.repeatSpeed = rng.nextInRange(0.3f, 0.8f);
    }

    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.1f, 0.4f);
    p.envDecay = rng.nextInRange(0.0f, 0.5f);

    if (rng.chance(1, 1)) {
        p.phaOffset = rng.nextInRange(-0.3f, 0.6f);
        p.phaRamp = rng.nextInRange(-0.3f, 0.0f);
    }

    p.envPunch = rng.nextInRange(0.2f, 0.8f);

    if (rng.chance(1, 1)) {
        p.vibStrength = rng.nextInRange(0.0f, 0.7f);
        p.vibSpeed = rng.nextInRange(0.0f, 0.6f);
    }

    if (rng.chance(1, 2)) {
        p.arpSpeed = rng.nextInRange(0.6f, 0.9f);
        p.arpMod = rng.nextInRange(-0.8f, 0.8f);
    }

    return p;
}

SfxParams powerup(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    if (rng.chance(1, 1)) {
        p.waveType = WaveType::Sine;
    } else {
        p.duty = rng.nextInRange(0.0f, 0.6f);
    }

    p.baseFreq = rng.nextInRange(0.2f, 0.5f);

    if (rng.chance(1, 1)) {
        p.freqRamp = rng.nextInRange(0.1f, 0.5f);
        p.repeatSpeed = rng.nextInRange(0.4f, 0.8f);
    } else {
        p.freqRamp = rng.nextInRange(0.05f, 0.25f);

        if (rng.chance(1, 1)) {
            p.vibStrength = rng.nextInRange(0.0f, 0.7f);
            p.vibSpeed = rng.nextInRange(0.0f, 0.6f);
        }
    }

    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.0f, 0.4f);
    p.envDecay = rng.nextInRange(0.1f, 0.5f);

    return p;
}

SfxParams hit(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.waveType = pickWave(rng, std::array{WaveType::Square, WaveType::Sine, WaveType::Noise});

    if (p.waveType == WaveType::Square) {
        p.duty = rng.nextInRange(0.0f, 0.6f);
    }

    p.baseFreq = rng.nextInRange(0.2f, 0.8f);
    p.freqRamp = rng.nextInRange(-0.3f, -0.7f);
    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.0f, 0.1f);
    p.envDecay = rng.nextInRange(0.1f, 0.3f);

    if (rng.chance(1, 1)) {
        p.hpfFreq = rng.nextInRange(0.0f, 0.3f);
    }

    return p;
}

SfxParams jump(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.waveType = WaveType::Square;
    p.duty = rng.nextInRange(0.0f, 0.6f);
    p.baseFreq = rng.nextInRange(0.3f, 0.6f);
    p.freqRamp = rng.nextInRange(0.1f, 0.3f);
    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.1f, 0.4f);
    p.envDecay = rng.nextInRange(0.1f, 0.3f);

    if (rng.chance(1, 1)) {
        p.hpfFreq = rng.nextInRange(0.0f, 0.3f);
    }

    if (rng.chance(1, 1)) {
        p.lpfFreq = rng.nextInRange(0.4f, 1.0f);
    }

    return p;
}

SfxParams blip(uint32_t seed) {
    Xorshift32 rng(seed);
    SfxParams p;

    p.waveType = pickWave(rng, std::array{WaveType::Square, WaveType::Sine});

    if (p.waveType == WaveType::Square) {
        p.duty = rng.nextInRange(0.0f, 0.6f);
    }

    p.baseFreq = rng.nextInRange(0.2f, 0.6f);
    p.envAttack = 0.0f;
    p.envSustain = rng.nextInRange(0.1f, 0.2f);
    p.envDecay = rng.nextInRange(0.0f, 0.2f);
    p.hpfFreq = 0.1f;

    return p;
}

void mutate(SfxParams& params, uint32_t seed) {
    Xorshift32 rng(seed);

    for (const auto& info : kSfxParamTable) {
        if (!info.mutates) {
            continue;
        }
        if (rng.chance(1, 1)) {
            const float nudged = info.get(params) + rng.nextInRange(-0.05f, 0.05f);
            info.set(params, std::clamp(nudged, info.minValue, info.maxValue));
        }
    }
}

bool fromName(std::string_view name, uint32_t seed, SfxParams& out) {
    using Factory = SfxParams (*)(uint32_t);
    constexpr std::array<Factory, kPresetNames.size()> kFactories = {
        &pickup, &laser, &explosion, &powerup, &hit, &jump, &blip
    };

    for (size_t i = 0; i < kPresetNames.size(); ++i) {
        if (kPresetNames[i] == name) {
            out = kFactories[i](seed);
            return true;
        }
    }
    return false;
}

} // namespace Presets
} // namespace DSP
} // namespace Sfxr
