// ==============================================================================
// Layer 0: Core Utility - Sound Effect Parameters
// ==============================================================================
// The complete definition of one sound effect: wave shape, frequency slide,
// vibrato, envelope, filters, phaser, repeat and arpeggio settings.
//
// Every numeric field is described once in kSfxParamTable (name, range,
// member pointer). Validation, mutation and the command-line renderer all
// walk that table instead of listing fields again.
//
// Layer 0: depends only on the standard library.
// ==============================================================================

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Sfxr {
namespace DSP {

// =============================================================================
// WaveType
// =============================================================================

/// Oscillator waveform.
/// Triangle is the classic sfxr ramp (1 - 2 * phase), kept under its
/// historical name.
enum class WaveType : uint8_t {
    Square = 0,
    Triangle,
    Sine,
    Noise
};

inline constexpr size_t kNumWaveTypes = 4;

[[nodiscard]] constexpr bool isValidWaveType(WaveType type) noexcept {
    return static_cast<size_t>(type) < kNumWaveTypes;
}

[[nodiscard]] constexpr std::string_view waveTypeName(WaveType type) noexcept {
    switch (type) {
        case WaveType::Square:   return "square";
        case WaveType::Triangle: return "triangle";
        case WaveType::Sine:     return "sine";
        case WaveType::Noise:    return "noise";
    }
    return "square";
}

/// Parse a lower-case wave name.
/// @return false (and leaves `out` untouched) if the name is unknown
[[nodiscard]] constexpr bool parseWaveType(std::string_view name, WaveType& out) noexcept {
    for (size_t i = 0; i < kNumWaveTypes; ++i) {
        const auto type = static_cast<WaveType>(i);
        if (waveTypeName(type) == name) {
            out = type;
            return true;
        }
    }
    return false;
}

// =============================================================================
// SfxParams
// =============================================================================

/// Sound effect definition consumed by SfxGenerator.
///
/// Defaults describe a plain square-wave blip: base frequency 0.3, attack
/// 0.4, sustain 0.1, decay 0.5, low-pass fully open, everything else off.
/// Ranges are listed beside each field and enforced when a generator is
/// built from the struct.
struct SfxParams {
    WaveType waveType = WaveType::Square;

    // Frequency
    float baseFreq = 0.3f;       // 0 to 1
    float freqLimit = 0.0f;      // 0 to 1 (lowest frequency reachable by slides)
    float freqRamp = 0.0f;       // -1 to 1
    float freqDramp = 0.0f;      // 0 to 1 (ramp of the ramp)

    // Square duty cycle (ignored by the other waves)
    float duty = 0.0f;           // 0 to 1
    float dutyRamp = 0.0f;       // -1 to 1

    // Vibrato
    float vibStrength = 0.0f;    // 0 to 1
    float vibSpeed = 0.0f;       // 0 to 1
    float vibDelay = 0.0f;       // 0 to 1 (stored for presets, not synthesized)

    // Volume envelope
    float envAttack = 0.4f;      // 0 to 1
    float envSustain = 0.1f;     // 0 to 1
    float envDecay = 0.5f;       // 0 to 1
    float envPunch = 0.0f;       // -1 to 1

    // Filters
    float lpfResonance = 0.0f;   // 0 to 1
    float lpfFreq = 1.0f;        // 0 to 1
    float lpfRamp = 0.0f;        // -1 to 1
    float hpfFreq = 0.0f;        // 0 to 1
    float hpfRamp = 0.0f;        // -1 to 1

    // Phaser
    float phaOffset = 0.0f;      // -1 to 1
    float phaRamp = 0.0f;        // -1 to 1

    // Repeat (0 = never)
    float repeatSpeed = 0.0f;    // 0 to 1

    // Arpeggio (speed 1 = never)
    float arpSpeed = 0.0f;       // 0 to 1
    float arpMod = 0.0f;         // -1 to 1
};

// =============================================================================
// Parameter Table
// =============================================================================

/// Static description of one numeric SfxParams field.
struct SfxParamInfo {
    std::string_view name;       ///< snake_case name used on the command line
    float minValue;
    float maxValue;
    float SfxParams::*field;
    bool mutates;                ///< touched by Presets::mutate()

    [[nodiscard]] constexpr float get(const SfxParams& params) const noexcept {
        return params.*field;
    }

    constexpr void set(SfxParams& params, float value) const noexcept {
        params.*field = value;
    }

    /// NaN is never in range.
    [[nodiscard]] constexpr bool inRange(float value) const noexcept {
        return value >= minValue && value <= maxValue;
    }
};

inline constexpr std::array<SfxParamInfo, 23> kSfxParamTable = {{
    {"base_freq",     0.0f, 1.0f, &SfxParams::baseFreq,     true},
    {"freq_limit",    0.0f, 1.0f, &SfxParams::freqLimit,    false},
    {"freq_ramp",    -1.0f, 1.0f, &SfxParams::freqRamp,     true},
    {"freq_dramp",    0.0f, 1.0f, &SfxParams::freqDramp,    true},
    {"duty",          0.0f, 1.0f, &SfxParams::duty,         true},
    {"duty_ramp",    -1.0f, 1.0f, &SfxParams::dutyRamp,     true},
    {"vib_strength",  0.0f, 1.0f, &SfxParams::vibStrength,  true},
    {"vib_speed",     0.0f, 1.0f, &SfxParams::vibSpeed,     true},
    {"vib_delay",     0.0f, 1.0f, &SfxParams::vibDelay,     true},
    {"env_attack",    0.0f, 1.0f, &SfxParams::envAttack,    true},
    {"env_sustain",   0.0f, 1.0f, &SfxParams::envSustain,   true},
    {"env_decay",     0.0f, 1.0f, &SfxParams::envDecay,     true},
    {"env_punch",    -1.0f, 1.0f, &SfxParams::envPunch,     true},
    {"lpf_resonance", 0.0f, 1.0f, &SfxParams::lpfResonance, true},
    {"lpf_freq",      0.0f, 1.0f, &SfxParams::lpfFreq,      true},
    {"lpf_ramp",     -1.0f, 1.0f, &SfxParams::lpfRamp,      true},
    {"hpf_freq",      0.0f, 1.0f, &SfxParams::hpfFreq,      true},
    {"hpf_ramp",     -1.0f, 1.0f, &SfxParams::hpfRamp,      true},
    {"pha_offset",   -1.0f, 1.0f, &SfxParams::phaOffset,    true},
    {"pha_ramp",     -1.0f, 1.0f, &SfxParams::phaRamp,      true},
    {"repeat_speed",  0.0f, 1.0f, &SfxParams::repeatSpeed,  true},
    {"arp_speed",     0.0f, 1.0f, &SfxParams::arpSpeed,     true},
    {"arp_mod",      -1.0f, 1.0f, &SfxParams::arpMod,       true},
}};

/// Look up a parameter by its snake_case name.
/// @return nullptr if no field has that name
[[nodiscard]] constexpr const SfxParamInfo* findSfxParam(std::string_view name) noexcept {
    for (const auto& info : kSfxParamTable) {
        if (info.name == name) {
            return &info;
        }
    }
    return nullptr;
}

/// First field of `params` outside its documented range.
/// @return nullptr if every field is valid
[[nodiscard]] constexpr const SfxParamInfo* findInvalidSfxParam(const SfxParams& params) noexcept {
    for (const auto& info : kSfxParamTable) {
        if (!info.inRange(info.get(params))) {
            return &info;
        }
    }
    return nullptr;
}

[[nodiscard]] constexpr bool isValid(const SfxParams& params) noexcept {
    return isValidWaveType(params.waveType) && findInvalidSfxParam(params) == nullptr;
}

} // namespace DSP
} // namespace Sfxr
