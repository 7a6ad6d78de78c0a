// ==============================================================================
// Layer 3: System Component - Sound Effect Generator
// ==============================================================================
// Renders one sound effect described by SfxParams into caller-owned buffers.
//
// Per output frame:
//   1. repeat counter; on expiry restart() (frequency slide + filter only)
//   2. oscillator, envelope and phaser advance once
//   3. 8 raw oscillator samples -> envelope -> low/high-pass -> phaser,
//      averaged
//   4. * volume, clamped to [-1, 1]
//
// Rendering state persists across generate() calls, so an effect can be
// streamed in blocks of any size. Output is 44.1 kHz mono.
//
// Real-Time Safety: generate() is noexcept and allocation-free. Construction
// and setParams() validate and throw std::invalid_argument.
// Layer 3: composes Layer 1 primitives.
// ==============================================================================

#pragma once

#include <sfxr/dsp/core/math_constants.h>
#include <sfxr/dsp/core/sfx_params.h>
#include <sfxr/dsp/primitives/high_low_pass_filter.h>
#include <sfxr/dsp/primitives/sfx_envelope.h>
#include <sfxr/dsp/primitives/sfx_oscillator.h>
#include <sfxr/dsp/primitives/sfx_phaser.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <sstream>
#include <stdexcept>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kDefaultSfxVolume = 0.2f;

// =============================================================================
// SfxGenerator Class
// =============================================================================

/// @brief Sound effect renderer.
///
/// @par Thread Safety
/// Single-threaded model. A generator shared between a playback thread and
/// an editing thread must be guarded by the caller.
///
/// @par Usage
/// @code
/// SfxParams params;
/// params.waveType = WaveType::Sine;
///
/// SfxGenerator generator(params);
/// std::vector<float> buffer(44100);
/// generator.generate(buffer.data(), buffer.size());
/// @endcode
class SfxGenerator {
public:
    /// Build a generator at the start of the effect.
    /// @param params    Effect definition, every field within its range
    /// @param noiseSeed Seed of the noise table PRNG
    /// @throws std::invalid_argument if a field of params is out of range
    explicit SfxGenerator(const SfxParams& params,
                          uint32_t noiseSeed = kDefaultNoiseSeed)
        : params_(params)
        , noiseSeed_(noiseSeed)
        , oscillator_(noiseSeed) {
        validate(params_);
        reset();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// Replace the effect definition. Takes effect on the next reset().
    /// @throws std::invalid_argument if a field of params is out of range
    void setParams(const SfxParams& params) {
        validate(params);
        params_ = params;
    }

    [[nodiscard]] const SfxParams& params() const noexcept { return params_; }

    /// Linear output gain applied before clamping. No range is enforced.
    void setVolume(float volume) noexcept { volume_ = volume; }

    [[nodiscard]] float volume() const noexcept { return volume_; }

    [[nodiscard]] uint32_t noiseSeed() const noexcept { return noiseSeed_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Fill `numSamples` frames. Continues where the previous call stopped.
    void generate(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = processFrame();
        }
    }

    void generate(std::span<float> output) noexcept {
        generate(output.data(), output.size());
    }

    /// Rewind to the beginning of the effect.
    void reset() noexcept {
        restart();
        envelope_.reset(params_.envAttack, params_.envSustain,
                        params_.envDecay, params_.envPunch);
        phaser_.reset(params_.phaOffset, params_.phaRamp);

        oscillator_.resetPhase();
        oscillator_.resetVibrato(params_.vibSpeed, params_.vibStrength);
        oscillator_.seedNoise(noiseSeed_);
        oscillator_.resetNoise();

        repTime_ = 0;
        const float repRemain = 1.0f - params_.repeatSpeed;
        repLimit_ = static_cast<int32_t>(repRemain * repRemain * 20000.0f * 32.0f);
        if (params_.repeatSpeed == 0.0f) {
            repLimit_ = 0;
        }
    }

    /// Partial rewind used by the repeat feature: re-derive the filter and
    /// the oscillator's frequency, duty and arpeggio state. Envelope,
    /// vibrato, phaser and noise keep running.
    void restart() noexcept {
        filter_.reset(params_.lpfResonance, params_.lpfFreq, params_.lpfRamp,
                      params_.hpfFreq, params_.hpfRamp);
        oscillator_.reset(params_);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// True once the envelope has reached its silent end stage.
    [[nodiscard]] bool isFinished() const noexcept { return envelope_.isFinished(); }

    /// Frames from reset until the envelope ends.
    [[nodiscard]] uint32_t effectLengthFrames() const noexcept {
        return SfxEnvelope::lengthFromParam(params_.envAttack)
             + SfxEnvelope::lengthFromParam(params_.envSustain)
             + SfxEnvelope::lengthFromParam(params_.envDecay);
    }

    /// Frames between repeat restarts, 0 if the effect never repeats.
    [[nodiscard]] int32_t repeatLimit() const noexcept { return repLimit_; }

    /// Frames since the last repeat restart. Stays 0 when repeat is off.
    [[nodiscard]] int32_t repeatTime() const noexcept { return repTime_; }

    [[nodiscard]] const SfxOscillator& oscillator() const noexcept { return oscillator_; }
    [[nodiscard]] const SfxEnvelope& envelope() const noexcept { return envelope_; }

private:
    [[nodiscard]] float processFrame() noexcept {
        // Counts only while armed, so endless streams never overflow it
        if (repLimit_ != 0 && ++repTime_ >= repLimit_) {
            repTime_ = 0;
            restart();
        }

        oscillator_.advance();
        envelope_.advance();
        phaser_.advance();

        float sum = 0.0f;
        for (size_t i = 0; i < kSfxSupersampleCount; ++i) {
            float sample = oscillator_.process();
            sample = envelope_.process(sample);
            sample = filter_.process(sample);
            sample = phaser_.process(sample);
            sum += sample;
        }
        const float average = sum / static_cast<float>(kSfxSupersampleCount);

        // fmin first: a NaN product (NaN volume) comes out as 1.0
        return std::fmax(std::fmin(average * volume_, 1.0f), -1.0f);
    }

    static void validate(const SfxParams& params) {
        if (!isValidWaveType(params.waveType)) {
            throw std::invalid_argument(
                "wave_type must be square, triangle, sine or noise");
        }
        if (const auto* invalid = findInvalidSfxParam(params)) {
            std::ostringstream message;
            message << invalid->name << " must be between "
                    << invalid->minValue << " and " << invalid->maxValue;
            throw std::invalid_argument(message.str());
        }
    }

    SfxParams params_;
    uint32_t noiseSeed_;
    float volume_ = kDefaultSfxVolume;

    SfxOscillator oscillator_;
    SfxEnvelope envelope_;
    HighLowPassFilter filter_;
    SfxPhaser phaser_;

    int32_t repTime_ = 0;
    int32_t repLimit_ = 0;
};

} // namespace DSP
} // namespace Sfxr
