// ==============================================================================
// Layer 1: DSP Primitive - Sound Effect Oscillator
// ==============================================================================
// Period-counting oscillator with geometric frequency slide, one-shot
// arpeggio step, sinusoidal vibrato and sliding square duty. Noise is read
// from a 32-entry table that is refilled every time the phase wraps, so the
// noise "pitch" follows the oscillator period.
//
// Modulators advance once per output frame (advance()); the waveform is
// sampled several times per frame (process()) by the generator.
//
// Real-Time Safety: noexcept, no allocations, owned PRNG.
// Layer 1: depends only on Layer 0.
// ==============================================================================

#pragma once

#include <sfxr/dsp/core/math_constants.h>
#include <sfxr/dsp/core/random.h>
#include <sfxr/dsp/core/sfx_params.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Shortest period the oscillator will run at, in raw samples
inline constexpr uint32_t kSfxMinPeriod = 8;

/// Entries in the noise lookup table
inline constexpr size_t kSfxNoiseTableSize = 32;

/// Default seed of the oscillator's noise PRNG
inline constexpr uint32_t kDefaultNoiseSeed = 0x5F3759DFu;

// =============================================================================
// SfxOscillator Class
// =============================================================================

/// @brief Raw waveform source of the sound effect generator.
///
/// The frequency is handled as a period in raw samples:
/// @code
/// fperiod    = 100 / (baseFreq^2 + 0.001)
/// fperiod    = min(fperiod * fslide, fmaxperiod)     // every frame
/// period     = max(8, fperiod * (1 + sin(vibPhase) * vibAmp))
/// @endcode
///
/// @par Usage
/// @code
/// SfxOscillator osc;
/// osc.reset(params);
/// osc.resetPhase();
/// osc.resetVibrato(params.vibSpeed, params.vibStrength);
/// osc.resetNoise();
///
/// osc.advance();
/// for (size_t i = 0; i < kSfxSupersampleCount; ++i) {
///     float raw = osc.process();
/// }
/// @endcode
class SfxOscillator {
public:
    SfxOscillator() noexcept = default;

    explicit SfxOscillator(uint32_t noiseSeed) noexcept
        : rng_(noiseSeed) {}

    // =========================================================================
    // Reset
    // =========================================================================

    /// Derive wave type, frequency slide, duty and arpeggio state from params.
    /// Phase, vibrato and the noise table are left alone.
    void reset(const SfxParams& params) noexcept {
        waveType_ = params.waveType;

        const double baseFreq = params.baseFreq;
        const double freqLimit = params.freqLimit;
        const double freqRamp = params.freqRamp;
        const double freqDramp = params.freqDramp;

        fperiod_ = 100.0 / (baseFreq * baseFreq + 0.001);
        fmaxperiod_ = 100.0 / (freqLimit * freqLimit + 0.001);
        fslide_ = 1.0 - freqRamp * freqRamp * freqRamp * 0.01;
        fdslide_ = -freqDramp * freqDramp * freqDramp * 0.000001;

        squareDuty_ = 0.5f - params.duty * 0.5f;
        squareSlide_ = -params.dutyRamp * 0.00005f;

        // Negative steps swing much further than positive ones
        const double arpMod = params.arpMod;
        if (arpMod >= 0.0) {
            arpMod_ = 1.0 - arpMod * arpMod * 0.9;
        } else {
            arpMod_ = 1.0 - arpMod * arpMod * 10.0;
        }

        arpTime_ = 0;
        const float arpRemain = 1.0f - params.arpSpeed;
        arpLimit_ = static_cast<int32_t>(arpRemain * arpRemain * 20000.0f + 32.0f);
        if (params.arpSpeed == 1.0f) {
            arpLimit_ = 0;
        }
    }

    void resetPhase() noexcept {
        phase_ = 0;
    }

    void resetVibrato(float speed, float strength) noexcept {
        vibPhase_ = 0.0;
        vibSpeed_ = static_cast<double>(speed) * static_cast<double>(speed) * 0.01;
        vibAmp_ = static_cast<double>(strength) * 0.5;
    }

    /// Refill the noise table from the PRNG.
    void resetNoise() noexcept {
        for (auto& value : noiseTable_) {
            value = rng_.nextFloat();
        }
    }

    /// Reseed the noise PRNG. Does not touch the current table.
    void seedNoise(uint32_t seed) noexcept {
        rng_.seed(seed);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Step arpeggio, frequency slide, vibrato and duty slide by one frame.
    void advance() noexcept {
        // The counter freezes once the step has fired
        if (arpLimit_ != 0 && ++arpTime_ >= arpLimit_) {
            arpLimit_ = 0;
            fperiod_ *= arpMod_;
        }

        fslide_ += fdslide_;
        // fmin drops a NaN period in favour of the limit
        fperiod_ = std::fmin(fperiod_ * fslide_, fmaxperiod_);

        vibPhase_ += vibSpeed_;
        const double vibrato = 1.0 + std::sin(vibPhase_) * vibAmp_;

        const double period = vibrato * fperiod_;
        if (period >= static_cast<double>(kSfxMinPeriod)) {
            period_ = static_cast<uint32_t>(period);
        } else {
            // also catches NaN and negative periods
            period_ = kSfxMinPeriod;
        }

        squareDuty_ = std::clamp(squareDuty_ + squareSlide_, 0.0f, 0.5f);
    }

    /// Produce the next raw waveform sample.
    [[nodiscard]] float process() noexcept {
        ++phase_;
        if (phase_ >= period_) {
            phase_ %= period_;
            if (waveType_ == WaveType::Noise) {
                resetNoise();
            }
        }

        const float fp = static_cast<float>(phase_) / static_cast<float>(period_);

        switch (waveType_) {
            case WaveType::Square:
                return fp < squareDuty_ ? 0.5f : -0.5f;

            case WaveType::Triangle:
                return 1.0f - fp * 2.0f;

            case WaveType::Sine:
                return std::sin(fp * kTwoPi);

            case WaveType::Noise: {
                const auto index = std::min(
                    static_cast<size_t>(fp * static_cast<float>(kSfxNoiseTableSize)),
                    kSfxNoiseTableSize - 1);
                return noiseTable_[index];
            }
        }
        return 0.0f;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] WaveType waveType() const noexcept { return waveType_; }

    /// Current period in raw samples (always >= kSfxMinPeriod)
    [[nodiscard]] uint32_t period() const noexcept { return period_; }

    [[nodiscard]] uint32_t phase() const noexcept { return phase_; }

    /// Unquantized period before vibrato
    [[nodiscard]] double fractionalPeriod() const noexcept { return fperiod_; }

    [[nodiscard]] float squareDuty() const noexcept { return squareDuty_; }

    /// True while the one-shot arpeggio step is still pending
    [[nodiscard]] bool isArpeggioArmed() const noexcept { return arpLimit_ != 0; }

    /// Frames counted towards the arpeggio step since reset
    [[nodiscard]] int32_t arpeggioTime() const noexcept { return arpTime_; }

    [[nodiscard]] const std::array<float, kSfxNoiseTableSize>& noiseTable() const noexcept {
        return noiseTable_;
    }

private:
    WaveType waveType_ = WaveType::Square;
    Xorshift32 rng_{kDefaultNoiseSeed};

    uint32_t period_ = kSfxMinPeriod;
    uint32_t phase_ = 0;
    std::array<float, kSfxNoiseTableSize> noiseTable_{};

    // Square duty
    float squareDuty_ = 0.5f;
    float squareSlide_ = 0.0f;

    // Frequency slide
    double fperiod_ = 0.0;
    double fmaxperiod_ = 0.0;
    double fslide_ = 0.0;
    double fdslide_ = 0.0;

    // Vibrato
    double vibPhase_ = 0.0;
    double vibSpeed_ = 0.0;
    double vibAmp_ = 0.0;

    // Arpeggio
    int32_t arpTime_ = 0;
    int32_t arpLimit_ = 0;
    double arpMod_ = 0.0;
};

} // namespace DSP
} // namespace Sfxr
