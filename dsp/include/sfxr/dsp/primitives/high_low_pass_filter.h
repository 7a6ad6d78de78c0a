// ==============================================================================
// Layer 1: DSP Primitive - Cascaded Low/High-Pass Filter
// ==============================================================================
// Resonant one-pole "spring" low-pass feeding a leaky-integrator high-pass,
// both with per-sample multiplicative cutoff ramps. Cutoffs are the sfxr
// parameter curves (cubic for the low-pass, squared for the high-pass), not
// frequencies in Hz.
//
// Real-Time Safety: noexcept, no allocations.
// Layer 1: depends only on the standard library.
// ==============================================================================

#pragma once

#include <algorithm>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kLowPassMaxCutoff = 0.1f;
inline constexpr float kLowPassMaxDamping = 0.8f;
inline constexpr float kHighPassMinCutoff = 0.00001f;
inline constexpr float kHighPassMaxCutoff = 0.1f;

// =============================================================================
// HighLowPassFilter Class
// =============================================================================

/// @brief Low-pass then high-pass, with time-varying coefficients.
///
/// Per sample:
/// @code
/// w   = clamp(w * wRamp, 0, 0.1)
/// dp += (x - p) * w;  dp -= dp * damping;  p += dp     // low-pass
/// hp  = clamp(hp * hpRamp, 1e-5, 0.1)
/// php += p - pPrev;  php -= php * hp                    // high-pass
/// y   = php
/// @endcode
///
/// A cutoff of exactly 0 passes the input straight through the low-pass
/// stage. Higher resonance means less damping and more ringing.
class HighLowPassFilter {
public:
    HighLowPassFilter() noexcept = default;

    /// Derive coefficients from the filter parameters and clear the state.
    void reset(float lpfResonance, float lpfFreq, float lpfRamp,
               float hpfFreq, float hpfRamp) noexcept {
        fltp_ = 0.0f;
        fltdp_ = 0.0f;
        fltw_ = lpfFreq * lpfFreq * lpfFreq * 0.1f;
        fltwD_ = 1.0f + lpfRamp * 0.0001f;

        fltdmp_ = 5.0f / (1.0f + lpfResonance * lpfResonance * 20.0f) * (0.01f + fltw_);
        fltdmp_ = std::clamp(fltdmp_, 0.0f, kLowPassMaxDamping);

        fltphp_ = 0.0f;
        flthp_ = hpfFreq * hpfFreq * 0.1f;
        flthpD_ = 1.0f + hpfRamp * 0.0003f;
    }

    [[nodiscard]] float process(float input) noexcept {
        const float previous = fltp_;

        fltw_ = std::clamp(fltw_ * fltwD_, 0.0f, kLowPassMaxCutoff);
        if (fltw_ > 0.0f) {
            fltdp_ += (input - fltp_) * fltw_;
            fltdp_ -= fltdp_ * fltdmp_;
        } else {
            fltp_ = input;
            fltdp_ = 0.0f;
        }
        fltp_ += fltdp_;

        flthp_ = std::clamp(flthp_ * flthpD_, kHighPassMinCutoff, kHighPassMaxCutoff);
        fltphp_ += fltp_ - previous;
        fltphp_ -= fltphp_ * flthp_;

        return fltphp_;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] float lowPassCutoff() const noexcept { return fltw_; }
    [[nodiscard]] float lowPassDamping() const noexcept { return fltdmp_; }
    [[nodiscard]] float highPassCutoff() const noexcept { return flthp_; }

    /// Output of the low-pass stage for the last sample
    [[nodiscard]] float lowPassOutput() const noexcept { return fltp_; }

private:
    // Low-pass
    float fltp_ = 0.0f;
    float fltdp_ = 0.0f;
    float fltw_ = 0.0f;
    float fltwD_ = 0.0f;
    float fltdmp_ = 0.0f;

    // High-pass
    float fltphp_ = 0.0f;
    float flthp_ = 0.0f;
    float flthpD_ = 0.0f;
};

} // namespace DSP
} // namespace Sfxr
