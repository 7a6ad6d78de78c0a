// ==============================================================================
// Layer 1: DSP Primitive - Sound Effect Phaser
// ==============================================================================
// Feedforward comb filter with a swept integer delay:
//
//   y[n] = x[n] + x[n - D],  D = min(1023, |fphase|),  fphase += fdphase
//
// The delay sweeps once per output frame while process() runs per raw
// sample, giving the sfxr "phaser" sweep.
//
// Real-Time Safety: noexcept, fixed-size buffer, no allocations.
// Layer 1: depends only on the standard library.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

inline constexpr size_t kSfxPhaserBufferSize = 1024;

// =============================================================================
// SfxPhaser Class
// =============================================================================

class SfxPhaser {
public:
    SfxPhaser() noexcept = default;

    /// Set offset and sweep, and clear the delay history.
    /// @param offset Initial delay, -1 to 1 (signed square * 1020 samples)
    /// @param ramp   Delay change per frame, -1 to 1 (signed square)
    void reset(float offset, float ramp) noexcept {
        fphase_ = offset * offset * 1020.0f;
        if (offset < 0.0f) {
            fphase_ = -fphase_;
        }

        fdphase_ = ramp * ramp;
        if (ramp < 0.0f) {
            fdphase_ = -fdphase_;
        }

        buffer_.fill(0.0f);
        ipp_ = 0;
    }

    /// Sweep the delay by one frame.
    void advance() noexcept {
        fphase_ += fdphase_;
    }

    [[nodiscard]] float process(float input) noexcept {
        buffer_[ipp_] = input;
        const size_t iphase = delaySamples();
        const float result = input + buffer_[(ipp_ + kSfxPhaserBufferSize - iphase) % kSfxPhaserBufferSize];
        ipp_ = (ipp_ + 1) % kSfxPhaserBufferSize;
        return result;
    }

    /// Current integer delay in samples, 0 to kSfxPhaserBufferSize - 1.
    [[nodiscard]] size_t delaySamples() const noexcept {
        constexpr auto kMaxDelay = static_cast<float>(kSfxPhaserBufferSize - 1);
        return static_cast<size_t>(std::min(std::fabs(fphase_), kMaxDelay));
    }

    [[nodiscard]] float phaseOffset() const noexcept { return fphase_; }

private:
    std::array<float, kSfxPhaserBufferSize> buffer_{};
    size_t ipp_ = 0;
    float fphase_ = 0.0f;
    float fdphase_ = 0.0f;
};

} // namespace DSP
} // namespace Sfxr
