// ==============================================================================
// Layer 1: DSP Primitive - Sound Effect Envelope
// ==============================================================================
// Linear three-stage volume envelope (attack, sustain with punch, decay)
// followed by a silent terminal stage. Stage lengths are frame counts derived
// from the squared parameter: length = param^2 * 100000.
//
// Real-Time Safety: noexcept, no allocations.
// Layer 1: depends only on the standard library.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Sfxr {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

enum class SfxEnvelopeStage : uint8_t {
    Attack = 0,
    Sustain,
    Decay,
    End
};

// =============================================================================
// SfxEnvelope Class
// =============================================================================

/// @brief Volume envelope of a single sound effect.
///
/// With dt = framesLeft / stageLength:
/// - Attack:  1 - dt            (rises 0 -> 1)
/// - Sustain: 1 + dt * 2 * punch (starts boosted, settles to 1)
/// - Decay:   dt                (falls 1 -> 0)
/// - End:     0
///
/// A zero-length stage is passed through with dt = 0.
class SfxEnvelope {
public:
    SfxEnvelope() noexcept = default;

    /// Rewind to the start of Attack with new stage lengths.
    /// @param attack  Attack parameter, 0 to 1
    /// @param sustain Sustain parameter, 0 to 1
    /// @param decay   Decay parameter, 0 to 1
    /// @param punch   Sustain boost, -1 to 1
    void reset(float attack, float sustain, float decay, float punch) noexcept {
        attack_ = lengthFromParam(attack);
        sustain_ = lengthFromParam(sustain);
        decay_ = lengthFromParam(decay);
        punch_ = punch;
        stage_ = SfxEnvelopeStage::Attack;
        stageLeft_ = stageLength(stage_);
    }

    /// Count down one frame, moving to the next stage when the current one
    /// runs out. End is terminal.
    void advance() noexcept {
        if (stageLeft_ > 1) {
            --stageLeft_;
            return;
        }

        switch (stage_) {
            case SfxEnvelopeStage::Attack:  stage_ = SfxEnvelopeStage::Sustain; break;
            case SfxEnvelopeStage::Sustain: stage_ = SfxEnvelopeStage::Decay; break;
            case SfxEnvelopeStage::Decay:   stage_ = SfxEnvelopeStage::End; break;
            case SfxEnvelopeStage::End:     break;
        }
        stageLeft_ = stageLength(stage_);
    }

    /// Current volume multiplier.
    [[nodiscard]] float volume() const noexcept {
        const uint32_t length = stageLength(stage_);
        const float dt = length > 0
            ? static_cast<float>(stageLeft_) / static_cast<float>(length)
            : 0.0f;

        switch (stage_) {
            case SfxEnvelopeStage::Attack:  return 1.0f - dt;
            case SfxEnvelopeStage::Sustain: return 1.0f + dt * 2.0f * punch_;
            case SfxEnvelopeStage::Decay:   return dt;
            case SfxEnvelopeStage::End:     return 0.0f;
        }
        return 0.0f;
    }

    /// Apply the current volume to a raw sample.
    [[nodiscard]] float process(float input) const noexcept {
        return input * volume();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] SfxEnvelopeStage stage() const noexcept { return stage_; }
    [[nodiscard]] uint32_t stageLeft() const noexcept { return stageLeft_; }
    [[nodiscard]] bool isFinished() const noexcept { return stage_ == SfxEnvelopeStage::End; }

    [[nodiscard]] uint32_t stageLength(SfxEnvelopeStage stage) const noexcept {
        switch (stage) {
            case SfxEnvelopeStage::Attack:  return attack_;
            case SfxEnvelopeStage::Sustain: return sustain_;
            case SfxEnvelopeStage::Decay:   return decay_;
            case SfxEnvelopeStage::End:     return 0;
        }
        return 0;
    }

    /// Frames from reset until End
    [[nodiscard]] uint32_t totalLength() const noexcept {
        return attack_ + sustain_ + decay_;
    }

    /// Frame count of a stage for a given parameter value.
    [[nodiscard]] static constexpr uint32_t lengthFromParam(float param) noexcept {
        return static_cast<uint32_t>(param * param * 100000.0f);
    }

private:
    SfxEnvelopeStage stage_ = SfxEnvelopeStage::Attack;
    uint32_t stageLeft_ = 0;
    uint32_t attack_ = 0;
    uint32_t sustain_ = 0;
    uint32_t decay_ = 0;
    float punch_ = 0.0f;
};

} // namespace DSP
} // namespace Sfxr
