/**
 * @file builtin_effects.hh
 * @brief Reference effects shipped with mixrack
 * @ingroup builtin
 */

#pragma once

#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/export_mixrack.h>

namespace mixrack {

    /**
     * @brief Register gain, pan, lowpass, delay, sidechain_compressor and
     *        sidechain_gate with @p registry
     */
    MIXRACK_EXPORT void register_builtin_effects(effect_registry& registry);

    /// 20*log10(amp); very small amplitudes clamp to -120 dB
    MIXRACK_EXPORT float amplitude_to_db(float amplitude) noexcept;

    MIXRACK_EXPORT float db_to_amplitude(float db) noexcept;

    /// max(|l|, |r|)
    MIXRACK_EXPORT float sidechain_peak(float left, float right) noexcept;

    /// sqrt((l^2 + r^2) / 2)
    MIXRACK_EXPORT float sidechain_rms(float left, float right) noexcept;
}
