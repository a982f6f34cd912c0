/**
 * @file builtin_synths.hh
 * @brief Reference synth voices shipped with mixrack
 * @ingroup builtin
 */

#pragma once

#include <mixrack/sdk/synth_registry.hh>
#include <mixrack/export_mixrack.h>

namespace mixrack {

    /**
     * @brief Register sine (alias beep), saw, square, triangle (alias tri)
     *        and noise with @p registry
     *
     * saw and square run through a resonant lowpass and expose cutoff and
     * resonance; the others do not.
     */
    MIXRACK_EXPORT void register_builtin_synths(synth_registry& registry);
}
