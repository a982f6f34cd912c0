/**
 * @file processor.hh
 * @brief Per-sample signal processor and generator interfaces
 * @ingroup sdk_processing
 */

#pragma once

#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>

namespace mixrack {

    /**
     * @class signal_processor
     * @brief Abstract stereo-in / stereo-out effect unit
     * @ingroup sdk_processing
     *
     * A signal_processor is the opaque leaf of an effect chain. The chain
     * never looks inside it; it only feeds one frame in and takes one frame
     * out, in list order.
     *
     * ## Real-Time Constraints
     *
     * process() is called from the render thread:
     * - **No blocking operations** (mutex, file I/O, memory allocation)
     * - **Must not throw**; a built processor cannot reject a sample
     * - **Lock-free parameters** only, via realtime_param handles
     *
     * Numerical instability (NaN, clipping) is the processor's own business.
     *
     * ## Implementing a Processor
     *
     * @code
     * class gain_processor : public signal_processor {
     *     shared_param m_gain;
     * public:
     *     explicit gain_processor(shared_param g) : m_gain(std::move(g)) {}
     *
     *     stereo_frame process(float left, float right) override {
     *         const float g = m_gain->value();
     *         return {left * g, right * g};
     *     }
     * };
     * @endcode
     *
     * @see effect_registry, effect_chain
     */
    class MIXRACK_EXPORT signal_processor {
        public:
            signal_processor();
            virtual ~signal_processor();

            signal_processor(const signal_processor&) = delete;
            auto operator=(const signal_processor&) -> signal_processor& = delete;

            /**
             * @brief Transform one stereo frame
             * @warning Called from the render thread
             */
            virtual stereo_frame process(float left, float right) = 0;

            /**
             * @brief Clear internal state (delay lines, envelopes)
             */
            virtual void reset();

            /**
             * @brief Adapt coefficients to a new sample rate
             */
            virtual void set_sample_rate(sample_rate_t sample_rate);
    };

    /**
     * @class sidechain_processor
     * @brief Effect that can be keyed by an external signal
     * @ingroup sdk_processing
     *
     * When a chain is driven with a sidechain frame and a stage owns one of
     * these, process_with_sidechain() replaces the plain processor for that
     * stage (ducking compressors, keyed gates). Without a sidechain frame
     * the stage falls back to its plain processor.
     */
    class MIXRACK_EXPORT sidechain_processor : public signal_processor {
        public:
            sidechain_processor();
            ~sidechain_processor() override;

            /**
             * @brief Process with an external key signal
             * @param left Main input, left
             * @param right Main input, right
             * @param sc_left Sidechain, left
             * @param sc_right Sidechain, right
             */
            virtual stereo_frame process_with_sidechain(float left, float right,
                                                        float sc_left, float sc_right) = 0;
    };

    /**
     * @class signal_generator
     * @brief Source with no input (one voice of a synth)
     * @ingroup sdk_processing
     *
     * Generators are fixed-frequency at construction; the voice manager
     * builds a fresh one for every new note. A generator whose amplitude
     * control reads 0 must produce silence.
     */
    class MIXRACK_EXPORT signal_generator {
        public:
            signal_generator();
            virtual ~signal_generator();

            signal_generator(const signal_generator&) = delete;
            auto operator=(const signal_generator&) -> signal_generator& = delete;

            /**
             * @brief Produce the next stereo frame
             * @warning Called from the render thread
             */
            virtual stereo_frame next() = 0;

            virtual void reset();

            virtual void set_sample_rate(sample_rate_t sample_rate);
    };
}

/*
 * Copyright (C) 2025
 *
 * This file is part of mixrack.
 *
 * mixrack is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * mixrack is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with mixrack.  If not, see <http://www.gnu.org/licenses/>.
 */
