/**
 * @file rack.hh
 * @brief Voice manager feeding an effect chain behind one render call
 * @ingroup rack
 */

#ifndef MIXRACK_RACK_HH
#define MIXRACK_RACK_HH

#include <mixrack/chain_state.hh>
#include <mixrack/effect_chain.hh>
#include <mixrack/effect_id.hh>
#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/synth_registry.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/voice_manager.hh>
#include <mixrack/export_mixrack.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mixrack {

    /**
     * @struct rack_config
     * @brief Construction parameters of a rack
     */
    struct rack_config {
        sample_rate_t sample_rate = 48000.0;
        /// Largest number of frames rendered under one lock
        std::size_t block_frames = 512;
        std::size_t max_voices = 8;
        std::string synth = "sine";
    };

    /**
     * @class rack
     * @brief Thread-safe front of a voice_manager -> effect_chain pipeline
     * @ingroup rack
     *
     * ## Threading model
     *
     * One render thread calls render(); any number of control threads call
     * the rest (control calls are serialized among themselves).
     *
     * - render() holds the render lock for one block of at most
     *   rack_config::block_frames frames, so it always sees one consistent
     *   stage list and voice pool for the block.
     * - Structural calls build effect stages and voice generators before
     *   taking the render lock, hold it only to splice the built objects in
     *   or out, and destroy whatever was detached after releasing it.
     * - set_effect_param() and master_gain() never take the render lock;
     *   they write realtime_param cells through handles cached per stage.
     *
     * @code
     * auto fx = effect_registry::with_builtin();
     * auto synths = synth_registry::with_builtin();
     * rack r(fx, synths, rack_config{});
     *
     * auto lp = r.add_effect("lowpass", {{"cutoff", 800.0f}});
     * r.note_on(60, 0.8f);
     * r.set_effect_param(lp, "cutoff", 2000.0f);   // lock-free
     *
     * std::vector<float> out(2 * 256);
     * r.render(out.data(), 256);
     * @endcode
     */
    class MIXRACK_EXPORT rack {
        public:
            rack(std::shared_ptr<const effect_registry> effects,
                 std::shared_ptr<const synth_registry> synths,
                 rack_config config = rack_config{});
            ~rack();

            rack(const rack&) = delete;
            rack& operator=(const rack&) = delete;

            // -----------------------------------------------------------------
            // Effects
            // -----------------------------------------------------------------

            /**
             * @brief Append an effect stage
             * @return Id assigned to the new stage
             * @throws processor_not_found_error; the chain is unchanged
             */
            mixrack::effect_id add_effect(const std::string& name, const param_map& params);

            bool remove_effect(const mixrack::effect_id& id);

            bool move_effect(const mixrack::effect_id& id, std::size_t new_index);

            bool bypass_effect(const mixrack::effect_id& id, bool bypassed);

            bool mute_effect(const mixrack::effect_id& id, bool muted);

            /**
             * @brief Lock-free parameter write
             * @return false if the id is unknown (an unknown parameter name on
             *         a known stage is ignored and still returns true)
             */
            bool set_effect_param(const mixrack::effect_id& id, const std::string& param, float value);

            [[nodiscard]] std::optional<float> effect_param(const mixrack::effect_id& id,
                                                            const std::string& param) const;

            [[nodiscard]] std::size_t effect_count() const;

            /**
             * @brief Snapshot of the chain, taken between blocks
             */
            [[nodiscard]] chain_state chain_snapshot() const;

            /**
             * @brief Replace the chain from a snapshot
             * @throws processor_not_found_error, serialization_error; the
             *         chain is unchanged on failure
             */
            void restore_chain(const chain_state& state);

            // -----------------------------------------------------------------
            // Notes
            // -----------------------------------------------------------------

            std::optional<std::size_t> note_on(midi_note_t note, float velocity);

            void note_off(midi_note_t note);

            void all_notes_off();

            void pitch_bend(float semitones);

            void set_cutoff(float hz);

            void set_resonance(float resonance);

            [[nodiscard]] std::size_t active_voices() const;

            [[nodiscard]] std::vector<midi_note_t> playing_notes() const;

            // -----------------------------------------------------------------
            // Output
            // -----------------------------------------------------------------

            /**
             * @brief Output gain applied after the chain; write it from anywhere
             */
            [[nodiscard]] const shared_param& master_gain() const { return m_master_gain; }

            /**
             * @brief Render interleaved stereo
             * @param interleaved Destination, 2 * @p frames floats
             * @param frames Frames to produce
             * @param sidechain Optional interleaved stereo key signal,
             *        2 * @p frames floats, fed to sidechain-capable stages
             * @warning Render thread; never throws or allocates
             */
            void render(float* interleaved, std::size_t frames, const float* sidechain = nullptr) noexcept;

            [[nodiscard]] std::uint64_t frames_rendered() const noexcept {
                return m_frames_rendered.load(std::memory_order_relaxed);
            }

            [[nodiscard]] const rack_config& config() const { return m_config; }

            [[nodiscard]] sample_rate_t sample_rate() const { return m_config.sample_rate; }

            // -----------------------------------------------------------------
            // Metering
            // -----------------------------------------------------------------

            [[nodiscard]] double chain_cpu_usage() const;

            [[nodiscard]] performance_metrics voice_metrics() const;

            [[nodiscard]] std::map<std::string, stage_levels> effect_levels() const;

        private:
            void cache_controls();

            rack_config m_config;
            effect_chain m_chain;
            voice_manager m_voices;
            shared_param m_master_gain;
            std::atomic<std::uint64_t> m_frames_rendered{0};

            // held by render() per block and by control calls only to splice
            mutable std::mutex m_render_mutex;
            // serializes control threads; guards m_controls
            mutable std::mutex m_control_mutex;
            std::map<mixrack::effect_id, effect_controls> m_controls;
    };
}

#endif

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
