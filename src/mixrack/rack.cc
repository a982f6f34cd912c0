// This is copyrighted software. More information is at the end of this file.
#include <mixrack/rack.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <utility>

namespace mixrack {

    rack::rack(std::shared_ptr<const effect_registry> effects,
               std::shared_ptr<const synth_registry> synths,
               rack_config config)
        : m_config(std::move(config)),
          m_chain(std::move(effects), m_config.sample_rate),
          m_voices(std::move(synths), m_config.synth, m_config.max_voices, m_config.sample_rate),
          m_master_gain(make_param(1.0f)) {
        if (m_config.block_frames == 0) {
            LOG_WARN("rack", "block_frames of 0 replaced by 1");
            m_config.block_frames = 1;
        }
        LOG_INFO("rack", "Created rack:", m_config.sample_rate, "Hz,", m_config.max_voices,
                 "voices of", m_config.synth, ", blocks of", m_config.block_frames);
    }

    rack::~rack() = default;

    // -------------------------------------------------------------------------
    // Effects
    // -------------------------------------------------------------------------

    mixrack::effect_id rack::add_effect(const std::string& name, const param_map& params) {
        std::lock_guard<std::mutex> control(m_control_mutex);

        const auto id = mixrack::effect_id::generate();
        auto instance = m_chain.make_effect(name, params, id);
        m_controls[id] = instance->controls;
        auto storage = m_chain.spare_storage();

        std::size_t position = 0;
        {
            std::lock_guard<std::mutex> render(m_render_mutex);
            m_chain.adopt_storage(storage);
            position = m_chain.insert_effect(std::move(instance));
        }
        LOG_INFO("rack", "Added", name, "as", id.to_string(), "at", position);
        return id;
    }

    bool rack::remove_effect(const mixrack::effect_id& id) {
        std::lock_guard<std::mutex> control(m_control_mutex);

        std::unique_ptr<effect_instance> detached;
        {
            std::lock_guard<std::mutex> render(m_render_mutex);
            if (auto index = m_chain.find_effect_index(id)) {
                detached = m_chain.take_effect(*index);
            }
        }
        if (!detached) {
            return false;
        }
        m_controls.erase(id);
        LOG_INFO("rack", "Removed", detached->name, "(", id.to_string(), ")");
        return true;
    }

    bool rack::move_effect(const mixrack::effect_id& id, std::size_t new_index) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        bool moved = false;
        {
            std::lock_guard<std::mutex> render(m_render_mutex);
            moved = m_chain.move_effect(id, new_index);
        }
        if (moved) {
            LOG_INFO("rack", "Moved", id.to_string(), "to", new_index);
        }
        return moved;
    }

    bool rack::bypass_effect(const mixrack::effect_id& id, bool bypassed) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        std::lock_guard<std::mutex> render(m_render_mutex);
        auto index = m_chain.find_effect_index(id);
        return index && m_chain.set_effect_bypass(*index, bypassed);
    }

    bool rack::mute_effect(const mixrack::effect_id& id, bool muted) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        std::lock_guard<std::mutex> render(m_render_mutex);
        auto index = m_chain.find_effect_index(id);
        return index && m_chain.set_effect_mute(*index, muted);
    }

    bool rack::set_effect_param(const mixrack::effect_id& id, const std::string& param, float value) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        auto it = m_controls.find(id);
        if (it == m_controls.end()) {
            return false;
        }
        it->second.set(param, value);
        return true;
    }

    std::optional<float> rack::effect_param(const mixrack::effect_id& id, const std::string& param) const {
        std::lock_guard<std::mutex> control(m_control_mutex);
        auto it = m_controls.find(id);
        if (it == m_controls.end()) {
            return std::nullopt;
        }
        return it->second.get(param);
    }

    std::size_t rack::effect_count() const {
        std::lock_guard<std::mutex> control(m_control_mutex);
        return m_chain.size();
    }

    chain_state rack::chain_snapshot() const {
        std::lock_guard<std::mutex> control(m_control_mutex);
        return m_chain.to_state();
    }

    void rack::restore_chain(const chain_state& state) {
        std::lock_guard<std::mutex> control(m_control_mutex);

        // every stage the rack manages must be addressable by id
        chain_state tagged = state;
        for (auto& es : tagged.effects) {
            if (!es.id) {
                es.id = mixrack::effect_id::generate();
            }
        }

        effect_chain staging(m_chain.registry(), m_config.sample_rate);
        staging.from_state(tagged);
        // stages run at the device rate whatever rate the snapshot was taken at
        staging.set_sample_rate(m_config.sample_rate);
        {
            std::lock_guard<std::mutex> render(m_render_mutex);
            m_chain.swap(staging);
        }
        cache_controls();
        LOG_INFO("rack", "Restored chain with", m_chain.size(), "effects");
        // staging now holds the previous stages and is destroyed here, unlocked
    }

    void rack::cache_controls() {
        m_controls.clear();
        for (std::size_t i = 0; i < m_chain.size(); ++i) {
            auto id = m_chain.effect_id_at(i);
            const auto* controls = m_chain.effect_controls_at(i);
            if (id && controls) {
                m_controls[*id] = *controls;
            }
        }
    }

    // -------------------------------------------------------------------------
    // Notes
    // -------------------------------------------------------------------------

    std::optional<std::size_t> rack::note_on(midi_note_t note, float velocity) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        if (m_voices.max_voices() == 0) {
            return std::nullopt;
        }

        prepared_voice prepared;
        if (!m_voices.find_voice(note)) {
            auto built = m_voices.prepare_voice(note);
            if (!built) {
                return std::nullopt;
            }
            prepared = std::move(*built);
        }

        std::optional<std::size_t> index;
        {
            std::lock_guard<std::mutex> render(m_render_mutex);
            index = m_voices.trigger(note, velocity, prepared);
        }
        if (index) {
            LOG_DEBUG("rack", "Note", static_cast<int>(note), "on voice", *index);
        }
        return index;
    }

    void rack::note_off(midi_note_t note) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        std::lock_guard<std::mutex> render(m_render_mutex);
        m_voices.note_off(note);
    }

    void rack::all_notes_off() {
        std::lock_guard<std::mutex> control(m_control_mutex);
        std::lock_guard<std::mutex> render(m_render_mutex);
        m_voices.all_notes_off();
    }

    void rack::pitch_bend(float semitones) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        m_voices.pitch_bend(semitones);
    }

    void rack::set_cutoff(float hz) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        m_voices.set_cutoff(hz);
    }

    void rack::set_resonance(float resonance) {
        std::lock_guard<std::mutex> control(m_control_mutex);
        m_voices.set_resonance(resonance);
    }

    std::size_t rack::active_voices() const {
        std::lock_guard<std::mutex> control(m_control_mutex);
        return m_voices.active_voices();
    }

    std::vector<midi_note_t> rack::playing_notes() const {
        std::lock_guard<std::mutex> control(m_control_mutex);
        return m_voices.playing_notes();
    }

    // -------------------------------------------------------------------------
    // Render
    // -------------------------------------------------------------------------

    void rack::render(float* interleaved, std::size_t frames, const float* sidechain) noexcept {
        if (!interleaved) {
            return;
        }

        std::size_t done = 0;
        while (done < frames) {
            const std::size_t block = std::min(m_config.block_frames, frames - done);
            {
                std::lock_guard<std::mutex> render(m_render_mutex);
                const float gain = m_master_gain->value();
                for (std::size_t i = done; i < done + block; ++i) {
                    const auto dry = m_voices.get_stereo();

                    std::optional<stereo_frame> key;
                    if (sidechain) {
                        key = stereo_frame{sidechain[2 * i], sidechain[2 * i + 1]};
                    }

                    const auto wet = m_chain.process_with_sidechain(dry.left, dry.right, key);
                    interleaved[2 * i] = wet.left * gain;
                    interleaved[2 * i + 1] = wet.right * gain;
                }
            }
            done += block;
            m_frames_rendered.fetch_add(block, std::memory_order_relaxed);
        }
    }

    // -------------------------------------------------------------------------
    // Metering
    // -------------------------------------------------------------------------

    double rack::chain_cpu_usage() const {
        std::lock_guard<std::mutex> render(m_render_mutex);
        return m_chain.total_cpu_usage();
    }

    performance_metrics rack::voice_metrics() const {
        std::lock_guard<std::mutex> render(m_render_mutex);
        return m_voices.metrics();
    }

    std::map<std::string, stage_levels> rack::effect_levels() const {
        std::lock_guard<std::mutex> render(m_render_mutex);
        return m_chain.effect_levels();
    }
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
