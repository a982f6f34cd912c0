// This is copyrighted software. More information is at the end of this file.
#include <mixrack/voice_manager.hh>
#include <mixrack/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace mixrack {

    float midi_to_freq(midi_note_t note) noexcept {
        return 440.0f * std::pow(2.0f, (static_cast<float>(note) - 69.0f) / 12.0f);
    }

    voice_manager::voice_manager(std::shared_ptr<const synth_registry> registry,
                                 std::string synth_name,
                                 std::size_t max_voices,
                                 sample_rate_t sample_rate)
        : m_synth_name(std::move(synth_name)),
          m_max_voices(max_voices),
          m_sample_rate(sample_rate),
          m_registry(std::move(registry)),
          m_meter(sample_rate) {
        // slots are appended lazily but never beyond this, so trigger() never reallocates
        m_voices.reserve(max_voices);

        if (!m_registry || !m_registry->contains(m_synth_name)) {
            LOG_WARN("voice_manager", "Synth", m_synth_name, "is not registered; notes will be dropped");
        }
    }

    std::optional<prepared_voice> voice_manager::prepare_voice(midi_note_t note) const {
        if (!m_registry) {
            LOG_WARN("voice_manager", "No synth registry, dropping note", static_cast<int>(note));
            return std::nullopt;
        }

        try {
            auto parts = m_registry->build(m_synth_name, midi_to_freq(note), m_default_params);
            parts.generator->set_sample_rate(m_sample_rate);
            return prepared_voice{std::move(parts.generator), std::move(parts.controls)};
        } catch (const processor_not_found_error& e) {
            LOG_WARN("voice_manager", "Cannot build voice for note", static_cast<int>(note), ":", e.what());
        } catch (const std::exception& e) {
            LOG_WARN("voice_manager", "Synth", m_synth_name, "failed for note", static_cast<int>(note), ":", e.what());
        }
        return std::nullopt;
    }

    std::optional<std::size_t> voice_manager::find_voice(midi_note_t note) const {
        for (std::size_t i = 0; i < m_voices.size(); ++i) {
            if (m_voices[i].note == note) {
                return i;
            }
        }
        return std::nullopt;
    }

    void voice_manager::assign(voice& slot, midi_note_t note, float velocity, prepared_voice& prepared) {
        std::swap(slot.generator, prepared.generator);
        std::swap(slot.controls, prepared.controls);
        slot.controls.amp->set(velocity);
        slot.note = note;
        slot.age = m_age_counter++;
    }

    std::optional<std::size_t> voice_manager::trigger(midi_note_t note, float velocity, prepared_voice& prepared) {
        if (m_max_voices == 0) {
            return std::nullopt;
        }

        if (auto index = find_voice(note)) {
            auto& slot = m_voices[*index];
            slot.controls.amp->set(velocity);
            slot.controls.pitch_bend->set(1.0f);
            slot.age = m_age_counter++;
            return index;
        }

        if (!prepared.generator || !prepared.controls.amp) {
            return std::nullopt;
        }

        for (std::size_t i = 0; i < m_voices.size(); ++i) {
            if (!m_voices[i].note) {
                assign(m_voices[i], note, velocity, prepared);
                return i;
            }
        }

        if (m_voices.size() < m_max_voices) {
            m_voices.emplace_back();
            assign(m_voices.back(), note, velocity, prepared);
            return m_voices.size() - 1;
        }

        std::size_t oldest = 0;
        for (std::size_t i = 1; i < m_voices.size(); ++i) {
            if (m_voices[i].age < m_voices[oldest].age) {
                oldest = i;
            }
        }
        assign(m_voices[oldest], note, velocity, prepared);
        return oldest;
    }

    std::optional<std::size_t> voice_manager::note_on(midi_note_t note, float velocity) {
        if (m_max_voices == 0) {
            return std::nullopt;
        }

        prepared_voice prepared;
        if (!find_voice(note)) {
            auto built = prepare_voice(note);
            if (!built) {
                return std::nullopt;
            }
            prepared = std::move(*built);
        }
        auto index = trigger(note, velocity, prepared);
        if (index) {
            LOG_DEBUG("voice_manager", "Note", static_cast<int>(note), "on voice", *index);
        }
        return index;
    }

    void voice_manager::note_off(midi_note_t note) {
        for (auto& v : m_voices) {
            if (v.note == note) {
                v.controls.amp->set(0.0f);
                v.note.reset();
            }
        }
    }

    void voice_manager::all_notes_off() {
        for (auto& v : m_voices) {
            if (v.controls.amp) {
                v.controls.amp->set(0.0f);
            }
            v.note.reset();
        }
    }

    void voice_manager::pitch_bend(float semitones) {
        const float bend = std::pow(2.0f, semitones / 12.0f);
        for (auto& v : m_voices) {
            if (v.note) {
                v.controls.pitch_bend->set(bend);
            }
        }
    }

    void voice_manager::set_cutoff(float hz) {
        for (auto& v : m_voices) {
            if (v.note && v.controls.cutoff) {
                v.controls.cutoff->set(hz);
            }
        }
    }

    void voice_manager::set_resonance(float resonance) {
        for (auto& v : m_voices) {
            if (v.note && v.controls.resonance) {
                v.controls.resonance->set(resonance);
            }
        }
    }

    void voice_manager::set_pressure(float pressure) {
        for (auto& v : m_voices) {
            if (v.note) {
                v.controls.pressure->set(pressure);
            }
        }
    }

    void voice_manager::set_default_param(const std::string& name, float value) {
        m_default_params[name] = value;
    }

    void voice_manager::set_sample_rate(sample_rate_t sample_rate) {
        if (sample_rate <= 0.0) {
            LOG_WARN("voice_manager", "Ignoring invalid sample rate", sample_rate);
            return;
        }
        m_sample_rate = sample_rate;
        m_meter.set_sample_rate(sample_rate);
        for (auto& v : m_voices) {
            v.generator->set_sample_rate(sample_rate);
        }
    }

    stereo_frame voice_manager::get_stereo() noexcept {
        const auto token = m_meter.start_timing();

        stereo_frame mix;
        for (auto& v : m_voices) {
            const auto frame = v.generator->next();
            mix.left += frame.left;
            mix.right += frame.right;
        }

        if (m_voices.size() > 1) {
            const float scale = 1.0f / std::sqrt(static_cast<float>(m_voices.size()));
            mix.left *= scale;
            mix.right *= scale;
        }

        m_meter.stop_timing(token, 1);
        return mix;
    }

    std::size_t voice_manager::active_voices() const {
        return static_cast<std::size_t>(std::count_if(m_voices.begin(), m_voices.end(),
                                                      [](const voice& v) { return v.note.has_value(); }));
    }

    std::vector<midi_note_t> voice_manager::playing_notes() const {
        std::vector<midi_note_t> notes;
        notes.reserve(m_voices.size());
        for (const auto& v : m_voices) {
            if (v.note) {
                notes.push_back(*v.note);
            }
        }
        std::sort(notes.begin(), notes.end());
        return notes;
    }

    std::optional<midi_note_t> voice_manager::voice_note(std::size_t index) const {
        if (index >= m_voices.size()) {
            return std::nullopt;
        }
        return m_voices[index].note;
    }

    std::optional<std::uint64_t> voice_manager::voice_age(std::size_t index) const {
        if (index >= m_voices.size()) {
            return std::nullopt;
        }
        return m_voices[index].age;
    }

    poly_synth_builder::poly_synth_builder(std::string synth_name)
        : m_synth_name(std::move(synth_name)) {
    }

    poly_synth_builder& poly_synth_builder::voices(std::size_t max_voices) {
        m_max_voices = max_voices;
        return *this;
    }

    poly_synth_builder& poly_synth_builder::param(const std::string& name, float value) {
        m_params[name] = value;
        return *this;
    }

    poly_synth_builder& poly_synth_builder::cutoff(float hz) {
        return param("cutoff", hz);
    }

    poly_synth_builder& poly_synth_builder::resonance(float q) {
        return param("resonance", q);
    }

    poly_synth_builder& poly_synth_builder::sample_rate(sample_rate_t sample_rate) {
        m_sample_rate = sample_rate;
        return *this;
    }

    poly_synth_builder& poly_synth_builder::registry(std::shared_ptr<const synth_registry> registry) {
        m_registry = std::move(registry);
        return *this;
    }

    std::unique_ptr<voice_manager> poly_synth_builder::build() const {
        std::shared_ptr<const synth_registry> registry = m_registry;
        if (!registry) {
            registry = synth_registry::with_builtin();
        }
        auto manager = std::make_unique<voice_manager>(std::move(registry), m_synth_name, m_max_voices, m_sample_rate);
        for (const auto& [name, value] : m_params) {
            manager->set_default_param(name, value);
        }
        return manager;
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
