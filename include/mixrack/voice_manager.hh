/**
 * @file voice_manager.hh
 * @brief Bounded polyphonic voice pool
 * @ingroup voices
 */

#ifndef MIXRACK_VOICE_MANAGER_HH
#define MIXRACK_VOICE_MANAGER_HH

#include <mixrack/cpu_meter.hh>
#include <mixrack/sdk/processor.hh>
#include <mixrack/sdk/synth_registry.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mixrack {

    /**
     * @brief Equal-tempered frequency of a MIDI note, A4 (69) = 440 Hz
     */
    MIXRACK_EXPORT float midi_to_freq(midi_note_t note) noexcept;

    /**
     * @struct voice
     * @brief One slot of the pool
     *
     * A slot is free when @ref note is empty. Generator and controls are
     * replaced on every fresh note-on since generators have a fixed
     * frequency.
     */
    struct voice {
        std::unique_ptr<signal_generator> generator;
        voice_controls controls;
        std::optional<midi_note_t> note;
        std::uint64_t age = 0;
    };

    /**
     * @struct prepared_voice
     * @brief A generator built ahead of voice_manager::trigger()
     *
     * After trigger() it holds whatever the slot held before (or the unused
     * generator on a retrigger), to be destroyed by the caller.
     */
    struct prepared_voice {
        std::unique_ptr<signal_generator> generator;
        voice_controls controls;
    };

    /**
     * @class voice_manager
     * @brief Note-to-voice binding, allocation, stealing and mixdown
     * @ingroup voices
     *
     * ## Allocation
     *
     * note_on() tries, in order:
     * 1. a voice already holding the note (retrigger: same index)
     * 2. the first free slot
     * 3. a new slot, while fewer than max_voices() exist
     * 4. stealing the slot with the smallest age (ties: lowest index)
     *
     * Every note-on stamps the chosen slot with a strictly increasing age,
     * so the oldest trigger is the one stolen. At most one slot holds a
     * given note.
     *
     * ## Release
     *
     * note_off() sets amp to 0 and frees the slot at once; release tails
     * belong inside the generator.
     *
     * ## Mixdown
     *
     * get_stereo() sums every allocated slot (free slots are silent) and
     * scales by 1/sqrt(n) when more than one slot exists.
     *
     * ## Threading
     *
     * Single owner. For a separate render thread use prepare_voice() outside
     * the render lock and trigger() inside it; see rack.
     */
    class MIXRACK_EXPORT voice_manager {
        public:
            static constexpr sample_rate_t DEFAULT_SAMPLE_RATE = 44100.0;

            voice_manager(std::shared_ptr<const synth_registry> registry,
                          std::string synth_name,
                          std::size_t max_voices,
                          sample_rate_t sample_rate = DEFAULT_SAMPLE_RATE);

            voice_manager(const voice_manager&) = delete;
            voice_manager& operator=(const voice_manager&) = delete;

            // -----------------------------------------------------------------
            // Notes
            // -----------------------------------------------------------------

            /**
             * @brief Start (or retrigger) a note
             * @param velocity Written to the voice amp, 0..1
             * @return Slot index, or empty when max_voices() is 0 or the synth
             *         cannot be built (logged)
             */
            std::optional<std::size_t> note_on(midi_note_t note, float velocity);

            /**
             * @brief Silence and free every slot holding @p note
             *
             * Releasing a note that is not held does nothing.
             */
            void note_off(midi_note_t note);

            void all_notes_off();

            /**
             * @brief Build a generator for @p note without touching the pool
             * @return empty if the synth cannot be built (logged)
             */
            [[nodiscard]] std::optional<prepared_voice> prepare_voice(midi_note_t note) const;

            /**
             * @brief note_on() with a generator built in advance
             *
             * Never builds anything. On return @p prepared holds the objects
             * the pool no longer needs.
             */
            std::optional<std::size_t> trigger(midi_note_t note, float velocity, prepared_voice& prepared);

            /**
             * @brief Index of the slot a note_on(note) would retrigger
             */
            [[nodiscard]] std::optional<std::size_t> find_voice(midi_note_t note) const;

            // -----------------------------------------------------------------
            // Broadcast controls (sounding voices only)
            // -----------------------------------------------------------------

            /**
             * @brief Bend by @p semitones; writes 2^(semitones/12)
             */
            void pitch_bend(float semitones);

            /// Voices without a cutoff control are skipped
            void set_cutoff(float hz);

            /// Voices without a resonance control are skipped
            void set_resonance(float resonance);

            void set_pressure(float pressure);

            // -----------------------------------------------------------------
            // Configuration
            // -----------------------------------------------------------------

            /**
             * @brief Build parameter for future notes
             */
            void set_default_param(const std::string& name, float value);

            [[nodiscard]] const param_map& default_params() const { return m_default_params; }

            void set_sample_rate(sample_rate_t sample_rate);

            [[nodiscard]] sample_rate_t sample_rate() const { return m_sample_rate; }

            [[nodiscard]] const std::string& synth_name() const { return m_synth_name; }

            // -----------------------------------------------------------------
            // Render
            // -----------------------------------------------------------------

            /**
             * @brief Next mixed frame of all voices
             * @warning Render thread; never allocates or throws
             */
            stereo_frame get_stereo() noexcept;

            // -----------------------------------------------------------------
            // Introspection
            // -----------------------------------------------------------------

            /// Slots currently holding a note
            [[nodiscard]] std::size_t active_voices() const;

            /// Slots created so far, free or not
            [[nodiscard]] std::size_t allocated_voices() const { return m_voices.size(); }

            [[nodiscard]] std::size_t max_voices() const { return m_max_voices; }

            /**
             * @brief Held notes in ascending order
             */
            [[nodiscard]] std::vector<midi_note_t> playing_notes() const;

            [[nodiscard]] std::optional<midi_note_t> voice_note(std::size_t index) const;

            [[nodiscard]] std::optional<std::uint64_t> voice_age(std::size_t index) const;

            [[nodiscard]] const performance_metrics& metrics() const { return m_meter.metrics(); }

            void reset_metrics() { m_meter.reset(); }

        private:
            void assign(voice& slot, midi_note_t note, float velocity, prepared_voice& prepared);

            std::string m_synth_name;
            param_map m_default_params;
            std::vector<voice> m_voices;
            std::size_t m_max_voices;
            std::uint64_t m_age_counter = 0;
            sample_rate_t m_sample_rate;
            std::shared_ptr<const synth_registry> m_registry;
            cpu_meter m_meter;
    };

    /**
     * @class poly_synth_builder
     * @brief Fluent setup of a voice_manager
     *
     * @code
     * auto pad = poly_synth_builder("saw")
     *                .voices(16)
     *                .cutoff(1200.0f)
     *                .resonance(0.4f)
     *                .sample_rate(48000.0)
     *                .build();
     * @endcode
     *
     * Without an explicit registry the built-in synths are used.
     */
    class MIXRACK_EXPORT poly_synth_builder {
        public:
            static constexpr std::size_t DEFAULT_VOICES = 8;

            explicit poly_synth_builder(std::string synth_name);

            poly_synth_builder& voices(std::size_t max_voices);
            poly_synth_builder& param(const std::string& name, float value);
            /// Shortcut for param("cutoff", hz)
            poly_synth_builder& cutoff(float hz);
            /// Shortcut for param("resonance", q)
            poly_synth_builder& resonance(float q);
            poly_synth_builder& sample_rate(sample_rate_t sample_rate);
            poly_synth_builder& registry(std::shared_ptr<const synth_registry> registry);

            [[nodiscard]] std::unique_ptr<voice_manager> build() const;

        private:
            std::string m_synth_name;
            std::size_t m_max_voices = DEFAULT_VOICES;
            param_map m_params;
            sample_rate_t m_sample_rate = voice_manager::DEFAULT_SAMPLE_RATE;
            std::shared_ptr<const synth_registry> m_registry;
    };
}

#endif
