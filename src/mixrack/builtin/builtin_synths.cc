#include <mixrack/builtin/builtin_synths.hh>
#include "biquad.hh"
#include <cmath>
#include <cstdint>
#include <memory>
#include <utility>

namespace mixrack {

    namespace {
        constexpr sample_rate_t DEFAULT_RATE = 44100.0;
        constexpr double TWO_PI = 6.28318530717958647692;

        enum class waveform {
            sine,
            saw,
            square,
            triangle
        };

        float param_or(const param_map& params, const char* name, float fallback) {
            auto it = params.find(name);
            return it == params.end() ? fallback : it->second;
        }

        // pressure adds up to a quarter of extra level on top of amp
        float voice_level(const voice_controls& controls) {
            return controls.amp->value() * (1.0f + 0.25f * controls.pressure->value());
        }

        /**
         * Naive phase-accumulator oscillator. The frequency is fixed at
         * construction; pitch_bend scales the phase increment per sample.
         */
        class oscillator_voice : public signal_generator {
            public:
                oscillator_voice(waveform shape, float freq, voice_controls controls)
                    : m_shape(shape),
                      m_freq(freq),
                      m_controls(std::move(controls)) {
                    if (m_controls.cutoff && m_controls.resonance) {
                        update_filter();
                    }
                }

                stereo_frame next() override {
                    const float level = voice_level(m_controls);
                    float sample = 0.0f;
                    if (level != 0.0f) {
                        sample = shape_at(m_phase) * level;
                    }

                    const double bend = m_controls.pitch_bend->value();
                    m_phase += static_cast<double>(m_freq) * bend / m_sample_rate;
                    m_phase -= std::floor(m_phase);

                    if (m_controls.cutoff && m_controls.resonance) {
                        const float cutoff = m_controls.cutoff->value();
                        const float res = m_controls.resonance->value();
                        if (cutoff != m_last_cutoff || res != m_last_res) {
                            update_filter();
                        }
                        sample = m_filter.tick(sample, m_coef);
                    }
                    return {sample, sample};
                }

                void reset() override {
                    m_phase = 0.0;
                    m_filter = detail::biquad_state{};
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_sample_rate = sample_rate;
                    if (m_controls.cutoff && m_controls.resonance) {
                        update_filter();
                    }
                }

            private:
                float shape_at(double phase) const {
                    switch (m_shape) {
                        case waveform::sine:
                            return static_cast<float>(std::sin(TWO_PI * phase));
                        case waveform::saw:
                            return static_cast<float>(2.0 * phase - 1.0);
                        case waveform::square:
                            return phase < 0.5 ? 1.0f : -1.0f;
                        case waveform::triangle:
                            return static_cast<float>(1.0 - 4.0 * std::fabs(phase - 0.5));
                    }
                    return 0.0f;
                }

                void update_filter() {
                    m_last_cutoff = m_controls.cutoff->value();
                    m_last_res = m_controls.resonance->value();
                    m_coef.set_lowpass(m_last_cutoff, m_last_res, m_sample_rate);
                }

                waveform m_shape;
                float m_freq;
                voice_controls m_controls;
                sample_rate_t m_sample_rate = DEFAULT_RATE;
                double m_phase = 0.0;
                float m_last_cutoff = 0.0f;
                float m_last_res = 0.0f;
                detail::biquad_coefficients m_coef;
                detail::biquad_state m_filter;
        };

        // xorshift32; frequency only seeds the generator
        class noise_voice : public signal_generator {
            public:
                noise_voice(float freq, voice_controls controls)
                    : m_seed(seed_for(freq)),
                      m_state(m_seed),
                      m_controls(std::move(controls)) {
                }

                stereo_frame next() override {
                    m_state ^= m_state << 13;
                    m_state ^= m_state >> 17;
                    m_state ^= m_state << 5;
                    const float white = static_cast<float>(m_state) / 2147483648.0f - 1.0f;
                    const float sample = white * voice_level(m_controls);
                    return {sample, sample};
                }

                void reset() override {
                    m_state = m_seed;
                }

            private:
                static std::uint32_t seed_for(float freq) {
                    const auto seed = static_cast<std::uint32_t>(freq * 1000.0f) ^ 0x9E3779B9u;
                    return seed == 0 ? 1u : seed;
                }

                std::uint32_t m_seed;
                std::uint32_t m_state;
                voice_controls m_controls;
        };

        class oscillator_builder : public synth_builder {
            public:
                oscillator_builder(waveform shape, std::string name, std::string description, bool filtered)
                    : m_shape(shape),
                      m_name(std::move(name)),
                      m_description(std::move(description)),
                      m_filtered(filtered) {
                }

                synth_parts build(float freq, const param_map& params) const override {
                    auto controls = voice_controls::make(param_or(params, "amp", 1.0f));
                    controls.pitch_bend->set(param_or(params, "pitch_bend", 1.0f));
                    controls.pressure->set(param_or(params, "pressure", 0.0f));
                    if (m_filtered) {
                        controls.cutoff = make_param(param_or(params, "cutoff", 2000.0f));
                        controls.resonance = make_param(param_or(params, "resonance", 0.2f));
                    }
                    synth_parts parts;
                    parts.generator = std::make_unique<oscillator_voice>(m_shape, freq, controls);
                    parts.controls = std::move(controls);
                    return parts;
                }

                synth_metadata metadata() const override {
                    synth_metadata meta(m_name, m_description,
                                        m_filtered ? synth_category::analog : synth_category::basic);
                    meta.with_param("amp", 1.0f, 0.0f, 1.0f)
                        .with_param("pitch_bend", 1.0f, 0.5f, 2.0f)
                        .with_param("pressure", 0.0f, 0.0f, 1.0f);
                    if (m_filtered) {
                        meta.with_param("cutoff", 2000.0f, 20.0f, 20000.0f)
                            .with_param("resonance", 0.2f, 0.0f, 1.0f);
                    }
                    return meta;
                }

            private:
                waveform m_shape;
                std::string m_name;
                std::string m_description;
                bool m_filtered;
        };

        class noise_builder : public synth_builder {
            public:
                synth_parts build(float freq, const param_map& params) const override {
                    auto controls = voice_controls::make(param_or(params, "amp", 1.0f));
                    controls.pressure->set(param_or(params, "pressure", 0.0f));
                    synth_parts parts;
                    parts.generator = std::make_unique<noise_voice>(freq, controls);
                    parts.controls = std::move(controls);
                    return parts;
                }

                synth_metadata metadata() const override {
                    return synth_metadata("noise", "White noise", synth_category::noise)
                        .with_param("amp", 1.0f, 0.0f, 1.0f)
                        .with_param("pressure", 0.0f, 0.0f, 1.0f);
                }
        };
    }

    void register_builtin_synths(synth_registry& registry) {
        auto sine = std::make_shared<oscillator_builder>(waveform::sine, "sine", "Pure sine tone", false);
        auto triangle = std::make_shared<oscillator_builder>(waveform::triangle, "triangle", "Triangle wave", false);

        registry.register_synth("sine", sine);
        registry.register_synth("beep", sine);
        registry.register_synth("saw", std::make_shared<oscillator_builder>(
            waveform::saw, "saw", "Filtered sawtooth", true));
        registry.register_synth("square", std::make_shared<oscillator_builder>(
            waveform::square, "square", "Filtered square wave", true));
        registry.register_synth("triangle", triangle);
        registry.register_synth("tri", triangle);
        registry.register_synth("noise", std::make_shared<noise_builder>());
    }
}
