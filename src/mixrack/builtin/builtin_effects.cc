#include <mixrack/builtin/builtin_effects.hh>
#include <mixrack/sdk/smoothed_param.hh>
#include "biquad.hh"
#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

namespace mixrack {

    namespace {
        constexpr sample_rate_t DEFAULT_RATE = 48000.0;
        constexpr float MAX_DELAY_SECONDS = 2.0f;

        float param_or(const param_map& params, const char* name, float fallback) {
            auto it = params.find(name);
            return it == params.end() ? fallback : it->second;
        }

        // exp(-1 / (t * sr)); non-positive times follow the target immediately
        float envelope_coefficient(float seconds, sample_rate_t sample_rate) {
            const double samples = static_cast<double>(seconds) * sample_rate;
            if (samples <= 0.0) {
                return 0.0f;
            }
            return static_cast<float>(std::exp(-1.0 / samples));
        }

        // ---------------------------------------------------------------------
        class gain_processor : public signal_processor {
            public:
                explicit gain_processor(shared_param gain)
                    : m_gain(std::move(gain), smoothed_param::DEFAULT_SMOOTHING_MS, DEFAULT_RATE) {
                }

                stereo_frame process(float left, float right) override {
                    const float g = m_gain.next();
                    return {left * g, right * g};
                }

                void reset() override {
                    m_gain.snap_to_target();
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_gain.set_sample_rate(sample_rate, smoothed_param::DEFAULT_SMOOTHING_MS);
                }

            private:
                smoothed_param m_gain;
        };

        class gain_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    auto gain = make_param(param_or(params, "gain", 1.0f));
                    effect_parts parts;
                    parts.processor = std::make_unique<gain_processor>(gain);
                    parts.controls.add("gain", gain);
                    return parts;
                }

                effect_metadata metadata() const override {
                    return effect_metadata("gain", "Linear gain", effect_category::other)
                        .with_param("gain", 1.0f, 0.0f, 4.0f);
                }
        };

        // ---------------------------------------------------------------------
        // Balance law: centre is unity on both sides.
        class pan_processor : public signal_processor {
            public:
                explicit pan_processor(shared_param pan)
                    : m_pan(std::move(pan), smoothed_param::DEFAULT_SMOOTHING_MS, DEFAULT_RATE) {
                }

                stereo_frame process(float left, float right) override {
                    const float p = std::clamp(m_pan.next(), -1.0f, 1.0f);
                    return {left * std::min(1.0f, 1.0f - p), right * std::min(1.0f, 1.0f + p)};
                }

                void reset() override {
                    m_pan.snap_to_target();
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_pan.set_sample_rate(sample_rate, smoothed_param::DEFAULT_SMOOTHING_MS);
                }

            private:
                smoothed_param m_pan;
        };

        class pan_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    auto pan = make_param(param_or(params, "pan", 0.0f));
                    effect_parts parts;
                    parts.processor = std::make_unique<pan_processor>(pan);
                    parts.controls.add("pan", pan);
                    return parts;
                }

                effect_metadata metadata() const override {
                    return effect_metadata("pan", "Stereo balance", effect_category::spatial)
                        .with_param("pan", 0.0f, -1.0f, 1.0f);
                }
        };

        // ---------------------------------------------------------------------
        class lowpass_processor : public signal_processor {
            public:
                lowpass_processor(shared_param cutoff, shared_param res)
                    : m_cutoff(std::move(cutoff)),
                      m_res(std::move(res)) {
                    update_coefficients(m_cutoff->value(), m_res->value());
                }

                stereo_frame process(float left, float right) override {
                    const float cutoff = m_cutoff->value();
                    const float res = m_res->value();
                    if (cutoff != m_last_cutoff || res != m_last_res) {
                        update_coefficients(cutoff, res);
                    }
                    return {m_left.tick(left, m_coef), m_right.tick(right, m_coef)};
                }

                void reset() override {
                    m_left = detail::biquad_state{};
                    m_right = detail::biquad_state{};
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_sample_rate = sample_rate;
                    update_coefficients(m_cutoff->value(), m_res->value());
                }

            private:
                void update_coefficients(float cutoff, float res) {
                    m_last_cutoff = cutoff;
                    m_last_res = res;
                    m_coef.set_lowpass(cutoff, res, m_sample_rate);
                }

                shared_param m_cutoff;
                shared_param m_res;
                sample_rate_t m_sample_rate = DEFAULT_RATE;
                float m_last_cutoff = 0.0f;
                float m_last_res = 0.0f;
                detail::biquad_coefficients m_coef;
                detail::biquad_state m_left;
                detail::biquad_state m_right;
        };

        class lowpass_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    auto cutoff = make_param(param_or(params, "cutoff", 1000.0f));
                    auto res = make_param(param_or(params, "res", 0.0f));
                    effect_parts parts;
                    parts.processor = std::make_unique<lowpass_processor>(cutoff, res);
                    parts.controls.add("cutoff", cutoff);
                    parts.controls.add("res", res);
                    return parts;
                }

                effect_metadata metadata() const override {
                    return effect_metadata("lowpass", "Resonant 2-pole lowpass", effect_category::filter)
                        .with_param("cutoff", 1000.0f, 20.0f, 20000.0f)
                        .with_param("res", 0.0f, 0.0f, 1.0f);
                }
        };

        // ---------------------------------------------------------------------
        // Feedback delay. The line is sized for MAX_DELAY_SECONDS and is only
        // reallocated by set_sample_rate(), which runs on the control side.
        class delay_processor : public signal_processor {
            public:
                delay_processor(shared_param time, shared_param feedback, shared_param mix)
                    : m_time(std::move(time)),
                      m_feedback(std::move(feedback)),
                      m_mix(std::move(mix)) {
                    allocate(DEFAULT_RATE);
                }

                stereo_frame process(float left, float right) override {
                    const std::size_t size = m_left.size();
                    const float max_delay = static_cast<float>(size - 1);
                    // non-finite values fall back to the shortest, driest setting
                    const float samples = m_time->value() * static_cast<float>(m_sample_rate);
                    const float delay = std::isfinite(samples) ? std::clamp(samples, 1.0f, max_delay) : 1.0f;
                    const auto offset = static_cast<std::size_t>(delay);
                    const std::size_t read = (m_write + size - offset) % size;

                    const float fb = m_feedback->value();
                    const float feedback = std::isfinite(fb) ? std::clamp(fb, 0.0f, 0.95f) : 0.0f;
                    const float wet = m_mix->value();
                    const float mix = std::isfinite(wet) ? std::clamp(wet, 0.0f, 1.0f) : 0.0f;

                    const float wet_l = m_left[read];
                    const float wet_r = m_right[read];
                    m_left[m_write] = left + wet_l * feedback;
                    m_right[m_write] = right + wet_r * feedback;
                    m_write = (m_write + 1) % size;

                    return {left * (1.0f - mix) + wet_l * mix, right * (1.0f - mix) + wet_r * mix};
                }

                void reset() override {
                    std::fill(m_left.begin(), m_left.end(), 0.0f);
                    std::fill(m_right.begin(), m_right.end(), 0.0f);
                    m_write = 0;
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    allocate(sample_rate);
                }

            private:
                void allocate(sample_rate_t sample_rate) {
                    m_sample_rate = sample_rate;
                    const auto size = static_cast<std::size_t>(MAX_DELAY_SECONDS * sample_rate) + 2;
                    m_left.assign(size, 0.0f);
                    m_right.assign(size, 0.0f);
                    m_write = 0;
                }

                shared_param m_time;
                shared_param m_feedback;
                shared_param m_mix;
                sample_rate_t m_sample_rate = DEFAULT_RATE;
                std::vector<float> m_left;
                std::vector<float> m_right;
                std::size_t m_write = 0;
        };

        class delay_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    auto time = make_param(param_or(params, "time", 0.25f));
                    auto feedback = make_param(param_or(params, "feedback", 0.3f));
                    auto mix = make_param(param_or(params, "mix", 0.5f));
                    effect_parts parts;
                    parts.processor = std::make_unique<delay_processor>(time, feedback, mix);
                    parts.controls.add("time", time);
                    parts.controls.add("feedback", feedback);
                    parts.controls.add("mix", mix);
                    return parts;
                }

                effect_metadata metadata() const override {
                    return effect_metadata("delay", "Feedback echo", effect_category::time)
                        .with_param("time", 0.25f, 0.0f, MAX_DELAY_SECONDS)
                        .with_param("feedback", 0.3f, 0.0f, 0.95f)
                        .with_param("mix", 0.5f, 0.0f, 1.0f);
                }
        };

        // ---------------------------------------------------------------------
        // Used as the plain processor of the sidechain effects: without a key
        // signal there is nothing to react to.
        class passthrough_processor : public signal_processor {
            public:
                stereo_frame process(float left, float right) override {
                    return {left, right};
                }
        };

        /**
         * Attack/release follower shared by the keyed compressor and gate.
         * Coefficients are recomputed only when the time controls change.
         */
        class envelope_follower {
            public:
                envelope_follower(shared_param attack, shared_param release)
                    : m_attack(std::move(attack)),
                      m_release(std::move(release)) {
                }

                float follow(float target) {
                    refresh();
                    const float coeff = target > m_envelope ? m_attack_coeff : m_release_coeff;
                    m_envelope = target + coeff * (m_envelope - target);
                    return m_envelope;
                }

                void reset() {
                    m_envelope = 0.0f;
                }

                void set_sample_rate(sample_rate_t sample_rate) {
                    m_sample_rate = sample_rate;
                    m_last_attack = -1.0f;
                    m_last_release = -1.0f;
                }

            private:
                void refresh() {
                    const float attack = m_attack->value();
                    const float release = m_release->value();
                    if (attack != m_last_attack) {
                        m_last_attack = attack;
                        m_attack_coeff = envelope_coefficient(attack, m_sample_rate);
                    }
                    if (release != m_last_release) {
                        m_last_release = release;
                        m_release_coeff = envelope_coefficient(release, m_sample_rate);
                    }
                }

                shared_param m_attack;
                shared_param m_release;
                sample_rate_t m_sample_rate = DEFAULT_RATE;
                float m_last_attack = -1.0f;
                float m_last_release = -1.0f;
                float m_attack_coeff = 0.0f;
                float m_release_coeff = 0.0f;
                float m_envelope = 0.0f;
        };

        class keyed_compressor : public sidechain_processor {
            public:
                keyed_compressor(shared_param threshold, shared_param ratio,
                                 shared_param attack, shared_param release,
                                 sample_rate_t sample_rate)
                    : m_threshold(std::move(threshold)),
                      m_ratio(std::move(ratio)),
                      m_follower(std::move(attack), std::move(release)) {
                    m_follower.set_sample_rate(sample_rate);
                }

                stereo_frame process(float left, float right) override {
                    return {left, right};
                }

                stereo_frame process_with_sidechain(float left, float right,
                                                    float sc_left, float sc_right) override {
                    const float threshold = m_threshold->value();
                    const float level = sidechain_peak(sc_left, sc_right);
                    const float target = amplitude_to_db(level) > threshold ? level : 0.0f;
                    const float envelope = m_follower.follow(target);

                    float gain = 1.0f;
                    if (envelope > 0.0f) {
                        const float envelope_db = amplitude_to_db(envelope);
                        if (envelope_db > threshold) {
                            const float ratio = std::max(1.0f, m_ratio->value());
                            const float over_db = envelope_db - threshold;
                            gain = db_to_amplitude(-(over_db * (1.0f - 1.0f / ratio)));
                        }
                    }
                    return {left * gain, right * gain};
                }

                void reset() override {
                    m_follower.reset();
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_follower.set_sample_rate(sample_rate);
                }

            private:
                shared_param m_threshold;
                shared_param m_ratio;
                envelope_follower m_follower;
        };

        class keyed_gate : public sidechain_processor {
            public:
                keyed_gate(shared_param threshold, shared_param attack, shared_param release,
                           sample_rate_t sample_rate)
                    : m_threshold(std::move(threshold)),
                      m_follower(std::move(attack), std::move(release)) {
                    m_follower.set_sample_rate(sample_rate);
                }

                stereo_frame process(float left, float right) override {
                    return {left, right};
                }

                // gain glides between 0 (closed) and 1 (open)
                stereo_frame process_with_sidechain(float left, float right,
                                                    float sc_left, float sc_right) override {
                    const float level = sidechain_peak(sc_left, sc_right);
                    const float target = amplitude_to_db(level) > m_threshold->value() ? 1.0f : 0.0f;
                    const float gain = m_follower.follow(target);
                    return {left * gain, right * gain};
                }

                void reset() override {
                    m_follower.reset();
                }

                void set_sample_rate(sample_rate_t sample_rate) override {
                    m_follower.set_sample_rate(sample_rate);
                }

            private:
                shared_param m_threshold;
                envelope_follower m_follower;
        };

        class sidechain_compressor_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    effect_parts parts;
                    parts.processor = std::make_unique<passthrough_processor>();
                    parts.controls.add("threshold", make_param(param_or(params, "threshold", -20.0f)));
                    parts.controls.add("ratio", make_param(param_or(params, "ratio", 4.0f)));
                    parts.controls.add("attack", make_param(param_or(params, "attack", 0.01f)));
                    parts.controls.add("release", make_param(param_or(params, "release", 0.1f)));
                    return parts;
                }

                std::unique_ptr<sidechain_processor> build_sidechain(
                    const param_map& params, sample_rate_t sample_rate,
                    const effect_controls& controls) const override {
                    auto bind = [&](const char* name, float fallback) {
                        auto p = controls.find(name);
                        return p ? p : make_param(param_or(params, name, fallback));
                    };
                    return std::make_unique<keyed_compressor>(
                        bind("threshold", -20.0f), bind("ratio", 4.0f),
                        bind("attack", 0.01f), bind("release", 0.1f), sample_rate);
                }

                effect_metadata metadata() const override {
                    return effect_metadata("sidechain_compressor",
                                           "Compressor keyed by an external signal",
                                           effect_category::dynamics)
                        .with_param("threshold", -20.0f, -60.0f, 0.0f)
                        .with_param("ratio", 4.0f, 1.0f, 20.0f)
                        .with_param("attack", 0.01f, 0.0001f, 1.0f)
                        .with_param("release", 0.1f, 0.001f, 5.0f)
                        .with_tag(SIDECHAIN_TAG);
                }
        };

        class sidechain_gate_builder : public effect_builder {
            public:
                effect_parts build(const param_map& params) const override {
                    effect_parts parts;
                    parts.processor = std::make_unique<passthrough_processor>();
                    parts.controls.add("threshold", make_param(param_or(params, "threshold", -40.0f)));
                    parts.controls.add("attack", make_param(param_or(params, "attack", 0.001f)));
                    parts.controls.add("release", make_param(param_or(params, "release", 0.1f)));
                    return parts;
                }

                std::unique_ptr<sidechain_processor> build_sidechain(
                    const param_map& params, sample_rate_t sample_rate,
                    const effect_controls& controls) const override {
                    auto bind = [&](const char* name, float fallback) {
                        auto p = controls.find(name);
                        return p ? p : make_param(param_or(params, name, fallback));
                    };
                    return std::make_unique<keyed_gate>(
                        bind("threshold", -40.0f), bind("attack", 0.001f),
                        bind("release", 0.1f), sample_rate);
                }

                effect_metadata metadata() const override {
                    return effect_metadata("sidechain_gate",
                                           "Gate opened by an external signal",
                                           effect_category::dynamics)
                        .with_param("threshold", -40.0f, -80.0f, 0.0f)
                        .with_param("attack", 0.001f, 0.0001f, 1.0f)
                        .with_param("release", 0.1f, 0.001f, 5.0f)
                        .with_tag(SIDECHAIN_TAG);
                }
        };
    }

    float amplitude_to_db(float amplitude) noexcept {
        return 20.0f * std::log10(std::max(amplitude, 1e-6f));
    }

    float db_to_amplitude(float db) noexcept {
        return std::pow(10.0f, db / 20.0f);
    }

    float sidechain_peak(float left, float right) noexcept {
        return std::max(std::fabs(left), std::fabs(right));
    }

    float sidechain_rms(float left, float right) noexcept {
        return std::sqrt((left * left + right * right) * 0.5f);
    }

    void register_builtin_effects(effect_registry& registry) {
        registry.register_effect("gain", std::make_shared<gain_builder>());
        registry.register_effect("pan", std::make_shared<pan_builder>());
        registry.register_effect("lowpass", std::make_shared<lowpass_builder>());
        registry.register_effect("delay", std::make_shared<delay_builder>());
        registry.register_effect("sidechain_compressor", std::make_shared<sidechain_compressor_builder>());
        registry.register_effect("sidechain_gate", std::make_shared<sidechain_gate_builder>());
    }
}
