#ifndef MIXRACK_MOCK_COMPONENTS_HH
#define MIXRACK_MOCK_COMPONENTS_HH

#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/sdk/processor.hh>
#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/synth_registry.hh>
#include <mixrack/sdk/types.hh>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace mixrack::test {

// Multiplies both channels by a shared "gain" parameter, no smoothing
class scale_processor : public signal_processor {
public:
    explicit scale_processor(shared_param gain)
        : m_gain(std::move(gain)) {}

    stereo_frame process(float left, float right) override {
        ++calls;
        const float g = m_gain->value();
        return {left * g, right * g};
    }

    void reset() override {
        ++resets;
    }

    void set_sample_rate(sample_rate_t sample_rate) override {
        last_sample_rate = sample_rate;
    }

    int calls = 0;
    int resets = 0;
    sample_rate_t last_sample_rate = 0.0;

private:
    shared_param m_gain;
};

// Adds a constant offset, to make processing order observable
class offset_processor : public signal_processor {
public:
    explicit offset_processor(shared_param offset)
        : m_offset(std::move(offset)) {}

    stereo_frame process(float left, float right) override {
        const float o = m_offset->value();
        return {left + o, right + o};
    }

private:
    shared_param m_offset;
};

// Sidechain variant that outputs the key signal itself
class key_passthrough : public sidechain_processor {
public:
    stereo_frame process(float left, float right) override {
        return {left, right};
    }

    stereo_frame process_with_sidechain(float, float, float sc_left, float sc_right) override {
        ++keyed_calls;
        return {sc_left, sc_right};
    }

    int keyed_calls = 0;
};

class scale_builder : public effect_builder {
public:
    effect_parts build(const param_map& params) const override {
        auto gain = make_param(params.at("gain"));
        effect_parts parts;
        parts.processor = std::make_unique<scale_processor>(gain);
        parts.controls.add("gain", gain);
        return parts;
    }

    effect_metadata metadata() const override {
        return effect_metadata("scale", "Test gain", effect_category::other)
            .with_param("gain", 1.0f, 0.0f, 10.0f);
    }
};

class offset_builder : public effect_builder {
public:
    explicit offset_builder(std::size_t latency = 0)
        : m_latency(latency) {}

    effect_parts build(const param_map& params) const override {
        auto offset = make_param(params.at("offset"));
        effect_parts parts;
        parts.processor = std::make_unique<offset_processor>(offset);
        parts.controls.add("offset", offset);
        return parts;
    }

    effect_metadata metadata() const override {
        return effect_metadata("offset", "Test offset", effect_category::other)
            .with_param("offset", 0.0f, -10.0f, 10.0f)
            .with_latency(m_latency);
    }

private:
    std::size_t m_latency;
};

class key_builder : public effect_builder {
public:
    effect_parts build(const param_map&) const override {
        effect_parts parts;
        parts.processor = std::make_unique<scale_processor>(make_param(1.0f));
        parts.controls.add("amount", make_param(0.5f));
        return parts;
    }

    std::unique_ptr<sidechain_processor> build_sidechain(const param_map&, sample_rate_t,
                                                         const effect_controls&) const override {
        return std::make_unique<key_passthrough>();
    }

    effect_metadata metadata() const override {
        return effect_metadata("key", "Outputs the sidechain", effect_category::dynamics)
            .with_param("amount", 0.5f, 0.0f, 1.0f)
            .with_tag(SIDECHAIN_TAG);
    }
};

// Builder that returns no processor at all
class broken_builder : public effect_builder {
public:
    effect_parts build(const param_map&) const override {
        return effect_parts{};
    }

    effect_metadata metadata() const override {
        return effect_metadata("broken", "Builds nothing", effect_category::other);
    }
};

inline std::shared_ptr<effect_registry> make_test_effect_registry() {
    auto registry = std::make_shared<effect_registry>();
    registry->register_effect("scale", std::make_shared<scale_builder>());
    registry->register_effect("offset", std::make_shared<offset_builder>());
    registry->register_effect("slow_offset", std::make_shared<offset_builder>(64));
    registry->register_effect("key", std::make_shared<key_builder>());
    registry->register_effect("broken", std::make_shared<broken_builder>());
    return registry;
}

// Generator producing a constant amp-scaled value; counts instances
class constant_generator : public signal_generator {
public:
    constant_generator(float freq, voice_controls controls, std::shared_ptr<std::atomic<int>> live)
        : m_freq(freq), m_controls(std::move(controls)), m_live(std::move(live)) {
        ++*m_live;
    }

    ~constant_generator() override {
        --*m_live;
    }

    stereo_frame next() override {
        const float v = m_controls.amp->value();
        return {v, v};
    }

    void set_sample_rate(sample_rate_t sample_rate) override {
        last_sample_rate = sample_rate;
    }

    float frequency() const { return m_freq; }

    sample_rate_t last_sample_rate = 0.0;

private:
    float m_freq;
    voice_controls m_controls;
    std::shared_ptr<std::atomic<int>> m_live;
};

class constant_synth_builder : public synth_builder {
public:
    explicit constant_synth_builder(bool with_filter = false)
        : live(std::make_shared<std::atomic<int>>(0)), m_with_filter(with_filter) {}

    synth_parts build(float freq, const param_map& params) const override {
        ++builds;
        last_freq = freq;
        last_params = params;
        auto controls = voice_controls::make(1.0f);
        if (m_with_filter) {
            controls.cutoff = make_param(1000.0f);
            controls.resonance = make_param(0.1f);
        }
        last_controls = controls;
        synth_parts parts;
        parts.generator = std::make_unique<constant_generator>(freq, controls, live);
        parts.controls = std::move(controls);
        return parts;
    }

    synth_metadata metadata() const override {
        return synth_metadata("constant", "Test voice", synth_category::basic)
            .with_param("amp", 1.0f, 0.0f, 1.0f);
    }

    std::shared_ptr<std::atomic<int>> live;
    mutable int builds = 0;
    mutable float last_freq = 0.0f;
    mutable param_map last_params;
    mutable voice_controls last_controls;

private:
    bool m_with_filter;
};

// Synth builder whose construction fails with a plain runtime_error
class throwing_synth_builder : public synth_builder {
public:
    synth_parts build(float, const param_map&) const override {
        ++attempts;
        throw std::runtime_error("wavetable allocation failed");
    }

    synth_metadata metadata() const override {
        return synth_metadata("throwing", "Always fails", synth_category::basic);
    }

    mutable int attempts = 0;
};

} // namespace mixrack::test

#endif // MIXRACK_MOCK_COMPONENTS_HH
