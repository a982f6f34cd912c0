#include <mixrack/sdk/synth_registry.hh>
#include <mixrack/builtin/builtin_synths.hh>
#include <mixrack/error.hh>
#include <utility>

namespace mixrack {

    voice_controls voice_controls::make(float amp) {
        voice_controls controls;
        controls.amp = make_param(amp);
        controls.pitch_bend = make_param(1.0f);
        controls.pressure = make_param(0.0f);
        return controls;
    }

    synth_metadata::synth_metadata(std::string name_, std::string description_, synth_category category_)
        : name(std::move(name_)),
          description(std::move(description_)),
          category(category_) {
    }

    synth_metadata& synth_metadata::with_param(const std::string& param, float default_value, float min, float max) {
        parameters.emplace_back(param, default_value, min, max);
        return *this;
    }

    synth_builder::~synth_builder() = default;

    std::shared_ptr<synth_registry> synth_registry::with_builtin() {
        auto registry = std::make_shared<synth_registry>();
        register_builtin_synths(*registry);
        return registry;
    }

    void synth_registry::register_synth(const std::string& name, std::shared_ptr<synth_builder> builder) {
        if (!builder) {
            return;
        }
        m_builders[name] = std::move(builder);
    }

    synth_parts synth_registry::build(const std::string& name, float freq, const param_map& params) const {
        auto it = m_builders.find(name);
        if (it == m_builders.end()) {
            throw processor_not_found_error(name);
        }

        param_map merged;
        for (const auto& def : it->second->metadata().parameters) {
            merged[def.name] = def.default_value;
        }
        for (const auto& [key, value] : params) {
            merged[key] = value;
        }

        auto parts = it->second->build(freq, merged);
        if (!parts.generator || !parts.controls.amp || !parts.controls.pitch_bend || !parts.controls.pressure) {
            throw processor_not_found_error(name, "builder returned an incomplete voice");
        }
        return parts;
    }

    std::optional<synth_metadata> synth_registry::metadata(const std::string& name) const {
        auto it = m_builders.find(name);
        if (it == m_builders.end()) {
            return std::nullopt;
        }
        return it->second->metadata();
    }

    bool synth_registry::contains(const std::string& name) const {
        return m_builders.find(name) != m_builders.end();
    }

    std::vector<std::string> synth_registry::names() const {
        std::vector<std::string> result;
        result.reserve(m_builders.size());
        for (const auto& entry : m_builders) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::size_t synth_registry::size() const {
        return m_builders.size();
    }
}
