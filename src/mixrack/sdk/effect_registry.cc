// This is copyrighted software. More information is at the end of this file.
#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/builtin/builtin_effects.hh>
#include <mixrack/error.hh>
#include <algorithm>
#include <utility>

namespace mixrack {

    void effect_controls::add(const std::string& name, shared_param param) {
        m_params[name] = std::move(param);
    }

    bool effect_controls::set(const std::string& name, float value) const {
        auto it = m_params.find(name);
        if (it == m_params.end() || !it->second) {
            return false;
        }
        it->second->set(value);
        return true;
    }

    std::optional<float> effect_controls::get(const std::string& name) const {
        auto it = m_params.find(name);
        if (it == m_params.end() || !it->second) {
            return std::nullopt;
        }
        return it->second->value();
    }

    shared_param effect_controls::find(const std::string& name) const {
        auto it = m_params.find(name);
        return it == m_params.end() ? nullptr : it->second;
    }

    bool effect_controls::contains(const std::string& name) const {
        return m_params.find(name) != m_params.end();
    }

    param_map effect_controls::values() const {
        param_map result;
        for (const auto& [name, param] : m_params) {
            if (param) {
                result[name] = param->value();
            }
        }
        return result;
    }

    effect_metadata::effect_metadata(std::string name_, std::string description_, effect_category category_)
        : name(std::move(name_)),
          description(std::move(description_)),
          category(category_) {
    }

    effect_metadata& effect_metadata::with_param(const std::string& param, float default_value, float min, float max) {
        parameters.emplace_back(param, default_value, min, max);
        return *this;
    }

    effect_metadata& effect_metadata::with_latency(std::size_t samples) {
        latency_samples = samples;
        return *this;
    }

    effect_metadata& effect_metadata::with_tag(const std::string& tag) {
        if (!has_tag(tag)) {
            tags.push_back(tag);
        }
        return *this;
    }

    bool effect_metadata::has_tag(const std::string& tag) const {
        return std::find(tags.begin(), tags.end(), tag) != tags.end();
    }

    const parameter_def* effect_metadata::find_param(const std::string& param) const {
        auto it = std::find_if(parameters.begin(), parameters.end(),
                               [&param](const parameter_def& p) { return p.name == param; });
        return it == parameters.end() ? nullptr : &*it;
    }

    effect_builder::~effect_builder() = default;

    std::unique_ptr<sidechain_processor> effect_builder::build_sidechain(const param_map&, sample_rate_t,
                                                                         const effect_controls&) const {
        return nullptr;
    }

    // Metadata defaults first, caller-supplied values override them.
    static param_map with_defaults(const effect_metadata& meta, const param_map& params) {
        param_map merged;
        for (const auto& def : meta.parameters) {
            merged[def.name] = def.default_value;
        }
        for (const auto& [name, value] : params) {
            merged[name] = value;
        }
        return merged;
    }

    std::shared_ptr<effect_registry> effect_registry::with_builtin() {
        auto registry = std::make_shared<effect_registry>();
        register_builtin_effects(*registry);
        return registry;
    }

    void effect_registry::register_effect(const std::string& name, std::shared_ptr<effect_builder> builder) {
        if (!builder) {
            return;
        }
        m_builders[name] = std::move(builder);
    }

    std::shared_ptr<const effect_builder> effect_registry::get(const std::string& name) const {
        auto it = m_builders.find(name);
        if (it == m_builders.end()) {
            return nullptr;
        }
        return it->second;
    }

    effect_parts effect_registry::build(const std::string& name, const param_map& params) const {
        auto builder = get(name);
        if (!builder) {
            throw processor_not_found_error(name);
        }
        auto parts = builder->build(with_defaults(builder->metadata(), params));
        if (!parts.processor) {
            throw processor_not_found_error(name, "builder returned no processor");
        }
        return parts;
    }

    std::unique_ptr<sidechain_processor> effect_registry::build_sidechain(
        const std::string& name, const param_map& params,
        sample_rate_t sample_rate, const effect_controls& controls) const {
        auto builder = get(name);
        if (!builder) {
            return nullptr;
        }
        return builder->build_sidechain(with_defaults(builder->metadata(), params), sample_rate, controls);
    }

    std::optional<effect_metadata> effect_registry::metadata(const std::string& name) const {
        auto builder = get(name);
        if (!builder) {
            return std::nullopt;
        }
        return builder->metadata();
    }

    bool effect_registry::contains(const std::string& name) const {
        return m_builders.find(name) != m_builders.end();
    }

    std::vector<std::string> effect_registry::names() const {
        std::vector<std::string> result;
        result.reserve(m_builders.size());
        for (const auto& entry : m_builders) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::vector<effect_metadata> effect_registry::list_effects() const {
        std::vector<effect_metadata> result;
        result.reserve(m_builders.size());
        for (const auto& entry : m_builders) {
            result.push_back(entry.second->metadata());
        }
        return result;
    }

    std::vector<effect_metadata> effect_registry::list_by_category(effect_category category) const {
        std::vector<effect_metadata> result;
        for (const auto& entry : m_builders) {
            auto meta = entry.second->metadata();
            if (meta.category == category) {
                result.push_back(std::move(meta));
            }
        }
        return result;
    }

    std::size_t effect_registry::size() const {
        return m_builders.size();
    }

    void effect_registry::clear() {
        m_builders.clear();
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
