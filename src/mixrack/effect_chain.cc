// This is copyrighted software. More information is at the end of this file.
#include <mixrack/effect_chain.hh>
#include <mixrack/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <iterator>
#include <utility>

namespace mixrack {

    effect_instance::effect_instance(sample_rate_t sample_rate)
        : meter(sample_rate) {
    }

    effect_chain::effect_chain()
        : effect_chain(nullptr) {
    }

    effect_chain::effect_chain(std::shared_ptr<const effect_registry> registry, sample_rate_t sample_rate)
        : m_sample_rate(sample_rate),
          m_registry(std::move(registry)) {
        m_effects.reserve(DEFAULT_CAPACITY);
    }

    effect_chain::~effect_chain() = default;

    void effect_chain::set_registry(std::shared_ptr<const effect_registry> registry) {
        m_registry = std::move(registry);
    }

    effect_instance* effect_chain::at(std::size_t index) const {
        return index < m_effects.size() ? m_effects[index].get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Structure
    // -------------------------------------------------------------------------

    std::unique_ptr<effect_instance> effect_chain::make_effect(const std::string& name,
                                                               const param_map& params,
                                                               std::optional<mixrack::effect_id> id) const {
        return build_effect(name, params, std::move(id), m_sample_rate);
    }

    std::unique_ptr<effect_instance> effect_chain::build_effect(const std::string& name,
                                                                const param_map& params,
                                                                std::optional<mixrack::effect_id> id,
                                                                sample_rate_t sample_rate) const {
        if (!m_registry) {
            throw processor_not_found_error(name, "no effect registry bound to the chain");
        }

        auto parts = m_registry->build(name, params);
        auto meta = m_registry->metadata(name);

        auto instance = std::make_unique<effect_instance>(sample_rate);
        instance->id = id;
        instance->name = name;
        instance->controls = std::move(parts.controls);
        instance->processor = std::move(parts.processor);
        instance->processor->set_sample_rate(sample_rate);

        if (meta) {
            instance->latency_samples = meta->latency_samples;
            if (meta->has_tag(SIDECHAIN_TAG)) {
                instance->sidechain = m_registry->build_sidechain(name, params, sample_rate, instance->controls);
            }
        }
        return instance;
    }

    std::size_t effect_chain::insert_effect(std::unique_ptr<effect_instance> instance, std::size_t index) {
        if (!instance) {
            THROW_RUNTIME("Cannot insert a null effect instance");
        }
        const std::size_t position = std::min(index, m_effects.size());
        m_effects.insert(m_effects.begin() + static_cast<std::ptrdiff_t>(position), std::move(instance));
        return position;
    }

    std::unique_ptr<effect_instance> effect_chain::take_effect(std::size_t index) {
        if (index >= m_effects.size()) {
            return nullptr;
        }
        auto it = m_effects.begin() + static_cast<std::ptrdiff_t>(index);
        auto instance = std::move(*it);
        m_effects.erase(it);
        return instance;
    }

    std::vector<std::unique_ptr<effect_instance>> effect_chain::spare_storage() const {
        std::vector<std::unique_ptr<effect_instance>> storage;
        if (m_effects.size() == m_effects.capacity()) {
            storage.reserve(std::max(DEFAULT_CAPACITY, 2 * m_effects.capacity()));
        }
        return storage;
    }

    void effect_chain::adopt_storage(std::vector<std::unique_ptr<effect_instance>>& storage) noexcept {
        if (storage.capacity() <= m_effects.capacity()) {
            return;
        }
        // fits without reallocating; storage gets the old buffer back
        std::move(m_effects.begin(), m_effects.end(), std::back_inserter(storage));
        m_effects.swap(storage);
        storage.clear();
    }

    std::size_t effect_chain::add_effect(const std::string& name, const param_map& params) {
        const auto position = insert_effect(make_effect(name, params));
        LOG_INFO("effect_chain", "Added", name, "at", position);
        return position;
    }

    effect_chain& effect_chain::with_effect(const std::string& name, const param_map& params) {
        add_effect(name, params);
        return *this;
    }

    std::size_t effect_chain::add_effect_with_id(const mixrack::effect_id& id, const std::string& name,
                                                 const param_map& params) {
        const auto position = insert_effect(make_effect(name, params, id));
        LOG_INFO("effect_chain", "Added", name, "as", id.to_string(), "at", position);
        return position;
    }

    bool effect_chain::remove_effect(std::size_t index) {
        auto instance = take_effect(index);
        if (!instance) {
            return false;
        }
        LOG_INFO("effect_chain", "Removed", instance->name, "from", index);
        return true;
    }

    bool effect_chain::remove_effect_by_id(const mixrack::effect_id& id) {
        auto index = find_effect_index(id);
        return index && remove_effect(*index);
    }

    std::optional<std::size_t> effect_chain::find_effect_index(const mixrack::effect_id& id) const {
        auto it = std::find_if(m_effects.begin(), m_effects.end(),
                               [&id](const std::unique_ptr<effect_instance>& e) { return e->id == id; });
        if (it == m_effects.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(m_effects.begin(), it));
    }

    bool effect_chain::move_effect(const mixrack::effect_id& id, std::size_t new_index) {
        auto old_index = find_effect_index(id);
        if (!old_index || new_index >= m_effects.size()) {
            return false;
        }
        if (*old_index == new_index) {
            return true;
        }

        auto first = m_effects.begin();
        if (*old_index < new_index) {
            std::rotate(first + static_cast<std::ptrdiff_t>(*old_index),
                        first + static_cast<std::ptrdiff_t>(*old_index) + 1,
                        first + static_cast<std::ptrdiff_t>(new_index) + 1);
        } else {
            std::rotate(first + static_cast<std::ptrdiff_t>(new_index),
                        first + static_cast<std::ptrdiff_t>(*old_index),
                        first + static_cast<std::ptrdiff_t>(*old_index) + 1);
        }
        return true;
    }

    void effect_chain::clear() {
        if (!m_effects.empty()) {
            LOG_INFO("effect_chain", "Clearing", m_effects.size(), "effects");
        }
        m_effects.clear();
    }

    void effect_chain::swap(effect_chain& other) noexcept {
        m_effects.swap(other.m_effects);
        std::swap(m_bypassed, other.m_bypassed);
    }

    // -------------------------------------------------------------------------
    // Per-stage control
    // -------------------------------------------------------------------------

    bool effect_chain::set_param(std::size_t index, const std::string& param, float value) const {
        auto* e = at(index);
        if (!e) {
            return false;
        }
        e->controls.set(param, value);
        return true;
    }

    bool effect_chain::set_param_by_id(const mixrack::effect_id& id, const std::string& param, float value) const {
        auto index = find_effect_index(id);
        return index && set_param(*index, param, value);
    }

    bool effect_chain::set_effect_bypass(std::size_t index, bool bypassed) {
        auto* e = at(index);
        if (!e) {
            return false;
        }
        e->bypassed = bypassed;
        return true;
    }

    bool effect_chain::set_effect_mute(std::size_t index, bool muted) {
        auto* e = at(index);
        if (!e) {
            return false;
        }
        e->muted = muted;
        return true;
    }

    std::optional<bool> effect_chain::is_effect_bypassed(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->bypassed;
        }
        return std::nullopt;
    }

    std::optional<bool> effect_chain::is_effect_muted(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->muted;
        }
        return std::nullopt;
    }

    std::optional<std::size_t> effect_chain::effect_latency(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->latency_samples;
        }
        return std::nullopt;
    }

    std::optional<std::string> effect_chain::effect_name(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->name;
        }
        return std::nullopt;
    }

    std::optional<mixrack::effect_id> effect_chain::effect_id_at(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->id;
        }
        return std::nullopt;
    }

    std::optional<float> effect_chain::effect_param(std::size_t index, const std::string& param) const {
        if (auto* e = at(index)) {
            return e->controls.get(param);
        }
        return std::nullopt;
    }

    const effect_controls* effect_chain::effect_controls_at(std::size_t index) const {
        auto* e = at(index);
        return e ? &e->controls : nullptr;
    }

    void effect_chain::set_sample_rate(sample_rate_t sample_rate) {
        if (sample_rate <= 0.0) {
            LOG_WARN("effect_chain", "Ignoring invalid sample rate", sample_rate);
            return;
        }
        m_sample_rate = sample_rate;
        for (auto& e : m_effects) {
            e->processor->set_sample_rate(sample_rate);
            if (e->sidechain) {
                e->sidechain->set_sample_rate(sample_rate);
            }
            e->meter.set_sample_rate(sample_rate);
        }
    }

    std::size_t effect_chain::total_latency() const {
        std::size_t total = 0;
        for (const auto& e : m_effects) {
            if (!e->bypassed) {
                total += e->latency_samples;
            }
        }
        return total;
    }

    // -------------------------------------------------------------------------
    // Render
    // -------------------------------------------------------------------------

    stereo_frame effect_chain::process(float left, float right) noexcept {
        return process_with_sidechain(left, right, std::nullopt);
    }

    stereo_frame effect_chain::process_with_sidechain(float left, float right,
                                                      std::optional<stereo_frame> sidechain) noexcept {
        if (m_bypassed || m_effects.empty()) {
            return {left, right};
        }

        stereo_frame current{left, right};
        for (auto& e : m_effects) {
            e->input_window.push(current.left, current.right);

            if (e->muted) {
                current = {0.0f, 0.0f};
            } else if (!e->bypassed) {
                const auto token = e->meter.start_timing();
                if (sidechain && e->sidechain) {
                    current = e->sidechain->process_with_sidechain(current.left, current.right,
                                                                   sidechain->left, sidechain->right);
                } else {
                    current = e->processor->process(current.left, current.right);
                }
                e->meter.stop_timing(token, 1);
            }

            e->output_window.push(current.left, current.right);
        }
        return current;
    }

    // -------------------------------------------------------------------------
    // Metering
    // -------------------------------------------------------------------------

    std::optional<stage_levels> effect_chain::stage_input_levels(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->input_window.levels();
        }
        return std::nullopt;
    }

    std::optional<stage_levels> effect_chain::stage_output_levels(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->output_window.levels();
        }
        return std::nullopt;
    }

    std::map<std::string, stage_levels> effect_chain::effect_levels() const {
        std::map<std::string, stage_levels> result;
        for (std::size_t i = 0; i < m_effects.size(); ++i) {
            const auto& e = m_effects[i];
            const std::string key = e->id ? e->id->to_string() : e->name + "_" + std::to_string(i);
            result[key] = e->output_window.levels();
        }
        return result;
    }

    std::optional<performance_metrics> effect_chain::effect_metrics(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->meter.metrics();
        }
        return std::nullopt;
    }

    std::optional<double> effect_chain::effect_cpu_usage(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->meter.metrics().cpu_usage;
        }
        return std::nullopt;
    }

    std::optional<double> effect_chain::effect_cpu_percent(std::size_t index) const {
        if (auto* e = at(index)) {
            return e->meter.metrics().cpu_percent();
        }
        return std::nullopt;
    }

    double effect_chain::total_cpu_usage() const {
        double total = 0.0;
        for (const auto& e : m_effects) {
            if (!e->bypassed) {
                total += e->meter.metrics().cpu_usage;
            }
        }
        return total;
    }

    double effect_chain::total_cpu_percent() const {
        return total_cpu_usage() * 100.0;
    }

    bool effect_chain::has_overload() const {
        return std::any_of(m_effects.begin(), m_effects.end(),
                           [](const std::unique_ptr<effect_instance>& e) {
                               return e->meter.metrics().is_overloaded();
                           });
    }

    void effect_chain::reset_cpu_meters() {
        for (auto& e : m_effects) {
            e->meter.reset();
        }
    }

    std::vector<effect_cpu_entry> effect_chain::cpu_report() const {
        std::vector<effect_cpu_entry> report;
        report.reserve(m_effects.size());
        for (const auto& e : m_effects) {
            const auto& m = e->meter.metrics();
            report.push_back(effect_cpu_entry{e->name, m.cpu_percent(), m.is_overloaded()});
        }
        return report;
    }

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------

    chain_state effect_chain::to_state() const {
        chain_state state(m_sample_rate);
        state.bypassed = m_bypassed;
        for (const auto& e : m_effects) {
            effect_state es(e->name);
            es.id = e->id;
            es.parameters = e->controls.values();
            es.bypassed = e->bypassed;
            es.muted = e->muted;
            state.add_effect(std::move(es));
        }
        return state;
    }

    void effect_chain::from_state(const chain_state& state) {
        if (state.version > chain_state::CURRENT_VERSION) {
            throw serialization_error("unsupported chain state version " + std::to_string(state.version));
        }

        const sample_rate_t rate = state.sample_rate > 0.0 ? state.sample_rate : m_sample_rate;

        std::vector<std::unique_ptr<effect_instance>> rebuilt;
        rebuilt.reserve(std::max(DEFAULT_CAPACITY, state.effects.size()));
        for (const auto& es : state.effects) {
            auto instance = build_effect(es.name, es.parameters, es.id, rate);
            instance->bypassed = es.bypassed;
            instance->muted = es.muted;
            rebuilt.push_back(std::move(instance));
        }

        m_effects.swap(rebuilt);
        m_bypassed = state.bypassed;
        m_sample_rate = rate;
        LOG_INFO("effect_chain", "Restored", m_effects.size(), "effects at", rate, "Hz, replaced", rebuilt.size());
    }

    std::string effect_chain::to_json() const {
        return to_state().to_json();
    }

    void effect_chain::from_json(const std::string& text) {
        from_state(chain_state::from_json(text));
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
