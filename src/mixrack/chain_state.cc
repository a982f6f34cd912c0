// This is copyrighted software. More information is at the end of this file.
#include <mixrack/chain_state.hh>
#include <mixrack/error.hh>
#include <nlohmann/json.hpp>
#include <utility>

namespace mixrack {

    using json = nlohmann::json;

    effect_state::effect_state(std::string name_)
        : name(std::move(name_)) {
    }

    effect_state::effect_state(std::string name_, const effect_id& id_)
        : id(id_),
          name(std::move(name_)) {
    }

    effect_state& effect_state::with_param(const std::string& param, float value) {
        parameters[param] = value;
        return *this;
    }

    effect_state& effect_state::with_bypass(bool value) {
        bypassed = value;
        return *this;
    }

    effect_state& effect_state::with_mute(bool value) {
        muted = value;
        return *this;
    }

    std::optional<float> effect_state::param(const std::string& param) const {
        auto it = parameters.find(param);
        if (it == parameters.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // nlohmann ADL hooks
    void to_json(json& j, const effect_state& e) {
        j = json::object();
        if (e.id) {
            j["id"] = e.id->to_string();
        }
        j["name"] = e.name;
        j["parameters"] = e.parameters;
        j["bypassed"] = e.bypassed;
        j["muted"] = e.muted;
    }

    void from_json(const json& j, effect_state& e) {
        e.id.reset();
        if (j.contains("id") && !j.at("id").is_null()) {
            e.id = effect_id::parse(j.at("id").get<std::string>());
        }
        j.at("name").get_to(e.name);
        e.parameters = j.at("parameters").get<param_map>();
        e.bypassed = j.value("bypassed", false);
        e.muted = j.value("muted", false);
    }

    void to_json(json& j, const chain_state& c) {
        j = json{
            {"version", c.version},
            {"sample_rate", c.sample_rate},
            {"bypassed", c.bypassed},
            {"effects", c.effects}
        };
    }

    void from_json(const json& j, chain_state& c) {
        c.version = j.value("version", chain_state::CURRENT_VERSION);
        j.at("sample_rate").get_to(c.sample_rate);
        c.bypassed = j.value("bypassed", false);
        c.effects = j.at("effects").get<std::vector<effect_state>>();
    }

    chain_state::chain_state(sample_rate_t sample_rate_)
        : sample_rate(sample_rate_) {
    }

    void chain_state::add_effect(effect_state effect) {
        effects.push_back(std::move(effect));
    }

    std::string chain_state::to_json() const {
        json j = *this;
        return j.dump(2);
    }

    chain_state chain_state::from_json(const std::string& text) {
        chain_state state;
        try {
            state = json::parse(text).get<chain_state>();
        } catch (const json::exception& e) {
            throw serialization_error(std::string("invalid chain state: ") + e.what());
        }

        if (state.version > CURRENT_VERSION) {
            throw serialization_error("unsupported chain state version " + std::to_string(state.version));
        }
        return state;
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
