/**
 * @file chain_state.hh
 * @brief Serializable snapshot of an effect chain
 * @ingroup chain
 */

#ifndef MIXRACK_CHAIN_STATE_HH
#define MIXRACK_CHAIN_STATE_HH

#include <mixrack/effect_id.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mixrack {

    /**
     * @struct effect_state
     * @brief One stage: registry name, parameter values and flags
     */
    struct MIXRACK_EXPORT effect_state {
        std::optional<effect_id> id;
        std::string name;
        param_map parameters;
        bool bypassed = false;
        bool muted = false;

        effect_state() = default;
        explicit effect_state(std::string name_);
        effect_state(std::string name_, const effect_id& id_);

        effect_state& with_param(const std::string& param, float value);
        effect_state& with_bypass(bool value);
        effect_state& with_mute(bool value);

        [[nodiscard]] std::optional<float> param(const std::string& param) const;
    };

    /**
     * @struct chain_state
     * @brief Whole-chain snapshot used for presets and project files
     *
     * JSON layout:
     * @code
     * {
     *   "version": 1,
     *   "sample_rate": 48000.0,
     *   "bypassed": false,
     *   "effects": [
     *     { "id": "…", "name": "lowpass", "parameters": { "cutoff": 1000.0 },
     *       "bypassed": false, "muted": false }
     *   ]
     * }
     * @endcode
     *
     * On input "version" defaults to 1, "bypassed" and "muted" default to
     * false and "id" is optional. "sample_rate", "effects", "name" and
     * "parameters" are required.
     */
    struct MIXRACK_EXPORT chain_state {
        static constexpr std::uint32_t CURRENT_VERSION = 1;

        std::uint32_t version = CURRENT_VERSION;
        sample_rate_t sample_rate = 48000.0;
        bool bypassed = false;
        std::vector<effect_state> effects;

        chain_state() = default;
        explicit chain_state(sample_rate_t sample_rate_);

        void add_effect(effect_state effect);

        /**
         * @brief Pretty-printed JSON
         */
        [[nodiscard]] std::string to_json() const;

        /**
         * @brief Parse JSON text
         * @throws serialization_error on malformed text, missing required
         *         fields, a bad id or a version newer than CURRENT_VERSION
         */
        static chain_state from_json(const std::string& text);
    };
}

#endif
