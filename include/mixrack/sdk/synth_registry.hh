/**
 * @file synth_registry.hh
 * @brief Synth factory: name + frequency -> generator and voice controls
 * @ingroup sdk_registry
 */

#pragma once

#include <mixrack/sdk/parameter_def.hh>
#include <mixrack/sdk/processor.hh>
#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mixrack {

    enum class synth_category {
        basic,
        analog,
        digital,
        physical,
        noise
    };

    /**
     * @struct voice_controls
     * @brief Realtime controls of one synth voice
     * @ingroup sdk_registry
     *
     * amp, pitch_bend and pressure always exist. cutoff and resonance are
     * null for generators without a filter; broadcasts skip those voices.
     */
    struct MIXRACK_EXPORT voice_controls {
        /// Amplitude (0..1+); 0 must silence the generator
        shared_param amp;
        /// Frequency multiplier; 1 = no bend, 2 = one octave up
        shared_param pitch_bend;
        /// Channel/poly aftertouch, normalized 0..1
        shared_param pressure;
        /// Filter cutoff in Hz, if the generator has a filter
        shared_param cutoff;
        /// Filter resonance 0..1, if the generator has a filter
        shared_param resonance;

        /**
         * @brief Controls with amp/pitch_bend/pressure cells allocated
         */
        static voice_controls make(float amp = 1.0f);
    };

    struct MIXRACK_EXPORT synth_metadata {
        std::string name;
        std::string description;
        std::vector<parameter_def> parameters;
        synth_category category = synth_category::basic;

        synth_metadata() = default;
        synth_metadata(std::string name_, std::string description_, synth_category category_);

        synth_metadata& with_param(const std::string& param, float default_value, float min, float max);
    };

    struct synth_parts {
        std::unique_ptr<signal_generator> generator;
        voice_controls controls;
    };

    /**
     * @class synth_builder
     * @brief Plugin interface for one kind of synth voice
     * @ingroup sdk_registry
     */
    class MIXRACK_EXPORT synth_builder {
        public:
            virtual ~synth_builder();

            /**
             * @brief Build one voice playing @p freq
             * @param freq Fundamental in Hz
             * @param params Parameter values with metadata defaults filled in
             */
            [[nodiscard]] virtual synth_parts build(float freq, const param_map& params) const = 0;

            [[nodiscard]] virtual synth_metadata metadata() const = 0;
    };

    /**
     * @class synth_registry
     * @brief Registry mapping synth names to builders
     * @ingroup sdk_registry
     *
     * Same threading rules as effect_registry: register at startup, then
     * share read-only.
     */
    class MIXRACK_EXPORT synth_registry {
        public:
            static std::shared_ptr<synth_registry> with_builtin();

            void register_synth(const std::string& name, std::shared_ptr<synth_builder> builder);

            /**
             * @brief Build a voice by name
             * @throws processor_not_found_error if @p name is not registered
             */
            [[nodiscard]] synth_parts build(const std::string& name, float freq, const param_map& params) const;

            [[nodiscard]] std::optional<synth_metadata> metadata(const std::string& name) const;

            [[nodiscard]] bool contains(const std::string& name) const;

            [[nodiscard]] std::vector<std::string> names() const;

            [[nodiscard]] std::size_t size() const;

        private:
            std::map<std::string, std::shared_ptr<synth_builder>> m_builders;
    };
}
