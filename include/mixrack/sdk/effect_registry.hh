/**
 * @file effect_registry.hh
 * @brief Effect factory: name -> processor and controls
 * @ingroup sdk_registry
 */

#pragma once

#include <mixrack/sdk/parameter_def.hh>
#include <mixrack/sdk/processor.hh>
#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mixrack {

    /**
     * @brief Coarse grouping used by hosts to organize effect lists
     */
    enum class effect_category {
        time,
        modulation,
        filter,
        dynamics,
        distortion,
        spatial,
        other
    };

    /**
     * @class effect_controls
     * @brief Named realtime parameters of one effect instance
     * @ingroup sdk_registry
     *
     * The map itself is built once on the control thread and never
     * reshaped afterwards; only the parameter cells change.
     */
    class MIXRACK_EXPORT effect_controls {
        public:
            using container_t = std::map<std::string, shared_param>;

            /**
             * @brief Register a control; replaces an existing one of the same name
             */
            void add(const std::string& name, shared_param param);

            /**
             * @brief Write a parameter
             * @return false if no parameter of that name exists (nothing happens)
             */
            bool set(const std::string& name, float value) const;

            [[nodiscard]] std::optional<float> get(const std::string& name) const;

            [[nodiscard]] shared_param find(const std::string& name) const;

            [[nodiscard]] bool contains(const std::string& name) const;

            /**
             * @brief Current value of every parameter
             */
            [[nodiscard]] param_map values() const;

            [[nodiscard]] const container_t& params() const { return m_params; }

            [[nodiscard]] std::size_t size() const { return m_params.size(); }

            [[nodiscard]] bool empty() const { return m_params.empty(); }

        private:
            container_t m_params;
    };

    /**
     * @struct effect_metadata
     * @brief Descriptive information about a registered effect
     * @ingroup sdk_registry
     */
    struct MIXRACK_EXPORT effect_metadata {
        std::string name;
        std::string description;
        std::vector<parameter_def> parameters;
        effect_category category = effect_category::other;
        std::size_t latency_samples = 0;
        std::vector<std::string> tags;

        effect_metadata() = default;
        effect_metadata(std::string name_, std::string description_, effect_category category_);

        effect_metadata& with_param(const std::string& param, float default_value, float min, float max);
        effect_metadata& with_latency(std::size_t samples);
        effect_metadata& with_tag(const std::string& tag);

        [[nodiscard]] bool has_tag(const std::string& tag) const;
        [[nodiscard]] const parameter_def* find_param(const std::string& param) const;
    };

    /**
     * @brief Tag marking an effect as able to build a sidechain_processor
     */
    inline constexpr const char* SIDECHAIN_TAG = "sidechain";

    /**
     * @struct effect_parts
     * @brief What a factory hands back for one effect instance
     */
    struct effect_parts {
        std::unique_ptr<signal_processor> processor;
        effect_controls controls;
    };

    /**
     * @class effect_builder
     * @brief Plugin interface for one kind of effect
     * @ingroup sdk_registry
     *
     * Builders must be stateless with respect to build(): the registry may
     * call them from any control thread.
     */
    class MIXRACK_EXPORT effect_builder {
        public:
            virtual ~effect_builder();

            /**
             * @brief Build a processor and its controls
             * @param params Parameter values; the registry has already filled
             *        in metadata defaults for anything not supplied
             */
            [[nodiscard]] virtual effect_parts build(const param_map& params) const = 0;

            [[nodiscard]] virtual effect_metadata metadata() const = 0;

            /**
             * @brief Build the sidechain-aware variant of this effect
             *
             * The default returns nullptr (not sidechain capable). A capable
             * builder should bind the returned processor to @p controls so
             * that parameter writes reach both variants.
             */
            [[nodiscard]] virtual std::unique_ptr<sidechain_processor> build_sidechain(
                const param_map& params, sample_rate_t sample_rate, const effect_controls& controls) const;
    };

    /**
     * @class effect_registry
     * @brief Registry mapping effect names to builders
     * @ingroup sdk_registry
     *
     * ## Usage Example
     *
     * @code
     * auto registry = std::make_shared<effect_registry>();
     * register_builtin_effects(*registry);
     * registry->register_effect("my_fx", std::make_shared<my_fx_builder>());
     *
     * auto parts = registry->build("gain", {{"gain", 0.5f}});
     * @endcode
     *
     * ## Thread Safety
     *
     * - Registration methods are NOT thread-safe
     * - build(), metadata() and the listing methods ARE safe for
     *   concurrent readers once registration is finished
     * - Typically configured once at startup and then shared as
     *   std::shared_ptr<const effect_registry>
     */
    class MIXRACK_EXPORT effect_registry {
        public:
            /**
             * @brief Registry pre-populated with the built-in effects
             */
            static std::shared_ptr<effect_registry> with_builtin();

            void register_effect(const std::string& name, std::shared_ptr<effect_builder> builder);

            [[nodiscard]] std::shared_ptr<const effect_builder> get(const std::string& name) const;

            /**
             * @brief Build an effect by name
             * @throws processor_not_found_error if @p name is not registered
             */
            [[nodiscard]] effect_parts build(const std::string& name, const param_map& params) const;

            /**
             * @brief Build the sidechain variant of an effect
             * @return nullptr when the name is unknown or not sidechain capable
             */
            [[nodiscard]] std::unique_ptr<sidechain_processor> build_sidechain(
                const std::string& name, const param_map& params,
                sample_rate_t sample_rate, const effect_controls& controls) const;

            [[nodiscard]] std::optional<effect_metadata> metadata(const std::string& name) const;

            [[nodiscard]] bool contains(const std::string& name) const;

            /**
             * @brief All registered names, sorted
             */
            [[nodiscard]] std::vector<std::string> names() const;

            [[nodiscard]] std::vector<effect_metadata> list_effects() const;

            [[nodiscard]] std::vector<effect_metadata> list_by_category(effect_category category) const;

            [[nodiscard]] std::size_t size() const;

            void clear();

        private:
            std::map<std::string, std::shared_ptr<effect_builder>> m_builders;
    };
}
