/**
 * @file effect_chain.hh
 * @brief Ordered, mutable pipeline of effect stages
 * @ingroup chain
 */

#ifndef MIXRACK_EFFECT_CHAIN_HH
#define MIXRACK_EFFECT_CHAIN_HH

#include <mixrack/chain_state.hh>
#include <mixrack/cpu_meter.hh>
#include <mixrack/effect_id.hh>
#include <mixrack/level_meter.hh>
#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/sdk/processor.hh>
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
     * @struct effect_instance
     * @brief One stage of an effect_chain
     * @ingroup chain
     *
     * Owned exclusively by the chain (or, briefly, by control code between
     * effect_chain::make_effect() and effect_chain::insert_effect()).
     */
    struct MIXRACK_EXPORT effect_instance {
        std::optional<mixrack::effect_id> id;
        std::string name;
        effect_controls controls;
        std::unique_ptr<signal_processor> processor;
        /// Keyed variant sharing @ref controls; null if not sidechain capable
        std::unique_ptr<sidechain_processor> sidechain;
        std::size_t latency_samples = 0;
        bool bypassed = false;
        bool muted = false;
        level_window input_window;
        level_window output_window;
        cpu_meter meter;

        explicit effect_instance(sample_rate_t sample_rate);

        effect_instance(const effect_instance&) = delete;
        effect_instance& operator=(const effect_instance&) = delete;
    };

    /**
     * @struct effect_cpu_entry
     * @brief One row of effect_chain::cpu_report()
     */
    struct effect_cpu_entry {
        std::string name;
        double percent = 0.0;
        bool overloaded = false;
    };

    /**
     * @class effect_chain
     * @brief Runs stereo frames through an ordered list of effect stages
     * @ingroup chain
     *
     * List order is processing order; index 0 is the first stage. Each
     * stage can be bypassed (identity) or muted (silence) independently,
     * and the whole chain can be bypassed.
     *
     * ## Threading
     *
     * effect_chain is a single-owner object. process() and
     * process_with_sidechain() never allocate, never throw and never lock;
     * structural operations (add, remove, move, restore) must not run
     * concurrently with them. Parameter writes through the stage controls
     * are lock-free and may happen at any time. See rack for the two-thread
     * arrangement.
     *
     * ## Errors
     *
     * Index- and id-based operations never throw: they return false or an
     * empty optional. Building a stage throws processor_not_found_error;
     * restoring state throws serialization_error or
     * processor_not_found_error and leaves the chain untouched.
     *
     * @code
     * effect_chain chain(effect_registry::with_builtin());
     * chain.add_effect("lowpass", {{"cutoff", 800.0f}});
     * chain.add_effect("delay", {});
     * chain.set_param(0, "cutoff", 1200.0f);
     *
     * for (...) {
     *     auto out = chain.process(l, r);
     * }
     * @endcode
     */
    class MIXRACK_EXPORT effect_chain {
        public:
            static constexpr sample_rate_t DEFAULT_SAMPLE_RATE = 48000.0;
            static constexpr std::size_t DEFAULT_CAPACITY = 64;

            effect_chain();
            explicit effect_chain(std::shared_ptr<const effect_registry> registry,
                                  sample_rate_t sample_rate = DEFAULT_SAMPLE_RATE);
            ~effect_chain();

            effect_chain(const effect_chain&) = delete;
            effect_chain& operator=(const effect_chain&) = delete;

            void set_registry(std::shared_ptr<const effect_registry> registry);

            [[nodiscard]] const std::shared_ptr<const effect_registry>& registry() const { return m_registry; }

            // -----------------------------------------------------------------
            // Structure
            // -----------------------------------------------------------------

            /**
             * @brief Append a stage built by the registry
             * @return Index of the new stage
             * @throws processor_not_found_error if no registry is bound or the
             *         name is unknown; the chain is unchanged
             */
            std::size_t add_effect(const std::string& name, const param_map& params);

            /**
             * @brief Chaining form of add_effect()
             *
             * @code
             * effect_chain chain(effect_registry::with_builtin());
             * chain.with_effect("lowpass", {{"cutoff", 800.0f}})
             *      .with_effect("delay", {{"time", 0.25f}});
             * @endcode
             * @throws processor_not_found_error
             */
            effect_chain& with_effect(const std::string& name, const param_map& params = {});

            /**
             * @brief Like add_effect() and tag the stage with @p id
             */
            std::size_t add_effect_with_id(const mixrack::effect_id& id, const std::string& name,
                                           const param_map& params);

            /**
             * @brief Build a stage without inserting it
             *
             * Used to keep allocation out of a render lock; see rack.
             * @throws processor_not_found_error
             */
            [[nodiscard]] std::unique_ptr<effect_instance> make_effect(
                const std::string& name, const param_map& params,
                std::optional<mixrack::effect_id> id = std::nullopt) const;

            /**
             * @brief Storage with room for one more stage, or an empty vector
             *        when the current capacity already has room
             *
             * Allocates; call it outside any render lock and hand the result
             * to adopt_storage() under the lock.
             */
            [[nodiscard]] std::vector<std::unique_ptr<effect_instance>> spare_storage() const;

            /**
             * @brief Move the stages into @p storage if it is larger
             *
             * Does not allocate. Afterwards @p storage holds the previous
             * buffer, to be released outside the lock.
             */
            void adopt_storage(std::vector<std::unique_ptr<effect_instance>>& storage) noexcept;

            /**
             * @brief Insert a pre-built stage
             *
             * insert_effect(), take_effect() and move_effect() neither log nor
             * allocate while capacity allows, so they are safe under a render lock.
             * @param index Position; anything past the end appends
             * @return Actual index of the stage
             */
            std::size_t insert_effect(std::unique_ptr<effect_instance> instance,
                                      std::size_t index = static_cast<std::size_t>(-1));

            /**
             * @brief Detach a stage and hand it to the caller
             * @return nullptr if @p index is out of range
             */
            [[nodiscard]] std::unique_ptr<effect_instance> take_effect(std::size_t index);

            /**
             * @return false if @p index is out of range
             */
            bool remove_effect(std::size_t index);

            bool remove_effect_by_id(const mixrack::effect_id& id);

            [[nodiscard]] std::optional<std::size_t> find_effect_index(const mixrack::effect_id& id) const;

            /**
             * @brief Move the stage tagged @p id to @p new_index
             * @return false if the id is unknown or new_index >= size()
             */
            bool move_effect(const mixrack::effect_id& id, std::size_t new_index);

            /**
             * @brief Remove every stage
             */
            void clear();

            /**
             * @brief Exchange stages and the chain bypass flag with @p other
             *
             * Registry and sample rate stay with each chain.
             */
            void swap(effect_chain& other) noexcept;

            [[nodiscard]] std::size_t size() const { return m_effects.size(); }

            [[nodiscard]] bool empty() const { return m_effects.empty(); }

            // -----------------------------------------------------------------
            // Per-stage control
            // -----------------------------------------------------------------

            /**
             * @brief Forward a value to the stage's named parameter
             *
             * An unknown parameter name is ignored.
             * @return false only if @p index is out of range
             */
            bool set_param(std::size_t index, const std::string& param, float value) const;

            bool set_param_by_id(const mixrack::effect_id& id, const std::string& param, float value) const;

            bool set_effect_bypass(std::size_t index, bool bypassed);

            bool set_effect_mute(std::size_t index, bool muted);

            [[nodiscard]] std::optional<bool> is_effect_bypassed(std::size_t index) const;

            [[nodiscard]] std::optional<bool> is_effect_muted(std::size_t index) const;

            [[nodiscard]] std::optional<std::size_t> effect_latency(std::size_t index) const;

            [[nodiscard]] std::optional<std::string> effect_name(std::size_t index) const;

            [[nodiscard]] std::optional<mixrack::effect_id> effect_id_at(std::size_t index) const;

            [[nodiscard]] std::optional<float> effect_param(std::size_t index, const std::string& param) const;

            /**
             * @brief Controls of a stage, e.g. to cache parameter handles
             * @return nullptr if @p index is out of range
             */
            [[nodiscard]] const effect_controls* effect_controls_at(std::size_t index) const;

            // -----------------------------------------------------------------
            // Chain settings
            // -----------------------------------------------------------------

            void set_bypass(bool bypassed) { m_bypassed = bypassed; }

            [[nodiscard]] bool is_bypassed() const { return m_bypassed; }

            /**
             * @brief Change the processing rate of the chain and every stage
             *
             * May reallocate inside processors (delay lines); control thread only.
             */
            void set_sample_rate(sample_rate_t sample_rate);

            [[nodiscard]] sample_rate_t sample_rate() const { return m_sample_rate; }

            /**
             * @brief Sum of latency over stages that are not bypassed
             */
            [[nodiscard]] std::size_t total_latency() const;

            // -----------------------------------------------------------------
            // Render
            // -----------------------------------------------------------------

            /**
             * @brief Run one frame through the chain
             * @warning Render thread; never allocates or throws
             */
            stereo_frame process(float left, float right) noexcept;

            /**
             * @brief Run one frame, keying sidechain-capable stages by @p sidechain
             *
             * Stages without a sidechain processor, or calls without a
             * sidechain frame, use the plain processor.
             */
            stereo_frame process_with_sidechain(float left, float right,
                                                std::optional<stereo_frame> sidechain) noexcept;

            // -----------------------------------------------------------------
            // Metering
            // -----------------------------------------------------------------

            [[nodiscard]] std::optional<stage_levels> stage_input_levels(std::size_t index) const;

            [[nodiscard]] std::optional<stage_levels> stage_output_levels(std::size_t index) const;

            /**
             * @brief Output levels keyed by id string, or "name_index" for
             *        stages without an id
             */
            [[nodiscard]] std::map<std::string, stage_levels> effect_levels() const;

            [[nodiscard]] std::optional<performance_metrics> effect_metrics(std::size_t index) const;

            [[nodiscard]] std::optional<double> effect_cpu_usage(std::size_t index) const;

            [[nodiscard]] std::optional<double> effect_cpu_percent(std::size_t index) const;

            /**
             * @brief Combined usage of stages that are not bypassed
             */
            [[nodiscard]] double total_cpu_usage() const;

            [[nodiscard]] double total_cpu_percent() const;

            [[nodiscard]] bool has_overload() const;

            void reset_cpu_meters();

            [[nodiscard]] std::vector<effect_cpu_entry> cpu_report() const;

            // -----------------------------------------------------------------
            // Persistence
            // -----------------------------------------------------------------

            /**
             * @brief Snapshot names, ids, flags and current parameter values
             */
            [[nodiscard]] chain_state to_state() const;

            /**
             * @brief Replace the chain with the stages described by @p state
             *
             * Every stage is built before anything is replaced, so a failure
             * leaves the chain exactly as it was. Ids are preserved. The
             * chain adopts the state's sample rate unless it is not positive.
             *
             * @throws processor_not_found_error, serialization_error
             */
            void from_state(const chain_state& state);

            [[nodiscard]] std::string to_json() const;

            /**
             * @throws serialization_error, processor_not_found_error
             */
            void from_json(const std::string& text);

        private:
            [[nodiscard]] effect_instance* at(std::size_t index) const;

            [[nodiscard]] std::unique_ptr<effect_instance> build_effect(
                const std::string& name, const param_map& params,
                std::optional<mixrack::effect_id> id, sample_rate_t sample_rate) const;

            std::vector<std::unique_ptr<effect_instance>> m_effects;
            bool m_bypassed = false;
            sample_rate_t m_sample_rate;
            std::shared_ptr<const effect_registry> m_registry;
    };
}

#endif
