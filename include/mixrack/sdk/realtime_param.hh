/**
 * @file realtime_param.hh
 * @brief Lock-free scalar shared between control and render threads
 * @ingroup sdk_params
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>

namespace mixrack {

    /**
     * @class realtime_param
     * @brief A single float published through an atomic 32-bit word
     * @ingroup sdk_params
     *
     * This is the only channel by which a control thread (UI, sequencer,
     * MIDI handler) influences per-sample behaviour. The float's bit
     * pattern is stored in a std::atomic<std::uint32_t>, so a reader can
     * never observe a torn value and a writer never blocks a reader.
     *
     * ## Ordering
     *
     * Each parameter is independently atomic. Two parameters written one
     * after the other may become visible to the render thread in any order,
     * and no promise is made about the exact sample at which a new value
     * takes effect.
     *
     * ## Sharing
     *
     * Parameters are shared by handle (see ::shared_param). A processor
     * built by a factory keeps one handle and the owning chain or voice
     * keeps another in its controls map; both see the same cell.
     *
     * @code
     * auto cutoff = make_param(1000.0f);
     * // control thread
     * cutoff->set(2500.0f);
     * // render thread
     * float hz = cutoff->value();
     * @endcode
     */
    class realtime_param {
        public:
            explicit realtime_param(float initial = 0.0f) noexcept
                : m_bits(to_bits(initial)) {
            }

            realtime_param(const realtime_param&) = delete;
            realtime_param& operator=(const realtime_param&) = delete;

            /**
             * @brief Publish a new value
             *
             * Never blocks, never allocates. Callable from any thread.
             */
            void set(float value) noexcept {
                m_bits.store(to_bits(value), std::memory_order_relaxed);
            }

            /**
             * @brief Most recently published value
             */
            [[nodiscard]] float value() const noexcept {
                return from_bits(m_bits.load(std::memory_order_relaxed));
            }

        private:
            static std::uint32_t to_bits(float v) noexcept {
                static_assert(sizeof(float) == sizeof(std::uint32_t), "32-bit float required");
                std::uint32_t bits;
                std::memcpy(&bits, &v, sizeof(bits));
                return bits;
            }

            static float from_bits(std::uint32_t bits) noexcept {
                float v;
                std::memcpy(&v, &bits, sizeof(v));
                return v;
            }

            std::atomic<std::uint32_t> m_bits;
    };

    /**
     * @typedef shared_param
     * @brief Shared handle to a realtime_param
     */
    using shared_param = std::shared_ptr<realtime_param>;

    /**
     * @brief Create a new shared parameter cell
     */
    inline shared_param make_param(float initial = 0.0f) {
        return std::make_shared<realtime_param>(initial);
    }
}
