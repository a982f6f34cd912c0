/**
 * @file effect_id.hh
 * @brief Stable identity of a chain stage
 * @ingroup chain
 */

#ifndef MIXRACK_EFFECT_ID_HH
#define MIXRACK_EFFECT_ID_HH

#include <mixrack/export_mixrack.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace mixrack {

    /**
     * @class effect_id
     * @brief 128-bit random (version 4) UUID
     *
     * Indices shift when stages are inserted, removed or moved; an id does
     * not. Hosts keep ids to address stages across edits and across a
     * to_state()/from_state() round trip.
     */
    class MIXRACK_EXPORT effect_id {
        public:
            using bytes_t = std::array<std::uint8_t, 16>;

            /// The nil UUID (all zero)
            effect_id() = default;

            explicit effect_id(const bytes_t& bytes)
                : m_bytes(bytes) {
            }

            /**
             * @brief A fresh random version 4 id
             */
            static effect_id generate();

            /**
             * @brief Parse the canonical 8-4-4-4-12 hex form
             * @throws serialization_error on malformed input
             */
            static effect_id parse(const std::string& text);

            /// Lower-case canonical form
            [[nodiscard]] std::string to_string() const;

            [[nodiscard]] bool is_nil() const noexcept;

            [[nodiscard]] const bytes_t& bytes() const noexcept { return m_bytes; }

            friend bool operator==(const effect_id& a, const effect_id& b) noexcept {
                return a.m_bytes == b.m_bytes;
            }

            friend bool operator!=(const effect_id& a, const effect_id& b) noexcept {
                return !(a == b);
            }

            friend bool operator<(const effect_id& a, const effect_id& b) noexcept {
                return a.m_bytes < b.m_bytes;
            }

        private:
            bytes_t m_bytes{};
    };
}

namespace std {
    template<>
    struct hash<mixrack::effect_id> {
        std::size_t operator()(const mixrack::effect_id& id) const noexcept {
            std::size_t h = 0;
            for (auto b : id.bytes()) {
                h = h * 31 + b;
            }
            return h;
        }
    };
}

#endif
