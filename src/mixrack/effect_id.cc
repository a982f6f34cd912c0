#include <mixrack/effect_id.hh>
#include <mixrack/error.hh>
#include <mutex>
#include <random>

namespace mixrack {

    namespace {
        constexpr char HEX_DIGITS[] = "0123456789abcdef";

        int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }

        bool is_dash_position(std::size_t i) {
            return i == 8 || i == 13 || i == 18 || i == 23;
        }
    }

    effect_id effect_id::generate() {
        static std::mutex s_mutex;
        static std::mt19937_64 s_engine{std::random_device{}()};

        std::uint64_t hi;
        std::uint64_t lo;
        {
            std::lock_guard<std::mutex> lock(s_mutex);
            hi = s_engine();
            lo = s_engine();
        }

        bytes_t bytes{};
        for (std::size_t i = 0; i < 8; ++i) {
            bytes[i] = static_cast<std::uint8_t>(hi >> (56 - 8 * i));
            bytes[8 + i] = static_cast<std::uint8_t>(lo >> (56 - 8 * i));
        }
        // version 4, RFC 4122 variant
        bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
        return effect_id(bytes);
    }

    effect_id effect_id::parse(const std::string& text) {
        if (text.size() != 36) {
            throw serialization_error("malformed effect id: '" + text + "'");
        }

        bytes_t bytes{};
        std::size_t out = 0;
        for (std::size_t i = 0; i < text.size();) {
            if (is_dash_position(i)) {
                if (text[i] != '-') {
                    throw serialization_error("malformed effect id: '" + text + "'");
                }
                ++i;
                continue;
            }
            const int high = hex_value(text[i]);
            const int low = hex_value(text[i + 1]);
            if (high < 0 || low < 0) {
                throw serialization_error("malformed effect id: '" + text + "'");
            }
            bytes[out++] = static_cast<std::uint8_t>((high << 4) | low);
            i += 2;
        }
        return effect_id(bytes);
    }

    std::string effect_id::to_string() const {
        std::string result;
        result.reserve(36);
        for (std::size_t i = 0; i < m_bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                result.push_back('-');
            }
            result.push_back(HEX_DIGITS[m_bytes[i] >> 4]);
            result.push_back(HEX_DIGITS[m_bytes[i] & 0x0F]);
        }
        return result;
    }

    bool effect_id::is_nil() const noexcept {
        for (auto b : m_bytes) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }
}
