/**
 * @file types.hh
 * @brief Value types shared by processors, chains and voices
 * @ingroup sdk_types
 */

#ifndef MIXRACK_SDK_TYPES_HH
#define MIXRACK_SDK_TYPES_HH

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace mixrack {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core value types for per-sample processing
 *
 * Everything in mixrack works one stereo frame at a time. A frame is a
 * pair of floats; parameter maps are plain name/value maps passed to the
 * processor factories at build time.
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Sample rate in Hz
 *
 * Kept as double because oscillator phase increments and meter budgets
 * are derived from it.
 */
using sample_rate_t = double;

/**
 * @typedef midi_note_t
 * @brief MIDI note number (0..127)
 */
using midi_note_t = std::uint8_t;

/**
 * @typedef param_map
 * @brief Build-time parameter values keyed by parameter name
 *
 * Ordered so that serialized output is stable.
 */
using param_map = std::map<std::string, float>;

/**
 * @struct stereo_frame
 * @brief One left/right sample pair
 */
struct stereo_frame {
    float left = 0.0f;
    float right = 0.0f;
};

inline bool operator==(const stereo_frame& a, const stereo_frame& b) {
    return a.left == b.left && a.right == b.right;
}

inline bool operator!=(const stereo_frame& a, const stereo_frame& b) {
    return !(a == b);
}

/**
 * @struct stage_levels
 * @brief Windowed loudness statistics of a stereo signal
 *
 * RMS and absolute peak per channel, computed over a fixed-size window.
 */
struct stage_levels {
    float rms_left = 0.0f;
    float rms_right = 0.0f;
    float peak_left = 0.0f;
    float peak_right = 0.0f;
};

/** @} */

} // namespace mixrack

#endif // MIXRACK_SDK_TYPES_HH
