/**
 * @file sdl3_output.hh
 * @brief Plays a rack through an SDL3 playback device
 * @ingroup backends
 */

#ifndef MIXRACK_BACKENDS_SDL3_OUTPUT_HH
#define MIXRACK_BACKENDS_SDL3_OUTPUT_HH

#include <cstddef>
#include <memory>
#include <string>

// Include generated export header
#include "export_mixrack_backend_sdl3.h"

namespace mixrack {

class rack;

/**
 * @struct sdl3_output_config
 * @brief Device-side settings of sdl3_output
 */
struct sdl3_output_config {
    /// Frames rendered per pull from the rack inside the device callback
    std::size_t device_frames = 512;
};

/**
 * @class sdl3_output
 * @brief Pulls interleaved float stereo from a rack on SDL's audio thread
 * @ingroup backends
 *
 * Opens the default playback device as a float32 stereo stream at the
 * rack's sample rate. SDL asks for data from its own thread; the callback
 * renders into a buffer allocated at open() time, device_frames at a time,
 * and queues it on the stream.
 *
 * The device starts paused; call resume() to start pulling.
 *
 * ## Usage Example
 *
 * @code
 * mixrack::rack r(fx, synths);
 * mixrack::sdl3_output out;
 * out.open(r);
 * out.resume();
 * r.note_on(60, 0.8f);
 * // ...
 * out.close();
 * @endcode
 *
 * The rack must outlive the open device. SDL's audio subsystem is
 * reference counted: every open() initializes it and every close() quits
 * it again.
 */
class MIXRACK_BACKEND_SDL3_EXPORT sdl3_output {
public:
    explicit sdl3_output(sdl3_output_config config = sdl3_output_config{});
    ~sdl3_output();

    sdl3_output(const sdl3_output&) = delete;
    sdl3_output& operator=(const sdl3_output&) = delete;

    /**
     * @brief Open the default playback device for @p source
     * @throws device_error if SDL cannot initialize audio or open the device,
     *         or if this output is already open
     */
    void open(rack& source);

    /**
     * @throws device_error if the device cannot be resumed
     */
    void resume();

    /**
     * @throws device_error if the device cannot be paused
     */
    void pause();

    /**
     * @brief Stop the device and release it; safe to call when closed
     */
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] bool is_paused() const;

    [[nodiscard]] const sdl3_output_config& config() const noexcept { return m_config; }

private:
    struct impl;

    sdl3_output_config m_config;
    std::unique_ptr<impl> m_impl;
};

} // namespace mixrack

#endif // MIXRACK_BACKENDS_SDL3_OUTPUT_HH
