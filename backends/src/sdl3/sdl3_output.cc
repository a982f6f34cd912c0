// This is copyrighted software. More information is at the end of this file.
#include <mixrack_backends/sdl3/sdl3_output.hh>
#include <mixrack/error.hh>
#include <mixrack/rack.hh>
#include <failsafe/failsafe.hh>
#include <SDL3/SDL.h>
#include <algorithm>
#include <vector>

namespace mixrack {

    namespace {
        constexpr int CHANNELS = 2;
        constexpr int BYTES_PER_FRAME = CHANNELS * static_cast<int>(sizeof(float));

        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }
    }

    struct sdl3_output::impl {
        rack* source = nullptr;
        SDL_AudioStream* stream = nullptr;
        std::vector<float> buffer;
        std::size_t device_frames = 0;

        static void SDLCALL on_stream_request(void* userdata, SDL_AudioStream* stream,
                                              int additional_amount, [[maybe_unused]] int total_amount) {
            auto* self = static_cast<impl*>(userdata);
            if (!self || !self->source || additional_amount <= 0) {
                return;
            }

            auto remaining = static_cast<std::size_t>((additional_amount + BYTES_PER_FRAME - 1) / BYTES_PER_FRAME);
            while (remaining > 0) {
                const std::size_t frames = std::min(remaining, self->device_frames);
                self->source->render(self->buffer.data(), frames);
                if (!SDL_PutAudioStreamData(stream, self->buffer.data(),
                                            static_cast<int>(frames) * BYTES_PER_FRAME)) {
                    return;
                }
                remaining -= frames;
            }
        }
    };

    sdl3_output::sdl3_output(sdl3_output_config config)
        : m_config(config) {
        if (m_config.device_frames == 0) {
            m_config.device_frames = 1;
        }
    }

    sdl3_output::~sdl3_output() {
        close();
    }

    void sdl3_output::open(rack& source) {
        if (m_impl) {
            throw device_error("SDL3 output is already open");
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            throw device_error("Failed to initialize SDL3 audio: " + get_sdl_error());
        }

        auto state = std::make_unique<impl>();
        state->source = &source;
        state->device_frames = m_config.device_frames;
        state->buffer.assign(m_config.device_frames * CHANNELS, 0.0f);

        SDL_AudioSpec spec;
        SDL_zero(spec);
        spec.format = SDL_AUDIO_F32;
        spec.channels = CHANNELS;
        spec.freq = static_cast<int>(source.sample_rate());

        state->stream = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec,
                                                  &impl::on_stream_request, state.get());
        if (!state->stream) {
            const auto error = get_sdl_error();
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            throw device_error("Failed to open SDL3 playback device: " + error);
        }

        LOG_INFO("sdl3_output", "Opened playback device at", spec.freq, "Hz,",
                 m_config.device_frames, "frames per pull");
        m_impl = std::move(state);
    }

    void sdl3_output::resume() {
        if (!m_impl) {
            throw device_error("SDL3 output is not open");
        }
        if (!SDL_ResumeAudioStreamDevice(m_impl->stream)) {
            throw device_error("Failed to resume SDL3 playback device: " + get_sdl_error());
        }
    }

    void sdl3_output::pause() {
        if (!m_impl) {
            throw device_error("SDL3 output is not open");
        }
        if (!SDL_PauseAudioStreamDevice(m_impl->stream)) {
            throw device_error("Failed to pause SDL3 playback device: " + get_sdl_error());
        }
    }

    void sdl3_output::close() noexcept {
        if (!m_impl) {
            return;
        }
        // destroying the stream closes the device and joins its callback
        SDL_DestroyAudioStream(m_impl->stream);
        m_impl.reset();
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        LOG_INFO("sdl3_output", "Closed playback device");
    }

    bool sdl3_output::is_open() const noexcept {
        return m_impl != nullptr;
    }

    bool sdl3_output::is_paused() const {
        if (!m_impl) {
            return true;
        }
        return SDL_AudioStreamDevicePaused(m_impl->stream);
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
