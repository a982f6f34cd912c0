#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <mixrack_backends/sdl3/sdl3_output.hh>
#include <mixrack/error.hh>
#include <mixrack/rack.hh>
#include <SDL3/SDL.h>
#include <chrono>
#include <thread>

using namespace mixrack;

namespace {
    // The dummy driver consumes audio on its own thread without hardware
    struct dummy_audio_driver {
        dummy_audio_driver() {
            SDL_SetHint(SDL_HINT_AUDIO_DRIVER, "dummy");
        }
    };

    rack make_rack() {
        rack_config config;
        config.sample_rate = 48000.0;
        config.block_frames = 128;
        config.max_voices = 4;
        return rack(effect_registry::with_builtin(), synth_registry::with_builtin(), config);
    }
}

TEST_SUITE("SDL3Output") {
    TEST_CASE("closed output reports its state") {
        sdl3_output out;
        CHECK_FALSE(out.is_open());
        CHECK(out.is_paused());
        CHECK(out.config().device_frames == 512);

        CHECK_THROWS_AS(out.resume(), device_error);
        CHECK_THROWS_AS(out.pause(), device_error);

        // closing twice is harmless
        out.close();
        out.close();
        CHECK_FALSE(out.is_open());
    }

    TEST_CASE("device frames of zero are clamped") {
        sdl3_output out(sdl3_output_config{0});
        CHECK(out.config().device_frames == 1);
    }

    TEST_CASE("open, pull and close on the dummy driver") {
        dummy_audio_driver driver;
        auto r = make_rack();
        r.add_effect("gain", {{"gain", 0.5f}});
        REQUIRE(r.note_on(69, 0.8f).has_value());

        sdl3_output out(sdl3_output_config{256});
        out.open(r);
        REQUIRE(out.is_open());
        CHECK(out.is_paused());

        SUBCASE("opening twice is rejected") {
            CHECK_THROWS_AS(out.open(r), device_error);
            CHECK(out.is_open());
        }

        SUBCASE("resumed device pulls frames from the rack") {
            out.resume();
            CHECK_FALSE(out.is_paused());

            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (r.frames_rendered() == 0 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            CHECK(r.frames_rendered() > 0);

            out.pause();
            CHECK(out.is_paused());
        }

        out.close();
        CHECK_FALSE(out.is_open());
    }
}
