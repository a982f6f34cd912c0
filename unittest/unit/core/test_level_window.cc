#include <doctest/doctest.h>
#include <mixrack/level_meter.hh>
#include <cmath>

using namespace mixrack;

TEST_SUITE("Core::LevelWindow") {
    TEST_CASE("levels stay zero until the first full window") {
        level_window window;
        CHECK(window.capacity() == level_window::DEFAULT_CAPACITY);

        for (std::size_t i = 0; i + 1 < window.capacity(); ++i) {
            CHECK_FALSE(window.push(1.0f, 1.0f));
        }
        CHECK(window.pending() == window.capacity() - 1);
        CHECK(window.levels().rms_left == 0.0f);
        CHECK(window.levels().peak_left == 0.0f);

        CHECK(window.push(1.0f, 1.0f));
        CHECK(window.pending() == 0);
        CHECK(window.levels().rms_left == doctest::Approx(1.0f));
        CHECK(window.levels().peak_right == 1.0f);
    }

    TEST_CASE("rms and peak per channel") {
        level_window window(4);
        window.push(1.0f, 0.0f);
        window.push(-1.0f, 0.0f);
        window.push(1.0f, 0.5f);
        CHECK(window.push(-1.0f, -0.5f));

        const auto& l = window.levels();
        CHECK(l.rms_left == doctest::Approx(1.0f));
        CHECK(l.peak_left == 1.0f);
        CHECK(l.rms_right == doctest::Approx(std::sqrt(0.125f)));
        CHECK(l.peak_right == 0.5f);
    }

    TEST_CASE("a new window replaces the old statistics") {
        level_window window(2);
        window.push(1.0f, 1.0f);
        window.push(1.0f, 1.0f);
        CHECK(window.levels().peak_left == 1.0f);

        window.push(0.0f, 0.0f);
        CHECK(window.levels().peak_left == 1.0f);
        window.push(0.0f, 0.0f);
        CHECK(window.levels().peak_left == 0.0f);
        CHECK(window.levels().rms_left == 0.0f);
    }

    TEST_CASE("clear resets the window") {
        level_window window(2);
        window.push(0.5f, 0.5f);
        window.push(0.5f, 0.5f);
        window.push(0.5f, 0.5f);
        window.clear();
        CHECK(window.pending() == 0);
        CHECK(window.levels().peak_left == 0.0f);
    }

    TEST_CASE("zero capacity is raised to one") {
        level_window window(0);
        CHECK(window.capacity() == 1);
        CHECK(window.push(0.25f, 0.5f));
        CHECK(window.levels().peak_right == 0.5f);
    }
}
