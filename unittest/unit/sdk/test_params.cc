#include <doctest/doctest.h>
#include <mixrack/sdk/parameter_def.hh>
#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/smoothed_param.hh>
#include <atomic>
#include <cmath>
#include <thread>

using namespace mixrack;

TEST_SUITE("SDK::Params") {
    TEST_CASE("realtime_param publishes the last written value") {
        realtime_param p(0.25f);
        CHECK(p.value() == 0.25f);

        p.set(-3.5f);
        CHECK(p.value() == -3.5f);

        SUBCASE("special values survive the bit cast") {
            p.set(-0.0f);
            CHECK(std::signbit(p.value()));

            p.set(INFINITY);
            CHECK(std::isinf(p.value()));
        }
    }

    TEST_CASE("shared handles see the same cell") {
        auto a = make_param(1.0f);
        shared_param b = a;
        b->set(7.0f);
        CHECK(a->value() == 7.0f);
        CHECK(make_param()->value() == 0.0f);
    }

    TEST_CASE("concurrent reader never observes a torn value") {
        auto p = make_param(1.0f);
        std::atomic<bool> done{false};
        std::atomic<int> bad{0};

        std::thread reader([&] {
            while (!done.load()) {
                const float v = p->value();
                if (v != 1.0f && v != 2.0f) {
                    ++bad;
                }
            }
        });

        for (int i = 0; i < 100000; ++i) {
            p->set((i & 1) ? 2.0f : 1.0f);
        }
        done = true;
        reader.join();

        CHECK(bad.load() == 0);
    }

    TEST_CASE("parameter_def range helpers") {
        parameter_def def("cutoff", 1000.0f, 20.0f, 20000.0f);
        CHECK(def.clamp(5.0f) == 20.0f);
        CHECK(def.clamp(50000.0f) == 20000.0f);
        CHECK(def.normalize(20.0f) == 0.0f);
        CHECK(def.normalize(20000.0f) == 1.0f);
        CHECK(def.denormalize(0.5f) == doctest::Approx(10010.0f));

        parameter_def flat("x", 1.0f, 1.0f, 1.0f);
        CHECK(flat.normalize(1.0f) == 0.0f);
    }

    TEST_CASE("smoothed_param chases its target") {
        auto target = make_param(0.5f);
        smoothed_param s(target, 10.0f, 48000.0);

        // seeded from the current value: no ramp at start
        CHECK(s.current() == 0.5f);
        CHECK(s.next() == 0.5f);
        CHECK(s.is_settled(1e-6f));

        target->set(1.0f);
        const float first = s.next();
        CHECK(first > 0.5f);
        CHECK(first < 1.0f);
        CHECK_FALSE(s.is_settled(1e-3f));

        float last = first;
        bool monotonic = true;
        for (int i = 0; i < 48000; ++i) {
            const float v = s.next();
            monotonic = monotonic && v >= last;
            last = v;
        }
        CHECK(monotonic);
        CHECK(last == doctest::Approx(1.0f).epsilon(1e-4));

        SUBCASE("snap jumps straight to the target") {
            target->set(-1.0f);
            s.snap_to_target();
            CHECK(s.current() == -1.0f);
        }

        SUBCASE("zero smoothing time follows immediately") {
            s.set_sample_rate(48000.0, 0.0f);
            target->set(0.125f);
            CHECK(s.next() == 0.125f);
        }
    }
}
