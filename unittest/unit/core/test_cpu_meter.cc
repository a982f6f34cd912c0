#include <doctest/doctest.h>
#include <mixrack/cpu_meter.hh>
#include <chrono>
#include <thread>

using namespace mixrack;
using namespace std::chrono_literals;

TEST_SUITE("Core::CpuMeter") {
    TEST_CASE("fresh meter reports idle") {
        cpu_meter meter;
        const auto& m = meter.metrics();
        CHECK(m.avg_time_ns == 0.0);
        CHECK(m.peak_time_ns == 0);
        CHECK(m.cpu_usage == 0.0);
        CHECK(m.samples_processed == 0);
        CHECK(m.is_low());
        CHECK_FALSE(m.is_overloaded());
        CHECK(meter.sample_rate() == 48000.0);
        CHECK(meter.smoothing() == cpu_meter::DEFAULT_SMOOTHING);
    }

    TEST_CASE("zero-duration measurements keep usage at zero") {
        cpu_meter meter(48000.0);
        for (int i = 0; i < 100; ++i) {
            meter.record(0ns, 1);
        }
        CHECK(meter.metrics().samples_processed == 100);
        CHECK(meter.metrics().cpu_usage == 0.0);
        CHECK(meter.metrics().is_low());
    }

    TEST_CASE("first measurement is taken as is, later ones are smoothed") {
        cpu_meter meter(1000.0);  // 1 ms = 1e6 ns budget per sample

        meter.record(500000ns, 1);
        CHECK(meter.metrics().avg_time_ns == doctest::Approx(500000.0));
        CHECK(meter.metrics().cpu_usage == doctest::Approx(0.5));
        CHECK(meter.metrics().is_moderate());

        meter.record(1500000ns, 1);
        // 0.99 * 500000 + 0.01 * 1500000
        CHECK(meter.metrics().avg_time_ns == doctest::Approx(510000.0));
        CHECK(meter.metrics().peak_time_ns == 1500000);
        CHECK(meter.metrics().total_time_ns == 2000000);
        CHECK(meter.metrics().cpu_percent() == doctest::Approx(51.0));
        CHECK(meter.metrics().avg_time_us() == doctest::Approx(510.0));
        CHECK(meter.metrics().peak_time_us() == doctest::Approx(1500.0));
    }

    TEST_CASE("per-sample time uses integer division") {
        cpu_meter meter(1000.0);
        meter.record(1000ns, 3);
        CHECK(meter.metrics().avg_time_ns == 333.0);
        CHECK(meter.metrics().samples_processed == 3);
    }

    TEST_CASE("zero samples is a no-op") {
        cpu_meter meter;
        meter.record(1000000ns, 0);
        CHECK(meter.metrics().samples_processed == 0);
        CHECK(meter.metrics().total_time_ns == 0);
    }

    TEST_CASE("smoothing factor is clamped") {
        cpu_meter meter;
        meter.set_smoothing(2.0);
        CHECK(meter.smoothing() == doctest::Approx(0.999));
        meter.set_smoothing(-1.0);
        CHECK(meter.smoothing() == 0.0);

        SUBCASE("no smoothing tracks the latest sample") {
            cpu_meter m(1000.0);
            m.set_smoothing(0.0);
            m.record(100ns, 1);
            m.record(900ns, 1);
            CHECK(m.metrics().avg_time_ns == 900.0);
        }
    }

    TEST_CASE("overload classification") {
        cpu_meter meter(1000.0);
        meter.record(900000ns, 1);
        CHECK(meter.metrics().is_overloaded());
        CHECK_FALSE(meter.metrics().is_moderate());

        meter.reset();
        CHECK(meter.metrics().cpu_usage == 0.0);
        CHECK(meter.metrics().samples_processed == 0);
    }

    TEST_CASE("sample rate changes the budget") {
        cpu_meter meter(1000.0);
        meter.set_sample_rate(0.0);
        CHECK(meter.sample_rate() == 1000.0);

        meter.set_sample_rate(2000.0);
        meter.record(250000ns, 1);
        CHECK(meter.metrics().cpu_usage == doctest::Approx(0.5));
    }

    TEST_CASE("measure times a callable") {
        cpu_meter meter;
        meter.measure(10, [] { std::this_thread::sleep_for(1ms); });
        CHECK(meter.metrics().samples_processed == 10);
        CHECK(meter.metrics().total_time_ns >= 1000000);
        CHECK(meter.metrics().avg_time_ns > 0.0);
    }
}

TEST_SUITE("Core::MetricsAggregator") {
    TEST_CASE("sums meters and reports overloads") {
        metrics_aggregator agg;
        CHECK(agg.size() == 0);
        CHECK(agg.total_cpu_usage() == 0.0);

        const auto a = agg.add_meter(cpu_meter(1000.0));
        const auto b = agg.add_meter(cpu_meter(1000.0));
        REQUIRE(agg.meter(a) != nullptr);
        CHECK(agg.meter(5) == nullptr);
        CHECK_FALSE(agg.meter_metrics(5).has_value());

        agg.meter(a)->record(300000ns, 1);
        agg.meter(b)->record(200000ns, 1);
        CHECK(agg.total_cpu_usage() == doctest::Approx(0.5));
        CHECK(agg.total_cpu_percent() == doctest::Approx(50.0));
        CHECK_FALSE(agg.has_overload());

        agg.meter(b)->set_smoothing(0.0);
        agg.meter(b)->record(950000ns, 1);
        CHECK(agg.has_overload());
        CHECK(agg.meter_metrics(b)->is_overloaded());

        agg.reset_all();
        CHECK(agg.total_cpu_usage() == 0.0);
    }
}
