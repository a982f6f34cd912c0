/**
 * @file cpu_meter.hh
 * @brief Per-sample processing cost measurement
 * @ingroup metering
 */

#ifndef MIXRACK_CPU_METER_HH
#define MIXRACK_CPU_METER_HH

#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace mixrack {

    /**
     * @struct performance_metrics
     * @brief Snapshot of a cpu_meter
     *
     * cpu_usage is the smoothed per-sample cost divided by the time budget
     * of one sample (1e9 / sample_rate ns): 0 = idle, 1 = the whole budget,
     * above 1 = the render path cannot keep up.
     */
    struct MIXRACK_EXPORT performance_metrics {
        double avg_time_ns = 0.0;
        std::uint64_t peak_time_ns = 0;
        double cpu_usage = 0.0;
        std::uint64_t samples_processed = 0;
        std::uint64_t total_time_ns = 0;

        /// Above 80% of the budget: dropouts are likely
        [[nodiscard]] bool is_overloaded() const { return cpu_usage > 0.8; }
        /// Between 40% and 80% inclusive
        [[nodiscard]] bool is_moderate() const { return cpu_usage >= 0.4 && cpu_usage <= 0.8; }
        /// Below 40%
        [[nodiscard]] bool is_low() const { return cpu_usage < 0.4; }

        [[nodiscard]] double cpu_percent() const { return cpu_usage * 100.0; }
        [[nodiscard]] double avg_time_us() const { return avg_time_ns / 1000.0; }
        [[nodiscard]] double peak_time_us() const { return static_cast<double>(peak_time_ns) / 1000.0; }
    };

    /**
     * @class cpu_meter
     * @brief Exponentially smoothed per-sample timing
     * @ingroup metering
     *
     * The meter is owned by whoever renders (a chain stage, the voice
     * manager) and is only touched from that thread; reports are read
     * between render calls.
     *
     * @code
     * auto token = meter.start_timing();
     * auto out = processor.process(l, r);
     * meter.stop_timing(token, 1);
     * @endcode
     */
    class MIXRACK_EXPORT cpu_meter {
        public:
            using clock = std::chrono::steady_clock;
            using token = clock::time_point;

            static constexpr double DEFAULT_SMOOTHING = 0.99;

            explicit cpu_meter(sample_rate_t sample_rate = 48000.0);

            [[nodiscard]] token start_timing() const noexcept {
                return clock::now();
            }

            /**
             * @brief Account the time since @p start over @p n_samples samples
             *
             * Does nothing for n_samples == 0.
             */
            void stop_timing(token start, std::size_t n_samples) noexcept;

            /**
             * @brief Account an explicit duration over @p n_samples samples
             */
            void record(std::chrono::nanoseconds elapsed, std::size_t n_samples) noexcept;

            /**
             * @brief Time a callable as @p n_samples samples of work
             */
            template<typename Fn>
            void measure(std::size_t n_samples, Fn&& fn) {
                const auto start = start_timing();
                fn();
                stop_timing(start, n_samples);
            }

            [[nodiscard]] const performance_metrics& metrics() const noexcept {
                return m_metrics;
            }

            void reset() noexcept;

            void set_sample_rate(sample_rate_t sample_rate) noexcept;

            [[nodiscard]] sample_rate_t sample_rate() const noexcept {
                return m_sample_rate;
            }

            /**
             * @brief Smoothing factor a in avg = avg*a + sample*(1-a)
             *
             * Clamped to [0, 0.999]; 0 disables smoothing.
             */
            void set_smoothing(double factor) noexcept;

            [[nodiscard]] double smoothing() const noexcept {
                return m_smoothing;
            }

        private:
            performance_metrics m_metrics;
            sample_rate_t m_sample_rate;
            double m_time_per_sample_ns;
            double m_smoothing = DEFAULT_SMOOTHING;
    };

    /**
     * @class metrics_aggregator
     * @brief Owns several meters and reports their combined load
     */
    class MIXRACK_EXPORT metrics_aggregator {
        public:
            std::size_t add_meter(cpu_meter meter);

            [[nodiscard]] cpu_meter* meter(std::size_t index);

            [[nodiscard]] std::optional<performance_metrics> meter_metrics(std::size_t index) const;

            [[nodiscard]] double total_cpu_usage() const;

            [[nodiscard]] double total_cpu_percent() const;

            [[nodiscard]] bool has_overload() const;

            void reset_all();

            [[nodiscard]] std::size_t size() const { return m_meters.size(); }

        private:
            std::vector<cpu_meter> m_meters;
    };
}

#endif
