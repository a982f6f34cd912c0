#include <mixrack/cpu_meter.hh>
#include <algorithm>

namespace mixrack {

    cpu_meter::cpu_meter(sample_rate_t sample_rate)
        : m_sample_rate(sample_rate),
          m_time_per_sample_ns(1e9 / sample_rate) {
    }

    void cpu_meter::stop_timing(token start, std::size_t n_samples) noexcept {
        record(std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - start), n_samples);
    }

    void cpu_meter::record(std::chrono::nanoseconds elapsed, std::size_t n_samples) noexcept {
        if (n_samples == 0) {
            return;
        }

        const auto elapsed_ns = static_cast<std::uint64_t>(std::max<std::chrono::nanoseconds::rep>(0, elapsed.count()));
        m_metrics.samples_processed += n_samples;
        m_metrics.total_time_ns += elapsed_ns;

        const std::uint64_t per_sample = elapsed_ns / n_samples;
        m_metrics.peak_time_ns = std::max(m_metrics.peak_time_ns, per_sample);

        // an idle meter takes the first measurement as is
        if (m_metrics.avg_time_ns == 0.0) {
            m_metrics.avg_time_ns = static_cast<double>(per_sample);
        } else {
            m_metrics.avg_time_ns = m_metrics.avg_time_ns * m_smoothing
                                    + static_cast<double>(per_sample) * (1.0 - m_smoothing);
        }

        m_metrics.cpu_usage = m_metrics.avg_time_ns / m_time_per_sample_ns;
    }

    void cpu_meter::reset() noexcept {
        m_metrics = performance_metrics{};
    }

    void cpu_meter::set_sample_rate(sample_rate_t sample_rate) noexcept {
        if (sample_rate <= 0.0) {
            return;
        }
        m_sample_rate = sample_rate;
        m_time_per_sample_ns = 1e9 / sample_rate;
    }

    void cpu_meter::set_smoothing(double factor) noexcept {
        m_smoothing = std::clamp(factor, 0.0, 0.999);
    }

    std::size_t metrics_aggregator::add_meter(cpu_meter meter) {
        m_meters.push_back(meter);
        return m_meters.size() - 1;
    }

    cpu_meter* metrics_aggregator::meter(std::size_t index) {
        return index < m_meters.size() ? &m_meters[index] : nullptr;
    }

    std::optional<performance_metrics> metrics_aggregator::meter_metrics(std::size_t index) const {
        if (index >= m_meters.size()) {
            return std::nullopt;
        }
        return m_meters[index].metrics();
    }

    double metrics_aggregator::total_cpu_usage() const {
        double total = 0.0;
        for (const auto& m : m_meters) {
            total += m.metrics().cpu_usage;
        }
        return total;
    }

    double metrics_aggregator::total_cpu_percent() const {
        return total_cpu_usage() * 100.0;
    }

    bool metrics_aggregator::has_overload() const {
        return std::any_of(m_meters.begin(), m_meters.end(),
                           [](const cpu_meter& m) { return m.metrics().is_overloaded(); });
    }

    void metrics_aggregator::reset_all() {
        for (auto& m : m_meters) {
            m.reset();
        }
    }
}
