#include <mixrack/sdk/smoothed_param.hh>

#include <cmath>
#include <utility>

namespace mixrack {

    smoothed_param::smoothed_param(shared_param target, float smoothing_ms, sample_rate_t sample_rate)
        : m_target(std::move(target)),
          m_current(m_target ? m_target->value() : 0.0f) {
        set_sample_rate(sample_rate, smoothing_ms);
    }

    float smoothed_param::next() noexcept {
        const float target = m_target->value();
        m_current += (target - m_current) * (1.0f - m_coefficient);
        return m_current;
    }

    bool smoothed_param::is_settled(float threshold) const noexcept {
        return std::fabs(m_current - m_target->value()) < threshold;
    }

    void smoothed_param::snap_to_target() noexcept {
        m_current = m_target->value();
    }

    void smoothed_param::set_sample_rate(sample_rate_t sample_rate, float smoothing_ms) {
        const double time_constant = static_cast<double>(smoothing_ms) * sample_rate / 1000.0;
        // zero smoothing time means "follow immediately"
        m_coefficient = time_constant > 0.0
                            ? static_cast<float>(std::exp(-1.0 / time_constant))
                            : 0.0f;
    }
}
