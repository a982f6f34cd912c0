#include <mixrack/level_meter.hh>
#include <algorithm>
#include <cmath>

namespace mixrack {

    level_window::level_window(std::size_t capacity)
        : m_left(std::max<std::size_t>(capacity, 1), 0.0f),
          m_right(std::max<std::size_t>(capacity, 1), 0.0f) {
    }

    bool level_window::push(float left, float right) noexcept {
        m_left[m_write] = left;
        m_right[m_write] = right;
        if (++m_write < m_left.size()) {
            return false;
        }
        m_write = 0;
        recompute();
        return true;
    }

    void level_window::clear() noexcept {
        std::fill(m_left.begin(), m_left.end(), 0.0f);
        std::fill(m_right.begin(), m_right.end(), 0.0f);
        m_write = 0;
        m_levels = stage_levels{};
    }

    void level_window::recompute() noexcept {
        float sum_l = 0.0f;
        float sum_r = 0.0f;
        float peak_l = 0.0f;
        float peak_r = 0.0f;

        for (std::size_t i = 0; i < m_left.size(); ++i) {
            const float l = m_left[i];
            const float r = m_right[i];
            sum_l += l * l;
            sum_r += r * r;
            peak_l = std::max(peak_l, std::fabs(l));
            peak_r = std::max(peak_r, std::fabs(r));
        }

        const auto count = static_cast<float>(m_left.size());
        m_levels.rms_left = std::sqrt(sum_l / count);
        m_levels.rms_right = std::sqrt(sum_r / count);
        m_levels.peak_left = peak_l;
        m_levels.peak_right = peak_r;
    }
}
