/**
 * @file level_meter.hh
 * @brief Fixed-window RMS / peak metering
 * @ingroup metering
 */

#ifndef MIXRACK_LEVEL_METER_HH
#define MIXRACK_LEVEL_METER_HH

#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>
#include <cstddef>
#include <vector>

namespace mixrack {

    /**
     * @class level_window
     * @brief Pre-allocated ring of stereo frames with block-wise statistics
     * @ingroup metering
     *
     * push() never allocates. Each time the ring has received another
     * capacity() frames the window statistics are recomputed over the whole
     * ring and published through levels(); until the first full window the
     * levels stay at zero.
     */
    class MIXRACK_EXPORT level_window {
        public:
            static constexpr std::size_t DEFAULT_CAPACITY = 2048;

            explicit level_window(std::size_t capacity = DEFAULT_CAPACITY);

            /**
             * @brief Append one frame
             * @return true when this frame completed a window and levels() changed
             */
            bool push(float left, float right) noexcept;

            [[nodiscard]] const stage_levels& levels() const noexcept { return m_levels; }

            [[nodiscard]] std::size_t capacity() const noexcept { return m_left.size(); }

            /**
             * @brief Frames pushed since the last completed window
             */
            [[nodiscard]] std::size_t pending() const noexcept { return m_write; }

            void clear() noexcept;

        private:
            void recompute() noexcept;

            std::vector<float> m_left;
            std::vector<float> m_right;
            std::size_t m_write = 0;
            stage_levels m_levels;
    };
}

#endif
