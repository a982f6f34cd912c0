/**
 * @file smoothed_param.hh
 * @brief Render-side exponential smoothing of a realtime_param
 * @ingroup sdk_params
 */

#pragma once

#include <mixrack/sdk/realtime_param.hh>
#include <mixrack/sdk/types.hh>
#include <mixrack/export_mixrack.h>

namespace mixrack {

    /**
     * @class smoothed_param
     * @brief One-pole smoother that chases a shared target value
     * @ingroup sdk_params
     *
     * Abrupt parameter jumps (gain, cutoff) produce audible clicks. A
     * processor that wants click-free control keeps a smoothed_param
     * bound to its shared_param and calls next() once per sample; the
     * control thread keeps writing the shared_param as usual.
     *
     * The smoother state is owned by the render thread only.
     */
    class MIXRACK_EXPORT smoothed_param {
        public:
            static constexpr float DEFAULT_SMOOTHING_MS = 10.0f;

            /**
             * @param target Shared target cell; its current value seeds the smoother
             * @param smoothing_ms Time for ~63% of a step
             * @param sample_rate Processing rate
             */
            smoothed_param(shared_param target, float smoothing_ms, sample_rate_t sample_rate);

            /**
             * @brief Advance one sample towards the target
             */
            float next() noexcept;

            [[nodiscard]] float current() const noexcept { return m_current; }

            /**
             * @brief True when within @p threshold of the target
             */
            [[nodiscard]] bool is_settled(float threshold) const noexcept;

            /**
             * @brief Jump straight to the target
             */
            void snap_to_target() noexcept;

            void set_sample_rate(sample_rate_t sample_rate, float smoothing_ms);

            [[nodiscard]] const shared_param& target() const noexcept { return m_target; }

        private:
            shared_param m_target;
            float m_current;
            float m_coefficient = 0.0f;
    };
}
