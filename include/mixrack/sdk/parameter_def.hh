/**
 * @file parameter_def.hh
 * @brief Parameter description published in processor metadata
 * @ingroup sdk_params
 */

#pragma once

#include <algorithm>
#include <string>
#include <utility>

namespace mixrack {

    /**
     * @struct parameter_def
     * @brief Name, default and range of one processor parameter
     * @ingroup sdk_params
     */
    struct parameter_def {
        std::string name;
        float default_value = 0.0f;
        float min = 0.0f;
        float max = 1.0f;

        parameter_def() = default;

        parameter_def(std::string name_, float default_, float min_, float max_)
            : name(std::move(name_)), default_value(default_), min(min_), max(max_) {
        }

        [[nodiscard]] float clamp(float value) const {
            return std::clamp(value, min, max);
        }

        /**
         * @brief Map a value in [min, max] to [0, 1]
         *
         * A degenerate range maps everything to 0.
         */
        [[nodiscard]] float normalize(float value) const {
            if (max == min) {
                return 0.0f;
            }
            return (value - min) / (max - min);
        }

        [[nodiscard]] float denormalize(float normalized) const {
            return min + normalized * (max - min);
        }
    };
}
