//
// Resonant lowpass shared by the lowpass effect and the filtered synth voices
//

#ifndef MIXRACK_BUILTIN_BIQUAD_HH
#define MIXRACK_BUILTIN_BIQUAD_HH

#include <mixrack/sdk/types.hh>
#include <algorithm>
#include <cmath>

namespace mixrack::detail {

    struct biquad_coefficients {
        float b0 = 1.0f;
        float b1 = 0.0f;
        float b2 = 0.0f;
        float a1 = 0.0f;
        float a2 = 0.0f;

        /**
         * RBJ cookbook lowpass. @p resonance 0..1 maps to Q 0.707..10, the
         * cutoff is kept below Nyquist.
         */
        void set_lowpass(float cutoff, float resonance, sample_rate_t sample_rate) {
            constexpr float pi = 3.14159265358979323846f;
            const auto sr = static_cast<float>(sample_rate);
            const float fc = std::clamp(cutoff, 10.0f, sr * 0.49f);
            const float q = 0.707f + std::clamp(resonance, 0.0f, 1.0f) * 9.3f;
            const float w0 = 2.0f * pi * fc / sr;
            const float cos_w0 = std::cos(w0);
            const float alpha = std::sin(w0) / (2.0f * q);
            const float a0 = 1.0f + alpha;

            b0 = (1.0f - cos_w0) * 0.5f / a0;
            b1 = (1.0f - cos_w0) / a0;
            b2 = b0;
            a1 = -2.0f * cos_w0 / a0;
            a2 = (1.0f - alpha) / a0;
        }
    };

    struct biquad_state {
        float x1 = 0.0f;
        float x2 = 0.0f;
        float y1 = 0.0f;
        float y2 = 0.0f;

        float tick(float x, const biquad_coefficients& c) {
            const float y = c.b0 * x + c.b1 * x1 + c.b2 * x2 - c.a1 * y1 - c.a2 * y2;
            x2 = x1;
            x1 = x;
            y2 = y1;
            y1 = y;
            return y;
        }
    };
}

#endif
