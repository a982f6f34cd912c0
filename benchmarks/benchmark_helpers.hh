#ifndef MIXRACK_BENCHMARK_HELPERS_HH
#define MIXRACK_BENCHMARK_HELPERS_HH

#include <mixrack/rack.hh>
#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/sdk/synth_registry.hh>
#include <cstddef>
#include <memory>
#include <vector>

namespace mixrack::benchmark {

// Frames per benchmark iteration, a typical device period
constexpr std::size_t BLOCK_FRAMES = 256;

inline const std::shared_ptr<effect_registry>& builtin_effects() {
    static const auto registry = effect_registry::with_builtin();
    return registry;
}

inline const std::shared_ptr<synth_registry>& builtin_synths() {
    static const auto registry = synth_registry::with_builtin();
    return registry;
}

// lowpass -> delay -> gain -> pan, the usual insert stack
inline void add_typical_effects(effect_chain& chain) {
    chain.add_effect("lowpass", {{"cutoff", 2000.0f}, {"res", 0.3f}});
    chain.add_effect("delay", {{"time", 0.2f}});
    chain.add_effect("gain", {{"gain", 0.8f}});
    chain.add_effect("pan", {{"pan", -0.2f}});
}

inline rack_config benchmark_rack_config(std::size_t voices) {
    rack_config config;
    config.sample_rate = 48000.0;
    config.block_frames = BLOCK_FRAMES;
    config.max_voices = voices;
    config.synth = "saw";
    return config;
}

// Interleaved stereo buffer for one block
inline std::vector<float> make_block_buffer() {
    return std::vector<float>(2 * BLOCK_FRAMES, 0.0f);
}

} // namespace mixrack::benchmark

#endif // MIXRACK_BENCHMARK_HELPERS_HH
