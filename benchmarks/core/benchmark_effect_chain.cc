#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <mixrack/effect_chain.hh>

namespace mixrack::benchmark {

void register_effect_chain_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Effect Chain");
    bench.batch(BLOCK_FRAMES).unit("frame");

    // Baseline: nothing to do
    effect_chain empty(builtin_effects());
    bench.run("chain_empty", [&] {
        for (std::size_t i = 0; i < BLOCK_FRAMES; ++i) {
            auto out = empty.process(0.1f, -0.1f);
            ankerl::nanobench::doNotOptimizeAway(out);
        }
    });

    effect_chain typical(builtin_effects());
    add_typical_effects(typical);
    bench.run("chain_four_stages", [&] {
        for (std::size_t i = 0; i < BLOCK_FRAMES; ++i) {
            auto out = typical.process(0.1f, -0.1f);
            ankerl::nanobench::doNotOptimizeAway(out);
        }
    });

    // Same stack, all bypassed: cost of metering and iteration alone
    effect_chain bypassed(builtin_effects());
    add_typical_effects(bypassed);
    for (std::size_t i = 0; i < bypassed.size(); ++i) {
        bypassed.set_effect_bypass(i, true);
    }
    bench.run("chain_four_stages_bypassed", [&] {
        for (std::size_t i = 0; i < BLOCK_FRAMES; ++i) {
            auto out = bypassed.process(0.1f, -0.1f);
            ankerl::nanobench::doNotOptimizeAway(out);
        }
    });

    effect_chain keyed(builtin_effects());
    keyed.add_effect("sidechain_compressor", {});
    keyed.add_effect("sidechain_gate", {});
    const stereo_frame key{0.5f, 0.5f};
    bench.run("chain_sidechain", [&] {
        for (std::size_t i = 0; i < BLOCK_FRAMES; ++i) {
            auto out = keyed.process_with_sidechain(0.1f, -0.1f, key);
            ankerl::nanobench::doNotOptimizeAway(out);
        }
    });

    bench.batch(1).unit("op");

    // Lock-free parameter write through the stage controls
    bench.run("chain_set_param", [&] {
        typical.set_param(0, "cutoff", 1500.0f);
    });

    bench.run("chain_to_state", [&] {
        auto state = typical.to_state();
        ankerl::nanobench::doNotOptimizeAway(state);
    });
}

} // namespace mixrack::benchmark
