#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <mixrack/voice_manager.hh>
#include <string>

namespace mixrack::benchmark {

void register_voice_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Voice Manager");
    bench.batch(BLOCK_FRAMES).unit("frame");

    for (std::size_t voices : {1u, 8u, 32u}) {
        voice_manager vm(builtin_synths(), "saw", voices, 48000.0);
        for (std::size_t n = 0; n < voices; ++n) {
            vm.note_on(static_cast<midi_note_t>(36 + n), 0.5f);
        }
        bench.run("get_stereo_saw_x" + std::to_string(voices), [&] {
            for (std::size_t i = 0; i < BLOCK_FRAMES; ++i) {
                auto out = vm.get_stereo();
                ankerl::nanobench::doNotOptimizeAway(out);
            }
        });
    }

    bench.batch(1).unit("op");

    // Steady-state stealing: every note-on builds a generator and evicts one
    voice_manager stealing(builtin_synths(), "sine", 8, 48000.0);
    midi_note_t note = 0;
    bench.run("note_on_steal", [&] {
        auto index = stealing.note_on(static_cast<midi_note_t>(note++ % 128), 0.7f);
        ankerl::nanobench::doNotOptimizeAway(index);
    });

    voice_manager bending(builtin_synths(), "saw", 16, 48000.0);
    for (midi_note_t n = 48; n < 64; ++n) {
        bending.note_on(n, 0.5f);
    }
    bench.run("pitch_bend_16_voices", [&] {
        bending.pitch_bend(0.5f);
    });
}

} // namespace mixrack::benchmark
