#include <nanobench.h>
#include "../benchmark_helpers.hh"
#include <atomic>
#include <thread>

namespace mixrack::benchmark {

// Render cost while a control thread keeps editing the rack
void register_rack_contention_benchmarks(ankerl::nanobench::Bench& bench) {
    bench.title("Rack Contention");
    bench.batch(BLOCK_FRAMES).unit("frame");

    auto buffer = make_block_buffer();

    {
        rack r(builtin_effects(), builtin_synths(), benchmark_rack_config(8));
        r.add_effect("lowpass", {});
        r.add_effect("delay", {});
        for (midi_note_t n = 48; n < 56; ++n) {
            r.note_on(n, 0.5f);
        }

        bench.run("render_uncontended", [&] {
            r.render(buffer.data(), BLOCK_FRAMES);
        });
    }

    {
        rack r(builtin_effects(), builtin_synths(), benchmark_rack_config(8));
        const auto cutoff = r.add_effect("lowpass", {});
        r.add_effect("delay", {});

        std::atomic<bool> stop{false};
        std::thread control([&] {
            midi_note_t note = 48;
            while (!stop.load(std::memory_order_relaxed)) {
                r.note_on(note, 0.5f);
                r.set_effect_param(cutoff, "cutoff", 500.0f + note * 10.0f);
                r.note_off(static_cast<midi_note_t>(note - 4));
                note = static_cast<midi_note_t>(note < 72 ? note + 1 : 48);
            }
        });

        bench.run("render_with_control_thread", [&] {
            r.render(buffer.data(), BLOCK_FRAMES);
        });

        stop = true;
        control.join();
    }

    {
        rack r(builtin_effects(), builtin_synths(), benchmark_rack_config(8));
        r.add_effect("gain", {});

        std::atomic<bool> stop{false};
        std::thread editor([&] {
            while (!stop.load(std::memory_order_relaxed)) {
                const auto id = r.add_effect("lowpass", {});
                r.move_effect(id, 0);
                r.remove_effect(id);
            }
        });

        bench.run("render_with_structural_edits", [&] {
            r.render(buffer.data(), BLOCK_FRAMES);
        });

        stop = true;
        editor.join();
    }
}

} // namespace mixrack::benchmark
