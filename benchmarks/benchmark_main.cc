#define ANKERL_NANOBENCH_IMPLEMENT
#include <nanobench.h>
#include <iostream>

// Declare benchmark suites
namespace mixrack::benchmark {
    void register_effect_chain_benchmarks(ankerl::nanobench::Bench& bench);
    void register_voice_benchmarks(ankerl::nanobench::Bench& bench);
    void register_rack_contention_benchmarks(ankerl::nanobench::Bench& bench);
}

int main() {
    std::cout << "Running mixrack benchmarks...\n\n";

    // Run benchmarks in a scope so they complete before the process exits
    {
        ankerl::nanobench::Bench bench;
        bench.title("mixrack Benchmarks");
        bench.relative(true);
        bench.performanceCounters(true);

        mixrack::benchmark::register_effect_chain_benchmarks(bench);
        mixrack::benchmark::register_voice_benchmarks(bench);
        mixrack::benchmark::register_rack_contention_benchmarks(bench);
    }

    return 0;
}
