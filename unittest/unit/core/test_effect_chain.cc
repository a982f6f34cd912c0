#include <doctest/doctest.h>
#include "../../mock_components.hh"
#include <mixrack/effect_chain.hh>
#include <mixrack/error.hh>

using namespace mixrack;
using namespace mixrack::test;

namespace {
    effect_chain make_chain() {
        return effect_chain(make_test_effect_registry(), 48000.0);
    }
}

TEST_SUITE("Core::EffectChain") {
    TEST_CASE("empty chain is the identity") {
        effect_chain chain = make_chain();
        CHECK(chain.empty());
        auto out = chain.process(0.3f, -0.7f);
        CHECK(out.left == 0.3f);
        CHECK(out.right == -0.7f);
        CHECK(chain.total_latency() == 0);
        CHECK(chain.total_cpu_usage() == 0.0);
    }

    TEST_CASE("stages run in list order") {
        effect_chain chain = make_chain();
        CHECK(chain.add_effect("scale", {{"gain", 2.0f}}) == 0);
        CHECK(chain.add_effect("offset", {{"offset", 1.0f}}) == 1);
        CHECK(chain.size() == 2);

        // (x * 2) + 1
        auto out = chain.process(1.0f, -1.0f);
        CHECK(out.left == 3.0f);
        CHECK(out.right == -1.0f);

        SUBCASE("chain bypass skips every stage") {
            chain.set_bypass(true);
            CHECK(chain.is_bypassed());
            CHECK(chain.process(1.0f, -1.0f) == stereo_frame{1.0f, -1.0f});
        }

        SUBCASE("stage bypass is the identity for that stage") {
            CHECK(chain.set_effect_bypass(0, true));
            CHECK(chain.is_effect_bypassed(0) == true);
            CHECK(chain.process(1.0f, -1.0f) == stereo_frame{2.0f, 0.0f});
        }

        SUBCASE("stage mute silences what reaches later stages") {
            CHECK(chain.set_effect_mute(0, true));
            CHECK(chain.is_effect_muted(0) == true);
            CHECK(chain.process(1.0f, -1.0f) == stereo_frame{1.0f, 1.0f});

            chain.set_effect_mute(1, true);
            CHECK(chain.process(1.0f, -1.0f) == stereo_frame{0.0f, 0.0f});
        }

        SUBCASE("parameters reach the processor") {
            CHECK(chain.set_param(0, "gain", 3.0f));
            CHECK(chain.effect_param(0, "gain") == 3.0f);
            CHECK(chain.process(1.0f, 1.0f).left == 4.0f);
        }

        SUBCASE("unknown parameter names are ignored") {
            CHECK(chain.set_param(0, "nonexistent", 5.0f));
            CHECK_FALSE(chain.effect_param(0, "nonexistent").has_value());
            CHECK(chain.process(1.0f, -1.0f).left == 3.0f);
        }
    }

    TEST_CASE("index errors are reported, not thrown") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {});

        CHECK_FALSE(chain.set_param(5, "gain", 1.0f));
        CHECK_FALSE(chain.set_effect_bypass(5, true));
        CHECK_FALSE(chain.set_effect_mute(5, true));
        CHECK_FALSE(chain.is_effect_bypassed(5).has_value());
        CHECK_FALSE(chain.is_effect_muted(5).has_value());
        CHECK_FALSE(chain.effect_latency(5).has_value());
        CHECK_FALSE(chain.effect_name(5).has_value());
        CHECK_FALSE(chain.effect_id_at(5).has_value());
        CHECK_FALSE(chain.effect_param(5, "gain").has_value());
        CHECK(chain.effect_controls_at(5) == nullptr);
        CHECK_FALSE(chain.stage_input_levels(5).has_value());
        CHECK_FALSE(chain.effect_metrics(5).has_value());
        CHECK_FALSE(chain.effect_cpu_usage(5).has_value());
        CHECK_FALSE(chain.remove_effect(5));
        CHECK(chain.take_effect(5) == nullptr);
        CHECK(chain.size() == 1);
    }

    TEST_CASE("adding an unknown effect leaves the chain unchanged") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {{"gain", 2.0f}});

        CHECK_THROWS_AS(chain.add_effect("nonexistent_effect", {}), processor_not_found_error);
        CHECK_THROWS_AS(chain.add_effect("broken", {}), processor_not_found_error);
        CHECK(chain.size() == 1);
        CHECK(chain.process(1.0f, 1.0f).left == 2.0f);

        effect_chain unbound;
        CHECK_THROWS_AS(unbound.add_effect("scale", {}), processor_not_found_error);
    }

    TEST_CASE("removal and lookup by id") {
        effect_chain chain = make_chain();
        const auto a = effect_id::generate();
        const auto b = effect_id::generate();
        chain.add_effect_with_id(a, "scale", {{"gain", 2.0f}});
        chain.add_effect_with_id(b, "offset", {{"offset", 1.0f}});
        chain.add_effect("scale", {});

        CHECK(chain.find_effect_index(b) == 1u);
        CHECK(chain.effect_id_at(0) == a);
        CHECK_FALSE(chain.effect_id_at(2).has_value());
        CHECK(chain.effect_name(1) == "offset");

        CHECK(chain.set_param_by_id(b, "offset", 3.0f));
        CHECK(chain.effect_param(1, "offset") == 3.0f);
        CHECK_FALSE(chain.set_param_by_id(effect_id::generate(), "offset", 3.0f));

        CHECK(chain.remove_effect_by_id(a));
        CHECK_FALSE(chain.remove_effect_by_id(a));
        CHECK(chain.find_effect_index(b) == 0u);
        CHECK(chain.size() == 2);
    }

    TEST_CASE("move_effect reorders stages") {
        effect_chain chain = make_chain();
        const auto scale = effect_id::generate();
        const auto offset = effect_id::generate();
        const auto tail = effect_id::generate();
        chain.add_effect_with_id(scale, "scale", {{"gain", 2.0f}});
        chain.add_effect_with_id(offset, "offset", {{"offset", 1.0f}});
        chain.add_effect_with_id(tail, "scale", {{"gain", 1.0f}});

        CHECK(chain.process(1.0f, 1.0f).left == 3.0f);

        // offset first: (1 + 1) * 2
        CHECK(chain.move_effect(offset, 0));
        CHECK(chain.find_effect_index(offset) == 0u);
        CHECK(chain.find_effect_index(scale) == 1u);
        CHECK(chain.process(1.0f, 1.0f).left == 4.0f);

        CHECK(chain.move_effect(offset, 2));
        CHECK(chain.find_effect_index(offset) == 2u);
        CHECK(chain.find_effect_index(scale) == 0u);
        CHECK(chain.find_effect_index(tail) == 1u);

        CHECK(chain.move_effect(offset, 2));
        CHECK_FALSE(chain.move_effect(offset, 3));
        CHECK_FALSE(chain.move_effect(effect_id::generate(), 0));
    }

    TEST_CASE("with_effect chains additions") {
        effect_chain chain = make_chain();
        chain.with_effect("scale", {{"gain", 2.0f}})
             .with_effect("offset", {{"offset", 1.0f}})
             .with_effect("slow_offset");
        CHECK(chain.size() == 3);
        CHECK(chain.effect_name(2) == "slow_offset");
        CHECK(chain.process(1.0f, 1.0f).left == 3.0f);

        CHECK_THROWS_AS(chain.with_effect("nope"), processor_not_found_error);
        CHECK(chain.size() == 3);
    }

    TEST_CASE("insert and take keep stages intact") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {{"gain", 2.0f}});

        auto built = chain.make_effect("offset", {{"offset", 1.0f}});
        REQUIRE(built);
        CHECK(chain.size() == 1);
        CHECK(chain.insert_effect(std::move(built), 0) == 0);
        CHECK(chain.effect_name(0) == "offset");

        auto taken = chain.take_effect(0);
        REQUIRE(taken);
        CHECK(taken->name == "offset");
        CHECK(chain.insert_effect(std::move(taken), 99) == 1);
        CHECK(chain.effect_name(1) == "offset");

        chain.clear();
        CHECK(chain.empty());
    }

    TEST_CASE("spare storage grows the chain without moving stages") {
        effect_chain chain = make_chain();
        CHECK(chain.spare_storage().capacity() == 0);

        for (std::size_t i = 0; i < effect_chain::DEFAULT_CAPACITY; ++i) {
            chain.add_effect("offset", {{"offset", 0.0f}});
        }
        chain.set_param(0, "offset", 1.0f);
        const auto* first = chain.effect_controls_at(0);

        auto storage = chain.spare_storage();
        CHECK(storage.capacity() > effect_chain::DEFAULT_CAPACITY);
        chain.adopt_storage(storage);
        CHECK(storage.empty());
        CHECK(chain.size() == effect_chain::DEFAULT_CAPACITY);
        CHECK(chain.effect_controls_at(0) == first);

        // the stage after the last one fits without reallocating
        CHECK(chain.spare_storage().capacity() == 0);
        CHECK(chain.add_effect("scale", {{"gain", 2.0f}}) == effect_chain::DEFAULT_CAPACITY);
        CHECK(chain.process(0.0f, 0.0f).left == 2.0f);

        SUBCASE("smaller storage is ignored") {
            std::vector<std::unique_ptr<effect_instance>> small;
            small.reserve(4);
            chain.adopt_storage(small);
            CHECK(chain.size() == effect_chain::DEFAULT_CAPACITY + 1);
            CHECK(small.empty());
        }
    }

    TEST_CASE("sidechain frames reach capable stages only") {
        effect_chain chain = make_chain();
        chain.add_effect("key", {});
        chain.add_effect("scale", {{"gain", 2.0f}});

        auto keyed = chain.process_with_sidechain(1.0f, 1.0f, stereo_frame{0.25f, 0.5f});
        CHECK(keyed.left == 0.5f);
        CHECK(keyed.right == 1.0f);

        // without a key the plain processor runs
        auto plain = chain.process_with_sidechain(1.0f, 1.0f, std::nullopt);
        CHECK(plain.left == 2.0f);
        CHECK(chain.process(1.0f, 1.0f).left == 2.0f);

        SUBCASE("the keyed variant shares the stage controls") {
            CHECK(chain.set_param(0, "amount", 0.9f));
            CHECK(chain.effect_param(0, "amount") == doctest::Approx(0.9f));
        }
    }

    TEST_CASE("latency of non-bypassed stages adds up") {
        effect_chain chain = make_chain();
        chain.add_effect("slow_offset", {});
        chain.add_effect("scale", {});
        chain.add_effect("slow_offset", {});

        CHECK(chain.effect_latency(0) == 64u);
        CHECK(chain.effect_latency(1) == 0u);
        CHECK(chain.total_latency() == 128);

        chain.set_effect_bypass(2, true);
        CHECK(chain.total_latency() == 64);
    }

    TEST_CASE("sample rate propagates to stages") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {});
        chain.set_sample_rate(96000.0);
        CHECK(chain.sample_rate() == 96000.0);

        chain.set_sample_rate(-1.0);
        CHECK(chain.sample_rate() == 96000.0);

        auto taken = chain.take_effect(0);
        auto* proc = dynamic_cast<scale_processor*>(taken->processor.get());
        REQUIRE(proc != nullptr);
        CHECK(proc->last_sample_rate == 96000.0);
        CHECK(taken->meter.sample_rate() == 96000.0);
    }

    TEST_CASE("stage levels are published per window") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {{"gain", 0.5f}});

        for (std::size_t i = 0; i + 1 < level_window::DEFAULT_CAPACITY; ++i) {
            chain.process(1.0f, 1.0f);
        }
        CHECK(chain.stage_output_levels(0)->peak_left == 0.0f);

        chain.process(1.0f, 1.0f);
        const auto in = chain.stage_input_levels(0);
        const auto out = chain.stage_output_levels(0);
        REQUIRE(in);
        REQUIRE(out);
        CHECK(in->rms_left == doctest::Approx(1.0f));
        CHECK(out->rms_left == doctest::Approx(0.5f));
        CHECK(out->peak_right == 0.5f);

        const auto levels = chain.effect_levels();
        REQUIRE(levels.size() == 1);
        CHECK(levels.count("scale_0") == 1);
    }

    TEST_CASE("cpu metering") {
        effect_chain chain = make_chain();
        const auto id = effect_id::generate();
        chain.add_effect_with_id(id, "scale", {});
        chain.add_effect("offset", {});

        for (int i = 0; i < 256; ++i) {
            chain.process(0.1f, 0.1f);
        }

        const auto metrics = chain.effect_metrics(0);
        REQUIRE(metrics);
        CHECK(metrics->samples_processed == 256);
        CHECK(chain.effect_cpu_usage(0).value() >= 0.0);
        CHECK(chain.effect_cpu_percent(0).value() == doctest::Approx(chain.effect_cpu_usage(0).value() * 100.0));
        CHECK(chain.total_cpu_percent() == doctest::Approx(chain.total_cpu_usage() * 100.0));

        const auto report = chain.cpu_report();
        REQUIRE(report.size() == 2);
        CHECK(report[0].name == "scale");
        CHECK(report[1].name == "offset");

        SUBCASE("bypassed stages are not timed") {
            chain.reset_cpu_meters();
            chain.set_effect_bypass(0, true);
            chain.process(0.1f, 0.1f);
            CHECK(chain.effect_metrics(0)->samples_processed == 0);
            CHECK(chain.effect_metrics(1)->samples_processed == 1);
        }

        SUBCASE("levels are keyed by id when present") {
            const auto levels = chain.effect_levels();
            CHECK(levels.count(id.to_string()) == 1);
            CHECK(levels.count("offset_1") == 1);
        }
    }

    TEST_CASE("state round trip") {
        effect_chain chain = make_chain();
        const auto id = effect_id::generate();
        chain.add_effect_with_id(id, "scale", {{"gain", 2.0f}});
        chain.add_effect("offset", {{"offset", 0.5f}});
        chain.set_effect_mute(1, true);
        chain.set_param(0, "gain", 3.0f);
        chain.set_bypass(true);

        const auto state = chain.to_state();
        CHECK(state.sample_rate == 48000.0);
        CHECK(state.bypassed);
        REQUIRE(state.effects.size() == 2);
        CHECK(state.effects[0].id == id);
        CHECK(state.effects[0].param("gain") == 3.0f);
        CHECK(state.effects[1].muted);

        effect_chain copy(make_test_effect_registry(), 44100.0);
        copy.from_json(chain.to_json());
        CHECK(copy.size() == 2);
        CHECK(copy.is_bypassed());
        CHECK(copy.sample_rate() == 48000.0);
        CHECK(copy.to_state().sample_rate == 48000.0);
        CHECK(copy.find_effect_index(id) == 0u);
        CHECK(copy.effect_param(0, "gain") == 3.0f);
        CHECK(copy.is_effect_muted(1) == true);

        copy.set_bypass(false);
        CHECK(copy.process(1.0f, 1.0f) == stereo_frame{0.0f, 0.0f});
    }

    TEST_CASE("restore adopts the snapshot sample rate") {
        effect_chain source(make_test_effect_registry(), 96000.0);
        source.add_effect("scale", {});

        effect_chain target(make_test_effect_registry(), 44100.0);
        target.from_state(source.to_state());
        CHECK(target.sample_rate() == 96000.0);

        auto taken = target.take_effect(0);
        REQUIRE(taken);
        auto* proc = dynamic_cast<scale_processor*>(taken->processor.get());
        REQUIRE(proc != nullptr);
        CHECK(proc->last_sample_rate == 96000.0);
        CHECK(taken->meter.sample_rate() == 96000.0);

        SUBCASE("a non-positive rate keeps the current one") {
            chain_state state(0.0);
            state.add_effect(effect_state("scale"));
            effect_chain other(make_test_effect_registry(), 22050.0);
            other.from_state(state);
            CHECK(other.sample_rate() == 22050.0);
        }
    }

    TEST_CASE("failed restore leaves the chain untouched") {
        effect_chain chain = make_chain();
        chain.add_effect("scale", {{"gain", 2.0f}});

        chain_state state;
        state.add_effect(effect_state("offset").with_param("offset", 1.0f));
        state.add_effect(effect_state("does_not_exist"));

        CHECK_THROWS_AS(chain.from_state(state), processor_not_found_error);
        CHECK(chain.size() == 1);
        CHECK(chain.effect_name(0) == "scale");
        CHECK(chain.process(1.0f, 1.0f).left == 2.0f);

        state.effects.pop_back();
        state.version = 2;
        CHECK_THROWS_AS(chain.from_state(state), serialization_error);
        CHECK_THROWS_AS(chain.from_json("{}"), serialization_error);
        CHECK(chain.size() == 1);
    }

    TEST_CASE("swap exchanges stages but not settings") {
        effect_chain a = make_chain();
        effect_chain b(make_test_effect_registry(), 44100.0);
        a.add_effect("scale", {});
        a.set_bypass(true);

        a.swap(b);
        CHECK(a.empty());
        CHECK_FALSE(a.is_bypassed());
        CHECK(b.size() == 1);
        CHECK(b.is_bypassed());
        CHECK(a.sample_rate() == 48000.0);
        CHECK(b.sample_rate() == 44100.0);
    }
}
