#include <doctest/doctest.h>
#include "../../mock_components.hh"
#include <mixrack/error.hh>
#include <mixrack/sdk/effect_registry.hh>
#include <mixrack/sdk/synth_registry.hh>
#include <algorithm>

using namespace mixrack;
using namespace mixrack::test;

TEST_SUITE("SDK::EffectRegistry") {
    TEST_CASE("build fills in metadata defaults") {
        auto registry = make_test_effect_registry();

        auto parts = registry->build("scale", {});
        REQUIRE(parts.processor != nullptr);
        CHECK(parts.controls.get("gain") == 1.0f);

        auto custom = registry->build("scale", {{"gain", 3.0f}});
        CHECK(custom.controls.get("gain") == 3.0f);
        auto out = custom.processor->process(1.0f, -2.0f);
        CHECK(out.left == 3.0f);
        CHECK(out.right == -6.0f);
    }

    TEST_CASE("unknown names throw processor_not_found_error") {
        auto registry = make_test_effect_registry();
        try {
            (void)registry->build("no_such_effect", {});
            FAIL("expected processor_not_found_error");
        } catch (const processor_not_found_error& e) {
            CHECK(e.name() == "no_such_effect");
        }

        CHECK_THROWS_AS((void)registry->build("broken", {}), processor_not_found_error);
        CHECK_FALSE(registry->metadata("no_such_effect").has_value());
        CHECK(registry->get("no_such_effect") == nullptr);
    }

    TEST_CASE("listing and categories") {
        auto registry = make_test_effect_registry();
        CHECK(registry->size() == 5);
        CHECK(registry->contains("key"));

        auto names = registry->names();
        CHECK(std::is_sorted(names.begin(), names.end()));

        auto dynamics = registry->list_by_category(effect_category::dynamics);
        REQUIRE(dynamics.size() == 1);
        CHECK(dynamics[0].name == "key");
        CHECK(dynamics[0].has_tag(SIDECHAIN_TAG));

        registry->register_effect("null", nullptr);
        CHECK_FALSE(registry->contains("null"));

        registry->clear();
        CHECK(registry->size() == 0);
    }

    TEST_CASE("sidechain variants are only built for capable effects") {
        auto registry = make_test_effect_registry();
        auto parts = registry->build("key", {});
        CHECK(registry->build_sidechain("key", {}, 48000.0, parts.controls) != nullptr);
        CHECK(registry->build_sidechain("scale", {}, 48000.0, parts.controls) == nullptr);
        CHECK(registry->build_sidechain("missing", {}, 48000.0, parts.controls) == nullptr);
    }

    TEST_CASE("effect_controls") {
        effect_controls controls;
        auto p = make_param(2.0f);
        controls.add("x", p);

        CHECK(controls.set("x", 4.0f));
        CHECK(p->value() == 4.0f);
        CHECK_FALSE(controls.set("y", 1.0f));
        CHECK_FALSE(controls.get("y").has_value());
        CHECK(controls.find("x") == p);
        CHECK(controls.find("y") == nullptr);

        auto values = controls.values();
        CHECK(values.size() == 1);
        CHECK(values["x"] == 4.0f);
    }

    TEST_CASE("metadata lookup") {
        auto meta = effect_metadata("m", "d", effect_category::filter)
                        .with_param("a", 0.5f, 0.0f, 1.0f)
                        .with_tag("t")
                        .with_tag("t");
        CHECK(meta.tags.size() == 1);
        REQUIRE(meta.find_param("a") != nullptr);
        CHECK(meta.find_param("a")->default_value == 0.5f);
        CHECK(meta.find_param("b") == nullptr);
    }
}

TEST_SUITE("SDK::SynthRegistry") {
    TEST_CASE("build merges defaults with the given parameters") {
        auto builder = std::make_shared<constant_synth_builder>();
        synth_registry registry;
        registry.register_synth("constant", builder);

        auto parts = registry.build("constant", 440.0f, {{"detune", 0.1f}});
        REQUIRE(parts.generator != nullptr);
        CHECK(builder->last_freq == 440.0f);
        CHECK(builder->last_params.at("amp") == 1.0f);
        CHECK(builder->last_params.at("detune") == doctest::Approx(0.1f));
        CHECK(builder->live->load() == 1);

        parts.generator.reset();
        CHECK(builder->live->load() == 0);
    }

    TEST_CASE("unknown synth throws") {
        synth_registry registry;
        CHECK_THROWS_AS((void)registry.build("sine", 440.0f, {}), processor_not_found_error);
        CHECK_FALSE(registry.contains("sine"));
        CHECK(registry.size() == 0);
    }

    TEST_CASE("voice_controls::make allocates the mandatory cells") {
        auto controls = voice_controls::make(0.5f);
        REQUIRE(controls.amp);
        REQUIRE(controls.pitch_bend);
        REQUIRE(controls.pressure);
        CHECK(controls.amp->value() == 0.5f);
        CHECK(controls.pitch_bend->value() == 1.0f);
        CHECK(controls.pressure->value() == 0.0f);
        CHECK_FALSE(controls.cutoff);
        CHECK_FALSE(controls.resonance);
    }
}
