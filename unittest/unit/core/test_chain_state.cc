#include <doctest/doctest.h>
#include <mixrack/chain_state.hh>
#include <mixrack/error.hh>

using namespace mixrack;

TEST_SUITE("Core::ChainState") {
    TEST_CASE("builders") {
        auto es = effect_state("lowpass")
                      .with_param("cutoff", 800.0f)
                      .with_bypass(true)
                      .with_mute(true);
        CHECK(es.name == "lowpass");
        CHECK(es.param("cutoff") == 800.0f);
        CHECK_FALSE(es.param("res").has_value());
        CHECK(es.bypassed);
        CHECK(es.muted);
        CHECK_FALSE(es.id.has_value());

        chain_state state(44100.0);
        CHECK(state.version == chain_state::CURRENT_VERSION);
        state.add_effect(es);
        CHECK(state.effects.size() == 1);
    }

    TEST_CASE("JSON round trip keeps ids, flags and parameters") {
        const auto id = effect_id::generate();
        chain_state state(44100.0);
        state.bypassed = true;
        state.add_effect(effect_state("gain", id).with_param("gain", 0.5f).with_mute(true));
        state.add_effect(effect_state("delay").with_param("time", 0.125f).with_param("mix", 0.25f));

        const auto restored = chain_state::from_json(state.to_json());
        CHECK(restored.version == 1);
        CHECK(restored.sample_rate == 44100.0);
        CHECK(restored.bypassed);
        REQUIRE(restored.effects.size() == 2);

        CHECK(restored.effects[0].id == id);
        CHECK(restored.effects[0].name == "gain");
        CHECK(restored.effects[0].param("gain") == 0.5f);
        CHECK(restored.effects[0].muted);
        CHECK_FALSE(restored.effects[0].bypassed);

        CHECK_FALSE(restored.effects[1].id.has_value());
        CHECK(restored.effects[1].parameters.size() == 2);
        CHECK(restored.effects[1].param("time") == 0.125f);
    }

    TEST_CASE("optional fields take their defaults") {
        const auto state = chain_state::from_json(R"({
            "sample_rate": 48000,
            "effects": [ { "name": "gain", "parameters": {} } ]
        })");
        CHECK(state.version == 1);
        CHECK_FALSE(state.bypassed);
        REQUIRE(state.effects.size() == 1);
        CHECK_FALSE(state.effects[0].bypassed);
        CHECK_FALSE(state.effects[0].muted);
        CHECK(state.effects[0].parameters.empty());
    }

    TEST_CASE("invalid documents throw serialization_error") {
        SUBCASE("malformed text") {
            CHECK_THROWS_AS(chain_state::from_json("{ not json"), serialization_error);
        }
        SUBCASE("missing sample rate") {
            CHECK_THROWS_AS(chain_state::from_json(R"({"effects": []})"), serialization_error);
        }
        SUBCASE("missing effects") {
            CHECK_THROWS_AS(chain_state::from_json(R"({"sample_rate": 48000})"), serialization_error);
        }
        SUBCASE("effect without parameters") {
            CHECK_THROWS_AS(chain_state::from_json(
                                R"({"sample_rate": 48000, "effects": [{"name": "gain"}]})"),
                            serialization_error);
        }
        SUBCASE("wrong field type") {
            CHECK_THROWS_AS(chain_state::from_json(R"({"sample_rate": "fast", "effects": []})"),
                            serialization_error);
        }
        SUBCASE("bad id") {
            CHECK_THROWS_AS(chain_state::from_json(
                                R"({"sample_rate": 48000, "effects": [{"id": "xyz", "name": "gain", "parameters": {}}]})"),
                            serialization_error);
        }
        SUBCASE("newer version") {
            CHECK_THROWS_AS(chain_state::from_json(R"({"version": 2, "sample_rate": 48000, "effects": []})"),
                            serialization_error);
        }
    }
}
