#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config.hpp"
#include "model_catalog.hpp"
#include <nlohmann/json.hpp>

using namespace sift;
using json = nlohmann::json;

// ── Built-in catalog ─────────────────────────────────────────────

TEST_CASE("ModelCatalog: builtin models", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    const ModelInfo* gpt = catalog.find("gpt-4o");
    REQUIRE(gpt != nullptr);
    REQUIRE(gpt->provider == "openai");
    REQUIRE(gpt->supports_vision);

    const ModelInfo* deepseek = catalog.find("deepseek/deepseek-chat-v3-0324");
    REQUIRE(deepseek != nullptr);
    REQUIRE(deepseek->provider == "openrouter");
    REQUIRE_FALSE(deepseek->supports_vision);

    REQUIRE(catalog.find("nope") == nullptr);
}

TEST_CASE("ModelCatalog: available filters by provider, keeping order", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    auto openai = catalog.available([](const std::string& p) { return p == "openai"; });
    REQUIRE(openai.size() == 2);
    REQUIRE(openai[0].id == "gpt-4o");
    REQUIRE(openai[1].id == "gpt-4.1-mini");

    auto none = catalog.available([](const std::string&) { return false; });
    REQUIRE(none.empty());
}

// ── Config additions ─────────────────────────────────────────────

TEST_CASE("ModelCatalog::from_config: adds, replaces and skips entries", "[catalog]") {
    Config cfg;
    cfg.models = json::array({
        {{"id", "local-llama"}, {"provider", "compatible"}, {"name", "Llama"},
         {"parameters", json::array({{{"key", "temperature"}, {"min", 0.0}, {"max", 2.0},
                                      {"defaultValue", 0.2}}})}},
        {{"id", "gpt-4o"}, {"provider", "openai"}, {"supportsVision", false}},
        {{"name", "no id"}},
        "garbage"
    });
    auto catalog = ModelCatalog::from_config(cfg);

    const ModelInfo* local = catalog.find("local-llama");
    REQUIRE(local != nullptr);
    REQUIRE(local->name == "Llama");
    REQUIRE(local->parameters.size() == 1);
    REQUIRE(local->parameters[0].max == Catch::Approx(2.0));

    REQUIRE_FALSE(catalog.find("gpt-4o")->supports_vision);
    REQUIRE(catalog.models().size() == ModelCatalog::builtin().models().size() + 1);
}

TEST_CASE("model_from_json: requires id and provider", "[catalog]") {
    REQUIRE_THROWS_AS(model_from_json(json{{"id", "x"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(model_from_json(json::array()), std::invalid_argument);
    ModelInfo m = model_from_json(json{{"id", "x"}, {"provider", "openai"}});
    REQUIRE(m.name == "x");
}

TEST_CASE("model_to_json: camelCase wire shape", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    json j = model_to_json(*catalog.find("claude-sonnet-4-20250514"));
    REQUIRE(j["id"] == "claude-sonnet-4-20250514");
    REQUIRE(j["provider"] == "anthropic");
    REQUIRE(j["supportsVision"] == true);
    REQUIRE(j.contains("systemDirective"));
    REQUIRE(j["parameters"].size() == 2);
    REQUIRE(j["parameters"][1]["key"] == "max_tokens");
    REQUIRE(j["parameters"][1]["defaultValue"] == 4096);
}

// ── resolve_params ───────────────────────────────────────────────

TEST_CASE("resolve_params: fills defaults", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    json p = resolve_params(*catalog.find("gpt-4o"), json::object());
    REQUIRE(p["temperature"].get<double>() == Catch::Approx(0.7));
    REQUIRE(p["topP"].get<double>() == Catch::Approx(0.95));

    json from_null = resolve_params(*catalog.find("gpt-4o"), nullptr);
    REQUIRE(from_null == p);
}

TEST_CASE("resolve_params: clamps to the declared range", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    const ModelInfo& claude = *catalog.find("claude-sonnet-4-20250514");

    json p = resolve_params(claude, {{"temperature", -3.0}, {"max_tokens", 100000}});
    REQUIRE(p["temperature"].get<double>() == Catch::Approx(0.0));
    REQUIRE(p["max_tokens"].is_number_integer());
    REQUIRE(p["max_tokens"].get<long long>() == 8192);
}

TEST_CASE("resolve_params: undeclared keys and non-numbers pass through", "[catalog]") {
    auto catalog = ModelCatalog::builtin();
    json p = resolve_params(*catalog.find("gpt-4o"),
                            {{"seed", 7}, {"temperature", "hot"}});
    REQUIRE(p["seed"] == 7);
    REQUIRE(p["temperature"] == "hot");
}
