#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <cstdlib>
#include <nlohmann/json.hpp>

using namespace sift;
using json = nlohmann::json;

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: defaults parse into usable values", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.server.listen == "127.0.0.1:4567");
    REQUIRE(cfg.server.handle_ttl == 300);
    REQUIRE(cfg.client.server_url == "http://127.0.0.1:4567");
    REQUIRE(cfg.client.default_model == "gpt-4o");
    REQUIRE(cfg.store.backend == "sqlite");
    REQUIRE(cfg.api_key_for("openai").empty());
    REQUIRE(cfg.prompts.templates.size() == 3);
    REQUIRE(cfg.prompts.templates.count("full_check") == 1);
    REQUIRE(cfg.prompts.system_directive.find("{{date}}") != std::string::npos);
    REQUIRE_FALSE(cfg.prompts.chat_directive.empty());
}

TEST_CASE("Config: unknown provider has no key or base url", "[config]") {
    Config cfg;
    REQUIRE(cfg.api_key_for("nope").empty());
    REQUIRE(cfg.base_url_for("nope").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    json j = {
        {"providers", {{"openai", {{"api_key", "sk-1"}, {"base_url", "http://local/v1"}}}}},
        {"server", {{"listen", "0.0.0.0:9000"}, {"max_body", 1024}, {"handle_ttl", 5}}},
        {"client", {{"server_url", "http://remote:9000"}, {"default_model", "m"},
                    {"default_report_type", "community_note"}}},
        {"store", {{"backend", "none"}, {"path", "/tmp/x.db"}}},
        {"models", json::array({{{"id", "local"}, {"provider", "compatible"}}})},
        {"prompts", {{"system_directive", "S"}, {"templates", {{"custom", "C {{user_input}}"}}}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.api_key_for("openai") == "sk-1");
    REQUIRE(cfg.base_url_for("openai") == "http://local/v1");
    REQUIRE(cfg.server.listen == "0.0.0.0:9000");
    REQUIRE(cfg.server.max_body == 1024);
    REQUIRE(cfg.server.handle_ttl == 5);
    REQUIRE(cfg.client.server_url == "http://remote:9000");
    REQUIRE(cfg.client.default_report_type == "community_note");
    REQUIRE(cfg.store.backend == "none");
    REQUIRE(cfg.store.path == "/tmp/x.db");
    REQUIRE(cfg.models.size() == 1);
    REQUIRE(cfg.prompts.system_directive == "S");
    REQUIRE(cfg.prompts.templates.at("custom") == "C {{user_input}}");
}

TEST_CASE("Config::from_json: wrong types are ignored", "[config]") {
    json j = {
        {"server", {{"listen", 42}, {"handle_ttl", "soon"}}},
        {"providers", {{"openai", "not-an-object"}}},
        {"models", "nope"}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.listen == "127.0.0.1:4567");
    REQUIRE(cfg.server.handle_ttl == 300);
    REQUIRE(cfg.providers.count("openai") == 0);
    REQUIRE(cfg.models.empty());
}

// ── merge_defaults ───────────────────────────────────────────────

TEST_CASE("merge_defaults: fills missing keys without overwriting", "[config]") {
    json existing = {{"server", {{"listen", "0.0.0.0:1"}}}, {"extra", true}};
    json merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["server"]["listen"] == "0.0.0.0:1");
    REQUIRE(merged["server"]["handle_ttl"] == 300);
    REQUIRE(merged["extra"] == true);
    REQUIRE(merged.contains("prompts"));
}

TEST_CASE("merge_defaults: non-object values are kept as is", "[config]") {
    json existing = {{"models", json::array({1})}};
    json merged = merge_defaults(existing, Config::defaults_json());
    REQUIRE(merged["models"].size() == 1);
}

// ── Environment ──────────────────────────────────────────────────

TEST_CASE("Config::apply_env: environment overrides", "[config]") {
    setenv("OPENROUTER_API_KEY", "sk-or-env", 1);
    setenv("SIFT_LISTEN", "127.0.0.1:0", 1);
    setenv("SIFT_SERVER_URL", "http://env:1", 1);

    Config cfg = Config::from_json(Config::defaults_json());
    cfg.apply_env();
    REQUIRE(cfg.api_key_for("openrouter") == "sk-or-env");
    REQUIRE(cfg.server.listen == "127.0.0.1:0");
    REQUIRE(cfg.client.server_url == "http://env:1");

    unsetenv("OPENROUTER_API_KEY");
    unsetenv("SIFT_LISTEN");
    unsetenv("SIFT_SERVER_URL");
}
