#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sift {

static const char* kDefaultDirective =
    "You are a meticulous and self-critical fact-checking and contextualization "
    "assistant following the SIFT method (Stop, Investigate the source, Find better "
    "coverage, Trace claims to their origin). Analyze the claims, images or artifacts "
    "you are given, identify errors, provide corrections and assess source "
    "reliability. Structure every report in Markdown. Today is {{date}}.";

static const char* kChatDirective =
    "You are a meticulous and self-critical fact-checking assistant adhering to the "
    "SIFT method. You are in a chat session: keep the conversational context, answer "
    "follow-up questions and commands such as 'another round' or 'read the room', and "
    "render every table in pure Markdown. Today is {{date}}.";

nlohmann::json Config::defaults_json() {
    return {
        {"providers", {
            {"openai", {{"api_key", ""}, {"base_url", ""}}},
            {"openrouter", {{"api_key", ""}}},
            {"anthropic", {{"api_key", ""}}},
            {"compatible", {{"api_key", ""}, {"base_url", ""}}}
        }},
        {"server", {
            {"listen", "127.0.0.1:4567"},
            {"max_body", 16 * 1024 * 1024},
            {"handle_ttl", 300}
        }},
        {"client", {
            {"server_url", "http://127.0.0.1:4567"},
            {"default_model", "gpt-4o"},
            {"default_report_type", "full_check"}
        }},
        {"store", {
            {"backend", "sqlite"},
            {"path", ""}
        }},
        {"models", nlohmann::json::array()},
        {"prompts", {
            {"system_directive", kDefaultDirective},
            {"chat_directive", kChatDirective},
            {"templates", {
                {"full_check",
                 "Perform a full SIFT check on the following input: {{user_input}}"},
                {"context_report",
                 "Write a context report for the following claim or artifact, covering "
                 "its origin, the surrounding coverage and what a reader should know: "
                 "{{user_input}}"},
                {"community_note",
                 "Draft a short, neutral community note with sources for the following "
                 "post: {{user_input}}"}
            }}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::load() {
    std::string config_path = expand_home("~/.sift/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

static bool is_count(const nlohmann::json& v) {
    return v.is_number_integer() && v.get<int64_t>() >= 0;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            if (obj.contains("api_key") && obj["api_key"].is_string())
                entry.api_key = obj["api_key"].get<std::string>();
            if (obj.contains("base_url") && obj["base_url"].is_string())
                entry.base_url = obj["base_url"].get<std::string>();
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("listen") && s["listen"].is_string())
            cfg.server.listen = s["listen"].get<std::string>();
        if (s.contains("max_body") && is_count(s["max_body"]))
            cfg.server.max_body = s["max_body"].get<uint32_t>();
        if (s.contains("handle_ttl") && is_count(s["handle_ttl"]))
            cfg.server.handle_ttl = s["handle_ttl"].get<uint32_t>();
    }

    if (j.contains("client") && j["client"].is_object()) {
        auto& c = j["client"];
        if (c.contains("server_url") && c["server_url"].is_string())
            cfg.client.server_url = c["server_url"].get<std::string>();
        if (c.contains("default_model") && c["default_model"].is_string())
            cfg.client.default_model = c["default_model"].get<std::string>();
        if (c.contains("default_report_type") && c["default_report_type"].is_string())
            cfg.client.default_report_type = c["default_report_type"].get<std::string>();
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& st = j["store"];
        if (st.contains("backend") && st["backend"].is_string())
            cfg.store.backend = st["backend"].get<std::string>();
        if (st.contains("path") && st["path"].is_string())
            cfg.store.path = st["path"].get<std::string>();
    }

    if (j.contains("models") && j["models"].is_array())
        cfg.models = j["models"];

    if (j.contains("prompts") && j["prompts"].is_object()) {
        auto& p = j["prompts"];
        if (p.contains("system_directive") && p["system_directive"].is_string())
            cfg.prompts.system_directive = p["system_directive"].get<std::string>();
        if (p.contains("chat_directive") && p["chat_directive"].is_string())
            cfg.prompts.chat_directive = p["chat_directive"].get<std::string>();
        if (p.contains("templates") && p["templates"].is_object()) {
            for (auto& [type, tmpl] : p["templates"].items()) {
                if (tmpl.is_string())
                    cfg.prompts.templates[type] = tmpl.get<std::string>();
            }
        }
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        providers["openai"].api_key = v;
    if (const char* v = std::getenv("OPENROUTER_API_KEY"))
        providers["openrouter"].api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("OPENAI_BASE_URL"))
        providers["openai"].base_url = v;
    if (const char* v = std::getenv("SIFT_LISTEN"))
        server.listen = v;
    if (const char* v = std::getenv("SIFT_SERVER_URL"))
        client.server_url = v;
    if (const char* v = std::getenv("SIFT_DB_PATH"))
        store.path = v;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace sift
