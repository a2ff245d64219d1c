#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace sift {

struct ProviderEntry {
    std::string api_key;
    std::string base_url; // empty = provider default
};

struct ServerConfig {
    std::string listen = "127.0.0.1:4567";
    uint32_t max_body = 16 * 1024 * 1024; // inline base64 images
    uint32_t handle_ttl = 300;            // seconds an unclaimed stream handle lives
};

struct ClientConfig {
    std::string server_url = "http://127.0.0.1:4567";
    std::string default_model = "gpt-4o";
    std::string default_report_type = "full_check";
};

struct StoreConfig {
    std::string backend = "sqlite";
    std::string path; // empty = ~/.sift/sift.db
};

struct PromptConfig {
    std::string system_directive;  // initial analysis
    std::string chat_directive;    // follow-up turns
    std::unordered_map<std::string, std::string> templates; // report type -> template
};

struct Config {
    std::unordered_map<std::string, ProviderEntry> providers;
    ServerConfig server;
    ClientConfig client;
    StoreConfig store;
    PromptConfig prompts;
    nlohmann::json models = nlohmann::json::array(); // catalog additions/overrides

    // Load from ~/.sift/config.json + env vars
    static Config load();

    // Parse an already-merged JSON document (no file or env access)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides
    void apply_env();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;
};

// Fill keys missing from existing with values from defaults, recursively.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace sift
