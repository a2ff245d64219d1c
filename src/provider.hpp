#pragma once
#include "cancel_token.hpp"
#include "query.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <functional>

namespace sift {

struct ProviderEntry;
struct Config;
class HttpClient;

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// Accepts "user", "assistant"/"ai"/"model" and "system". Returns nullopt otherwise.
std::optional<Role> role_from_string(const std::string& name);

struct PromptMessage {
    Role role;
    std::string content;
};

struct GenerationRequest {
    std::string model;
    std::string system_prompt;
    std::vector<PromptMessage> messages;  // oldest first; last is the new user turn
    std::optional<ImageRef> image;        // attached to the last user message
    nlohmann::json params = nlohmann::json::object();
    const CancelToken* cancel = nullptr;
};

struct GenerationResult {
    std::string text;   // everything delivered through the callback
    std::string model;  // model reported by the provider
    bool aborted = false;
};

// Callback for streaming text deltas. Return false to abort.
using TextDeltaCallback = std::function<bool(const std::string& delta)>;

// A streaming text source. Implementations throw std::runtime_error on
// HTTP or protocol failure; an abort requested by the callback or the cancel
// token returns normally with `aborted` set.
class Provider {
public:
    virtual ~Provider() = default;

    virtual GenerationResult stream(const GenerationRequest& request,
                                    const TextDeltaCallback& on_delta) = 0;

    virtual std::string provider_name() const = 0;
};

// Factory: create provider by registered name
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const ProviderEntry& entry,
                                          HttpClient& http);

// True if the provider has what it needs to make a call (an API key, or a
// base URL for the OpenAI-compatible provider).
bool provider_configured(const Config& config, const std::string& name);

} // namespace sift
