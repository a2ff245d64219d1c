#pragma once
#include "model_catalog.hpp"
#include "prompt.hpp"
#include "provider.hpp"
#include "query.hpp"
#include "stream_relay.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sift {

struct Config;
class HttpClient;
class SessionStore;

// Body of POST /api/sift/chat.
struct ChatRequest {
    std::string message;
    std::vector<PromptMessage> history;
    std::string model_id;
    nlohmann::json params = nlohmann::json::object();
    std::string analysis_id;      // empty = session-less chat
    std::string system_override;  // replaces the chat directive when non-empty
};

// Throws ValidationError on missing or mistyped fields.
ChatRequest chat_request_from_json(const nlohmann::json& body);
nlohmann::json chat_request_to_json(const ChatRequest& request);

// Where the gateway gets provider instances from.
class ProviderSource {
public:
    virtual ~ProviderSource() = default;
    virtual bool available(const std::string& provider) const = 0;
    // Throws if the provider cannot be created.
    virtual std::unique_ptr<Provider> create(const std::string& provider) = 0;
};

// Providers from the plugin registry, configured from Config.
class ConfiguredProviders : public ProviderSource {
public:
    ConfiguredProviders(const Config& config, HttpClient& http);

    bool available(const std::string& provider) const override;
    std::unique_ptr<Provider> create(const std::string& provider) override;

private:
    const Config& config_;
    HttpClient& http_;
};

// An analysis accepted by initiate() and waiting for its stream subscription.
struct PendingAnalysis {
    std::string session_id;
    std::string analysis_id;  // empty when the store does not persist
    AnalysisQuery query;
};

// One-time stream handles. A handle is removed when claimed or when its TTL
// elapses, so it can never be claimed twice. Thread-safe.
class HandleRegistry {
public:
    explicit HandleRegistry(std::chrono::seconds ttl);

    std::string issue(PendingAnalysis pending);

    // nullopt for unknown, expired or already-claimed handles.
    std::optional<PendingAnalysis> claim(const std::string& handle);

    // Drop expired handles; returns how many were removed.
    size_t evict_expired();

    size_t size() const;

private:
    using Clock = std::chrono::steady_clock;
    struct Entry {
        PendingAnalysis pending;
        Clock::time_point expires_at;
    };

    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

struct InitiateResult {
    std::string handle;
    std::string session_id;
    std::string analysis_id;
};

// A validated stream ready to be relayed.
struct PreparedStream {
    std::unique_ptr<Provider> provider;
    GenerationRequest request;
    RelayOptions options;
    std::string session_id;
};

// Validates requests, records sessions and binds each one to exactly one
// relay invocation.
class AnalysisGateway {
public:
    AnalysisGateway(const ModelCatalog& catalog, const PromptSet& prompts,
                    SessionStore& store, ProviderSource& providers,
                    std::chrono::seconds handle_ttl = std::chrono::seconds(300));

    // Throws ValidationError or GatewayError; nothing is recorded on failure.
    InitiateResult initiate(const AnalysisQuery& query);

    // Claim a handle. Throws GatewayError (type "NotFound") if the handle is
    // unknown, expired or already claimed.
    PreparedStream claim(const std::string& handle);

    // Validate a chat request. Throws ValidationError or GatewayError.
    PreparedStream prepare_chat(const ChatRequest& request);

    // Relay a prepared stream to the sink.
    RelayResult run(PreparedStream& stream, FrameSink& sink);

    RelayResult open_stream(const std::string& handle, FrameSink& sink);
    RelayResult chat(const ChatRequest& request, FrameSink& sink);

    HandleRegistry& handles() { return handles_; }

private:
    const ModelInfo& require_model(const std::string& model_id) const;
    std::unique_ptr<Provider> require_provider(const ModelInfo& model);

    const ModelCatalog& catalog_;
    const PromptSet& prompts_;
    SessionStore& store_;
    ProviderSource& providers_;
    HandleRegistry handles_;
};

} // namespace sift
