#include "gateway.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "store/session_store.hpp"
#include "util.hpp"
#include <iostream>

using json = nlohmann::json;

namespace sift {

// ── Chat request wire format ────────────────────────────────────

static std::string string_field(const json& body, const char* key, bool required) {
    if (!body.contains(key) || body[key].is_null()) {
        if (required) throw ValidationError(std::string(key) + " is required");
        return "";
    }
    if (!body[key].is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return body[key].get<std::string>();
}

ChatRequest chat_request_from_json(const json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
    ChatRequest req;
    req.message = string_field(body, "newUserMessageText", true);
    req.model_id = string_field(body, "selectedModelId", true);
    req.analysis_id = string_field(body, "analysisId", false);
    req.system_override = string_field(body, "systemInstructionOverride", false);

    if (body.contains("chatHistory") && !body["chatHistory"].is_null()) {
        const auto& history = body["chatHistory"];
        if (!history.is_array()) {
            throw ValidationError("chatHistory must be an array");
        }
        for (const auto& entry : history) {
            if (!entry.is_object() || !entry.contains("role") || !entry["role"].is_string() ||
                !entry.contains("content") || !entry["content"].is_string()) {
                throw ValidationError("chatHistory entries need string role and content");
            }
            auto role = role_from_string(entry["role"].get<std::string>());
            if (!role || *role == Role::System) {
                throw ValidationError("chatHistory role must be user or assistant");
            }
            req.history.push_back({*role, entry["content"].get<std::string>()});
        }
    }

    if (body.contains("modelConfigParams") && !body["modelConfigParams"].is_null()) {
        if (!body["modelConfigParams"].is_object()) {
            throw ValidationError("modelConfigParams must be an object");
        }
        req.params = body["modelConfigParams"];
    }
    return req;
}

json chat_request_to_json(const ChatRequest& request) {
    json history = json::array();
    for (const auto& msg : request.history) {
        history.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    json j = {
        {"newUserMessageText", request.message},
        {"chatHistory", history},
        {"selectedModelId", request.model_id},
        {"modelConfigParams", request.params.is_object() ? request.params : json::object()}
    };
    if (!request.analysis_id.empty()) j["analysisId"] = request.analysis_id;
    if (!request.system_override.empty()) j["systemInstructionOverride"] = request.system_override;
    return j;
}

// ── ConfiguredProviders ─────────────────────────────────────────

ConfiguredProviders::ConfiguredProviders(const Config& config, HttpClient& http)
    : config_(config), http_(http) {}

bool ConfiguredProviders::available(const std::string& provider) const {
    return provider_configured(config_, provider);
}

std::unique_ptr<Provider> ConfiguredProviders::create(const std::string& provider) {
    ProviderEntry entry;
    auto it = config_.providers.find(provider);
    if (it != config_.providers.end()) entry = it->second;
    return create_provider(provider, entry, http_);
}

// ── HandleRegistry ──────────────────────────────────────────────

HandleRegistry::HandleRegistry(std::chrono::seconds ttl) : ttl_(ttl) {}

std::string HandleRegistry::issue(PendingAnalysis pending) {
    std::string handle = generate_token();
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[handle] = Entry{std::move(pending), Clock::now() + ttl_};
    return handle;
}

std::optional<PendingAnalysis> HandleRegistry::claim(const std::string& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(handle);
    if (it == entries_.end()) return std::nullopt;

    Entry entry = std::move(it->second);
    entries_.erase(it);
    if (Clock::now() >= entry.expires_at) return std::nullopt;
    return std::move(entry.pending);
}

size_t HandleRegistry::evict_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expires_at) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t HandleRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ── AnalysisGateway ─────────────────────────────────────────────

AnalysisGateway::AnalysisGateway(const ModelCatalog& catalog, const PromptSet& prompts,
                                 SessionStore& store, ProviderSource& providers,
                                 std::chrono::seconds handle_ttl)
    : catalog_(catalog), prompts_(prompts), store_(store), providers_(providers),
      handles_(handle_ttl) {}

const ModelInfo& AnalysisGateway::require_model(const std::string& model_id) const {
    if (is_blank(model_id)) {
        throw ValidationError("selectedModelId is required");
    }
    const ModelInfo* model = catalog_.find(model_id);
    if (!model) {
        throw ValidationError("Unknown model: " + model_id);
    }
    return *model;
}

std::unique_ptr<Provider> AnalysisGateway::require_provider(const ModelInfo& model) {
    if (!providers_.available(model.provider)) {
        throw GatewayError("Provider " + model.provider + " is not configured for model " +
                           model.id);
    }
    try {
        return providers_.create(model.provider);
    } catch (const std::exception& e) {
        throw GatewayError("Provider " + model.provider + " unavailable: " + e.what());
    }
}

InitiateResult AnalysisGateway::initiate(const AnalysisQuery& query) {
    if (!query.has_content()) {
        throw ValidationError("Either text or an image is required");
    }
    if (is_blank(query.report_type)) {
        throw ValidationError("reportType is required");
    }
    if (!prompts_.has_report_type(query.report_type)) {
        throw ValidationError("Unknown report type: " + query.report_type);
    }
    const ModelInfo& model = require_model(query.model_id);
    if (query.image) {
        if (!model.supports_vision) {
            throw ValidationError("Model " + model.id + " does not accept images");
        }
        if (query.image->data.empty()) {
            throw ValidationError("userImage.data is required");
        }
    }
    if (!query.params.is_object()) {
        throw ValidationError("modelConfigParams must be an object");
    }
    if (!providers_.available(model.provider)) {
        throw GatewayError("Provider " + model.provider + " is not configured for model " +
                           model.id);
    }

    PendingAnalysis pending;
    try {
        pending.analysis_id = store_.create_analysis(query);
    } catch (const std::exception& e) {
        throw GatewayError(std::string("Could not record analysis: ") + e.what());
    }
    pending.session_id = pending.analysis_id.empty() ? generate_id() : pending.analysis_id;
    pending.query = query;

    handles_.evict_expired();

    InitiateResult result;
    result.session_id = pending.session_id;
    result.analysis_id = pending.analysis_id;
    result.handle = handles_.issue(std::move(pending));

    std::cerr << "[gateway] Initiated session " << result.session_id << " ("
              << query.report_type << ", " << model.id << ")\n";
    return result;
}

PreparedStream AnalysisGateway::claim(const std::string& handle) {
    auto pending = handles_.claim(handle);
    if (!pending) {
        throw GatewayError("Stream handle is unknown, expired or already used", "NotFound");
    }

    const AnalysisQuery& query = pending->query;
    const ModelInfo& model = require_model(query.model_id);

    PreparedStream stream;
    stream.session_id = pending->session_id;
    stream.provider = require_provider(model);

    stream.request.model = model.id;
    stream.request.system_prompt = prompts_.system_prompt(model.system_directive);
    stream.request.messages.push_back(
        {Role::User, prompts_.render_user_prompt(query.report_type, query.text)});
    stream.request.image = query.image;
    stream.request.params = resolve_params(model, query.params);

    stream.options.status.push_back("Analysis started with " + model.name);
    stream.options.analysis_id = pending->analysis_id;

    std::string analysis_id = pending->analysis_id;
    std::string user_text = query.text.empty() ? kImageOnlyInput : query.text;
    std::string model_id = model.id;
    SessionStore& store = store_;
    if (!analysis_id.empty()) {
        stream.options.on_finish = [&store, analysis_id, user_text, model_id](
                                       const RelayResult& r) {
            if (r.outcome == RelayOutcome::Completed) {
                store.update_report(analysis_id, r.text);
                store.save_message(analysis_id, "user", user_text, model_id);
                store.save_message(analysis_id, "assistant", r.text, model_id);
                store.update_status(analysis_id, analysis_status::Complete);
            } else if (r.outcome == RelayOutcome::Failed) {
                store.update_status(analysis_id, analysis_status::Errored);
            } else {
                store.update_status(analysis_id, analysis_status::Aborted);
            }
        };
    }
    return stream;
}

PreparedStream AnalysisGateway::prepare_chat(const ChatRequest& req) {
    if (is_blank(req.message)) {
        throw ValidationError("newUserMessageText must not be empty");
    }
    if (!req.params.is_object()) {
        throw ValidationError("modelConfigParams must be an object");
    }
    const ModelInfo& model = require_model(req.model_id);

    if (!req.analysis_id.empty()) {
        std::optional<AnalysisRecord> record;
        try {
            record = store_.find_analysis(req.analysis_id);
        } catch (const std::exception& e) {
            throw GatewayError(std::string("Could not look up analysis: ") + e.what());
        }
        if (!record) {
            throw ValidationError("Unknown analysis id: " + req.analysis_id);
        }
    }

    PreparedStream stream;
    stream.session_id = req.analysis_id.empty() ? generate_id() : req.analysis_id;
    stream.provider = require_provider(model);

    stream.request.model = model.id;
    stream.request.system_prompt = prompts_.chat_system_prompt(req.system_override);
    stream.request.messages = req.history;
    stream.request.messages.push_back({Role::User, req.message});
    stream.request.params = resolve_params(model, req.params);

    if (!req.analysis_id.empty()) {
        try {
            store_.save_message(req.analysis_id, "user", req.message, model.id);
        } catch (const std::exception& e) {
            std::cerr << "[gateway] Failed to persist chat message: " << e.what() << "\n";
        }
        std::string analysis_id = req.analysis_id;
        std::string model_id = model.id;
        SessionStore& store = store_;
        stream.options.on_finish = [&store, analysis_id, model_id](const RelayResult& r) {
            if (r.outcome == RelayOutcome::Completed && !r.text.empty()) {
                store.save_message(analysis_id, "assistant", r.text, model_id);
            }
        };
    }
    return stream;
}

RelayResult AnalysisGateway::run(PreparedStream& stream, FrameSink& sink) {
    const std::string& analysis_id = stream.options.analysis_id;
    if (!analysis_id.empty()) {
        try {
            store_.update_status(analysis_id, analysis_status::Streaming);
        } catch (const std::exception& e) {
            std::cerr << "[gateway] Failed to update status: " << e.what() << "\n";
        }
    }

    StreamRelay relay(*stream.provider, sink);
    RelayResult result = relay.run(stream.request, stream.options);
    std::cerr << "[gateway] Session " << stream.session_id << " "
              << relay_outcome_name(result.outcome) << " ("
              << result.frames_written << " frames)\n";
    return result;
}

RelayResult AnalysisGateway::open_stream(const std::string& handle, FrameSink& sink) {
    PreparedStream stream = claim(handle);
    return run(stream, sink);
}

RelayResult AnalysisGateway::chat(const ChatRequest& request, FrameSink& sink) {
    PreparedStream stream = prepare_chat(request);
    return run(stream, sink);
}

} // namespace sift
