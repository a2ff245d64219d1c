#include "anthropic.hpp"
#include "../sse.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static sift::ProviderRegistrar reg_anthropic("anthropic",
    [](const sift::ProviderEntry& entry, sift::HttpClient& http) {
        return std::make_unique<sift::AnthropicProvider>(entry.api_key, http, entry.base_url);
    });

using json = nlohmann::json;

namespace sift {

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url) {}

json AnthropicProvider::build_request(const GenerationRequest& req) const {
    json request;
    request["model"] = req.model;
    request["stream"] = true;
    request["max_tokens"] = DEFAULT_MAX_TOKENS;

    const auto& params = req.params;
    if (params.contains("max_tokens") && params["max_tokens"].is_number())
        request["max_tokens"] = params["max_tokens"];
    if (params.contains("temperature") && params["temperature"].is_number())
        request["temperature"] = params["temperature"];
    if (params.contains("topP") && params["topP"].is_number())
        request["top_p"] = params["topP"];
    if (params.contains("topK") && params["topK"].is_number())
        request["top_k"] = params["topK"];

    std::string system_text = req.system_prompt;

    json msgs = json::array();
    for (size_t i = 0; i < req.messages.size(); ++i) {
        const auto& msg = req.messages[i];
        if (msg.role == Role::System) {
            if (!system_text.empty()) system_text += "\n";
            system_text += msg.content;
            continue;
        }
        bool last = i + 1 == req.messages.size();
        if (last && msg.role == Role::User && req.image) {
            json content = json::array();
            content.push_back({{"type", "image"},
                               {"source", {{"type", "base64"},
                                           {"media_type", req.image->mime_type},
                                           {"data", req.image->base64()}}}});
            content.push_back({{"type", "text"}, {"text", msg.content}});
            msgs.push_back({{"role", "user"}, {"content", content}});
            continue;
        }
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }
    request["messages"] = msgs;
    return request;
}

GenerationResult AnthropicProvider::stream(const GenerationRequest& req,
                                           const TextDeltaCallback& on_delta) {
    json request = build_request(req);

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    GenerationResult result;
    result.model = req.model;
    bool stream_error = false;
    std::string error_body;
    bool keep_going = true;

    SSEParser parser;

    auto http_response = http_.stream(
        "POST", base_url_ + "/messages", request.dump(), headers,
        [&](const char* data, size_t len) -> bool {
            parser.feed(std::string(data, len), [&](const SSEEvent& sse) -> bool {
                if (sse.event == "error") {
                    stream_error = true;
                    error_body = sse.data;
                    keep_going = false;
                    return false;
                }

                if (sse.data.empty()) return true;

                json payload;
                try {
                    payload = json::parse(sse.data);
                } catch (const json::parse_error&) {
                    return true;
                }

                if (sse.event == "message_start") {
                    if (payload.contains("message") && payload["message"].is_object()) {
                        result.model = payload["message"].value("model", req.model);
                    }
                } else if (sse.event == "content_block_delta") {
                    if (payload.contains("delta") && payload["delta"].is_object()) {
                        const auto& delta = payload["delta"];
                        if (delta.value("type", "") == "text_delta") {
                            std::string text = delta.value("text", "");
                            if (!text.empty()) {
                                result.text += text;
                                if (on_delta && !on_delta(text)) {
                                    result.aborted = true;
                                    keep_going = false;
                                    return false;
                                }
                            }
                        }
                    }
                }
                return true;
            });
            return keep_going;
        },
        req.cancel);

    if (stream_error) {
        throw std::runtime_error("Anthropic streaming error: " + error_body);
    }
    if (http_response.cancelled) {
        result.aborted = true;
        return result;
    }
    if (http_response.status_code == 0) {
        throw std::runtime_error("Anthropic request failed: " + http_response.error);
    }
    if (!is_success(http_response)) {
        throw std::runtime_error("Anthropic API error (HTTP " +
            std::to_string(http_response.status_code) + "): " + http_response.body);
    }
    return result;
}

} // namespace sift
