#include "openai.hpp"
#include "../sse.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static sift::ProviderRegistrar reg_openai("openai",
    [](const sift::ProviderEntry& entry, sift::HttpClient& http) {
        return std::make_unique<sift::OpenAIProvider>(entry.api_key, http, entry.base_url);
    });

using json = nlohmann::json;

namespace sift {

OpenAIProvider::OpenAIProvider(const std::string& api_key, HttpClient& http,
                               const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.openai.com/v1" : base_url) {}

json OpenAIProvider::build_request(const GenerationRequest& req) const {
    json request;
    request["model"] = req.model;
    request["stream"] = true;

    const auto& params = req.params;
    if (params.contains("temperature") && params["temperature"].is_number())
        request["temperature"] = params["temperature"];
    if (params.contains("topP") && params["topP"].is_number())
        request["top_p"] = params["topP"];
    if (params.contains("max_tokens") && params["max_tokens"].is_number())
        request["max_tokens"] = params["max_tokens"];

    json msgs = json::array();
    if (!req.system_prompt.empty()) {
        msgs.push_back({{"role", "system"}, {"content", req.system_prompt}});
    }
    for (size_t i = 0; i < req.messages.size(); ++i) {
        const auto& msg = req.messages[i];
        bool last = i + 1 == req.messages.size();
        if (last && msg.role == Role::User && req.image) {
            // Vision input: text part plus a data-URL image part
            json content = json::array();
            content.push_back({{"type", "text"}, {"text", msg.content}});
            content.push_back({{"type", "image_url"},
                               {"image_url", {{"url", req.image->data_url()}}}});
            msgs.push_back({{"role", "user"}, {"content", content}});
            continue;
        }
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    return request;
}

std::vector<Header> OpenAIProvider::build_headers() const {
    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
    if (!api_key_.empty()) {
        headers.emplace_back("Authorization", "Bearer " + api_key_);
    }
    return headers;
}

GenerationResult OpenAIProvider::stream(const GenerationRequest& req,
                                        const TextDeltaCallback& on_delta) {
    json request = build_request(req);

    GenerationResult result;
    result.model = req.model;
    std::string stream_error;

    SSEParser parser;

    auto http_response = http_.stream(
        "POST", base_url_ + "/chat/completions", request.dump(), build_headers(),
        [&](const char* data, size_t len) -> bool {
            bool keep_going = true;
            parser.feed(std::string(data, len), [&](const SSEEvent& sse) -> bool {
                if (sse.data.empty() || sse.data == "[DONE]") return true;

                json payload;
                try {
                    payload = json::parse(sse.data);
                } catch (const json::parse_error&) {
                    return true;
                }

                // Mid-stream error object
                if (payload.contains("error") && payload["error"].is_object()) {
                    stream_error = payload["error"].value("message", sse.data);
                    keep_going = false;
                    return false;
                }

                if (payload.contains("model") && payload["model"].is_string()) {
                    result.model = payload["model"].get<std::string>();
                }

                if (payload.contains("choices") && payload["choices"].is_array() &&
                    !payload["choices"].empty()) {
                    const auto& choice = payload["choices"][0];
                    if (choice.contains("delta") && choice["delta"].contains("content") &&
                        choice["delta"]["content"].is_string()) {
                        std::string text = choice["delta"]["content"].get<std::string>();
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
                return true;
            });
            return keep_going;
        },
        req.cancel);

    if (!stream_error.empty()) {
        throw std::runtime_error(provider_name() + " streaming error: " + stream_error);
    }
    if (http_response.cancelled) {
        result.aborted = true;
        return result;
    }
    if (http_response.status_code == 0) {
        throw std::runtime_error(provider_name() + " request failed: " + http_response.error);
    }
    if (!is_success(http_response)) {
        throw std::runtime_error(provider_name() + " API error (HTTP " +
            std::to_string(http_response.status_code) + "): " + http_response.body);
    }
    return result;
}

} // namespace sift
