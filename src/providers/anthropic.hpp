#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sift {

// Anthropic Messages API with event streaming.
class AnthropicProvider : public Provider {
public:
    AnthropicProvider(const std::string& api_key, HttpClient& http,
                      const std::string& base_url);

    GenerationResult stream(const GenerationRequest& request,
                            const TextDeltaCallback& on_delta) override;

    std::string provider_name() const override { return "anthropic"; }

private:
    nlohmann::json build_request(const GenerationRequest& request) const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr int DEFAULT_MAX_TOKENS = 4096;
};

} // namespace sift
