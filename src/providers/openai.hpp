#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sift {

// OpenAI Chat Completions with server-sent event streaming.
class OpenAIProvider : public Provider {
public:
    OpenAIProvider(const std::string& api_key, HttpClient& http,
                   const std::string& base_url);

    GenerationResult stream(const GenerationRequest& request,
                            const TextDeltaCallback& on_delta) override;

    std::string provider_name() const override { return "openai"; }

protected:
    nlohmann::json build_request(const GenerationRequest& request) const;
    virtual std::vector<Header> build_headers() const;

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
};

} // namespace sift
