#include "openrouter.hpp"
#include "../plugin.hpp"

static sift::ProviderRegistrar reg_openrouter("openrouter",
    [](const sift::ProviderEntry& entry, sift::HttpClient& http) {
        return std::make_unique<sift::OpenRouterProvider>(entry.api_key, http, entry.base_url);
    });

namespace sift {

OpenRouterProvider::OpenRouterProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url)
    : OpenAIProvider(api_key, http,
                     base_url.empty() ? "https://openrouter.ai/api/v1" : base_url) {}

std::vector<Header> OpenRouterProvider::build_headers() const {
    auto headers = OpenAIProvider::build_headers();
    headers.emplace_back("HTTP-Referer", "https://github.com/sift-toolbox/sift");
    headers.emplace_back("X-Title", "Sift");
    return headers;
}

} // namespace sift
