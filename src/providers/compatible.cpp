#include "compatible.hpp"
#include "../plugin.hpp"
#include <stdexcept>

static sift::ProviderRegistrar reg_compatible("compatible",
    [](const sift::ProviderEntry& entry, sift::HttpClient& http) {
        return std::make_unique<sift::CompatibleProvider>(entry.api_key, http, entry.base_url);
    });

namespace sift {

CompatibleProvider::CompatibleProvider(const std::string& api_key, HttpClient& http,
                                       const std::string& base_url)
    : OpenAIProvider(api_key, http, base_url) {
    if (base_url.empty()) {
        throw std::invalid_argument("compatible provider requires a base_url");
    }
}

} // namespace sift
