#include "provider.hpp"
#include "plugin.hpp"
#include "config.hpp"

namespace sift {

std::optional<Role> role_from_string(const std::string& name) {
    if (name == "user") return Role::User;
    if (name == "assistant" || name == "ai" || name == "model") return Role::Assistant;
    if (name == "system") return Role::System;
    return std::nullopt;
}

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const ProviderEntry& entry,
                                          HttpClient& http) {
    return PluginRegistry::instance().create_provider(name, entry, http);
}

bool provider_configured(const Config& config, const std::string& name) {
    if (!PluginRegistry::instance().has_provider(name)) return false;
    auto it = config.providers.find(name);
    if (it == config.providers.end()) return false;
    if (name == "compatible") return !it->second.base_url.empty();
    return !it->second.api_key.empty();
}

} // namespace sift
