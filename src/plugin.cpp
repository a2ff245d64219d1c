#include "plugin.hpp"
#include "store/session_store.hpp"
#include <stdexcept>
#include <algorithm>

namespace sift {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void PluginRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const ProviderEntry& entry,
                                                          HttpClient& http) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    return it->second(entry, http);
}

std::unique_ptr<SessionStore> PluginRegistry::create_store(const std::string& name,
                                                           const Config& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        throw std::invalid_argument("Unknown store backend: " + name);
    }
    return it->second(config);
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(providers_);
}

std::vector<std::string> PluginRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(stores_);
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

bool PluginRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

void PluginRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.clear();
    stores_.clear();
}

} // namespace sift
