#pragma once
#include "provider.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace sift { class SessionStore; } // forward declaration

namespace sift {

// Factory function types
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const ProviderEntry& entry, HttpClient& http)>;

using StoreFactory = std::function<std::unique_ptr<SessionStore>(const Config& config)>;

// Central registry for self-registering providers and store backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_provider(const std::string& name, ProviderFactory factory);
    void register_store(const std::string& name, StoreFactory factory);

    // Creation
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const ProviderEntry& entry,
                                              HttpClient& http) const;

    std::unique_ptr<SessionStore> create_store(const std::string& name,
                                               const Config& config) const;

    // Query
    std::vector<std::string> provider_names() const;
    std::vector<std::string> store_names() const;
    bool has_provider(const std::string& name) const;
    bool has_store(const std::string& name) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        PluginRegistry::instance().register_store(name, std::move(factory));
    }
};

} // namespace sift
