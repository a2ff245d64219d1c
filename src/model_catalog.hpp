#pragma once
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace sift {

struct Config;

struct ModelParameter {
    std::string key;
    std::string label;
    std::string type = "slider";
    double min = 0.0;
    double max = 1.0;
    double step = 0.01;
    nlohmann::json default_value;
    std::string description;
};

struct ModelInfo {
    std::string id;
    std::string provider;
    std::string name;
    bool supports_vision = false;
    std::string system_directive; // empty = use the configured prompt directive
    std::vector<ModelParameter> parameters;
};

// Wire representation used by GET /api/models/config (camelCase keys).
nlohmann::json model_to_json(const ModelInfo& model);

// Throws std::invalid_argument if id or provider is missing.
ModelInfo model_from_json(const nlohmann::json& j);

class ModelCatalog {
public:
    // Built-in models only.
    static ModelCatalog builtin();

    // Built-in models plus the config "models" array (same id replaces).
    static ModelCatalog from_config(const Config& config);

    void add(ModelInfo model);

    // nullptr if unknown
    const ModelInfo* find(const std::string& id) const;

    const std::vector<ModelInfo>& models() const { return models_; }

    // Models whose provider passes the predicate, in catalog order.
    std::vector<ModelInfo> available(
        const std::function<bool(const std::string& provider)>& usable) const;

private:
    std::vector<ModelInfo> models_;
};

// Fill missing parameters with their defaults and clamp numeric values to the
// declared range. Keys the model does not declare are passed through.
nlohmann::json resolve_params(const ModelInfo& model, const nlohmann::json& given);

} // namespace sift
