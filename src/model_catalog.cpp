#include "model_catalog.hpp"
#include "config.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace sift {

static ModelParameter temperature_param() {
    return {"temperature", "Temperature", "slider", 0.0, 1.0, 0.01, 0.7,
            "Controls randomness. Lower for more predictable, higher for more creative."};
}

static ModelParameter top_p_param() {
    return {"topP", "Top-P", "slider", 0.0, 1.0, 0.01, 0.95,
            "Nucleus sampling. Considers tokens with probability mass adding up to topP."};
}

static ModelParameter max_tokens_param(double max, double def) {
    return {"max_tokens", "Max Tokens", "slider", 256.0, max, 256.0, def,
            "Upper bound on the length of the generated report."};
}

ModelCatalog ModelCatalog::builtin() {
    ModelCatalog catalog;
    catalog.add({"gpt-4o", "openai", "GPT-4o", true, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"gpt-4.1-mini", "openai", "GPT-4.1 Mini", true, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"openai/gpt-4o-mini", "openrouter", "GPT-4o Mini (OpenRouter)", true, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"anthropic/claude-sonnet-4", "openrouter",
                 "Claude Sonnet 4 (OpenRouter)", true, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"deepseek/deepseek-chat-v3-0324", "openrouter",
                 "DeepSeek Chat V3 (OpenRouter)", false, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"google/gemma-3-27b-it", "openrouter", "Gemma 3 27B (OpenRouter)", true, "",
                 {temperature_param(), top_p_param()}});
    catalog.add({"claude-sonnet-4-20250514", "anthropic", "Claude Sonnet 4", true, "",
                 {temperature_param(), max_tokens_param(8192.0, 4096)}});
    return catalog;
}

ModelCatalog ModelCatalog::from_config(const Config& config) {
    ModelCatalog catalog = builtin();
    for (const auto& entry : config.models) {
        try {
            catalog.add(model_from_json(entry));
        } catch (const std::exception& e) {
            std::cerr << "[config] Skipping model entry: " << e.what() << "\n";
        }
    }
    return catalog;
}

void ModelCatalog::add(ModelInfo model) {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&](const ModelInfo& m) { return m.id == model.id; });
    if (it != models_.end()) {
        *it = std::move(model);
    } else {
        models_.push_back(std::move(model));
    }
}

const ModelInfo* ModelCatalog::find(const std::string& id) const {
    for (const auto& m : models_) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

std::vector<ModelInfo> ModelCatalog::available(
    const std::function<bool(const std::string& provider)>& usable) const {
    std::vector<ModelInfo> result;
    for (const auto& m : models_) {
        if (usable(m.provider)) result.push_back(m);
    }
    return result;
}

json model_to_json(const ModelInfo& model) {
    json params = json::array();
    for (const auto& p : model.parameters) {
        params.push_back({
            {"key", p.key},
            {"label", p.label},
            {"type", p.type},
            {"min", p.min},
            {"max", p.max},
            {"step", p.step},
            {"defaultValue", p.default_value},
            {"description", p.description}
        });
    }
    return {
        {"id", model.id},
        {"name", model.name},
        {"provider", model.provider},
        {"supportsVision", model.supports_vision},
        {"systemDirective", model.system_directive},
        {"parameters", params}
    };
}

ModelInfo model_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("model entry is not an object");

    ModelInfo model;
    model.id = j.value("id", "");
    model.provider = j.value("provider", "");
    if (model.id.empty() || model.provider.empty()) {
        throw std::invalid_argument("model entry needs id and provider");
    }
    model.name = j.value("name", model.id);
    model.supports_vision = j.value("supportsVision", false);
    model.system_directive = j.value("systemDirective", "");

    if (j.contains("parameters") && j["parameters"].is_array()) {
        for (const auto& p : j["parameters"]) {
            if (!p.is_object() || !p.contains("key")) continue;
            ModelParameter param;
            param.key = p.value("key", "");
            param.label = p.value("label", param.key);
            param.type = p.value("type", "slider");
            param.min = p.value("min", 0.0);
            param.max = p.value("max", 1.0);
            param.step = p.value("step", 0.01);
            if (p.contains("defaultValue")) param.default_value = p["defaultValue"];
            param.description = p.value("description", "");
            model.parameters.push_back(std::move(param));
        }
    }
    return model;
}

json resolve_params(const ModelInfo& model, const json& given) {
    json result = given.is_object() ? given : json::object();
    for (const auto& p : model.parameters) {
        if (!result.contains(p.key) || result[p.key].is_null()) {
            if (!p.default_value.is_null()) result[p.key] = p.default_value;
            continue;
        }
        if (result[p.key].is_number()) {
            double v = std::clamp(result[p.key].get<double>(), p.min, p.max);
            if (result[p.key].is_number_integer() || result[p.key].is_number_unsigned()) {
                result[p.key] = static_cast<long long>(v);
            } else {
                result[p.key] = v;
            }
        }
    }
    return result;
}

} // namespace sift
