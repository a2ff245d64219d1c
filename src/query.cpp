#include "query.hpp"
#include "errors.hpp"
#include "util.hpp"

using json = nlohmann::json;

namespace sift {

std::string ImageRef::base64() const {
    if (!data.empty()) return data;
    return base64_encode(read_file(expand_home(path)));
}

std::string ImageRef::data_url() const {
    return "data:" + mime_type + ";base64," + base64();
}

bool AnalysisQuery::has_content() const {
    return !is_blank(text) || image.has_value();
}

json query_to_json(const AnalysisQuery& query) {
    json j;
    if (!query.text.empty()) j["userInputText"] = query.text;
    if (query.image) {
        json img;
        img["mimeType"] = query.image->mime_type;
        if (!query.image->data.empty()) img["data"] = query.image->data;
        if (!query.image->path.empty()) img["path"] = query.image->path;
        j["userImage"] = img;
    }
    j["reportType"] = query.report_type;
    j["selectedModelId"] = query.model_id;
    j["modelConfigParams"] = query.params.is_object() ? query.params : json::object();
    return j;
}

ImageRef image_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("userImage must be an object");
    }
    ImageRef img;
    if (j.contains("mimeType") && j["mimeType"].is_string())
        img.mime_type = j["mimeType"].get<std::string>();
    if (j.contains("path") && j["path"].is_string())
        img.path = j["path"].get<std::string>();
    if (j.contains("data") && j["data"].is_string())
        img.data = j["data"].get<std::string>();

    if (img.mime_type.rfind("image/", 0) != 0) {
        throw ValidationError("userImage.mimeType must be an image MIME type");
    }
    if (img.path.empty() && img.data.empty()) {
        throw ValidationError("userImage needs either path or data");
    }
    return img;
}

static std::string optional_string(const json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) return "";
    if (!body[key].is_string()) {
        throw ValidationError(std::string(key) + " must be a string");
    }
    return body[key].get<std::string>();
}

AnalysisQuery query_from_json(const json& body) {
    if (!body.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
    AnalysisQuery query;
    query.text = optional_string(body, "userInputText");
    if (body.contains("userImage") && !body["userImage"].is_null()) {
        query.image = image_from_json(body["userImage"]);
    }
    query.report_type = optional_string(body, "reportType");
    query.model_id = optional_string(body, "selectedModelId");

    if (body.contains("modelConfigParams") && !body["modelConfigParams"].is_null()) {
        const auto& params = body["modelConfigParams"];
        if (!params.is_object()) {
            throw ValidationError("modelConfigParams must be an object");
        }
        for (auto& [key, value] : params.items()) {
            if (value.is_object() || value.is_array()) {
                throw ValidationError("modelConfigParams." + key + " must be a scalar");
            }
        }
        query.params = params;
    }
    return query;
}

} // namespace sift
