#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sift {

// Image attached to a query: a MIME type plus either a local file path or
// inline base64 data.
struct ImageRef {
    std::string mime_type;
    std::string path;
    std::string data; // base64

    // base64 payload, reading `path` when no inline data is present.
    // Throws std::runtime_error if the file cannot be read.
    std::string base64() const;
    std::string data_url() const;
};

namespace report_types {
    constexpr const char* FullCheck     = "full_check";
    constexpr const char* ContextReport = "context_report";
    constexpr const char* CommunityNote = "community_note";
} // namespace report_types

struct AnalysisQuery {
    std::string text;
    std::optional<ImageRef> image;
    std::string report_type = report_types::FullCheck;
    std::string model_id;
    nlohmann::json params = nlohmann::json::object(); // flat scalar map

    bool has_content() const;
};

// Wire body of POST /api/sift/initiate.
nlohmann::json query_to_json(const AnalysisQuery& query);

// Parse an initiate body. Field type errors raise ValidationError; semantic
// checks (known model, known report type) are left to the gateway.
AnalysisQuery query_from_json(const nlohmann::json& body);

// Validate image reference JSON ({mimeType, path?|data?}).
ImageRef image_from_json(const nlohmann::json& j);

} // namespace sift
