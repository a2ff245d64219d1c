#pragma once
#include "../query.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sift {

namespace analysis_status {
    constexpr const char* Initiated = "initiated";
    constexpr const char* Streaming = "streaming";
    constexpr const char* Complete  = "complete";
    constexpr const char* Errored   = "errored";
    constexpr const char* Aborted   = "aborted";
} // namespace analysis_status

struct AnalysisRecord {
    std::string id;
    std::string user_query;
    std::string image_mime;   // empty when no image was attached
    std::string report_type;
    std::string model_id;
    std::string params_json;
    std::string status;
    std::string report;       // assistant output of the initial analysis
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

struct StoredMessage {
    std::string analysis_id;
    std::string role;         // "user" | "assistant"
    std::string content;
    std::string model_id;
    uint64_t created_at = 0;
};

// Persistence for analyses and their follow-up conversation.
// Implementations must be safe to call from multiple connection threads and
// throw std::runtime_error on storage failure.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::string backend_name() const = 0;

    // Returns the new analysis id, or "" if this backend does not persist.
    virtual std::string create_analysis(const AnalysisQuery& query) = 0;

    // Returns false if the id is unknown.
    virtual bool update_status(const std::string& id, const std::string& status) = 0;
    virtual bool update_report(const std::string& id, const std::string& report) = 0;

    virtual void save_message(const std::string& analysis_id, const std::string& role,
                              const std::string& content, const std::string& model_id) = 0;

    virtual std::optional<AnalysisRecord> find_analysis(const std::string& id) = 0;

    // Messages of an analysis, oldest first.
    virtual std::vector<StoredMessage> messages(const std::string& analysis_id) = 0;
};

} // namespace sift
