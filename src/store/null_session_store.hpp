#pragma once
#include "session_store.hpp"

namespace sift {

// store.backend = "none": nothing is persisted and no analysis id is issued.
class NullSessionStore : public SessionStore {
public:
    std::string backend_name() const override { return "none"; }

    std::string create_analysis(const AnalysisQuery&) override { return {}; }

    bool update_status(const std::string&, const std::string&) override { return false; }

    bool update_report(const std::string&, const std::string&) override { return false; }

    void save_message(const std::string&, const std::string&,
                      const std::string&, const std::string&) override {}

    std::optional<AnalysisRecord> find_analysis(const std::string&) override {
        return std::nullopt;
    }

    std::vector<StoredMessage> messages(const std::string&) override { return {}; }
};

} // namespace sift
