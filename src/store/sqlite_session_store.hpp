#pragma once
#include "session_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace sift {

class SqliteSessionStore : public SessionStore {
public:
    // path may be ":memory:" for an in-process database.
    explicit SqliteSessionStore(const std::string& path);
    ~SqliteSessionStore() override;

    // Non-copyable
    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::string create_analysis(const AnalysisQuery& query) override;
    bool update_status(const std::string& id, const std::string& status) override;
    bool update_report(const std::string& id, const std::string& report) override;
    void save_message(const std::string& analysis_id, const std::string& role,
                      const std::string& content, const std::string& model_id) override;
    std::optional<AnalysisRecord> find_analysis(const std::string& id) override;
    std::vector<StoredMessage> messages(const std::string& analysis_id) override;

private:
    void init_schema();
    void exec_or_throw(const char* sql);
    bool update_column(const char* sql, const std::string& id, const std::string& value);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace sift
