#include "sqlite_session_store.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

static sift::StoreRegistrar reg_sqlite("sqlite",
    [](const sift::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = sift::expand_home("~/.sift/sift.db");
        }
        return std::make_unique<sift::SqliteSessionStore>(path);
    });

namespace sift {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) {
        return reinterpret_cast<const char*>(v);
    }
    return {};
}

SqliteSessionStore::SqliteSessionStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteSessionStore: failed to open database: " + err);
    }

    // Connection threads write concurrently; WAL keeps readers unblocked.
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    init_schema();
}

SqliteSessionStore::~SqliteSessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteSessionStore::exec_or_throw(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteSessionStore: " + msg);
    }
}

void SqliteSessionStore::init_schema() {
    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS analyses ("
        "  id          TEXT PRIMARY KEY,"
        "  user_query  TEXT NOT NULL,"
        "  image_mime  TEXT NOT NULL DEFAULT '',"
        "  report_type TEXT NOT NULL,"
        "  model_id    TEXT NOT NULL,"
        "  params      TEXT NOT NULL DEFAULT '{}',"
        "  status      TEXT NOT NULL,"
        "  report      TEXT NOT NULL DEFAULT '',"
        "  created_at  INTEGER NOT NULL,"
        "  updated_at  INTEGER NOT NULL"
        ");");

    exec_or_throw(
        "CREATE TABLE IF NOT EXISTS messages ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  analysis_id TEXT NOT NULL REFERENCES analyses(id) ON DELETE CASCADE,"
        "  role        TEXT NOT NULL,"
        "  content     TEXT NOT NULL,"
        "  model_id    TEXT NOT NULL DEFAULT '',"
        "  created_at  INTEGER NOT NULL"
        ");");

    exec_or_throw(
        "CREATE INDEX IF NOT EXISTS idx_messages_analysis "
        "ON messages(analysis_id, id);");
}

std::string SqliteSessionStore::create_analysis(const AnalysisQuery& query) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = generate_id();
    uint64_t now = epoch_seconds();
    std::string params = query.params.is_object() ? query.params.dump() : "{}";
    std::string image_mime = query.image ? query.image->mime_type : "";

    StmtGuard g;
    const char* sql =
        "INSERT INTO analyses (id, user_query, image_mime, report_type, model_id,"
        " params, status, created_at, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteSessionStore: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, query.text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, image_mime.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, query.report_type.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 5, query.model_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 6, params.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 7, analysis_status::Initiated, -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(now));
    sqlite3_bind_int64(g.stmt, 9, static_cast<sqlite3_int64>(now));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error("SqliteSessionStore: insert failed: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return id;
}

bool SqliteSessionStore::update_column(const char* sql, const std::string& id,
                                       const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteSessionStore: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(g.stmt, 1, value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(epoch_seconds()));
    sqlite3_bind_text(g.stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error("SqliteSessionStore: update failed: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteSessionStore::update_status(const std::string& id, const std::string& status) {
    return update_column("UPDATE analyses SET status = ?, updated_at = ? WHERE id = ?;",
                         id, status);
}

bool SqliteSessionStore::update_report(const std::string& id, const std::string& report) {
    return update_column("UPDATE analyses SET report = ?, updated_at = ? WHERE id = ?;",
                         id, report);
}

void SqliteSessionStore::save_message(const std::string& analysis_id, const std::string& role,
                                      const std::string& content, const std::string& model_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "INSERT INTO messages (analysis_id, role, content, model_id, created_at)"
        " VALUES (?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteSessionStore: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(g.stmt, 1, analysis_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, role.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, content.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 4, model_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 5, static_cast<sqlite3_int64>(epoch_seconds()));

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error("SqliteSessionStore: insert failed: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
}

std::optional<AnalysisRecord> SqliteSessionStore::find_analysis(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT id, user_query, image_mime, report_type, model_id, params, status,"
        " report, created_at, updated_at FROM analyses WHERE id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteSessionStore: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    AnalysisRecord rec;
    rec.id          = column_text(g.stmt, 0);
    rec.user_query  = column_text(g.stmt, 1);
    rec.image_mime  = column_text(g.stmt, 2);
    rec.report_type = column_text(g.stmt, 3);
    rec.model_id    = column_text(g.stmt, 4);
    rec.params_json = column_text(g.stmt, 5);
    rec.status      = column_text(g.stmt, 6);
    rec.report      = column_text(g.stmt, 7);
    rec.created_at  = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 8));
    rec.updated_at  = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 9));
    return rec;
}

std::vector<StoredMessage> SqliteSessionStore::messages(const std::string& analysis_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT analysis_id, role, content, model_id, created_at FROM messages"
        " WHERE analysis_id = ? ORDER BY id ASC;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("SqliteSessionStore: " + std::string(sqlite3_errmsg(db_)));
    }
    sqlite3_bind_text(g.stmt, 1, analysis_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<StoredMessage> result;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        StoredMessage msg;
        msg.analysis_id = column_text(g.stmt, 0);
        msg.role        = column_text(g.stmt, 1);
        msg.content     = column_text(g.stmt, 2);
        msg.model_id    = column_text(g.stmt, 3);
        msg.created_at  = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 4));
        result.push_back(std::move(msg));
    }
    return result;
}

} // namespace sift
