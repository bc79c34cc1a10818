#include "courier/engine/sqlite_store.hpp"
#include "courier/engine/result_converter.hpp"
#include <caf/unit.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>

namespace courier {
namespace engine {

using json = nlohmann::json;

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS environments (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    variables TEXT NOT NULL DEFAULT '{}',
    is_default INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS collections (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    description TEXT NOT NULL DEFAULT '',
    active_environment_id INTEGER,
    created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS collection_environments (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    collection_id INTEGER NOT NULL REFERENCES collections(id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    variables TEXT NOT NULL DEFAULT '{}',
    created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS requests (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    collection_id INTEGER REFERENCES collections(id) ON DELETE CASCADE,
    name TEXT NOT NULL,
    method TEXT NOT NULL DEFAULT 'GET',
    url TEXT NOT NULL,
    headers TEXT NOT NULL DEFAULT '{}',
    body TEXT NOT NULL DEFAULT 'null',
    auth TEXT NOT NULL DEFAULT '{"type":"none"}',
    query_params TEXT NOT NULL DEFAULT '[]',
    sort_order INTEGER NOT NULL DEFAULT 0,
    created_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS request_history (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    request_id INTEGER,
    collection_id INTEGER,
    request_name TEXT NOT NULL DEFAULT '',
    method TEXT NOT NULL,
    url TEXT NOT NULL,
    request_headers TEXT NOT NULL DEFAULT '{}',
    query_params TEXT NOT NULL DEFAULT '[]',
    body TEXT NOT NULL DEFAULT 'null',
    status INTEGER NOT NULL,
    status_text TEXT NOT NULL DEFAULT '',
    response_headers TEXT NOT NULL DEFAULT '{}',
    response_body TEXT NOT NULL DEFAULT '',
    response_time INTEGER NOT NULL DEFAULT 0,
    error TEXT,
    created_at TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_requests_collection ON requests(collection_id);
CREATE INDEX IF NOT EXISTS idx_history_created ON request_history(created_at);
)SQL";

// RAII wrapper to ensure statement is finalized
struct StatementGuard {
    sqlite3_stmt* stmt_ = nullptr;
    StatementGuard() = default;
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    // Non-copyable
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;
};

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(millis.count()));
    return std::string(buf);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* stmt, int index, const std::optional<int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_string(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::optional<int64_t> column_optional(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

// Bodies and headers may carry bytes that are not UTF-8; those become U+FFFD
std::string json_text(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Unreadable JSON columns come back as null
json column_json(sqlite3_stmt* stmt, int index) {
    json value = json::parse(column_string(stmt, index), nullptr, false);
    return value.is_discarded() ? json() : value;
}

// Non-string values are kept as their JSON text
std::map<std::string, std::string> to_string_map(const json& value) {
    std::map<std::string, std::string> out;
    if (!value.is_object()) {
        return out;
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : json_text(it.value());
    }
    return out;
}

} // namespace

SqliteStore::SqliteStore(std::string path, std::shared_ptr<Observability> observability)
    : path_(std::move(path)),
      observability_(observability ? std::move(observability) : default_observability("sqlite_store")) {}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

caf::error SqliteStore::sqlite_error(const std::string& what) const {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "database is not open";
    return caf::make_error(caf::sec::runtime_error, what + ": " + detail);
}

caf::expected<void> SqliteStore::exec(const char* sql) {
    char* message = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : "unknown error";
        sqlite3_free(message);
        return caf::make_error(caf::sec::runtime_error, "SQL execution failed: " + detail);
    }
    return caf::unit;
}

caf::expected<void> SqliteStore::migrate() {
    if (auto res = exec("PRAGMA foreign_keys = ON;"); !res) {
        return res;
    }
    return exec(kSchema);
}

caf::expected<void> SqliteStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return caf::unit;
    }

    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        auto err = sqlite_error("Failed to open SQLite database " + path_);
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    auto migrated = migrate();
    if (!migrated) {
        observability_->log_error("Database migration failed", "", "", "", "", {
            {"path", path_},
            {"error", caf::to_string(migrated.error())}
        });
        return migrated;
    }

    observability_->log_info("Database opened", "", "", "", "", {{"path", path_}});
    return caf::unit;
}

caf::expected<VariableMap> SqliteStore::global_variables(std::optional<int64_t> environment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    if (environment_id) {
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, "SELECT variables FROM environments WHERE id = ?", -1, &guard.stmt_, nullptr) != SQLITE_OK) {
            return sqlite_error("Failed to prepare statement");
        }
        sqlite3_bind_int64(guard.stmt_, 1, *environment_id);
        if (sqlite3_step(guard.stmt_) == SQLITE_ROW) {
            return to_string_map(column_json(guard.stmt_, 0));
        }
    }

    // Default environment first, then the first one created
    StatementGuard guard;
    const char* sql = "SELECT variables FROM environments ORDER BY is_default DESC, id ASC LIMIT 1";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    int rc = sqlite3_step(guard.stmt_);
    if (rc == SQLITE_ROW) {
        return to_string_map(column_json(guard.stmt_, 0));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error("Query execution failed");
    }
    return caf::make_error(caf::sec::runtime_error, "No environment selected");
}

caf::expected<std::optional<VariableMap>> SqliteStore::collection_variables(int64_t collection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    std::optional<int64_t> active_id;
    {
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, "SELECT active_environment_id FROM collections WHERE id = ?", -1, &guard.stmt_, nullptr) != SQLITE_OK) {
            return sqlite_error("Failed to prepare statement");
        }
        sqlite3_bind_int64(guard.stmt_, 1, collection_id);
        if (sqlite3_step(guard.stmt_) != SQLITE_ROW) {
            return caf::make_error(caf::sec::runtime_error, "Collection not found");
        }
        active_id = column_optional(guard.stmt_, 0);
    }

    if (active_id) {
        StatementGuard guard;
        const char* sql = "SELECT variables FROM collection_environments WHERE id = ? AND collection_id = ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
            return sqlite_error("Failed to prepare statement");
        }
        sqlite3_bind_int64(guard.stmt_, 1, *active_id);
        sqlite3_bind_int64(guard.stmt_, 2, collection_id);
        if (sqlite3_step(guard.stmt_) == SQLITE_ROW) {
            return std::optional<VariableMap>(to_string_map(column_json(guard.stmt_, 0)));
        }
    }

    // No active sub-environment, or it was deleted: use the first one
    StatementGuard guard;
    const char* sql = "SELECT variables FROM collection_environments WHERE collection_id = ? ORDER BY id ASC LIMIT 1";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    sqlite3_bind_int64(guard.stmt_, 1, collection_id);
    if (sqlite3_step(guard.stmt_) == SQLITE_ROW) {
        return std::optional<VariableMap>(to_string_map(column_json(guard.stmt_, 0)));
    }
    return std::optional<VariableMap>();
}

caf::expected<std::vector<RequestDescriptor>> SqliteStore::collection_requests(int64_t collection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    {
        StatementGuard guard;
        if (sqlite3_prepare_v2(db_, "SELECT 1 FROM collections WHERE id = ?", -1, &guard.stmt_, nullptr) != SQLITE_OK) {
            return sqlite_error("Failed to prepare statement");
        }
        sqlite3_bind_int64(guard.stmt_, 1, collection_id);
        if (sqlite3_step(guard.stmt_) != SQLITE_ROW) {
            return caf::make_error(caf::sec::runtime_error, "Collection not found");
        }
    }

    StatementGuard guard;
    const char* sql =
        "SELECT id, collection_id, name, method, url, headers, body, auth, query_params, sort_order "
        "FROM requests WHERE collection_id = ? ORDER BY sort_order ASC, id ASC";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    sqlite3_bind_int64(guard.stmt_, 1, collection_id);

    std::vector<RequestDescriptor> requests;
    int rc;
    while ((rc = sqlite3_step(guard.stmt_)) == SQLITE_ROW) {
        RequestDescriptor request;
        request.id = sqlite3_column_int64(guard.stmt_, 0);
        request.collection_id = column_optional(guard.stmt_, 1);
        request.name = column_string(guard.stmt_, 2);
        request.method = column_string(guard.stmt_, 3);
        request.url = column_string(guard.stmt_, 4);
        request.headers = to_string_map(column_json(guard.stmt_, 5));
        request.body = column_json(guard.stmt_, 6);
        request.auth = ResultConverter::auth_from_json(column_json(guard.stmt_, 7));
        request.query_params = ResultConverter::query_params_from_json(column_json(guard.stmt_, 8));
        request.order = sqlite3_column_int64(guard.stmt_, 9);
        requests.push_back(std::move(request));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error("Query execution failed");
    }
    return requests;
}

caf::expected<void> SqliteStore::record(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql =
        "INSERT INTO request_history (request_id, collection_id, request_name, method, url, request_headers, "
        "query_params, body, status, status_text, response_headers, response_body, response_time, error, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }

    try {
        bind_optional(guard.stmt_, 1, entry.request_id);
        bind_optional(guard.stmt_, 2, entry.collection_id);
        bind_text(guard.stmt_, 3, entry.request_name);
        bind_text(guard.stmt_, 4, entry.method);
        bind_text(guard.stmt_, 5, entry.url);
        bind_text(guard.stmt_, 6, json_text(json(entry.request_headers)));
        bind_text(guard.stmt_, 7, json_text(ResultConverter::query_params_to_json(entry.query_params)));
        bind_text(guard.stmt_, 8, json_text(entry.raw_body));
        sqlite3_bind_int(guard.stmt_, 9, entry.status);
        bind_text(guard.stmt_, 10, entry.status_text);
        bind_text(guard.stmt_, 11, json_text(json(entry.response_headers)));
        bind_text(guard.stmt_, 12, entry.response_body);
        sqlite3_bind_int64(guard.stmt_, 13, entry.response_time_ms);
        if (entry.error) {
            bind_text(guard.stmt_, 14, *entry.error);
        } else {
            sqlite3_bind_null(guard.stmt_, 14);
        }
        bind_text(guard.stmt_, 15, entry.created_at.empty() ? now_iso8601() : entry.created_at);
    } catch (const std::exception& e) {
        return caf::make_error(caf::sec::runtime_error, std::string("Failed to encode history entry: ") + e.what());
    }

    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to insert history entry");
    }
    return caf::unit;
}

caf::expected<int64_t> SqliteStore::add_environment(const std::string& name,
                                                    const VariableMap& variables,
                                                    bool is_default) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    // Only one default environment
    if (is_default) {
        if (auto res = exec("UPDATE environments SET is_default = 0"); !res) {
            return res.error();
        }
    }

    StatementGuard guard;
    const char* sql = "INSERT INTO environments (name, variables, is_default, created_at) VALUES (?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    bind_text(guard.stmt_, 1, name);
    bind_text(guard.stmt_, 2, json_text(json(variables)));
    sqlite3_bind_int(guard.stmt_, 3, is_default ? 1 : 0);
    bind_text(guard.stmt_, 4, now_iso8601());
    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to insert environment");
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

caf::expected<int64_t> SqliteStore::add_collection(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql = "INSERT INTO collections (name, description, created_at) VALUES (?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    bind_text(guard.stmt_, 1, name);
    bind_text(guard.stmt_, 2, description);
    bind_text(guard.stmt_, 3, now_iso8601());
    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to insert collection");
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

caf::expected<int64_t> SqliteStore::add_collection_environment(int64_t collection_id,
                                                               const std::string& name,
                                                               const VariableMap& variables) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql = "INSERT INTO collection_environments (collection_id, name, variables, created_at) VALUES (?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    sqlite3_bind_int64(guard.stmt_, 1, collection_id);
    bind_text(guard.stmt_, 2, name);
    bind_text(guard.stmt_, 3, json_text(json(variables)));
    bind_text(guard.stmt_, 4, now_iso8601());
    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to insert collection environment");
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

caf::expected<void> SqliteStore::set_active_environment(int64_t collection_id, int64_t environment_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql = "UPDATE collections SET active_environment_id = ? WHERE id = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    sqlite3_bind_int64(guard.stmt_, 1, environment_id);
    sqlite3_bind_int64(guard.stmt_, 2, collection_id);
    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to update collection");
    }
    if (sqlite3_changes(db_) == 0) {
        return caf::make_error(caf::sec::runtime_error, "Collection not found");
    }
    return caf::unit;
}

caf::expected<int64_t> SqliteStore::add_request(const RequestDescriptor& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql =
        "INSERT INTO requests (collection_id, name, method, url, headers, body, auth, query_params, sort_order, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    bind_optional(guard.stmt_, 1, request.collection_id);
    bind_text(guard.stmt_, 2, request.name);
    bind_text(guard.stmt_, 3, request.method);
    bind_text(guard.stmt_, 4, request.url);
    bind_text(guard.stmt_, 5, json_text(json(request.headers)));
    bind_text(guard.stmt_, 6, json_text(request.body));
    bind_text(guard.stmt_, 7, json_text(ResultConverter::auth_to_json(request.auth)));
    bind_text(guard.stmt_, 8, json_text(ResultConverter::query_params_to_json(request.query_params)));
    sqlite3_bind_int64(guard.stmt_, 9, request.order);
    bind_text(guard.stmt_, 10, now_iso8601());
    if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
        return sqlite_error("Failed to insert request");
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

caf::expected<std::vector<HistoryEntry>> SqliteStore::history(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return sqlite_error("Store is not open");
    }

    StatementGuard guard;
    const char* sql =
        "SELECT request_id, collection_id, request_name, method, url, request_headers, query_params, body, "
        "status, status_text, response_headers, response_body, response_time, error, created_at "
        "FROM request_history ORDER BY id DESC LIMIT ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &guard.stmt_, nullptr) != SQLITE_OK) {
        return sqlite_error("Failed to prepare statement");
    }
    sqlite3_bind_int64(guard.stmt_, 1, static_cast<sqlite3_int64>(limit));

    std::vector<HistoryEntry> entries;
    int rc;
    while ((rc = sqlite3_step(guard.stmt_)) == SQLITE_ROW) {
        HistoryEntry entry;
        entry.request_id = column_optional(guard.stmt_, 0);
        entry.collection_id = column_optional(guard.stmt_, 1);
        entry.request_name = column_string(guard.stmt_, 2);
        entry.method = column_string(guard.stmt_, 3);
        entry.url = column_string(guard.stmt_, 4);
        entry.request_headers = to_string_map(column_json(guard.stmt_, 5));
        entry.query_params = ResultConverter::query_params_from_json(column_json(guard.stmt_, 6));
        entry.raw_body = column_json(guard.stmt_, 7);
        entry.status = sqlite3_column_int(guard.stmt_, 8);
        entry.status_text = column_string(guard.stmt_, 9);
        entry.response_headers = to_string_map(column_json(guard.stmt_, 10));
        entry.response_body = column_string(guard.stmt_, 11);
        entry.response_time_ms = sqlite3_column_int64(guard.stmt_, 12);
        if (sqlite3_column_type(guard.stmt_, 13) != SQLITE_NULL) {
            entry.error = column_string(guard.stmt_, 13);
        }
        entry.created_at = column_string(guard.stmt_, 14);
        entries.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error("Query execution failed");
    }
    return entries;
}

} // namespace engine
} // namespace courier
