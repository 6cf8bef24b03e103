#include "flowcore/workflow/sqlite_state_store.hpp"
#include "flowcore/workflow/errors.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <caf/unit.hpp>
#include <sqlite3.h>

namespace flowcore {
namespace workflow {

namespace {

// RAII wrapper to ensure statement is finalized
struct StatementGuard {
    sqlite3_stmt* stmt_;
    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    // Non-copyable
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;
};

caf::error sqlite_error(sqlite3* db, const std::string& what) {
    return caf::make_error(caf::sec::runtime_error, what + ": " + std::string(sqlite3_errmsg(db)));
}

// Collaborator failures surface to StateStore callers as StateError
template <class T>
T unwrap(caf::expected<T>&& result) {
    if (!result) {
        throw StateError("state store: " + caf::to_string(result.error()));
    }
    return std::move(*result);
}

void unwrap(caf::expected<void>&& result) {
    if (!result) {
        throw StateError("state store: " + caf::to_string(result.error()));
    }
}

} // namespace

SqliteStateStore::SqliteStateStore(const std::string& path) : path_(path) {
    int rc = sqlite3_open(path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StateError("failed to open SQLite database '" + path_ + "': " + message);
    }

    auto created = exec(
        "CREATE TABLE IF NOT EXISTS workflow_state ("
        "  workflow_id TEXT PRIMARY KEY,"
        "  record TEXT NOT NULL"
        ")");
    if (!created) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw StateError("failed to create state schema: " + caf::to_string(created.error()));
    }
}

SqliteStateStore::~SqliteStateStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

caf::expected<void> SqliteStateStore::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        return caf::make_error(caf::sec::runtime_error, "sqlite exec failed: " + message);
    }
    return caf::unit;
}

caf::expected<std::optional<std::string>> SqliteStateStore::select_one(const std::string& workflow_id) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT record FROM workflow_state WHERE workflow_id = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "failed to prepare select");
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, workflow_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) {
        return std::optional<std::string>{};
    }
    if (rc != SQLITE_ROW) {
        return sqlite_error(db_, "select failed");
    }
    const char* body = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    return std::optional<std::string>{body ? body : ""};
}

caf::expected<std::vector<std::string>> SqliteStateStore::select_all() {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT record FROM workflow_state ORDER BY workflow_id", -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "failed to prepare select");
    }
    StatementGuard guard(stmt);

    std::vector<std::string> rows;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* body = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        rows.emplace_back(body ? body : "");
    }
    if (rc != SQLITE_DONE) {
        return sqlite_error(db_, "select failed");
    }
    return rows;
}

caf::expected<void> SqliteStateStore::upsert(const std::string& workflow_id, const std::string& body) {
    sqlite3_stmt* stmt = nullptr;
    const char* sql =
        "INSERT INTO workflow_state (workflow_id, record) VALUES (?1, ?2) "
        "ON CONFLICT(workflow_id) DO UPDATE SET record = excluded.record";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "failed to prepare upsert");
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, workflow_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, body.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return sqlite_error(db_, "upsert failed");
    }
    return caf::unit;
}

caf::expected<int> SqliteStateStore::delete_row(const std::string& workflow_id) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM workflow_state WHERE workflow_id = ?1", -1, &stmt, nullptr) != SQLITE_OK) {
        return sqlite_error(db_, "failed to prepare delete");
    }
    StatementGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, workflow_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        return sqlite_error(db_, "delete failed");
    }
    return sqlite3_changes(db_);
}

std::optional<StateRecord> SqliteStateStore::load_record(const std::string& workflow_id) {
    auto body = unwrap(select_one(workflow_id));
    if (!body) {
        return std::nullopt;
    }
    return StateRecord::from_json(nlohmann::json::parse(*body));
}

void SqliteStateStore::store_record(const std::string& workflow_id, const StateRecord& record) {
    unwrap(upsert(workflow_id, record.to_json().dump()));
}

bool SqliteStateStore::erase_record(const std::string& workflow_id) {
    return unwrap(delete_row(workflow_id)) > 0;
}

std::vector<StateRecord> SqliteStateStore::load_all() {
    std::vector<StateRecord> records;
    for (const auto& body : unwrap(select_all())) {
        records.push_back(StateRecord::from_json(nlohmann::json::parse(body)));
    }
    return records;
}

} // namespace workflow
} // namespace flowcore
