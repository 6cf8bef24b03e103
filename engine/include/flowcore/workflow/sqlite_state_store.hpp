#pragma once

#include "flowcore/workflow/state_store.hpp"
#include <caf/expected.hpp>
#include <string>

struct sqlite3;

namespace flowcore {
namespace workflow {

/**
 * SQLite backend. Each record is one row holding its JSON form, keyed by
 * workflow id, so the persisted shape is exactly StateRecord::to_json().
 *
 * `path` may be ":memory:" for a private in-memory database. The
 * constructor throws StateError when the database cannot be opened or the
 * schema cannot be created.
 */
class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(const std::string& path = ":memory:");
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    const std::string& path() const { return path_; }

protected:
    std::optional<StateRecord> load_record(const std::string& workflow_id) override;
    void store_record(const std::string& workflow_id, const StateRecord& record) override;
    bool erase_record(const std::string& workflow_id) override;
    std::vector<StateRecord> load_all() override;

private:
    caf::expected<void> exec(const std::string& sql);
    caf::expected<std::optional<std::string>> select_one(const std::string& workflow_id);
    caf::expected<std::vector<std::string>> select_all();
    caf::expected<void> upsert(const std::string& workflow_id, const std::string& body);
    caf::expected<int> delete_row(const std::string& workflow_id);

    std::string path_;
    sqlite3* db_ = nullptr;
};

} // namespace workflow
} // namespace flowcore
