#pragma once

#include "flowcore/workflow/state_record.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {
namespace workflow {

/**
 * Keyed store of StateRecords, one per workflow id.
 *
 * Every public operation runs under one store-wide mutex, so a
 * read-modify-write such as mark_step_completed is atomic with respect to
 * the others. Backends only implement the raw record primitives.
 */
class StateStore {
public:
    virtual ~StateStore() = default;

    // Whole-record replace; updated_at never goes back past the stored one
    void save(const std::string& workflow_id, StateRecord record);

    std::optional<StateRecord> get(const std::string& workflow_id);

    bool remove(const std::string& workflow_id);

    // Throws StateError on an out-of-range value, NotFoundError on an unknown id
    void update_progress(const std::string& workflow_id,
                         double progress,
                         const std::optional<std::string>& current_step = std::nullopt);

    // Throws NotFoundError on an unknown id
    void mark_step_completed(const std::string& workflow_id,
                             const std::string& step_name,
                             const std::optional<nlohmann::json>& step_output = std::nullopt);

    // Throws StateError on a forbidden transition, NotFoundError on an unknown id
    void update_status(const std::string& workflow_id,
                       ExecutionStatus status,
                       const std::optional<std::string>& error = std::nullopt);

    // Execution-scoped writes: applied only while the record still belongs to
    // `execution_id`. Return false when the record is missing or has been
    // replaced by another execution of the same workflow.
    bool record_step(const std::string& workflow_id,
                     const std::string& execution_id,
                     const std::string& step_name,
                     const nlohmann::json& step_output,
                     double progress);

    // A completed status also sets progress to 1.0
    bool finalize(const std::string& workflow_id,
                  const std::string& execution_id,
                  ExecutionStatus status,
                  const std::optional<std::string>& error = std::nullopt);

    // Removes records with now - created_at >= max_age; returns the count
    size_t cleanup_expired(std::chrono::milliseconds max_age);

    std::vector<StateRecord> list();

    size_t size();

protected:
    // Called with the store mutex held
    virtual std::optional<StateRecord> load_record(const std::string& workflow_id) = 0;
    virtual void store_record(const std::string& workflow_id, const StateRecord& record) = 0;
    virtual bool erase_record(const std::string& workflow_id) = 0;
    virtual std::vector<StateRecord> load_all() = 0;

private:
    StateRecord require(const std::string& workflow_id);

    std::mutex mutex_;
};

// Process-local backend
class MemoryStateStore : public StateStore {
protected:
    std::optional<StateRecord> load_record(const std::string& workflow_id) override;
    void store_record(const std::string& workflow_id, const StateRecord& record) override;
    bool erase_record(const std::string& workflow_id) override;
    std::vector<StateRecord> load_all() override;

private:
    std::map<std::string, StateRecord> records_;
};

} // namespace workflow
} // namespace flowcore
