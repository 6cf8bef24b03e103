#include "flowcore/workflow/state_store.hpp"
#include "flowcore/workflow/errors.hpp"

namespace flowcore {
namespace workflow {

StateRecord StateStore::require(const std::string& workflow_id) {
    auto record = load_record(workflow_id);
    if (!record) {
        throw NotFoundError("no state for workflow '" + workflow_id + "'");
    }
    return std::move(*record);
}

void StateStore::save(const std::string& workflow_id, StateRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    record.workflow_id = workflow_id;
    if (auto existing = load_record(workflow_id)) {
        record.touch(existing->updated_at);
    }
    record.touch();
    store_record(workflow_id, record);
}

std::optional<StateRecord> StateStore::get(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_record(workflow_id);
}

bool StateStore::remove(const std::string& workflow_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return erase_record(workflow_id);
}

void StateStore::update_progress(const std::string& workflow_id,
                                 double progress,
                                 const std::optional<std::string>& current_step) {
    std::lock_guard<std::mutex> lock(mutex_);
    StateRecord record = require(workflow_id);
    record.apply_progress(progress, current_step);
    store_record(workflow_id, record);
}

void StateStore::mark_step_completed(const std::string& workflow_id,
                                     const std::string& step_name,
                                     const std::optional<nlohmann::json>& step_output) {
    std::lock_guard<std::mutex> lock(mutex_);
    StateRecord record = require(workflow_id);
    record.apply_step_completed(step_name, step_output);
    store_record(workflow_id, record);
}

void StateStore::update_status(const std::string& workflow_id,
                               ExecutionStatus status,
                               const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    StateRecord record = require(workflow_id);
    record.apply_status(status, error);
    store_record(workflow_id, record);
}

bool StateStore::record_step(const std::string& workflow_id,
                             const std::string& execution_id,
                             const std::string& step_name,
                             const nlohmann::json& step_output,
                             double progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = load_record(workflow_id);
    if (!record || record->execution_id != execution_id) {
        return false;
    }
    record->apply_step_completed(step_name, step_output);
    record->apply_progress(progress, step_name);
    store_record(workflow_id, *record);
    return true;
}

bool StateStore::finalize(const std::string& workflow_id,
                          const std::string& execution_id,
                          ExecutionStatus status,
                          const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = load_record(workflow_id);
    if (!record || record->execution_id != execution_id) {
        return false;
    }
    if (status == ExecutionStatus::completed) {
        record->apply_progress(1.0);
    }
    record->apply_status(status, error);
    store_record(workflow_id, *record);
    return true;
}

size_t StateStore::cleanup_expired(std::chrono::milliseconds max_age) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    size_t removed = 0;
    for (const auto& record : load_all()) {
        if (now - record.created_at >= max_age) {
            if (erase_record(record.workflow_id)) {
                ++removed;
            }
        }
    }
    return removed;
}

std::vector<StateRecord> StateStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_all();
}

size_t StateStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_all().size();
}

std::optional<StateRecord> MemoryStateStore::load_record(const std::string& workflow_id) {
    auto it = records_.find(workflow_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStateStore::store_record(const std::string& workflow_id, const StateRecord& record) {
    records_[workflow_id] = record;
}

bool MemoryStateStore::erase_record(const std::string& workflow_id) {
    return records_.erase(workflow_id) > 0;
}

std::vector<StateRecord> MemoryStateStore::load_all() {
    std::vector<StateRecord> all;
    all.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        all.push_back(record);
    }
    return all;
}

} // namespace workflow
} // namespace flowcore
