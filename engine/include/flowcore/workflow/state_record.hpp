#pragma once

#include "flowcore/workflow/core.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

/**
 * Persisted progress of a workflow execution.
 *
 * Invariants kept by the mutators below:
 * - steps_completed and steps_remaining are disjoint
 * - steps_completed holds no duplicates and keeps completion order
 * - progress stays within [0, 1]
 * - updated_at never moves backwards
 */
struct StateRecord {
    std::string workflow_id;
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::pending;
    std::string current_step;
    std::vector<std::string> steps_completed;
    std::set<std::string> steps_remaining;
    double progress = 0.0;
    nlohmann::json data = nlohmann::json::object();
    std::optional<std::string> error;
    TimePoint created_at = Clock::now();
    TimePoint updated_at = created_at;
    nlohmann::json metadata = nlohmann::json::object();

    bool is_step_completed(const std::string& step_name) const;

    // Throws StateError for values outside [0, 1] or NaN; record unchanged
    void apply_progress(double value, const std::optional<std::string>& step = std::nullopt);

    // Idempotent. The output, when given, lands in data["step_<name>"].
    void apply_step_completed(const std::string& step_name,
                              const std::optional<nlohmann::json>& output = std::nullopt);

    // Throws StateError on a transition the execution state machine forbids
    void apply_status(ExecutionStatus next, const std::optional<std::string>& error_message = std::nullopt);

    // Advances updated_at to `now` unless it is already later
    void touch(TimePoint now = Clock::now());

    nlohmann::json to_json() const;

    // Throws StateError on unknown status strings or malformed timestamps
    static StateRecord from_json(const nlohmann::json& j);
};

} // namespace workflow
} // namespace flowcore
