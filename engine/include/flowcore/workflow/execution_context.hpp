#pragma once

#include "flowcore/workflow/core.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

/**
 * Live state of one workflow execution.
 *
 * Shared by the engine, its worker threads and callers through
 * std::shared_ptr. Readers get copies taken under the context mutex; all
 * mutation is reserved to WorkflowEngine.
 */
class ExecutionContext {
public:
    explicit ExecutionContext(std::string workflow_id,
                              std::string execution_id = generate_execution_id(),
                              nlohmann::json data = nlohmann::json::object());

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const std::string& workflow_id() const { return workflow_id_; }
    const std::string& execution_id() const { return execution_id_; }

    ExecutionStatus status() const;
    std::optional<TimePoint> start_time() const;
    std::optional<TimePoint> end_time() const;
    std::string current_step() const;
    nlohmann::json data() const;
    nlohmann::json metadata() const;
    std::optional<std::string> error() const;
    std::vector<std::string> completed_steps() const;

    // "exec-" followed by 16 random hex digits
    static std::string generate_execution_id();

private:
    friend class WorkflowEngine;

    // False, leaving the status unchanged, when the state machine forbids it
    bool try_transition(ExecutionStatus next);

    void merge_input(const nlohmann::json& input);
    void mark_started();
    void mark_finished();
    void set_current_step(const std::string& step_name);
    void set_error(const std::string& message);
    void set_metadata(const std::string& key, nlohmann::json value);

    // Merges `outputs` into data and records the step as completed
    void commit_step(const std::string& step_name, const nlohmann::json& outputs);

    const std::string workflow_id_;
    const std::string execution_id_;

    mutable std::mutex mutex_;
    ExecutionStatus status_ = ExecutionStatus::pending;
    std::optional<TimePoint> start_time_;
    std::optional<TimePoint> end_time_;
    std::string current_step_;
    nlohmann::json data_;
    nlohmann::json metadata_ = nlohmann::json::object();
    std::optional<std::string> error_;
    std::vector<std::string> completed_steps_;
};

} // namespace workflow
} // namespace flowcore
