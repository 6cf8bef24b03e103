#pragma once

#include "flowcore/workflow/core.hpp"
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/step_graph.hpp"
#include "flowcore/workflow/workflow_step.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

// Structured outcome of WorkflowDefinition::validate()
struct ValidationResult {
    bool valid = true;
    ValidationIssue issue = ValidationIssue::none;
    std::string step_name;
    std::string message;

    static ValidationResult ok() { return ValidationResult{}; }

    static ValidationResult fail(ValidationIssue issue, std::string message, std::string step_name = "") {
        ValidationResult result;
        result.valid = false;
        result.issue = issue;
        result.message = std::move(message);
        result.step_name = std::move(step_name);
        return result;
    }
};

/**
 * A DAG of steps plus its dependency map.
 *
 * `dependencies()` is keyed by the dependent step and lists its
 * prerequisites: after `add_dependency("a", "b")`, `dependencies()["b"]`
 * contains "a".
 *
 * Mutable while being built; WorkflowEngine::register_workflow freezes it,
 * after which every mutator throws StateError.
 */
class WorkflowDefinition {
public:
    WorkflowDefinition(std::string id,
                       std::string name,
                       std::string description = "",
                       std::string version = "1.0.0");

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::string& version() const { return version_; }
    const std::vector<WorkflowStep>& steps() const { return steps_; }
    const std::map<std::string, std::vector<std::string>>& dependencies() const { return dependencies_; }
    const std::set<std::string>& initial_inputs() const { return initial_inputs_; }
    ExecutionStrategy strategy() const { return strategy_; }
    int64_t max_execution_time_ms() const { return max_execution_time_ms_; }
    const nlohmann::json& metadata() const { return metadata_; }
    TimePoint created_at() const { return created_at_; }
    TimePoint updated_at() const { return updated_at_; }
    bool frozen() const { return frozen_; }

    void add_step(WorkflowStep step);

    // `to` requires `from`; duplicates are ignored
    void add_dependency(const std::string& from, const std::string& to);

    void set_initial_inputs(std::set<std::string> inputs);
    void set_strategy(ExecutionStrategy strategy);
    void set_max_execution_time_ms(int64_t ms);

    // Shallow merge of `updates` into the metadata object
    void update_metadata(const nlohmann::json& updates);

    const WorkflowStep* find_step(const std::string& name) const;

    // Prerequisites of `name`, in insertion order
    std::vector<std::string> get_step_dependencies(const std::string& name) const;

    // Steps that list `name` as a prerequisite, in declaration order
    std::vector<std::string> get_dependent_steps(const std::string& name) const;

    /**
     * Checks, in order: at least one step, unique step names, dependency
     * references, acyclicity and input availability along the computed
     * order. Never throws.
     */
    ValidationResult validate() const;

    // Throws ValidationError on a cycle or dangling reference
    std::vector<std::string> get_execution_order() const;

    // Not-completed steps whose prerequisites are all completed
    std::vector<std::string> get_parallel_steps(const std::set<std::string>& completed) const;

    std::vector<std::string> get_next_steps(const std::string& current,
                                            const std::set<std::string>& completed) const;

    nlohmann::json to_json() const;

    static std::shared_ptr<WorkflowDefinition> from_json(const nlohmann::json& j);

private:
    friend class WorkflowEngine;

    void freeze() { frozen_ = true; }
    void ensure_mutable(const char* operation) const;
    void touch();
    StepGraph build_graph() const;
    bool prerequisites_met(const std::string& step, const std::set<std::string>& completed) const;

    std::string id_;
    std::string name_;
    std::string description_;
    std::string version_;
    std::vector<WorkflowStep> steps_;
    std::map<std::string, std::vector<std::string>> dependencies_;
    std::set<std::string> initial_inputs_;
    ExecutionStrategy strategy_ = ExecutionStrategy::sequential;
    int64_t max_execution_time_ms_ = 0;
    nlohmann::json metadata_ = nlohmann::json::object();
    TimePoint created_at_;
    TimePoint updated_at_;
    bool frozen_ = false;
};

} // namespace workflow
} // namespace flowcore
