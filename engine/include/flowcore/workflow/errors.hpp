#pragma once

#include "flowcore/workflow/core.hpp"
#include <stdexcept>
#include <string>

namespace flowcore {
namespace workflow {

// Why a workflow definition was rejected
enum class ValidationIssue {
    none,
    no_steps,
    duplicate_step,
    unknown_step,
    cycle_detected,
    unsatisfied_input
};

/**
 * Base class of every error the engine throws.
 *
 * Carries a machine-readable ErrorCode and, for per-step failures, the name
 * of the step that triggered it, so callers can branch without parsing
 * what().
 */
class WorkflowError : public std::runtime_error {
public:
    WorkflowError(ErrorCode code, const std::string& message, std::string step_name = "")
        : std::runtime_error(message), code_(code), step_name_(std::move(step_name)) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& step_name() const noexcept { return step_name_; }

private:
    ErrorCode code_;
    std::string step_name_;
};

// Malformed, cyclic or unsatisfiable definition. Raised at registration.
class ValidationError : public WorkflowError {
public:
    ValidationError(ValidationIssue issue, const std::string& message, std::string step_name = "")
        : WorkflowError(ErrorCode::validation_failed, message, std::move(step_name)), issue_(issue) {}

    ValidationIssue issue() const noexcept { return issue_; }

protected:
    ValidationError(ErrorCode code, const std::string& message)
        : WorkflowError(code, message), issue_(ValidationIssue::none) {}

private:
    ValidationIssue issue_;
};

class DuplicateDefinitionError : public ValidationError {
public:
    explicit DuplicateDefinitionError(const std::string& workflow_id)
        : ValidationError(ErrorCode::duplicate_definition, "workflow already registered: " + workflow_id) {}
};

class NotFoundError : public WorkflowError {
public:
    explicit NotFoundError(const std::string& message)
        : WorkflowError(ErrorCode::not_found, message) {}
};

// Caller-retryable: the engine is at max_concurrent_workflows
class ConcurrencyLimitError : public WorkflowError {
public:
    explicit ConcurrencyLimitError(const std::string& message)
        : WorkflowError(ErrorCode::concurrency_limit, message) {}
};

class MissingInputError : public WorkflowError {
public:
    MissingInputError(const std::string& step_name, const std::string& input_name)
        : WorkflowError(ErrorCode::missing_input,
                        "step '" + step_name + "' is missing required input '" + input_name + "'",
                        step_name),
          input_name_(input_name) {}

    const std::string& input_name() const noexcept { return input_name_; }

private:
    std::string input_name_;
};

class StepTimeoutError : public WorkflowError {
public:
    StepTimeoutError(const std::string& step_name, int64_t timeout_ms)
        : WorkflowError(ErrorCode::step_timeout,
                        "step '" + step_name + "' timed out after " + std::to_string(timeout_ms) + "ms",
                        step_name) {}
};

/**
 * Executor failure tagged with the step name and an error kind.
 *
 * The kind is the string form of the underlying ErrorCode (for example
 * "NETWORK_ERROR") and is what a step's retryable_kinds are matched against.
 */
class StepExecutionError : public WorkflowError {
public:
    StepExecutionError(const std::string& step_name, ErrorCode cause, std::string kind, const std::string& message)
        : WorkflowError(cause, "step '" + step_name + "' failed: " + message, step_name),
          kind_(std::move(kind)) {}

    const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

// Invalid progress value or an illegal status transition
class StateError : public WorkflowError {
public:
    explicit StateError(const std::string& message)
        : WorkflowError(ErrorCode::state_error, message) {}
};

} // namespace workflow
} // namespace flowcore
