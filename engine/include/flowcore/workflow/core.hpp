#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

// Forward declarations
class StepExecutor;
class WorkflowEngine;
class Observability;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Execution lifecycle: pending -> running -> {completed | failed | terminated}
enum class ExecutionStatus {
    pending,
    running,
    waiting,
    completed,
    failed,
    terminated
};

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::completed ||
           status == ExecutionStatus::failed ||
           status == ExecutionStatus::terminated;
}

// Allowed edges of the execution state machine
inline bool is_valid_transition(ExecutionStatus from, ExecutionStatus to) {
    if (is_terminal(from)) {
        return false;
    }
    switch (from) {
        case ExecutionStatus::pending:
            return to == ExecutionStatus::running ||
                   to == ExecutionStatus::failed ||
                   to == ExecutionStatus::terminated;
        case ExecutionStatus::running:
            return to == ExecutionStatus::waiting ||
                   to == ExecutionStatus::completed ||
                   to == ExecutionStatus::failed ||
                   to == ExecutionStatus::terminated;
        case ExecutionStatus::waiting:
            return to == ExecutionStatus::running ||
                   to == ExecutionStatus::failed ||
                   to == ExecutionStatus::terminated;
        default:
            return false;
    }
}

// Step attempt status, as reported by executors
enum class StepStatus {
    ok,
    error,
    timeout,
    cancelled
};

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Definition errors (1xxx)
    validation_failed = 1001,
    duplicate_definition = 1002,
    not_found = 1003,
    // Scheduling errors (2xxx)
    concurrency_limit = 2001,
    missing_input = 2002,
    workflow_timeout = 2003,
    terminated = 2004,
    // Step errors (3xxx)
    step_timeout = 3001,
    execution_failed = 3002,
    executor_not_found = 3003,
    output_contract_violation = 3004,
    network_error = 3005,
    invalid_input = 3006,
    // State errors (4xxx)
    state_error = 4001,
    internal_error = 4002
};

// Correlation metadata attached to every step result
struct ResultMetadata {
    std::string workflow_id;
    std::string execution_id;
    std::string step_name;
    std::string agent_type;
    int32_t attempt = 0;
};

// What an executor receives for one attempt of one step
struct StepRequest {
    std::string step_name;
    std::string agent_type;
    nlohmann::json inputs = nlohmann::json::object();
    std::vector<std::string> expected_outputs;
    int64_t timeout_ms = 300000;
    int32_t attempt = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

// Execution identity handed to executors alongside the request
struct StepContext {
    std::string workflow_id;
    std::string execution_id;
    std::string step_name;
};

// Unified result type for all step executions
struct StepResult {
    StepStatus status = StepStatus::ok;
    ErrorCode error_code = ErrorCode::none;
    nlohmann::json outputs = nlohmann::json::object();
    std::string error_message;
    ResultMetadata metadata;
    int64_t latency_ms = 0;

    bool is_success() const { return status == StepStatus::ok; }
    bool is_error() const { return status == StepStatus::error; }
    bool is_timeout() const { return status == StepStatus::timeout; }
    bool is_cancelled() const { return status == StepStatus::cancelled; }

    static StepResult success(const ResultMetadata& meta,
                              nlohmann::json outputs = nlohmann::json::object(),
                              int64_t latency_ms = 0) {
        StepResult result;
        result.status = StepStatus::ok;
        result.error_code = ErrorCode::none;
        result.metadata = meta;
        result.outputs = std::move(outputs);
        result.latency_ms = latency_ms;
        return result;
    }

    static StepResult error_result(ErrorCode code, const std::string& message,
                                   const ResultMetadata& meta,
                                   int64_t latency_ms = 0) {
        StepResult result;
        result.status = StepStatus::error;
        result.error_code = code;
        result.error_message = message;
        result.metadata = meta;
        result.latency_ms = latency_ms;
        return result;
    }

    static StepResult timeout_result(const ResultMetadata& meta, int64_t latency_ms = 0) {
        StepResult result;
        result.status = StepStatus::timeout;
        result.error_code = ErrorCode::step_timeout;
        result.metadata = meta;
        result.latency_ms = latency_ms;
        return result;
    }

    static StepResult cancelled_result(const ResultMetadata& meta, int64_t latency_ms = 0) {
        StepResult result;
        result.status = StepStatus::cancelled;
        result.error_code = ErrorCode::terminated;
        result.metadata = meta;
        result.latency_ms = latency_ms;
        return result;
    }
};

struct ExecutorMetrics {
    int64_t latency_ms = 0;
    int64_t success_count = 0;
    int64_t error_count = 0;
};

// How a definition wants its steps dispatched
enum class ExecutionStrategy {
    sequential,
    parallel,
    adaptive
};

} // namespace workflow
} // namespace flowcore
