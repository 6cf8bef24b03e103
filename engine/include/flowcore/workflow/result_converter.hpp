#pragma once

#include "flowcore/workflow/core.hpp"
#include <optional>
#include <string>

namespace flowcore {
namespace workflow {

// Converter utilities between engine enums and their wire/log strings.
// The strings are part of the persisted state record shape and of the
// event payloads, so they must stay stable.
class ResultConverter {
public:
    static std::string status_to_string(ExecutionStatus status) {
        switch (status) {
            case ExecutionStatus::pending:
                return "pending";
            case ExecutionStatus::running:
                return "running";
            case ExecutionStatus::waiting:
                return "waiting";
            case ExecutionStatus::completed:
                return "completed";
            case ExecutionStatus::failed:
                return "failed";
            case ExecutionStatus::terminated:
                return "terminated";
            default:
                return "failed";
        }
    }

    // Unknown strings yield nullopt; callers decide whether that is an error
    static std::optional<ExecutionStatus> string_to_status(const std::string& status_str) {
        if (status_str == "pending") {
            return ExecutionStatus::pending;
        } else if (status_str == "running") {
            return ExecutionStatus::running;
        } else if (status_str == "waiting" || status_str == "waiting_for_input") {
            return ExecutionStatus::waiting;
        } else if (status_str == "completed") {
            return ExecutionStatus::completed;
        } else if (status_str == "failed") {
            return ExecutionStatus::failed;
        } else if (status_str == "terminated") {
            return ExecutionStatus::terminated;
        }
        return std::nullopt;
    }

    static std::string step_status_to_string(StepStatus status) {
        switch (status) {
            case StepStatus::ok:
                return "success";
            case StepStatus::error:
                return "error";
            case StepStatus::timeout:
                return "timeout";
            case StepStatus::cancelled:
                return "cancelled";
            default:
                return "error";
        }
    }

    // Error kinds are the strings listed in a step's retryable_kinds
    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::validation_failed:
                return "VALIDATION_FAILED";
            case ErrorCode::duplicate_definition:
                return "DUPLICATE_DEFINITION";
            case ErrorCode::not_found:
                return "NOT_FOUND";
            case ErrorCode::concurrency_limit:
                return "CONCURRENCY_LIMIT";
            case ErrorCode::missing_input:
                return "MISSING_INPUT";
            case ErrorCode::workflow_timeout:
                return "WORKFLOW_TIMEOUT";
            case ErrorCode::terminated:
                return "TERMINATED";
            case ErrorCode::step_timeout:
                return "STEP_TIMEOUT";
            case ErrorCode::execution_failed:
                return "EXECUTION_FAILED";
            case ErrorCode::executor_not_found:
                return "EXECUTOR_NOT_FOUND";
            case ErrorCode::output_contract_violation:
                return "OUTPUT_CONTRACT_VIOLATION";
            case ErrorCode::network_error:
                return "NETWORK_ERROR";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::state_error:
                return "STATE_ERROR";
            case ErrorCode::internal_error:
                return "INTERNAL_ERROR";
            default:
                return "UNKNOWN_ERROR";
        }
    }

    static std::string strategy_to_string(ExecutionStrategy strategy) {
        switch (strategy) {
            case ExecutionStrategy::sequential:
                return "sequential";
            case ExecutionStrategy::parallel:
                return "parallel";
            case ExecutionStrategy::adaptive:
                return "adaptive";
            default:
                return "sequential";
        }
    }

    static std::optional<ExecutionStrategy> string_to_strategy(const std::string& value) {
        if (value == "sequential") {
            return ExecutionStrategy::sequential;
        } else if (value == "parallel") {
            return ExecutionStrategy::parallel;
        } else if (value == "adaptive") {
            return ExecutionStrategy::adaptive;
        }
        return std::nullopt;
    }

    // Consistency check for results coming back from executors
    static bool validate_result(const StepResult& result) {
        if (result.status == StepStatus::ok && result.error_code != ErrorCode::none) {
            return false;
        }
        if (result.status == StepStatus::error && result.error_code == ErrorCode::none) {
            return false;
        }
        if (result.latency_ms < 0) {
            return false;
        }
        if (!result.outputs.is_object()) {
            return false;
        }
        return true;
    }
};

} // namespace workflow
} // namespace flowcore
