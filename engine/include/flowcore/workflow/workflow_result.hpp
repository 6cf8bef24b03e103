#pragma once

#include "flowcore/workflow/core.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

// Outcome of one execution, built once it reached a terminal status
struct WorkflowResult {
    std::string workflow_id;
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::pending;
    bool success = false;
    nlohmann::json steps_results = nlohmann::json::object(); // step name -> declared outputs
    nlohmann::json data = nlohmann::json::object();
    TimePoint start_time;
    std::optional<TimePoint> end_time;
    int64_t duration_ms = 0;
    std::vector<std::string> errors;   // first fatal cause first
    std::vector<std::string> warnings;
    ErrorCode error_code = ErrorCode::none;
    std::string failed_step;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const;
};

} // namespace workflow
} // namespace flowcore
