#pragma once

#include "flowcore/workflow/core.hpp"
#include "flowcore/workflow/retry_policy.hpp"
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

/**
 * Declarative contract for one unit of work.
 *
 * A step names the executor that performs it (`agent_type`), the context
 * keys it reads and the keys it promises to produce. The engine resolves
 * inputs from the execution context before invoking the executor and
 * merges only the declared outputs back.
 */
struct WorkflowStep {
    std::string name;
    std::string description;
    std::string agent_type;
    std::set<std::string> required_inputs;
    std::set<std::string> optional_inputs;
    std::set<std::string> outputs;
    int64_t timeout_ms = 300000;
    RetryPolicy retry_policy;
    nlohmann::json metadata = nlohmann::json::object();

    // Names of required inputs absent from `provided`, sorted
    std::vector<std::string> validate_inputs(const nlohmann::json& provided) const;

    std::set<std::string> all_inputs() const;

    nlohmann::json to_json() const;

    // Throws ValidationError when `name` or `agent_type` is missing
    static WorkflowStep from_json(const nlohmann::json& j);
};

} // namespace workflow
} // namespace flowcore
