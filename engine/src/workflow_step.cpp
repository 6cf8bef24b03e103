#include "flowcore/workflow/workflow_step.hpp"
#include "flowcore/workflow/errors.hpp"

namespace flowcore {
namespace workflow {

std::vector<std::string> WorkflowStep::validate_inputs(const nlohmann::json& provided) const {
    std::vector<std::string> missing;
    for (const auto& input : required_inputs) {
        if (!provided.is_object() || !provided.contains(input)) {
            missing.push_back(input);
        }
    }
    // std::set iteration already yields sorted names
    return missing;
}

std::set<std::string> WorkflowStep::all_inputs() const {
    std::set<std::string> result = required_inputs;
    result.insert(optional_inputs.begin(), optional_inputs.end());
    return result;
}

nlohmann::json WorkflowStep::to_json() const {
    return nlohmann::json{
        {"name", name},
        {"description", description},
        {"agent_type", agent_type},
        {"required_inputs", required_inputs},
        {"optional_inputs", optional_inputs},
        {"outputs", outputs},
        {"timeout_ms", timeout_ms},
        {"retry_policy", retry_policy.to_json()},
        {"metadata", metadata}
    };
}

WorkflowStep WorkflowStep::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("name") || !j.at("name").is_string()) {
        throw ValidationError(ValidationIssue::unknown_step, "step definition without a name");
    }

    WorkflowStep step;
    step.name = j.at("name").get<std::string>();
    if (!j.contains("agent_type") || !j.at("agent_type").is_string()) {
        throw ValidationError(ValidationIssue::unknown_step,
                              "step '" + step.name + "' has no agent_type", step.name);
    }
    step.agent_type = j.at("agent_type").get<std::string>();
    step.description = j.value("description", std::string());

    if (j.contains("required_inputs")) {
        step.required_inputs = j.at("required_inputs").get<std::set<std::string>>();
    }
    if (j.contains("optional_inputs")) {
        step.optional_inputs = j.at("optional_inputs").get<std::set<std::string>>();
    }
    if (j.contains("outputs")) {
        step.outputs = j.at("outputs").get<std::set<std::string>>();
    }
    step.timeout_ms = j.value("timeout_ms", step.timeout_ms);
    if (j.contains("retry_policy")) {
        step.retry_policy = RetryPolicy::from_json(j.at("retry_policy"));
    }
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        step.metadata = j.at("metadata");
    }
    return step;
}

} // namespace workflow
} // namespace flowcore
