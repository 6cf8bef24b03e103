#include "flowcore/workflow/sandbox_executor.hpp"
#include <chrono>
#include <thread>

namespace flowcore {
namespace workflow {

SandboxExecutor::SandboxExecutor(std::string agent_type, int64_t simulated_latency_ms)
    : BaseStepExecutor(std::move(agent_type)), simulated_latency_ms_(simulated_latency_ms) {}

caf::expected<StepResult> SandboxExecutor::execute_impl(const StepRequest& req, const StepContext& ctx) {
    if (simulated_latency_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(simulated_latency_ms_));
    }

    nlohmann::json seen_inputs = nlohmann::json::array();
    if (req.inputs.is_object()) {
        for (auto it = req.inputs.begin(); it != req.inputs.end(); ++it) {
            seen_inputs.push_back(it.key());
        }
    }

    nlohmann::json outputs = nlohmann::json::object();
    for (const auto& name : req.expected_outputs) {
        outputs[name] = {
            {"sandbox", true},
            {"agent_type", agent_type_},
            {"step", req.step_name},
            {"output", name},
            {"inputs", seen_inputs}
        };
    }

    return StepResult::success(metadata_from_context(req, ctx), std::move(outputs), simulated_latency_ms_);
}

size_t register_sandbox_executors(ExecutorRegistry& registry,
                                  const WorkflowDefinition& definition,
                                  int64_t simulated_latency_ms) {
    size_t registered = 0;
    for (const auto& step : definition.steps()) {
        if (registry.contains(step.agent_type)) {
            continue;
        }
        registry.register_executor(std::make_shared<SandboxExecutor>(step.agent_type, simulated_latency_ms));
        ++registered;
    }
    return registered;
}

} // namespace workflow
} // namespace flowcore
