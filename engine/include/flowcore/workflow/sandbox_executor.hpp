#pragma once

#include "flowcore/workflow/executor_registry.hpp"
#include "flowcore/workflow/step_executor.hpp"
#include "flowcore/workflow/workflow_definition.hpp"
#include <string>

namespace flowcore {
namespace workflow {

/**
 * Dry-run executor: performs no work and fabricates every output the step
 * declares, so a definition can be exercised end to end without real
 * agents. Each fabricated value records which agent and step produced it
 * and which inputs it saw.
 */
class SandboxExecutor : public BaseStepExecutor {
public:
    explicit SandboxExecutor(std::string agent_type, int64_t simulated_latency_ms = 0);

protected:
    caf::expected<StepResult> execute_impl(const StepRequest& req, const StepContext& ctx) override;

private:
    int64_t simulated_latency_ms_;
};

// Registers a SandboxExecutor for every agent type in `definition` that has
// no executor yet. Returns the number registered.
size_t register_sandbox_executors(ExecutorRegistry& registry,
                                  const WorkflowDefinition& definition,
                                  int64_t simulated_latency_ms = 0);

} // namespace workflow
} // namespace flowcore
