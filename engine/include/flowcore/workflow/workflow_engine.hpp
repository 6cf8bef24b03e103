#pragma once

#include "flowcore/workflow/engine_config.hpp"
#include "flowcore/workflow/event_bus.hpp"
#include "flowcore/workflow/execution_context.hpp"
#include "flowcore/workflow/executor_registry.hpp"
#include "flowcore/workflow/observability.hpp"
#include "flowcore/workflow/state_store.hpp"
#include "flowcore/workflow/worker_pool.hpp"
#include "flowcore/workflow/workflow_definition.hpp"
#include "flowcore/workflow/workflow_result.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flowcore {
namespace workflow {

/**
 * Registers workflow definitions and drives their executions.
 *
 * Steps run on the engine's worker pool in dependency order, either one at
 * a time along the topological order or as whole frontiers of ready steps.
 * Each attempt is bounded by the step timeout and retried per the step's
 * RetryPolicy. Progress goes to the StateStore (keyed by workflow id) and
 * lifecycle events to the EventBus.
 *
 * execute() throws only for problems detected before the run starts;
 * step failures come back as a failed WorkflowResult.
 */
class WorkflowEngine {
public:
    explicit WorkflowEngine(EngineConfig config = EngineConfig{},
                            std::shared_ptr<StateStore> state_store = nullptr,
                            std::shared_ptr<ExecutorRegistry> executors = nullptr);
    ~WorkflowEngine();

    WorkflowEngine(const WorkflowEngine&) = delete;
    WorkflowEngine& operator=(const WorkflowEngine&) = delete;

    /**
     * Validates and stores `definition`, then freezes it.
     * Throws ValidationError, or DuplicateDefinitionError when the id is
     * taken; the earlier registration is left untouched.
     */
    void register_workflow(std::shared_ptr<WorkflowDefinition> definition);

    /**
     * Runs a registered workflow to a terminal status.
     *
     * Throws NotFoundError for an unknown id, ConcurrencyLimitError when
     * max_concurrent_workflows executions are running, and StateError when
     * `context` is terminal or already running.
     */
    WorkflowResult execute(const std::string& workflow_id,
                           const nlohmann::json& input_data = nlohmann::json::object(),
                           std::shared_ptr<ExecutionContext> context = nullptr);

    /**
     * Cooperative termination: the execution stops before its next step or
     * frontier. Throws NotFoundError for an unknown execution and
     * StateError when it already finished.
     */
    void terminate(const std::string& execution_id, const std::string& reason);

    std::optional<StateRecord> get_state(const std::string& workflow_id);
    void update_state(const std::string& workflow_id, StateRecord record);

    std::shared_ptr<const WorkflowDefinition> get_definition(const std::string& workflow_id) const;
    std::vector<std::string> list_workflows() const;

    size_t running_count() const;

    // Running or recently finished execution; nullptr when unknown
    std::shared_ptr<ExecutionContext> get_execution(const std::string& execution_id) const;

    ExecutorRegistry& executors() { return *executors_; }
    EventBus& event_bus() { return *event_bus_; }
    StateStore& state_store() { return *state_store_; }
    Observability& observability() { return *observability_; }
    const EngineConfig& config() const { return config_; }

private:
    // Fatal cause of a failed execution
    struct StepFailure {
        ErrorCode code = ErrorCode::execution_failed;
        std::string kind;
        std::string step_name;
        std::string message;
    };

    struct StepOutcome {
        bool ran = true; // false when a frontier stopped before dispatching it
        bool ok = false;
        nlohmann::json outputs = nlohmann::json::object();
        std::vector<std::string> warnings;
        int32_t retries = 0;
        StepFailure failure;
    };

    // Releases a concurrency slot on scope exit
    class RunningSlot {
    public:
        RunningSlot(WorkflowEngine& engine, std::string execution_id)
            : engine_(engine), execution_id_(std::move(execution_id)) {}
        ~RunningSlot() { engine_.release_slot(execution_id_); }
        RunningSlot(const RunningSlot&) = delete;
        RunningSlot& operator=(const RunningSlot&) = delete;

    private:
        WorkflowEngine& engine_;
        std::string execution_id_;
    };

    void acquire_slot(const std::shared_ptr<ExecutionContext>& context);
    void release_slot(const std::string& execution_id);
    void retain_execution(const std::shared_ptr<ExecutionContext>& context);

    WorkflowResult run(const WorkflowDefinition& definition, const std::shared_ptr<ExecutionContext>& context);

    std::optional<StepFailure> check_interrupt(const WorkflowDefinition& definition,
                                               const ExecutionContext& context,
                                               std::chrono::steady_clock::time_point started,
                                               const std::string& next_step) const;

    // Never throws: anything escaping attempt_step becomes an EXECUTION_FAILED outcome
    StepOutcome run_step(const WorkflowStep& step, const std::shared_ptr<ExecutionContext>& context);
    StepOutcome attempt_step(const WorkflowStep& step, const std::shared_ptr<ExecutionContext>& context);
    StepOutcome fail_step(const WorkflowStep& step,
                          const ExecutionContext& context,
                          StepFailure failure,
                          int32_t attempt);

    // Dispatches in pool-sized batches; stops after a batch with a failure or
    // once the execution is interrupted
    std::vector<StepOutcome> run_frontier(const WorkflowDefinition& definition,
                                          const std::vector<std::string>& frontier,
                                          const std::shared_ptr<ExecutionContext>& context,
                                          std::chrono::steady_clock::time_point started);

    void commit_step(const WorkflowStep& step,
                     const StepOutcome& outcome,
                     ExecutionContext& context,
                     WorkflowResult& result,
                     size_t total_steps);

    StepFailure make_failure(const WorkflowError& error, ErrorCode code) const;
    void publish(const std::string& event_type, nlohmann::json payload);

    // Final status write; skipped when another execution owns the record
    void finalize_record(const ExecutionContext& context,
                         ExecutionStatus status,
                         const std::optional<std::string>& error);

    template <class F>
    void with_state(const ExecutionContext& context, const char* operation, F&& fn);

    EngineConfig config_;
    std::shared_ptr<Observability> observability_;
    std::shared_ptr<StateStore> state_store_;
    std::shared_ptr<ExecutorRegistry> executors_;
    std::unique_ptr<EventBus> event_bus_;

    mutable std::mutex definitions_mutex_;
    std::map<std::string, std::shared_ptr<WorkflowDefinition>> definitions_;

    mutable std::mutex executions_mutex_;
    std::map<std::string, std::shared_ptr<ExecutionContext>> running_;
    std::map<std::string, std::shared_ptr<ExecutionContext>> retained_;
    std::deque<std::string> retained_order_;

    // Declared last so its threads are joined before the other members go
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace workflow
} // namespace flowcore
