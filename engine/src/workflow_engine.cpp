#include "flowcore/workflow/workflow_engine.hpp"
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/result_converter.hpp"
#include "flowcore/workflow/sqlite_state_store.hpp"
#include "flowcore/workflow/timeout_enforcement.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace flowcore {
namespace workflow {

namespace {

double seconds_since(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
}

nlohmann::json key_list(const nlohmann::json& object) {
    nlohmann::json keys = nlohmann::json::array();
    if (object.is_object()) {
        for (auto it = object.begin(); it != object.end(); ++it) {
            keys.push_back(it.key());
        }
    }
    return keys;
}

} // namespace

WorkflowEngine::WorkflowEngine(EngineConfig config,
                               std::shared_ptr<StateStore> state_store,
                               std::shared_ptr<ExecutorRegistry> executors)
    : config_(std::move(config)),
      observability_(std::make_shared<Observability>("workflow_engine")),
      state_store_(std::move(state_store)),
      executors_(executors ? std::move(executors) : std::make_shared<ExecutorRegistry>()),
      event_bus_(std::make_unique<EventBus>(static_cast<size_t>(std::max(config_.max_event_history, 0)),
                                            observability_)),
      pool_(std::make_unique<WorkerPool>(config_.step_pool_size)) {
    if (!state_store_) {
        if (config_.state_db_path.empty()) {
            state_store_ = std::make_shared<MemoryStateStore>();
        } else {
            state_store_ = std::make_shared<SqliteStateStore>(config_.state_db_path);
        }
    }

    observability_->log_info("Workflow engine initialized", "", "", "", {
        {"max_concurrent_workflows", std::to_string(config_.max_concurrent_workflows)},
        {"step_pool_size", std::to_string(pool_->concurrency())},
        {"enable_parallel", config_.enable_parallel ? "true" : "false"}
    });
}

WorkflowEngine::~WorkflowEngine() = default;

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void WorkflowEngine::register_workflow(std::shared_ptr<WorkflowDefinition> definition) {
    if (!definition) {
        throw ValidationError(ValidationIssue::none, "null workflow definition");
    }

    std::lock_guard<std::mutex> lock(definitions_mutex_);
    if (definitions_.count(definition->id()) > 0) {
        throw DuplicateDefinitionError(definition->id());
    }

    auto validation = definition->validate();
    if (!validation.valid) {
        observability_->log_warn("Workflow definition rejected", definition->id(), "", validation.step_name,
                                 {{"reason", validation.message}});
        throw ValidationError(validation.issue, validation.message, validation.step_name);
    }

    definition->freeze();
    definitions_.emplace(definition->id(), definition);

    observability_->log_info("Workflow registered", definition->id(), "", "", {
        {"steps", std::to_string(definition->steps().size())},
        {"strategy", ResultConverter::strategy_to_string(definition->strategy())}
    });
}

std::shared_ptr<const WorkflowDefinition> WorkflowEngine::get_definition(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(definitions_mutex_);
    auto it = definitions_.find(workflow_id);
    if (it == definitions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> WorkflowEngine::list_workflows() const {
    std::lock_guard<std::mutex> lock(definitions_mutex_);
    std::vector<std::string> ids;
    ids.reserve(definitions_.size());
    for (const auto& [id, definition] : definitions_) {
        ids.push_back(id);
    }
    return ids;
}

// ---------------------------------------------------------------------------
// Concurrency slots and execution tracking
// ---------------------------------------------------------------------------

void WorkflowEngine::acquire_slot(const std::shared_ptr<ExecutionContext>& context) {
    std::lock_guard<std::mutex> lock(executions_mutex_);
    if (running_.count(context->execution_id()) > 0) {
        throw StateError("execution '" + context->execution_id() + "' is already running");
    }
    if (static_cast<int>(running_.size()) >= config_.max_concurrent_workflows) {
        throw ConcurrencyLimitError("max concurrent workflows reached (" +
                                    std::to_string(config_.max_concurrent_workflows) + ")");
    }
    running_.emplace(context->execution_id(), context);
    observability_->set_running_workflows(static_cast<int64_t>(running_.size()));
}

void WorkflowEngine::release_slot(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(executions_mutex_);
    running_.erase(execution_id);
    observability_->set_running_workflows(static_cast<int64_t>(running_.size()));
}

void WorkflowEngine::retain_execution(const std::shared_ptr<ExecutionContext>& context) {
    std::lock_guard<std::mutex> lock(executions_mutex_);
    if (retained_.emplace(context->execution_id(), context).second) {
        retained_order_.push_back(context->execution_id());
    }
    while (static_cast<int>(retained_order_.size()) > std::max(config_.max_retained_executions, 0)) {
        retained_.erase(retained_order_.front());
        retained_order_.pop_front();
    }
}

size_t WorkflowEngine::running_count() const {
    std::lock_guard<std::mutex> lock(executions_mutex_);
    return running_.size();
}

std::shared_ptr<ExecutionContext> WorkflowEngine::get_execution(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(executions_mutex_);
    auto it = running_.find(execution_id);
    if (it != running_.end()) {
        return it->second;
    }
    auto retained = retained_.find(execution_id);
    return retained == retained_.end() ? nullptr : retained->second;
}

// ---------------------------------------------------------------------------
// State access
// ---------------------------------------------------------------------------

std::optional<StateRecord> WorkflowEngine::get_state(const std::string& workflow_id) {
    return state_store_->get(workflow_id);
}

void WorkflowEngine::update_state(const std::string& workflow_id, StateRecord record) {
    state_store_->save(workflow_id, std::move(record));
}

template <class F>
void WorkflowEngine::with_state(const ExecutionContext& context, const char* operation, F&& fn) {
    try {
        fn();
    } catch (const WorkflowError& e) {
        // The record may have been removed or replaced by a concurrent
        // execution of the same workflow
        observability_->log_warn("State update skipped", context.workflow_id(), context.execution_id(),
                                 context.current_step(), {{"operation", operation}, {"error", e.what()}});
    }
}

void WorkflowEngine::finalize_record(const ExecutionContext& context,
                                     ExecutionStatus status,
                                     const std::optional<std::string>& error) {
    with_state(context, "finalize", [&]() {
        if (!state_store_->finalize(context.workflow_id(), context.execution_id(), status, error)) {
            observability_->log_debug("State record owned by another execution", context.workflow_id(),
                                      context.execution_id());
        }
    });
}

void WorkflowEngine::publish(const std::string& event_type, nlohmann::json payload) {
    event_bus_->publish(event_type, payload);
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

WorkflowResult WorkflowEngine::execute(const std::string& workflow_id,
                                       const nlohmann::json& input_data,
                                       std::shared_ptr<ExecutionContext> context) {
    std::shared_ptr<WorkflowDefinition> definition;
    {
        std::lock_guard<std::mutex> lock(definitions_mutex_);
        auto it = definitions_.find(workflow_id);
        if (it == definitions_.end()) {
            throw NotFoundError("workflow not registered: " + workflow_id);
        }
        definition = it->second;
    }

    if (!context) {
        context = std::make_shared<ExecutionContext>(workflow_id);
    } else {
        if (context->workflow_id() != workflow_id) {
            throw StateError("execution context belongs to workflow '" + context->workflow_id() + "'");
        }
        auto status = context->status();
        if (is_terminal(status) || status == ExecutionStatus::running) {
            throw StateError("execution context '" + context->execution_id() + "' is already " +
                             ResultConverter::status_to_string(status));
        }
    }

    acquire_slot(context);
    RunningSlot slot(*this, context->execution_id());
    retain_execution(context);

    // Caller input overrides keys already present in the context
    context->merge_input(input_data);

    return run(*definition, context);
}

std::optional<WorkflowEngine::StepFailure> WorkflowEngine::check_interrupt(
    const WorkflowDefinition& definition,
    const ExecutionContext& context,
    std::chrono::steady_clock::time_point started,
    const std::string& next_step) const {

    if (context.status() == ExecutionStatus::terminated) {
        StepFailure failure;
        failure.code = ErrorCode::terminated;
        failure.kind = ResultConverter::error_code_to_string(ErrorCode::terminated);
        failure.step_name = next_step;
        failure.message = context.error().value_or("terminated");
        return failure;
    }

    if (definition.max_execution_time_ms() > 0 &&
        TimeoutEnforcement::elapsed_ms(started) >= definition.max_execution_time_ms()) {
        StepFailure failure;
        failure.code = ErrorCode::workflow_timeout;
        failure.kind = ResultConverter::error_code_to_string(ErrorCode::workflow_timeout);
        failure.step_name = next_step;
        failure.message = "workflow '" + definition.id() + "' exceeded max execution time of " +
                          std::to_string(definition.max_execution_time_ms()) + "ms";
        return failure;
    }
    return std::nullopt;
}

WorkflowEngine::StepFailure WorkflowEngine::make_failure(const WorkflowError& error, ErrorCode code) const {
    StepFailure failure;
    failure.code = code;
    failure.kind = ResultConverter::error_code_to_string(code);
    failure.step_name = error.step_name();
    failure.message = error.what();
    return failure;
}

WorkflowResult WorkflowEngine::run(const WorkflowDefinition& definition,
                                   const std::shared_ptr<ExecutionContext>& context) {
    auto started = std::chrono::steady_clock::now();
    const auto& wid = context->workflow_id();
    const auto& eid = context->execution_id();

    auto span = observability_->start_span("workflow.execute", {
        {"workflow_id", wid},
        {"execution_id", eid}
    });

    context->mark_started();
    if (!context->try_transition(ExecutionStatus::running)) {
        throw StateError("execution '" + eid + "' cannot start from status " +
                         ResultConverter::status_to_string(context->status()));
    }

    WorkflowResult result;
    result.workflow_id = wid;
    result.execution_id = eid;
    result.start_time = context->start_time().value_or(Clock::now());

    const auto order = definition.get_execution_order();
    const size_t total_steps = order.size();

    StateRecord record;
    record.workflow_id = wid;
    record.execution_id = eid;
    record.status = ExecutionStatus::running;
    record.steps_remaining = std::set<std::string>(order.begin(), order.end());
    record.data = context->data();
    record.metadata = {
        {"workflow_name", definition.name()},
        {"version", definition.version()},
        {"strategy", ResultConverter::strategy_to_string(definition.strategy())}
    };
    with_state(*context, "save", [&]() { state_store_->save(wid, record); });

    publish(events::workflow_started, {
        {"workflow_id", wid},
        {"execution_id", eid},
        {"input_keys", key_list(context->data())},
        {"step_count", total_steps}
    });
    observability_->log_info("Workflow started", wid, eid, "", {
        {"steps", std::to_string(total_steps)}
    });

    std::optional<StepFailure> failure;
    const bool frontier_dispatch = config_.enable_parallel &&
                                   definition.strategy() != ExecutionStrategy::sequential;

    if (!frontier_dispatch) {
        for (const auto& name : order) {
            failure = check_interrupt(definition, *context, started, name);
            if (failure) {
                break;
            }
            const WorkflowStep& step = *definition.find_step(name);
            auto outcome = run_step(step, context);
            if (!outcome.ok) {
                failure = outcome.failure;
                break;
            }
            commit_step(step, outcome, *context, result, total_steps);
        }
    } else {
        std::set<std::string> completed;
        while (completed.size() < total_steps) {
            auto frontier = definition.get_parallel_steps(completed);
            if (frontier.empty()) {
                break;
            }
            failure = check_interrupt(definition, *context, started, frontier.front());
            if (failure) {
                break;
            }

            std::vector<StepOutcome> outcomes;
            if (frontier.size() == 1 && definition.strategy() == ExecutionStrategy::adaptive) {
                outcomes.push_back(run_step(*definition.find_step(frontier.front()), context));
            } else {
                outcomes = run_frontier(definition, frontier, context, started);
            }

            // Merge in frontier order; the first failure is the fatal cause.
            // Steps a stopped frontier never dispatched stay pending, and the
            // interrupt check at the top of the loop ends the run.
            for (size_t i = 0; i < frontier.size(); ++i) {
                if (!outcomes[i].ran) {
                    continue;
                }
                if (outcomes[i].ok) {
                    commit_step(*definition.find_step(frontier[i]), outcomes[i], *context, result, total_steps);
                    completed.insert(frontier[i]);
                } else if (!failure) {
                    failure = outcomes[i].failure;
                }
            }
            if (failure) {
                break;
            }
        }
    }

    ExecutionStatus final_status;
    if (context->status() == ExecutionStatus::terminated) {
        // terminate() already updated the record and published the event
        final_status = ExecutionStatus::terminated;
        result.error_code = ErrorCode::terminated;
        result.failed_step = failure ? failure->step_name : context->current_step();
        result.errors.push_back(context->error().value_or("terminated"));
    } else if (failure) {
        if (context->try_transition(ExecutionStatus::failed)) {
            final_status = ExecutionStatus::failed;
            context->set_error(failure->message);
            result.error_code = failure->code;
            result.failed_step = failure->step_name;
            result.errors.push_back(failure->message);

            finalize_record(*context, ExecutionStatus::failed, failure->message);
            publish(events::workflow_failed, {
                {"workflow_id", wid},
                {"execution_id", eid},
                {"error", failure->message},
                {"error_code", failure->kind},
                {"failed_step", failure->step_name}
            });
            observability_->log_error("Workflow failed", wid, eid, failure->step_name, {
                {"error", failure->message},
                {"error_code", failure->kind}
            });
        } else {
            final_status = ExecutionStatus::terminated;
            result.error_code = ErrorCode::terminated;
            result.failed_step = failure->step_name;
            result.errors.push_back(context->error().value_or("terminated"));
        }
    } else if (context->try_transition(ExecutionStatus::completed)) {
        final_status = ExecutionStatus::completed;
        finalize_record(*context, ExecutionStatus::completed, std::nullopt);
        publish(events::workflow_completed, {
            {"workflow_id", wid},
            {"execution_id", eid},
            {"steps_completed", context->completed_steps()}
        });
        observability_->log_info("Workflow completed", wid, eid, "", {
            {"duration_ms", std::to_string(TimeoutEnforcement::elapsed_ms(started))}
        });
    } else {
        // Terminated after the last step finished
        final_status = ExecutionStatus::terminated;
        result.error_code = ErrorCode::terminated;
        result.errors.push_back(context->error().value_or("terminated"));
    }

    context->mark_finished();
    result.status = final_status;
    result.success = final_status == ExecutionStatus::completed;
    result.data = context->data();
    result.metadata = context->metadata();
    result.end_time = context->end_time();
    result.duration_ms = TimeoutEnforcement::elapsed_ms(started);

    auto status_str = ResultConverter::status_to_string(final_status);
    observability_->record_workflow_execution(wid, status_str, seconds_since(started));
    span->SetAttribute("status", status_str.c_str());
    span->End();

    return result;
}

WorkflowEngine::StepOutcome WorkflowEngine::fail_step(const WorkflowStep& step,
                                                      const ExecutionContext& context,
                                                      StepFailure failure,
                                                      int32_t attempt) {
    failure.step_name = step.name;
    StepOutcome outcome;
    outcome.ok = false;
    outcome.retries = attempt;
    outcome.failure = failure;
    publish(events::step_failed, {
        {"workflow_id", context.workflow_id()},
        {"execution_id", context.execution_id()},
        {"step_name", step.name},
        {"agent_type", step.agent_type},
        {"error", failure.message},
        {"error_code", failure.kind},
        {"attempts", attempt + 1}
    });
    observability_->log_error("Step failed", context.workflow_id(), context.execution_id(), step.name, {
        {"error", failure.message},
        {"error_code", failure.kind}
    });
    return outcome;
}

WorkflowEngine::StepOutcome WorkflowEngine::run_step(const WorkflowStep& step,
                                                     const std::shared_ptr<ExecutionContext>& context) {
    try {
        return attempt_step(step, context);
    } catch (const std::exception& e) {
        StepExecutionError error(step.name, ErrorCode::execution_failed,
                                 ResultConverter::error_code_to_string(ErrorCode::execution_failed), e.what());
        return fail_step(step, *context, make_failure(error, ErrorCode::execution_failed), 0);
    }
}

WorkflowEngine::StepOutcome WorkflowEngine::attempt_step(const WorkflowStep& step,
                                                         const std::shared_ptr<ExecutionContext>& context) {
    const auto& wid = context->workflow_id();
    const auto& eid = context->execution_id();
    StepOutcome outcome;

    // Resolve inputs from the context data
    auto data = context->data();
    auto missing = step.validate_inputs(data);
    if (!missing.empty()) {
        return fail_step(step, *context,
                         make_failure(MissingInputError(step.name, missing.front()), ErrorCode::missing_input), 0);
    }
    nlohmann::json inputs = nlohmann::json::object();
    for (const auto& name : step.all_inputs()) {
        if (data.contains(name)) {
            inputs[name] = data[name];
        }
    }

    auto executor = executors_->resolve(step.agent_type);
    if (!executor) {
        StepExecutionError error(step.name, ErrorCode::executor_not_found,
                                 ResultConverter::error_code_to_string(ErrorCode::executor_not_found),
                                 caf::to_string(executor.error()));
        return fail_step(step, *context, make_failure(error, ErrorCode::executor_not_found), 0);
    }

    context->set_current_step(step.name);
    publish(events::step_started, {
        {"workflow_id", wid},
        {"execution_id", eid},
        {"step_name", step.name},
        {"agent_type", step.agent_type}
    });
    observability_->log_info("Step started", wid, eid, step.name, {{"agent_type", step.agent_type}});

    const int64_t timeout_ms = step.timeout_ms > 0 ? step.timeout_ms : config_.default_step_timeout_ms;

    for (int32_t attempt = 0;; ++attempt) {
        StepRequest req;
        req.step_name = step.name;
        req.agent_type = step.agent_type;
        req.inputs = inputs;
        req.expected_outputs.assign(step.outputs.begin(), step.outputs.end());
        req.timeout_ms = timeout_ms;
        req.attempt = attempt;
        req.metadata = step.metadata;

        StepContext step_ctx{wid, eid, step.name};
        ResultMetadata meta{wid, eid, step.name, step.agent_type, attempt};

        auto attempt_span = observability_->start_span("step.execute", {
            {"workflow_id", wid},
            {"execution_id", eid},
            {"step_name", step.name},
            {"agent_type", step.agent_type},
            {"attempt", std::to_string(attempt)}
        });
        auto attempt_start = std::chrono::steady_clock::now();

        std::optional<StepFailure> failure;
        StepResult step_result;
        try {
            auto step_executor = *executor;
            std::function<StepResult()> operation = [step_executor, req, step_ctx, meta]() {
                auto produced = step_executor->execute(req, step_ctx);
                if (!produced) {
                    return StepResult::error_result(ErrorCode::execution_failed,
                                                    caf::to_string(produced.error()), meta);
                }
                return std::move(*produced);
            };

            bool finished = TimeoutEnforcement::execute_with_timeout<StepResult>(
                *pool_, std::move(operation), timeout_ms, step_result);

            if (!finished) {
                if (auto cancelled = step_executor->cancel(eid); !cancelled) {
                    observability_->log_warn("Executor cancel failed", wid, eid, step.name,
                                             {{"error", caf::to_string(cancelled.error())}});
                }
                failure = make_failure(StepTimeoutError(step.name, timeout_ms), ErrorCode::step_timeout);
            }
        } catch (const std::exception& e) {
            failure = make_failure(StepExecutionError(step.name, ErrorCode::execution_failed,
                                                      ResultConverter::error_code_to_string(ErrorCode::execution_failed),
                                                      e.what()),
                                   ErrorCode::execution_failed);
        }

        if (!failure && !ResultConverter::validate_result(step_result)) {
            failure = make_failure(StepExecutionError(step.name, ErrorCode::execution_failed,
                                                      ResultConverter::error_code_to_string(ErrorCode::execution_failed),
                                                      "executor returned an inconsistent result (status " +
                                                          ResultConverter::step_status_to_string(step_result.status) + ")"),
                                   ErrorCode::execution_failed);
        }

        if (!failure) {
            if (step_result.is_success()) {
                std::vector<std::string> absent;
                for (const auto& name : step.outputs) {
                    if (!step_result.outputs.contains(name)) {
                        absent.push_back(name);
                    }
                }
                if (!absent.empty()) {
                    failure = make_failure(StepExecutionError(step.name, ErrorCode::output_contract_violation,
                                                              ResultConverter::error_code_to_string(ErrorCode::output_contract_violation),
                                                              "missing declared output '" + absent.front() + "'"),
                                           ErrorCode::output_contract_violation);
                }
            } else if (step_result.is_timeout()) {
                failure = make_failure(StepTimeoutError(step.name, timeout_ms), ErrorCode::step_timeout);
            } else if (step_result.is_cancelled()) {
                std::string message = step_result.error_message.empty() ? "step cancelled by executor"
                                                                        : step_result.error_message;
                failure = make_failure(StepExecutionError(step.name, ErrorCode::terminated,
                                                          ResultConverter::error_code_to_string(ErrorCode::terminated),
                                                          message),
                                       ErrorCode::terminated);
            } else {
                ErrorCode code = step_result.error_code == ErrorCode::none ? ErrorCode::execution_failed
                                                                            : step_result.error_code;
                std::string message = step_result.error_message.empty()
                    ? ResultConverter::step_status_to_string(step_result.status)
                    : step_result.error_message;
                failure = make_failure(StepExecutionError(step.name, code,
                                                          ResultConverter::error_code_to_string(code), message),
                                       code);
            }
        }

        const double attempt_seconds = seconds_since(attempt_start);
        observability_->record_step_execution(step.agent_type, failure ? failure->kind : "success", attempt_seconds);
        attempt_span->SetAttribute("status", failure ? failure->kind.c_str() : "success");
        attempt_span->End();

        if (!failure) {
            for (auto it = step_result.outputs.begin(); it != step_result.outputs.end(); ++it) {
                if (step.outputs.count(it.key()) > 0) {
                    outcome.outputs[it.key()] = it.value();
                } else {
                    auto warning = "step '" + step.name + "' produced undeclared output '" + it.key() + "'";
                    observability_->log_warn("Undeclared step output ignored", wid, eid, step.name,
                                             {{"output", it.key()}});
                    outcome.warnings.push_back(warning);
                }
            }
            outcome.ok = true;
            outcome.retries = attempt;
            return outcome;
        }

        if (context->status() != ExecutionStatus::terminated &&
            step.retry_policy.should_retry(failure->kind, attempt)) {
            int64_t delay_ms = step.retry_policy.calculate_backoff_delay(attempt);
            publish(events::step_retrying, {
                {"workflow_id", wid},
                {"execution_id", eid},
                {"step_name", step.name},
                {"attempt", attempt + 1},
                {"delay_ms", delay_ms},
                {"error", failure->message},
                {"error_code", failure->kind}
            });
            observability_->record_step_retry(step.agent_type);
            observability_->log_warn("Retrying step", wid, eid, step.name, {
                {"attempt", std::to_string(attempt + 1)},
                {"delay_ms", std::to_string(delay_ms)},
                {"error_code", failure->kind}
            });
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            continue;
        }

        return fail_step(step, *context, *failure, attempt);
    }
}

std::vector<WorkflowEngine::StepOutcome> WorkflowEngine::run_frontier(
    const WorkflowDefinition& definition,
    const std::vector<std::string>& frontier,
    const std::shared_ptr<ExecutionContext>& context,
    std::chrono::steady_clock::time_point started) {

    std::vector<StepOutcome> outcomes(frontier.size());
    for (auto& outcome : outcomes) {
        outcome.ran = false;
    }
    const size_t batch_size = static_cast<size_t>(pool_->concurrency());

    for (size_t begin = 0; begin < frontier.size(); begin += batch_size) {
        if (begin > 0 && check_interrupt(definition, *context, started, frontier[begin])) {
            break;
        }
        size_t end = std::min(frontier.size(), begin + batch_size);
        std::vector<std::future<StepOutcome>> pending;
        for (size_t i = begin; i < end; ++i) {
            const WorkflowStep* step = definition.find_step(frontier[i]);
            pending.push_back(std::async(std::launch::async, [this, step, &context]() {
                return run_step(*step, context);
            }));
        }
        bool batch_failed = false;
        for (size_t i = begin; i < end; ++i) {
            outcomes[i] = pending[i - begin].get();
            batch_failed = batch_failed || !outcomes[i].ok;
        }
        if (batch_failed) {
            break;
        }
    }
    return outcomes;
}

void WorkflowEngine::commit_step(const WorkflowStep& step,
                                 const StepOutcome& outcome,
                                 ExecutionContext& context,
                                 WorkflowResult& result,
                                 size_t total_steps) {
    context.commit_step(step.name, outcome.outputs);
    result.steps_results[step.name] = outcome.outputs;
    result.warnings.insert(result.warnings.end(), outcome.warnings.begin(), outcome.warnings.end());

    const double progress = total_steps == 0
        ? 1.0
        : static_cast<double>(context.completed_steps().size()) / static_cast<double>(total_steps);

    with_state(context, "record_step", [&]() {
        if (!state_store_->record_step(context.workflow_id(), context.execution_id(), step.name,
                                       outcome.outputs, std::min(progress, 1.0))) {
            observability_->log_debug("State record owned by another execution", context.workflow_id(),
                                      context.execution_id(), step.name);
        }
    });

    publish(events::step_completed, {
        {"workflow_id", context.workflow_id()},
        {"execution_id", context.execution_id()},
        {"step_name", step.name},
        {"outputs", key_list(outcome.outputs)},
        {"retries", outcome.retries},
        {"progress", progress}
    });
    observability_->log_info("Step completed", context.workflow_id(), context.execution_id(), step.name, {
        {"retries", std::to_string(outcome.retries)}
    });
}

// ---------------------------------------------------------------------------
// Termination
// ---------------------------------------------------------------------------

void WorkflowEngine::terminate(const std::string& execution_id, const std::string& reason) {
    auto context = get_execution(execution_id);
    if (!context) {
        throw NotFoundError("execution not found: " + execution_id);
    }
    if (!context->try_transition(ExecutionStatus::terminated)) {
        throw StateError("execution '" + execution_id + "' already " +
                         ResultConverter::status_to_string(context->status()));
    }

    context->set_metadata("termination_reason", reason);
    context->set_error("terminated: " + reason);
    finalize_record(*context, ExecutionStatus::terminated, "terminated: " + reason);

    // Best effort: tell the executor of the step in flight
    auto definition = get_definition(context->workflow_id());
    auto current = context->current_step();
    if (definition && !current.empty()) {
        if (const WorkflowStep* step = definition->find_step(current)) {
            auto executor = executors_->resolve(step->agent_type);
            if (executor) {
                if (auto cancelled = (*executor)->cancel(execution_id); !cancelled) {
                    observability_->log_warn("Executor cancel failed", context->workflow_id(), execution_id,
                                             current, {{"error", caf::to_string(cancelled.error())}});
                }
            }
        }
    }

    publish(events::workflow_terminated, {
        {"workflow_id", context->workflow_id()},
        {"execution_id", execution_id},
        {"reason", reason}
    });
    observability_->log_warn("Workflow terminated", context->workflow_id(), execution_id, current, {
        {"reason", reason}
    });
}

} // namespace workflow
} // namespace flowcore
