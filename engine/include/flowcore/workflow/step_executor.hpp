#pragma once

#include "flowcore/workflow/core.hpp"
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/sec.hpp>
#include <caf/unit.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace flowcore {
namespace workflow {

/**
 * Executor contract for one agent type.
 *
 * `execute` is called from worker pool threads, possibly concurrently for
 * different steps, so implementations must be thread-safe. Failures are
 * reported either as an error StepResult (with an ErrorCode the engine can
 * classify for retries) or as a caf::error, which counts as
 * EXECUTION_FAILED.
 */
class StepExecutor {
public:
    virtual ~StepExecutor() = default;

    virtual std::string agent_type() const = 0;

    virtual caf::expected<StepResult> execute(const StepRequest& req, const StepContext& ctx) = 0;

    // Best effort; the engine never waits for it
    virtual caf::expected<void> cancel(const std::string& execution_id) = 0;

    virtual ExecutorMetrics metrics() const = 0;

protected:
    // Helper to create ResultMetadata from StepContext
    static ResultMetadata metadata_from_context(const StepRequest& req, const StepContext& ctx) {
        ResultMetadata meta;
        meta.workflow_id = ctx.workflow_id;
        meta.execution_id = ctx.execution_id;
        meta.step_name = ctx.step_name;
        meta.agent_type = req.agent_type;
        meta.attempt = req.attempt;
        return meta;
    }
};

// Base StepExecutor implementation with common functionality
class BaseStepExecutor : public StepExecutor {
public:
    explicit BaseStepExecutor(std::string agent_type) : agent_type_(std::move(agent_type)) {}

    std::string agent_type() const override { return agent_type_; }

    caf::expected<StepResult> execute(const StepRequest& req, const StepContext& ctx) override {
        auto start = std::chrono::steady_clock::now();
        auto result = execute_impl(req, ctx);
        auto latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (result && result->is_success()) {
            record_success(latency_ms);
        } else {
            record_error(latency_ms);
        }
        if (result && result->latency_ms == 0) {
            result->latency_ms = latency_ms;
        }
        return result;
    }

    caf::expected<void> cancel(const std::string& /*execution_id*/) override {
        // Default implementation - can be overridden by specific executors
        return caf::unit;
    }

    ExecutorMetrics metrics() const override {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        return metrics_;
    }

protected:
    std::string agent_type_;

    // Subclasses should override this method
    virtual caf::expected<StepResult> execute_impl(const StepRequest& req, const StepContext& ctx) = 0;

    void record_success(int64_t latency_ms) {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.latency_ms = latency_ms;
        metrics_.success_count++;
    }

    void record_error(int64_t latency_ms) {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.latency_ms = latency_ms;
        metrics_.error_count++;
    }

    static bool has_input(const StepRequest& req, const std::string& key) {
        return req.inputs.is_object() && req.inputs.contains(key);
    }

private:
    mutable std::mutex metrics_mutex_;
    ExecutorMetrics metrics_;
};

/**
 * Adapts a callable to the executor contract.
 *
 * The outputs-only form maps step inputs to an outputs object; anything it
 * throws becomes an EXECUTION_FAILED result.
 */
class FunctionExecutor : public BaseStepExecutor {
public:
    using Handler = std::function<caf::expected<StepResult>(const StepRequest&, const StepContext&)>;
    using OutputsHandler = std::function<nlohmann::json(const nlohmann::json& inputs)>;

    FunctionExecutor(std::string agent_type, Handler handler)
        : BaseStepExecutor(std::move(agent_type)), handler_(std::move(handler)) {}

    static std::shared_ptr<FunctionExecutor> from_outputs(std::string agent_type, OutputsHandler fn) {
        return std::make_shared<FunctionExecutor>(
            std::move(agent_type),
            [fn = std::move(fn)](const StepRequest& req, const StepContext& ctx) -> caf::expected<StepResult> {
                return StepResult::success(metadata_from_context(req, ctx), fn(req.inputs));
            });
    }

protected:
    caf::expected<StepResult> execute_impl(const StepRequest& req, const StepContext& ctx) override {
        try {
            return handler_(req, ctx);
        } catch (const std::exception& e) {
            return StepResult::error_result(ErrorCode::execution_failed, e.what(),
                                            metadata_from_context(req, ctx));
        }
    }

private:
    Handler handler_;
};

} // namespace workflow
} // namespace flowcore
