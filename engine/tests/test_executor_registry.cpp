#include <iostream>
#include <cassert>
#include <atomic>
#include <stdexcept>
#include <string>
#include "flowcore/workflow/executor_registry.hpp"
#include "flowcore/workflow/sandbox_executor.hpp"
#include "flowcore/workflow/workflow_definition.hpp"

using namespace flowcore::workflow;

StepRequest make_request(const std::string& step_name, const std::string& agent_type) {
    StepRequest req;
    req.step_name = step_name;
    req.agent_type = agent_type;
    req.inputs = {{"topic", "storage"}};
    req.expected_outputs = {"summary", "risks"};
    req.timeout_ms = 1000;
    return req;
}

StepContext make_context(const std::string& step_name) {
    return StepContext{"wf", "exec-1", step_name};
}

void test_resolve_and_cache() {
    std::cout << "Testing resolve and caching..." << std::endl;

    ExecutorRegistry registry;
    std::atomic<int> constructed{0};
    registry.register_factory("analysis", [&constructed]() -> std::shared_ptr<StepExecutor> {
        constructed++;
        return std::make_shared<SandboxExecutor>("analysis");
    });

    assert(registry.contains("analysis"));
    assert(constructed == 0);

    auto first = registry.resolve("analysis");
    auto second = registry.resolve("analysis");
    assert(first && second);
    assert(first->get() == second->get());
    assert(constructed == 1);

    // Re-registering drops the cached instance
    registry.register_factory("analysis", [&constructed]() -> std::shared_ptr<StepExecutor> {
        constructed++;
        return std::make_shared<SandboxExecutor>("analysis");
    });
    auto third = registry.resolve("analysis");
    assert(third && third->get() != first->get());
    assert(constructed == 2);

    std::cout << "✓ resolve and caching test passed" << std::endl;
}

void test_unknown_agent_type() {
    std::cout << "Testing unknown agent type..." << std::endl;

    ExecutorRegistry registry;
    assert(!registry.resolve("ghost"));

    registry.register_factory("empty", []() -> std::shared_ptr<StepExecutor> { return nullptr; });
    assert(!registry.resolve("empty"));

    registry.register_executor(std::make_shared<SandboxExecutor>("writer"));
    assert((registry.agent_types() == std::vector<std::string>{"empty", "writer"}));
    assert(registry.unregister("writer"));
    assert(!registry.unregister("writer"));
    assert(!registry.resolve("writer"));

    std::cout << "✓ unknown agent type test passed" << std::endl;
}

void test_throwing_factory() {
    std::cout << "Testing throwing executor factory..." << std::endl;

    ExecutorRegistry registry;
    std::atomic<int> calls{0};
    registry.register_factory("flaky", [&calls]() -> std::shared_ptr<StepExecutor> {
        calls++;
        throw std::runtime_error("connection refused");
    });

    auto resolved = registry.resolve("flaky");
    assert(!resolved);
    auto message = caf::to_string(resolved.error());
    assert(message.find("flaky") != std::string::npos);
    assert(message.find("connection refused") != std::string::npos);

    // Nothing cached: the next resolve tries the factory again
    assert(!registry.resolve("flaky"));
    assert(calls == 2);
    assert(registry.contains("flaky"));

    std::cout << "✓ throwing executor factory test passed" << std::endl;
}

void test_sandbox_fabricates_outputs() {
    std::cout << "Testing sandbox executor outputs..." << std::endl;

    SandboxExecutor executor("analysis");
    auto result = executor.execute(make_request("analyze", "analysis"), make_context("analyze"));
    assert(result);
    assert(result->is_success());
    assert(result->outputs.size() == 2);
    assert(result->outputs["summary"]["sandbox"] == true);
    assert(result->outputs["summary"]["agent_type"] == "analysis");
    assert(result->outputs["risks"]["step"] == "analyze");
    assert(result->outputs["risks"]["inputs"][0] == "topic");
    assert(result->metadata.execution_id == "exec-1");

    auto metrics = executor.metrics();
    assert(metrics.success_count == 1);
    assert(metrics.error_count == 0);

    std::cout << "✓ sandbox executor outputs test passed" << std::endl;
}

void test_register_sandbox_executors() {
    std::cout << "Testing sandbox registration..." << std::endl;

    WorkflowDefinition definition("wf", "Sandbox");
    WorkflowStep a;
    a.name = "A";
    a.agent_type = "analysis";
    WorkflowStep b;
    b.name = "B";
    b.agent_type = "writer";
    WorkflowStep c;
    c.name = "C";
    c.agent_type = "analysis";
    definition.add_step(a);
    definition.add_step(b);
    definition.add_step(c);

    ExecutorRegistry registry;
    auto writer = FunctionExecutor::from_outputs("writer", [](const nlohmann::json&) {
        return nlohmann::json{{"doc", "text"}};
    });
    registry.register_executor(writer);

    // Existing executors are left alone
    assert(register_sandbox_executors(registry, definition) == 1);
    assert(registry.resolve("writer")->get() == writer.get());
    assert(registry.contains("analysis"));
    assert(register_sandbox_executors(registry, definition) == 0);

    std::cout << "✓ sandbox registration test passed" << std::endl;
}

void test_function_executor_errors() {
    std::cout << "Testing function executor failures..." << std::endl;

    auto throwing = FunctionExecutor::from_outputs("broken", [](const nlohmann::json&) -> nlohmann::json {
        throw std::runtime_error("model unavailable");
    });
    auto result = throwing->execute(make_request("A", "broken"), make_context("A"));
    assert(result);
    assert(result->is_error());
    assert(result->error_code == ErrorCode::execution_failed);
    assert(result->error_message == "model unavailable");
    assert(throwing->metrics().error_count == 1);

    FunctionExecutor network("flaky", [](const StepRequest& req, const StepContext& ctx) -> caf::expected<StepResult> {
        ResultMetadata meta{ctx.workflow_id, ctx.execution_id, ctx.step_name, req.agent_type, req.attempt};
        return StepResult::error_result(ErrorCode::network_error, "connection reset", meta);
    });
    auto flaky = network.execute(make_request("A", "flaky"), make_context("A"));
    assert(flaky && flaky->error_code == ErrorCode::network_error);

    FunctionExecutor failing("fails", [](const StepRequest&, const StepContext&) -> caf::expected<StepResult> {
        return caf::make_error(caf::sec::runtime_error, "no capacity");
    });
    assert(!failing.execute(make_request("A", "fails"), make_context("A")));
    assert(failing.metrics().error_count == 1);
    assert(failing.cancel("exec-1"));

    std::cout << "✓ function executor failures test passed" << std::endl;
}

int main() {
    std::cout << "Running Executor Registry Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_resolve_and_cache();
        test_unknown_agent_type();
        test_throwing_factory();
        test_sandbox_fabricates_outputs();
        test_register_sandbox_executors();
        test_function_executor_errors();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All executor registry tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
