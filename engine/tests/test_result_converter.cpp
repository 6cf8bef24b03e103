#include <iostream>
#include <cassert>
#include "flowcore/workflow/result_converter.hpp"
#include "flowcore/workflow/workflow_result.hpp"

using namespace flowcore::workflow;

void test_status_strings() {
    std::cout << "Testing status conversion..." << std::endl;

    for (auto status : {ExecutionStatus::pending, ExecutionStatus::running, ExecutionStatus::waiting,
                        ExecutionStatus::completed, ExecutionStatus::failed, ExecutionStatus::terminated}) {
        auto parsed = ResultConverter::string_to_status(ResultConverter::status_to_string(status));
        assert(parsed && *parsed == status);
    }
    assert(ResultConverter::string_to_status("waiting_for_input") == ExecutionStatus::waiting);
    assert(!ResultConverter::string_to_status("exploded"));

    std::cout << "✓ status conversion test passed" << std::endl;
}

void test_state_machine() {
    std::cout << "Testing execution state machine..." << std::endl;

    assert(is_valid_transition(ExecutionStatus::pending, ExecutionStatus::running));
    assert(is_valid_transition(ExecutionStatus::pending, ExecutionStatus::terminated));
    assert(is_valid_transition(ExecutionStatus::running, ExecutionStatus::waiting));
    assert(is_valid_transition(ExecutionStatus::waiting, ExecutionStatus::running));
    assert(is_valid_transition(ExecutionStatus::running, ExecutionStatus::completed));
    assert(!is_valid_transition(ExecutionStatus::pending, ExecutionStatus::completed));
    assert(!is_valid_transition(ExecutionStatus::completed, ExecutionStatus::running));
    assert(!is_valid_transition(ExecutionStatus::terminated, ExecutionStatus::failed));
    assert(!is_valid_transition(ExecutionStatus::failed, ExecutionStatus::failed));

    assert(is_terminal(ExecutionStatus::completed));
    assert(is_terminal(ExecutionStatus::failed));
    assert(is_terminal(ExecutionStatus::terminated));
    assert(!is_terminal(ExecutionStatus::waiting));

    std::cout << "✓ execution state machine test passed" << std::endl;
}

void test_error_kinds() {
    std::cout << "Testing error kind strings..." << std::endl;

    assert(ResultConverter::error_code_to_string(ErrorCode::step_timeout) == "STEP_TIMEOUT");
    assert(ResultConverter::error_code_to_string(ErrorCode::network_error) == "NETWORK_ERROR");
    assert(ResultConverter::error_code_to_string(ErrorCode::executor_not_found) == "EXECUTOR_NOT_FOUND");
    assert(ResultConverter::error_code_to_string(ErrorCode::output_contract_violation) == "OUTPUT_CONTRACT_VIOLATION");
    assert(ResultConverter::error_code_to_string(ErrorCode::missing_input) == "MISSING_INPUT");
    assert(ResultConverter::error_code_to_string(ErrorCode::workflow_timeout) == "WORKFLOW_TIMEOUT");
    assert(ResultConverter::step_status_to_string(StepStatus::ok) == "success");

    assert(ResultConverter::string_to_strategy("adaptive") == ExecutionStrategy::adaptive);
    assert(!ResultConverter::string_to_strategy("random"));

    std::cout << "✓ error kind strings test passed" << std::endl;
}

void test_validate_result() {
    std::cout << "Testing result validation..." << std::endl;

    ResultMetadata meta{"wf", "exec", "step", "agent", 0};
    assert(ResultConverter::validate_result(StepResult::success(meta, {{"x", 1}})));
    assert(ResultConverter::validate_result(StepResult::error_result(ErrorCode::network_error, "down", meta)));
    assert(ResultConverter::validate_result(StepResult::timeout_result(meta)));

    auto inconsistent = StepResult::success(meta);
    inconsistent.error_code = ErrorCode::execution_failed;
    assert(!ResultConverter::validate_result(inconsistent));

    auto bad_outputs = StepResult::success(meta);
    bad_outputs.outputs = nlohmann::json::array();
    assert(!ResultConverter::validate_result(bad_outputs));

    std::cout << "✓ result validation test passed" << std::endl;
}

void test_workflow_result_json() {
    std::cout << "Testing workflow result JSON..." << std::endl;

    WorkflowResult result;
    result.workflow_id = "wf";
    result.execution_id = "exec-1";
    result.status = ExecutionStatus::failed;
    result.error_code = ErrorCode::step_timeout;
    result.failed_step = "B";
    result.errors.push_back("step 'B' timed out after 50ms");
    result.steps_results["A"] = {{"a", 1}};

    auto j = result.to_json();
    assert(j["status"] == "failed");
    assert(j["success"] == false);
    assert(j["error_code"] == "STEP_TIMEOUT");
    assert(j["failed_step"] == "B");
    assert(j["errors"].size() == 1);
    assert(j["steps_results"]["A"]["a"] == 1);
    assert(j["end_time"].is_null());

    WorkflowResult ok;
    ok.status = ExecutionStatus::completed;
    ok.success = true;
    assert(!ok.to_json().contains("error_code"));

    std::cout << "✓ workflow result JSON test passed" << std::endl;
}

int main() {
    std::cout << "Running Result Converter Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_status_strings();
        test_state_machine();
        test_error_kinds();
        test_validate_result();
        test_workflow_result_json();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All result converter tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
