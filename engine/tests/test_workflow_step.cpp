#include <iostream>
#include <cassert>
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/workflow_step.hpp"

using namespace flowcore::workflow;

WorkflowStep make_step() {
    WorkflowStep step;
    step.name = "summarize";
    step.agent_type = "summarizer";
    step.required_inputs = {"text", "language"};
    step.optional_inputs = {"max_words"};
    step.outputs = {"summary"};
    return step;
}

void test_validate_inputs_reports_missing_sorted() {
    std::cout << "Testing validate_inputs..." << std::endl;

    auto step = make_step();

    auto missing = step.validate_inputs(nlohmann::json::object());
    assert(missing.size() == 2);
    assert(missing[0] == "language");
    assert(missing[1] == "text");

    missing = step.validate_inputs({{"text", "hello"}});
    assert(missing.size() == 1);
    assert(missing[0] == "language");

    // Optional inputs are never reported
    missing = step.validate_inputs({{"text", "hello"}, {"language", "en"}});
    assert(missing.empty());

    // Null values still count as provided
    missing = step.validate_inputs({{"text", nullptr}, {"language", "en"}});
    assert(missing.empty());

    std::cout << "✓ validate_inputs test passed" << std::endl;
}

void test_all_inputs_is_union() {
    std::cout << "Testing all_inputs..." << std::endl;

    auto step = make_step();
    auto all = step.all_inputs();
    assert(all.size() == 3);
    assert(all.count("text") == 1);
    assert(all.count("language") == 1);
    assert(all.count("max_words") == 1);

    std::cout << "✓ all_inputs test passed" << std::endl;
}

void test_defaults() {
    std::cout << "Testing step defaults..." << std::endl;

    WorkflowStep step;
    assert(step.timeout_ms == 300000);
    assert(step.retry_policy.max_retries() == 3);
    assert(step.retry_policy.base_delay_ms() == 1000);
    assert(step.retry_policy.max_delay_ms() == 60000);
    assert(step.retry_policy.is_retryable("STEP_TIMEOUT"));
    assert(step.retry_policy.is_retryable("NETWORK_ERROR"));
    assert(!step.retry_policy.is_retryable("MISSING_INPUT"));
    assert(step.metadata.is_object());

    std::cout << "✓ step defaults test passed" << std::endl;
}

void test_json_round_trip() {
    std::cout << "Testing step JSON conversion..." << std::endl;

    auto step = make_step();
    step.timeout_ms = 1500;
    step.metadata = {{"owner", "docs"}};

    auto parsed = WorkflowStep::from_json(step.to_json());
    assert(parsed.name == "summarize");
    assert(parsed.agent_type == "summarizer");
    assert(parsed.required_inputs == step.required_inputs);
    assert(parsed.optional_inputs == step.optional_inputs);
    assert(parsed.outputs == step.outputs);
    assert(parsed.timeout_ms == 1500);
    assert(parsed.metadata["owner"] == "docs");
    assert(parsed.retry_policy.max_retries() == 3);

    std::cout << "✓ step JSON conversion test passed" << std::endl;
}

void test_from_json_rejects_incomplete_steps() {
    std::cout << "Testing from_json rejection..." << std::endl;

    bool threw = false;
    try {
        WorkflowStep::from_json({{"agent_type", "x"}});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        WorkflowStep::from_json({{"name", "lonely"}});
    } catch (const ValidationError& e) {
        threw = true;
        assert(e.step_name() == "lonely");
    }
    assert(threw);

    std::cout << "✓ from_json rejection test passed" << std::endl;
}

int main() {
    std::cout << "Running Workflow Step Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_validate_inputs_reports_missing_sorted();
        test_all_inputs_is_union();
        test_defaults();
        test_json_round_trip();
        test_from_json_rejects_incomplete_steps();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All workflow step tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
