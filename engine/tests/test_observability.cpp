#include <iostream>
#include <cassert>
#include <cstdlib>
#include <string>
#include <nlohmann/json.hpp>
#include "flowcore/workflow/feature_flags.hpp"
#include "flowcore/workflow/observability.hpp"

using namespace flowcore::workflow;

void test_log_format() {
    std::cout << "Testing JSON log format..." << std::endl;

    Observability obs("workflow_engine");
    auto line = obs.format_json_log("INFO", "step completed", "wf-1", "exec-1", "A",
                                    {{"attempt", "0"}});
    auto j = nlohmann::json::parse(line);

    assert(j["level"] == "INFO");
    assert(j["component"] == "workflow_engine");
    assert(j["message"] == "step completed");
    assert(j["workflow_id"] == "wf-1");
    assert(j["execution_id"] == "exec-1");
    assert(j["step_name"] == "A");
    assert(j["context"]["attempt"] == "0");
    assert(j["timestamp"].get<std::string>().back() == 'Z');

    // Empty correlation fields are omitted
    auto bare = nlohmann::json::parse(obs.format_json_log("WARN", "plain", "", "", "", {}));
    assert(!bare.contains("workflow_id"));
    assert(!bare.contains("step_name"));
    assert(!bare.contains("context"));

    std::cout << "✓ JSON log format test passed" << std::endl;
}

void test_pii_redaction() {
    std::cout << "Testing PII redaction..." << std::endl;

    Observability obs("workflow_engine");
    auto j = nlohmann::json::parse(obs.format_json_log(
        "INFO", "executor configured", "wf", "", "",
        {{"api_key", "sk-123"}, {"User_Email", "a@b.c"}, {"agent_type", "analysis"}}));

    assert(j["context"]["api_key"] == "[REDACTED]");
    assert(j["context"]["User_Email"] == "[REDACTED]");
    assert(j["context"]["agent_type"] == "analysis");

    std::cout << "✓ PII redaction test passed" << std::endl;
}

void test_case_folding_with_non_ascii() {
    std::cout << "Testing case folding with non-ASCII bytes..." << std::endl;

    // UTF-8 bytes are negative as plain char
    Observability obs("workflow_engine");
    auto j = nlohmann::json::parse(obs.format_json_log(
        "INFO", "executor configured", "wf", "", "",
        {{"cl\xC3\xA9_API_KEY", "sk-123"}, {"r\xC3\xA9gion", "eu"}}));
    assert(j["context"]["cl\xC3\xA9_API_KEY"] == "[REDACTED]");
    assert(j["context"]["r\xC3\xA9gion"] == "eu");

    setenv("FLOWCORE_METRICS_ENABLED", "Yes", 1);
    assert(FeatureFlags::is_metrics_enabled());
    setenv("FLOWCORE_METRICS_ENABLED", "\xC3\xA9\xFF", 1);
    assert(!FeatureFlags::is_metrics_enabled());
    unsetenv("FLOWCORE_METRICS_ENABLED");

    setenv("FLOWCORE_LOG_LEVEL", "W\xC3\x89", 1);
    assert(FeatureFlags::log_level() == "w\xC3\x89");
    unsetenv("FLOWCORE_LOG_LEVEL");

    std::cout << "✓ non-ASCII case folding test passed" << std::endl;
}

void test_parse_log_level() {
    std::cout << "Testing log level parsing..." << std::endl;

    assert(parse_log_level("debug") == LogLevel::debug);
    assert(parse_log_level("info") == LogLevel::info);
    assert(parse_log_level("warning") == LogLevel::warn);
    assert(parse_log_level("error") == LogLevel::error);
    assert(parse_log_level("verbose") == LogLevel::info);

    setenv("FLOWCORE_LOG_LEVEL", "ERROR", 1);
    Observability quiet("quiet");
    assert(!quiet.is_enabled(LogLevel::warn));
    assert(quiet.is_enabled(LogLevel::error));
    unsetenv("FLOWCORE_LOG_LEVEL");

    std::cout << "✓ log level parsing test passed" << std::endl;
}

void test_metrics_gated_by_flag() {
    std::cout << "Testing metrics feature flag..." << std::endl;

    unsetenv("FLOWCORE_METRICS_ENABLED");
    Observability disabled("workflow_engine");
    disabled.record_step_execution("analysis", "success", 0.01);
    assert(disabled.metrics_text().empty());

    setenv("FLOWCORE_METRICS_ENABLED", "true", 1);
    assert(FeatureFlags::is_metrics_enabled());
    Observability enabled("workflow_engine");
    enabled.record_workflow_execution("wf", "completed", 0.2);
    enabled.record_step_execution("analysis", "success", 0.01);
    enabled.record_step_retry("analysis");
    enabled.record_event_published("step_completed");
    enabled.set_running_workflows(3);

    auto text = enabled.metrics_text();
    assert(text.find("flowcore_workflow_executions_total") != std::string::npos);
    assert(text.find("flowcore_step_retries_total") != std::string::npos);
    assert(text.find("flowcore_running_workflows 3") != std::string::npos);
    unsetenv("FLOWCORE_METRICS_ENABLED");

    std::cout << "✓ metrics feature flag test passed" << std::endl;
}

void test_span_without_tracing() {
    std::cout << "Testing no-op spans..." << std::endl;

    unsetenv("FLOWCORE_TRACING_ENABLED");
    Observability obs("workflow_engine");
    auto span = obs.start_span("step.execute", {{"step_name", "A"}});
    assert(span);
    span->SetAttribute("status", "success");
    span->End();

    std::cout << "✓ no-op spans test passed" << std::endl;
}

int main() {
    std::cout << "Running Observability Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        test_log_format();
        test_pii_redaction();
        test_case_folding_with_non_ascii();
        test_parse_log_level();
        test_metrics_gated_by_flag();
        test_span_without_tracing();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All observability tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
