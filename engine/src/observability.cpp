#include "flowcore/workflow/observability.hpp"
#include "flowcore/workflow/feature_flags.hpp"
#include "flowcore/workflow/time_utils.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <vector>

namespace flowcore {
namespace workflow {

using json = nlohmann::json;

namespace {

// Context keys whose values never reach the log
const std::vector<std::string> PII_FIELDS = {
    "password", "api_key", "secret", "token", "access_token",
    "refresh_token", "authorization", "credit_card", "ssn",
    "email", "phone"
};

bool is_pii_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& pii_field : PII_FIELDS) {
        if (lower_field.find(pii_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void filter_pii_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_pii_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_pii_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_pii_recursive(item);
            }
        }
    }
}

// Serializes whole lines across threads
std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

LogLevel parse_log_level(const std::string& value) {
    if (value == "debug") {
        return LogLevel::debug;
    } else if (value == "warn" || value == "warning") {
        return LogLevel::warn;
    } else if (value == "error") {
        return LogLevel::error;
    }
    return LogLevel::info;
}

Observability::Observability(const std::string& component)
    : component_(component), min_level_(parse_log_level(FeatureFlags::log_level())) {
    initialize_metrics();
    initialize_tracing();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    workflow_executions_total_family_ = &prometheus::BuildCounter()
        .Name("flowcore_workflow_executions_total")
        .Help("Total number of finished workflow executions")
        .Register(*registry_);

    workflow_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("flowcore_workflow_duration_seconds")
        .Help("Workflow execution duration in seconds")
        .Register(*registry_);

    step_executions_total_family_ = &prometheus::BuildCounter()
        .Name("flowcore_step_executions_total")
        .Help("Total number of step attempts")
        .Register(*registry_);

    step_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("flowcore_step_duration_seconds")
        .Help("Step attempt duration in seconds")
        .Register(*registry_);

    step_retries_total_family_ = &prometheus::BuildCounter()
        .Name("flowcore_step_retries_total")
        .Help("Total number of step retries")
        .Register(*registry_);

    events_published_total_family_ = &prometheus::BuildCounter()
        .Name("flowcore_events_published_total")
        .Help("Total number of published lifecycle events")
        .Register(*registry_);

    event_handler_failures_total_family_ = &prometheus::BuildCounter()
        .Name("flowcore_event_handler_failures_total")
        .Help("Total number of event handlers that raised")
        .Register(*registry_);

    running_workflows_gauge_ = &prometheus::BuildGauge()
        .Name("flowcore_running_workflows")
        .Help("Workflow executions currently running")
        .Register(*registry_)
        .Add({});
}

void Observability::initialize_tracing() {
    if (FeatureFlags::is_tracing_enabled()) {
        // Whatever provider the embedding application installed
        tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer("flowcore", "1.0.0");
    } else {
        tracer_ = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer>(
            new opentelemetry::trace::NoopTracer());
    }
}

void Observability::record_workflow_execution(const std::string& workflow_id,
                                              const std::string& status,
                                              double duration_seconds) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }

    workflow_executions_total_family_->Add({
        {"workflow_id", workflow_id},
        {"status", status}
    }).Increment();

    workflow_duration_seconds_family_->Add(
        {{"workflow_id", workflow_id}},
        prometheus::Histogram::BucketBoundaries{0.01, 0.1, 0.5, 1.0, 5.0, 10.0, 30.0, 60.0, 300.0}
    ).Observe(duration_seconds);
}

void Observability::record_step_execution(const std::string& agent_type,
                                          const std::string& status,
                                          double duration_seconds) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }

    step_executions_total_family_->Add({
        {"agent_type", agent_type},
        {"status", status}
    }).Increment();

    step_duration_seconds_family_->Add(
        {{"agent_type", agent_type}},
        prometheus::Histogram::BucketBoundaries{0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 5.0, 30.0}
    ).Observe(duration_seconds);
}

void Observability::record_step_retry(const std::string& agent_type) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    step_retries_total_family_->Add({{"agent_type", agent_type}}).Increment();
}

void Observability::record_event_published(const std::string& event_type) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    events_published_total_family_->Add({{"event_type", event_type}}).Increment();
}

void Observability::record_event_handler_failure(const std::string& event_type) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    event_handler_failures_total_family_->Add({{"event_type", event_type}}).Increment();
}

void Observability::set_running_workflows(int64_t count) {
    if (!FeatureFlags::is_metrics_enabled()) {
        return;
    }
    running_workflows_gauge_->Set(static_cast<double>(count));
}

std::string Observability::metrics_text() {
    if (!FeatureFlags::is_metrics_enabled()) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

SpanPtr Observability::start_span(const std::string& operation,
                                  const std::map<std::string, std::string>& attributes) {
    std::map<std::string, std::string> span_attributes = attributes;
    span_attributes["component"] = component_;
    return tracer_->StartSpan(operation, span_attributes);
}

void Observability::log_debug(const std::string& message,
                              const std::string& workflow_id,
                              const std::string& execution_id,
                              const std::string& step_name,
                              const std::unordered_map<std::string, std::string>& context) {
    if (!is_enabled(LogLevel::debug)) {
        return;
    }
    write_log(LogLevel::debug, format_json_log("DEBUG", message, workflow_id, execution_id, step_name, context));
}

void Observability::log_info(const std::string& message,
                             const std::string& workflow_id,
                             const std::string& execution_id,
                             const std::string& step_name,
                             const std::unordered_map<std::string, std::string>& context) {
    if (!is_enabled(LogLevel::info)) {
        return;
    }
    write_log(LogLevel::info, format_json_log("INFO", message, workflow_id, execution_id, step_name, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& workflow_id,
                             const std::string& execution_id,
                             const std::string& step_name,
                             const std::unordered_map<std::string, std::string>& context) {
    if (!is_enabled(LogLevel::warn)) {
        return;
    }
    write_log(LogLevel::warn, format_json_log("WARN", message, workflow_id, execution_id, step_name, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& workflow_id,
                              const std::string& execution_id,
                              const std::string& step_name,
                              const std::unordered_map<std::string, std::string>& context) {
    if (!is_enabled(LogLevel::error)) {
        return;
    }
    write_log(LogLevel::error, format_json_log("ERROR", message, workflow_id, execution_id, step_name, context));
}

void Observability::write_log(LogLevel level, const std::string& line) const {
    std::lock_guard<std::mutex> lock(log_mutex());
    if (level == LogLevel::error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& workflow_id,
                                           const std::string& execution_id,
                                           const std::string& step_name,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = iso8601_now();
    log_entry["level"] = level;
    log_entry["component"] = component_;
    log_entry["message"] = message;

    // Correlation fields (top level, when provided)
    if (!workflow_id.empty()) {
        log_entry["workflow_id"] = workflow_id;
    }
    if (!execution_id.empty()) {
        log_entry["execution_id"] = execution_id;
    }
    if (!step_name.empty()) {
        log_entry["step_name"] = step_name;
    }

    if (!context.empty()) {
        json context_obj = json::object();
        for (const auto& [key, value] : context) {
            context_obj[key] = value;
        }
        filter_pii_recursive(context_obj);
        log_entry["context"] = context_obj;
    }

    return log_entry.dump();
}

} // namespace workflow
} // namespace flowcore
