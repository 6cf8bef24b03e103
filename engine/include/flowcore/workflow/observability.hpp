#pragma once

#include "flowcore/workflow/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <cstdint>

namespace flowcore {
namespace workflow {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

class Observability {
public:
    explicit Observability(const std::string& component);

    // Metrics (recorded only when FLOWCORE_METRICS_ENABLED is set)
    void record_workflow_execution(const std::string& workflow_id,
                                   const std::string& status,
                                   double duration_seconds);

    void record_step_execution(const std::string& agent_type,
                               const std::string& status,
                               double duration_seconds);

    void record_step_retry(const std::string& agent_type);

    void record_event_published(const std::string& event_type);

    void record_event_handler_failure(const std::string& event_type);

    void set_running_workflows(int64_t count);

    std::string metrics_text(); // Prometheus text format

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing (no-op spans unless FLOWCORE_TRACING_ENABLED is set)
    SpanPtr start_span(const std::string& operation,
                       const std::map<std::string, std::string>& attributes = {});

    // Logging
    void log_debug(const std::string& message,
                   const std::string& workflow_id = "",
                   const std::string& execution_id = "",
                   const std::string& step_name = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_info(const std::string& message,
                  const std::string& workflow_id = "",
                  const std::string& execution_id = "",
                  const std::string& step_name = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& workflow_id = "",
                  const std::string& execution_id = "",
                  const std::string& step_name = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& workflow_id = "",
                   const std::string& execution_id = "",
                   const std::string& step_name = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    bool is_enabled(LogLevel level) const { return level >= min_level_; }

    const std::string& component() const { return component_; }

    // Builds one JSON log line; exposed for tests
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& workflow_id,
                                const std::string& execution_id,
                                const std::string& step_name,
                                const std::unordered_map<std::string, std::string>& context) const;

private:
    std::string component_;
    LogLevel min_level_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* workflow_executions_total_family_;
    prometheus::Family<prometheus::Histogram>* workflow_duration_seconds_family_;
    prometheus::Family<prometheus::Counter>* step_executions_total_family_;
    prometheus::Family<prometheus::Histogram>* step_duration_seconds_family_;
    prometheus::Family<prometheus::Counter>* step_retries_total_family_;
    prometheus::Family<prometheus::Counter>* events_published_total_family_;
    prometheus::Family<prometheus::Counter>* event_handler_failures_total_family_;
    prometheus::Gauge* running_workflows_gauge_;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    void initialize_metrics();
    void initialize_tracing();
    void write_log(LogLevel level, const std::string& line) const;
};

LogLevel parse_log_level(const std::string& value);

} // namespace workflow
} // namespace flowcore
