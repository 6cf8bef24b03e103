#include "flowcore/workflow/state_record.hpp"
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/result_converter.hpp"
#include "flowcore/workflow/time_utils.hpp"
#include <algorithm>
#include <cmath>

namespace flowcore {
namespace workflow {

bool StateRecord::is_step_completed(const std::string& step_name) const {
    return std::find(steps_completed.begin(), steps_completed.end(), step_name) != steps_completed.end();
}

void StateRecord::apply_progress(double value, const std::optional<std::string>& step) {
    if (std::isnan(value) || value < 0.0 || value > 1.0) {
        throw StateError("progress out of range [0, 1]: " + std::to_string(value));
    }
    progress = value;
    if (step) {
        current_step = *step;
    }
    touch();
}

void StateRecord::apply_step_completed(const std::string& step_name,
                                       const std::optional<nlohmann::json>& output) {
    if (!is_step_completed(step_name)) {
        steps_completed.push_back(step_name);
    }
    steps_remaining.erase(step_name);
    if (output) {
        data["step_" + step_name] = *output;
    }
    touch();
}

void StateRecord::apply_status(ExecutionStatus next, const std::optional<std::string>& error_message) {
    if (next != status && !is_valid_transition(status, next)) {
        throw StateError("invalid status transition " + ResultConverter::status_to_string(status) +
                         " -> " + ResultConverter::status_to_string(next) + " for workflow '" +
                         workflow_id + "'");
    }
    status = next;
    if (error_message) {
        error = *error_message;
    }
    touch();
}

void StateRecord::touch(TimePoint now) {
    updated_at = std::max(updated_at, now);
}

nlohmann::json StateRecord::to_json() const {
    nlohmann::json j = {
        {"workflow_id", workflow_id},
        {"execution_id", execution_id},
        {"status", ResultConverter::status_to_string(status)},
        {"current_step", current_step},
        {"steps_completed", steps_completed},
        {"steps_remaining", steps_remaining},
        {"progress", progress},
        {"data", data},
        {"created_at", format_iso8601(created_at)},
        {"updated_at", format_iso8601(updated_at)},
        {"metadata", metadata}
    };
    if (error) {
        j["error"] = *error;
    } else {
        j["error"] = nullptr;
    }
    return j;
}

StateRecord StateRecord::from_json(const nlohmann::json& j) {
    StateRecord record;
    record.workflow_id = j.value("workflow_id", std::string());
    record.execution_id = j.value("execution_id", std::string());

    auto status = ResultConverter::string_to_status(j.value("status", std::string("pending")));
    if (!status) {
        throw StateError("unknown execution status: " + j.value("status", std::string()));
    }
    record.status = *status;

    record.current_step = j.value("current_step", std::string());
    if (j.contains("steps_completed")) {
        for (const auto& step : j.at("steps_completed")) {
            auto name = step.get<std::string>();
            if (!record.is_step_completed(name)) {
                record.steps_completed.push_back(name);
            }
        }
    }
    if (j.contains("steps_remaining")) {
        record.steps_remaining = j.at("steps_remaining").get<std::set<std::string>>();
    }
    for (const auto& step : record.steps_completed) {
        record.steps_remaining.erase(step);
    }

    record.progress = j.value("progress", 0.0);
    if (j.contains("data") && j.at("data").is_object()) {
        record.data = j.at("data");
    }
    if (j.contains("error") && j.at("error").is_string()) {
        record.error = j.at("error").get<std::string>();
    }
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        record.metadata = j.at("metadata");
    }

    if (j.contains("created_at")) {
        auto created = parse_iso8601(j.at("created_at").get<std::string>());
        if (!created) {
            throw StateError("malformed created_at: " + j.at("created_at").get<std::string>());
        }
        record.created_at = *created;
    }
    record.updated_at = record.created_at;
    if (j.contains("updated_at")) {
        auto updated = parse_iso8601(j.at("updated_at").get<std::string>());
        if (!updated) {
            throw StateError("malformed updated_at: " + j.at("updated_at").get<std::string>());
        }
        record.updated_at = *updated;
    }
    return record;
}

} // namespace workflow
} // namespace flowcore
