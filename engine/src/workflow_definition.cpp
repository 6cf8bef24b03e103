#include "flowcore/workflow/workflow_definition.hpp"
#include "flowcore/workflow/result_converter.hpp"
#include "flowcore/workflow/time_utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace flowcore {
namespace workflow {

WorkflowDefinition::WorkflowDefinition(std::string id,
                                       std::string name,
                                       std::string description,
                                       std::string version)
    : id_(std::move(id)),
      name_(std::move(name)),
      description_(std::move(description)),
      version_(std::move(version)),
      created_at_(Clock::now()),
      updated_at_(created_at_) {}

void WorkflowDefinition::ensure_mutable(const char* operation) const {
    if (frozen_) {
        throw StateError(std::string(operation) + " on registered workflow '" + id_ + "'");
    }
}

void WorkflowDefinition::touch() {
    updated_at_ = std::max(updated_at_, Clock::now());
}

void WorkflowDefinition::add_step(WorkflowStep step) {
    ensure_mutable("add_step");
    steps_.push_back(std::move(step));
    touch();
}

void WorkflowDefinition::add_dependency(const std::string& from, const std::string& to) {
    ensure_mutable("add_dependency");
    auto& prereqs = dependencies_[to];
    if (std::find(prereqs.begin(), prereqs.end(), from) == prereqs.end()) {
        prereqs.push_back(from);
    }
    touch();
}

void WorkflowDefinition::set_initial_inputs(std::set<std::string> inputs) {
    ensure_mutable("set_initial_inputs");
    initial_inputs_ = std::move(inputs);
    touch();
}

void WorkflowDefinition::set_strategy(ExecutionStrategy strategy) {
    ensure_mutable("set_strategy");
    strategy_ = strategy;
    touch();
}

void WorkflowDefinition::set_max_execution_time_ms(int64_t ms) {
    ensure_mutable("set_max_execution_time_ms");
    max_execution_time_ms_ = ms < 0 ? 0 : ms;
    touch();
}

void WorkflowDefinition::update_metadata(const nlohmann::json& updates) {
    ensure_mutable("update_metadata");
    if (updates.is_object()) {
        metadata_.update(updates);
    }
    touch();
}

const WorkflowStep* WorkflowDefinition::find_step(const std::string& name) const {
    for (const auto& step : steps_) {
        if (step.name == name) {
            return &step;
        }
    }
    return nullptr;
}

std::vector<std::string> WorkflowDefinition::get_step_dependencies(const std::string& name) const {
    auto it = dependencies_.find(name);
    if (it == dependencies_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> WorkflowDefinition::get_dependent_steps(const std::string& name) const {
    std::vector<std::string> dependents;
    for (const auto& step : steps_) {
        auto prereqs = get_step_dependencies(step.name);
        if (std::find(prereqs.begin(), prereqs.end(), name) != prereqs.end()) {
            dependents.push_back(step.name);
        }
    }
    return dependents;
}

StepGraph WorkflowDefinition::build_graph() const {
    StepGraph graph;
    for (const auto& step : steps_) {
        graph.add_node(step.name);
    }
    for (const auto& [step, prereqs] : dependencies_) {
        if (!graph.index_of(step)) {
            throw ValidationError(ValidationIssue::unknown_step,
                                  "dependency declared for unknown step: " + step, step);
        }
        for (const auto& prereq : prereqs) {
            graph.add_edge(prereq, step);
        }
    }
    return graph;
}

ValidationResult WorkflowDefinition::validate() const {
    if (steps_.empty()) {
        return ValidationResult::fail(ValidationIssue::no_steps, "workflow '" + id_ + "' has no steps");
    }

    std::unordered_set<std::string> names;
    for (const auto& step : steps_) {
        if (!names.insert(step.name).second) {
            return ValidationResult::fail(ValidationIssue::duplicate_step,
                                          "duplicate step name: " + step.name, step.name);
        }
    }

    for (const auto& [step, prereqs] : dependencies_) {
        if (names.count(step) == 0) {
            return ValidationResult::fail(ValidationIssue::unknown_step,
                                          "dependency declared for unknown step: " + step, step);
        }
        for (const auto& prereq : prereqs) {
            if (names.count(prereq) == 0) {
                return ValidationResult::fail(ValidationIssue::unknown_step,
                                              "step '" + step + "' depends on unknown step: " + prereq,
                                              prereq);
            }
        }
    }

    StepGraph graph = build_graph();
    if (auto cycle = graph.find_cycle()) {
        return ValidationResult::fail(ValidationIssue::cycle_detected,
                                      "circular dependency through step: " + *cycle, *cycle);
    }

    auto order = graph.topological_order();
    if (!order) {
        return ValidationResult::fail(ValidationIssue::cycle_detected, "circular dependency");
    }

    // Simulate the run: each step sees initial inputs plus earlier outputs
    std::set<std::string> available = initial_inputs_;
    for (auto index : *order) {
        const WorkflowStep* step = find_step(graph.name_of(index));
        for (const auto& input : step->required_inputs) {
            if (available.count(input) == 0) {
                return ValidationResult::fail(ValidationIssue::unsatisfied_input,
                                              "step '" + step->name + "' requires input '" + input +
                                                  "' that no earlier step produces",
                                              step->name);
            }
        }
        available.insert(step->outputs.begin(), step->outputs.end());
    }

    return ValidationResult::ok();
}

std::vector<std::string> WorkflowDefinition::get_execution_order() const {
    StepGraph graph = build_graph();
    auto order = graph.topological_order();
    if (!order) {
        auto cycle = graph.find_cycle();
        throw ValidationError(ValidationIssue::cycle_detected,
                              "circular dependency in workflow '" + id_ + "'",
                              cycle ? *cycle : std::string());
    }

    std::vector<std::string> names;
    names.reserve(order->size());
    for (auto index : *order) {
        names.push_back(graph.name_of(index));
    }
    return names;
}

bool WorkflowDefinition::prerequisites_met(const std::string& step,
                                           const std::set<std::string>& completed) const {
    auto it = dependencies_.find(step);
    if (it == dependencies_.end()) {
        return true;
    }
    return std::all_of(it->second.begin(), it->second.end(),
                       [&completed](const std::string& prereq) { return completed.count(prereq) > 0; });
}

std::vector<std::string> WorkflowDefinition::get_parallel_steps(const std::set<std::string>& completed) const {
    std::vector<std::string> ready;
    for (const auto& step : steps_) {
        if (completed.count(step.name) == 0 && prerequisites_met(step.name, completed)) {
            ready.push_back(step.name);
        }
    }
    return ready;
}

std::vector<std::string> WorkflowDefinition::get_next_steps(const std::string& current,
                                                            const std::set<std::string>& completed) const {
    std::vector<std::string> next;
    for (const auto& step : steps_) {
        if (completed.count(step.name) > 0) {
            continue;
        }
        auto prereqs = get_step_dependencies(step.name);
        if (current.empty()) {
            if (prereqs.empty()) {
                next.push_back(step.name);
            }
            continue;
        }
        if (std::find(prereqs.begin(), prereqs.end(), current) == prereqs.end()) {
            continue;
        }
        bool others_done = std::all_of(prereqs.begin(), prereqs.end(), [&](const std::string& prereq) {
            return prereq == current || completed.count(prereq) > 0;
        });
        if (others_done) {
            next.push_back(step.name);
        }
    }
    return next;
}

nlohmann::json WorkflowDefinition::to_json() const {
    nlohmann::json steps = nlohmann::json::array();
    for (const auto& step : steps_) {
        steps.push_back(step.to_json());
    }
    return nlohmann::json{
        {"id", id_},
        {"name", name_},
        {"description", description_},
        {"version", version_},
        {"steps", steps},
        {"dependencies", dependencies_},
        {"initial_inputs", initial_inputs_},
        {"strategy", ResultConverter::strategy_to_string(strategy_)},
        {"max_execution_time_ms", max_execution_time_ms_},
        {"metadata", metadata_},
        {"created_at", format_iso8601(created_at_)},
        {"updated_at", format_iso8601(updated_at_)}
    };
}

std::shared_ptr<WorkflowDefinition> WorkflowDefinition::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id") || !j.at("id").is_string()) {
        throw ValidationError(ValidationIssue::no_steps, "workflow definition without an id");
    }

    auto definition = std::make_shared<WorkflowDefinition>(
        j.at("id").get<std::string>(),
        j.value("name", j.at("id").get<std::string>()),
        j.value("description", std::string()),
        j.value("version", std::string("1.0.0")));

    if (j.contains("steps")) {
        for (const auto& step : j.at("steps")) {
            definition->add_step(WorkflowStep::from_json(step));
        }
    }

    // Accepts the map form written by to_json and a list of {from, to} edges
    if (j.contains("dependencies")) {
        const auto& deps = j.at("dependencies");
        if (deps.is_object()) {
            for (auto it = deps.begin(); it != deps.end(); ++it) {
                for (const auto& prereq : it.value()) {
                    definition->add_dependency(prereq.get<std::string>(), it.key());
                }
            }
        } else if (deps.is_array()) {
            for (const auto& edge : deps) {
                definition->add_dependency(edge.at("from").get<std::string>(), edge.at("to").get<std::string>());
            }
        }
    }

    if (j.contains("initial_inputs")) {
        definition->set_initial_inputs(j.at("initial_inputs").get<std::set<std::string>>());
    }
    if (j.contains("strategy")) {
        auto strategy = ResultConverter::string_to_strategy(j.at("strategy").get<std::string>());
        if (!strategy) {
            throw ValidationError(ValidationIssue::none,
                                  "unknown execution strategy: " + j.at("strategy").get<std::string>());
        }
        definition->set_strategy(*strategy);
    }
    definition->set_max_execution_time_ms(j.value("max_execution_time_ms", int64_t{0}));
    if (j.contains("metadata")) {
        definition->update_metadata(j.at("metadata"));
    }
    return definition;
}

} // namespace workflow
} // namespace flowcore
