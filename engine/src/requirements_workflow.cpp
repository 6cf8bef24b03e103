#include "flowcore/workflow/requirements_workflow.hpp"

namespace flowcore {
namespace workflow {

namespace {

WorkflowStep analysis_step(std::string name,
                           std::string description,
                           std::string agent_type,
                           std::set<std::string> required_inputs,
                           std::set<std::string> outputs) {
    WorkflowStep step;
    step.name = std::move(name);
    step.description = std::move(description);
    step.agent_type = std::move(agent_type);
    step.required_inputs = std::move(required_inputs);
    step.outputs = std::move(outputs);
    step.timeout_ms = 300000;
    step.metadata = {{"category", "requirements_analysis"}};
    return step;
}

} // namespace

std::shared_ptr<WorkflowDefinition> make_requirements_workflow(const std::string& workflow_id) {
    auto definition = std::make_shared<WorkflowDefinition>(
        workflow_id,
        "Requirements analysis",
        "Multi-agent requirements analysis: analysis, clarification, business and technical review, "
        "quality review and documentation",
        "1.0.0");

    definition->set_initial_inputs({"initial_requirements", "project_context"});
    definition->set_strategy(ExecutionStrategy::adaptive);

    definition->add_step(analysis_step(
        "initial_analysis", "Analyze the initial requirements", "requirements_analyzer",
        {"initial_requirements", "project_context"},
        {"initial_analysis_result", "requirement_points", "analysis_depth"}));

    definition->add_step(analysis_step(
        "clarification", "Clarify requirement details through questions", "requirement_clarifier",
        {"initial_analysis_result", "requirement_points"},
        {"clarified_requirements", "clarification_questions"}));

    definition->add_step(analysis_step(
        "business_analysis", "Assess business value and impact", "business_analyst",
        {"clarified_requirements"},
        {"business_analysis_result", "business_rules"}));

    // Runs beside business_analysis, so business_rules is only used when present
    WorkflowStep technical = analysis_step(
        "technical_analysis", "Assess technical feasibility", "technical_analyst",
        {"clarified_requirements"},
        {"technical_analysis_result", "technical_constraints"});
    technical.optional_inputs = {"business_rules"};
    definition->add_step(std::move(technical));

    definition->add_step(analysis_step(
        "quality_review", "Review requirement quality and completeness", "quality_reviewer",
        {"clarified_requirements", "business_analysis_result", "technical_analysis_result"},
        {"quality_review_result", "improvement_suggestions"}));

    definition->add_step(analysis_step(
        "documentation", "Produce the requirements specification document", "technical_writer",
        {"clarified_requirements", "business_analysis_result", "technical_analysis_result",
         "quality_review_result"},
        {"requirements_document"}));

    definition->add_dependency("initial_analysis", "clarification");
    definition->add_dependency("clarification", "business_analysis");
    definition->add_dependency("clarification", "technical_analysis");
    definition->add_dependency("business_analysis", "quality_review");
    definition->add_dependency("technical_analysis", "quality_review");
    definition->add_dependency("quality_review", "documentation");

    return definition;
}

} // namespace workflow
} // namespace flowcore
