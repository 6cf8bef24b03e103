#pragma once

#include "flowcore/workflow/workflow_definition.hpp"
#include <memory>
#include <string>

namespace flowcore {
namespace workflow {

/**
 * Built-in requirements analysis workflow.
 *
 *   initial_analysis -> clarification -> business_analysis  -> quality_review -> documentation
 *                                     -> technical_analysis ->
 *
 * Business and technical analysis form one parallel frontier. Initial
 * inputs: initial_requirements, project_context.
 */
std::shared_ptr<WorkflowDefinition> make_requirements_workflow(const std::string& workflow_id = "requirements_analysis");

} // namespace workflow
} // namespace flowcore
