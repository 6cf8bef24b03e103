#include "flowcore/workflow/workflow_result.hpp"
#include "flowcore/workflow/result_converter.hpp"
#include "flowcore/workflow/time_utils.hpp"

namespace flowcore {
namespace workflow {

nlohmann::json WorkflowResult::to_json() const {
    nlohmann::json j = {
        {"workflow_id", workflow_id},
        {"execution_id", execution_id},
        {"status", ResultConverter::status_to_string(status)},
        {"success", success},
        {"steps_results", steps_results},
        {"data", data},
        {"start_time", format_iso8601(start_time)},
        {"end_time", end_time ? nlohmann::json(format_iso8601(*end_time)) : nlohmann::json(nullptr)},
        {"duration_ms", duration_ms},
        {"errors", errors},
        {"warnings", warnings},
        {"metadata", metadata}
    };
    if (error_code != ErrorCode::none) {
        j["error_code"] = ResultConverter::error_code_to_string(error_code);
        j["failed_step"] = failed_step;
    }
    return j;
}

} // namespace workflow
} // namespace flowcore
