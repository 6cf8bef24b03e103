#include <iostream>
#include <fstream>
#include <caf/actor_system_config.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <nlohmann/json.hpp>
#include "flowcore/workflow/errors.hpp"
#include "flowcore/workflow/observability.hpp"
#include "flowcore/workflow/requirements_workflow.hpp"
#include "flowcore/workflow/sandbox_executor.hpp"
#include "flowcore/workflow/workflow_engine.hpp"

class RunnerConfig : public caf::actor_system_config {
public:
    RunnerConfig() {
        opt_group{custom_options_, "global"}
            .add(definition_path, "definition", "Workflow definition JSON file (default: built-in requirements workflow)")
            .add(input_path, "input", "Input data JSON file")
            .add(sandbox_latency_ms, "sandbox-latency-ms", "Simulated latency of sandbox executors (ms)")
            .add(engine_config.max_concurrent_workflows, "max-concurrent", "Max concurrently running workflows")
            .add(engine_config.step_pool_size, "step-pool-size", "Worker threads for step execution")
            .add(engine_config.default_step_timeout_ms, "default-step-timeout-ms", "Timeout for steps declaring none (ms)")
            .add(engine_config.max_event_history, "max-event-history", "Events kept in the event history")
            .add(engine_config.enable_parallel, "enable-parallel", "Dispatch ready steps as parallel frontiers")
            .add(engine_config.state_db_path, "state-db", "SQLite state database path (default: in-memory store)");
    }

    std::string definition_path;
    std::string input_path;
    int64_t sandbox_latency_ms = 0;
    flowcore::workflow::EngineConfig engine_config;
};

namespace {

nlohmann::json load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return nlohmann::json::parse(in);
}

nlohmann::json default_input() {
    return {
        {"initial_requirements", "Users can register, sign in and reset their password by email."},
        {"project_context", {{"domain", "web"}, {"team_size", 4}}}
    };
}

} // namespace

int run(const RunnerConfig& config) {
    using namespace flowcore::workflow;

    Observability observability("flowcore_runner");

    try {
        auto definition = config.definition_path.empty()
            ? make_requirements_workflow()
            : WorkflowDefinition::from_json(load_json_file(config.definition_path));
        auto input = config.input_path.empty() ? default_input() : load_json_file(config.input_path);

        WorkflowEngine engine(config.engine_config);
        size_t sandboxed = register_sandbox_executors(engine.executors(), *definition, config.sandbox_latency_ms);
        engine.register_workflow(definition);

        observability.log_info("Running workflow", definition->id(), "", "", {
            {"steps", std::to_string(definition->steps().size())},
            {"sandbox_executors", std::to_string(sandboxed)}
        });

        auto result = engine.execute(definition->id(), input);
        std::cout << result.to_json().dump(2) << std::endl;
        return result.success ? 0 : 2;

    } catch (const ValidationError& e) {
        observability.log_error("Workflow definition invalid", "", "", e.step_name(), {{"error", e.what()}});
        return 1;
    } catch (const std::exception& e) {
        observability.log_error("Runner fatal error", "", "", "", {{"error", e.what()}});
        return 1;
    }
}

int main(int argc, char** argv) {
    caf::core::init_global_meta_objects();
    RunnerConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    return run(config);
}
