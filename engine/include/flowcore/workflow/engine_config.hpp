#pragma once

#include <cstdint>
#include <string>

namespace flowcore {
namespace workflow {

// Engine configuration
struct EngineConfig {
    int max_concurrent_workflows = 10;
    int step_pool_size = 4;
    int64_t default_step_timeout_ms = 300000; // used when a step declares none
    int max_event_history = 1000;
    bool enable_parallel = true;
    std::string state_db_path; // empty: in-memory state store
    int max_retained_executions = 1000;
};

} // namespace workflow
} // namespace flowcore
