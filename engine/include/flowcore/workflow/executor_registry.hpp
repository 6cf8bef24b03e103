#pragma once

#include "flowcore/workflow/step_executor.hpp"
#include <caf/expected.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowcore {
namespace workflow {

/**
 * Maps agent types to executors.
 *
 * Factories are invoked lazily on the first resolve() of their agent type
 * and the instance is reused afterwards, so executor metrics accumulate
 * across executions. Registering again for the same type replaces the
 * factory and drops the cached instance.
 */
class ExecutorRegistry {
public:
    using Factory = std::function<std::shared_ptr<StepExecutor>()>;

    void register_factory(const std::string& agent_type, Factory factory);

    // Registers a factory that always hands out `executor`
    void register_executor(std::shared_ptr<StepExecutor> executor);

    bool unregister(const std::string& agent_type);

    bool contains(const std::string& agent_type) const;

    std::vector<std::string> agent_types() const;

    // Error when no factory is registered, or the factory throws or yields nothing
    caf::expected<std::shared_ptr<StepExecutor>> resolve(const std::string& agent_type);

private:
    mutable std::mutex mutex_;
    std::map<std::string, Factory> factories_;
    std::map<std::string, std::shared_ptr<StepExecutor>> instances_;
};

} // namespace workflow
} // namespace flowcore
