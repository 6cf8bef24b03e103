#include "flowcore/workflow/executor_registry.hpp"
#include <caf/error.hpp>
#include <caf/sec.hpp>
#include <exception>

namespace flowcore {
namespace workflow {

void ExecutorRegistry::register_factory(const std::string& agent_type, Factory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factories_[agent_type] = std::move(factory);
    instances_.erase(agent_type);
}

void ExecutorRegistry::register_executor(std::shared_ptr<StepExecutor> executor) {
    auto agent_type = executor->agent_type();
    register_factory(agent_type, [executor]() { return executor; });
}

bool ExecutorRegistry::unregister(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    instances_.erase(agent_type);
    return factories_.erase(agent_type) > 0;
}

bool ExecutorRegistry::contains(const std::string& agent_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.count(agent_type) > 0;
}

std::vector<std::string> ExecutorRegistry::agent_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(factories_.size());
    for (const auto& [agent_type, factory] : factories_) {
        types.push_back(agent_type);
    }
    return types;
}

caf::expected<std::shared_ptr<StepExecutor>> ExecutorRegistry::resolve(const std::string& agent_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = instances_.find(agent_type);
    if (cached != instances_.end()) {
        return cached->second;
    }

    auto it = factories_.find(agent_type);
    if (it == factories_.end()) {
        return caf::make_error(caf::sec::runtime_error, "no executor registered for agent type: " + agent_type);
    }

    std::shared_ptr<StepExecutor> executor;
    try {
        executor = it->second();
    } catch (const std::exception& e) {
        return caf::make_error(caf::sec::runtime_error,
                               "executor factory failed for agent type " + agent_type + ": " + e.what());
    }
    if (!executor) {
        return caf::make_error(caf::sec::runtime_error, "executor factory returned null for agent type: " + agent_type);
    }
    instances_.emplace(agent_type, executor);
    return executor;
}

} // namespace workflow
} // namespace flowcore
