#include "flowcore/workflow/execution_context.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

namespace flowcore {
namespace workflow {

ExecutionContext::ExecutionContext(std::string workflow_id, std::string execution_id, nlohmann::json data)
    : workflow_id_(std::move(workflow_id)),
      execution_id_(std::move(execution_id)),
      data_(data.is_object() ? std::move(data) : nlohmann::json::object()) {}

std::string ExecutionContext::generate_execution_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    char buf[24];
    snprintf(buf, sizeof(buf), "exec-%016llx", static_cast<unsigned long long>(generator()));
    return std::string(buf);
}

ExecutionStatus ExecutionContext::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<TimePoint> ExecutionContext::start_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_time_;
}

std::optional<TimePoint> ExecutionContext::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

std::string ExecutionContext::current_step() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_step_;
}

nlohmann::json ExecutionContext::data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_;
}

nlohmann::json ExecutionContext::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

std::optional<std::string> ExecutionContext::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::vector<std::string> ExecutionContext::completed_steps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_steps_;
}

bool ExecutionContext::try_transition(ExecutionStatus next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_valid_transition(status_, next)) {
        return false;
    }
    status_ = next;
    return true;
}

void ExecutionContext::merge_input(const nlohmann::json& input) {
    if (!input.is_object()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    data_.update(input);
}

void ExecutionContext::mark_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!start_time_) {
        start_time_ = Clock::now();
    }
}

void ExecutionContext::mark_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    end_time_ = Clock::now();
}

void ExecutionContext::set_current_step(const std::string& step_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_step_ = step_name;
}

void ExecutionContext::set_error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = message;
}

void ExecutionContext::set_metadata(const std::string& key, nlohmann::json value) {
    std::lock_guard<std::mutex> lock(mutex_);
    metadata_[key] = std::move(value);
}

void ExecutionContext::commit_step(const std::string& step_name, const nlohmann::json& outputs) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outputs.is_object()) {
        data_.update(outputs);
    }
    if (std::find(completed_steps_.begin(), completed_steps_.end(), step_name) == completed_steps_.end()) {
        completed_steps_.push_back(step_name);
    }
}

} // namespace workflow
} // namespace flowcore
