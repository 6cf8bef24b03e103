#pragma once

#include "flowcore/workflow/observability.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

// Lifecycle event types published by the engine
namespace events {
constexpr const char* workflow_started = "workflow_started";
constexpr const char* step_started = "step_started";
constexpr const char* step_retrying = "step_retrying";
constexpr const char* step_completed = "step_completed";
constexpr const char* step_failed = "step_failed";
constexpr const char* workflow_completed = "workflow_completed";
constexpr const char* workflow_failed = "workflow_failed";
constexpr const char* workflow_terminated = "workflow_terminated";
} // namespace events

using EventHandler = std::function<void(const nlohmann::json&)>;
using SubscriptionId = uint64_t;

/**
 * In-process publish/subscribe with a bounded event history.
 *
 * Each published event is stored as {type, workflow_id, timestamp, data};
 * handlers subscribed to its type at the moment of publishing receive the
 * payload itself. A non-string workflow_id in the payload is recorded as "". Handlers run concurrently; a handler that throws is logged
 * and does not affect delivery to the others.
 */
class EventBus {
public:
    explicit EventBus(size_t max_history = 1000,
                      std::shared_ptr<Observability> observability = nullptr);

    SubscriptionId subscribe(const std::string& event_type, EventHandler handler);

    // False when no such subscription exists
    bool unsubscribe(const std::string& event_type, SubscriptionId id);

    /**
     * Records the event and waits until every handler has run.
     * Returns the number of handlers that completed without throwing.
     */
    size_t publish(const std::string& event_type, const nlohmann::json& payload);

    // Most recent `limit` matching events, oldest first
    std::vector<nlohmann::json> get_event_history(const std::optional<std::string>& event_type = std::nullopt,
                                                  const std::optional<std::string>& workflow_id = std::nullopt,
                                                  size_t limit = 100) const;

    void clear_history();

    size_t subscriber_count(const std::string& event_type) const;

    size_t max_history() const { return max_history_; }

private:
    size_t max_history_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    SubscriptionId next_id_ = 1;
    std::map<std::string, std::vector<std::pair<SubscriptionId, EventHandler>>> subscribers_;
    std::deque<nlohmann::json> history_;
};

} // namespace workflow
} // namespace flowcore
