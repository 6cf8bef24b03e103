#include "flowcore/workflow/event_bus.hpp"
#include "flowcore/workflow/time_utils.hpp"
#include <algorithm>
#include <future>

namespace flowcore {
namespace workflow {

EventBus::EventBus(size_t max_history, std::shared_ptr<Observability> observability)
    : max_history_(max_history),
      observability_(observability ? std::move(observability) : std::make_shared<Observability>("event_bus")) {}

SubscriptionId EventBus::subscribe(const std::string& event_type, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[event_type].emplace_back(id, std::move(handler));
    return id;
}

bool EventBus::unsubscribe(const std::string& event_type, SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(event_type);
    if (it == subscribers_.end()) {
        return false;
    }
    auto& handlers = it->second;
    auto pos = std::find_if(handlers.begin(), handlers.end(),
                            [id](const auto& entry) { return entry.first == id; });
    if (pos == handlers.end()) {
        return false;
    }
    handlers.erase(pos);
    if (handlers.empty()) {
        subscribers_.erase(it);
    }
    return true;
}

size_t EventBus::publish(const std::string& event_type, const nlohmann::json& payload) {
    std::string workflow_id;
    if (payload.is_object()) {
        auto it = payload.find("workflow_id");
        if (it != payload.end() && it->is_string()) {
            workflow_id = it->get<std::string>();
        }
    }
    nlohmann::json event = {
        {"type", event_type},
        {"workflow_id", workflow_id},
        {"timestamp", iso8601_now()},
        {"data", payload}
    };

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(event);
        while (history_.size() > max_history_) {
            history_.pop_front();
        }
        auto it = subscribers_.find(event_type);
        if (it != subscribers_.end()) {
            for (const auto& entry : it->second) {
                handlers.push_back(entry.second);
            }
        }
    }

    observability_->record_event_published(event_type);
    if (handlers.empty()) {
        return 0;
    }

    std::vector<std::future<void>> pending;
    pending.reserve(handlers.size());
    for (auto& handler : handlers) {
        pending.push_back(std::async(std::launch::async, [&handler, &payload]() { handler(payload); }));
    }

    size_t delivered = 0;
    for (auto& future : pending) {
        try {
            future.get();
            ++delivered;
        } catch (const std::exception& e) {
            observability_->record_event_handler_failure(event_type);
            observability_->log_error("Event handler failed", workflow_id, "", "",
                                      {{"event_type", event_type}, {"error", e.what()}});
        } catch (...) {
            observability_->record_event_handler_failure(event_type);
            observability_->log_error("Event handler failed", workflow_id, "", "",
                                      {{"event_type", event_type}, {"error", "non-standard exception"}});
        }
    }
    return delivered;
}

std::vector<nlohmann::json> EventBus::get_event_history(const std::optional<std::string>& event_type,
                                                        const std::optional<std::string>& workflow_id,
                                                        size_t limit) const {
    std::vector<nlohmann::json> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : history_) {
            if (event_type && event["type"] != *event_type) {
                continue;
            }
            if (workflow_id && event["workflow_id"] != *workflow_id) {
                continue;
            }
            matched.push_back(event);
        }
    }

    if (matched.size() > limit) {
        matched.erase(matched.begin(), matched.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return matched;
}

void EventBus::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

size_t EventBus::subscriber_count(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(event_type);
    return it == subscribers_.end() ? 0 : it->second.size();
}

} // namespace workflow
} // namespace flowcore
