#pragma once

#include "flowcore/workflow/core.hpp"
#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace flowcore {
namespace workflow {

/**
 * Step retry policy
 *
 * Implements:
 * - Exponential backoff: delay = min(base * 2^attempt, max)
 * - Error classification by kind (the string form of an ErrorCode)
 *
 * Enforced by the engine around each step invocation; executors do not
 * retry on their own.
 */
class RetryPolicy {
public:
    struct Config {
        int64_t base_delay_ms = 1000;     // Base delay for exponential backoff
        int64_t max_delay_ms = 60000;     // Maximum delay between retries
        int32_t max_retries = 3;          // Retries after the first attempt
        std::set<std::string> retryable_kinds = {"STEP_TIMEOUT", "NETWORK_ERROR"};
    };

    RetryPolicy() = default;
    explicit RetryPolicy(Config config) : config_(std::move(config)) {}

    /**
     * Delay before retry number `attempt` (0 for the first retry)
     */
    int64_t calculate_backoff_delay(int32_t attempt) const {
        if (attempt < 0) {
            attempt = 0;
        }
        int64_t delay = std::max<int64_t>(config_.base_delay_ms, 0);
        for (int32_t i = 0; i < attempt; ++i) {
            if (delay >= config_.max_delay_ms) {
                break;
            }
            delay *= 2;
        }
        return std::min(delay, config_.max_delay_ms);
    }

    bool is_retryable(const std::string& kind) const {
        return config_.retryable_kinds.count(kind) > 0;
    }

    /**
     * True when another attempt is allowed after `attempt` failed with `kind`
     */
    bool should_retry(const std::string& kind, int32_t attempt) const {
        return attempt < config_.max_retries && is_retryable(kind);
    }

    int32_t max_retries() const { return config_.max_retries; }
    int64_t base_delay_ms() const { return config_.base_delay_ms; }
    int64_t max_delay_ms() const { return config_.max_delay_ms; }
    const std::set<std::string>& retryable_kinds() const { return config_.retryable_kinds; }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"max_retries", config_.max_retries},
            {"base_delay_ms", config_.base_delay_ms},
            {"max_delay_ms", config_.max_delay_ms},
            {"retryable_kinds", config_.retryable_kinds}
        };
    }

    // Missing keys keep their defaults
    static RetryPolicy from_json(const nlohmann::json& j) {
        Config config;
        config.max_retries = j.value("max_retries", config.max_retries);
        config.base_delay_ms = j.value("base_delay_ms", config.base_delay_ms);
        config.max_delay_ms = j.value("max_delay_ms", config.max_delay_ms);
        if (j.contains("retryable_kinds")) {
            config.retryable_kinds = j.at("retryable_kinds").get<std::set<std::string>>();
        }
        return RetryPolicy(std::move(config));
    }

private:
    Config config_;
};

} // namespace workflow
} // namespace flowcore
