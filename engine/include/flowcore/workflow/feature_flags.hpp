#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace flowcore {
namespace workflow {

/**
 * Environment feature flags
 *
 * Optional observability features are gated behind environment variables so
 * that embedding applications opt in explicitly:
 * - FLOWCORE_METRICS_ENABLED
 * - FLOWCORE_TRACING_ENABLED
 * - FLOWCORE_LOG_LEVEL (debug | info | warn | error)
 */
class FeatureFlags {
public:
    /**
     * Gates Prometheus metric recording in Observability
     */
    static bool is_metrics_enabled() {
        return get_env_bool("FLOWCORE_METRICS_ENABLED", false);
    }

    /**
     * Gates OpenTelemetry span creation for workflows and step attempts
     */
    static bool is_tracing_enabled() {
        return get_env_bool("FLOWCORE_TRACING_ENABLED", false);
    }

    /**
     * Minimum log level, lower-cased. Defaults to "info".
     */
    static std::string log_level() {
        const char* value = std::getenv("FLOWCORE_LOG_LEVEL");
        if (value == nullptr) {
            return "info";
        }
        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return str_value;
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` for "true", "1" or "yes" (case-insensitive) and
     * `default_value` when the variable is unset.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace workflow
} // namespace flowcore
