#pragma once

#include "courier/engine/core.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace courier {
namespace engine {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

/**
 * Engine settings
 *
 * Every value can be overridden through an environment variable:
 * - COURIER_DEFAULT_TIMEOUT_MS   per-request timeout when the request sets none
 * - COURIER_CONNECT_TIMEOUT_MS   connection establishment limit
 * - COURIER_USER_AGENT           User-Agent sent when the request sets none
 * - COURIER_LOG_LEVEL            debug | info | warn | error
 * - COURIER_METRICS_ENABLED      collect Prometheus metrics
 */
struct EngineConfig {
    int64_t default_timeout_ms = kDefaultTimeoutMs;
    int64_t connect_timeout_ms = 10000;
    std::string user_agent = "courier-engine/1.0";
    LogLevel log_level = LogLevel::info;
    bool metrics_enabled = true;

    static EngineConfig from_environment() {
        EngineConfig config;
        config.default_timeout_ms = get_env_int("COURIER_DEFAULT_TIMEOUT_MS", config.default_timeout_ms);
        config.connect_timeout_ms = get_env_int("COURIER_CONNECT_TIMEOUT_MS", config.connect_timeout_ms);
        config.log_level = parse_log_level(get_env_string("COURIER_LOG_LEVEL", "info"));
        config.metrics_enabled = get_env_bool("COURIER_METRICS_ENABLED", config.metrics_enabled);

        const char* agent = std::getenv("COURIER_USER_AGENT");
        if (agent != nullptr && *agent != '\0') {
            config.user_agent = agent;
        }
        return config;
    }

    static LogLevel parse_log_level(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "debug") {
            return LogLevel::debug;
        } else if (value == "warn" || value == "warning") {
            return LogLevel::warn;
        } else if (value == "error") {
            return LogLevel::error;
        }
        return LogLevel::info;
    }

private:
    /**
     * Returns `true` for "true", "1" or "yes" (case-insensitive),
     * `false` for "false", "0" or "no", `default_value` otherwise.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (str_value == "true" || str_value == "1" || str_value == "yes") {
            return true;
        }
        if (str_value == "false" || str_value == "0" || str_value == "no") {
            return false;
        }
        return default_value;
    }

    // Positive integers only; anything else keeps the default
    static int64_t get_env_int(const char* env_var, int64_t default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        char* end = nullptr;
        long long parsed = std::strtoll(value, &end, 10);
        if (end == value || *end != '\0' || parsed <= 0) {
            return default_value;
        }
        return static_cast<int64_t>(parsed);
    }

    static std::string get_env_string(const char* env_var, const std::string& default_value) {
        const char* value = std::getenv(env_var);
        return value != nullptr ? std::string(value) : default_value;
    }
};

} // namespace engine
} // namespace courier
