#include "courier/engine/observability.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <vector>

namespace courier {
namespace engine {

using json = nlohmann::json;

// Secret-bearing field names to redact (substring match, case-insensitive)
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "api_key", "api-key", "apikey", "secret", "token",
    "authorization", "cookie", "credit_card", "ssn"
};

static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

// ISO 8601 with microseconds, UTC
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

static std::string optional_id(const std::optional<int64_t>& id) {
    return id ? std::to_string(*id) : std::string();
}

Observability::Observability(const std::string& component, LogLevel min_level, bool metrics_enabled)
    : component_(component), min_level_(min_level), metrics_enabled_(metrics_enabled) {
    initialize_metrics();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();
    if (!metrics_enabled_) {
        return;
    }

    dispatch_total_family_ = &prometheus::BuildCounter()
        .Name("courier_dispatch_total")
        .Help("Total number of HTTP dispatches by method and outcome")
        .Labels({{"component", component_}})
        .Register(*registry_);

    dispatch_duration_family_ = &prometheus::BuildHistogram()
        .Name("courier_dispatch_duration_seconds")
        .Help("Wall-clock duration of HTTP dispatches in seconds")
        .Labels({{"component", component_}})
        .Register(*registry_);

    collection_runs_family_ = &prometheus::BuildCounter()
        .Name("courier_collection_runs_total")
        .Help("Total number of collection runs by result")
        .Labels({{"component", component_}})
        .Register(*registry_);
}

void Observability::record_dispatch(const std::string& method, const std::string& outcome, double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }

    dispatch_total_family_->Add({{"method", method}, {"outcome", outcome}}).Increment();
    dispatch_duration_family_->Add({{"method", method}},
        prometheus::Histogram::BucketBoundaries{0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0})
        .Observe(duration_seconds);
}

void Observability::record_collection_run(const std::string& result) {
    if (!metrics_enabled_) {
        return;
    }
    collection_runs_family_->Add({{"result", result}}).Increment();
}

std::string Observability::metrics_text() const {
    if (!metrics_enabled_) {
        return "";
    }

    std::ostringstream oss;
    prometheus::TextSerializer serializer;
    serializer.Serialize(oss, registry_->Collect());
    return oss.str();
}

void Observability::log_info(const std::string& message,
                             const std::string& run_id,
                             const std::string& collection_id,
                             const std::string& request_id,
                             const std::string& transaction_id,
                             const std::unordered_map<std::string, std::string>& context) {
    if (min_level_ > LogLevel::info) {
        return;
    }
    write(LogLevel::info, format_json_log("INFO", message, run_id, collection_id, request_id, transaction_id, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& run_id,
                             const std::string& collection_id,
                             const std::string& request_id,
                             const std::string& transaction_id,
                             const std::unordered_map<std::string, std::string>& context) {
    if (min_level_ > LogLevel::warn) {
        return;
    }
    write(LogLevel::warn, format_json_log("WARN", message, run_id, collection_id, request_id, transaction_id, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& run_id,
                              const std::string& collection_id,
                              const std::string& request_id,
                              const std::string& transaction_id,
                              const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::error, format_json_log("ERROR", message, run_id, collection_id, request_id, transaction_id, context));
}

void Observability::log_debug(const std::string& message,
                              const std::string& run_id,
                              const std::string& collection_id,
                              const std::string& request_id,
                              const std::string& transaction_id,
                              const std::unordered_map<std::string, std::string>& context) {
    if (min_level_ > LogLevel::debug) {
        return;
    }
    write(LogLevel::debug, format_json_log("DEBUG", message, run_id, collection_id, request_id, transaction_id, context));
}

void Observability::log_info_with_request(const std::string& message,
                                          const RequestDescriptor& request,
                                          const std::unordered_map<std::string, std::string>& context) {
    log_with_request(LogLevel::info, message, request, context);
}

void Observability::log_warn_with_request(const std::string& message,
                                          const RequestDescriptor& request,
                                          const std::unordered_map<std::string, std::string>& context) {
    log_with_request(LogLevel::warn, message, request, context);
}

void Observability::log_error_with_request(const std::string& message,
                                           const RequestDescriptor& request,
                                           const std::unordered_map<std::string, std::string>& context) {
    log_with_request(LogLevel::error, message, request, context);
}

void Observability::log_with_request(LogLevel level,
                                     const std::string& message,
                                     const RequestDescriptor& request,
                                     const std::unordered_map<std::string, std::string>& context) {
    if (level != LogLevel::error && min_level_ > level) {
        return;
    }
    write(level, format_json_log(level_name(level), message, "",
                                 optional_id(request.collection_id),
                                 optional_id(request.id),
                                 request.transaction_id.value_or(""),
                                 context));
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& run_id,
                                           const std::string& collection_id,
                                           const std::string& request_id,
                                           const std::string& transaction_id,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = component_;
    log_entry["message"] = message;

    // Correlation ids at top level, when provided
    if (!run_id.empty()) {
        log_entry["run_id"] = run_id;
    }
    if (!collection_id.empty()) {
        log_entry["collection_id"] = collection_id;
    }
    if (!request_id.empty()) {
        log_entry["request_id"] = request_id;
    }
    if (!transaction_id.empty()) {
        log_entry["transaction_id"] = transaction_id;
    }

    json context_obj = json::object();
    for (const auto& [key, value] : context) {
        // Header snapshots arrive as serialized objects; redact inside them too
        if (!value.empty() && value.front() == '{') {
            json nested = json::parse(value, nullptr, false);
            if (!nested.is_discarded()) {
                context_obj[key] = std::move(nested);
                continue;
            }
        }
        context_obj[key] = value;
    }

    filter_secrets_recursive(context_obj);

    if (!context_obj.empty()) {
        log_entry["context"] = context_obj;
    }

    return log_entry.dump(-1, ' ', false, json::error_handler_t::replace);
}

void Observability::write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (level == LogLevel::error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::shared_ptr<Observability> default_observability(const std::string& component) {
    auto config = EngineConfig::from_environment();
    return std::make_shared<Observability>(component, config.log_level, config.metrics_enabled);
}

} // namespace engine
} // namespace courier
