#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/engine_config.hpp"
#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace courier {
namespace engine {

class Observability {
public:
    explicit Observability(const std::string& component,
                           LogLevel min_level = LogLevel::info,
                           bool metrics_enabled = true);
    ~Observability() = default;

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Metrics
    void record_dispatch(const std::string& method, const std::string& outcome, double duration_seconds);
    void record_collection_run(const std::string& result);
    std::string metrics_text() const; // Prometheus text format

    // Logging
    void log_info(const std::string& message,
                  const std::string& run_id = "",
                  const std::string& collection_id = "",
                  const std::string& request_id = "",
                  const std::string& transaction_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& run_id = "",
                  const std::string& collection_id = "",
                  const std::string& request_id = "",
                  const std::string& transaction_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& run_id = "",
                   const std::string& collection_id = "",
                   const std::string& request_id = "",
                   const std::string& transaction_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const std::string& run_id = "",
                   const std::string& collection_id = "",
                   const std::string& request_id = "",
                   const std::string& transaction_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    // Pull the correlation ids out of a request
    void log_info_with_request(const std::string& message,
                               const RequestDescriptor& request,
                               const std::unordered_map<std::string, std::string>& context = {});

    void log_warn_with_request(const std::string& message,
                               const RequestDescriptor& request,
                               const std::unordered_map<std::string, std::string>& context = {});

    void log_error_with_request(const std::string& message,
                                const RequestDescriptor& request,
                                const std::unordered_map<std::string, std::string>& context = {});

    // One JSON log line, secrets redacted
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& run_id,
                                const std::string& collection_id,
                                const std::string& request_id,
                                const std::string& transaction_id,
                                const std::unordered_map<std::string, std::string>& context) const;

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }
    const std::string& component() const { return component_; }
    LogLevel min_level() const { return min_level_; }

private:
    std::string component_;
    LogLevel min_level_;
    bool metrics_enabled_;
    std::mutex write_mutex_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* dispatch_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* dispatch_duration_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* collection_runs_family_ = nullptr;

    void initialize_metrics();
    void write(LogLevel level, const std::string& line);
    void log_with_request(LogLevel level,
                          const std::string& message,
                          const RequestDescriptor& request,
                          const std::unordered_map<std::string, std::string>& context);
};

// Shared no-frills logger for components constructed without one
std::shared_ptr<Observability> default_observability(const std::string& component);

} // namespace engine
} // namespace courier
