#pragma once

#include "courier/engine/cancellation.hpp"
#include "courier/engine/core.hpp"
#include "courier/engine/engine_config.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/payload_encoder.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace courier {
namespace engine {

struct DispatchOptions {
    HttpMethod method = HttpMethod::get;
    EncodedPayload payload;                     // final headers and body
    std::optional<int64_t> timeout_ms;          // config default when unset
    std::optional<std::string> transaction_id;  // makes the dispatch cancellable
};

// Transport failure, timeout or cancellation of a dispatch
class DispatchError : public std::runtime_error {
public:
    DispatchError(ErrorCode code, const std::string& message, int64_t elapsed_ms = 0)
        : std::runtime_error(message), code_(code), elapsed_ms_(elapsed_ms) {}

    ErrorCode code() const { return code_; }
    int64_t elapsed_ms() const { return elapsed_ms_; }

private:
    ErrorCode code_;
    int64_t elapsed_ms_;
};

// Transport seam of the engine; HttpDispatcher is the libcurl implementation
class RequestDispatcher {
public:
    virtual ~RequestDispatcher() = default;

    // Throws DispatchError. HTTP error statuses are returned, not thrown.
    virtual DispatchResult send(const std::string& url, const DispatchOptions& options) = 0;

    // Signals the in-flight dispatch registered under the id; false if none
    virtual bool cancel(const std::string& transaction_id) = 0;

    // GET probe; reachable means any status below 500
    virtual bool test_connection(const std::string& url, int64_t timeout_ms = kConnectionProbeTimeoutMs) = 0;
};

// Process-wide curl_global_init / curl_global_cleanup
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    static void ensure_initialized();
};

/**
 * libcurl-backed dispatcher.
 *
 * Each send() drives its own easy handle through a private multi handle,
 * polling with curl_multi_poll. The per-call CancellationToken is woken by
 * cancel() from any thread and by the deadline, so both abort promptly.
 * Redirects are followed (max 20).
 */
class HttpDispatcher : public RequestDispatcher {
public:
    explicit HttpDispatcher(EngineConfig config = EngineConfig::from_environment(),
                            std::shared_ptr<Observability> observability = nullptr);

    DispatchResult send(const std::string& url, const DispatchOptions& options) override;
    bool cancel(const std::string& transaction_id) override;
    bool test_connection(const std::string& url, int64_t timeout_ms = kConnectionProbeTimeoutMs) override;

    const TransactionRegistry& registry() const { return registry_; }
    const EngineConfig& config() const { return config_; }

    // Standard reason phrase, used when the status line carries none (HTTP/2)
    static std::string reason_phrase(int status);

    // JSON for application/json (text if unparsable), text for text/*, base64 otherwise
    static void type_body(const std::string& content_type, const std::string& raw, DispatchResult& result);

private:
    EngineConfig config_;
    std::shared_ptr<Observability> observability_;
    TransactionRegistry registry_;

    DispatchResult perform(const std::string& url,
                           const DispatchOptions& options,
                           CancellationToken& token,
                           int64_t timeout_ms);
};

} // namespace engine
} // namespace courier
