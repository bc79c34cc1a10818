#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace courier {
namespace engine {

using VariableMap = std::map<std::string, std::string>;
using HeaderMap = std::map<std::string, std::string>;

// Default per-request timeout when neither the request nor the config sets one
constexpr int64_t kDefaultTimeoutMs = 30000;

// Probe timeout for test_connection()
constexpr int64_t kConnectionProbeTimeoutMs = 5000;

enum class HttpMethod {
    get,
    post,
    put,
    patch,
    del,
    head,
    options
};

// Two-scope variable context. Supplied fresh by the caller for every
// resolution; nothing in the engine writes to it.
struct VariableContext {
    VariableMap global_variables;
    std::optional<VariableMap> collection_variables;
};

struct QueryParam {
    std::string key;
    std::string value;
    bool enabled = true;
};

enum class AuthType {
    none,
    bearer,
    basic,
    api_key
};

struct AuthDescriptor {
    AuthType type = AuthType::none;
    std::string token;                          // bearer
    std::string username;                       // basic
    std::string password;                       // basic
    std::string api_key;                        // api_key
    std::string api_key_header = "X-API-Key";   // api_key
};

// A templated request as authored by the user. Every string field may carry
// {{...}} placeholders; they are resolved right before dispatch.
struct RequestDescriptor {
    std::optional<int64_t> id;
    std::string name;
    std::optional<int64_t> collection_id;
    int64_t order = 0;

    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    // string, JSON object, or list of {key, value, enabled} form fields
    nlohmann::json body;
    AuthDescriptor auth;
    std::vector<QueryParam> query_params;

    std::optional<std::string> transaction_id;
    std::optional<int64_t> timeout_ms;

    // Explicit global environment for single sends; default environment otherwise
    std::optional<int64_t> environment_id;
};

enum class BodyKind {
    json,
    text,
    base64
};

// Normalized response. status 0 is reserved for transport failures surfaced
// by the request service and never comes out of HttpDispatcher::send().
struct DispatchResult {
    int status = 0;
    std::string status_text;
    HeaderMap headers;
    nlohmann::json body;
    BodyKind body_kind = BodyKind::text;
    int64_t size_bytes = 0;
    int64_t response_time_ms = 0;

    bool is_http_error() const { return status >= 400; }
};

// Machine-readable error codes
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    invalid_format = 1003,
    // Execution errors (2xxx)
    execution_failed = 2001,
    resource_unavailable = 2002,
    // Network errors (3xxx)
    network_error = 3001,
    // System errors (4xxx)
    internal_error = 4001,
    // Cancellation (5xxx)
    cancelled_by_user = 5001,
    cancelled_by_timeout = 5002
};

// Result-shaped outcome of a single send, also used for failures so callers
// can render them without catching anything.
struct SendOutcome {
    bool success = false;
    DispatchResult result;
    std::string error;
    ErrorCode error_code = ErrorCode::none;
};

struct RunResult {
    std::optional<int64_t> request_id;
    std::string request_name;
    bool success = false;
    std::optional<int> status;
    std::optional<int64_t> response_time_ms;
    std::optional<std::string> error;

    bool passed() const { return success && status.has_value() && *status < 400; }
};

struct RunSummary {
    size_t total = 0;
    size_t passed = 0;
    size_t failed = 0;
};

struct RunReport {
    std::vector<RunResult> results;
    RunSummary summary;
};

enum class ProgressStatus {
    completed,
    error
};

struct ProgressEvent {
    size_t current = 0;
    size_t total = 0;
    std::string request_name;
    std::optional<int64_t> request_id;
    ProgressStatus status = ProgressStatus::completed;
    std::optional<std::string> error;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// Write-once execution record handed to the HistoryRecorder
struct HistoryEntry {
    std::string method;
    std::string url;
    HeaderMap request_headers;

    int status = 0;
    std::string status_text;
    HeaderMap response_headers;
    std::string response_body;
    int64_t response_time_ms = 0;

    std::optional<int64_t> request_id;
    std::optional<int64_t> collection_id;
    std::string request_name;
    nlohmann::json raw_body;
    std::vector<QueryParam> query_params;
    std::optional<std::string> error;
    std::string created_at;
};

} // namespace engine
} // namespace courier
