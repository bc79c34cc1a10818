#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/auth.hpp"
#include "courier/engine/result_converter.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>

namespace courier {
namespace engine {

using json = nlohmann::json;

namespace {

struct CurlDefaults {
    static constexpr long FOLLOW_LOCATION = 1L;
    static constexpr long MAX_REDIRECTS = 20L;
    static constexpr long NO_SIGNAL = 1L;
    static constexpr const char* ACCEPT_ENCODING = "";
    // Upper bound for a single curl_multi_poll wait
    static constexpr int64_t MAX_POLL_MS = 1000;
};

struct ResponseCapture {
    std::string body;
    std::string status_text;
    HeaderMap headers;
};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    auto* capture = static_cast<ResponseCapture*>(userp);
    capture->body.append(contents, size * nmemb);
    return size * nmemb;
}

// Called once per header line, for every response in a redirect chain
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    auto* capture = static_cast<ResponseCapture*>(userdata);
    std::string line = trim(std::string(buffer, total));

    if (line.compare(0, 5, "HTTP/") == 0) {
        // New response: only the last one in the chain is reported
        capture->headers.clear();
        capture->status_text.clear();
        auto first_space = line.find(' ');
        if (first_space != std::string::npos) {
            auto second_space = line.find(' ', first_space + 1);
            if (second_space != std::string::npos) {
                capture->status_text = trim(line.substr(second_space + 1));
            }
        }
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return total;
    }

    std::string name = to_lower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));
    auto it = capture->headers.find(name);
    if (it == capture->headers.end()) {
        capture->headers.emplace(std::move(name), std::move(value));
    } else {
        it->second += ", " + value;
    }
    return total;
}

// RAII wrapper for every libcurl resource of one transfer
struct CurlTransfer {
    CURLM* multi = nullptr;
    CURL* easy = nullptr;
    curl_slist* headers = nullptr;
    curl_mime* mime = nullptr;
    bool added = false;

    CurlTransfer() = default;
    ~CurlTransfer() {
        if (added) {
            curl_multi_remove_handle(multi, easy);
        }
        if (easy) {
            curl_easy_cleanup(easy);
        }
        if (mime) {
            curl_mime_free(mime);
        }
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (multi) {
            curl_multi_cleanup(multi);
        }
    }

    // Non-copyable
    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;
};

// Drops the token's reference to the multi handle before it is cleaned up
struct WakeupGuard {
    CancellationToken& token;
    WakeupGuard(CancellationToken& t, CURLM* multi) : token(t) { token.attach(multi); }
    ~WakeupGuard() { token.detach(); }

    WakeupGuard(const WakeupGuard&) = delete;
    WakeupGuard& operator=(const WakeupGuard&) = delete;
};

// Clears the registry entry on every exit path of send()
struct RegistrationGuard {
    TransactionRegistry& registry;
    std::optional<std::string> transaction_id;
    std::shared_ptr<CancellationToken> token;
    ~RegistrationGuard() {
        if (transaction_id) {
            registry.clear(*transaction_id, token.get());
        }
    }
};

std::string timeout_message(int64_t timeout_ms) {
    return "Request timeout after " + std::to_string(timeout_ms) + "ms";
}

const char* outcome_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::cancelled_by_timeout:
            return "timeout";
        case ErrorCode::cancelled_by_user:
            return "cancelled";
        default:
            return "network_error";
    }
}

} // namespace

CurlGlobal::CurlGlobal() {
    const auto rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

void CurlGlobal::ensure_initialized() {
    static CurlGlobal instance;
}

HttpDispatcher::HttpDispatcher(EngineConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)),
      observability_(observability ? std::move(observability) : default_observability("http_dispatcher")) {
    CurlGlobal::ensure_initialized();
}

std::string HttpDispatcher::reason_phrase(int status) {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 410: return "Gone";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void HttpDispatcher::type_body(const std::string& content_type, const std::string& raw, DispatchResult& result) {
    const std::string type = to_lower(content_type);
    result.size_bytes = static_cast<int64_t>(raw.size());

    if (type.find("application/json") != std::string::npos) {
        json parsed = json::parse(raw, nullptr, false);
        if (!parsed.is_discarded()) {
            result.body = std::move(parsed);
            result.body_kind = BodyKind::json;
            return;
        }
        result.body = raw;
        result.body_kind = BodyKind::text;
    } else if (type.find("text/") != std::string::npos) {
        result.body = raw;
        result.body_kind = BodyKind::text;
    } else {
        result.body = base64_encode(raw);
        result.body_kind = BodyKind::base64;
    }
}

DispatchResult HttpDispatcher::perform(const std::string& url,
                                       const DispatchOptions& options,
                                       CancellationToken& token,
                                       int64_t timeout_ms) {
    // Taken before libcurl starts its own timers
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    // Outlive the transfer, which holds pointers to both
    ResponseCapture capture;
    std::array<char, CURL_ERROR_SIZE> error_buf{};

    CurlTransfer transfer;
    transfer.easy = curl_easy_init();
    transfer.multi = curl_multi_init();
    if (transfer.easy == nullptr || transfer.multi == nullptr) {
        throw DispatchError(ErrorCode::internal_error, "Failed to initialize CURL");
    }

    CURL* curl = transfer.easy;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buf.data());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(std::min(config_.connect_timeout_ms, timeout_ms)));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &capture);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &capture);

    // Method
    const std::string method = ResultConverter::method_to_string(options.method);
    switch (options.method) {
        case HttpMethod::get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::head:
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
            break;
        case HttpMethod::post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            break;
        default:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
            break;
    }

    // Body
    const EncodedPayload& payload = options.payload;
    if (payload.kind == PayloadKind::multipart) {
        transfer.mime = curl_mime_init(curl);
        for (const auto& part : payload.parts) {
            curl_mimepart* mime_part = curl_mime_addpart(transfer.mime);
            curl_mime_name(mime_part, part.name.c_str());
            curl_mime_data(mime_part, part.data.data(), part.data.size());
            if (part.filename) {
                curl_mime_filename(mime_part, part.filename->c_str());
            }
        }
        curl_easy_setopt(curl, CURLOPT_MIMEPOST, transfer.mime);
    } else if (PayloadEncoder::carries_body(options.method)) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.body.size()));
        curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, payload.body.c_str());
    }

    // Headers
    bool has_expect = false;
    for (const auto& [name, value] : payload.headers) {
        if (to_lower(name) == "expect") {
            has_expect = true;
        }
        // "Name;" is libcurl's form for a header with an empty value
        std::string line = value.empty() ? name + ";" : name + ": " + value;
        transfer.headers = curl_slist_append(transfer.headers, line.c_str());
    }
    if (!has_expect) {
        transfer.headers = curl_slist_append(transfer.headers, "Expect:");
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer.headers);

    if (curl_multi_add_handle(transfer.multi, curl) != CURLM_OK) {
        throw DispatchError(ErrorCode::internal_error, "Failed to start transfer");
    }
    transfer.added = true;

    // Poll until done, cancelled, or past the deadline
    WakeupGuard wakeup(token, transfer.multi);
    int running = 1;
    while (true) {
        CURLMcode mc = curl_multi_perform(transfer.multi, &running);
        if (mc != CURLM_OK) {
            throw DispatchError(ErrorCode::network_error, curl_multi_strerror(mc));
        }
        if (running == 0 || token.is_cancelled()) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            token.cancel(CancelReason::timeout);
            break;
        }

        mc = curl_multi_poll(transfer.multi, nullptr, 0,
                             static_cast<int>(std::min<int64_t>(remaining, CurlDefaults::MAX_POLL_MS)), nullptr);
        if (mc != CURLM_OK) {
            throw DispatchError(ErrorCode::network_error, curl_multi_strerror(mc));
        }
    }

    // Finished: later cancels find nothing to abort
    if (running == 0 && options.transaction_id) {
        registry_.clear(*options.transaction_id, &token);
    }

    // A transfer that completed wins over a cancel that arrived afterwards
    if (running != 0) {
        if (token.reason() == CancelReason::user) {
            throw DispatchError(ErrorCode::cancelled_by_user, "Request cancelled by user");
        }
        throw DispatchError(ErrorCode::cancelled_by_timeout, timeout_message(timeout_ms));
    }

    CURLcode rc = CURLE_OK;
    int pending = 0;
    while (CURLMsg* msg = curl_multi_info_read(transfer.multi, &pending)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == curl) {
            rc = msg->data.result;
        }
    }

    // A connect timeout shorter than the request timeout is a transport failure
    if (rc == CURLE_OPERATION_TIMEDOUT && std::chrono::steady_clock::now() >= deadline) {
        throw DispatchError(ErrorCode::cancelled_by_timeout, timeout_message(timeout_ms));
    }
    if (rc != CURLE_OK) {
        std::string detail = error_buf[0] != '\0' ? std::string(error_buf.data()) : std::string(curl_easy_strerror(rc));
        throw DispatchError(ErrorCode::network_error, detail);
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    DispatchResult result;
    result.status = static_cast<int>(status);
    result.status_text = capture.status_text.empty() ? reason_phrase(result.status) : capture.status_text;
    result.headers = std::move(capture.headers);

    auto content_type = result.headers.find("content-type");
    type_body(content_type != result.headers.end() ? content_type->second : std::string(), capture.body, result);
    return result;
}

DispatchResult HttpDispatcher::send(const std::string& url, const DispatchOptions& options) {
    const auto start_time = std::chrono::steady_clock::now();
    const std::string method = ResultConverter::method_to_string(options.method);
    const std::string transaction_id = options.transaction_id.value_or("");
    const int64_t timeout_ms = options.timeout_ms && *options.timeout_ms > 0
        ? *options.timeout_ms
        : config_.default_timeout_ms;

    auto token = std::make_shared<CancellationToken>();
    if (options.transaction_id) {
        registry_.add(*options.transaction_id, token);
    }
    RegistrationGuard registration{registry_, options.transaction_id, token};

    observability_->log_info("API Request: " + method + " " + url, "", "", "", transaction_id, {
        {"url", url},
        {"method", method},
        {"headers", json(options.payload.headers).dump(-1, ' ', false, json::error_handler_t::replace)}
    });

    auto elapsed_ms = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    };

    try {
        DispatchResult result = perform(url, options, *token, timeout_ms);
        result.response_time_ms = elapsed_ms();
        observability_->record_dispatch(method, result.is_http_error() ? "http_error" : "success",
                                        static_cast<double>(result.response_time_ms) / 1000.0);

        const std::string summary = std::to_string(result.status) + " " + result.status_text;
        if (result.is_http_error()) {
            observability_->log_error("API Error: " + summary, "", "", "", transaction_id, {
                {"url", url},
                {"status", std::to_string(result.status)},
                {"response_time_ms", std::to_string(result.response_time_ms)}
            });
        } else {
            observability_->log_info("API Success: " + summary, "", "", "", transaction_id, {
                {"url", url},
                {"response_time_ms", std::to_string(result.response_time_ms)}
            });
        }
        return result;
    } catch (const DispatchError& e) {
        const int64_t elapsed = elapsed_ms();
        observability_->record_dispatch(method, outcome_for(e.code()), static_cast<double>(elapsed) / 1000.0);

        const bool aborted = e.code() == ErrorCode::cancelled_by_timeout || e.code() == ErrorCode::cancelled_by_user;
        observability_->log_error(aborted ? std::string(e.what()) : "Request failed for " + url, "", "", "", transaction_id, {
            {"url", url},
            {"error", e.what()},
            {"error_code", ResultConverter::error_code_to_string(e.code())},
            {"response_time_ms", std::to_string(elapsed)}
        });
        throw DispatchError(e.code(), e.what(), elapsed);
    }
}

bool HttpDispatcher::cancel(const std::string& transaction_id) {
    bool cancelled = registry_.cancel(transaction_id);
    if (cancelled) {
        observability_->log_info("Request cancelled", "", "", "", transaction_id);
    }
    return cancelled;
}

bool HttpDispatcher::test_connection(const std::string& url, int64_t timeout_ms) {
    DispatchOptions options;
    options.method = HttpMethod::get;
    options.timeout_ms = timeout_ms;

    try {
        DispatchResult result = send(url, options);
        return result.status < 500;
    } catch (const DispatchError& e) {
        observability_->log_debug("Connection test failed", "", "", "", "", {
            {"url", url},
            {"error", e.what()}
        });
        return false;
    }
}

} // namespace engine
} // namespace courier
