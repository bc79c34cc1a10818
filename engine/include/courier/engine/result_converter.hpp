#pragma once

#include "courier/engine/core.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace courier {
namespace engine {

// Converters between engine types and their string / JSON forms
// (CLI output, history rows, stored request columns)

class ResultConverter {
public:
    using json = nlohmann::json;

    static std::string method_to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::get:
                return "GET";
            case HttpMethod::post:
                return "POST";
            case HttpMethod::put:
                return "PUT";
            case HttpMethod::patch:
                return "PATCH";
            case HttpMethod::del:
                return "DELETE";
            case HttpMethod::head:
                return "HEAD";
            case HttpMethod::options:
                return "OPTIONS";
            default:
                return "GET";
        }
    }

    // Upper-case verbs only; nullopt for anything else
    static std::optional<HttpMethod> string_to_method(const std::string& method) {
        if (method == "GET") {
            return HttpMethod::get;
        } else if (method == "POST") {
            return HttpMethod::post;
        } else if (method == "PUT") {
            return HttpMethod::put;
        } else if (method == "PATCH") {
            return HttpMethod::patch;
        } else if (method == "DELETE") {
            return HttpMethod::del;
        } else if (method == "HEAD") {
            return HttpMethod::head;
        } else if (method == "OPTIONS") {
            return HttpMethod::options;
        }
        return std::nullopt;
    }

    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::invalid_format:
                return "INVALID_FORMAT";
            case ErrorCode::execution_failed:
                return "EXECUTION_FAILED";
            case ErrorCode::resource_unavailable:
                return "RESOURCE_UNAVAILABLE";
            case ErrorCode::network_error:
                return "NETWORK_ERROR";
            case ErrorCode::internal_error:
                return "INTERNAL_ERROR";
            case ErrorCode::cancelled_by_user:
                return "CANCELLED_BY_USER";
            case ErrorCode::cancelled_by_timeout:
                return "CANCELLED_BY_TIMEOUT";
            default:
                return "UNKNOWN_ERROR";
        }
    }

    static std::string body_kind_to_string(BodyKind kind) {
        switch (kind) {
            case BodyKind::json:
                return "json";
            case BodyKind::text:
                return "text";
            case BodyKind::base64:
                return "base64";
            default:
                return "text";
        }
    }

    static std::string progress_status_to_string(ProgressStatus status) {
        return status == ProgressStatus::completed ? "completed" : "error";
    }

    static std::string auth_type_to_string(AuthType type) {
        switch (type) {
            case AuthType::bearer:
                return "bearer";
            case AuthType::basic:
                return "basic";
            case AuthType::api_key:
                return "apikey";
            default:
                return "none";
        }
    }

    static AuthType string_to_auth_type(const std::string& type) {
        if (type == "bearer") {
            return AuthType::bearer;
        } else if (type == "basic") {
            return AuthType::basic;
        } else if (type == "apikey" || type == "api_key") {
            return AuthType::api_key;
        }
        return AuthType::none;
    }

    static json to_json(const DispatchResult& result) {
        json out;
        out["status"] = result.status;
        out["statusText"] = result.status_text;
        out["headers"] = result.headers;
        out["body"] = result.body;
        out["bodyKind"] = body_kind_to_string(result.body_kind);
        out["size"] = result.size_bytes;
        out["responseTime"] = result.response_time_ms;
        return out;
    }

    static json to_json(const SendOutcome& outcome) {
        json out = to_json(outcome.result);
        out["success"] = outcome.success;
        if (!outcome.success) {
            out["error"] = outcome.error;
            out["errorCode"] = error_code_to_string(outcome.error_code);
        }
        return out;
    }

    static json to_json(const RunResult& result) {
        json out;
        out["requestId"] = result.request_id ? json(*result.request_id) : json(nullptr);
        out["requestName"] = result.request_name;
        out["success"] = result.success;
        if (result.status) {
            out["status"] = *result.status;
        }
        if (result.response_time_ms) {
            out["responseTime"] = *result.response_time_ms;
        }
        if (result.error) {
            out["error"] = *result.error;
        }
        return out;
    }

    static json to_json(const RunReport& report) {
        json out;
        out["results"] = json::array();
        for (const auto& result : report.results) {
            out["results"].push_back(to_json(result));
        }
        out["summary"] = {
            {"total", report.summary.total},
            {"passed", report.summary.passed},
            {"failed", report.summary.failed}
        };
        return out;
    }

    static json to_json(const ProgressEvent& event) {
        json out;
        out["current"] = event.current;
        out["total"] = event.total;
        out["requestName"] = event.request_name;
        out["requestId"] = event.request_id ? json(*event.request_id) : json(nullptr);
        out["status"] = progress_status_to_string(event.status);
        if (event.error) {
            out["error"] = *event.error;
        }
        return out;
    }

    static json query_params_to_json(const std::vector<QueryParam>& params) {
        json out = json::array();
        for (const auto& param : params) {
            out.push_back({{"key", param.key}, {"value", param.value}, {"enabled", param.enabled}});
        }
        return out;
    }

    static std::vector<QueryParam> query_params_from_json(const json& value) {
        std::vector<QueryParam> params;
        if (!value.is_array()) {
            return params;
        }
        for (const auto& item : value) {
            if (!item.is_object()) {
                continue;
            }
            QueryParam param;
            param.key = item.value("key", "");
            param.value = item.value("value", "");
            param.enabled = item.value("enabled", true);
            params.push_back(std::move(param));
        }
        return params;
    }

    static json auth_to_json(const AuthDescriptor& auth) {
        json out;
        out["type"] = auth_type_to_string(auth.type);
        switch (auth.type) {
            case AuthType::bearer:
                out["token"] = auth.token;
                break;
            case AuthType::basic:
                out["username"] = auth.username;
                out["password"] = auth.password;
                break;
            case AuthType::api_key:
                out["apiKey"] = auth.api_key;
                out["apiKeyHeader"] = auth.api_key_header;
                break;
            default:
                break;
        }
        return out;
    }

    static AuthDescriptor auth_from_json(const json& value) {
        AuthDescriptor auth;
        if (!value.is_object()) {
            return auth;
        }
        auth.type = string_to_auth_type(value.value("type", "none"));
        auth.token = value.value("token", "");
        auth.username = value.value("username", "");
        auth.password = value.value("password", "");
        auth.api_key = value.value("apiKey", "");
        auth.api_key_header = value.value("apiKeyHeader", "X-API-Key");
        return auth;
    }

    // History stores bodies as text; structured bodies are serialized
    static std::string body_to_text(const json& body) {
        if (body.is_string()) {
            return body.get<std::string>();
        }
        if (body.is_null()) {
            return "";
        }
        return body.dump(-1, ' ', false, json::error_handler_t::replace);
    }
};

} // namespace engine
} // namespace courier
