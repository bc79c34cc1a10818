#include "courier/engine/payload_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

namespace courier {
namespace engine {

using json = nlohmann::json;

static std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// String(value) semantics: strings verbatim, everything else as JSON text
static std::string field_value(const nlohmann::ordered_json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

static bool starts_with(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

PayloadEncoder::PayloadEncoder(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

bool PayloadEncoder::carries_body(HttpMethod method) {
    switch (method) {
        case HttpMethod::post:
        case HttpMethod::put:
        case HttpMethod::patch:
            return true;
        case HttpMethod::get:
        case HttpMethod::del:
        case HttpMethod::head:
        case HttpMethod::options:
            return false;
    }
    return false;
}

std::string PayloadEncoder::form_urlencode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);

    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::optional<std::string> PayloadEncoder::find_header(const HeaderMap& headers, const std::string& name) {
    const std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<FormFields> PayloadEncoder::form_fields(const json& body, const char* branch) const {
    nlohmann::ordered_json parsed;

    if (body.is_string()) {
        const auto& text = body.get_ref<const std::string&>();
        if (text.empty()) {
            return FormFields{};
        }
        parsed = nlohmann::ordered_json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            if (observability_) {
                observability_->log_error(std::string("Failed to parse ") + branch + " body", "", "", "", "", {
                    {"error", "body is not valid JSON"}
                });
            }
            return std::nullopt;
        }
    } else if (body.is_null()) {
        return FormFields{};
    } else {
        parsed = nlohmann::ordered_json(body);
    }

    FormFields fields;
    if (parsed.is_object()) {
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            fields.emplace_back(it.key(), field_value(it.value()));
        }
        return fields;
    }

    // Structured form-field list: [{key, value, enabled}]
    if (parsed.is_array()) {
        for (const auto& item : parsed) {
            if (!item.is_object() || !item.contains("key")) {
                continue;
            }
            if (item.contains("enabled") && item["enabled"].is_boolean() && !item["enabled"].get<bool>()) {
                continue;
            }
            std::string key = field_value(item["key"]);
            if (key.empty()) {
                continue;
            }
            fields.emplace_back(key, item.contains("value") ? field_value(item["value"]) : std::string());
        }
        return fields;
    }

    if (observability_) {
        observability_->log_error(std::string("Failed to parse ") + branch + " body", "", "", "", "", {
            {"error", "body is not a key/value map"}
        });
    }
    return std::nullopt;
}

EncodedPayload PayloadEncoder::encode_multipart(HeaderMap headers, const json& body) const {
    EncodedPayload payload;
    payload.kind = PayloadKind::multipart;

    // libcurl writes its own Content-Type with the boundary
    for (auto it = headers.begin(); it != headers.end();) {
        if (to_lower(it->first) == "content-type") {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    payload.headers = std::move(headers);

    auto fields = form_fields(body, "multipart/form-data");
    if (!fields) {
        return payload;
    }

    const std::string prefix = kFileReferencePrefix;
    for (const auto& [key, value] : *fields) {
        if (!starts_with(value, prefix)) {
            payload.parts.push_back(MultipartPart{key, value, std::nullopt});
            continue;
        }

        const std::filesystem::path file_path(value.substr(prefix.size()));
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            if (observability_) {
                observability_->log_warn("File not found", "", "", "", "", {
                    {"path", file_path.string()},
                    {"field", key}
                });
            }
            continue;
        }

        std::ifstream in(file_path, std::ios::binary);
        if (!in) {
            if (observability_) {
                observability_->log_warn("File not readable", "", "", "", "", {
                    {"path", file_path.string()},
                    {"field", key}
                });
            }
            continue;
        }
        std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        payload.parts.push_back(MultipartPart{key, std::move(data), file_path.filename().string()});
    }

    return payload;
}

EncodedPayload PayloadEncoder::encode_urlencoded(HeaderMap headers, const json& body) const {
    EncodedPayload payload;
    payload.kind = PayloadKind::urlencoded;
    payload.headers = std::move(headers);

    auto fields = form_fields(body, "form-urlencoded");
    if (!fields) {
        return payload;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : *fields) {
        if (!first) {
            oss << '&';
        }
        first = false;
        oss << form_urlencode(key) << '=' << form_urlencode(value);
    }
    payload.body = oss.str();
    return payload;
}

EncodedPayload PayloadEncoder::encode(HttpMethod method, const HeaderMap& headers, const json& body) const {
    if (!carries_body(method)) {
        EncodedPayload payload;
        payload.headers = headers;
        return payload;
    }

    auto content_type = find_header(headers, "Content-Type");
    const std::string effective_type = content_type ? to_lower(*content_type) : std::string();

    if (effective_type.find("multipart/form-data") != std::string::npos) {
        return encode_multipart(headers, body);
    }
    if (effective_type.find("application/x-www-form-urlencoded") != std::string::npos) {
        return encode_urlencoded(headers, body);
    }

    EncodedPayload payload;
    payload.headers = headers;

    const bool empty_body = body.is_null() || (body.is_string() && body.get_ref<const std::string&>().empty());
    if (empty_body) {
        return payload;
    }

    payload.body = body.is_string() ? body.get<std::string>() : body.dump(-1, ' ', false, json::error_handler_t::replace);
    if (!content_type) {
        payload.headers["Content-Type"] = "application/json";
        payload.kind = PayloadKind::json;
    } else {
        payload.kind = effective_type.find("json") != std::string::npos ? PayloadKind::json : PayloadKind::raw;
    }
    return payload;
}

} // namespace engine
} // namespace courier
