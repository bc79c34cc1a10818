#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/observability.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace courier {
namespace engine {

enum class PayloadKind {
    none,
    raw,
    json,
    urlencoded,
    multipart
};

struct MultipartPart {
    std::string name;
    std::string data;                       // text value or file bytes
    std::optional<std::string> filename;    // set for file parts
};

// Transport-ready request body plus the headers that go with it
struct EncodedPayload {
    PayloadKind kind = PayloadKind::none;
    HeaderMap headers;
    std::string body;
    std::vector<MultipartPart> parts;
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Prefix marking a form value as a local file to upload
constexpr const char* kFileReferencePrefix = "FILE::";

class PayloadEncoder {
public:
    explicit PayloadEncoder(std::shared_ptr<Observability> observability = nullptr);

    EncodedPayload encode(HttpMethod method, const HeaderMap& headers, const nlohmann::json& body) const;

    // GET, HEAD, OPTIONS and DELETE are sent without a payload
    static bool carries_body(HttpMethod method);

    // application/x-www-form-urlencoded serialization of one component
    static std::string form_urlencode(const std::string& value);

    // Case-insensitive header lookup; nullopt when absent
    static std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name);

private:
    std::shared_ptr<Observability> observability_;

    // nullopt when the body cannot be read as a key/value map
    std::optional<FormFields> form_fields(const nlohmann::json& body, const char* branch) const;

    EncodedPayload encode_multipart(HeaderMap headers, const nlohmann::json& body) const;
    EncodedPayload encode_urlencoded(HeaderMap headers, const nlohmann::json& body) const;
};

} // namespace engine
} // namespace courier
