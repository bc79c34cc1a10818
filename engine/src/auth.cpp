#include "courier/engine/auth.hpp"
#include "courier/engine/payload_encoder.hpp"

namespace courier {
namespace engine {

std::string base64_encode(const std::string& data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= data.size()) {
        uint32_t chunk = (static_cast<unsigned char>(data[i]) << 16) |
                         (static_cast<unsigned char>(data[i + 1]) << 8) |
                         static_cast<unsigned char>(data[i + 2]);
        out.push_back(alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(alphabet[(chunk >> 12) & 0x3F]);
        out.push_back(alphabet[(chunk >> 6) & 0x3F]);
        out.push_back(alphabet[chunk & 0x3F]);
        i += 3;
    }

    const size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t chunk = static_cast<unsigned char>(data[i]) << 16;
        out.push_back(alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(alphabet[(chunk >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t chunk = (static_cast<unsigned char>(data[i]) << 16) |
                         (static_cast<unsigned char>(data[i + 1]) << 8);
        out.push_back(alphabet[(chunk >> 18) & 0x3F]);
        out.push_back(alphabet[(chunk >> 12) & 0x3F]);
        out.push_back(alphabet[(chunk >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

HeaderMap apply_auth(const HeaderMap& headers, const AuthDescriptor& auth) {
    HeaderMap out = headers;

    switch (auth.type) {
        case AuthType::bearer:
            if (!auth.token.empty() && !PayloadEncoder::find_header(out, "Authorization")) {
                out["Authorization"] = "Bearer " + auth.token;
            }
            break;
        case AuthType::basic:
            if ((!auth.username.empty() || !auth.password.empty()) &&
                !PayloadEncoder::find_header(out, "Authorization")) {
                out["Authorization"] = "Basic " + base64_encode(auth.username + ":" + auth.password);
            }
            break;
        case AuthType::api_key: {
            const std::string header = auth.api_key_header.empty() ? "X-API-Key" : auth.api_key_header;
            if (!auth.api_key.empty() && !PayloadEncoder::find_header(out, header)) {
                out[header] = auth.api_key;
            }
            break;
        }
        case AuthType::none:
            break;
    }
    return out;
}

} // namespace engine
} // namespace courier
