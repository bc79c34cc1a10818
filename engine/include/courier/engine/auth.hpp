#pragma once

#include "courier/engine/core.hpp"
#include <string>

namespace courier {
namespace engine {

// Standard base64 alphabet with '=' padding
std::string base64_encode(const std::string& data);

/**
 * Adds the header implied by an auth descriptor:
 *   bearer  -> Authorization: Bearer <token>
 *   basic   -> Authorization: Basic base64(user:pass)
 *   api_key -> <api_key_header>: <api_key>
 *
 * A header the caller already set (case-insensitive) is left untouched.
 * Descriptors with empty credentials add nothing.
 */
HeaderMap apply_auth(const HeaderMap& headers, const AuthDescriptor& auth);

} // namespace engine
} // namespace courier
