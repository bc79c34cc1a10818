#include "courier/engine/variable_resolver.hpp"
#include <chrono>
#include <cstdio>
#include <random>
#include <regex>

namespace courier {
namespace engine {

using json = nlohmann::json;

namespace {

// {{ [$] [scope.] name }}
const std::regex& placeholder_regex() {
    static const std::regex re(R"(\{\{(\$)?(?:(\w+)\.)?(\w+)\}\})");
    return re;
}

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::string random_uuid_v4() {
    std::uniform_int_distribution<unsigned int> byte_dist(0, 255);
    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(byte_dist(rng()));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
             bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(buf);
}

std::string random_token(size_t length) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);
    std::string token;
    token.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        token.push_back(alphabet[dist(rng())]);
    }
    return token;
}

// Empty values count as missing so they never shadow the other scope
std::optional<std::string> lookup(const VariableMap& scope, const std::string& name) {
    auto it = scope.find(name);
    if (it == scope.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

VariableResolver::VariableResolver(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

std::optional<std::string> VariableResolver::dynamic_value(const std::string& name) {
    if (name == "timestamp") {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
    }
    if (name == "randomInt") {
        std::uniform_int_distribution<int> dist(0, 999999);
        return std::to_string(dist(rng()));
    }
    if (name == "guid" || name == "uuid") {
        return random_uuid_v4();
    }
    if (name == "randomEmail") {
        return random_token(10) + "@example.com";
    }
    return std::nullopt;
}

std::optional<std::string> VariableResolver::resolve_placeholder(bool dynamic,
                                                                 const std::string& scope,
                                                                 const std::string& name,
                                                                 const VariableContext& context) const {
    if (dynamic) {
        auto value = dynamic_value(name);
        if (value) {
            return value;
        }
    }

    if (scope == "collection") {
        if (!context.collection_variables) {
            return std::nullopt;
        }
        return lookup(*context.collection_variables, name);
    }
    if (scope == "global") {
        return lookup(context.global_variables, name);
    }

    if (context.collection_variables) {
        auto value = lookup(*context.collection_variables, name);
        if (value) {
            return value;
        }
    }
    return lookup(context.global_variables, name);
}

std::string VariableResolver::substitute(const std::string& text,
                                         const VariableContext& context,
                                         std::vector<std::string>* unresolved,
                                         bool log_misses) const {
    if (text.find("{{") == std::string::npos) {
        return text;
    }

    std::string out;
    out.reserve(text.size());

    auto begin = std::sregex_iterator(text.begin(), text.end(), placeholder_regex());
    auto end = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        out.append(text, last, static_cast<size_t>(match.position(0)) - last);
        last = static_cast<size_t>(match.position(0) + match.length(0));

        bool dynamic = match[1].matched;
        std::string scope = match[2].matched ? match[2].str() : std::string();
        std::string name = match[3].str();

        auto value = resolve_placeholder(dynamic, scope, name, context);
        if (value) {
            out += *value;
            continue;
        }

        if (unresolved != nullptr) {
            unresolved->push_back(name);
        }
        if (log_misses && observability_) {
            observability_->log_warn("Variable not resolved", "", "", "", "", {
                {"variable", name},
                {"placeholder", match.str(0)}
            });
        }
    }

    out.append(text, last, std::string::npos);
    return out;
}

std::string VariableResolver::resolve(const std::string& text, const VariableContext& context) const {
    return substitute(text, context, nullptr, true);
}

json VariableResolver::resolve_object(const json& value, const VariableContext& context) const {
    if (value.is_string()) {
        return resolve(value.get<std::string>(), context);
    }

    if (value.is_array()) {
        json resolved = json::array();
        for (const auto& item : value) {
            resolved.push_back(resolve_object(item, context));
        }
        return resolved;
    }

    if (value.is_object()) {
        json resolved = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            resolved[it.key()] = resolve_object(it.value(), context);
        }
        return resolved;
    }

    return value;
}

HeaderMap VariableResolver::resolve_headers(const HeaderMap& headers, const VariableContext& context) const {
    HeaderMap resolved;
    for (const auto& [name, value] : headers) {
        resolved[name] = resolve(value, context);
    }
    return resolved;
}

ResolutionPreview VariableResolver::preview_resolution(const std::string& text, const VariableContext& context) const {
    ResolutionPreview preview;
    preview.resolved = substitute(text, context, &preview.unresolved, false);
    return preview;
}

} // namespace engine
} // namespace courier
