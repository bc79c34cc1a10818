#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/observability.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace courier {
namespace engine {

struct ResolutionPreview {
    std::string resolved;
    std::vector<std::string> unresolved;
};

/**
 * Substitutes {{...}} placeholders.
 *
 * Grammar: "{{" [ "$" ] [ scope "." ] identifier "}}", identifier = \w+
 *
 * - {{$name}}            dynamic value (timestamp, randomInt, guid, uuid,
 *                        randomEmail); unknown names fall through to lookup
 * - {{collection.name}}  collection scope only
 * - {{global.name}}      global scope only
 * - {{name}}             collection scope, then global scope
 *
 * A miss substitutes the empty string and is logged as a warning.
 */
class VariableResolver {
public:
    explicit VariableResolver(std::shared_ptr<Observability> observability = nullptr);

    std::string resolve(const std::string& text, const VariableContext& context) const;

    // Strings are resolved, objects and arrays recursed, other leaves copied
    nlohmann::json resolve_object(const nlohmann::json& value, const VariableContext& context) const;

    HeaderMap resolve_headers(const HeaderMap& headers, const VariableContext& context) const;

    ResolutionPreview preview_resolution(const std::string& text, const VariableContext& context) const;

    // nullopt for names that are not dynamic variables
    static std::optional<std::string> dynamic_value(const std::string& name);

private:
    std::shared_ptr<Observability> observability_;

    // nullopt when the placeholder resolves to nothing
    std::optional<std::string> resolve_placeholder(bool dynamic,
                                                   const std::string& scope,
                                                   const std::string& name,
                                                   const VariableContext& context) const;

    std::string substitute(const std::string& text,
                           const VariableContext& context,
                           std::vector<std::string>* unresolved,
                           bool log_misses) const;
};

} // namespace engine
} // namespace courier
