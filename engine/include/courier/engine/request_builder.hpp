#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/payload_encoder.hpp"
#include "courier/engine/variable_resolver.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace courier {
namespace engine {

// A request with every placeholder resolved, ready for the dispatcher
struct PreparedRequest {
    HttpMethod method = HttpMethod::get;
    std::string url;
    HeaderMap headers;                      // resolved, auth applied, before encoding
    nlohmann::json body;                    // resolved body as authored
    std::vector<QueryParam> query_params;   // resolved, recorded in history only
    DispatchOptions options;
};

/**
 * resolve -> auth -> encode
 *
 * Throws DispatchError(invalid_input) for an unsupported method or an
 * empty URL. Query parameters are resolved for the history record but are
 * not appended to the URL; the URL is taken as authored.
 */
class RequestBuilder {
public:
    explicit RequestBuilder(std::shared_ptr<Observability> observability = nullptr);

    PreparedRequest build(const RequestDescriptor& request, const VariableContext& context) const;

    const VariableResolver& resolver() const { return resolver_; }

private:
    VariableResolver resolver_;
    PayloadEncoder encoder_;
};

} // namespace engine
} // namespace courier
