#include "courier/engine/request_builder.hpp"
#include "courier/engine/auth.hpp"
#include "courier/engine/result_converter.hpp"

namespace courier {
namespace engine {

RequestBuilder::RequestBuilder(std::shared_ptr<Observability> observability)
    : resolver_(observability), encoder_(observability) {}

PreparedRequest RequestBuilder::build(const RequestDescriptor& request, const VariableContext& context) const {
    auto method = ResultConverter::string_to_method(request.method);
    if (!method) {
        throw DispatchError(ErrorCode::invalid_input, "Unsupported HTTP method: " + request.method);
    }

    PreparedRequest prepared;
    prepared.method = *method;
    prepared.url = resolver_.resolve(request.url, context);
    if (prepared.url.empty()) {
        throw DispatchError(ErrorCode::invalid_input, "Request URL is empty");
    }

    AuthDescriptor auth = request.auth;
    auth.token = resolver_.resolve(auth.token, context);
    auth.username = resolver_.resolve(auth.username, context);
    auth.password = resolver_.resolve(auth.password, context);
    auth.api_key = resolver_.resolve(auth.api_key, context);
    auth.api_key_header = resolver_.resolve(auth.api_key_header, context);

    prepared.headers = apply_auth(resolver_.resolve_headers(request.headers, context), auth);
    prepared.body = resolver_.resolve_object(request.body, context);

    for (const auto& param : request.query_params) {
        QueryParam resolved = param;
        resolved.key = resolver_.resolve(param.key, context);
        resolved.value = resolver_.resolve(param.value, context);
        prepared.query_params.push_back(std::move(resolved));
    }

    prepared.options.method = prepared.method;
    prepared.options.payload = encoder_.encode(prepared.method, prepared.headers, prepared.body);
    prepared.options.timeout_ms = request.timeout_ms;
    prepared.options.transaction_id = request.transaction_id;
    return prepared;
}

} // namespace engine
} // namespace courier
