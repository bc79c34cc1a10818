#pragma once

#include "courier/engine/collection_runner.hpp"
#include "courier/engine/core.hpp"
#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/request_builder.hpp"
#include "courier/engine/store.hpp"
#include "courier/engine/variable_resolver.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <optional>
#include <string>

namespace courier {
namespace engine {

/**
 * Entry points of the engine.
 *
 * Single sends never throw: transport, timeout and cancellation failures
 * come back as a SendOutcome with status 0, status_text = error and body
 * {"error": message}. HTTP error statuses are successful sends.
 */
class RequestService {
public:
    RequestService(std::shared_ptr<EnvironmentStore> store,
                   std::shared_ptr<HistoryRecorder> history,
                   std::shared_ptr<RequestDispatcher> dispatcher,
                   std::shared_ptr<Observability> observability = nullptr);

    // Context from the store: request.environment_id (else default) and request.collection_id
    SendOutcome send_request(const RequestDescriptor& request);

    SendOutcome send_request(const RequestDescriptor& request, const VariableContext& context);

    bool cancel_request(const std::string& transaction_id);

    // Error when the collection does not exist or no environment exists
    caf::expected<RunReport> run_collection(int64_t collection_id, const ProgressCallback& progress = nullptr);

    bool test_connection(const std::string& url, std::optional<int64_t> timeout_ms = std::nullopt);

    ResolutionPreview preview(const std::string& text, const VariableContext& context) const;

    // Collection lookups are best effort unless require_collection is set
    caf::expected<VariableContext> context_for(std::optional<int64_t> environment_id,
                                               std::optional<int64_t> collection_id,
                                               bool require_collection = false);

private:
    std::shared_ptr<EnvironmentStore> store_;
    std::shared_ptr<HistoryRecorder> history_;
    std::shared_ptr<RequestDispatcher> dispatcher_;
    std::shared_ptr<Observability> observability_;
    RequestBuilder builder_;
    CollectionRunner runner_;

    SendOutcome failed_outcome(const std::string& error, ErrorCode code, int64_t elapsed_ms) const;
};

} // namespace engine
} // namespace courier
