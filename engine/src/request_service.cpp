#include "courier/engine/request_service.hpp"
#include "courier/engine/history.hpp"
#include "courier/engine/result_converter.hpp"
#include <chrono>

namespace courier {
namespace engine {

RequestService::RequestService(std::shared_ptr<EnvironmentStore> store,
                               std::shared_ptr<HistoryRecorder> history,
                               std::shared_ptr<RequestDispatcher> dispatcher,
                               std::shared_ptr<Observability> observability)
    : store_(std::move(store)),
      history_(std::move(history)),
      dispatcher_(std::move(dispatcher)),
      observability_(observability ? std::move(observability) : default_observability("request_service")),
      builder_(observability_),
      runner_(dispatcher_, history_, observability_) {}

caf::expected<VariableContext> RequestService::context_for(std::optional<int64_t> environment_id,
                                                           std::optional<int64_t> collection_id,
                                                           bool require_collection) {
    auto globals = store_->global_variables(environment_id);
    if (!globals) {
        return globals.error();
    }

    VariableContext context;
    context.global_variables = std::move(*globals);

    if (collection_id) {
        auto collection = store_->collection_variables(*collection_id);
        if (collection) {
            context.collection_variables = std::move(*collection);
        } else if (require_collection) {
            return collection.error();
        } else {
            observability_->log_debug("Collection variables unavailable", "", std::to_string(*collection_id), "", "", {
                {"error", caf::to_string(collection.error())}
            });
        }
    }
    return context;
}

SendOutcome RequestService::failed_outcome(const std::string& error, ErrorCode code, int64_t elapsed_ms) const {
    SendOutcome outcome;
    outcome.success = false;
    outcome.result = failure_result(error, elapsed_ms);
    outcome.error = error;
    outcome.error_code = code;
    return outcome;
}

SendOutcome RequestService::send_request(const RequestDescriptor& request) {
    const auto start_time = std::chrono::steady_clock::now();
    auto context = context_for(request.environment_id, request.collection_id);
    if (!context) {
        const std::string error = caf::to_string(context.error());
        observability_->log_error_with_request("Failed to build variable context", request, {{"error", error}});
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        return failed_outcome(error, ErrorCode::resource_unavailable, elapsed);
    }
    return send_request(request, *context);
}

SendOutcome RequestService::send_request(const RequestDescriptor& request, const VariableContext& context) {
    const auto start_time = std::chrono::steady_clock::now();
    std::optional<PreparedRequest> prepared;
    std::string error;
    ErrorCode code = ErrorCode::internal_error;

    try {
        prepared = builder_.build(request, context);
        DispatchResult result = dispatcher_->send(prepared->url, prepared->options);
        record_history(history_.get(), *observability_, history_entry_for(request, *prepared, result));

        SendOutcome outcome;
        outcome.success = true;
        outcome.result = std::move(result);
        return outcome;
    } catch (const DispatchError& e) {
        error = e.what();
        code = e.code();
    } catch (const std::exception& e) {
        error = e.what();
    }

    const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    observability_->log_error_with_request("Request failed", request, {
        {"error", error},
        {"error_code", ResultConverter::error_code_to_string(code)}
    });
    record_history(history_.get(), *observability_,
                   failed_history_entry(request, prepared ? &*prepared : nullptr, error, elapsed_ms));
    return failed_outcome(error, code, elapsed_ms);
}

bool RequestService::cancel_request(const std::string& transaction_id) {
    return dispatcher_->cancel(transaction_id);
}

caf::expected<RunReport> RequestService::run_collection(int64_t collection_id, const ProgressCallback& progress) {
    auto requests = store_->collection_requests(collection_id);
    if (!requests) {
        observability_->log_error("Collection run rejected", "", std::to_string(collection_id), "", "", {
            {"error", caf::to_string(requests.error())}
        });
        return requests.error();
    }

    auto context = context_for(std::nullopt, collection_id, true);
    if (!context) {
        observability_->log_error("Collection run rejected", "", std::to_string(collection_id), "", "", {
            {"error", caf::to_string(context.error())}
        });
        return context.error();
    }

    return runner_.run(std::move(*requests), *context, progress);
}

bool RequestService::test_connection(const std::string& url, std::optional<int64_t> timeout_ms) {
    return dispatcher_->test_connection(url, timeout_ms.value_or(kConnectionProbeTimeoutMs));
}

ResolutionPreview RequestService::preview(const std::string& text, const VariableContext& context) const {
    return builder_.resolver().preview_resolution(text, context);
}

} // namespace engine
} // namespace courier
