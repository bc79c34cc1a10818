#include "courier/engine/history.hpp"
#include "courier/engine/result_converter.hpp"
#include <nlohmann/json.hpp>
#include <exception>

namespace courier {
namespace engine {

using json = nlohmann::json;

DispatchResult failure_result(const std::string& error, int64_t elapsed_ms) {
    DispatchResult result;
    result.status = 0;
    result.status_text = error.empty() ? "Request Failed" : error;
    result.body = json{{"error", error}};
    result.body_kind = BodyKind::json;
    result.response_time_ms = elapsed_ms;
    return result;
}

HistoryEntry history_entry_for(const RequestDescriptor& request,
                               const PreparedRequest& prepared,
                               const DispatchResult& result) {
    HistoryEntry entry;
    entry.method = ResultConverter::method_to_string(prepared.method);
    entry.url = prepared.url;
    entry.request_headers = prepared.options.payload.headers;
    entry.query_params = prepared.query_params;
    entry.raw_body = prepared.body;

    entry.status = result.status;
    entry.status_text = result.status_text;
    entry.response_headers = result.headers;
    entry.response_body = ResultConverter::body_to_text(result.body);
    entry.response_time_ms = result.response_time_ms;

    entry.request_id = request.id;
    entry.collection_id = request.collection_id;
    entry.request_name = request.name;
    return entry;
}

HistoryEntry failed_history_entry(const RequestDescriptor& request,
                                  const PreparedRequest* prepared,
                                  const std::string& error,
                                  int64_t elapsed_ms) {
    DispatchResult result = failure_result(error, elapsed_ms);

    if (prepared != nullptr) {
        HistoryEntry entry = history_entry_for(request, *prepared, result);
        entry.error = error;
        return entry;
    }

    // Nothing resolved; keep the request as authored
    HistoryEntry entry;
    entry.method = request.method;
    entry.url = request.url;
    entry.request_headers = request.headers;
    entry.query_params = request.query_params;
    entry.raw_body = request.body;
    entry.status = result.status;
    entry.status_text = result.status_text;
    entry.response_body = ResultConverter::body_to_text(result.body);
    entry.response_time_ms = elapsed_ms;
    entry.request_id = request.id;
    entry.collection_id = request.collection_id;
    entry.request_name = request.name;
    entry.error = error;
    return entry;
}

void record_history(HistoryRecorder* recorder, Observability& observability, const HistoryEntry& entry) {
    if (recorder == nullptr) {
        return;
    }
    try {
        auto recorded = recorder->record(entry);
        if (!recorded) {
            observability.log_warn("Failed to record history", "", "", "", "", {
                {"url", entry.url},
                {"error", caf::to_string(recorded.error())}
            });
        }
    } catch (const std::exception& e) {
        observability.log_warn("Failed to record history", "", "", "", "", {
            {"url", entry.url},
            {"error", e.what()}
        });
    }
}

} // namespace engine
} // namespace courier
