#include "courier/engine/collection_runner.hpp"
#include "courier/engine/history.hpp"
#include "courier/engine/variable_resolver.hpp"
#include <algorithm>
#include <chrono>

namespace courier {
namespace engine {

CollectionRunner::CollectionRunner(std::shared_ptr<RequestDispatcher> dispatcher,
                                   std::shared_ptr<HistoryRecorder> history,
                                   std::shared_ptr<Observability> observability)
    : dispatcher_(std::move(dispatcher)),
      history_(std::move(history)),
      observability_(observability ? std::move(observability) : default_observability("collection_runner")),
      builder_(observability_) {}

void CollectionRunner::sort_requests(std::vector<RequestDescriptor>& requests) {
    std::stable_sort(requests.begin(), requests.end(), [](const RequestDescriptor& a, const RequestDescriptor& b) {
        if (a.order != b.order) {
            return a.order < b.order;
        }
        return a.id.value_or(0) < b.id.value_or(0);
    });
}

RunSummary CollectionRunner::summarize(const std::vector<RunResult>& results) {
    RunSummary summary;
    summary.total = results.size();
    summary.passed = static_cast<size_t>(std::count_if(results.begin(), results.end(),
                                                       [](const RunResult& r) { return r.passed(); }));
    summary.failed = summary.total - summary.passed;
    return summary;
}

RunResult CollectionRunner::execute_one(const RequestDescriptor& request,
                                        const VariableContext& context,
                                        const std::string& run_id) {
    RunResult result;
    result.request_id = request.id;
    result.request_name = request.name;

    const auto start_time = std::chrono::steady_clock::now();
    std::optional<PreparedRequest> prepared;
    std::string error;
    int64_t elapsed_ms = 0;

    try {
        prepared = builder_.build(request, context);
        DispatchResult response = dispatcher_->send(prepared->url, prepared->options);

        record_history(history_.get(), *observability_, history_entry_for(request, *prepared, response));
        result.success = true;
        result.status = response.status;
        result.response_time_ms = response.response_time_ms;
        return result;
    } catch (const DispatchError& e) {
        error = e.what();
        elapsed_ms = e.elapsed_ms();
    } catch (const std::exception& e) {
        error = e.what();
        elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
    }

    observability_->log_error_with_request("Request failed", request, {
        {"run_id", run_id},
        {"error", error}
    });
    record_history(history_.get(), *observability_,
                   failed_history_entry(request, prepared ? &*prepared : nullptr, error, elapsed_ms));

    result.success = false;
    result.error = error;
    return result;
}

RunReport CollectionRunner::run(std::vector<RequestDescriptor> requests,
                                const VariableContext& context,
                                const ProgressCallback& progress,
                                const std::string& run_id) {
    const std::string id = run_id.empty() ? VariableResolver::dynamic_value("uuid").value_or("") : run_id;
    sort_requests(requests);

    RunReport report;
    const size_t total = requests.size();
    observability_->log_info("Collection run started", id, "", "", "", {
        {"total", std::to_string(total)}
    });

    for (size_t i = 0; i < total; ++i) {
        const RequestDescriptor& request = requests[i];
        RunResult result = execute_one(request, context, id);

        ProgressEvent event;
        event.current = i + 1;
        event.total = total;
        event.request_name = request.name;
        event.request_id = request.id;
        event.status = result.success ? ProgressStatus::completed : ProgressStatus::error;
        event.error = result.error;

        report.results.push_back(std::move(result));
        if (progress) {
            progress(event);
        }
    }

    report.summary = summarize(report.results);
    observability_->record_collection_run(report.summary.failed == 0 ? "passed" : "failed");
    observability_->log_info("Collection run finished", id, "", "", "", {
        {"total", std::to_string(report.summary.total)},
        {"passed", std::to_string(report.summary.passed)},
        {"failed", std::to_string(report.summary.failed)}
    });
    return report;
}

} // namespace engine
} // namespace courier
