#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/request_builder.hpp"
#include "courier/engine/store.hpp"
#include <memory>
#include <string>
#include <vector>

namespace courier {
namespace engine {

/**
 * Sequential, failure-isolated execution of a collection's requests.
 *
 * Requests run by ascending order, ties by ascending id. Request N+1 is not
 * built before the history record and result of request N exist. A failure
 * to build or dispatch becomes a failed RunResult and the run continues.
 */
class CollectionRunner {
public:
    CollectionRunner(std::shared_ptr<RequestDispatcher> dispatcher,
                     std::shared_ptr<HistoryRecorder> history,
                     std::shared_ptr<Observability> observability = nullptr);

    RunReport run(std::vector<RequestDescriptor> requests,
                  const VariableContext& context,
                  const ProgressCallback& progress = nullptr,
                  const std::string& run_id = "");

    static void sort_requests(std::vector<RequestDescriptor>& requests);
    static RunSummary summarize(const std::vector<RunResult>& results);

private:
    std::shared_ptr<RequestDispatcher> dispatcher_;
    std::shared_ptr<HistoryRecorder> history_;
    std::shared_ptr<Observability> observability_;
    RequestBuilder builder_;

    RunResult execute_one(const RequestDescriptor& request, const VariableContext& context, const std::string& run_id);
};

} // namespace engine
} // namespace courier
