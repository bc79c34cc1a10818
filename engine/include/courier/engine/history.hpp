#pragma once

#include "courier/engine/core.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/request_builder.hpp"
#include "courier/engine/store.hpp"
#include <string>

namespace courier {
namespace engine {

// status 0, status_text = error, body {"error": error}
DispatchResult failure_result(const std::string& error, int64_t elapsed_ms);

HistoryEntry history_entry_for(const RequestDescriptor& request,
                               const PreparedRequest& prepared,
                               const DispatchResult& result);

// prepared is null when the request could not be built
HistoryEntry failed_history_entry(const RequestDescriptor& request,
                                  const PreparedRequest* prepared,
                                  const std::string& error,
                                  int64_t elapsed_ms);

// Recorder failures are logged, never propagated. A null recorder is a no-op.
void record_history(HistoryRecorder* recorder, Observability& observability, const HistoryEntry& entry);

} // namespace engine
} // namespace courier
