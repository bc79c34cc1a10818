#pragma once

#include "courier/engine/core.hpp"
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/sec.hpp>
#include <optional>
#include <vector>

namespace courier {
namespace engine {

// Read side of the persistence layer used to build variable contexts
class EnvironmentStore {
public:
    virtual ~EnvironmentStore() = default;

    /**
     * Variables of the requested environment. Falls back to the default
     * environment, then to the first one. Error when no environment exists.
     */
    virtual caf::expected<VariableMap> global_variables(std::optional<int64_t> environment_id) = 0;

    /**
     * Variables of the collection's active sub-environment, or of its first
     * one when no active id is set or it points at a deleted entry.
     * nullopt when the collection has no sub-environments; error when the
     * collection does not exist.
     */
    virtual caf::expected<std::optional<VariableMap>> collection_variables(int64_t collection_id) = 0;

    virtual caf::expected<std::vector<RequestDescriptor>> collection_requests(int64_t collection_id) = 0;
};

// Write-only sink, called once per dispatch attempt
class HistoryRecorder {
public:
    virtual ~HistoryRecorder() = default;

    virtual caf::expected<void> record(const HistoryEntry& entry) = 0;
};

} // namespace engine
} // namespace courier
