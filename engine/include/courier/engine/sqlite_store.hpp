#pragma once

#include "courier/engine/observability.hpp"
#include "courier/engine/store.hpp"
#include <sqlite3.h>
#include <memory>
#include <mutex>
#include <string>

namespace courier {
namespace engine {

/**
 * SQLite-backed EnvironmentStore and HistoryRecorder.
 *
 * Variable maps, headers, bodies, auth and query parameters are stored as
 * JSON text. Use ":memory:" for a throwaway database.
 */
class SqliteStore : public EnvironmentStore, public HistoryRecorder {
public:
    explicit SqliteStore(std::string path, std::shared_ptr<Observability> observability = nullptr);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // Opens the database and creates missing tables
    caf::expected<void> open();

    caf::expected<VariableMap> global_variables(std::optional<int64_t> environment_id) override;
    caf::expected<std::optional<VariableMap>> collection_variables(int64_t collection_id) override;
    caf::expected<std::vector<RequestDescriptor>> collection_requests(int64_t collection_id) override;

    caf::expected<void> record(const HistoryEntry& entry) override;

    caf::expected<int64_t> add_environment(const std::string& name,
                                           const VariableMap& variables,
                                           bool is_default = false);
    caf::expected<int64_t> add_collection(const std::string& name, const std::string& description = "");
    caf::expected<int64_t> add_collection_environment(int64_t collection_id,
                                                      const std::string& name,
                                                      const VariableMap& variables);
    caf::expected<void> set_active_environment(int64_t collection_id, int64_t environment_id);
    caf::expected<int64_t> add_request(const RequestDescriptor& request);

    // Newest first
    caf::expected<std::vector<HistoryEntry>> history(size_t limit = 100);

private:
    std::string path_;
    std::shared_ptr<Observability> observability_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    caf::expected<void> exec(const char* sql);
    caf::expected<void> migrate();
    caf::error sqlite_error(const std::string& what) const;
};

} // namespace engine
} // namespace courier
