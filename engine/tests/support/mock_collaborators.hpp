#pragma once

#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/store.hpp"
#include <caf/unit.hpp>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier {
namespace testing {

using namespace courier::engine;

// Scripted transport: responses and failures keyed by URL
class MockDispatcher : public RequestDispatcher {
public:
    struct Call {
        std::string url;
        DispatchOptions options;
    };

    void respond(const std::string& url, int status, nlohmann::json body = nlohmann::json::object()) {
        DispatchResult result;
        result.status = status;
        result.status_text = HttpDispatcher::reason_phrase(status);
        result.body = std::move(body);
        result.body_kind = BodyKind::json;
        result.response_time_ms = 5;
        responses_[url] = result;
    }

    void respond_with(const std::string& url, DispatchResult result) {
        responses_[url] = std::move(result);
    }

    void fail(const std::string& url, ErrorCode code, const std::string& message) {
        failures_[url] = std::make_pair(code, message);
    }

    DispatchResult send(const std::string& url, const DispatchOptions& options) override {
        int concurrent = ++in_flight_;
        if (concurrent > max_in_flight_) {
            max_in_flight_ = concurrent;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(Call{url, options});
        }

        auto failure = failures_.find(url);
        if (failure != failures_.end()) {
            --in_flight_;
            throw DispatchError(failure->second.first, failure->second.second, 7);
        }

        auto response = responses_.find(url);
        --in_flight_;
        if (response == responses_.end()) {
            throw DispatchError(ErrorCode::network_error, "getaddrinfo ENOTFOUND " + url, 3);
        }
        return response->second;
    }

    bool cancel(const std::string& transaction_id) override {
        cancelled_.push_back(transaction_id);
        return false;
    }

    bool test_connection(const std::string& url, int64_t) override {
        auto response = responses_.find(url);
        return response != responses_.end() && response->second.status < 500;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int max_in_flight() const { return max_in_flight_; }
    const std::vector<std::string>& cancelled() const { return cancelled_; }

private:
    std::map<std::string, DispatchResult> responses_;
    std::map<std::string, std::pair<ErrorCode, std::string>> failures_;
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::vector<std::string> cancelled_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

class InMemoryHistory : public HistoryRecorder {
public:
    caf::expected<void> record(const HistoryEntry& entry) override {
        if (throw_) {
            throw std::runtime_error("history encoder failed");
        }
        if (fail_) {
            return caf::make_error(caf::sec::runtime_error, "history store unavailable");
        }
        entries.push_back(entry);
        return caf::unit;
    }

    void fail_writes(bool fail) { fail_ = fail; }
    void throw_on_write(bool value) { throw_ = value; }

    std::vector<HistoryEntry> entries;

private:
    bool fail_ = false;
    bool throw_ = false;
};

class InMemoryStore : public EnvironmentStore {
public:
    caf::expected<VariableMap> global_variables(std::optional<int64_t> environment_id) override {
        if (environment_id) {
            auto it = environments.find(*environment_id);
            if (it != environments.end()) {
                return it->second;
            }
        }
        if (default_environment) {
            auto it = environments.find(*default_environment);
            if (it != environments.end()) {
                return it->second;
            }
        }
        if (environments.empty()) {
            return caf::make_error(caf::sec::runtime_error, "No environment selected");
        }
        return environments.begin()->second;
    }

    caf::expected<std::optional<VariableMap>> collection_variables(int64_t collection_id) override {
        auto it = collections.find(collection_id);
        if (it == collections.end()) {
            return caf::make_error(caf::sec::runtime_error, "Collection not found");
        }
        return it->second;
    }

    caf::expected<std::vector<RequestDescriptor>> collection_requests(int64_t collection_id) override {
        if (collections.find(collection_id) == collections.end()) {
            return caf::make_error(caf::sec::runtime_error, "Collection not found");
        }
        auto it = requests.find(collection_id);
        return it == requests.end() ? std::vector<RequestDescriptor>{} : it->second;
    }

    std::map<int64_t, VariableMap> environments;
    std::optional<int64_t> default_environment;
    std::map<int64_t, std::optional<VariableMap>> collections;
    std::map<int64_t, std::vector<RequestDescriptor>> requests;
};

} // namespace testing
} // namespace courier
