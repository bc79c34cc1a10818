#include <iostream>
#include <caf/actor_system_config.hpp>
#include "courier/engine/engine_config.hpp"
#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/observability.hpp"
#include "courier/engine/request_service.hpp"
#include "courier/engine/result_converter.hpp"
#include "courier/engine/sqlite_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

struct RunOptions {
    std::string db_path = "courier.db";
    int64_t collection_id = 0;
    std::string url;
    std::string method = "GET";
    std::vector<std::string> headers;
    std::string body;
    int64_t environment_id = 0;
    int64_t timeout_ms = 0;
    std::string probe_url;
    bool print_metrics = false;
};

class RunConfig : public caf::actor_system_config {
public:
    RunConfig() {
        opt_group{custom_options_, "global"}
            .add(options.db_path, "db", "SQLite database path")
            .add(options.collection_id, "collection", "Run every request of this collection")
            .add(options.url, "url", "Send a single request to this URL")
            .add(options.method, "method", "HTTP method of the single request")
            .add(options.headers, "header", "Header of the single request, as 'Name: value'")
            .add(options.body, "body", "Body of the single request")
            .add(options.environment_id, "environment", "Global environment for the single request")
            .add(options.timeout_ms, "timeout-ms", "Timeout of the single request (ms)")
            .add(options.probe_url, "probe", "Test whether a URL is reachable")
            .add(options.print_metrics, "print-metrics", "Print Prometheus metrics on exit");
    }

    RunOptions options;
};

namespace {

using courier::engine::ResultConverter;

courier::engine::HeaderMap parse_headers(const std::vector<std::string>& lines) {
    courier::engine::HeaderMap headers;
    for (const auto& line : lines) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        headers[line.substr(0, colon)] = value;
    }
    return headers;
}

// Response bodies and headers may hold bytes that are not UTF-8
std::string to_text(const nlohmann::json& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

int run(const RunConfig& config, courier::engine::Observability& observability,
        courier::engine::RequestService& service) {
    const RunOptions& options = config.options;

    if (!options.probe_url.empty()) {
        bool reachable = service.test_connection(options.probe_url,
                                                 options.timeout_ms > 0 ? std::optional<int64_t>(options.timeout_ms)
                                                                        : std::nullopt);
        std::cout << to_text(nlohmann::json{{"url", options.probe_url}, {"reachable", reachable}}, 2) << std::endl;
        return reachable ? 0 : 2;
    }

    if (options.collection_id > 0) {
        auto report = service.run_collection(options.collection_id, [&observability](const courier::engine::ProgressEvent& event) {
            observability.log_info("Collection progress", "", "", "", "", {
                {"progress", to_text(ResultConverter::to_json(event))}
            });
        });
        if (!report) {
            std::cerr << "Collection run failed: " << caf::to_string(report.error()) << std::endl;
            return 1;
        }
        std::cout << to_text(ResultConverter::to_json(*report), 2) << std::endl;
        return report->summary.failed == 0 ? 0 : 2;
    }

    if (!options.url.empty()) {
        courier::engine::RequestDescriptor request;
        request.name = "courier-run";
        request.method = options.method;
        request.url = options.url;
        request.headers = parse_headers(options.headers);
        if (!options.body.empty()) {
            request.body = options.body;
        }
        if (options.environment_id > 0) {
            request.environment_id = options.environment_id;
        }
        if (options.timeout_ms > 0) {
            request.timeout_ms = options.timeout_ms;
        }

        auto outcome = service.send_request(request);
        std::cout << to_text(ResultConverter::to_json(outcome), 2) << std::endl;
        return outcome.success && !outcome.result.is_http_error() ? 0 : 2;
    }

    std::cerr << "Nothing to do: pass --collection, --url or --probe (see --help)" << std::endl;
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    RunConfig config;

    if (auto err = config.parse(argc, argv)) {
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }
    if (config.cli_helptext_printed) {
        return 0;
    }

    auto engine_config = courier::engine::EngineConfig::from_environment();
    auto observability = std::make_shared<courier::engine::Observability>(
        "courier_run_" + std::to_string(getpid()), engine_config.log_level, engine_config.metrics_enabled);

    int exit_code = 1;
    try {
        auto store = std::make_shared<courier::engine::SqliteStore>(config.options.db_path, observability);
        if (auto opened = store->open(); !opened) {
            std::cerr << "Failed to open database: " << caf::to_string(opened.error()) << std::endl;
            return 1;
        }

        auto dispatcher = std::make_shared<courier::engine::HttpDispatcher>(engine_config, observability);
        courier::engine::RequestService service(store, store, dispatcher, observability);
        exit_code = run(config, *observability, service);
    } catch (const std::exception& e) {
        observability->log_error("courier-run fatal error", "", "", "", "", {{"error", e.what()}});
        return 1;
    }

    if (config.options.print_metrics) {
        std::cout << observability->metrics_text();
    }
    return exit_code;
}
