#include <iostream>
#include <cassert>
#include <memory>
#include <string>
#include <vector>
#include "courier/engine/request_service.hpp"
#include "courier/engine/sqlite_store.hpp"
#include "support/mock_collaborators.hpp"
#include <nlohmann/json.hpp>

using namespace courier::engine;
using courier::testing::InMemoryHistory;
using courier::testing::InMemoryStore;
using courier::testing::MockDispatcher;
using json = nlohmann::json;

struct Fixture {
    std::shared_ptr<InMemoryStore> store = std::make_shared<InMemoryStore>();
    std::shared_ptr<InMemoryHistory> history = std::make_shared<InMemoryHistory>();
    std::shared_ptr<MockDispatcher> dispatcher = std::make_shared<MockDispatcher>();
    RequestService service{store, history, dispatcher,
                           std::make_shared<Observability>("test_service", LogLevel::error)};

    Fixture() {
        store->environments[1] = {{"baseUrl", "https://global.example"}, {"token", "g-token"}};
        store->environments[2] = {{"baseUrl", "https://staging.example"}};
        store->default_environment = 1;
        store->collections[10] = VariableMap{{"baseUrl", "https://collection.example"}};
        store->collections[11] = std::nullopt;
    }
};

static bool error_mentions(const caf::error& err, const std::string& text) {
    return caf::to_string(err).find(text) != std::string::npos;
}

void test_successful_send() {
    std::cout << "Testing successful send..." << std::endl;

    Fixture f;
    f.dispatcher->respond("https://global.example/users", 200, json::array({json{{"id", 1}}}));

    RequestDescriptor request;
    request.id = 7;
    request.name = "users";
    request.url = "{{baseUrl}}/users";
    request.auth.type = AuthType::bearer;
    request.auth.token = "{{token}}";
    request.query_params = {QueryParam{"page", "{{token}}", true}};

    SendOutcome outcome = f.service.send_request(request);
    assert(outcome.success);
    assert(outcome.result.status == 200);
    assert(outcome.result.body[0]["id"] == 1);

    auto calls = f.dispatcher->calls();
    assert(calls.size() == 1);
    assert(calls[0].options.payload.headers.at("Authorization") == "Bearer g-token");
    // Query params are recorded, not appended
    assert(calls[0].url == "https://global.example/users");

    assert(f.history->entries.size() == 1);
    const auto& entry = f.history->entries[0];
    assert(entry.status == 200);
    assert(entry.method == "GET");
    assert(entry.url == "https://global.example/users");
    assert(entry.request_id == int64_t{7});
    assert(entry.query_params[0].value == "g-token");
    assert(!entry.error.has_value());

    std::cout << "✓ Successful send test passed" << std::endl;
}

void test_http_error_is_a_successful_send() {
    std::cout << "Testing HTTP error statuses are returned as results..." << std::endl;

    Fixture f;
    f.dispatcher->respond("https://global.example/missing", 404, json{{"message", "nope"}});

    RequestDescriptor request;
    request.url = "{{baseUrl}}/missing";
    SendOutcome outcome = f.service.send_request(request);

    assert(outcome.success);
    assert(outcome.result.status == 404);
    assert(outcome.result.is_http_error());
    assert(f.history->entries[0].status == 404);

    std::cout << "✓ HTTP error status test passed" << std::endl;
}

void test_transport_failure_becomes_status_zero() {
    std::cout << "Testing transport failures become status 0 results..." << std::endl;

    Fixture f;
    f.dispatcher->fail("https://global.example/slow", ErrorCode::cancelled_by_timeout, "Request timeout after 50ms");

    RequestDescriptor request;
    request.name = "slow";
    request.method = "POST";
    request.url = "{{baseUrl}}/slow";
    request.body = json{{"k", "v"}};
    request.timeout_ms = 50;

    SendOutcome outcome = f.service.send_request(request);
    assert(!outcome.success);
    assert(outcome.error == "Request timeout after 50ms");
    assert(outcome.error_code == ErrorCode::cancelled_by_timeout);
    assert(outcome.result.status == 0);
    assert(outcome.result.status_text == "Request timeout after 50ms");
    assert(outcome.result.body["error"] == "Request timeout after 50ms");

    auto calls = f.dispatcher->calls();
    assert(*calls[0].options.timeout_ms == 50);
    assert(calls[0].options.method == HttpMethod::post);

    assert(f.history->entries.size() == 1);
    const auto& entry = f.history->entries[0];
    assert(entry.status == 0);
    assert(entry.method == "POST");
    assert(entry.url == "https://global.example/slow");
    assert(*entry.error == "Request timeout after 50ms");

    std::cout << "✓ Status 0 failure test passed" << std::endl;
}

void test_invalid_request() {
    std::cout << "Testing invalid requests fail without dispatch..." << std::endl;

    Fixture f;

    RequestDescriptor bad_method;
    bad_method.method = "CONNECT";
    bad_method.url = "https://global.example";
    SendOutcome method_outcome = f.service.send_request(bad_method);
    assert(!method_outcome.success);
    assert(method_outcome.error_code == ErrorCode::invalid_input);
    assert(method_outcome.error == "Unsupported HTTP method: CONNECT");

    RequestDescriptor lower_method;
    lower_method.method = "get";
    lower_method.url = "https://global.example";
    SendOutcome lower_outcome = f.service.send_request(lower_method);
    assert(!lower_outcome.success);
    assert(lower_outcome.error == "Unsupported HTTP method: get");

    RequestDescriptor empty_url;
    empty_url.url = "{{nothingHere}}";
    SendOutcome url_outcome = f.service.send_request(empty_url);
    assert(!url_outcome.success);
    assert(url_outcome.error_code == ErrorCode::invalid_input);
    assert(url_outcome.error == "Request URL is empty");

    assert(f.dispatcher->calls().empty());
    // Recorded as authored
    assert(f.history->entries.size() == 3);
    assert(f.history->entries[0].method == "CONNECT");
    assert(f.history->entries[1].method == "get");
    assert(f.history->entries[2].url == "{{nothingHere}}");

    std::cout << "✓ Invalid request test passed" << std::endl;
}

void test_context_selection() {
    std::cout << "Testing context selection for single sends..." << std::endl;

    Fixture f;

    // Explicit environment
    auto staging = f.service.context_for(int64_t{2}, std::nullopt);
    assert(staging);
    assert(staging->global_variables.at("baseUrl") == "https://staging.example");
    assert(!staging->collection_variables.has_value());

    // Collection layer on top
    auto layered = f.service.context_for(std::nullopt, int64_t{10});
    assert(layered);
    assert(layered->collection_variables->at("baseUrl") == "https://collection.example");

    // Collection without sub-environments
    auto bare = f.service.context_for(std::nullopt, int64_t{11});
    assert(bare);
    assert(!bare->collection_variables.has_value());

    // Unknown collection: tolerated for single sends, required for runs
    auto tolerant = f.service.context_for(std::nullopt, int64_t{99});
    assert(tolerant);
    auto strict = f.service.context_for(std::nullopt, int64_t{99}, true);
    assert(!strict);
    assert(error_mentions(strict.error(), "Collection not found"));

    f.dispatcher->respond("https://collection.example/ping", 200);
    RequestDescriptor request;
    request.collection_id = 10;
    request.url = "{{baseUrl}}/ping";
    SendOutcome layered_send = f.service.send_request(request);
    assert(layered_send.success);

    std::cout << "✓ Context selection test passed" << std::endl;
}

void test_missing_environment() {
    std::cout << "Testing sends without any environment..." << std::endl;

    Fixture f;
    f.store->environments.clear();
    f.store->default_environment.reset();

    RequestDescriptor request;
    request.url = "https://global.example";
    SendOutcome outcome = f.service.send_request(request);

    assert(!outcome.success);
    assert(outcome.error_code == ErrorCode::resource_unavailable);
    assert(outcome.error.find("No environment selected") != std::string::npos);
    assert(outcome.result.status == 0);
    assert(f.dispatcher->calls().empty());
    assert(f.history->entries.empty());

    // An explicit context needs no store
    f.dispatcher->respond("https://global.example", 204);
    SendOutcome direct = f.service.send_request(request, VariableContext{});
    assert(direct.success);
    assert(direct.result.status == 204);

    std::cout << "✓ Missing environment test passed" << std::endl;
}

void test_run_collection() {
    std::cout << "Testing collection runs..." << std::endl;

    Fixture f;
    f.dispatcher->respond("https://collection.example/a", 200);
    f.dispatcher->respond("https://collection.example/b", 500);

    RequestDescriptor a;
    a.id = 1;
    a.name = "a";
    a.collection_id = 10;
    a.order = 2;
    a.url = "{{baseUrl}}/a";
    RequestDescriptor b;
    b.id = 2;
    b.name = "b";
    b.collection_id = 10;
    b.order = 1;
    b.url = "{{baseUrl}}/b";
    f.store->requests[10] = {a, b};

    std::vector<ProgressEvent> events;
    auto report = f.service.run_collection(10, [&events](const ProgressEvent& event) {
        events.push_back(event);
    });

    assert(report);
    assert(report->results.size() == 2);
    assert(report->results[0].request_name == "b");
    assert(report->results[0].status == 500);
    assert(report->summary.passed == 1);
    assert(report->summary.failed == 1);
    assert(events.size() == 2);
    assert(f.history->entries.size() == 2);

    auto missing = f.service.run_collection(404);
    assert(!missing);
    assert(error_mentions(missing.error(), "Collection not found"));

    f.store->environments.clear();
    f.store->default_environment.reset();
    auto no_env = f.service.run_collection(10);
    assert(!no_env);
    assert(error_mentions(no_env.error(), "No environment selected"));

    std::cout << "✓ Collection run test passed" << std::endl;
}

void test_history_exception_keeps_send_successful() {
    std::cout << "Testing history exceptions do not fail a send..." << std::endl;

    Fixture f;
    f.history->throw_on_write(true);
    f.dispatcher->respond("https://global.example/users", 200, json::array());

    RequestDescriptor request;
    request.url = "{{baseUrl}}/users";
    SendOutcome outcome = f.service.send_request(request);

    assert(outcome.success);
    assert(outcome.result.status == 200);
    assert(outcome.error.empty());
    // Dispatched once; no failure retry or second write
    assert(f.dispatcher->calls().size() == 1);
    assert(f.history->entries.empty());

    std::cout << "✓ History exception test passed" << std::endl;
}

void test_binary_body_recorded_in_sqlite() {
    std::cout << "Testing binary bodies and headers reach SQLite history..." << std::endl;

    Fixture f;
    auto sqlite = std::make_shared<SqliteStore>(":memory:",
        std::make_shared<Observability>("test_service_store", LogLevel::error));
    auto opened = sqlite->open();
    assert(opened);
    RequestService service{f.store, sqlite, f.dispatcher,
                           std::make_shared<Observability>("test_service", LogLevel::error)};

    const std::string jpeg_magic("\xff\xd8\xff\xe0", 4);
    DispatchResult response;
    response.status = 200;
    response.status_text = "OK";
    response.headers = {{"content-disposition", "attachment; filename=caf\xe9.txt"}};
    response.body = "stored";
    response.body_kind = BodyKind::text;
    f.dispatcher->respond_with("https://global.example/upload", response);

    RequestDescriptor request;
    request.name = "upload";
    request.method = "POST";
    request.url = "{{baseUrl}}/upload";
    request.headers = {{"Content-Type", "application/octet-stream"}};
    request.body = jpeg_magic;

    SendOutcome outcome = service.send_request(request);
    assert(outcome.success);
    assert(outcome.result.status == 200);
    assert(f.dispatcher->calls()[0].options.payload.body == jpeg_magic);

    auto rows = sqlite->history();
    assert(rows);
    assert(rows->size() == 1);
    const auto& row = (*rows)[0];
    assert(row.status == 200);
    assert(!row.error.has_value());
    assert(row.request_name == "upload");
    assert(row.raw_body.is_string());
    assert(!row.raw_body.get<std::string>().empty());
    assert(row.response_headers.count("content-disposition") == 1);
    assert(row.response_body == "stored");

    std::cout << "✓ Binary history test passed" << std::endl;
}

void test_cancel_probe_and_preview() {
    std::cout << "Testing cancel, probe and preview..." << std::endl;

    Fixture f;
    bool cancelled = f.service.cancel_request("tx-unknown");
    assert(!cancelled);
    assert(f.dispatcher->cancelled().size() == 1);
    assert(f.dispatcher->cancelled()[0] == "tx-unknown");

    f.dispatcher->respond("http://up.example", 404);
    f.dispatcher->respond("http://broken.example", 503);
    bool up = f.service.test_connection("http://up.example");
    bool broken = f.service.test_connection("http://broken.example", 100);
    bool nowhere = f.service.test_connection("http://nowhere.example");
    assert(up);
    assert(!broken);
    assert(!nowhere);

    VariableContext context;
    context.global_variables = {{"host", "h"}};
    ResolutionPreview preview = f.service.preview("{{host}}/{{path}}", context);
    assert(preview.resolved == "h/");
    assert(preview.unresolved.size() == 1);
    assert(preview.unresolved[0] == "path");

    std::cout << "✓ Cancel, probe and preview test passed" << std::endl;
}

int main() {
    std::cout << "=== Request Service Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_successful_send();
        test_http_error_is_a_successful_send();
        test_transport_failure_becomes_status_zero();
        test_invalid_request();
        test_context_selection();
        test_missing_environment();
        test_run_collection();
        test_history_exception_keeps_send_successful();
        test_binary_body_recorded_in_sqlite();
        test_cancel_probe_and_preview();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
