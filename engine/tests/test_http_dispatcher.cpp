#include <iostream>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <future>
#include <string>
#include <thread>
#include "courier/engine/http_dispatcher.hpp"
#include "courier/engine/payload_encoder.hpp"
#include "support/local_http_server.hpp"
#include <nlohmann/json.hpp>

using namespace courier::engine;
using courier::testing::CannedResponse;
using courier::testing::LocalHttpServer;
using courier::testing::ReceivedRequest;
using courier::testing::StalledListener;
using json = nlohmann::json;

static std::shared_ptr<Observability> quiet_observability() {
    return std::make_shared<Observability>("test_dispatcher", LogLevel::error);
}

static CannedResponse route(const ReceivedRequest& request) {
    CannedResponse response;
    if (request.path == "/json") {
        response.headers["Content-Type"] = "application/json; charset=utf-8";
        response.headers["X-Custom-Header"] = "custom";
        response.body = R"({"ok":true,"items":[1,2,3]})";
    } else if (request.path == "/broken-json") {
        response.headers["Content-Type"] = "application/json";
        response.body = "{not json";
    } else if (request.path == "/text") {
        response.headers["Content-Type"] = "text/plain";
        response.body = "hello world";
    } else if (request.path == "/binary") {
        response.headers["Content-Type"] = "application/octet-stream";
        response.body = std::string("\x00\x01\x02", 3);
    } else if (request.path == "/missing") {
        response.status = 404;
        response.reason = "Not Found";
        response.headers["Content-Type"] = "application/json";
        response.body = R"({"error":"missing"})";
    } else if (request.path == "/unavailable") {
        response.status = 503;
        response.reason = "Service Unavailable";
        response.headers["Content-Type"] = "text/plain";
        response.body = "down";
    } else if (request.path == "/no-reason") {
        response.status = 201;
        response.reason = "";
        response.headers["Content-Type"] = "text/plain";
        response.body = "created";
    } else if (request.path == "/redirect") {
        response.status = 302;
        response.reason = "Found";
        response.headers["Location"] = "/json";
    } else if (request.path == "/slow") {
        response.headers["Content-Type"] = "text/plain";
        response.body = "late";
        response.delay_ms = 3000;
    } else if (request.path == "/echo") {
        response.headers["Content-Type"] = "text/plain";
        response.body = request.body;
    } else {
        response.status = 404;
        response.reason = "Not Found";
        response.headers["Content-Type"] = "text/plain";
        response.body = "404 Not Found";
    }
    return response;
}

void test_json_response() {
    std::cout << "Testing JSON response typing..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchResult result = dispatcher.send(server.url("/json"), DispatchOptions{});

    assert(result.status == 200);
    assert(result.status_text == "OK");
    assert(result.body_kind == BodyKind::json);
    assert(result.body["ok"] == true);
    assert(result.body["items"].size() == 3);
    // Header names are lower-cased
    assert(result.headers.count("x-custom-header") == 1);
    assert(result.headers.at("x-custom-header") == "custom");
    assert(result.response_time_ms >= 0);

    std::cout << "✓ JSON response typing test passed" << std::endl;
}

void test_text_binary_and_fallback_typing() {
    std::cout << "Testing text, binary and fallback typing..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchResult text = dispatcher.send(server.url("/text"), DispatchOptions{});
    assert(text.body_kind == BodyKind::text);
    assert(text.body == "hello world");
    assert(text.size_bytes == 11);

    DispatchResult binary = dispatcher.send(server.url("/binary"), DispatchOptions{});
    assert(binary.body_kind == BodyKind::base64);
    assert(binary.body == "AAEC");
    assert(binary.size_bytes == 3);

    DispatchResult broken = dispatcher.send(server.url("/broken-json"), DispatchOptions{});
    assert(broken.body_kind == BodyKind::text);
    assert(broken.body == "{not json");

    std::cout << "✓ Text, binary and fallback typing test passed" << std::endl;
}

void test_http_errors_are_results() {
    std::cout << "Testing HTTP error statuses are returned, not thrown..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchResult result = dispatcher.send(server.url("/missing"), DispatchOptions{});
    assert(result.status == 404);
    assert(result.status_text == "Not Found");
    assert(result.is_http_error());
    assert(result.body["error"] == "missing");

    std::cout << "✓ HTTP error status test passed" << std::endl;
}

void test_status_text_fallback() {
    std::cout << "Testing status text fallback..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchResult result = dispatcher.send(server.url("/no-reason"), DispatchOptions{});
    assert(result.status == 201);
    assert(result.status_text == "Created");

    assert(HttpDispatcher::reason_phrase(404) == "Not Found");
    assert(HttpDispatcher::reason_phrase(299).empty());

    std::cout << "✓ Status text fallback test passed" << std::endl;
}

void test_redirect_followed() {
    std::cout << "Testing redirects are followed..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchResult result = dispatcher.send(server.url("/redirect"), DispatchOptions{});
    assert(result.status == 200);
    assert(result.body_kind == BodyKind::json);
    // Only the final response's headers are reported
    assert(result.headers.count("location") == 0);
    assert(server.request_count() == 2);

    std::cout << "✓ Redirect test passed" << std::endl;
}

void test_post_sends_encoded_payload() {
    std::cout << "Testing POST sends the encoded payload..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());
    PayloadEncoder encoder;

    DispatchOptions options;
    options.method = HttpMethod::post;
    options.payload = encoder.encode(HttpMethod::post, {{"X-Trace", "abc"}}, json{{"name", "courier"}});

    DispatchResult result = dispatcher.send(server.url("/echo"), options);
    assert(result.status == 200);
    assert(result.body == R"({"name":"courier"})");

    ReceivedRequest received = server.last_request();
    assert(received.method == "POST");
    assert(received.head.find("Content-Type: application/json") != std::string::npos);
    assert(received.head.find("X-Trace: abc") != std::string::npos);

    std::cout << "✓ POST payload test passed" << std::endl;
}

void test_non_utf8_header_value() {
    std::cout << "Testing header values that are not UTF-8..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchOptions options;
    options.payload.headers = {{"X-File-Name", "caf\xe9.txt"}};
    DispatchResult result = dispatcher.send(server.url("/json"), options);

    assert(result.status == 200);
    assert(server.last_request().head.find("X-File-Name: caf\xe9.txt") != std::string::npos);

    std::cout << "✓ Non-UTF-8 header test passed" << std::endl;
}

void test_custom_methods() {
    std::cout << "Testing PUT, PATCH and DELETE verbs..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());
    PayloadEncoder encoder;

    DispatchOptions put;
    put.method = HttpMethod::put;
    put.payload = encoder.encode(HttpMethod::put, {}, std::string("raw-put"));
    DispatchResult put_result = dispatcher.send(server.url("/echo"), put);
    assert(server.last_request().method == "PUT");
    assert(put_result.body == "raw-put");

    DispatchOptions patch;
    patch.method = HttpMethod::patch;
    patch.payload = encoder.encode(HttpMethod::patch, {}, json{{"a", 1}});
    dispatcher.send(server.url("/echo"), patch);
    assert(server.last_request().method == "PATCH");

    DispatchOptions del;
    del.method = HttpMethod::del;
    dispatcher.send(server.url("/echo"), del);
    assert(server.last_request().method == "DELETE");
    assert(server.last_request().body.empty());

    std::cout << "✓ Custom methods test passed" << std::endl;
}

void test_timeout() {
    std::cout << "Testing timeout aborts the dispatch..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchOptions options;
    options.timeout_ms = 200;

    auto start = std::chrono::steady_clock::now();
    bool thrown = false;
    try {
        dispatcher.send(server.url("/slow"), options);
    } catch (const DispatchError& e) {
        thrown = true;
        assert(e.code() == ErrorCode::cancelled_by_timeout);
        assert(std::string(e.what()) == "Request timeout after 200ms");
        assert(e.elapsed_ms() >= 150);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(thrown);
    assert(elapsed < 2000);

    std::cout << "✓ Timeout test passed (" << elapsed << "ms)" << std::endl;
}

void test_connect_timeout_is_transport_failure() {
    std::cout << "Testing a connect timeout shorter than the request timeout..." << std::endl;

    StalledListener listener;
    EngineConfig config;
    config.connect_timeout_ms = 200;
    HttpDispatcher dispatcher(config, quiet_observability());

    DispatchOptions options;
    options.timeout_ms = 5000;

    auto start = std::chrono::steady_clock::now();
    bool thrown = false;
    try {
        dispatcher.send(listener.url("/"), options);
    } catch (const DispatchError& e) {
        thrown = true;
        assert(e.code() == ErrorCode::network_error);
        assert(std::string(e.what()) != "Request timeout after 5000ms");
        assert(!std::string(e.what()).empty());
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(thrown);
    assert(elapsed < 4000);

    std::cout << "✓ Connect timeout test passed (" << elapsed << "ms)" << std::endl;
}

void test_user_cancellation() {
    std::cout << "Testing cancellation by transaction id..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchOptions options;
    options.transaction_id = "tx-cancel";
    options.timeout_ms = 10000;

    auto pending = std::async(std::launch::async, [&]() {
        try {
            dispatcher.send(server.url("/slow"), options);
        } catch (const DispatchError& e) {
            return e;
        }
        return DispatchError(ErrorCode::none, "completed");
    });

    // Wait until the dispatch is registered
    for (int i = 0; i < 200 && !dispatcher.registry().contains("tx-cancel"); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(dispatcher.registry().contains("tx-cancel"));

    auto start = std::chrono::steady_clock::now();
    bool cancelled = dispatcher.cancel("tx-cancel");
    assert(cancelled);
    DispatchError error = pending.get();
    auto abort_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    assert(error.code() == ErrorCode::cancelled_by_user);
    assert(std::string(error.what()) == "Request cancelled by user");
    assert(abort_ms < 1000);

    // Entry removed exactly once; a second cancel is a no-op
    bool cancelled_again = dispatcher.cancel("tx-cancel");
    assert(!cancelled_again);
    assert(dispatcher.registry().size() == 0);

    std::cout << "✓ Cancellation test passed (" << abort_ms << "ms to abort)" << std::endl;
}

void test_registry_cleared_after_completion() {
    std::cout << "Testing registry entry removed after completion..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    DispatchOptions options;
    options.transaction_id = "tx-done";
    DispatchResult result = dispatcher.send(server.url("/json"), options);

    assert(result.status == 200);
    assert(!dispatcher.registry().contains("tx-done"));
    bool done_cancelled = dispatcher.cancel("tx-done");
    bool unknown_cancelled = dispatcher.cancel("never-registered");
    assert(!done_cancelled);
    assert(!unknown_cancelled);

    std::cout << "✓ Registry cleanup test passed" << std::endl;
}

void test_registry_entry_ownership() {
    std::cout << "Testing registry entries belong to their token..." << std::endl;

    TransactionRegistry registry;
    auto first = std::make_shared<CancellationToken>();
    auto second = std::make_shared<CancellationToken>();

    // A reused id belongs to the newest dispatch
    registry.add("tx", first);
    registry.add("tx", second);
    registry.clear("tx", first.get());
    assert(registry.contains("tx"));

    bool cancelled = registry.cancel("tx");
    assert(cancelled);
    assert(second->reason() == CancelReason::user);
    assert(!first->is_cancelled());
    assert(!registry.contains("tx"));

    // Cleared on completion: a late cancel reaches nothing
    registry.add("tx-late", first);
    registry.clear("tx-late", first.get());
    bool late = registry.cancel("tx-late");
    assert(!late);
    assert(!first->is_cancelled());
    assert(registry.size() == 0);

    std::cout << "✓ Registry ownership test passed" << std::endl;
}

void test_transport_failure() {
    std::cout << "Testing transport failure..." << std::endl;

    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    bool thrown = false;
    try {
        dispatcher.send("http://127.0.0.1:1/", DispatchOptions{});
    } catch (const DispatchError& e) {
        thrown = true;
        assert(e.code() == ErrorCode::network_error);
        assert(std::string(e.what()).size() > 0);
    }
    assert(thrown);

    std::cout << "✓ Transport failure test passed" << std::endl;
}

void test_connection_probe() {
    std::cout << "Testing connection probe..." << std::endl;

    LocalHttpServer server(route);
    HttpDispatcher dispatcher(EngineConfig{}, quiet_observability());

    // Any status below 500 counts as reachable
    bool not_found_reachable = dispatcher.test_connection(server.url("/missing"));
    bool json_reachable = dispatcher.test_connection(server.url("/json"), 1000);
    bool unavailable_reachable = dispatcher.test_connection(server.url("/unavailable"));
    bool closed_port_reachable = dispatcher.test_connection("http://127.0.0.1:1/", 500);
    assert(not_found_reachable);
    assert(json_reachable);
    assert(!unavailable_reachable);
    assert(!closed_port_reachable);

    std::cout << "✓ Connection probe test passed" << std::endl;
}

void test_dispatch_metrics() {
    std::cout << "Testing dispatch metrics..." << std::endl;

    LocalHttpServer server(route);
    auto observability = quiet_observability();
    HttpDispatcher dispatcher(EngineConfig{}, observability);

    dispatcher.send(server.url("/json"), DispatchOptions{});
    dispatcher.send(server.url("/missing"), DispatchOptions{});

    std::string metrics = observability->metrics_text();
    assert(metrics.find("courier_dispatch_total") != std::string::npos);
    assert(metrics.find("outcome=\"success\"") != std::string::npos);
    assert(metrics.find("outcome=\"http_error\"") != std::string::npos);
    assert(metrics.find("courier_dispatch_duration_seconds") != std::string::npos);

    std::cout << "✓ Dispatch metrics test passed" << std::endl;
}

int main() {
    std::cout << "=== HTTP Dispatcher Tests ===" << std::endl;
    std::cout << std::endl;

    // Loopback traffic must not go through a proxy from the environment
    setenv("NO_PROXY", "127.0.0.1,localhost", 1);
    setenv("no_proxy", "127.0.0.1,localhost", 1);

    try {
        test_json_response();
        test_text_binary_and_fallback_typing();
        test_http_errors_are_results();
        test_status_text_fallback();
        test_redirect_followed();
        test_post_sends_encoded_payload();
        test_non_utf8_header_value();
        test_custom_methods();
        test_timeout();
        test_connect_timeout_is_transport_failure();
        test_user_cancellation();
        test_registry_cleared_after_completion();
        test_registry_entry_ownership();
        test_transport_failure();
        test_connection_probe();
        test_dispatch_metrics();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
