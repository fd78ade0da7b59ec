// Tests for the remote query engine: URL parsing, frame construction and
// reply decoding, a connection attempt to a closed port, and round trips
// against a loopback router.

#include "backend/backend_handle.hpp"
#include "backend/remote/remote_query_engine.hpp"
#include "tool_handlers/tool_chat_with_content.hpp"
#include "loopback_router.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace test_remote_query {

using json = nlohmann::json;

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

static bool decode_throws_with(const json &reply, const std::string &expected_fragment) {
    try {
        remote_query::decode_query_reply(reply);
    } catch (const std::runtime_error &error) {
        return std::string(error.what()).find(expected_fragment) != std::string::npos;
    }
    return false;
}

static bool wait_until(const std::function<bool()> &condition, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

static remote_query::RemoteEngineSettings router_settings(const test_router::LoopbackRouter &router,
                                                          int query_timeout_ms) {
    remote_query::RemoteEngineSettings settings;
    settings.router_url = router.url();
    settings.embedding_model = "m1";
    settings.query_timeout_ms = query_timeout_ms;
    return settings;
}

// Test: Host, port and path are split out of a ws:// URL, with defaults.
static bool test_parse_websocket_url() {
    remote_query::WebsocketEndpoint full = remote_query::parse_websocket_url("ws://router.local:9000/v1/query");
    remote_query::WebsocketEndpoint bare = remote_query::parse_websocket_url("ws://localhost");

    bool success = full.host == "router.local" && full.port == 9000 && full.path == "/v1/query" &&
                   bare.host == "localhost" && bare.port == 80 && bare.path == "/";
    return report(success, "ws:// URLs are parsed with default port and path");
}

// Test: Other schemes, missing hosts and bad ports are rejected.
static bool test_parse_websocket_url_rejects() {
    int rejected = 0;
    for (const std::string url : {"http://router:80/", "wss://router/", "ws://:9000/", "ws://router:0/",
                                  "ws://router:70000/", "ws://router:12ab/"}) {
        try {
            remote_query::parse_websocket_url(url);
            std::cout << "  accepted: " << url << std::endl;
        } catch (const std::invalid_argument &) {
            rejected++;
        }
    }
    return report(rejected == 6, "Unsupported or malformed URLs are rejected");
}

// Test: The query frame carries id, method, query and embedding model.
static bool test_build_query_frame() {
    json frame = remote_query::build_query_frame(12, "what is new?", "m1");
    bool success = frame["id"] == 12 && frame["method"] == "process_query" &&
                   frame["params"]["query"] == "what is new?" && frame["params"]["embedding_model"] == "m1";
    return report(success, "Query frame has id, method and params");
}

// Test: A result reply decodes into response and sources; absent sources stay absent.
static bool test_decode_success_replies() {
    json with_sources = {{"id", 1},
                         {"result", {{"response", "R"}, {"sources", json::array({{{"url", "https://a"}}})}}}};
    json without_sources = {{"id", 2}, {"result", {{"response", "R2"}}}};

    query_engine::QueryResult first = remote_query::decode_query_reply(with_sources);
    query_engine::QueryResult second = remote_query::decode_query_reply(without_sources);

    bool success = first.response == "R" && first.sources && first.sources->size() == 1 &&
                   (*first.sources)[0]["url"] == "https://a" && second.response == "R2" && !second.sources;
    return report(success, "Result replies decode with and without sources");
}

// Test: Error replies and malformed replies throw with a useful message.
static bool test_decode_failure_replies() {
    bool success = decode_throws_with({{"id", 1}, {"error", {{"message", "index not built"}}}}, "index not built") &&
                   decode_throws_with({{"id", 1}, {"error", "rate limited"}}, "rate limited") &&
                   decode_throws_with({{"id", 1}}, "missing result") &&
                   decode_throws_with({{"id", 1}, {"result", {{"response", 5}}}}, "'response' must be a string") &&
                   decode_throws_with({{"id", 1}, {"result", {{"response", "R"}, {"sources", "s1"}}}},
                                      "'sources' must be an array");
    return report(success, "Error and malformed replies are reported as failures");
}

// Test: Constructing with an invalid URL throws, which the backend reports as an initialization failure.
static bool test_invalid_url_fails_construction() {
    backend::BackendHandle handle;
    bool threw = false;
    try {
        handle.initialize(nullptr, "m1", remote_query::make_remote_engine_factory("http://nope", 1000));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    return report(threw && !handle.ready(), "Invalid router URL fails engine construction");
}

// Test: A query against a closed port fails on the connection error, not the timeout.
static bool test_unreachable_router_is_query_error() {
    backend::BackendHandle handle;
    handle.initialize(nullptr, "m1", remote_query::make_remote_engine_factory("ws://127.0.0.1:1/query", 10000));

    auto started = std::chrono::steady_clock::now();
    json payload = tool_chat_with_content::chat_with_content(handle, "hello").to_json();
    auto elapsed = std::chrono::steady_clock::now() - started;

    bool success = payload.contains("error") && !payload.contains("response") &&
                   payload["error"].get<std::string>().rfind("Error processing query: ", 0) == 0 &&
                   payload["error"].get<std::string>().find("Timed out") == std::string::npos &&
                   elapsed < std::chrono::milliseconds(10000);
    if (!success) {
        std::cout << "  got: " << payload.dump() << std::endl;
    }
    return report(success, "Unreachable router yields an 'Error processing query' result");
}

// Test: A query goes out as a frame and its reply comes back with sources; the connection is reused.
static bool test_round_trip_with_sources() {
    test_router::LoopbackRouter router;
    remote_query::RemoteQueryEngine engine(router_settings(router, 5000));

    query_engine::QueryOutcome first = query_engine::call_engine(engine, "echo:alpha");
    query_engine::QueryOutcome second = query_engine::call_engine(engine, "echo:beta");

    bool success = first.success && first.result.response == "alpha" && first.result.sources &&
                   first.result.sources->size() == 1 &&
                   (*first.result.sources)[0]["url"] == "https://example.test/alpha" && second.success &&
                   second.result.response == "beta" && router.frames_received() == 2;
    if (!success) {
        std::cout << "  first: " << (first.success ? first.result.response : first.error_detail)
                  << " second: " << (second.success ? second.result.response : second.error_detail) << std::endl;
    }
    return report(success, "Round trip through the router returns response and sources");
}

// Test: Two queries in flight are matched to their own replies even when answered out of order.
static bool test_out_of_order_replies_matched_by_id() {
    test_router::LoopbackRouter router;
    remote_query::RemoteQueryEngine engine(router_settings(router, 5000));

    query_engine::QueryOutcome held;
    std::thread held_caller([&engine, &held]() { held = query_engine::call_engine(engine, "hold:first"); });
    bool held_arrived = wait_until([&router]() { return router.frames_received() >= 1; }, 3000);

    query_engine::QueryOutcome released = query_engine::call_engine(engine, "release:second");
    held_caller.join();

    std::vector<std::string> order = router.reply_order();
    bool success = held_arrived && held.success && held.result.response == "first" && released.success &&
                   released.result.response == "second" && order == std::vector<std::string>{"second", "first"};
    return report(success, "Out-of-order replies complete the right queries");
}

// Test: An unanswered query times out; its late reply is dropped and the next query still works.
static bool test_timeout_then_late_reply_dropped() {
    test_router::LoopbackRouter router;
    remote_query::RemoteQueryEngine engine(router_settings(router, 200));

    query_engine::QueryOutcome timed_out = query_engine::call_engine(engine, "ignore:slow");
    query_engine::QueryOutcome after = query_engine::call_engine(engine, "flush:after");

    std::vector<std::string> order = router.reply_order();
    bool success = !timed_out.success && timed_out.error_detail.rfind("Timed out after 200 ms", 0) == 0 &&
                   after.success && after.result.response == "after" &&
                   order == std::vector<std::string>{"slow", "after"};
    if (!success) {
        std::cout << "  timed_out: " << timed_out.error_detail
                  << " after: " << (after.success ? after.result.response : after.error_detail) << std::endl;
    }
    return report(success, "Timed-out query fails and its late reply is ignored");
}

// Test: A reply whose id only matches after narrowing to int does not complete the query.
static bool test_out_of_range_reply_id_ignored() {
    test_router::LoopbackRouter router;
    remote_query::RemoteQueryEngine engine(router_settings(router, 5000));

    query_engine::QueryOutcome outcome = query_engine::call_engine(engine, "alias:right");
    bool success = outcome.success && outcome.result.response == "right";
    if (!success) {
        std::cout << "  got: " << (outcome.success ? outcome.result.response : outcome.error_detail) << std::endl;
    }
    return report(success, "Reply ids outside the int range are ignored");
}

// Test: The router closing after a frame fails that query, and the next query reconnects.
static bool test_close_fails_sent_query_then_reconnects() {
    test_router::LoopbackRouter router;
    remote_query::RemoteQueryEngine engine(router_settings(router, 5000));

    query_engine::QueryOutcome dropped = query_engine::call_engine(engine, "close:x");
    query_engine::QueryOutcome again = query_engine::call_engine(engine, "echo:again");

    bool closed_reported = dropped.error_detail.find("closed the connection") != std::string::npos ||
                           dropped.error_detail.find("connection failed") != std::string::npos;
    bool success = !dropped.success && closed_reported && again.success && again.result.response == "again";
    if (!success) {
        std::cout << "  dropped: " << dropped.error_detail
                  << " again: " << (again.success ? again.result.response : again.error_detail) << std::endl;
    }
    return report(success, "Connection closed mid-query fails it and the engine reconnects");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_websocket_url();
    all_passed &= test_parse_websocket_url_rejects();
    all_passed &= test_build_query_frame();
    all_passed &= test_decode_success_replies();
    all_passed &= test_decode_failure_replies();
    all_passed &= test_invalid_url_fails_construction();
    all_passed &= test_unreachable_router_is_query_error();
    all_passed &= test_round_trip_with_sources();
    all_passed &= test_out_of_order_replies_matched_by_id();
    all_passed &= test_timeout_then_late_reply_dropped();
    all_passed &= test_out_of_range_reply_id_ignored();
    all_passed &= test_close_fails_sent_query_then_reconnects();
    return all_passed;
}

} // namespace test_remote_query
