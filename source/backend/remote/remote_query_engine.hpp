#ifndef CHATBRIDGE_REMOTE_QUERY_ENGINE_HPP
#define CHATBRIDGE_REMOTE_QUERY_ENGINE_HPP

// Query engine that forwards each query to an external query router over a
// WebSocket connection (libwebsockets).
//
// Frames are JSON:
//   -> {"id": 7, "method": "process_query", "params": {"query": "...", "embedding_model": "..."}}
//   <- {"id": 7, "result": {"response": "...", "sources": [...]}}
//   <- {"id": 7, "error": {"message": "..."}}
//
// A single service thread owns the libwebsockets context. Callers queue
// frames and wake it with lws_cancel_service(); replies are matched by id, so
// any number of queries may be in flight at once.

#include "backend/query_engine_abi.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct lws_context;
struct lws;

namespace remote_query {

using json = nlohmann::json;

struct WebsocketEndpoint {
    std::string host;
    int port = 80;
    std::string path = "/";
};

// Parses ws://host[:port][/path]. Throws std::invalid_argument otherwise.
WebsocketEndpoint parse_websocket_url(const std::string &url);

json build_query_frame(int message_id, const std::string &query, const std::string &embedding_model);

// Converts a reply frame into a QueryResult. Throws std::runtime_error for an
// error reply or a malformed one.
query_engine::QueryResult decode_query_reply(const json &reply);

struct RemoteEngineSettings {
    std::string router_url;
    std::string embedding_model;
    int query_timeout_ms = 120000; // 0 = wait forever
};

class RemoteQueryEngine : public query_engine::QueryEngine {
public:
    // Validates the URL and starts the service thread. The connection itself
    // is opened lazily by the first query.
    explicit RemoteQueryEngine(RemoteEngineSettings settings);
    ~RemoteQueryEngine() override;

    RemoteQueryEngine(const RemoteQueryEngine &) = delete;
    RemoteQueryEngine &operator=(const RemoteQueryEngine &) = delete;

    query_engine::QueryResult process_query(const std::string &query) override;
    bool supports_concurrent_queries() const override { return true; }

    const std::string &embedding_model() const { return settings_.embedding_model; }
    const WebsocketEndpoint &endpoint() const { return endpoint_; }

    // Called from the libwebsockets callback on the service thread.
    int handle_websocket_event(struct lws *websocket_instance, int reason, void *incoming_data,
                               size_t incoming_length);

private:
    struct PendingQuery {
        bool sent = false;
        bool done = false;
        json reply;
        std::string failure;
    };

    void service_loop();
    void open_connection();
    void write_next_frame(struct lws *websocket_instance);
    void complete_reply(const std::string &payload);
    // Fails queries; sent_only restricts it to frames already on the wire.
    void fail_pending(const std::string &reason, bool sent_only);

    RemoteEngineSettings settings_;
    WebsocketEndpoint endpoint_;

    struct lws_context *websocket_context_ = nullptr;
    // Service-thread only.
    struct lws *websocket_connection_ = nullptr;
    bool connecting_ = false;
    bool connected_ = false;
    std::string receive_buffer_;

    std::mutex mutex_;
    std::condition_variable reply_condition_;
    std::map<int, std::shared_ptr<PendingQuery>> pending_;
    std::deque<std::pair<int, std::string>> outbound_;
    int next_message_id_ = 1;

    std::atomic<bool> stopping_{false};
    std::thread service_thread_;
};

// Factory producing RemoteQueryEngine instances for the backend handle.
query_engine::EngineFactory make_remote_engine_factory(const std::string &router_url, int query_timeout_ms);

} // namespace remote_query

#endif // CHATBRIDGE_REMOTE_QUERY_ENGINE_HPP
