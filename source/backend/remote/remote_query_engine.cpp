#include "backend/remote/remote_query_engine.hpp"
#include "utils/server_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace remote_query {

namespace {

const char *const kComponent = "remote_query";

// Query ids are positive ints; anything outside that range cannot be ours.
const std::int64_t kMaxMessageId = std::numeric_limits<int>::max();

bool read_message_id(const json &value, int &message_id) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMaxMessageId)) {
            return false;
        }
    } else if (value.get<std::int64_t>() < 1 || value.get<std::int64_t>() > kMaxMessageId) {
        return false;
    }
    message_id = value.get<int>();
    return message_id >= 1;
}

int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                       void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    if (websocket_instance == nullptr) {
        return 0;
    }
    auto *engine = static_cast<RemoteQueryEngine *>(lws_context_user(lws_get_context(websocket_instance)));
    if (engine == nullptr) {
        return 0;
    }
    return engine->handle_websocket_event(websocket_instance, static_cast<int>(reason), incoming_data,
                                          incoming_length);
}

const struct lws_protocols websocket_protocols[] = {
    {
        "chatbridge-query",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

// Routes libwebsockets diagnostics into the server log so they never reach
// stdout and are subject to console suppression like everything else.
void emit_websocket_log(int level, const char *line) {
    std::string text = line ? line : "";
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    if (level & LLL_ERR) {
        server_log::error("libwebsockets", text);
    } else if (level & LLL_WARN) {
        server_log::warning("libwebsockets", text);
    } else {
        server_log::debug("libwebsockets", text);
    }
}

} // namespace

WebsocketEndpoint parse_websocket_url(const std::string &url) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Query router URL must start with ws://: " + url);
    }

    std::string remainder = url.substr(scheme.size());
    WebsocketEndpoint endpoint;

    std::string host_and_port = remainder;
    auto slash_position = remainder.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = remainder.substr(0, slash_position);
        endpoint.path = remainder.substr(slash_position);
    }

    auto colon_position = host_and_port.find(':');
    endpoint.host = host_and_port.substr(0, colon_position);
    if (endpoint.host.empty()) {
        throw std::invalid_argument("Query router URL has no host: " + url);
    }

    if (colon_position != std::string::npos) {
        std::string port_text = host_and_port.substr(colon_position + 1);
        if (port_text.empty() || port_text.size() > 5 ||
            port_text.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Query router URL has an invalid port: " + url);
        }
        endpoint.port = std::stoi(port_text);
        if (endpoint.port < 1 || endpoint.port > 65535) {
            throw std::invalid_argument("Query router URL has an invalid port: " + url);
        }
    }

    return endpoint;
}

json build_query_frame(int message_id, const std::string &query, const std::string &embedding_model) {
    json frame;
    frame["id"] = message_id;
    frame["method"] = "process_query";
    frame["params"]["query"] = query;
    frame["params"]["embedding_model"] = embedding_model;
    return frame;
}

query_engine::QueryResult decode_query_reply(const json &reply) {
    if (reply.contains("error") && !reply["error"].is_null()) {
        const json &error = reply["error"];
        if (error.is_string()) {
            throw std::runtime_error(error.get<std::string>());
        }
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            throw std::runtime_error(error["message"].get<std::string>());
        }
        throw std::runtime_error("Query router error: " + error.dump());
    }

    if (!reply.contains("result") || !reply["result"].is_object()) {
        throw std::runtime_error("Malformed reply from query router: missing result object");
    }
    const json &result_object = reply["result"];

    if (!result_object.contains("response") || !result_object["response"].is_string()) {
        throw std::runtime_error("Malformed reply from query router: 'response' must be a string");
    }

    query_engine::QueryResult result;
    result.response = result_object["response"].get<std::string>();

    if (result_object.contains("sources") && !result_object["sources"].is_null()) {
        const json &sources = result_object["sources"];
        if (!sources.is_array()) {
            throw std::runtime_error("Malformed reply from query router: 'sources' must be an array");
        }
        result.sources = std::vector<json>(sources.begin(), sources.end());
    }
    return result;
}

// --- RemoteQueryEngine ---

RemoteQueryEngine::RemoteQueryEngine(RemoteEngineSettings settings)
    : settings_(std::move(settings)), endpoint_(parse_websocket_url(settings_.router_url)) {
    lws_set_log_level(LLL_ERR | LLL_WARN, emit_websocket_log);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    websocket_context_ = lws_create_context(&context_info);
    if (websocket_context_ == nullptr) {
        throw std::runtime_error("Failed to create libwebsockets context");
    }

    server_log::info(kComponent, "Query router at " + settings_.router_url + ", embedding model " +
                                     settings_.embedding_model);
    service_thread_ = std::thread([this]() { service_loop(); });
}

RemoteQueryEngine::~RemoteQueryEngine() {
    stopping_ = true;
    if (websocket_context_ != nullptr) {
        lws_cancel_service(websocket_context_);
    }
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    if (websocket_context_ != nullptr) {
        lws_context_destroy(websocket_context_);
        websocket_context_ = nullptr;
    }
    fail_pending("Query engine shut down", false);
}

query_engine::QueryResult RemoteQueryEngine::process_query(const std::string &query) {
    auto pending = std::make_shared<PendingQuery>();
    int message_id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message_id = next_message_id_;
        next_message_id_ = (next_message_id_ == kMaxMessageId) ? 1 : next_message_id_ + 1;
        pending_[message_id] = pending;
        outbound_.emplace_back(message_id,
                               build_query_frame(message_id, query, settings_.embedding_model).dump());
    }
    server_log::debug(kComponent, "Queued query id=" + std::to_string(message_id));
    lws_cancel_service(websocket_context_);

    std::unique_lock<std::mutex> lock(mutex_);
    auto is_done = [&pending]() { return pending->done; };
    if (settings_.query_timeout_ms > 0) {
        bool completed = reply_condition_.wait_for(lock, std::chrono::milliseconds(settings_.query_timeout_ms),
                                                   is_done);
        if (!completed) {
            pending_.erase(message_id);
            for (auto iterator = outbound_.begin(); iterator != outbound_.end(); ++iterator) {
                if (iterator->first == message_id) {
                    outbound_.erase(iterator);
                    break;
                }
            }
            throw std::runtime_error("Timed out after " + std::to_string(settings_.query_timeout_ms) +
                                     " ms waiting for the query router");
        }
    } else {
        reply_condition_.wait(lock, is_done);
    }

    if (!pending->failure.empty()) {
        throw std::runtime_error(pending->failure);
    }
    json reply = std::move(pending->reply);
    lock.unlock();

    return decode_query_reply(reply);
}

void RemoteQueryEngine::service_loop() {
    while (!stopping_) {
        bool has_outbound = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            has_outbound = !outbound_.empty();
        }
        if (has_outbound && websocket_connection_ == nullptr && !connecting_) {
            open_connection();
        }
        lws_service(websocket_context_, 100);
    }
}

void RemoteQueryEngine::open_connection() {
    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = websocket_context_;
    connect_info.address = endpoint_.host.c_str();
    connect_info.port = endpoint_.port;
    connect_info.path = endpoint_.path.c_str();
    connect_info.host = endpoint_.host.c_str();
    connect_info.origin = endpoint_.host.c_str();
    connect_info.protocol = nullptr;

    server_log::debug(kComponent, "Connecting to " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
                                      endpoint_.path);
    connecting_ = true;
    receive_buffer_.clear();
    websocket_connection_ = lws_client_connect_via_info(&connect_info);
    if (websocket_connection_ == nullptr) {
        connecting_ = false;
        fail_pending("Failed to initiate connection to query router at " + settings_.router_url, false);
    }
}

int RemoteQueryEngine::handle_websocket_event(struct lws *websocket_instance, int reason, void *incoming_data,
                                              size_t incoming_length) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connecting_ = false;
        connected_ = true;
        server_log::info(kComponent, "Connected to query router.");
        lws_callback_on_writable(websocket_instance);
        break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // A caller queued a frame (or the engine is stopping).
        bool has_outbound = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            has_outbound = !outbound_.empty();
        }
        if (has_outbound && connected_ && websocket_connection_ != nullptr) {
            lws_callback_on_writable(websocket_connection_);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE:
        write_next_frame(websocket_instance);
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        receive_buffer_.append(static_cast<const char *>(incoming_data), incoming_length);
        if (lws_is_final_fragment(websocket_instance) && lws_remaining_packet_payload(websocket_instance) == 0) {
            std::string payload;
            payload.swap(receive_buffer_);
            complete_reply(payload);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        std::string error_message = incoming_data ? std::string(static_cast<const char *>(incoming_data),
                                                                strnlen(static_cast<const char *>(incoming_data),
                                                                        incoming_length ? incoming_length : 512))
                                                  : "unknown";
        server_log::error(kComponent, "Query router connection error: " + error_message);
        websocket_connection_ = nullptr;
        connecting_ = false;
        connected_ = false;
        fail_pending("Query router connection failed: " + error_message, false);
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        server_log::warning(kComponent, "Query router connection closed.");
        websocket_connection_ = nullptr;
        connecting_ = false;
        connected_ = false;
        fail_pending("Query router closed the connection before replying", true);
        break;

    default:
        break;
    }

    return 0;
}

void RemoteQueryEngine::write_next_frame(struct lws *websocket_instance) {
    int message_id = 0;
    std::string frame;
    bool more_outbound = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outbound_.empty()) {
            return;
        }
        message_id = outbound_.front().first;
        frame = std::move(outbound_.front().second);
        outbound_.pop_front();
        more_outbound = !outbound_.empty();

        auto iterator = pending_.find(message_id);
        if (iterator != pending_.end()) {
            iterator->second->sent = true;
        }
    }

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + frame.size());
    memcpy(send_buffer.data() + LWS_PRE, frame.data(), frame.size());

    int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE, frame.size(), LWS_WRITE_TEXT);
    if (bytes_written < static_cast<int>(frame.size())) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iterator = pending_.find(message_id);
        if (iterator != pending_.end()) {
            iterator->second->failure = "Failed to send query to the query router";
            iterator->second->done = true;
            pending_.erase(iterator);
            reply_condition_.notify_all();
        }
        return;
    }

    if (more_outbound) {
        lws_callback_on_writable(websocket_instance);
    }
}

void RemoteQueryEngine::complete_reply(const std::string &payload) {
    json reply;
    try {
        reply = json::parse(payload);
    } catch (const json::parse_error &parse_error) {
        server_log::warning(kComponent, "Ignoring unparsable frame from query router: " +
                                            std::string(parse_error.what()));
        return;
    }

    if (!reply.is_object() || !reply.contains("id") || !reply["id"].is_number_integer()) {
        server_log::warning(kComponent, "Ignoring frame without an integer id: " + payload.substr(0, 200));
        return;
    }

    int message_id = 0;
    if (!read_message_id(reply["id"], message_id)) {
        server_log::warning(kComponent, "Ignoring frame with out-of-range id: " + reply["id"].dump());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto iterator = pending_.find(message_id);
    if (iterator == pending_.end()) {
        server_log::debug(kComponent, "Reply for unknown or expired query id=" + std::to_string(message_id));
        return;
    }
    iterator->second->reply = std::move(reply);
    iterator->second->done = true;
    pending_.erase(iterator);
    reply_condition_.notify_all();
}

void RemoteQueryEngine::fail_pending(const std::string &reason, bool sent_only) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto iterator = pending_.begin(); iterator != pending_.end();) {
        if (sent_only && !iterator->second->sent) {
            ++iterator;
            continue;
        }
        iterator->second->failure = reason;
        iterator->second->done = true;
        iterator = pending_.erase(iterator);
    }
    if (!sent_only) {
        outbound_.clear();
    }
    reply_condition_.notify_all();
}

query_engine::EngineFactory make_remote_engine_factory(const std::string &router_url, int query_timeout_ms) {
    return [router_url, query_timeout_ms](const std::string &embedding_model) {
        RemoteEngineSettings settings;
        settings.router_url = router_url;
        settings.embedding_model = embedding_model;
        settings.query_timeout_ms = query_timeout_ms;
        return std::shared_ptr<query_engine::QueryEngine>(std::make_shared<RemoteQueryEngine>(settings));
    };
}

} // namespace remote_query
