#ifndef CHATBRIDGE_SERVER_CONFIG_HPP
#define CHATBRIDGE_SERVER_CONFIG_HPP

// Startup configuration, read from CHATBRIDGE_* environment variables.

#include "utils/server_log.hpp"

#include <functional>
#include <string>
#include <vector>

namespace server_config {

struct ServerConfig {
    // Transport port. The stdio transport does not bind it; it is reported in
    // the startup log and kept for parity with network transports.
    int mcp_port = 8002;

    // Handshake metadata (serverInfo in the initialize response).
    std::string server_name = "Crawl n Chat";
    std::string server_description =
        "Chat with crawled web content. Ask a question with chat_with_content and "
        "get an answer grounded in the crawled pages, together with its sources.";
    std::string server_version = "0.1.0";

    // Embedding model the default query engine is configured with.
    std::string default_embedding_model = "text-embedding-3-small";

    // WebSocket endpoint of the query router used by the default engine.
    std::string router_url = "ws://127.0.0.1:8765/query";

    // Per-query timeout inside the default engine, 0 waits forever.
    int query_timeout_ms = 120000;

    // Tool calls answered at once; the reader waits when this many are running.
    int max_concurrent_requests = 32;

    std::string log_file = "logs/chatbridge.log";
    server_log::Level log_level = server_log::Level::Info;
    bool debug = false;
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvironmentLookup = std::function<const char *(const char *name)>;

struct LoadResult {
    ServerConfig config;
    // Variables that were set but could not be used (defaults kept).
    std::vector<std::string> warnings;
};

LoadResult load_server_config(const EnvironmentLookup &lookup);

// load_server_config() over the process environment.
LoadResult load_server_config_from_environment();

// "1", "true", "yes" (any case).
bool is_truthy(const std::string &value);

} // namespace server_config

#endif // CHATBRIDGE_SERVER_CONFIG_HPP
