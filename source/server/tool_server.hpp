#ifndef CHATBRIDGE_TOOL_SERVER_HPP
#define CHATBRIDGE_TOOL_SERVER_HPP

// The MCP tool server: owns the backend handle, the tool registry and the
// stdio transport loop, and sequences startup.
//
// Lifecycle:
//   Uninitialized -> Initializing        start() called
//   Initializing  -> Serving             engine ready, console suppressed, loop entered
//   Initializing  -> Failed              engine or transport could not be set up (rethrown)
// Serving lasts until the transport loop ends (EOF on stdin).

#include "backend/backend_handle.hpp"
#include "backend/query_engine_abi.hpp"
#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <atomic>
#include <istream>
#include <memory>
#include <ostream>

namespace tool_server {

using json = nlohmann::json;

enum class ServerState {
    Uninitialized,
    Initializing,
    Serving,
    Failed
};

const char *state_name(ServerState state);

class ToolServer {
public:
    // Registers the tools. engine_factory builds the default engine when
    // start() is not given one.
    ToolServer(server_config::ServerConfig config, query_engine::EngineFactory engine_factory);

    ToolServer(const ToolServer &) = delete;
    ToolServer &operator=(const ToolServer &) = delete;

    // Serve MCP on stdin/stdout until EOF.
    void start(std::shared_ptr<query_engine::QueryEngine> provided_engine = nullptr);

    // Serve MCP on the given streams until input reaches EOF. Throws
    // server_errors::InitializationError or server_errors::TransportFailure.
    // In-flight tool calls are answered before this returns.
    void start(std::shared_ptr<query_engine::QueryEngine> provided_engine, std::istream &input, std::ostream &output);

    ServerState state() const { return state_.load(); }

    const backend::BackendHandle &backend() const { return backend_; }
    const mcp_tools::ToolRegistry &tools() const { return tools_; }
    const server_config::ServerConfig &config() const { return config_; }

    // Dispatch one message synchronously (null for notifications).
    json handle_message(const json &message) const;

private:
    void run_transport_loop(mcp_stdio::StdioChannel &channel);
    void respond(mcp_stdio::StdioChannel &channel, const json &message) const;
    void fail(const std::string &reason);

    server_config::ServerConfig config_;
    query_engine::EngineFactory engine_factory_;
    mcp_dispatch::ServerInfo server_info_;
    backend::BackendHandle backend_;
    mcp_tools::ToolRegistry tools_;
    std::atomic<ServerState> state_{ServerState::Uninitialized};
};

} // namespace tool_server

#endif // CHATBRIDGE_TOOL_SERVER_HPP
