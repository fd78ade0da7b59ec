#ifndef CHATBRIDGE_MCP_DISPATCH_HPP
#define CHATBRIDGE_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes incoming MCP messages to the appropriate handler.

#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we answer with when the client asks for one we do not know.
extern const char *const PROTOCOL_VERSION;

// Reported as serverInfo in the initialize response.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string description;
};

// True for messages whose handling may block on a tool (tools/call requests).
// The transport runs those as their own task.
bool is_long_running(const json &message);

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const ServerInfo &server_info, const mcp_tools::ToolRegistry &tools, const json &message);

} // namespace mcp_dispatch

#endif // CHATBRIDGE_MCP_DISPATCH_HPP
