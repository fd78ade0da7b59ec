#ifndef CHATBRIDGE_TOOL_CHAT_WITH_CONTENT_HPP
#define CHATBRIDGE_TOOL_CHAT_WITH_CONTENT_HPP

// The "chat_with_content" tool: answers a question about the crawled content
// by forwarding it to the backend query engine.

#include "backend/backend_handle.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tool_chat_with_content {

using json = nlohmann::json;

constexpr const char *TOOL_NAME = "chat_with_content";
constexpr const char *NOT_INITIALIZED_MESSAGE = "Service not initialized";
constexpr const char *PROCESSING_ERROR_PREFIX = "Error processing query: ";

// Either {response, sources} (success) or {error} (failure), never both.
struct ToolInvocationResult {
    bool success = false;
    std::string response;
    std::vector<json> sources;
    std::string error;

    static ToolInvocationResult answer(std::string response, std::vector<json> sources);
    static ToolInvocationResult failure(std::string error);

    // {"response": ..., "sources": [...]} or {"error": ...}, strings sanitized
    // to valid UTF-8.
    json to_json() const;
};

// Forwards query to the backend. Returns "Service not initialized" without
// touching any engine when the backend is not ready. Engine failures are
// logged and returned as "Error processing query: <detail>". Never throws.
ToolInvocationResult chat_with_content(const backend::BackendHandle &backend, const std::string &query);

// MCP handler: validates arguments, calls chat_with_content() and wraps the
// result as a tool result.
json handle_chat_with_content(const backend::BackendHandle &backend, const json &arguments);

void register_tool(mcp_tools::ToolRegistry &registry, const backend::BackendHandle &backend);

} // namespace tool_chat_with_content

#endif // CHATBRIDGE_TOOL_CHAT_WITH_CONTENT_HPP
