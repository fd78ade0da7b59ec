#ifndef CHATBRIDGE_MCP_TOOLS_HPP
#define CHATBRIDGE_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag, as per MCP spec).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Registration happens during server construction, before any dispatch;
// afterwards the registry is only read.
class ToolRegistry {
public:
    // Returns false (and registers nothing) if the name is already taken.
    bool register_tool(ToolDefinition definition);

    // Payload for tools/list.
    json build_tools_list_response() const;

    // Payload for tools/call. Unknown tools yield an isError result.
    json dispatch_tool_call(const std::string &tool_name, const json &arguments) const;

    const std::vector<ToolDefinition> &tools() const { return tools_; }

private:
    std::vector<ToolDefinition> tools_;
};

// Tool result carrying a single text item.
json build_text_result(const std::string &text, bool is_error);

// Tool result for a structured payload: the payload is serialized into the
// text item and also returned as structuredContent.
json build_structured_result(const json &payload, bool is_error);

} // namespace mcp_tools

#endif // CHATBRIDGE_MCP_TOOLS_HPP
