#include "mcp/mcp_tools.hpp"

#include <algorithm>
#include <utility>

namespace mcp_tools {

bool ToolRegistry::register_tool(ToolDefinition definition) {
    auto existing = std::find_if(tools_.begin(), tools_.end(), [&definition](const ToolDefinition &tool) {
        return tool.name == definition.name;
    });
    if (existing != tools_.end()) {
        return false;
    }
    tools_.push_back(std::move(definition));
    return true;
}

json ToolRegistry::build_tools_list_response() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json ToolRegistry::dispatch_tool_call(const std::string &tool_name, const json &arguments) const {
    for (const auto &tool : tools_) {
        if (tool.name == tool_name) {
            return tool.handler(arguments);
        }
    }
    return build_text_result("Unknown tool: " + tool_name, true);
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json build_structured_result(const json &payload, bool is_error) {
    json result = build_text_result(payload.dump(), is_error);
    result["structuredContent"] = payload;
    return result;
}

} // namespace mcp_tools
