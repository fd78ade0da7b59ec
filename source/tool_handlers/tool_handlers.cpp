#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_chat_with_content.hpp"

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, const backend::BackendHandle &backend) {
    tool_chat_with_content::register_tool(registry, backend);
}

} // namespace tool_handlers
