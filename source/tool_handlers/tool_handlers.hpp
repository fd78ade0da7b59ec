#ifndef CHATBRIDGE_TOOL_HANDLERS_HPP
#define CHATBRIDGE_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called while the
// server is constructed.

#include "backend/backend_handle.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with the MCP tool registry. Handlers
// keep a reference to backend, which must outlive the registry.
void register_all_tools(mcp_tools::ToolRegistry &registry, const backend::BackendHandle &backend);

} // namespace tool_handlers

#endif // CHATBRIDGE_TOOL_HANDLERS_HPP
