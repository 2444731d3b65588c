#ifndef INKWELL_TOOL_HANDLERS_HPP
#define INKWELL_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register all available tool handlers with registry, in catalog order.
void register_all_tools(mcp_tools::ToolRegistry &registry);

} // namespace tool_handlers

#endif // INKWELL_TOOL_HANDLERS_HPP
