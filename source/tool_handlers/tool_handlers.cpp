#include "tool_handlers/tool_handlers.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_list_articles { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_article { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_search_articles { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_articles_since { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_experts { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_expert { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_tags { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_add_note { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_notes { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_update_note { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_clear_notes { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_save_source { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_list_sources { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_deactivate_source { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_mark_source_used { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_prepare_brief { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_stats { void register_tool(mcp_tools::ToolRegistry &registry); }

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry) {
    // Articles, experts, tags: public.
    tool_list_articles::register_tool(registry);
    tool_get_article::register_tool(registry);
    tool_search_articles::register_tool(registry);
    tool_get_articles_since::register_tool(registry);
    tool_list_experts::register_tool(registry);
    tool_get_expert::register_tool(registry);
    tool_list_tags::register_tool(registry);

    // Editorial workspace: owner only.
    tool_add_note::register_tool(registry);
    tool_list_notes::register_tool(registry);
    tool_update_note::register_tool(registry);
    tool_clear_notes::register_tool(registry);
    tool_save_source::register_tool(registry);
    tool_list_sources::register_tool(registry);
    tool_deactivate_source::register_tool(registry);
    tool_mark_source_used::register_tool(registry);
    tool_prepare_brief::register_tool(registry);
    tool_get_stats::register_tool(registry);
}

} // namespace tool_handlers
