#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolOutcome handle_list_tags(const json &arguments,
                                               const auth::AuthContext *context,
                                               mcp_tools::ToolEnvironment &environment) {
    (void)context;

    storage::QueryOptions options;
    options.table = "tags";
    options.select = {"id", "name", "category", "description"};
    if (tool_support::truthy(arguments, "category")) {
        options.filters.push_back({"category", storage::FilterOp::Eq, tool_support::text(arguments, "category")});
    }
    options.order.push_back({"name", storage::SortDirection::Asc});
    options.limit = tool_support::limit(arguments, "limit", 50, 200);

    debug_log::log("list_tags invoked");
    std::vector<storage::Row> rows = environment.store.query(options);

    json result;
    result["tags"] = rows;
    result["count"] = rows.size();
    return result;
}

namespace tool_list_tags {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"category", {{"type", "string"}, {"description", "Tag category"},
                      {"enum", {"platform", "business", "trend", "tech", "event"}}}},
        {"limit", {{"type", "number"}, {"description", "Max results (default 50, max 200)"},
                   {"minimum", 1}, {"maximum", 200}}}
    };

    registry.register_tool({
        "list_tags",
        "List tags used in the newsletter, optionally filtered by category.",
        input_schema,
        handle_list_tags
    });
}

} // namespace tool_list_tags
