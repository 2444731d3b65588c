#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_articles".
// Newest first; articles without a publication date come last.

static mcp_tools::ToolOutcome handle_list_articles(const json &arguments,
                                                   const auth::AuthContext *context,
                                                   mcp_tools::ToolEnvironment &environment) {
    (void)context;

    int64_t limit = tool_support::limit(arguments, "limit", 20, 50);
    int64_t offset = tool_support::offset(arguments, "offset");

    storage::QueryOptions options;
    options.table = "articles";
    options.select = {"id", "number", "title", "subtitle", "status", "type", "published_at",
                      "views", "open_rate", "substack_url", "editorial_angle"};
    if (tool_support::truthy(arguments, "status")) {
        options.filters.push_back({"status", storage::FilterOp::Eq, tool_support::text(arguments, "status")});
    }
    if (tool_support::truthy(arguments, "type")) {
        options.filters.push_back({"type", storage::FilterOp::Eq, tool_support::text(arguments, "type")});
    }
    options.order.push_back({"published_at", storage::SortDirection::Desc, storage::NullPlacement::Last});
    options.limit = limit;
    options.offset = offset;

    debug_log::log("list_articles invoked limit=" + std::to_string(limit) + " offset=" + std::to_string(offset));
    std::vector<storage::Row> rows = environment.store.query(options);

    json result;
    result["articles"] = rows;
    result["count"] = rows.size();
    result["offset"] = offset;
    result["markdown"] = tool_support::markdown_list(rows, formatting::format_article_md, environment.config.watermark);
    return result;
}

namespace tool_list_articles {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"status", {{"type", "string"}, {"description", "Filter by status"},
                    {"enum", {"published", "draft", "archived"}}}},
        {"type", {{"type", "string"}, {"description", "Filter by content type"},
                  {"enum", {"edition", "analysis", "special"}}}},
        {"limit", {{"type", "number"}, {"description", "Max results (default 20, max 50)"},
                   {"minimum", 1}, {"maximum", 50}}},
        {"offset", {{"type", "number"}, {"description", "Pagination offset (default 0)"}, {"minimum", 0}}}
    };

    registry.register_tool({
        "list_articles",
        "List newsletter articles with optional filters by status, type, and pagination.",
        input_schema,
        handle_list_articles
    });
}

} // namespace tool_list_articles
