#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "storage/query_builder.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_sources".
// "used" needs IS NOT NULL, which the declarative filters cannot express, so
// that case compiles the other filters and appends the condition. Owner only.

static mcp_tools::ToolOutcome handle_list_sources(const json &arguments,
                                                  const auth::AuthContext *context,
                                                  mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::vector<storage::Filter> filters;
    if (tool_support::has(arguments, "target_article")) {
        std::string target = tool_support::text(arguments, "target_article");
        if (target == "backlog") {
            filters.push_back({"target_article", storage::FilterOp::Is, nullptr});
        } else {
            filters.push_back({"target_article", storage::FilterOp::Eq, target});
        }
    }
    if (tool_support::truthy(arguments, "status")) {
        filters.push_back({"status", storage::FilterOp::Eq, tool_support::text(arguments, "status")});
    }
    if (tool_support::truthy(arguments, "type")) {
        filters.push_back({"type", storage::FilterOp::Eq, tool_support::text(arguments, "type")});
    }

    int64_t limit = tool_support::limit(arguments, "limit", 50, 100);
    const json &used = tool_support::field(arguments, "used");

    debug_log::log("list_sources invoked");
    std::vector<storage::Row> rows;
    if (used.is_boolean()) {
        query_builder::CompiledSql where = query_builder::compile_where(filters);
        std::string used_condition = used.get<bool>() ? "used_in_article IS NOT NULL" : "used_in_article IS NULL";
        std::string sql = "SELECT * FROM editorial_sources " +
                          (where.sql.empty() ? "WHERE " + used_condition : where.sql + " AND " + used_condition) +
                          " ORDER BY published_date DESC NULLS LAST, created_at DESC LIMIT ?";
        where.params.push_back(limit);
        rows = environment.store.raw(sql, where.params);
    } else {
        storage::QueryOptions options;
        options.table = "editorial_sources";
        options.filters = filters;
        options.order.push_back({"published_date", storage::SortDirection::Desc, storage::NullPlacement::Last});
        options.order.push_back({"created_at", storage::SortDirection::Desc});
        options.limit = limit;
        rows = environment.store.query(options);
    }

    json result;
    result["sources"] = rows;
    result["count"] = rows.size();
    result["markdown"] = rows.empty()
        ? "_No sources found_\n\n" + formatting::get_watermark(environment.config.watermark)
        : tool_support::markdown_list(rows, formatting::format_source_md, environment.config.watermark);
    return result;
}

namespace tool_list_sources {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"target_article", {{"type", "string"},
                            {"description", "Filter by article ID (use \"backlog\" for unassigned)"}}},
        {"status", {{"type", "string"}, {"enum", json::array({"active", "inactive"})}}},
        {"type", {{"type", "string"},
                  {"enum", {"article", "report", "dataset", "interview", "video", "podcast", "social", "other"}}}},
        {"used", {{"type", "boolean"}, {"description", "true = only used, false = only unused"}}},
        {"limit", {{"type", "number"}, {"minimum", 1}, {"maximum", 100},
                   {"description", "Max results (default 50)"}}}
    };

    registry.register_tool({
        "list_sources",
        "List editorial sources with used/unused indicator. Owner only.",
        input_schema,
        handle_list_sources
    });
}

} // namespace tool_list_sources
