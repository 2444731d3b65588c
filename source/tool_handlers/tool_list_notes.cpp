#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "list_notes".
// target_article "backlog" selects unassigned notes. Only active notes unless
// a status is given. Owner only.

static mcp_tools::ToolOutcome handle_list_notes(const json &arguments,
                                                const auth::AuthContext *context,
                                                mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    storage::QueryOptions options;
    options.table = "editorial_notes";

    if (tool_support::has(arguments, "target_article")) {
        std::string target = tool_support::text(arguments, "target_article");
        if (target == "backlog") {
            options.filters.push_back({"target_article", storage::FilterOp::Is, nullptr});
        } else {
            options.filters.push_back({"target_article", storage::FilterOp::Eq, target});
        }
    }
    if (tool_support::truthy(arguments, "type")) {
        options.filters.push_back({"type", storage::FilterOp::Eq, tool_support::text(arguments, "type")});
    }
    std::string status = tool_support::truthy(arguments, "status") ? tool_support::text(arguments, "status") : "active";
    options.filters.push_back({"status", storage::FilterOp::Eq, status});
    if (tool_support::truthy(arguments, "tag")) {
        options.filters.push_back({"tags", storage::FilterOp::Cs, tool_support::text(arguments, "tag")});
    }
    options.order.push_back({"priority", storage::SortDirection::Asc});
    options.order.push_back({"created_at", storage::SortDirection::Desc});
    options.limit = tool_support::limit(arguments, "limit", 50, 100);

    debug_log::log("list_notes invoked status=" + status);
    std::vector<storage::Row> rows = environment.store.query(options);
    for (auto &row : rows) {
        row["tags"] = formatting::parse_json_array(row["tags"]);
    }

    json result;
    result["notes"] = rows;
    result["count"] = rows.size();
    result["markdown"] = rows.empty()
        ? "_No notes found_\n\n" + formatting::get_watermark(environment.config.watermark)
        : tool_support::markdown_list(rows, formatting::format_note_md, environment.config.watermark);
    return result;
}

namespace tool_list_notes {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"target_article", {{"type", "string"},
                            {"description", "Filter by article ID (use \"backlog\" for unassigned)"}}},
        {"type", {{"type", "string"}, {"enum", {"idea", "angle", "quote", "fact", "todo", "outline"}}}},
        {"status", {{"type", "string"}, {"enum", {"active", "used", "discarded"}},
                    {"description", "Default: active"}}},
        {"tag", {{"type", "string"}, {"description", "Filter by tag"}}},
        {"limit", {{"type", "number"}, {"minimum", 1}, {"maximum", 100},
                   {"description", "Max results (default 50)"}}}
    };

    registry.register_tool({
        "list_notes",
        "List editorial notes with filters. Owner only.",
        input_schema,
        handle_list_notes
    });
}

} // namespace tool_list_notes
