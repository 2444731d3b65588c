#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolOutcome handle_mark_source_used(const json &arguments,
                                                      const auth::AuthContext *context,
                                                      mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string id = tool_support::text(arguments, "id");
    std::string article_id = tool_support::text(arguments, "article_id");
    if (id.empty() || article_id.empty()) {
        return mcp_errors::bad_request("id and article_id are required");
    }

    std::string now = formatting::iso_timestamp_now();
    json patch;
    patch["used_in_article"] = article_id;
    patch["used_at"] = now;
    patch["updated_at"] = now;

    debug_log::log("mark_source_used invoked id=" + id);
    std::vector<storage::Row> rows =
        environment.store.update("editorial_sources", {{"id", storage::FilterOp::Eq, id}}, patch);
    if (rows.empty()) {
        return mcp_errors::not_found("Source not found");
    }

    json result;
    result["id"] = rows.front()["id"];
    result["title"] = rows.front()["title"];
    result["used_in_article"] = article_id;
    result["message"] = "Source marked as used";
    return result;
}

namespace tool_mark_source_used {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Source id"}}},
        {"article_id", {{"type", "string"}, {"description", "Article ID where the source was used"}}}
    };
    input_schema["required"] = json::array({"id", "article_id"});

    registry.register_tool({
        "mark_source_used",
        "Mark an editorial source as used in a specific article. Owner only.",
        input_schema,
        handle_mark_source_used
    });
}

} // namespace tool_mark_source_used
