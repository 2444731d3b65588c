#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "deactivate_source".
// Marks the source inactive and keeps it. A reason is appended to its description.

static mcp_tools::ToolOutcome handle_deactivate_source(const json &arguments,
                                                       const auth::AuthContext *context,
                                                       mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string id = tool_support::text(arguments, "id");
    if (id.empty()) {
        return mcp_errors::bad_request("id is required");
    }

    std::vector<storage::Filter> by_id = {{"id", storage::FilterOp::Eq, id}};

    storage::QueryOptions lookup;
    lookup.table = "editorial_sources";
    lookup.filters = by_id;
    std::optional<storage::Row> existing = environment.store.query_one(lookup);
    if (!existing) {
        return mcp_errors::not_found("Source not found");
    }

    json patch;
    patch["status"] = "inactive";
    patch["updated_at"] = formatting::iso_timestamp_now();
    if (tool_support::truthy(arguments, "reason")) {
        std::string marker = "[DEACTIVATED: " + tool_support::text(arguments, "reason") + "]";
        std::string previous = tool_support::text(*existing, "description");
        patch["description"] = previous.empty() ? marker : previous + "\n" + marker;
    }

    debug_log::log("deactivate_source invoked id=" + id);
    std::vector<storage::Row> rows = environment.store.update("editorial_sources", by_id, patch);
    if (rows.empty()) {
        return mcp_errors::not_found("Source not found");
    }

    return tool_support::with_message(rows.front(),
                                      "Source deactivated: " + tool_support::text(*existing, "title"));
}

namespace tool_deactivate_source {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Source id"}}},
        {"reason", {{"type", "string"}, {"description", "Reason for deactivation"}}}
    };
    input_schema["required"] = json::array({"id"});

    registry.register_tool({
        "deactivate_source",
        "Mark an editorial source as inactive. Does not delete. Owner only.",
        input_schema,
        handle_deactivate_source
    });
}

} // namespace tool_deactivate_source
