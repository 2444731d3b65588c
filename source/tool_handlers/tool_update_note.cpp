#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolOutcome handle_update_note(const json &arguments,
                                                 const auth::AuthContext *context,
                                                 mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string id = tool_support::text(arguments, "id");
    if (id.empty()) {
        return mcp_errors::bad_request("id is required");
    }

    json patch;
    if (tool_support::has(arguments, "content")) {
        patch["content"] = tool_support::text(arguments, "content");
    }
    if (tool_support::has(arguments, "type")) {
        patch["type"] = tool_support::text(arguments, "type");
    }
    if (tool_support::has(arguments, "status")) {
        patch["status"] = tool_support::text(arguments, "status");
    }
    if (tool_support::has(arguments, "priority")) {
        std::optional<json> priority = tool_support::numeric_value(arguments, "priority");
        if (!priority) {
            return mcp_errors::bad_request("priority must be a number from 1 to 5");
        }
        patch["priority"] = *priority;
    }
    if (tool_support::has(arguments, "tags")) {
        patch["tags"] = tool_support::string_list(arguments, "tags");
    }
    if (tool_support::has(arguments, "target_article")) {
        std::string target = tool_support::text(arguments, "target_article");
        patch["target_article"] = target == "backlog" ? json() : json(target);
    }

    if (patch.empty()) {
        return mcp_errors::bad_request("No fields to update");
    }
    patch["updated_at"] = formatting::iso_timestamp_now();

    debug_log::log("update_note invoked id=" + id);
    std::vector<storage::Row> rows =
        environment.store.update("editorial_notes", {{"id", storage::FilterOp::Eq, id}}, patch);
    if (rows.empty()) {
        return mcp_errors::not_found("Note not found");
    }

    return tool_support::with_message(rows.front(), "Note updated");
}

namespace tool_update_note {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Note id"}}},
        {"content", {{"type", "string"}}},
        {"type", {{"type", "string"}, {"enum", {"idea", "angle", "quote", "fact", "todo", "outline"}}}},
        {"target_article", {{"type", "string"}, {"description", "Article ID or \"backlog\" to unassign"}}},
        {"status", {{"type", "string"}, {"enum", {"active", "used", "discarded"}}}},
        {"priority", {{"type", "number"}, {"minimum", 1}, {"maximum", 5}}},
        {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}
    };
    input_schema["required"] = json::array({"id"});

    registry.register_tool({
        "update_note",
        "Update an editorial note. Owner only.",
        input_schema,
        handle_update_note
    });
}

} // namespace tool_update_note
