#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "clear_notes".
// One note by id, or a batch by article and/or status. A batch is only
// previewed until the call is repeated with confirm: true. Owner only.

static mcp_tools::ToolOutcome handle_clear_notes(const json &arguments,
                                                 const auth::AuthContext *context,
                                                 mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    json result;

    if (tool_support::truthy(arguments, "id")) {
        std::string id = tool_support::text(arguments, "id");
        debug_log::log("clear_notes invoked id=" + id);
        std::vector<storage::Row> deleted =
            environment.store.remove("editorial_notes", {{"id", storage::FilterOp::Eq, id}});
        if (deleted.empty()) {
            return mcp_errors::not_found("Note not found");
        }
        result["deleted"] = 1;
        result["message"] = "Note deleted";
        return result;
    }

    std::vector<storage::Filter> filters;
    if (tool_support::has(arguments, "target_article")) {
        filters.push_back({"target_article", storage::FilterOp::Eq, tool_support::text(arguments, "target_article")});
    }
    if (tool_support::truthy(arguments, "status")) {
        filters.push_back({"status", storage::FilterOp::Eq, tool_support::text(arguments, "status")});
    }
    if (filters.empty()) {
        return mcp_errors::bad_request("Provide id, target_article, or status to specify what to delete");
    }

    int64_t count = environment.store.count("editorial_notes", filters);
    if (count == 0) {
        result["deleted"] = 0;
        result["message"] = "No matching notes found";
        return result;
    }

    if (!formatting::is_truthy(tool_support::field(arguments, "confirm"))) {
        result["preview"] = true;
        result["count"] = count;
        result["message"] = std::to_string(count) +
                            " note(s) will be deleted. Call again with confirm: true to proceed.";
        return result;
    }

    debug_log::log("clear_notes deleting " + std::to_string(count) + " note(s)");
    std::vector<storage::Row> deleted = environment.store.remove("editorial_notes", filters);
    result["deleted"] = deleted.size();
    result["message"] = std::to_string(deleted.size()) + " note(s) cleared.";
    return result;
}

namespace tool_clear_notes {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Delete a single note by id"}}},
        {"target_article", {{"type", "string"}, {"description", "Delete all notes for this article"}}},
        {"status", {{"type", "string"}, {"enum", json::array({"used", "discarded"})},
                    {"description", "Delete all notes with this status"}}},
        {"confirm", {{"type", "boolean"}, {"description", "Confirm batch deletion"}, {"default", false}}}
    };

    registry.register_tool({
        "clear_notes",
        "Delete notes by ID, by article, or batch by status. Batch requires confirm=true. Owner only.",
        input_schema,
        handle_clear_notes
    });
}

} // namespace tool_clear_notes
