#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "add_note".
// Notes without a target article go to the backlog. Owner only.

static const char *const kNoteTypes[] = {"idea", "angle", "quote", "fact", "todo", "outline"};

static mcp_tools::ToolOutcome handle_add_note(const json &arguments,
                                              const auth::AuthContext *context,
                                              mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string type = tool_support::text(arguments, "type");
    if (std::find(std::begin(kNoteTypes), std::end(kNoteTypes), type) == std::end(kNoteTypes)) {
        return mcp_errors::bad_request("type must be one of idea, angle, quote, fact, todo, outline");
    }
    std::string content = tool_support::text(arguments, "content");
    if (content.empty()) {
        return mcp_errors::bad_request("content is required");
    }

    json note;
    note["type"] = type;
    note["content"] = content;
    note["target_article"] = tool_support::truthy(arguments, "target_article")
        ? json(tool_support::text(arguments, "target_article")) : json();
    note["tags"] = tool_support::string_list(arguments, "tags");
    std::optional<json> priority = tool_support::numeric_value(arguments, "priority");
    note["priority"] = priority ? *priority : json(3);
    note["status"] = "active";

    debug_log::log("add_note invoked type=" + type);
    storage::Row saved = environment.store.insert("editorial_notes", note);

    std::string message = tool_support::truthy(saved, "target_article")
        ? "Note added for article " + tool_support::text(saved, "target_article")
        : "Note added to backlog";
    return tool_support::with_message(saved, message);
}

namespace tool_add_note {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"type", {{"type", "string"}, {"description", "Note type"},
                  {"enum", {"idea", "angle", "quote", "fact", "todo", "outline"}}}},
        {"content", {{"type", "string"}, {"description", "Note content"}, {"minLength", 1}}},
        {"target_article", {{"type", "string"}, {"description", "Target article ID (omit for backlog)"}}},
        {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "Tags for filtering"}}},
        {"priority", {{"type", "number"}, {"minimum", 1}, {"maximum", 5},
                      {"description", "Priority 1-5 (default 3)"}}}
    };
    input_schema["required"] = json::array({"type", "content"});

    registry.register_tool({
        "add_note",
        "Add an editorial note (idea, angle, quote, fact, todo, outline) for an article or backlog. Owner only.",
        input_schema,
        handle_add_note
    });
}

} // namespace tool_add_note
