#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "save_source".
// A URL is stored once; saving it again reports the existing source. Owner only.

// The argument as text, or null when it is absent or empty.
static json text_or_null(const json &arguments, const char *key) {
    return tool_support::truthy(arguments, key) ? json(tool_support::text(arguments, key)) : json();
}

static mcp_tools::ToolOutcome handle_save_source(const json &arguments,
                                                 const auth::AuthContext *context,
                                                 mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string url = tool_support::trim(tool_support::text(arguments, "url"));
    std::string title = tool_support::trim(tool_support::text(arguments, "title"));
    if (url.empty() || title.empty()) {
        return mcp_errors::bad_request("url and title are required");
    }

    storage::QueryOptions lookup;
    lookup.table = "editorial_sources";
    lookup.filters.push_back({"url", storage::FilterOp::Eq, url});
    std::optional<storage::Row> existing = environment.store.query_one(lookup);

    json result;
    if (existing) {
        debug_log::log("save_source duplicate url=" + url);
        result["duplicate"] = true;
        result["existing_id"] = (*existing)["id"];
        result["existing_title"] = (*existing)["title"];
        result["message"] = "This URL already exists in editorial sources";
        return result;
    }

    json source;
    source["url"] = url;
    source["title"] = title;
    source["published_date"] = text_or_null(arguments, "published_date");
    source["target_article"] = text_or_null(arguments, "target_article");
    source["type"] = text_or_null(arguments, "type");
    source["description"] = text_or_null(arguments, "description");
    source["key_quotes"] = text_or_null(arguments, "key_quotes");
    source["status"] = "active";

    debug_log::log("save_source invoked url=" + url);
    storage::Row saved = environment.store.insert("editorial_sources", source);

    std::string message = "Source saved";
    if (tool_support::truthy(saved, "target_article")) {
        message += " for article " + tool_support::text(saved, "target_article");
    }
    return tool_support::with_message(saved, message);
}

namespace tool_save_source {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"url", {{"type", "string"}, {"description", "Full URL of the source"}}},
        {"title", {{"type", "string"}, {"description", "Source title"}, {"minLength", 1}}},
        {"published_date", {{"type", "string"}, {"description", "Publication date YYYY-MM-DD"}}},
        {"target_article", {{"type", "string"}, {"description", "Target article ID"}}},
        {"type", {{"type", "string"},
                  {"enum", {"article", "report", "dataset", "interview", "video", "podcast", "social", "other"}}}},
        {"description", {{"type", "string"}, {"description", "Relevance notes"}}},
        {"key_quotes", {{"type", "string"}, {"description", "Notable quotes"}}}
    };
    input_schema["required"] = json::array({"url", "title"});

    registry.register_tool({
        "save_source",
        "Save a dated editorial source for research. Deduplicates by URL. Owner only.",
        input_schema,
        handle_save_source
    });
}

} // namespace tool_save_source
