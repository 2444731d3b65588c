#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Starts with YYYY-MM-DD. Anything may follow (a time, a zone).
static bool starts_with_iso_date(const std::string &text) {
    static const char pattern[] = "dddd-dd-dd";
    if (text.size() < sizeof(pattern) - 1) {
        return false;
    }
    for (size_t index = 0; index < sizeof(pattern) - 1; ++index) {
        bool digit = std::isdigit(static_cast<unsigned char>(text[index])) != 0;
        if (pattern[index] == 'd' ? !digit : text[index] != '-') {
            return false;
        }
    }
    return true;
}

static mcp_tools::ToolOutcome handle_get_articles_since(const json &arguments,
                                                        const auth::AuthContext *context,
                                                        mcp_tools::ToolEnvironment &environment) {
    (void)context;

    std::string since = tool_support::trim(tool_support::text(arguments, "since_date"));
    if (!starts_with_iso_date(since)) {
        return mcp_errors::bad_request("since_date must be ISO 8601 (e.g. \"2026-02-01\")");
    }
    int64_t limit = tool_support::limit(arguments, "limit", 20, 50);

    storage::QueryOptions options;
    options.table = "articles";
    options.select = {"id", "number", "title", "subtitle", "type", "published_at",
                      "views", "open_rate", "substack_url", "editorial_angle"};
    options.filters = {
        {"status", storage::FilterOp::Eq, "published"},
        {"published_at", storage::FilterOp::Gte, since},
    };
    options.order.push_back({"published_at", storage::SortDirection::Desc});
    options.limit = limit;

    debug_log::log("get_articles_since invoked since=" + since);
    std::vector<storage::Row> rows = environment.store.query(options);

    json result;
    result["since_date"] = since;
    result["articles"] = rows;
    result["count"] = rows.size();
    result["markdown"] = tool_support::markdown_list(rows, formatting::format_article_md, environment.config.watermark);
    return result;
}

namespace tool_get_articles_since {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"since_date", {{"type", "string"}, {"description", "ISO 8601 date (e.g. \"2026-02-01\")"}}},
        {"limit", {{"type", "number"}, {"description", "Max results (default 20, max 50)"},
                   {"minimum", 1}, {"maximum", 50}}}
    };
    input_schema["required"] = json::array({"since_date"});

    registry.register_tool({
        "get_articles_since",
        "Get articles published since a given date.",
        input_schema,
        handle_get_articles_since
    });
}

} // namespace tool_get_articles_since
