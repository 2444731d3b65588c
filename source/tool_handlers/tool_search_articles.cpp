#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "search_articles".
// Case-insensitive substring match over title, subtitle and editorial angle of
// published articles. Every search is recorded in search_queries.

static void record_search(storage::SqliteStore &store, const std::string &query, size_t result_count) {
    try {
        json entry;
        entry["tool_name"] = "search_articles";
        entry["query"] = query;
        entry["result_count"] = result_count;
        store.insert("search_queries", entry);
    } catch (const storage::StorageError &error) {
        debug_log::log(std::string("Could not record search query: ") + error.what());
    }
}

static mcp_tools::ToolOutcome handle_search_articles(const json &arguments,
                                                     const auth::AuthContext *context,
                                                     mcp_tools::ToolEnvironment &environment) {
    (void)context;

    std::string query = tool_support::trim(tool_support::text(arguments, "query"));
    if (query.size() < 2) {
        return mcp_errors::bad_request("query must be at least 2 characters");
    }
    int64_t limit = tool_support::limit(arguments, "limit", 10, 30);

    debug_log::log("search_articles invoked query=" + query);
    std::vector<storage::Row> rows = environment.store.raw(
        "SELECT id, number, title, subtitle, status, type, published_at, views, substack_url, editorial_angle "
        "FROM articles "
        "WHERE status = 'published' "
        "AND (title LIKE ?1 COLLATE NOCASE OR subtitle LIKE ?1 COLLATE NOCASE "
        "OR editorial_angle LIKE ?1 COLLATE NOCASE) "
        "ORDER BY published_at DESC "
        "LIMIT ?2",
        {"%" + query + "%", limit});

    record_search(environment.store, query, rows.size());

    json result;
    result["query"] = query;
    result["articles"] = rows;
    result["count"] = rows.size();
    result["markdown"] = tool_support::markdown_list(rows, formatting::format_article_md, environment.config.watermark);
    return result;
}

namespace tool_search_articles {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"query", {{"type", "string"}, {"description", "Search terms"}, {"minLength", 2}}},
        {"limit", {{"type", "number"}, {"description", "Max results (default 10, max 30)"},
                   {"minimum", 1}, {"maximum", 30}}}
    };
    input_schema["required"] = json::array({"query"});

    registry.register_tool({
        "search_articles",
        "Full-text search across articles (title, subtitle, editorial_angle). Returns matching articles.",
        input_schema,
        handle_search_articles
    });
}

} // namespace tool_search_articles
