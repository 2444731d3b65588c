#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_stats".
// Views and open rate are aggregated over published articles only. Owner only.

// A numeric column as a double; anything that is not a number counts as 0.
static double numeric_column(const json &row, const char *key) {
    const json &value = tool_support::field(row, key);
    return value.is_number() ? value.get<double>() : 0.0;
}

static mcp_tools::ToolOutcome handle_get_stats(const json &arguments,
                                               const auth::AuthContext *context,
                                               mcp_tools::ToolEnvironment &environment) {
    (void)arguments;
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    debug_log::log("get_stats invoked");
    storage::SqliteStore &store = environment.store;

    std::vector<storage::Row> all_articles = store.raw("SELECT id, views, open_rate, status FROM articles");
    std::vector<storage::Row> top_articles = store.raw(
        "SELECT id, title, number, views, substack_url FROM articles WHERE status = ? ORDER BY views DESC LIMIT 5",
        {"published"});

    int64_t published = 0;
    int64_t draft = 0;
    int64_t archived = 0;
    int64_t total_views = 0;
    double open_rate_sum = 0.0;
    for (const auto &article : all_articles) {
        std::string status = tool_support::text(article, "status");
        if (status == "published") {
            ++published;
            total_views += static_cast<int64_t>(numeric_column(article, "views"));
            open_rate_sum += numeric_column(article, "open_rate");
        } else if (status == "draft") {
            ++draft;
        } else if (status == "archived") {
            ++archived;
        }
    }
    double average_open_rate = published > 0 ? open_rate_sum / static_cast<double>(published) : 0.0;

    json result;
    result["total_articles"] = all_articles.size();
    result["published"] = published;
    result["draft"] = draft;
    result["archived"] = archived;
    result["total_views"] = total_views;
    result["avg_open_rate"] = formatting::round_one_decimal(average_open_rate);
    result["top_5_by_views"] = top_articles;
    result["active_notes"] = store.count("editorial_notes", {{"status", storage::FilterOp::Eq, "active"}});
    result["active_sources"] = store.count("editorial_sources", {{"status", storage::FilterOp::Eq, "active"}});
    return result;
}

namespace tool_get_stats {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    registry.register_tool({
        "get_stats",
        "Get aggregate newsletter statistics: article counts, engagement, top articles. Owner only.",
        input_schema,
        handle_get_stats
    });
}

} // namespace tool_get_stats
