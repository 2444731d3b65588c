#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_article".
// Looks an article up by id, or by edition number, and attaches its experts.

static mcp_tools::ToolOutcome handle_get_article(const json &arguments,
                                                 const auth::AuthContext *context,
                                                 mcp_tools::ToolEnvironment &environment) {
    (void)context;

    bool by_id = tool_support::truthy(arguments, "id");
    if (!by_id && !tool_support::has(arguments, "number")) {
        return mcp_errors::bad_request("Provide either id or number");
    }

    storage::QueryOptions options;
    options.table = "articles";
    if (by_id) {
        options.filters.push_back({"id", storage::FilterOp::Eq, tool_support::text(arguments, "id")});
    } else {
        std::optional<json> number = tool_support::numeric_value(arguments, "number");
        if (!number) {
            return mcp_errors::bad_request("number must be numeric");
        }
        options.filters.push_back({"number", storage::FilterOp::Eq, *number});
    }

    debug_log::log("get_article invoked");
    std::optional<storage::Row> article = environment.store.query_one(options);
    if (!article) {
        return mcp_errors::not_found("Article not found");
    }

    std::vector<storage::Row> experts = environment.store.raw(
        "SELECT e.id, e.name, e.affiliation, e.country "
        "FROM experts e "
        "JOIN article_experts ae ON ae.expert_id = e.id "
        "WHERE ae.article_id = ?",
        {(*article)["id"]});

    json result = *article;
    result["experts"] = experts;
    result["experts_count"] = experts.size();
    result["markdown"] = formatting::format_article_md(*article) + "\n\n" +
                         formatting::get_watermark(environment.config.watermark);
    return result;
}

namespace tool_get_article {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Article id"}}},
        {"number", {{"type", "number"}, {"description", "Edition number"}}}
    };

    registry.register_tool({
        "get_article",
        "Get a single article by ID or edition number, including linked experts.",
        input_schema,
        handle_get_article
    });
}

} // namespace tool_get_article
