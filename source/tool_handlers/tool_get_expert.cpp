#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_expert".
// By id, or by the first expert whose name contains the given text (any case).

static std::string expert_markdown(const json &expert, const std::vector<storage::Row> &articles,
                                   const std::string &watermark_text) {
    std::string markdown = "## " + formatting::text_of(tool_support::field(expert, "name")) + "\n";
    if (tool_support::truthy(expert, "affiliation")) {
        markdown += "_" + tool_support::text(expert, "affiliation") + "_";
    }
    if (tool_support::truthy(expert, "country")) {
        markdown += " (" + tool_support::text(expert, "country") + ")";
    }

    markdown += "\n\n### Articles (" + std::to_string(articles.size()) + ")\n";
    if (articles.empty()) {
        markdown += "_No linked articles_";
    }
    for (size_t index = 0; index < articles.size(); ++index) {
        if (index > 0) {
            markdown += "\n";
        }
        markdown += formatting::format_article_md(articles[index]);
    }

    return markdown + "\n\n" + formatting::get_watermark(watermark_text);
}

static mcp_tools::ToolOutcome handle_get_expert(const json &arguments,
                                                const auth::AuthContext *context,
                                                mcp_tools::ToolEnvironment &environment) {
    (void)context;

    bool by_id = tool_support::truthy(arguments, "id");
    if (!by_id && !tool_support::truthy(arguments, "name")) {
        return mcp_errors::bad_request("Provide either id or name");
    }

    storage::QueryOptions options;
    options.table = "experts";
    if (by_id) {
        options.filters.push_back({"id", storage::FilterOp::Eq, tool_support::text(arguments, "id")});
    } else {
        std::string name = tool_support::trim(tool_support::text(arguments, "name"));
        options.filters.push_back({"name", storage::FilterOp::Ilike, "%" + name + "%"});
    }

    debug_log::log("get_expert invoked");
    std::optional<storage::Row> expert = environment.store.query_one(options);
    if (!expert) {
        return mcp_errors::not_found("Expert not found");
    }

    std::vector<storage::Row> articles = environment.store.raw(
        "SELECT a.id, a.title, a.published_at, a.substack_url, a.editorial_angle, a.number, a.type "
        "FROM articles a "
        "JOIN article_experts ae ON ae.article_id = a.id "
        "WHERE ae.expert_id = ?",
        {(*expert)["id"]});

    json result;
    result["expert"] = *expert;
    result["articles"] = articles;
    result["articles_count"] = articles.size();
    result["markdown"] = expert_markdown(*expert, articles, environment.config.watermark);
    return result;
}

namespace tool_get_expert {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"id", {{"type", "string"}, {"description", "Expert id"}}},
        {"name", {{"type", "string"}, {"description", "Expert name (partial match)"}}}
    };

    registry.register_tool({
        "get_expert",
        "Get a single expert by ID or name (partial match), including linked articles.",
        input_schema,
        handle_get_expert
    });
}

} // namespace tool_get_expert
