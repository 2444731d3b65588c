#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static mcp_tools::ToolOutcome handle_list_experts(const json &arguments,
                                                  const auth::AuthContext *context,
                                                  mcp_tools::ToolEnvironment &environment) {
    (void)context;

    storage::QueryOptions options;
    options.table = "experts";
    options.select = {"id", "name", "affiliation", "expertise", "country", "tier", "times_cited"};

    if (tool_support::has(arguments, "tier")) {
        std::optional<json> tier = tool_support::numeric_value(arguments, "tier");
        if (!tier) {
            return mcp_errors::bad_request("tier must be 1, 2 or 3");
        }
        options.filters.push_back({"tier", storage::FilterOp::Eq, *tier});
    }
    if (tool_support::truthy(arguments, "country")) {
        std::string country = tool_support::text(arguments, "country");
        for (auto &character : country) {
            character = static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
        }
        options.filters.push_back({"country", storage::FilterOp::Eq, country});
    }
    options.order.push_back({"times_cited", storage::SortDirection::Desc});
    options.limit = tool_support::limit(arguments, "limit", 20, 50);

    debug_log::log("list_experts invoked");
    std::vector<storage::Row> rows = environment.store.query(options);

    json result;
    result["experts"] = rows;
    result["count"] = rows.size();
    return result;
}

namespace tool_list_experts {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"tier", {{"type", "number"}, {"description", "Expert tier (1=top, 2=mid, 3=emerging)"},
                  {"enum", {1, 2, 3}}}},
        {"country", {{"type", "string"}, {"description", "ISO country code (e.g. \"US\", \"FR\")"}}},
        {"limit", {{"type", "number"}, {"description", "Max results (default 20, max 50)"},
                   {"minimum", 1}, {"maximum", 50}}}
    };

    registry.register_tool({
        "list_experts",
        "List experts cited in the newsletter with optional filters by tier or country.",
        input_schema,
        handle_list_experts
    });
}

} // namespace tool_list_experts
