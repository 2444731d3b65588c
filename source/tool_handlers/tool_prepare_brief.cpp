#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_support.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/formatting.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <set>
#include <utility>

using json = nlohmann::json;

// Tool handler for "prepare_brief".
// Collects the active notes and the sources for one article (plus the backlog
// unless include_backlog is false) into a writing brief. Owner only.

// Notes grouped by type, in order of first appearance.
using NoteGroups = std::vector<std::pair<std::string, std::vector<storage::Row>>>;

static NoteGroups group_notes_by_type(const std::vector<storage::Row> &notes) {
    NoteGroups groups;
    for (const auto &note : notes) {
        std::string type = tool_support::text(note, "type");
        auto group = groups.begin();
        while (group != groups.end() && group->first != type) {
            ++group;
        }
        if (group == groups.end()) {
            groups.push_back({type, {}});
            group = groups.end() - 1;
        }
        group->second.push_back(note);
    }
    return groups;
}

static std::string backlog_marker(const json &row) {
    return tool_support::field(row, "target_article").is_null() ? " _(backlog)_" : "";
}

static std::string heading_for_type(std::string type) {
    if (!type.empty()) {
        type[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(type[0])));
    }
    return "### " + type + "s";
}

static mcp_tools::ToolOutcome handle_prepare_brief(const json &arguments,
                                                   const auth::AuthContext *context,
                                                   mcp_tools::ToolEnvironment &environment) {
    if (!auth::is_owner(context)) {
        return mcp_errors::forbidden();
    }

    std::string article_id = tool_support::text(arguments, "target_article");
    if (article_id.empty()) {
        return mcp_errors::bad_request("target_article is required");
    }
    const json &include_backlog_argument = tool_support::field(arguments, "include_backlog");
    bool include_backlog = !(include_backlog_argument.is_boolean() && !include_backlog_argument.get<bool>());

    debug_log::log("prepare_brief invoked article=" + article_id);
    storage::SqliteStore &store = environment.store;

    storage::QueryOptions article_query;
    article_query.table = "articles";
    article_query.select = {"id", "title", "number"};
    article_query.filters.push_back({"id", storage::FilterOp::Eq, article_id});
    std::optional<storage::Row> article = store.query_one(article_query);

    std::string article_label = article_id;
    if (article) {
        article_label = tool_support::truthy(*article, "number")
            ? "#" + tool_support::text(*article, "number") + " " + tool_support::text(*article, "title")
            : tool_support::text(*article, "title");
    }

    std::vector<storage::Row> notes;
    if (include_backlog) {
        notes = store.raw(
            "SELECT * FROM editorial_notes "
            "WHERE status = 'active' AND (target_article = ? OR target_article IS NULL) "
            "ORDER BY priority ASC, type ASC",
            {article_id});
    } else {
        storage::QueryOptions note_query;
        note_query.table = "editorial_notes";
        note_query.filters = {
            {"target_article", storage::FilterOp::Eq, article_id},
            {"status", storage::FilterOp::Eq, "active"},
        };
        note_query.order = {{"priority", storage::SortDirection::Asc}, {"type", storage::SortDirection::Asc}};
        notes = store.query(note_query);
    }

    storage::QueryOptions source_query;
    source_query.table = "editorial_sources";
    source_query.filters.push_back({"target_article", storage::FilterOp::Eq, article_id});
    source_query.order.push_back({"published_date", storage::SortDirection::Desc, storage::NullPlacement::Last});
    std::vector<storage::Row> sources = store.query(source_query);

    if (include_backlog) {
        std::set<std::string> seen_ids;
        for (const auto &source : sources) {
            seen_ids.insert(tool_support::text(source, "id"));
        }
        std::vector<storage::Row> backlog_sources = store.raw(
            "SELECT * FROM editorial_sources WHERE target_article IS NULL AND status = 'active' "
            "ORDER BY published_date DESC");
        for (const auto &source : backlog_sources) {
            if (seen_ids.insert(tool_support::text(source, "id")).second) {
                sources.push_back(source);
            }
        }
    }

    std::vector<storage::Row> active_unused;
    std::vector<storage::Row> used;
    std::vector<storage::Row> inactive;
    for (const auto &source : sources) {
        bool is_used = !tool_support::field(source, "used_in_article").is_null();
        std::string status = tool_support::text(source, "status");
        if (status == "active" && !tool_support::truthy(source, "used_in_article")) {
            active_unused.push_back(source);
        }
        if (is_used) {
            used.push_back(source);
        }
        if (status == "inactive") {
            inactive.push_back(source);
        }
    }

    NoteGroups notes_by_type = group_notes_by_type(notes);

    std::string markdown = "# Brief: " + article_label + "\n\n## Notes";
    if (notes.empty()) {
        markdown += "\n_No notes for this article_";
    }
    for (const auto &group : notes_by_type) {
        markdown += "\n\n" + heading_for_type(group.first);
        for (const auto &note : group.second) {
            markdown += "\n- P" + tool_support::text(note, "priority") + " | " +
                        tool_support::text(note, "content") + backlog_marker(note);
        }
    }

    markdown += "\n\n## Sources: Active & Unused";
    if (active_unused.empty()) {
        markdown += "\n_No unused sources_";
    }
    for (const auto &source : active_unused) {
        std::string date = tool_support::has(source, "published_date") ? tool_support::text(source, "published_date") : "?";
        markdown += "\n- " + tool_support::text(source, "title") + " (" + date + ")" + backlog_marker(source) +
                    "\n  " + tool_support::text(source, "url");
    }

    if (!used.empty()) {
        markdown += "\n\n## Sources: Already Used";
        for (const auto &source : used) {
            markdown += "\n- ~~" + tool_support::text(source, "title") + "~~ - used in " +
                        tool_support::text(source, "used_in_article") + "\n  " + tool_support::text(source, "url");
        }
    }

    if (!inactive.empty()) {
        markdown += "\n\n## Sources: Inactive";
        for (const auto &source : inactive) {
            markdown += "\n- ~~" + tool_support::text(source, "title") + "~~ - inactive\n  " +
                        tool_support::text(source, "url");
        }
    }

    markdown += "\n\n" + formatting::get_watermark(environment.config.watermark);

    json type_counts = json::object();
    for (const auto &group : notes_by_type) {
        type_counts[group.first] = group.second.size();
    }

    json result;
    result["target_article"] = article_id;
    result["article_label"] = article_label;
    result["notes_count"] = notes.size();
    result["notes_by_type"] = type_counts;
    result["sources_active_unused"] = active_unused.size();
    result["sources_used"] = used.size();
    result["sources_inactive"] = inactive.size();
    result["markdown"] = markdown;
    return result;
}

namespace tool_prepare_brief {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = {
        {"target_article", {{"type", "string"}, {"description", "Article ID to prepare the brief for"}}},
        {"include_backlog", {{"type", "boolean"}, {"description", "Include backlog notes (default true)"},
                             {"default", true}}}
    };
    input_schema["required"] = json::array({"target_article"});

    registry.register_tool({
        "prepare_brief",
        "Generate an article preparation brief: aggregated notes + sources, organized by type and status. "
        "Owner only.",
        input_schema,
        handle_prepare_brief
    });
}

} // namespace tool_prepare_brief
