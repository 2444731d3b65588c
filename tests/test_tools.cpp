// Tests for the tool catalog, calling handlers directly against a seeded
// in-memory database.

#include "auth/auth.hpp"
#include "mcp/mcp_tools.hpp"
#include "test_support.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/formatting.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <variant>

using json = nlohmann::json;
using test_support::check;

namespace test_tools {

struct Fixture {
    std::unique_ptr<storage::SqliteStore> store = test_support::open_memory_store();
    server_config::ServerConfig config;
    mcp_tools::ToolRegistry registry;
    mcp_tools::ToolEnvironment environment{*store, config};
    auth::AuthContext owner{auth::Role::Owner};
    auth::AuthContext visitor{auth::Role::Public};

    Fixture() { tool_handlers::register_all_tools(registry); }

    mcp_tools::ToolOutcome call(const std::string &name, const json &arguments, const auth::AuthContext *context) {
        return registry.find(name)->handler(arguments, context, environment);
    }

    mcp_tools::ToolOutcome call(const std::string &name, const json &arguments = json::object()) {
        return call(name, arguments, &owner);
    }

    storage::Row add_article(const std::string &title, int number, const std::string &status,
                             const json &published_at, int views = 0, double open_rate = 0.0) {
        json row;
        row["title"] = title;
        row["number"] = number;
        row["status"] = status;
        row["published_at"] = published_at;
        row["views"] = views;
        row["open_rate"] = open_rate;
        return store->insert("articles", row);
    }
};

// Code of a failed outcome, or 0 when it succeeded.
static int error_code(const mcp_tools::ToolOutcome &outcome) {
    if (outcome.ok()) {
        return 0;
    }
    return mcp_errors::to_error_object(outcome.error())["code"].get<int>();
}

static bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Test: The full catalog registers with unique names and object schemas.
static bool test_catalog_registration() {
    Fixture fixture;
    std::set<std::string> names;
    bool schemas_ok = true;
    for (const auto &tool : fixture.registry.tools()) {
        names.insert(tool.name);
        schemas_ok = schemas_ok && tool.input_schema["type"] == "object" && !tool.description.empty();
    }
    bool success = fixture.registry.size() == 17 && names.size() == 17 && schemas_ok &&
                   fixture.registry.find("prepare_brief") != nullptr;

    if (success) {
        std::cout << "  OK: 17 tools registered" << std::endl;
    } else {
        std::cout << "  FAIL: " << fixture.registry.size() << " tools registered" << std::endl;
    }
    return success;
}

// Test: list_articles filters, orders newest first with undated last, and clamps the limit.
static bool test_list_articles() {
    Fixture fixture;
    fixture.add_article("Draft idea", 3, "draft", nullptr);
    fixture.add_article("Older", 1, "published", "2026-01-01T08:00:00Z");
    fixture.add_article("Newer", 2, "published", "2026-02-01T08:00:00Z");

    mcp_tools::ToolOutcome all = fixture.call("list_articles", {{"limit", 500}}, nullptr);
    mcp_tools::ToolOutcome published = fixture.call("list_articles", {{"status", "published"}}, nullptr);

    const json &rows = all.value()["articles"];
    bool success = all.ok() && rows.size() == 3 && rows[0]["title"] == "Newer" && rows[2]["title"] == "Draft idea" &&
                   published.value()["count"] == 2 &&
                   ends_with(all.value()["markdown"].get<std::string>(), "---\n_Source: Inkwell MCP_");
    return check(success, "list_articles ordering, filter and watermark");
}

// Test: get_article validates input, reports missing articles and joins experts.
static bool test_get_article() {
    Fixture fixture;
    storage::Row article = fixture.add_article("Funding", 12, "published", "2026-01-05");
    json expert;
    expert["name"] = "Ada Analyst";
    expert["country"] = "FR";
    storage::Row saved_expert = fixture.store->insert("experts", expert);
    json link;
    link["article_id"] = article["id"];
    link["expert_id"] = saved_expert["id"];
    fixture.store->insert("article_experts", link);

    mcp_tools::ToolOutcome by_number = fixture.call("get_article", {{"number", 12}}, nullptr);
    bool success = error_code(fixture.call("get_article", json::object(), nullptr)) == 400 &&
                   error_code(fixture.call("get_article", {{"id", "unknown"}}, nullptr)) == 404 &&
                   by_number.ok() && by_number.value()["title"] == "Funding" &&
                   by_number.value()["experts_count"] == 1 &&
                   by_number.value()["experts"][0]["name"] == "Ada Analyst";
    return check(success, "get_article by number includes linked experts; 400 and 404 paths");
}

// Test: search_articles matches published articles case-insensitively and records the search.
static bool test_search_articles() {
    Fixture fixture;
    fixture.add_article("AI Funding Roundup", 1, "published", "2026-01-01");
    fixture.add_article("ai drafts", 2, "draft", nullptr);

    mcp_tools::ToolOutcome found = fixture.call("search_articles", {{"query", "  funding "}}, nullptr);
    std::vector<storage::Row> logged = fixture.store->raw("SELECT tool_name, query, result_count FROM search_queries");

    bool success = found.ok() && found.value()["count"] == 1 && found.value()["query"] == "funding" &&
                   error_code(fixture.call("search_articles", {{"query", "a"}}, nullptr)) == 400 &&
                   logged.size() == 1 && logged[0]["tool_name"] == "search_articles" &&
                   logged[0]["query"] == "funding" && logged[0]["result_count"] == 1;
    return check(success, "search_articles matches and logs the query");
}

// Test: get_articles_since validates the date and filters by it.
static bool test_get_articles_since() {
    Fixture fixture;
    fixture.add_article("January", 1, "published", "2026-01-15");
    fixture.add_article("March", 2, "published", "2026-03-01");

    mcp_tools::ToolOutcome since = fixture.call("get_articles_since", {{"since_date", "2026-02-01"}}, nullptr);
    bool success = since.ok() && since.value()["count"] == 1 && since.value()["articles"][0]["title"] == "March" &&
                   error_code(fixture.call("get_articles_since", {{"since_date", "last week"}}, nullptr)) == 400;
    return check(success, "get_articles_since filters and rejects non-ISO dates");
}

// Test: Expert lookup upper-cases countries and matches partial names.
static bool test_experts() {
    Fixture fixture;
    json expert;
    expert["name"] = "Grace Hopper";
    expert["country"] = "US";
    expert["tier"] = 1;
    fixture.store->insert("experts", expert);

    mcp_tools::ToolOutcome listed = fixture.call("list_experts", {{"country", "us"}}, nullptr);
    mcp_tools::ToolOutcome found = fixture.call("get_expert", {{"name", "hopper"}}, nullptr);
    bool success = listed.ok() && listed.value()["count"] == 1 && found.ok() &&
                   found.value()["expert"]["name"] == "Grace Hopper" && found.value()["articles_count"] == 0 &&
                   found.value()["markdown"].get<std::string>().find("_No linked articles_") != std::string::npos &&
                   error_code(fixture.call("get_expert", {{"name", "nobody"}}, nullptr)) == 404;
    return check(success, "list_experts and get_expert lookups");
}

// Test: Owner-only tools refuse public and session-less callers.
static bool test_owner_only_tools() {
    Fixture fixture;
    mcp_tools::ToolOutcome as_visitor = fixture.call("add_note", {{"type", "idea"}, {"content", "x"}}, &fixture.visitor);
    mcp_tools::ToolOutcome without_session = fixture.call("get_stats", json::object(), nullptr);

    bool success = !as_visitor.ok() && std::holds_alternative<mcp_errors::AuthError>(as_visitor.error()) &&
                   error_code(without_session) == 403 && fixture.store->count("editorial_notes") == 0 &&
                   fixture.call("list_tags", json::object(), &fixture.visitor).ok();
    return check(success, "Owner-only tools are forbidden for public callers");
}

// Test: Notes can be added, listed, updated and cleared.
static bool test_note_lifecycle() {
    Fixture fixture;
    storage::Row article = fixture.add_article("Next issue", 5, "draft", nullptr);
    std::string article_id = article["id"].get<std::string>();

    mcp_tools::ToolOutcome backlog = fixture.call("add_note", {{"type", "idea"}, {"content", "Backlog idea"},
                                                               {"tags", json::array({"ai", "funding"})}});
    mcp_tools::ToolOutcome targeted = fixture.call("add_note", {{"type", "quote"}, {"content", "A quote"},
                                                                {"target_article", article_id}, {"priority", 1}});
    bool all_passed = check(backlog.ok() && backlog.value()["message"] == "Note added to backlog" && targeted.ok() &&
                                targeted.value()["message"] == "Note added for article " + article_id,
                            "add_note reports backlog or target article");

    all_passed &= check(error_code(fixture.call("add_note", {{"type", "rumor"}, {"content", "x"}})) == 400,
                        "add_note rejects unknown note types");

    mcp_tools::ToolOutcome listed = fixture.call("list_notes", {{"target_article", "backlog"}});
    mcp_tools::ToolOutcome tagged = fixture.call("list_notes", {{"tag", "funding"}});
    mcp_tools::ToolOutcome everything = fixture.call("list_notes");
    all_passed &= check(listed.ok() && listed.value()["count"] == 1 &&
                            listed.value()["notes"][0]["tags"] == json::array({"ai", "funding"}) &&
                            tagged.value()["count"] == 1 && everything.value()["notes"][0]["priority"] == 1,
                        "list_notes filters backlog and tags, decodes tags, orders by priority");

    std::string note_id = backlog.value()["id"].get<std::string>();
    all_passed &= check(error_code(fixture.call("update_note", {{"id", note_id}})) == 400 &&
                            error_code(fixture.call("update_note", {{"id", "missing"}, {"content", "y"}})) == 404,
                        "update_note rejects empty patches and unknown ids");

    mcp_tools::ToolOutcome updated = fixture.call("update_note", {{"id", note_id}, {"status", "used"},
                                                                  {"target_article", article_id}});
    all_passed &= check(updated.ok() && updated.value()["status"] == "used" &&
                            updated.value()["target_article"] == article_id,
                        "update_note applies the patch");

    mcp_tools::ToolOutcome preview = fixture.call("clear_notes", {{"status", "used"}});
    all_passed &= check(preview.ok() && preview.value()["preview"] == true && preview.value()["count"] == 1 &&
                            fixture.store->count("editorial_notes") == 2,
                        "clear_notes previews a batch without deleting");

    mcp_tools::ToolOutcome cleared = fixture.call("clear_notes", {{"status", "used"}, {"confirm", true}});
    all_passed &= check(cleared.ok() && cleared.value()["deleted"] == 1 &&
                            fixture.store->count("editorial_notes") == 1 &&
                            error_code(fixture.call("clear_notes", json::object())) == 400,
                        "clear_notes deletes a confirmed batch");
    return all_passed;
}

// Test: Sources deduplicate by URL and track usage and deactivation.
static bool test_source_lifecycle() {
    Fixture fixture;
    storage::Row article = fixture.add_article("Edition", 9, "published", "2026-01-09");
    std::string article_id = article["id"].get<std::string>();

    json source = {{"url", "https://example.com/report"}, {"title", "Market report"},
                   {"published_date", "2026-01-02"}, {"description", "Good numbers"}};
    mcp_tools::ToolOutcome saved = fixture.call("save_source", source);
    mcp_tools::ToolOutcome again = fixture.call("save_source", source);
    std::string source_id = saved.value()["id"].get<std::string>();

    bool all_passed = check(saved.ok() && again.value()["duplicate"] == true &&
                                again.value()["existing_id"] == source_id,
                            "save_source deduplicates by URL");

    fixture.call("save_source", {{"url", "https://example.com/other"}, {"title", "Other"}});
    mcp_tools::ToolOutcome marked = fixture.call("mark_source_used", {{"id", source_id}, {"article_id", article_id}});
    mcp_tools::ToolOutcome used = fixture.call("list_sources", {{"used", true}});
    mcp_tools::ToolOutcome unused = fixture.call("list_sources", {{"used", false}, {"status", "active"}});
    all_passed &= check(marked.ok() && marked.value()["used_in_article"] == article_id &&
                            used.value()["count"] == 1 && unused.value()["count"] == 1 &&
                            unused.value()["sources"][0]["title"] == "Other",
                        "mark_source_used and the used filter");

    mcp_tools::ToolOutcome deactivated = fixture.call("deactivate_source", {{"id", source_id}, {"reason", "paywalled"}});
    all_passed &= check(deactivated.ok() && deactivated.value()["status"] == "inactive" &&
                            deactivated.value()["description"] == "Good numbers\n[DEACTIVATED: paywalled]" &&
                            error_code(fixture.call("deactivate_source", {{"id", "missing"}})) == 404,
                        "deactivate_source keeps the row and appends the reason");
    return all_passed;
}

// Test: prepare_brief groups notes by type and splits sources by state.
static bool test_prepare_brief() {
    Fixture fixture;
    storage::Row article = fixture.add_article("Brief target", 21, "draft", nullptr);
    std::string article_id = article["id"].get<std::string>();

    fixture.call("add_note", {{"type", "idea"}, {"content", "For this issue"}, {"target_article", article_id}});
    fixture.call("add_note", {{"type", "fact"}, {"content", "From the backlog"}});
    fixture.call("save_source", {{"url", "https://a.example"}, {"title", "A"}, {"target_article", article_id}});
    fixture.call("save_source", {{"url", "https://b.example"}, {"title", "B"}});

    mcp_tools::ToolOutcome brief = fixture.call("prepare_brief", {{"target_article", article_id}});
    mcp_tools::ToolOutcome focused = fixture.call("prepare_brief", {{"target_article", article_id},
                                                                   {"include_backlog", false}});

    bool success = brief.ok() && brief.value()["article_label"] == "#21 Brief target" &&
                   brief.value()["notes_count"] == 2 && brief.value()["notes_by_type"]["fact"] == 1 &&
                   brief.value()["sources_active_unused"] == 2 &&
                   brief.value()["markdown"].get<std::string>().find("From the backlog _(backlog)_") != std::string::npos &&
                   focused.value()["notes_count"] == 1 && focused.value()["sources_active_unused"] == 1;
    return check(success, "prepare_brief aggregates notes and sources");
}

// Test: get_stats aggregates published articles and rounds the open rate.
static bool test_get_stats() {
    Fixture fixture;
    fixture.add_article("One", 1, "published", "2026-01-01", 100, 30.0);
    fixture.add_article("Two", 2, "published", "2026-01-08", 300, 40.0);
    fixture.add_article("Three", 3, "published", "2026-01-15", 200, 51.0);
    fixture.add_article("Draft", 4, "draft", nullptr, 999, 99.0);

    mcp_tools::ToolOutcome stats = fixture.call("get_stats");
    const json &value = stats.value();
    bool success = stats.ok() && value["total_articles"] == 4 && value["published"] == 3 && value["draft"] == 1 &&
                   value["total_views"] == 600 && value["avg_open_rate"] == 40.3 &&
                   value["top_5_by_views"].size() == 3 && value["top_5_by_views"][0]["title"] == "Two" &&
                   value["active_notes"] == 0;
    return check(success, "get_stats counts, sums and rounds");
}

// Test: One-decimal rounding is half away from zero on the scaled value.
static bool test_round_one_decimal() {
    bool success = formatting::round_one_decimal(2.25) == 2.3 && formatting::round_one_decimal(-2.25) == -2.3 &&
                   formatting::round_one_decimal(40.0 + 1.0 / 3.0) == 40.3 &&
                   formatting::round_one_decimal(12.345) == 12.3 &&
                   formatting::round_one_decimal(0.0) == 0.0;
    return check(success, "round_one_decimal");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_catalog_registration();
    all_passed &= test_list_articles();
    all_passed &= test_get_article();
    all_passed &= test_search_articles();
    all_passed &= test_get_articles_since();
    all_passed &= test_experts();
    all_passed &= test_owner_only_tools();
    all_passed &= test_note_lifecycle();
    all_passed &= test_source_lifecycle();
    all_passed &= test_prepare_brief();
    all_passed &= test_get_stats();
    all_passed &= test_round_one_decimal();
    return all_passed;
}

} // namespace test_tools
