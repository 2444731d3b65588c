// Tests for the SQL compiler: exact statement text and bound parameters for
// declarative queries, without touching a database.

#include "storage/query_builder.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_support::check;

namespace test_query_builder {

using storage::Filter;
using storage::FilterOp;

// Test: A full query compiles filters, ordering and paging in that order.
static bool test_select_with_every_clause() {
    storage::QueryOptions options;
    options.table = "articles";
    options.select = {"id", "title"};
    options.filters = {{"status", FilterOp::Eq, "published"}, {"views", FilterOp::Gte, 100}};
    options.order = {{"published_at", storage::SortDirection::Desc, storage::NullPlacement::Last},
                     {"number", storage::SortDirection::Asc}};
    options.limit = 20;
    options.offset = 40;

    query_builder::CompiledSql compiled = query_builder::compile_select(options);
    bool success = compiled.sql ==
                       "SELECT id, title FROM articles WHERE status = ? AND views >= ? "
                       "ORDER BY published_at DESC NULLS LAST, number ASC LIMIT ? OFFSET ?" &&
                   compiled.params == std::vector<json>{"published", 100, 20, 40};

    if (success) {
        std::cout << "  OK: Full select compiles with bound paging" << std::endl;
    } else {
        std::cout << "  FAIL: Got SQL: " << compiled.sql << std::endl;
    }
    return success;
}

// Test: A bare query selects every column with no trailing clauses.
static bool test_select_without_clauses() {
    storage::QueryOptions options;
    options.table = "tags";
    query_builder::CompiledSql compiled = query_builder::compile_select(options);
    return check(compiled.sql == "SELECT * FROM tags" && compiled.params.empty(),
                 "Bare select is SELECT * with no parameters");
}

// Test: An offset without a limit still produces valid SQLite.
static bool test_offset_without_limit() {
    storage::QueryOptions options;
    options.table = "tags";
    options.offset = 5;
    query_builder::CompiledSql compiled = query_builder::compile_select(options);
    return check(compiled.sql == "SELECT * FROM tags LIMIT -1 OFFSET ?" &&
                     compiled.params == std::vector<json>{5},
                 "Offset alone compiles to LIMIT -1 OFFSET ?");
}

// Test: Each operator compiles to exactly one clause.
static bool test_operator_clauses() {
    bool all_passed = true;

    query_builder::CompiledSql is_null = query_builder::compile_where({{"target_article", FilterOp::Is, nullptr}});
    all_passed &= check(is_null.sql == "WHERE target_article IS NULL" && is_null.params.empty(),
                        "is null compiles to IS NULL without a parameter");

    query_builder::CompiledSql in_list =
        query_builder::compile_where({{"status", FilterOp::In, json::array({"draft", "archived"})}});
    all_passed &= check(in_list.sql == "WHERE status IN (?, ?)" &&
                            in_list.params == std::vector<json>{"draft", "archived"},
                        "in compiles one placeholder per element");

    query_builder::CompiledSql empty_in = query_builder::compile_where({{"status", FilterOp::In, json::array()}});
    all_passed &= check(empty_in.sql == "WHERE 0 = 1" && empty_in.params.empty(),
                        "in with an empty list matches nothing");

    query_builder::CompiledSql contains = query_builder::compile_where({{"tags", FilterOp::Cs, "ai"}});
    all_passed &= check(contains.sql == "WHERE tags LIKE ?" && contains.params == std::vector<json>{"%ai%"},
                        "cs compiles to a substring LIKE");

    query_builder::CompiledSql ilike = query_builder::compile_where({{"name", FilterOp::Ilike, "%ann%"}});
    all_passed &= check(ilike.sql == "WHERE name LIKE ? COLLATE NOCASE", "ilike compiles to LIKE ... COLLATE NOCASE");

    query_builder::CompiledSql neq = query_builder::compile_where({{"priority", FilterOp::Neq, 3},
                                                                  {"priority", FilterOp::Lt, 5}});
    all_passed &= check(neq.sql == "WHERE priority != ? AND priority < ?" &&
                            neq.params == std::vector<json>{3, 5},
                        "Comparison operators join with AND");

    return all_passed;
}

// Test: Invalid descriptors are rejected before any SQL is produced.
static bool test_rejects_invalid_descriptors() {
    bool all_passed = true;

    bool threw = false;
    try {
        query_builder::compile_where({{"status", FilterOp::In, "draft"}});
    } catch (const storage::StorageError &) {
        threw = true;
    }
    all_passed &= check(threw, "in with a non-list value is rejected");

    threw = false;
    try {
        storage::QueryOptions options;
        options.table = "articles; DROP TABLE articles";
        query_builder::compile_select(options);
    } catch (const storage::StorageError &) {
        threw = true;
    }
    all_passed &= check(threw, "Table name with SQL in it is rejected");

    threw = false;
    try {
        query_builder::compile_where({{"a.status", FilterOp::Eq, "x"}});
    } catch (const storage::StorageError &) {
        threw = true;
    }
    all_passed &= check(threw, "Qualified column is rejected in a filter");

    all_passed &= check(query_builder::is_identifier("e.name", true) && !query_builder::is_identifier("e.name") &&
                            !query_builder::is_identifier("1col") && query_builder::is_identifier("_migrations"),
                        "Identifier rules");

    threw = false;
    try {
        query_builder::compile_update("editorial_notes", {}, json::object());
    } catch (const storage::StorageError &) {
        threw = true;
    }
    all_passed &= check(threw, "Update with an empty patch is rejected");

    return all_passed;
}

// Test: Structured values are serialized before binding.
static bool test_value_serialization() {
    bool success = query_builder::serialize_value(json::array({"a", "b"})) == "[\"a\",\"b\"]" &&
                   query_builder::serialize_value(json{{"k", 1}}) == "{\"k\":1}" &&
                   query_builder::serialize_value(true) == 1 &&
                   query_builder::serialize_value(false) == 0 &&
                   query_builder::serialize_value(nullptr).is_null() &&
                   query_builder::serialize_value(2.5) == 2.5;
    return check(success, "Arrays and objects become JSON text, booleans 0/1");
}

// Test: Writes list their columns in key order and return the affected rows.
static bool test_write_statements() {
    bool all_passed = true;

    json row = {{"title", "Weekly"}, {"id", "abc"}, {"tags", json::array({"x"})}};
    query_builder::CompiledSql insert = query_builder::compile_insert("articles", row);
    all_passed &= check(insert.sql == "INSERT INTO articles (id, tags, title) VALUES (?, ?, ?) RETURNING *" &&
                            insert.params == std::vector<json>{"abc", "[\"x\"]", "Weekly"},
                        "Insert compiles with RETURNING *");

    json patch = {{"priority", 1}, {"content", "New"}};
    query_builder::CompiledSql update =
        query_builder::compile_update("editorial_notes", {{"id", FilterOp::Eq, "n1"}}, patch);
    all_passed &= check(update.sql == "UPDATE editorial_notes SET content = ?, priority = ? WHERE id = ? RETURNING *" &&
                            update.params == std::vector<json>{"New", 1, "n1"},
                        "Update binds the patch before the filters");

    query_builder::CompiledSql remove = query_builder::compile_delete("editorial_notes", {});
    all_passed &= check(remove.sql == "DELETE FROM editorial_notes RETURNING *", "Delete without filters");

    query_builder::CompiledSql count =
        query_builder::compile_count("editorial_notes", {{"status", FilterOp::Eq, "active"}});
    all_passed &= check(count.sql == "SELECT COUNT(*) AS cnt FROM editorial_notes WHERE status = ?",
                        "Count compiles with its filters");

    return all_passed;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_select_with_every_clause();
    all_passed &= test_select_without_clauses();
    all_passed &= test_offset_without_limit();
    all_passed &= test_operator_clauses();
    all_passed &= test_rejects_invalid_descriptors();
    all_passed &= test_value_serialization();
    all_passed &= test_write_statements();
    return all_passed;
}

} // namespace test_query_builder
