#ifndef INKWELL_QUERY_BUILDER_HPP
#define INKWELL_QUERY_BUILDER_HPP

// Compiles declarative QueryOptions / Filter lists into parameterized SQL.
// Values are never interpolated into the SQL text; identifiers are validated
// and ordering keywords come from closed enums.

#include "storage/storage_types.hpp"

#include <string>
#include <vector>

namespace query_builder {

using json = nlohmann::json;

// SQL text plus the values for its '?' placeholders, in order.
struct CompiledSql {
    std::string sql;
    std::vector<json> params;
};

// True for [A-Za-z_][A-Za-z0-9_]*. With allow_qualified, one "table.column"
// qualification is accepted as well.
bool is_identifier(const std::string &name, bool allow_qualified = false);

// Throws storage::StorageError unless is_identifier(name, allow_qualified).
void require_identifier(const std::string &name, bool allow_qualified = false);

// Converts a value to what gets bound: arrays and objects become JSON text,
// booleans become 0/1, everything else passes through.
json serialize_value(const json &value);

// "WHERE a = ? AND b IS NULL" or "" for an empty list.
CompiledSql compile_where(const std::vector<storage::Filter> &filters);

// "ORDER BY a DESC NULLS LAST, b ASC" or "" for an empty list.
std::string compile_order(const std::vector<storage::OrderClause> &order);

CompiledSql compile_select(const storage::QueryOptions &options);
CompiledSql compile_count(const std::string &table, const std::vector<storage::Filter> &filters);
CompiledSql compile_insert(const std::string &table, const storage::Row &row);
CompiledSql compile_update(const std::string &table, const std::vector<storage::Filter> &filters,
                           const storage::Row &patch);
CompiledSql compile_delete(const std::string &table, const std::vector<storage::Filter> &filters);

} // namespace query_builder

#endif // INKWELL_QUERY_BUILDER_HPP
