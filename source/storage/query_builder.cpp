#include "storage/query_builder.hpp"

#include <cctype>

namespace query_builder {

using storage::Filter;
using storage::FilterOp;
using storage::NullPlacement;
using storage::OrderClause;
using storage::QueryOptions;
using storage::Row;
using storage::SortDirection;
using storage::StorageError;

static bool is_plain_identifier(const std::string &name, size_t begin, size_t end) {
    if (begin >= end) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name[begin]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    for (size_t index = begin + 1; index < end; ++index) {
        unsigned char character = static_cast<unsigned char>(name[index]);
        if (!(std::isalnum(character) || character == '_')) {
            return false;
        }
    }
    return true;
}

bool is_identifier(const std::string &name, bool allow_qualified) {
    size_t dot = name.find('.');
    if (dot == std::string::npos) {
        return is_plain_identifier(name, 0, name.size());
    }
    if (!allow_qualified) {
        return false;
    }
    return is_plain_identifier(name, 0, dot) && is_plain_identifier(name, dot + 1, name.size());
}

void require_identifier(const std::string &name, bool allow_qualified) {
    if (!is_identifier(name, allow_qualified)) {
        throw StorageError("invalid SQL identifier: '" + name + "'");
    }
}

json serialize_value(const json &value) {
    if (value.is_array() || value.is_object()) {
        return value.dump();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? 1 : 0;
    }
    return value;
}

static const char *comparison_operator(FilterOp op) {
    switch (op) {
    case FilterOp::Eq:
        return "=";
    case FilterOp::Neq:
        return "!=";
    case FilterOp::Gt:
        return ">";
    case FilterOp::Gte:
        return ">=";
    case FilterOp::Lt:
        return "<";
    case FilterOp::Lte:
        return "<=";
    default:
        return nullptr;
    }
}

// Appends exactly one clause for filter to clauses.
static void compile_filter(const Filter &filter, std::vector<std::string> &clauses, std::vector<json> &params) {
    require_identifier(filter.column);
    const std::string &column = filter.column;

    switch (filter.op) {
    case FilterOp::Eq:
    case FilterOp::Neq:
    case FilterOp::Gt:
    case FilterOp::Gte:
    case FilterOp::Lt:
    case FilterOp::Lte:
        clauses.push_back(column + " " + comparison_operator(filter.op) + " ?");
        params.push_back(serialize_value(filter.value));
        return;

    case FilterOp::Like:
        clauses.push_back(column + " LIKE ?");
        params.push_back(serialize_value(filter.value));
        return;

    case FilterOp::Ilike:
        clauses.push_back(column + " LIKE ? COLLATE NOCASE");
        params.push_back(serialize_value(filter.value));
        return;

    case FilterOp::Is:
        if (filter.value.is_null()) {
            clauses.push_back(column + " IS NULL");
        } else {
            clauses.push_back(column + " IS ?");
            params.push_back(serialize_value(filter.value));
        }
        return;

    case FilterOp::In: {
        if (!filter.value.is_array()) {
            throw StorageError("'in' filter on " + column + " requires a list value");
        }
        if (filter.value.empty()) {
            // An empty set matches nothing; dropping the clause would match everything.
            clauses.push_back("0 = 1");
            return;
        }
        std::string placeholders;
        for (const auto &item : filter.value) {
            placeholders += placeholders.empty() ? "?" : ", ?";
            params.push_back(serialize_value(item));
        }
        clauses.push_back(column + " IN (" + placeholders + ")");
        return;
    }

    case FilterOp::Cs: {
        std::string needle = filter.value.is_string() ? filter.value.get<std::string>() : filter.value.dump();
        clauses.push_back(column + " LIKE ?");
        params.push_back("%" + needle + "%");
        return;
    }
    }

    throw StorageError("unsupported filter operator on " + column);
}

CompiledSql compile_where(const std::vector<Filter> &filters) {
    CompiledSql compiled;
    if (filters.empty()) {
        return compiled;
    }

    std::vector<std::string> clauses;
    for (const auto &filter : filters) {
        compile_filter(filter, clauses, compiled.params);
    }

    compiled.sql = "WHERE ";
    for (size_t index = 0; index < clauses.size(); ++index) {
        if (index > 0) {
            compiled.sql += " AND ";
        }
        compiled.sql += clauses[index];
    }
    return compiled;
}

std::string compile_order(const std::vector<OrderClause> &order) {
    if (order.empty()) {
        return "";
    }

    std::string sql = "ORDER BY ";
    for (size_t index = 0; index < order.size(); ++index) {
        const OrderClause &clause = order[index];
        require_identifier(clause.column, true);

        if (index > 0) {
            sql += ", ";
        }
        sql += clause.column;
        sql += (clause.direction == SortDirection::Desc) ? " DESC" : " ASC";
        if (clause.nulls == NullPlacement::First) {
            sql += " NULLS FIRST";
        } else if (clause.nulls == NullPlacement::Last) {
            sql += " NULLS LAST";
        }
    }
    return sql;
}

// Joins the non-empty parts with single spaces.
static std::string join_parts(const std::vector<std::string> &parts) {
    std::string sql;
    for (const auto &part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!sql.empty()) {
            sql += " ";
        }
        sql += part;
    }
    return sql;
}

CompiledSql compile_select(const QueryOptions &options) {
    require_identifier(options.table);

    std::string projection;
    if (options.select.empty()) {
        projection = "*";
    } else {
        for (const auto &column : options.select) {
            require_identifier(column, true);
            if (!projection.empty()) {
                projection += ", ";
            }
            projection += column;
        }
    }

    CompiledSql where = compile_where(options.filters);

    // LIMIT and OFFSET values are bound, never formatted into the text.
    std::string limit_clause;
    if (options.limit.has_value()) {
        limit_clause = "LIMIT ?";
        where.params.push_back(*options.limit);
        if (options.offset.has_value()) {
            limit_clause += " OFFSET ?";
            where.params.push_back(*options.offset);
        }
    } else if (options.offset.has_value()) {
        // SQLite only accepts OFFSET after a LIMIT; -1 means unbounded.
        limit_clause = "LIMIT -1 OFFSET ?";
        where.params.push_back(*options.offset);
    }

    CompiledSql compiled;
    compiled.sql = join_parts({"SELECT " + projection + " FROM " + options.table, where.sql,
                               compile_order(options.order), limit_clause});
    compiled.params = std::move(where.params);
    return compiled;
}

CompiledSql compile_count(const std::string &table, const std::vector<Filter> &filters) {
    require_identifier(table);
    CompiledSql where = compile_where(filters);

    CompiledSql compiled;
    compiled.sql = join_parts({"SELECT COUNT(*) AS cnt FROM " + table, where.sql});
    compiled.params = std::move(where.params);
    return compiled;
}

CompiledSql compile_insert(const std::string &table, const Row &row) {
    require_identifier(table);
    if (!row.is_object() || row.empty()) {
        throw StorageError("insert into " + table + " requires a non-empty row");
    }

    CompiledSql compiled;
    std::string columns;
    std::string placeholders;
    for (const auto &entry : row.items()) {
        require_identifier(entry.key());
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += entry.key();
        placeholders += "?";
        compiled.params.push_back(serialize_value(entry.value()));
    }

    compiled.sql = "INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ") RETURNING *";
    return compiled;
}

CompiledSql compile_update(const std::string &table, const std::vector<Filter> &filters, const Row &patch) {
    require_identifier(table);
    if (!patch.is_object() || patch.empty()) {
        throw StorageError("update of " + table + " requires at least one column to set");
    }

    CompiledSql compiled;
    std::string assignments;
    for (const auto &entry : patch.items()) {
        require_identifier(entry.key());
        if (!assignments.empty()) {
            assignments += ", ";
        }
        assignments += entry.key() + " = ?";
        compiled.params.push_back(serialize_value(entry.value()));
    }

    CompiledSql where = compile_where(filters);
    compiled.sql = join_parts({"UPDATE " + table + " SET " + assignments, where.sql, "RETURNING *"});
    compiled.params.insert(compiled.params.end(), where.params.begin(), where.params.end());
    return compiled;
}

CompiledSql compile_delete(const std::string &table, const std::vector<Filter> &filters) {
    require_identifier(table);
    CompiledSql where = compile_where(filters);

    CompiledSql compiled;
    compiled.sql = join_parts({"DELETE FROM " + table, where.sql, "RETURNING *"});
    compiled.params = std::move(where.params);
    return compiled;
}

} // namespace query_builder
