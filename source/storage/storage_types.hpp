#ifndef INKWELL_STORAGE_TYPES_HPP
#define INKWELL_STORAGE_TYPES_HPP

// Generic, schema-agnostic types shared by the query compiler and the store.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace storage {

using json = nlohmann::json;

// A row is a JSON object keyed by column name.
using Row = json;

enum class FilterOp {
    Eq,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte,
    Like,
    Ilike,
    Is,
    In,
    Cs, // substring containment over a collection stored as text
};

struct Filter {
    std::string column;
    FilterOp op = FilterOp::Eq;
    json value;
};

enum class SortDirection {
    Asc,
    Desc,
};

enum class NullPlacement {
    Default,
    First,
    Last,
};

struct OrderClause {
    std::string column;
    SortDirection direction = SortDirection::Asc;
    NullPlacement nulls = NullPlacement::Default;
};

struct QueryOptions {
    std::string table;
    std::vector<std::string> select; // empty selects every column
    std::vector<Filter> filters;     // all must hold
    std::vector<OrderClause> order;  // highest priority first
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

// A named schema script, applied at most once.
struct Migration {
    std::string name;
    std::string sql;
};

// Raised for every storage failure: invalid descriptors, SQLite errors,
// use after close. what() carries the underlying message.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string &message) : std::runtime_error(message) {}
};

} // namespace storage

#endif // INKWELL_STORAGE_TYPES_HPP
