#ifndef INKWELL_SQLITE_STORE_HPP
#define INKWELL_SQLITE_STORE_HPP

// Storage engine: owns the SQLite handle and exposes generic CRUD-by-filter
// operations plus the migration runner. Knows nothing about tool semantics.
//
// Every public operation is serialized on an internal mutex, so close() can be
// called from a shutdown path while a request is still running: the request
// either completes first or fails with StorageError afterwards.

#include "storage/storage_types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace storage {

class SqliteStore {
public:
    // Opens (creating if needed) the database at database_path. ":memory:"
    // opens a private in-memory database. Throws StorageError on failure.
    explicit SqliteStore(const std::string &database_path,
                         std::vector<Migration> migrations = {});
    ~SqliteStore();

    SqliteStore(const SqliteStore &) = delete;
    SqliteStore &operator=(const SqliteStore &) = delete;

    std::vector<Row> query(const QueryOptions &options);

    // query() with the limit forced to 1. std::nullopt when nothing matches.
    std::optional<Row> query_one(const QueryOptions &options);

    // Assigns a random 32-hex-digit id when the row has none. Returns the
    // persisted row including defaults filled in by the schema.
    Row insert(const std::string &table, Row row);

    // Returns the updated rows; an empty list when no row matched.
    std::vector<Row> update(const std::string &table, const std::vector<Filter> &filters, const Row &patch);

    // DELETE. Returns the deleted rows.
    std::vector<Row> remove(const std::string &table, const std::vector<Filter> &filters);

    int64_t count(const std::string &table, const std::vector<Filter> &filters = {});

    // Single parameterized statement for joins and aggregates.
    std::vector<Row> raw(const std::string &sql, const std::vector<json> &params = {});

    // Applies every pending migration, each atomically with its ledger row.
    // Returns how many were applied; 0 when the schema is current.
    int migrate();

    // Names recorded in the migration ledger, in application order.
    std::vector<std::string> applied_migrations();

    // Releases the handle. Safe to call more than once.
    void close();

    bool is_open() const;

    const std::string &path() const { return database_path_; }

private:
    // Callers hold mutex_.
    void ensure_open() const;
    std::vector<Row> execute(const std::string &sql, const std::vector<json> &params);
    void execute_script(const std::string &sql);
    void ensure_ledger();

    std::string database_path_;
    std::vector<Migration> migrations_;
    sqlite3 *database_ = nullptr;
    mutable std::mutex mutex_;
};

// Lowercase hex of 16 random bytes.
std::string generate_id();

} // namespace storage

#endif // INKWELL_SQLITE_STORE_HPP
