#include "storage/sqlite_store.hpp"
#include "storage/query_builder.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <sqlite3.h>

#include <cctype>
#include <cstdint>
#include <limits>
#include <memory>
#include <set>

namespace storage {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt *statement) const { sqlite3_finalize(statement); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr int kBusyTimeoutMilliseconds = 5000;

std::string to_hex(const unsigned char *bytes, size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (size_t index = 0; index < length; ++index) {
        hex += kDigits[bytes[index] >> 4];
        hex += kDigits[bytes[index] & 0x0F];
    }
    return hex;
}

void bind_value(sqlite3 *database, sqlite3_stmt *statement, int index, const json &value) {
    int result = SQLITE_OK;

    if (value.is_null()) {
        result = sqlite3_bind_null(statement, index);
    } else if (value.is_boolean()) {
        result = sqlite3_bind_int(statement, index, value.get<bool>() ? 1 : 0);
    } else if (value.is_number_unsigned() &&
               value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<sqlite3_int64>::max())) {
        throw StorageError("parameter " + std::to_string(index) + " is out of the 64-bit integer range");
    } else if (value.is_number_integer()) {
        result = sqlite3_bind_int64(statement, index, value.get<sqlite3_int64>());
    } else if (value.is_number_float()) {
        result = sqlite3_bind_double(statement, index, value.get<double>());
    } else if (value.is_string()) {
        const std::string &text = value.get_ref<const std::string &>();
        result = sqlite3_bind_text(statement, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    } else {
        std::string text = value.dump();
        result = sqlite3_bind_text(statement, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }

    if (result != SQLITE_OK) {
        throw StorageError("failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(database));
    }
}

json read_column(sqlite3_stmt *statement, int column) {
    switch (sqlite3_column_type(statement, column)) {
    case SQLITE_INTEGER:
        return static_cast<int64_t>(sqlite3_column_int64(statement, column));
    case SQLITE_FLOAT:
        return sqlite3_column_double(statement, column);
    case SQLITE_TEXT: {
        const char *text = reinterpret_cast<const char *>(sqlite3_column_text(statement, column));
        int length = sqlite3_column_bytes(statement, column);
        std::string value(text ? text : "", static_cast<size_t>(length));
        utf8_sanitize::sanitize(value);
        return value;
    }
    case SQLITE_BLOB: {
        const unsigned char *bytes = static_cast<const unsigned char *>(sqlite3_column_blob(statement, column));
        int length = sqlite3_column_bytes(statement, column);
        return to_hex(bytes, static_cast<size_t>(length));
    }
    default:
        return nullptr;
    }
}

bool only_whitespace(const char *text) {
    if (text == nullptr) {
        return true;
    }
    for (; *text != '\0'; ++text) {
        if (!std::isspace(static_cast<unsigned char>(*text))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string generate_id() {
    unsigned char bytes[16];
    sqlite3_randomness(static_cast<int>(sizeof(bytes)), bytes);
    return to_hex(bytes, sizeof(bytes));
}

SqliteStore::SqliteStore(const std::string &database_path, std::vector<Migration> migrations)
    : database_path_(database_path), migrations_(std::move(migrations)) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int result = sqlite3_open_v2(database_path_.c_str(), &database_, flags, nullptr);
    if (result != SQLITE_OK) {
        std::string error = database_ ? sqlite3_errmsg(database_) : sqlite3_errstr(result);
        sqlite3_close(database_);
        database_ = nullptr;
        throw StorageError("failed to open database " + database_path_ + ": " + error);
    }

    sqlite3_busy_timeout(database_, kBusyTimeoutMilliseconds);

    try {
        if (database_path_ != ":memory:") {
            execute_script("PRAGMA journal_mode = WAL");
        }
        execute_script("PRAGMA foreign_keys = ON");
    } catch (const StorageError &) {
        sqlite3_close(database_);
        database_ = nullptr;
        throw;
    }

    debug_log::log("Opened database " + database_path_);
}

SqliteStore::~SqliteStore() {
    close();
}

void SqliteStore::ensure_open() const {
    if (database_ == nullptr) {
        throw StorageError("database is closed");
    }
}

std::vector<Row> SqliteStore::execute(const std::string &sql, const std::vector<json> &params) {
    ensure_open();

    sqlite3_stmt *raw_statement = nullptr;
    const char *tail = nullptr;
    int result = sqlite3_prepare_v2(database_, sql.c_str(), static_cast<int>(sql.size()), &raw_statement, &tail);
    StatementPtr statement(raw_statement);
    if (result != SQLITE_OK) {
        throw StorageError(std::string(sqlite3_errmsg(database_)) + " (SQL: " + sql + ")");
    }
    if (!statement) {
        throw StorageError("empty SQL statement");
    }
    if (!only_whitespace(tail)) {
        throw StorageError("only one SQL statement may be executed at a time");
    }

    int expected_params = sqlite3_bind_parameter_count(statement.get());
    if (expected_params != static_cast<int>(params.size())) {
        throw StorageError("statement expects " + std::to_string(expected_params) + " parameter(s), got " +
                           std::to_string(params.size()));
    }
    for (size_t index = 0; index < params.size(); ++index) {
        bind_value(database_, statement.get(), static_cast<int>(index) + 1, params[index]);
    }

    std::vector<Row> rows;
    int column_count = sqlite3_column_count(statement.get());

    for (;;) {
        result = sqlite3_step(statement.get());
        if (result == SQLITE_DONE) {
            break;
        }
        if (result != SQLITE_ROW) {
            throw StorageError(sqlite3_errmsg(database_));
        }

        Row row = json::object();
        for (int column = 0; column < column_count; ++column) {
            const char *name = sqlite3_column_name(statement.get(), column);
            row[name ? name : std::to_string(column)] = read_column(statement.get(), column);
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

void SqliteStore::execute_script(const std::string &sql) {
    ensure_open();

    char *error_message = nullptr;
    int result = sqlite3_exec(database_, sql.c_str(), nullptr, nullptr, &error_message);
    if (result != SQLITE_OK) {
        std::string error = error_message ? error_message : sqlite3_errstr(result);
        sqlite3_free(error_message);
        throw StorageError(error);
    }
}

std::vector<Row> SqliteStore::query(const QueryOptions &options) {
    query_builder::CompiledSql compiled = query_builder::compile_select(options);
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(compiled.sql, compiled.params);
}

std::optional<Row> SqliteStore::query_one(const QueryOptions &options) {
    QueryOptions single = options;
    single.limit = 1;

    std::vector<Row> rows = query(single);
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

Row SqliteStore::insert(const std::string &table, Row row) {
    if (!row.is_object()) {
        throw StorageError("insert into " + table + " requires an object row");
    }
    if (!row.contains("id") || row["id"].is_null() ||
        (row["id"].is_string() && row["id"].get_ref<const std::string &>().empty())) {
        row["id"] = generate_id();
    }

    query_builder::CompiledSql compiled = query_builder::compile_insert(table, row);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Row> rows = execute(compiled.sql, compiled.params);
    if (rows.empty()) {
        return row;
    }
    return std::move(rows.front());
}

std::vector<Row> SqliteStore::update(const std::string &table, const std::vector<Filter> &filters, const Row &patch) {
    query_builder::CompiledSql compiled = query_builder::compile_update(table, filters, patch);
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(compiled.sql, compiled.params);
}

std::vector<Row> SqliteStore::remove(const std::string &table, const std::vector<Filter> &filters) {
    query_builder::CompiledSql compiled = query_builder::compile_delete(table, filters);
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(compiled.sql, compiled.params);
}

int64_t SqliteStore::count(const std::string &table, const std::vector<Filter> &filters) {
    query_builder::CompiledSql compiled = query_builder::compile_count(table, filters);
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Row> rows = execute(compiled.sql, compiled.params);
    if (rows.empty() || !rows.front()["cnt"].is_number_integer()) {
        return 0;
    }
    return rows.front()["cnt"].get<int64_t>();
}

std::vector<Row> SqliteStore::raw(const std::string &sql, const std::vector<json> &params) {
    std::vector<json> bound;
    bound.reserve(params.size());
    for (const auto &param : params) {
        bound.push_back(query_builder::serialize_value(param));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return execute(sql, bound);
}

void SqliteStore::ensure_ledger() {
    execute_script(
        "CREATE TABLE IF NOT EXISTS _migrations ("
        " name TEXT PRIMARY KEY,"
        " applied_at TEXT NOT NULL DEFAULT (datetime('now'))"
        ")");
}

int SqliteStore::migrate() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_ledger();

    std::set<std::string> applied;
    for (const auto &row : execute("SELECT name FROM _migrations", {})) {
        applied.insert(row["name"].get<std::string>());
    }

    int applied_count = 0;
    for (const auto &migration : migrations_) {
        if (applied.count(migration.name) > 0) {
            continue;
        }

        execute_script("BEGIN IMMEDIATE");
        try {
            execute_script(migration.sql);
            execute("INSERT INTO _migrations (name) VALUES (?)", {migration.name});
            execute_script("COMMIT");
        } catch (const StorageError &error) {
            char *rollback_error = nullptr;
            sqlite3_exec(database_, "ROLLBACK", nullptr, nullptr, &rollback_error);
            if (rollback_error) {
                debug_log::log(std::string("Rollback failed: ") + rollback_error);
                sqlite3_free(rollback_error);
            }
            throw StorageError("migration " + migration.name + " failed: " + error.what());
        }

        debug_log::log("Applied migration " + migration.name);
        applied.insert(migration.name);
        ++applied_count;
    }

    return applied_count;
}

std::vector<std::string> SqliteStore::applied_migrations() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_ledger();

    std::vector<std::string> names;
    for (const auto &row : execute("SELECT name FROM _migrations ORDER BY rowid", {})) {
        names.push_back(row["name"].get<std::string>());
    }
    return names;
}

void SqliteStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (database_ == nullptr) {
        return;
    }
    sqlite3_close_v2(database_);
    database_ = nullptr;
    debug_log::log("Closed database " + database_path_);
}

bool SqliteStore::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return database_ != nullptr;
}

} // namespace storage
