#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <memory>
#include <string>
#include <vector>

namespace tablekit {

struct configuration;

/// One live session against the backing database. Not thread-safe; the pool
/// hands each connection to a single caller at a time.
class connection {
public:
    virtual ~connection() = default;

    virtual dialect_kind kind() const = 0;

    // Execute SQL with optional params (DDL, INSERT/UPDATE/DELETE)
    virtual void execute(const std::string& sql,
                         const std::vector<column_value_t>& params = {}) = 0;

    // Query - returns rows as column maps
    virtual std::vector<row_t> query(const std::string& sql,
                                     const std::vector<column_value_t>& params = {}) = 0;

    // Rows affected (matched, on MySQL) by the last execute()
    virtual int64_t changes() const = 0;
    virtual primary_key_t last_insert_id() const = 0;

    // Transaction support
    virtual void begin_transaction() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool is_in_transaction() const = 0;

    virtual bool table_exists(const std::string& name) = 0;

    /// Name of the database the session works in ("main" on SQLite).
    virtual std::string database_name() const = 0;
};

class sqlite_connection : public connection {
public:
    enum class open_mode {
        read_write,
        read_only
    };

    explicit sqlite_connection(const std::string& path, open_mode mode = open_mode::read_write);
    ~sqlite_connection() override;

    sqlite_connection(const sqlite_connection&) = delete;
    sqlite_connection& operator=(const sqlite_connection&) = delete;

    dialect_kind kind() const override { return dialect_kind::sqlite; }

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {}) override;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) override;

    int64_t changes() const override;
    primary_key_t last_insert_id() const override;

    void begin_transaction() override;
    void commit() override;
    void rollback() override;
    bool is_in_transaction() const override;

    bool table_exists(const std::string& name) override;
    std::string database_name() const override { return "main"; }

    const std::string& path() const { return path_; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;

    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void raise(const std::string& context, const std::string& sql = {},
                            sqlite3_stmt* stmt = nullptr) const;
};

// Row accessors for catalog and metadata queries. Missing keys and NULL read
// as empty / zero.
inline std::string column_text(const row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return {};
    if (auto s = std::get_if<std::string>(&it->second)) return *s;
    if (auto i = std::get_if<int64_t>(&it->second)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&it->second)) return std::to_string(*d);
    return {};
}

inline std::optional<std::string> column_optional_text(const row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end() || std::holds_alternative<std::nullptr_t>(it->second)) return std::nullopt;
    return column_text(row, key);
}

inline int64_t column_int(const row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return 0;
    if (auto i = std::get_if<int64_t>(&it->second)) return *i;
    if (auto d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    if (auto s = std::get_if<std::string>(&it->second)) {
        try {
            return std::stoll(*s);
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

inline bool column_is_null(const row_t& row, const std::string& key) {
    auto it = row.find(key);
    return it == row.end() || std::holds_alternative<std::nullptr_t>(it->second);
}

/// Opens a connection for the configured dialect. Throws fatal_error when the
/// dialect was not compiled in.
std::unique_ptr<connection> open_connection(const configuration& config);

// RAII transaction guard. Joins an already open transaction instead of
// nesting: in that case commit() and rollback() are left to the owner.
class transaction {
public:
    explicit transaction(connection& conn);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

    bool owns() const { return owns_; }

private:
    connection& conn_;
    bool owns_ = false;
    bool completed_ = false;
};

// Turns SQLite foreign-key enforcement off for the guard's lifetime (no-op on
// other dialects). Must be created outside any transaction: SQLite ignores
// the pragma inside one.
class foreign_keys_suspended {
public:
    explicit foreign_keys_suspended(connection& conn);
    ~foreign_keys_suspended();

    foreign_keys_suspended(const foreign_keys_suspended&) = delete;
    foreign_keys_suspended& operator=(const foreign_keys_suspended&) = delete;

private:
    connection& conn_;
    bool active_ = false;
};

/// Runs PRAGMA foreign_key_check on SQLite and throws integrity_error when a
/// row references a missing parent.
void verify_foreign_keys(connection& conn);

} // namespace tablekit

#endif // __cplusplus
