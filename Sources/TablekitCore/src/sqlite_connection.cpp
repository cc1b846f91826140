#include "tablekit/connection.hpp"
#include "tablekit/log.hpp"

namespace tablekit {

sqlite_connection::sqlite_connection(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw fatal_error("Failed to open database " + path + ": " + error);
    }

    sqlite3_extended_result_codes(db_, 1);

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    execute("PRAGMA foreign_keys = ON");

    // WAL lets readers on other pooled connections keep their snapshot while
    // a copy-and-swap is in flight. Not available for in-memory databases.
    if (mode == open_mode::read_write && path != ":memory:") {
        query("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    LOG_DEBUG("db", "Opened sqlite database %s", path.c_str());
}

sqlite_connection::~sqlite_connection() {
    if (db_) {
        if (mode_ == open_mode::read_write) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
        }
        sqlite3_close_v2(db_);
    }
}

namespace {

[[noreturn]] void throw_sqlite_error(int code, const std::string& msg) {
    switch (code) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            throw conflict_error(msg);
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            throw integrity_error(msg);
        case SQLITE_CONSTRAINT_NOTNULL:
            throw validation_error(msg);
        default:
            break;
    }
    switch (code & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            throw transient_error(msg);
        default:
            throw db_error(msg);
    }
}

} // namespace

void sqlite_connection::raise(const std::string& context, const std::string& sql, sqlite3_stmt* stmt) const {
    // Capture the error before finalize() can reset it.
    int code = sqlite3_extended_errcode(db_);
    std::string msg = context + ": " + sqlite3_errmsg(db_);
    if (stmt) {
        sqlite3_finalize(stmt);
    }
    if (!sql.empty()) {
        LOG_DEBUG("db", "%s (SQL: %s)", msg.c_str(), sql.c_str());
    }
    throw_sqlite_error(code, msg);
}

void sqlite_connection::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            sqlite3_free(errmsg);
            raise("SQL execution failed", sql);
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        raise("Failed to prepare statement", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        raise("Execution failed", sql, stmt);
    }
    sqlite3_finalize(stmt);
}

std::vector<row_t> sqlite_connection::query(const std::string& sql,
                                            const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "%s in %s", sqlite3_errmsg(db_), sql.c_str());
        raise("Failed to prepare query", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        raise("Query failed", sql, stmt);
    }
    sqlite3_finalize(stmt);

    return results;
}

int64_t sqlite_connection::changes() const {
    return sqlite3_changes(db_);
}

primary_key_t sqlite_connection::last_insert_id() const {
    return sqlite3_last_insert_rowid(db_);
}

void sqlite_connection::begin_transaction() {
    // BEGIN IMMEDIATE takes the write lock up front so that two pooled
    // connections never deadlock upgrading from read to write. The busy
    // timeout bounds the wait; past it the caller gets a transient_error.
    int rc = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        raise("Failed to begin transaction");
    }
}

void sqlite_connection::commit() {
    execute("COMMIT");
}

void sqlite_connection::rollback() {
    execute("ROLLBACK");
}

bool sqlite_connection::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active, non-zero otherwise
    return sqlite3_get_autocommit(db_) == 0;
}

bool sqlite_connection::table_exists(const std::string& name) {
    auto rows = query("SELECT name FROM sqlite_master WHERE type='table' AND name=?", {name});
    return !rows.empty();
}

void sqlite_connection::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

column_value_t sqlite_connection::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

} // namespace tablekit
