#include "tablekit/mysql_connection.hpp"
#include "tablekit/log.hpp"
#include <charconv>
#include <cstring>
#include <memory>
#include <type_traits>

namespace tablekit {

namespace {

// bool on MySQL 8, my_bool on MariaDB Connector/C
using flag_t = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

constexpr size_t initial_buffer_size = 256;

bool is_integer_type(enum_field_types type) {
    switch (type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONGLONG:
        case MYSQL_TYPE_YEAR:
            return true;
        default:
            return false;
    }
}

bool is_real_type(enum_field_types type) {
    switch (type) {
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return true;
        default:
            return false;
    }
}

column_value_t convert_text(enum_field_types type, std::string text) {
    if (is_integer_type(type)) {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec == std::errc() && ptr == text.data() + text.size()) return v;
    } else if (is_real_type(type)) {
        double v = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
        if (ec == std::errc() && ptr == text.data() + text.size()) return v;
    }
    return text;
}

} // namespace

mysql_connection::mysql_connection(const std::string& host, unsigned int port,
                                   const std::string& user, const std::string& password,
                                   const std::string& database)
    : database_(database) {
    conn_ = mysql_init(nullptr);
    if (!conn_) {
        throw fatal_error("mysql_init() failed");
    }

    mysql_options(conn_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

    if (mysql_real_connect(conn_, host.c_str(), user.c_str(), password.c_str(),
                           database.c_str(), port, nullptr, CLIENT_FOUND_ROWS) == nullptr) {
        unsigned int code = mysql_errno(conn_);
        std::string error = mysql_error(conn_);
        mysql_close(conn_);
        conn_ = nullptr;
        LOG_ERROR("db", "MySQL connection failed: %s (host: %s, user: %s, db: %s, port: %u)",
                  error.c_str(), host.c_str(), user.c_str(), database.c_str(), port);
        if (code == 2002 || code == 2003 || code == 2013) {
            throw transient_error("MySQL connection failed: " + error);
        }
        throw fatal_error("MySQL connection failed: " + error);
    }

    // Engine timestamps are UTC; keep server-side defaults consistent with them.
    execute("SET time_zone = '+00:00'");

    LOG_DEBUG("db", "Connected to mysql %s:%u/%s", host.c_str(), port, database.c_str());
}

mysql_connection::~mysql_connection() {
    if (conn_) {
        mysql_close(conn_);
    }
}

void mysql_connection::raise(unsigned int code, const std::string& msg, const std::string& sql) const {
    if (!sql.empty()) {
        LOG_DEBUG("db", "%s (error %u, SQL: %s)", msg.c_str(), code, sql.c_str());
    }
    switch (code) {
        case 1062:  // ER_DUP_ENTRY
        case 1022:  // ER_DUP_KEY
            throw conflict_error(msg);
        case 1216:  // ER_NO_REFERENCED_ROW
        case 1217:  // ER_ROW_IS_REFERENCED
        case 1451:  // ER_ROW_IS_REFERENCED_2
        case 1452:  // ER_NO_REFERENCED_ROW_2
            throw integrity_error(msg);
        case 1048:  // ER_BAD_NULL_ERROR
            throw validation_error(msg);
        case 1205:  // ER_LOCK_WAIT_TIMEOUT
        case 1213:  // ER_LOCK_DEADLOCK
        case 2006:  // CR_SERVER_GONE_ERROR
        case 2013:  // CR_SERVER_LOST
            throw transient_error(msg);
        default:
            throw db_error(msg);
    }
}

MYSQL_STMT* mysql_connection::prepare(const std::string& sql, const std::vector<column_value_t>& params,
                                      std::vector<MYSQL_BIND>& binds, std::vector<std::string>& buffers,
                                      std::vector<long long>& ints, std::vector<double>& doubles) {
    MYSQL_STMT* stmt = mysql_stmt_init(conn_);
    if (!stmt) {
        raise(mysql_errno(conn_), "mysql_stmt_init failed: " + std::string(mysql_error(conn_)), sql);
    }

    if (mysql_stmt_prepare(stmt, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        unsigned int code = mysql_stmt_errno(stmt);
        std::string error = mysql_stmt_error(stmt);
        mysql_stmt_close(stmt);
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        raise(code, "Failed to prepare statement: " + error, sql);
    }

    // Sized up front: MYSQL_BIND keeps raw pointers into these vectors.
    binds.assign(params.size(), MYSQL_BIND{});
    buffers.assign(params.size(), std::string());
    ints.assign(params.size(), 0);
    doubles.assign(params.size(), 0.0);

    for (size_t i = 0; i < params.size(); ++i) {
        MYSQL_BIND& b = binds[i];
        std::memset(&b, 0, sizeof(b));
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                b.buffer_type = MYSQL_TYPE_NULL;
            } else if constexpr (std::is_same_v<T, int64_t>) {
                ints[i] = v;
                b.buffer_type = MYSQL_TYPE_LONGLONG;
                b.buffer = &ints[i];
            } else if constexpr (std::is_same_v<T, double>) {
                doubles[i] = v;
                b.buffer_type = MYSQL_TYPE_DOUBLE;
                b.buffer = &doubles[i];
            } else if constexpr (std::is_same_v<T, std::string>) {
                buffers[i] = v;
                b.buffer_type = MYSQL_TYPE_STRING;
                b.buffer = buffers[i].data();
                b.buffer_length = static_cast<unsigned long>(buffers[i].size());
            }
        }, params[i]);
    }

    if (!binds.empty() && mysql_stmt_bind_param(stmt, binds.data()) != 0) {
        unsigned int code = mysql_stmt_errno(stmt);
        std::string error = mysql_stmt_error(stmt);
        mysql_stmt_close(stmt);
        raise(code, "Failed to bind parameters: " + error, sql);
    }

    if (mysql_stmt_execute(stmt) != 0) {
        unsigned int code = mysql_stmt_errno(stmt);
        std::string error = mysql_stmt_error(stmt);
        mysql_stmt_close(stmt);
        raise(code, "Execution failed: " + error, sql);
    }
    return stmt;
}

std::vector<row_t> mysql_connection::fetch_all(MYSQL_STMT* stmt, const std::string& sql) {
    std::vector<row_t> results;

    MYSQL_RES* meta = mysql_stmt_result_metadata(stmt);
    if (!meta) {
        return results;
    }

    unsigned int count = mysql_num_fields(meta);
    MYSQL_FIELD* fields = mysql_fetch_fields(meta);

    std::vector<MYSQL_BIND> binds(count);
    std::vector<std::string> buffers(count, std::string(initial_buffer_size, '\0'));
    std::vector<unsigned long> lengths(count, 0);
    // Not std::vector: flag_t may be bool.
    std::unique_ptr<flag_t[]> nulls(new flag_t[count]());
    std::unique_ptr<flag_t[]> errors(new flag_t[count]());

    for (unsigned int i = 0; i < count; ++i) {
        std::memset(&binds[i], 0, sizeof(MYSQL_BIND));
        binds[i].buffer_type = MYSQL_TYPE_STRING;
        binds[i].buffer = buffers[i].data();
        binds[i].buffer_length = static_cast<unsigned long>(buffers[i].size());
        binds[i].length = &lengths[i];
        binds[i].is_null = &nulls[i];
        binds[i].error = &errors[i];
    }

    if (mysql_stmt_bind_result(stmt, binds.data()) != 0 || mysql_stmt_store_result(stmt) != 0) {
        unsigned int code = mysql_stmt_errno(stmt);
        std::string error = mysql_stmt_error(stmt);
        mysql_free_result(meta);
        raise(code, "Failed to read result: " + error, sql);
    }

    while (true) {
        int rc = mysql_stmt_fetch(stmt);
        if (rc == MYSQL_NO_DATA) break;
        if (rc == 1) {
            unsigned int code = mysql_stmt_errno(stmt);
            std::string error = mysql_stmt_error(stmt);
            mysql_free_result(meta);
            raise(code, "Query failed: " + error, sql);
        }

        row_t row;
        for (unsigned int i = 0; i < count; ++i) {
            if (nulls[i]) {
                row[fields[i].name] = nullptr;
                continue;
            }
            std::string text;
            if (lengths[i] > buffers[i].size()) {
                // MYSQL_DATA_TRUNCATED: refetch this column at full length
                text.assign(lengths[i], '\0');
                MYSQL_BIND big;
                std::memset(&big, 0, sizeof(big));
                big.buffer_type = MYSQL_TYPE_STRING;
                big.buffer = text.data();
                big.buffer_length = lengths[i];
                if (mysql_stmt_fetch_column(stmt, &big, i, 0) != 0) {
                    unsigned int code = mysql_stmt_errno(stmt);
                    std::string error = mysql_stmt_error(stmt);
                    mysql_free_result(meta);
                    raise(code, "Failed to fetch column: " + error, sql);
                }
            } else {
                text.assign(buffers[i].data(), lengths[i]);
            }
            row[fields[i].name] = convert_text(fields[i].type, std::move(text));
        }
        results.push_back(std::move(row));
    }

    mysql_free_result(meta);
    return results;
}

void mysql_connection::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
            raise(mysql_errno(conn_), "SQL execution failed: " + std::string(mysql_error(conn_)), sql);
        }
        // Discard a result set if the statement produced one
        if (MYSQL_RES* res = mysql_store_result(conn_)) {
            mysql_free_result(res);
        }
        changes_ = static_cast<int64_t>(mysql_affected_rows(conn_));
        last_insert_id_ = static_cast<primary_key_t>(mysql_insert_id(conn_));
        return;
    }

    std::vector<MYSQL_BIND> binds;
    std::vector<std::string> buffers;
    std::vector<long long> ints;
    std::vector<double> doubles;
    MYSQL_STMT* stmt = prepare(sql, params, binds, buffers, ints, doubles);
    changes_ = static_cast<int64_t>(mysql_stmt_affected_rows(stmt));
    last_insert_id_ = static_cast<primary_key_t>(mysql_stmt_insert_id(stmt));
    mysql_stmt_close(stmt);
}

std::vector<row_t> mysql_connection::query(const std::string& sql, const std::vector<column_value_t>& params) {
    std::vector<MYSQL_BIND> binds;
    std::vector<std::string> buffers;
    std::vector<long long> ints;
    std::vector<double> doubles;
    MYSQL_STMT* stmt = prepare(sql, params, binds, buffers, ints, doubles);
    try {
        auto rows = fetch_all(stmt, sql);
        mysql_stmt_close(stmt);
        return rows;
    } catch (...) {
        mysql_stmt_close(stmt);
        throw;
    }
}

void mysql_connection::begin_transaction() {
    execute("START TRANSACTION");
    in_transaction_ = true;
}

void mysql_connection::commit() {
    in_transaction_ = false;
    execute("COMMIT");
}

void mysql_connection::rollback() {
    in_transaction_ = false;
    execute("ROLLBACK");
}

bool mysql_connection::table_exists(const std::string& name) {
    auto rows = query("SELECT TABLE_NAME FROM INFORMATION_SCHEMA.TABLES "
                      "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ?", {name});
    return !rows.empty();
}

} // namespace tablekit
