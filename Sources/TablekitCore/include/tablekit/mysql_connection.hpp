#pragma once

#ifdef __cplusplus

#include "connection.hpp"
#include <mysql.h>

namespace tablekit {

/// MySQL session through the C client API. Every parameterized statement is
/// a server-side prepared statement; parameterless execute() calls go
/// through mysql_real_query. Opened with CLIENT_FOUND_ROWS so that changes() counts
/// matched rather than modified rows, like SQLite.
class mysql_connection : public connection {
public:
    mysql_connection(const std::string& host, unsigned int port,
                     const std::string& user, const std::string& password,
                     const std::string& database);
    ~mysql_connection() override;

    mysql_connection(const mysql_connection&) = delete;
    mysql_connection& operator=(const mysql_connection&) = delete;

    dialect_kind kind() const override { return dialect_kind::mysql; }

    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {}) override;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) override;

    int64_t changes() const override { return changes_; }
    primary_key_t last_insert_id() const override { return last_insert_id_; }

    void begin_transaction() override;
    void commit() override;
    void rollback() override;
    bool is_in_transaction() const override { return in_transaction_; }

    bool table_exists(const std::string& name) override;
    std::string database_name() const override { return database_; }

    MYSQL* handle() const { return conn_; }

private:
    MYSQL* conn_ = nullptr;
    std::string database_;
    int64_t changes_ = 0;
    primary_key_t last_insert_id_ = 0;
    bool in_transaction_ = false;

    MYSQL_STMT* prepare(const std::string& sql, const std::vector<column_value_t>& params,
                        std::vector<MYSQL_BIND>& binds, std::vector<std::string>& buffers,
                        std::vector<long long>& ints, std::vector<double>& doubles);
    std::vector<row_t> fetch_all(MYSQL_STMT* stmt, const std::string& sql);
    [[noreturn]] void raise(unsigned int code, const std::string& msg, const std::string& sql) const;
};

} // namespace tablekit

#endif // __cplusplus
