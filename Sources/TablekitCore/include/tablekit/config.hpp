#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "log.hpp"
#include <chrono>
#include <string>

namespace tablekit {

/// What deleting a table configuration does to the physical table.
enum class delete_table_policy {
    retain,   // leave the physical table (and its rows) for manual cleanup
    drop      // drop the physical table in the same operation
};

inline const char* to_string(delete_table_policy policy) {
    return policy == delete_table_policy::drop ? "drop" : "retain";
}

struct configuration {
    /// Backing database dialect.
    dialect_kind dialect = dialect_kind::sqlite;

    /// SQLite database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// MySQL server location and credentials.
    std::string host;
    unsigned int port = 3306;
    std::string user;
    std::string password;

    /// Database (schema) name. SQLite always works in "main".
    std::string database = "main";

    /// Number of pooled connections. Forced to 1 for in-memory SQLite,
    /// where every connection would otherwise see its own empty database.
    size_t pool_size = 4;

    /// How long a request waits for a free pooled connection.
    std::chrono::milliseconds acquire_timeout{5000};

    /// How long CRUD waits for a table that is being restructured.
    std::chrono::milliseconds lock_timeout{10000};

    /// How long a schema mutation waits for exclusive access to its table.
    std::chrono::milliseconds mutation_lock_timeout{30000};

    /// Largest page a List request may return; larger limits are clamped.
    int64_t max_page_size = 1000;

    /// Policy applied by delete_table().
    delete_table_policy on_delete_table = delete_table_policy::retain;

    log_level level = log_level::warn;

    configuration() = default;

    // Path only - SQLite file database
    explicit configuration(const std::string& p) : path(p) {}

    /// Loads a JSON object whose keys mirror the member names. Missing keys
    /// keep their defaults. Throws validation_error on a malformed file.
    static configuration from_json_file(const std::string& file);

    /// Overlays DB_HOST, DB_PORT, DB_USER, DB_PASS, DB_NAME and LOG_LEVEL.
    /// A non-empty DB_HOST switches the dialect to MySQL.
    void apply_environment();

    /// Pool size after the in-memory adjustment.
    size_t effective_pool_size() const {
        if (dialect == dialect_kind::sqlite && path == ":memory:") return 1;
        return pool_size == 0 ? 1 : pool_size;
    }

    /// One-line summary with the password redacted.
    std::string describe() const;
};

} // namespace tablekit

#endif // __cplusplus
