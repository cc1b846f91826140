#pragma once

#ifdef __cplusplus

#include "connection.hpp"
#include "dialect.hpp"
#include <string>
#include <vector>

namespace tablekit {

/// One numbered change to the metadata schema. Up scripts exist for both
/// dialects; down scripts reverse them (on SQLite as a copy-and-swap where a
/// column has to go).
struct migration {
    int version;
    std::string name;
    std::vector<std::string> sqlite_up;
    std::vector<std::string> mysql_up;
    std::vector<std::string> sqlite_down;
    std::vector<std::string> mysql_down;
};

class migrator {
public:
    migrator(connection& conn, const dialect& d);

    static const std::vector<migration>& migrations();
    static int latest_version();

    /// Highest applied version, 0 for a fresh database.
    int current_version();

    /// Applies every pending migration in order. Throws fatal_error when the
    /// database was migrated by a newer build.
    void migrate_to_latest();

    /// Runs down scripts until the database is at `version`.
    void revert_to(int version);

private:
    connection& conn_;
    const dialect& dialect_;

    void ensure_migrations_table();
    void run(const std::vector<std::string>& statements);
};

} // namespace tablekit

#endif // __cplusplus
