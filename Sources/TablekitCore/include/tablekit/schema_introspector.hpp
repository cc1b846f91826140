#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "connection.hpp"
#include "dialect.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tablekit {

// ============================================================================
// structure_cache - introspected structures keyed by physical table name
// ============================================================================
//
// Shared by every request. The schema mutator invalidates an entry after each
// structural change to its table, whether the change committed or not.

class structure_cache {
public:
    std::optional<table_structure> get(const std::string& table) const;
    void put(const table_structure& structure);
    void invalidate(const std::string& table);
    void clear();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, table_structure> entries_;
};

// ============================================================================
// schema_introspector - the live catalog is the authority on columns
// ============================================================================

class schema_introspector {
public:
    schema_introspector(connection& conn, const dialect& d, structure_cache* cache = nullptr);

    /// Ordered columns of a physical table with their semantic types.
    /// Throws not_found_error when the table does not exist.
    table_structure get_table_structure(const std::string& table);

    /// Same, bypassing (and refreshing) the cache.
    table_structure read_table_structure(const std::string& table);

    /// Physical tables excluding the engine's own metadata tables.
    std::vector<std::string> list_physical_tables();

    bool table_exists(const std::string& table);

    /// Every physical table with its configuration status, by name.
    std::vector<database_table_info> list_database_tables(const std::vector<table_configuration>& configs);

    /// Row count summed over tables. Approximate on MySQL (table statistics),
    /// exact on SQLite.
    int64_t approx_total_rows(const std::vector<std::string>& tables);

    /// Configured tables without a physical table, and physical tables
    /// without a configuration.
    consistency_report check_consistency(const std::vector<table_configuration>& configs);

private:
    connection& conn_;
    const dialect& dialect_;
    structure_cache* cache_;

    std::vector<foreign_key_declaration> advisory_declarations(const std::string& table);
};

} // namespace tablekit

#endif // __cplusplus
