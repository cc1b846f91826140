#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "connection_pool.hpp"
#include "dialect.hpp"
#include "schema_introspector.hpp"
#include "table_locks.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tablekit {

// ============================================================================
// engine - the schema-driven data engine behind one database
// ============================================================================
//
// Owns the connection pool, the dialect, the structure cache and the table
// lock registry. Opening an engine migrates the metadata schema to the
// latest version and reports (but does not repair) inconsistencies between
// configured and physical tables.
//
// Thread-safe: every call leases its own connection. CRUD holds the table's
// lock shared, mutations hold it exclusively.

class engine {
public:
    explicit engine(const configuration& config);
    ~engine() = default;

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;

    const configuration& config() const { return config_; }
    const dialect& sql_dialect() const { return *dialect_; }
    table_lock_registry& locks() { return locks_; }
    structure_cache& cache() { return cache_; }

    // ---- CRUD ---------------------------------------------------------------

    std::vector<item> list(const std::string& table, const list_query& query = {});
    item get(const std::string& table, primary_key_t id);
    item get_last(const std::string& table);
    item create(const std::string& table, const field_map& fields);
    item update(const std::string& table, primary_key_t id, const field_map& fields);
    void remove(const std::string& table, primary_key_t id);

    static void compute_synthetic_fields(item& record, timestamp_t now);

    // ---- introspection and metadata ------------------------------------------

    /// Live structure of a physical table, read past the cache.
    table_structure get_table_structure(const std::string& table);
    std::vector<std::string> list_physical_tables();
    bool table_exists(const std::string& table);
    consistency_report check_consistency();

    /// Physical tables with their configuration status.
    std::vector<database_table_info> list_database_tables();

    /// Rows across all configured tables; approximate on MySQL.
    int64_t approx_total_rows();

    std::vector<table_configuration> list_table_configurations();
    table_configuration get_table_configuration(const std::string& name);
    table_configuration get_table_configuration_by_id(int64_t id);
    table_configuration update_table_configuration(const table_configuration& config);

    std::vector<table_view> get_table_views(const std::string& table);
    table_view get_view(int64_t view_id);
    table_view create_view(const table_view& view);
    table_view update_view(const table_view& view);
    void delete_view(int64_t view_id);
    void set_default_view(const std::string& table, int64_t view_id);

    effective_view resolve_effective_view(const std::string& table,
                                          std::optional<int64_t> view_id = std::nullopt);

    std::vector<foreign_key_declaration> list_foreign_keys(const std::string& table);

    // ---- schema mutation ------------------------------------------------------

    table_configuration create_table(const std::string& name, const std::vector<column_spec>& columns,
                                     const std::string& title = {});
    void delete_table(const std::string& name);
    table_structure add_column(const std::string& table, const column_spec& column);
    table_structure drop_column(const std::string& table, const std::string& column);
    table_structure rename_column(const std::string& table, const std::string& from, const std::string& to);
    table_structure change_column_type(const std::string& table, const std::string& column,
                                       semantic_type type);
    foreign_key_declaration create_foreign_key(const std::string& table, const std::string& column,
                                               const std::string& referenced_table,
                                               const std::string& referenced_column = "id",
                                               fk_action on_delete = fk_action::restrict,
                                               fk_action on_update = fk_action::restrict);
    void drop_foreign_key(const std::string& table, const std::string& constraint_name);

    // ---- migrations -----------------------------------------------------------

    int schema_version();
    void revert_migrations(int version);

private:
    configuration config_;
    std::unique_ptr<dialect> dialect_;
    structure_cache cache_;
    table_lock_registry locks_;
    connection_pool pool_;

    table_lock_registry::shared_guard read_lock(const std::string& table);
    table_lock_registry::exclusive_guard write_lock(const std::string& table);
};

} // namespace tablekit

#endif // __cplusplus
