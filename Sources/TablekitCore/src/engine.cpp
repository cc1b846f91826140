#include "tablekit/engine.hpp"
#include "tablekit/crud_engine.hpp"
#include "tablekit/metadata_store.hpp"
#include "tablekit/migrations.hpp"
#include "tablekit/schema_mutator.hpp"
#include "tablekit/view_resolver.hpp"
#include "tablekit/log.hpp"

namespace tablekit {

// Global log level - default to warn.
std::atomic<log_level> g_log_level{log_level::warn};

engine::engine(const configuration& config)
    : config_(config),
      dialect_(dialect::create(config.dialect)),
      pool_([this] { return open_connection(config_); },
            config.effective_pool_size(), config.acquire_timeout) {
    set_log_level(config_.level);
    LOG_INFO("engine", "Opening %s", config_.describe().c_str());

    auto conn = pool_.acquire();
    migrator(*conn, *dialect_).migrate_to_latest();

    metadata_store store(*conn, *dialect_);
    schema_introspector introspector(*conn, *dialect_);
    auto report = introspector.check_consistency(store.list_table_configurations());
    for (const auto& name : report.missing_physical) {
        LOG_ERROR("engine", "Configured table %s has no physical table", name.c_str());
    }
    for (const auto& name : report.orphaned_physical) {
        LOG_WARN("engine", "Physical table %s has no configuration", name.c_str());
    }
}

table_lock_registry::shared_guard engine::read_lock(const std::string& table) {
    // Validate before the name becomes a registry key.
    dialect_->validate_identifier(table);
    return locks_.lock_shared(table, config_.lock_timeout);
}

table_lock_registry::exclusive_guard engine::write_lock(const std::string& table) {
    dialect_->validate_identifier(table);
    return locks_.lock_exclusive(table, config_.mutation_lock_timeout);
}

// ============================================================================
// CRUD
// ============================================================================

std::vector<item> engine::list(const std::string& table, const list_query& query) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).list(table, query);
}

item engine::get(const std::string& table, primary_key_t id) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).get(table, id);
}

item engine::get_last(const std::string& table) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).get_last(table);
}

item engine::create(const std::string& table, const field_map& fields) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).create(table, fields);
}

item engine::update(const std::string& table, primary_key_t id, const field_map& fields) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).update(table, id, fields);
}

void engine::remove(const std::string& table, primary_key_t id) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    crud_engine(*conn, *dialect_, &cache_, config_.max_page_size).remove(table, id);
}

void engine::compute_synthetic_fields(item& record, timestamp_t now) {
    crud_engine::compute_synthetic_fields(record, now);
}

// ============================================================================
// Introspection and metadata
// ============================================================================

table_structure engine::get_table_structure(const std::string& table) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return schema_introspector(*conn, *dialect_, &cache_).read_table_structure(table);
}

std::vector<std::string> engine::list_physical_tables() {
    auto conn = pool_.acquire();
    return schema_introspector(*conn, *dialect_).list_physical_tables();
}

bool engine::table_exists(const std::string& table) {
    auto conn = pool_.acquire();
    return schema_introspector(*conn, *dialect_).table_exists(table);
}

consistency_report engine::check_consistency() {
    auto conn = pool_.acquire();
    metadata_store store(*conn, *dialect_);
    return schema_introspector(*conn, *dialect_).check_consistency(store.list_table_configurations());
}

std::vector<database_table_info> engine::list_database_tables() {
    auto conn = pool_.acquire();
    metadata_store store(*conn, *dialect_);
    return schema_introspector(*conn, *dialect_).list_database_tables(store.list_table_configurations());
}

int64_t engine::approx_total_rows() {
    auto conn = pool_.acquire();
    std::vector<std::string> tables;
    for (const auto& config : metadata_store(*conn, *dialect_).list_table_configurations()) {
        tables.push_back(config.name);
    }
    return schema_introspector(*conn, *dialect_).approx_total_rows(tables);
}

std::vector<table_configuration> engine::list_table_configurations() {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).list_table_configurations();
}

table_configuration engine::get_table_configuration(const std::string& name) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).get_table_configuration(name);
}

table_configuration engine::get_table_configuration_by_id(int64_t id) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).get_table_configuration_by_id(id);
}

table_configuration engine::update_table_configuration(const table_configuration& config) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).update_table_configuration(config);
}

std::vector<table_view> engine::get_table_views(const std::string& table) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).list_views(table);
}

table_view engine::get_view(int64_t view_id) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).get_view(view_id);
}

table_view engine::create_view(const table_view& view) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).create_view(view);
}

table_view engine::update_view(const table_view& view) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).update_view(view);
}

void engine::delete_view(int64_t view_id) {
    auto conn = pool_.acquire();
    metadata_store(*conn, *dialect_).delete_view(view_id);
}

void engine::set_default_view(const std::string& table, int64_t view_id) {
    auto conn = pool_.acquire();
    metadata_store(*conn, *dialect_).set_default_view(table, view_id);
}

effective_view engine::resolve_effective_view(const std::string& table, std::optional<int64_t> view_id) {
    auto guard = read_lock(table);
    auto conn = pool_.acquire();
    return view_resolver(*conn, *dialect_, &cache_).resolve(table, view_id);
}

std::vector<foreign_key_declaration> engine::list_foreign_keys(const std::string& table) {
    auto conn = pool_.acquire();
    return metadata_store(*conn, *dialect_).list_foreign_key_declarations(table);
}

// ============================================================================
// Schema mutation
// ============================================================================

table_configuration engine::create_table(const std::string& name, const std::vector<column_spec>& columns,
                                         const std::string& title) {
    auto guard = write_lock(name);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).create_table(name, columns, title);
}

void engine::delete_table(const std::string& name) {
    auto guard = write_lock(name);
    auto conn = pool_.acquire();
    schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).delete_table(name);
}

table_structure engine::add_column(const std::string& table, const column_spec& column) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).add_column(table, column);
}

table_structure engine::drop_column(const std::string& table, const std::string& column) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).drop_column(table, column);
}

table_structure engine::rename_column(const std::string& table, const std::string& from, const std::string& to) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).rename_column(table, from, to);
}

table_structure engine::change_column_type(const std::string& table, const std::string& column,
                                           semantic_type type) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table)
        .change_column_type(table, column, type);
}

foreign_key_declaration engine::create_foreign_key(const std::string& table, const std::string& column,
                                                   const std::string& referenced_table,
                                                   const std::string& referenced_column,
                                                   fk_action on_delete, fk_action on_update) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    return schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table)
        .create_foreign_key(table, column, referenced_table, referenced_column, on_delete, on_update);
}

void engine::drop_foreign_key(const std::string& table, const std::string& constraint_name) {
    auto guard = write_lock(table);
    auto conn = pool_.acquire();
    schema_mutator(*conn, *dialect_, &cache_, config_.on_delete_table).drop_foreign_key(table, constraint_name);
}

// ============================================================================
// Migrations
// ============================================================================

int engine::schema_version() {
    auto conn = pool_.acquire();
    return migrator(*conn, *dialect_).current_version();
}

void engine::revert_migrations(int version) {
    auto conn = pool_.acquire();
    migrator(*conn, *dialect_).revert_to(version);
    cache_.clear();
}

} // namespace tablekit
