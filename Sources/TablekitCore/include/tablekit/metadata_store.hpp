#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "connection.hpp"
#include "dialect.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tablekit {

/// Persistent catalog of logical tables, their views and foreign-key
/// declarations. Works on whatever connection it is given, so callers can
/// put its writes inside their own transaction.
class metadata_store {
public:
    metadata_store(connection& conn, const dialect& d);

    // ---- table configurations ----------------------------------------------

    /// Throws validation_error for a bad name and conflict_error when the
    /// name is taken. An empty title defaults to the name.
    table_configuration create_table_configuration(const table_configuration& config);

    std::vector<table_configuration> list_table_configurations();
    std::optional<table_configuration> find_table_configuration(const std::string& name);
    table_configuration get_table_configuration(const std::string& name);
    table_configuration get_table_configuration_by_id(int64_t id);

    /// Updates title, ordinal, db, button text and icon. The name identifies
    /// the physical table and cannot change here.
    table_configuration update_table_configuration(const table_configuration& config);

    /// Removes the configuration with its views and every foreign-key
    /// declaration on or pointing at the table. Physical data is untouched.
    void delete_table_configuration(const std::string& name);

    // ---- views --------------------------------------------------------------

    table_view create_view(const table_view& view);
    table_view update_view(const table_view& view);
    void delete_view(int64_t view_id);
    std::vector<table_view> list_views(const std::string& table);
    table_view get_view(int64_t view_id);
    std::optional<table_view> default_view(const std::string& table);

    /// Makes view_id the only default view of its table.
    void set_default_view(const std::string& table, int64_t view_id);

    // ---- foreign-key declarations ------------------------------------------

    foreign_key_declaration create_foreign_key_declaration(const foreign_key_declaration& fk);
    std::vector<foreign_key_declaration> list_foreign_key_declarations(const std::string& table);
    std::optional<foreign_key_declaration> find_foreign_key_declaration(const std::string& constraint_name);
    void delete_foreign_key_declaration(const std::string& constraint_name);

    /// Declarations whose referenced side is table (optionally one column).
    std::vector<foreign_key_declaration> list_referencing(const std::string& table,
                                                          const std::string& column = {});

    // ---- column references --------------------------------------------------

    /// Rewrites view entries and foreign-key declarations, including the
    /// constraint names derived from the column.
    void rename_column_references(const std::string& table, const std::string& from,
                                  const std::string& to);
    void drop_column_references(const std::string& table, const std::string& column);

    static bool is_metadata_table(const std::string& name);
    static const std::vector<std::string>& metadata_tables();

private:
    connection& conn_;
    const dialect& dialect_;

    void save_view_columns(int64_t view_id, const std::string& table,
                           const std::vector<view_column>& columns);
    std::vector<view_column> load_view_columns(int64_t view_id);
    table_view view_from_row(const row_t& row);
};

} // namespace tablekit

#endif // __cplusplus
