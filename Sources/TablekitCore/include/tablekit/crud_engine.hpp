#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "connection.hpp"
#include "dialect.hpp"
#include "schema_introspector.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace tablekit {

// ============================================================================
// crud_engine - parameterized CRUD over tables known only at request time
// ============================================================================
//
// Every call first resolves the table against the configured tables and the
// live catalog; identifiers that reach SQL text come from that allow-list.
// Values are always bound as parameters.

class crud_engine {
public:
    crud_engine(connection& conn, const dialect& d, structure_cache* cache = nullptr,
                int64_t max_page_size = 1000);

    std::vector<item> list(const std::string& table, const list_query& query = {});
    item get(const std::string& table, primary_key_t id);

    /// Most recently created row. Throws not_found_error on an empty table.
    item get_last(const std::string& table);

    item create(const std::string& table, const field_map& fields);

    /// Partial update: columns absent from fields keep their values.
    item update(const std::string& table, primary_key_t id, const field_map& fields);

    /// Throws not_found_error when no row has this id, including a second
    /// delete of the same row.
    void remove(const std::string& table, primary_key_t id);

    /// Sets createdRelative / updatedRelative from the item's timestamps.
    static void compute_synthetic_fields(item& record, timestamp_t now);

    /// Configured and physically present structure of a table.
    table_structure resolve(const std::string& table);

private:
    connection& conn_;
    const dialect& dialect_;
    structure_cache* cache_;
    int64_t max_page_size_;

    std::vector<std::pair<std::string, field_value_t>> prepare_fields(const table_structure& structure,
                                                                       const field_map& fields);
    void check_references(const table_structure& structure,
                          const std::vector<std::pair<std::string, field_value_t>>& values);
    // Advisory foreign keys on SQLite. `visited` holds "table#id" of rows
    // already handled in this statement so self-references terminate.
    void apply_delete_actions(const std::string& table, const row_t& row, std::set<std::string>& visited);
    void apply_update_actions(const std::string& table, const row_t& before,
                              const std::map<std::string, column_value_t>& after,
                              std::set<std::string>& visited);
    std::vector<row_t> referencing_rows(const foreign_key_declaration& fk, const column_value_t& key);
    item to_item(const table_structure& structure, const row_t& row, timestamp_t now) const;
    std::vector<sort_key> default_order(const table_structure& structure) const;
    std::optional<row_t> fetch_row(const table_structure& structure, primary_key_t id);
};

} // namespace tablekit

#endif // __cplusplus
