#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "dialect.hpp"
#include "schema_introspector.hpp"
#include <functional>
#include <string>
#include <vector>

namespace tablekit {

// ============================================================================
// schema_mutator - structural changes as all-or-nothing operations
// ============================================================================
//
// Each operation validates, asks the dialect for a statement plan, runs it
// and reconciles the metadata store. On SQLite the plan and the metadata
// writes share one transaction (copy-and-swap runs with foreign keys
// suspended and is checked before commit). MySQL commits DDL implicitly, so
// the metadata part runs in its own transaction afterwards and a failure
// there undoes the DDL with a compensating statement.
//
// The caller holds the table's exclusive lock for the duration.

class schema_mutator {
public:
    schema_mutator(connection& conn, const dialect& d, structure_cache* cache = nullptr,
                   delete_table_policy on_delete = delete_table_policy::retain);

    table_configuration create_table(const std::string& name, const std::vector<column_spec>& columns,
                                     const std::string& title = {});

    /// Removes the configuration (views and declarations with it) and applies
    /// the delete policy to the physical table. Throws integrity_error while
    /// another table still declares a foreign key to it.
    void delete_table(const std::string& name);

    table_structure add_column(const std::string& table, const column_spec& column);
    table_structure drop_column(const std::string& table, const std::string& column);
    table_structure rename_column(const std::string& table, const std::string& from, const std::string& to);

    /// Refuses (validation_error) when an existing value cannot be
    /// represented in the new type.
    table_structure change_column_type(const std::string& table, const std::string& column,
                                       semantic_type type);

    foreign_key_declaration create_foreign_key(const std::string& table, const std::string& column,
                                               const std::string& referenced_table,
                                               const std::string& referenced_column = "id",
                                               fk_action on_delete = fk_action::restrict,
                                               fk_action on_update = fk_action::restrict);
    void drop_foreign_key(const std::string& table, const std::string& constraint_name);

private:
    connection& conn_;
    const dialect& dialect_;
    structure_cache* cache_;
    delete_table_policy on_delete_;

    table_structure require_structure(const std::string& table);
    const column_descriptor& require_user_column(const table_structure& structure, const std::string& column,
                                                 const char* action);
    void validate_new_column(const table_structure& structure, const column_spec& column);
    void verify_convertible(const table_structure& structure, const column_descriptor& column,
                            semantic_type type);

    void apply(const statement_plan& plan, const std::function<void()>& reconcile,
               const std::function<void()>& compensate);
    void run(const statement_plan& plan);
};

} // namespace tablekit

#endif // __cplusplus
