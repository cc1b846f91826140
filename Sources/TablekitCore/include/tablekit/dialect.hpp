#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "connection.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tablekit {

// ============================================================================
// Physical catalog shapes - what the database itself reports for a table
// ============================================================================

struct physical_column {
    std::string name;
    std::string type;                       // as declared, uppercase
    bool not_null = false;
    bool primary_key = false;
    bool auto_increment = false;
    std::optional<std::string> default_sql; // default as SQL expression text
};

struct physical_foreign_key {
    std::string name;                       // empty on SQLite (unnamed)
    std::string column;
    std::string referenced_table;
    std::string referenced_column;
    std::string on_delete = "NO ACTION";
    std::string on_update = "NO ACTION";
};

struct physical_index {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    bool primary = false;
    // Original CREATE INDEX text when the dialect keeps it (SQLite).
    std::optional<std::string> definition;
};

struct table_shape {
    std::string name;
    std::vector<physical_column> columns;
    std::vector<physical_foreign_key> foreign_keys;
    std::vector<physical_index> indexes;
    std::vector<std::string> triggers;      // CREATE TRIGGER text (SQLite)

    const physical_column* find(const std::string& column) const {
        for (const auto& c : columns) {
            if (c.name == column) return &c;
        }
        return nullptr;
    }
};

/// Ordered statements for one abstract operation.
struct statement_plan {
    std::vector<std::string> statements;

    // true when the database applies the plan all-or-nothing by itself;
    // false when the caller must run it inside one transaction.
    bool natively_atomic = true;

    // SQLite copy-and-swap: referential checks must be off while the
    // original table is dropped, and checked again before commit.
    bool requires_foreign_keys_off = false;
};

// ============================================================================
// CRUD statement templates
// ============================================================================

enum class condition_op {
    equals,     // col = ?
    is_null,    // col IS NULL (no parameter)
    like        // col LIKE ? with the dialect's escape character
};

struct condition {
    std::string column;
    condition_op op = condition_op::equals;
};

struct select_spec {
    std::string table;
    std::vector<std::string> columns;   // empty selects every column
    std::vector<condition> where;
    std::vector<sort_key> order;
    std::optional<int64_t> limit;
    int64_t offset = 0;
    bool for_update = false;            // row locks where the dialect has them
};

// ============================================================================
// dialect - every SQL text difference between SQLite and MySQL lives here
// ============================================================================

class dialect {
public:
    virtual ~dialect() = default;

    virtual dialect_kind kind() const = 0;

    static std::unique_ptr<dialect> create(dialect_kind kind);

    // ---- identifiers -------------------------------------------------------

    virtual size_t max_identifier_length() const = 0;

    /// Throws validation_error (field = name) unless name matches
    /// [A-Za-z_][A-Za-z0-9_]* within the dialect's length limit.
    virtual void validate_identifier(const std::string& name) const;

    /// Validates and quotes an identifier for splicing into SQL text.
    std::string quote(const std::string& name) const;

    /// fk_<table>_<column>_<reftable>_<refcolumn>, shortened with a hash
    /// suffix when it would exceed the identifier limit.
    std::string constraint_name(const std::string& table, const std::string& column,
                                const std::string& referenced_table,
                                const std::string& referenced_column) const;

    /// Lookup index name used for advisory foreign keys.
    std::string index_name(const std::string& constraint) const;

    // ---- types -------------------------------------------------------------

    /// Physical type for a semantic type. Throws validation_error for
    /// semantic_type::unsupported.
    virtual std::string physical_type(semantic_type type) const = 0;

    /// Semantic type for a declared physical type, via the shared mapping
    /// table. Unknown types classify as unsupported.
    semantic_type classify(const std::string& physical_type) const;

    /// Literal used to backfill a NOT NULL column added to a populated table.
    std::string fill_literal(semantic_type type) const;

    // ---- DDL ---------------------------------------------------------------

    virtual statement_plan create_table(const std::string& table,
                                        const std::vector<column_spec>& columns) const = 0;
    statement_plan drop_table(const std::string& table) const;

    virtual statement_plan add_column(const table_shape& shape, const column_spec& column) const;
    virtual statement_plan drop_column(const table_shape& shape, const std::string& column) const = 0;
    virtual statement_plan rename_column(const table_shape& shape, const std::string& from,
                                         const std::string& to) const = 0;
    virtual statement_plan change_column_type(const table_shape& shape, const std::string& column,
                                              semantic_type type) const = 0;
    virtual statement_plan add_foreign_key(const table_shape& shape,
                                           const foreign_key_declaration& fk) const = 0;
    virtual statement_plan drop_foreign_key(const table_shape& shape,
                                            const foreign_key_declaration& fk) const = 0;

    /// Whether add_foreign_key creates a constraint the database enforces.
    virtual bool enforces_foreign_keys() const = 0;

    // ---- DML ---------------------------------------------------------------

    std::string select(const select_spec& spec) const;

    /// INSERT with one placeholder per column. An empty column list inserts
    /// a row of defaults.
    std::string insert(const std::string& table, const std::vector<std::string>& columns) const;

    /// UPDATE ... SET c = ? ... WHERE id = ?
    std::string update(const std::string& table, const std::vector<std::string>& columns) const;

    /// DELETE ... WHERE id = ?
    std::string remove(const std::string& table) const;

    /// Escapes LIKE wildcards in a user search term and wraps it in %...%.
    std::string like_pattern(const std::string& term) const;

    // ---- catalog -----------------------------------------------------------

    /// Reads the live definition of a table. Throws not_found_error when it
    /// does not exist.
    virtual table_shape read_table_shape(connection& conn, const std::string& table) const = 0;

    /// Base tables in the connection's database, sorted by name.
    virtual std::vector<std::string> list_tables(connection& conn) const = 0;

protected:
    virtual char quote_char() const = 0;
    virtual std::string insert_defaults_clause() const = 0;
    virtual std::string unbounded_limit() const = 0;
    virtual std::string lock_clause() const = 0;

    std::string column_definition(const column_spec& column) const;
};

class sqlite_dialect : public dialect {
public:
    dialect_kind kind() const override { return dialect_kind::sqlite; }
    size_t max_identifier_length() const override { return 128; }
    void validate_identifier(const std::string& name) const override;

    std::string physical_type(semantic_type type) const override;

    statement_plan create_table(const std::string& table,
                                const std::vector<column_spec>& columns) const override;
    statement_plan drop_column(const table_shape& shape, const std::string& column) const override;
    statement_plan rename_column(const table_shape& shape, const std::string& from,
                                 const std::string& to) const override;
    statement_plan change_column_type(const table_shape& shape, const std::string& column,
                                      semantic_type type) const override;
    statement_plan add_foreign_key(const table_shape& shape,
                                   const foreign_key_declaration& fk) const override;
    statement_plan drop_foreign_key(const table_shape& shape,
                                    const foreign_key_declaration& fk) const override;
    bool enforces_foreign_keys() const override { return false; }

    table_shape read_table_shape(connection& conn, const std::string& table) const override;
    std::vector<std::string> list_tables(connection& conn) const override;

    /// Name of the temporary table a copy-and-swap builds.
    static std::string shadow_name(const std::string& table) { return "_shadow_" + table; }

    /// CREATE TABLE text reproducing a shape under another name.
    std::string create_statement(const table_shape& shape, const std::string& name) const;

protected:
    char quote_char() const override { return '"'; }
    std::string insert_defaults_clause() const override { return " DEFAULT VALUES"; }
    std::string unbounded_limit() const override { return "-1"; }
    std::string lock_clause() const override { return ""; }

private:
    struct copy_column {
        std::string target;
        std::string source_expression;
    };

    statement_plan rebuild(const table_shape& current, const table_shape& target,
                           const std::vector<copy_column>& copies) const;
    std::string cast_expression(const std::string& column, semantic_type type) const;
};

class mysql_dialect : public dialect {
public:
    dialect_kind kind() const override { return dialect_kind::mysql; }
    size_t max_identifier_length() const override { return 64; }

    std::string physical_type(semantic_type type) const override;

    statement_plan create_table(const std::string& table,
                                const std::vector<column_spec>& columns) const override;
    statement_plan drop_column(const table_shape& shape, const std::string& column) const override;
    statement_plan rename_column(const table_shape& shape, const std::string& from,
                                 const std::string& to) const override;
    statement_plan change_column_type(const table_shape& shape, const std::string& column,
                                      semantic_type type) const override;
    statement_plan add_foreign_key(const table_shape& shape,
                                   const foreign_key_declaration& fk) const override;
    statement_plan drop_foreign_key(const table_shape& shape,
                                    const foreign_key_declaration& fk) const override;
    bool enforces_foreign_keys() const override { return true; }

    table_shape read_table_shape(connection& conn, const std::string& table) const override;
    std::vector<std::string> list_tables(connection& conn) const override;

protected:
    char quote_char() const override { return '`'; }
    std::string insert_defaults_clause() const override { return " () VALUES ()"; }
    std::string unbounded_limit() const override { return "18446744073709551615"; }
    std::string lock_clause() const override { return " FOR UPDATE"; }
};

} // namespace tablekit

#endif // __cplusplus
