#include "tablekit/dialect.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace tablekit {

namespace {

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

// Catalog names (sqlite_autoindex_*) do not pass validate_identifier but
// still have to be quoted for PRAGMA calls.
std::string catalog_quote(const std::string& name) {
    if (name.find('"') != std::string::npos) {
        throw validation_error("Unexpected quote in catalog name " + name, name);
    }
    return "\"" + name + "\"";
}

} // namespace

void sqlite_dialect::validate_identifier(const std::string& name) const {
    dialect::validate_identifier(name);
    if (to_upper(name.substr(0, 7)) == "SQLITE_") {
        throw validation_error("Identifier '" + name + "' uses the reserved sqlite_ prefix", name);
    }
}

std::string sqlite_dialect::physical_type(semantic_type type) const {
    switch (type) {
        case semantic_type::text: return "TEXT";
        case semantic_type::integer: return "INTEGER";
        case semantic_type::real: return "REAL";
        case semantic_type::boolean: return "BOOLEAN";
        case semantic_type::timestamp: return "DATETIME";
        case semantic_type::foreign_key: return "INTEGER";
        case semantic_type::unsupported: break;
    }
    throw validation_error("Column type is not supported by sqlite");
}

statement_plan sqlite_dialect::create_table(const std::string& table,
                                            const std::vector<column_spec>& columns) const {
    std::ostringstream sql;
    sql << "CREATE TABLE " << quote(table) << " ("
        << quote(id_column) << " INTEGER PRIMARY KEY AUTOINCREMENT, "
        << quote(created_column) << " DATETIME NOT NULL DEFAULT (datetime('now')), "
        << quote(updated_column) << " DATETIME NOT NULL DEFAULT (datetime('now'))";
    for (const auto& col : columns) {
        sql << ", " << column_definition(col);
    }
    sql << ")";

    statement_plan plan;
    plan.statements.push_back(sql.str());
    return plan;
}

statement_plan sqlite_dialect::rename_column(const table_shape& shape, const std::string& from,
                                             const std::string& to) const {
    // Native since SQLite 3.25; also rewrites indexes and triggers.
    statement_plan plan;
    plan.statements.push_back("ALTER TABLE " + quote(shape.name) + " RENAME COLUMN " +
                              quote(from) + " TO " + quote(to));
    return plan;
}

statement_plan sqlite_dialect::drop_column(const table_shape& shape, const std::string& column) const {
    table_shape target;
    target.name = shape.name;
    std::vector<copy_column> copies;
    for (const auto& col : shape.columns) {
        if (col.name == column) continue;
        target.columns.push_back(col);
        copies.push_back({col.name, quote(col.name)});
    }
    for (const auto& fk : shape.foreign_keys) {
        if (fk.column != column) target.foreign_keys.push_back(fk);
    }
    for (const auto& idx : shape.indexes) {
        if (std::find(idx.columns.begin(), idx.columns.end(), column) == idx.columns.end()) {
            target.indexes.push_back(idx);
        } else {
            LOG_INFO("dialect", "Index %s on %s goes away with column %s",
                     idx.name.c_str(), shape.name.c_str(), column.c_str());
        }
    }
    target.triggers = shape.triggers;
    return rebuild(shape, target, copies);
}

statement_plan sqlite_dialect::change_column_type(const table_shape& shape, const std::string& column,
                                                  semantic_type type) const {
    table_shape target = shape;
    std::vector<copy_column> copies;
    for (auto& col : target.columns) {
        if (col.name == column) {
            if (classify(col.type) != type) {
                col.default_sql.reset();
            }
            col.type = physical_type(type);
            copies.push_back({col.name, cast_expression(col.name, type)});
        } else {
            copies.push_back({col.name, quote(col.name)});
        }
    }
    return rebuild(shape, target, copies);
}

statement_plan sqlite_dialect::add_foreign_key(const table_shape& shape,
                                               const foreign_key_declaration& fk) const {
    // No ALTER TABLE ADD CONSTRAINT in SQLite. The relationship is recorded
    // as advisory metadata; the index keeps lookups on the column cheap.
    statement_plan plan;
    plan.statements.push_back("CREATE INDEX IF NOT EXISTS " + quote(index_name(fk.constraint_name)) +
                              " ON " + quote(shape.name) + " (" + quote(fk.column_name) + ")");
    return plan;
}

statement_plan sqlite_dialect::drop_foreign_key(const table_shape&,
                                                const foreign_key_declaration& fk) const {
    statement_plan plan;
    plan.statements.push_back("DROP INDEX IF EXISTS " + quote(index_name(fk.constraint_name)));
    return plan;
}

std::string sqlite_dialect::cast_expression(const std::string& column, semantic_type type) const {
    std::string c = quote(column);
    switch (type) {
        case semantic_type::text:
            return "CAST(" + c + " AS TEXT)";
        case semantic_type::integer:
        case semantic_type::foreign_key:
            return "CAST(" + c + " AS INTEGER)";
        case semantic_type::real:
            return "CAST(" + c + " AS REAL)";
        case semantic_type::boolean:
            return "CASE WHEN " + c + " IS NULL THEN NULL WHEN lower(CAST(" + c +
                   " AS TEXT)) IN ('0', 'false', '0.0') THEN 0 ELSE 1 END";
        case semantic_type::timestamp:
            return "CASE WHEN typeof(" + c + ") IN ('integer', 'real') THEN datetime(" + c +
                   ", 'unixepoch') ELSE datetime(" + c + ") END";
        case semantic_type::unsupported:
            break;
    }
    throw validation_error("Column type is not supported by sqlite", column);
}

std::string sqlite_dialect::create_statement(const table_shape& shape, const std::string& name) const {
    size_t pk_count = std::count_if(shape.columns.begin(), shape.columns.end(),
                                    [](const physical_column& c) { return c.primary_key; });

    std::ostringstream sql;
    sql << "CREATE TABLE " << quote(name) << " (";
    bool first = true;
    for (const auto& col : shape.columns) {
        if (!first) sql << ", ";
        sql << quote(col.name);
        if (!col.type.empty()) sql << " " << col.type;
        if (col.primary_key && pk_count == 1) {
            sql << " PRIMARY KEY";
            if (col.auto_increment) sql << " AUTOINCREMENT";
        }
        if (col.not_null) sql << " NOT NULL";
        if (col.default_sql) sql << " DEFAULT (" << *col.default_sql << ")";
        first = false;
    }
    if (pk_count > 1) {
        sql << ", PRIMARY KEY (";
        bool first_pk = true;
        for (const auto& col : shape.columns) {
            if (!col.primary_key) continue;
            if (!first_pk) sql << ", ";
            sql << quote(col.name);
            first_pk = false;
        }
        sql << ")";
    }
    for (const auto& fk : shape.foreign_keys) {
        sql << ", FOREIGN KEY (" << quote(fk.column) << ") REFERENCES " << quote(fk.referenced_table)
            << " (" << quote(fk.referenced_column) << ") ON DELETE " << fk.on_delete
            << " ON UPDATE " << fk.on_update;
    }
    sql << ")";
    return sql.str();
}

statement_plan sqlite_dialect::rebuild(const table_shape& current, const table_shape& target,
                                       const std::vector<copy_column>& copies) const {
    const std::string& table = current.name;
    std::string shadow = shadow_name(table);

    statement_plan plan;
    plan.natively_atomic = false;
    plan.requires_foreign_keys_off = true;

    // 1. Shadow table with the final column set
    plan.statements.push_back("DROP TABLE IF EXISTS " + quote(shadow));
    plan.statements.push_back(create_statement(target, shadow));

    // 2. Copy every row, converting where the column changed
    if (!copies.empty()) {
        std::string dest_str;
        std::string src_str;
        for (size_t i = 0; i < copies.size(); ++i) {
            if (i > 0) {
                dest_str += ", ";
                src_str += ", ";
            }
            dest_str += quote(copies[i].target);
            src_str += copies[i].source_expression;
        }
        plan.statements.push_back("INSERT INTO " + quote(shadow) + " (" + dest_str + ") SELECT " +
                                  src_str + " FROM " + quote(table));
    }

    // Keep the AUTOINCREMENT high-water mark so deleted ids are never reused.
    bool has_autoincrement = std::any_of(current.columns.begin(), current.columns.end(),
                                         [](const physical_column& c) { return c.auto_increment; });
    if (has_autoincrement) {
        plan.statements.push_back("DELETE FROM sqlite_sequence WHERE name = '" + shadow + "'");
        plan.statements.push_back("INSERT INTO sqlite_sequence (name, seq) SELECT '" + shadow +
                                  "', seq FROM sqlite_sequence WHERE name = '" + table + "'");
    }

    // 3. Drop the original (its indexes and triggers go with it)
    plan.statements.push_back("DROP TABLE " + quote(table));

    // 4. Swap the shadow into place
    plan.statements.push_back("ALTER TABLE " + quote(shadow) + " RENAME TO " + quote(table));

    // 5. Secondary indexes and triggers
    for (const auto& idx : target.indexes) {
        if (idx.primary) continue;
        if (idx.definition) {
            plan.statements.push_back(*idx.definition);
        } else if (idx.unique) {
            std::string name = "uq_" + table;
            std::string cols;
            for (const auto& c : idx.columns) {
                name += "_" + c;
                if (!cols.empty()) cols += ", ";
                cols += quote(c);
            }
            plan.statements.push_back("CREATE UNIQUE INDEX IF NOT EXISTS " + catalog_quote(name) +
                                      " ON " + quote(table) + " (" + cols + ")");
        }
    }
    for (const auto& trigger : target.triggers) {
        plan.statements.push_back(trigger);
    }

    return plan;
}

table_shape sqlite_dialect::read_table_shape(connection& conn, const std::string& table) const {
    auto info = conn.query("PRAGMA table_info(" + quote(table) + ")");
    if (info.empty()) {
        throw not_found_error("Table not found: " + table, table);
    }

    table_shape shape;
    shape.name = table;

    auto master = conn.query("SELECT sql FROM sqlite_master WHERE type='table' AND name=?", {table});
    bool autoincrement = !master.empty() &&
        to_upper(column_text(master[0], "sql")).find("AUTOINCREMENT") != std::string::npos;

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    size_t pk_count = 0;
    for (const auto& row : info) {
        physical_column col;
        col.name = column_text(row, "name");
        col.type = to_upper(column_text(row, "type"));
        col.not_null = column_int(row, "notnull") != 0;
        col.default_sql = column_optional_text(row, "dflt_value");
        col.primary_key = column_int(row, "pk") > 0;
        if (col.primary_key) ++pk_count;
        shape.columns.push_back(std::move(col));
    }
    for (auto& col : shape.columns) {
        col.auto_increment = autoincrement && col.primary_key && pk_count == 1;
    }

    // PRAGMA foreign_key_list returns: id, seq, table, from, to, on_update, on_delete, match
    for (const auto& row : conn.query("PRAGMA foreign_key_list(" + quote(table) + ")")) {
        physical_foreign_key fk;
        fk.column = column_text(row, "from");
        fk.referenced_table = column_text(row, "table");
        fk.referenced_column = column_is_null(row, "to") ? std::string(id_column) : column_text(row, "to");
        fk.on_delete = column_text(row, "on_delete");
        fk.on_update = column_text(row, "on_update");
        shape.foreign_keys.push_back(std::move(fk));
    }

    // PRAGMA index_list returns: seq, name, unique, origin, partial
    for (const auto& row : conn.query("PRAGMA index_list(" + quote(table) + ")")) {
        physical_index idx;
        idx.name = column_text(row, "name");
        idx.unique = column_int(row, "unique") != 0;
        std::string origin = column_text(row, "origin");
        idx.primary = origin == "pk";
        for (const auto& col : conn.query("PRAGMA index_info(" + catalog_quote(idx.name) + ")")) {
            idx.columns.push_back(column_text(col, "name"));
        }
        if (origin == "c") {
            auto def = conn.query("SELECT sql FROM sqlite_master WHERE type='index' AND name=?", {idx.name});
            if (!def.empty() && !column_is_null(def[0], "sql")) {
                idx.definition = column_text(def[0], "sql");
            }
        }
        shape.indexes.push_back(std::move(idx));
    }

    for (const auto& row : conn.query("SELECT sql FROM sqlite_master WHERE type='trigger' AND tbl_name=?", {table})) {
        if (!column_is_null(row, "sql")) {
            shape.triggers.push_back(column_text(row, "sql"));
        }
    }

    return shape;
}

std::vector<std::string> sqlite_dialect::list_tables(connection& conn) const {
    std::vector<std::string> tables;
    auto rows = conn.query("SELECT name FROM sqlite_master WHERE type='table' "
                           "AND name NOT LIKE 'sqlite!_%' ESCAPE '!' ORDER BY name");
    for (const auto& row : rows) {
        tables.push_back(column_text(row, "name"));
    }
    return tables;
}

} // namespace tablekit
