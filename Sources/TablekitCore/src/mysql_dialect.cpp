#include "tablekit/dialect.hpp"
#include "tablekit/errors.hpp"
#include <cctype>
#include <map>
#include <sstream>

namespace tablekit {

namespace {

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

const physical_column& require_column(const table_shape& shape, const std::string& column) {
    const physical_column* col = shape.find(column);
    if (!col) {
        throw not_found_error("Column " + column + " not found in " + shape.name, column);
    }
    return *col;
}

} // namespace

std::string mysql_dialect::physical_type(semantic_type type) const {
    switch (type) {
        case semantic_type::text: return "VARCHAR(255)";
        case semantic_type::integer: return "BIGINT";
        case semantic_type::real: return "DOUBLE";
        case semantic_type::boolean: return "TINYINT(1)";
        case semantic_type::timestamp: return "DATETIME";
        case semantic_type::foreign_key: return "BIGINT";
        case semantic_type::unsupported: break;
    }
    throw validation_error("Column type is not supported by mysql");
}

statement_plan mysql_dialect::create_table(const std::string& table,
                                           const std::vector<column_spec>& columns) const {
    std::ostringstream sql;
    sql << "CREATE TABLE " << quote(table) << " ("
        << quote(id_column) << " BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY, "
        << quote(created_column) << " DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP, "
        << quote(updated_column) << " DATETIME NOT NULL DEFAULT CURRENT_TIMESTAMP ON UPDATE CURRENT_TIMESTAMP";
    for (const auto& col : columns) {
        sql << ", " << column_definition(col);
    }
    sql << ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4";

    statement_plan plan;
    plan.statements.push_back(sql.str());
    return plan;
}

statement_plan mysql_dialect::drop_column(const table_shape& shape, const std::string& column) const {
    require_column(shape, column);
    statement_plan plan;
    plan.statements.push_back("ALTER TABLE " + quote(shape.name) + " DROP COLUMN " + quote(column));
    return plan;
}

statement_plan mysql_dialect::rename_column(const table_shape& shape, const std::string& from,
                                            const std::string& to) const {
    require_column(shape, from);
    statement_plan plan;
    plan.statements.push_back("ALTER TABLE " + quote(shape.name) + " RENAME COLUMN " +
                              quote(from) + " TO " + quote(to));
    return plan;
}

statement_plan mysql_dialect::change_column_type(const table_shape& shape, const std::string& column,
                                                 semantic_type type) const {
    const auto& col = require_column(shape, column);
    // MODIFY restates the whole definition; keep NOT NULL so it is not lost.
    std::string sql = "ALTER TABLE " + quote(shape.name) + " MODIFY COLUMN " + quote(column) + " " +
                      physical_type(type);
    if (col.not_null) {
        sql += " NOT NULL";
    }
    statement_plan plan;
    plan.statements.push_back(std::move(sql));
    return plan;
}

statement_plan mysql_dialect::add_foreign_key(const table_shape& shape,
                                              const foreign_key_declaration& fk) const {
    require_column(shape, fk.column_name);
    statement_plan plan;
    plan.statements.push_back("ALTER TABLE " + quote(shape.name) + " ADD CONSTRAINT " +
                              quote(fk.constraint_name) + " FOREIGN KEY (" + quote(fk.column_name) +
                              ") REFERENCES " + quote(fk.referenced_table) + " (" +
                              quote(fk.referenced_column) + ") ON DELETE " + to_string(fk.on_delete) +
                              " ON UPDATE " + to_string(fk.on_update));
    return plan;
}

statement_plan mysql_dialect::drop_foreign_key(const table_shape& shape,
                                               const foreign_key_declaration& fk) const {
    statement_plan plan;
    plan.statements.push_back("ALTER TABLE " + quote(shape.name) + " DROP FOREIGN KEY " +
                              quote(fk.constraint_name));
    return plan;
}

table_shape mysql_dialect::read_table_shape(connection& conn, const std::string& table) const {
    validate_identifier(table);

    auto columns = conn.query(
        "SELECT COLUMN_NAME AS name, COLUMN_TYPE AS type, IS_NULLABLE AS nullable, "
        "COLUMN_DEFAULT AS dflt, COLUMN_KEY AS col_key, EXTRA AS extra "
        "FROM INFORMATION_SCHEMA.COLUMNS WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
        "ORDER BY ORDINAL_POSITION", {table});
    if (columns.empty()) {
        throw not_found_error("Table not found: " + table, table);
    }

    table_shape shape;
    shape.name = table;
    for (const auto& row : columns) {
        physical_column col;
        col.name = column_text(row, "name");
        col.type = to_upper(column_text(row, "type"));
        col.not_null = column_text(row, "nullable") == "NO";
        col.default_sql = column_optional_text(row, "dflt");
        col.primary_key = column_text(row, "col_key") == "PRI";
        col.auto_increment = to_upper(column_text(row, "extra")).find("AUTO_INCREMENT") != std::string::npos;
        shape.columns.push_back(std::move(col));
    }

    auto fks = conn.query(
        "SELECT k.CONSTRAINT_NAME AS name, k.COLUMN_NAME AS col, "
        "k.REFERENCED_TABLE_NAME AS ref_table, k.REFERENCED_COLUMN_NAME AS ref_col, "
        "r.DELETE_RULE AS on_delete, r.UPDATE_RULE AS on_update "
        "FROM INFORMATION_SCHEMA.KEY_COLUMN_USAGE k "
        "JOIN INFORMATION_SCHEMA.REFERENTIAL_CONSTRAINTS r "
        "ON r.CONSTRAINT_SCHEMA = k.CONSTRAINT_SCHEMA AND r.CONSTRAINT_NAME = k.CONSTRAINT_NAME "
        "AND r.TABLE_NAME = k.TABLE_NAME "
        "WHERE k.TABLE_SCHEMA = DATABASE() AND k.TABLE_NAME = ? AND k.REFERENCED_TABLE_NAME IS NOT NULL "
        "ORDER BY k.CONSTRAINT_NAME, k.ORDINAL_POSITION", {table});
    for (const auto& row : fks) {
        physical_foreign_key fk;
        fk.name = column_text(row, "name");
        fk.column = column_text(row, "col");
        fk.referenced_table = column_text(row, "ref_table");
        fk.referenced_column = column_text(row, "ref_col");
        fk.on_delete = column_text(row, "on_delete");
        fk.on_update = column_text(row, "on_update");
        shape.foreign_keys.push_back(std::move(fk));
    }

    auto stats = conn.query(
        "SELECT INDEX_NAME AS name, COLUMN_NAME AS col, NON_UNIQUE AS non_unique "
        "FROM INFORMATION_SCHEMA.STATISTICS WHERE TABLE_SCHEMA = DATABASE() AND TABLE_NAME = ? "
        "ORDER BY INDEX_NAME, SEQ_IN_INDEX", {table});
    std::map<std::string, size_t> by_name;
    for (const auto& row : stats) {
        std::string name = column_text(row, "name");
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            physical_index idx;
            idx.name = name;
            idx.unique = column_int(row, "non_unique") == 0;
            idx.primary = name == "PRIMARY";
            shape.indexes.push_back(std::move(idx));
            it = by_name.emplace(name, shape.indexes.size() - 1).first;
        }
        shape.indexes[it->second].columns.push_back(column_text(row, "col"));
    }

    return shape;
}

std::vector<std::string> mysql_dialect::list_tables(connection& conn) const {
    std::vector<std::string> tables;
    auto rows = conn.query("SELECT TABLE_NAME AS name FROM INFORMATION_SCHEMA.TABLES "
                           "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' "
                           "ORDER BY TABLE_NAME");
    for (const auto& row : rows) {
        tables.push_back(column_text(row, "name"));
    }
    return tables;
}

} // namespace tablekit
