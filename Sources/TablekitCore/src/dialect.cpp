#include "tablekit/dialect.hpp"
#include "tablekit/errors.hpp"
#include <cctype>
#include <cstdio>
#include <sstream>

namespace tablekit {

namespace {

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Declared base type (before any "(" or modifier) -> semantic type.
// TINYINT(1) is matched before this table because MySQL reports booleans
// that way.
struct type_mapping {
    const char* base;
    semantic_type type;
};

constexpr type_mapping type_mappings[] = {
    {"INTEGER", semantic_type::integer},
    {"INT", semantic_type::integer},
    {"BIGINT", semantic_type::integer},
    {"SMALLINT", semantic_type::integer},
    {"MEDIUMINT", semantic_type::integer},
    {"TINYINT", semantic_type::integer},
    {"INT2", semantic_type::integer},
    {"INT8", semantic_type::integer},
    {"TEXT", semantic_type::text},
    {"VARCHAR", semantic_type::text},
    {"CHAR", semantic_type::text},
    {"NVARCHAR", semantic_type::text},
    {"NCHAR", semantic_type::text},
    {"CLOB", semantic_type::text},
    {"TINYTEXT", semantic_type::text},
    {"MEDIUMTEXT", semantic_type::text},
    {"LONGTEXT", semantic_type::text},
    {"CHARACTER", semantic_type::text},
    {"REAL", semantic_type::real},
    {"DOUBLE", semantic_type::real},
    {"FLOAT", semantic_type::real},
    {"NUMERIC", semantic_type::real},
    {"DECIMAL", semantic_type::real},
    {"BOOLEAN", semantic_type::boolean},
    {"BOOL", semantic_type::boolean},
    {"DATETIME", semantic_type::timestamp},
    {"TIMESTAMP", semantic_type::timestamp},
    {"DATE", semantic_type::timestamp},
};

uint32_t fnv1a(const std::string& s) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

} // namespace

std::unique_ptr<dialect> dialect::create(dialect_kind kind) {
    switch (kind) {
        case dialect_kind::sqlite: return std::make_unique<sqlite_dialect>();
        case dialect_kind::mysql: return std::make_unique<mysql_dialect>();
    }
    throw fatal_error("Unknown dialect");
}

void dialect::validate_identifier(const std::string& name) const {
    if (name.empty()) {
        throw validation_error("Identifier must not be empty", name);
    }
    if (name.size() > max_identifier_length()) {
        throw validation_error("Identifier '" + name + "' is longer than " +
                               std::to_string(max_identifier_length()) + " characters", name);
    }
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && first != '_') {
        throw validation_error("Identifier '" + name + "' must start with a letter or underscore", name);
    }
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '_') {
            throw validation_error("Identifier '" + name + "' may only contain letters, digits and underscores", name);
        }
    }
}

std::string dialect::quote(const std::string& name) const {
    validate_identifier(name);
    char q = quote_char();
    return q + name + q;
}

std::string dialect::constraint_name(const std::string& table, const std::string& column,
                                     const std::string& referenced_table,
                                     const std::string& referenced_column) const {
    std::string name = "fk_" + table + "_" + column + "_" + referenced_table + "_" + referenced_column;
    if (name.size() <= max_identifier_length()) {
        return name;
    }
    char suffix[10];
    std::snprintf(suffix, sizeof(suffix), "_%08x", fnv1a(name));
    return name.substr(0, max_identifier_length() - 9) + suffix;
}

std::string dialect::index_name(const std::string& constraint) const {
    std::string name = "idx_" + constraint;
    if (name.size() <= max_identifier_length()) {
        return name;
    }
    char suffix[10];
    std::snprintf(suffix, sizeof(suffix), "_%08x", fnv1a(name));
    return name.substr(0, max_identifier_length() - 9) + suffix;
}

semantic_type dialect::classify(const std::string& declared) const {
    std::string type = to_upper(trim(declared));
    if (type.rfind("TINYINT(1)", 0) == 0) {
        return semantic_type::boolean;
    }
    size_t end = type.find_first_of("( ");
    std::string base = end == std::string::npos ? type : type.substr(0, end);
    for (const auto& mapping : type_mappings) {
        if (base == mapping.base) {
            return mapping.type;
        }
    }
    return semantic_type::unsupported;
}

std::string dialect::fill_literal(semantic_type type) const {
    switch (type) {
        case semantic_type::text: return "''";
        case semantic_type::timestamp: return "'1970-01-01 00:00:00'";
        case semantic_type::integer:
        case semantic_type::real:
        case semantic_type::boolean:
        case semantic_type::foreign_key:
            return "0";
        case semantic_type::unsupported:
            break;
    }
    throw validation_error("Unsupported column type");
}

std::string dialect::column_definition(const column_spec& column) const {
    return quote(column.name) + " " + physical_type(column.type) + (column.nullable ? "" : " NOT NULL");
}

statement_plan dialect::drop_table(const std::string& table) const {
    statement_plan plan;
    plan.statements.push_back("DROP TABLE " + quote(table));
    return plan;
}

statement_plan dialect::add_column(const table_shape& shape, const column_spec& column) const {
    // Both dialects add columns natively. A NOT NULL column needs a default
    // so that existing rows stay valid.
    std::string sql = "ALTER TABLE " + quote(shape.name) + " ADD COLUMN " + column_definition(column);
    if (!column.nullable) {
        sql += " DEFAULT " + fill_literal(column.type);
    }
    statement_plan plan;
    plan.statements.push_back(std::move(sql));
    return plan;
}

std::string dialect::select(const select_spec& spec) const {
    std::ostringstream sql;
    sql << "SELECT ";
    if (spec.columns.empty()) {
        sql << "*";
    } else {
        bool first = true;
        for (const auto& col : spec.columns) {
            if (!first) sql << ", ";
            sql << quote(col);
            first = false;
        }
    }
    sql << " FROM " << quote(spec.table);

    if (!spec.where.empty()) {
        sql << " WHERE ";
        bool first = true;
        for (const auto& cond : spec.where) {
            if (!first) sql << " AND ";
            sql << quote(cond.column);
            switch (cond.op) {
                case condition_op::equals: sql << " = ?"; break;
                case condition_op::is_null: sql << " IS NULL"; break;
                case condition_op::like: sql << " LIKE ? ESCAPE '!'"; break;
            }
            first = false;
        }
    }

    if (!spec.order.empty()) {
        sql << " ORDER BY ";
        bool first = true;
        for (const auto& key : spec.order) {
            if (!first) sql << ", ";
            sql << quote(key.column) << (key.descending ? " DESC" : " ASC");
            first = false;
        }
    }

    if (spec.limit) {
        sql << " LIMIT " << *spec.limit;
        if (spec.offset > 0) sql << " OFFSET " << spec.offset;
    } else if (spec.offset > 0) {
        sql << " LIMIT " << unbounded_limit() << " OFFSET " << spec.offset;
    }

    if (spec.for_update) {
        sql << lock_clause();
    }
    return sql.str();
}

std::string dialect::insert(const std::string& table, const std::vector<std::string>& columns) const {
    std::ostringstream sql;
    sql << "INSERT INTO " << quote(table);
    if (columns.empty()) {
        sql << insert_defaults_clause();
        return sql.str();
    }

    sql << " (";
    bool first = true;
    for (const auto& col : columns) {
        if (!first) sql << ", ";
        sql << quote(col);
        first = false;
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";
    return sql.str();
}

std::string dialect::update(const std::string& table, const std::vector<std::string>& columns) const {
    if (columns.empty()) {
        throw validation_error("UPDATE needs at least one column");
    }
    std::ostringstream sql;
    sql << "UPDATE " << quote(table) << " SET ";
    bool first = true;
    for (const auto& col : columns) {
        if (!first) sql << ", ";
        sql << quote(col) << " = ?";
        first = false;
    }
    sql << " WHERE " << quote(id_column) << " = ?";
    return sql.str();
}

std::string dialect::remove(const std::string& table) const {
    return "DELETE FROM " + quote(table) + " WHERE " + quote(id_column) + " = ?";
}

std::string dialect::like_pattern(const std::string& term) const {
    std::string pattern = "%";
    for (char c : term) {
        if (c == '%' || c == '_' || c == '!') {
            pattern += '!';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace tablekit
