#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tablekit {

// Timestamps are second precision and always UTC.
using timestamp_t = std::chrono::sys_seconds;

// Primary key type
using primary_key_t = int64_t;

enum class dialect_kind {
    sqlite,
    mysql
};

inline const char* to_string(dialect_kind kind) {
    return kind == dialect_kind::mysql ? "mysql" : "sqlite";
}

// Value as it crosses the driver boundary. Booleans travel as 0/1 and
// timestamps as "YYYY-MM-DD HH:MM:SS" text.
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

using row_t = std::unordered_map<std::string, column_value_t>;

// Value as the engine hands it to callers.
using field_value_t = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    timestamp_t
>;

using field_map = std::map<std::string, field_value_t>;

enum class semantic_type {
    text,
    integer,
    real,
    boolean,
    timestamp,
    foreign_key,
    unsupported
};

inline const char* to_string(semantic_type type) {
    switch (type) {
        case semantic_type::text: return "text";
        case semantic_type::integer: return "integer";
        case semantic_type::real: return "real";
        case semantic_type::boolean: return "boolean";
        case semantic_type::timestamp: return "timestamp";
        case semantic_type::foreign_key: return "foreign_key";
        case semantic_type::unsupported: return "unsupported";
    }
    return "unsupported";
}

inline std::optional<semantic_type> semantic_type_from_string(const std::string& name) {
    if (name == "text") return semantic_type::text;
    if (name == "integer") return semantic_type::integer;
    if (name == "real") return semantic_type::real;
    if (name == "boolean") return semantic_type::boolean;
    if (name == "timestamp") return semantic_type::timestamp;
    if (name == "foreign_key") return semantic_type::foreign_key;
    return std::nullopt;
}

// System columns carried by every table the engine creates.
inline constexpr const char* id_column = "id";
inline constexpr const char* created_column = "sr_created";
inline constexpr const char* updated_column = "sr_updated";

inline bool is_system_column(const std::string& name) {
    return name == id_column || name == created_column || name == updated_column;
}

struct foreign_key_ref {
    std::string table;
    std::string column;

    bool operator==(const foreign_key_ref&) const = default;
};

/// A physical column as the live catalog reports it.
struct column_descriptor {
    std::string name;
    std::string physical_type;     // uppercase, as declared
    semantic_type type = semantic_type::unsupported;
    bool nullable = true;
    bool primary_key = false;
    bool auto_increment = false;
    std::optional<std::string> default_value;
    std::optional<foreign_key_ref> reference;

    bool operator==(const column_descriptor&) const = default;
};

/// Ordered column list of one physical table.
struct table_structure {
    std::string table;
    std::vector<column_descriptor> columns;

    const column_descriptor* find(const std::string& name) const {
        for (const auto& col : columns) {
            if (col.name == name) return &col;
        }
        return nullptr;
    }

    bool has_column(const std::string& name) const { return find(name) != nullptr; }

    std::vector<std::string> column_names() const {
        std::vector<std::string> names;
        names.reserve(columns.size());
        for (const auto& col : columns) names.push_back(col.name);
        return names;
    }

    bool operator==(const table_structure&) const = default;
};

/// Requested column for CreateTable / AddColumn.
struct column_spec {
    std::string name;
    semantic_type type = semantic_type::text;
    bool nullable = true;

    column_spec() = default;
    column_spec(std::string n, semantic_type t, bool null_ok = true)
        : name(std::move(n)), type(t), nullable(null_ok) {}
};

/// A dynamic record: system columns plus whatever the table declares.
struct item {
    primary_key_t id = 0;
    std::optional<timestamp_t> created;
    std::optional<timestamp_t> updated;
    field_map fields;

    // Computed at read time, never stored (createdRelative, updatedRelative).
    std::map<std::string, int64_t> synthetic;
};

struct table_configuration {
    int64_t id = 0;
    std::string name;
    std::string title;
    int64_t ordinal = 0;
    std::optional<std::string> db;
    std::optional<std::string> create_button_text;
    std::optional<std::string> icon;
};

enum class sort_direction {
    none,
    ascending,
    descending
};

inline const char* to_string(sort_direction dir) {
    switch (dir) {
        case sort_direction::ascending: return "asc";
        case sort_direction::descending: return "desc";
        case sort_direction::none: return "";
    }
    return "";
}

inline sort_direction sort_direction_from_string(const std::string& s) {
    if (s == "asc" || s == "ASC") return sort_direction::ascending;
    if (s == "desc" || s == "DESC") return sort_direction::descending;
    return sort_direction::none;
}

/// One column entry of a saved view.
struct view_column {
    std::string column_name;
    bool visible = true;
    int64_t order = 0;
    std::optional<int64_t> width;
    sort_direction sort = sort_direction::none;
};

struct table_view {
    int64_t id = 0;
    std::string table_name;
    std::string name;
    bool is_default = false;
    std::string view_type = "table";
    std::vector<view_column> columns;
};

enum class fk_action {
    restrict,
    cascade,
    set_null,
    no_action
};

inline const char* to_string(fk_action action) {
    switch (action) {
        case fk_action::restrict: return "RESTRICT";
        case fk_action::cascade: return "CASCADE";
        case fk_action::set_null: return "SET NULL";
        case fk_action::no_action: return "NO ACTION";
    }
    return "RESTRICT";
}

inline std::optional<fk_action> fk_action_from_string(const std::string& s) {
    if (s == "RESTRICT") return fk_action::restrict;
    if (s == "CASCADE") return fk_action::cascade;
    if (s == "SET NULL") return fk_action::set_null;
    if (s == "NO ACTION") return fk_action::no_action;
    return std::nullopt;
}

struct foreign_key_declaration {
    int64_t id = 0;
    std::string constraint_name;
    std::string table_name;
    std::string column_name;
    std::string referenced_table;
    std::string referenced_column;
    fk_action on_delete = fk_action::restrict;
    fk_action on_update = fk_action::restrict;
    // true when the database enforces it, false when only the engine does
    bool enforced = false;
};

struct sort_key {
    std::string column;
    bool descending = false;
};

struct list_query {
    field_map equals;                               // column = value (null means IS NULL)
    std::map<std::string, std::string> contains;    // column LIKE %value%
    std::vector<sort_key> sort;
    std::optional<int64_t> limit;
    int64_t offset = 0;
};

struct effective_column {
    std::string name;
    semantic_type type = semantic_type::unsupported;
    bool visible = true;
    int64_t order = 0;
    std::optional<int64_t> width;
    sort_direction sort = sort_direction::none;
    bool has_entry = false;   // false when the view says nothing about this column
};

struct effective_view {
    std::string table_name;
    std::optional<int64_t> view_id;     // empty when no view exists for the table
    std::string view_name;
    std::string view_type = "table";
    std::vector<effective_column> columns;
};

/// A physical table and the configuration that describes it, if any.
struct database_table_info {
    std::string table_name;
    bool has_configuration = false;
    std::optional<std::string> configuration_title;
};

struct consistency_report {
    std::vector<std::string> missing_physical;   // configured, no table
    std::vector<std::string> orphaned_physical;  // table, not configured

    bool consistent() const { return missing_physical.empty() && orphaned_physical.empty(); }
};

} // namespace tablekit

#endif // __cplusplus
