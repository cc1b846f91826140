#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include "value_codec.hpp"
#include <nlohmann/json.hpp>
#include <string>

// ============================================================================
// nlohmann::json serialization for tablekit types
// ============================================================================

// timestamp_t and field_value_t are std types, so ADL won't find functions in
// the tablekit namespace. Use nlohmann's adl_serializer specialization instead.
namespace nlohmann {

template <>
struct adl_serializer<tablekit::timestamp_t> {
    static void to_json(json& j, const tablekit::timestamp_t& t) {
        j = tablekit::codec::format_timestamp(t);
    }

    static void from_json(const json& j, tablekit::timestamp_t& t) {
        if (j.is_string()) {
            auto parsed = tablekit::codec::parse_timestamp(j.get<std::string>());
            if (!parsed) {
                throw tablekit::validation_error("Invalid timestamp: " + j.get<std::string>());
            }
            t = *parsed;
        } else if (j.is_number_integer()) {
            t = tablekit::timestamp_t(std::chrono::seconds(j.get<int64_t>()));
        } else {
            throw tablekit::validation_error("Timestamp must be a string or epoch seconds");
        }
    }
};

template <>
struct adl_serializer<tablekit::field_value_t> {
    static void to_json(json& j, const tablekit::field_value_t& value) {
        std::visit([&](auto&& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                j = nullptr;
            } else if constexpr (std::is_same_v<T, tablekit::timestamp_t>) {
                j = tablekit::codec::format_timestamp(v);
            } else {
                j = v;
            }
        }, value);
    }

    // JSON carries no timestamp type: timestamps arrive as strings and are
    // converted by the column coercion.
    static void from_json(const json& j, tablekit::field_value_t& value) {
        if (j.is_null()) {
            value = nullptr;
        } else if (j.is_boolean()) {
            value = j.get<bool>();
        } else if (j.is_number_integer()) {
            value = j.get<int64_t>();
        } else if (j.is_number_float()) {
            value = j.get<double>();
        } else if (j.is_string()) {
            value = j.get<std::string>();
        } else {
            throw tablekit::validation_error("Field values must be null, boolean, number or string");
        }
    }
};

} // namespace nlohmann

namespace tablekit {

using json = nlohmann::json;

inline void to_json(json& j, semantic_type type) {
    j = to_string(type);
}

inline void from_json(const json& j, semantic_type& type) {
    auto parsed = j.is_string() ? semantic_type_from_string(j.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw validation_error("Unknown column type " + j.dump(), "type");
    }
    type = *parsed;
}

inline void to_json(json& j, fk_action action) {
    j = to_string(action);
}

inline void from_json(const json& j, fk_action& action) {
    auto parsed = j.is_string() ? fk_action_from_string(j.get<std::string>()) : std::nullopt;
    if (!parsed) {
        throw validation_error("Unknown referential action " + j.dump(), "on_delete");
    }
    action = *parsed;
}

/// Parses a request payload into a field map. Throws validation_error for
/// anything but a JSON object of scalars.
inline field_map parse_field_map(const json& j) {
    if (!j.is_object()) {
        throw validation_error("Fields must be a JSON object", "fields");
    }
    field_map fields;
    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            fields[it.key()] = it.value().get<field_value_t>();
        } catch (const validation_error& e) {
            throw validation_error(e.what(), it.key());
        }
    }
    return fields;
}

inline void to_json(json& j, const item& record) {
    j = json{{"id", record.id}, {"fields", record.fields}};
    j["created"] = record.created ? json(*record.created) : json(nullptr);
    j["updated"] = record.updated ? json(*record.updated) : json(nullptr);
    for (const auto& [name, seconds] : record.synthetic) {
        j[name] = seconds;
    }
}

inline void to_json(json& j, const column_descriptor& col) {
    j = json{
        {"name", col.name},
        {"physicalType", col.physical_type},
        {"type", col.type},
        {"nullable", col.nullable},
        {"primaryKey", col.primary_key}
    };
    if (col.reference) {
        j["references"] = json{{"table", col.reference->table}, {"column", col.reference->column}};
    }
}

inline void to_json(json& j, const table_structure& structure) {
    j = json{{"table", structure.table}, {"columns", structure.columns}};
}

inline void to_json(json& j, const database_table_info& info) {
    j = json{
        {"tableName", info.table_name},
        {"hasConfiguration", info.has_configuration},
        {"configurationTitle", info.configuration_title ? json(*info.configuration_title) : json(nullptr)}
    };
}

inline void to_json(json& j, const table_configuration& config) {
    j = json{
        {"id", config.id},
        {"name", config.name},
        {"title", config.title},
        {"ordinal", config.ordinal},
        {"db", config.db ? json(*config.db) : json(nullptr)},
        {"createButtonText", config.create_button_text ? json(*config.create_button_text) : json(nullptr)},
        {"icon", config.icon ? json(*config.icon) : json(nullptr)}
    };
}

inline void from_json(const json& j, table_configuration& config) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        throw validation_error("Table configuration needs a name", "name");
    }
    config.name = j["name"].get<std::string>();
    if (j.contains("id") && j["id"].is_number_integer()) config.id = j["id"].get<int64_t>();
    if (j.contains("title") && j["title"].is_string()) config.title = j["title"].get<std::string>();
    if (j.contains("ordinal") && j["ordinal"].is_number_integer()) config.ordinal = j["ordinal"].get<int64_t>();
    if (j.contains("db") && j["db"].is_string()) config.db = j["db"].get<std::string>();
    if (j.contains("createButtonText") && j["createButtonText"].is_string()) {
        config.create_button_text = j["createButtonText"].get<std::string>();
    }
    if (j.contains("icon") && j["icon"].is_string()) config.icon = j["icon"].get<std::string>();
}

inline void to_json(json& j, const view_column& col) {
    j = json{
        {"columnName", col.column_name},
        {"isVisible", col.visible},
        {"columnOrder", col.order},
        {"columnWidth", col.width ? json(*col.width) : json(nullptr)},
        {"sortOrder", col.sort == sort_direction::none ? json(nullptr) : json(to_string(col.sort))}
    };
}

inline void from_json(const json& j, view_column& col) {
    if (!j.is_object() || !j.contains("columnName") || !j["columnName"].is_string()) {
        throw validation_error("View column needs a columnName", "columnName");
    }
    col.column_name = j["columnName"].get<std::string>();
    if (j.contains("isVisible") && j["isVisible"].is_boolean()) col.visible = j["isVisible"].get<bool>();
    if (j.contains("columnOrder") && j["columnOrder"].is_number_integer()) col.order = j["columnOrder"].get<int64_t>();
    if (j.contains("columnWidth") && j["columnWidth"].is_number_integer()) col.width = j["columnWidth"].get<int64_t>();
    if (j.contains("sortOrder") && j["sortOrder"].is_string()) {
        col.sort = sort_direction_from_string(j["sortOrder"].get<std::string>());
    }
}

inline void to_json(json& j, const table_view& view) {
    j = json{
        {"id", view.id},
        {"tableName", view.table_name},
        {"viewName", view.name},
        {"isDefault", view.is_default},
        {"viewType", view.view_type},
        {"columns", view.columns}
    };
}

inline void from_json(const json& j, table_view& view) {
    if (!j.is_object()) {
        throw validation_error("View must be a JSON object");
    }
    if (j.contains("id") && j["id"].is_number_integer()) view.id = j["id"].get<int64_t>();
    if (j.contains("tableName") && j["tableName"].is_string()) view.table_name = j["tableName"].get<std::string>();
    if (j.contains("viewName") && j["viewName"].is_string()) view.name = j["viewName"].get<std::string>();
    if (j.contains("isDefault") && j["isDefault"].is_boolean()) view.is_default = j["isDefault"].get<bool>();
    if (j.contains("viewType") && j["viewType"].is_string()) view.view_type = j["viewType"].get<std::string>();
    if (j.contains("columns")) {
        if (!j["columns"].is_array()) {
            throw validation_error("View columns must be an array", "columns");
        }
        view.columns = j["columns"].get<std::vector<view_column>>();
    }
}

inline void to_json(json& j, const foreign_key_declaration& fk) {
    j = json{
        {"id", fk.id},
        {"constraintName", fk.constraint_name},
        {"tableName", fk.table_name},
        {"columnName", fk.column_name},
        {"referencedTable", fk.referenced_table},
        {"referencedColumn", fk.referenced_column},
        {"onDelete", fk.on_delete},
        {"onUpdate", fk.on_update},
        {"enforced", fk.enforced}
    };
}

inline void to_json(json& j, const effective_column& col) {
    j = json{
        {"name", col.name},
        {"type", col.type},
        {"visible", col.visible},
        {"order", col.order},
        {"width", col.width ? json(*col.width) : json(nullptr)},
        {"sort", col.sort == sort_direction::none ? json(nullptr) : json(to_string(col.sort))}
    };
}

inline void to_json(json& j, const effective_view& view) {
    j = json{
        {"tableName", view.table_name},
        {"viewId", view.view_id ? json(*view.view_id) : json(nullptr)},
        {"viewName", view.view_name},
        {"viewType", view.view_type},
        {"columns", view.columns}
    };
}

inline void to_json(json& j, const consistency_report& report) {
    j = json{
        {"consistent", report.consistent()},
        {"missingPhysical", report.missing_physical},
        {"orphanedPhysical", report.orphaned_physical}
    };
}

/// {"filter": {...}, "contains": {...}, "sort": [{"column", "direction"}],
///  "limit": n, "offset": n}
inline void from_json(const json& j, list_query& query) {
    if (!j.is_object()) {
        throw validation_error("Query must be a JSON object");
    }
    if (j.contains("filter")) {
        query.equals = parse_field_map(j["filter"]);
    }
    if (j.contains("contains")) {
        if (!j["contains"].is_object()) {
            throw validation_error("contains must be a JSON object", "contains");
        }
        for (auto it = j["contains"].begin(); it != j["contains"].end(); ++it) {
            if (!it.value().is_string()) {
                throw validation_error("Search terms must be strings", it.key());
            }
            query.contains[it.key()] = it.value().get<std::string>();
        }
    }
    if (j.contains("sort")) {
        if (!j["sort"].is_array()) {
            throw validation_error("sort must be an array", "sort");
        }
        for (const auto& entry : j["sort"]) {
            if (!entry.is_object() || !entry.contains("column") || !entry["column"].is_string()) {
                throw validation_error("Sort entries need a column", "sort");
            }
            sort_key key;
            key.column = entry["column"].get<std::string>();
            key.descending = entry.contains("direction") && entry["direction"].is_string() &&
                             sort_direction_from_string(entry["direction"].get<std::string>()) ==
                                 sort_direction::descending;
            query.sort.push_back(std::move(key));
        }
    }
    if (j.contains("limit")) {
        if (!j["limit"].is_number_integer()) {
            throw validation_error("limit must be an integer", "limit");
        }
        query.limit = j["limit"].get<int64_t>();
    }
    if (j.contains("offset")) {
        if (!j["offset"].is_number_integer()) {
            throw validation_error("offset must be an integer", "offset");
        }
        query.offset = j["offset"].get<int64_t>();
    }
}

} // namespace tablekit

#endif // __cplusplus
