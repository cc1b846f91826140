#include "tablekit/crud_engine.hpp"
#include "tablekit/metadata_store.hpp"
#include "tablekit/value_codec.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <algorithm>

namespace tablekit {

namespace {

std::optional<timestamp_t> read_timestamp(const row_t& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) return std::nullopt;
    auto value = codec::from_physical(it->second, semantic_type::timestamp);
    if (auto ts = std::get_if<timestamp_t>(&value)) return *ts;
    return std::nullopt;
}

} // namespace

crud_engine::crud_engine(connection& conn, const dialect& d, structure_cache* cache, int64_t max_page_size)
    : conn_(conn), dialect_(d), cache_(cache), max_page_size_(max_page_size > 0 ? max_page_size : 1000) {}

table_structure crud_engine::resolve(const std::string& table) {
    dialect_.validate_identifier(table);

    metadata_store store(conn_, dialect_);
    if (!store.find_table_configuration(table)) {
        throw not_found_error("Unknown table " + table, "table");
    }

    schema_introspector introspector(conn_, dialect_, cache_);
    table_structure structure;
    try {
        structure = introspector.get_table_structure(table);
    } catch (const not_found_error&) {
        LOG_ERROR("crud", "Table %s is configured but missing from the database", table.c_str());
        throw fatal_error("Table " + table + " is configured but has no physical table", table);
    }
    if (!structure.has_column(id_column)) {
        throw fatal_error("Table " + table + " has no " + std::string(id_column) + " column", table);
    }
    return structure;
}

std::vector<std::pair<std::string, field_value_t>> crud_engine::prepare_fields(const table_structure& structure,
                                                                                const field_map& fields) {
    std::vector<std::pair<std::string, field_value_t>> values;
    for (const auto& [name, value] : fields) {
        if (name == id_column) {
            throw validation_error("Column id is assigned by the database", name);
        }
        if (name == created_column || name == updated_column) {
            // Stamped by the engine; the caller's value never wins.
            LOG_DEBUG("crud", "Ignoring caller value for %s", name.c_str());
            continue;
        }
        const column_descriptor* column = structure.find(name);
        if (!column) {
            throw validation_error("Unknown column " + name + " in table " + structure.table, name);
        }
        values.emplace_back(name, codec::coerce(value, *column));
    }
    return values;
}

void crud_engine::check_references(const table_structure& structure,
                                   const std::vector<std::pair<std::string, field_value_t>>& values) {
    // Enforced constraints are the database's job.
    if (dialect_.enforces_foreign_keys()) return;

    for (const auto& [name, value] : values) {
        if (std::holds_alternative<std::nullptr_t>(value)) continue;
        const column_descriptor* column = structure.find(name);
        if (!column || !column->reference) continue;

        select_spec spec;
        spec.table = column->reference->table;
        spec.columns = {column->reference->column};
        spec.where = {{column->reference->column, condition_op::equals}};
        spec.limit = 1;
        auto rows = conn_.query(dialect_.select(spec), {codec::to_physical(value)});
        if (rows.empty()) {
            throw integrity_error("Value " + codec::to_display_string(value) + " for " + name +
                                  " does not exist in " + column->reference->table + "." +
                                  column->reference->column, name);
        }
    }
}

std::vector<row_t> crud_engine::referencing_rows(const foreign_key_declaration& fk, const column_value_t& key) {
    select_spec spec;
    spec.table = fk.table_name;
    spec.where = {{fk.column_name, condition_op::equals}};
    spec.order = {{id_column, false}};
    return conn_.query(dialect_.select(spec), {key});
}

void crud_engine::apply_delete_actions(const std::string& table, const row_t& row, std::set<std::string>& visited) {
    if (dialect_.enforces_foreign_keys()) return;
    visited.insert(table + "#" + std::to_string(column_int(row, id_column)));

    metadata_store store(conn_, dialect_);
    for (const auto& fk : store.list_referencing(table)) {
        if (fk.enforced) continue;
        auto it = row.find(fk.referenced_column);
        if (it == row.end() || std::holds_alternative<std::nullptr_t>(it->second)) continue;
        const column_value_t& key = it->second;

        auto children = referencing_rows(fk, key);
        if (children.empty()) continue;

        switch (fk.on_delete) {
            case fk_action::restrict:
            case fk_action::no_action:
                for (const auto& child : children) {
                    // A row deleted earlier in this cascade no longer counts.
                    if (visited.count(fk.table_name + "#" + std::to_string(column_int(child, id_column)))) continue;
                    throw integrity_error("Row is still referenced by " + fk.table_name + "." + fk.column_name,
                                          fk.column_name);
                }
                break;
            case fk_action::cascade:
                for (const auto& child : children) {
                    primary_key_t child_id = column_int(child, id_column);
                    if (visited.count(fk.table_name + "#" + std::to_string(child_id))) continue;
                    apply_delete_actions(fk.table_name, child, visited);
                    conn_.execute(dialect_.remove(fk.table_name), {child_id});
                }
                break;
            case fk_action::set_null:
                for (const auto& child : children) {
                    primary_key_t child_id = column_int(child, id_column);
                    if (visited.count(fk.table_name + "#" + std::to_string(child_id))) continue;
                    apply_update_actions(fk.table_name, child, {{fk.column_name, nullptr}}, visited);
                    conn_.execute(dialect_.update(fk.table_name, {fk.column_name}), {nullptr, child_id});
                }
                break;
        }
    }
}

void crud_engine::apply_update_actions(const std::string& table, const row_t& before,
                                       const std::map<std::string, column_value_t>& after,
                                       std::set<std::string>& visited) {
    if (dialect_.enforces_foreign_keys()) return;

    metadata_store store(conn_, dialect_);
    for (const auto& [column, value] : after) {
        auto old = before.find(column);
        if (old == before.end() || std::holds_alternative<std::nullptr_t>(old->second)) continue;
        if (old->second == value) continue;

        for (const auto& fk : store.list_referencing(table, column)) {
            if (fk.enforced) continue;
            auto children = referencing_rows(fk, old->second);
            if (children.empty()) continue;

            switch (fk.on_update) {
                case fk_action::restrict:
                case fk_action::no_action:
                    throw integrity_error("Value of " + table + "." + column + " is still referenced by " +
                                          fk.table_name + "." + fk.column_name, column);
                case fk_action::cascade:
                case fk_action::set_null: {
                    column_value_t replacement = fk.on_update == fk_action::cascade ? value : column_value_t(nullptr);
                    for (const auto& child : children) {
                        primary_key_t child_id = column_int(child, id_column);
                        std::string mark = fk.table_name + "#" + std::to_string(child_id) + "#" + fk.column_name;
                        if (!visited.insert(mark).second) continue;
                        apply_update_actions(fk.table_name, child, {{fk.column_name, replacement}}, visited);
                        conn_.execute(dialect_.update(fk.table_name, {fk.column_name}), {replacement, child_id});
                    }
                    break;
                }
            }
        }
    }
}

void crud_engine::compute_synthetic_fields(item& record, timestamp_t now) {
    auto elapsed = [&](const std::optional<timestamp_t>& ts) -> int64_t {
        if (!ts) return 0;
        return std::max<int64_t>(0, (now - *ts).count());
    };
    if (record.created) record.synthetic["createdRelative"] = elapsed(record.created);
    if (record.updated) record.synthetic["updatedRelative"] = elapsed(record.updated);
}

item crud_engine::to_item(const table_structure& structure, const row_t& row, timestamp_t now) const {
    item record;
    record.id = column_int(row, id_column);
    record.created = read_timestamp(row, created_column);
    record.updated = read_timestamp(row, updated_column);

    for (const auto& column : structure.columns) {
        if (is_system_column(column.name)) continue;
        auto it = row.find(column.name);
        if (it == row.end()) {
            record.fields[column.name] = nullptr;
            continue;
        }
        record.fields[column.name] = codec::from_physical(it->second, column.type);
    }
    compute_synthetic_fields(record, now);
    return record;
}

std::vector<sort_key> crud_engine::default_order(const table_structure& structure) const {
    if (structure.has_column(created_column)) {
        return {{created_column, true}, {id_column, true}};
    }
    return {{id_column, true}};
}

std::optional<row_t> crud_engine::fetch_row(const table_structure& structure, primary_key_t id) {
    select_spec spec;
    spec.table = structure.table;
    spec.where = {{id_column, condition_op::equals}};
    auto rows = conn_.query(dialect_.select(spec), {id});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

// ============================================================================
// Operations
// ============================================================================

std::vector<item> crud_engine::list(const std::string& table, const list_query& query) {
    auto structure = resolve(table);

    select_spec spec;
    spec.table = table;
    std::vector<column_value_t> params;

    for (const auto& [name, value] : query.equals) {
        const column_descriptor* column = structure.find(name);
        if (!column) {
            throw validation_error("Unknown filter column " + name + " in table " + table, name);
        }
        if (std::holds_alternative<std::nullptr_t>(value)) {
            spec.where.push_back({name, condition_op::is_null});
            continue;
        }
        spec.where.push_back({name, condition_op::equals});
        params.push_back(codec::to_physical(codec::coerce(value, *column)));
    }

    for (const auto& [name, term] : query.contains) {
        const column_descriptor* column = structure.find(name);
        if (!column) {
            throw validation_error("Unknown search column " + name + " in table " + table, name);
        }
        if (column->type != semantic_type::text) {
            throw validation_error("Column " + name + " is not a text column and cannot be searched", name);
        }
        spec.where.push_back({name, condition_op::like});
        params.push_back(dialect_.like_pattern(term));
    }

    for (const auto& key : query.sort) {
        if (!structure.has_column(key.column)) {
            throw validation_error("Unknown sort column " + key.column + " in table " + table, key.column);
        }
        spec.order.push_back(key);
    }
    if (spec.order.empty()) {
        spec.order = default_order(structure);
    } else if (std::none_of(spec.order.begin(), spec.order.end(),
                            [](const sort_key& k) { return k.column == id_column; })) {
        // Stable pagination needs a unique tiebreaker.
        spec.order.push_back({id_column, false});
    }

    if (query.limit && *query.limit < 0) {
        throw validation_error("Limit must not be negative", "limit");
    }
    if (query.offset < 0) {
        throw validation_error("Offset must not be negative", "offset");
    }
    spec.limit = std::min(query.limit.value_or(max_page_size_), max_page_size_);
    spec.offset = query.offset;

    auto rows = conn_.query(dialect_.select(spec), params);
    auto now = codec::now();
    std::vector<item> items;
    items.reserve(rows.size());
    for (const auto& row : rows) {
        items.push_back(to_item(structure, row, now));
    }
    return items;
}

item crud_engine::get(const std::string& table, primary_key_t id) {
    auto structure = resolve(table);
    auto row = fetch_row(structure, id);
    if (!row) {
        throw not_found_error("No row " + std::to_string(id) + " in " + table, "id");
    }
    return to_item(structure, *row, codec::now());
}

item crud_engine::get_last(const std::string& table) {
    auto structure = resolve(table);
    select_spec spec;
    spec.table = table;
    spec.order = default_order(structure);
    spec.limit = 1;
    auto rows = conn_.query(dialect_.select(spec));
    if (rows.empty()) {
        throw not_found_error("Table " + table + " has no rows", "id");
    }
    return to_item(structure, rows.front(), codec::now());
}

item crud_engine::create(const std::string& table, const field_map& fields) {
    auto structure = resolve(table);
    auto values = prepare_fields(structure, fields);

    auto now = codec::now();
    std::string stamp = codec::format_timestamp(now);
    std::vector<std::string> columns;
    std::vector<column_value_t> params;
    for (const auto& [name, value] : values) {
        columns.push_back(name);
        params.push_back(codec::to_physical(value));
    }
    if (structure.has_column(created_column)) {
        columns.push_back(created_column);
        params.push_back(stamp);
    }
    if (structure.has_column(updated_column)) {
        columns.push_back(updated_column);
        params.push_back(stamp);
    }

    transaction tx(conn_);
    check_references(structure, values);
    conn_.execute(dialect_.insert(table, columns), params);
    primary_key_t id = conn_.last_insert_id();
    auto row = fetch_row(structure, id);
    tx.commit();

    if (!row) {
        throw db_error("Inserted row " + std::to_string(id) + " in " + table + " could not be read back");
    }
    LOG_DEBUG("crud", "Created %s/%lld", table.c_str(), static_cast<long long>(id));
    return to_item(structure, *row, now);
}

item crud_engine::update(const std::string& table, primary_key_t id, const field_map& fields) {
    auto structure = resolve(table);
    auto values = prepare_fields(structure, fields);
    if (values.empty()) {
        throw validation_error("Update of " + table + " names no writable column", "fields");
    }

    auto now = codec::now();
    std::vector<std::string> columns;
    std::vector<column_value_t> params;
    for (const auto& [name, value] : values) {
        columns.push_back(name);
        params.push_back(codec::to_physical(value));
    }
    if (structure.has_column(updated_column)) {
        columns.push_back(updated_column);
        params.push_back(codec::format_timestamp(now));
    }
    params.push_back(id);

    transaction tx(conn_);
    check_references(structure, values);
    if (!dialect_.enforces_foreign_keys()) {
        if (auto before = fetch_row(structure, id)) {
            std::map<std::string, column_value_t> after;
            for (const auto& [name, value] : values) after[name] = codec::to_physical(value);
            std::set<std::string> visited;
            apply_update_actions(table, *before, after, visited);
        }
    }
    conn_.execute(dialect_.update(table, columns), params);
    if (conn_.changes() == 0) {
        throw not_found_error("No row " + std::to_string(id) + " in " + table, "id");
    }
    auto row = fetch_row(structure, id);
    tx.commit();

    if (!row) {
        throw not_found_error("No row " + std::to_string(id) + " in " + table, "id");
    }
    return to_item(structure, *row, now);
}

void crud_engine::remove(const std::string& table, primary_key_t id) {
    auto structure = resolve(table);

    transaction tx(conn_);
    auto row = fetch_row(structure, id);
    if (!row) {
        throw not_found_error("No row " + std::to_string(id) + " in " + table, "id");
    }
    std::set<std::string> visited;
    apply_delete_actions(table, *row, visited);
    conn_.execute(dialect_.remove(table), {id});
    if (conn_.changes() == 0) {
        throw not_found_error("No row " + std::to_string(id) + " in " + table, "id");
    }
    tx.commit();
    LOG_DEBUG("crud", "Deleted %s/%lld", table.c_str(), static_cast<long long>(id));
}

} // namespace tablekit
