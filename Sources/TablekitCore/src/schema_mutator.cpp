#include "tablekit/schema_mutator.hpp"
#include "tablekit/metadata_store.hpp"
#include "tablekit/value_codec.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <charconv>
#include <optional>
#include <set>

namespace tablekit {

namespace {

// Drops the cached structure of a table when the mutation finishes, however
// it finishes.
class cache_invalidation {
public:
    cache_invalidation(structure_cache* cache, std::string table)
        : cache_(cache), table_(std::move(table)) {}
    ~cache_invalidation() {
        if (cache_) cache_->invalidate(table_);
    }

    cache_invalidation(const cache_invalidation&) = delete;
    cache_invalidation& operator=(const cache_invalidation&) = delete;

private:
    structure_cache* cache_;
    std::string table_;
};

bool is_numeric(semantic_type type) {
    return type == semantic_type::integer || type == semantic_type::real ||
           type == semantic_type::boolean || type == semantic_type::foreign_key;
}

// Text the rebuild's CAST(... AS INTEGER) reads in full: an optional minus
// sign and decimal digits. CAST stops at the first other character, so
// "1e3" or "2.5" would silently lose their tail.
bool is_plain_integer(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    return !s.empty() && ec == std::errc() && ptr == s.data() + s.size();
}

} // namespace

schema_mutator::schema_mutator(connection& conn, const dialect& d, structure_cache* cache,
                               delete_table_policy on_delete)
    : conn_(conn), dialect_(d), cache_(cache), on_delete_(on_delete) {}

// ============================================================================
// Helpers
// ============================================================================

table_structure schema_mutator::require_structure(const std::string& table) {
    dialect_.validate_identifier(table);
    metadata_store store(conn_, dialect_);
    if (!store.find_table_configuration(table)) {
        throw not_found_error("Unknown table " + table, "table");
    }
    schema_introspector introspector(conn_, dialect_);
    try {
        return introspector.read_table_structure(table);
    } catch (const not_found_error&) {
        throw fatal_error("Table " + table + " is configured but has no physical table", table);
    }
}

const column_descriptor& schema_mutator::require_user_column(const table_structure& structure,
                                                             const std::string& column, const char* action) {
    if (is_system_column(column)) {
        throw validation_error("System column " + column + " cannot be " + action, column);
    }
    const column_descriptor* desc = structure.find(column);
    if (!desc) {
        throw not_found_error("Column " + column + " not found in " + structure.table, column);
    }
    return *desc;
}

void schema_mutator::validate_new_column(const table_structure& structure, const column_spec& column) {
    dialect_.validate_identifier(column.name);
    if (is_system_column(column.name)) {
        throw validation_error("Column name " + column.name + " is reserved", column.name);
    }
    if (column.type == semantic_type::unsupported) {
        throw validation_error("Column " + column.name + " needs a supported type", column.name);
    }
    if (structure.has_column(column.name)) {
        throw conflict_error("Column " + column.name + " already exists in " + structure.table, column.name);
    }
}

void schema_mutator::verify_convertible(const table_structure& structure, const column_descriptor& column,
                                        semantic_type type) {
    std::string sql = "SELECT DISTINCT " + dialect_.quote(column.name) + " AS v FROM " +
                      dialect_.quote(structure.table) + " WHERE " + dialect_.quote(column.name) + " IS NOT NULL";
    auto rows = conn_.query(sql);

    column_descriptor target = column;
    target.type = type;
    target.nullable = true;

    for (const auto& row : rows) {
        const column_value_t& raw = row.at("v");
        // Booleans convert through their 0/1 form.
        semantic_type read_as = column.type == semantic_type::boolean ? semantic_type::integer : column.type;
        field_value_t value = codec::from_physical(raw, read_as);
        std::string shown = codec::to_display_string(value);

        if (dialect_.kind() == dialect_kind::mysql) {
            // MODIFY COLUMN converts differently from the SQLite rebuild.
            if (type == semantic_type::boolean && column.type == semantic_type::text &&
                shown != "0" && shown != "1") {
                throw validation_error("Value '" + shown + "' in " + structure.table + "." + column.name +
                                       " cannot become a boolean", column.name);
            }
            if (type == semantic_type::timestamp && is_numeric(column.type)) {
                throw validation_error("Numeric column " + column.name + " with data cannot become a timestamp",
                                       column.name);
            }
        }

        auto text = std::get_if<std::string>(&raw);
        if (text && (type == semantic_type::integer || type == semantic_type::foreign_key) &&
            !is_plain_integer(*text)) {
            throw validation_error("Value '" + shown + "' in " + structure.table + "." + column.name +
                                   " is not a plain integer and would be truncated", column.name);
        }

        try {
            codec::coerce(value, target);
        } catch (const validation_error&) {
            throw validation_error("Value '" + shown + "' in " + structure.table + "." + column.name +
                                   " cannot be converted to " + to_string(type), column.name);
        }
    }
}

void schema_mutator::run(const statement_plan& plan) {
    for (const auto& sql : plan.statements) {
        LOG_DEBUG("mutate", "%s", sql.c_str());
        conn_.execute(sql);
    }
}

void schema_mutator::apply(const statement_plan& plan, const std::function<void()>& reconcile,
                           const std::function<void()>& compensate) {
    if (dialect_.kind() == dialect_kind::sqlite) {
        std::optional<foreign_keys_suspended> fk_off;
        if (plan.requires_foreign_keys_off) {
            fk_off.emplace(conn_);
        }
        transaction tx(conn_);
        run(plan);
        if (reconcile) reconcile();
        if (plan.requires_foreign_keys_off) {
            verify_foreign_keys(conn_);
        }
        tx.commit();
        return;
    }

    // MySQL: each DDL statement has already committed when execute returns.
    run(plan);
    if (!reconcile) return;
    try {
        transaction tx(conn_);
        reconcile();
        tx.commit();
    } catch (const std::exception& e) {
        LOG_ERROR("mutate", "Metadata update failed after DDL: %s", e.what());
        if (compensate) {
            try {
                compensate();
            } catch (const std::exception& undo) {
                LOG_ERROR("mutate", "Compensating DDL failed, schema needs manual repair: %s", undo.what());
            }
        }
        throw;
    }
}

// ============================================================================
// Tables
// ============================================================================

table_configuration schema_mutator::create_table(const std::string& name, const std::vector<column_spec>& columns,
                                                 const std::string& title) {
    dialect_.validate_identifier(name);
    if (metadata_store::is_metadata_table(name)) {
        throw validation_error("Table name " + name + " is reserved", "name");
    }

    metadata_store store(conn_, dialect_);
    if (store.find_table_configuration(name)) {
        throw conflict_error("Table " + name + " already exists", "name");
    }
    if (conn_.table_exists(name)) {
        throw conflict_error("A physical table named " + name + " already exists", "name");
    }

    std::set<std::string> seen;
    for (const auto& column : columns) {
        dialect_.validate_identifier(column.name);
        if (is_system_column(column.name)) {
            throw validation_error("Column name " + column.name + " is reserved", column.name);
        }
        if (column.type == semantic_type::unsupported) {
            throw validation_error("Column " + column.name + " needs a supported type", column.name);
        }
        if (!seen.insert(column.name).second) {
            throw conflict_error("Column " + column.name + " is declared twice", column.name);
        }
    }

    cache_invalidation invalidate(cache_, name);
    table_configuration config;
    config.name = name;
    config.title = title;
    config.ordinal = static_cast<int64_t>(store.list_table_configurations().size());

    table_configuration created;
    apply(dialect_.create_table(name, columns),
          [&] { created = store.create_table_configuration(config); },
          [&] { run(dialect_.drop_table(name)); });
    LOG_INFO("mutate", "Created table %s with %zu columns", name.c_str(), columns.size());
    return created;
}

void schema_mutator::delete_table(const std::string& name) {
    dialect_.validate_identifier(name);
    metadata_store store(conn_, dialect_);
    store.get_table_configuration(name);

    for (const auto& fk : store.list_referencing(name)) {
        if (fk.table_name != name) {
            throw integrity_error("Table " + name + " is still referenced by " + fk.table_name + "." +
                                  fk.column_name, fk.table_name);
        }
    }

    cache_invalidation invalidate(cache_, name);
    bool drop = on_delete_ == delete_table_policy::drop && conn_.table_exists(name);

    if (dialect_.kind() == dialect_kind::sqlite) {
        transaction tx(conn_);
        store.delete_table_configuration(name);
        if (drop) run(dialect_.drop_table(name));
        tx.commit();
    } else {
        // Metadata first: a failed DROP then leaves an orphan, which
        // check_consistency reports, rather than a configuration without a table.
        store.delete_table_configuration(name);
        if (drop) run(dialect_.drop_table(name));
    }
    LOG_INFO("mutate", "Deleted table %s (physical table %s)", name.c_str(), drop ? "dropped" : "retained");
}

// ============================================================================
// Columns
// ============================================================================

table_structure schema_mutator::add_column(const std::string& table, const column_spec& column) {
    auto structure = require_structure(table);
    validate_new_column(structure, column);

    cache_invalidation invalidate(cache_, table);
    auto shape = dialect_.read_table_shape(conn_, table);
    apply(dialect_.add_column(shape, column), nullptr, nullptr);
    LOG_INFO("mutate", "Added column %s.%s", table.c_str(), column.name.c_str());

    schema_introspector introspector(conn_, dialect_);
    return introspector.read_table_structure(table);
}

table_structure schema_mutator::drop_column(const std::string& table, const std::string& column) {
    auto structure = require_structure(table);
    const auto& desc = require_user_column(structure, column, "dropped");
    if (desc.primary_key) {
        throw validation_error("Primary key column " + column + " cannot be dropped", column);
    }
    if (structure.columns.size() == 1) {
        throw validation_error("Cannot drop the only column of " + table, column);
    }

    metadata_store store(conn_, dialect_);
    auto incoming = store.list_referencing(table, column);
    if (!incoming.empty()) {
        throw integrity_error("Column " + column + " is referenced by foreign key " +
                              incoming.front().constraint_name + "; drop the foreign key first", column);
    }
    for (const auto& fk : store.list_foreign_key_declarations(table)) {
        if (fk.column_name == column) {
            throw integrity_error("Column " + column + " carries foreign key " + fk.constraint_name +
                                  "; drop the foreign key first", column);
        }
    }

    cache_invalidation invalidate(cache_, table);
    auto shape = dialect_.read_table_shape(conn_, table);
    for (const auto& fk : shape.foreign_keys) {
        if (fk.column == column) {
            throw integrity_error("Column " + column + " carries a database foreign key to " +
                                  fk.referenced_table + "; drop it first", column);
        }
    }

    apply(dialect_.drop_column(shape, column),
          [&] { store.drop_column_references(table, column); },
          nullptr);
    LOG_INFO("mutate", "Dropped column %s.%s", table.c_str(), column.c_str());

    schema_introspector introspector(conn_, dialect_);
    return introspector.read_table_structure(table);
}

table_structure schema_mutator::rename_column(const std::string& table, const std::string& from,
                                              const std::string& to) {
    auto structure = require_structure(table);
    require_user_column(structure, from, "renamed");
    dialect_.validate_identifier(to);
    if (is_system_column(to)) {
        throw validation_error("Column name " + to + " is reserved", to);
    }
    if (from == to) {
        return structure;
    }
    if (structure.has_column(to)) {
        throw conflict_error("Column " + to + " already exists in " + table, to);
    }

    cache_invalidation invalidate(cache_, table);
    metadata_store store(conn_, dialect_);
    auto shape = dialect_.read_table_shape(conn_, table);

    // Constraints on or pointing at the column are renamed with it: the
    // old one (or its SQLite index) is dropped, the new one added.
    std::vector<std::pair<foreign_key_declaration, foreign_key_declaration>> renamed;
    std::set<int64_t> seen;
    auto collect = [&](const foreign_key_declaration& fk) {
        if (!seen.insert(fk.id).second) return;
        foreign_key_declaration next = fk;
        if (next.table_name == table && next.column_name == from) next.column_name = to;
        if (next.referenced_table == table && next.referenced_column == from) next.referenced_column = to;
        next.constraint_name = dialect_.constraint_name(next.table_name, next.column_name,
                                                        next.referenced_table, next.referenced_column);
        if (next.constraint_name != fk.constraint_name) renamed.emplace_back(fk, next);
    };
    for (const auto& fk : store.list_foreign_key_declarations(table)) {
        if (fk.column_name == from) collect(fk);
    }
    for (const auto& fk : store.list_referencing(table, from)) collect(fk);

    auto renamed_shape = shape;
    for (auto& col : renamed_shape.columns) {
        if (col.name == from) col.name = to;
    }
    auto owner_shape = [&](const std::string& owner, const table_shape& own) {
        return owner == table ? own : dialect_.read_table_shape(conn_, owner);
    };
    auto build = [&](const table_shape& current, const table_shape& target, const std::string& old_name,
                     const std::string& new_name, bool forward) {
        statement_plan plan = dialect_.rename_column(current, old_name, new_name);
        for (const auto& [before, after] : renamed) {
            const auto& dropped = forward ? before : after;
            const auto& added = forward ? after : before;
            auto drop_plan = dialect_.drop_foreign_key(owner_shape(dropped.table_name, current), dropped);
            auto add_plan = dialect_.add_foreign_key(owner_shape(added.table_name, target), added);
            plan.statements.insert(plan.statements.end(), drop_plan.statements.begin(), drop_plan.statements.end());
            plan.statements.insert(plan.statements.end(), add_plan.statements.begin(), add_plan.statements.end());
        }
        return plan;
    };

    apply(build(shape, renamed_shape, from, to, true),
          [&] { store.rename_column_references(table, from, to); },
          [&] { run(build(renamed_shape, shape, to, from, false)); });

    // Other tables' references to this column changed too.
    if (cache_) cache_->clear();
    LOG_INFO("mutate", "Renamed column %s.%s to %s", table.c_str(), from.c_str(), to.c_str());

    schema_introspector introspector(conn_, dialect_);
    return introspector.read_table_structure(table);
}

table_structure schema_mutator::change_column_type(const std::string& table, const std::string& column,
                                                   semantic_type type) {
    auto structure = require_structure(table);
    const auto& desc = require_user_column(structure, column, "retyped");
    if (desc.primary_key) {
        throw validation_error("Primary key column " + column + " cannot be retyped", column);
    }
    if (type == semantic_type::unsupported) {
        throw validation_error("Column " + column + " needs a supported type", column);
    }
    if (type == semantic_type::foreign_key) {
        throw validation_error("Use a foreign key to make " + column + " a reference", column);
    }
    if (desc.type == type) {
        return structure;
    }

    metadata_store store(conn_, dialect_);
    if (desc.reference || !store.list_referencing(table, column).empty()) {
        throw integrity_error("Column " + column + " takes part in a foreign key and cannot be retyped", column);
    }

    verify_convertible(structure, desc, type);

    cache_invalidation invalidate(cache_, table);
    auto shape = dialect_.read_table_shape(conn_, table);
    apply(dialect_.change_column_type(shape, column, type), nullptr, nullptr);
    LOG_INFO("mutate", "Changed %s.%s to %s", table.c_str(), column.c_str(), to_string(type));

    schema_introspector introspector(conn_, dialect_);
    return introspector.read_table_structure(table);
}

// ============================================================================
// Foreign keys
// ============================================================================

foreign_key_declaration schema_mutator::create_foreign_key(const std::string& table, const std::string& column,
                                                           const std::string& referenced_table,
                                                           const std::string& referenced_column,
                                                           fk_action on_delete, fk_action on_update) {
    auto structure = require_structure(table);
    const auto& desc = require_user_column(structure, column, "used as a foreign key");
    if (desc.primary_key) {
        throw validation_error("Primary key column " + column + " cannot be a foreign key", column);
    }
    dialect_.validate_identifier(referenced_table);
    dialect_.validate_identifier(referenced_column);

    if (!conn_.table_exists(referenced_table)) {
        throw integrity_error("Referenced table " + referenced_table + " does not exist", column);
    }
    schema_introspector introspector(conn_, dialect_);
    auto target = introspector.read_table_structure(referenced_table);
    if (!target.has_column(referenced_column)) {
        throw integrity_error("Referenced column " + referenced_table + "." + referenced_column +
                              " does not exist", column);
    }

    foreign_key_declaration fk;
    fk.constraint_name = dialect_.constraint_name(table, column, referenced_table, referenced_column);
    fk.table_name = table;
    fk.column_name = column;
    fk.referenced_table = referenced_table;
    fk.referenced_column = referenced_column;
    fk.on_delete = on_delete;
    fk.on_update = on_update;
    fk.enforced = dialect_.enforces_foreign_keys();

    metadata_store store(conn_, dialect_);
    if (store.find_foreign_key_declaration(fk.constraint_name)) {
        throw conflict_error("Foreign key " + fk.constraint_name + " already exists", column);
    }

    auto orphans = conn_.query(
        "SELECT COUNT(*) AS n FROM " + dialect_.quote(table) + " src WHERE src." + dialect_.quote(column) +
        " IS NOT NULL AND NOT EXISTS (SELECT 1 FROM " + dialect_.quote(referenced_table) + " dst WHERE dst." +
        dialect_.quote(referenced_column) + " = src." + dialect_.quote(column) + ")");
    if (!orphans.empty() && column_int(orphans[0], "n") > 0) {
        throw integrity_error(std::to_string(column_int(orphans[0], "n")) + " rows of " + table +
                              " reference missing " + referenced_table + " rows", column);
    }

    cache_invalidation invalidate(cache_, table);
    auto shape = dialect_.read_table_shape(conn_, table);
    foreign_key_declaration created;
    apply(dialect_.add_foreign_key(shape, fk),
          [&] { created = store.create_foreign_key_declaration(fk); },
          [&] { run(dialect_.drop_foreign_key(shape, fk)); });
    LOG_INFO("mutate", "Created foreign key %s (%s)", fk.constraint_name.c_str(),
             fk.enforced ? "enforced" : "advisory");
    return created;
}

void schema_mutator::drop_foreign_key(const std::string& table, const std::string& constraint_name) {
    require_structure(table);
    metadata_store store(conn_, dialect_);
    auto fk = store.find_foreign_key_declaration(constraint_name);
    if (!fk || fk->table_name != table) {
        throw not_found_error("Foreign key " + constraint_name + " not found on " + table, "constraint_name");
    }

    cache_invalidation invalidate(cache_, table);
    auto shape = dialect_.read_table_shape(conn_, table);
    apply(dialect_.drop_foreign_key(shape, *fk),
          [&] { store.delete_foreign_key_declaration(constraint_name); },
          [&] { run(dialect_.add_foreign_key(dialect_.read_table_shape(conn_, table), *fk)); });
    LOG_INFO("mutate", "Dropped foreign key %s", constraint_name.c_str());
}

} // namespace tablekit
