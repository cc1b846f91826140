#include "tablekit/metadata_store.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <algorithm>
#include <set>

namespace tablekit {

namespace {

table_configuration config_from_row(const row_t& row) {
    table_configuration config;
    config.id = column_int(row, "id");
    config.name = column_text(row, "name");
    config.title = column_text(row, "title");
    config.ordinal = column_int(row, "ordinal");
    config.db = column_optional_text(row, "db");
    config.create_button_text = column_optional_text(row, "create_button_text");
    config.icon = column_optional_text(row, "icon");
    return config;
}

foreign_key_declaration declaration_from_row(const row_t& row) {
    foreign_key_declaration fk;
    fk.id = column_int(row, "id");
    fk.constraint_name = column_text(row, "constraint_name");
    fk.table_name = column_text(row, "table_name");
    fk.column_name = column_text(row, "column_name");
    fk.referenced_table = column_text(row, "referenced_table");
    fk.referenced_column = column_text(row, "referenced_column");
    fk.on_delete = fk_action_from_string(column_text(row, "on_delete")).value_or(fk_action::restrict);
    fk.on_update = fk_action_from_string(column_text(row, "on_update")).value_or(fk_action::restrict);
    fk.enforced = column_int(row, "enforced") != 0;
    return fk;
}

column_value_t optional_param(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

const char* config_columns =
    "SELECT id, name, title, ordinal, db, create_button_text, icon FROM table_configurations";

const char* view_columns =
    "SELECT id, table_name, view_name, is_default, view_type FROM table_views";

const char* declaration_columns =
    "SELECT id, constraint_name, table_name, column_name, referenced_table, referenced_column, "
    "on_delete, on_update, enforced FROM table_foreign_keys";

} // namespace

metadata_store::metadata_store(connection& conn, const dialect& d) : conn_(conn), dialect_(d) {}

const std::vector<std::string>& metadata_store::metadata_tables() {
    static const std::vector<std::string> names = {
        "schema_migrations",
        "table_configurations",
        "table_foreign_keys",
        "table_view_columns",
        "table_views",
        "table_views_new",
    };
    return names;
}

bool metadata_store::is_metadata_table(const std::string& name) {
    const auto& names = metadata_tables();
    return std::find(names.begin(), names.end(), name) != names.end();
}

// ============================================================================
// Table configurations
// ============================================================================

table_configuration metadata_store::create_table_configuration(const table_configuration& config) {
    dialect_.validate_identifier(config.name);
    if (is_metadata_table(config.name)) {
        throw validation_error("Table name " + config.name + " is reserved", "name");
    }
    if (find_table_configuration(config.name)) {
        throw conflict_error("Table configuration " + config.name + " already exists", "name");
    }

    std::string title = config.title.empty() ? config.name : config.title;
    conn_.execute("INSERT INTO table_configurations (name, title, ordinal, db, create_button_text, icon) "
                  "VALUES (?, ?, ?, ?, ?, ?)",
                  {config.name, title, config.ordinal, optional_param(config.db),
                   optional_param(config.create_button_text), optional_param(config.icon)});

    table_configuration created = config;
    created.id = conn_.last_insert_id();
    created.title = title;
    LOG_DEBUG("metadata", "Created table configuration %s (id %lld)",
              created.name.c_str(), static_cast<long long>(created.id));
    return created;
}

std::vector<table_configuration> metadata_store::list_table_configurations() {
    std::vector<table_configuration> configs;
    for (const auto& row : conn_.query(std::string(config_columns) + " ORDER BY ordinal, name")) {
        configs.push_back(config_from_row(row));
    }
    return configs;
}

std::optional<table_configuration> metadata_store::find_table_configuration(const std::string& name) {
    auto rows = conn_.query(std::string(config_columns) + " WHERE name = ?", {name});
    if (rows.empty()) return std::nullopt;
    return config_from_row(rows[0]);
}

table_configuration metadata_store::get_table_configuration(const std::string& name) {
    auto config = find_table_configuration(name);
    if (!config) {
        throw not_found_error("Table " + name + " is not configured", "table");
    }
    return *config;
}

table_configuration metadata_store::get_table_configuration_by_id(int64_t id) {
    auto rows = conn_.query(std::string(config_columns) + " WHERE id = ?", {id});
    if (rows.empty()) {
        throw not_found_error("No table configuration with id " + std::to_string(id), "id");
    }
    return config_from_row(rows[0]);
}

table_configuration metadata_store::update_table_configuration(const table_configuration& config) {
    auto existing = get_table_configuration(config.name);
    std::string title = config.title.empty() ? config.name : config.title;
    conn_.execute("UPDATE table_configurations SET title = ?, ordinal = ?, db = ?, "
                  "create_button_text = ?, icon = ? WHERE id = ?",
                  {title, config.ordinal, optional_param(config.db),
                   optional_param(config.create_button_text), optional_param(config.icon), existing.id});

    table_configuration updated = config;
    updated.id = existing.id;
    updated.title = title;
    return updated;
}

void metadata_store::delete_table_configuration(const std::string& name) {
    transaction tx(conn_);
    auto config = get_table_configuration(name);

    // Columns go explicitly: SQLite only cascades with foreign_keys on.
    conn_.execute("DELETE FROM table_view_columns WHERE view_id IN "
                  "(SELECT id FROM table_views WHERE table_name = ?)", {name});
    conn_.execute("DELETE FROM table_views WHERE table_name = ?", {name});
    conn_.execute("DELETE FROM table_foreign_keys WHERE table_name = ? OR referenced_table = ?",
                  {name, name});
    conn_.execute("DELETE FROM table_configurations WHERE id = ?", {config.id});
    tx.commit();
    LOG_INFO("metadata", "Deleted table configuration %s", name.c_str());
}

// ============================================================================
// Views
// ============================================================================

table_view metadata_store::view_from_row(const row_t& row) {
    table_view view;
    view.id = column_int(row, "id");
    view.table_name = column_text(row, "table_name");
    view.name = column_text(row, "view_name");
    view.is_default = column_int(row, "is_default") != 0;
    view.view_type = column_text(row, "view_type");
    if (view.view_type.empty()) view.view_type = "table";
    view.columns = load_view_columns(view.id);
    return view;
}

std::vector<view_column> metadata_store::load_view_columns(int64_t view_id) {
    std::vector<view_column> columns;
    auto rows = conn_.query("SELECT column_name, is_visible, column_order, column_width, sort_order "
                            "FROM table_view_columns WHERE view_id = ? ORDER BY column_order, id",
                            {view_id});
    for (const auto& row : rows) {
        view_column col;
        col.column_name = column_text(row, "column_name");
        col.visible = column_int(row, "is_visible") != 0;
        col.order = column_int(row, "column_order");
        if (!column_is_null(row, "column_width")) {
            col.width = column_int(row, "column_width");
        }
        col.sort = sort_direction_from_string(column_text(row, "sort_order"));
        columns.push_back(std::move(col));
    }
    return columns;
}

void metadata_store::save_view_columns(int64_t view_id, const std::string& table,
                                       const std::vector<view_column>& columns) {
    std::set<std::string> seen;
    for (const auto& col : columns) {
        dialect_.validate_identifier(col.column_name);
        if (!seen.insert(col.column_name).second) {
            throw validation_error("Column " + col.column_name + " appears twice in the view for " + table,
                                   col.column_name);
        }
    }

    conn_.execute("DELETE FROM table_view_columns WHERE view_id = ?", {view_id});
    for (const auto& col : columns) {
        column_value_t width = nullptr;
        if (col.width) width = *col.width;
        column_value_t sort = nullptr;
        if (col.sort != sort_direction::none) sort = std::string(to_string(col.sort));
        conn_.execute("INSERT INTO table_view_columns "
                      "(view_id, column_name, is_visible, column_order, column_width, sort_order) "
                      "VALUES (?, ?, ?, ?, ?, ?)",
                      {view_id, col.column_name, static_cast<int64_t>(col.visible ? 1 : 0),
                       col.order, width, sort});
    }
}

table_view metadata_store::create_view(const table_view& view) {
    if (view.name.empty()) {
        throw validation_error("View name must not be empty", "name");
    }
    transaction tx(conn_);
    get_table_configuration(view.table_name);

    auto existing = conn_.query("SELECT id FROM table_views WHERE table_name = ? AND view_name = ?",
                                {view.table_name, view.name});
    if (!existing.empty()) {
        throw conflict_error("View " + view.name + " already exists for " + view.table_name, "name");
    }

    std::string view_type = view.view_type.empty() ? "table" : view.view_type;
    conn_.execute("INSERT INTO table_views (table_name, view_name, is_default, view_type) VALUES (?, ?, 0, ?)",
                  {view.table_name, view.name, view_type});
    int64_t id = conn_.last_insert_id();
    save_view_columns(id, view.table_name, view.columns);
    if (view.is_default) {
        set_default_view(view.table_name, id);
    }
    tx.commit();
    return get_view(id);
}

table_view metadata_store::update_view(const table_view& view) {
    if (view.name.empty()) {
        throw validation_error("View name must not be empty", "name");
    }
    transaction tx(conn_);
    auto current = get_view(view.id);

    auto clash = conn_.query("SELECT id FROM table_views WHERE table_name = ? AND view_name = ? AND id <> ?",
                             {current.table_name, view.name, view.id});
    if (!clash.empty()) {
        throw conflict_error("View " + view.name + " already exists for " + current.table_name, "name");
    }

    std::string view_type = view.view_type.empty() ? "table" : view.view_type;
    conn_.execute("UPDATE table_views SET view_name = ?, view_type = ? WHERE id = ?",
                  {view.name, view_type, view.id});
    save_view_columns(view.id, current.table_name, view.columns);

    if (view.is_default) {
        set_default_view(current.table_name, view.id);
    } else if (current.is_default) {
        conn_.execute("UPDATE table_views SET is_default = 0 WHERE id = ?", {view.id});
    }
    tx.commit();
    return get_view(view.id);
}

void metadata_store::delete_view(int64_t view_id) {
    transaction tx(conn_);
    conn_.execute("DELETE FROM table_view_columns WHERE view_id = ?", {view_id});
    conn_.execute("DELETE FROM table_views WHERE id = ?", {view_id});
    if (conn_.changes() == 0) {
        throw not_found_error("No view with id " + std::to_string(view_id), "id");
    }
    tx.commit();
}

std::vector<table_view> metadata_store::list_views(const std::string& table) {
    std::vector<table_view> views;
    auto rows = conn_.query(std::string(view_columns) + " WHERE table_name = ? ORDER BY view_name, id", {table});
    for (const auto& row : rows) {
        views.push_back(view_from_row(row));
    }
    return views;
}

table_view metadata_store::get_view(int64_t view_id) {
    auto rows = conn_.query(std::string(view_columns) + " WHERE id = ?", {view_id});
    if (rows.empty()) {
        throw not_found_error("No view with id " + std::to_string(view_id), "id");
    }
    return view_from_row(rows[0]);
}

std::optional<table_view> metadata_store::default_view(const std::string& table) {
    auto rows = conn_.query(std::string(view_columns) + " WHERE table_name = ? AND is_default = 1 ORDER BY id",
                            {table});
    if (rows.empty()) return std::nullopt;
    if (rows.size() > 1) {
        LOG_WARN("metadata", "Table %s has %zu default views", table.c_str(), rows.size());
    }
    return view_from_row(rows[0]);
}

void metadata_store::set_default_view(const std::string& table, int64_t view_id) {
    transaction tx(conn_);

    // Lock the table's view rows so two concurrent default switches serialize.
    select_spec spec;
    spec.table = "table_views";
    spec.columns = {"id"};
    spec.where = {{"table_name", condition_op::equals}};
    spec.for_update = true;
    auto rows = conn_.query(dialect_.select(spec), {table});

    bool found = std::any_of(rows.begin(), rows.end(),
                             [&](const row_t& row) { return column_int(row, "id") == view_id; });
    if (!found) {
        throw not_found_error("No view with id " + std::to_string(view_id) + " for table " + table, "id");
    }

    conn_.execute("UPDATE table_views SET is_default = 0 WHERE table_name = ? AND id <> ?", {table, view_id});
    conn_.execute("UPDATE table_views SET is_default = 1 WHERE id = ?", {view_id});
    tx.commit();
}

// ============================================================================
// Foreign-key declarations
// ============================================================================

foreign_key_declaration metadata_store::create_foreign_key_declaration(const foreign_key_declaration& fk) {
    dialect_.validate_identifier(fk.table_name);
    dialect_.validate_identifier(fk.column_name);
    dialect_.validate_identifier(fk.referenced_table);
    dialect_.validate_identifier(fk.referenced_column);

    foreign_key_declaration created = fk;
    if (created.constraint_name.empty()) {
        created.constraint_name = dialect_.constraint_name(fk.table_name, fk.column_name,
                                                           fk.referenced_table, fk.referenced_column);
    }
    if (find_foreign_key_declaration(created.constraint_name)) {
        throw conflict_error("Foreign key " + created.constraint_name + " already exists", fk.column_name);
    }

    conn_.execute("INSERT INTO table_foreign_keys (constraint_name, table_name, column_name, referenced_table, "
                  "referenced_column, on_delete, on_update, enforced) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
                  {created.constraint_name, created.table_name, created.column_name, created.referenced_table,
                   created.referenced_column, std::string(to_string(created.on_delete)),
                   std::string(to_string(created.on_update)), static_cast<int64_t>(created.enforced ? 1 : 0)});
    created.id = conn_.last_insert_id();
    return created;
}

std::vector<foreign_key_declaration> metadata_store::list_foreign_key_declarations(const std::string& table) {
    std::vector<foreign_key_declaration> result;
    auto rows = conn_.query(std::string(declaration_columns) + " WHERE table_name = ? ORDER BY column_name, id",
                            {table});
    for (const auto& row : rows) {
        result.push_back(declaration_from_row(row));
    }
    return result;
}

std::optional<foreign_key_declaration> metadata_store::find_foreign_key_declaration(const std::string& constraint_name) {
    auto rows = conn_.query(std::string(declaration_columns) + " WHERE constraint_name = ?", {constraint_name});
    if (rows.empty()) return std::nullopt;
    return declaration_from_row(rows[0]);
}

void metadata_store::delete_foreign_key_declaration(const std::string& constraint_name) {
    conn_.execute("DELETE FROM table_foreign_keys WHERE constraint_name = ?", {constraint_name});
    if (conn_.changes() == 0) {
        throw not_found_error("Foreign key " + constraint_name + " not found", "constraint_name");
    }
}

std::vector<foreign_key_declaration> metadata_store::list_referencing(const std::string& table,
                                                                      const std::string& column) {
    std::vector<row_t> rows;
    if (column.empty()) {
        rows = conn_.query(std::string(declaration_columns) + " WHERE referenced_table = ? ORDER BY id", {table});
    } else {
        rows = conn_.query(std::string(declaration_columns) +
                           " WHERE referenced_table = ? AND referenced_column = ? ORDER BY id", {table, column});
    }
    std::vector<foreign_key_declaration> result;
    for (const auto& row : rows) {
        result.push_back(declaration_from_row(row));
    }
    return result;
}

// ============================================================================
// Column references
// ============================================================================

void metadata_store::rename_column_references(const std::string& table, const std::string& from,
                                              const std::string& to) {
    conn_.execute("UPDATE table_view_columns SET column_name = ? WHERE column_name = ? AND view_id IN "
                  "(SELECT id FROM table_views WHERE table_name = ?)", {to, from, table});
    conn_.execute("UPDATE table_foreign_keys SET column_name = ? WHERE table_name = ? AND column_name = ?",
                  {to, table, from});
    conn_.execute("UPDATE table_foreign_keys SET referenced_column = ? "
                  "WHERE referenced_table = ? AND referenced_column = ?", {to, table, from});

    // Constraint names embed the column names, so follow the rename.
    auto rows = conn_.query(std::string(declaration_columns) +
                            " WHERE (table_name = ? AND column_name = ?) OR "
                            "(referenced_table = ? AND referenced_column = ?) ORDER BY id",
                            {table, to, table, to});
    for (const auto& row : rows) {
        auto fk = declaration_from_row(row);
        auto name = dialect_.constraint_name(fk.table_name, fk.column_name, fk.referenced_table,
                                             fk.referenced_column);
        if (name == fk.constraint_name) continue;
        conn_.execute("UPDATE table_foreign_keys SET constraint_name = ? WHERE id = ?", {name, fk.id});
    }
}

void metadata_store::drop_column_references(const std::string& table, const std::string& column) {
    conn_.execute("DELETE FROM table_view_columns WHERE column_name = ? AND view_id IN "
                  "(SELECT id FROM table_views WHERE table_name = ?)", {column, table});
    conn_.execute("DELETE FROM table_foreign_keys WHERE table_name = ? AND column_name = ?", {table, column});
}

} // namespace tablekit
