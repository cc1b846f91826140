#pragma once

#include "TestSupport.hpp"
#include <algorithm>

namespace metadata_tests {

using namespace tablekit;
using test_support::expect_throw;

inline bool has_column(connection& conn, const std::string& table, const std::string& column) {
    for (const auto& row : conn.query("PRAGMA table_info(" + table + ")")) {
        if (column_text(row, "name") == column) return true;
    }
    return false;
}

inline table_configuration named(const std::string& name, int64_t ordinal = 0) {
    table_configuration config;
    config.name = name;
    config.ordinal = ordinal;
    return config;
}

inline view_column entry(const std::string& name, int64_t order, bool visible = true) {
    view_column col;
    col.column_name = name;
    col.order = order;
    col.visible = visible;
    return col;
}

// ============================================================================
// test_migrations_up_and_down
// ============================================================================

void test_migrations_up_and_down() {
    std::cout << "  test_migrations_up_and_down..." << std::flush;

    sqlite_connection conn(":memory:");
    sqlite_dialect d;
    migrator m(conn, d);

    assert(m.current_version() == 0);
    m.migrate_to_latest();
    assert(m.current_version() == migrator::latest_version());
    assert(migrator::latest_version() == 3);
    assert(conn.table_exists("table_configurations"));
    assert(conn.table_exists("table_foreign_keys"));
    assert(has_column(conn, "table_views", "view_type"));

    // Idempotent
    m.migrate_to_latest();
    auto applied = conn.query("SELECT COUNT(*) AS n FROM schema_migrations");
    assert(column_int(applied[0], "n") == 3);

    // A view saved before the revert survives the copy-and-swap
    metadata_store store(conn, d);
    store.create_table_configuration(named("contacts"));
    table_view view;
    view.table_name = "contacts";
    view.name = "All";
    view.columns = {entry("name", 0)};
    auto saved = store.create_view(view);

    m.revert_to(2);
    assert(m.current_version() == 2);
    assert(!has_column(conn, "table_views", "view_type"));
    assert(!conn.table_exists("table_views_new"));
    auto rows = conn.query("SELECT view_name FROM table_views WHERE id = ?", {saved.id});
    assert(rows.size() == 1 && column_text(rows[0], "view_name") == "All");

    m.revert_to(0);
    assert(m.current_version() == 0);
    assert(!conn.table_exists("table_configurations"));
    assert(!conn.table_exists("table_foreign_keys"));

    m.migrate_to_latest();
    assert(m.current_version() == 3);

    expect_throw<validation_error>([&] { m.revert_to(-1); });

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_newer_schema_is_fatal
// ============================================================================

void test_newer_schema_is_fatal() {
    std::cout << "  test_newer_schema_is_fatal..." << std::flush;

    sqlite_connection conn(":memory:");
    sqlite_dialect d;
    migrator m(conn, d);
    m.migrate_to_latest();
    conn.execute("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)",
                 {int64_t(99), std::string("future"), std::string("2030-01-01 00:00:00")});

    auto e = expect_throw<fatal_error>([&] { m.migrate_to_latest(); });
    assert(e.kind() == error_kind::fatal);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_table_configurations
// ============================================================================

void test_table_configurations() {
    std::cout << "  test_table_configurations..." << std::flush;

    sqlite_connection conn(":memory:");
    sqlite_dialect d;
    migrator(conn, d).migrate_to_latest();
    metadata_store store(conn, d);

    auto contacts = store.create_table_configuration(named("contacts", 2));
    assert(contacts.id > 0);
    assert(contacts.title == "contacts");

    auto orders_config = named("orders", 1);
    orders_config.title = "Orders";
    orders_config.icon = "cart";
    auto orders = store.create_table_configuration(orders_config);

    auto dup = expect_throw<conflict_error>([&] { store.create_table_configuration(named("contacts")); });
    assert(dup.field() == "name");
    auto reserved = expect_throw<validation_error>([&] { store.create_table_configuration(named("table_views")); });
    assert(reserved.field() == "name");
    expect_throw<validation_error>([&] { store.create_table_configuration(named("bad name")); });

    auto all = store.list_table_configurations();
    assert(all.size() == 2);
    assert(all[0].name == "orders");
    assert(all[1].name == "contacts");

    assert(store.get_table_configuration_by_id(orders.id).icon == std::optional<std::string>("cart"));
    assert(!store.find_table_configuration("missing"));
    auto missing = expect_throw<not_found_error>([&] { store.get_table_configuration("missing"); });
    assert(missing.field() == "table");
    expect_throw<not_found_error>([&] { store.get_table_configuration_by_id(9999); });

    auto change = contacts;
    change.title = "People";
    change.create_button_text = "Add person";
    auto updated = store.update_table_configuration(change);
    assert(updated.id == contacts.id);
    auto reread = store.get_table_configuration("contacts");
    assert(reread.title == "People");
    assert(reread.create_button_text == std::optional<std::string>("Add person"));

    assert(metadata_store::is_metadata_table("schema_migrations"));
    assert(!metadata_store::is_metadata_table("contacts"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_views_and_default_invariant: at most one default per table
// ============================================================================

void test_views_and_default_invariant() {
    std::cout << "  test_views_and_default_invariant..." << std::flush;

    sqlite_connection conn(":memory:");
    sqlite_dialect d;
    migrator(conn, d).migrate_to_latest();
    metadata_store store(conn, d);
    store.create_table_configuration(named("contacts"));
    store.create_table_configuration(named("orders"));

    table_view first;
    first.table_name = "contacts";
    first.name = "All";
    first.is_default = true;
    first.columns = {entry("email", 1, false), entry("name", 0)};
    first.columns[0].width = 200;
    first.columns[1].sort = sort_direction::descending;
    auto a = store.create_view(first);
    assert(a.is_default);
    assert(a.columns.size() == 2);
    // Loaded in column order, hidden entries kept
    assert(a.columns[0].column_name == "name");
    assert(a.columns[0].sort == sort_direction::descending);
    assert(a.columns[1].column_name == "email");
    assert(!a.columns[1].visible);
    assert(a.columns[1].width == std::optional<int64_t>(200));

    table_view second;
    second.table_name = "contacts";
    second.name = "Compact";
    second.is_default = true;
    auto b = store.create_view(second);

    auto views = store.list_views("contacts");
    assert(views.size() == 2);
    assert(std::count_if(views.begin(), views.end(), [](const table_view& v) { return v.is_default; }) == 1);
    assert(store.default_view("contacts")->id == b.id);

    store.set_default_view("contacts", a.id);
    assert(store.default_view("contacts")->id == a.id);
    assert(!store.get_view(b.id).is_default);

    // A view of another table cannot become this table's default
    table_view other;
    other.table_name = "orders";
    other.name = "All";
    auto o = store.create_view(other);
    expect_throw<not_found_error>([&] { store.set_default_view("contacts", o.id); });
    assert(store.default_view("contacts")->id == a.id);

    auto unset = a;
    unset.is_default = false;
    store.update_view(unset);
    assert(!store.default_view("contacts"));

    auto clash = second;
    clash.name = "All";
    clash.table_name = "contacts";
    expect_throw<conflict_error>([&] { store.create_view(clash); });

    table_view doubled;
    doubled.table_name = "contacts";
    doubled.name = "Doubled";
    doubled.columns = {entry("name", 0), entry("name", 1)};
    auto twice = expect_throw<validation_error>([&] { store.create_view(doubled); });
    assert(twice.field() == "name");
    assert(store.list_views("contacts").size() == 2);

    table_view nowhere;
    nowhere.table_name = "missing";
    nowhere.name = "All";
    expect_throw<not_found_error>([&] { store.create_view(nowhere); });

    store.delete_view(b.id);
    expect_throw<not_found_error>([&] { store.delete_view(b.id); });
    expect_throw<not_found_error>([&] { store.get_view(b.id); });

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_foreign_key_declarations
// ============================================================================

void test_foreign_key_declarations() {
    std::cout << "  test_foreign_key_declarations..." << std::flush;

    sqlite_connection conn(":memory:");
    sqlite_dialect d;
    migrator(conn, d).migrate_to_latest();
    metadata_store store(conn, d);
    store.create_table_configuration(named("customers"));
    store.create_table_configuration(named("orders"));

    foreign_key_declaration fk;
    fk.table_name = "orders";
    fk.column_name = "customer_id";
    fk.referenced_table = "customers";
    fk.referenced_column = "id";
    fk.on_delete = fk_action::cascade;
    auto created = store.create_foreign_key_declaration(fk);
    assert(created.constraint_name == "fk_orders_customer_id_customers_id");
    assert(!created.enforced);

    expect_throw<conflict_error>([&] { store.create_foreign_key_declaration(fk); });

    auto found = store.find_foreign_key_declaration(created.constraint_name);
    assert(found && found->on_delete == fk_action::cascade && found->on_update == fk_action::restrict);
    assert(store.list_foreign_key_declarations("orders").size() == 1);
    assert(store.list_referencing("customers").size() == 1);
    assert(store.list_referencing("customers", "id").size() == 1);
    assert(store.list_referencing("customers", "name").empty());

    // View entries and declarations follow a rename
    table_view view;
    view.table_name = "orders";
    view.name = "All";
    view.columns = {entry("customer_id", 0)};
    auto saved = store.create_view(view);
    store.rename_column_references("orders", "customer_id", "client_id");
    assert(store.get_view(saved.id).columns[0].column_name == "client_id");
    assert(store.list_foreign_key_declarations("orders")[0].column_name == "client_id");

    store.drop_column_references("orders", "client_id");
    assert(store.get_view(saved.id).columns.empty());
    assert(store.list_foreign_key_declarations("orders").empty());

    store.create_foreign_key_declaration(fk);
    store.delete_table_configuration("customers");
    assert(store.list_referencing("customers").empty());
    assert(!store.find_table_configuration("customers"));
    assert(store.find_table_configuration("orders"));

    auto gone = expect_throw<not_found_error>([&] { store.delete_foreign_key_declaration("fk_missing"); });
    assert(gone.field() == "constraint_name");

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Metadata Tests ---" << std::endl;

    test_migrations_up_and_down();
    test_newer_schema_is_fatal();
    test_table_configurations();
    test_views_and_default_invariant();
    test_foreign_key_declarations();

    std::cout << "--- Metadata Tests: All passed ---" << std::endl;
}

} // namespace metadata_tests
