#include <tablekit/tablekit.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <algorithm>

#include "TestSupport.hpp"
#include "DialectTests.hpp"
#include "CodecTests.hpp"
#include "ConfigTests.hpp"
#include "MetadataTests.hpp"
#include "MutationTests.hpp"
#include "ConcurrencyTests.hpp"
#include "MySQLTests.hpp"

using namespace tablekit;
using test_support::expect_throw;
using test_support::text;
using test_support::is_null;

// ============================================================================
// Test: Create / Get / List on a fresh table
// ============================================================================

void test_basic_crud() {
    std::cout << "Testing basic CRUD operations..." << std::endl;

    engine eng(test_support::memory_config());
    eng.create_table("contacts", {{"name", semantic_type::text}});

    // CREATE - server assigns id and timestamps
    auto alice = eng.create("contacts", {{"name", std::string("Alice Johnson")}});
    assert(alice.id == 1);
    assert(text(alice, "name") == "Alice Johnson");
    assert(alice.created.has_value());
    assert(alice.updated == alice.created);

    // READ
    auto found = eng.get("contacts", alice.id);
    assert(text(found, "name") == "Alice Johnson");
    assert(found.created == alice.created);

    auto all = eng.list("contacts");
    assert(all.size() == 1);
    assert(all[0].id == alice.id);
    assert(all[0].synthetic.count("createdRelative") == 1);
    assert(all[0].synthetic.at("createdRelative") >= 0);
    assert(all[0].synthetic.at("createdRelative") <= 5);

    assert(eng.get_last("contacts").id == alice.id);

    // DELETE - twice is not a silent success
    eng.remove("contacts", alice.id);
    auto gone = expect_throw<not_found_error>([&] { eng.get("contacts", alice.id); });
    assert(gone.field() == "id");
    expect_throw<not_found_error>([&] { eng.remove("contacts", alice.id); });
    expect_throw<not_found_error>([&] { eng.get_last("contacts"); });
    assert(eng.list("contacts").empty());

    std::cout << "  CRUD test passed!" << std::endl;
}

// ============================================================================
// Test: Update touches only the named columns
// ============================================================================

void test_partial_update() {
    std::cout << "Testing partial update..." << std::endl;

    engine eng(test_support::memory_config());
    eng.create_table("contacts", {{"name", semantic_type::text, false},
                                  {"email", semantic_type::text},
                                  {"age", semantic_type::integer},
                                  {"vip", semantic_type::boolean}});

    auto bob = eng.create("contacts", {{"name", std::string("Bob")}, {"email", std::string("b@x.com")},
                                       {"age", int64_t(40)}, {"vip", false}});

    auto old_stamp = *codec::parse_timestamp("2020-01-01 00:00:00");
    auto older = eng.update("contacts", bob.id, {{"age", int64_t(41)}});
    assert(older.updated >= bob.updated);

    auto updated = eng.update("contacts", bob.id, {{"email", std::string("bob@x.com")},
                                                   {"sr_updated", old_stamp}});
    assert(text(updated, "email") == "bob@x.com");
    assert(text(updated, "name") == "Bob");
    assert(std::get<int64_t>(updated.fields.at("age")) == 41);
    assert(!std::get<bool>(updated.fields.at("vip")));
    // The engine stamps updated; the caller's value never wins
    assert(updated.updated != old_stamp);
    assert(updated.created == bob.created);

    // Null clears a nullable column, not a required one
    auto cleared = eng.update("contacts", bob.id, {{"email", nullptr}});
    assert(is_null(cleared, "email"));
    auto required = expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {{"name", nullptr}}); });
    assert(required.field() == "name");

    auto empty = expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {}); });
    assert(empty.field() == "fields");
    expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {{"sr_created", old_stamp}}); });
    expect_throw<not_found_error>([&] { eng.update("contacts", 999, {{"age", int64_t(1)}}); });

    auto unknown = expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {{"phone", std::string("1")}}); });
    assert(unknown.field() == "phone");
    auto id = expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {{"id", int64_t(5)}}); });
    assert(id.field() == "id");
    auto bad = expect_throw<validation_error>([&] { eng.update("contacts", bob.id, {{"age", std::string("old")}}); });
    assert(bad.field() == "age");

    // Nothing above changed the row
    auto reread = eng.get("contacts", bob.id);
    assert(text(reread, "name") == "Bob");
    assert(std::get<int64_t>(reread.fields.at("age")) == 41);

    std::cout << "  Partial update test passed!" << std::endl;
}

// ============================================================================
// Test: Create rejects what the table does not declare
// ============================================================================

void test_create_validation() {
    std::cout << "Testing create validation..." << std::endl;

    engine eng(test_support::memory_config());
    eng.create_table("contacts", {{"name", semantic_type::text, false}, {"due", semantic_type::timestamp}});

    auto unknown = expect_throw<validation_error>([&] {
        eng.create("contacts", {{"name", std::string("A")}, {"nickname", std::string("a")}});
    });
    assert(unknown.field() == "nickname");
    expect_throw<validation_error>([&] { eng.create("contacts", {{"id", int64_t(10)}, {"name", std::string("A")}}); });
    expect_throw<validation_error>([&] { eng.create("contacts", {{"due", std::string("tomorrow")}, {"name", std::string("A")}}); });
    expect_throw<validation_error>([&] { eng.create("contacts", {}); });

    // Caller-supplied system timestamps are ignored
    auto stamp = *codec::parse_timestamp("1999-12-31 23:59:59");
    auto row = eng.create("contacts", {{"name", std::string("A")}, {"sr_created", stamp},
                                       {"due", std::string("2024-06-01T09:30:00Z")}});
    assert(row.created != stamp);
    assert(codec::to_display_string(row.fields.at("due")) == "2024-06-01 09:30:00");

    // Table names go through the allow-list
    auto unconfigured = expect_throw<not_found_error>([&] { eng.list("ghosts"); });
    assert(unconfigured.field() == "table");
    expect_throw<validation_error>([&] { eng.list("contacts; DROP TABLE contacts"); });
    expect_throw<validation_error>([&] { eng.list("sqlite_master"); });
    expect_throw<not_found_error>([&] { eng.list("table_configurations"); });
    assert(eng.list("contacts").size() == 1);

    std::cout << "  Create validation test passed!" << std::endl;
}

// ============================================================================
// Test: List filters, search, sort and pagination
// ============================================================================

void test_list_queries() {
    std::cout << "Testing list queries..." << std::endl;

    auto config = test_support::memory_config();
    config.max_page_size = 5;
    engine eng(config);
    eng.create_table("tasks", {{"title", semantic_type::text}, {"status", semantic_type::text},
                               {"priority", semantic_type::integer}, {"done", semantic_type::boolean}});

    const char* titles[] = {"Write report", "Review 50% draft", "Fix_bug", "Ship", "Plan", "Call Alice",
                            "Email Bob", "Archive"};
    for (int i = 0; i < 8; ++i) {
        field_map fields{{"title", std::string(titles[i])}, {"priority", int64_t(i % 3)}, {"done", i % 2 == 0}};
        if (i < 6) fields["status"] = std::string(i < 3 ? "open" : "closed");
        eng.create("tasks", fields);
    }

    // Equality, with coercion of the filter value
    list_query open;
    open.equals["status"] = std::string("open");
    assert(eng.list("tasks", open).size() == 3);

    list_query by_priority;
    by_priority.equals["priority"] = std::string("2");
    assert(eng.list("tasks", by_priority).size() == 2);

    list_query done;
    done.equals["done"] = true;
    done.equals["status"] = std::string("closed");
    assert(eng.list("tasks", done).size() == 1);

    list_query no_status;
    no_status.equals["status"] = nullptr;
    auto unset = eng.list("tasks", no_status);
    assert(unset.size() == 2);
    assert(std::all_of(unset.begin(), unset.end(), [](const item& i) { return is_null(i, "status"); }));

    // Contains treats wildcards literally
    list_query percent;
    percent.contains["title"] = "50%";
    assert(eng.list("tasks", percent).size() == 1);
    list_query underscore;
    underscore.contains["title"] = "_";
    assert(eng.list("tasks", underscore).size() == 1);
    list_query word;
    word.contains["title"] = "an";
    assert(eng.list("tasks", word).size() == 1);

    auto not_text = expect_throw<validation_error>([&] {
        list_query q;
        q.contains["priority"] = "1";
        eng.list("tasks", q);
    });
    assert(not_text.field() == "priority");
    auto unknown = expect_throw<validation_error>([&] {
        list_query q;
        q.equals["owner"] = std::string("me");
        eng.list("tasks", q);
    });
    assert(unknown.field() == "owner");

    // Sort with id as tiebreaker
    list_query sorted;
    sorted.sort = {{"priority", true}};
    sorted.limit = 100;
    auto by_prio = eng.list("tasks", sorted);
    assert(by_prio.size() == 5);   // clamped to max_page_size
    assert(std::get<int64_t>(by_prio[0].fields.at("priority")) == 2);
    assert(by_prio[0].id < by_prio[1].id);

    expect_throw<validation_error>([&] {
        list_query q;
        q.sort = {{"missing", false}};
        eng.list("tasks", q);
    });

    // Pagination walks every row exactly once
    std::vector<primary_key_t> seen;
    for (int64_t offset = 0;; offset += 3) {
        list_query page;
        page.limit = 3;
        page.offset = offset;
        auto rows = eng.list("tasks", page);
        if (rows.empty()) break;
        for (const auto& row : rows) seen.push_back(row.id);
    }
    assert(seen.size() == 8);
    std::sort(seen.begin(), seen.end());
    assert(std::unique(seen.begin(), seen.end()) == seen.end());

    // Default order: newest first
    auto newest = eng.list("tasks");
    assert(newest.size() == 5);
    assert(newest[0].id == 8);

    list_query negative;
    negative.limit = -1;
    auto e = expect_throw<validation_error>([&] { eng.list("tasks", negative); });
    assert(e.field() == "limit");
    list_query back;
    back.offset = -3;
    expect_throw<validation_error>([&] { eng.list("tasks", back); });

    std::cout << "  List query test passed!" << std::endl;
}

// ============================================================================
// Test: Synthetic fields are computed, never stored
// ============================================================================

void test_synthetic_fields() {
    std::cout << "Testing synthetic fields..." << std::endl;

    item record;
    record.created = *codec::parse_timestamp("2024-01-01 00:00:00");
    record.updated = *codec::parse_timestamp("2024-01-01 00:10:00");
    auto now = *codec::parse_timestamp("2024-01-01 01:00:00");
    engine::compute_synthetic_fields(record, now);
    assert(record.synthetic.at("createdRelative") == 3600);
    assert(record.synthetic.at("updatedRelative") == 3000);

    // Clock skew never produces negative ages
    item future;
    future.created = *codec::parse_timestamp("2024-01-01 02:00:00");
    engine::compute_synthetic_fields(future, now);
    assert(future.synthetic.at("createdRelative") == 0);
    assert(future.synthetic.count("updatedRelative") == 0);

    engine eng(test_support::memory_config());
    eng.create_table("notes", {{"body", semantic_type::text}});
    auto note = eng.create("notes", {{"body", std::string("hi")}});
    assert(note.fields.count("createdRelative") == 0);
    auto structure = eng.get_table_structure("notes");
    assert(!structure.has_column("createdRelative"));

    json j = note;
    assert(j.contains("createdRelative"));
    assert(j["fields"].size() == 1);

    std::cout << "  Synthetic fields test passed!" << std::endl;
}

// ============================================================================
// Test: AddColumn, RenameColumn, DropColumn in sequence
// ============================================================================

void test_column_lifecycle() {
    std::cout << "Testing column lifecycle..." << std::endl;

    engine eng(test_support::memory_config());
    eng.create_table("contacts", {{"name", semantic_type::text}});
    auto alice = eng.create("contacts", {{"name", std::string("Alice")}});

    table_view view;
    view.table_name = "contacts";
    view.name = "Main";
    view_column name_col;
    name_col.column_name = "name";
    view.columns = {name_col};
    auto saved = eng.create_view(view);

    // New columns appear as null on existing rows and never in saved views
    eng.add_column("contacts", {"email", semantic_type::text});
    auto rows = eng.list("contacts");
    assert(is_null(rows[0], "email"));
    auto bob = eng.create("contacts", {{"name", std::string("Bob")}, {"email", std::string("b@x.com")}});
    assert(text(bob, "email") == "b@x.com");
    assert(eng.get_view(saved.id).columns.size() == 1);

    // Reference it from the view, then rename and drop it
    auto with_email = eng.get_view(saved.id);
    view_column email_col;
    email_col.column_name = "email";
    email_col.order = 1;
    with_email.columns.push_back(email_col);
    eng.update_view(with_email);

    eng.rename_column("contacts", "email", "mail");
    assert(eng.get_view(saved.id).columns[1].column_name == "mail");
    assert(text(eng.get("contacts", bob.id), "mail") == "b@x.com");

    eng.drop_column("contacts", "mail");
    auto structure = eng.get_table_structure("contacts");
    assert(!structure.has_column("mail"));
    assert(!structure.has_column("email"));
    auto final_view = eng.get_view(saved.id);
    assert(final_view.columns.size() == 1);
    assert(final_view.columns[0].column_name == "name");
    assert(eng.list_foreign_keys("contacts").empty());
    assert(text(eng.get("contacts", alice.id), "name") == "Alice");

    std::cout << "  Column lifecycle test passed!" << std::endl;
}

// ============================================================================
// Test: Table configurations and views through the engine
// ============================================================================

void test_configurations_and_views() {
    std::cout << "Testing configurations and views..." << std::endl;

    engine eng(test_support::memory_config());
    eng.create_table("contacts", {{"name", semantic_type::text}}, "Contacts");
    eng.create_table("orders", {{"total", semantic_type::real}});

    auto configs = eng.list_table_configurations();
    assert(configs.size() == 2);
    assert(configs[0].name == "contacts");
    assert(configs[0].title == "Contacts");

    auto contacts = eng.get_table_configuration("contacts");
    contacts.icon = "person";
    contacts.create_button_text = "New contact";
    eng.update_table_configuration(contacts);
    auto by_id = eng.get_table_configuration_by_id(contacts.id);
    assert(by_id.icon == std::optional<std::string>("person"));

    json j = by_id;
    assert(j["createButtonText"] == "New contact");
    assert(j["name"] == "contacts");

    table_view a;
    a.table_name = "contacts";
    a.name = "A";
    a.is_default = true;
    auto view_a = eng.create_view(a);
    table_view b;
    b.table_name = "contacts";
    b.name = "B";
    auto view_b = eng.create_view(b);

    eng.set_default_view("contacts", view_b.id);
    auto views = eng.get_table_views("contacts");
    assert(views.size() == 2);
    assert(std::count_if(views.begin(), views.end(), [](const table_view& v) { return v.is_default; }) == 1);
    assert(!eng.get_view(view_a.id).is_default);
    assert(eng.resolve_effective_view("contacts").view_id == view_b.id);

    eng.delete_view(view_b.id);
    assert(!eng.resolve_effective_view("contacts").view_id);
    expect_throw<conflict_error>([&] {
        table_view dup;
        dup.table_name = "contacts";
        dup.name = "A";
        eng.create_view(dup);
    });

    json views_json = eng.get_table_views("contacts");
    assert(views_json.size() == 1);
    assert(views_json[0]["viewName"] == "A");
    assert(views_json[0]["viewType"] == "table");

    json structure = eng.get_table_structure("orders");
    assert(structure["columns"][3]["type"] == "real");

    std::cout << "  Configurations and views test passed!" << std::endl;
}

// ============================================================================
// Test: File database persists across engines; migrations can be reverted
// ============================================================================

void test_file_database() {
    std::cout << "Testing file database..." << std::endl;

    auto path = test_support::temp_db_path("persist");
    primary_key_t id = 0;
    {
        engine eng(test_support::file_config(path));
        assert(eng.schema_version() == migrator::latest_version());
        eng.create_table("contacts", {{"name", semantic_type::text}});
        id = eng.create("contacts", {{"name", std::string("Alice")}}).id;
    }
    {
        engine eng(test_support::file_config(path));
        assert(text(eng.get("contacts", id), "name") == "Alice");
        assert(eng.check_consistency().consistent());

        eng.revert_migrations(2);
        assert(eng.schema_version() == 2);
    }
    {
        // Reopening migrates forward again without losing data
        engine eng(test_support::file_config(path));
        assert(eng.schema_version() == migrator::latest_version());
        assert(text(eng.get("contacts", id), "name") == "Alice");
    }
    test_support::remove_db(path);

    std::cout << "  File database test passed!" << std::endl;
}

// ============================================================================
// Test: Database table summary and approximate row totals
// ============================================================================

void test_database_tables() {
    std::cout << "Testing database table summary..." << std::endl;

    engine eng(test_support::memory_config());
    assert(eng.list_database_tables().empty());
    assert(eng.approx_total_rows() == 0);

    eng.create_table("orders", {{"total", semantic_type::real}}, "Orders");
    eng.create_table("contacts", {{"name", semantic_type::text}}, "People");
    eng.create_table("archive", {{"note", semantic_type::text}});
    eng.create("contacts", {{"name", std::string("Alice")}});
    eng.create("contacts", {{"name", std::string("Bob")}});
    eng.create("orders", {{"total", 12.5}});
    eng.create("archive", {{"note", std::string("old")}});

    // Sorted by name, metadata tables left out
    auto tables = eng.list_database_tables();
    assert(tables.size() == 3);
    assert(tables[0].table_name == "archive");
    assert(tables[1].table_name == "contacts");
    assert(tables[2].table_name == "orders");
    assert(tables[1].has_configuration);
    assert(tables[1].configuration_title == std::optional<std::string>("People"));

    assert(eng.approx_total_rows() == 4);

    // A retained table stays in the database without a configuration and
    // no longer counts toward the total
    eng.delete_table("archive");
    tables = eng.list_database_tables();
    assert(tables.size() == 3);
    assert(tables[0].table_name == "archive");
    assert(!tables[0].has_configuration);
    assert(!tables[0].configuration_title);
    assert(eng.approx_total_rows() == 3);

    auto json = nlohmann::json(tables[1]);
    assert(json["tableName"] == "contacts");
    assert(json["hasConfiguration"] == true);
    assert(json["configurationTitle"] == "People");
    assert(nlohmann::json(tables[0])["configurationTitle"].is_null());

    std::cout << "  Database table summary test passed!" << std::endl;
}

int main() {
    std::cout << "=== TablekitCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Engine tests
        test_basic_crud();
        test_partial_update();
        test_create_validation();
        test_list_queries();
        test_synthetic_fields();
        test_column_lifecycle();
        test_configurations_and_views();
        test_file_database();
        test_database_tables();

        // Component suites
        dialect_tests::run_all();
        codec_tests::run_all();
        config_tests::run_all();
        metadata_tests::run_all();
        mutation_tests::run_all();
        concurrency_tests::run_all();
        mysql_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
