#pragma once

#include "TestSupport.hpp"
#include <algorithm>

namespace dialect_tests {

using namespace tablekit;
using test_support::expect_throw;

inline table_shape contacts_shape() {
    table_shape shape;
    shape.name = "contacts";
    shape.columns = {
        {"id", "INTEGER", true, true, true, std::nullopt},
        {"sr_created", "DATETIME", true, false, false, std::string("datetime('now')")},
        {"sr_updated", "DATETIME", true, false, false, std::string("datetime('now')")},
        {"name", "TEXT", true, false, false, std::nullopt},
        {"age", "TEXT", false, false, false, std::nullopt},
        {"email", "TEXT", false, false, false, std::nullopt},
    };
    physical_index idx;
    idx.name = "idx_contacts_email";
    idx.columns = {"email"};
    idx.definition = "CREATE INDEX idx_contacts_email ON contacts (email)";
    shape.indexes.push_back(idx);
    return shape;
}

// Position of the first statement starting with prefix, or npos.
inline size_t find_statement(const statement_plan& plan, const std::string& prefix) {
    for (size_t i = 0; i < plan.statements.size(); ++i) {
        if (plan.statements[i].rfind(prefix, 0) == 0) return i;
    }
    return std::string::npos;
}

// ============================================================================
// test_identifier_grammar: names are validated before interpolation
// ============================================================================

void test_identifier_grammar() {
    std::cout << "  test_identifier_grammar..." << std::flush;

    sqlite_dialect sqlite;
    mysql_dialect mysql;

    sqlite.validate_identifier("contacts");
    sqlite.validate_identifier("_private_1");
    mysql.validate_identifier("Order_Items2");

    auto e = expect_throw<validation_error>([&] { sqlite.validate_identifier("1st"); });
    assert(e.field() == "1st");
    assert(e.kind() == error_kind::validation);
    expect_throw<validation_error>([&] { sqlite.validate_identifier(""); });
    expect_throw<validation_error>([&] { sqlite.validate_identifier("first-name"); });
    expect_throw<validation_error>([&] { mysql.validate_identifier("name; DROP TABLE x"); });
    expect_throw<validation_error>([&] { mysql.quote("x`y"); });
    expect_throw<validation_error>([&] { sqlite.quote("x\"y"); });

    // Reserved prefix only on SQLite
    expect_throw<validation_error>([&] { sqlite.validate_identifier("sqlite_master"); });
    mysql.validate_identifier("sqlite_master");

    // Length limits differ
    std::string long_name(65, 'a');
    sqlite.validate_identifier(long_name);
    expect_throw<validation_error>([&] { mysql.validate_identifier(long_name); });

    assert(sqlite.quote("name") == "\"name\"");
    assert(mysql.quote("name") == "`name`");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_constraint_names: deterministic and within the identifier limit
// ============================================================================

void test_constraint_names() {
    std::cout << "  test_constraint_names..." << std::flush;

    mysql_dialect mysql;
    assert(mysql.constraint_name("orders", "customer_id", "customers", "id") ==
           "fk_orders_customer_id_customers_id");
    assert(mysql.index_name("fk_orders_customer_id_customers_id") ==
           "idx_fk_orders_customer_id_customers_id");

    std::string table(40, 't');
    std::string column(30, 'c');
    auto name = mysql.constraint_name(table, column, "customers", "id");
    assert(name.size() <= mysql.max_identifier_length());
    assert(name.rfind("fk_", 0) == 0);
    assert(name == mysql.constraint_name(table, column, "customers", "id"));
    assert(name != mysql.constraint_name(table, column, "customers", "code"));
    mysql.validate_identifier(name);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_type_classification: physical types map through one table
// ============================================================================

void test_type_classification() {
    std::cout << "  test_type_classification..." << std::flush;

    sqlite_dialect sqlite;
    mysql_dialect mysql;

    assert(sqlite.classify("INTEGER") == semantic_type::integer);
    assert(mysql.classify("bigint(20)") == semantic_type::integer);
    assert(mysql.classify("BIGINT UNSIGNED") == semantic_type::integer);
    assert(mysql.classify("varchar(255)") == semantic_type::text);
    assert(sqlite.classify("TEXT") == semantic_type::text);
    assert(mysql.classify("tinyint(1)") == semantic_type::boolean);
    assert(mysql.classify("TINYINT(4)") == semantic_type::integer);
    assert(sqlite.classify("BOOLEAN") == semantic_type::boolean);
    assert(sqlite.classify("DATETIME") == semantic_type::timestamp);
    assert(mysql.classify("timestamp") == semantic_type::timestamp);
    assert(mysql.classify("DOUBLE") == semantic_type::real);
    assert(sqlite.classify("REAL") == semantic_type::real);
    assert(sqlite.classify("BLOB") == semantic_type::unsupported);
    assert(mysql.classify("JSON") == semantic_type::unsupported);
    assert(sqlite.classify("") == semantic_type::unsupported);

    // Every semantic type survives its own physical type
    for (auto type : {semantic_type::text, semantic_type::integer, semantic_type::real,
                      semantic_type::boolean, semantic_type::timestamp}) {
        assert(sqlite.classify(sqlite.physical_type(type)) == type);
        assert(mysql.classify(mysql.physical_type(type)) == type);
    }
    expect_throw<validation_error>([&] { mysql.physical_type(semantic_type::unsupported); });

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_create_and_add_column: DDL text for both dialects
// ============================================================================

void test_create_and_add_column() {
    std::cout << "  test_create_and_add_column..." << std::flush;

    sqlite_dialect sqlite;
    mysql_dialect mysql;
    std::vector<column_spec> columns = {{"name", semantic_type::text, false},
                                        {"active", semantic_type::boolean}};

    auto plan = sqlite.create_table("contacts", columns);
    assert(plan.statements.size() == 1);
    assert(plan.natively_atomic);
    const auto& sql = plan.statements[0];
    assert(sql.find("\"id\" INTEGER PRIMARY KEY AUTOINCREMENT") != std::string::npos);
    assert(sql.find("\"sr_created\" DATETIME NOT NULL") != std::string::npos);
    assert(sql.find("\"name\" TEXT NOT NULL") != std::string::npos);
    assert(sql.find("\"active\" BOOLEAN") != std::string::npos);

    auto my = mysql.create_table("contacts", columns);
    assert(my.statements[0].find("`id` BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY") != std::string::npos);
    assert(my.statements[0].find("`active` TINYINT(1)") != std::string::npos);
    assert(my.statements[0].find("ON UPDATE CURRENT_TIMESTAMP") != std::string::npos);
    assert(my.statements[0].find("ENGINE=InnoDB") != std::string::npos);

    expect_throw<validation_error>([&] { sqlite.create_table("bad name", columns); });

    auto shape = contacts_shape();
    auto add = sqlite.add_column(shape, {"phone", semantic_type::text, true});
    assert(add.statements.size() == 1);
    assert(add.statements[0] == "ALTER TABLE \"contacts\" ADD COLUMN \"phone\" TEXT");

    auto add_required = mysql.add_column(shape, {"score", semantic_type::integer, false});
    assert(add_required.statements[0] == "ALTER TABLE `contacts` ADD COLUMN `score` BIGINT NOT NULL DEFAULT 0");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_copy_and_swap: drop/retype plan on the dialect without ALTER
// ============================================================================

void test_sqlite_copy_and_swap() {
    std::cout << "  test_sqlite_copy_and_swap..." << std::flush;

    sqlite_dialect sqlite;
    auto shape = contacts_shape();

    auto plan = sqlite.drop_column(shape, "age");
    assert(!plan.natively_atomic);
    assert(plan.requires_foreign_keys_off);

    size_t create_shadow = find_statement(plan, "CREATE TABLE \"_shadow_contacts\"");
    size_t copy = find_statement(plan, "INSERT INTO \"_shadow_contacts\"");
    size_t drop = find_statement(plan, "DROP TABLE \"contacts\"");
    size_t swap = find_statement(plan, "ALTER TABLE \"_shadow_contacts\" RENAME TO \"contacts\"");
    size_t reindex = find_statement(plan, "CREATE INDEX idx_contacts_email");
    assert(create_shadow != std::string::npos);
    assert(create_shadow < copy && copy < drop && drop < swap && swap < reindex);

    // The shadow lacks the dropped column, the copy never reads it
    assert(plan.statements[create_shadow].find("\"age\"") == std::string::npos);
    assert(plan.statements[copy].find("\"age\"") == std::string::npos);
    assert(plan.statements[copy].find("\"email\"") != std::string::npos);
    assert(plan.statements[create_shadow].find("AUTOINCREMENT") != std::string::npos);
    assert(plan.statements[create_shadow].find("\"name\" TEXT NOT NULL") != std::string::npos);

    // AUTOINCREMENT high-water mark is carried over
    assert(find_statement(plan, "INSERT INTO sqlite_sequence") != std::string::npos);

    // Dropping an indexed column drops its index
    auto drop_email = sqlite.drop_column(shape, "email");
    assert(find_statement(drop_email, "CREATE INDEX idx_contacts_email") == std::string::npos);

    auto retype = sqlite.change_column_type(shape, "age", semantic_type::integer);
    size_t retype_copy = find_statement(retype, "INSERT INTO \"_shadow_contacts\"");
    assert(retype.statements[retype_copy].find("CAST(\"age\" AS INTEGER)") != std::string::npos);
    size_t retype_create = find_statement(retype, "CREATE TABLE \"_shadow_contacts\"");
    assert(retype.statements[retype_create].find("\"age\" INTEGER") != std::string::npos);

    // Rename is native (3.25+)
    auto rename = sqlite.rename_column(shape, "email", "mail");
    assert(rename.statements.size() == 1);
    assert(rename.statements[0] == "ALTER TABLE \"contacts\" RENAME COLUMN \"email\" TO \"mail\"");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_mysql_native_alter: one statement per structural operation
// ============================================================================

void test_mysql_native_alter() {
    std::cout << "  test_mysql_native_alter..." << std::flush;

    mysql_dialect mysql;
    auto shape = contacts_shape();

    auto drop = mysql.drop_column(shape, "age");
    assert(drop.statements.size() == 1);
    assert(drop.natively_atomic);
    assert(drop.statements[0] == "ALTER TABLE `contacts` DROP COLUMN `age`");

    auto retype = mysql.change_column_type(shape, "name", semantic_type::integer);
    assert(retype.statements[0] == "ALTER TABLE `contacts` MODIFY COLUMN `name` BIGINT NOT NULL");

    auto rename = mysql.rename_column(shape, "email", "mail");
    assert(rename.statements[0] == "ALTER TABLE `contacts` RENAME COLUMN `email` TO `mail`");

    expect_throw<not_found_error>([&] { mysql.drop_column(shape, "missing"); });

    foreign_key_declaration fk;
    fk.constraint_name = "fk_contacts_age_people_id";
    fk.table_name = "contacts";
    fk.column_name = "age";
    fk.referenced_table = "people";
    fk.referenced_column = "id";
    fk.on_delete = fk_action::cascade;
    auto add_fk = mysql.add_foreign_key(shape, fk);
    assert(add_fk.statements[0] ==
           "ALTER TABLE `contacts` ADD CONSTRAINT `fk_contacts_age_people_id` FOREIGN KEY (`age`) "
           "REFERENCES `people` (`id`) ON DELETE CASCADE ON UPDATE RESTRICT");
    assert(mysql.drop_foreign_key(shape, fk).statements[0] ==
           "ALTER TABLE `contacts` DROP FOREIGN KEY `fk_contacts_age_people_id`");

    sqlite_dialect sqlite;
    auto advisory = sqlite.add_foreign_key(shape, fk);
    assert(advisory.statements[0] ==
           "CREATE INDEX IF NOT EXISTS \"idx_fk_contacts_age_people_id\" ON \"contacts\" (\"age\")");
    assert(!sqlite.enforces_foreign_keys());
    assert(mysql.enforces_foreign_keys());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_dml_templates: SELECT/INSERT/UPDATE/DELETE with placeholders only
// ============================================================================

void test_dml_templates() {
    std::cout << "  test_dml_templates..." << std::flush;

    sqlite_dialect sqlite;
    mysql_dialect mysql;

    select_spec spec;
    spec.table = "contacts";
    spec.where = {{"name", condition_op::equals}, {"email", condition_op::is_null},
                  {"notes", condition_op::like}};
    spec.order = {{"sr_created", true}, {"id", true}};
    spec.limit = 10;
    spec.offset = 20;
    assert(sqlite.select(spec) ==
           "SELECT * FROM \"contacts\" WHERE \"name\" = ? AND \"email\" IS NULL AND \"notes\" LIKE ? ESCAPE '!' "
           "ORDER BY \"sr_created\" DESC, \"id\" DESC LIMIT 10 OFFSET 20");

    select_spec offset_only;
    offset_only.table = "contacts";
    offset_only.columns = {"id"};
    offset_only.offset = 5;
    assert(sqlite.select(offset_only) == "SELECT \"id\" FROM \"contacts\" LIMIT -1 OFFSET 5");
    assert(mysql.select(offset_only) == "SELECT `id` FROM `contacts` LIMIT 18446744073709551615 OFFSET 5");

    select_spec locking;
    locking.table = "table_views";
    locking.for_update = true;
    assert(mysql.select(locking) == "SELECT * FROM `table_views` FOR UPDATE");
    assert(sqlite.select(locking) == "SELECT * FROM \"table_views\"");

    assert(sqlite.insert("contacts", {"name", "email"}) ==
           "INSERT INTO \"contacts\" (\"name\", \"email\") VALUES (?, ?)");
    assert(sqlite.insert("contacts", {}) == "INSERT INTO \"contacts\" DEFAULT VALUES");
    assert(mysql.insert("contacts", {}) == "INSERT INTO `contacts` () VALUES ()");

    assert(sqlite.update("contacts", {"name", "sr_updated"}) ==
           "UPDATE \"contacts\" SET \"name\" = ?, \"sr_updated\" = ? WHERE \"id\" = ?");
    expect_throw<validation_error>([&] { sqlite.update("contacts", {}); });
    assert(mysql.remove("contacts") == "DELETE FROM `contacts` WHERE `id` = ?");

    assert(sqlite.like_pattern("50%_off!") == "%50!%!_off!!%");
    assert(sqlite.like_pattern("") == "%%");

    // Identifiers in templates go through the same grammar
    select_spec hostile;
    hostile.table = "contacts";
    hostile.where = {{"name = 1 OR 1", condition_op::equals}};
    expect_throw<validation_error>([&] { sqlite.select(hostile); });

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Dialect Tests ---" << std::endl;

    test_identifier_grammar();
    test_constraint_names();
    test_type_classification();
    test_create_and_add_column();
    test_sqlite_copy_and_swap();
    test_mysql_native_alter();
    test_dml_templates();

    std::cout << "--- Dialect Tests: All passed ---" << std::endl;
}

} // namespace dialect_tests
