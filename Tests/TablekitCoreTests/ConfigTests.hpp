#pragma once

#include "TestSupport.hpp"
#include <cstdlib>
#include <fstream>

namespace config_tests {

using namespace tablekit;
using test_support::expect_throw;

inline std::string write_file(const std::string& name, const std::string& content) {
    auto path = (std::filesystem::temp_directory_path() / ("tablekit_test_" + name + ".json")).string();
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

// ============================================================================
// test_defaults
// ============================================================================

void test_defaults() {
    std::cout << "  test_defaults..." << std::flush;

    configuration config;
    assert(config.dialect == dialect_kind::sqlite);
    assert(config.path == ":memory:");
    assert(config.effective_pool_size() == 1);
    assert(config.on_delete_table == delete_table_policy::retain);
    assert(config.max_page_size == 1000);

    configuration file("/tmp/data.sqlite");
    file.pool_size = 8;
    assert(file.effective_pool_size() == 8);
    file.pool_size = 0;
    assert(file.effective_pool_size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_json_file
// ============================================================================

void test_json_file() {
    std::cout << "  test_json_file..." << std::flush;

    auto path = write_file("config", R"({
        "dialect": "mysql",
        "host": "db.internal",
        "port": 3307,
        "user": "app",
        "password": "hunter2",
        "database": "crm",
        "pool_size": 6,
        "lock_timeout_ms": 250,
        "max_page_size": 50,
        "on_delete_table": "drop",
        "log_level": "debug"
    })");
    auto config = configuration::from_json_file(path);
    assert(config.dialect == dialect_kind::mysql);
    assert(config.host == "db.internal");
    assert(config.port == 3307);
    assert(config.database == "crm");
    assert(config.pool_size == 6);
    assert(config.lock_timeout == std::chrono::milliseconds(250));
    assert(config.mutation_lock_timeout == std::chrono::milliseconds(30000));
    assert(config.max_page_size == 50);
    assert(config.on_delete_table == delete_table_policy::drop);
    assert(config.level == log_level::debug);

    auto summary = config.describe();
    assert(summary.find("hunter2") == std::string::npos);
    assert(summary.find("password=***") != std::string::npos);
    assert(summary.find("host=db.internal") != std::string::npos);
    std::filesystem::remove(path);

    auto bad_dialect = write_file("bad_dialect", R"({"dialect": "postgres"})");
    auto e = expect_throw<validation_error>([&] { configuration::from_json_file(bad_dialect); });
    assert(e.field() == "dialect");
    std::filesystem::remove(bad_dialect);

    auto malformed = write_file("malformed", "{ not json");
    expect_throw<validation_error>([&] { configuration::from_json_file(malformed); });
    std::filesystem::remove(malformed);

    auto negative = write_file("negative", R"({"acquire_timeout_ms": -5})");
    expect_throw<validation_error>([&] { configuration::from_json_file(negative); });
    std::filesystem::remove(negative);

    auto policy = write_file("policy", R"({"on_delete_table": "archive"})");
    expect_throw<validation_error>([&] { configuration::from_json_file(policy); });
    std::filesystem::remove(policy);

    expect_throw<validation_error>([] { configuration::from_json_file("/nonexistent/tablekit.json"); });

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_environment_overlay
// ============================================================================

void test_environment_overlay() {
    std::cout << "  test_environment_overlay..." << std::flush;

    setenv("DB_HOST", "mysql.local", 1);
    setenv("DB_PORT", "not-a-port", 1);
    setenv("DB_USER", "svc", 1);
    setenv("DB_NAME", "inventory", 1);
    setenv("LOG_LEVEL", "INFO", 1);

    configuration config;
    config.apply_environment();
    assert(config.dialect == dialect_kind::mysql);
    assert(config.host == "mysql.local");
    assert(config.port == 3306);
    assert(config.user == "svc");
    assert(config.database == "inventory");
    assert(config.level == log_level::info);

    setenv("DB_PORT", "3310", 1);
    config.apply_environment();
    assert(config.port == 3310);

    unsetenv("DB_HOST");
    unsetenv("DB_PORT");
    unsetenv("DB_USER");
    unsetenv("DB_NAME");
    unsetenv("LOG_LEVEL");

    configuration untouched;
    untouched.apply_environment();
    assert(untouched.dialect == dialect_kind::sqlite);

    assert(log_level_from_string("Warning") == log_level::warn);
    assert(log_level_from_string("off") == log_level::off);
    assert(!log_level_from_string("verbose"));
    assert(std::string(to_string(log_level::error)) == "error");

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Config Tests ---" << std::endl;

    test_defaults();
    test_json_file();
    test_environment_overlay();

    std::cout << "--- Config Tests: All passed ---" << std::endl;
}

} // namespace config_tests
