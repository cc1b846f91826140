#include "tablekit/migrations.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include "tablekit/value_codec.hpp"

namespace tablekit {

const std::vector<migration>& migrator::migrations() {
    static const std::vector<migration> all = {
        {
            1, "init",
            // sqlite up
            {
                R"(CREATE TABLE IF NOT EXISTS table_configurations (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    name TEXT NOT NULL UNIQUE,
                    title TEXT,
                    ordinal INTEGER DEFAULT 0,
                    db TEXT,
                    create_button_text TEXT,
                    icon TEXT
                ))",
                R"(CREATE TABLE IF NOT EXISTS table_views (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    table_name TEXT NOT NULL,
                    view_name TEXT NOT NULL,
                    is_default INTEGER NOT NULL DEFAULT 0,
                    sr_created DATETIME DEFAULT CURRENT_TIMESTAMP,
                    UNIQUE(table_name, view_name)
                ))",
                "CREATE INDEX IF NOT EXISTS idx_table_views_table_name ON table_views (table_name)",
                R"(CREATE TABLE IF NOT EXISTS table_view_columns (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    view_id INTEGER NOT NULL,
                    column_name TEXT NOT NULL,
                    is_visible INTEGER NOT NULL DEFAULT 1,
                    column_order INTEGER NOT NULL DEFAULT 0,
                    column_width INTEGER,
                    sort_order TEXT,
                    FOREIGN KEY (view_id) REFERENCES table_views(id) ON DELETE CASCADE,
                    UNIQUE(view_id, column_name)
                ))",
            },
            // mysql up
            {
                R"(CREATE TABLE IF NOT EXISTS table_configurations (
                    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
                    name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    title VARCHAR(255),
                    ordinal INT DEFAULT 0,
                    db VARCHAR(255),
                    create_button_text VARCHAR(255),
                    icon VARCHAR(255),
                    UNIQUE KEY uq_table_configurations_name (name)
                ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)",
                R"(CREATE TABLE IF NOT EXISTS table_views (
                    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
                    table_name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    view_name VARCHAR(255) NOT NULL,
                    is_default TINYINT(1) NOT NULL DEFAULT 0,
                    sr_created DATETIME DEFAULT CURRENT_TIMESTAMP,
                    UNIQUE KEY uq_table_views_name (table_name, view_name),
                    KEY idx_table_views_table_name (table_name)
                ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)",
                R"(CREATE TABLE IF NOT EXISTS table_view_columns (
                    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
                    view_id BIGINT NOT NULL,
                    column_name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    is_visible TINYINT(1) NOT NULL DEFAULT 1,
                    column_order INT NOT NULL DEFAULT 0,
                    column_width INT NULL,
                    sort_order VARCHAR(8) NULL,
                    UNIQUE KEY uq_table_view_columns (view_id, column_name),
                    CONSTRAINT fk_table_view_columns_view FOREIGN KEY (view_id)
                        REFERENCES table_views(id) ON DELETE CASCADE
                ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)",
            },
            // sqlite down
            {
                "DROP TABLE IF EXISTS table_view_columns",
                "DROP TABLE IF EXISTS table_views",
                "DROP TABLE IF EXISTS table_configurations",
            },
            // mysql down
            {
                "DROP TABLE IF EXISTS table_view_columns",
                "DROP TABLE IF EXISTS table_views",
                "DROP TABLE IF EXISTS table_configurations",
            },
        },
        {
            2, "foreign_keys",
            {
                R"(CREATE TABLE IF NOT EXISTS table_foreign_keys (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    constraint_name TEXT NOT NULL UNIQUE,
                    table_name TEXT NOT NULL,
                    column_name TEXT NOT NULL,
                    referenced_table TEXT NOT NULL,
                    referenced_column TEXT NOT NULL,
                    on_delete TEXT NOT NULL DEFAULT 'RESTRICT',
                    on_update TEXT NOT NULL DEFAULT 'RESTRICT',
                    enforced INTEGER NOT NULL DEFAULT 0
                ))",
                "CREATE INDEX IF NOT EXISTS idx_table_foreign_keys_table ON table_foreign_keys (table_name)",
                "CREATE INDEX IF NOT EXISTS idx_table_foreign_keys_referenced ON table_foreign_keys (referenced_table)",
            },
            {
                R"(CREATE TABLE IF NOT EXISTS table_foreign_keys (
                    id BIGINT NOT NULL AUTO_INCREMENT PRIMARY KEY,
                    constraint_name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    table_name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    column_name VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    referenced_table VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    referenced_column VARCHAR(64) COLLATE utf8mb4_bin NOT NULL,
                    on_delete VARCHAR(16) NOT NULL DEFAULT 'RESTRICT',
                    on_update VARCHAR(16) NOT NULL DEFAULT 'RESTRICT',
                    enforced TINYINT(1) NOT NULL DEFAULT 0,
                    UNIQUE KEY uq_table_foreign_keys_name (constraint_name),
                    KEY idx_table_foreign_keys_table (table_name),
                    KEY idx_table_foreign_keys_referenced (referenced_table)
                ) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4)",
            },
            {
                "DROP TABLE IF EXISTS table_foreign_keys",
            },
            {
                "DROP TABLE IF EXISTS table_foreign_keys",
            },
        },
        {
            3, "view_type",
            {
                "ALTER TABLE table_views ADD COLUMN view_type TEXT NOT NULL DEFAULT 'table'",
            },
            {
                "ALTER TABLE table_views ADD COLUMN view_type VARCHAR(50) NOT NULL DEFAULT 'table'",
            },
            // SQLite cannot drop the column in place: copy-and-swap.
            {
                R"(CREATE TABLE table_views_new (
                    id INTEGER PRIMARY KEY AUTOINCREMENT,
                    table_name TEXT NOT NULL,
                    view_name TEXT NOT NULL,
                    is_default INTEGER NOT NULL DEFAULT 0,
                    sr_created DATETIME DEFAULT CURRENT_TIMESTAMP,
                    UNIQUE(table_name, view_name)
                ))",
                "INSERT INTO table_views_new (id, table_name, view_name, is_default, sr_created) "
                "SELECT id, table_name, view_name, is_default, sr_created FROM table_views",
                "DROP TABLE table_views",
                "ALTER TABLE table_views_new RENAME TO table_views",
                "CREATE INDEX IF NOT EXISTS idx_table_views_table_name ON table_views (table_name)",
            },
            {
                "ALTER TABLE table_views DROP COLUMN view_type",
            },
        },
    };
    return all;
}

int migrator::latest_version() {
    return migrations().back().version;
}

migrator::migrator(connection& conn, const dialect& d) : conn_(conn), dialect_(d) {}

void migrator::ensure_migrations_table() {
    // Same text is valid on both dialects.
    conn_.execute("CREATE TABLE IF NOT EXISTS schema_migrations ("
                  "version BIGINT NOT NULL PRIMARY KEY, "
                  "name VARCHAR(255) NOT NULL, "
                  "applied_at DATETIME NOT NULL)");
}

int migrator::current_version() {
    ensure_migrations_table();
    auto rows = conn_.query("SELECT MAX(version) AS version FROM schema_migrations");
    if (rows.empty() || column_is_null(rows[0], "version")) {
        return 0;
    }
    return static_cast<int>(column_int(rows[0], "version"));
}

void migrator::run(const std::vector<std::string>& statements) {
    for (const auto& sql : statements) {
        conn_.execute(sql);
    }
}

void migrator::migrate_to_latest() {
    int current = current_version();
    if (current > latest_version()) {
        throw fatal_error("Metadata schema is at version " + std::to_string(current) +
                          " but this build only knows up to " + std::to_string(latest_version()));
    }

    for (const auto& m : migrations()) {
        if (m.version <= current) continue;
        LOG_INFO("migrate", "Applying migration %d (%s)", m.version, m.name.c_str());

        if (dialect_.kind() == dialect_kind::sqlite) {
            foreign_keys_suspended fk_off(conn_);
            transaction tx(conn_);
            run(m.sqlite_up);
            verify_foreign_keys(conn_);
            conn_.execute("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)",
                          {static_cast<int64_t>(m.version), m.name, codec::format_timestamp(codec::now())});
            tx.commit();
        } else {
            // MySQL DDL commits on its own; record the version once it is through.
            run(m.mysql_up);
            conn_.execute("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)",
                          {static_cast<int64_t>(m.version), m.name, codec::format_timestamp(codec::now())});
        }
    }
}

void migrator::revert_to(int version) {
    if (version < 0) {
        throw validation_error("Migration version must not be negative", "version");
    }
    int current = current_version();
    const auto& all = migrations();
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        const auto& m = *it;
        if (m.version > current || m.version <= version) continue;
        LOG_INFO("migrate", "Reverting migration %d (%s)", m.version, m.name.c_str());

        if (dialect_.kind() == dialect_kind::sqlite) {
            foreign_keys_suspended fk_off(conn_);
            transaction tx(conn_);
            run(m.sqlite_down);
            verify_foreign_keys(conn_);
            conn_.execute("DELETE FROM schema_migrations WHERE version = ?", {static_cast<int64_t>(m.version)});
            tx.commit();
        } else {
            run(m.mysql_down);
            conn_.execute("DELETE FROM schema_migrations WHERE version = ?", {static_cast<int64_t>(m.version)});
        }
    }
}

} // namespace tablekit
