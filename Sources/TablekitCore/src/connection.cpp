#include "tablekit/connection.hpp"
#include "tablekit/config.hpp"
#include "tablekit/log.hpp"

#ifdef TABLEKIT_HAVE_MYSQL
#include "tablekit/mysql_connection.hpp"
#endif

namespace tablekit {

std::unique_ptr<connection> open_connection(const configuration& config) {
    switch (config.dialect) {
        case dialect_kind::sqlite:
            return std::make_unique<sqlite_connection>(config.path);
        case dialect_kind::mysql:
#ifdef TABLEKIT_HAVE_MYSQL
            return std::make_unique<mysql_connection>(config.host, config.port, config.user,
                                                      config.password, config.database);
#else
            throw fatal_error("This build of Tablekit has no MySQL support");
#endif
    }
    throw fatal_error("Unknown dialect");
}

// Transaction RAII guard
transaction::transaction(connection& conn) : conn_(conn) {
    if (!conn_.is_in_transaction()) {
        conn_.begin_transaction();
        owns_ = true;
    }
}

transaction::~transaction() {
    // The driver may already have rolled back on its own (SQLITE_FULL, deadlock).
    if (owns_ && !completed_ && conn_.is_in_transaction()) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    if (owns_ && !completed_) {
        conn_.commit();
    }
    completed_ = true;
}

void transaction::rollback() {
    if (owns_ && !completed_) {
        conn_.rollback();
    }
    completed_ = true;
}

foreign_keys_suspended::foreign_keys_suspended(connection& conn) : conn_(conn) {
    if (conn_.kind() != dialect_kind::sqlite) return;
    if (conn_.is_in_transaction()) {
        throw fatal_error("Foreign keys cannot be suspended inside a transaction");
    }
    conn_.execute("PRAGMA foreign_keys = OFF");
    active_ = true;
}

foreign_keys_suspended::~foreign_keys_suspended() {
    if (!active_) return;
    try {
        conn_.execute("PRAGMA foreign_keys = ON");
    } catch (const std::exception& e) {
        LOG_ERROR("db", "Failed to re-enable foreign keys: %s", e.what());
    }
}

void verify_foreign_keys(connection& conn) {
    if (conn.kind() != dialect_kind::sqlite) return;
    auto violations = conn.query("PRAGMA foreign_key_check");
    if (!violations.empty()) {
        const auto& first = violations.front();
        throw integrity_error("Foreign key violation in " + column_text(first, "table") +
                              " (row " + column_text(first, "rowid") + " references missing " +
                              column_text(first, "parent") + ")", column_text(first, "table"));
    }
}

} // namespace tablekit
