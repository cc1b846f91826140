#include "tablekit/schema_introspector.hpp"
#include "tablekit/metadata_store.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <algorithm>
#include <map>
#include <set>

namespace tablekit {

std::optional<table_structure> structure_cache::get(const std::string& table) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(table);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void structure_cache::put(const table_structure& structure) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[structure.table] = structure;
}

void structure_cache::invalidate(const std::string& table) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(table);
}

void structure_cache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t structure_cache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

schema_introspector::schema_introspector(connection& conn, const dialect& d, structure_cache* cache)
    : conn_(conn), dialect_(d), cache_(cache) {}

table_structure schema_introspector::get_table_structure(const std::string& table) {
    if (cache_) {
        if (auto cached = cache_->get(table)) {
            return *cached;
        }
    }
    return read_table_structure(table);
}

std::vector<foreign_key_declaration> schema_introspector::advisory_declarations(const std::string& table) {
    // Before the metadata tables exist (first migration) there is nothing to read.
    if (!conn_.table_exists("table_foreign_keys")) return {};
    metadata_store store(conn_, dialect_);
    return store.list_foreign_key_declarations(table);
}

table_structure schema_introspector::read_table_structure(const std::string& table) {
    dialect_.validate_identifier(table);
    table_shape shape = dialect_.read_table_shape(conn_, table);

    table_structure structure;
    structure.table = table;
    for (const auto& col : shape.columns) {
        column_descriptor desc;
        desc.name = col.name;
        desc.physical_type = col.type;
        desc.type = dialect_.classify(col.type);
        desc.nullable = !col.not_null && !col.primary_key;
        desc.primary_key = col.primary_key;
        desc.auto_increment = col.auto_increment;
        desc.default_value = col.default_sql;
        if (desc.type == semantic_type::unsupported) {
            LOG_DEBUG("introspect", "Column %s.%s has unsupported type %s",
                      table.c_str(), col.name.c_str(), col.type.c_str());
        }
        structure.columns.push_back(std::move(desc));
    }

    auto mark_reference = [&](const std::string& column, const std::string& ref_table, const std::string& ref_column) {
        for (auto& desc : structure.columns) {
            if (desc.name == column && !desc.primary_key) {
                desc.type = semantic_type::foreign_key;
                desc.reference = foreign_key_ref{ref_table, ref_column};
            }
        }
    };

    for (const auto& fk : shape.foreign_keys) {
        mark_reference(fk.column, fk.referenced_table, fk.referenced_column);
    }
    if (!dialect_.enforces_foreign_keys()) {
        for (const auto& fk : advisory_declarations(table)) {
            mark_reference(fk.column_name, fk.referenced_table, fk.referenced_column);
        }
    }

    if (cache_) {
        cache_->put(structure);
    }
    return structure;
}

std::vector<std::string> schema_introspector::list_physical_tables() {
    std::vector<std::string> tables;
    for (auto& name : dialect_.list_tables(conn_)) {
        if (!metadata_store::is_metadata_table(name)) {
            tables.push_back(std::move(name));
        }
    }
    return tables;
}

bool schema_introspector::table_exists(const std::string& table) {
    dialect_.validate_identifier(table);
    return conn_.table_exists(table);
}

std::vector<database_table_info> schema_introspector::list_database_tables(
        const std::vector<table_configuration>& configs) {
    std::map<std::string, const table_configuration*> by_name;
    for (const auto& config : configs) by_name[config.name] = &config;

    auto physical = list_physical_tables();
    std::sort(physical.begin(), physical.end());
    std::vector<database_table_info> tables;
    for (const auto& name : physical) {
        database_table_info info;
        info.table_name = name;
        auto it = by_name.find(name);
        if (it != by_name.end()) {
            info.has_configuration = true;
            info.configuration_title = it->second->title;
        }
        tables.push_back(std::move(info));
    }
    return tables;
}

int64_t schema_introspector::approx_total_rows(const std::vector<std::string>& tables) {
    if (tables.empty()) return 0;

    if (dialect_.kind() == dialect_kind::mysql) {
        std::string sql = "SELECT COALESCE(SUM(TABLE_ROWS), 0) AS total FROM INFORMATION_SCHEMA.TABLES "
                          "WHERE TABLE_SCHEMA = DATABASE() AND TABLE_TYPE = 'BASE TABLE' AND TABLE_NAME IN (";
        std::vector<column_value_t> params;
        for (const auto& table : tables) {
            dialect_.validate_identifier(table);
            sql += params.empty() ? "?" : ", ?";
            params.push_back(table);
        }
        sql += ")";
        auto rows = conn_.query(sql, params);
        return rows.empty() ? 0 : column_int(rows[0], "total");
    }

    int64_t total = 0;
    for (const auto& table : tables) {
        if (!conn_.table_exists(table)) continue;
        auto rows = conn_.query("SELECT COUNT(*) AS n FROM " + dialect_.quote(table));
        if (!rows.empty()) total += column_int(rows[0], "n");
    }
    return total;
}

consistency_report schema_introspector::check_consistency(const std::vector<table_configuration>& configs) {
    consistency_report report;
    auto physical = list_physical_tables();
    std::set<std::string> physical_set(physical.begin(), physical.end());
    std::set<std::string> configured;

    for (const auto& config : configs) {
        configured.insert(config.name);
        if (!physical_set.count(config.name)) {
            report.missing_physical.push_back(config.name);
        }
    }
    for (const auto& name : physical) {
        // Leftovers of an interrupted copy-and-swap count as orphans too.
        if (!configured.count(name)) {
            report.orphaned_physical.push_back(name);
        }
    }
    if (!report.consistent()) {
        LOG_WARN("introspect", "Schema inconsistent: %zu configured tables missing, %zu orphaned tables",
                 report.missing_physical.size(), report.orphaned_physical.size());
    }
    return report;
}

} // namespace tablekit
