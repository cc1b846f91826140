#include "tablekit/view_resolver.hpp"
#include "tablekit/metadata_store.hpp"
#include "tablekit/errors.hpp"
#include "tablekit/log.hpp"
#include <algorithm>

namespace tablekit {

view_resolver::view_resolver(connection& conn, const dialect& d, structure_cache* cache)
    : conn_(conn), dialect_(d), cache_(cache) {}

effective_view view_resolver::combine(const table_structure& structure, const table_view* view) {
    effective_view result;
    result.table_name = structure.table;
    if (view) {
        result.view_id = view->id;
        result.view_name = view->name;
        result.view_type = view->view_type;
    }

    struct ranked {
        effective_column column;
        size_t position;
    };
    std::vector<ranked> explicit_columns;
    std::vector<effective_column> implicit_columns;

    for (size_t i = 0; i < structure.columns.size(); ++i) {
        const auto& desc = structure.columns[i];
        effective_column col;
        col.name = desc.name;
        col.type = desc.type;
        col.order = static_cast<int64_t>(i);

        const view_column* entry = nullptr;
        if (view) {
            for (const auto& vc : view->columns) {
                if (vc.column_name == desc.name) {
                    entry = &vc;
                    break;
                }
            }
        }
        if (entry) {
            col.visible = entry->visible;
            col.order = entry->order;
            col.width = entry->width;
            col.sort = entry->sort;
            col.has_entry = true;
            explicit_columns.push_back({std::move(col), i});
        } else {
            implicit_columns.push_back(std::move(col));
        }
    }

    std::stable_sort(explicit_columns.begin(), explicit_columns.end(), [](const ranked& a, const ranked& b) {
        if (a.column.order != b.column.order) return a.column.order < b.column.order;
        return a.position < b.position;
    });

    for (auto& r : explicit_columns) {
        result.columns.push_back(std::move(r.column));
    }
    for (auto& col : implicit_columns) {
        result.columns.push_back(std::move(col));
    }
    return result;
}

effective_view view_resolver::resolve(const std::string& table, std::optional<int64_t> view_id) {
    dialect_.validate_identifier(table);
    metadata_store store(conn_, dialect_);
    store.get_table_configuration(table);

    schema_introspector introspector(conn_, dialect_, cache_);
    table_structure structure;
    try {
        structure = introspector.get_table_structure(table);
    } catch (const not_found_error&) {
        throw fatal_error("Table " + table + " is configured but has no physical table", table);
    }

    std::optional<table_view> view;
    if (view_id) {
        view = store.get_view(*view_id);
        if (view->table_name != table) {
            throw not_found_error("View " + std::to_string(*view_id) + " does not belong to " + table, "view_id");
        }
    } else {
        view = store.default_view(table);
    }

    if (view) {
        for (const auto& entry : view->columns) {
            if (!structure.has_column(entry.column_name)) {
                LOG_DEBUG("views", "View %s lists missing column %s.%s", view->name.c_str(),
                          table.c_str(), entry.column_name.c_str());
            }
        }
    }
    return combine(structure, view ? &*view : nullptr);
}

} // namespace tablekit
