#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "connection.hpp"
#include "dialect.hpp"
#include "schema_introspector.hpp"
#include <optional>

namespace tablekit {

/// Merges a saved view with the live columns of its table. Columns the view
/// has entries for come first by column order (ties in catalog order); the
/// rest follow visible, in catalog order. Entries for columns that no longer
/// exist are ignored.
class view_resolver {
public:
    view_resolver(connection& conn, const dialect& d, structure_cache* cache = nullptr);

    /// Uses view_id when given, else the table's default view, else no view.
    effective_view resolve(const std::string& table, std::optional<int64_t> view_id = std::nullopt);

    static effective_view combine(const table_structure& structure, const table_view* view);

private:
    connection& conn_;
    const dialect& dialect_;
    structure_cache* cache_;
};

} // namespace tablekit

#endif // __cplusplus
