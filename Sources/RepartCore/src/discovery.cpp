#include "repart/discovery.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"

namespace repart {

static bool is_yes(const row_t& row, const std::string& column) {
    auto text = to_upper(row_text(row, column));
    return text == "Y" || text == "YES" || text == "1";
}

table_metadata catalog_discovery::discover(const physical_table& table, const error_context& where) const {
    const auto& d = gw_.sql_dialect();
    error_context ctx = where;
    ctx.step = "discover(" + table.to_string() + ")";

    table_metadata meta;
    try {
        for (const auto& row : run_query(gw_, d.table_columns(table), timeout_, ctx)) {
            meta.columns.push_back({row_text(row, "name"), row_text(row, "type"), is_yes(row, "nullable")});
        }
        if (meta.columns.empty()) {
            throw precondition_failed("Table " + table.to_string() + " not found", ctx);
        }

        for (const auto& row : run_query(gw_, d.primary_key_columns(table), timeout_, ctx)) {
            meta.primary_key.push_back(row_text(row, "name"));
        }

        // One row per index column, ordered by index then position
        for (const auto& row : run_query(gw_, d.table_indexes(table), timeout_, ctx)) {
            auto name = row_text(row, "index_name");
            if (meta.indexes.empty() || meta.indexes.back().name != name) {
                meta.indexes.push_back({name, {}, row_int(row, "is_unique") != 0});
            }
            meta.indexes.back().columns.push_back(row_text(row, "column_name"));
        }

        if (auto grants = d.table_grants(table)) {
            for (const auto& row : run_query(gw_, *grants, timeout_, ctx)) {
                meta.grants.push_back({row_text(row, "grantee"), row_text(row, "privilege"),
                                       is_yes(row, "grantable")});
            }
        }
    } catch (const db_error& e) {
        raise_database_error(e, ctx);
    }

    LOG_DEBUG("discovery", "%s: %zu columns, %zu key columns, %zu indexes, %zu grants",
              table.to_string().c_str(), meta.columns.size(), meta.primary_key.size(),
              meta.indexes.size(), meta.grants.size());
    return meta;
}

} // namespace repart
