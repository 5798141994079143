#include "repart/dialect.hpp"
#include "repart/errors.hpp"
#include <sstream>

namespace repart {

namespace {

std::string column_list(const std::vector<std::string>& columns, const std::string& prefix = {}) {
    std::ostringstream sql;
    bool first = true;
    for (const auto& c : columns) {
        if (!first) sql << ", ";
        sql << prefix << c;
        first = false;
    }
    return sql.str();
}

std::string key_match(const std::vector<std::string>& key, const std::string& left, const std::string& right) {
    std::ostringstream sql;
    bool first = true;
    for (const auto& k : key) {
        if (!first) sql << " AND ";
        sql << left << "." << k << " = " << right << "." << k;
        first = false;
    }
    return sql.str();
}

std::string quote_literal(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "''";
        else out += c;
    }
    out += "'";
    return out;
}

[[noreturn]] void no_partitions(const char* operation, const physical_table& table) {
    throw configuration_error(std::string("SQLite cannot ") + operation + " on " + table.to_string() +
                              ": tables are never partitioned");
}

} // namespace

// SQLite stores names as written and compares them case-insensitively.
std::string sqlite_dialect::identifier(const std::string& name) const {
    return name;
}

// ============================================================================
// Catalog reads
// ============================================================================

statement sqlite_dialect::object_exists(const std::string& schema, const std::string& name,
                                        object_kind kind) const {
    const char* type = "table";
    switch (kind) {
        case object_kind::table: type = "table"; break;
        case object_kind::view: type = "view"; break;
        case object_kind::trigger: type = "trigger"; break;
        case object_kind::index: type = "index"; break;
    }
    return statement("SELECT COUNT(*) AS n FROM " + schema +
                     ".sqlite_master WHERE type = ?1 AND lower(name) = lower(?2)",
                     {std::string(type), name});
}

statement sqlite_dialect::count_rows(const physical_table& table) const {
    return statement("SELECT COUNT(*) AS n FROM " + qualify(table));
}

statement sqlite_dialect::count_missing_keys(const physical_table& reference, const physical_table& target,
                                             const std::vector<std::string>& key) const {
    return statement("SELECT COUNT(*) AS n FROM " + qualify(reference) + " r WHERE NOT EXISTS (SELECT 1 FROM " +
                     qualify(target) + " t WHERE " + key_match(key, "t", "r") + ")");
}

statement sqlite_dialect::constraint_states(const physical_table& table) const {
    // Foreign keys are only enforced while PRAGMA foreign_keys is on.
    return statement(
        "SELECT 'PK' AS constraint_name, 'P' AS constraint_type, 'ENABLED' AS status "
        "WHERE EXISTS (SELECT 1 FROM pragma_table_info(?1, ?2) WHERE pk > 0) "
        "UNION ALL "
        "SELECT DISTINCT 'FK_' || id, 'R', "
        "CASE WHEN (SELECT foreign_keys FROM pragma_foreign_keys) THEN 'ENABLED' ELSE 'DISABLED' END "
        "FROM pragma_foreign_key_list(?1, ?2)",
        {table.name, table.schema});
}

statement sqlite_dialect::active_sessions(const std::string& /*schema*/, const std::string& pattern) const {
    return statement("SELECT repart_active_statements(?1) AS n", {to_upper(pattern)});
}

std::optional<statement> sqlite_dialect::partition_slices(const physical_table& /*table*/) const {
    return std::nullopt;
}

statement sqlite_dialect::table_columns(const physical_table& table) const {
    return statement(
        "SELECT name, type, CASE WHEN \"notnull\" = 1 OR pk > 0 THEN 'N' ELSE 'Y' END AS nullable "
        "FROM pragma_table_info(?1, ?2) ORDER BY cid",
        {table.name, table.schema});
}

statement sqlite_dialect::primary_key_columns(const physical_table& table) const {
    return statement("SELECT name FROM pragma_table_info(?1, ?2) WHERE pk > 0 ORDER BY pk",
                     {table.name, table.schema});
}

statement sqlite_dialect::table_indexes(const physical_table& table) const {
    // origin 'c' excludes the automatic indexes behind PRIMARY KEY and UNIQUE.
    return statement(
        "SELECT il.name AS index_name, il.\"unique\" AS is_unique, ii.name AS column_name "
        "FROM pragma_index_list(?1, ?2) il JOIN pragma_index_info(il.name, ?2) ii "
        "WHERE il.origin = 'c' ORDER BY il.name, ii.seqno",
        {table.name, table.schema});
}

std::optional<statement> sqlite_dialect::table_grants(const physical_table& /*table*/) const {
    return std::nullopt;
}

std::optional<statement> sqlite_dialect::invalid_objects(const std::string& /*schema*/) const {
    return std::nullopt;
}

// ============================================================================
// DDL / DML
// ============================================================================

statement sqlite_dialect::create_table(const physical_table& target, const table_metadata& source,
                                       int /*parallel_degree*/) const {
    if (target.scheme.is_partitioned()) {
        no_partitions("create a partitioned table", target);
    }
    std::ostringstream sql;
    sql << "CREATE TABLE " << qualify(target) << " (";
    bool first = true;
    for (const auto& col : source.columns) {
        if (!first) sql << ", ";
        sql << col.name;
        if (!col.sql_type.empty()) sql << " " << col.sql_type;
        if (!col.nullable) sql << " NOT NULL";
        first = false;
    }
    sql << ", CONSTRAINT " << target.name << "_PK PRIMARY KEY (" << column_list(source.primary_key) << "))";
    return statement(sql.str());
}

statement sqlite_dialect::backfill_batch(const physical_table& source, const physical_table& target,
                                         const table_metadata& metadata,
                                         const std::vector<std::string>& order_by,
                                         int64_t batch_rows, int /*parallel_degree*/) const {
    auto columns = metadata.column_names();
    std::ostringstream sql;
    sql << "INSERT INTO " << qualify(target) << " (" << column_list(columns) << ") "
        << "SELECT " << column_list(columns, "s.") << " FROM " << qualify(source) << " s "
        << "WHERE NOT EXISTS (SELECT 1 FROM " << qualify(target) << " t WHERE "
        << key_match(metadata.primary_key, "t", "s") << ")";
    if (!order_by.empty()) {
        sql << " ORDER BY " << column_list(order_by, "s.");
    }
    if (batch_rows > 0) {
        sql << " LIMIT " << batch_rows;
    }
    return statement(sql.str());
}

statement sqlite_dialect::delete_missing_keys(const physical_table& target, const physical_table& reference,
                                              const std::vector<std::string>& key) const {
    return statement("DELETE FROM " + qualify(target) + " AS t WHERE NOT EXISTS (SELECT 1 FROM " +
                     qualify(reference) + " r WHERE " + key_match(key, "r", "t") + ")");
}

statement sqlite_dialect::create_index(const physical_table& target, const std::string& index_name,
                                       const index_def& index, bool /*local*/, int /*parallel_degree*/) const {
    // The ON table of CREATE INDEX is resolved in the index's schema.
    return statement("CREATE " + std::string(index.unique ? "UNIQUE " : "") + "INDEX " +
                     qualify(target.schema, index_name) + " ON " + target.name +
                     " (" + column_list(index.columns) + ")");
}

statement sqlite_dialect::gather_statistics(const physical_table& table, int /*parallel_degree*/) const {
    return statement("ANALYZE " + qualify(table));
}

statement sqlite_dialect::enable_constraint(const physical_table& /*table*/,
                                            const std::string& /*constraint_name*/) const {
    return statement("PRAGMA foreign_keys = ON");
}

statement sqlite_dialect::rename_table(const physical_table& table, const std::string& new_name) const {
    return statement("ALTER TABLE " + qualify(table) + " RENAME TO " + new_name);
}

statement sqlite_dialect::drop_table(const physical_table& table) const {
    return statement("DROP TABLE " + qualify(table));
}

statement sqlite_dialect::insert_row(const physical_table& table, const std::vector<std::string>& columns,
                                     std::vector<column_value_t> values) const {
    std::ostringstream marks;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i) marks << ", ";
        marks << "?" << (i + 1);
    }
    return statement("INSERT INTO " + qualify(table) + " (" + column_list(columns) + ") VALUES (" +
                     marks.str() + ")",
                     std::move(values));
}

// View and trigger bodies may not name a schema; the objects live beside
// the tables they read.
statement sqlite_dialect::create_bridge_view(const bridge_spec& spec) const {
    auto cols = column_list(spec.columns);
    auto key = column_list(spec.key_columns);
    if (spec.key_columns.size() > 1) key = "(" + key + ")";

    std::ostringstream sql;
    sql << "CREATE VIEW " << qualify(spec.schema, spec.view_name) << " AS "
        << "SELECT " << cols << " FROM " << spec.shadow_name
        << " UNION ALL "
        << "SELECT " << cols << " FROM " << spec.retired_name
        << " WHERE " << key << " NOT IN (SELECT " << column_list(spec.key_columns)
        << " FROM " << spec.shadow_name << ")";
    return statement(sql.str());
}

std::vector<std::string> sqlite_dialect::write_router_triggers(const bridge_spec& spec) const {
    return {spec.view_name + "_ins", spec.view_name + "_upd", spec.view_name + "_del"};
}

std::vector<statement> sqlite_dialect::create_write_router(const bridge_spec& spec) const {
    auto names = write_router_triggers(spec);
    auto reject = quote_literal("Bridge " + spec.view_name + " accepts INSERT only");

    std::vector<statement> out;
    out.emplace_back("CREATE TRIGGER " + qualify(spec.schema, names[0]) + " INSTEAD OF INSERT ON " +
                     spec.view_name + " BEGIN INSERT INTO " + spec.shadow_name + " (" +
                     column_list(spec.columns) + ") VALUES (" + column_list(spec.columns, "NEW.") + "); END");
    out.emplace_back("CREATE TRIGGER " + qualify(spec.schema, names[1]) + " INSTEAD OF UPDATE ON " +
                     spec.view_name + " BEGIN SELECT RAISE(ABORT, " + reject + "); END");
    out.emplace_back("CREATE TRIGGER " + qualify(spec.schema, names[2]) + " INSTEAD OF DELETE ON " +
                     spec.view_name + " BEGIN SELECT RAISE(ABORT, " + reject + "); END");
    return out;
}

statement sqlite_dialect::drop_view(const std::string& schema, const std::string& name) const {
    return statement("DROP VIEW " + qualify(schema, name));
}

statement sqlite_dialect::drop_trigger(const std::string& schema, const std::string& name) const {
    return statement("DROP TRIGGER " + qualify(schema, name));
}

std::optional<statement> sqlite_dialect::recompile(const std::string& /*schema*/,
                                                   const schema_object& /*object*/) const {
    return std::nullopt;
}

std::optional<statement> sqlite_dialect::grant(const physical_table& /*table*/, const grant_def& /*grant*/) const {
    return std::nullopt;
}

// ============================================================================
// Partition exchange
// ============================================================================

statement sqlite_dialect::exchange_partition(const physical_table& table, const std::string& /*partition*/,
                                             const physical_table& /*with_table*/) const {
    no_partitions("exchange a partition", table);
}

statement sqlite_dialect::add_partition(const physical_table& table, const std::string& /*partition*/,
                                        const std::string& /*upper_bound*/) const {
    no_partitions("add a partition", table);
}

statement sqlite_dialect::drop_partition(const physical_table& table, const std::string& /*partition*/) const {
    no_partitions("drop a partition", table);
}

} // namespace repart
