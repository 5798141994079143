#include "repart/dialect.hpp"
#include "repart/errors.hpp"
#include <algorithm>
#include <sstream>

namespace repart {

namespace {

std::string placeholders(size_t count) {
    std::ostringstream sql;
    for (size_t i = 0; i < count; ++i) {
        if (i) sql << ", ";
        sql << ":" << (i + 1);
    }
    return sql.str();
}

std::string key_match(const std::vector<std::string>& key, const std::string& left,
                      const std::string& right, const oracle_dialect& d) {
    std::ostringstream sql;
    bool first = true;
    for (const auto& k : key) {
        if (!first) sql << " AND ";
        sql << left << "." << d.identifier(k) << " = " << right << "." << d.identifier(k);
        first = false;
    }
    return sql.str();
}

std::string column_list(const std::vector<std::string>& columns, const oracle_dialect& d,
                        const std::string& prefix = {}) {
    std::ostringstream sql;
    bool first = true;
    for (const auto& c : columns) {
        if (!first) sql << ", ";
        sql << prefix << d.identifier(c);
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

} // namespace

std::string oracle_dialect::identifier(const std::string& name) const {
    return to_upper(name);
}

// ============================================================================
// Catalog reads
// ============================================================================

statement oracle_dialect::object_exists(const std::string& schema, const std::string& name,
                                        object_kind kind) const {
    const char* sql = nullptr;
    switch (kind) {
        case object_kind::table:
            sql = "SELECT COUNT(*) AS n FROM all_tables WHERE owner = :1 AND table_name = :2";
            break;
        case object_kind::view:
            sql = "SELECT COUNT(*) AS n FROM all_views WHERE owner = :1 AND view_name = :2";
            break;
        case object_kind::trigger:
            sql = "SELECT COUNT(*) AS n FROM all_triggers WHERE owner = :1 AND trigger_name = :2";
            break;
        case object_kind::index:
            sql = "SELECT COUNT(*) AS n FROM all_indexes WHERE owner = :1 AND index_name = :2";
            break;
    }
    return statement(sql, {identifier(schema), identifier(name)});
}

statement oracle_dialect::count_rows(const physical_table& table) const {
    return statement("SELECT COUNT(*) AS n FROM " + qualify(table));
}

statement oracle_dialect::count_missing_keys(const physical_table& reference, const physical_table& target,
                                             const std::vector<std::string>& key) const {
    return statement("SELECT COUNT(*) AS n FROM " + qualify(reference) + " r WHERE NOT EXISTS (SELECT 1 FROM " +
                     qualify(target) + " t WHERE " + key_match(key, "t", "r", *this) + ")");
}

statement oracle_dialect::constraint_states(const physical_table& table) const {
    return statement(
        "SELECT constraint_name, constraint_type, status FROM all_constraints "
        "WHERE owner = :1 AND table_name = :2 AND constraint_type IN ('P', 'U', 'R', 'C') "
        "ORDER BY CASE constraint_type WHEN 'P' THEN 1 WHEN 'U' THEN 2 WHEN 'C' THEN 3 WHEN 'R' THEN 4 END, "
        "constraint_name",
        {identifier(table.schema), identifier(table.name)});
}

statement oracle_dialect::active_sessions(const std::string& /*schema*/, const std::string& pattern) const {
    // User sessions currently executing SQL that mentions the pattern, bare
    // or owner-qualified, whatever schema they are connected as; the
    // checking session itself never counts.
    return statement(
        "SELECT COUNT(*) AS n FROM v$session s JOIN v$sqlarea sa ON s.sql_id = sa.sql_id "
        "WHERE UPPER(sa.sql_text) LIKE '%' || :1 || '%' "
        "AND s.status = 'ACTIVE' AND s.username IS NOT NULL "
        "AND s.sid <> SYS_CONTEXT('USERENV', 'SID')",
        {to_upper(pattern)});
}

std::optional<statement> oracle_dialect::partition_slices(const physical_table& table) const {
    return statement(
        "SELECT partition_name, partition_position AS position, high_value, num_rows "
        "FROM all_tab_partitions WHERE table_owner = :1 AND table_name = :2 "
        "ORDER BY partition_position",
        {identifier(table.schema), identifier(table.name)});
}

statement oracle_dialect::table_columns(const physical_table& table) const {
    return statement(
        "SELECT column_name AS name, "
        "CASE WHEN data_type IN ('VARCHAR2', 'NVARCHAR2', 'CHAR', 'NCHAR') "
        "THEN data_type || '(' || char_length || CASE char_used WHEN 'C' THEN ' CHAR' ELSE '' END || ')' "
        "WHEN data_type = 'RAW' THEN 'RAW(' || data_length || ')' "
        "WHEN data_type = 'NUMBER' AND data_precision IS NOT NULL "
        "THEN 'NUMBER(' || data_precision || ',' || NVL(data_scale, 0) || ')' "
        "ELSE data_type END AS type, nullable "
        "FROM all_tab_columns WHERE owner = :1 AND table_name = :2 ORDER BY column_id",
        {identifier(table.schema), identifier(table.name)});
}

statement oracle_dialect::primary_key_columns(const physical_table& table) const {
    return statement(
        "SELECT cc.column_name AS name FROM all_constraints c "
        "JOIN all_cons_columns cc ON cc.owner = c.owner AND cc.constraint_name = c.constraint_name "
        "WHERE c.owner = :1 AND c.table_name = :2 AND c.constraint_type = 'P' "
        "ORDER BY cc.position",
        {identifier(table.schema), identifier(table.name)});
}

statement oracle_dialect::table_indexes(const physical_table& table) const {
    return statement(
        "SELECT i.index_name, CASE i.uniqueness WHEN 'UNIQUE' THEN 1 ELSE 0 END AS is_unique, "
        "c.column_name FROM all_indexes i "
        "JOIN all_ind_columns c ON c.index_owner = i.owner AND c.index_name = i.index_name "
        "WHERE i.table_owner = :1 AND i.table_name = :2 "
        "AND NOT EXISTS (SELECT 1 FROM all_constraints k WHERE k.owner = i.table_owner "
        "AND k.table_name = i.table_name AND k.index_name = i.index_name AND k.constraint_type IN ('P', 'U')) "
        "ORDER BY i.index_name, c.column_position",
        {identifier(table.schema), identifier(table.name)});
}

std::optional<statement> oracle_dialect::table_grants(const physical_table& table) const {
    return statement(
        "SELECT grantee, privilege, grantable FROM all_tab_privs "
        "WHERE table_schema = :1 AND table_name = :2 ORDER BY grantee, privilege",
        {identifier(table.schema), identifier(table.name)});
}

std::optional<statement> oracle_dialect::invalid_objects(const std::string& schema) const {
    return statement(
        "SELECT object_name, object_type FROM all_objects "
        "WHERE owner = :1 AND status = 'INVALID' "
        "AND object_type IN ('VIEW', 'SYNONYM', 'PROCEDURE', 'FUNCTION', 'PACKAGE', 'PACKAGE BODY', "
        "'TRIGGER', 'MATERIALIZED VIEW') ORDER BY object_type, object_name",
        {identifier(schema)});
}

// ============================================================================
// DDL / DML
// ============================================================================

statement oracle_dialect::create_table(const physical_table& target, const table_metadata& source,
                                       int parallel_degree) const {
    const auto& scheme = target.scheme;
    std::ostringstream sql;
    sql << "CREATE TABLE " << qualify(target) << " (";
    bool first = true;
    for (const auto& col : source.columns) {
        if (!first) sql << ", ";
        sql << identifier(col.name) << " " << col.sql_type;
        if (!col.nullable) sql << " NOT NULL";
        first = false;
    }
    sql << ", CONSTRAINT " << identifier(target.name + "_PK")
        << " PRIMARY KEY (" << column_list(source.primary_key, *this) << "))";

    if (!scheme.tablespace.empty()) {
        sql << " TABLESPACE " << identifier(scheme.tablespace);
    }

    auto subpartition_clause = [&]() {
        if (scheme.subpartition_method == partition_method::hash) {
            sql << " SUBPARTITION BY HASH (" << column_list(scheme.subpartition_columns, *this)
                << ") SUBPARTITIONS " << scheme.subpartition_count;
        }
    };

    switch (scheme.method) {
        case partition_method::none:
            break;
        case partition_method::range:
            sql << " PARTITION BY RANGE (" << column_list(scheme.columns, *this) << ")";
            subpartition_clause();
            sql << " (PARTITION P_INITIAL VALUES LESS THAN (" << scheme.initial_upper_bound << "), "
                << "PARTITION P_MAX VALUES LESS THAN (MAXVALUE))";
            break;
        case partition_method::interval:
            sql << " PARTITION BY RANGE (" << column_list(scheme.columns, *this) << ")"
                << " INTERVAL (" << scheme.interval << ")";
            subpartition_clause();
            sql << " (PARTITION P_INITIAL VALUES LESS THAN (" << scheme.initial_upper_bound << "))";
            break;
        case partition_method::list:
            sql << " PARTITION BY LIST (" << column_list(scheme.columns, *this) << ")";
            subpartition_clause();
            sql << " (PARTITION P_DEFAULT VALUES (DEFAULT))";
            break;
        case partition_method::hash:
            sql << " PARTITION BY HASH (" << column_list(scheme.columns, *this) << ")"
                << " PARTITIONS " << scheme.partition_count;
            break;
    }

    if (scheme.is_partitioned()) {
        sql << " ENABLE ROW MOVEMENT";
    }
    if (parallel_degree > 1) {
        sql << " PARALLEL " << parallel_degree;
    }
    return statement(sql.str());
}

statement oracle_dialect::backfill_batch(const physical_table& source, const physical_table& target,
                                         const table_metadata& metadata,
                                         const std::vector<std::string>& order_by,
                                         int64_t batch_rows, int parallel_degree) const {
    auto columns = metadata.column_names();
    std::ostringstream sql;
    sql << "INSERT ";
    if (parallel_degree > 1) {
        sql << "/*+ PARALLEL(" << parallel_degree << ") */ ";
    }
    sql << "INTO " << qualify(target) << " (" << column_list(columns, *this) << ") "
        << "SELECT " << column_list(columns, *this, "s.") << " FROM " << qualify(source) << " s "
        << "WHERE NOT EXISTS (SELECT 1 FROM " << qualify(target) << " t WHERE "
        << key_match(metadata.primary_key, "t", "s", *this) << ")";
    if (!order_by.empty()) {
        sql << " ORDER BY " << column_list(order_by, *this, "s.");
    }
    if (batch_rows > 0) {
        sql << " FETCH FIRST " << batch_rows << " ROWS ONLY";
    }
    return statement(sql.str());
}

statement oracle_dialect::delete_missing_keys(const physical_table& target, const physical_table& reference,
                                              const std::vector<std::string>& key) const {
    return statement("DELETE FROM " + qualify(target) + " t WHERE NOT EXISTS (SELECT 1 FROM " +
                     qualify(reference) + " r WHERE " + key_match(key, "r", "t", *this) + ")");
}

statement oracle_dialect::create_index(const physical_table& target, const std::string& index_name,
                                       const index_def& index, bool local, int parallel_degree) const {
    std::ostringstream sql;
    sql << "CREATE " << (index.unique ? "UNIQUE " : "") << "INDEX "
        << qualify(target.schema, index_name) << " ON " << qualify(target)
        << " (" << column_list(index.columns, *this) << ")";
    if (local) sql << " LOCAL";
    if (parallel_degree > 1) sql << " PARALLEL " << parallel_degree;
    return statement(sql.str());
}

statement oracle_dialect::gather_statistics(const physical_table& table, int parallel_degree) const {
    std::ostringstream sql;
    sql << "BEGIN DBMS_STATS.GATHER_TABLE_STATS("
        << "ownname => " << quote_literal(identifier(table.schema)) << ", "
        << "tabname => " << quote_literal(identifier(table.name)) << ", "
        << "estimate_percent => DBMS_STATS.AUTO_SAMPLE_SIZE, "
        << "method_opt => 'FOR ALL COLUMNS SIZE AUTO', "
        << "degree => " << std::max(parallel_degree, 1) << ", "
        << "cascade => TRUE); END;";
    return statement(sql.str());
}

statement oracle_dialect::enable_constraint(const physical_table& table, const std::string& constraint_name) const {
    return statement("ALTER TABLE " + qualify(table) + " ENABLE NOVALIDATE CONSTRAINT " + identifier(constraint_name));
}

statement oracle_dialect::rename_table(const physical_table& table, const std::string& new_name) const {
    return statement("ALTER TABLE " + qualify(table) + " RENAME TO " + identifier(new_name));
}

statement oracle_dialect::drop_table(const physical_table& table) const {
    return statement("DROP TABLE " + qualify(table) + " CASCADE CONSTRAINTS PURGE");
}

statement oracle_dialect::insert_row(const physical_table& table, const std::vector<std::string>& columns,
                                     std::vector<column_value_t> values) const {
    return statement("INSERT INTO " + qualify(table) + " (" + column_list(columns, *this) + ") VALUES (" +
                     placeholders(columns.size()) + ")",
                     std::move(values));
}

statement oracle_dialect::create_bridge_view(const bridge_spec& spec) const {
    auto cols = column_list(spec.columns, *this);
    auto key = column_list(spec.key_columns, *this);
    if (spec.key_columns.size() > 1) key = "(" + key + ")";

    std::ostringstream sql;
    sql << "CREATE OR REPLACE VIEW " << qualify(spec.schema, spec.view_name) << " AS "
        << "SELECT " << cols << " FROM " << qualify(spec.schema, spec.shadow_name)
        << " UNION ALL "
        << "SELECT " << cols << " FROM " << qualify(spec.schema, spec.retired_name)
        << " WHERE " << key << " NOT IN (SELECT " << column_list(spec.key_columns, *this)
        << " FROM " << qualify(spec.schema, spec.shadow_name) << ")";
    return statement(sql.str());
}

std::vector<std::string> oracle_dialect::write_router_triggers(const bridge_spec& spec) const {
    return {identifier(spec.view_name + "_TRG")};
}

std::vector<statement> oracle_dialect::create_write_router(const bridge_spec& spec) const {
    std::ostringstream values;
    bool first = true;
    for (const auto& c : spec.columns) {
        if (!first) values << ", ";
        values << ":NEW." << identifier(c);
        first = false;
    }

    std::ostringstream sql;
    sql << "CREATE OR REPLACE TRIGGER " << qualify(spec.schema, write_router_triggers(spec).front())
        << " INSTEAD OF INSERT OR UPDATE OR DELETE ON " << qualify(spec.schema, spec.view_name)
        << " FOR EACH ROW BEGIN "
        << "IF INSERTING THEN "
        << "INSERT INTO " << qualify(spec.schema, spec.shadow_name)
        << " (" << column_list(spec.columns, *this) << ") VALUES (" << values.str() << "); "
        << "ELSE RAISE_APPLICATION_ERROR(-20010, "
        << quote_literal("Bridge " + identifier(spec.view_name) + " accepts INSERT only") << "); "
        << "END IF; END;";
    return {statement(sql.str())};
}

statement oracle_dialect::drop_view(const std::string& schema, const std::string& name) const {
    return statement("DROP VIEW " + qualify(schema, name));
}

statement oracle_dialect::drop_trigger(const std::string& schema, const std::string& name) const {
    return statement("DROP TRIGGER " + qualify(schema, name));
}

std::optional<statement> oracle_dialect::recompile(const std::string& schema, const schema_object& object) const {
    auto type = to_upper(object.type);
    auto target = qualify(schema, object.name);
    if (type == "PACKAGE BODY") {
        return statement("ALTER PACKAGE " + target + " COMPILE BODY");
    }
    if (type == "VIEW" || type == "SYNONYM" || type == "PROCEDURE" || type == "FUNCTION" ||
        type == "PACKAGE" || type == "TRIGGER" || type == "MATERIALIZED VIEW") {
        return statement("ALTER " + type + " " + target + " COMPILE");
    }
    return std::nullopt;
}

std::optional<statement> oracle_dialect::grant(const physical_table& table, const grant_def& grant) const {
    std::string sql = "GRANT " + to_upper(grant.privilege) + " ON " + qualify(table) + " TO " +
                      identifier(grant.grantee);
    if (grant.grantable) sql += " WITH GRANT OPTION";
    return statement(sql);
}

// ============================================================================
// Partition exchange
// ============================================================================

statement oracle_dialect::exchange_partition(const physical_table& table, const std::string& partition,
                                             const physical_table& with_table) const {
    return statement("ALTER TABLE " + qualify(table) + " EXCHANGE PARTITION " + identifier(partition) +
                     " WITH TABLE " + qualify(with_table) + " INCLUDING INDEXES WITHOUT VALIDATION");
}

statement oracle_dialect::add_partition(const physical_table& table, const std::string& partition,
                                        const std::string& upper_bound) const {
    return statement("ALTER TABLE " + qualify(table) + " ADD PARTITION " + identifier(partition) +
                     " VALUES LESS THAN (" + upper_bound + ")");
}

statement oracle_dialect::drop_partition(const physical_table& table, const std::string& partition) const {
    return statement("ALTER TABLE " + qualify(table) + " DROP PARTITION " + identifier(partition));
}

} // namespace repart
