#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "gateway.hpp"
#include <optional>
#include <string>
#include <vector>

namespace repart {

enum class object_kind {
    table,
    view,
    trigger,
    index
};

/// Everything a dialect needs to render the bridge objects.
struct bridge_spec {
    std::string schema;
    std::string view_name;
    std::string shadow_name;    ///< table now holding the canonical name
    std::string retired_name;
    std::vector<std::string> columns;
    std::vector<std::string> key_columns;
};

/// A dependent object the server reports as invalid.
struct schema_object {
    std::string name;
    std::string type;   ///< server type name, e.g. "VIEW", "PACKAGE BODY"
};

// ============================================================================
// Dialect - renders every statement the engine issues
// ============================================================================
//
// Catalog queries return counts in a column named `n`. Optional statements
// return std::nullopt where the backend has no such concept; callers skip
// the step and say so in their events.

class dialect {
public:
    virtual ~dialect() = default;

    virtual const char* name() const = 0;
    virtual bool supports_partitioning() const = 0;

    /// Normalize an identifier the way the server stores it.
    virtual std::string identifier(const std::string& name) const = 0;
    std::string qualify(const std::string& schema, const std::string& name) const {
        return identifier(schema) + "." + identifier(name);
    }
    std::string qualify(const physical_table& table) const {
        return qualify(table.schema, table.name);
    }

    // ------------------------------------------------------------------------
    // Catalog reads
    // ------------------------------------------------------------------------
    virtual statement object_exists(const std::string& schema, const std::string& name,
                                    object_kind kind) const = 0;
    virtual statement count_rows(const physical_table& table) const = 0;
    /// Rows of `reference` whose key has no match in `target`.
    virtual statement count_missing_keys(const physical_table& reference, const physical_table& target,
                                         const std::vector<std::string>& key) const = 0;
    /// Columns: constraint_name, constraint_type (P/U/R/C), status.
    virtual statement constraint_states(const physical_table& table) const = 0;
    virtual statement active_sessions(const std::string& schema, const std::string& pattern) const = 0;
    /// Columns: partition_name, position, high_value, num_rows.
    virtual std::optional<statement> partition_slices(const physical_table& table) const = 0;

    /// Columns: name, type, nullable ('Y'/'N' or 1/0).
    virtual statement table_columns(const physical_table& table) const = 0;
    /// Column: name, ordered by key position.
    virtual statement primary_key_columns(const physical_table& table) const = 0;
    /// Columns: index_name, is_unique, column_name, ordered by index then position.
    virtual statement table_indexes(const physical_table& table) const = 0;
    /// Columns: grantee, privilege, grantable.
    virtual std::optional<statement> table_grants(const physical_table& table) const = 0;
    /// Columns: object_name, object_type.
    virtual std::optional<statement> invalid_objects(const std::string& schema) const = 0;

    // ------------------------------------------------------------------------
    // DDL / DML
    // ------------------------------------------------------------------------
    virtual statement create_table(const physical_table& target, const table_metadata& source,
                                   int parallel_degree) const = 0;
    /// One batch of the backfill; `batch_rows` <= 0 copies everything at once.
    virtual statement backfill_batch(const physical_table& source, const physical_table& target,
                                     const table_metadata& metadata,
                                     const std::vector<std::string>& order_by,
                                     int64_t batch_rows, int parallel_degree) const = 0;
    /// Deletes rows of `target` whose key has no match in `reference`.
    virtual statement delete_missing_keys(const physical_table& target, const physical_table& reference,
                                          const std::vector<std::string>& key) const = 0;
    virtual statement create_index(const physical_table& target, const std::string& index_name,
                                   const index_def& index, bool local, int parallel_degree) const = 0;
    virtual statement gather_statistics(const physical_table& table, int parallel_degree) const = 0;
    virtual statement enable_constraint(const physical_table& table, const std::string& constraint_name) const = 0;
    virtual statement rename_table(const physical_table& table, const std::string& new_name) const = 0;
    virtual statement drop_table(const physical_table& table) const = 0;
    virtual statement insert_row(const physical_table& table, const std::vector<std::string>& columns,
                                 std::vector<column_value_t> values) const = 0;

    virtual statement create_bridge_view(const bridge_spec& spec) const = 0;
    virtual std::vector<statement> create_write_router(const bridge_spec& spec) const = 0;
    /// Names of the trigger objects create_write_router installs.
    virtual std::vector<std::string> write_router_triggers(const bridge_spec& spec) const = 0;
    virtual statement drop_view(const std::string& schema, const std::string& name) const = 0;
    virtual statement drop_trigger(const std::string& schema, const std::string& name) const = 0;

    virtual std::optional<statement> recompile(const std::string& schema, const schema_object& object) const = 0;
    virtual std::optional<statement> grant(const physical_table& table, const grant_def& grant) const = 0;

    // ------------------------------------------------------------------------
    // Partition exchange (requires supports_partitioning())
    // ------------------------------------------------------------------------
    virtual statement exchange_partition(const physical_table& table, const std::string& partition,
                                         const physical_table& with_table) const = 0;
    virtual statement add_partition(const physical_table& table, const std::string& partition,
                                    const std::string& upper_bound) const = 0;
    virtual statement drop_partition(const physical_table& table, const std::string& partition) const = 0;
};

// ============================================================================
// Oracle: the production target
// ============================================================================

class oracle_dialect : public dialect {
public:
    const char* name() const override { return "oracle"; }
    bool supports_partitioning() const override { return true; }
    std::string identifier(const std::string& name) const override;

    statement object_exists(const std::string& schema, const std::string& name,
                            object_kind kind) const override;
    statement count_rows(const physical_table& table) const override;
    statement count_missing_keys(const physical_table& reference, const physical_table& target,
                                 const std::vector<std::string>& key) const override;
    statement constraint_states(const physical_table& table) const override;
    statement active_sessions(const std::string& schema, const std::string& pattern) const override;
    std::optional<statement> partition_slices(const physical_table& table) const override;
    statement table_columns(const physical_table& table) const override;
    statement primary_key_columns(const physical_table& table) const override;
    statement table_indexes(const physical_table& table) const override;
    std::optional<statement> table_grants(const physical_table& table) const override;
    std::optional<statement> invalid_objects(const std::string& schema) const override;

    statement create_table(const physical_table& target, const table_metadata& source,
                           int parallel_degree) const override;
    statement backfill_batch(const physical_table& source, const physical_table& target,
                             const table_metadata& metadata, const std::vector<std::string>& order_by,
                             int64_t batch_rows, int parallel_degree) const override;
    statement delete_missing_keys(const physical_table& target, const physical_table& reference,
                                  const std::vector<std::string>& key) const override;
    statement create_index(const physical_table& target, const std::string& index_name,
                           const index_def& index, bool local, int parallel_degree) const override;
    statement gather_statistics(const physical_table& table, int parallel_degree) const override;
    statement enable_constraint(const physical_table& table, const std::string& constraint_name) const override;
    statement rename_table(const physical_table& table, const std::string& new_name) const override;
    statement drop_table(const physical_table& table) const override;
    statement insert_row(const physical_table& table, const std::vector<std::string>& columns,
                         std::vector<column_value_t> values) const override;

    statement create_bridge_view(const bridge_spec& spec) const override;
    std::vector<statement> create_write_router(const bridge_spec& spec) const override;
    std::vector<std::string> write_router_triggers(const bridge_spec& spec) const override;
    statement drop_view(const std::string& schema, const std::string& name) const override;
    statement drop_trigger(const std::string& schema, const std::string& name) const override;

    std::optional<statement> recompile(const std::string& schema, const schema_object& object) const override;
    std::optional<statement> grant(const physical_table& table, const grant_def& grant) const override;

    statement exchange_partition(const physical_table& table, const std::string& partition,
                                 const physical_table& with_table) const override;
    statement add_partition(const physical_table& table, const std::string& partition,
                            const std::string& upper_bound) const override;
    statement drop_partition(const physical_table& table, const std::string& partition) const override;
};

// ============================================================================
// SQLite: unpartitioned rehearsal backend
// ============================================================================
//
// SQLite has no native partitioning, sessions catalog, grants or invalid
// objects. Partitioned targets and partition exchange raise
// configuration_error; active sessions are answered by the
// repart_active_statements() function sqlite_gateway registers.

class sqlite_dialect : public dialect {
public:
    const char* name() const override { return "sqlite"; }
    bool supports_partitioning() const override { return false; }
    std::string identifier(const std::string& name) const override;

    statement object_exists(const std::string& schema, const std::string& name,
                            object_kind kind) const override;
    statement count_rows(const physical_table& table) const override;
    statement count_missing_keys(const physical_table& reference, const physical_table& target,
                                 const std::vector<std::string>& key) const override;
    statement constraint_states(const physical_table& table) const override;
    statement active_sessions(const std::string& schema, const std::string& pattern) const override;
    std::optional<statement> partition_slices(const physical_table& table) const override;
    statement table_columns(const physical_table& table) const override;
    statement primary_key_columns(const physical_table& table) const override;
    statement table_indexes(const physical_table& table) const override;
    std::optional<statement> table_grants(const physical_table& table) const override;
    std::optional<statement> invalid_objects(const std::string& schema) const override;

    statement create_table(const physical_table& target, const table_metadata& source,
                           int parallel_degree) const override;
    statement backfill_batch(const physical_table& source, const physical_table& target,
                             const table_metadata& metadata, const std::vector<std::string>& order_by,
                             int64_t batch_rows, int parallel_degree) const override;
    statement delete_missing_keys(const physical_table& target, const physical_table& reference,
                                  const std::vector<std::string>& key) const override;
    statement create_index(const physical_table& target, const std::string& index_name,
                           const index_def& index, bool local, int parallel_degree) const override;
    statement gather_statistics(const physical_table& table, int parallel_degree) const override;
    statement enable_constraint(const physical_table& table, const std::string& constraint_name) const override;
    statement rename_table(const physical_table& table, const std::string& new_name) const override;
    statement drop_table(const physical_table& table) const override;
    statement insert_row(const physical_table& table, const std::vector<std::string>& columns,
                         std::vector<column_value_t> values) const override;

    statement create_bridge_view(const bridge_spec& spec) const override;
    std::vector<statement> create_write_router(const bridge_spec& spec) const override;
    std::vector<std::string> write_router_triggers(const bridge_spec& spec) const override;
    statement drop_view(const std::string& schema, const std::string& name) const override;
    statement drop_trigger(const std::string& schema, const std::string& name) const override;

    std::optional<statement> recompile(const std::string& schema, const schema_object& object) const override;
    std::optional<statement> grant(const physical_table& table, const grant_def& grant) const override;

    statement exchange_partition(const physical_table& table, const std::string& partition,
                                 const physical_table& with_table) const override;
    statement add_partition(const physical_table& table, const std::string& partition,
                            const std::string& upper_bound) const override;
    statement drop_partition(const physical_table& table, const std::string& partition) const override;
};

} // namespace repart

#endif // __cplusplus
