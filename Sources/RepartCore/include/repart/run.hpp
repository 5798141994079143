#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace repart {

/// The read view and write router over {shadow, retired}. Exists only
/// while both tables exist.
struct bridge {
    std::string schema;
    std::string view_name;
    std::vector<std::string> router_objects;   // trigger names; empty for the proxy router
    std::string shadow_name;                   // holds the canonical name after cutover
    std::string retired_name;
    std::vector<std::string> columns;
    std::vector<std::string> key_columns;
    router_kind router = router_kind::trigger;

    physical_table view() const { return {schema, view_name, {}}; }
    physical_table shadow() const { return {schema, shadow_name, {}}; }
    physical_table retired() const { return {schema, retired_name, {}}; }
};

/// One re-partitioning of one table identity.
///
/// `phase` is written only by the cutover controller, the finalizer and
/// the engine, and only while the identity guard is held. Operations that
/// change `phase` or `active_bridge` also hold `state_mutex`, which
/// route_write takes to copy the bridge; copies of a run share it.
struct migration_run {
    uuid_t id;
    table_identity identity;
    physical_table source;          // canonical table before cutover
    physical_table shadow;          // new-scheme table, under its shadow name
    std::string retired_name;
    std::optional<bridge> active_bridge;
    migration_phase phase = migration_phase::built;
    bool operator_intervention_required = false;

    table_metadata source_metadata;
    std::vector<grant_def> captured_grants;
    std::vector<gate_result> gate_results;         // latest gate results, appended per transition
    std::optional<int64_t> reference_row_count;    // source rows after backfill
    std::optional<timestamp_t> cut_over_at;
    std::shared_ptr<std::mutex> state_mutex = std::make_shared<std::mutex>();

    /// The renamed former source.
    physical_table retired() const {
        return {identity.schema, retired_name, source.scheme};
    }

    /// The table holding the logical name after cutover.
    physical_table canonical() const {
        return {identity.schema, identity.logical_name, shadow.scheme};
    }

    error_context context(const std::string& step = {}) const {
        return {id.to_string(), identity.to_string(), to_string(phase), step};
    }
};

} // namespace repart

#endif // __cplusplus
