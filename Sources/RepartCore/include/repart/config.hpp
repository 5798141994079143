#pragma once

#ifdef __cplusplus

#include <chrono>
#include <cstdint>
#include <string>

namespace repart {

/// How INSERTs issued against the bridge reach the shadow table.
enum class router_kind {
    trigger,    ///< INSTEAD OF triggers on the bridge view
    proxy       ///< application-level routing through write_router::route
};

/// What cutover does when the shadow reports disabled constraints.
enum class constraint_policy {
    enable,     ///< enable them and re-check (default)
    proceed,    ///< cut over anyway; the WARN is kept in the run's gate results
    abort       ///< refuse with precondition_failed
};

const char* to_string(router_kind kind);
const char* to_string(constraint_policy policy);

struct configuration {
    /// Suffix appended to the logical name for the shadow table.
    std::string shadow_suffix = "_NEW";

    /// Suffix appended to the logical name when the source is renamed aside.
    std::string retired_suffix = "_OLD";

    /// Suffix of the bridge read view.
    std::string bridge_suffix = "_BRIDGE";

    /// Suffix appended to every index rebuilt on the shadow.
    std::string shadow_index_suffix = "_N";

    /// History partitions are named <prefix><UTC milliseconds>.
    std::string history_partition_prefix = "P_HIST_";

    /// Rows per backfill batch. 0 copies everything in one statement.
    int64_t backfill_batch_rows = 50000;

    /// Degree of parallelism for table creation, backfill, indexes and statistics.
    int parallel_degree = 4;

    /// Deadline of a single mutating statement. 0 = none.
    std::chrono::milliseconds step_timeout{std::chrono::hours(2)};

    /// Deadline of a single gate query. 0 = none.
    std::chrono::milliseconds gate_timeout{std::chrono::minutes(5)};

    router_kind router = router_kind::trigger;

    /// Open the bridge as part of a successful cutover.
    bool open_bridge_after_cutover = true;

    constraint_policy disabled_constraints = constraint_policy::enable;

    /// Time that must pass after cutover before the retired table may be dropped.
    std::chrono::seconds validation_window{std::chrono::hours(24 * 7)};

    configuration() = default;

    /// Throws configuration_error on unusable values.
    void validate() const;
};

} // namespace repart

#endif // __cplusplus
