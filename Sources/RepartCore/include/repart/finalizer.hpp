#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "dialect.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "events.hpp"
#include "run.hpp"
#include "bridge.hpp"

namespace repart {

struct finalize_options {
    /// The operator has validated the new table and accepts the drop.
    bool operator_confirmed = false;
};

struct finalize_report {
    bool retired_dropped = false;               // false when already gone
    std::vector<schema_object> recompiled;      // objects a recompile was attempted for
    std::vector<schema_object> still_invalid;   // invalid after the single pass
    std::vector<grant_def> grants_applied;
};

// ============================================================================
// Finalizer - retires the old table once the operator signs off
// ============================================================================
//
// Preconditions fail fast, before any drop: phase BRIDGED, operator
// confirmation and the validation window elapsed since cutover. The
// canonical table is authoritative from cutover on, so keys only the
// retired table holds are rows deleted since and go with the drop. Each
// step is safe to rerun; a failed grant leaves the run BRIDGED for a retry.

class finalizer {
public:
    finalizer(gateway& gw, const configuration& config, const event_stream& events, bridge_manager& bridges);

    finalize_report finalize(migration_run& run, const finalize_options& options);

private:
    void check_preconditions(migration_run& run, const finalize_options& options);
    void recompile_dependents(const migration_run& run, finalize_report& report);
    void restore_grants(const migration_run& run, finalize_report& report);

    gateway& gw_;
    const configuration& config_;
    const event_stream& events_;
    gate_engine gates_;
    bridge_manager& bridges_;
};

} // namespace repart

#endif // __cplusplus
