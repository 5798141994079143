#pragma once

#ifdef __cplusplus

#include "config.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "events.hpp"
#include "run.hpp"
#include "shadow.hpp"
#include "bridge.hpp"

namespace repart {

struct rollback_options {
    /// The operator accepts that rows written since cutover stay behind
    /// in the shadow table.
    bool operator_confirmed = false;
};

// ============================================================================
// Cutover controller - the compensated two-rename saga
// ============================================================================
//
//   BUILT --rename source->retired--> RENAMED_SOURCE --rename shadow->logical--> CUT_OVER
//
// If the second rename fails the retired table is renamed back at once.
// Success of that compensation restores BUILT; failure leaves the run
// ABORTED with operator_intervention_required set, and nothing automated
// touches it again. roll_back() runs the same saga the other way round.

class cutover_controller {
public:
    cutover_controller(gateway& gw, const configuration& config, const event_stream& events,
                       shadow_builder& builder, bridge_manager& bridges);

    /// BUILT -> CUT_OVER, then BRIDGED when open_bridge_after_cutover is set.
    void cut_over(migration_run& run);

    /// CUT_OVER or BRIDGED -> BUILT. Closes the bridge, renames the
    /// canonical table back to the shadow name and the retired table back
    /// to the logical name.
    void roll_back(migration_run& run, const rollback_options& options);

private:
    /// Moves `outgoing` off the logical name and `incoming` onto it.
    struct rename_plan {
        physical_table outgoing;
        std::string outgoing_name;
        physical_table incoming;
        migration_phase completed;      // phase once both renames are done
        migration_phase restored;       // phase after a successful compensation
        const char* operation;
        const char* first_step;
        const char* second_step;
    };

    void check_preconditions(migration_run& run);
    void rename_pair(migration_run& run, const rename_plan& plan);
    void fail_gates(migration_run& run, const std::string& step, const std::string& why,
                    const std::vector<gate_result>& gates);

    gateway& gw_;
    const configuration& config_;
    const event_stream& events_;
    gate_engine gates_;
    shadow_builder& builder_;
    bridge_manager& bridges_;
};

} // namespace repart

#endif // __cplusplus
