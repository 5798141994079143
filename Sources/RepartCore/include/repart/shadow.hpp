#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "events.hpp"
#include "run.hpp"
#include "cancellation.hpp"

namespace repart {

// ============================================================================
// Shadow builder - creates and fills the new-scheme copy of a table
// ============================================================================
//
// Each step is callable on its own so an operator can retry exactly the
// step that failed. A failing step aborts the build and leaves the shadow
// in place for inspection; nothing here ever drops it.

class shadow_builder {
public:
    shadow_builder(gateway& gw, const configuration& config, const event_stream& events);

    /// create_shadow, backfill, rebuild_indexes, collect_statistics and
    /// enable_constraints in order. Records the source row count after
    /// backfill as the run's reference row count. Returns run.shadow.
    physical_table build(migration_run& run, const cancellation_token* cancel = nullptr);

    /// Fails with precondition_failed when `shadow` already exists and with
    /// configuration_error, before any DDL, when `source` has no primary key.
    void create_shadow(const physical_table& shadow, const table_metadata& source, const error_context& where);

    /// Copies rows of `source` whose key is absent from `target`, in
    /// batches of configuration::backfill_batch_rows, until a batch copies
    /// nothing. Returns the number of rows copied.
    int64_t backfill(const physical_table& source, const physical_table& target, const table_metadata& metadata,
                     const error_context& where, const cancellation_token* cancel = nullptr);

    /// Deletes rows of `target` whose key `source` no longer holds, so a
    /// delete on the source after the backfill reaches the shadow too.
    /// Returns the number of rows deleted.
    int64_t remove_orphans(const physical_table& source, const physical_table& target,
                           const table_metadata& metadata, const error_context& where);

    /// Returns the number of indexes created (existing ones are skipped).
    int rebuild_indexes(const physical_table& shadow, const table_metadata& source, const error_context& where,
                        const cancellation_token* cancel = nullptr);

    void collect_statistics(const physical_table& table, const error_context& where);

    /// Re-enables disabled constraints in P, U, C, R order. Returns how many.
    int enable_constraints(const physical_table& table, const error_context& where);

private:
    template <typename Fn>
    auto step(const error_context& where, const char* name, Fn&& fn) -> decltype(fn());

    void check_cancelled(const cancellation_token* cancel, const error_context& where, const char* step) const;

    gateway& gw_;
    const configuration& config_;
    const event_stream& events_;
    gate_engine gates_;
};

} // namespace repart

#endif // __cplusplus
