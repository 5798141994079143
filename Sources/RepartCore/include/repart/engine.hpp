#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "discovery.hpp"
#include "shadow.hpp"
#include "bridge.hpp"
#include "cutover.hpp"
#include "finalizer.hpp"
#include "exchange.hpp"
#include "events.hpp"
#include "cancellation.hpp"
#include "run.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace repart {

// ============================================================================
// Identity registry - one caller at a time per table identity
// ============================================================================

class identity_registry {
public:
    // Singleton accessor - defined in engine.cpp to avoid ODR violations
    static identity_registry& instance();

    /// False if another operation already holds `key`.
    bool try_acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.insert(key).second;
    }

    void release(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        held_.erase(key);
    }

    bool is_held(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return held_.count(key) > 0;
    }

private:
    identity_registry() = default;
    std::mutex mutex_;
    std::set<std::string> held_;
};

/// Holds an identity for the lifetime of one engine operation. Throws
/// precondition_failed if the identity is busy.
class identity_guard {
public:
    identity_guard(const std::string& schema, const std::string& name, const error_context& where);
    ~identity_guard();

    identity_guard(const identity_guard&) = delete;
    identity_guard& operator=(const identity_guard&) = delete;

    static std::string key_of(const std::string& schema, const std::string& name);

private:
    std::string key_;
};

// ============================================================================
// Migration engine - the complete operator-facing API
// ============================================================================
//
// Wires every component over one gateway and one configuration. Every
// call on a run holds that run's identity guard for its duration; calls
// on different identities may run in parallel.
//
//   auto run = engine.start({"APP", "ORDERS"}, scheme);   // BUILT
//   engine.catch_up(run);                                  // source changes since the build
//   engine.cut_over(run);                                  // BRIDGED
//   engine.finalize(run, {true});                          // FINALIZED, or
//   engine.roll_back(run, {true});                         // BUILT again

class migration_engine {
public:
    explicit migration_engine(gateway& gw, configuration config = {});

    migration_engine(const migration_engine&) = delete;
    migration_engine& operator=(const migration_engine&) = delete;

    const configuration& config() const { return config_; }
    event_stream& events() { return events_; }
    shadow_builder& builder() { return builder_; }

    gate_result run_gate(const gate_request& request);
    std::vector<gate_result> run_gates(const std::vector<gate_request>& requests);

    /// Discover the source and name the shadow and retired tables. The
    /// shadow does not exist yet; build() creates it.
    migration_run prepare(const table_identity& identity, const partition_scheme& target_scheme);

    /// prepare() then build().
    migration_run start(const table_identity& identity, const partition_scheme& target_scheme,
                        const cancellation_token* cancel = nullptr);

    physical_table build(migration_run& run, const cancellation_token* cancel = nullptr);

    /// BUILT only. Copies source rows the shadow is missing, deletes shadow
    /// rows the source no longer holds and refreshes the reference row
    /// count. Returns the rows copied plus the rows deleted.
    int64_t catch_up(migration_run& run, const cancellation_token* cancel = nullptr);

    void cut_over(migration_run& run);

    /// Undo a cutover while the retired table still exists.
    void roll_back(migration_run& run, const rollback_options& options);

    /// CUT_OVER -> BRIDGED. Returns the existing bridge when already BRIDGED.
    const bridge& open_bridge(migration_run& run);

    /// BRIDGED -> CUT_OVER.
    void close_bridge(migration_run& run);

    int64_t route_write(migration_run& run, const write_request& request);

    finalize_report finalize(migration_run& run, const finalize_options& options);

    exchange_report swap_oldest_slice(const archive_cycle& cycle);

private:
    void ensure_not_aborted(const migration_run& run) const;

    gateway& gw_;
    configuration config_;
    event_stream events_;
    gate_engine gates_;
    catalog_discovery discovery_;
    shadow_builder builder_;
    bridge_manager bridges_;
    cutover_controller cutover_;
    finalizer finalizer_;
    exchange_engine exchange_;
};

} // namespace repart

#endif // __cplusplus
