#include "repart/engine.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"

namespace repart {

identity_registry& identity_registry::instance() {
    static identity_registry registry;
    return registry;
}

std::string identity_guard::key_of(const std::string& schema, const std::string& name) {
    return to_upper(schema) + "." + to_upper(name);
}

identity_guard::identity_guard(const std::string& schema, const std::string& name, const error_context& where)
    : key_(key_of(schema, name)) {
    if (!identity_registry::instance().try_acquire(key_)) {
        throw precondition_failed("Another operation is in progress on " + key_, where);
    }
}

identity_guard::~identity_guard() {
    identity_registry::instance().release(key_);
}

migration_engine::migration_engine(gateway& gw, configuration config)
    : gw_(gw)
    , config_(std::move(config))
    , gates_(gw, config_.gate_timeout)
    , discovery_(gw, config_.gate_timeout)
    , builder_(gw, config_, events_)
    , bridges_(gw, config_, events_)
    , cutover_(gw, config_, events_, builder_, bridges_)
    , finalizer_(gw, config_, events_, bridges_)
    , exchange_(gw, config_, events_) {
    config_.validate();
    LOG_DEBUG("engine", "Engine on %s dialect, %s router", gw_.sql_dialect().name(), to_string(config_.router));
}

void migration_engine::ensure_not_aborted(const migration_run& run) const {
    if (run.phase == migration_phase::aborted || run.operator_intervention_required) {
        throw precondition_failed("Run is ABORTED and needs operator intervention", run.context());
    }
}

gate_result migration_engine::run_gate(const gate_request& request) {
    auto result = gates_.run(request);
    auto event = make_event({}, "gates", to_string(request.kind),
                            result.failed() ? event_outcome::failed
                                            : result.passed() ? event_outcome::succeeded : event_outcome::warned,
                            result.detail);
    event.identity = request.table.to_string();
    event.gates = {result};
    events_.emit(event);
    return result;
}

std::vector<gate_result> migration_engine::run_gates(const std::vector<gate_request>& requests) {
    auto results = gates_.run_all(requests);
    auto event = make_event({}, "gates", "run_all", none_failed(results) ? event_outcome::succeeded : event_outcome::failed,
                            summarize(results));
    event.gates = results;
    events_.emit(event);
    return results;
}

migration_run migration_engine::prepare(const table_identity& identity, const partition_scheme& target_scheme) {
    error_context ctx{"", identity.to_string(), "", "prepare"};
    if (identity.schema.empty() || identity.logical_name.empty()) {
        throw configuration_error("Table identity needs a schema and a name", ctx);
    }
    target_scheme.validate();
    if (target_scheme.is_partitioned() && !gw_.sql_dialect().supports_partitioning()) {
        throw configuration_error(std::string("The ") + gw_.sql_dialect().name() +
                                  " backend cannot build partitioned tables", ctx);
    }

    migration_run run;
    run.id = uuid_t::generate();
    run.identity = identity;
    run.source = {identity.schema, identity.logical_name, {}};
    run.shadow = {identity.schema, identity.logical_name + config_.shadow_suffix, target_scheme};
    run.retired_name = identity.logical_name + config_.retired_suffix;
    ctx = run.context("prepare");

    auto exists = gates_.run(gate_request::existence(run.source, true), ctx);
    if (exists.failed()) {
        throw precondition_failed("Source " + run.source.to_string() + " does not exist", ctx, {exists});
    }
    run.source_metadata = discovery_.discover(run.source, ctx);
    if (run.source_metadata.primary_key.empty()) {
        throw configuration_error("Source " + run.source.to_string() + " has no primary key", ctx);
    }
    for (const auto& column : target_scheme.columns) {
        if (!run.source_metadata.has_column(column)) {
            throw configuration_error("Partition key column " + column + " is not a column of " +
                                      run.source.to_string(), ctx);
        }
    }
    run.captured_grants = run.source_metadata.grants;

    events_.emit(make_event(ctx, "engine", "prepare", event_outcome::succeeded,
                            run.source.to_string() + " -> " + run.shadow.to_string() + " " +
                            target_scheme.describe()));
    return run;
}

migration_run migration_engine::start(const table_identity& identity, const partition_scheme& target_scheme,
                                      const cancellation_token* cancel) {
    auto run = prepare(identity, target_scheme);
    build(run, cancel);
    return run;
}

physical_table migration_engine::build(migration_run& run, const cancellation_token* cancel) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("build"));
    ensure_not_aborted(run);
    if (run.phase != migration_phase::built) {
        throw precondition_failed(std::string("Build requires phase BUILT, run is ") + to_string(run.phase),
                                  run.context("build"));
    }
    return builder_.build(run, cancel);
}

int64_t migration_engine::catch_up(migration_run& run, const cancellation_token* cancel) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("catch_up"));
    ensure_not_aborted(run);
    if (run.phase != migration_phase::built) {
        // From cutover on the canonical table is authoritative; nothing flows back
        throw precondition_failed(std::string("Nothing to catch up in phase ") + to_string(run.phase),
                                  run.context("catch_up"));
    }

    auto copied = builder_.backfill(run.source, run.shadow, run.source_metadata, run.context(), cancel);
    auto removed = builder_.remove_orphans(run.source, run.shadow, run.source_metadata, run.context());
    auto rows = run_query(gw_, gw_.sql_dialect().count_rows(run.source), config_.gate_timeout,
                          run.context("reference count"));
    run.reference_row_count = rows.empty() ? 0 : row_int(rows.front(), "n");
    return copied + removed;
}

void migration_engine::cut_over(migration_run& run) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("cut_over"));
    std::lock_guard<std::mutex> state(*run.state_mutex);
    ensure_not_aborted(run);
    cutover_.cut_over(run);
}

void migration_engine::roll_back(migration_run& run, const rollback_options& options) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("roll_back"));
    std::lock_guard<std::mutex> state(*run.state_mutex);
    ensure_not_aborted(run);
    cutover_.roll_back(run, options);
}

const bridge& migration_engine::open_bridge(migration_run& run) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("open_bridge"));
    std::lock_guard<std::mutex> state(*run.state_mutex);
    ensure_not_aborted(run);
    if (run.phase == migration_phase::bridged && run.active_bridge) {
        return *run.active_bridge;
    }
    if (run.phase != migration_phase::cut_over) {
        throw precondition_failed(std::string("Bridge opens after cutover, run is ") + to_string(run.phase),
                                  run.context("open_bridge"));
    }
    const auto& b = bridges_.open(run);
    run.phase = migration_phase::bridged;
    return b;
}

void migration_engine::close_bridge(migration_run& run) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("close_bridge"));
    std::lock_guard<std::mutex> state(*run.state_mutex);
    ensure_not_aborted(run);
    if (run.phase != migration_phase::bridged) {
        throw precondition_failed(std::string("No bridge to close in phase ") + to_string(run.phase),
                                  run.context("close_bridge"));
    }
    bridges_.close(run);
    run.phase = migration_phase::cut_over;
}

int64_t migration_engine::route_write(migration_run& run, const write_request& request) {
    // Writes are traffic, not orchestration; they skip the identity guard
    // and hold the run's state only long enough to copy the bridge
    std::optional<bridge> target;
    error_context ctx;
    {
        std::lock_guard<std::mutex> state(*run.state_mutex);
        ensure_not_aborted(run);
        target = run.active_bridge;
        ctx = run.context("route");
    }
    if (!target) {
        throw precondition_failed("Run has no open bridge", ctx);
    }
    return bridges_.route(*target, request, ctx);
}

finalize_report migration_engine::finalize(migration_run& run, const finalize_options& options) {
    identity_guard guard(run.identity.schema, run.identity.logical_name, run.context("finalize"));
    std::lock_guard<std::mutex> state(*run.state_mutex);
    ensure_not_aborted(run);
    return finalizer_.finalize(run, options);
}

exchange_report migration_engine::swap_oldest_slice(const archive_cycle& cycle) {
    error_context ctx{"", cycle.active.to_string(), "", "swap_oldest_slice"};
    identity_guard guard(cycle.active.schema, cycle.active.name, ctx);
    return exchange_.swap_oldest_slice(cycle);
}

} // namespace repart
