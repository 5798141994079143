#include "repart/cutover.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"
#include <algorithm>

namespace repart {

cutover_controller::cutover_controller(gateway& gw, const configuration& config, const event_stream& events,
                                       shadow_builder& builder, bridge_manager& bridges)
    : gw_(gw), config_(config), events_(events), gates_(gw, config.gate_timeout)
    , builder_(builder), bridges_(bridges) {}

void cutover_controller::fail_gates(migration_run& run, const std::string& step, const std::string& why,
                                    const std::vector<gate_result>& gates) {
    auto ctx = run.context(step);
    auto event = make_event(ctx, "cutover", "preconditions", event_outcome::failed, why);
    event.gates = gates;
    events_.emit(event);
    throw precondition_failed(why + ": " + summarize(gates), ctx, gates);
}

void cutover_controller::cut_over(migration_run& run) {
    auto ctx = run.context("cut_over");
    if (run.phase != migration_phase::built) {
        throw precondition_failed(std::string("Cutover requires phase BUILT, run is ") + to_string(run.phase), ctx);
    }
    if (!run.reference_row_count) {
        throw precondition_failed("Run has no reference row count; build the shadow first", ctx);
    }
    events_.emit(make_event(ctx, "cutover", "cut_over", event_outcome::started));

    check_preconditions(run);
    rename_pair(run, {run.source, run.retired_name, run.shadow,
                      migration_phase::cut_over, migration_phase::built,
                      "Cutover", "rename_source", "rename_shadow"});

    run.cut_over_at = std::chrono::system_clock::now();
    events_.emit(make_event(run.context("cut_over"), "cutover", "cut_over", event_outcome::succeeded,
                            run.canonical().to_string() + " now " + run.shadow.scheme.describe() +
                            "; former source is " + run.retired().to_string()));
    LOG_INFO("cutover", "%s cut over (retired as %s)", run.identity.to_string().c_str(), run.retired_name.c_str());

    if (config_.open_bridge_after_cutover) {
        bridges_.open(run);
        run.phase = migration_phase::bridged;
        events_.emit(make_event(run.context("open_bridge"), "cutover", "open_bridge", event_outcome::succeeded));
    }
}

void cutover_controller::check_preconditions(migration_run& run) {
    auto ctx = run.context("preconditions");
    const auto& key = run.source_metadata.primary_key;

    // Pure reads; fan out and join before anything mutates. The two
    // coverage gates catch inserts and deletes the catch-up has not seen.
    auto gates = gates_.run_all({
        gate_request::existence(run.source, true),
        gate_request::existence(run.shadow, true),
        gate_request::existence(run.retired(), false),
        gate_request::constraint_state(run.shadow),
        gate_request::row_reconciliation(run.source, run.shadow, *run.reference_row_count),
        gate_request::key_coverage(run.source, run.shadow, key),
        gate_request::key_coverage(run.shadow, run.source, key),
    }, ctx);
    run.gate_results = gates;

    if (!none_failed(gates)) {
        fail_gates(run, "cut_over", "Cutover preconditions failed", gates);
    }

    auto& constraints = run.gate_results[3];
    if (constraints.verdict == gate_verdict::warn) {
        switch (config_.disabled_constraints) {
            case constraint_policy::enable:
                builder_.enable_constraints(run.shadow, ctx);
                constraints = gates_.run(gate_request::constraint_state(run.shadow), ctx);
                if (!constraints.passed()) {
                    fail_gates(run, "cut_over", "Shadow constraints still not enabled", run.gate_results);
                }
                break;
            case constraint_policy::proceed:
                LOG_WARN("cutover", "Proceeding with disabled constraints on %s: %s",
                         run.shadow.to_string().c_str(), constraints.detail.c_str());
                break;
            case constraint_policy::abort:
                fail_gates(run, "cut_over", "Shadow has disabled constraints", run.gate_results);
                break;
        }
    }

    // Last check before the renames; best effort, hence the compensation
    auto writers = gates_.run(gate_request::active_writers(run.identity.schema, run.identity.logical_name), ctx);
    run.gate_results.push_back(writers);
    if (!writers.passed()) {
        fail_gates(run, "cut_over", "Active sessions reference " + run.identity.logical_name, run.gate_results);
    }

    bool clean = std::all_of(run.gate_results.begin(), run.gate_results.end(),
                             [](const gate_result& g) { return g.passed(); });
    auto event = make_event(ctx, "cutover", "preconditions",
                            clean ? event_outcome::succeeded : event_outcome::warned,
                            summarize(run.gate_results));
    event.gates = run.gate_results;
    events_.emit(event);
}

void cutover_controller::roll_back(migration_run& run, const rollback_options& options) {
    auto ctx = run.context("roll_back");
    if (run.phase != migration_phase::cut_over && run.phase != migration_phase::bridged) {
        throw precondition_failed(std::string("Rollback requires phase CUT_OVER or BRIDGED, run is ") +
                                  to_string(run.phase), ctx);
    }
    if (!options.operator_confirmed) {
        throw precondition_failed("Rollback needs operator confirmation", ctx);
    }
    events_.emit(make_event(ctx, "cutover", "roll_back", event_outcome::started));

    // The retired table must still be there to come back, and the shadow
    // name must be free to park the canonical table under
    auto gates = gates_.run_all({
        gate_request::existence(run.canonical(), true),
        gate_request::existence(run.retired(), true),
        gate_request::existence(run.shadow, false),
        gate_request::active_writers(run.identity.schema, run.identity.logical_name),
    }, ctx);
    run.gate_results = gates;
    bool clean = std::all_of(gates.begin(), gates.end(), [](const gate_result& g) { return g.passed(); });
    if (!clean) {
        fail_gates(run, "roll_back", "Rollback preconditions failed", gates);
    }

    if (run.phase == migration_phase::bridged) {
        bridges_.close(run);
        run.phase = migration_phase::cut_over;
    }

    rename_pair(run, {run.canonical(), run.shadow.name, run.retired(),
                      migration_phase::built, migration_phase::cut_over,
                      "Rollback", "rename_canonical", "rename_retired"});

    run.cut_over_at.reset();
    events_.emit(make_event(run.context("roll_back"), "cutover", "roll_back", event_outcome::succeeded,
                            run.source.to_string() + " restored; new-scheme table is " + run.shadow.to_string()));
    LOG_WARN("cutover", "%s rolled back; rows written since cutover remain only in %s",
             run.identity.to_string().c_str(), run.shadow.to_string().c_str());
}

void cutover_controller::rename_pair(migration_run& run, const rename_plan& plan) {
    const auto& d = gw_.sql_dialect();
    const auto& logical = run.identity.logical_name;
    auto outgoing_moved = physical_table{run.identity.schema, plan.outgoing_name, plan.outgoing.scheme};

    // (a) outgoing off the logical name. Failure changes nothing.
    auto ctx = run.context("rename " + plan.outgoing.name + " -> " + plan.outgoing_name);
    try {
        run_step(gw_, d.rename_table(plan.outgoing, plan.outgoing_name), config_.step_timeout, ctx);
    } catch (const migration_error& e) {
        events_.emit(make_event(ctx, "cutover", plan.first_step, event_outcome::failed, e.what()));
        throw;
    }
    run.phase = migration_phase::renamed_source;
    events_.emit(make_event(run.context(ctx.step), "cutover", plan.first_step, event_outcome::succeeded));

    // (b) incoming onto the logical name, immediately
    ctx = run.context("rename " + plan.incoming.name + " -> " + logical);
    try {
        run_step(gw_, d.rename_table(plan.incoming, logical), config_.step_timeout, ctx);
    } catch (const migration_error& first) {
        events_.emit(make_event(ctx, "cutover", plan.second_step, event_outcome::failed, first.what()));

        auto undo = run.context("rename " + plan.outgoing_name + " -> " + logical);
        try {
            run_step(gw_, d.rename_table(outgoing_moved, logical), config_.step_timeout, undo);
        } catch (const migration_error& second) {
            run.phase = migration_phase::aborted;
            run.operator_intervention_required = true;
            undo = run.context(undo.step);
            events_.emit(make_event(undo, "cutover", "compensate", event_outcome::failed, second.what()));
            LOG_ERROR("cutover", "Compensation failed for %s; %s and %s need an operator",
                      run.identity.to_string().c_str(), outgoing_moved.to_string().c_str(),
                      plan.incoming.to_string().c_str());
            throw irrecoverable_cutover_failure(
                std::string(plan.operation) + " rename of " + plan.incoming.to_string() + " failed (" +
                first.what() + ") and compensation failed (" + second.what() + "); " +
                logical + " is now " + outgoing_moved.to_string() + ", the other table is " +
                plan.incoming.to_string(), undo);
        }

        run.phase = plan.restored;
        undo = run.context(undo.step);
        events_.emit(make_event(undo, "cutover", "compensate", event_outcome::compensated,
                                plan.outgoing.to_string() + " restored"));
        throw transient_database_error(std::string(plan.operation) + " undone after the rename of " +
                                       plan.incoming.to_string() + " failed: " + first.what(), ctx);
    }

    run.phase = plan.completed;
    events_.emit(make_event(run.context(ctx.step), "cutover", plan.second_step, event_outcome::succeeded));
}

} // namespace repart
