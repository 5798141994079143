#include "repart/finalizer.hpp"
#include "repart/log.hpp"

namespace repart {

finalizer::finalizer(gateway& gw, const configuration& config, const event_stream& events, bridge_manager& bridges)
    : gw_(gw), config_(config), events_(events), gates_(gw, config.gate_timeout), bridges_(bridges) {}

void finalizer::check_preconditions(migration_run& run, const finalize_options& options) {
    auto ctx = run.context("preconditions");
    auto refuse = [&](const std::string& why, std::vector<gate_result> gates = {}) {
        auto event = make_event(ctx, "finalizer", "preconditions", event_outcome::failed, why);
        event.gates = gates;
        events_.emit(event);
        throw precondition_failed(why, ctx, std::move(gates));
    };

    if (run.phase != migration_phase::bridged) {
        refuse(std::string("Finalize requires phase BRIDGED, run is ") + to_string(run.phase));
    }
    if (!options.operator_confirmed) {
        refuse("Finalize requires operator confirmation");
    }
    if (!run.cut_over_at) {
        refuse("Run has no cutover time");
    }
    auto window_ends = *run.cut_over_at + config_.validation_window;
    if (std::chrono::system_clock::now() < window_ends) {
        auto left = std::chrono::duration_cast<std::chrono::seconds>(window_ends - std::chrono::system_clock::now());
        refuse("Validation window has " + std::to_string(left.count()) + "s left");
    }
}

finalize_report finalizer::finalize(migration_run& run, const finalize_options& options) {
    check_preconditions(run, options);

    finalize_report report;
    auto ctx = run.context("finalize");
    events_.emit(make_event(ctx, "finalizer", "finalize", event_outcome::started));

    bridges_.close(run);

    ctx.step = "drop " + run.retired().to_string();
    auto present = gates_.run(gate_request::existence(run.retired(), true), ctx);
    if (present.passed()) {
        try {
            run_step(gw_, gw_.sql_dialect().drop_table(run.retired()), config_.step_timeout, ctx);
        } catch (const migration_error& e) {
            events_.emit(make_event(ctx, "finalizer", "drop_retired", event_outcome::failed, e.what()));
            throw;
        }
        report.retired_dropped = true;
        events_.emit(make_event(ctx, "finalizer", "drop_retired", event_outcome::succeeded, run.retired().to_string()));
    } else {
        events_.emit(make_event(ctx, "finalizer", "drop_retired", event_outcome::succeeded, "already dropped"));
    }

    recompile_dependents(run, report);
    restore_grants(run, report);

    run.phase = migration_phase::finalized;
    events_.emit(make_event(run.context("finalize"), "finalizer", "finalize", event_outcome::succeeded,
                            report.still_invalid.empty()
                                ? "all dependents valid"
                                : std::to_string(report.still_invalid.size()) + " object(s) still invalid"));
    LOG_INFO("finalizer", "%s finalized", run.identity.to_string().c_str());
    return report;
}

void finalizer::recompile_dependents(const migration_run& run, finalize_report& report) {
    const auto& d = gw_.sql_dialect();
    auto ctx = run.context("recompile");
    auto invalid_query = d.invalid_objects(run.identity.schema);
    if (!invalid_query) {
        events_.emit(make_event(ctx, "finalizer", "recompile", event_outcome::succeeded,
                                std::string("skipped: ") + d.name() + " has no invalid objects"));
        return;
    }

    auto read_invalid = [&]() {
        std::vector<schema_object> objects;
        for (const auto& row : run_query(gw_, *invalid_query, config_.gate_timeout, ctx)) {
            objects.push_back({row_text(row, "object_name"), row_text(row, "object_type")});
        }
        return objects;
    };

    // Exactly one pass; whatever is still invalid afterwards is reported
    for (const auto& object : read_invalid()) {
        auto stmt = d.recompile(run.identity.schema, object);
        if (!stmt) continue;
        report.recompiled.push_back(object);
        error_context step = ctx;
        step.step = "recompile " + object.type + " " + object.name;
        try {
            run_step(gw_, *stmt, config_.step_timeout, step);
        } catch (const migration_error& e) {
            LOG_WARN("finalizer", "Recompile of %s %s failed: %s", object.type.c_str(), object.name.c_str(), e.what());
        }
    }
    report.still_invalid = read_invalid();

    if (report.still_invalid.empty()) {
        events_.emit(make_event(ctx, "finalizer", "recompile", event_outcome::succeeded,
                                std::to_string(report.recompiled.size()) + " object(s) recompiled"));
    } else {
        std::vector<std::string> names;
        for (const auto& object : report.still_invalid) {
            names.push_back(object.type + " " + object.name);
        }
        events_.emit(make_event(ctx, "finalizer", "recompile", event_outcome::warned,
                                "still invalid: " + join(names, ", ")));
    }
}

void finalizer::restore_grants(const migration_run& run, finalize_report& report) {
    const auto& d = gw_.sql_dialect();
    auto ctx = run.context("grants");
    auto canonical = run.canonical();

    std::vector<std::string> failures;
    for (const auto& grant : run.captured_grants) {
        auto stmt = d.grant(canonical, grant);
        if (!stmt) continue;
        error_context step = ctx;
        step.step = "grant " + grant.privilege + " to " + grant.grantee;
        try {
            run_step(gw_, *stmt, config_.step_timeout, step);
            report.grants_applied.push_back(grant);
        } catch (const migration_error& e) {
            failures.push_back(step.step + ": " + e.what());
        }
    }

    if (!failures.empty()) {
        events_.emit(make_event(ctx, "finalizer", "grants", event_outcome::failed, join(failures, "; ")));
        throw transient_database_error(std::to_string(failures.size()) + " grant(s) failed: " + join(failures, "; "), ctx);
    }
    events_.emit(make_event(ctx, "finalizer", "grants", event_outcome::succeeded,
                            std::to_string(report.grants_applied.size()) + " grant(s) applied"));
}

} // namespace repart
