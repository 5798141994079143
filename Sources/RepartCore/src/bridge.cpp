#include "repart/bridge.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"

namespace repart {

namespace {

bridge_spec spec_of(const bridge& b) {
    return {b.schema, b.view_name, b.shadow_name, b.retired_name, b.columns, b.key_columns};
}

bool object_present(gateway& gw, const std::string& schema, const std::string& name, object_kind kind,
                    std::chrono::milliseconds timeout, const error_context& where) {
    auto rows = run_query(gw, gw.sql_dialect().object_exists(schema, name, kind), timeout, where);
    return !rows.empty() && row_int(rows.front(), "n") > 0;
}

} // namespace

const char* to_string(write_kind kind) {
    switch (kind) {
        case write_kind::insert: return "INSERT";
        case write_kind::update: return "UPDATE";
        case write_kind::remove: return "DELETE";
    }
    return "UNKNOWN";
}

// ============================================================================
// Write routers
// ============================================================================

int64_t write_router::route(const bridge& b, const write_request& request, const error_context& where) {
    error_context ctx = where;
    ctx.step = std::string("route ") + to_string(request.kind) + " via " + b.view_name;
    if (request.kind != write_kind::insert) {
        throw unsupported_write(std::string(to_string(request.kind)) + " through bridge " + b.view_name +
                                " is not supported; only INSERT is routed", ctx);
    }
    if (request.columns.empty() || request.columns.size() != request.values.size()) {
        throw configuration_error("Insert through bridge " + b.view_name + " needs matching columns and values", ctx);
    }
    return route_insert(b, request, ctx);
}

std::vector<std::string> trigger_write_router::install(const bridge& b, const error_context& where) {
    const auto& d = gw_.sql_dialect();
    auto spec = spec_of(b);
    auto names = d.write_router_triggers(spec);
    auto statements = d.create_write_router(spec);

    error_context ctx = where;
    for (size_t i = 0; i < statements.size(); ++i) {
        const auto& name = i < names.size() ? names[i] : b.view_name;
        ctx.step = "create_trigger(" + name + ")";
        if (i < names.size() && object_present(gw_, b.schema, name, object_kind::trigger, timeout_, ctx)) {
            continue;
        }
        run_step(gw_, statements[i], timeout_, ctx);
    }
    return names;
}

void trigger_write_router::uninstall(const bridge& b, const error_context& where) {
    const auto& d = gw_.sql_dialect();
    error_context ctx = where;
    for (const auto& name : d.write_router_triggers(spec_of(b))) {
        ctx.step = "drop_trigger(" + name + ")";
        if (object_present(gw_, b.schema, name, object_kind::trigger, timeout_, ctx)) {
            run_step(gw_, d.drop_trigger(b.schema, name), timeout_, ctx);
        }
    }
}

int64_t trigger_write_router::route_insert(const bridge& b, const write_request& request,
                                           const error_context& where) {
    // The view's INSTEAD OF trigger forwards the row to the shadow
    return run_step(gw_, gw_.sql_dialect().insert_row(b.view(), request.columns, request.values),
                    timeout_, where);
}

std::vector<std::string> proxy_write_router::install(const bridge& /*b*/, const error_context& /*where*/) {
    return {};
}

void proxy_write_router::uninstall(const bridge& /*b*/, const error_context& /*where*/) {}

int64_t proxy_write_router::route_insert(const bridge& b, const write_request& request,
                                         const error_context& where) {
    return run_step(gw_, gw_.sql_dialect().insert_row(b.shadow(), request.columns, request.values),
                    timeout_, where);
}

std::unique_ptr<write_router> make_write_router(router_kind kind, gateway& gw, std::chrono::milliseconds timeout) {
    switch (kind) {
        case router_kind::trigger: return std::make_unique<trigger_write_router>(gw, timeout);
        case router_kind::proxy: return std::make_unique<proxy_write_router>(gw, timeout);
    }
    throw configuration_error("Unknown write router kind");
}

// ============================================================================
// Bridge manager
// ============================================================================

bridge_manager::bridge_manager(gateway& gw, const configuration& config, const event_stream& events)
    : gw_(gw), config_(config), events_(events), gates_(gw, config.gate_timeout)
    , router_(make_write_router(config.router, gw, config.step_timeout)) {}

bridge bridge_manager::describe(const migration_run& run) const {
    bridge b;
    b.schema = run.identity.schema;
    b.view_name = run.identity.logical_name + config_.bridge_suffix;
    b.shadow_name = run.identity.logical_name;
    b.retired_name = run.retired_name;
    b.columns = run.source_metadata.column_names();
    b.key_columns = run.source_metadata.primary_key;
    b.router = router_->kind();
    return b;
}

const bridge& bridge_manager::open(migration_run& run) {
    auto ctx = run.context("open_bridge");
    if (run.active_bridge) {
        return *run.active_bridge;
    }
    events_.emit(make_event(ctx, "bridge", "open", event_outcome::started));

    auto gates = gates_.run_all({gate_request::existence(run.canonical(), true),
                                 gate_request::existence(run.retired(), true)},
                                ctx);
    if (!none_failed(gates)) {
        auto event = make_event(ctx, "bridge", "open", event_outcome::failed, summarize(gates));
        event.gates = gates;
        events_.emit(event);
        throw precondition_failed("Bridge needs both " + run.canonical().to_string() + " and " +
                                  run.retired().to_string() + ": " + summarize(gates), ctx, gates);
    }
    if (run.source_metadata.primary_key.empty()) {
        throw configuration_error("Bridge deduplication needs a primary key", ctx);
    }

    auto b = describe(run);
    try {
        ctx.step = "create_view(" + b.view_name + ")";
        if (!object_present(gw_, b.schema, b.view_name, object_kind::view, config_.gate_timeout, ctx)) {
            run_step(gw_, gw_.sql_dialect().create_bridge_view(spec_of(b)), config_.step_timeout, ctx);
        }
        b.router_objects = router_->install(b, ctx);
    } catch (const migration_error& e) {
        events_.emit(make_event(ctx, "bridge", "open", event_outcome::failed, e.what()));
        throw;
    }

    run.active_bridge = std::move(b);
    ctx.step = "open_bridge";
    events_.emit(make_event(ctx, "bridge", "open", event_outcome::succeeded,
                            run.active_bridge->view_name + " over " + run.canonical().to_string() + " + " +
                            run.retired().to_string() + " (" + to_string(router_->kind()) + " router)"));
    LOG_INFO("bridge", "Opened %s", run.active_bridge->view_name.c_str());
    return *run.active_bridge;
}

void bridge_manager::close(migration_run& run) {
    auto ctx = run.context("close_bridge");
    auto b = run.active_bridge ? *run.active_bridge : describe(run);
    events_.emit(make_event(ctx, "bridge", "close", event_outcome::started, b.view_name));

    try {
        // Router first so no write can reach a half-removed bridge
        if (b.router == router_->kind()) {
            router_->uninstall(b, ctx);
        } else {
            make_write_router(b.router, gw_, config_.step_timeout)->uninstall(b, ctx);
        }

        ctx.step = "drop_view(" + b.view_name + ")";
        if (object_present(gw_, b.schema, b.view_name, object_kind::view, config_.gate_timeout, ctx)) {
            run_step(gw_, gw_.sql_dialect().drop_view(b.schema, b.view_name), config_.step_timeout, ctx);
        }
    } catch (const migration_error& e) {
        events_.emit(make_event(ctx, "bridge", "close", event_outcome::failed, e.what()));
        throw;
    }

    run.active_bridge.reset();
    ctx.step = "close_bridge";
    events_.emit(make_event(ctx, "bridge", "close", event_outcome::succeeded, b.view_name));
}

int64_t bridge_manager::route(const bridge& b, const write_request& request, const error_context& where) {
    if (b.router != router_->kind()) {
        return make_write_router(b.router, gw_, config_.step_timeout)->route(b, request, where);
    }
    return router_->route(b, request, where);
}

} // namespace repart
