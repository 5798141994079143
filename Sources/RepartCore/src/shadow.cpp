#include "repart/shadow.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"
#include <algorithm>

namespace repart {

shadow_builder::shadow_builder(gateway& gw, const configuration& config, const event_stream& events)
    : gw_(gw), config_(config), events_(events), gates_(gw, config.gate_timeout) {}

template <typename Fn>
auto shadow_builder::step(const error_context& where, const char* name, Fn&& fn) -> decltype(fn()) {
    error_context ctx = where;
    ctx.step = name;
    events_.emit(make_event(ctx, "shadow", name, event_outcome::started));
    try {
        return fn();
    } catch (const std::exception& e) {
        LOG_ERROR("shadow", "%s failed: %s", name, e.what());
        events_.emit(make_event(ctx, "shadow", name, event_outcome::failed, e.what()));
        throw;
    }
}

void shadow_builder::check_cancelled(const cancellation_token* cancel, const error_context& where,
                                     const char* step) const {
    if (cancel && cancel->is_cancelled()) {
        error_context ctx = where;
        ctx.step = step;
        events_.emit(make_event(ctx, "shadow", step, event_outcome::failed, "cancelled"));
        throw operation_cancelled(std::string(step) + " cancelled at a batch boundary", ctx);
    }
}

physical_table shadow_builder::build(migration_run& run, const cancellation_token* cancel) {
    auto where = run.context();
    run.shadow.scheme.validate();

    create_shadow(run.shadow, run.source_metadata, where);
    backfill(run.source, run.shadow, run.source_metadata, where, cancel);

    // Reference snapshot for the cutover reconciliation gate
    auto rows = run_query(gw_, gw_.sql_dialect().count_rows(run.source), config_.gate_timeout, run.context("reference count"));
    run.reference_row_count = rows.empty() ? 0 : row_int(rows.front(), "n");

    rebuild_indexes(run.shadow, run.source_metadata, where, cancel);
    collect_statistics(run.shadow, where);
    enable_constraints(run.shadow, where);

    LOG_INFO("shadow", "Built %s as %s (%lld reference rows)", run.shadow.to_string().c_str(),
             run.shadow.scheme.describe().c_str(), static_cast<long long>(*run.reference_row_count));
    return run.shadow;
}

void shadow_builder::create_shadow(const physical_table& shadow, const table_metadata& source,
                                   const error_context& where) {
    step(where, "create_shadow", [&]() {
        error_context ctx = where;
        ctx.step = "create_shadow";

        // The bridge deduplicates on the primary key
        if (source.primary_key.empty()) {
            throw configuration_error("Source table has no primary key; cannot build " + shadow.to_string(), ctx);
        }
        shadow.scheme.validate();

        auto gate = gates_.run(gate_request::existence(shadow, false), ctx);
        if (gate.failed()) {
            throw precondition_failed("Shadow " + shadow.to_string() + " already exists", ctx, {gate});
        }

        run_step(gw_, gw_.sql_dialect().create_table(shadow, source, config_.parallel_degree),
                 config_.step_timeout, ctx);
        events_.emit(make_event(ctx, "shadow", "create_shadow", event_outcome::succeeded,
                                shadow.to_string() + " " + shadow.scheme.describe()));
    });
}

int64_t shadow_builder::backfill(const physical_table& source, const physical_table& target,
                                 const table_metadata& metadata, const error_context& where,
                                 const cancellation_token* cancel) {
    return step(where, "backfill", [&]() -> int64_t {
        error_context ctx = where;
        ctx.step = "backfill";
        if (metadata.primary_key.empty()) {
            throw configuration_error("Backfill needs the source primary key", ctx);
        }

        // Partition key order keeps each batch within few slices
        const auto& order_by = target.scheme.is_partitioned() ? target.scheme.columns : metadata.primary_key;
        auto stmt = gw_.sql_dialect().backfill_batch(source, target, metadata, order_by,
                                                     config_.backfill_batch_rows, config_.parallel_degree);

        int64_t copied = 0;
        int batch = 0;
        while (true) {
            check_cancelled(cancel, where, "backfill");
            int64_t inserted = run_step(gw_, stmt, config_.step_timeout, ctx);
            if (inserted <= 0) break;
            copied += inserted;
            ++batch;
            events_.emit(make_event(ctx, "shadow", "backfill", event_outcome::succeeded,
                                    "batch " + std::to_string(batch) + ": " + std::to_string(inserted) + " rows"));
            if (config_.backfill_batch_rows <= 0) break;
        }

        events_.emit(make_event(ctx, "shadow", "backfill", event_outcome::succeeded,
                                std::to_string(copied) + " rows copied from " + source.to_string() +
                                " to " + target.to_string()));
        return copied;
    });
}

int64_t shadow_builder::remove_orphans(const physical_table& source, const physical_table& target,
                                       const table_metadata& metadata, const error_context& where) {
    return step(where, "remove_orphans", [&]() -> int64_t {
        error_context ctx = where;
        ctx.step = "remove_orphans";
        if (metadata.primary_key.empty()) {
            throw configuration_error("Removing deleted rows needs the source primary key", ctx);
        }
        int64_t removed = run_step(gw_, gw_.sql_dialect().delete_missing_keys(target, source, metadata.primary_key),
                                   config_.step_timeout, ctx);
        events_.emit(make_event(ctx, "shadow", "remove_orphans", event_outcome::succeeded,
                                std::to_string(removed) + " rows deleted from " + target.to_string() +
                                " that " + source.to_string() + " no longer holds"));
        return removed;
    });
}

int shadow_builder::rebuild_indexes(const physical_table& shadow, const table_metadata& source,
                                    const error_context& where, const cancellation_token* cancel) {
    return step(where, "rebuild_indexes", [&]() -> int {
        const auto& d = gw_.sql_dialect();
        error_context ctx = where;

        int created = 0;
        for (const auto& index : source.indexes) {
            check_cancelled(cancel, where, "rebuild_indexes");
            auto name = index.name + config_.shadow_index_suffix;
            ctx.step = "create_index(" + name + ")";

            auto rows = run_query(gw_, d.object_exists(shadow.schema, name, object_kind::index),
                                  config_.gate_timeout, ctx);
            if (!rows.empty() && row_int(rows.front(), "n") > 0) {
                LOG_INFO("shadow", "Index %s already exists, skipping", name.c_str());
                continue;
            }

            // A unique local index must contain the whole partition key
            bool local = shadow.scheme.is_partitioned();
            if (local && index.unique) {
                local = std::all_of(shadow.scheme.columns.begin(), shadow.scheme.columns.end(),
                                    [&](const std::string& key) {
                                        return std::any_of(index.columns.begin(), index.columns.end(),
                                                           [&](const std::string& c) { return to_upper(c) == to_upper(key); });
                                    });
            }

            run_step(gw_, d.create_index(shadow, name, index, local, config_.parallel_degree),
                     config_.step_timeout, ctx);
            ++created;
        }

        ctx.step = "rebuild_indexes";
        events_.emit(make_event(ctx, "shadow", "rebuild_indexes", event_outcome::succeeded,
                                std::to_string(created) + " of " + std::to_string(source.indexes.size()) +
                                " indexes created"));
        return created;
    });
}

void shadow_builder::collect_statistics(const physical_table& table, const error_context& where) {
    step(where, "collect_statistics", [&]() {
        error_context ctx = where;
        ctx.step = "collect_statistics";
        run_step(gw_, gw_.sql_dialect().gather_statistics(table, config_.parallel_degree),
                 config_.step_timeout, ctx);
        events_.emit(make_event(ctx, "shadow", "collect_statistics", event_outcome::succeeded, table.to_string()));
    });
}

int shadow_builder::enable_constraints(const physical_table& table, const error_context& where) {
    return step(where, "enable_constraints", [&]() -> int {
        const auto& d = gw_.sql_dialect();
        error_context ctx = where;
        ctx.step = "enable_constraints";

        // Rows arrive in P, U, C, R order
        std::vector<std::string> disabled;
        auto rows = run_query(gw_, d.constraint_states(table), config_.gate_timeout, ctx);
        for (const auto& row : rows) {
            if (to_upper(row_text(row, "status")) == "DISABLED") {
                disabled.push_back(row_text(row, "constraint_name"));
            }
        }
        for (const auto& name : disabled) {
            ctx.step = "enable_constraint(" + name + ")";
            run_step(gw_, d.enable_constraint(table, name), config_.step_timeout, ctx);
        }

        ctx.step = "enable_constraints";
        events_.emit(make_event(ctx, "shadow", "enable_constraints", event_outcome::succeeded,
                                disabled.empty() ? "all constraints enabled" : "enabled " + join(disabled, ", ")));
        return static_cast<int>(disabled.size());
    });
}

} // namespace repart
