#include "repart/exchange.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"
#include <algorithm>

namespace repart {

exchange_engine::exchange_engine(gateway& gw, const configuration& config, const event_stream& events)
    : gw_(gw), config_(config), events_(events), gates_(gw, config.gate_timeout) {}

std::string exchange_engine::next_history_partition(timestamp_t at) {
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    std::lock_guard<std::mutex> lock(mutex_);
    if (ms <= last_history_ms_) {
        ms = last_history_ms_ + 1;
    }
    last_history_ms_ = ms;
    return config_.history_partition_prefix + std::to_string(ms);
}

exchange_report exchange_engine::swap_oldest_slice(const archive_cycle& cycle) {
    const auto& d = gw_.sql_dialect();
    error_context ctx{"", cycle.active.to_string(), "", "swap_oldest_slice"};

    if (!d.supports_partitioning()) {
        throw configuration_error(std::string("Partition exchange needs native partitioning; ") + d.name() +
                                  " has none", ctx);
    }
    const auto& a = cycle.active;
    const auto& s = cycle.staging;
    const auto& h = cycle.history;
    if (a.name.empty() || s.name.empty() || h.name.empty()) {
        throw configuration_error("Archive cycle needs active, staging and history tables", ctx);
    }
    if (to_upper(a.to_string()) == to_upper(s.to_string()) || to_upper(a.to_string()) == to_upper(h.to_string()) ||
        to_upper(s.to_string()) == to_upper(h.to_string())) {
        throw configuration_error("Active, staging and history must be three different tables", ctx);
    }

    events_.emit(make_event(ctx, "exchange", "swap_oldest_slice", event_outcome::started,
                            a.to_string() + " -> " + s.to_string() + " -> " + h.to_string()));

    // Preconditions
    auto gates = gates_.run_all({gate_request::row_reconciliation(s, s, 0),
                                 gate_request::partition_distribution(a)}, ctx);
    auto refuse = [&](const std::string& why) {
        auto event = make_event(ctx, "exchange", "preconditions", event_outcome::failed, why);
        event.gates = gates;
        events_.emit(event);
        throw precondition_failed(why, ctx, gates);
    };
    if (gates[0].failed()) {
        refuse("Staging " + s.to_string() + " is not empty: " + gates[0].detail);
    }
    const auto& slices = gates[1].slices;
    if (slices.empty()) {
        refuse("Active " + a.to_string() + " has no partitions");
    }

    // Oldest = smallest upper bound = lowest position
    exchange_report report;
    report.slice = *std::min_element(slices.begin(), slices.end(),
                                     [](const partition_slice& x, const partition_slice& y) {
                                         return x.ordinal_position < y.ordinal_position;
                                     });
    const auto& slice = report.slice;

    // Step 2: nothing has moved if this fails
    ctx.step = "exchange " + slice.name + " with " + s.to_string();
    try {
        run_step(gw_, d.exchange_partition(a, slice.name, s), config_.step_timeout, ctx);
    } catch (const migration_error& e) {
        events_.emit(make_event(ctx, "exchange", "exchange_active", event_outcome::failed,
                                std::string(e.what()) + "; nothing moved"));
        throw;
    }
    events_.emit(make_event(ctx, "exchange", "exchange_active", event_outcome::succeeded, slice.name));

    // From here on staging holds the slice's rows until step 4 completes
    auto leave_staging = [&](const std::string& step, const migration_error& e) {
        events_.emit(make_event(ctx, "exchange", step, event_outcome::failed, e.what()));
        LOG_ERROR("exchange", "%s failed; staging %s left non-empty: %s", step.c_str(), s.to_string().c_str(), e.what());
        throw transient_database_error(step + " failed after " + slice.name + " moved; staging " + s.to_string() +
                                       " left non-empty for the operator: " + e.what(), ctx);
    };

    try {
        auto rows = run_query(gw_, d.count_rows(s), config_.gate_timeout, ctx);
        report.rows_moved = rows.empty() ? 0 : row_int(rows.front(), "n");
    } catch (const migration_error& e) {
        leave_staging("count_staging", e);
    }

    // Step 3
    report.history_partition = next_history_partition(std::chrono::system_clock::now());
    ctx.step = "add partition " + report.history_partition + " to " + h.to_string();
    try {
        run_step(gw_, d.add_partition(h, report.history_partition, slice.upper_bound), config_.step_timeout, ctx);
    } catch (const migration_error& e) {
        leave_staging("add_history_partition", e);
    }

    // Step 4
    ctx.step = "exchange " + report.history_partition + " with " + s.to_string();
    try {
        run_step(gw_, d.exchange_partition(h, report.history_partition, s), config_.step_timeout, ctx);
    } catch (const migration_error& e) {
        leave_staging("exchange_history", e);
    }
    events_.emit(make_event(ctx, "exchange", "exchange_history", event_outcome::succeeded,
                            std::to_string(report.rows_moved) + " rows into " + report.history_partition));

    // Step 5: staging is empty again; only the emptied slice remains
    ctx.step = "drop partition " + slice.name + " from " + a.to_string();
    try {
        run_step(gw_, d.drop_partition(a, slice.name), config_.step_timeout, ctx);
    } catch (const migration_error& e) {
        events_.emit(make_event(ctx, "exchange", "drop_active_slice", event_outcome::failed, e.what()));
        throw transient_database_error("Rows archived into " + report.history_partition + " but empty slice " +
                                       slice.name + " remains in " + a.to_string() + ": " + e.what(), ctx);
    }

    ctx.step = "swap_oldest_slice";
    events_.emit(make_event(ctx, "exchange", "swap_oldest_slice", event_outcome::succeeded,
                            slice.name + " (" + std::to_string(report.rows_moved) + " rows) -> " +
                            h.to_string() + "." + report.history_partition));
    LOG_INFO("exchange", "Archived %s.%s into %s.%s", a.to_string().c_str(), slice.name.c_str(),
             h.to_string().c_str(), report.history_partition.c_str());
    return report;
}

} // namespace repart
