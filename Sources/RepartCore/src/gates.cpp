#include "repart/gates.hpp"
#include "repart/dialect.hpp"
#include "repart/log.hpp"
#include <cstdio>
#include <exception>
#include <future>

namespace repart {

// ============================================================================
// Requests
// ============================================================================

gate_request gate_request::existence(physical_table table, bool must_exist) {
    gate_request r;
    r.kind = gate_kind::existence;
    r.table = std::move(table);
    r.must_exist = must_exist;
    return r;
}

gate_request gate_request::row_reconciliation(physical_table source, physical_table target, int64_t expected) {
    gate_request r;
    r.kind = gate_kind::row_reconciliation;
    r.table = std::move(source);
    r.other = std::move(target);
    r.expected = expected;
    return r;
}

gate_request gate_request::constraint_state(physical_table table) {
    gate_request r;
    r.kind = gate_kind::constraint_state;
    r.table = std::move(table);
    return r;
}

gate_request gate_request::active_writers(std::string schema, std::string pattern) {
    gate_request r;
    r.kind = gate_kind::active_writers;
    r.table.schema = std::move(schema);
    r.pattern = std::move(pattern);
    return r;
}

gate_request gate_request::partition_distribution(physical_table table) {
    gate_request r;
    r.kind = gate_kind::partition_distribution;
    r.table = std::move(table);
    return r;
}

gate_request gate_request::key_coverage(physical_table reference, physical_table target,
                                        std::vector<std::string> key) {
    gate_request r;
    r.kind = gate_kind::key_coverage;
    r.table = std::move(reference);
    r.other = std::move(target);
    r.key = std::move(key);
    return r;
}

// ============================================================================
// Engine
// ============================================================================

static std::string target_of(const gate_request& r) {
    switch (r.kind) {
        case gate_kind::row_reconciliation:
        case gate_kind::key_coverage:
            return r.table.to_string() + " -> " + r.other.to_string();
        case gate_kind::active_writers:
            return r.table.schema + ":" + r.pattern;
        default:
            return r.table.to_string();
    }
}

gate_result gate_engine::run(const gate_request& request, const error_context& where) const {
    error_context ctx = where;
    ctx.step = std::string(to_string(request.kind)) + "(" + target_of(request) + ")";

    gate_result result;
    switch (request.kind) {
        case gate_kind::existence: result = existence(request, ctx); break;
        case gate_kind::row_reconciliation: result = row_reconciliation(request, ctx); break;
        case gate_kind::constraint_state: result = constraint_state(request, ctx); break;
        case gate_kind::active_writers: result = active_writers(request, ctx); break;
        case gate_kind::partition_distribution: result = partition_distribution(request, ctx); break;
        case gate_kind::key_coverage: result = key_coverage(request, ctx); break;
    }
    result.kind = request.kind;
    result.target = target_of(request);

    LOG_DEBUG("gates", "%s = %s (%s)", ctx.step.c_str(), to_string(result.verdict), result.detail.c_str());
    return result;
}

std::vector<gate_result> gate_engine::run_all(const std::vector<gate_request>& requests,
                                              const error_context& where) const {
    std::vector<std::future<gate_result>> pending;
    pending.reserve(requests.size());
    for (const auto& request : requests) {
        pending.push_back(std::async(std::launch::async, [this, &request, &where]() {
            return run(request, where);
        }));
    }

    // Join everything before surfacing an error
    std::vector<gate_result> results;
    results.reserve(requests.size());
    std::exception_ptr first_error;
    for (auto& future : pending) {
        try {
            results.push_back(future.get());
        } catch (const std::exception&) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return results;
}

int64_t gate_engine::count(const statement& stmt, const error_context& where) const {
    auto rows = run_query(gw_, stmt, timeout_, where);
    if (rows.empty()) {
        throw transient_database_error("Catalog query returned no rows", where);
    }
    try {
        return row_int(rows.front(), "n");
    } catch (const db_error& e) {
        raise_database_error(e, where);
    }
}

gate_result gate_engine::existence(const gate_request& r, const error_context& where) const {
    const auto& d = gw_.sql_dialect();
    int64_t found = count(d.object_exists(r.table.schema, r.table.name, object_kind::table), where);

    gate_result result;
    result.observed = found;
    bool exists = found > 0;
    if (exists == r.must_exist) {
        result.verdict = gate_verdict::pass;
        result.detail = exists ? "present" : "absent";
    } else {
        result.verdict = gate_verdict::fail;
        result.detail = exists ? "present but required absent" : "absent but required present";
    }
    return result;
}

gate_result gate_engine::row_reconciliation(const gate_request& r, const error_context& where) const {
    const auto& d = gw_.sql_dialect();
    int64_t source = count(d.count_rows(r.table), where);
    int64_t target = count(d.count_rows(r.other), where);
    int64_t expected = r.expected;

    gate_result result;
    result.observed = source;
    result.reference = target;
    std::string counts = "source=" + std::to_string(source) + " target=" + std::to_string(target) +
                         " expected=" + std::to_string(expected);

    if (expected == 0) {
        if (source == 0 && target == 0) {
            result.verdict = gate_verdict::pass;
            result.detail = "empty as expected";
        } else {
            result.verdict = gate_verdict::fail;
            result.detail = "rows present when expecting empty: " + counts;
        }
    } else if (target == 0) {
        result.verdict = gate_verdict::fail;
        result.detail = "target is empty: " + counts;
    } else if (source == expected && target == expected) {
        result.verdict = gate_verdict::pass;
        result.detail = counts;
    } else if (source < expected || target < expected) {
        result.verdict = gate_verdict::warn;
        result.detail = "fewer rows than expected: " + counts;
    } else {
        result.verdict = gate_verdict::warn;
        result.detail = "more rows than expected: " + counts;
    }
    return result;
}

gate_result gate_engine::constraint_state(const gate_request& r, const error_context& where) const {
    auto rows = run_query(gw_, gw_.sql_dialect().constraint_states(r.table), timeout_, where);

    std::vector<std::string> disabled;
    std::vector<std::string> illegal;
    try {
        for (const auto& row : rows) {
            auto name = row_text(row, "constraint_name");
            auto status = to_upper(row_text(row, "status"));
            if (status == "ENABLED") continue;
            if (status == "DISABLED") {
                disabled.push_back(name);
            } else {
                illegal.push_back(name + "=" + status);
            }
        }
    } catch (const db_error& e) {
        raise_database_error(e, where);
    }

    gate_result result;
    result.observed = static_cast<int64_t>(rows.size());
    result.reference = static_cast<int64_t>(disabled.size());
    if (!illegal.empty()) {
        result.verdict = gate_verdict::fail;
        result.detail = "illegal constraint state: " + join(illegal, ", ");
    } else if (!disabled.empty()) {
        result.verdict = gate_verdict::warn;
        result.detail = "disabled: " + join(disabled, ", ");
    } else {
        result.verdict = gate_verdict::pass;
        result.detail = rows.empty() ? "no constraints" : std::to_string(rows.size()) + " enabled";
    }
    return result;
}

gate_result gate_engine::active_writers(const gate_request& r, const error_context& where) const {
    int64_t sessions = count(gw_.sql_dialect().active_sessions(r.table.schema, r.pattern), where);

    gate_result result;
    result.observed = sessions;
    if (sessions == 0) {
        result.verdict = gate_verdict::pass;
        result.detail = "no active sessions";
    } else {
        result.verdict = gate_verdict::fail;
        result.detail = std::to_string(sessions) + " active session(s) referencing " + r.pattern;
    }
    return result;
}

gate_result gate_engine::partition_distribution(const gate_request& r, const error_context& where) const {
    gate_result result;
    result.verdict = gate_verdict::pass;

    auto stmt = gw_.sql_dialect().partition_slices(r.table);
    if (!stmt) {
        result.detail = "not partitioned";
        return result;
    }

    auto rows = run_query(gw_, *stmt, timeout_, where);
    int64_t total = 0;
    try {
        for (const auto& row : rows) {
            partition_slice slice;
            slice.owning_table = r.table.to_string();
            slice.name = row_text(row, "partition_name");
            slice.ordinal_position = row_int(row, "position");
            slice.upper_bound = row_text(row, "high_value");
            slice.estimated_row_count = row_optional_int(row, "num_rows").value_or(0);
            total += slice.estimated_row_count;
            result.slices.push_back(std::move(slice));
        }
    } catch (const db_error& e) {
        raise_database_error(e, where);
    }

    result.observed = total;
    result.reference = static_cast<int64_t>(result.slices.size());
    if (result.slices.empty()) {
        result.detail = "not partitioned";
        return result;
    }

    std::vector<std::string> parts;
    for (const auto& slice : result.slices) {
        char pct[32];
        double share = total > 0 ? 100.0 * static_cast<double>(slice.estimated_row_count) / static_cast<double>(total) : 0.0;
        std::snprintf(pct, sizeof(pct), "%.1f%%", share);
        parts.push_back(slice.name + "=" + std::to_string(slice.estimated_row_count) + " (" + pct + ")");
    }
    result.detail = join(parts, ", ");
    return result;
}

gate_result gate_engine::key_coverage(const gate_request& r, const error_context& where) const {
    if (r.key.empty()) {
        throw configuration_error("KeyCoverage needs key columns", where);
    }
    int64_t missing = count(gw_.sql_dialect().count_missing_keys(r.table, r.other, r.key), where);

    gate_result result;
    result.observed = missing;
    if (missing == 0) {
        result.verdict = gate_verdict::pass;
        result.detail = "every key of " + r.table.to_string() + " present";
    } else {
        result.verdict = gate_verdict::fail;
        result.detail = std::to_string(missing) + " key(s) of " + r.table.to_string() + " missing from " +
                        r.other.to_string();
    }
    return result;
}

bool none_failed(const std::vector<gate_result>& results) {
    for (const auto& r : results) {
        if (r.failed()) return false;
    }
    return true;
}

std::string summarize(const std::vector<gate_result>& results) {
    std::vector<std::string> parts;
    parts.reserve(results.size());
    for (const auto& r : results) {
        std::string part = std::string(to_string(r.kind)) + "(" + r.target + ")=" + to_string(r.verdict);
        if (!r.passed() && !r.detail.empty()) {
            part += " [" + r.detail + "]";
        }
        parts.push_back(std::move(part));
    }
    return join(parts, ", ");
}

} // namespace repart
