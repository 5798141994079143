#include "repart/types.hpp"
#include "repart/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace repart {

// ============================================================================
// Row access
// ============================================================================

static const column_value_t* find_column(const row_t& row, const std::string& column) {
    auto it = row.find(column);
    if (it != row.end()) return &it->second;

    // Oracle reports unquoted aliases in upper case, SQLite as written.
    for (const auto& [name, value] : row) {
        if (name.size() != column.size()) continue;
        bool same = true;
        for (size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) !=
                std::tolower(static_cast<unsigned char>(column[i]))) {
                same = false;
                break;
            }
        }
        if (same) return &value;
    }
    return nullptr;
}

std::optional<int64_t> row_optional_int(const row_t& row, const std::string& column) {
    const column_value_t* value = find_column(row, column);
    if (!value) {
        throw db_error("Result row has no column '" + column + "'");
    }
    if (std::holds_alternative<std::nullptr_t>(*value)) {
        return std::nullopt;
    }
    if (std::holds_alternative<int64_t>(*value)) {
        return std::get<int64_t>(*value);
    }
    if (std::holds_alternative<double>(*value)) {
        // NUMBER columns may arrive as floating point
        return static_cast<int64_t>(std::llround(std::get<double>(*value)));
    }
    if (std::holds_alternative<std::string>(*value)) {
        const auto& s = std::get<std::string>(*value);
        try {
            return static_cast<int64_t>(std::stoll(s));
        } catch (const std::exception&) {
            throw db_error("Column '" + column + "' is not numeric: " + s);
        }
    }
    throw db_error("Column '" + column + "' holds a blob, expected a number");
}

int64_t row_int(const row_t& row, const std::string& column) {
    auto value = row_optional_int(row, column);
    return value.value_or(0);
}

std::string row_text(const row_t& row, const std::string& column) {
    const column_value_t* value = find_column(row, column);
    if (!value) {
        throw db_error("Result row has no column '" + column + "'");
    }
    return std::visit([&](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return std::string(v.begin(), v.end());
        }
    }, *value);
}

// ============================================================================
// Partition schemes
// ============================================================================

const char* to_string(partition_method method) {
    switch (method) {
        case partition_method::none: return "NONE";
        case partition_method::range: return "RANGE";
        case partition_method::interval: return "INTERVAL";
        case partition_method::list: return "LIST";
        case partition_method::hash: return "HASH";
    }
    return "UNKNOWN";
}

void partition_scheme::validate() const {
    if (method == partition_method::none) {
        if (subpartition_method != partition_method::none) {
            throw configuration_error("Subpartitioning requires a partitioned target scheme");
        }
        return;
    }
    if (columns.empty()) {
        throw configuration_error(std::string(to_string(method)) + " partitioning requires partition key columns");
    }
    if ((method == partition_method::range || method == partition_method::interval) &&
        initial_upper_bound.empty()) {
        throw configuration_error(std::string(to_string(method)) + " partitioning requires an initial upper bound");
    }
    if (method == partition_method::interval && interval.empty()) {
        throw configuration_error("INTERVAL partitioning requires an interval expression");
    }
    if (method == partition_method::hash && partition_count <= 0) {
        throw configuration_error("HASH partitioning requires a positive partition count");
    }
    if (subpartition_method != partition_method::none) {
        if (subpartition_method != partition_method::hash) {
            throw configuration_error("Only HASH subpartitioning is supported");
        }
        if (subpartition_columns.empty() || subpartition_count <= 0) {
            throw configuration_error("HASH subpartitioning requires columns and a positive count");
        }
    }
}

std::string partition_scheme::describe() const {
    if (!is_partitioned()) return "NONE";
    std::string out = std::string(to_string(method)) + "(" + join(columns, ", ") + ")";
    if (method == partition_method::hash) {
        out += " x" + std::to_string(partition_count);
    }
    if (subpartition_method != partition_method::none) {
        out += " + " + std::string(to_string(subpartition_method)) + "(" +
               join(subpartition_columns, ", ") + ") x" + std::to_string(subpartition_count);
    }
    return out;
}

// ============================================================================
// Metadata
// ============================================================================

std::vector<std::string> table_metadata::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& col : columns) {
        names.push_back(col.name);
    }
    return names;
}

bool table_metadata::has_column(const std::string& name) const {
    auto wanted = to_lower(name);
    return std::any_of(columns.begin(), columns.end(), [&](const column_def& col) {
        return to_lower(col.name) == wanted;
    });
}

// ============================================================================
// Enum names
// ============================================================================

const char* to_string(gate_kind kind) {
    switch (kind) {
        case gate_kind::existence: return "Existence";
        case gate_kind::row_reconciliation: return "RowReconciliation";
        case gate_kind::constraint_state: return "ConstraintState";
        case gate_kind::active_writers: return "ActiveWriters";
        case gate_kind::partition_distribution: return "PartitionDistribution";
        case gate_kind::key_coverage: return "KeyCoverage";
    }
    return "Unknown";
}

const char* to_string(gate_verdict verdict) {
    switch (verdict) {
        case gate_verdict::pass: return "PASS";
        case gate_verdict::warn: return "WARN";
        case gate_verdict::fail: return "FAIL";
    }
    return "UNKNOWN";
}

const char* to_string(migration_phase phase) {
    switch (phase) {
        case migration_phase::built: return "BUILT";
        case migration_phase::renamed_source: return "RENAMED_SOURCE";
        case migration_phase::cut_over: return "CUT_OVER";
        case migration_phase::bridged: return "BRIDGED";
        case migration_phase::finalized: return "FINALIZED";
        case migration_phase::aborted: return "ABORTED";
    }
    return "UNKNOWN";
}

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::configuration: return "ConfigurationError";
        case error_kind::precondition_failed: return "PreconditionFailed";
        case error_kind::transient_database: return "TransientDatabaseError";
        case error_kind::irrecoverable_cutover: return "IrrecoverableCutoverFailure";
        case error_kind::cancelled: return "Cancelled";
        case error_kind::unsupported_write: return "UnsupportedWrite";
    }
    return "Unknown";
}

std::string migration_error::format(error_kind kind, const std::string& msg, const error_context& ctx) {
    std::string out = std::string(to_string(kind)) + ": " + msg;
    std::string where;
    auto add = [&](const char* label, const std::string& value) {
        if (value.empty()) return;
        if (!where.empty()) where += ", ";
        where += label;
        where += "=";
        where += value;
    };
    add("run", ctx.run_id);
    add("table", ctx.identity);
    add("phase", ctx.phase);
    add("step", ctx.step);
    if (!where.empty()) {
        out += " [" + where + "]";
    }
    return out;
}

// ============================================================================
// String helpers
// ============================================================================

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    bool first = true;
    for (const auto& p : parts) {
        if (!first) out += sep;
        out += p;
        first = false;
    }
    return out;
}

} // namespace repart
