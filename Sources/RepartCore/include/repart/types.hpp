#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>
#include <unordered_map>

namespace repart {

// Timestamp type (system clock, rendered as milliseconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// UUID type, used as the identity of a migration run
struct uuid_t {
    std::array<uint8_t, 16> bytes{};

    uuid_t() = default;

    explicit uuid_t(const std::array<uint8_t, 16>& b) : bytes(b) {}

    // Convert to lowercase hyphenated string (e.g., "550e8400-e29b-41d4-a716-446655440000")
    std::string to_string() const {
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    // Generate a random UUID (v4)
    static uuid_t generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dis;

        uuid_t result;
        uint64_t a = dis(gen);
        uint64_t b = dis(gen);

        for (int i = 0; i < 8; ++i) {
            result.bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
            result.bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
        }

        // Set version (4) and variant (RFC 4122)
        result.bytes[6] = (result.bytes[6] & 0x0F) | 0x40;
        result.bytes[8] = (result.bytes[8] & 0x3F) | 0x80;

        return result;
    }

    bool operator==(const uuid_t& other) const { return bytes == other.bytes; }
    bool operator!=(const uuid_t& other) const { return bytes != other.bytes; }
};

// Values bound to and read from statements
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// One result row, keyed by column name as the server reports it
using row_t = std::unordered_map<std::string, column_value_t>;

// Case-insensitive column lookup. Throws db_error if the column is missing
// or does not hold a value of the requested shape.
int64_t row_int(const row_t& row, const std::string& column);
std::string row_text(const row_t& row, const std::string& column);
std::optional<int64_t> row_optional_int(const row_t& row, const std::string& column);

// ============================================================================
// Tables and partitioning
// ============================================================================

enum class partition_method {
    none,
    range,
    interval,
    list,
    hash
};

const char* to_string(partition_method method);

struct partition_scheme {
    partition_method method = partition_method::none;
    std::vector<std::string> columns;           // partition key
    std::string interval;                       // e.g. NUMTOYMINTERVAL(1, 'MONTH')
    std::string initial_upper_bound;            // e.g. TO_DATE('2020-01-01', 'YYYY-MM-DD')
    int partition_count = 0;                    // hash partitions
    partition_method subpartition_method = partition_method::none;
    std::vector<std::string> subpartition_columns;
    int subpartition_count = 0;
    std::string tablespace;

    bool is_partitioned() const { return method != partition_method::none; }

    // Throws configuration_error when the scheme is incomplete.
    void validate() const;

    // Human-readable summary, e.g. "INTERVAL(created_at) + HASH(customer_id) x8"
    std::string describe() const;
};

/// The name external clients use. Never changes during a migration.
struct table_identity {
    std::string schema;
    std::string logical_name;

    std::string to_string() const { return schema + "." + logical_name; }
};

/// A concrete table instance.
struct physical_table {
    std::string schema;
    std::string name;
    partition_scheme scheme;

    std::string to_string() const { return schema + "." + name; }
};

/// One partition's worth of rows.
struct partition_slice {
    std::string owning_table;
    std::string name;
    int64_t ordinal_position = 0;
    std::string upper_bound;
    int64_t estimated_row_count = 0;
};

/// The three tables of one archival relay. Owns nothing beyond the names.
struct archive_cycle {
    physical_table active;
    physical_table staging;
    physical_table history;
};

// ============================================================================
// Discovered table metadata
// ============================================================================

struct column_def {
    std::string name;
    std::string sql_type;
    bool nullable = true;
};

struct index_def {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

struct grant_def {
    std::string grantee;
    std::string privilege;
    bool grantable = false;
};

struct table_metadata {
    std::vector<column_def> columns;
    std::vector<std::string> primary_key;  // ordered
    std::vector<index_def> indexes;        // explicit indexes only
    std::vector<grant_def> grants;

    std::vector<std::string> column_names() const;
    bool has_column(const std::string& name) const;
};

// ============================================================================
// Gates
// ============================================================================

enum class gate_kind {
    existence,
    row_reconciliation,
    constraint_state,
    active_writers,
    partition_distribution,
    key_coverage
};

enum class gate_verdict {
    pass,
    warn,
    fail
};

const char* to_string(gate_kind kind);
const char* to_string(gate_verdict verdict);

struct gate_result {
    gate_kind kind = gate_kind::existence;
    std::string target;
    gate_verdict verdict = gate_verdict::pass;
    std::string detail;
    int64_t observed = -1;         // primary count the gate looked at
    int64_t reference = -1;        // secondary count, when the gate has one
    std::vector<partition_slice> slices;

    bool passed() const { return verdict == gate_verdict::pass; }
    bool failed() const { return verdict == gate_verdict::fail; }
};

// ============================================================================
// Migration state
// ============================================================================

enum class migration_phase {
    built,
    renamed_source,
    cut_over,
    bridged,
    finalized,
    aborted
};

const char* to_string(migration_phase phase);

// String helpers shared by the dialects
std::string to_upper(std::string s);
std::string to_lower(std::string s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace repart

#endif // __cplusplus
