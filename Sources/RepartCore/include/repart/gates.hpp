#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "gateway.hpp"
#include "errors.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace repart {

/// What to check. Build with the named constructors.
struct gate_request {
    gate_kind kind = gate_kind::existence;
    physical_table table;           // subject (source, reference or staging)
    physical_table other;           // target of reconciliation / coverage
    bool must_exist = true;
    int64_t expected = 0;
    std::string pattern;            // active_writers
    std::vector<std::string> key;   // key_coverage

    static gate_request existence(physical_table table, bool must_exist);
    static gate_request row_reconciliation(physical_table source, physical_table target, int64_t expected);
    static gate_request constraint_state(physical_table table);
    static gate_request active_writers(std::string schema, std::string pattern);
    static gate_request partition_distribution(physical_table table);
    static gate_request key_coverage(physical_table reference, physical_table target,
                                     std::vector<std::string> key);
};

// ============================================================================
// Gate engine - read-only checks gating every transition
// ============================================================================
//
// Gates never mutate and are safe to run any number of times, including
// concurrently. A gate whose own query fails raises
// transient_database_error (or step_timeout_error) naming the gate; it is
// never reported as PASS.

class gate_engine {
public:
    explicit gate_engine(gateway& gw, std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        : gw_(gw), timeout_(timeout) {}

    gate_result run(const gate_request& request, const error_context& where = {}) const;

    /// Runs every request on its own task and joins all of them before
    /// returning. If any gate raised, the first error (in request order)
    /// is rethrown after the join.
    std::vector<gate_result> run_all(const std::vector<gate_request>& requests,
                                     const error_context& where = {}) const;

private:
    gate_result existence(const gate_request& r, const error_context& where) const;
    gate_result row_reconciliation(const gate_request& r, const error_context& where) const;
    gate_result constraint_state(const gate_request& r, const error_context& where) const;
    gate_result active_writers(const gate_request& r, const error_context& where) const;
    gate_result partition_distribution(const gate_request& r, const error_context& where) const;
    gate_result key_coverage(const gate_request& r, const error_context& where) const;

    int64_t count(const statement& stmt, const error_context& where) const;

    gateway& gw_;
    std::chrono::milliseconds timeout_;
};

/// True when no result is FAIL.
bool none_failed(const std::vector<gate_result>& results);

/// One-line summary, e.g. "Existence(main.orders)=PASS, ...".
std::string summarize(const std::vector<gate_result>& results);

} // namespace repart

#endif // __cplusplus
