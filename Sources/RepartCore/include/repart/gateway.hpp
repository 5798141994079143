#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace repart {

class dialect;

/// One statement sent to the database. Identifiers inside `sql` are always
/// schema-qualified; the engine never relies on a current schema.
struct statement {
    std::string sql;
    std::vector<column_value_t> params;
    std::chrono::milliseconds timeout{0};  ///< 0 = no deadline

    statement() = default;
    statement(std::string text, std::vector<column_value_t> bound = {})
        : sql(std::move(text)), params(std::move(bound)) {}
};

// ============================================================================
// Gateway - the database service every component talks to
// ============================================================================
//
// Implementations must be safe to call from several threads at once: gate
// checks fan out concurrently. Failures are reported as db_error, and a
// statement interrupted by its timeout as statement_timeout.

class gateway {
public:
    virtual ~gateway() = default;

    /// Run a statement that returns no rows. Returns the number of rows
    /// the statement changed (0 for DDL).
    virtual int64_t execute(const statement& stmt) = 0;

    /// Run a query and return every row.
    virtual std::vector<row_t> query(const statement& stmt) = 0;

    /// The SQL dialect statements for this gateway must be written in.
    virtual const dialect& sql_dialect() const = 0;
};

struct error_context;

/// Execute `stmt` under `timeout`, reporting failures as engine errors
/// (transient_database_error or step_timeout_error) carrying `ctx`.
int64_t run_step(gateway& gw, statement stmt, std::chrono::milliseconds timeout,
                 const error_context& ctx);
std::vector<row_t> run_query(gateway& gw, statement stmt, std::chrono::milliseconds timeout,
                             const error_context& ctx);

} // namespace repart

#endif // __cplusplus
