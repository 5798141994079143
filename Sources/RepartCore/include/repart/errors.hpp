#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace repart {

// ============================================================================
// Gateway errors
// ============================================================================

/// Raised by a gateway when a statement cannot be prepared or executed.
class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, std::string sql = {})
        : std::runtime_error(msg), sql_(std::move(sql)) {}

    const std::string& sql() const { return sql_; }

private:
    std::string sql_;
};

/// The gateway interrupted a statement that outlived its timeout.
class statement_timeout : public db_error {
public:
    using db_error::db_error;
};

// ============================================================================
// Engine errors
// ============================================================================

enum class error_kind {
    configuration,
    precondition_failed,
    transient_database,
    irrecoverable_cutover,
    cancelled,
    unsupported_write
};

const char* to_string(error_kind kind);

/// Where an engine error happened. Every field may be empty when the
/// failing operation is not part of a migration run.
struct error_context {
    std::string run_id;
    std::string identity;
    std::string phase;
    std::string step;       // step, statement or gate that failed
};

class migration_error : public std::runtime_error {
public:
    migration_error(error_kind kind, const std::string& msg, error_context ctx)
        : std::runtime_error(format(kind, msg, ctx)), kind_(kind), ctx_(std::move(ctx)) {}

    error_kind kind() const { return kind_; }
    const error_context& context() const { return ctx_; }

private:
    static std::string format(error_kind kind, const std::string& msg, const error_context& ctx);

    error_kind kind_;
    error_context ctx_;
};

/// Fatal; retrying cannot help (e.g. the source has no primary key).
class configuration_error : public migration_error {
public:
    explicit configuration_error(const std::string& msg, error_context ctx = {})
        : migration_error(error_kind::configuration, msg, std::move(ctx)) {}
};

/// A gate returned FAIL or the run is not in the required phase.
/// The run did not advance.
class precondition_failed : public migration_error {
public:
    precondition_failed(const std::string& msg, error_context ctx,
                        std::vector<gate_result> gates = {})
        : migration_error(error_kind::precondition_failed, msg, std::move(ctx))
        , gates_(std::move(gates)) {}

    const std::vector<gate_result>& gates() const { return gates_; }

private:
    std::vector<gate_result> gates_;
};

/// The database failed a statement; the same step is safe to retry.
class transient_database_error : public migration_error {
public:
    transient_database_error(const std::string& msg, error_context ctx)
        : migration_error(error_kind::transient_database, msg, std::move(ctx)) {}
};

class step_timeout_error : public transient_database_error {
public:
    using transient_database_error::transient_database_error;
};

/// Both a cutover rename and its compensation failed. The run is ABORTED
/// and needs an operator.
class irrecoverable_cutover_failure : public migration_error {
public:
    irrecoverable_cutover_failure(const std::string& msg, error_context ctx)
        : migration_error(error_kind::irrecoverable_cutover, msg, std::move(ctx)) {}
};

/// A long-running step observed cancellation at a batch boundary.
class operation_cancelled : public migration_error {
public:
    operation_cancelled(const std::string& msg, error_context ctx)
        : migration_error(error_kind::cancelled, msg, std::move(ctx)) {}
};

/// UPDATE or DELETE issued through a bridge.
class unsupported_write : public migration_error {
public:
    unsupported_write(const std::string& msg, error_context ctx)
        : migration_error(error_kind::unsupported_write, msg, std::move(ctx)) {}
};

/// Wrap a gateway failure for the engine: statement_timeout becomes
/// step_timeout_error, anything else transient_database_error.
[[noreturn]] void raise_database_error(const db_error& e, error_context ctx);

} // namespace repart

#endif // __cplusplus
