#include "repart/gateway.hpp"
#include "repart/errors.hpp"
#include "repart/log.hpp"

namespace repart {

void raise_database_error(const db_error& e, error_context ctx) {
    if (ctx.step.empty()) {
        ctx.step = e.sql();
    }
    if (dynamic_cast<const statement_timeout*>(&e)) {
        throw step_timeout_error(e.what(), std::move(ctx));
    }
    throw transient_database_error(e.what(), std::move(ctx));
}

int64_t run_step(gateway& gw, statement stmt, std::chrono::milliseconds timeout,
                 const error_context& ctx) {
    stmt.timeout = timeout;
    try {
        return gw.execute(stmt);
    } catch (const db_error& e) {
        LOG_WARN("gateway", "Step %s failed: %s", ctx.step.c_str(), e.what());
        raise_database_error(e, ctx);
    }
}

std::vector<row_t> run_query(gateway& gw, statement stmt, std::chrono::milliseconds timeout,
                             const error_context& ctx) {
    stmt.timeout = timeout;
    try {
        return gw.query(stmt);
    } catch (const db_error& e) {
        LOG_WARN("gateway", "Query for %s failed: %s", ctx.step.c_str(), e.what());
        raise_database_error(e, ctx);
    }
}

} // namespace repart
