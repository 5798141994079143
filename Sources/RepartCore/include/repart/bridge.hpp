#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "events.hpp"
#include "run.hpp"
#include <memory>

namespace repart {

enum class write_kind {
    insert,
    update,
    remove
};

const char* to_string(write_kind kind);

/// A write issued against the bridge. Only inserts are routed.
struct write_request {
    write_kind kind = write_kind::insert;
    std::vector<std::string> columns;
    std::vector<column_value_t> values;
};

// ============================================================================
// Write routers - force bridge inserts into the shadow table
// ============================================================================

class write_router {
public:
    virtual ~write_router() = default;

    virtual router_kind kind() const = 0;

    /// Create the routing objects. Returns their names (may be empty).
    virtual std::vector<std::string> install(const bridge& b, const error_context& where) = 0;

    /// Drop every routing object that still exists.
    virtual void uninstall(const bridge& b, const error_context& where) = 0;

    /// Route one write. UPDATE and DELETE raise unsupported_write before
    /// touching the database. Returns the rows written.
    int64_t route(const bridge& b, const write_request& request, const error_context& where);

protected:
    write_router(gateway& gw, std::chrono::milliseconds timeout) : gw_(gw), timeout_(timeout) {}

    virtual int64_t route_insert(const bridge& b, const write_request& request, const error_context& where) = 0;

    gateway& gw_;
    std::chrono::milliseconds timeout_;
};

/// INSTEAD OF triggers on the bridge view redirect inserts into the
/// shadow and reject everything else inside the database.
class trigger_write_router : public write_router {
public:
    trigger_write_router(gateway& gw, std::chrono::milliseconds timeout) : write_router(gw, timeout) {}

    router_kind kind() const override { return router_kind::trigger; }
    std::vector<std::string> install(const bridge& b, const error_context& where) override;
    void uninstall(const bridge& b, const error_context& where) override;

protected:
    int64_t route_insert(const bridge& b, const write_request& request, const error_context& where) override;
};

/// Application-level routing: inserts go straight into the shadow; no
/// database objects are installed.
class proxy_write_router : public write_router {
public:
    proxy_write_router(gateway& gw, std::chrono::milliseconds timeout) : write_router(gw, timeout) {}

    router_kind kind() const override { return router_kind::proxy; }
    std::vector<std::string> install(const bridge& b, const error_context& where) override;
    void uninstall(const bridge& b, const error_context& where) override;

protected:
    int64_t route_insert(const bridge& b, const write_request& request, const error_context& where) override;
};

std::unique_ptr<write_router> make_write_router(router_kind kind, gateway& gw, std::chrono::milliseconds timeout);

// ============================================================================
// Bridge manager
// ============================================================================

class bridge_manager {
public:
    bridge_manager(gateway& gw, const configuration& config, const event_stream& events);

    /// Requires the canonical table and the retired table to exist. Creates
    /// the deduplicating read view, then installs the write router.
    /// Stores the bridge on the run; does not change its phase.
    const bridge& open(migration_run& run);

    /// Removes the router, then the view; objects already gone are skipped.
    void close(migration_run& run);

    /// Route a write through `b`, a copy of the run's bridge taken by the
    /// caller; the run itself may be closing the bridge meanwhile.
    int64_t route(const bridge& b, const write_request& request, const error_context& where);

private:
    bridge describe(const migration_run& run) const;

    gateway& gw_;
    const configuration& config_;
    const event_stream& events_;
    gate_engine gates_;
    std::unique_ptr<write_router> router_;
};

} // namespace repart

#endif // __cplusplus
