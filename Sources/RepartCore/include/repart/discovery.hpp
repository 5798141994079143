#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "gateway.hpp"
#include "errors.hpp"
#include <chrono>

namespace repart {

/// Reads table metadata through the dialect's catalog queries: columns in
/// table order, the ordered primary key, explicit (non-constraint) indexes
/// and, where the backend has them, grants.
class catalog_discovery {
public:
    explicit catalog_discovery(gateway& gw, std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        : gw_(gw), timeout_(timeout) {}

    /// Throws precondition_failed when the table has no columns (absent).
    table_metadata discover(const physical_table& table, const error_context& where = {}) const;

private:
    gateway& gw_;
    std::chrono::milliseconds timeout_;
};

} // namespace repart

#endif // __cplusplus
