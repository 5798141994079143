#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "gates.hpp"
#include "events.hpp"
#include <mutex>

namespace repart {

struct exchange_report {
    partition_slice slice;              // the slice taken from the active table
    std::string history_partition;      // the partition created in history
    int64_t rows_moved = 0;
};

// ============================================================================
// Partition exchange engine - active -> staging -> history relay
// ============================================================================
//
// Moves the oldest slice of `active` into a new partition of `history`
// without copying rows. If the first exchange fails nothing has moved. A
// later failure leaves the rows in staging; the next cycle's staging
// precondition then FAILs instead of risking duplicate or lost rows.

class exchange_engine {
public:
    exchange_engine(gateway& gw, const configuration& config, const event_stream& events);

    exchange_report swap_oldest_slice(const archive_cycle& cycle);

    /// Name for a new history partition, e.g. "P_HIST_1700000000000".
    /// Strictly increasing across calls on one engine.
    std::string next_history_partition(timestamp_t at);

private:
    gateway& gw_;
    const configuration& config_;
    const event_stream& events_;
    gate_engine gates_;

    std::mutex mutex_;
    int64_t last_history_ms_ = 0;
};

} // namespace repart

#endif // __cplusplus
