#include "repart/config.hpp"
#include "repart/errors.hpp"

namespace repart {

const char* to_string(router_kind kind) {
    switch (kind) {
        case router_kind::trigger: return "trigger";
        case router_kind::proxy: return "proxy";
    }
    return "unknown";
}

const char* to_string(constraint_policy policy) {
    switch (policy) {
        case constraint_policy::enable: return "enable";
        case constraint_policy::proceed: return "proceed";
        case constraint_policy::abort: return "abort";
    }
    return "unknown";
}

void configuration::validate() const {
    if (shadow_suffix.empty() || retired_suffix.empty() || bridge_suffix.empty()) {
        throw configuration_error("Shadow, retired and bridge suffixes must be non-empty");
    }
    if (shadow_suffix == retired_suffix || shadow_suffix == bridge_suffix || retired_suffix == bridge_suffix) {
        throw configuration_error("Shadow, retired and bridge suffixes must differ");
    }
    if (shadow_index_suffix.empty()) {
        throw configuration_error("Shadow index suffix must be non-empty");
    }
    if (history_partition_prefix.empty()) {
        throw configuration_error("History partition prefix must be non-empty");
    }
    if (backfill_batch_rows < 0) {
        throw configuration_error("backfill_batch_rows must not be negative");
    }
    if (parallel_degree < 1) {
        throw configuration_error("parallel_degree must be at least 1");
    }
    if (step_timeout.count() < 0 || gate_timeout.count() < 0 || validation_window.count() < 0) {
        throw configuration_error("Timeouts and the validation window must not be negative");
    }
}

} // namespace repart
