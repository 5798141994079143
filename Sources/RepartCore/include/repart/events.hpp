#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "errors.hpp"
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace repart {

enum class event_outcome {
    started,
    succeeded,
    warned,
    failed,
    compensated
};

const char* to_string(event_outcome outcome);

/// One step of a migration or archive cycle, as reported to operators.
struct migration_event {
    std::string run_id;
    std::string identity;
    std::string component;      // "gates", "shadow", "bridge", "cutover", ...
    std::string step;
    std::string phase;          // phase after the step, empty outside a run
    event_outcome outcome = event_outcome::succeeded;
    timestamp_t at = std::chrono::system_clock::now();
    std::string detail;
    std::vector<gate_result> gates;

    // Serialize to JSON (one line, no trailing newline)
    std::string to_json() const;
};

/// Build an event located by `where` (run id, identity and phase).
migration_event make_event(const error_context& where, std::string component, std::string step,
                           event_outcome outcome, std::string detail = {});

using event_sink = std::function<void(const migration_event&)>;

// ============================================================================
// Event stream - fans every event out to the subscribed sinks
// ============================================================================
//
// Orchestration code only ever emits; nothing reads events back to make a
// decision. Sinks are called synchronously on the emitting thread.

class event_stream {
public:
    void subscribe(event_sink sink);
    void emit(const migration_event& event) const;

private:
    mutable std::mutex mutex_;
    std::vector<event_sink> sinks_;
};

/// Writes each event as one JSON line.
event_sink json_lines_sink(std::ostream& out);

/// Renders events through the LOG_* macros (failures as errors, warnings
/// and compensations as warnings, the rest as info).
event_sink log_event_sink();

} // namespace repart

#endif // __cplusplus
