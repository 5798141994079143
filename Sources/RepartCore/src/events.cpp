#include "repart/events.hpp"
#include "repart/log.hpp"
#include <nlohmann/json.hpp>
#include <memory>

using json = nlohmann::json;

namespace repart {

const char* to_string(event_outcome outcome) {
    switch (outcome) {
        case event_outcome::started: return "started";
        case event_outcome::succeeded: return "succeeded";
        case event_outcome::warned: return "warned";
        case event_outcome::failed: return "failed";
        case event_outcome::compensated: return "compensated";
    }
    return "unknown";
}

static json gate_to_json(const gate_result& gate) {
    json j;
    j["kind"] = to_string(gate.kind);
    j["target"] = gate.target;
    j["verdict"] = to_string(gate.verdict);
    j["detail"] = gate.detail;
    if (gate.observed >= 0) j["observed"] = gate.observed;
    if (gate.reference >= 0) j["reference"] = gate.reference;
    if (!gate.slices.empty()) {
        json slices = json::array();
        for (const auto& slice : gate.slices) {
            slices.push_back({
                {"name", slice.name},
                {"position", slice.ordinal_position},
                {"upperBound", slice.upper_bound},
                {"rows", slice.estimated_row_count}
            });
        }
        j["slices"] = slices;
    }
    return j;
}

std::string migration_event::to_json() const {
    json j;
    j["runId"] = run_id;
    j["identity"] = identity;
    j["component"] = component;
    j["step"] = step;
    j["phase"] = phase;
    j["outcome"] = to_string(outcome);
    j["at"] = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
    j["detail"] = detail;

    json gates_array = json::array();
    for (const auto& gate : gates) {
        gates_array.push_back(gate_to_json(gate));
    }
    j["gates"] = gates_array;

    return j.dump();
}

migration_event make_event(const error_context& where, std::string component, std::string step,
                           event_outcome outcome, std::string detail) {
    migration_event event;
    event.run_id = where.run_id;
    event.identity = where.identity;
    event.phase = where.phase;
    event.component = std::move(component);
    event.step = std::move(step);
    event.outcome = outcome;
    event.detail = std::move(detail);
    return event;
}

void event_stream::subscribe(event_sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void event_stream::emit(const migration_event& event) const {
    std::vector<event_sink> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink(event);
    }
}

event_sink json_lines_sink(std::ostream& out) {
    auto write_mutex = std::make_shared<std::mutex>();
    return [&out, write_mutex](const migration_event& event) {
        std::lock_guard<std::mutex> lock(*write_mutex);
        out << event.to_json() << '\n';
        out.flush();
    };
}

event_sink log_event_sink() {
    return [](const migration_event& event) {
        const char* outcome = to_string(event.outcome);
        switch (event.outcome) {
            case event_outcome::failed:
                LOG_ERROR(event.component.c_str(), "%s %s [%s] %s", event.step.c_str(), outcome,
                          event.identity.c_str(), event.detail.c_str());
                break;
            case event_outcome::warned:
            case event_outcome::compensated:
                LOG_WARN(event.component.c_str(), "%s %s [%s] %s", event.step.c_str(), outcome,
                         event.identity.c_str(), event.detail.c_str());
                break;
            default:
                LOG_INFO(event.component.c_str(), "%s %s [%s] %s", event.step.c_str(), outcome,
                         event.identity.c_str(), event.detail.c_str());
                break;
        }
        for (const auto& gate : event.gates) {
            if (!gate.passed()) {
                LOG_WARN("gates", "%s(%s) %s: %s", to_string(gate.kind), gate.target.c_str(),
                         to_string(gate.verdict), gate.detail.c_str());
            }
        }
    };
}

} // namespace repart
