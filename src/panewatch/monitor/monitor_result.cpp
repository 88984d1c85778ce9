#include "monitor_result.hpp"

const char* to_string(MonitorStatus status) {
    switch (status) {
        case MonitorStatus::Running: return "running";
        case MonitorStatus::Succeeded: return "succeeded";
        case MonitorStatus::TimedOut: return "timed-out";
        case MonitorStatus::Failed: return "failed";
        case MonitorStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

int exit_code(MonitorStatus status) {
    switch (status) {
        case MonitorStatus::Succeeded: return 0;
        case MonitorStatus::TimedOut: return 2;
        case MonitorStatus::Failed: return 3;
        case MonitorStatus::Cancelled: return 4;
        case MonitorStatus::Running: break;
    }
    return 1;
}

std::string render_events(const MonitorResult& result) {
    std::string out;
    for (const auto& e : result.events) {
        out += format_event(e);
        out += '\n';
    }
    return out;
}

nlohmann::json to_json(const MonitorResult& result) {
    nlohmann::json events = nlohmann::json::array();
    for (const auto& e : result.events) {
        events.push_back({
            {"elapsed", std::chrono::duration<double>(e.elapsed).count()},
            {"kind", to_string(e.kind)},
            {"detail", e.detail},
        });
    }

    return {
        {"status", to_string(result.status)},
        {"target", result.target},
        {"elapsed", std::chrono::duration<double>(result.elapsed).count()},
        {"injections", result.injections},
        {"events", std::move(events)},
        {"final_text", result.final_text},
    };
}
