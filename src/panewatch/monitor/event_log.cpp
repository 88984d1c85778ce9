#include "event_log.hpp"

#include <format>
#include <print>

const char* to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Progress: return "progress";
        case EventKind::PermissionRequest: return "permission-request";
        case EventKind::IdleDetected: return "idle-detected";
        case EventKind::CaptureError: return "capture-error";
    }
    return "unknown";
}

std::string format_event(const MonitorEvent& event) {
    double seconds = std::chrono::duration<double>(event.elapsed).count();
    return std::format("[{:6.1f}s] {}: {}", seconds, to_string(event.kind), event.detail);
}

void EventLog::add(std::chrono::milliseconds elapsed, EventKind kind, std::string detail) {
    events_.push_back({elapsed, kind, std::move(detail)});
    if (echo_) {
        std::println(stderr, "[panewatch] {}", format_event(events_.back()));
    }
}
