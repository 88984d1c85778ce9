#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

enum class EventKind { Progress, PermissionRequest, IdleDetected, CaptureError };

const char* to_string(EventKind kind);

struct MonitorEvent {
    std::chrono::milliseconds elapsed{0};
    EventKind kind = EventKind::Progress;
    std::string detail;
};

// "[  12.5s] permission-request: Do you want to proceed? -> sent "1""
std::string format_event(const MonitorEvent& event);

class EventLog {
public:
    void add(std::chrono::milliseconds elapsed, EventKind kind, std::string detail);

    std::vector<MonitorEvent> take() { return std::move(events_); }

    // Also print each event to stderr as it is added.
    void set_echo(bool echo) { echo_ = echo; }

private:
    std::vector<MonitorEvent> events_;
    bool echo_ = false;
};
