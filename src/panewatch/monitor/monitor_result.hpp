#pragma once

#include "monitor/event_log.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class MonitorStatus { Running, Succeeded, TimedOut, Failed, Cancelled };

const char* to_string(MonitorStatus status);

// Process exit code for the frontend: 0 succeeded, 2 timed out, 3 failed, 4 cancelled.
int exit_code(MonitorStatus status);

struct MonitorResult {
    MonitorStatus status = MonitorStatus::Running;
    std::string target;
    std::string final_text;
    std::vector<MonitorEvent> events;
    std::chrono::milliseconds elapsed{0};
    int injections = 0;
};

// Event lines, one per line, each prefixed with elapsed seconds.
std::string render_events(const MonitorResult& result);

nlohmann::json to_json(const MonitorResult& result);
