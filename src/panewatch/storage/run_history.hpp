#pragma once

#include "monitor/monitor_result.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunEntry {
    int64_t id;
    std::string timestamp;
    std::string target;
    std::string status;
    double elapsed;
    int injections;
    int event_count;
    std::string final_text; // tail only
};

class RunHistory {
public:
    // Bytes of final text kept per run.
    static constexpr size_t kFinalTextTail = 2000;

    RunHistory();
    ~RunHistory();

    RunHistory(const RunHistory&) = delete;
    RunHistory& operator=(const RunHistory&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const MonitorResult& result);

    std::vector<RunEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
