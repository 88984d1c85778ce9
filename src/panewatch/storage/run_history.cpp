#include "run_history.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

RunHistory::RunHistory() = default;

RunHistory::~RunHistory() {
    close();
}

bool RunHistory::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Several monitors may finish at once
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO runs (target, status, elapsed, injections, event_count, final_text) "
        "VALUES (?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, target, status, elapsed, injections, event_count, final_text "
        "FROM runs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void RunHistory::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool RunHistory::insert(const MonitorResult& result) {
    if (!insert_stmt_) return false;

    std::string tail = result.final_text;
    if (tail.size() > kFinalTextTail) {
        // Start on a character boundary, not inside a UTF-8 sequence
        size_t cut = tail.size() - kFinalTextTail;
        while (cut < tail.size() && (static_cast<unsigned char>(tail[cut]) & 0xC0) == 0x80) cut++;
        tail.erase(0, cut);
    }

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, result.target.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, to_string(result.status), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 3, std::chrono::duration<double>(result.elapsed).count());
    sqlite3_bind_int(insert_stmt_, 4, result.injections);
    sqlite3_bind_int(insert_stmt_, 5, static_cast<int>(result.events.size()));
    if (tail.empty()) sqlite3_bind_null(insert_stmt_, 6);
    else sqlite3_bind_text(insert_stmt_, 6, tail.c_str(), static_cast<int>(tail.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<RunEntry> RunHistory::recent(int limit) {
    std::vector<RunEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RunEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.target = get_text(recent_stmt_, 2);
        e.status = get_text(recent_stmt_, 3);
        e.elapsed = sqlite3_column_double(recent_stmt_, 4);
        e.injections = sqlite3_column_int(recent_stmt_, 5);
        e.event_count = sqlite3_column_int(recent_stmt_, 6);
        e.final_text = get_text(recent_stmt_, 7);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool RunHistory::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            target TEXT NOT NULL,
            status TEXT NOT NULL,
            elapsed REAL,
            injections INTEGER,
            event_count INTEGER,
            final_text TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
