#include <catch2/catch_test_macros.hpp>

#include "storage/run_history.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("pw_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

MonitorResult make_result(const std::string& target, MonitorStatus status = MonitorStatus::Succeeded) {
    MonitorResult r;
    r.status = status;
    r.target = target;
    r.final_text = "$ ";
    r.elapsed = 2500ms;
    r.injections = 2;
    r.events = {
        {0ms, EventKind::Progress, "✻ Thinking…"},
        {1000ms, EventKind::PermissionRequest, "\"Allow?\" -> sent \"y\""},
        {2500ms, EventKind::IdleDetected, "no change for 3 ticks"},
    };
    return r;
}

} // namespace

TEST_CASE("RunHistory", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(make_result("%4", MonitorStatus::TimedOut)));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].target == "%4");
        REQUIRE(entries[0].status == "timed-out");
        REQUIRE(entries[0].elapsed == 2.5);
        REQUIRE(entries[0].injections == 2);
        REQUIRE(entries[0].event_count == 3);
        REQUIRE(entries[0].final_text == "$ ");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(make_result("%" + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(make_result("%1")));
        REQUIRE(db.insert(make_result("%2")));
        REQUIRE(db.insert(make_result("%3")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].target == "%3");
        REQUIRE(entries[1].target == "%2");
        REQUIRE(entries[2].target == "%1");
    }

    SECTION("FinalTextTailOnly") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        auto r = make_result("%1");
        r.final_text = std::string(5000, 'x') + "END";
        REQUIRE(db.insert(r));

        auto entries = db.recent(1);
        REQUIRE(entries[0].final_text.size() == RunHistory::kFinalTextTail);
        REQUIRE(entries[0].final_text.ends_with("END"));
    }

    SECTION("FinalTextTailKeepsUtf8Whole") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        // 1500 two-byte characters then "x": the byte cut lands mid-character
        std::string text;
        for (int i = 0; i < 1500; ++i) text += "é";
        text += "x";
        auto r = make_result("%1");
        r.final_text = text;
        REQUIRE(db.insert(r));

        auto tail = db.recent(1)[0].final_text;
        REQUIRE(tail.size() == RunHistory::kFinalTextTail - 1);
        REQUIRE((static_cast<unsigned char>(tail.front()) & 0xC0) != 0x80);
        REQUIRE(tail.starts_with("é"));
        REQUIRE(tail.ends_with("éx"));
    }

    SECTION("EmptyFinalText") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        auto r = make_result("%1", MonitorStatus::Failed);
        r.final_text.clear();
        REQUIRE(db.insert(r));

        auto entries = db.recent(1);
        REQUIRE(entries[0].final_text.empty());
        REQUIRE(entries[0].status == "failed");
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(make_result("%1")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("InsertWithoutOpenFails") {
        RunHistory db;
        REQUIRE_FALSE(db.insert(make_result("%1")));
        REQUIRE(db.recent().empty());
    }
}
