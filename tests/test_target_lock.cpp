#include <catch2/catch_test_macros.hpp>

#include "platform/linux/target_lock.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpLockPath {
    std::string path;

    TmpLockPath() {
        path = std::filesystem::temp_directory_path() /
               ("pw_test_lock_" + std::to_string(getpid()) + ".lock");
    }

    ~TmpLockPath() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("TargetLock", "[lock]") {
    TmpLockPath tmp;

    SECTION("SecondMonitorIsRefused") {
        TargetLock first;
        REQUIRE(first.acquire(tmp.path).has_value());
        REQUIRE(first.held());

        TargetLock second;
        auto res = second.acquire(tmp.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("already being monitored") != std::string::npos);
        REQUIRE_FALSE(second.held());
    }

    SECTION("ReleaseAllowsReacquire") {
        TargetLock first;
        REQUIRE(first.acquire(tmp.path).has_value());
        first.release();
        REQUIRE_FALSE(first.held());

        TargetLock second;
        REQUIRE(second.acquire(tmp.path).has_value());
    }

    SECTION("DestructorReleases") {
        {
            TargetLock scoped;
            REQUIRE(scoped.acquire(tmp.path).has_value());
        }
        TargetLock next;
        REQUIRE(next.acquire(tmp.path).has_value());
    }

    SECTION("DoubleAcquireRejected") {
        TargetLock lock;
        REQUIRE(lock.acquire(tmp.path).has_value());
        auto res = lock.acquire(tmp.path);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "lock already held");
    }

    SECTION("PathForSanitizesNames") {
        auto path = TargetLock::path_for("", "%12");
        REQUIRE(path.ends_with("/default-_12.lock"));

        auto named = TargetLock::path_for("my socket", "%3");
        REQUIRE(named.ends_with("/my_socket-_3.lock"));
        REQUIRE(named.find("panewatch") != std::string::npos);
    }
}
