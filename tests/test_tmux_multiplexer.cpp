#include <catch2/catch_test_macros.hpp>

#include "platform/linux/tmux_multiplexer.hpp"

// `echo` stands in for tmux so the exact command line can be checked.
TEST_CASE("TmuxMultiplexer", "[tmux]") {

    SECTION("CaptureCommandLine") {
        TmuxMultiplexer mux("echo");
        auto res = mux.capture("%1");
        REQUIRE(res.has_value());
        REQUIRE(*res == "capture-pane -p -t %1\n");
    }

    SECTION("SocketSelectsServer") {
        TmuxMultiplexer mux("echo", "agents");
        REQUIRE(mux.socket() == "agents");
        auto res = mux.capture("work:0.1");
        REQUIRE(res.has_value());
        REQUIRE(*res == "-L agents capture-pane -p -t work:0.1\n");
    }

    SECTION("SendLiteral") {
        TmuxMultiplexer mux("echo");
        REQUIRE(mux.send_literal("%1", "y\r").has_value());
    }

    SECTION("ResolvePaneTrimsOutput") {
        TmuxMultiplexer mux("echo");
        auto res = mux.resolve_pane("work:0");
        REQUIRE(res.has_value());
        REQUIRE(*res == "display-message -p -t work:0 #{pane_id}");
    }

    SECTION("ResolvePaneEmptyOutput") {
        TmuxMultiplexer mux("true");
        auto res = mux.resolve_pane("nowhere");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "tmux: no pane for target nowhere");
    }

    SECTION("NonZeroExit") {
        TmuxMultiplexer mux("false");
        auto res = mux.send_literal("%1", "1");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "tmux send-keys: exited with code 1");
    }

    SECTION("MissingBinary") {
        TmuxMultiplexer mux("pw-test-no-such-tmux");
        auto res = mux.capture("%1");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "could not execute pw-test-no-such-tmux");
    }
}
