#include <catch2/catch_test_macros.hpp>

#include "frame.hpp"

#include <string>
#include <vector>

using Lines = std::vector<std::string>;

TEST_CASE("Frame helpers", "[frame]") {

    SECTION("SplitLines") {
        REQUIRE(frame::split_lines("a\nb\r\nc") == Lines{"a", "b", "c"});
        REQUIRE(frame::split_lines("a\n") == Lines{"a"});
        REQUIRE(frame::split_lines("") == Lines{});
        REQUIRE(frame::split_lines("\n\n") == Lines{"", ""});
    }

    SECTION("StripAnsi") {
        REQUIRE(frame::strip_ansi("\033[1;32mgreen\033[0m text") == "green text");
        REQUIRE(frame::strip_ansi("\033]0;title\007after") == "after");
        REQUIRE(frame::strip_ansi("\033]8;;http://x\033\\link") == "link");
        REQUIRE(frame::strip_ansi("plain") == "plain");
    }

    SECTION("Unbox") {
        REQUIRE(frame::unbox("│ Do you want to proceed?   │") == "Do you want to proceed?");
        REQUIRE(frame::unbox("  │ ❯ 1. Yes") == "❯ 1. Yes");
        REQUIRE(frame::unbox("no border") == "no border");
    }

    SECTION("CollapseWhitespace") {
        REQUIRE(frame::collapse_whitespace("  a \t b\n\nc  ") == "a b c");
        REQUIRE(frame::collapse_whitespace("   ").empty());
    }

    SECTION("LettersOnly") {
        REQUIRE(frame::letters_only("✻ Thinking… (12s)") == "Thinking s");
        REQUIRE(frame::letters_only("Elapsed: 00:17") == "Elapsed");
        REQUIRE(frame::letters_only("rm -rf build") == "rm rf build");
        REQUIRE(frame::letters_only("42%").empty());
    }

    SECTION("TrailingLinesSkipsBlankPadding") {
        // capture-pane pads the pane height with empty rows
        std::string text = "one\ntwo\n\nthree\n   \n\n\n\n";
        REQUIRE(frame::trailing_lines(text, 2) == Lines{"two", "three"});
        REQUIRE(frame::trailing_lines(text, 10) == Lines{"one", "two", "three"});
        REQUIRE(frame::trailing_lines(text, 0).empty());
    }

    SECTION("TrailingLinesStripsEscapes") {
        REQUIRE(frame::trailing_lines("\033[31mred\033[0m\n", 1) == Lines{"red"});
    }
}
