#include <catch2/catch_test_macros.hpp>

#include "cli_options.hpp"

#include <vector>

namespace {

std::expected<CliOptions, std::string> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "panewatch");
    return parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {

    SECTION("TargetAndFlags") {
        auto opts = parse({"-j", "-v", "--timeout", "90", "-c", "/tmp/pw.json", "work:1.0"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->json);
        REQUIRE(opts->verbose);
        REQUIRE_FALSE(opts->quiet);
        REQUIRE(opts->timeout_s == 90);
        REQUIRE(opts->config_path == "/tmp/pw.json");
        REQUIRE(opts->target == "work:1.0");
    }

    SECTION("TimeoutDefaultsToConfig") {
        auto opts = parse({"%3"});
        REQUIRE(opts.has_value());
        REQUIRE(opts->timeout_s == 0);
    }

    SECTION("InvalidTimeoutRejected") {
        for (const char* bad : {"abc", "0", "-5", "10s", ""}) {
            auto opts = parse({"-t", bad, "%3"});
            REQUIRE_FALSE(opts.has_value());
            REQUIRE(opts.error().starts_with("Invalid timeout"));
        }
    }

    SECTION("MissingValue") {
        auto opts = parse({"%3", "--timeout"});
        REQUIRE_FALSE(opts.has_value());
        REQUIRE(opts.error() == "Missing value for --timeout");
    }

    SECTION("History") {
        auto plain = parse({"--history"});
        REQUIRE(plain.has_value());
        REQUIRE(plain->history_limit == 10);

        auto counted = parse({"--history", "25"});
        REQUIRE(counted.has_value());
        REQUIRE(counted->history_limit == 25);
        REQUIRE(counted->target.empty());
    }

    SECTION("UnknownArgument") {
        REQUIRE_FALSE(parse({"--bogus"}).has_value());
        REQUIRE_FALSE(parse({"%1", "%2"}).has_value());
    }

    SECTION("ParsePositive") {
        REQUIRE(parse_positive("600") == 600);
        REQUIRE_FALSE(parse_positive("99999999999"));
        REQUIRE_FALSE(parse_positive(" 5"));
    }
}
