#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct CliOptions {
    bool json = false;
    bool quiet = false;
    bool verbose = false;
    bool help = false;
    int history_limit = 0; // > 0: print history and exit
    int timeout_s = 0;     // 0: take it from config
    std::string config_path;
    std::string target;
};

// Returns the error message for a bad or incomplete command line.
std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]);

// Decimal integer > 0 with nothing trailing.
std::optional<int> parse_positive(std::string_view text);
