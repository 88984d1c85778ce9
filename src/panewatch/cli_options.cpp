#include "cli_options.hpp"

#include <charconv>

std::optional<int> parse_positive(std::string_view text) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

std::expected<CliOptions, std::string> parse_args(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--json" || arg == "-j") {
            opts.json = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--timeout" || arg == "-t") {
            if (i + 1 >= argc) return std::unexpected("Missing value for " + arg);
            auto seconds = parse_positive(argv[++i]);
            if (!seconds) {
                return std::unexpected("Invalid timeout: " + std::string(argv[i]) +
                                       " (expected a positive number of seconds)");
            }
            opts.timeout_s = *seconds;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected("Missing value for " + arg);
            opts.config_path = argv[++i];
        } else if (arg == "--history") {
            opts.history_limit = 10;
            if (i + 1 < argc) {
                if (auto n = parse_positive(argv[i + 1])) {
                    opts.history_limit = *n;
                    i++;
                }
            }
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (!arg.starts_with("-") && opts.target.empty()) {
            opts.target = arg;
        } else {
            return std::unexpected("Unknown argument: " + arg);
        }
    }

    return opts;
}
