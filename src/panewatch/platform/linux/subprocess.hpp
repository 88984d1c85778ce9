#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace platform {

struct ProcessResult {
    int exit_code = 0;
    std::string out;
    std::string err;
};

inline constexpr std::chrono::milliseconds kDefaultProcessTimeout{5000};

// Run argv[0] (PATH lookup, no shell) and collect its stdout and stderr.
// The error side is reserved for failures to run the process at all, or to
// finish its output within `timeout` (the process is then killed and reaped);
// a non-zero exit is reported through exit_code. Exit code 127 means exec failed.
std::expected<ProcessResult, std::string> run_process(
    const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout = kDefaultProcessTimeout);

} // namespace platform
