#pragma once

#include <expected>
#include <string>

// The terminal multiplexer owning the watched pane. Every call is a blocking
// round-trip that may fail on its own; callers decide whether to retry.
class Multiplexer {
public:
    virtual ~Multiplexer() = default;

    // Visible text of the pane.
    virtual std::expected<std::string, std::string> capture(const std::string& target) = 0;

    // Type `text` into the pane as-is, without key-name lookup.
    virtual std::expected<void, std::string> send_literal(const std::string& target,
                                                          const std::string& text) = 0;

    // Stable pane id (e.g. "%3") for any target spelling ("work:1.0", "%3", ...).
    virtual std::expected<std::string, std::string> resolve_pane(const std::string& target) = 0;
};
