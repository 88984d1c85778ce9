#pragma once

#include "classifier/activity_state.hpp"
#include "monitor/monitor_session.hpp"
#include "platform/multiplexer.hpp"

#include <cstdint>
#include <expected>
#include <string>

class AutoResponder {
public:
    explicit AutoResponder(Multiplexer& mux);

    // Types the prompt's response into the session's pane unless this prompt
    // was already answered. Returns true if keys were sent, false if the
    // prompt was already answered, or the injection error. A failed injection
    // leaves the prompt unanswered so a later tick can retry it.
    std::expected<bool, std::string> respond(MonitorSession& session,
                                             const AwaitingPermission& prompt);

    // FNV-1a over the whitespace-collapsed prompt context.
    static uint64_t fingerprint(const AwaitingPermission& prompt);

private:
    Multiplexer& mux_;
};
