#include "auto_responder.hpp"

#include "frame.hpp"

AutoResponder::AutoResponder(Multiplexer& mux)
    : mux_(mux) {}

std::expected<bool, std::string> AutoResponder::respond(MonitorSession& session,
                                                        const AwaitingPermission& prompt) {
    auto fp = fingerprint(prompt);
    if (session.answered(fp)) return false;

    std::string keys = prompt.response;
    if (prompt.submit) keys += '\r';

    auto res = mux_.send_literal(session.target(), keys);
    if (!res) return std::unexpected(res.error());

    session.mark_answered(fp);
    return true;
}

uint64_t AutoResponder::fingerprint(const AwaitingPermission& prompt) {
    const std::string& source = prompt.context.empty() ? prompt.prompt : prompt.context;
    auto text = frame::collapse_whitespace(source);

    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}
