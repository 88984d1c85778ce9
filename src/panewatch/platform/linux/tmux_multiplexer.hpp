#pragma once

#include "platform/multiplexer.hpp"

#include <chrono>
#include <string>
#include <vector>

class TmuxMultiplexer : public Multiplexer {
public:
    // `socket` selects a named server (tmux -L); empty uses the default one.
    // A call that has not finished after `timeout` is killed and fails.
    explicit TmuxMultiplexer(std::string binary = "tmux", std::string socket = {},
                             std::chrono::milliseconds timeout = std::chrono::seconds(5));

    std::expected<std::string, std::string> capture(const std::string& target) override;
    std::expected<void, std::string> send_literal(const std::string& target,
                                                  const std::string& text) override;
    std::expected<std::string, std::string> resolve_pane(const std::string& target) override;

    const std::string& socket() const { return socket_; }

private:
    // Runs tmux with `args`; returns stdout, or an error built from stderr on non-zero exit.
    std::expected<std::string, std::string> run(const std::vector<std::string>& args);

    std::string binary_;
    std::string socket_;
    std::chrono::milliseconds timeout_;
};
