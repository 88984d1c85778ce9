#include "platform/linux/tmux_multiplexer.hpp"

#include "frame.hpp"
#include "platform/linux/subprocess.hpp"

TmuxMultiplexer::TmuxMultiplexer(std::string binary, std::string socket,
                                 std::chrono::milliseconds timeout)
    : binary_(std::move(binary)), socket_(std::move(socket)), timeout_(timeout) {}

std::expected<std::string, std::string> TmuxMultiplexer::capture(const std::string& target) {
    return run({"capture-pane", "-p", "-t", target});
}

std::expected<void, std::string> TmuxMultiplexer::send_literal(const std::string& target,
                                                               const std::string& text) {
    auto res = run({"send-keys", "-l", "-t", target, text});
    if (!res) return std::unexpected(res.error());
    return {};
}

std::expected<std::string, std::string> TmuxMultiplexer::resolve_pane(const std::string& target) {
    auto res = run({"display-message", "-p", "-t", target, "#{pane_id}"});
    if (!res) return res;

    auto pane_id = frame::trim(*res);
    if (pane_id.empty()) {
        return std::unexpected("tmux: no pane for target " + target);
    }
    return pane_id;
}

std::expected<std::string, std::string> TmuxMultiplexer::run(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {binary_};
    if (!socket_.empty()) {
        argv.push_back("-L");
        argv.push_back(socket_);
    }
    argv.insert(argv.end(), args.begin(), args.end());

    auto res = platform::run_process(argv, timeout_);
    if (!res) return std::unexpected(res.error());

    if (res->exit_code == 127) {
        return std::unexpected("could not execute " + binary_);
    }
    if (res->exit_code != 0) {
        auto err = frame::trim(res->err);
        if (err.empty()) err = "exited with code " + std::to_string(res->exit_code);
        return std::unexpected("tmux " + args.front() + ": " + err);
    }
    return std::move(res->out);
}
