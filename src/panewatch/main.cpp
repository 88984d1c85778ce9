#include "classifier/activity_classifier.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "monitor/monitor_result.hpp"
#include "monitor/pane_monitor.hpp"
#include "platform/linux/signal_watcher.hpp"
#include "platform/linux/steady_timer.hpp"
#include "platform/linux/target_lock.hpp"
#include "platform/linux/tmux_multiplexer.hpp"
#include "platform/platform_paths.hpp"
#include "storage/run_history.hpp"

#include <chrono>
#include <print>
#include <stop_token>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options] <target>", prog);
    std::println("Watch a tmux pane until it goes quiet, answering permission prompts.");
    std::println("Options:");
    std::println("  -t, --timeout SECONDS   Give up after this long (default from config)");
    std::println("  -j, --json              Print the result as JSON");
    std::println("  -q, --quiet             Print only the final pane text");
    std::println("  -v, --verbose           Log events to stderr while monitoring");
    std::println("  -c, --config PATH       Config file path");
    std::println("      --history [N]       Show the last N monitor runs and exit");
    std::println("  -h, --help              Show this help");
}

static std::string history_path() {
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/history.db";
    return platform::runtime_dir() + "/history.db";
}

static int print_history(int limit) {
    RunHistory history;
    if (!history.open(history_path())) return 1;

    for (auto& e : history.recent(limit)) {
        std::println("[{}] {} {} ({:.1f}s, {} responses, {} events)", e.timestamp, e.target,
                     e.status, e.elapsed, e.injections, e.event_count);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "{}", parsed.error());
        usage(argv[0]);
        return 1;
    }
    const auto& opts = *parsed;

    if (opts.help) {
        usage(argv[0]);
        return 0;
    }

    if (opts.history_limit > 0) {
        return print_history(opts.history_limit);
    }

    if (opts.target.empty()) {
        usage(argv[0]);
        return 1;
    }

    // Load config
    Config config;
    if (!opts.config_path.empty()) {
        config = Config::load(opts.config_path);
    } else {
        config = Config::load_default();
    }
    std::chrono::seconds timeout(config.monitor.timeout_s);
    if (opts.timeout_s > 0) timeout = std::chrono::seconds(opts.timeout_s);

    // Block SIGINT/SIGTERM before any other thread exists
    std::stop_source stop;
    SignalWatcher signals(stop);
    if (!signals.start()) {
        std::println(stderr, "Failed to install signal handling");
        return 1;
    }

    TmuxMultiplexer tmux(config.tmux.binary, config.tmux.socket,
                         config.tmux.command_timeout());

    auto pane = tmux.resolve_pane(opts.target);
    if (!pane) {
        std::println(stderr, "Cannot resolve target {}: {}", opts.target, pane.error());
        return 1;
    }

    TargetLock lock;
    if (auto res = lock.acquire(TargetLock::path_for(tmux.socket(), *pane)); !res) {
        std::println(stderr, "Cannot monitor {}: {}", opts.target, res.error());
        return 1;
    }

    if (opts.verbose) {
        std::println(stderr, "[panewatch] Target {} resolved to pane {}", opts.target, *pane);
    }

    SteadyTimer timer;
    PaneMonitor monitor(tmux, timer, config.monitor, ActivityClassifier::from_config(config),
                        opts.verbose);
    auto result = monitor.run(*pane, timeout, stop.get_token());
    lock.release();

    if (config.history.enabled) {
        RunHistory history;
        if (!history.open(history_path()) || !history.insert(result)) {
            std::println(stderr, "Warning: history unavailable, run not recorded");
        }
    }

    if (opts.json) {
        std::println("{}", to_json(result).dump(2));
    } else if (opts.quiet) {
        std::print("{}", result.final_text);
    } else {
        std::print("{}", render_events(result));
        std::println("status: {} ({:.1f}s, {} responses sent)", to_string(result.status),
                     std::chrono::duration<double>(result.elapsed).count(), result.injections);
        std::println("----");
        std::print("{}", result.final_text);
    }

    return exit_code(result.status);
}
