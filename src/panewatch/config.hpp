#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    // No poll cadence may go below this, whatever the config file says.
    static constexpr std::chrono::milliseconds kMinInterval{50};

    struct Monitor {
        uint32_t poll_interval_ms = 1000; // idle or waiting on a prompt
        uint32_t busy_interval_ms = 500;  // output is changing
        uint32_t stability_ticks = 3;     // unchanged ticks before the pane counts as done
        uint32_t prompt_window_lines = 12;
        uint32_t max_capture_failures = 3;
        uint32_t status_log_interval_s = 10;
        uint32_t timeout_s = 600;

        std::chrono::milliseconds poll_interval() const {
            return std::max(std::chrono::milliseconds(poll_interval_ms), kMinInterval);
        }
        std::chrono::milliseconds busy_interval() const {
            return std::max(std::chrono::milliseconds(busy_interval_ms), kMinInterval);
        }
    } monitor;

    struct Tmux {
        std::string binary = "tmux";
        std::string socket; // -L name; empty for the default server
        uint32_t command_timeout_ms = 5000; // a hung tmux call counts as a failure after this

        std::chrono::milliseconds command_timeout() const {
            return std::chrono::milliseconds(command_timeout_ms);
        }
    } tmux;

    struct PromptPattern {
        std::string regex;
        std::string response = "y";
        bool submit = true;
    };

    struct Patterns {
        std::vector<PromptPattern> prompts;
        std::vector<std::string> progress;
    } patterns;

    struct History {
        bool enabled = true;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
