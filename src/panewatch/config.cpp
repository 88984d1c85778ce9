#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Zero or negative values would stall the loop or disable a safety bound.
// Read signed so a negative value is rejected instead of wrapping around.
void load_positive(const json& j, const char* section, const char* key, uint32_t& out) {
    if (!j.contains(key)) return;
    auto value = j[key].get<int64_t>();
    if (value <= 0 || value > std::numeric_limits<uint32_t>::max()) {
        std::println(stderr, "config: {}.{} must be positive, keeping {}", section, key, out);
        return;
    }
    out = static_cast<uint32_t>(value);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("monitor")) {
            auto& m = j["monitor"];
            load_positive(m, "monitor", "poll_interval_ms", cfg.monitor.poll_interval_ms);
            load_positive(m, "monitor", "busy_interval_ms", cfg.monitor.busy_interval_ms);
            load_positive(m, "monitor", "stability_ticks", cfg.monitor.stability_ticks);
            load_positive(m, "monitor", "prompt_window_lines", cfg.monitor.prompt_window_lines);
            load_positive(m, "monitor", "max_capture_failures", cfg.monitor.max_capture_failures);
            load_positive(m, "monitor", "status_log_interval_s", cfg.monitor.status_log_interval_s);
            load_positive(m, "monitor", "timeout_s", cfg.monitor.timeout_s);
        }

        if (j.contains("tmux")) {
            auto& t = j["tmux"];
            if (t.contains("binary")) cfg.tmux.binary = t["binary"].get<std::string>();
            if (t.contains("socket")) cfg.tmux.socket = t["socket"].get<std::string>();
            load_positive(t, "tmux", "command_timeout_ms", cfg.tmux.command_timeout_ms);
        }

        if (j.contains("patterns")) {
            auto& p = j["patterns"];
            if (p.contains("prompts")) {
                for (auto& entry : p["prompts"]) {
                    PromptPattern pattern;
                    pattern.regex = entry.at("regex").get<std::string>();
                    pattern.response = entry.value("response", pattern.response);
                    pattern.submit = entry.value("submit", pattern.submit);
                    cfg.patterns.prompts.push_back(std::move(pattern));
                }
            }
            if (p.contains("progress")) {
                cfg.patterns.progress = p["progress"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
