#pragma once

#include "classifier/activity_state.hpp"
#include "classifier/matchers.hpp"
#include "config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class ActivityClassifier {
public:
    using PromptMatchers = std::vector<std::unique_ptr<PromptMatcher>>;
    using ProgressMatchers = std::vector<std::unique_ptr<ProgressMatcher>>;

    ActivityClassifier(size_t window_lines, PromptMatchers prompts, ProgressMatchers progress);

    // Built-in matchers followed by the user patterns from config. Patterns
    // that fail to compile are reported and skipped.
    static ActivityClassifier from_config(const Config& config);

    static PromptMatchers default_prompt_matchers();
    static ProgressMatchers default_progress_matchers();

    // Prompt matchers win over everything. Otherwise an unchanged frame is
    // Idle, a changed frame is Processing if a progress marker is visible and
    // Unknown if not. `previous` is empty on the first tick.
    ActivityState classify(const std::optional<std::string>& previous,
                           std::string_view current) const;

    size_t window_lines() const { return window_lines_; }

private:
    size_t window_lines_;
    PromptMatchers prompts_;
    ProgressMatchers progress_;
};
