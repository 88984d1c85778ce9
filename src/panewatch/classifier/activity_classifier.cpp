#include "activity_classifier.hpp"

#include "frame.hpp"

#include <print>
#include <regex>

ActivityClassifier::ActivityClassifier(size_t window_lines, PromptMatchers prompts,
                                       ProgressMatchers progress)
    : window_lines_(window_lines), prompts_(std::move(prompts)),
      progress_(std::move(progress)) {}

ActivityClassifier ActivityClassifier::from_config(const Config& config) {
    auto prompts = default_prompt_matchers();
    auto progress = default_progress_matchers();

    for (const auto& p : config.patterns.prompts) {
        try {
            prompts.push_back(std::make_unique<RegexPromptMatcher>(
                std::regex(p.regex, std::regex::icase), p.response, p.submit));
        } catch (const std::regex_error& e) {
            std::println(stderr, "classifier: skipping prompt pattern '{}': {}", p.regex, e.what());
        }
    }

    for (const auto& p : config.patterns.progress) {
        try {
            progress.push_back(std::make_unique<RegexProgressMatcher>(std::regex(p)));
        } catch (const std::regex_error& e) {
            std::println(stderr, "classifier: skipping progress pattern '{}': {}", p, e.what());
        }
    }

    return ActivityClassifier(config.monitor.prompt_window_lines, std::move(prompts),
                              std::move(progress));
}

ActivityClassifier::PromptMatchers ActivityClassifier::default_prompt_matchers() {
    PromptMatchers m;
    m.push_back(std::make_unique<NumberedMenuMatcher>());
    m.push_back(std::make_unique<YesNoMatcher>());
    m.push_back(std::make_unique<AllowMatcher>());
    return m;
}

ActivityClassifier::ProgressMatchers ActivityClassifier::default_progress_matchers() {
    ProgressMatchers m;
    m.push_back(std::make_unique<SpinnerMatcher>());
    m.push_back(std::make_unique<EllipsisMatcher>());
    m.push_back(std::make_unique<CounterMatcher>());
    return m;
}

ActivityState ActivityClassifier::classify(const std::optional<std::string>& previous,
                                           std::string_view current) const {
    auto window = frame::trailing_lines(current, window_lines_);
    for (auto& line : window) {
        line = frame::unbox(line);
    }

    for (const auto& matcher : prompts_) {
        if (auto m = matcher->match(window)) {
            return AwaitingPermission{
                .prompt = std::move(m->prompt),
                .context = std::move(m->context),
                .response = std::move(m->response),
                .submit = m->submit,
            };
        }
    }

    if (previous && *previous == current) {
        return Idle{};
    }

    for (const auto& matcher : progress_) {
        if (auto progress = matcher->match(window)) {
            return Processing{std::move(*progress)};
        }
    }

    return Unknown{};
}
