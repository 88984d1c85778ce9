#include "matchers.hpp"

#include "frame.hpp"

#include <array>
#include <string_view>

namespace {

// Lines above the question that are folded into the fingerprint context. The
// question text alone repeats across prompts ("Do you want to proceed?"); the
// command shown above it does not.
constexpr size_t kContextLinesAbove = 2;

constexpr std::array<std::string_view, 3> kCursorGlyphs = {
    "\xE2\x9D\xAF", // ❯
    "\xE2\x80\xBA", // ›
    ">",
};

constexpr std::array<std::string_view, 17> kSpinnerGlyphs = {
    "\xE2\x9C\xBB", // ✻
    "\xE2\x9C\xB6", // ✶
    "\xE2\x9C\xB3", // ✳
    "\xE2\x9C\xA2", // ✢
    "\xE2\x9C\xBD", // ✽
    "\xC2\xB7",     // ·
    "*",
    "\xE2\xA0\x8B", // ⠋
    "\xE2\xA0\x99", // ⠙
    "\xE2\xA0\xB9", // ⠹
    "\xE2\xA0\xB8", // ⠸
    "\xE2\xA0\xBC", // ⠼
    "\xE2\xA0\xB4", // ⠴
    "\xE2\xA0\xA6", // ⠦
    "\xE2\xA0\xA7", // ⠧
    "\xE2\xA0\x87", // ⠇
    "\xE2\xA0\x8F", // ⠏
};

struct MenuOption {
    int number;
    bool highlighted;
};

std::optional<MenuOption> parse_option(const std::string& line) {
    static const std::regex option_re(R"(^(\d{1,2})[.)]\s+\S.*$)");

    std::string t = frame::trim(line);
    std::string_view v = t;
    bool highlighted = false;
    for (auto glyph : kCursorGlyphs) {
        if (v.starts_with(glyph)) {
            v.remove_prefix(glyph.size());
            highlighted = true;
            break;
        }
    }

    std::string rest = frame::trim(v);
    std::smatch m;
    if (!std::regex_match(rest, m, option_re)) return std::nullopt;
    return MenuOption{std::stoi(m[1].str()), highlighted};
}

bool is_spinner_line(std::string_view trimmed) {
    for (auto glyph : kSpinnerGlyphs) {
        if (!trimmed.starts_with(glyph)) continue;
        auto rest = trimmed.substr(glyph.size());
        if (rest.starts_with(' ') && !frame::trim(rest).empty()) return true;
    }
    return false;
}

void append_line(std::string& out, const std::string& line) {
    if (line.empty()) return;
    if (!out.empty()) out += '\n';
    out += line;
}

// Question line through `last`, preceded by the lines above the question.
// Those lines often hold a ticking status ("Elapsed: 00:03", a spinner), so
// spinner lines are left out and the rest keep only their letters. A prompt
// that stays on screen keeps the same context while the status moves.
std::string context_for(std::span<const std::string> lines, size_t question, size_t last) {
    size_t begin = question > kContextLinesAbove ? question - kContextLinesAbove : 0;

    std::string out;
    for (size_t i = begin; i < question; ++i) {
        auto t = frame::trim(lines[i]);
        if (is_spinner_line(t)) continue;
        append_line(out, frame::letters_only(t));
    }
    for (size_t i = question; i <= last; ++i) {
        append_line(out, frame::trim(lines[i]));
    }
    return out;
}

// Index of the bottom-most line matching `re`.
std::optional<size_t> find_last(std::span<const std::string> lines, const std::regex& re) {
    for (size_t i = lines.size(); i-- > 0;) {
        if (std::regex_search(lines[i], re)) return i;
    }
    return std::nullopt;
}

std::optional<std::string> search_last(std::span<const std::string> lines, const std::regex& re) {
    std::smatch m;
    for (size_t i = lines.size(); i-- > 0;) {
        if (std::regex_search(lines[i], m, re)) return frame::trim(m[0].str());
    }
    return std::nullopt;
}

PromptMatch line_prompt(std::span<const std::string> lines, size_t idx,
                        std::string response, bool submit) {
    return PromptMatch{
        .prompt = frame::trim(lines[idx]),
        .context = context_for(lines, idx, idx),
        .response = std::move(response),
        .submit = submit,
    };
}

} // namespace

std::optional<PromptMatch> NumberedMenuMatcher::match(std::span<const std::string> lines) const {
    std::optional<size_t> last;
    for (size_t i = lines.size(); i-- > 0;) {
        if (parse_option(lines[i])) {
            last = i;
            break;
        }
    }
    if (!last) return std::nullopt;

    size_t first = *last;
    while (first > 0 && parse_option(lines[first - 1])) --first;
    if (*last - first + 1 < 2) return std::nullopt;

    std::optional<int> selected;
    int expected = 1;
    for (size_t i = first; i <= *last; ++i) {
        auto opt = parse_option(lines[i]);
        if (opt->number != expected++) return std::nullopt;
        if (opt->highlighted) {
            if (selected) return std::nullopt;
            selected = opt->number;
        }
    }
    if (!selected) return std::nullopt;

    size_t question = first > 0 ? first - 1 : first;
    return PromptMatch{
        .prompt = frame::trim(lines[question]),
        .context = context_for(lines, question, *last),
        .response = std::to_string(*selected),
        .submit = false,
    };
}

std::optional<PromptMatch> YesNoMatcher::match(std::span<const std::string> lines) const {
    static const std::regex yes_no_re(
        R"((\b(do you want to|would you like to)\b.*\?|\b(proceed|continue)\s*\?|[\[(]\s*y(es)?\s*/\s*n(o)?\s*[\])]\s*:?)\s*$)",
        std::regex::icase);

    auto idx = find_last(lines, yes_no_re);
    if (!idx) return std::nullopt;
    return line_prompt(lines, *idx, "y", true);
}

std::optional<PromptMatch> AllowMatcher::match(std::span<const std::string> lines) const {
    static const std::regex allow_re(R"(\b(allow|approve)\b.*\?\s*$)", std::regex::icase);

    auto idx = find_last(lines, allow_re);
    if (!idx) return std::nullopt;
    return line_prompt(lines, *idx, "y", true);
}

RegexPromptMatcher::RegexPromptMatcher(std::regex pattern, std::string response, bool submit)
    : pattern_(std::move(pattern)), response_(std::move(response)), submit_(submit) {}

std::optional<PromptMatch> RegexPromptMatcher::match(std::span<const std::string> lines) const {
    auto idx = find_last(lines, pattern_);
    if (!idx) return std::nullopt;
    return line_prompt(lines, *idx, response_, submit_);
}

std::optional<std::string> SpinnerMatcher::match(std::span<const std::string> lines) const {
    for (size_t i = lines.size(); i-- > 0;) {
        std::string t = frame::trim(lines[i]);
        if (is_spinner_line(t)) return t;
    }
    return std::nullopt;
}

std::optional<std::string> EllipsisMatcher::match(std::span<const std::string> lines) const {
    static const std::regex ellipsis_re("[A-Z][a-z]+( [a-z]+)?(\xE2\x80\xA6|\\.\\.\\.)");
    return search_last(lines, ellipsis_re);
}

std::optional<std::string> CounterMatcher::match(std::span<const std::string> lines) const {
    static const std::regex counter_re(
        R"(\d+(\.\d+)?[kKmM]?\s*(tokens|bytes)\b|\b\d{1,3}%)");
    return search_last(lines, counter_re);
}

RegexProgressMatcher::RegexProgressMatcher(std::regex pattern)
    : pattern_(std::move(pattern)) {}

std::optional<std::string> RegexProgressMatcher::match(std::span<const std::string> lines) const {
    return search_last(lines, pattern_);
}
