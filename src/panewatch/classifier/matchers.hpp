#pragma once

#include <optional>
#include <regex>
#include <span>
#include <string>

// Matchers look at the trailing window of a frame: non-blank lines, oldest
// first, with escape sequences and box borders already removed. Each one
// searches from the bottom up so the match nearest the interactive edge wins.

struct PromptMatch {
    std::string prompt;
    std::string context;
    std::string response;
    bool submit = false;
};

class PromptMatcher {
public:
    virtual ~PromptMatcher() = default;
    virtual std::optional<PromptMatch> match(std::span<const std::string> lines) const = 0;
};

class ProgressMatcher {
public:
    virtual ~ProgressMatcher() = default;
    // Returns a human-readable progress string.
    virtual std::optional<std::string> match(std::span<const std::string> lines) const = 0;
};

// A block of "N. option" lines numbered from 1 with exactly one highlighted by
// a cursor glyph (❯, › or >). Responds with the highlighted number.
class NumberedMenuMatcher : public PromptMatcher {
public:
    std::optional<PromptMatch> match(std::span<const std::string> lines) const override;
};

// "Do you want to ...?", "Proceed?" or a trailing [y/n] style marker. Responds "y" + Enter.
class YesNoMatcher : public PromptMatcher {
public:
    std::optional<PromptMatch> match(std::span<const std::string> lines) const override;
};

// A question mentioning "allow" or "approve". Responds "y" + Enter.
class AllowMatcher : public PromptMatcher {
public:
    std::optional<PromptMatch> match(std::span<const std::string> lines) const override;
};

class RegexPromptMatcher : public PromptMatcher {
public:
    RegexPromptMatcher(std::regex pattern, std::string response, bool submit);
    std::optional<PromptMatch> match(std::span<const std::string> lines) const override;

private:
    std::regex pattern_;
    std::string response_;
    bool submit_;
};

// A line starting with a spinner glyph followed by text.
class SpinnerMatcher : public ProgressMatcher {
public:
    std::optional<std::string> match(std::span<const std::string> lines) const override;
};

// A capitalized verb followed by an ellipsis: "Thinking…", "Reading files...".
class EllipsisMatcher : public ProgressMatcher {
public:
    std::optional<std::string> match(std::span<const std::string> lines) const override;
};

// Token, byte or percentage counters: "1.2k tokens", "512 bytes", "42%".
class CounterMatcher : public ProgressMatcher {
public:
    std::optional<std::string> match(std::span<const std::string> lines) const override;
};

class RegexProgressMatcher : public ProgressMatcher {
public:
    explicit RegexProgressMatcher(std::regex pattern);
    std::optional<std::string> match(std::span<const std::string> lines) const override;

private:
    std::regex pattern_;
};
