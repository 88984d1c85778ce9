#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Helpers over a captured pane frame (the raw text of one capture-pane call).
namespace frame {

std::vector<std::string> split_lines(std::string_view text);

// Remove CSI, OSC and two-byte escape sequences.
std::string strip_ansi(std::string_view text);

std::string trim(std::string_view s);

// Strip a surrounding box border ("│ ... │") drawn by TUI prompts.
std::string unbox(std::string_view line);

// Collapse every run of whitespace to a single space and trim the ends.
std::string collapse_whitespace(std::string_view s);

// Only the ASCII letters of `s`, with every other run of characters turned
// into a single space. Digits, glyphs and punctuation all drop out, so
// "✻ Thinking… (12s)" and "✶ Thinking… (13s)" compare equal.
std::string letters_only(std::string_view s);

// Last `count` non-blank lines of the frame, oldest first, escape sequences removed.
// Blank rows are skipped entirely: tmux pads captures with empty rows below the
// cursor and prompts are often spaced with blank lines.
std::vector<std::string> trailing_lines(std::string_view text, size_t count);

} // namespace frame
