#include "frame.hpp"

#include <algorithm>

namespace frame {

namespace {

constexpr std::string_view kBoxVertical = "\xE2\x94\x82"; // │

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_blank(std::string_view s) {
    return std::ranges::all_of(s, is_space);
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    return lines;
}

std::string strip_ansi(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '\033') {
            out += text[i++];
            continue;
        }
        if (i + 1 >= text.size()) break;

        char kind = text[i + 1];
        i += 2;
        if (kind == '[') {
            // CSI: parameter and intermediate bytes, then one final byte in 0x40-0x7E
            while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7E)) i++;
            if (i < text.size()) i++;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ST (ESC \)
            while (i < text.size()) {
                if (text[i] == '\a') { i++; break; }
                if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '\\') { i += 2; break; }
                i++;
            }
        }
    }
    return out;
}

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) start++;
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) end--;
    return std::string(s.substr(start, end - start));
}

std::string unbox(std::string_view line) {
    std::string t = trim(line);
    std::string_view v = t;
    if (v.starts_with(kBoxVertical)) v.remove_prefix(kBoxVertical.size());
    if (v.ends_with(kBoxVertical)) v.remove_suffix(kBoxVertical.size());
    return trim(v);
}

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string letters_only(std::string_view s) {
    std::string letters;
    letters.reserve(s.size());
    for (char c : s) {
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        letters += alpha ? c : ' ';
    }
    return collapse_whitespace(letters);
}

std::vector<std::string> trailing_lines(std::string_view text, size_t count) {
    auto lines = split_lines(strip_ansi(text));

    std::vector<std::string> window;
    for (auto it = lines.rbegin(); it != lines.rend() && window.size() < count; ++it) {
        if (is_blank(*it)) continue;
        window.push_back(std::move(*it));
    }
    std::ranges::reverse(window);
    return window;
}

} // namespace frame
