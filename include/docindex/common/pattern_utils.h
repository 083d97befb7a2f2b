#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docindex::common {

namespace detail {

// Matches text[t] against the bracket expression starting at pattern[p] ('[').
// On success stores the index just past the closing ']' in next.
constexpr bool match_class(char c, std::string_view pattern, size_t p, size_t& next) noexcept {
    size_t i = p + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    for (; i < pattern.size(); ++i) {
        const char lo = pattern[i];
        if (lo == ']' && !first) {
            next = i + 1;
            return matched != negate;
        }
        first = false;
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            if (lo <= c && c <= pattern[i + 2])
                matched = true;
            i += 2;
        } else if (lo == c) {
            matched = true;
        }
    }
    // Unterminated class: treat '[' as a literal
    next = p + 1;
    return c == '[';
}

} // namespace detail

/**
 * Shell-style glob match, case-sensitive.
 *
 *  - '?' matches one character
 *  - '*' matches any run of characters, '/' included
 *  - "[abc]", "[a-z]", "[!x]" match one character from (or not from) a set
 *
 * Backtracks only to the most recent '*', so the cost stays linear in practice.
 */
[[nodiscard]] constexpr bool glob_match(std::string_view text, std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t star = std::string_view::npos;
    size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                star = p++;
                resume = t;
                continue;
            }
            if (pc == '?') {
                ++t;
                ++p;
                continue;
            }
            if (pc == '[') {
                size_t next = 0;
                if (detail::match_class(text[t], pattern, p, next)) {
                    ++t;
                    p = next;
                    continue;
                }
            } else if (pc == text[t]) {
                ++t;
                ++p;
                continue;
            }
        }
        if (star == std::string_view::npos)
            return false;
        p = star + 1;
        t = ++resume;
    }

    while (p < pattern.size() && pattern[p] == '*')
        ++p;
    return p == pattern.size();
}

[[nodiscard]] inline bool matches_any(std::string_view text,
                                      const std::vector<std::string>& patterns) noexcept {
    for (const auto& pattern : patterns) {
        if (glob_match(text, pattern))
            return true;
    }
    return false;
}

[[nodiscard]] constexpr bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_blank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_blank(s.back()))
        s.remove_suffix(1);
    return s;
}

} // namespace docindex::common
