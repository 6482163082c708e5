//! # Glob Matching
//!
//! Patterns are validated once, braces are expanded into alternatives, and
//! each alternative is split into `/` segments. Matching walks segments,
//! letting `**` absorb zero or more path segments, and matches single
//! segments with a backtracking star matcher.

#include "strata/policy/glob.hpp"

namespace strata::policy {

namespace {

constexpr size_t MAX_ALTERNATIVES = 256;

/// Checks bracket and brace structure. Returns an error message or "".
auto validate(std::string_view pattern) -> std::string {
    if (pattern.empty()) {
        return "empty pattern";
    }
    int braces = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                return "trailing escape";
            }
            ++i;
            continue;
        }
        if (c == '[') {
            size_t j = i + 1;
            if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) {
                ++j;
            }
            if (j < pattern.size() && pattern[j] == ']') {
                ++j; // literal ']' as first member
            }
            while (j < pattern.size() && pattern[j] != ']' && pattern[j] != '/') {
                ++j;
            }
            if (j >= pattern.size() || pattern[j] != ']') {
                return "unterminated character class at offset " + std::to_string(i);
            }
            i = j;
        } else if (c == '{') {
            ++braces;
        } else if (c == '}') {
            if (--braces < 0) {
                return "unbalanced '}' at offset " + std::to_string(i);
            }
        }
    }
    if (braces != 0) {
        return "unbalanced '{'";
    }
    return "";
}

/// Expands the first top-level brace group recursively.
void expand_braces(const std::string& pattern, std::vector<std::string>& out) {
    if (out.size() >= MAX_ALTERNATIVES) {
        return;
    }
    size_t open = std::string::npos;
    int depth = 0;
    std::vector<size_t> commas;
    size_t close = std::string::npos;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '[') {
            while (i < pattern.size() && pattern[i] != ']') {
                ++i;
            }
            continue;
        }
        if (c == '{') {
            if (depth++ == 0) {
                open = i;
            }
        } else if (c == ',' && depth == 1) {
            commas.push_back(i);
        } else if (c == '}' && --depth == 0) {
            close = i;
            break;
        }
    }
    if (open == std::string::npos || close == std::string::npos) {
        out.push_back(pattern);
        return;
    }
    std::string prefix = pattern.substr(0, open);
    std::string suffix = pattern.substr(close + 1);
    size_t start = open + 1;
    commas.push_back(close);
    for (size_t comma : commas) {
        expand_braces(prefix + pattern.substr(start, comma - start) + suffix, out);
        start = comma + 1;
    }
}

auto split_segments(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        segments.emplace_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

/// Matches `[...]` at `p` against `c`; advances `p` past the class.
auto match_class(std::string_view pat, size_t& p, char c) -> bool {
    size_t i = p + 1;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        ++i;
    }
    bool hit = false;
    bool first = true;
    while (i < pat.size() && (pat[i] != ']' || first)) {
        char lo = pat[i];
        if (lo == '\\' && i + 1 < pat.size()) {
            lo = pat[++i];
        }
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = pat[i + 2];
            hit = hit || (c >= lo && c <= hi);
            i += 3;
        } else {
            hit = hit || c == lo;
            ++i;
        }
        first = false;
    }
    p = i + 1;
    return hit != negate;
}

/// Matches one path segment against one pattern segment.
auto match_segment(std::string_view pat, std::string_view text) -> bool {
    size_t p = 0;
    size_t t = 0;
    size_t star_p = std::string_view::npos;
    size_t star_t = 0;
    while (t < text.size()) {
        if (p < pat.size() && pat[p] == '*') {
            while (p < pat.size() && pat[p] == '*') {
                ++p;
            }
            star_p = p;
            star_t = t;
            continue;
        }
        if (p < pat.size()) {
            char pc = pat[p];
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '[') {
                size_t next = p;
                if (match_class(pat, next, text[t])) {
                    p = next;
                    ++t;
                    continue;
                }
            } else {
                if (pc == '\\' && p + 1 < pat.size()) {
                    pc = pat[p + 1];
                    if (pc == text[t]) {
                        p += 2;
                        ++t;
                        continue;
                    }
                } else if (pc == text[t]) {
                    ++p;
                    ++t;
                    continue;
                }
            }
        }
        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p;
        t = ++star_t;
    }
    while (p < pat.size() && pat[p] == '*') {
        ++p;
    }
    return p == pat.size();
}

auto match_segments(const std::vector<std::string>& pat, size_t pi,
                    const std::vector<std::string>& path, size_t si) -> bool {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            // Collapse consecutive `**`
            while (pi + 1 < pat.size() && pat[pi + 1] == "**") {
                ++pi;
            }
            if (pi + 1 == pat.size()) {
                return true;
            }
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi + 1, path, k)) {
                    return true;
                }
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pat[pi], path[si])) {
            return false;
        }
        ++pi;
        ++si;
    }
    return si == path.size();
}

} // namespace

auto Glob::compile(std::string_view pattern) -> Result<Glob, std::string> {
    auto error = validate(pattern);
    if (!error.empty()) {
        return error;
    }
    Glob glob;
    glob.pattern_ = std::string(pattern);
    std::vector<std::string> expanded;
    expand_braces(glob.pattern_, expanded);
    for (const auto& alt : expanded) {
        glob.alternatives_.push_back(split_segments(alt));
    }
    return glob;
}

auto Glob::matches(std::string_view path) const -> bool {
    auto segments = split_segments(path);
    for (const auto& alt : alternatives_) {
        if (match_segments(alt, 0, segments, 0)) {
            return true;
        }
    }
    return false;
}

auto glob_match(std::string_view pattern, std::string_view path) -> bool {
    auto glob = Glob::compile(pattern);
    return is_ok(glob) && unwrap(glob).matches(path);
}

auto wildcard_match(std::string_view pattern, std::string_view text) -> bool {
    size_t p = 0;
    size_t t = 0;
    size_t star_p = std::string_view::npos;
    size_t star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_p = ++p;
            star_t = t;
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (star_p != std::string_view::npos) {
            p = star_p;
            t = ++star_t;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

} // namespace strata::policy
