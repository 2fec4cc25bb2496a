/**
 * @file pattern_filter.cpp
 * @brief Implementation of pattern_filter
 */

#include <kcenon/object_batch/planner/pattern_filter.h>
#include <kcenon/object_batch/core/logging.h>

#include <algorithm>

namespace kcenon::object_batch {

namespace {

constexpr auto npos = std::string_view::npos;

/**
 * @brief Locate the end of a bracket expression starting at @p start
 * @return Index one past the closing ']' or npos if unterminated
 *
 * A ']' directly after '[' or after the negation mark is a literal.
 */
auto class_end(std::string_view p, std::size_t start) -> std::size_t {
    auto i = start + 1;
    if (i < p.size() && (p[i] == '!' || p[i] == '^')) {
        ++i;
    }
    if (i < p.size() && p[i] == ']') {
        ++i;
    }
    while (i < p.size() && p[i] != ']') {
        if (p[i] == '\\') {
            if (i + 1 >= p.size()) {
                return npos;
            }
            i += 2;
            continue;
        }
        ++i;
    }
    return i < p.size() ? i + 1 : npos;
}

auto class_matches(std::string_view p, std::size_t start, std::size_t end, char c) -> bool {
    auto i = start + 1;
    bool negate = false;
    if (p[i] == '!' || p[i] == '^') {
        negate = true;
        ++i;
    }

    const auto close = end - 1;
    bool matched = false;
    while (i < close) {
        char lo = p[i];
        if (lo == '\\') {
            lo = p[i + 1];
            i += 2;
        } else {
            ++i;
        }

        if (i + 1 < close && p[i] == '-') {
            char hi = p[i + 1];
            if (hi == '\\' && i + 2 < close) {
                hi = p[i + 2];
                i += 3;
            } else {
                i += 2;
            }
            if (lo <= c && c <= hi) {
                matched = true;
            }
        } else if (lo == c) {
            matched = true;
        }
    }
    return matched != negate;
}

}  // namespace

auto pattern_filter::validate_pattern(std::string_view pattern) -> result<void> {
    if (pattern.empty()) {
        return unexpected(error(error_code::invalid_pattern, "empty glob pattern"));
    }

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            if (i + 1 >= pattern.size()) {
                return unexpected(error(error_code::invalid_pattern,
                    "trailing backslash in pattern '" + std::string(pattern) + "'"));
            }
            ++i;
        } else if (pattern[i] == '[') {
            auto end = class_end(pattern, i);
            if (end == npos) {
                return unexpected(error(error_code::invalid_pattern,
                    "unterminated '[' in pattern '" + std::string(pattern) + "'"));
            }
            i = end - 1;
        }
    }
    return {};
}

auto pattern_filter::validate_patterns(const std::vector<std::string>& patterns)
    -> result<void> {
    for (const auto& pattern : patterns) {
        auto valid = validate_pattern(pattern);
        if (!valid) {
            return valid;
        }
    }
    return {};
}

auto pattern_filter::matches(std::string_view p, std::string_view s) -> bool {
    std::size_t pi = 0;
    std::size_t si = 0;
    std::size_t star_p = npos;
    std::size_t star_s = 0;

    while (si < s.size()) {
        if (pi < p.size()) {
            char pc = p[pi];
            if (pc == '*') {
                star_p = ++pi;
                star_s = si;
                continue;
            }
            if (pc == '?') {
                ++pi;
                ++si;
                continue;
            }
            if (pc == '[') {
                auto end = class_end(p, pi);
                if (end != npos && class_matches(p, pi, end, s[si])) {
                    pi = end;
                    ++si;
                    continue;
                }
            } else if (pc == '\\' && pi + 1 < p.size()) {
                if (p[pi + 1] == s[si]) {
                    pi += 2;
                    ++si;
                    continue;
                }
            } else if (pc == s[si]) {
                ++pi;
                ++si;
                continue;
            }
        }

        // Backtrack: let the last '*' swallow one more character
        if (star_p != npos) {
            pi = star_p;
            si = ++star_s;
            continue;
        }
        return false;
    }

    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

auto pattern_filter::accepts(
    std::string_view path,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes) -> bool {
    auto hit = [path](const std::string& pattern) { return matches(pattern, path); };

    if (!includes.empty() && std::none_of(includes.begin(), includes.end(), hit)) {
        return false;
    }
    return std::none_of(excludes.begin(), excludes.end(), hit);
}

auto pattern_filter::filter(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& includes,
    const std::vector<std::string>& excludes) -> result<std::vector<std::string>> {
    if (auto valid = validate_patterns(includes); !valid) {
        return unexpected(valid.error());
    }
    if (auto valid = validate_patterns(excludes); !valid) {
        return unexpected(valid.error());
    }

    std::vector<std::string> kept;
    kept.reserve(paths.size());
    for (const auto& path : paths) {
        if (accepts(path, includes, excludes)) {
            kept.push_back(path);
        }
    }

    OB_LOG_DEBUG(log_category::planner,
        "Pattern filter kept " + std::to_string(kept.size()) + " of " +
        std::to_string(paths.size()) + " paths");
    return kept;
}

}  // namespace kcenon::object_batch
