/**
 * @file pattern_filter.h
 * @brief Include/exclude glob filtering of candidate paths
 */

#ifndef KCENON_OBJECT_BATCH_PLANNER_PATTERN_FILTER_H
#define KCENON_OBJECT_BATCH_PLANNER_PATTERN_FILTER_H

#include <string>
#include <string_view>
#include <vector>

#include "kcenon/object_batch/core/types.h"

namespace kcenon::object_batch {

/**
 * @brief Pure glob filter over relative paths
 *
 * Glob syntax: `*` (any run of characters, `/` included), `?` (one
 * character), `[abc]`, `[a-z]`, `[!abc]` / `[^abc]` and backslash escapes.
 * Matching is case-sensitive and anchored at both ends.
 *
 * A path is accepted iff (includes is empty OR it matches an include) AND
 * it matches no exclude.
 *
 * @code
 * auto kept = pattern_filter::filter(
 *     {"a.tar.gz", "a.debug.tar.gz", "b.log"},
 *     {"*.tar.gz"}, {"*.debug.tar.gz"});
 * // kept.value() == {"a.tar.gz"}
 * @endcode
 */
class pattern_filter {
public:
    /**
     * @brief Check that a pattern is well formed
     * @return Success or invalid_pattern naming the offending pattern
     */
    [[nodiscard]] static auto validate_pattern(std::string_view pattern) -> result<void>;

    /**
     * @brief Validate every pattern of a list
     */
    [[nodiscard]] static auto validate_patterns(const std::vector<std::string>& patterns)
        -> result<void>;

    /**
     * @brief Match one path against one (well formed) pattern
     */
    [[nodiscard]] static auto matches(std::string_view pattern, std::string_view path) -> bool;

    /**
     * @brief Apply include/exclude rules to a single path
     *
     * Patterns are assumed to be validated.
     */
    [[nodiscard]] static auto accepts(
        std::string_view path,
        const std::vector<std::string>& includes,
        const std::vector<std::string>& excludes) -> bool;

    /**
     * @brief Filter paths, preserving their order
     * @return The accepted subset, or invalid_pattern before anything is matched
     */
    [[nodiscard]] static auto filter(
        const std::vector<std::string>& paths,
        const std::vector<std::string>& includes,
        const std::vector<std::string>& excludes) -> result<std::vector<std::string>>;
};

}  // namespace kcenon::object_batch

#endif  // KCENON_OBJECT_BATCH_PLANNER_PATTERN_FILTER_H
