/**
 * @file test_pattern_filter.cpp
 * @brief Unit tests for glob include/exclude filtering
 */

#include <gtest/gtest.h>

#include <kcenon/object_batch/planner/pattern_filter.h>

#include <string>
#include <vector>

namespace kcenon::object_batch::test {

// =============================================================================
// Matching
// =============================================================================

class GlobMatchTest : public ::testing::Test {};

TEST_F(GlobMatchTest, StarMatchesAnyRun) {
    EXPECT_TRUE(pattern_filter::matches("*.tar.gz", "a.tar.gz"));
    EXPECT_TRUE(pattern_filter::matches("*.tar.gz", ".tar.gz"));
    EXPECT_FALSE(pattern_filter::matches("*.tar.gz", "a.tar.gz.bak"));
    EXPECT_TRUE(pattern_filter::matches("*", ""));
}

TEST_F(GlobMatchTest, StarCrossesDirectories) {
    EXPECT_TRUE(pattern_filter::matches("*.tar.gz", "logs/2024/a.tar.gz"));
    EXPECT_TRUE(pattern_filter::matches("logs/*", "logs/sub/a.txt"));
}

TEST_F(GlobMatchTest, QuestionMark) {
    EXPECT_TRUE(pattern_filter::matches("file?.log", "file1.log"));
    EXPECT_FALSE(pattern_filter::matches("file?.log", "file.log"));
    EXPECT_FALSE(pattern_filter::matches("file?.log", "file12.log"));
}

TEST_F(GlobMatchTest, CharacterClasses) {
    EXPECT_TRUE(pattern_filter::matches("node[0-9].log", "node7.log"));
    EXPECT_FALSE(pattern_filter::matches("node[0-9].log", "nodeA.log"));
    EXPECT_TRUE(pattern_filter::matches("node[!0-9].log", "nodeA.log"));
    EXPECT_FALSE(pattern_filter::matches("node[!0-9].log", "node3.log"));
    EXPECT_TRUE(pattern_filter::matches("[]x]", "]"));
    EXPECT_TRUE(pattern_filter::matches("[abc]*", "core.dump"));
}

TEST_F(GlobMatchTest, EscapeAndCase) {
    EXPECT_TRUE(pattern_filter::matches("a\\*b", "a*b"));
    EXPECT_FALSE(pattern_filter::matches("a\\*b", "axb"));
    EXPECT_FALSE(pattern_filter::matches("*.LOG", "a.log"));
}

// =============================================================================
// Validation
// =============================================================================

class PatternValidationTest : public ::testing::Test {};

TEST_F(PatternValidationTest, MalformedPatterns) {
    EXPECT_EQ(pattern_filter::validate_pattern("").error().code, error_code::invalid_pattern);
    EXPECT_EQ(pattern_filter::validate_pattern("[abc").error().code, error_code::invalid_pattern);
    EXPECT_EQ(pattern_filter::validate_pattern("abc\\").error().code, error_code::invalid_pattern);
}

TEST_F(PatternValidationTest, WellFormedPatterns) {
    EXPECT_TRUE(pattern_filter::validate_pattern("*.tar.gz"));
    EXPECT_TRUE(pattern_filter::validate_pattern("[!a-z]?"));
    EXPECT_TRUE(pattern_filter::validate_patterns({"*.log", "data/*"}));
    EXPECT_FALSE(pattern_filter::validate_patterns({"*.log", "[bad"}));
}

// =============================================================================
// Filtering
// =============================================================================

class PatternFilterTest : public ::testing::Test {
protected:
    std::vector<std::string> paths_{
        "a.tar.gz", "a.debug.tar.gz", "notes.txt", "sub/b.tar.gz", "sub/b.debug.tar.gz"};
};

TEST_F(PatternFilterTest, EmptyIncludesKeepEverything) {
    auto kept = pattern_filter::filter(paths_, {}, {});
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(kept.value(), paths_);
}

TEST_F(PatternFilterTest, IncludeThenExclude) {
    auto kept = pattern_filter::filter(paths_, {"*.tar.gz"}, {"*.debug.tar.gz"});
    ASSERT_TRUE(kept.has_value());
    std::vector<std::string> expected{"a.tar.gz", "sub/b.tar.gz"};
    EXPECT_EQ(kept.value(), expected);
}

TEST_F(PatternFilterTest, ExcludeWinsOverInclude) {
    EXPECT_FALSE(pattern_filter::accepts("a.tar.gz", {"*.tar.gz"}, {"a.*"}));
    EXPECT_TRUE(pattern_filter::accepts("notes.txt", {}, {"*.tar.gz"}));
}

TEST_F(PatternFilterTest, OrderIsPreserved) {
    std::vector<std::string> reversed(paths_.rbegin(), paths_.rend());
    auto kept = pattern_filter::filter(reversed, {"*.tar.gz"}, {});
    ASSERT_TRUE(kept.has_value());
    std::vector<std::string> expected{
        "sub/b.debug.tar.gz", "sub/b.tar.gz", "a.debug.tar.gz", "a.tar.gz"};
    EXPECT_EQ(kept.value(), expected);
}

TEST_F(PatternFilterTest, InvalidPatternRejectedBeforeMatching) {
    auto kept = pattern_filter::filter(paths_, {"*.tar.gz"}, {"[oops"});
    ASSERT_FALSE(kept.has_value());
    EXPECT_EQ(kept.error().code, error_code::invalid_pattern);
}

}  // namespace kcenon::object_batch::test
