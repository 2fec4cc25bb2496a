/**
 * @file test_progress_reporter.cpp
 * @brief Unit tests for the single-line progress display
 */

#include <gtest/gtest.h>

#include <kcenon/object_batch/progress/progress_reporter.h>

#include <sstream>
#include <string>
#include <vector>

namespace kcenon::object_batch::test {

using namespace std::chrono_literals;

class ProgressReporterTest : public ::testing::Test {
protected:
    static auto sample(uint64_t done, uint64_t total, std::chrono::steady_clock::time_point at)
        -> progress_sample {
        return progress_sample{done, total, at};
    }

    /**
     * @brief The visible text of the terminal line after all '\r' redraws
     *
     * Each UTF-8 code point occupies one column.
     */
    static auto visible_line(const std::string& output) -> std::string {
        std::vector<std::string> cells;
        std::size_t cursor = 0;
        for (char c : output) {
            if (c == '\r') {
                cursor = 0;
                continue;
            }
            if (c == '\n') {
                cells.clear();
                cursor = 0;
                continue;
            }
            if ((static_cast<unsigned char>(c) & 0xC0) == 0x80) {
                if (cursor > 0) {
                    cells[cursor - 1] += c;
                }
                continue;
            }
            if (cursor < cells.size()) {
                cells[cursor] = std::string(1, c);
            } else {
                cells.emplace_back(1, c);
            }
            ++cursor;
        }
        while (!cells.empty() && cells.back() == " ") {
            cells.pop_back();
        }

        std::string line;
        for (const auto& cell : cells) {
            line += cell;
        }
        return line;
    }

    std::ostringstream out_;
    transfer_item item_{"/data/logs/app.tar.gz", "s3://bucket/app.tar.gz", 4096};
};

TEST_F(ProgressReporterTest, LineShowsPositionAndAmounts) {
    progress_reporter reporter(out_);
    auto t0 = std::chrono::steady_clock::now();

    reporter.begin_item(1, 3, item_);
    reporter.update(sample(1024, 4096, t0));

    auto line = reporter.current_line();
    EXPECT_EQ(line.rfind("[2/3] app.tar.gz  1.00 KiB/4.00 KiB  25.0%", 0), 0u) << line;
}

TEST_F(ProgressReporterTest, SpeedAndEtaFromSampleDelta) {
    progress_reporter reporter(out_);
    auto t0 = std::chrono::steady_clock::now();

    reporter.begin_item(0, 1, item_);
    reporter.update(sample(0, 4096, t0));
    EXPECT_FALSE(reporter.eta().has_value());

    reporter.update(sample(1024, 4096, t0 + 1s));
    EXPECT_DOUBLE_EQ(reporter.speed(), 1024.0);
    ASSERT_TRUE(reporter.eta().has_value());
    EXPECT_EQ(reporter.eta()->count(), 3);
    EXPECT_NE(reporter.current_line().find("ETA 00:03"), std::string::npos);
}

TEST_F(ProgressReporterTest, ShorterRedrawLeavesNoArtifacts) {
    progress_reporter reporter(out_);
    auto t0 = std::chrono::steady_clock::now();

    reporter.begin_item(0, 1, item_);
    reporter.update(sample(0, 4096, t0));
    reporter.update(sample(2048, 4096, t0 + 1s));
    auto long_line = reporter.current_line();

    transfer_item short_item{"/d/x", "s3://b/x", 0};
    reporter.begin_item(0, 1, short_item);
    EXPECT_LT(reporter.current_line().size(), long_line.size());

    EXPECT_EQ(visible_line(out_.str()), "[1/1] x");
}

TEST_F(ProgressReporterTest, MultiByteNamesArePaddedByColumns) {
    progress_reporter reporter(out_);

    transfer_item ascii_item{"/d/" + std::string(40, 'a'), "s3://b/a", 0};
    reporter.begin_item(0, 1, ascii_item);

    // 20 x U+00E9: more bytes than the previous line, fewer columns
    std::string accented;
    for (int i = 0; i < 20; ++i) {
        accented += "\xC3\xA9";
    }
    transfer_item accented_item{"/d/" + accented + ".log", "s3://b/e", 0};
    reporter.begin_item(0, 1, accented_item);
    ASSERT_GT(reporter.current_line().size(), std::string("[1/1] ").size() + 40);

    EXPECT_EQ(visible_line(out_.str()), "[1/1] " + accented + ".log");
}

TEST_F(ProgressReporterTest, DisplayWidthCountsCodePoints) {
    EXPECT_EQ(progress_reporter::display_width(""), 0u);
    EXPECT_EQ(progress_reporter::display_width("abc"), 3u);
    EXPECT_EQ(progress_reporter::display_width("caf\xC3\xA9"), 4u);
    EXPECT_EQ(progress_reporter::display_width("\xE6\x97\xA5\xE6\x9C\xAC"), 2u);
}

TEST_F(ProgressReporterTest, EndItemTerminatesLine) {
    progress_reporter reporter(out_);
    reporter.begin_item(0, 2, item_);
    reporter.end_item(item_status::completed);

    auto text = out_.str();
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_NE(text.find("[1/2] app.tar.gz  completed"), std::string::npos);
}

TEST_F(ProgressReporterTest, QuietModeWritesNothing) {
    progress_reporter reporter(out_, true);
    reporter.begin_item(0, 1, item_);
    reporter.update(sample(10, 4096, std::chrono::steady_clock::now()));
    reporter.end_item(item_status::failed);

    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(reporter.is_quiet());
}

TEST_F(ProgressReporterTest, Formatting) {
    EXPECT_EQ(progress_reporter::format_bytes(512), "512 B");
    EXPECT_EQ(progress_reporter::format_bytes(1536), "1.50 KiB");
    EXPECT_EQ(progress_reporter::format_bytes(1572864), "1.50 MiB");
    EXPECT_EQ(progress_reporter::format_duration(65s), "01:05");
    EXPECT_EQ(progress_reporter::format_duration(3725s), "1:02:05");
}

}  // namespace kcenon::object_batch::test
