/**
 * @file test_logging.cpp
 * @brief Unit tests for the batch logger and structured log context
 */

#include <gtest/gtest.h>

#include <kcenon/object_batch/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::object_batch::test {

// =============================================================================
// Log context tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, OnlySetFieldsAreWritten) {
    transfer_log_context ctx;
    ctx.batch_id = "abc123";
    ctx.item_index = 2;
    ctx.attempt = 3;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"batch_id\":\"abc123\""), std::string::npos);
    EXPECT_NE(json.find("\"item\":2"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_EQ(json.find("error_message"), std::string::npos);
}

TEST_F(TransferLogContextTest, StringsAreEscaped) {
    transfer_log_context ctx;
    ctx.batch_id = "id";
    ctx.error_message = "line1\nsaid \"no\"";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("line1\\nsaid \\\"no\\\""), std::string::npos);
}

TEST_F(TransferLogContextTest, EscapeControlCharacters) {
    EXPECT_EQ(detail::escape_json_string("a\tb"), "a\\tb");
    EXPECT_EQ(detail::escape_json_string(std::string(1, '\x01')), "\\u0001");
    EXPECT_EQ(detail::escape_json_string("back\\slash"), "back\\\\slash");
}

// =============================================================================
// Logger tests
// =============================================================================

class BatchLoggerTest : public ::testing::Test {
protected:
    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    void SetUp() override {
        previous_level_ = get_logger().get_level();
        get_logger().set_console_enabled(false);
        get_logger().set_callback([this](log_level level, std::string_view category,
                                         std::string_view message,
                                         const transfer_log_context* ctx) {
            records_.push_back({level, std::string(category), std::string(message),
                                ctx != nullptr});
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_console_enabled(true);
        get_logger().set_level(previous_level_);
    }

    std::vector<record> records_;
    log_level previous_level_ = log_level::info;
};

TEST_F(BatchLoggerTest, LevelFilter) {
    get_logger().set_level(log_level::warn);

    OB_LOG_INFO(log_category::planner, "hidden");
    OB_LOG_WARN(log_category::planner, "shown");
    OB_LOG_ERROR(log_category::executor, "also shown");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].message, "shown");
    EXPECT_EQ(records_[0].category, "object_batch.planner");
    EXPECT_EQ(records_[1].level, log_level::error);
}

TEST_F(BatchLoggerTest, ContextIsForwarded) {
    get_logger().set_level(log_level::debug);

    transfer_log_context ctx;
    ctx.batch_id = "b";
    OB_LOG_DEBUG_CTX(log_category::state, "saved", ctx);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_TRUE(records_[0].has_context);
}

TEST_F(BatchLoggerTest, LevelNames) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(BatchLoggerTest, StructuredEntryJson) {
    structured_log_entry entry;
    entry.timestamp = "2025-01-01T00:00:00.000Z";
    entry.level = log_level::info;
    entry.category = std::string(log_category::engine);
    entry.message = "done";

    auto json = entry.to_json();
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"object_batch.engine\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"done\""), std::string::npos);
}

}  // namespace kcenon::object_batch::test
