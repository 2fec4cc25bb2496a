/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry_policy
 */

#include <gtest/gtest.h>

#include <kcenon/object_batch/core/retry_policy.h>

namespace kcenon::object_batch::test {

using std::chrono::milliseconds;

class RetryPolicyTest : public ::testing::Test {
protected:
    retry_policy policy_;
};

TEST_F(RetryPolicyTest, DefaultDelaysDouble) {
    EXPECT_EQ(policy_.backoff_delay(1), milliseconds{1000});
    EXPECT_EQ(policy_.backoff_delay(2), milliseconds{2000});
    EXPECT_EQ(policy_.backoff_delay(3), milliseconds{4000});
}

TEST_F(RetryPolicyTest, DelayIsCapped) {
    EXPECT_EQ(policy_.backoff_delay(7), milliseconds{60000});
    EXPECT_EQ(policy_.backoff_delay(100), milliseconds{60000});
    EXPECT_EQ(policy_.backoff_delay(4000), milliseconds{60000});
}

TEST_F(RetryPolicyTest, DelaysNeverDecrease) {
    auto previous = policy_.backoff_delay(1);
    for (uint32_t attempt = 2; attempt < 40; ++attempt) {
        auto delay = policy_.backoff_delay(attempt);
        EXPECT_GE(delay, previous);
        EXPECT_LE(delay, policy_.delay_cap);
        previous = delay;
    }
}

TEST_F(RetryPolicyTest, RetriesUpToMax) {
    EXPECT_TRUE(policy_.is_retryable(1));
    EXPECT_TRUE(policy_.is_retryable(3));
    EXPECT_FALSE(policy_.is_retryable(4));

    policy_.max_retries = 0;
    EXPECT_FALSE(policy_.is_retryable(1));
}

TEST_F(RetryPolicyTest, Validation) {
    EXPECT_TRUE(policy_.validate());

    retry_policy zero_base;
    zero_base.base_delay = milliseconds{0};
    EXPECT_EQ(zero_base.validate().error().code, error_code::invalid_configuration);

    retry_policy shrinking;
    shrinking.multiplier = 0.5;
    EXPECT_FALSE(shrinking.validate());

    retry_policy small_cap;
    small_cap.delay_cap = milliseconds{500};
    EXPECT_FALSE(small_cap.validate());
}

}  // namespace kcenon::object_batch::test
