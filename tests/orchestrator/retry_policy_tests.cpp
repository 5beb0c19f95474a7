#include <gtest/gtest.h>
#include "retry_policy.hpp"

using std::chrono::milliseconds;

TEST(RetryPolicyTests, ShouldRetry_OnlyTransientWithinLimit) {
    RetryPolicy p;
    p.max_retries = 2;
    EXPECT_TRUE(p.should_retry(ErrorClass::TransientInference, 1));
    EXPECT_TRUE(p.should_retry(ErrorClass::TransientInference, 2));
    EXPECT_FALSE(p.should_retry(ErrorClass::TransientInference, 3));
    EXPECT_FALSE(p.should_retry(ErrorClass::PermanentInference, 1));
    EXPECT_FALSE(p.should_retry(ErrorClass::InputUnavailable, 1));
    EXPECT_FALSE(p.should_retry(ErrorClass::Cancelled, 1));
}

TEST(RetryPolicyTests, ShouldRetry_ZeroRetriesMeansSingleAttempt) {
    RetryPolicy p;
    p.max_retries = 0;
    EXPECT_FALSE(p.should_retry(ErrorClass::TransientInference, 1));
}

TEST(RetryPolicyTests, Backoff_DoublesAndCaps) {
    RetryPolicy p;
    p.base_delay = milliseconds(100);
    p.max_delay = milliseconds(350);
    p.jitter = false;
    std::mt19937_64 rng(1);
    EXPECT_EQ(p.backoff(1, rng), milliseconds(100));
    EXPECT_EQ(p.backoff(2, rng), milliseconds(200));
    EXPECT_EQ(p.backoff(3, rng), milliseconds(350));
    EXPECT_EQ(p.backoff(30, rng), milliseconds(350));
}

TEST(RetryPolicyTests, Backoff_JitterStaysWithinHalfToFull) {
    RetryPolicy p;
    p.base_delay = milliseconds(1000);
    p.max_delay = milliseconds(30000);
    p.jitter = true;
    std::mt19937_64 rng(42);
    for (int i = 0; i < 200; ++i) {
        auto d = p.backoff(3, rng);
        EXPECT_GE(d, milliseconds(2000));
        EXPECT_LE(d, milliseconds(4000));
    }
}
