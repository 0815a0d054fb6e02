/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for exponential webhook retry backoff
 */

#include <gtest/gtest.h>

#include "taskcore/shared/config/EngineConfig.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/webhook/domain/model/RetryPolicy.hpp"

#include <stdexcept>

using namespace taskcore::webhook::domain::model;
using taskcore::shared::exception::DomainException;
using std::chrono::seconds;

TEST(RetryPolicyTest, DelayFor_DoublesFromBase) {
    RetryPolicy policy;

    EXPECT_EQ(policy.delayFor(1), seconds(60));
    EXPECT_EQ(policy.delayFor(2), seconds(120));
    EXPECT_EQ(policy.delayFor(3), seconds(240));
}

TEST(RetryPolicyTest, DelayFor_CappedAtMaximum) {
    RetryPolicy policy(seconds(60), seconds(300));

    EXPECT_EQ(policy.delayFor(4), seconds(300));
    EXPECT_EQ(policy.delayFor(1000), seconds(300));
}

TEST(RetryPolicyTest, DelayFor_RejectsZeroAttempt) {
    EXPECT_THROW(RetryPolicy().delayFor(0), std::invalid_argument);
}

TEST(RetryPolicyTest, Decide_RetriesWhileAttemptsRemain) {
    RetryPolicy policy;
    const auto failedAt = std::chrono::system_clock::now();

    auto retry = policy.decide(2, 3, failedAt);
    EXPECT_TRUE(retry.retry);
    EXPECT_EQ(retry.delay, seconds(120));
    ASSERT_TRUE(retry.nextRetryAt.has_value());
    EXPECT_EQ(*retry.nextRetryAt, failedAt + seconds(120));

    auto giveUp = policy.decide(3, 3, failedAt);
    EXPECT_FALSE(giveUp.retry);
    EXPECT_FALSE(giveUp.nextRetryAt.has_value());
}

TEST(RetryPolicyTest, Constructor_RejectsInvertedBounds) {
    EXPECT_THROW(RetryPolicy(seconds(0), seconds(10)), DomainException);
    EXPECT_THROW(RetryPolicy(seconds(600), seconds(60)), DomainException);
}

TEST(RetryPolicyTest, FromConfig_UsesConfiguredDelays) {
    taskcore::shared::config::EngineConfig config;
    config.webhookBaseDelaySeconds = 5;
    config.webhookMaxDelaySeconds = 20;

    auto policy = RetryPolicy::fromConfig(config);

    EXPECT_EQ(policy.getBaseDelay(), seconds(5));
    EXPECT_EQ(policy.delayFor(3), seconds(20));
}
