/**
 * @file test_webhook_aggregate.cpp
 * @brief Unit tests for the webhook delivery state machine and management commands
 */

#include <gtest/gtest.h>

#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/webhook/domain/model/WebhookAggregate.hpp"
#include "taskcore/webhook/domain/model/WebhookSignature.hpp"
#include "test_helpers.h"

using namespace taskcore::webhook::domain::model;
using namespace taskcore::shared::exception;
using taskcore::shared::domain::AggregateSnapshot;
using taskcore::shared::domain::DomainEvents;
using namespace test_helpers;
using std::chrono::seconds;

// ============================================================================
// Test Fixture
// ============================================================================

class WebhookAggregateTest : public ::testing::Test {
protected:
    WebhookAggregate webhook_ = makeWebhook("webhook-1", 3, 5);
    const WebhookAggregate::TimePoint t0_ = std::chrono::system_clock::now();

    void SetUp() override {
        webhook_.markCommitted();
    }

    DeliveryId trigger(const std::string& eventId, WebhookAggregate::TimePoint at) {
        Json::Value payload(Json::objectValue);
        payload["eventId"] = eventId;
        return webhook_.triggerDelivery(eventId, "TaskStatusChanged", payload, at);
    }

    const WebhookDelivery& delivery(const DeliveryId& id) const {
        return webhook_.getDelivery(id);
    }
};

// ============================================================================
// Registration
// ============================================================================

TEST(WebhookRegistrationTest, Create_AppliesDefaultsAndDeduplicatesEvents) {
    auto webhook = WebhookAggregate::create(
        WebhookId::of("webhook-9"),
        makeRegistration({"TaskCreated", "TaskStatusChanged", "TaskCreated"}),
        "alice");

    EXPECT_EQ(webhook.getStatus(), WebhookStatus::ACTIVE);
    EXPECT_EQ(webhook.getEvents(), (std::vector<std::string>{"TaskCreated", "TaskStatusChanged"}));
    EXPECT_EQ(webhook.getMaxRetries(), 3);
    EXPECT_EQ(webhook.getMaxFailures(), 10);
    EXPECT_EQ(webhook.getWorkspaceId(), "workspace-1");
    ASSERT_EQ(webhook.getUncommittedEvents().size(), 1u);
    EXPECT_EQ(webhook.getUncommittedEvents().front().getEventType(), "WebhookRegistered");
}

TEST(WebhookRegistrationTest, Create_RejectsInvalidFields) {
    auto badUrl = makeRegistration();
    badUrl.url = "ftp://example.com/hook";
    EXPECT_THROW(WebhookAggregate::create(WebhookId::of("w"), badUrl, "alice"), ValidationException);

    auto noEvents = makeRegistration({});
    EXPECT_THROW(WebhookAggregate::create(WebhookId::of("w"), noEvents, "alice"), ValidationException);

    auto shortSecret = makeRegistration();
    shortSecret.secret = "short";
    EXPECT_THROW(WebhookAggregate::create(WebhookId::of("w"), shortSecret, "alice"), ValidationException);

    auto tooManyRetries = makeRegistration({"TaskCreated"}, WebhookRules::MAX_RETRIES_LIMIT + 1);
    EXPECT_THROW(WebhookAggregate::create(WebhookId::of("w"), tooManyRetries, "alice"), ValidationException);
}

// ============================================================================
// Triggering
// ============================================================================

TEST_F(WebhookAggregateTest, TriggerDelivery_OpensSignedPendingDelivery) {
    const DeliveryId id = trigger("event-1", t0_);

    const WebhookDelivery& d = delivery(id);
    EXPECT_EQ(d.status, DeliveryStatus::PENDING);
    EXPECT_EQ(d.attempt, 1);
    EXPECT_EQ(d.eventId, "event-1");
    EXPECT_EQ(d.signature, WebhookSignature::signPayload(webhook_.getSecret(), d.payload));
    EXPECT_EQ(webhook_.getHealth().totalDeliveries, 1);
}

TEST_F(WebhookAggregateTest, TriggerDelivery_RejectsUnsubscribedType) {
    EXPECT_THROW(webhook_.triggerDelivery("event-1", "TaskRemoved", Json::Value(Json::objectValue), t0_),
                 WebhookNotTriggerableException);
    EXPECT_TRUE(webhook_.getDeliveries().empty());
}

TEST_F(WebhookAggregateTest, TriggerDelivery_SameEventOnlyOnce) {
    trigger("event-1", t0_);

    EXPECT_THROW(trigger("event-1", t0_), DuplicateDeliveryException);
    EXPECT_EQ(webhook_.getDeliveries().size(), 1u);
}

TEST_F(WebhookAggregateTest, TriggerDelivery_RejectedWhileSuspended) {
    webhook_.suspend("maintenance");
    EXPECT_THROW(trigger("event-1", t0_), WebhookNotTriggerableException);
}

// ============================================================================
// Outcomes and backoff
// ============================================================================

TEST_F(WebhookAggregateTest, RecordSuccess_ClosesDelivery) {
    const DeliveryId id = trigger("event-1", t0_);

    webhook_.recordSuccess(id, 204, std::nullopt, t0_ + seconds(1));

    EXPECT_EQ(delivery(id).status, DeliveryStatus::SUCCESS);
    EXPECT_EQ(delivery(id).httpStatus, std::optional<int>(204));
    EXPECT_EQ(webhook_.getHealth().successCount, 1);
    EXPECT_DOUBLE_EQ(webhook_.getHealth().successRate(), 100.0);
}

TEST_F(WebhookAggregateTest, MaxRetriesThree_BacksOffThenFails) {
    const DeliveryId id = trigger("event-1", t0_);

    webhook_.recordFailure(id, "HTTP 503", 503, std::nullopt, t0_);
    EXPECT_EQ(delivery(id).status, DeliveryStatus::RETRY_SCHEDULED);
    EXPECT_EQ(*delivery(id).nextRetryAt, t0_ + seconds(60));

    EXPECT_THROW(webhook_.retry(id, t0_ + seconds(59)), RetryNotDueException);
    webhook_.retry(id, t0_ + seconds(60));
    EXPECT_EQ(delivery(id).status, DeliveryStatus::PENDING);
    EXPECT_EQ(delivery(id).attempt, 2);

    const auto t1 = t0_ + seconds(61);
    webhook_.recordFailure(id, "HTTP 503", 503, std::nullopt, t1);
    EXPECT_EQ(*delivery(id).nextRetryAt, t1 + seconds(120));

    webhook_.retry(id, t1 + seconds(120));
    EXPECT_EQ(delivery(id).attempt, 3);
    webhook_.recordFailure(id, "timeout", std::nullopt, std::nullopt, t1 + seconds(121));

    EXPECT_EQ(delivery(id).status, DeliveryStatus::FAILED);
    EXPECT_FALSE(delivery(id).nextRetryAt.has_value());
    EXPECT_EQ(delivery(id).lastError, std::optional<std::string>("timeout"));
    EXPECT_THROW(webhook_.retry(id, t1 + seconds(3600)), RetriesExhaustedException);
    EXPECT_EQ(webhook_.getHealth().failureCount, 3);
}

TEST_F(WebhookAggregateTest, RecordOutcome_TwiceIsInvalid) {
    const DeliveryId id = trigger("event-1", t0_);
    webhook_.recordSuccess(id, 200, std::nullopt, t0_);

    EXPECT_THROW(webhook_.recordSuccess(id, 200, std::nullopt, t0_), InvalidStatusTransitionException);
    EXPECT_THROW(webhook_.recordFailure(id, "late", 500, std::nullopt, t0_), InvalidStatusTransitionException);
}

TEST_F(WebhookAggregateTest, Retry_PendingDeliveryNotRetryable) {
    const DeliveryId id = trigger("event-1", t0_);
    EXPECT_THROW(webhook_.retry(id, t0_), DeliveryNotRetryableException);
    EXPECT_THROW(webhook_.retry(DeliveryId::of("unknown"), t0_), NotFoundException);
}

TEST_F(WebhookAggregateTest, DueRetries_ListsOnlyElapsedSchedules) {
    const DeliveryId first = trigger("event-1", t0_);
    const DeliveryId second = trigger("event-2", t0_);
    webhook_.recordFailure(first, "HTTP 500", 500, std::nullopt, t0_);
    webhook_.recordFailure(second, "HTTP 500", 500, std::nullopt, t0_ + seconds(30));

    auto due = webhook_.dueRetries(t0_ + seconds(60));
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due.front().id, first);
}

// ============================================================================
// Health and suspension
// ============================================================================

TEST_F(WebhookAggregateTest, ConsecutiveFailures_SuspendAutomatically) {
    for (int i = 0; i < 5; ++i) {
        const DeliveryId id = trigger("event-" + std::to_string(i), t0_);
        webhook_.recordFailure(id, "HTTP 500", 500, std::nullopt, t0_);
    }

    EXPECT_EQ(webhook_.getStatus(), WebhookStatus::SUSPENDED);
    EXPECT_EQ(webhook_.getHealth().consecutiveFailures, 5);
    EXPECT_EQ(webhook_.getUncommittedEvents().back().getEventType(), "WebhookSuspended");
    EXPECT_TRUE(webhook_.getUncommittedEvents().back().getPayload()["automatic"].asBool());
}

TEST_F(WebhookAggregateTest, Success_ResetsConsecutiveFailures) {
    const DeliveryId failing = trigger("event-1", t0_);
    webhook_.recordFailure(failing, "HTTP 500", 500, std::nullopt, t0_);
    const DeliveryId ok = trigger("event-2", t0_);
    webhook_.recordSuccess(ok, 200, std::nullopt, t0_);

    EXPECT_EQ(webhook_.getHealth().consecutiveFailures, 0);
    EXPECT_DOUBLE_EQ(webhook_.getHealth().successRate(), 50.0);
}

TEST_F(WebhookAggregateTest, Retry_RequiresActiveWebhook) {
    const DeliveryId id = trigger("event-1", t0_);
    webhook_.recordFailure(id, "HTTP 500", 500, std::nullopt, t0_);
    webhook_.suspend("maintenance");

    EXPECT_THROW(webhook_.retry(id, t0_ + seconds(60)), WebhookNotTriggerableException);

    webhook_.activate("alice");
    EXPECT_NO_THROW(webhook_.retry(id, t0_ + seconds(60)));
}

// ============================================================================
// Management
// ============================================================================

TEST_F(WebhookAggregateTest, StatusTransitions_FollowLifecycle) {
    EXPECT_THROW(webhook_.activate("alice"), InvalidStatusTransitionException);

    webhook_.deactivate("alice");
    EXPECT_EQ(webhook_.getStatus(), WebhookStatus::INACTIVE);
    EXPECT_THROW(webhook_.suspend("why"), InvalidStatusTransitionException);

    webhook_.activate("alice");
    EXPECT_TRUE(webhook_.isActive());
}

TEST_F(WebhookAggregateTest, UpdateUrl_RejectsUnchangedOrInvalid) {
    webhook_.updateUrl("https://hooks.example.com/v2");
    EXPECT_EQ(webhook_.getUrl(), "https://hooks.example.com/v2");

    EXPECT_THROW(webhook_.updateUrl("https://hooks.example.com/v2"), ValidationException);
    EXPECT_THROW(webhook_.updateUrl("not a url"), ValidationException);
}

TEST_F(WebhookAggregateTest, RotateSecret_GeneratesWhenUnset) {
    const std::string previous = webhook_.getSecret();

    const std::string rotated = webhook_.rotateSecret();

    EXPECT_NE(rotated, previous);
    EXPECT_EQ(webhook_.getSecret(), rotated);
    EXPECT_EQ(rotated.size(), 64u);
}

TEST_F(WebhookAggregateTest, Remove_Tombstones) {
    webhook_.remove("alice");

    EXPECT_TRUE(webhook_.isDeleted());
    EXPECT_THROW(webhook_.updateSubscriptions({"TaskCreated"}), AggregateDeletedException);
}

// ============================================================================
// Snapshot and replay
// ============================================================================

TEST_F(WebhookAggregateTest, Snapshot_RestoresDeliveriesAndHealth) {
    const DeliveryId id = trigger("event-1", t0_);
    webhook_.recordFailure(id, "HTTP 502", 502, std::string("bad gateway"), t0_);
    webhook_.markCommitted();

    const auto restored = WebhookAggregate::restoreFromSnapshot(
        AggregateSnapshot::fromJson(webhook_.createSnapshot().toJson()), {});

    EXPECT_EQ(restored.getVersion(), webhook_.getVersion());
    ASSERT_EQ(restored.getDeliveries().size(), 1u);
    const WebhookDelivery& d = restored.getDelivery(id);
    EXPECT_EQ(d.status, DeliveryStatus::RETRY_SCHEDULED);
    EXPECT_EQ(d.responseBody, std::optional<std::string>("bad gateway"));
    EXPECT_TRUE(d.nextRetryAt.has_value());
    EXPECT_EQ(restored.getHealth().failureCount, 1);
    EXPECT_EQ(restored.getSecret(), webhook_.getSecret());
}

TEST(WebhookHistoryTest, FromHistory_ReplaysStateMachine) {
    auto webhook = makeWebhook("webhook-h", 2);
    DomainEvents history = webhook.getUncommittedEvents();
    webhook.markCommitted();

    const auto now = std::chrono::system_clock::now();
    const DeliveryId id = webhook.triggerDelivery("event-1", "TaskStatusChanged",
                                                  Json::Value(Json::objectValue), now);
    webhook.recordFailure(id, "HTTP 500", 500, std::nullopt, now);
    history.insert(history.end(), webhook.getUncommittedEvents().begin(), webhook.getUncommittedEvents().end());
    webhook.markCommitted();

    const auto replayed = WebhookAggregate::fromHistory(WebhookId::of("webhook-h"), history);

    EXPECT_EQ(replayed.getVersion(), 2);
    EXPECT_EQ(replayed.getDelivery(id).status, DeliveryStatus::RETRY_SCHEDULED);
    EXPECT_EQ(replayed.getHealth().consecutiveFailures, 1);
}
