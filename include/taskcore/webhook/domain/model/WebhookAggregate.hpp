/**
 * @file WebhookAggregate.hpp
 * @brief Webhook aggregate root: one subscription and its delivery history
 */

#pragma once

#include "RetryPolicy.hpp"
#include "WebhookDelivery.hpp"
#include "WebhookHealth.hpp"
#include "WebhookId.hpp"
#include "WebhookRules.hpp"
#include "WebhookStatus.hpp"
#include "taskcore/shared/domain/AggregateRoot.hpp"
#include "taskcore/shared/domain/Snapshot.hpp"
#include "taskcore/webhook/domain/event/WebhookEvents.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskcore::webhook::domain::model {

/**
 * @brief Consistency boundary for a webhook and its deliveries
 *
 * Invariants:
 * - every delivery's attempt lies in [1, maxRetries + 1];
 * - nextRetryAt is set exactly on RETRY_SCHEDULED deliveries and is strictly
 *   later than the failed attempt that scheduled it;
 * - delivery ids are unique and each source event is delivered at most once.
 *
 * Outcomes can only be recorded for PENDING deliveries, so a duplicated
 * success or failure report cannot produce a second side effect.
 */
class WebhookAggregate : public shared::domain::AggregateRoot<WebhookId> {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static constexpr const char* AGGREGATE_TYPE = "Webhook";
    static constexpr int SNAPSHOT_SCHEMA_VERSION = 1;

    struct Registration {
        std::string workspaceId;
        std::string name;
        std::string url;
        std::vector<std::string> events;
        std::map<std::string, std::string> headers;
        std::string secret;                 ///< Empty to send unsigned deliveries
        std::optional<int> maxRetries;      ///< rules.defaultMaxRetries when unset
        std::optional<int> maxFailures;     ///< rules.defaultMaxFailures when unset
    };

    /// @name Lifecycle

    /**
     * @throws shared::exception::ValidationException on invalid fields
     */
    static WebhookAggregate create(WebhookId webhookId, Registration registration, const std::string& createdBy,
                                   WebhookRules rules = {});

    static WebhookAggregate restoreFromSnapshot(const shared::domain::AggregateSnapshot& snapshot,
                                                const shared::domain::DomainEvents& eventsSince,
                                                WebhookRules rules = {});

    static WebhookAggregate fromHistory(const WebhookId& webhookId,
                                        const shared::domain::DomainEvents& history,
                                        WebhookRules rules = {});

    [[nodiscard]] shared::domain::AggregateSnapshot createSnapshot() const;

    /// @name Delivery state machine

    /**
     * @brief Open a PENDING delivery for a domain event
     *
     * @param payload Body to send; signed with the webhook secret
     * @throws shared::exception::WebhookNotTriggerableException unless ACTIVE and subscribed
     * @throws shared::exception::DuplicateDeliveryException if eventId was already delivered
     */
    DeliveryId triggerDelivery(const std::string& eventId, const std::string& eventType,
                               const Json::Value& payload, TimePoint now = std::chrono::system_clock::now());

    /**
     * @throws shared::exception::InvalidStatusTransitionException unless the delivery is PENDING
     */
    void recordSuccess(const DeliveryId& deliveryId, int httpStatus,
                       std::optional<std::string> responseBody = std::nullopt,
                       TimePoint now = std::chrono::system_clock::now());

    /**
     * @brief Record a failed attempt and schedule the next one if any remain
     *
     * While attempt < maxRetries the delivery becomes RETRY_SCHEDULED with
     * the backoff of the retry policy; otherwise it is terminally FAILED.
     * Reaching maxFailures consecutive failures suspends an ACTIVE webhook.
     * @throws shared::exception::InvalidStatusTransitionException unless the delivery is PENDING
     */
    void recordFailure(const DeliveryId& deliveryId, const std::string& error,
                       std::optional<int> httpStatus = std::nullopt,
                       std::optional<std::string> responseBody = std::nullopt,
                       TimePoint now = std::chrono::system_clock::now());

    /**
     * @brief RETRY_SCHEDULED -> PENDING with the next attempt number
     *
     * @throws shared::exception::RetriesExhaustedException on a FAILED delivery
     * @throws shared::exception::DeliveryNotRetryableException on PENDING or SUCCESS
     * @throws shared::exception::RetryNotDueException before nextRetryAt
     * @throws shared::exception::WebhookNotTriggerableException unless ACTIVE
     */
    void retry(const DeliveryId& deliveryId, TimePoint now = std::chrono::system_clock::now());

    /// @name Management

    void activate(const std::string& activatedBy);
    void suspend(const std::string& reason);
    void deactivate(const std::string& deactivatedBy);
    void updateUrl(const std::string& url);
    void updateSubscriptions(std::vector<std::string> events);

    /**
     * @param secret New secret; a random one is generated when unset
     * @return The secret now in use
     */
    std::string rotateSecret(std::optional<std::string> secret = std::nullopt);

    void remove(const std::string& removedBy);

    /// @name Queries

    [[nodiscard]] const std::string& getWorkspaceId() const noexcept { return state_.workspaceId; }
    [[nodiscard]] const std::string& getName() const noexcept { return state_.name; }
    [[nodiscard]] const std::string& getUrl() const noexcept { return state_.url; }
    [[nodiscard]] const std::vector<std::string>& getEvents() const noexcept { return state_.events; }
    [[nodiscard]] const std::map<std::string, std::string>& getHeaders() const noexcept { return state_.headers; }
    [[nodiscard]] const std::string& getSecret() const noexcept { return state_.secret; }
    [[nodiscard]] bool hasSecret() const noexcept { return !state_.secret.empty(); }
    [[nodiscard]] WebhookStatus getStatus() const noexcept { return state_.status; }
    [[nodiscard]] bool isActive() const noexcept { return state_.status == WebhookStatus::ACTIVE; }
    [[nodiscard]] int getMaxRetries() const noexcept { return state_.maxRetries; }
    [[nodiscard]] int getMaxFailures() const noexcept { return state_.maxFailures; }
    [[nodiscard]] const WebhookHealth& getHealth() const noexcept { return state_.health; }
    [[nodiscard]] const WebhookRules& getRules() const noexcept { return rules_; }
    [[nodiscard]] const std::vector<WebhookDelivery>& getDeliveries() const noexcept { return state_.deliveries; }

    [[nodiscard]] bool isSubscribedTo(const std::string& eventType) const;
    [[nodiscard]] bool hasDeliveryFor(const std::string& eventId) const;

    [[nodiscard]] const WebhookDelivery* findDelivery(const DeliveryId& deliveryId) const;

    /**
     * @throws shared::exception::NotFoundException
     */
    [[nodiscard]] const WebhookDelivery& getDelivery(const DeliveryId& deliveryId) const;

    [[nodiscard]] std::vector<WebhookDelivery> pendingDeliveries() const;

    /**
     * @brief RETRY_SCHEDULED deliveries whose nextRetryAt is not after `now`
     */
    [[nodiscard]] std::vector<WebhookDelivery> dueRetries(TimePoint now) const;

    /// @name AggregateRootBase

    [[nodiscard]] std::string aggregateType() const override { return AGGREGATE_TYPE; }
    void checkInvariants() const override;

private:
    struct State {
        std::string workspaceId;
        std::string name;
        std::string url;
        std::vector<std::string> events;
        std::map<std::string, std::string> headers;
        std::string secret;
        WebhookStatus status = WebhookStatus::ACTIVE;
        int maxRetries = 3;
        int maxFailures = 10;
        WebhookHealth health;
        std::vector<WebhookDelivery> deliveries;
    };

    State state_;
    WebhookRules rules_;

    WebhookAggregate(WebhookId webhookId, WebhookRules rules);

    static void applyEvent(State& state, const event::WebhookEvent& event, TimePoint at);

    template<typename E>
    static shared::domain::PendingEvent emit(State& state, const E& event, TimePoint at) {
        applyEvent(state, event::WebhookEvent{event}, at);
        return shared::domain::raise(event);
    }

    static WebhookDelivery& deliveryIn(State& state, const std::string& deliveryId);
    static void ensureTransition(const State& state, WebhookStatus to);
    void replay(const shared::domain::DomainEvents& events, int afterVersion);
};

} // namespace taskcore::webhook::domain::model
