/**
 * @file WebhookAggregate.cpp
 * @brief Webhook delivery state machine, management commands and replay
 */

#include "taskcore/webhook/domain/model/WebhookAggregate.hpp"
#include "taskcore/webhook/domain/model/WebhookSignature.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"
#include "taskcore/shared/util/TimeUtil.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>
#include <variant>

namespace taskcore::webhook::domain::model {

using namespace shared::exception;
using shared::domain::AggregateSnapshot;
using shared::domain::DomainEvents;
using shared::domain::PendingEvent;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::vector<std::string> uniqueInOrder(std::vector<std::string> values) {
    std::set<std::string> seen;
    std::vector<std::string> unique;
    for (auto& value : values) {
        if (seen.insert(value).second) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

} // namespace

WebhookAggregate::WebhookAggregate(WebhookId webhookId, WebhookRules rules)
    : AggregateRoot<WebhookId>(std::move(webhookId)),
      rules_(rules) {}

// ========================================================================
// Lifecycle
// ========================================================================

WebhookAggregate WebhookAggregate::create(WebhookId webhookId, Registration registration,
                                          const std::string& createdBy, WebhookRules rules) {
    WebhookAggregate aggregate(std::move(webhookId), rules);
    const auto now = std::chrono::system_clock::now();

    aggregate.applyChange(aggregate.state_, [&](State& state) {
        event::WebhookRegistered registered;
        registered.webhookId = aggregate.aggregateId();
        registered.workspaceId = WorkspaceId::of(registration.workspaceId).toString();
        registered.name = registration.name;
        registered.url = registration.url;
        registered.events = uniqueInOrder(registration.events);
        registered.headers = registration.headers;
        registered.secret = registration.secret;
        registered.maxRetries = registration.maxRetries.value_or(aggregate.rules_.defaultMaxRetries);
        registered.maxFailures = registration.maxFailures.value_or(aggregate.rules_.defaultMaxFailures);
        registered.createdBy = createdBy;

        WebhookRules::validateName(registered.name);
        WebhookRules::validateUrl(registered.url);
        WebhookRules::validateEventTypes(registered.events);
        if (!registered.secret.empty()) {
            WebhookRules::validateSecret(registered.secret);
        }
        WebhookRules::validateLimits(registered.maxRetries, registered.maxFailures);

        return std::vector<PendingEvent>{emit(state, registered, now)};
    }, now);

    return aggregate;
}

WebhookAggregate WebhookAggregate::restoreFromSnapshot(const AggregateSnapshot& snapshot,
                                                       const DomainEvents& eventsSince,
                                                       WebhookRules rules) {
    if (snapshot.aggregateType != AGGREGATE_TYPE) {
        throw DomainException("SNAPSHOT_TYPE_MISMATCH",
            "Snapshot of " + snapshot.aggregateType + " cannot restore a " + AGGREGATE_TYPE);
    }
    if (snapshot.schemaVersion != SNAPSHOT_SCHEMA_VERSION) {
        throw DomainException("UNSUPPORTED_SNAPSHOT_SCHEMA",
            "Unsupported webhook snapshot schema " + std::to_string(snapshot.schemaVersion));
    }

    const Json::Value& json = snapshot.state;
    WebhookAggregate aggregate(WebhookId::of(snapshot.aggregateId), rules);
    State& state = aggregate.state_;
    state.workspaceId = shared::util::requireString(json, "workspaceId");
    state.name = shared::util::requireString(json, "name");
    state.url = shared::util::requireString(json, "url");
    for (const auto& type : json["events"]) {
        state.events.push_back(type.asString());
    }
    for (const auto& header : json["headers"].getMemberNames()) {
        state.headers[header] = json["headers"][header].asString();
    }
    state.secret = shared::util::optionalString(json, "secret").value_or("");
    try {
        state.status = parseWebhookStatus(shared::util::requireString(json, "status"));
    } catch (const std::invalid_argument& e) {
        throw DomainException("INVALID_SNAPSHOT", e.what());
    }
    state.maxRetries = shared::util::requireInt(json, "maxRetries");
    state.maxFailures = shared::util::requireInt(json, "maxFailures");
    state.health = WebhookHealth::fromJson(json["health"]);
    for (const auto& deliveryJson : json["deliveries"]) {
        state.deliveries.push_back(WebhookDelivery::fromJson(deliveryJson));
    }

    aggregate.setVersion(snapshot.version);
    aggregate.restoreDeleted(json.get("deleted", false).asBool());
    const auto createdAt = shared::util::optionalTime(json, "createdAt");
    const auto updatedAt = shared::util::optionalTime(json, "updatedAt");
    if (createdAt && updatedAt) {
        aggregate.restoreTimestamps(*createdAt, *updatedAt);
    }

    aggregate.replay(eventsSince, snapshot.version);
    aggregate.checkInvariants();
    return aggregate;
}

WebhookAggregate WebhookAggregate::fromHistory(const WebhookId& webhookId, const DomainEvents& history,
                                               WebhookRules rules) {
    WebhookAggregate aggregate(webhookId, rules);
    aggregate.replay(history, 0);
    aggregate.checkInvariants();
    return aggregate;
}

AggregateSnapshot WebhookAggregate::createSnapshot() const {
    Json::Value json(Json::objectValue);
    json["workspaceId"] = state_.workspaceId;
    json["name"] = state_.name;
    json["url"] = state_.url;
    json["events"] = stringArray(state_.events);
    json["headers"] = Json::Value(Json::objectValue);
    for (const auto& [header, value] : state_.headers) {
        json["headers"][header] = value;
    }
    json["secret"] = state_.secret;
    json["status"] = toString(state_.status);
    json["maxRetries"] = state_.maxRetries;
    json["maxFailures"] = state_.maxFailures;
    json["health"] = state_.health.toJson();
    json["deliveries"] = Json::Value(Json::arrayValue);
    for (const auto& delivery : state_.deliveries) {
        json["deliveries"].append(delivery.toJson());
    }
    json["deleted"] = isDeleted();
    json["createdAt"] = shared::util::formatIso8601(getCreatedAt());
    json["updatedAt"] = shared::util::formatIso8601(getUpdatedAt());

    AggregateSnapshot snapshot;
    snapshot.aggregateType = AGGREGATE_TYPE;
    snapshot.aggregateId = aggregateId();
    snapshot.schemaVersion = SNAPSHOT_SCHEMA_VERSION;
    snapshot.version = getNextVersion();
    snapshot.state = std::move(json);
    snapshot.takenAt = std::chrono::system_clock::now();
    return snapshot;
}

void WebhookAggregate::replay(const DomainEvents& events, int afterVersion) {
    for (const auto& stored : events) {
        if (stored.getAggregateVersion() <= afterVersion) {
            continue;
        }
        if (stored.getAggregateId() != aggregateId()) {
            throw DomainException("FOREIGN_EVENT",
                "Event " + stored.getEventId() + " belongs to aggregate " + stored.getAggregateId());
        }
        if (stored.getAggregateVersion() < getVersion()) {
            throw DomainException("EVENT_OUT_OF_ORDER",
                "Event " + stored.getEventId() + " has version " +
                std::to_string(stored.getAggregateVersion()) + " below " + std::to_string(getVersion()));
        }

        const event::WebhookEvent typed = event::decodeWebhookEvent(stored);
        if (std::holds_alternative<event::WebhookRemoved>(typed)) {
            restoreDeleted(true);
        } else {
            applyEvent(state_, typed, stored.getOccurredAt());
        }
        if (std::holds_alternative<event::WebhookRegistered>(typed)) {
            restoreTimestamps(stored.getOccurredAt(), stored.getOccurredAt());
        } else {
            restoreTimestamps(getCreatedAt(), stored.getOccurredAt());
        }
        setVersion(stored.getAggregateVersion());
    }
}

// ========================================================================
// Event application
// ========================================================================

WebhookDelivery& WebhookAggregate::deliveryIn(State& state, const std::string& deliveryId) {
    auto it = std::find_if(state.deliveries.begin(), state.deliveries.end(),
                           [&](const WebhookDelivery& d) { return d.id.toString() == deliveryId; });
    if (it == state.deliveries.end()) {
        throw NotFoundException("Delivery " + deliveryId + " not found");
    }
    return *it;
}

void WebhookAggregate::applyEvent(State& state, const event::WebhookEvent& webhookEvent, TimePoint at) {
    std::visit(overloaded{
        [&](const event::WebhookRegistered& e) {
            state.workspaceId = e.workspaceId;
            state.name = e.name;
            state.url = e.url;
            state.events = e.events;
            state.headers = e.headers;
            state.secret = e.secret;
            state.status = WebhookStatus::ACTIVE;
            state.maxRetries = e.maxRetries;
            state.maxFailures = e.maxFailures;
        },
        [&](const event::WebhookDeliveryTriggered& e) {
            WebhookDelivery delivery(DeliveryId::of(e.deliveryId), e.eventId, e.eventType);
            delivery.payload = e.payload;
            delivery.signature = e.signature;
            delivery.createdAt = at;
            state.deliveries.push_back(std::move(delivery));
            ++state.health.totalDeliveries;
            state.health.lastTriggeredAt = at;
        },
        [&](const event::WebhookDeliverySucceeded& e) {
            WebhookDelivery& delivery = deliveryIn(state, e.deliveryId);
            delivery.status = DeliveryStatus::SUCCESS;
            delivery.attempt = e.attempt;
            delivery.httpStatus = e.httpStatus;
            delivery.responseBody = e.responseBody;
            delivery.nextRetryAt.reset();
            delivery.lastAttemptAt = at;
            delivery.deliveredAt = at;
            ++state.health.successCount;
            state.health.consecutiveFailures = 0;
            state.health.lastSuccessAt = at;
        },
        [&](const event::WebhookDeliveryFailed& e) {
            WebhookDelivery& delivery = deliveryIn(state, e.deliveryId);
            delivery.status = e.nextRetryAt ? DeliveryStatus::RETRY_SCHEDULED : DeliveryStatus::FAILED;
            delivery.attempt = e.attempt;
            delivery.nextRetryAt = e.nextRetryAt;
            delivery.lastError = e.error;
            delivery.httpStatus = e.httpStatus;
            delivery.responseBody = e.responseBody;
            delivery.lastAttemptAt = at;
            ++state.health.failureCount;
            ++state.health.consecutiveFailures;
            state.health.lastFailureAt = at;
            state.health.lastFailureReason = e.error;
        },
        [&](const event::WebhookDeliveryRetried& e) {
            WebhookDelivery& delivery = deliveryIn(state, e.deliveryId);
            delivery.status = DeliveryStatus::PENDING;
            delivery.attempt = e.attempt;
            delivery.nextRetryAt.reset();
        },
        [&](const event::WebhookSuspended&) {
            state.status = WebhookStatus::SUSPENDED;
        },
        [&](const event::WebhookActivated&) {
            state.status = WebhookStatus::ACTIVE;
            state.health.consecutiveFailures = 0;
        },
        [&](const event::WebhookDeactivated&) {
            state.status = WebhookStatus::INACTIVE;
        },
        [&](const event::WebhookUrlChanged& e) {
            state.url = e.url;
        },
        [&](const event::WebhookSubscriptionsChanged& e) {
            state.events = e.events;
        },
        [&](const event::WebhookSecretRotated& e) {
            state.secret = e.secret;
        },
        [&](const event::WebhookRemoved&) {
            // Tombstone only
        },
    }, webhookEvent);
}

// ========================================================================
// Delivery state machine
// ========================================================================

DeliveryId WebhookAggregate::triggerDelivery(const std::string& eventId, const std::string& eventType,
                                             const Json::Value& payload, TimePoint now) {
    const DeliveryId deliveryId = DeliveryId::generate();

    applyChange(state_, [&](State& state) {
        if (state.status != WebhookStatus::ACTIVE) {
            throw WebhookNotTriggerableException(
                "Webhook " + aggregateId() + " is " + toString(state.status));
        }
        if (std::find(state.events.begin(), state.events.end(), eventType) == state.events.end()) {
            throw WebhookNotTriggerableException(
                "Webhook " + aggregateId() + " is not subscribed to " + eventType);
        }
        if (hasDeliveryFor(eventId)) {
            throw DuplicateDeliveryException(
                "Webhook " + aggregateId() + " already has a delivery for event " + eventId);
        }

        event::WebhookDeliveryTriggered triggered;
        triggered.webhookId = aggregateId();
        triggered.deliveryId = deliveryId.toString();
        triggered.eventId = eventId;
        triggered.eventType = eventType;
        triggered.payload = payload;
        if (!state.secret.empty()) {
            triggered.signature = WebhookSignature::signPayload(state.secret, payload);
        }
        return std::vector<PendingEvent>{emit(state, triggered, now)};
    }, now);

    return deliveryId;
}

void WebhookAggregate::recordSuccess(const DeliveryId& deliveryId, int httpStatus,
                                     std::optional<std::string> responseBody, TimePoint now) {
    applyChange(state_, [&](State& state) {
        const WebhookDelivery& delivery = deliveryIn(state, deliveryId.toString());
        if (!delivery.isPending()) {
            throw InvalidStatusTransitionException(
                "Delivery " + deliveryId.toString() + " is " + toString(delivery.status) +
                "; only PENDING deliveries can record an outcome");
        }
        event::WebhookDeliverySucceeded succeeded{deliveryId.toString(), delivery.attempt, httpStatus,
                                                  std::move(responseBody)};
        return std::vector<PendingEvent>{emit(state, succeeded, now)};
    }, now);
}

void WebhookAggregate::recordFailure(const DeliveryId& deliveryId, const std::string& error,
                                     std::optional<int> httpStatus, std::optional<std::string> responseBody,
                                     TimePoint now) {
    applyChange(state_, [&](State& state) {
        const WebhookDelivery& delivery = deliveryIn(state, deliveryId.toString());
        if (!delivery.isPending()) {
            throw InvalidStatusTransitionException(
                "Delivery " + deliveryId.toString() + " is " + toString(delivery.status) +
                "; only PENDING deliveries can record an outcome");
        }

        const auto decision = rules_.retryPolicy.decide(delivery.attempt, state.maxRetries, now);

        event::WebhookDeliveryFailed failed;
        failed.deliveryId = deliveryId.toString();
        failed.attempt = delivery.attempt;
        failed.error = error;
        failed.httpStatus = httpStatus;
        failed.responseBody = std::move(responseBody);
        failed.nextRetryAt = decision.nextRetryAt;

        std::vector<PendingEvent> events;
        events.push_back(emit(state, failed, now));

        if (state.status == WebhookStatus::ACTIVE && state.health.consecutiveFailures >= state.maxFailures) {
            event::WebhookSuspended suspended;
            suspended.webhookId = aggregateId();
            suspended.reason = std::to_string(state.health.consecutiveFailures) + " consecutive delivery failures";
            suspended.consecutiveFailures = state.health.consecutiveFailures;
            suspended.automatic = true;
            events.push_back(emit(state, suspended, now));
        }
        return events;
    }, now);
}

void WebhookAggregate::retry(const DeliveryId& deliveryId, TimePoint now) {
    applyChange(state_, [&](State& state) {
        const WebhookDelivery& delivery = deliveryIn(state, deliveryId.toString());
        if (delivery.status == DeliveryStatus::FAILED) {
            throw RetriesExhaustedException(
                "Delivery " + deliveryId.toString() + " failed after " +
                std::to_string(delivery.attempt) + " attempt(s)");
        }
        if (delivery.status != DeliveryStatus::RETRY_SCHEDULED) {
            throw DeliveryNotRetryableException(
                "Delivery " + deliveryId.toString() + " is " + toString(delivery.status));
        }
        if (state.status != WebhookStatus::ACTIVE) {
            throw WebhookNotTriggerableException(
                "Webhook " + aggregateId() + " is " + toString(state.status));
        }
        if (!delivery.isDueForRetry(now)) {
            throw RetryNotDueException(
                "Delivery " + deliveryId.toString() + " is not due before " +
                shared::util::formatIso8601(*delivery.nextRetryAt));
        }

        event::WebhookDeliveryRetried retried{deliveryId.toString(), delivery.attempt + 1};
        return std::vector<PendingEvent>{emit(state, retried, now)};
    }, now);
}

// ========================================================================
// Management
// ========================================================================

void WebhookAggregate::ensureTransition(const State& state, WebhookStatus to) {
    if (!isValidTransition(state.status, to)) {
        throw InvalidStatusTransitionException(
            "Webhook cannot move from " + toString(state.status) + " to " + toString(to));
    }
}

void WebhookAggregate::activate(const std::string& activatedBy) {
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        ensureTransition(state, WebhookStatus::ACTIVE);
        return std::vector<PendingEvent>{emit(state, event::WebhookActivated{aggregateId(), activatedBy}, now)};
    }, now);
}

void WebhookAggregate::suspend(const std::string& reason) {
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        ensureTransition(state, WebhookStatus::SUSPENDED);
        event::WebhookSuspended suspended{aggregateId(), reason, state.health.consecutiveFailures, false};
        return std::vector<PendingEvent>{emit(state, suspended, now)};
    }, now);
}

void WebhookAggregate::deactivate(const std::string& deactivatedBy) {
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        ensureTransition(state, WebhookStatus::INACTIVE);
        return std::vector<PendingEvent>{emit(state, event::WebhookDeactivated{aggregateId(), deactivatedBy}, now)};
    }, now);
}

void WebhookAggregate::updateUrl(const std::string& url) {
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        WebhookRules::validateUrl(url);
        if (url == state.url) {
            throw ValidationException("url", "Webhook URL is unchanged");
        }
        event::WebhookUrlChanged changed{aggregateId(), url, state.url};
        return std::vector<PendingEvent>{emit(state, changed, now)};
    }, now);
}

void WebhookAggregate::updateSubscriptions(std::vector<std::string> events) {
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        std::vector<std::string> unique = uniqueInOrder(std::move(events));
        WebhookRules::validateEventTypes(unique);
        event::WebhookSubscriptionsChanged changed{aggregateId(), std::move(unique)};
        return std::vector<PendingEvent>{emit(state, changed, now)};
    }, now);
}

std::string WebhookAggregate::rotateSecret(std::optional<std::string> secret) {
    const std::string newSecret = secret ? *secret : WebhookSignature::generateSecret();
    const auto now = std::chrono::system_clock::now();
    applyChange(state_, [&](State& state) {
        WebhookRules::validateSecret(newSecret);
        return std::vector<PendingEvent>{emit(state, event::WebhookSecretRotated{aggregateId(), newSecret}, now)};
    }, now);
    return newSecret;
}

void WebhookAggregate::remove(const std::string& removedBy) {
    markDeleted(shared::domain::raise(event::WebhookRemoved{aggregateId(), removedBy}));
}

// ========================================================================
// Queries
// ========================================================================

bool WebhookAggregate::isSubscribedTo(const std::string& eventType) const {
    return std::find(state_.events.begin(), state_.events.end(), eventType) != state_.events.end();
}

bool WebhookAggregate::hasDeliveryFor(const std::string& eventId) const {
    return std::any_of(state_.deliveries.begin(), state_.deliveries.end(),
                       [&](const WebhookDelivery& d) { return d.eventId == eventId; });
}

const WebhookDelivery* WebhookAggregate::findDelivery(const DeliveryId& deliveryId) const {
    for (const auto& delivery : state_.deliveries) {
        if (delivery.id == deliveryId) {
            return &delivery;
        }
    }
    return nullptr;
}

const WebhookDelivery& WebhookAggregate::getDelivery(const DeliveryId& deliveryId) const {
    const WebhookDelivery* delivery = findDelivery(deliveryId);
    if (delivery == nullptr) {
        throw NotFoundException("Delivery " + deliveryId.toString() + " not found on webhook " + aggregateId());
    }
    return *delivery;
}

std::vector<WebhookDelivery> WebhookAggregate::pendingDeliveries() const {
    std::vector<WebhookDelivery> pending;
    std::copy_if(state_.deliveries.begin(), state_.deliveries.end(), std::back_inserter(pending),
                 [](const WebhookDelivery& d) { return d.isPending(); });
    return pending;
}

std::vector<WebhookDelivery> WebhookAggregate::dueRetries(TimePoint now) const {
    std::vector<WebhookDelivery> due;
    std::copy_if(state_.deliveries.begin(), state_.deliveries.end(), std::back_inserter(due),
                 [now](const WebhookDelivery& d) { return d.isDueForRetry(now); });
    return due;
}

// ========================================================================
// Invariants
// ========================================================================

void WebhookAggregate::checkInvariants() const {
    std::set<std::string> ids;
    std::set<std::string> sourceEvents;
    for (const auto& delivery : state_.deliveries) {
        const std::string& id = delivery.id.toString();
        if (!ids.insert(id).second) {
            throw InvariantViolationException("Duplicate delivery id " + id);
        }
        if (!sourceEvents.insert(delivery.eventId).second) {
            throw DuplicateDeliveryException("Event " + delivery.eventId + " is delivered more than once");
        }
        if (delivery.attempt < 1 || delivery.attempt > state_.maxRetries + 1) {
            throw InvariantViolationException(
                "Delivery " + id + " is on attempt " + std::to_string(delivery.attempt) +
                " with maxRetries " + std::to_string(state_.maxRetries));
        }
        const bool scheduled = delivery.status == DeliveryStatus::RETRY_SCHEDULED;
        if (scheduled != delivery.nextRetryAt.has_value()) {
            throw InvariantViolationException(
                "Delivery " + id + " in status " + toString(delivery.status) +
                (scheduled ? " has no retry time" : " has a retry time"));
        }
        if (scheduled && (!delivery.lastAttemptAt || *delivery.nextRetryAt <= *delivery.lastAttemptAt)) {
            throw InvariantViolationException(
                "Delivery " + id + " retry must be scheduled after its failed attempt");
        }
    }
}

} // namespace taskcore::webhook::domain::model
