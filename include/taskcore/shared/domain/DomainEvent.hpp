/**
 * @file DomainEvent.hpp
 * @brief Immutable record of something that happened to an aggregate
 */

#pragma once

#include <json/json.h>

#include <chrono>
#include <string>
#include <vector>

namespace taskcore::shared::domain {

/**
 * @brief Domain event envelope
 *
 * Every event type shares this record shape. The payload is structured data
 * specific to the event type; subscribers deduplicate on the event id because
 * publication is at-least-once.
 */
class DomainEvent {
private:
    std::string eventId_;
    std::string aggregateId_;
    std::string aggregateType_;
    int aggregateVersion_;
    std::chrono::system_clock::time_point occurredAt_;
    std::string eventType_;
    Json::Value payload_;

public:
    DomainEvent(std::string eventId,
                std::string aggregateId,
                std::string aggregateType,
                int aggregateVersion,
                std::chrono::system_clock::time_point occurredAt,
                std::string eventType,
                Json::Value payload)
        : eventId_(std::move(eventId)),
          aggregateId_(std::move(aggregateId)),
          aggregateType_(std::move(aggregateType)),
          aggregateVersion_(aggregateVersion),
          occurredAt_(occurredAt),
          eventType_(std::move(eventType)),
          payload_(std::move(payload)) {}

    [[nodiscard]] const std::string& getEventId() const noexcept { return eventId_; }
    [[nodiscard]] const std::string& getAggregateId() const noexcept { return aggregateId_; }
    [[nodiscard]] const std::string& getAggregateType() const noexcept { return aggregateType_; }

    /**
     * @brief Version the aggregate reaches once the batch holding this event commits
     */
    [[nodiscard]] int getAggregateVersion() const noexcept { return aggregateVersion_; }

    [[nodiscard]] std::chrono::system_clock::time_point getOccurredAt() const noexcept { return occurredAt_; }
    [[nodiscard]] const std::string& getEventType() const noexcept { return eventType_; }
    [[nodiscard]] const Json::Value& getPayload() const noexcept { return payload_; }

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @throws shared::exception::DomainException (INVALID_EVENT_RECORD) on malformed input
     */
    static DomainEvent fromJson(const Json::Value& json);
};

using DomainEvents = std::vector<DomainEvent>;

/**
 * @brief Event raised by a mutator before the aggregate stamps its envelope
 */
struct PendingEvent {
    std::string eventType;
    Json::Value payload;
};

/**
 * @brief Wrap a typed event (exposing TYPE and toPayload()) for registration
 */
template<typename TypedEvent>
PendingEvent raise(const TypedEvent& event) {
    return PendingEvent{TypedEvent::TYPE, event.toPayload()};
}

} // namespace taskcore::shared::domain
