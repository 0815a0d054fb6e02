/**
 * @file WebhookDelivery.hpp
 * @brief One outbound notification of a webhook
 */

#pragma once

#include "WebhookId.hpp"
#include "WebhookStatus.hpp"

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>

namespace taskcore::webhook::domain::model {

/**
 * @brief Delivery record, owned by WebhookAggregate
 *
 * Moves PENDING -> SUCCESS, or PENDING -> RETRY_SCHEDULED -> PENDING -> ...
 * until the retries are spent and it ends FAILED. `attempt` is 1-based.
 */
struct WebhookDelivery {
    using TimePoint = std::chrono::system_clock::time_point;

    DeliveryId id;
    std::string eventId;
    std::string eventType;
    Json::Value payload{Json::objectValue};
    std::string signature;  ///< Empty when the webhook has no secret
    DeliveryStatus status = DeliveryStatus::PENDING;
    int attempt = 1;
    std::optional<TimePoint> nextRetryAt;
    std::optional<TimePoint> lastAttemptAt;
    std::optional<std::string> lastError;
    std::optional<int> httpStatus;
    std::optional<std::string> responseBody;
    TimePoint createdAt{};
    std::optional<TimePoint> deliveredAt;

    WebhookDelivery(DeliveryId deliveryId, std::string sourceEventId, std::string sourceEventType)
        : id(std::move(deliveryId)),
          eventId(std::move(sourceEventId)),
          eventType(std::move(sourceEventType)) {}

    [[nodiscard]] bool isPending() const noexcept { return status == DeliveryStatus::PENDING; }
    [[nodiscard]] bool isSuccessful() const noexcept { return status == DeliveryStatus::SUCCESS; }

    [[nodiscard]] bool isTerminal() const noexcept {
        return status == DeliveryStatus::SUCCESS || status == DeliveryStatus::FAILED;
    }

    /**
     * @brief Retry scheduled and its time has come
     */
    [[nodiscard]] bool isDueForRetry(TimePoint now) const {
        return status == DeliveryStatus::RETRY_SCHEDULED && nextRetryAt && now >= *nextRetryAt;
    }

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @throws shared::exception::DomainException (INVALID_DELIVERY_RECORD)
     */
    static WebhookDelivery fromJson(const Json::Value& json);
};

} // namespace taskcore::webhook::domain::model
