/**
 * @file WebhookEvents.hpp
 * @brief Domain events raised by the webhook aggregate
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <json/json.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskcore::webhook::domain::event {

using TimePoint = std::chrono::system_clock::time_point;

struct WebhookRegistered {
    static constexpr const char* TYPE = "WebhookRegistered";
    std::string webhookId;
    std::string workspaceId;
    std::string name;
    std::string url;
    std::vector<std::string> events;
    std::map<std::string, std::string> headers;
    std::string secret;
    int maxRetries = 3;
    int maxFailures = 10;
    std::string createdBy;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookRegistered fromPayload(const Json::Value& payload);
};

struct WebhookDeliveryTriggered {
    static constexpr const char* TYPE = "WebhookDeliveryTriggered";
    std::string webhookId;
    std::string deliveryId;
    std::string eventId;
    std::string eventType;
    Json::Value payload{Json::objectValue};
    std::string signature;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookDeliveryTriggered fromPayload(const Json::Value& payload);
};

struct WebhookDeliverySucceeded {
    static constexpr const char* TYPE = "WebhookDeliverySucceeded";
    std::string deliveryId;
    int attempt = 1;
    int httpStatus = 200;
    std::optional<std::string> responseBody;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookDeliverySucceeded fromPayload(const Json::Value& payload);
};

/**
 * @brief Failed attempt; nextRetryAt is set when a retry was scheduled
 */
struct WebhookDeliveryFailed {
    static constexpr const char* TYPE = "WebhookDeliveryFailed";
    std::string deliveryId;
    int attempt = 1;
    std::string error;
    std::optional<int> httpStatus;
    std::optional<std::string> responseBody;
    std::optional<TimePoint> nextRetryAt;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookDeliveryFailed fromPayload(const Json::Value& payload);
};

struct WebhookDeliveryRetried {
    static constexpr const char* TYPE = "WebhookDeliveryRetried";
    std::string deliveryId;
    int attempt = 2;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookDeliveryRetried fromPayload(const Json::Value& payload);
};

struct WebhookSuspended {
    static constexpr const char* TYPE = "WebhookSuspended";
    std::string webhookId;
    std::string reason;
    int consecutiveFailures = 0;
    bool automatic = false;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookSuspended fromPayload(const Json::Value& payload);
};

struct WebhookActivated {
    static constexpr const char* TYPE = "WebhookActivated";
    std::string webhookId;
    std::string activatedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookActivated fromPayload(const Json::Value& payload);
};

struct WebhookDeactivated {
    static constexpr const char* TYPE = "WebhookDeactivated";
    std::string webhookId;
    std::string deactivatedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookDeactivated fromPayload(const Json::Value& payload);
};

struct WebhookUrlChanged {
    static constexpr const char* TYPE = "WebhookUrlChanged";
    std::string webhookId;
    std::string url;
    std::string previousUrl;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookUrlChanged fromPayload(const Json::Value& payload);
};

struct WebhookSubscriptionsChanged {
    static constexpr const char* TYPE = "WebhookSubscriptionsChanged";
    std::string webhookId;
    std::vector<std::string> events;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookSubscriptionsChanged fromPayload(const Json::Value& payload);
};

struct WebhookSecretRotated {
    static constexpr const char* TYPE = "WebhookSecretRotated";
    std::string webhookId;
    std::string secret;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookSecretRotated fromPayload(const Json::Value& payload);
};

struct WebhookRemoved {
    static constexpr const char* TYPE = "WebhookRemoved";
    std::string webhookId;
    std::string removedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static WebhookRemoved fromPayload(const Json::Value& payload);
};

using WebhookEvent = std::variant<
    WebhookRegistered,
    WebhookDeliveryTriggered,
    WebhookDeliverySucceeded,
    WebhookDeliveryFailed,
    WebhookDeliveryRetried,
    WebhookSuspended,
    WebhookActivated,
    WebhookDeactivated,
    WebhookUrlChanged,
    WebhookSubscriptionsChanged,
    WebhookSecretRotated,
    WebhookRemoved>;

/**
 * @throws shared::exception::DomainException (UNKNOWN_EVENT_TYPE) for a type outside WebhookEvent
 */
WebhookEvent decodeWebhookEvent(const shared::domain::DomainEvent& event);

[[nodiscard]] bool isWebhookEventType(const std::string& eventType);

} // namespace taskcore::webhook::domain::event
