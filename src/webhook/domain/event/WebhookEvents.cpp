#include "taskcore/webhook/domain/event/WebhookEvents.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

#include <functional>

namespace taskcore::webhook::domain::event {

using namespace shared::util;

namespace {

Json::Value toArray(const std::vector<std::string>& values) {
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

std::vector<std::string> fromArray(const Json::Value& json, const char* key) {
    if (!json.isObject() || !json[key].isArray()) {
        throw shared::exception::DomainException("INVALID_PAYLOAD", std::string("Missing array field: ") + key);
    }
    std::vector<std::string> values;
    for (const auto& value : json[key]) {
        values.push_back(value.asString());
    }
    return values;
}

} // namespace

Json::Value WebhookRegistered::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["workspaceId"] = workspaceId;
    payload["name"] = name;
    payload["url"] = url;
    payload["events"] = toArray(events);
    payload["headers"] = Json::Value(Json::objectValue);
    for (const auto& [header, value] : headers) {
        payload["headers"][header] = value;
    }
    payload["secret"] = secret;
    payload["maxRetries"] = maxRetries;
    payload["maxFailures"] = maxFailures;
    payload["createdBy"] = createdBy;
    return payload;
}

WebhookRegistered WebhookRegistered::fromPayload(const Json::Value& payload) {
    WebhookRegistered event;
    event.webhookId = requireString(payload, "webhookId");
    event.workspaceId = requireString(payload, "workspaceId");
    event.name = requireString(payload, "name");
    event.url = requireString(payload, "url");
    event.events = fromArray(payload, "events");
    const Json::Value& headers = payload["headers"];
    if (headers.isObject()) {
        for (const auto& header : headers.getMemberNames()) {
            event.headers[header] = headers[header].asString();
        }
    }
    event.secret = optionalString(payload, "secret").value_or("");
    event.maxRetries = requireInt(payload, "maxRetries");
    event.maxFailures = requireInt(payload, "maxFailures");
    event.createdBy = requireString(payload, "createdBy");
    return event;
}

Json::Value WebhookDeliveryTriggered::toPayload() const {
    Json::Value json(Json::objectValue);
    json["webhookId"] = webhookId;
    json["deliveryId"] = deliveryId;
    json["eventId"] = eventId;
    json["eventType"] = eventType;
    json["payload"] = payload;
    json["signature"] = signature;
    return json;
}

WebhookDeliveryTriggered WebhookDeliveryTriggered::fromPayload(const Json::Value& json) {
    WebhookDeliveryTriggered event;
    event.webhookId = requireString(json, "webhookId");
    event.deliveryId = requireString(json, "deliveryId");
    event.eventId = requireString(json, "eventId");
    event.eventType = requireString(json, "eventType");
    event.payload = json["payload"];
    event.signature = optionalString(json, "signature").value_or("");
    return event;
}

Json::Value WebhookDeliverySucceeded::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["deliveryId"] = deliveryId;
    payload["attempt"] = attempt;
    payload["httpStatus"] = httpStatus;
    putOptional(payload, "responseBody", responseBody);
    return payload;
}

WebhookDeliverySucceeded WebhookDeliverySucceeded::fromPayload(const Json::Value& payload) {
    WebhookDeliverySucceeded event;
    event.deliveryId = requireString(payload, "deliveryId");
    event.attempt = requireInt(payload, "attempt");
    event.httpStatus = requireInt(payload, "httpStatus");
    event.responseBody = optionalString(payload, "responseBody");
    return event;
}

Json::Value WebhookDeliveryFailed::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["deliveryId"] = deliveryId;
    payload["attempt"] = attempt;
    payload["error"] = error;
    putOptional(payload, "httpStatus", httpStatus);
    putOptional(payload, "responseBody", responseBody);
    putOptionalTime(payload, "nextRetryAt", nextRetryAt);
    return payload;
}

WebhookDeliveryFailed WebhookDeliveryFailed::fromPayload(const Json::Value& payload) {
    WebhookDeliveryFailed event;
    event.deliveryId = requireString(payload, "deliveryId");
    event.attempt = requireInt(payload, "attempt");
    event.error = requireString(payload, "error");
    event.httpStatus = optionalInt(payload, "httpStatus");
    event.responseBody = optionalString(payload, "responseBody");
    event.nextRetryAt = optionalTime(payload, "nextRetryAt");
    return event;
}

Json::Value WebhookDeliveryRetried::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["deliveryId"] = deliveryId;
    payload["attempt"] = attempt;
    return payload;
}

WebhookDeliveryRetried WebhookDeliveryRetried::fromPayload(const Json::Value& payload) {
    return WebhookDeliveryRetried{requireString(payload, "deliveryId"), requireInt(payload, "attempt")};
}

Json::Value WebhookSuspended::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["reason"] = reason;
    payload["consecutiveFailures"] = consecutiveFailures;
    payload["automatic"] = automatic;
    return payload;
}

WebhookSuspended WebhookSuspended::fromPayload(const Json::Value& payload) {
    WebhookSuspended event;
    event.webhookId = requireString(payload, "webhookId");
    event.reason = optionalString(payload, "reason").value_or("");
    event.consecutiveFailures = optionalInt(payload, "consecutiveFailures").value_or(0);
    event.automatic = payload.get("automatic", false).asBool();
    return event;
}

Json::Value WebhookActivated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["activatedBy"] = activatedBy;
    return payload;
}

WebhookActivated WebhookActivated::fromPayload(const Json::Value& payload) {
    return WebhookActivated{requireString(payload, "webhookId"), requireString(payload, "activatedBy")};
}

Json::Value WebhookDeactivated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["deactivatedBy"] = deactivatedBy;
    return payload;
}

WebhookDeactivated WebhookDeactivated::fromPayload(const Json::Value& payload) {
    return WebhookDeactivated{requireString(payload, "webhookId"), requireString(payload, "deactivatedBy")};
}

Json::Value WebhookUrlChanged::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["url"] = url;
    payload["previousUrl"] = previousUrl;
    return payload;
}

WebhookUrlChanged WebhookUrlChanged::fromPayload(const Json::Value& payload) {
    return WebhookUrlChanged{requireString(payload, "webhookId"),
                             requireString(payload, "url"),
                             optionalString(payload, "previousUrl").value_or("")};
}

Json::Value WebhookSubscriptionsChanged::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["events"] = toArray(events);
    return payload;
}

WebhookSubscriptionsChanged WebhookSubscriptionsChanged::fromPayload(const Json::Value& payload) {
    return WebhookSubscriptionsChanged{requireString(payload, "webhookId"), fromArray(payload, "events")};
}

Json::Value WebhookSecretRotated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["secret"] = secret;
    return payload;
}

WebhookSecretRotated WebhookSecretRotated::fromPayload(const Json::Value& payload) {
    return WebhookSecretRotated{requireString(payload, "webhookId"), requireString(payload, "secret")};
}

Json::Value WebhookRemoved::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["webhookId"] = webhookId;
    payload["removedBy"] = removedBy;
    return payload;
}

WebhookRemoved WebhookRemoved::fromPayload(const Json::Value& payload) {
    return WebhookRemoved{requireString(payload, "webhookId"), requireString(payload, "removedBy")};
}

namespace {

using Decoder = std::function<WebhookEvent(const Json::Value&)>;

template<typename E>
std::pair<const std::string, Decoder> entry() {
    return {E::TYPE, [](const Json::Value& payload) -> WebhookEvent { return E::fromPayload(payload); }};
}

const std::map<std::string, Decoder>& decoders() {
    static const std::map<std::string, Decoder> table{
        entry<WebhookRegistered>(),
        entry<WebhookDeliveryTriggered>(),
        entry<WebhookDeliverySucceeded>(),
        entry<WebhookDeliveryFailed>(),
        entry<WebhookDeliveryRetried>(),
        entry<WebhookSuspended>(),
        entry<WebhookActivated>(),
        entry<WebhookDeactivated>(),
        entry<WebhookUrlChanged>(),
        entry<WebhookSubscriptionsChanged>(),
        entry<WebhookSecretRotated>(),
        entry<WebhookRemoved>(),
    };
    return table;
}

} // namespace

WebhookEvent decodeWebhookEvent(const shared::domain::DomainEvent& event) {
    auto it = decoders().find(event.getEventType());
    if (it == decoders().end()) {
        throw shared::exception::DomainException(
            "UNKNOWN_EVENT_TYPE",
            "Event type " + event.getEventType() + " does not belong to the webhook aggregate");
    }
    return it->second(event.getPayload());
}

bool isWebhookEventType(const std::string& eventType) {
    return decoders().count(eventType) > 0;
}

} // namespace taskcore::webhook::domain::event
