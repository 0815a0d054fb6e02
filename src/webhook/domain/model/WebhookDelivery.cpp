#include "taskcore/webhook/domain/model/WebhookDelivery.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

#include <stdexcept>

namespace taskcore::webhook::domain::model {

using namespace shared::util;

Json::Value WebhookDelivery::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id.toString();
    json["eventId"] = eventId;
    json["eventType"] = eventType;
    json["payload"] = payload;
    json["signature"] = signature;
    json["status"] = toString(status);
    json["attempt"] = attempt;
    putOptionalTime(json, "nextRetryAt", nextRetryAt);
    putOptionalTime(json, "lastAttemptAt", lastAttemptAt);
    putOptional(json, "lastError", lastError);
    putOptional(json, "httpStatus", httpStatus);
    putOptional(json, "responseBody", responseBody);
    json["createdAt"] = formatIso8601(createdAt);
    putOptionalTime(json, "deliveredAt", deliveredAt);
    return json;
}

WebhookDelivery WebhookDelivery::fromJson(const Json::Value& json) {
    try {
        WebhookDelivery delivery(DeliveryId::of(requireString(json, "id")),
                                 requireString(json, "eventId"),
                                 requireString(json, "eventType"));
        delivery.payload = json["payload"];
        delivery.signature = optionalString(json, "signature").value_or("");
        delivery.status = parseDeliveryStatus(requireString(json, "status"));
        delivery.attempt = requireInt(json, "attempt");
        delivery.nextRetryAt = optionalTime(json, "nextRetryAt");
        delivery.lastAttemptAt = optionalTime(json, "lastAttemptAt");
        delivery.lastError = optionalString(json, "lastError");
        delivery.httpStatus = optionalInt(json, "httpStatus");
        delivery.responseBody = optionalString(json, "responseBody");
        delivery.createdAt = requireTime(json, "createdAt");
        delivery.deliveredAt = optionalTime(json, "deliveredAt");
        return delivery;
    } catch (const shared::exception::DomainException& e) {
        throw shared::exception::DomainException("INVALID_DELIVERY_RECORD", e.getMessage());
    } catch (const std::invalid_argument& e) {
        throw shared::exception::DomainException("INVALID_DELIVERY_RECORD", e.what());
    }
}

} // namespace taskcore::webhook::domain::model
