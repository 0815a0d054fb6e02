#include "taskcore/webhook/domain/model/WebhookHealth.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

namespace taskcore::webhook::domain::model {

using namespace shared::util;

Json::Value WebhookHealth::toJson() const {
    Json::Value json(Json::objectValue);
    json["totalDeliveries"] = totalDeliveries;
    json["successCount"] = successCount;
    json["failureCount"] = failureCount;
    json["consecutiveFailures"] = consecutiveFailures;
    putOptionalTime(json, "lastTriggeredAt", lastTriggeredAt);
    putOptionalTime(json, "lastSuccessAt", lastSuccessAt);
    putOptionalTime(json, "lastFailureAt", lastFailureAt);
    putOptional(json, "lastFailureReason", lastFailureReason);
    return json;
}

WebhookHealth WebhookHealth::fromJson(const Json::Value& json) {
    WebhookHealth health;
    health.totalDeliveries = optionalInt(json, "totalDeliveries").value_or(0);
    health.successCount = optionalInt(json, "successCount").value_or(0);
    health.failureCount = optionalInt(json, "failureCount").value_or(0);
    health.consecutiveFailures = optionalInt(json, "consecutiveFailures").value_or(0);
    health.lastTriggeredAt = optionalTime(json, "lastTriggeredAt");
    health.lastSuccessAt = optionalTime(json, "lastSuccessAt");
    health.lastFailureAt = optionalTime(json, "lastFailureAt");
    health.lastFailureReason = optionalString(json, "lastFailureReason");
    return health;
}

} // namespace taskcore::webhook::domain::model
