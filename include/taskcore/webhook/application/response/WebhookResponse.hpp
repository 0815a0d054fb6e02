/**
 * @file WebhookResponse.hpp
 * @brief Response DTOs for webhook operations
 */

#pragma once

#include "taskcore/webhook/domain/model/WebhookAggregate.hpp"

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace taskcore::webhook::application::response {

struct WebhookResponse {
    std::string webhookId;
    std::string workspaceId;
    std::string name;
    std::string url;
    std::string status;
    std::vector<std::string> events;
    bool isSigned = false;
    std::optional<std::string> secret;  ///< Only right after registration or rotation
    int totalDeliveries = 0;
    int consecutiveFailures = 0;
    double successRate = 100.0;
    int version = 0;

    static WebhookResponse fromDomain(const domain::model::WebhookAggregate& aggregate) {
        WebhookResponse response;
        response.webhookId = aggregate.aggregateId();
        response.workspaceId = aggregate.getWorkspaceId();
        response.name = aggregate.getName();
        response.url = aggregate.getUrl();
        response.status = domain::model::toString(aggregate.getStatus());
        response.events = aggregate.getEvents();
        response.isSigned = aggregate.hasSecret();
        response.totalDeliveries = aggregate.getHealth().totalDeliveries;
        response.consecutiveFailures = aggregate.getHealth().consecutiveFailures;
        response.successRate = aggregate.getHealth().successRate();
        response.version = aggregate.getVersion();
        return response;
    }

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json(Json::objectValue);
        json["webhookId"] = webhookId;
        json["workspaceId"] = workspaceId;
        json["name"] = name;
        json["url"] = url;
        json["status"] = status;
        json["events"] = Json::Value(Json::arrayValue);
        for (const auto& type : events) {
            json["events"].append(type);
        }
        json["signed"] = isSigned;
        if (secret) {
            json["secret"] = *secret;
        }
        json["totalDeliveries"] = totalDeliveries;
        json["consecutiveFailures"] = consecutiveFailures;
        json["successRate"] = successRate;
        json["version"] = version;
        return json;
    }
};

/**
 * @brief Outcome counters of one delivery or retry pass
 */
struct DeliveryReport {
    std::size_t webhooks = 0;
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t retriesScheduled = 0;
    std::size_t suspended = 0;
    std::size_t skipped = 0;

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json(Json::objectValue);
        json["webhooks"] = static_cast<Json::UInt64>(webhooks);
        json["attempted"] = static_cast<Json::UInt64>(attempted);
        json["succeeded"] = static_cast<Json::UInt64>(succeeded);
        json["failed"] = static_cast<Json::UInt64>(failed);
        json["retriesScheduled"] = static_cast<Json::UInt64>(retriesScheduled);
        json["suspended"] = static_cast<Json::UInt64>(suspended);
        json["skipped"] = static_cast<Json::UInt64>(skipped);
        return json;
    }
};

} // namespace taskcore::webhook::application::response
