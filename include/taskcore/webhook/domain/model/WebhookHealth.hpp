/**
 * @file WebhookHealth.hpp
 * @brief Delivery counters of a webhook
 */

#pragma once

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>

namespace taskcore::webhook::domain::model {

struct WebhookHealth {
    using TimePoint = std::chrono::system_clock::time_point;

    int totalDeliveries = 0;
    int successCount = 0;
    int failureCount = 0;          ///< Failed attempts, retried or not
    int consecutiveFailures = 0;   ///< Reset by any success
    std::optional<TimePoint> lastTriggeredAt;
    std::optional<TimePoint> lastSuccessAt;
    std::optional<TimePoint> lastFailureAt;
    std::optional<std::string> lastFailureReason;

    /**
     * @brief Share of successful attempts in percent; 100 before any attempt
     */
    [[nodiscard]] double successRate() const noexcept {
        const int attempts = successCount + failureCount;
        return attempts == 0 ? 100.0 : 100.0 * successCount / attempts;
    }

    [[nodiscard]] Json::Value toJson() const;
    static WebhookHealth fromJson(const Json::Value& json);
};

} // namespace taskcore::webhook::domain::model
