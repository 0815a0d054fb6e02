/**
 * @file WebhookStatus.hpp
 * @brief Enums for webhook and delivery status
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskcore::webhook::domain::model {

enum class WebhookStatus {
    ACTIVE,
    SUSPENDED,  // Set automatically after too many consecutive failures
    INACTIVE
};

inline std::string toString(WebhookStatus status) {
    switch (status) {
        case WebhookStatus::ACTIVE: return "ACTIVE";
        case WebhookStatus::SUSPENDED: return "SUSPENDED";
        case WebhookStatus::INACTIVE: return "INACTIVE";
        default: throw std::invalid_argument("Unknown WebhookStatus");
    }
}

inline WebhookStatus parseWebhookStatus(const std::string& str) {
    if (str == "ACTIVE") return WebhookStatus::ACTIVE;
    if (str == "SUSPENDED") return WebhookStatus::SUSPENDED;
    if (str == "INACTIVE") return WebhookStatus::INACTIVE;
    throw std::invalid_argument("Unknown webhook status: " + str);
}

inline bool isValidTransition(WebhookStatus from, WebhookStatus to) {
    switch (from) {
        case WebhookStatus::ACTIVE:
            return to == WebhookStatus::SUSPENDED || to == WebhookStatus::INACTIVE;
        case WebhookStatus::SUSPENDED:
            return to == WebhookStatus::ACTIVE || to == WebhookStatus::INACTIVE;
        case WebhookStatus::INACTIVE:
            return to == WebhookStatus::ACTIVE;
        default:
            return false;
    }
}

enum class DeliveryStatus {
    PENDING,
    SUCCESS,          // Terminal
    FAILED,           // Terminal once retries are exhausted
    RETRY_SCHEDULED
};

inline std::string toString(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::PENDING: return "PENDING";
        case DeliveryStatus::SUCCESS: return "SUCCESS";
        case DeliveryStatus::FAILED: return "FAILED";
        case DeliveryStatus::RETRY_SCHEDULED: return "RETRY_SCHEDULED";
        default: throw std::invalid_argument("Unknown DeliveryStatus");
    }
}

inline DeliveryStatus parseDeliveryStatus(const std::string& str) {
    if (str == "PENDING") return DeliveryStatus::PENDING;
    if (str == "SUCCESS") return DeliveryStatus::SUCCESS;
    if (str == "FAILED") return DeliveryStatus::FAILED;
    if (str == "RETRY_SCHEDULED") return DeliveryStatus::RETRY_SCHEDULED;
    throw std::invalid_argument("Unknown delivery status: " + str);
}

} // namespace taskcore::webhook::domain::model
