/**
 * @file IWebhookAggregateRepository.hpp
 * @brief Repository interface for webhook aggregates
 */

#pragma once

#include "taskcore/shared/repository/IAggregateRepository.hpp"
#include "taskcore/webhook/domain/model/WebhookAggregate.hpp"
#include "taskcore/webhook/domain/model/WebhookId.hpp"

#include <string>
#include <vector>

namespace taskcore::webhook::domain::repository {

/**
 * @brief Webhook persistence plus the lookups the delivery pipeline needs
 */
class IWebhookAggregateRepository
    : public shared::repository::IAggregateRepository<model::WebhookAggregate, model::WebhookId> {
public:
    /**
     * @brief ACTIVE, non-removed webhooks subscribed to the event type
     */
    virtual std::vector<model::WebhookId> findSubscribedTo(const std::string& eventType) = 0;

    /**
     * @brief Non-removed webhooks holding PENDING or RETRY_SCHEDULED deliveries
     */
    virtual std::vector<model::WebhookId> findWithOpenDeliveries() = 0;
};

} // namespace taskcore::webhook::domain::repository
