/**
 * @file InMemoryWebhookRepository.hpp
 * @brief In-memory webhook repository with the delivery pipeline lookups
 */

#pragma once

#include "InMemoryAggregateRepository.hpp"
#include "taskcore/webhook/domain/repository/IWebhookAggregateRepository.hpp"

#include <string>
#include <vector>

namespace taskcore::infrastructure::persistence {

/**
 * @brief Webhook repository; lookups scan every stored webhook
 */
class InMemoryWebhookRepository
    : public InMemoryAggregateRepository<webhook::domain::model::WebhookAggregate,
                                         webhook::domain::model::WebhookId,
                                         webhook::domain::repository::IWebhookAggregateRepository> {
public:
    InMemoryWebhookRepository(std::shared_ptr<InMemoryAggregateStore> store,
                              webhook::domain::model::WebhookRules rules);

    std::vector<webhook::domain::model::WebhookId> findSubscribedTo(const std::string& eventType) override;
    std::vector<webhook::domain::model::WebhookId> findWithOpenDeliveries() override;

    /**
     * @brief Every stored webhook of a workspace
     */
    std::vector<webhook::domain::model::WebhookId> findByWorkspace(const std::string& workspaceId);
};

} // namespace taskcore::infrastructure::persistence
