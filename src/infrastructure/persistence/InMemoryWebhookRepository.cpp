#include "taskcore/infrastructure/persistence/InMemoryWebhookRepository.hpp"

#include <algorithm>

namespace taskcore::infrastructure::persistence {

using webhook::domain::model::DeliveryStatus;
using webhook::domain::model::WebhookAggregate;
using webhook::domain::model::WebhookDelivery;
using webhook::domain::model::WebhookId;
using webhook::domain::model::WebhookRules;

InMemoryWebhookRepository::InMemoryWebhookRepository(std::shared_ptr<InMemoryAggregateStore> store,
                                                     WebhookRules rules)
    : InMemoryAggregateRepository(std::move(store),
          [rules](const shared::domain::AggregateSnapshot& snapshot) {
              return WebhookAggregate::restoreFromSnapshot(snapshot, {}, rules);
          }) {}

std::vector<WebhookId> InMemoryWebhookRepository::findSubscribedTo(const std::string& eventType) {
    std::vector<WebhookId> ids;
    for (const auto& webhook : loadAll()) {
        if (!webhook.isDeleted() && webhook.isActive() && webhook.isSubscribedTo(eventType)) {
            ids.push_back(webhook.getId());
        }
    }
    return ids;
}

std::vector<WebhookId> InMemoryWebhookRepository::findWithOpenDeliveries() {
    std::vector<WebhookId> ids;
    for (const auto& webhook : loadAll()) {
        if (webhook.isDeleted()) {
            continue;
        }
        const auto& deliveries = webhook.getDeliveries();
        const bool open = std::any_of(deliveries.begin(), deliveries.end(), [](const WebhookDelivery& delivery) {
            return delivery.status == DeliveryStatus::PENDING || delivery.status == DeliveryStatus::RETRY_SCHEDULED;
        });
        if (open) {
            ids.push_back(webhook.getId());
        }
    }
    return ids;
}

std::vector<WebhookId> InMemoryWebhookRepository::findByWorkspace(const std::string& workspaceId) {
    std::vector<WebhookId> ids;
    for (const auto& webhook : loadAll()) {
        if (!webhook.isDeleted() && webhook.getWorkspaceId() == workspaceId) {
            ids.push_back(webhook.getId());
        }
    }
    return ids;
}

} // namespace taskcore::infrastructure::persistence
