/**
 * @file WebhookUseCases.hpp
 * @brief Registration, management and delivery of webhooks
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/uow/AggregateUpdater.hpp"
#include "taskcore/shared/uow/UnitOfWorkFactory.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"
#include "taskcore/webhook/application/command/WebhookCommands.hpp"
#include "taskcore/webhook/application/port/IWebhookSender.hpp"
#include "taskcore/webhook/application/response/WebhookResponse.hpp"
#include "taskcore/webhook/domain/model/WebhookSignature.hpp"
#include "taskcore/webhook/domain/repository/IWebhookAggregateRepository.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace taskcore::webhook::application::usecase {

using namespace taskcore::webhook::domain::model;
using namespace taskcore::webhook::application::command;
using namespace taskcore::webhook::application::response;
using domain::repository::IWebhookAggregateRepository;

using WebhookUpdater = shared::uow::AggregateUpdater<WebhookAggregate, WebhookId>;

class RegisterWebhookUseCase {
private:
    std::shared_ptr<WebhookUpdater> updater_;
    WebhookRules rules_;

public:
    RegisterWebhookUseCase(std::shared_ptr<WebhookUpdater> updater, WebhookRules rules)
        : updater_(std::move(updater)), rules_(rules) {}

    /**
     * @return The registered webhook, including its secret
     */
    WebhookResponse execute(const RegisterWebhookCommand& command) {
        WebhookId webhookId = command.webhookId.empty() ? WebhookId::generate()
                                                        : WebhookId::of(command.webhookId);
        WebhookAggregate::Registration registration;
        registration.workspaceId = command.workspaceId;
        registration.name = command.name;
        registration.url = command.url;
        registration.events = command.events;
        registration.headers = command.headers;
        registration.secret = command.secret;
        registration.maxRetries = command.maxRetries;
        registration.maxFailures = command.maxFailures;

        auto aggregate = WebhookAggregate::create(std::move(webhookId), std::move(registration),
                                                  command.createdBy, rules_);
        updater_->insert(aggregate);

        spdlog::info("Webhook registered: id={}, workspace={}, url={}, events={}",
                     aggregate.aggregateId(), aggregate.getWorkspaceId(), aggregate.getUrl(),
                     aggregate.getEvents().size());

        WebhookResponse response = WebhookResponse::fromDomain(aggregate);
        if (aggregate.hasSecret()) {
            response.secret = aggregate.getSecret();
        }
        return response;
    }
};

/**
 * @brief Status changes and configuration updates of one webhook
 */
class ManageWebhookUseCase {
private:
    std::shared_ptr<WebhookUpdater> updater_;

public:
    explicit ManageWebhookUseCase(std::shared_ptr<WebhookUpdater> updater)
        : updater_(std::move(updater)) {}

    WebhookResponse execute(const ManageWebhookCommand& command) {
        const WebhookId webhookId = WebhookId::of(command.webhookId);

        if (command.action == WebhookAction::REMOVE) {
            auto removed = updater_->remove(webhookId, "RemoveWebhook",
                [&](WebhookAggregate& webhook) { webhook.remove(command.userId); });
            spdlog::info("Webhook removed: id={}, by={}", command.webhookId, command.userId);
            return WebhookResponse::fromDomain(removed);
        }

        std::string rotatedSecret;
        auto aggregate = updater_->update(webhookId, "ManageWebhook", [&](WebhookAggregate& webhook) {
            switch (command.action) {
                case WebhookAction::ACTIVATE: webhook.activate(command.userId); break;
                case WebhookAction::SUSPEND: webhook.suspend(command.reason); break;
                case WebhookAction::DEACTIVATE: webhook.deactivate(command.userId); break;
                case WebhookAction::UPDATE_URL: webhook.updateUrl(command.url); break;
                case WebhookAction::UPDATE_SUBSCRIPTIONS: webhook.updateSubscriptions(command.events); break;
                case WebhookAction::ROTATE_SECRET: rotatedSecret = webhook.rotateSecret(command.secret); break;
                case WebhookAction::REMOVE: break;
            }
        });

        spdlog::info("Webhook {} updated: status={}, version={}",
                     aggregate.aggregateId(), toString(aggregate.getStatus()), aggregate.getVersion());

        WebhookResponse response = WebhookResponse::fromDomain(aggregate);
        if (!rotatedSecret.empty()) {
            response.secret = rotatedSecret;
        }
        return response;
    }
};

/**
 * @brief Event handler that opens a delivery on every matching webhook
 *
 * Events of the webhook aggregate itself are never delivered, so delivery
 * bookkeeping cannot trigger further deliveries. Publication is
 * at-least-once: an event that already has a delivery on a webhook is
 * skipped there.
 */
class DispatchEventToWebhooksUseCase {
private:
    std::shared_ptr<IWebhookAggregateRepository> repository_;
    std::shared_ptr<WebhookUpdater> updater_;

public:
    DispatchEventToWebhooksUseCase(std::shared_ptr<IWebhookAggregateRepository> repository,
                                   std::shared_ptr<WebhookUpdater> updater)
        : repository_(std::move(repository)), updater_(std::move(updater))
    {
        if (!repository_) {
            throw std::invalid_argument("DispatchEventToWebhooksUseCase: repository cannot be nullptr");
        }
        if (!updater_) {
            throw std::invalid_argument("DispatchEventToWebhooksUseCase: updater cannot be nullptr");
        }
    }

    /**
     * @return Number of deliveries opened
     */
    std::size_t execute(const shared::domain::DomainEvent& event) {
        if (event.getAggregateType() == WebhookAggregate::AGGREGATE_TYPE) {
            return 0;
        }

        const Json::Value payload = event.toJson();
        std::size_t triggered = 0;
        for (const auto& webhookId : repository_->findSubscribedTo(event.getEventType())) {
            try {
                updater_->update(webhookId, "TriggerWebhookDelivery", [&](WebhookAggregate& webhook) {
                    webhook.triggerDelivery(event.getEventId(), event.getEventType(), payload);
                });
                ++triggered;
            } catch (const shared::exception::DuplicateDeliveryException& e) {
                spdlog::debug("Event {} already delivered to webhook {}: {}",
                              event.getEventId(), webhookId.toString(), e.what());
            } catch (const shared::exception::WebhookNotTriggerableException& e) {
                spdlog::info("Webhook {} skipped for event {}: {}",
                             webhookId.toString(), event.getEventId(), e.what());
            } catch (const shared::exception::NotFoundException& e) {
                // Removed after the subscription lookup
                spdlog::info("Webhook {} no longer exists, skipped for event {}: {}",
                             webhookId.toString(), event.getEventId(), e.what());
            }
        }

        if (triggered > 0) {
            spdlog::info("Event {} ({}) opened {} webhook delivery(ies)",
                         event.getEventId(), event.getEventType(), triggered);
        }
        return triggered;
    }
};

/**
 * @brief Send every PENDING delivery and record the outcome
 *
 * One unit of work per webhook. The HTTP calls happen before the commit, so
 * this pass is not replayed on a concurrency conflict: the conflict is
 * rethrown and the unrecorded deliveries stay PENDING for the next pass.
 * Receivers deduplicate on the X-Webhook-Delivery header.
 */
class DeliverPendingDeliveriesUseCase {
private:
    static constexpr std::size_t RESPONSE_BODY_LIMIT = 1024;

    std::shared_ptr<IWebhookAggregateRepository> repository_;
    std::shared_ptr<shared::uow::UnitOfWorkFactory> unitOfWorkFactory_;
    std::shared_ptr<port::IWebhookSender> sender_;

    static std::optional<std::string> truncate(const std::string& body) {
        if (body.empty()) {
            return std::nullopt;
        }
        return body.substr(0, RESPONSE_BODY_LIMIT);
    }

    static std::map<std::string, std::string> headersFor(const WebhookAggregate& webhook,
                                                         const WebhookDelivery& delivery) {
        std::map<std::string, std::string> headers = webhook.getHeaders();
        headers["Content-Type"] = "application/json";
        headers["X-Webhook-Id"] = webhook.aggregateId();
        headers["X-Webhook-Event"] = delivery.eventType;
        headers["X-Webhook-Delivery"] = delivery.id.toString();
        headers["X-Webhook-Attempt"] = std::to_string(delivery.attempt);
        if (!delivery.signature.empty()) {
            headers[WebhookSignature::HEADER] = delivery.signature;
        }
        return headers;
    }

    void deliver(WebhookAggregate& webhook, const WebhookDelivery& delivery, DeliveryReport& report) {
        ++report.attempted;
        const std::string body = shared::util::toCompactString(delivery.payload);

        std::optional<port::SendResult> result;
        std::string transportError;
        try {
            result = sender_->send(webhook.getUrl(), headersFor(webhook, delivery), body);
        } catch (const std::exception& e) {
            transportError = e.what();
        }

        if (result && result->isSuccess()) {
            webhook.recordSuccess(delivery.id, result->httpStatus, truncate(result->body));
            ++report.succeeded;
            return;
        }
        if (result) {
            webhook.recordFailure(delivery.id, "HTTP " + std::to_string(result->httpStatus),
                                  result->httpStatus, truncate(result->body));
        } else {
            webhook.recordFailure(delivery.id, transportError);
        }

        const WebhookDelivery& recorded = webhook.getDelivery(delivery.id);
        if (recorded.status == DeliveryStatus::RETRY_SCHEDULED) {
            ++report.retriesScheduled;
            spdlog::warn("Webhook {} delivery {} failed (attempt {}/{}): {}; retry at {}",
                         webhook.aggregateId(), delivery.id.toString(), recorded.attempt,
                         webhook.getMaxRetries(), recorded.lastError.value_or(""),
                         shared::util::formatIso8601(*recorded.nextRetryAt));
        } else {
            ++report.failed;
            spdlog::error("Webhook {} delivery {} failed permanently after {} attempt(s): {}",
                          webhook.aggregateId(), delivery.id.toString(), recorded.attempt,
                          recorded.lastError.value_or(""));
        }
    }

public:
    DeliverPendingDeliveriesUseCase(std::shared_ptr<IWebhookAggregateRepository> repository,
                                    std::shared_ptr<shared::uow::UnitOfWorkFactory> unitOfWorkFactory,
                                    std::shared_ptr<port::IWebhookSender> sender)
        : repository_(std::move(repository)),
          unitOfWorkFactory_(std::move(unitOfWorkFactory)),
          sender_(std::move(sender))
    {
        if (!repository_ || !unitOfWorkFactory_ || !sender_) {
            throw std::invalid_argument("DeliverPendingDeliveriesUseCase: dependencies cannot be nullptr");
        }
    }

    DeliveryReport execute() {
        DeliveryReport report;
        for (const auto& webhookId : repository_->findWithOpenDeliveries()) {
            deliverFor(webhookId, report);
        }
        return report;
    }

    DeliveryReport execute(const WebhookId& webhookId) {
        DeliveryReport report;
        deliverFor(webhookId, report);
        return report;
    }

private:
    void deliverFor(const WebhookId& webhookId, DeliveryReport& report) {
        WebhookAggregate webhook = repository_->load(webhookId);
        const auto pending = webhook.pendingDeliveries();
        if (pending.empty()) {
            return;
        }
        ++report.webhooks;
        if (!webhook.isActive()) {
            report.skipped += pending.size();
            spdlog::debug("Webhook {} is {}; {} pending delivery(ies) held",
                          webhookId.toString(), toString(webhook.getStatus()), pending.size());
            return;
        }

        for (const auto& delivery : pending) {
            if (!webhook.isActive()) {
                ++report.skipped;
                continue;
            }
            deliver(webhook, delivery, report);
            if (!webhook.isActive()) {
                ++report.suspended;
                spdlog::warn("Webhook {} suspended after {} consecutive failures",
                             webhookId.toString(), webhook.getHealth().consecutiveFailures);
            }
        }

        auto unitOfWork = unitOfWorkFactory_->create();
        unitOfWork.registerDirty(webhook, std::static_pointer_cast<WebhookUpdater::Repository>(repository_));
        unitOfWork.commit();
    }
};

/**
 * @brief Poller step: move due RETRY_SCHEDULED deliveries back to PENDING
 */
class RetryDueDeliveriesUseCase {
private:
    std::shared_ptr<IWebhookAggregateRepository> repository_;
    std::shared_ptr<WebhookUpdater> updater_;

public:
    RetryDueDeliveriesUseCase(std::shared_ptr<IWebhookAggregateRepository> repository,
                              std::shared_ptr<WebhookUpdater> updater)
        : repository_(std::move(repository)), updater_(std::move(updater))
    {
        if (!repository_ || !updater_) {
            throw std::invalid_argument("RetryDueDeliveriesUseCase: dependencies cannot be nullptr");
        }
    }

    /**
     * @return Number of deliveries returned to PENDING
     */
    std::size_t execute(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {
        std::size_t retried = 0;
        for (const auto& webhookId : repository_->findWithOpenDeliveries()) {
            const WebhookAggregate current = repository_->load(webhookId);
            if (!current.isActive() || current.dueRetries(now).empty()) {
                continue;
            }

            std::size_t count = 0;
            updater_->update(webhookId, "RetryDueDeliveries", [&](WebhookAggregate& webhook) {
                count = 0;
                for (const auto& delivery : webhook.dueRetries(now)) {
                    webhook.retry(delivery.id, now);
                    ++count;
                }
            });
            retried += count;
            spdlog::info("Webhook {}: {} delivery(ies) due for retry", webhookId.toString(), count);
        }
        return retried;
    }
};

} // namespace taskcore::webhook::application::usecase
