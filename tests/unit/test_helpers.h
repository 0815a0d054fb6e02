/**
 * @file test_helpers.h
 * @brief Shared fakes and builders for taskcore unit tests
 *
 * Everything runs against the in-memory store; no network or database.
 */

#pragma once

#include "taskcore/infrastructure/persistence/InMemoryAggregateStore.hpp"
#include "taskcore/infrastructure/persistence/InMemoryOutbox.hpp"
#include "taskcore/infrastructure/persistence/InMemoryTaskRepository.hpp"
#include "taskcore/infrastructure/persistence/InMemoryTransactionRunner.hpp"
#include "taskcore/infrastructure/persistence/InMemoryWebhookRepository.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"
#include "taskcore/shared/port/IEventPublisher.hpp"
#include "taskcore/shared/repository/IAggregateRepository.hpp"
#include "taskcore/shared/uow/UnitOfWorkFactory.hpp"
#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"
#include "taskcore/webhook/application/port/IWebhookSender.hpp"
#include "taskcore/webhook/domain/model/WebhookAggregate.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_helpers {

using taskcore::shared::domain::DomainEvent;
using taskcore::shared::domain::DomainEvents;

// --- Event publisher ---

/// Records every accepted batch; throws PublishException while failNext > 0
class RecordingPublisher : public taskcore::shared::port::IEventPublisher {
public:
    std::vector<DomainEvents> batches;
    int failNext = 0;
    int rejected = 0;

    /// Observes each batch before it is accepted or rejected
    std::function<void(const DomainEvents&)> onPublish;

    void publishAll(const DomainEvents& events) override {
        if (onPublish) {
            onPublish(events);
        }
        if (failNext > 0) {
            --failNext;
            ++rejected;
            throw taskcore::shared::exception::PublishException("broker unavailable");
        }
        batches.push_back(events);
    }

    [[nodiscard]] std::size_t eventCount() const {
        std::size_t count = 0;
        for (const auto& batch : batches) {
            count += batch.size();
        }
        return count;
    }

    [[nodiscard]] std::vector<std::string> eventTypes() const {
        std::vector<std::string> types;
        for (const auto& batch : batches) {
            for (const auto& event : batch) {
                types.push_back(event.getEventType());
            }
        }
        return types;
    }
};

// --- Repository decorator ---

/// Forwards to a real repository; save() throws PersistenceException when armed
template<typename T, typename IdType>
class FailingRepository : public taskcore::shared::repository::IAggregateRepository<T, IdType> {
public:
    using Inner = taskcore::shared::repository::IAggregateRepository<T, IdType>;

    explicit FailingRepository(std::shared_ptr<Inner> inner) : inner_(std::move(inner)) {}

    bool failOnSave = false;
    int saveCalls = 0;

    /// Runs before every save (e.g. a competing writer)
    std::function<void()> beforeSave;

    void save(const T& aggregate, int expectedVersion) override {
        ++saveCalls;
        if (beforeSave) {
            auto hook = std::move(beforeSave);
            beforeSave = nullptr;
            hook();
        }
        if (failOnSave) {
            throw taskcore::shared::exception::PersistenceException("disk full");
        }
        inner_->save(aggregate, expectedVersion);
    }

    void remove(const IdType& id, int expectedVersion) override {
        inner_->remove(id, expectedVersion);
    }

    T load(const IdType& id) override {
        return inner_->load(id);
    }

    std::optional<T> findById(const IdType& id) override {
        return inner_->findById(id);
    }

private:
    std::shared_ptr<Inner> inner_;
};

// --- Webhook sender ---

/// Replies with queued HTTP statuses (200 once the queue is empty); -1 simulates a transport error
class FakeWebhookSender : public taskcore::webhook::application::port::IWebhookSender {
public:
    struct Request {
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;
    };

    std::deque<int> statuses;
    std::vector<Request> requests;

    taskcore::webhook::application::port::SendResult send(
            const std::string& url,
            const std::map<std::string, std::string>& headers,
            const std::string& body) override {
        requests.push_back(Request{url, headers, body});
        int status = 200;
        if (!statuses.empty()) {
            status = statuses.front();
            statuses.pop_front();
        }
        if (status < 0) {
            throw std::runtime_error("connection refused");
        }
        return {status, status < 300 ? "ok" : "unavailable"};
    }
};

// --- Wiring ---

/// Store, transaction runner and repositories sharing one in-memory database
struct InMemoryEnvironment {
    std::shared_ptr<taskcore::infrastructure::persistence::InMemoryAggregateStore> store =
        std::make_shared<taskcore::infrastructure::persistence::InMemoryAggregateStore>();
    std::shared_ptr<taskcore::infrastructure::persistence::InMemoryTransactionRunner> runner =
        std::make_shared<taskcore::infrastructure::persistence::InMemoryTransactionRunner>(store);
    std::shared_ptr<taskcore::infrastructure::persistence::InMemoryOutbox> outbox =
        std::make_shared<taskcore::infrastructure::persistence::InMemoryOutbox>(store);
    std::shared_ptr<RecordingPublisher> publisher = std::make_shared<RecordingPublisher>();

    std::shared_ptr<taskcore::infrastructure::persistence::InMemoryTaskRepository> taskRepository =
        std::make_shared<taskcore::infrastructure::persistence::InMemoryTaskRepository>(
            store, taskcore::taskmanagement::domain::model::TaskRules{});
    std::shared_ptr<taskcore::infrastructure::persistence::InMemoryWebhookRepository> webhookRepository =
        std::make_shared<taskcore::infrastructure::persistence::InMemoryWebhookRepository>(
            store, taskcore::webhook::domain::model::WebhookRules{});

    [[nodiscard]] std::shared_ptr<taskcore::shared::uow::UnitOfWorkFactory> directFactory() const {
        return std::make_shared<taskcore::shared::uow::UnitOfWorkFactory>(runner, publisher);
    }

    [[nodiscard]] std::shared_ptr<taskcore::shared::uow::UnitOfWorkFactory> outboxFactory() const {
        return std::make_shared<taskcore::shared::uow::UnitOfWorkFactory>(runner, publisher, outbox);
    }
};

// --- Builders ---

inline taskcore::taskmanagement::domain::model::TaskAggregate makeProject(
        const std::string& projectId = "project-1",
        taskcore::taskmanagement::domain::model::TaskRules rules = {}) {
    using namespace taskcore::taskmanagement::domain::model;
    return TaskAggregate::create(ProjectId::of(projectId), "Apollo", UserId::of("alice"), rules);
}

inline taskcore::taskmanagement::domain::model::TaskId addTask(
        taskcore::taskmanagement::domain::model::TaskAggregate& project,
        const std::string& title,
        std::optional<double> estimatedHours = std::nullopt) {
    using namespace taskcore::taskmanagement::domain::model;
    TaskAggregate::NewTask task;
    task.title = title;
    task.estimatedHours = estimatedHours;
    return project.createTask(UserId::of("alice"), task);
}

inline taskcore::webhook::domain::model::WebhookAggregate::Registration makeRegistration(
        std::vector<std::string> events = {"TaskStatusChanged"},
        std::optional<int> maxRetries = std::nullopt,
        std::optional<int> maxFailures = std::nullopt) {
    taskcore::webhook::domain::model::WebhookAggregate::Registration registration;
    registration.workspaceId = "workspace-1";
    registration.name = "CI notifier";
    registration.url = "https://hooks.example.com/taskcore";
    registration.events = std::move(events);
    registration.secret = "0123456789abcdef0123456789abcdef";
    registration.maxRetries = maxRetries;
    registration.maxFailures = maxFailures;
    return registration;
}

inline taskcore::webhook::domain::model::WebhookAggregate makeWebhook(
        const std::string& webhookId = "webhook-1",
        std::optional<int> maxRetries = std::nullopt,
        std::optional<int> maxFailures = std::nullopt) {
    using namespace taskcore::webhook::domain::model;
    return WebhookAggregate::create(WebhookId::of(webhookId),
                                    makeRegistration({"TaskStatusChanged"}, maxRetries, maxFailures),
                                    "alice");
}

/// Minimal event envelope for dispatcher and relay tests
inline DomainEvent makeEvent(const std::string& eventType,
                             const std::string& aggregateId = "project-1",
                             const std::string& eventId = "",
                             int version = 1) {
    static int sequence = 0;
    Json::Value payload(Json::objectValue);
    payload["sequence"] = ++sequence;
    return DomainEvent(eventId.empty() ? "event-" + std::to_string(sequence) : eventId,
                       aggregateId, "TaskGraph", version,
                       std::chrono::system_clock::now(), eventType, payload);
}

} // namespace test_helpers
