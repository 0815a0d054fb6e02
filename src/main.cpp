/**
 * @file main.cpp
 * @brief taskcore demo: task graph, webhook delivery and the outbox relay
 *
 * Wires the engine over the in-memory store and walks through:
 * - building a project's dependency graph (including a rejected cycle)
 * - fanning task events out to a subscribed webhook
 * - failed deliveries, exponential backoff and a successful retry
 * - draining the transactional outbox
 */

#include "taskcore/infrastructure/messaging/DispatchingEventPublisher.hpp"
#include "taskcore/infrastructure/messaging/LoggingEventPublisher.hpp"
#include "taskcore/infrastructure/messaging/OutboxRelay.hpp"
#include "taskcore/infrastructure/persistence/InMemoryAggregateStore.hpp"
#include "taskcore/infrastructure/persistence/InMemoryOutbox.hpp"
#include "taskcore/infrastructure/persistence/InMemoryTaskRepository.hpp"
#include "taskcore/infrastructure/persistence/InMemoryTransactionRunner.hpp"
#include "taskcore/infrastructure/persistence/InMemoryWebhookRepository.hpp"
#include "taskcore/shared/config/ConfigManager.hpp"
#include "taskcore/shared/config/EngineConfig.hpp"
#include "taskcore/shared/error/ErrorClassification.hpp"
#include "taskcore/shared/event/EventHandlerRegistry.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/logging/Logger.hpp"
#include "taskcore/shared/uow/UnitOfWorkFactory.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"
#include "taskcore/taskmanagement/application/usecase/TaskUseCases.hpp"
#include "taskcore/taskmanagement/domain/event/TaskEvents.hpp"
#include "taskcore/webhook/application/usecase/WebhookUseCases.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace taskcore;

namespace {

/**
 * @brief Sender that answers 503 for the first `failures` calls, then 200
 */
class ScriptedWebhookSender : public webhook::application::port::IWebhookSender {
private:
    int failures_;
    int calls_ = 0;

public:
    explicit ScriptedWebhookSender(int failures) : failures_(failures) {}

    webhook::application::port::SendResult send(const std::string& url,
                                                const std::map<std::string, std::string>& headers,
                                                const std::string& body) override {
        ++calls_;
        auto signature = headers.find(webhook::domain::model::WebhookSignature::HEADER);
        spdlog::info("POST {} ({} bytes, signature={}, attempt={})", url, body.size(),
                     signature == headers.end() ? "none" : signature->second,
                     headers.count("X-Webhook-Attempt") ? headers.at("X-Webhook-Attempt") : "?");
        if (calls_ <= failures_) {
            return {503, "{\"error\":\"service unavailable\"}"};
        }
        return {200, "{\"received\":true}"};
    }

    [[nodiscard]] int calls() const noexcept { return calls_; }
};

void printBanner() {
    std::cout << R"(
  _            _
 | |_ __ _ ___| | _____ ___  _ __ ___
 | __/ _` / __| |/ / __/ _ \| '__/ _ \
 | || (_| \__ \   < (_| (_) | | |  __/
  \__\__,_|___/_|\_\___\___/|_|  \___|

  Aggregate consistency & transactional event publishing
)" << std::endl;
}

shared::config::EngineConfig loadConfig() {
    auto& manager = shared::config::ConfigManager::getInstance();
    manager.loadFromEnvironment();
    auto config = shared::config::EngineConfig::load(manager);
    config.validate();
    return config;
}

/**
 * @brief Everything the demo needs, wired once
 */
struct Engine {
    std::shared_ptr<infrastructure::persistence::InMemoryAggregateStore> store;
    std::shared_ptr<infrastructure::persistence::InMemoryOutbox> outbox;
    std::shared_ptr<infrastructure::persistence::InMemoryTaskRepository> taskRepository;
    std::shared_ptr<infrastructure::persistence::InMemoryWebhookRepository> webhookRepository;
    std::shared_ptr<shared::event::EventHandlerRegistry> registry;
    std::shared_ptr<infrastructure::messaging::DispatchingEventPublisher> taskPublisher;
    std::shared_ptr<shared::uow::UnitOfWorkFactory> webhookUnitOfWorkFactory;
    std::shared_ptr<taskmanagement::application::usecase::TaskGraphUpdater> taskUpdater;
    std::shared_ptr<webhook::application::usecase::WebhookUpdater> webhookUpdater;
};

Engine wire(const shared::config::EngineConfig& config) {
    using namespace taskcore::infrastructure;

    Engine engine;
    engine.store = std::make_shared<persistence::InMemoryAggregateStore>();
    auto transactionRunner = std::make_shared<persistence::InMemoryTransactionRunner>(engine.store);
    if (config.outboxEnabled) {
        engine.outbox = std::make_shared<persistence::InMemoryOutbox>(engine.store);
    }

    const auto taskRules = taskmanagement::domain::model::TaskRules::fromConfig(config);
    const auto webhookRules = webhook::domain::model::WebhookRules::fromConfig(config);
    engine.taskRepository = std::make_shared<persistence::InMemoryTaskRepository>(engine.store, taskRules);
    engine.webhookRepository = std::make_shared<persistence::InMemoryWebhookRepository>(engine.store, webhookRules);

    // Task events fan out through the registry; webhook bookkeeping is only logged
    engine.registry = std::make_shared<shared::event::EventHandlerRegistry>();
    engine.taskPublisher = std::make_shared<messaging::DispatchingEventPublisher>(engine.registry);
    auto taskUnitOfWorkFactory = std::make_shared<shared::uow::UnitOfWorkFactory>(
        transactionRunner, engine.taskPublisher, engine.outbox);
    engine.webhookUnitOfWorkFactory = std::make_shared<shared::uow::UnitOfWorkFactory>(
        transactionRunner, std::make_shared<messaging::LoggingEventPublisher>());

    engine.taskUpdater = std::make_shared<taskmanagement::application::usecase::TaskGraphUpdater>(
        engine.taskRepository, taskUnitOfWorkFactory, config.conflictRetryAttempts);
    engine.webhookUpdater = std::make_shared<webhook::application::usecase::WebhookUpdater>(
        engine.webhookRepository, engine.webhookUnitOfWorkFactory, config.conflictRetryAttempts);

    auto dispatch = std::make_shared<webhook::application::usecase::DispatchEventToWebhooksUseCase>(
        engine.webhookRepository, engine.webhookUpdater);
    engine.registry->subscribe(taskmanagement::domain::event::taskEventTypes(),
        [dispatch](const shared::domain::DomainEvent& event) { dispatch->execute(event); });

    spdlog::info("Engine wired: outbox={}, conflict retries={}, fan-in limit={}",
                 config.outboxEnabled ? "on" : "off", config.conflictRetryAttempts, taskRules.maxDependenciesPerTask);
    return engine;
}

void runScenario(Engine& engine, const shared::config::EngineConfig& config) {
    using namespace taskcore::taskmanagement::application::usecase;
    using namespace taskcore::webhook::application::usecase;

    // Webhook first, so task events find a subscriber
    RegisterWebhookUseCase registerWebhook(engine.webhookUpdater,
                                           webhook::domain::model::WebhookRules::fromConfig(config));
    RegisterWebhookCommand webhookCommand;
    webhookCommand.workspaceId = "workspace-demo";
    webhookCommand.name = "Status feed";
    webhookCommand.url = "https://hooks.example.com/taskcore";
    webhookCommand.events = {taskmanagement::domain::event::TaskStatusChanged::TYPE};
    webhookCommand.secret = webhook::domain::model::WebhookSignature::generateSecret();
    webhookCommand.createdBy = "admin";
    const auto registered = registerWebhook.execute(webhookCommand);

    // Project with A -> B -> C (A depends on B, B depends on C)
    CreateProjectUseCase createProject(engine.taskUpdater,
                                       taskmanagement::domain::model::TaskRules::fromConfig(config));
    const auto project = createProject.execute({"", "Release 1.0", "alice"});

    CreateTaskUseCase createTask(engine.taskUpdater);
    auto newTask = [&](const std::string& title, double hours) {
        CreateTaskCommand command;
        command.projectId = project.projectId;
        command.title = title;
        command.createdBy = "alice";
        command.estimatedHours = hours;
        return createTask.execute(command).taskId;
    };
    const std::string taskA = newTask("Ship release", 2.0);
    const std::string taskB = newTask("Write changelog", 3.0);
    const std::string taskC = newTask("Freeze schema", 5.0);

    AddDependencyUseCase addDependency(engine.taskUpdater);
    addDependency.execute({project.projectId, taskA, taskB});
    addDependency.execute({project.projectId, taskB, taskC});

    try {
        addDependency.execute({project.projectId, taskC, taskA});
    } catch (const shared::exception::CircularDependencyException& e) {
        const auto classified = shared::error::classifyError(e);
        spdlog::warn("Cycle rejected ({} / HTTP {}): {}", e.getCode(), classified.httpStatus, e.what());
    }

    const auto graph = engine.taskRepository->load(taskmanagement::domain::model::ProjectId::of(project.projectId));
    spdlog::info("Graph after rejected cycle: {} task(s), {} dependency edge(s), version {}",
                 graph.taskCount(), graph.dependencyCount(), graph.getVersion());

    // C has no dependencies: start and complete it
    ChangeTaskStatusUseCase changeStatus(engine.taskUpdater);
    changeStatus.execute({project.projectId, taskC, TaskAction::START, "alice", "", std::nullopt});
    changeStatus.execute({project.projectId, taskC, TaskAction::COMPLETE, "alice", "", 4.5});

    try {
        changeStatus.execute({project.projectId, taskA, TaskAction::START, "alice", "", std::nullopt});
    } catch (const shared::exception::DependencyNotSatisfiedException& e) {
        spdlog::warn("Start rejected: {}", e.what());
    }

    // Two failures, then success
    auto sender = std::make_shared<ScriptedWebhookSender>(2);
    DeliverPendingDeliveriesUseCase deliver(engine.webhookRepository, engine.webhookUnitOfWorkFactory, sender);
    RetryDueDeliveriesUseCase retryDue(engine.webhookRepository, engine.webhookUpdater);

    auto report = deliver.execute();
    spdlog::info("Delivery pass 1: {}", shared::util::toCompactString(report.toJson()));

    // The poller would wake up once the backoff expired
    const auto later = std::chrono::system_clock::now() + std::chrono::seconds(config.webhookMaxDelaySeconds);
    const std::size_t retried = retryDue.execute(later);
    spdlog::info("Retry pass: {} delivery(ies) back to PENDING", retried);

    report = deliver.execute();
    spdlog::info("Delivery pass 2: {}", shared::util::toCompactString(report.toJson()));

    const auto subscriber = engine.webhookRepository->load(
        webhook::domain::model::WebhookId::of(registered.webhookId));
    spdlog::info("Webhook {}: {}", registered.webhookId,
                 shared::util::toCompactString(WebhookResponse::fromDomain(subscriber).toJson()));
    spdlog::info("Webhook health: {}", shared::util::toCompactString(subscriber.getHealth().toJson()));
    spdlog::info("Sender received {} request(s)", sender->calls());

    if (engine.outbox) {
        infrastructure::messaging::OutboxRelay relay(
            engine.outbox, engine.taskPublisher, static_cast<std::size_t>(config.outboxBatchSize),
            config.outboxMaxAttempts);
        const std::size_t relayed = relay.relayAll();
        engine.store->purgeDispatched();
        spdlog::info("Outbox drained: {} event(s) relayed, {} pending", relayed, engine.outbox->pendingCount());
    }

    spdlog::info("Registry: {} unhandled event(s)", engine.registry->unhandledCount());
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main() {
    printBanner();

    shared::config::EngineConfig config;
    try {
        config = loadConfig();
    } catch (const std::exception& e) {
        shared::logging::Logger::initialize("taskcore-demo");
        spdlog::critical("Invalid configuration: {}", e.what());
        return 2;
    }

    shared::logging::Logger::initialize("taskcore-demo", config.logLevel, config.logFile);
    spdlog::info("Starting taskcore demo...");

    try {
        Engine engine = wire(config);
        runScenario(engine, config);
    } catch (const std::exception& e) {
        const auto classified = shared::error::classifyError(e);
        spdlog::error("Demo failed ({} / HTTP {}): {}", classified.code, classified.httpStatus, e.what());
        shared::logging::Logger::flush();
        return 1;
    }

    spdlog::info("Demo finished");
    shared::logging::Logger::flush();
    return 0;
}
