#include "taskcore/shared/config/EngineConfig.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"

#include <spdlog/spdlog.h>

namespace taskcore::shared::config {

namespace {

void requirePositive(const char* key, int value) {
    if (value <= 0) {
        throw exception::ConfigException(
            std::string(key) + " must be positive, got " + std::to_string(value));
    }
}

} // namespace

EngineConfig EngineConfig::load(const ConfigManager& manager) {
    EngineConfig config;
    config.maxDependenciesPerTask = manager.getInt(ConfigManager::MAX_DEPENDENCIES_PER_TASK, config.maxDependenciesPerTask);
    config.maxTasksPerProject = manager.getInt(ConfigManager::MAX_TASKS_PER_PROJECT, config.maxTasksPerProject);
    config.webhookBaseDelaySeconds = manager.getInt(ConfigManager::WEBHOOK_BASE_DELAY_SECONDS, config.webhookBaseDelaySeconds);
    config.webhookMaxDelaySeconds = manager.getInt(ConfigManager::WEBHOOK_MAX_DELAY_SECONDS, config.webhookMaxDelaySeconds);
    config.webhookMaxRetries = manager.getInt(ConfigManager::WEBHOOK_MAX_RETRIES, config.webhookMaxRetries);
    config.webhookMaxFailures = manager.getInt(ConfigManager::WEBHOOK_MAX_FAILURES, config.webhookMaxFailures);
    config.outboxEnabled = manager.getBool(ConfigManager::OUTBOX_ENABLED, config.outboxEnabled);
    config.outboxBatchSize = manager.getInt(ConfigManager::OUTBOX_BATCH_SIZE, config.outboxBatchSize);
    config.outboxMaxAttempts = manager.getInt(ConfigManager::OUTBOX_MAX_ATTEMPTS, config.outboxMaxAttempts);
    config.conflictRetryAttempts = manager.getInt(ConfigManager::CONFLICT_RETRY_ATTEMPTS, config.conflictRetryAttempts);
    config.logLevel = manager.getString(ConfigManager::LOG_LEVEL, config.logLevel);
    config.logFile = manager.getString(ConfigManager::LOG_FILE, config.logFile);
    return config;
}

void EngineConfig::validate() const {
    requirePositive(ConfigManager::MAX_DEPENDENCIES_PER_TASK, maxDependenciesPerTask);
    requirePositive(ConfigManager::MAX_TASKS_PER_PROJECT, maxTasksPerProject);
    requirePositive(ConfigManager::WEBHOOK_BASE_DELAY_SECONDS, webhookBaseDelaySeconds);
    requirePositive(ConfigManager::WEBHOOK_MAX_DELAY_SECONDS, webhookMaxDelaySeconds);
    requirePositive(ConfigManager::WEBHOOK_MAX_RETRIES, webhookMaxRetries);
    requirePositive(ConfigManager::WEBHOOK_MAX_FAILURES, webhookMaxFailures);
    requirePositive(ConfigManager::OUTBOX_BATCH_SIZE, outboxBatchSize);
    requirePositive(ConfigManager::OUTBOX_MAX_ATTEMPTS, outboxMaxAttempts);
    requirePositive(ConfigManager::CONFLICT_RETRY_ATTEMPTS, conflictRetryAttempts);

    if (webhookMaxDelaySeconds < webhookBaseDelaySeconds) {
        throw exception::ConfigException(
            std::string(ConfigManager::WEBHOOK_MAX_DELAY_SECONDS) + " (" +
            std::to_string(webhookMaxDelaySeconds) + ") must not be below " +
            ConfigManager::WEBHOOK_BASE_DELAY_SECONDS + " (" +
            std::to_string(webhookBaseDelaySeconds) + ")");
    }

    spdlog::debug("Engine config valid: fanIn={}, tasks={}, backoff={}s..{}s, retries={}, outbox={}",
                  maxDependenciesPerTask, maxTasksPerProject, webhookBaseDelaySeconds,
                  webhookMaxDelaySeconds, webhookMaxRetries, outboxEnabled);
}

} // namespace taskcore::shared::config
