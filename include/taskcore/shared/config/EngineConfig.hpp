/**
 * @file EngineConfig.hpp
 * @brief Typed snapshot of the engine's tunables
 */

#pragma once

#include "ConfigManager.hpp"

#include <cstddef>
#include <string>

namespace taskcore::shared::config {

struct EngineConfig {
    int maxDependenciesPerTask = 10;
    int maxTasksPerProject = 1000;

    int webhookBaseDelaySeconds = 60;
    int webhookMaxDelaySeconds = 1800;
    int webhookMaxRetries = 3;
    int webhookMaxFailures = 10;

    bool outboxEnabled = true;
    int outboxBatchSize = 100;
    int outboxMaxAttempts = 5;
    int conflictRetryAttempts = 3;

    std::string logLevel = "info";
    std::string logFile;

    /**
     * @brief Read every key, using the defaults above for missing ones
     */
    static EngineConfig load(const ConfigManager& manager);

    /**
     * @throws exception::ConfigException naming the first offending key
     */
    void validate() const;
};

} // namespace taskcore::shared::config
