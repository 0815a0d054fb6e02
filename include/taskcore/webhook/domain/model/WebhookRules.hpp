/**
 * @file WebhookRules.hpp
 * @brief Defaults and field validation for webhooks
 */

#pragma once

#include "RetryPolicy.hpp"
#include "taskcore/shared/config/EngineConfig.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace taskcore::webhook::domain::model {

struct WebhookRules {
    static constexpr std::size_t NAME_MAX_LENGTH = 100;
    static constexpr std::size_t URL_MAX_LENGTH = 2048;
    static constexpr std::size_t SECRET_MIN_LENGTH = 16;
    static constexpr int MAX_RETRIES_LIMIT = 10;

    RetryPolicy retryPolicy;
    int defaultMaxRetries = 3;
    int defaultMaxFailures = 10;

    static WebhookRules fromConfig(const shared::config::EngineConfig& config);

    /**
     * @throws shared::exception::ValidationException
     */
    static void validateName(const std::string& name);

    /**
     * @brief Absolute http or https URL with a host
     */
    static void validateUrl(const std::string& url);

    static void validateEventTypes(const std::vector<std::string>& eventTypes);
    static void validateSecret(const std::string& secret);
    static void validateLimits(int maxRetries, int maxFailures);
};

} // namespace taskcore::webhook::domain::model
