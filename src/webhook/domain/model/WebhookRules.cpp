#include "taskcore/webhook/domain/model/WebhookRules.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace taskcore::webhook::domain::model {

using shared::exception::ValidationException;

WebhookRules WebhookRules::fromConfig(const shared::config::EngineConfig& config) {
    WebhookRules rules;
    rules.retryPolicy = RetryPolicy::fromConfig(config);
    rules.defaultMaxRetries = config.webhookMaxRetries;
    rules.defaultMaxFailures = config.webhookMaxFailures;
    return rules;
}

void WebhookRules::validateName(const std::string& name) {
    const bool blank = std::all_of(name.begin(), name.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw ValidationException("name", "Webhook name cannot be empty");
    }
    if (name.length() > NAME_MAX_LENGTH) {
        throw ValidationException("name",
            "Webhook name cannot exceed " + std::to_string(NAME_MAX_LENGTH) + " characters");
    }
}

void WebhookRules::validateUrl(const std::string& url) {
    static const std::regex urlRegex(R"(^https?://[^\s/?#:]+(:[0-9]{1,5})?([/?#]\S*)?$)", std::regex::icase);

    if (url.length() > URL_MAX_LENGTH || !std::regex_match(url, urlRegex)) {
        throw ValidationException("url", "Webhook URL must be an absolute http or https URL: '" + url + "'");
    }
}

void WebhookRules::validateEventTypes(const std::vector<std::string>& eventTypes) {
    if (eventTypes.empty()) {
        throw ValidationException("events", "At least one event type must be subscribed");
    }
    for (const auto& type : eventTypes) {
        if (type.empty()) {
            throw ValidationException("events", "Event type cannot be empty");
        }
    }
}

void WebhookRules::validateSecret(const std::string& secret) {
    if (secret.length() < SECRET_MIN_LENGTH) {
        throw ValidationException("secret",
            "Webhook secret must be at least " + std::to_string(SECRET_MIN_LENGTH) + " characters");
    }
}

void WebhookRules::validateLimits(int maxRetries, int maxFailures) {
    if (maxRetries < 1 || maxRetries > MAX_RETRIES_LIMIT) {
        throw ValidationException("maxRetries",
            "maxRetries must be between 1 and " + std::to_string(MAX_RETRIES_LIMIT));
    }
    if (maxFailures < 1) {
        throw ValidationException("maxFailures", "maxFailures must be at least 1");
    }
}

} // namespace taskcore::webhook::domain::model
