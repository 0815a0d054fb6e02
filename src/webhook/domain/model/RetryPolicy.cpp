#include "taskcore/webhook/domain/model/RetryPolicy.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <stdexcept>
#include <string>

namespace taskcore::webhook::domain::model {

RetryPolicy::RetryPolicy(std::chrono::seconds baseDelay, std::chrono::seconds maxDelay)
    : baseDelay_(baseDelay), maxDelay_(maxDelay) {
    if (baseDelay_.count() <= 0 || maxDelay_ < baseDelay_) {
        throw shared::exception::DomainException(
            "INVALID_RETRY_POLICY",
            "Retry delays must satisfy 0 < base <= max (base=" + std::to_string(baseDelay_.count()) +
            "s, max=" + std::to_string(maxDelay_.count()) + "s)");
    }
}

RetryPolicy RetryPolicy::fromConfig(const shared::config::EngineConfig& config) {
    return RetryPolicy(std::chrono::seconds(config.webhookBaseDelaySeconds),
                       std::chrono::seconds(config.webhookMaxDelaySeconds));
}

std::chrono::seconds RetryPolicy::delayFor(int attempt) const {
    if (attempt < 1) {
        throw std::invalid_argument("Delivery attempts are 1-based, got " + std::to_string(attempt));
    }
    // Doubling stops at the ceiling, so large attempt numbers cannot overflow
    std::chrono::seconds delay = baseDelay_;
    for (int i = 1; i < attempt && delay < maxDelay_; ++i) {
        delay *= 2;
    }
    return delay < maxDelay_ ? delay : maxDelay_;
}

RetryPolicy::Decision RetryPolicy::decide(int attempt, int maxRetries, TimePoint failedAt) const {
    Decision decision;
    if (attempt < maxRetries) {
        decision.retry = true;
        decision.delay = delayFor(attempt);
        decision.nextRetryAt = failedAt + decision.delay;
    }
    return decision;
}

} // namespace taskcore::webhook::domain::model
