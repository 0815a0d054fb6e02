/**
 * @file RetryPolicy.hpp
 * @brief Exponential backoff for failed webhook deliveries
 */

#pragma once

#include "taskcore/shared/config/EngineConfig.hpp"

#include <chrono>
#include <optional>

namespace taskcore::webhook::domain::model {

/**
 * @brief Capped exponential backoff
 *
 * The delay after failed attempt n (1-based) is
 * min(2^(n-1) * baseDelay, maxDelay), so the first retry waits baseDelay and
 * the schedule never decreases.
 */
class RetryPolicy {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct Decision {
        bool retry = false;
        std::chrono::seconds delay{0};
        std::optional<TimePoint> nextRetryAt;
    };

    /**
     * @brief 1 minute base, 30 minute ceiling
     */
    RetryPolicy() = default;

    /**
     * @throws shared::exception::DomainException (INVALID_RETRY_POLICY) unless 0 < baseDelay <= maxDelay
     */
    RetryPolicy(std::chrono::seconds baseDelay, std::chrono::seconds maxDelay);

    static RetryPolicy fromConfig(const shared::config::EngineConfig& config);

    /**
     * @throws std::invalid_argument for attempt < 1
     */
    [[nodiscard]] std::chrono::seconds delayFor(int attempt) const;

    /**
     * @brief Outcome of failed attempt `attempt` out of `maxRetries`
     *
     * Retries while attempt < maxRetries; the retry is due delayFor(attempt)
     * after `failedAt`.
     */
    [[nodiscard]] Decision decide(int attempt, int maxRetries, TimePoint failedAt) const;

    [[nodiscard]] std::chrono::seconds getBaseDelay() const noexcept { return baseDelay_; }
    [[nodiscard]] std::chrono::seconds getMaxDelay() const noexcept { return maxDelay_; }

private:
    std::chrono::seconds baseDelay_{60};
    std::chrono::seconds maxDelay_{1800};
};

} // namespace taskcore::webhook::domain::model
