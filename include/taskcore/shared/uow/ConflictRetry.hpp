/**
 * @file ConflictRetry.hpp
 * @brief Bounded reload-and-replay on optimistic concurrency conflicts
 */

#pragma once

#include "taskcore/shared/exception/InfrastructureException.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace taskcore::shared::uow {

/**
 * @brief Run `attempt` until it commits without a ConcurrencyConflictException
 *
 * `attempt` must reload every aggregate it touches, so each try replays the
 * operation against fresh state. The unit of work itself never retries;
 * other errors propagate immediately.
 *
 * @param maxAttempts Total tries (>= 1); the last conflict is rethrown
 */
template<typename Attempt>
auto retryOnConflict(int maxAttempts, const std::string& operation, Attempt&& attempt)
    -> decltype(attempt()) {
    if (maxAttempts < 1) {
        throw std::invalid_argument("retryOnConflict: maxAttempts must be at least 1");
    }
    for (int tryNumber = 1;; ++tryNumber) {
        try {
            return attempt();
        } catch (const exception::ConcurrencyConflictException& e) {
            if (tryNumber >= maxAttempts) {
                spdlog::warn("{}: giving up after {} conflicting attempt(s): {}", operation, tryNumber, e.what());
                throw;
            }
            spdlog::info("{}: concurrency conflict on attempt {}/{}, reloading: {}",
                         operation, tryNumber, maxAttempts, e.what());
        }
    }
}

} // namespace taskcore::shared::uow
