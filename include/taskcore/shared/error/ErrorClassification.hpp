/**
 * @file ErrorClassification.hpp
 * @brief Map engine exceptions to caller-facing outcomes
 */

#pragma once

#include <exception>
#include <string>

namespace taskcore::shared::error {

enum class ErrorCategory {
    INVARIANT_VIOLATION,   ///< Rejected by a domain rule, state unchanged
    NOT_FOUND,
    CONCURRENCY_CONFLICT,  ///< Reload and replay
    INVALID_REQUEST,       ///< Misuse of the API (bad arguments, finalized unit of work)
    PERSISTENCE_FAILURE,   ///< Unit aborted, events preserved
    POST_COMMIT_PUBLISH,   ///< State durable, events undelivered
    INTERNAL
};

std::string toString(ErrorCategory category);

struct ErrorClassification {
    ErrorCategory category = ErrorCategory::INTERNAL;
    std::string code;
    int httpStatus = 500;
    bool clientError = false;  ///< 4xx-style "rejected, try again"
};

/**
 * @brief Classify an exception raised by the engine
 *
 * Domain rule violations map to 422, missing entities to 404, conflicts and
 * illegal state transitions to 409, bad field values and API misuse to 400,
 * a non-assignee starting a task to 403, everything else to 500.
 */
ErrorClassification classifyError(const std::exception& e);

} // namespace taskcore::shared::error
