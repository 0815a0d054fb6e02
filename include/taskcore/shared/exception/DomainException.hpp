/**
 * @file DomainException.hpp
 * @brief Domain layer exception classes
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskcore::shared::exception {

/**
 * @brief Exception for domain layer errors
 *
 * Used when business rules are violated or domain invariants are broken.
 * The aggregate that raised it is left unchanged.
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "CIRCULAR_DEPENDENCY")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief An aggregate invariant does not hold
 */
class InvariantViolationException : public DomainException {
public:
    explicit InvariantViolationException(std::string message)
        : DomainException("INVARIANT_VIOLATION", std::move(message)) {}

protected:
    InvariantViolationException(std::string code, std::string message)
        : DomainException(std::move(code), std::move(message)) {}
};

/**
 * @brief Referenced entity does not exist inside the aggregate or store
 */
class NotFoundException : public DomainException {
public:
    explicit NotFoundException(std::string message)
        : DomainException("NOT_FOUND", std::move(message)) {}
};

class CircularDependencyException : public InvariantViolationException {
public:
    explicit CircularDependencyException(std::string message)
        : InvariantViolationException("CIRCULAR_DEPENDENCY", std::move(message)) {}
};

class FanInExceededException : public InvariantViolationException {
public:
    explicit FanInExceededException(std::string message)
        : InvariantViolationException("FAN_IN_EXCEEDED", std::move(message)) {}
};

class DuplicateEdgeException : public InvariantViolationException {
public:
    explicit DuplicateEdgeException(std::string message)
        : InvariantViolationException("DUPLICATE_EDGE", std::move(message)) {}
};

class DependencyNotSatisfiedException : public InvariantViolationException {
public:
    explicit DependencyNotSatisfiedException(std::string message)
        : InvariantViolationException("DEPENDENCY_NOT_SATISFIED", std::move(message)) {}
};

class TaskLimitExceededException : public InvariantViolationException {
public:
    explicit TaskLimitExceededException(std::string message)
        : InvariantViolationException("TASK_LIMIT_EXCEEDED", std::move(message)) {}
};

class WebhookNotTriggerableException : public InvariantViolationException {
public:
    explicit WebhookNotTriggerableException(std::string message)
        : InvariantViolationException("WEBHOOK_NOT_TRIGGERABLE", std::move(message)) {}
};

class DuplicateDeliveryException : public InvariantViolationException {
public:
    explicit DuplicateDeliveryException(std::string message)
        : InvariantViolationException("DUPLICATE_DELIVERY", std::move(message)) {}
};

/**
 * @brief A status machine was asked for a transition it does not allow
 */
class InvalidStatusTransitionException : public DomainException {
public:
    explicit InvalidStatusTransitionException(std::string message)
        : DomainException("INVALID_STATUS_TRANSITION", std::move(message)) {}
};

class RetryNotDueException : public DomainException {
public:
    explicit RetryNotDueException(std::string message)
        : DomainException("RETRY_NOT_DUE", std::move(message)) {}
};

class RetriesExhaustedException : public DomainException {
public:
    explicit RetriesExhaustedException(std::string message)
        : DomainException("RETRIES_EXHAUSTED", std::move(message)) {}
};

class DeliveryNotRetryableException : public DomainException {
public:
    explicit DeliveryNotRetryableException(std::string message)
        : DomainException("DELIVERY_NOT_RETRYABLE", std::move(message)) {}
};

/**
 * @brief A field value is outside its allowed range or format
 */
class ValidationException : public DomainException {
private:
    std::string field_;

public:
    ValidationException(std::string field, std::string message)
        : DomainException("VALIDATION_ERROR", std::move(message)),
          field_(std::move(field)) {}

    [[nodiscard]] const std::string& getField() const noexcept {
        return field_;
    }
};

class NotTaskAssigneeException : public DomainException {
public:
    explicit NotTaskAssigneeException(std::string message)
        : DomainException("NOT_TASK_ASSIGNEE", std::move(message)) {}
};

/**
 * @brief Mutation attempted on a tombstoned aggregate
 */
class AggregateDeletedException : public DomainException {
public:
    explicit AggregateDeletedException(std::string message)
        : DomainException("AGGREGATE_DELETED", std::move(message)) {}
};

} // namespace taskcore::shared::exception
