/**
 * @file InfrastructureException.hpp
 * @brief Infrastructure layer exception classes
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace taskcore::shared::exception {

/**
 * @brief Exception for infrastructure layer errors
 *
 * Used for persistence, event publication and configuration errors.
 */
class InfrastructureException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Infrastructure Exception
     * @param code Error code (e.g., "PERSISTENCE_ERROR")
     * @param message Human-readable error message
     */
    InfrastructureException(std::string code, std::string message)
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
 * @brief Storage round trip failed (transient or structural)
 */
class PersistenceException : public InfrastructureException {
public:
    explicit PersistenceException(std::string message)
        : InfrastructureException("PERSISTENCE_ERROR", std::move(message)) {}
};

/**
 * @brief Optimistic concurrency check failed on save
 *
 * The persisted version no longer matches the version the caller loaded.
 * The caller must reload the aggregate and replay its operation.
 */
class ConcurrencyConflictException : public InfrastructureException {
private:
    std::string aggregateId_;
    int expectedVersion_;
    int actualVersion_;

public:
    ConcurrencyConflictException(std::string aggregateId, int expectedVersion, int actualVersion)
        : InfrastructureException(
              "CONCURRENCY_CONFLICT",
              "Concurrency conflict on aggregate " + aggregateId +
                  ": expected version " + std::to_string(expectedVersion) +
                  ", persisted version " + std::to_string(actualVersion)),
          aggregateId_(std::move(aggregateId)),
          expectedVersion_(expectedVersion),
          actualVersion_(actualVersion) {}

    [[nodiscard]] const std::string& getAggregateId() const noexcept { return aggregateId_; }
    [[nodiscard]] int getExpectedVersion() const noexcept { return expectedVersion_; }
    [[nodiscard]] int getActualVersion() const noexcept { return actualVersion_; }
};

/**
 * @brief Event publisher rejected a batch
 */
class PublishException : public InfrastructureException {
public:
    explicit PublishException(std::string message)
        : InfrastructureException("PUBLISH_ERROR", std::move(message)) {}
};

/**
 * @brief State was committed but its events were not delivered
 *
 * Carries the undelivered events so operators can reconcile them.
 */
class PostCommitPublishException : public InfrastructureException {
private:
    std::vector<domain::DomainEvent> undeliveredEvents_;
    std::string cause_;

public:
    PostCommitPublishException(std::vector<domain::DomainEvent> undeliveredEvents, std::string cause)
        : InfrastructureException(
              "POST_COMMIT_PUBLISH_FAILURE",
              "State committed but " + std::to_string(undeliveredEvents.size()) +
                  " event(s) were not published: " + cause),
          undeliveredEvents_(std::move(undeliveredEvents)),
          cause_(std::move(cause)) {}

    [[nodiscard]] const std::vector<domain::DomainEvent>& getUndeliveredEvents() const noexcept {
        return undeliveredEvents_;
    }

    [[nodiscard]] const std::string& getCause() const noexcept {
        return cause_;
    }
};

/**
 * @brief Configuration value missing or out of range
 */
class ConfigException : public InfrastructureException {
public:
    explicit ConfigException(std::string message)
        : InfrastructureException("CONFIG_ERROR", std::move(message)) {}
};

} // namespace taskcore::shared::exception
