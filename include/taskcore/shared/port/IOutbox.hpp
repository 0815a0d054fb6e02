/**
 * @file IOutbox.hpp
 * @brief Transactional outbox port
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace taskcore::shared::port {

/**
 * @brief Durable event queue written in the same transaction as aggregate state
 *
 * append() must participate in the surrounding transaction so that events are
 * stored if and only if the state change that produced them is stored.
 * A relay drains pending() and acknowledges with markDispatched() only after
 * the publisher accepted the batch.
 */
class IOutbox {
public:
    virtual ~IOutbox() = default;

    virtual void append(const domain::DomainEvents& events) = 0;

    /**
     * @brief Oldest undispatched events, in append order
     */
    virtual domain::DomainEvents pending(std::size_t limit) = 0;

    virtual void markDispatched(const std::vector<std::string>& eventIds) = 0;

    /**
     * @brief Count one failed publish attempt against each entry
     * @return Highest attempt count among the entries
     */
    virtual int recordFailedAttempt(const std::vector<std::string>& eventIds) = 0;

    /**
     * @brief Take entries out of pending() without dispatching them
     */
    virtual void park(const std::vector<std::string>& eventIds) = 0;

    /// Undispatched entries that are not parked
    [[nodiscard]] virtual std::size_t pendingCount() const = 0;
    [[nodiscard]] virtual std::size_t parkedCount() const = 0;
};

} // namespace taskcore::shared::port
