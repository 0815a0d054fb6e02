/**
 * @file IEventPublisher.hpp
 * @brief Outbound port for domain event delivery
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

namespace taskcore::shared::port {

/**
 * @brief Event publisher interface
 *
 * Accepts an ordered batch for at-least-once delivery to subscribers.
 * The engine never deduplicates; subscribers must be idempotent on the
 * event id. Order inside one aggregate's events must be preserved.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @throws exception::PublishException when the batch cannot be accepted
     */
    virtual void publishAll(const domain::DomainEvents& events) = 0;
};

} // namespace taskcore::shared::port
