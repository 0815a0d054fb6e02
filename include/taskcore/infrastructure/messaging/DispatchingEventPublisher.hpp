/**
 * @file DispatchingEventPublisher.hpp
 * @brief Publisher that fans events out to in-process handlers
 */

#pragma once

#include "taskcore/shared/event/EventHandlerRegistry.hpp"
#include "taskcore/shared/port/IEventPublisher.hpp"

#include <memory>

namespace taskcore::infrastructure::messaging {

/**
 * @brief Delivers each event of a batch, in order, through an EventHandlerRegistry
 *
 * The first handler failure stops the batch and surfaces as PublishException;
 * events already dispatched stay dispatched, so handlers must tolerate the
 * redelivery that follows (at-least-once).
 */
class DispatchingEventPublisher : public shared::port::IEventPublisher {
public:
    /**
     * @throws std::invalid_argument if registry is nullptr
     */
    explicit DispatchingEventPublisher(std::shared_ptr<shared::event::EventHandlerRegistry> registry);

    void publishAll(const shared::domain::DomainEvents& events) override;

private:
    std::shared_ptr<shared::event::EventHandlerRegistry> registry_;
};

} // namespace taskcore::infrastructure::messaging
