/**
 * @file EventHandlerRegistry.hpp
 * @brief Explicit event type to handler table
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace taskcore::shared::event {

/**
 * @brief Routes domain events to the handlers registered for their type
 *
 * Only types registered through subscribe() are dispatched. An event whose
 * type has no handler is logged and counted, never resolved by name.
 * Handlers run in subscription order and must be idempotent on the event id.
 */
class EventHandlerRegistry {
public:
    using Handler = std::function<void(const domain::DomainEvent&)>;

    void subscribe(const std::string& eventType, Handler handler);

    /**
     * @brief Register one handler for several event types
     */
    void subscribe(const std::vector<std::string>& eventTypes, const Handler& handler);

    /**
     * @brief Invoke every handler registered for the event's type
     * @return Number of handlers invoked (0 for an unknown type)
     * @throws exception::PublishException nesting the first handler failure
     */
    std::size_t dispatch(const domain::DomainEvent& event) const;

    [[nodiscard]] bool isRegistered(const std::string& eventType) const;
    [[nodiscard]] std::vector<std::string> registeredTypes() const;
    [[nodiscard]] std::size_t unhandledCount() const;

private:
    std::map<std::string, std::vector<Handler>> handlers_;
    mutable std::size_t unhandled_ = 0;
    mutable std::mutex mutex_;
};

} // namespace taskcore::shared::event
