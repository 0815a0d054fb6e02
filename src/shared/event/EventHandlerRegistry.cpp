#include "taskcore/shared/event/EventHandlerRegistry.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace taskcore::shared::event {

void EventHandlerRegistry::subscribe(const std::string& eventType, Handler handler) {
    if (eventType.empty()) {
        throw std::invalid_argument("EventHandlerRegistry: event type cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("EventHandlerRegistry: handler for " + eventType + " cannot be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[eventType].push_back(std::move(handler));
    spdlog::debug("Event handler registered: type={}, handlers={}", eventType, handlers_[eventType].size());
}

void EventHandlerRegistry::subscribe(const std::vector<std::string>& eventTypes, const Handler& handler) {
    for (const auto& eventType : eventTypes) {
        subscribe(eventType, handler);
    }
}

std::size_t EventHandlerRegistry::dispatch(const domain::DomainEvent& event) const {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.getEventType());
        if (it == handlers_.end()) {
            ++unhandled_;
            spdlog::warn("No handler registered for event type {} (event {}, aggregate {})",
                         event.getEventType(), event.getEventId(), event.getAggregateId());
            return 0;
        }
        handlers = it->second;
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            spdlog::error("Handler for {} failed on event {}: {}",
                          event.getEventType(), event.getEventId(), e.what());
            std::throw_with_nested(exception::PublishException(
                "Handler for " + event.getEventType() + " failed on event " +
                event.getEventId() + ": " + e.what()));
        }
    }
    return handlers.size();
}

bool EventHandlerRegistry::isRegistered(const std::string& eventType) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(eventType) > 0;
}

std::vector<std::string> EventHandlerRegistry::registeredTypes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> types;
    types.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        types.push_back(entry.first);
    }
    return types;
}

std::size_t EventHandlerRegistry::unhandledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unhandled_;
}

} // namespace taskcore::shared::event
