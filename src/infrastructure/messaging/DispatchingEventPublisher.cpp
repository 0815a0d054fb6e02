#include "taskcore/infrastructure/messaging/DispatchingEventPublisher.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace taskcore::infrastructure::messaging {

DispatchingEventPublisher::DispatchingEventPublisher(std::shared_ptr<shared::event::EventHandlerRegistry> registry)
    : registry_(std::move(registry))
{
    if (!registry_) {
        throw std::invalid_argument("DispatchingEventPublisher: registry cannot be nullptr");
    }
}

void DispatchingEventPublisher::publishAll(const shared::domain::DomainEvents& events) {
    std::size_t handled = 0;
    for (const auto& event : events) {
        handled += registry_->dispatch(event);
    }
    spdlog::debug("Dispatched {} event(s) to {} handler call(s)", events.size(), handled);
}

} // namespace taskcore::infrastructure::messaging
