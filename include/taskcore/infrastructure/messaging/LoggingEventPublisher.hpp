/**
 * @file LoggingEventPublisher.hpp
 * @brief Publisher that writes every event to the log
 */

#pragma once

#include "taskcore/shared/port/IEventPublisher.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>

namespace taskcore::infrastructure::messaging {

class LoggingEventPublisher : public shared::port::IEventPublisher {
private:
    std::atomic<std::size_t> published_{0};

public:
    void publishAll(const shared::domain::DomainEvents& events) override {
        for (const auto& event : events) {
            spdlog::info("Event published: type={}, aggregate={} {}, version={}, id={}",
                         event.getEventType(), event.getAggregateType(), event.getAggregateId(),
                         event.getAggregateVersion(), event.getEventId());
            spdlog::debug("Event payload {}: {}", event.getEventId(),
                          shared::util::toCompactString(event.getPayload()));
        }
        published_ += events.size();
    }

    [[nodiscard]] std::size_t publishedCount() const noexcept {
        return published_.load();
    }
};

} // namespace taskcore::infrastructure::messaging
