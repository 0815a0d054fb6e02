#include "taskcore/infrastructure/messaging/OutboxRelay.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskcore::infrastructure::messaging {

OutboxRelay::OutboxRelay(std::shared_ptr<shared::port::IOutbox> outbox,
                         std::shared_ptr<shared::port::IEventPublisher> publisher,
                         std::size_t batchSize,
                         int maxAttempts)
    : outbox_(std::move(outbox)),
      publisher_(std::move(publisher)),
      batchSize_(batchSize),
      maxAttempts_(maxAttempts)
{
    if (!outbox_) {
        throw std::invalid_argument("OutboxRelay: outbox cannot be nullptr");
    }
    if (!publisher_) {
        throw std::invalid_argument("OutboxRelay: publisher cannot be nullptr");
    }
    if (batchSize_ == 0) {
        throw std::invalid_argument("OutboxRelay: batchSize must be positive");
    }
    if (maxAttempts_ <= 0) {
        throw std::invalid_argument("OutboxRelay: maxAttempts must be positive");
    }
}

void OutboxRelay::recordFailure(const std::vector<std::string>& eventIds, const char* reason) {
    const int attempts = outbox_->recordFailedAttempt(eventIds);
    if (attempts < maxAttempts_) {
        spdlog::warn("Outbox relay: batch of {} event(s) rejected (attempt {}/{}), left pending: {}",
                     eventIds.size(), attempts, maxAttempts_, reason);
        return;
    }

    outbox_->park(eventIds);
    totalParked_ += eventIds.size();
    spdlog::error("Outbox relay: batch of {} event(s) parked after {} failed attempt(s), first event {}: {}",
                  eventIds.size(), attempts, eventIds.front(), reason);
}

std::size_t OutboxRelay::relayOnce() {
    const auto batch = outbox_->pending(batchSize_);
    if (batch.empty()) {
        return 0;
    }

    std::vector<std::string> eventIds;
    eventIds.reserve(batch.size());
    for (const auto& event : batch) {
        eventIds.push_back(event.getEventId());
    }

    try {
        publisher_->publishAll(batch);
    } catch (const std::exception& e) {
        recordFailure(eventIds, e.what());
        throw;
    } catch (...) {
        recordFailure(eventIds, "non-standard exception");
        throw;
    }

    outbox_->markDispatched(eventIds);
    totalRelayed_ += batch.size();

    spdlog::info("Outbox relay: dispatched {} event(s), {} still pending", batch.size(), outbox_->pendingCount());
    return batch.size();
}

std::size_t OutboxRelay::relayAll() {
    std::size_t relayed = 0;
    for (;;) {
        const std::size_t dispatched = relayOnce();
        if (dispatched == 0) {
            break;
        }
        relayed += dispatched;
    }
    return relayed;
}

} // namespace taskcore::infrastructure::messaging
