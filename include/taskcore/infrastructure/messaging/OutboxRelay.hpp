/**
 * @file OutboxRelay.hpp
 * @brief Drains the transactional outbox into the event publisher
 */

#pragma once

#include "taskcore/shared/port/IEventPublisher.hpp"
#include "taskcore/shared/port/IOutbox.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace taskcore::infrastructure::messaging {

/**
 * @brief Publishes pending outbox entries in batches
 *
 * A batch is marked dispatched only after the publisher accepted all of it.
 * When the publisher fails the batch stays pending and the error propagates,
 * so the next relay pass delivers it again. Every failure counts against the
 * batch's entries; once an entry reaches maxAttempts the batch is parked so
 * the entries behind it can flow. Parked entries stay in the outbox for
 * inspection.
 *
 * Not thread-safe; run one relay per outbox.
 */
class OutboxRelay {
public:
    /**
     * @throws std::invalid_argument on nullptr collaborators, a zero batch size
     *         or a non-positive maxAttempts
     */
    OutboxRelay(std::shared_ptr<shared::port::IOutbox> outbox,
                std::shared_ptr<shared::port::IEventPublisher> publisher,
                std::size_t batchSize = 100,
                int maxAttempts = 5);

    /**
     * @brief Publish at most one batch
     * @return Number of events dispatched
     * @throws exception::PublishException (or the publisher's error) when the batch is rejected
     */
    std::size_t relayOnce();

    /**
     * @brief Publish batches until the outbox is empty
     * @return Number of events dispatched
     */
    std::size_t relayAll();

    [[nodiscard]] std::size_t totalRelayed() const noexcept { return totalRelayed_; }
    [[nodiscard]] std::size_t totalParked() const noexcept { return totalParked_; }
    [[nodiscard]] std::size_t getBatchSize() const noexcept { return batchSize_; }
    [[nodiscard]] int getMaxAttempts() const noexcept { return maxAttempts_; }

private:
    std::shared_ptr<shared::port::IOutbox> outbox_;
    std::shared_ptr<shared::port::IEventPublisher> publisher_;
    std::size_t batchSize_;
    int maxAttempts_;
    std::size_t totalRelayed_ = 0;
    std::size_t totalParked_ = 0;

    void recordFailure(const std::vector<std::string>& eventIds, const char* reason);
};

} // namespace taskcore::infrastructure::messaging
